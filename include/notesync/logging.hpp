#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace notesync {

enum class LogOutput {
    Stdout,
    Stderr
};

/**
 * @brief Parse trace, debug, info, warn, error, critical or off.
 * @throws std::invalid_argument for anything else.
 */
inline spdlog::level::level_enum parseLogLevel(const std::string& name) {
    static const std::pair<const char*, spdlog::level::level_enum> kLevels[] = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };

    for (const auto& level : kLevels) {
        if (name == level.first) return level.second;
    }
    throw std::invalid_argument("Unknown log level '" + name + "'");
}

/**
 * @brief Colored console logger.
 */
inline std::shared_ptr<spdlog::logger> makeLogger(const std::string& name, const std::string& level,
                                                  LogOutput output = LogOutput::Stdout) {
    spdlog::sink_ptr sink;
    if (output == LogOutput::Stderr) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }

    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(parseLogLevel(level));
    return logger;
}

/**
 * @brief Logger that discards everything.
 */
inline std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name = "null") {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace notesync
