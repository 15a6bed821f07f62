#pragma once

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <initializer_list>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace notesync {
namespace config {

/**
 * @brief Environment lookup, nullptr when the variable is unset.
 * Injected so configuration can be tested without touching the process
 * environment.
 */
using EnvLookup = std::function<const char*(const char*)>;

inline EnvLookup processEnv() {
    return [](const char* name) -> const char* { return std::getenv(name); };
}

/**
 * @brief Command line split into `--flag value` pairs, switches and
 * positional words. `--flag=value` is accepted as well.
 */
struct Arguments {
    std::map<std::string, std::string> values;
    std::set<std::string> switches;
    std::vector<std::string> positional;

    /**
     * @param value_flags Flags that take a value.
     * @param switch_flags Flags that stand alone.
     * @throws std::runtime_error on unknown flags or missing values.
     */
    static Arguments parse(int argc, char* argv[],
                           const std::set<std::string>& value_flags,
                           const std::set<std::string>& switch_flags) {
        Arguments args;
        int index = 1;
        while (index < argc) {
            std::string arg = argv[index++];

            if (arg.size() < 2 || arg.compare(0, 2, "--") != 0) {
                args.positional.push_back(arg);
                continue;
            }

            std::string value;
            bool inline_value = false;
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                value = arg.substr(eq + 1);
                arg.erase(eq);
                inline_value = true;
            }

            if (switch_flags.count(arg)) {
                if (inline_value) throw std::runtime_error("Flag " + arg + " takes no value");
                args.switches.insert(arg);
            } else if (value_flags.count(arg)) {
                if (!inline_value) {
                    if (index >= argc) throw std::runtime_error("Missing value for " + arg);
                    value = argv[index++];
                }
                args.values[arg] = value;
            } else {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }
        return args;
    }

    bool has(const std::string& flag) const {
        return switches.count(flag) > 0;
    }

    /**
     * @brief Flag value, else the first set environment variable, else
     * the default.
     */
    std::string resolve(const std::string& flag, std::initializer_list<const char*> env_names,
                        const EnvLookup& env, const std::string& default_value) const {
        auto it = values.find(flag);
        if (it != values.end()) return it->second;

        for (const char* name : env_names) {
            const char* value = env(name);
            if (value != nullptr && *value != '\0') return value;
        }
        return default_value;
    }
};

/**
 * @throws std::invalid_argument unless `text` is a decimal number in
 *         [min, max].
 */
inline uint64_t parseNumber(const std::string& name, const std::string& text,
                            uint64_t min = 0, uint64_t max = std::numeric_limits<uint64_t>::max()) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Invalid value for " + name + ": '" + text + "'");
    }

    uint64_t value;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Value for " + name + " out of range: " + text);
    }

    if (value < min || value > max) {
        throw std::invalid_argument("Value for " + name + " must be between " + std::to_string(min) +
                                    " and " + std::to_string(max) + ", got " + text);
    }
    return value;
}

} // namespace config
} // namespace notesync
