#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include "notesync/notesync.hpp"

using namespace notesync;

namespace {

// Exit codes
constexpr int kExitOk = 0;
constexpr int kExitConfig = 1;
constexpr int kExitTransport = 2;
constexpr int kExitConflict = 3;

int exitCode(const core::Status& status) {
    switch (status.code()) {
        case core::StatusCode::Ok:
        case core::StatusCode::NotModified:
            return kExitOk;
        case core::StatusCode::VersionConflict:
            return kExitConflict;
        default:
            return kExitTransport;
    }
}

std::string describe(const core::VersionToken& version) {
    return version.isZero() ? "none" : version.format();
}

core::Status printStatus(client::SyncClient& sync) {
    core::VersionToken local;
    core::Status status = sync.localVersion(local);
    if (!status.ok() && status.code() != core::StatusCode::NotFound) return status;

    core::VersionToken remote;
    status = sync.remoteVersion(remote);
    if (!status.ok()) return status;

    std::cout << "local:  " << describe(local) << " (" << sync.path() << ")\n";
    std::cout << "remote: " << describe(remote) << "\n";
    if (local == remote) {
        std::cout << "up to date\n";
    } else if (local > remote) {
        std::cout << "local copy is newer, push it\n";
    } else {
        std::cout << "server copy is newer, pull it\n";
    }
    return core::Status::OK();
}

int runCommand(const config::ClientConfig& cfg, const std::shared_ptr<spdlog::logger>& logger) {
    auto transport = std::make_shared<network::HttpTransport>(cfg.address, cfg.token);
    client::SyncClient sync(transport, cfg.file, logger);

    core::Status status;
    switch (cfg.command) {
        case config::ClientCommand::Status:
            status = printStatus(sync);
            break;
        case config::ClientCommand::Pull: {
            bool updated = false;
            status = sync.pull(updated);
            break;
        }
        case config::ClientCommand::Push: {
            core::VersionToken stored;
            status = sync.push(cfg.force, stored);
            break;
        }
        case config::ClientCommand::Sync: {
            client::SyncAction action = client::SyncAction::None;
            status = sync.sync(action);
            if (status.ok()) logger->info("Sync done: {}", client::toString(action));
            break;
        }
        case config::ClientCommand::Edit:
            status = sync.edit(cfg.editor);
            break;
    }

    if (status.code() == core::StatusCode::VersionConflict) {
        logger->error("Version conflict, the server has a different copy: {}", status.toString());
        logger->error("Pull it first, or push with --force to replace it");
    } else if (!status.ok() && status.code() != core::StatusCode::NotModified) {
        logger->error("{}", status.toString());
    }
    return exitCode(status);
}

} // namespace

int main(int argc, char* argv[]) {
    config::ClientConfig cfg;
    try {
        cfg = config::ClientConfig::parse(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << config::ClientConfig::usage();
        return kExitConfig;
    }

    if (cfg.help) {
        std::cout << config::ClientConfig::usage();
        return kExitOk;
    }

    auto logger = makeLogger("notesync", cfg.log_level, LogOutput::Stderr);
    try {
        return runCommand(cfg, logger);
    } catch (const std::exception& e) {
        logger->critical("Fatal: {}", e.what());
        return kExitTransport;
    }
}
