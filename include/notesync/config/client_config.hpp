#pragma once

#include <stdexcept>
#include <string>
#include "arguments.hpp"
#include "../logging.hpp"
#include "../network/http_transport.hpp"

namespace notesync {
namespace config {

enum class ClientCommand {
    Status,
    Pull,
    Push,
    Sync,
    Edit
};

inline bool parseClientCommand(const std::string& name, ClientCommand& out_command) {
    if (name == "status") out_command = ClientCommand::Status;
    else if (name == "pull") out_command = ClientCommand::Pull;
    else if (name == "push") out_command = ClientCommand::Push;
    else if (name == "sync") out_command = ClientCommand::Sync;
    else if (name == "edit") out_command = ClientCommand::Edit;
    else return false;
    return true;
}

/**
 * @brief Settings of notesync_client.
 */
struct ClientConfig {
    network::ServerAddress address;
    std::string file;
    std::string token;
    std::string editor = "vim";
    ClientCommand command = ClientCommand::Edit;
    bool force = false;
    std::string log_level = "info";
    bool help = false;

    /**
     * @throws std::runtime_error / std::invalid_argument on bad or missing
     *         settings. With --help nothing else is checked.
     */
    static ClientConfig parse(int argc, char* argv[], const EnvLookup& env = processEnv()) {
        Arguments args = Arguments::parse(argc, argv, {"--addr", "--file", "--token", "--editor", "--log-level"},
                                          {"--force", "--help"});

        ClientConfig config;
        config.help = args.has("--help");
        if (config.help) return config;

        if (args.positional.size() > 1) {
            throw std::runtime_error("Unexpected argument: " + args.positional[1]);
        }
        if (!args.positional.empty() && !parseClientCommand(args.positional.front(), config.command)) {
            throw std::invalid_argument("Unknown command '" + args.positional.front() + "'");
        }

        config.force = args.has("--force");
        if (config.force && config.command != ClientCommand::Push) {
            throw std::invalid_argument("--force only applies to push");
        }

        std::string addr = args.resolve("--addr", {"NOTESYNC_ADDR"}, env, "");
        if (addr.empty()) {
            throw std::invalid_argument("No server address, set NOTESYNC_ADDR or --addr");
        }
        if (!network::ServerAddress::parse(addr, config.address)) {
            throw std::invalid_argument("Invalid server address '" + addr + "', expected http://host[:port]");
        }

        config.file = args.resolve("--file", {"NOTESYNC_FILE"}, env, "");
        if (config.file.empty()) {
            throw std::invalid_argument("No file, set NOTESYNC_FILE or --file");
        }

        config.token = args.resolve("--token", {"NOTESYNC_TOKEN"}, env, "");
        if (config.token.empty()) {
            throw std::invalid_argument("No access token, set NOTESYNC_TOKEN or --token");
        }

        config.editor = args.resolve("--editor", {"NOTESYNC_EDITOR"}, env, config.editor);

        config.log_level = args.resolve("--log-level", {"NOTESYNC_LOG_LEVEL"}, env, config.log_level);
        parseLogLevel(config.log_level);

        return config;
    }

    static const char* usage() {
        return "Usage: notesync_client [status|pull|push|sync|edit] [options]\n"
               "\n"
               "  status             Compare the local file with the server\n"
               "  pull               Download the server copy if it is newer\n"
               "  push [--force]     Upload the local file; --force ignores versions\n"
               "  sync               Pull or push, whichever side is newer\n"
               "  edit               Sync, open the editor, upload the result (default)\n"
               "\n"
               "  --addr URL         Server address (NOTESYNC_ADDR)\n"
               "  --file PATH        Local copy of the document (NOTESYNC_FILE)\n"
               "  --token SECRET     Access token (NOTESYNC_TOKEN)\n"
               "  --editor COMMAND   Editor (NOTESYNC_EDITOR, default vim)\n"
               "  --log-level LEVEL  trace|debug|info|warn|error|critical|off (default info)\n"
               "  --help             Show this message\n";
    }
};

} // namespace config
} // namespace notesync
