#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include "arguments.hpp"
#include "../logging.hpp"
#include "../network/http_server.hpp"
#include "../network/sync_endpoint.hpp"
#include "../storage/object_backend.hpp"

namespace notesync {
namespace config {

/**
 * @brief Settings of notesync_server. Each one comes from its flag, else
 * its environment variable, else the default.
 */
struct ServerConfig {
    std::string backend = "s3";  // "s3" or "memory"
    storage::ObjectKey object{"notesync", "notes.md"};
    std::string region = "us-west-2";
    std::string endpoint_url;    // Empty for AWS itself
    long max_retries = 3;

    std::string access_token;
    uint64_t max_body_size = 1024 * 1024;
    network::ServerOptions server;

    std::string log_level = "info";
    bool help = false;

    network::EndpointOptions endpointOptions() const {
        network::EndpointOptions options;
        options.access_token = access_token;
        options.max_body_size = max_body_size;
        return options;
    }

    network::ServerOptions serverOptions() const {
        network::ServerOptions options = server;
        options.max_body_size = max_body_size;
        return options;
    }

    /**
     * @throws std::runtime_error / std::invalid_argument on bad input.
     */
    static ServerConfig parse(int argc, char* argv[], const EnvLookup& env = processEnv()) {
        Arguments args = Arguments::parse(argc, argv,
                                          {"--bucket", "--key", "--region", "--endpoint-url", "--backend",
                                           "--address", "--port", "--token", "--max-body", "--max-retries",
                                           "--read-timeout", "--threads", "--log-level"},
                                          {"--help"});
        if (!args.positional.empty()) {
            throw std::runtime_error("Unexpected argument: " + args.positional.front());
        }

        ServerConfig config;
        config.help = args.has("--help");

        config.backend = args.resolve("--backend", {"NOTESYNC_BACKEND"}, env, config.backend);
        if (config.backend != "s3" && config.backend != "memory") {
            throw std::invalid_argument("Unknown backend '" + config.backend + "', expected s3 or memory");
        }

        config.object.bucket = args.resolve("--bucket", {"NOTESYNC_BUCKET"}, env, config.object.bucket);
        config.object.key = args.resolve("--key", {"NOTESYNC_KEY"}, env, config.object.key);
        if (config.object.bucket.empty() || config.object.key.empty()) {
            throw std::invalid_argument("Bucket and key must not be empty");
        }

        config.region = args.resolve("--region", {"NOTESYNC_REGION", "AWS_REGION"}, env, config.region);
        config.endpoint_url = args.resolve("--endpoint-url", {"NOTESYNC_ENDPOINT_URL"}, env, "");
        config.max_retries = static_cast<long>(
            parseNumber("--max-retries", args.resolve("--max-retries", {"NOTESYNC_MAX_RETRIES"}, env, "3"), 0, 100));

        config.access_token = args.resolve("--token", {"NOTESYNC_TOKEN", "TOKEN"}, env, "");
        config.max_body_size =
            parseNumber("--max-body", args.resolve("--max-body", {"NOTESYNC_MAX_BODY"}, env, "1048576"), 1);

        config.server.address = args.resolve("--address", {"NOTESYNC_ADDRESS"}, env, config.server.address);
        config.server.port = static_cast<uint16_t>(
            parseNumber("--port", args.resolve("--port", {"NOTESYNC_PORT"}, env, "80"), 0, 65535));
        config.server.read_timeout_seconds = static_cast<int>(parseNumber(
            "--read-timeout", args.resolve("--read-timeout", {"NOTESYNC_READ_TIMEOUT"}, env, "30"), 1, 3600));
        config.server.threads = static_cast<unsigned>(
            parseNumber("--threads", args.resolve("--threads", {"NOTESYNC_THREADS"}, env, "4"), 1, 256));
        config.server.max_body_size = config.max_body_size;

        config.log_level = args.resolve("--log-level", {"NOTESYNC_LOG_LEVEL"}, env, config.log_level);
        parseLogLevel(config.log_level);

        return config;
    }

    static const char* usage() {
        return "Usage: notesync_server [options]\n"
               "\n"
               "  --backend s3|memory     Object storage (NOTESYNC_BACKEND, default s3)\n"
               "  --bucket NAME           Bucket holding the document (NOTESYNC_BUCKET, default notesync)\n"
               "  --key NAME              Object key of the document (NOTESYNC_KEY, default notes.md)\n"
               "  --region NAME           AWS region (NOTESYNC_REGION or AWS_REGION, default us-west-2)\n"
               "  --endpoint-url URL      S3 compatible endpoint (NOTESYNC_ENDPOINT_URL)\n"
               "  --max-retries N         Storage retries (NOTESYNC_MAX_RETRIES, default 3)\n"
               "  --address ADDR          Listen address (NOTESYNC_ADDRESS, default 0.0.0.0)\n"
               "  --port N                Listen port (NOTESYNC_PORT, default 80)\n"
               "  --token SECRET          Access token, empty disables auth (NOTESYNC_TOKEN or TOKEN)\n"
               "  --max-body BYTES        Largest accepted document is one byte less (NOTESYNC_MAX_BODY, default 1048576)\n"
               "  --read-timeout SECONDS  Idle connection timeout (NOTESYNC_READ_TIMEOUT, default 30)\n"
               "  --threads N             Worker threads (NOTESYNC_THREADS, default 4)\n"
               "  --log-level LEVEL       trace|debug|info|warn|error|critical|off (NOTESYNC_LOG_LEVEL, default info)\n"
               "  --help                  Show this message\n";
    }
};

} // namespace config
} // namespace notesync
