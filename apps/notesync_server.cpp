#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include "notesync/notesync.hpp"
#include "notesync/storage/s3_backend.hpp"

using namespace notesync;

namespace {

int serve(const config::ServerConfig& cfg, const std::shared_ptr<spdlog::logger>& logger) {
    // Declared first: the SDK must outlive every S3 client
    std::unique_ptr<storage::AwsApi> aws;
    std::shared_ptr<storage::ObjectBackend> backend;

    if (cfg.backend == "memory") {
        logger->warn("Using the in-memory backend, the document is lost on exit");
        backend = std::make_shared<storage::MemoryBackend>();
    } else {
        aws = std::make_unique<storage::AwsApi>();
        storage::S3Options s3_options;
        s3_options.region = cfg.region;
        s3_options.endpoint_url = cfg.endpoint_url;
        s3_options.max_retries = cfg.max_retries;
        backend = std::make_shared<storage::S3Backend>(s3_options);
        logger->info("Using {} in {}{}", cfg.object.toString(), cfg.region,
                     cfg.endpoint_url.empty() ? "" : " via " + cfg.endpoint_url);
    }

    if (cfg.access_token.empty()) {
        logger->warn("No access token configured, authentication is disabled");
    }

    auto store = std::make_shared<core::VersionedObjectStore>(backend, cfg.object, logger);
    network::SyncEndpoint endpoint(store, cfg.endpointOptions(), logger);

    network::HttpServer server(endpoint, cfg.serverOptions(), logger);
    if (!server.bind()) return 1;

    server.handleSignals();
    server.run();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    config::ServerConfig cfg;
    try {
        cfg = config::ServerConfig::parse(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << config::ServerConfig::usage();
        return 1;
    }

    if (cfg.help) {
        std::cout << config::ServerConfig::usage();
        return 0;
    }

    auto logger = makeLogger("notesync", cfg.log_level);
    spdlog::set_default_logger(logger);
    logger->info("notesync server {}", VERSION_STRING);

    try {
        return serve(cfg, logger);
    } catch (const std::exception& e) {
        logger->critical("Fatal: {}", e.what());
        return 1;
    }
}
