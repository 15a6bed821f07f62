#pragma once

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/optional.hpp>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>
#include "sync_endpoint.hpp"

namespace notesync {
namespace network {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

struct ServerOptions {
    std::string address = "0.0.0.0";
    uint16_t port = 80;                   // 0 picks a free port, see HttpServer::port()
    uint64_t max_body_size = 1024 * 1024; // Parser limit; larger bodies get 413 without reaching the endpoint
    int read_timeout_seconds = 30;        // Idle keep-alive connections are dropped after this
    unsigned threads = 4;
};

/**
 * @brief One client connection. Reads requests, hands them to the
 * SyncEndpoint and writes the responses back, until the peer closes,
 * goes idle, or the server shuts down.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
private:
    beast::tcp_stream stream;
    beast::flat_buffer buffer;
    boost::optional<http::request_parser<http::string_body>> parser;
    Response res;

    SyncEndpoint& endpoint;
    const ServerOptions& options;
    std::shared_ptr<spdlog::logger> logger;

    // Only touched on the stream's strand
    bool reading = false;
    bool closing = false;

public:
    HttpSession(tcp::socket&& socket, SyncEndpoint& endpoint_, const ServerOptions& options_,
                std::shared_ptr<spdlog::logger> logger_)
        : stream(std::move(socket)), endpoint(endpoint_), options(options_), logger(std::move(logger_)) {}

    void run() {
        net::dispatch(stream.get_executor(),
                      beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
    }

    /**
     * @brief Finish the request in flight, if any, then close.
     * An idle connection is closed right away.
     */
    void close() {
        net::post(stream.get_executor(), [self = shared_from_this()]() {
            self->closing = true;
            if (self->reading) {
                self->stream.cancel();
            }
        });
    }

private:
    void doRead() {
        if (closing) return doClose();

        parser.emplace();
        parser->body_limit(options.max_body_size);

        stream.expires_after(std::chrono::seconds(options.read_timeout_seconds));
        reading = true;
        http::async_read(stream, buffer, *parser,
                         beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        reading = false;

        if (ec == http::error::end_of_stream || ec == beast::error::timeout ||
            ec == net::error::operation_aborted) {
            return doClose();
        }

        if (ec == http::error::body_limit) {
            logger->info("Body too large, over {} bytes", options.max_body_size);
            return sendError(http::status::payload_too_large, "body too large");
        }

        if (ec) {
            logger->info("Malformed request: {}", ec.message());
            return sendError(http::status::bad_request, "malformed request");
        }

        Request req = parser->release();
        Response response;
        try {
            response = endpoint.handle(req);
        } catch (const std::exception& e) {
            logger->error("Error handling request: {}", e.what());
            response = Response{http::status::internal_server_error, req.version()};
            response.keep_alive(false);
            response.prepare_payload();
        }
        sendResponse(std::move(response));
    }

    void sendError(http::status code, const std::string& text) {
        Response response{code, 11};
        response.set(http::field::server, "notesync");
        response.set(http::field::content_type, "text/plain; charset=utf-8");
        response.body() = text + "\n";
        response.keep_alive(false);
        response.prepare_payload();
        sendResponse(std::move(response));
    }

    void sendResponse(Response&& response) {
        res = std::move(response);
        if (closing) res.keep_alive(false);

        stream.expires_after(std::chrono::seconds(options.read_timeout_seconds));
        http::async_write(stream, res,
                          beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(), res.need_eof()));
    }

    void onWrite(bool close_after, beast::error_code ec, std::size_t) {
        if (ec) {
            logger->debug("Error writing response: {}", ec.message());
            return doClose();
        }
        if (close_after) return doClose();
        doRead();
    }

    void doClose() {
        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
};

/**
 * @brief HTTP/1.1 listener for a SyncEndpoint.
 *
 * Connections are served as independent sessions on a small pool of
 * threads. The endpoint, and through it the store, is called from any of
 * them concurrently.
 */
class HttpServer {
private:
    SyncEndpoint& endpoint;
    ServerOptions options;
    std::shared_ptr<spdlog::logger> logger;

    net::io_context ioc;
    net::strand<net::io_context::executor_type> strand;
    tcp::acceptor acceptor;
    net::signal_set signals;
    uint16_t bound_port = 0;

    std::mutex sessions_mtx;
    std::list<std::weak_ptr<HttpSession>> sessions;

public:
    HttpServer(SyncEndpoint& endpoint_, ServerOptions options_,
               std::shared_ptr<spdlog::logger> logger_ = spdlog::default_logger())
        : endpoint(endpoint_),
          options(std::move(options_)),
          logger(std::move(logger_)),
          ioc(static_cast<int>(options.threads == 0 ? 1 : options.threads)),
          strand(net::make_strand(ioc)),
          acceptor(strand),
          signals(strand) {}

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Open the listening socket.
     * @return false if the address is invalid or cannot be bound.
     */
    bool bind() {
        beast::error_code ec;
        auto address = net::ip::make_address(options.address, ec);
        if (ec) {
            logger->error("Invalid listen address {}: {}", options.address, ec.message());
            return false;
        }

        tcp::endpoint ep{address, options.port};
        acceptor.open(ep.protocol(), ec);
        if (!ec) acceptor.set_option(net::socket_base::reuse_address(true), ec);
        if (!ec) acceptor.bind(ep, ec);
        if (!ec) acceptor.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            logger->error("Failed to listen on {}:{}: {}", options.address, options.port, ec.message());
            beast::error_code ignored;
            acceptor.close(ignored);
            return false;
        }

        bound_port = acceptor.local_endpoint().port();
        logger->info("Listening on {}:{}", options.address, bound_port);
        return true;
    }

    uint16_t port() const {
        return bound_port;
    }

    /**
     * @brief Stop on SIGINT / SIGTERM. Call before run().
     */
    void handleSignals() {
        signals.add(SIGINT);
        signals.add(SIGTERM);
        signals.async_wait([this](const beast::error_code& ec, int signo) {
            if (ec) return;
            logger->info("Received signal {}, shutting down", signo);
            shutdown();
        });
    }

    /**
     * @brief Serve until stop() (or a handled signal). Blocks the caller,
     * which becomes one of the worker threads.
     */
    void run() {
        net::dispatch(strand, [this]() { doAccept(); });

        std::vector<std::thread> workers;
        unsigned extra = options.threads > 1 ? options.threads - 1 : 0;
        workers.reserve(extra);
        for (unsigned i = 0; i < extra; i++) {
            workers.emplace_back([this]() { ioc.run(); });
        }
        ioc.run();
        for (auto& t : workers) {
            t.join();
        }

        logger->info("Server stopped");
    }

    /**
     * @brief Thread-safe. Stops accepting, lets in-flight requests finish and
     * closes idle connections; run() returns once all sessions are gone.
     */
    void stop() {
        net::post(strand, [this]() { shutdown(); });
    }

private:
    void doAccept() {
        if (!acceptor.is_open()) return;
        acceptor.async_accept(net::make_strand(ioc),
                              net::bind_executor(strand, [this](beast::error_code ec, tcp::socket socket) {
                                  onAccept(ec, std::move(socket));
                              }));
    }

    void onAccept(beast::error_code ec, tcp::socket socket) {
        if (!acceptor.is_open()) return;

        if (ec) {
            logger->warn("Accept failed: {}", ec.message());
        } else {
            auto session = std::make_shared<HttpSession>(std::move(socket), endpoint, options, logger);
            track(session);
            session->run();
        }
        doAccept();
    }

    void track(const std::shared_ptr<HttpSession>& session) {
        std::lock_guard<std::mutex> lock(sessions_mtx);
        sessions.remove_if([](const std::weak_ptr<HttpSession>& w) { return w.expired(); });
        sessions.push_back(session);
    }

    // Runs on the strand
    void shutdown() {
        beast::error_code ec;
        acceptor.close(ec);
        signals.cancel(ec);

        std::lock_guard<std::mutex> lock(sessions_mtx);
        for (auto& w : sessions) {
            if (auto session = w.lock()) {
                session->close();
            }
        }
        sessions.clear();
    }
};

} // namespace network
} // namespace notesync
