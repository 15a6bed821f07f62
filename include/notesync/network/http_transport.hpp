#pragma once

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <string>
#include <utility>
#include "sync_endpoint.hpp"
#include "../core/status.hpp"

namespace notesync {
namespace network {

/**
 * @brief Request/response exchange with a notesync server.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Send one request and wait for its response.
     * @return TransportError if no response could be obtained. Any HTTP
     *         status, including 4xx/5xx, is a successful round trip.
     */
    virtual core::Status roundTrip(Request req, Response& out_response) = 0;
};

/**
 * @brief Parsed "http://host[:port][/]" address.
 */
struct ServerAddress {
    std::string host;
    std::string port = "80";

    /**
     * @return false if the address is not a plain http URL of a server
     *         root. The document only lives at "/", so a path is refused.
     */
    static bool parse(const std::string& url, ServerAddress& out_address) {
        const std::string scheme = "http://";
        if (url.compare(0, scheme.size(), scheme) != 0) return false;

        std::string rest = url.substr(scheme.size());
        ServerAddress address;

        auto slash = rest.find('/');
        std::string authority = rest.substr(0, slash);
        if (slash != std::string::npos && rest.substr(slash) != "/") return false;

        auto colon = authority.rfind(':');
        if (colon != std::string::npos && authority.find(']') == std::string::npos) {
            address.host = authority.substr(0, colon);
            address.port = authority.substr(colon + 1);
            if (address.port.empty()) return false;
            for (char c : address.port) {
                if (c < '0' || c > '9') return false;
            }
        } else {
            address.host = authority;
        }

        if (address.host.empty()) return false;
        out_address = std::move(address);
        return true;
    }
};

/**
 * @brief Blocking HTTP/1.1 client, one connection per request.
 * Every request is sent to the document at "/", with the Host,
 * User-Agent and auth headers added.
 */
class HttpTransport : public Transport {
private:
    ServerAddress address;
    std::string token;

public:
    HttpTransport(ServerAddress address_, std::string token_)
        : address(std::move(address_)), token(std::move(token_)) {}

    const ServerAddress& serverAddress() const {
        return address;
    }

    core::Status roundTrip(Request req, Response& out_response) override {
        namespace net = boost::asio;
        namespace beast = boost::beast;
        using tcp = net::ip::tcp;

        req.target("/");
        req.set(http::field::host, address.host);
        req.set(http::field::user_agent, "notesync/" BOOST_BEAST_VERSION_STRING);
        if (!token.empty()) req.set(SyncEndpoint::kAuthHeader, token);
        req.keep_alive(false);
        req.prepare_payload();

        net::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);
        beast::error_code ec;

        auto results = resolver.resolve(address.host, address.port, ec);
        if (ec) {
            return core::Status::TransportError("resolve " + address.host + ": " + ec.message());
        }

        stream.connect(results, ec);
        if (ec) {
            return core::Status::TransportError("connect " + address.host + ":" + address.port + ": " + ec.message());
        }

        http::write(stream, req, ec);
        if (ec) {
            return core::Status::TransportError("write request: " + ec.message());
        }

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(boost::none);
        if (req.method() == http::verb::head) parser.skip(true);

        http::read(stream, buffer, parser, ec);
        if (ec) {
            return core::Status::TransportError("read response: " + ec.message());
        }
        out_response = parser.release();

        // The server may already have closed its side
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return core::Status::OK();
    }
};

} // namespace network
} // namespace notesync
