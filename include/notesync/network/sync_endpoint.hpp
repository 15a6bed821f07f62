#pragma once

#include <boost/beast/http.hpp>

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>
#include "html_view.hpp"
#include "../core/status.hpp"
#include "../core/version_token.hpp"
#include "../core/versioned_object_store.hpp"

namespace notesync {
namespace network {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

struct EndpointOptions {
    std::string access_token;            // Shared secret; empty disables the check
    uint64_t max_body_size = 1024 * 1024; // PUT bodies of this size or larger are rejected
};

/**
 * @brief HTTP face of the VersionedObjectStore.
 *
 *   GET  /            conditional read (If-Modified-Since)
 *   HEAD /            current version only (Last-Modified)
 *   PUT  /            versioned write (Last-Modified), Force bypasses the check
 *   GET  /index.html  browser view
 *
 * Everything the client controls (auth, version headers, body size) is
 * validated here before the store is called. Store outcomes map to:
 *
 *   NotFound        -> 404
 *   NotModified     -> 304
 *   VersionConflict -> 409
 *   InvalidVersion  -> 500
 *   TransportError  -> 500
 */
class SyncEndpoint {
public:
    static constexpr const char* kAuthHeader = "X-Auth-Access-Token";
    static constexpr const char* kLegacyAuthHeader = "Token";
    static constexpr const char* kForceHeader = "Force";
    static constexpr const char* kViewPath = "/index.html";

private:
    std::shared_ptr<core::VersionedObjectStore> store;
    EndpointOptions options;
    std::shared_ptr<spdlog::logger> logger;

public:
    SyncEndpoint(std::shared_ptr<core::VersionedObjectStore> store_,
                 EndpointOptions options_,
                 std::shared_ptr<spdlog::logger> logger_ = spdlog::default_logger())
        : store(std::move(store_)), options(std::move(options_)), logger(std::move(logger_)) {}

    const EndpointOptions& getOptions() const {
        return options;
    }

    Response handle(const Request& req) {
        std::string target = path(req);
        logger->info("Request {}: {}, Content Length {}",
                     toString(req.method_string()), target, req.body().size());

        Response res = dispatch(req, target);

        logger->info("Request served: {} {}", res.result_int(), toString(res.reason()));
        return res;
    }

private:
    Response dispatch(const Request& req, const std::string& target) {
        if (!options.access_token.empty()) {
            std::string token = header(req, kAuthHeader);
            if (token.empty()) token = header(req, kLegacyAuthHeader);

            if (token.empty()) {
                logger->warn("No auth token provided");
                return textResponse(req, http::status::unauthorized, "no auth token provided");
            }
            if (!sameToken(token, options.access_token)) {
                logger->warn("Invalid auth token");
                return textResponse(req, http::status::forbidden, "invalid token");
            }
        }

        if (req.method() == http::verb::get && target == kViewPath) {
            return getView(req);
        }

        if (target != "" && target != "/") {
            logger->info("Invalid path {}", target);
            return textResponse(req, http::status::not_found, "not found");
        }

        switch (req.method()) {
            case http::verb::get:
                return get(req);
            case http::verb::head:
                return head(req);
            case http::verb::put:
                return put(req);
            default:
                break;
        }

        logger->info("Invalid request, method {} not allowed", toString(req.method_string()));
        Response res = textResponse(req, http::status::method_not_allowed, "method not allowed");
        res.set(http::field::allow, "GET, HEAD, PUT");
        return res;
    }

    Response get(const Request& req) {
        core::VersionToken client_version;
        std::string date = header(req, http::field::if_modified_since);
        if (!date.empty() && !core::VersionToken::parse(date, client_version)) {
            logger->info("Unrecognized version date '{}'", date);
            return textResponse(req, http::status::bad_request, "unrecognized version date");
        }

        std::ostringstream content;
        core::VersionToken stored_version;
        core::Status status = store->get(client_version, content, stored_version);
        if (!status.ok()) {
            Response res = errorResponse(req, status);
            if (status.code() == core::StatusCode::NotModified) {
                res.set(http::field::last_modified, client_version.format());
            }
            return res;
        }

        Response res = emptyResponse(req, http::status::ok);
        res.set(http::field::content_type, "text/plain; charset=utf-8");
        res.set(http::field::last_modified, stored_version.format());
        res.body() = content.str();
        res.prepare_payload();
        return res;
    }

    // Headers describe the entity a GET would return, the body stays empty
    Response head(const Request& req) {
        core::VersionToken version;
        uint64_t length = 0;
        core::Status status = store->getCurrentVersion(version, length);
        if (!status.ok()) {
            return errorResponse(req, status);
        }

        Response res = emptyResponse(req, http::status::ok);
        res.set(http::field::content_type, "text/plain; charset=utf-8");
        res.set(http::field::last_modified, version.format());
        res.content_length(length);
        return res;
    }

    Response put(const Request& req) {
        core::VersionToken version;
        std::string date = header(req, http::field::last_modified);
        if (!core::VersionToken::parse(date, version)) {
            logger->info("Unrecognized version date '{}'", date);
            return textResponse(req, http::status::bad_request, "unrecognized version date");
        }

        const std::string& body = req.body();
        if (body.empty()) {
            logger->info("Missing body or content length");
            return textResponse(req, http::status::bad_request, "missing body");
        }

        if (body.size() >= options.max_body_size) {
            logger->info("Body too large: {} bytes", body.size());
            return textResponse(req, http::status::payload_too_large, "body too large");
        }

        core::Status status;
        core::VersionToken stored_version = version;
        std::string force = header(req, kForceHeader);
        if (force.empty() || force == "false") {
            status = store->safePut(version, body);
        } else {
            logger->info("Requested FORCE put");
            status = store->overwrite(body, stored_version);
        }

        if (!status.ok()) {
            return errorResponse(req, status);
        }

        Response res = emptyResponse(req, http::status::ok);
        res.set(http::field::last_modified, stored_version.format());
        res.prepare_payload();
        return res;
    }

    Response getView(const Request& req) {
        std::ostringstream content;
        core::VersionToken version;
        core::Status status = store->get(core::VersionToken(), content, version);
        if (!status.ok()) {
            logger->info("Error getting view: {}", status.toString());
            return errorResponse(req, status);
        }

        Response res = emptyResponse(req, http::status::ok);
        res.set(http::field::content_type, "text/html; charset=utf-8");
        res.set(http::field::last_modified, version.format());
        res.body() = renderHtmlView(content.str());
        res.prepare_payload();
        logger->info("View served");
        return res;
    }

    static http::status statusFor(core::StatusCode code) {
        switch (code) {
            case core::StatusCode::Ok:              return http::status::ok;
            case core::StatusCode::NotFound:        return http::status::not_found;
            case core::StatusCode::NotModified:     return http::status::not_modified;
            case core::StatusCode::VersionConflict: return http::status::conflict;
            case core::StatusCode::InvalidVersion:  return http::status::internal_server_error;
            case core::StatusCode::TransportError:  return http::status::internal_server_error;
        }
        return http::status::internal_server_error;
    }

    Response errorResponse(const Request& req, const core::Status& status) {
        http::status code = statusFor(status.code());
        if (code == http::status::internal_server_error) {
            logger->error("Error serving request: {}", status.toString());
        } else {
            logger->info("{}", status.toString());
        }

        if (code == http::status::not_modified) {
            Response res = emptyResponse(req, code);
            res.prepare_payload();
            return res;
        }
        return textResponse(req, code, core::toString(status.code()));
    }

    static Response emptyResponse(const Request& req, http::status code) {
        Response res{code, req.version()};
        res.set(http::field::server, "notesync");
        res.keep_alive(req.keep_alive());
        return res;
    }

    static Response textResponse(const Request& req, http::status code, const std::string& text) {
        Response res = emptyResponse(req, code);
        res.set(http::field::content_type, "text/plain; charset=utf-8");
        if (req.method() == http::verb::head) {
            res.content_length(text.size() + 1);
            return res;
        }
        res.body() = text + "\n";
        res.prepare_payload();
        return res;
    }

    static std::string toString(boost::beast::string_view sv) {
        return std::string(sv.data(), sv.size());
    }

    template <typename Field>
    static std::string header(const Request& req, Field field) {
        auto it = req.find(field);
        if (it == req.end()) return "";
        return toString(it->value());
    }

    static std::string path(const Request& req) {
        std::string target = toString(req.target());
        auto query = target.find('?');
        if (query != std::string::npos) target.erase(query);
        return target;
    }

    // Constant time with respect to the token contents
    static bool sameToken(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return false;
        unsigned char diff = 0;
        for (size_t i = 0; i < a.size(); i++) {
            diff |= static_cast<unsigned char>(a[i] ^ b[i]);
        }
        return diff == 0;
    }
};

} // namespace network
} // namespace notesync
