#pragma once

#include <string>
#include <utility>

namespace notesync {
namespace core {

/**
 * @brief Outcome kinds shared by the store, its backends and the endpoint.
 *
 * NotModified is success-adjacent: nothing failed, but no content was
 * transferred. Every other non-Ok code is a distinct failure and is never
 * folded into another one.
 */
enum class StatusCode {
    Ok,
    NotFound,        // The object does not exist
    InvalidVersion,  // The object exists but its version metadata is missing or unparsable
    NotModified,     // The caller already has the stored version
    VersionConflict, // The caller's version disagrees with the stored one
    TransportError   // Opaque backend / I/O failure
};

inline const char* toString(StatusCode code) {
    switch (code) {
        case StatusCode::Ok:              return "ok";
        case StatusCode::NotFound:        return "not found";
        case StatusCode::InvalidVersion:  return "invalid version";
        case StatusCode::NotModified:     return "not modified";
        case StatusCode::VersionConflict: return "version conflict";
        case StatusCode::TransportError:  return "transport error";
    }
    return "unknown";
}

/**
 * @brief A StatusCode plus a human readable message.
 * Returned by value from every store and backend call; results travel
 * through reference out-parameters.
 */
class Status {
private:
    StatusCode code_;
    std::string message_;

public:
    Status() : code_(StatusCode::Ok) {}

    Status(StatusCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    static Status OK() { return Status(); }

    static Status NotFound(std::string message = "not found") {
        return Status(StatusCode::NotFound, std::move(message));
    }

    static Status InvalidVersion(std::string message = "invalid version") {
        return Status(StatusCode::InvalidVersion, std::move(message));
    }

    static Status NotModified(std::string message = "not modified") {
        return Status(StatusCode::NotModified, std::move(message));
    }

    static Status VersionConflict(std::string message = "version conflict") {
        return Status(StatusCode::VersionConflict, std::move(message));
    }

    static Status TransportError(std::string message) {
        return Status(StatusCode::TransportError, std::move(message));
    }

    bool ok() const { return code_ == StatusCode::Ok; }

    StatusCode code() const { return code_; }

    const std::string& message() const { return message_; }

    std::string toString() const {
        if (message_.empty()) return core::toString(code_);
        return std::string(core::toString(code_)) + ": " + message_;
    }

    bool operator==(StatusCode code) const { return code_ == code; }
    bool operator!=(StatusCode code) const { return code_ != code; }
};

} // namespace core
} // namespace notesync
