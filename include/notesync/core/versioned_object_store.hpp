#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>
#include "status.hpp"
#include "version_token.hpp"
#include "../storage/object_backend.hpp"

namespace notesync {
namespace core {

/**
 * @brief The single synchronized document and its version protocol.
 *
 * The document is one blob in an ObjectBackend; its version is an RFC 1123
 * timestamp kept in the blob's metadata under "version". Every call derives
 * the object's state (absent / valid version / invalid version) afresh from
 * the backend. Nothing is cached and no lock is held between calls.
 *
 * Reads are conditional: content is only handed out when the stored version
 * is strictly newer than the caller's. Writes are optimistic: safePut only
 * replaces the object when the caller's version is strictly newer than the
 * stored one.
 *
 * safePut checks and then writes in two backend calls. Two writers racing
 * with the same stale version can both pass the check and the later write
 * wins. Closing that window needs a conditional write in the backend
 * itself, not a lock here: writers may live in different processes.
 */
class VersionedObjectStore {
public:
    using Clock = std::function<VersionToken()>;

    static constexpr const char* kVersionMetadata = "version";
    static constexpr const char* kContentType = "text/plain";

private:
    std::shared_ptr<storage::ObjectBackend> backend;
    storage::ObjectKey object_key;
    std::shared_ptr<spdlog::logger> logger;
    Clock clock;

public:
    VersionedObjectStore(std::shared_ptr<storage::ObjectBackend> backend_,
                         storage::ObjectKey key,
                         std::shared_ptr<spdlog::logger> logger_ = spdlog::default_logger(),
                         Clock clock_ = &VersionToken::now)
        : backend(std::move(backend_)),
          object_key(std::move(key)),
          logger(std::move(logger_)),
          clock(std::move(clock_)) {}

    const storage::ObjectKey& key() const {
        return object_key;
    }

    /**
     * @brief Read the stored version without transferring the content.
     * @return NotFound, InvalidVersion, TransportError or Ok.
     */
    Status getCurrentVersion(VersionToken& out_version) const {
        uint64_t length = 0;
        return getCurrentVersion(out_version, length);
    }

    /**
     * @brief Same, also reporting the content length in bytes.
     */
    Status getCurrentVersion(VersionToken& out_version, uint64_t& out_length) const {
        storage::ObjectHead head;
        Status status = backend->headObject(object_key, head);
        if (!status.ok()) {
            logBackendFailure("Error getting file info", status);
            return status;
        }

        status = storedVersion(head, out_version);
        if (status.ok()) out_length = head.content_length;
        return status;
    }

    /**
     * @brief Conditional read.
     *
     * stored >  client: Ok, content written to out, out_version = stored
     * stored == client: NotModified, nothing written
     * stored <  client: VersionConflict, nothing written (the client claims
     *                   a version the store never had)
     */
    Status get(const VersionToken& client_version, std::ostream& out, VersionToken& out_version) const {
        storage::ObjectHead head;
        std::string content;
        Status status = backend->getObject(object_key, head, content);
        if (!status.ok()) {
            logBackendFailure("Error getting file", status);
            return status;
        }

        VersionToken current;
        status = storedVersion(head, current);
        if (!status.ok()) return status;

        int cmp = current.compare(client_version);
        if (cmp == 0) {
            logger->debug("Client already has version {}", current.format());
            return Status::NotModified();
        }
        if (cmp < 0) {
            logger->info("The provided version {} is newer than the stored {}",
                         client_version.format(), current.format());
            return Status::VersionConflict("requested version is newer than the stored one");
        }

        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) {
            logger->error("Error writing file to the output");
            return Status::TransportError("error writing content to the output");
        }

        out_version = current;
        return Status::OK();
    }

    /**
     * @brief Optimistic write: replace the content only if new_version is
     * strictly after the stored version. An absent object counts as the
     * zero version.
     */
    Status safePut(const VersionToken& new_version, const std::string& content) {
        VersionToken current;
        Status status = getCurrentVersion(current);
        if (status.code() == StatusCode::NotFound) {
            current = VersionToken();
        } else if (!status.ok()) {
            return status;
        }

        if (new_version <= current) {
            logger->info("Version conflict, stored version {} is not older than {}",
                         current.isZero() ? "<none>" : current.format(), new_version.format());
            return Status::VersionConflict("stored version is not older than the provided one");
        }

        return write(new_version, content);
    }

    /**
     * @brief Unconditional write stamped with the current wall-clock second.
     * @param out_version Receives the version the content was stored with.
     */
    Status overwrite(const std::string& content, VersionToken& out_version) {
        VersionToken version = clock();
        Status status = write(version, content);
        if (status.ok()) out_version = version;
        return status;
    }

private:
    Status storedVersion(const storage::ObjectHead& head, VersionToken& out_version) const {
        auto it = head.metadata.find(kVersionMetadata);
        if (it == head.metadata.end()) {
            logger->error("Missing stored version on {}", object_key.toString());
            return Status::InvalidVersion("missing stored version");
        }

        VersionToken version;
        if (!VersionToken::parse(it->second, version)) {
            logger->error("Invalid stored version '{}' on {}", it->second, object_key.toString());
            return Status::InvalidVersion("unparsable stored version '" + it->second + "'");
        }

        out_version = version;
        return Status::OK();
    }

    Status write(const VersionToken& version, const std::string& content) {
        storage::ObjectHead head;
        head.metadata[kVersionMetadata] = version.format();
        head.content_length = content.size();
        head.content_type = kContentType;

        Status status = backend->putObject(object_key, head, content);
        if (!status.ok()) {
            logger->error("Can't store the file: {}", status.toString());
            return status;
        }

        logger->info("Stored {} bytes with version {}", content.size(), version.format());
        return Status::OK();
    }

    void logBackendFailure(const char* what, const Status& status) const {
        if (status.code() == StatusCode::NotFound) {
            logger->info("File not found: {}", object_key.toString());
        } else {
            logger->error("{}: {}", what, status.toString());
        }
    }
};

} // namespace core
} // namespace notesync
