#pragma once

#include <cstdint>
#include <map>
#include <string>
#include "../core/status.hpp"

namespace notesync {
namespace storage {

/**
 * @brief Location of a blob.
 */
struct ObjectKey {
    std::string bucket; // Namespace / bucket name
    std::string key;    // Object name inside the bucket

    bool operator==(const ObjectKey& other) const {
        return bucket == other.bucket && key == other.key;
    }

    bool operator<(const ObjectKey& other) const {
        if (bucket != other.bucket) return bucket < other.bucket;
        return key < other.key;
    }

    std::string toString() const {
        return "s3://" + bucket + "/" + key;
    }
};

using Metadata = std::map<std::string, std::string>;

/**
 * @brief Everything a HEAD returns: no content, only its description.
 */
struct ObjectHead {
    Metadata metadata;
    uint64_t content_length = 0;
    std::string content_type;
};

/**
 * @brief Storage adapter for a keyed blob with user metadata.
 *
 * Implementations translate their backend's "no such key" signal into
 * StatusCode::NotFound and every other failure into
 * StatusCode::TransportError. They never interpret the metadata.
 */
class ObjectBackend {
public:
    virtual ~ObjectBackend() = default;

    /**
     * @brief Fetch metadata and length without the content.
     */
    virtual core::Status headObject(const ObjectKey& key, ObjectHead& out_head) = 0;

    /**
     * @brief Fetch content and metadata.
     */
    virtual core::Status getObject(const ObjectKey& key, ObjectHead& out_head, std::string& out_content) = 0;

    /**
     * @brief Replace the whole object.
     * head.content_length is the declared length and must match content.size().
     */
    virtual core::Status putObject(const ObjectKey& key, const ObjectHead& head, const std::string& content) = 0;
};

} // namespace storage
} // namespace notesync
