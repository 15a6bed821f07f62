#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include "object_backend.hpp"

namespace notesync {
namespace storage {

/**
 * @brief In-process ObjectBackend.
 *
 * Used by the tests and by `notesync_server --backend memory` for local
 * runs. Objects can be seeded with arbitrary metadata (e.g. none at all) and
 * the next N calls can be made to fail with a transport error.
 */
class MemoryBackend : public ObjectBackend {
public:
    struct Object {
        Metadata metadata;
        std::string content;
        std::string content_type;
    };

private:
    mutable std::mutex mtx;
    std::map<ObjectKey, Object> objects;

    // Failure injection
    size_t failures_pending = 0;
    std::string failure_message;

    std::atomic<uint64_t> head_calls{0};
    std::atomic<uint64_t> get_calls{0};
    std::atomic<uint64_t> put_calls{0};

    // Caller holds mtx
    bool consumeFailure(core::Status& out_status) {
        if (failures_pending == 0) return false;
        failures_pending--;
        out_status = core::Status::TransportError(failure_message);
        return true;
    }

public:
    core::Status headObject(const ObjectKey& key, ObjectHead& out_head) override {
        head_calls++;
        std::lock_guard<std::mutex> lock(mtx);

        core::Status injected;
        if (consumeFailure(injected)) return injected;

        auto it = objects.find(key);
        if (it == objects.end()) {
            return core::Status::NotFound("no such key " + key.toString());
        }

        out_head.metadata = it->second.metadata;
        out_head.content_length = it->second.content.size();
        out_head.content_type = it->second.content_type;
        return core::Status::OK();
    }

    core::Status getObject(const ObjectKey& key, ObjectHead& out_head, std::string& out_content) override {
        get_calls++;
        std::lock_guard<std::mutex> lock(mtx);

        core::Status injected;
        if (consumeFailure(injected)) return injected;

        auto it = objects.find(key);
        if (it == objects.end()) {
            return core::Status::NotFound("no such key " + key.toString());
        }

        out_head.metadata = it->second.metadata;
        out_head.content_length = it->second.content.size();
        out_head.content_type = it->second.content_type;
        out_content = it->second.content;
        return core::Status::OK();
    }

    core::Status putObject(const ObjectKey& key, const ObjectHead& head, const std::string& content) override {
        put_calls++;
        std::lock_guard<std::mutex> lock(mtx);

        core::Status injected;
        if (consumeFailure(injected)) return injected;

        if (head.content_length != content.size()) {
            return core::Status::TransportError("declared length " + std::to_string(head.content_length) +
                                                " does not match body of " + std::to_string(content.size()) + " bytes");
        }

        Object& obj = objects[key];
        obj.metadata = head.metadata;
        obj.content = content;
        obj.content_type = head.content_type;
        return core::Status::OK();
    }

    /**
     * @brief Store an object directly, bypassing every check.
     */
    void seed(const ObjectKey& key, const std::string& content, const Metadata& metadata) {
        std::lock_guard<std::mutex> lock(mtx);
        Object& obj = objects[key];
        obj.metadata = metadata;
        obj.content = content;
        obj.content_type = "text/plain";
    }

    /**
     * @brief Read an object directly. Returns false if absent.
     */
    bool peek(const ObjectKey& key, Object& out_object) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = objects.find(key);
        if (it == objects.end()) return false;
        out_object = it->second;
        return true;
    }

    /**
     * @brief Make the next `count` calls fail with a transport error.
     */
    void failNext(size_t count, const std::string& message = "injected failure") {
        std::lock_guard<std::mutex> lock(mtx);
        failures_pending = count;
        failure_message = message;
    }

    uint64_t headCalls() const { return head_calls.load(); }
    uint64_t getCalls() const { return get_calls.load(); }
    uint64_t putCalls() const { return put_calls.load(); }
};

} // namespace storage
} // namespace notesync
