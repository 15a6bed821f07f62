#include <iostream>
#include <cassert>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include "notesync/core/versioned_object_store.hpp"
#include "notesync/storage/memory_backend.hpp"
#include "notesync/logging.hpp"

using namespace notesync;
using namespace notesync::core;
using notesync::storage::MemoryBackend;
using notesync::storage::ObjectKey;

static const ObjectKey kKey{"bucket", "notes.md"};
static const int64_t kDay = 24 * 3600;
static const int64_t kYear = 365 * kDay;

// Sun, 06 Nov 1994 08:49:37 GMT
static const VersionToken kT = VersionToken::fromUnixSeconds(784111777);

struct Fixture {
    std::shared_ptr<MemoryBackend> backend = std::make_shared<MemoryBackend>();
    VersionedObjectStore store{backend, kKey, makeNullLogger()};

    void seed(const VersionToken& version, const std::string& content) {
        backend->seed(kKey, content, {{"version", version.format()}});
    }
};

/**
 * Test 1: Absent object, first write, version visible afterwards
 */
void test_first_write() {
    std::cout << "Test 1: First write on an absent object..." << std::endl;
    Fixture f;

    VersionToken v;
    assert(f.store.getCurrentVersion(v) == StatusCode::NotFound);

    VersionToken now = VersionToken::now();
    Status status = f.store.safePut(now, "x");
    assert(status.ok());

    assert(f.store.getCurrentVersion(v).ok());
    assert(v == now);

    MemoryBackend::Object obj;
    assert(f.backend->peek(kKey, obj));
    assert(obj.content == "x");
    assert(obj.content_type == "text/plain");
    assert(obj.metadata["version"] == now.format());

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 2: Get with the stored version transfers nothing
 */
void test_get_not_modified() {
    std::cout << "Test 2: Get at the stored version..." << std::endl;
    Fixture f;
    f.seed(kT, "content");

    std::ostringstream out;
    VersionToken v = VersionToken::fromUnixSeconds(1);
    Status status = f.store.get(kT, out, v);
    assert(status == StatusCode::NotModified);
    assert(out.str().empty());
    assert(v.unixSeconds() == 1);

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 3: Get with a version from the future is a conflict
 */
void test_get_future_version() {
    std::cout << "Test 3: Get ahead of the stored version..." << std::endl;
    Fixture f;
    f.seed(kT, "content");

    std::ostringstream out;
    VersionToken v;
    assert(f.store.get(kT.addSeconds(kYear), out, v) == StatusCode::VersionConflict);
    assert(out.str().empty());

    assert(f.store.get(kT.addSeconds(1), out, v) == StatusCode::VersionConflict);
    assert(out.str().empty());

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 4: Missing or broken version metadata is never NotFound
 */
void test_invalid_metadata() {
    std::cout << "Test 4: Invalid version metadata..." << std::endl;

    const storage::Metadata broken[] = {
        {},
        {{"owner", "someone"}},
        {{"version", ""}},
        {{"version", "not a date"}},
        {{"version", "1994-11-06T08:49:37Z"}},
        {{"version", "Sun, 06 Nov 94 08:49:37 GMT"}},
        {{"version", "Mon, 31 Feb 2020 10:00:00 GMT"}},
    };

    for (const auto& metadata : broken) {
        Fixture f;
        f.backend->seed(kKey, "content without a version", metadata);

        VersionToken v;
        Status status = f.store.getCurrentVersion(v);
        assert(status == StatusCode::InvalidVersion);

        std::ostringstream out;
        status = f.store.get(VersionToken(), out, v);
        assert(status == StatusCode::InvalidVersion);
        assert(out.str().empty());

        // A write cannot decide against an unknown version either
        status = f.store.safePut(VersionToken::now(), "new");
        assert(status == StatusCode::InvalidVersion);
        MemoryBackend::Object obj;
        assert(f.backend->peek(kKey, obj));
        assert(obj.content == "content without a version");
    }

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 5: An older write is refused and changes nothing
 */
void test_stale_write() {
    std::cout << "Test 5: Stale write..." << std::endl;
    Fixture f;
    f.seed(kT, "stored");
    uint64_t puts_before = f.backend->putCalls();

    Status status = f.store.safePut(kT.addSeconds(-kDay), "y");
    assert(status == StatusCode::VersionConflict);
    assert(f.backend->putCalls() == puts_before);

    VersionToken v;
    assert(f.store.getCurrentVersion(v).ok());
    assert(v == kT);

    std::ostringstream out;
    assert(f.store.get(VersionToken(), out, v).ok());
    assert(out.str() == "stored");

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 6: Writing the stored version again is a conflict too
 */
void test_equal_write() {
    std::cout << "Test 6: Write at the stored version..." << std::endl;
    Fixture f;
    f.seed(kT, "stored");

    assert(f.store.safePut(kT, "same second") == StatusCode::VersionConflict);
    assert(f.store.safePut(kT.addSeconds(1), "next second").ok());

    VersionToken v;
    assert(f.store.getCurrentVersion(v).ok());
    assert(v == kT.addSeconds(1));

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 7: The read policy over a grid of stored/client pairs
 */
void test_read_policy() {
    std::cout << "Test 7: Read policy..." << std::endl;

    const int64_t offsets[] = {-kYear, -kDay, -1, 0, 1, kDay, kYear};
    int checked = 0;

    for (int64_t offset : offsets) {
        Fixture f;
        f.seed(kT, "doc");
        VersionToken client = kT.addSeconds(offset);

        std::ostringstream out;
        VersionToken v;
        Status status = f.store.get(client, out, v);

        if (kT > client) {
            assert(status.ok());
            assert(out.str() == "doc");
            assert(v == kT);
        } else if (kT == client) {
            assert(status == StatusCode::NotModified);
            assert(out.str().empty());
        } else {
            assert(status == StatusCode::VersionConflict);
            assert(out.str().empty());
        }
        checked++;
    }

    // A client without a copy always gets the content
    Fixture f;
    f.seed(kT, "doc");
    std::ostringstream out;
    VersionToken v;
    assert(f.store.get(VersionToken(), out, v).ok());
    assert(out.str() == "doc");
    checked++;

    std::cout << "  Checked " << checked << " pairs" << std::endl;
    std::cout << "  PASS" << std::endl;
}

/**
 * Test 8: Get on an absent object
 */
void test_get_absent() {
    std::cout << "Test 8: Get on an absent object..." << std::endl;
    Fixture f;

    std::ostringstream out;
    VersionToken v;
    assert(f.store.get(VersionToken(), out, v) == StatusCode::NotFound);
    assert(out.str().empty());

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 9: Overwrite ignores the stored version and stamps the clock
 */
void test_overwrite() {
    std::cout << "Test 9: Overwrite..." << std::endl;
    auto backend = std::make_shared<MemoryBackend>();
    VersionToken fixed = VersionToken::fromUnixSeconds(1000000000);
    VersionedObjectStore store(backend, kKey, makeNullLogger(), [fixed]() { return fixed; });

    // Stored version far in the future
    backend->seed(kKey, "future", {{"version", fixed.addSeconds(kYear).format()}});

    VersionToken stored;
    assert(store.overwrite("forced", stored).ok());
    assert(stored == fixed);

    VersionToken v;
    assert(store.getCurrentVersion(v).ok());
    assert(v == fixed);

    // Also over broken metadata
    backend->seed(kKey, "broken", {});
    assert(store.overwrite("forced again", stored).ok());
    assert(store.getCurrentVersion(v).ok());

    // And with the real clock, never before the call
    Fixture f;
    VersionToken before = VersionToken::now();
    assert(f.store.overwrite("now", stored).ok());
    assert(stored >= before);

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 10: Repeated reads agree, content comes back byte-identical
 */
void test_idempotent_reads() {
    std::cout << "Test 10: Idempotent reads..." << std::endl;
    Fixture f;

    std::string content = "line 1\r\nline 2\n";
    content.push_back('\0');
    content += "\xC3\xA9\xFF";
    assert(f.store.safePut(kT, content).ok());

    VersionToken v1, v2;
    assert(f.store.getCurrentVersion(v1).ok());
    assert(f.store.getCurrentVersion(v2).ok());
    assert(v1 == v2);

    std::ostringstream out;
    VersionToken v;
    assert(f.store.get(kT.addSeconds(-1), out, v).ok());
    assert(out.str() == content);
    assert(v == kT);

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 11: Backend failures come through as TransportError
 */
void test_transport_errors() {
    std::cout << "Test 11: Transport errors..." << std::endl;
    Fixture f;
    f.seed(kT, "doc");

    VersionToken v;
    f.backend->failNext(1, "connection reset");
    Status status = f.store.getCurrentVersion(v);
    assert(status == StatusCode::TransportError);
    assert(status.message() == "connection reset");

    std::ostringstream out;
    f.backend->failNext(1);
    assert(f.store.get(VersionToken(), out, v) == StatusCode::TransportError);

    // Failure on the check: nothing is written
    uint64_t puts = f.backend->putCalls();
    f.backend->failNext(1);
    assert(f.store.safePut(kT.addSeconds(10), "new") == StatusCode::TransportError);
    assert(f.backend->putCalls() == puts);

    // Failure on the write itself
    VersionToken stored;
    f.backend->failNext(1);
    assert(f.store.overwrite("new", stored) == StatusCode::TransportError);

    assert(f.store.getCurrentVersion(v).ok());
    assert(v == kT);

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 12: Concurrent writers with distinct versions, the newest one stays
 */
void test_concurrent_writers() {
    std::cout << "Test 12: Concurrent writers..." << std::endl;
    Fixture f;
    f.seed(kT, "v0");

    std::vector<std::thread> writers;
    for (int i = 1; i <= 8; i++) {
        writers.emplace_back([&f, i]() {
            Status status = f.store.safePut(kT.addSeconds(i), "v" + std::to_string(i));
            assert(status.ok() || status == StatusCode::VersionConflict);
        });
    }
    for (auto& t : writers) {
        t.join();
    }

    // Whatever interleaving happened, a later call sees one consistent object
    VersionToken v;
    assert(f.store.getCurrentVersion(v).ok());
    assert(v > kT);

    std::ostringstream out;
    VersionToken read;
    assert(f.store.get(kT, out, read).ok());
    assert(read == v);
    assert(out.str() == "v" + std::to_string(v.unixSeconds() - kT.unixSeconds()));

    // The newest version can still be written on top
    assert(f.store.safePut(kT.addSeconds(100), "final").ok());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== notesync VersionedObjectStore Tests ===" << std::endl << std::endl;

    test_first_write();
    test_get_not_modified();
    test_get_future_version();
    test_invalid_metadata();
    test_stale_write();
    test_equal_write();
    test_read_policy();
    test_get_absent();
    test_overwrite();
    test_idempotent_reads();
    test_transport_errors();
    test_concurrent_writers();

    std::cout << std::endl << "=== ALL TESTS PASSED ===" << std::endl;
    return 0;
}
