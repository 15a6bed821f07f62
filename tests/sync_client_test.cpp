#include <sys/stat.h>
#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

#include <iostream>
#include <cassert>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include "notesync/client/sync_client.hpp"
#include "notesync/network/sync_endpoint.hpp"
#include "notesync/storage/memory_backend.hpp"
#include "notesync/logging.hpp"

using namespace notesync;
using namespace notesync::network;
using notesync::client::SyncAction;
using notesync::client::SyncClient;
using notesync::core::Status;
using notesync::core::StatusCode;
using notesync::core::VersionToken;
using notesync::storage::MemoryBackend;
using notesync::storage::ObjectKey;

static const ObjectKey kKey{"bucket", "notes.md"};
static const std::string kToken = "s3cret";
static const VersionToken kT = VersionToken::fromUnixSeconds(784111777);
static const VersionToken kNow = VersionToken::fromUnixSeconds(1700000000);

/**
 * Hands requests straight to a SyncEndpoint, no sockets involved.
 */
class EndpointTransport : public Transport {
private:
    SyncEndpoint& endpoint;

public:
    bool offline = false;
    int requests = 0;

    explicit EndpointTransport(SyncEndpoint& endpoint_) : endpoint(endpoint_) {}

    Status roundTrip(Request req, Response& out_response) override {
        if (offline) return Status::TransportError("connection refused");
        requests++;
        req.set(SyncEndpoint::kAuthHeader, kToken);
        req.prepare_payload();
        out_response = endpoint.handle(req);
        return Status::OK();
    }
};

struct Fixture {
    std::string dir;
    std::shared_ptr<MemoryBackend> backend = std::make_shared<MemoryBackend>();
    std::shared_ptr<core::VersionedObjectStore> store;
    std::unique_ptr<SyncEndpoint> endpoint;
    std::shared_ptr<EndpointTransport> transport;

    Fixture() {
        char dir_template[] = "/tmp/notesync-client-test-XXXXXX";
        char* created = mkdtemp(dir_template);
        assert(created != nullptr);
        (void)created;
        dir = dir_template;

        store = std::make_shared<core::VersionedObjectStore>(backend, kKey, makeNullLogger(),
                                                             []() { return kNow; });
        EndpointOptions options;
        options.access_token = kToken;
        endpoint = std::make_unique<SyncEndpoint>(store, options, makeNullLogger());
        transport = std::make_shared<EndpointTransport>(*endpoint);
    }

    ~Fixture() {
        unlink(path("notes.md").c_str());
        unlink(path("notes.md.tmp").c_str());
        rmdir(dir.c_str());
    }

    std::string path(const std::string& name) const {
        return dir + "/" + name;
    }

    SyncClient client() {
        return SyncClient(transport, path("notes.md"), makeNullLogger());
    }

    void seedRemote(const VersionToken& version, const std::string& content) {
        backend->seed(kKey, content, {{"version", version.format()}});
    }

    std::string remoteContent() const {
        MemoryBackend::Object obj;
        if (!backend->peek(kKey, obj)) return "";
        return obj.content;
    }
};

void writeFile(const std::string& path, const std::string& content, const VersionToken& mtime) {
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }
    struct timespec times[2] = {{0, UTIME_NOW}, {static_cast<time_t>(mtime.unixSeconds()), 0}};
    int rc = utimensat(AT_FDCWD, path.c_str(), times, 0);
    assert(rc == 0);
    (void)rc;
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * Test 1: Local and remote versions
 */
void test_versions() {
    std::cout << "Test 1: Local and remote versions..." << std::endl;
    Fixture f;
    SyncClient c = f.client();

    VersionToken v;
    assert(c.localVersion(v) == StatusCode::NotFound);

    // A missing remote document is version zero
    assert(c.remoteVersion(v).ok());
    assert(v.isZero());

    writeFile(c.path(), "local", kT);
    assert(c.localVersion(v).ok());
    assert(v == kT);

    f.seedRemote(kT.addSeconds(5), "remote");
    assert(c.remoteVersion(v).ok());
    assert(v == kT.addSeconds(5));

    // Broken metadata on the server is an error, not zero
    f.backend->seed(kKey, "remote", {});
    assert(!c.remoteVersion(v).ok());

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 2: Pull downloads newer content and copies the version
 */
void test_pull() {
    std::cout << "Test 2: Pull..." << std::endl;
    Fixture f;
    SyncClient c = f.client();
    f.seedRemote(kT, "# from server\n");

    bool updated = false;
    assert(c.pull(updated).ok());
    assert(updated);
    assert(readFile(c.path()) == "# from server\n");

    VersionToken v;
    assert(c.localVersion(v).ok());
    assert(v == kT);

    // Second pull: nothing to do
    assert(c.pull(updated).ok());
    assert(!updated);

    // Remote moves on
    f.seedRemote(kT.addSeconds(60), "# newer\n");
    assert(c.pull(updated).ok());
    assert(updated);
    assert(readFile(c.path()) == "# newer\n");

    // Nothing on the server
    Fixture empty;
    SyncClient e = empty.client();
    assert(e.pull(updated) == StatusCode::NotFound);
    assert(!updated);

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 3: Push, stale push, forced push
 */
void test_push() {
    std::cout << "Test 3: Push..." << std::endl;
    Fixture f;
    SyncClient c = f.client();

    VersionToken stored;
    assert(c.push(false, stored) == StatusCode::NotFound);

    writeFile(c.path(), "v1", kT);
    assert(c.push(false, stored).ok());
    assert(stored == kT);
    assert(f.remoteContent() == "v1");

    // Same version again is refused
    assert(c.push(false, stored) == StatusCode::VersionConflict);

    // Someone else pushed something newer
    f.seedRemote(kT.addSeconds(100), "theirs");
    writeFile(c.path(), "mine", kT.addSeconds(50));
    assert(c.push(false, stored) == StatusCode::VersionConflict);
    assert(f.remoteContent() == "theirs");

    // Force: the server stamps the write, the file follows
    assert(c.push(true, stored).ok());
    assert(stored == kNow);
    assert(f.remoteContent() == "mine");

    VersionToken local;
    assert(c.localVersion(local).ok());
    assert(local == kNow);

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 4: Sync picks the newer side
 */
void test_sync() {
    std::cout << "Test 4: Sync..." << std::endl;
    Fixture f;
    SyncClient c = f.client();
    SyncAction action;

    assert(c.sync(action) == StatusCode::NotFound);
    assert(action == SyncAction::None);

    // Only local: push
    writeFile(c.path(), "local", kT);
    assert(c.sync(action).ok());
    assert(action == SyncAction::Pushed);
    assert(f.remoteContent() == "local");

    // Equal: nothing
    int before = f.transport->requests;
    assert(c.sync(action).ok());
    assert(action == SyncAction::None);
    assert(f.transport->requests == before + 1);

    // Remote newer: pull
    f.seedRemote(kT.addSeconds(10), "remote");
    assert(c.sync(action).ok());
    assert(action == SyncAction::Pulled);
    assert(readFile(c.path()) == "remote");

    // Local newer: push
    writeFile(c.path(), "edited", kT.addSeconds(20));
    assert(c.sync(action).ok());
    assert(action == SyncAction::Pushed);
    assert(f.remoteContent() == "edited");

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 5: Edit runs the editor and pushes what was saved
 */
void test_edit() {
    std::cout << "Test 5: Edit..." << std::endl;
    Fixture f;
    SyncClient c = f.client();
    f.seedRemote(kT, "line 1\n");

    assert(c.edit("printf 'line 2\\n' >>").ok());
    assert(readFile(c.path()) == "line 1\nline 2\n");
    assert(f.remoteContent() == "line 1\nline 2\n");

    // Editor closed without saving
    uint64_t puts = f.backend->putCalls();
    assert(c.edit("true").ok());
    assert(f.backend->putCalls() == puts);

    // Editor failure
    assert(c.edit("false") == StatusCode::TransportError);

    // Brand new document
    Fixture fresh;
    SyncClient n = fresh.client();
    assert(n.edit("printf 'hello\\n' >").ok());
    assert(fresh.remoteContent() == "hello\n");

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 6: Transport failures reach the caller
 */
void test_offline() {
    std::cout << "Test 6: Offline..." << std::endl;
    Fixture f;
    SyncClient c = f.client();
    writeFile(c.path(), "local", kT);
    f.transport->offline = true;

    VersionToken v;
    SyncAction action;
    bool updated;
    assert(c.remoteVersion(v) == StatusCode::TransportError);
    assert(c.pull(updated) == StatusCode::TransportError);
    assert(c.push(false, v) == StatusCode::TransportError);
    assert(c.sync(action) == StatusCode::TransportError);

    // The local file is left alone
    assert(readFile(c.path()) == "local");

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== notesync SyncClient Tests ===" << std::endl << std::endl;

    test_versions();
    test_pull();
    test_push();
    test_sync();
    test_edit();
    test_offline();

    std::cout << std::endl << "=== ALL TESTS PASSED ===" << std::endl;
    return 0;
}
