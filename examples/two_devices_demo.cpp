#include <sys/stat.h>
#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <thread>
#include "notesync/notesync.hpp"

// A local walk-through of the sync protocol.
// One server (in-memory storage) and two "devices": a laptop and a phone,
// each with its own copy of notes.md. File times are set by hand so the
// versions are easy to follow.

using namespace notesync;

void writeNote(const std::string& path, const std::string& text, int64_t mtime) {
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << text;
    }
    struct timespec times[2] = {{0, UTIME_NOW}, {static_cast<time_t>(mtime), 0}};
    utimensat(AT_FDCWD, path.c_str(), times, 0);
}

std::string readNote(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void printResult(const std::string& who, const std::string& what, const core::Status& status) {
    std::cout << "[" << who << "] " << what << ": " << status.toString() << std::endl;
}

int main() {
    std::cout << "--- notesync Demo: Two Devices, One Document ---" << std::endl;

    char dir_template[] = "/tmp/notesync-demo-XXXXXX";
    if (mkdtemp(dir_template) == nullptr) {
        std::cout << "Unable to create a working directory" << std::endl;
        return 1;
    }
    std::string dir = dir_template;

    // 1. Server on a free local port
    auto logger = makeLogger("demo", "warn");
    auto backend = std::make_shared<storage::MemoryBackend>();
    auto store = std::make_shared<core::VersionedObjectStore>(backend, storage::ObjectKey{"demo", "notes.md"}, logger);

    network::EndpointOptions endpoint_options;
    endpoint_options.access_token = "demo-token";
    network::SyncEndpoint endpoint(store, endpoint_options, logger);

    network::ServerOptions server_options;
    server_options.address = "127.0.0.1";
    server_options.port = 0;
    server_options.threads = 2;
    network::HttpServer server(endpoint, server_options, logger);
    if (!server.bind()) return 1;
    std::thread server_thread([&server]() { server.run(); });

    network::ServerAddress address;
    address.host = "127.0.0.1";
    address.port = std::to_string(server.port());
    auto transport = std::make_shared<network::HttpTransport>(address, "demo-token");

    client::SyncClient laptop(transport, dir + "/laptop.md", logger);
    client::SyncClient phone(transport, dir + "/phone.md", logger);

    int64_t t0 = core::VersionToken::now().unixSeconds() - 3600;
    core::VersionToken stored;
    client::SyncAction action;

    // 2. The laptop writes the first version and pushes it
    std::cout << "\n[Step 1] Laptop creates the note" << std::endl;
    writeNote(laptop.path(), "# Shopping\n- milk\n", t0);
    printResult("Laptop", "push", laptop.push(false, stored));
    std::cout << "  Server version: " << stored.format() << std::endl;

    // 3. The phone has nothing yet, sync pulls
    std::cout << "\n[Step 2] Phone syncs" << std::endl;
    printResult("Phone", "sync", phone.sync(action));
    std::cout << "  Action: " << client::toString(action) << std::endl;

    // 4. The phone edits and pushes a newer version
    std::cout << "\n[Step 3] Phone adds a line" << std::endl;
    writeNote(phone.path(), "# Shopping\n- milk\n- bread\n", t0 + 60);
    printResult("Phone", "sync", phone.sync(action));
    std::cout << "  Action: " << client::toString(action) << std::endl;

    // 5. The laptop edited its stale copy in between. Its version is older
    //    than the server's, so the push is refused.
    std::cout << "\n[Step 4] CONFLICT! Laptop pushes an edit of the old copy" << std::endl;
    writeNote(laptop.path(), "# Shopping\n- milk\n- eggs\n", t0 + 30);
    printResult("Laptop", "push", laptop.push(false, stored));

    // 6. The laptop decides its copy wins
    std::cout << "\n[Step 5] Laptop forces its copy" << std::endl;
    printResult("Laptop", "push --force", laptop.push(true, stored));
    std::cout << "  Server version: " << stored.format() << std::endl;

    // 7. The phone catches up
    std::cout << "\n[Step 6] Phone syncs again" << std::endl;
    printResult("Phone", "sync", phone.sync(action));
    std::cout << "  Action: " << client::toString(action) << std::endl;

    // 8. Final Result
    std::cout << "\n[Final Consistency Check]" << std::endl;
    std::string on_laptop = readNote(laptop.path());
    std::string on_phone = readNote(phone.path());
    std::cout << "[Laptop View]:\n" << on_laptop;
    std::cout << "[Phone View]:\n" << on_phone;

    server.stop();
    server_thread.join();

    unlink(laptop.path().c_str());
    unlink(phone.path().c_str());
    rmdir(dir.c_str());

    if (on_laptop == on_phone) {
        std::cout << "\nSUCCESS: Both devices hold the same document." << std::endl;
        return 0;
    }
    std::cout << "\nFAILURE: Desync detected!" << std::endl;
    return 1;
}
