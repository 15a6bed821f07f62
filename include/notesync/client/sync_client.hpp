#pragma once

#include <sys/stat.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>
#include "../core/status.hpp"
#include "../core/version_token.hpp"
#include "../network/http_transport.hpp"

namespace notesync {
namespace client {

enum class SyncAction {
    None,   // Both sides already had the same version
    Pulled, // The server copy replaced the local file
    Pushed  // The local file replaced the server copy
};

inline const char* toString(SyncAction action) {
    switch (action) {
        case SyncAction::None:   return "up to date";
        case SyncAction::Pulled: return "pulled";
        case SyncAction::Pushed: return "pushed";
    }
    return "unknown";
}

/**
 * @brief Keeps one local file in step with the server's document.
 *
 * The local version of the file is its modification time, truncated to the
 * second. After every pull or push the mtime is set to the version the
 * server holds, so an unchanged file compares equal to the server copy and
 * any edit makes it newer.
 */
class SyncClient {
private:
    std::shared_ptr<network::Transport> transport;
    std::string file_path;
    std::shared_ptr<spdlog::logger> logger;

public:
    SyncClient(std::shared_ptr<network::Transport> transport_, std::string file_path_,
               std::shared_ptr<spdlog::logger> logger_ = spdlog::default_logger())
        : transport(std::move(transport_)), file_path(std::move(file_path_)), logger(std::move(logger_)) {}

    const std::string& path() const {
        return file_path;
    }

    /**
     * @brief The local file's version (its mtime). NotFound if it does not exist.
     */
    core::Status localVersion(core::VersionToken& out_version) const {
        struct stat st;
        if (::stat(file_path.c_str(), &st) != 0) {
            if (errno == ENOENT) return core::Status::NotFound("no local file " + file_path);
            return core::Status::TransportError("stat " + file_path + ": " + std::strerror(errno));
        }
        out_version = core::VersionToken::fromUnixSeconds(static_cast<int64_t>(st.st_mtime));
        return core::Status::OK();
    }

    /**
     * @brief The server's version. A missing document is the zero version.
     */
    core::Status remoteVersion(core::VersionToken& out_version) {
        network::Response res;
        core::Status status = transport->roundTrip(network::Request{network::http::verb::head, "/", 11}, res);
        if (!status.ok()) return status;

        if (res.result() == network::http::status::not_found) {
            out_version = core::VersionToken();
            return core::Status::OK();
        }
        if (res.result() != network::http::status::ok) {
            return statusFor(res, "HEAD");
        }

        return lastModified(res, out_version);
    }

    /**
     * @brief Download the server copy if it is newer than the local file.
     * @param out_updated true if the local file was replaced.
     */
    core::Status pull(bool& out_updated) {
        out_updated = false;

        core::VersionToken local;
        core::Status status = localVersion(local);
        if (!status.ok() && status.code() != core::StatusCode::NotFound) return status;

        network::Request req{network::http::verb::get, "/", 11};
        if (!local.isZero()) {
            req.set(network::http::field::if_modified_since, local.format());
        }

        network::Response res;
        status = transport->roundTrip(std::move(req), res);
        if (!status.ok()) return status;

        if (res.result() == network::http::status::not_modified) {
            logger->info("Local file is up to date");
            return core::Status::OK();
        }
        if (res.result() != network::http::status::ok) {
            return statusFor(res, "GET");
        }

        core::VersionToken remote;
        status = lastModified(res, remote);
        if (!status.ok()) return status;

        status = replaceFile(res.body(), remote);
        if (!status.ok()) return status;

        logger->info("Downloaded {} bytes, version {}", res.body().size(), remote.format());
        out_updated = true;
        return core::Status::OK();
    }

    /**
     * @brief Upload the local file with its mtime as version.
     * @param force Overwrite the server copy whatever its version.
     * @param out_version The version the server stored.
     */
    core::Status push(bool force, core::VersionToken& out_version) {
        core::VersionToken local;
        core::Status status = localVersion(local);
        if (!status.ok()) return status;

        std::string content;
        status = readFile(content);
        if (!status.ok()) return status;

        network::Request req{network::http::verb::put, "/", 11};
        req.set(network::http::field::last_modified, local.format());
        req.set(network::http::field::content_type, "text/plain");
        if (force) req.set(network::SyncEndpoint::kForceHeader, "true");
        req.body() = content;

        network::Response res;
        status = transport->roundTrip(std::move(req), res);
        if (!status.ok()) return status;

        if (res.result() != network::http::status::ok) {
            return statusFor(res, "PUT");
        }

        core::VersionToken stored;
        status = lastModified(res, stored);
        if (!status.ok()) return status;

        // A forced write is stamped by the server
        if (stored != local) {
            status = setModificationTime(stored);
            if (!status.ok()) return status;
        }

        logger->info("Uploaded {} bytes, version {}", content.size(), stored.format());
        out_version = stored;
        return core::Status::OK();
    }

    /**
     * @brief Bring both sides to the newer copy.
     */
    core::Status sync(SyncAction& out_action) {
        out_action = SyncAction::None;

        core::VersionToken local;
        core::Status status = localVersion(local);
        bool have_local = status.ok();
        if (!have_local && status.code() != core::StatusCode::NotFound) return status;

        core::VersionToken remote;
        status = remoteVersion(remote);
        if (!status.ok()) return status;

        logger->debug("Local version {}, remote version {}",
                      have_local ? local.format() : "<none>",
                      remote.isZero() ? "<none>" : remote.format());

        if (!have_local && remote.isZero()) {
            return core::Status::NotFound("neither a local file nor a remote document");
        }

        if (remote > local) {
            bool updated = false;
            status = pull(updated);
            if (status.ok() && updated) out_action = SyncAction::Pulled;
            return status;
        }

        if (local > remote) {
            core::VersionToken stored;
            status = push(false, stored);
            if (status.ok()) out_action = SyncAction::Pushed;
            return status;
        }

        return core::Status::OK();
    }

    /**
     * @brief sync, open the file in the editor, push it if it was saved.
     */
    core::Status edit(const std::string& editor) {
        SyncAction action;
        core::Status status = sync(action);
        if (!status.ok() && status.code() != core::StatusCode::NotFound) return status;

        core::VersionToken before;
        bool existed = localVersion(before).ok();

        status = runEditor(editor);
        if (!status.ok()) return status;

        core::VersionToken after;
        status = localVersion(after);
        if (status.code() == core::StatusCode::NotFound) {
            logger->info("No file saved, nothing to upload");
            return core::Status::OK();
        }
        if (!status.ok()) return status;

        if (existed && after == before) {
            logger->info("File not modified, nothing to upload");
            return core::Status::OK();
        }

        core::VersionToken stored;
        return push(false, stored);
    }

private:
    static core::Status statusFor(const network::Response& res, const char* op) {
        std::string what = std::string(op) + " answered " + std::to_string(res.result_int());
        switch (res.result()) {
            case network::http::status::not_modified:
                return core::Status::NotModified(what);
            case network::http::status::conflict:
                return core::Status::VersionConflict(what);
            case network::http::status::not_found:
                return core::Status::NotFound(what);
            default:
                return core::Status::TransportError(what);
        }
    }

    static core::Status lastModified(const network::Response& res, core::VersionToken& out_version) {
        auto it = res.find(network::http::field::last_modified);
        if (it == res.end()) {
            return core::Status::InvalidVersion("response without Last-Modified");
        }

        std::string value(it->value().data(), it->value().size());
        if (!core::VersionToken::parse(value, out_version)) {
            return core::Status::InvalidVersion("unparsable Last-Modified '" + value + "'");
        }
        return core::Status::OK();
    }

    core::Status readFile(std::string& out_content) const {
        std::ifstream in(file_path, std::ios::binary);
        if (!in) {
            return core::Status::TransportError("unable to open " + file_path);
        }
        out_content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad()) {
            return core::Status::TransportError("error reading " + file_path);
        }
        return core::Status::OK();
    }

    // Write to a temporary file next to the target, then rename over it
    core::Status replaceFile(const std::string& content, const core::VersionToken& version) {
        std::string tmp_path = file_path + ".tmp";
        {
            std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
            if (!out) {
                return core::Status::TransportError("unable to create " + tmp_path);
            }
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            out.close();
            if (!out) {
                std::remove(tmp_path.c_str());
                return core::Status::TransportError("error writing " + tmp_path);
            }
        }

        if (std::rename(tmp_path.c_str(), file_path.c_str()) != 0) {
            std::string error = std::strerror(errno);
            std::remove(tmp_path.c_str());
            return core::Status::TransportError("rename " + tmp_path + ": " + error);
        }

        return setModificationTime(version);
    }

    core::Status setModificationTime(const core::VersionToken& version) {
        struct timespec times[2];
        times[0].tv_sec = 0;
        times[0].tv_nsec = UTIME_NOW;
        times[1].tv_sec = static_cast<time_t>(version.unixSeconds());
        times[1].tv_nsec = 0;

        if (::utimensat(AT_FDCWD, file_path.c_str(), times, 0) != 0) {
            return core::Status::TransportError("utimensat " + file_path + ": " + std::strerror(errno));
        }
        return core::Status::OK();
    }

    // The editor string goes through the shell (it may carry flags); the
    // file name is passed as a separate argument.
    core::Status runEditor(const std::string& editor) {
        std::string command = editor + " \"$1\"";

        pid_t pid = ::fork();
        if (pid < 0) {
            return core::Status::TransportError(std::string("fork: ") + std::strerror(errno));
        }
        if (pid == 0) {
            ::execl("/bin/sh", "sh", "-c", command.c_str(), "sh", file_path.c_str(), static_cast<char*>(nullptr));
            ::_exit(127);
        }

        int wstatus = 0;
        while (::waitpid(pid, &wstatus, 0) < 0) {
            if (errno != EINTR) {
                return core::Status::TransportError(std::string("waitpid: ") + std::strerror(errno));
            }
        }

        if (!WIFEXITED(wstatus) || WEXITSTATUS(wstatus) != 0) {
            return core::Status::TransportError("unable to run editor '" + editor + "'");
        }
        return core::Status::OK();
    }
};

} // namespace client
} // namespace notesync
