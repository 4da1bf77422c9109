#include "store/json_store.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace agentlink::store {

using core::errors::ErrorCategory;
using core::errors::LinkError;
using core::errors::Ok;
using nlohmann::json;

namespace {

enum class ReadOutcome { Missing, Corrupt, Parsed };

ReadOutcome try_read(const std::filesystem::path& path, json& out) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return ReadOutcome::Missing;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    out = json::parse(buffer.str(), nullptr, false);
    if (out.is_discarded()) {
        return ReadOutcome::Corrupt;
    }
    return ReadOutcome::Parsed;
}

LinkError io_error(const std::string& what, const std::filesystem::path& path,
                   const int err, const std::string& code) {
    return LinkError{ErrorCategory::Storage,
                     what + ": " + path.string() + " (" + std::strerror(err) + ")",
                     code};
}

bool write_all(const int fd, const std::string& data) {
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

void sync_directory(const std::filesystem::path& dir) {
    const int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return;
    }
    static_cast<void>(fsync(fd));
    static_cast<void>(close(fd));
}

core::errors::Result<Ok> ensure_parent(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return LinkError{ErrorCategory::Storage,
                         "Unable to create directory: " + path.parent_path().string(),
                         "store_dir_create_failed"};
    }
    return Ok{};
}

}  // namespace

std::string dump_compact(const json& document) {
    return document.dump(-1, ' ', false, json::error_handler_t::replace);
}

json read_json(const std::filesystem::path& path, const json& fallback) {
    json parsed;
    const auto outcome = try_read(path, parsed);
    if (outcome == ReadOutcome::Corrupt) {
        LOG_WARN("Ignoring corrupt document: " + path.string());
    }
    if (outcome != ReadOutcome::Parsed) {
        return fallback;
    }
    return parsed;
}

core::errors::Result<json> read_json_for_merge(const std::filesystem::path& path,
                                               const json& fallback) {
    json parsed;
    const auto outcome = try_read(path, parsed);
    if (outcome == ReadOutcome::Missing) {
        return fallback;
    }
    if (outcome == ReadOutcome::Corrupt) {
        std::filesystem::path backup = path;
        backup += ".bak";
        std::error_code ec;
        std::filesystem::rename(path, backup, ec);
        if (ec) {
            LOG_WARN("Unable to back up corrupt document " + path.string() + ": " +
                     ec.message());
        } else {
            LOG_WARN("Backed up corrupt document to " + backup.string());
        }
        return fallback;
    }
    if (!parsed.is_object()) {
        return fallback;
    }
    return parsed;
}

core::errors::Result<Ok> write_json(const std::filesystem::path& path,
                                    const json& document) {
    auto parent = ensure_parent(path);
    if (core::errors::is_error(parent)) {
        return core::errors::get_error(parent);
    }

    std::filesystem::path tmp = path;
    tmp += ".tmp." + std::to_string(getpid());

    const int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return io_error("Unable to open temp file", tmp, errno, "store_write_failed");
    }

    const std::string payload =
        document.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
    if (!write_all(fd, payload) || fsync(fd) != 0) {
        const int err = errno;
        static_cast<void>(close(fd));
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        return io_error("Unable to write temp file", tmp, err, "store_write_failed");
    }
    static_cast<void>(close(fd));

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return LinkError{ErrorCategory::Storage,
                         "Unable to replace document: " + path.string(),
                         "store_write_failed"};
    }
    sync_directory(path.parent_path());
    return Ok{};
}

core::errors::Result<Ok> append_line(const std::filesystem::path& path,
                                     const std::string& line) {
    auto parent = ensure_parent(path);
    if (core::errors::is_error(parent)) {
        return core::errors::get_error(parent);
    }

    const int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        return io_error("Unable to open log", path, errno, "store_append_failed");
    }
    if (!write_all(fd, line + "\n") || fsync(fd) != 0) {
        const int err = errno;
        static_cast<void>(close(fd));
        return io_error("Unable to append to log", path, err, "store_append_failed");
    }
    static_cast<void>(close(fd));
    return Ok{};
}

}  // namespace agentlink::store
