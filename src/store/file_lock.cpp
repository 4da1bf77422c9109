#include "store/file_lock.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/file.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace agentlink::store {

using core::errors::ErrorCategory;
using core::errors::LinkError;

namespace {

constexpr auto kBusyPollInterval = std::chrono::milliseconds(10);

LinkError lock_error(const std::filesystem::path& path, const std::string& what,
                     const int err) {
    return LinkError{ErrorCategory::Storage,
                     what + ": " + path.string() + " (" + std::strerror(err) + ")",
                     "lock_failed"};
}

}  // namespace

FileLock::FileLock(const int fd) : fd_(fd) {}

FileLock::FileLock(FileLock&& other) noexcept
    : fd_(other.fd_) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

FileLock::~FileLock() { release(); }

void FileLock::release() {
    if (fd_ < 0) {
        return;
    }
    static_cast<void>(flock(fd_, LOCK_UN));
    static_cast<void>(close(fd_));
    fd_ = -1;
}

core::errors::Result<FileLock> FileLock::acquire(const std::filesystem::path& lock_path,
                                                 const std::uint32_t timeout_ms) {
    std::error_code ec;
    std::filesystem::create_directories(lock_path.parent_path(), ec);
    if (ec) {
        return LinkError{ErrorCategory::Storage,
                         "Unable to create lock directory: " +
                             lock_path.parent_path().string(),
                         "lock_dir_create_failed"};
    }

    const int fd = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return lock_error(lock_path, "Unable to open lock file", errno);
    }

    if (timeout_ms == 0) {
        while (flock(fd, LOCK_EX) != 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            static_cast<void>(close(fd));
            return lock_error(lock_path, "Unable to lock", err);
        }
        return FileLock(fd);
    }

    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        if (err != EWOULDBLOCK && err != EINTR) {
            static_cast<void>(close(fd));
            return lock_error(lock_path, "Unable to lock", err);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            static_cast<void>(close(fd));
            LOG_WARN("Lock busy after " + std::to_string(timeout_ms) +
                     "ms: " + lock_path.string());
            return LinkError{ErrorCategory::Storage,
                             "Lock busy: " + lock_path.string(), "lock_busy",
                             "Another process holds this lock; retry later."};
        }
        std::this_thread::sleep_for(kBusyPollInterval);
    }
    return FileLock(fd);
}

}  // namespace agentlink::store
