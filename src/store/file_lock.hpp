#pragma once

#include <cstdint>
#include <filesystem>
#include <utility>
#include "core/errors/link_errors.hpp"

namespace agentlink::store {

// Exclusive flock(2) on a zero-length lock file. Released when the object dies,
// and by the kernel when the owning process exits.
class FileLock {
public:
    // timeout_ms == 0 blocks until the lock is granted.
    static core::errors::Result<FileLock> acquire(const std::filesystem::path& lock_path,
                                                  std::uint32_t timeout_ms = 0);

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    ~FileLock();

private:
    explicit FileLock(int fd);
    void release();

    int fd_ = -1;
};

// Runs body() while holding the lock at lock_path. body returns Result<T>.
template <typename T, typename Body>
core::errors::Result<T> with_lock(const std::filesystem::path& lock_path,
                                  const std::uint32_t timeout_ms, Body&& body) {
    auto acquired = FileLock::acquire(lock_path, timeout_ms);
    if (core::errors::is_error(acquired)) {
        return core::errors::get_error(acquired);
    }
    const FileLock lock = core::errors::take_value(std::move(acquired));
    return std::forward<Body>(body)();
}

}  // namespace agentlink::store
