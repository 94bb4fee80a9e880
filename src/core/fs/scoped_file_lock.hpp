#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include "core/errors/knife_errors.hpp"

namespace knife::core::fs {

// Exclusive lock held as an `O_CREAT | O_EXCL` lock file next to the
// protected resource. Acquisition retries with a capped backoff until the
// timeout; the lock file is removed when the object is destroyed.
class ScopedFileLock {
public:
    ScopedFileLock(const ScopedFileLock&) = delete;
    ScopedFileLock& operator=(const ScopedFileLock&) = delete;
    ScopedFileLock(ScopedFileLock&& other) noexcept;
    ScopedFileLock& operator=(ScopedFileLock&& other) noexcept;
    ~ScopedFileLock();

    static errors::Result<std::shared_ptr<ScopedFileLock>> acquire(
        const std::filesystem::path& resource,
        std::chrono::milliseconds timeout = std::chrono::seconds(5));

    static std::filesystem::path lock_path_for(const std::filesystem::path& resource);

    const std::filesystem::path& lock_path() const { return lock_path_; }

private:
    ScopedFileLock(std::filesystem::path lock_path, int fd);
    void release() noexcept;

    std::filesystem::path lock_path_;
    int fd_ = -1;
};

}  // namespace knife::core::fs
