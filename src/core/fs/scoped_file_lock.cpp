#include "core/fs/scoped_file_lock.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace knife::core::fs {

using errors::ErrorCategory;
using errors::ToolError;

ScopedFileLock::ScopedFileLock(std::filesystem::path lock_path, const int fd)
    : lock_path_(std::move(lock_path)), fd_(fd) {}

ScopedFileLock::ScopedFileLock(ScopedFileLock&& other) noexcept
    : lock_path_(std::move(other.lock_path_)), fd_(other.fd_) {
    other.fd_ = -1;
    other.lock_path_.clear();
}

ScopedFileLock& ScopedFileLock::operator=(ScopedFileLock&& other) noexcept {
    if (this != &other) {
        release();
        lock_path_ = std::move(other.lock_path_);
        fd_ = other.fd_;
        other.fd_ = -1;
        other.lock_path_.clear();
    }
    return *this;
}

ScopedFileLock::~ScopedFileLock() { release(); }

void ScopedFileLock::release() noexcept {
    if (fd_ < 0) {
        return;
    }
    static_cast<void>(close(fd_));
    fd_ = -1;
    std::error_code ec;
    std::filesystem::remove(lock_path_, ec);
}

std::filesystem::path ScopedFileLock::lock_path_for(
    const std::filesystem::path& resource) {
    std::filesystem::path lock = resource;
    lock += ".lock";
    return lock;
}

errors::Result<std::shared_ptr<ScopedFileLock>> ScopedFileLock::acquire(
    const std::filesystem::path& resource, const std::chrono::milliseconds timeout) {
    const auto lock_path = lock_path_for(resource);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto backoff = std::chrono::milliseconds(10);
    constexpr auto kMaxBackoff = std::chrono::milliseconds(200);

    while (true) {
        const int fd = open(lock_path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
        if (fd >= 0) {
            const std::string owner = std::to_string(getpid()) + "\n";
            static_cast<void>(write(fd, owner.data(), owner.size()));
            return std::shared_ptr<ScopedFileLock>(new ScopedFileLock(lock_path, fd));
        }
        if (errno != EEXIST) {
            return ToolError{ErrorCategory::Execution,
                             "Unable to create lock file " + lock_path.string() + ": " +
                                 std::strerror(errno),
                             errors::codes::kInternalError};
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            KNIFE_LOG_WARN("Lock wait expired for " + resource.string());
            return ToolError{ErrorCategory::Execution,
                             "Timed out waiting for lock on " + resource.string(),
                             errors::codes::kTimeout,
                             "Another writer holds " + lock_path.string() + "."};
        }

        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(backoff, remaining));
        backoff = std::min(backoff * 2, kMaxBackoff);
    }
}

}  // namespace knife::core::fs
