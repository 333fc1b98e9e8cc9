/**
 * @file named_lock.cpp
 * @brief OFD record lock implementation.
 * @author AnalyzerOrchestrator Team
 */

#include "store/named_lock.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace analyzer_orchestrator {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds{10};

void unlock_and_close(int fd) noexcept {
    struct flock fl{};
    fl.l_type = F_UNLCK;
    fl.l_whence = SEEK_SET;
    fcntl(fd, F_OFD_SETLK, &fl);
    ::close(fd);
}

}  // namespace

// ── Guard ────────────────────────────────────

NamedLock::Guard::~Guard() {
    release();
}

NamedLock::Guard::Guard(Guard&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

NamedLock::Guard& NamedLock::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void NamedLock::Guard::release() noexcept {
    if (fd_ >= 0) {
        unlock_and_close(fd_);
        fd_ = -1;
    }
}

// ── NamedLock ────────────────────────────────

NamedLock::NamedLock(std::filesystem::path lock_dir, std::string name)
    : path_(std::move(lock_dir) / (name + ".lock")), name_(std::move(name)) {}

Result<NamedLock::Guard> NamedLock::try_acquire() const {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Error{"Cannot open lock file " + path_.string() + ": " + std::strerror(errno),
                     ErrorKind::Storage};
    }

    struct flock fl{};
    fl.l_type = F_WRLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;
    fl.l_pid = 0;
    if (fcntl(fd, F_OFD_SETLK, &fl) == 0) {
        return Guard{fd};
    }

    int err = errno;
    ::close(fd);
    if (err == EAGAIN || err == EACCES) {
        return Error{"Lock '" + name_ + "' is held", ErrorKind::LockTimeout};
    }
    return Error{"fcntl on " + path_.string() + ": " + std::strerror(err), ErrorKind::Storage};
}

Result<NamedLock::Guard> NamedLock::acquire(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto guard = try_acquire();
        if (guard || guard.error().kind != ErrorKind::LockTimeout) return guard;

        if (std::chrono::steady_clock::now() >= deadline) {
            return Error{"Timed out after " + std::to_string(timeout.count())
                         + "ms waiting for lock '" + name_ + "'", ErrorKind::LockTimeout};
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

}  // namespace analyzer_orchestrator
