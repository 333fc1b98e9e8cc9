/**
 * @file named_lock.hpp
 * @brief Process-external, named, timeout-bounded mutual exclusion.
 * @author AnalyzerOrchestrator Team
 *
 * Backed by open-file-description record locks on <lock_dir>/<name>.lock.
 * Every acquisition opens its own descriptor, so the lock excludes other
 * threads of this process as well as other processes. The lock is released
 * by the kernel if the holder dies.
 */

#pragma once

#include "core/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace analyzer_orchestrator {

class NamedLock {
public:
    /// Held lock. Releases on destruction.
    class Guard {
    public:
        explicit Guard(int fd) noexcept : fd_(fd) {}
        ~Guard();
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        void release() noexcept;
        [[nodiscard]] bool held() const noexcept { return fd_ >= 0; }

    private:
        int fd_ = -1;
    };

    NamedLock(std::filesystem::path lock_dir, std::string name);

    /**
     * @brief Acquire, polling until the timeout.
     * @return Guard, or LockTimeout on expiry, Storage on I/O failure.
     */
    Result<Guard> acquire(std::chrono::milliseconds timeout) const;

    /// Single non-blocking attempt. LockTimeout if currently held elsewhere.
    Result<Guard> try_acquire() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::string name_;
};

}  // namespace analyzer_orchestrator
