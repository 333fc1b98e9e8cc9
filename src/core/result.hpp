/**
 * @file result.hpp
 * @brief Monadic error handling type for AnalyzerOrchestrator.
 * @author AnalyzerOrchestrator Team
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Ordinary
 * contention (no endpoint, busy store, remote failure) is reported through
 * Result, never through exceptions. Error carries an ErrorKind so callers can
 * tell retryable conditions from permanent ones.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace analyzer_orchestrator {

// ─────────────────────────────────────────────
// Error taxonomy
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    InvalidArgument,
    NotFound,
    CapacityExhausted,     ///< No healthy endpoint for a service
    RemoteFailure,         ///< Worker returned an error or the transport broke
    Timeout,               ///< Remote call or store access exceeded its bound
    AllocationConflict,    ///< Uniqueness conflict the store could not resolve
    StaleVersion,          ///< Attempt to branch a lineage from a non-latest version
    Storage,
    LockTimeout,
    Protocol,
    Cancelled,
    Internal
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidArgument:    return "invalid_argument";
        case ErrorKind::NotFound:           return "not_found";
        case ErrorKind::CapacityExhausted:  return "capacity_exhausted";
        case ErrorKind::RemoteFailure:      return "remote_failure";
        case ErrorKind::Timeout:            return "timeout";
        case ErrorKind::AllocationConflict: return "allocation_conflict";
        case ErrorKind::StaleVersion:       return "stale_version";
        case ErrorKind::Storage:            return "storage";
        case ErrorKind::LockTimeout:        return "lock_timeout";
        case ErrorKind::Protocol:           return "protocol";
        case ErrorKind::Cancelled:          return "cancelled";
        case ErrorKind::Internal:           return "internal";
    }
    return "unknown";
}

/// Conditions a caller may reasonably retry later.
[[nodiscard]] constexpr bool is_retryable(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::CapacityExhausted:
        case ErrorKind::RemoteFailure:
        case ErrorKind::Timeout:
        case ErrorKind::AllocationConflict:
        case ErrorKind::LockTimeout:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Error type carrying a human-readable message and its category.
 */
struct Error {
    std::string message;
    ErrorKind kind = ErrorKind::Internal;

    explicit Error(std::string msg, ErrorKind k = ErrorKind::Internal)
        : message(std::move(msg)), kind(k) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
    [[nodiscard]] bool retryable() const noexcept { return is_retryable(kind); }
};

/**
 * @brief Result<T, E>: value or error.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_message());
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_message());
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_message());
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::string error_message() const {
        if constexpr (std::is_same_v<E, Error>) {
            return std::get<E>(storage_).message;
        } else {
            return "error";
        }
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(std::string message, ErrorKind kind = ErrorKind::Internal) {
    return Result<T, E>(E{std::move(message), kind});
}

}  // namespace analyzer_orchestrator
