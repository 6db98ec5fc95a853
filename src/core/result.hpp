/**
 * @file result.hpp
 * @brief Monadic error handling type for ParallelOrchestrator.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Errors
 * carry an ErrorKind from the orchestration error taxonomy so callers can
 * decide between aborting the run, retrying, or degrading.
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

namespace parallel_orchestrator {

// ─────────────────────────────────────────────
// Error Taxonomy
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    InputParse,         ///< Fatal: input cannot be turned into a task
    DependencyCycle,    ///< Fatal: dependency graph is not a DAG
    WorkspaceExists,    ///< Caller must remove or reuse before retrying
    ExecutorTimeout,    ///< Retryable
    ExecutorFailure,    ///< Retryable up to max attempts
    CircuitOpen,        ///< Throttling signal, not a task failure
    CheckpointIO,       ///< Run continues in memory, resumability lost
    VersionControl,     ///< Workspace backend command failed
    InvalidArgument,
    Cancelled,
    Internal
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InputParse:      return "InputParseError";
        case ErrorKind::DependencyCycle: return "DependencyCycleError";
        case ErrorKind::WorkspaceExists: return "WorkspaceExistsError";
        case ErrorKind::ExecutorTimeout: return "ExecutorTimeoutError";
        case ErrorKind::ExecutorFailure: return "ExecutorFailure";
        case ErrorKind::CircuitOpen:     return "CircuitOpenError";
        case ErrorKind::CheckpointIO:    return "CheckpointIOError";
        case ErrorKind::VersionControl:  return "VersionControlError";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::Cancelled:       return "Cancelled";
        case ErrorKind::Internal:        return "InternalError";
    }
    return "UnknownError";
}

/// Fatal errors abort the whole run before any execution.
[[nodiscard]] constexpr bool is_fatal(ErrorKind kind) noexcept {
    return kind == ErrorKind::InputParse || kind == ErrorKind::DependencyCycle;
}

[[nodiscard]] constexpr bool is_retryable(ErrorKind kind) noexcept {
    return kind == ErrorKind::ExecutorTimeout || kind == ErrorKind::ExecutorFailure;
}

/**
 * @brief Error type carrying a kind and a descriptive message.
 */
struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// "KindName: message", used in reports and logs.
    [[nodiscard]] std::string describe() const {
        return std::string{to_string(kind)} + ": " + message;
    }
};

/**
 * @brief Result<T, E>: a monadic error type.
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
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
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

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
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
template <typename T>
Result<T> make_error(ErrorKind kind, std::string message) {
    return Result<T>(Error{kind, std::move(message)});
}

}  // namespace parallel_orchestrator
