/**
 * @file types.hpp
 * @brief Fundamental types used throughout ParallelOrchestrator.
 * @author Dimitris Kafetzis
 *
 * Defines TaskId, RunId, the task status state machine, complexity levels
 * and other shared vocabulary types. All types are designed for value
 * semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace parallel_orchestrator {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using RunId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

/**
 * @brief Per-task execution state.
 *
 *   Queued → Running → { Succeeded | Failed | TimedOut | Cancelled }
 *
 * Failed and TimedOut are re-queued by the retry policy until attempts are
 * exhausted; after that Failed is terminal.
 */
enum class TaskStatus : uint8_t {
    Queued,
    Running,
    Succeeded,
    Failed,
    TimedOut,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Queued:    return "queued";
        case TaskStatus::Running:   return "running";
        case TaskStatus::Succeeded: return "succeeded";
        case TaskStatus::Failed:    return "failed";
        case TaskStatus::TimedOut:  return "timed_out";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] std::optional<TaskStatus> parse_task_status(std::string_view text) noexcept;

/// Succeeded, Failed (after retries) and Cancelled end a task's lifecycle.
[[nodiscard]] constexpr bool is_terminal(TaskStatus status) noexcept {
    return status == TaskStatus::Succeeded
        || status == TaskStatus::Failed
        || status == TaskStatus::Cancelled;
}

// ─────────────────────────────────────────────
// Complexity
// ─────────────────────────────────────────────

enum class Complexity : uint8_t {
    Low,
    Medium,
    High
};

[[nodiscard]] constexpr std::string_view to_string(Complexity complexity) noexcept {
    switch (complexity) {
        case Complexity::Low:    return "low";
        case Complexity::Medium: return "medium";
        case Complexity::High:   return "high";
    }
    return "unknown";
}

[[nodiscard]] std::optional<Complexity> parse_complexity(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Run Phase
// ─────────────────────────────────────────────

enum class RunPhase : uint8_t {
    Initialized,
    Analyzed,
    Executing,
    Completed,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(RunPhase phase) noexcept {
    switch (phase) {
        case RunPhase::Initialized: return "initialized";
        case RunPhase::Analyzed:    return "analyzed";
        case RunPhase::Executing:   return "executing";
        case RunPhase::Completed:   return "completed";
        case RunPhase::Failed:      return "failed";
        case RunPhase::Cancelled:   return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] std::optional<RunPhase> parse_run_phase(std::string_view text) noexcept;

/// Reason recorded on tasks cancelled because a dependency did not succeed.
inline constexpr std::string_view kBlockedDependencyFailed = "blocked-dependency-failed";

}  // namespace parallel_orchestrator
