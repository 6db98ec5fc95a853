/**
 * @file task.hpp
 * @brief Task vocabulary: raw task specs, analysed task models, workspaces
 *        and per-attempt execution results.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace parallel_orchestrator {

/**
 * @brief Declared footprint of a task, used for conflict detection and
 *        complexity scoring.
 */
struct TaskFootprint {
    std::vector<std::string> target_files;
    std::vector<std::string> target_dirs;
    std::vector<std::string> imports;              ///< Files/modules the task's code imports
    std::vector<std::string> components;           ///< Business-logic / architectural ownership
    std::vector<std::string> interfaces;           ///< Public API surfaces modified
    std::vector<std::string> data_models;          ///< Persistent schemas written
    std::vector<std::string> test_fixtures;        ///< Test environments used exclusively
    std::vector<std::string> exclusive_resources;  ///< Named external resources used exclusively
    bool cpu_intensive = false;
    bool memory_intensive = false;

    bool operator==(const TaskFootprint&) const = default;
};

/**
 * @brief A task as supplied by the caller, before analysis.
 */
struct TaskSpec {
    std::string name;
    std::string description;
    TaskFootprint footprint;
    std::vector<std::string> depends_on;           ///< Names of other specs
    std::optional<uint32_t> estimated_minutes;
    std::string source;                            ///< Originating file or "<inline>"
};

/**
 * @brief Outcome of one execution attempt. Immutable once recorded.
 */
struct ExecutionResult {
    TaskId task_id;
    uint32_t attempt = 0;                          ///< 1-based
    TaskStatus status = TaskStatus::Failed;        ///< Succeeded, Failed, TimedOut or Cancelled
    Timestamp start_time{};
    Timestamp end_time{};
    int exit_code = -1;
    std::string stdout_ref;                        ///< Path of captured stdout
    std::string stderr_ref;                        ///< Path of captured stderr
    std::optional<std::string> error_message;

    [[nodiscard]] Duration duration() const noexcept {
        return std::chrono::duration_cast<Duration>(end_time - start_time);
    }
};

enum class WorkspaceStatus : uint8_t {
    Created,
    Active,
    Removed
};

[[nodiscard]] constexpr std::string_view to_string(WorkspaceStatus status) noexcept {
    switch (status) {
        case WorkspaceStatus::Created: return "created";
        case WorkspaceStatus::Active:  return "active";
        case WorkspaceStatus::Removed: return "removed";
    }
    return "unknown";
}

/**
 * @brief Isolated, branch-scoped working copy owned by exactly one task.
 */
struct Workspace {
    TaskId task_id;
    std::filesystem::path path;
    std::string branch_name;
    WorkspaceStatus status = WorkspaceStatus::Created;
};

/**
 * @brief Analysed unit of work.
 *
 * Descriptive fields are fixed by the analyzer; status, attempts,
 * workspace_ref and result change only through status transitions.
 */
struct TaskModel {
    TaskId id;
    std::string name;
    std::string description;
    TaskFootprint footprint;
    std::vector<TaskId> dependencies;
    Complexity complexity = Complexity::Low;
    double complexity_score = 0.0;
    Duration estimated_duration{0};
    std::optional<TaskId> parent;                  ///< Set on decomposed subtasks

    TaskStatus status = TaskStatus::Queued;
    uint32_t attempts = 0;
    std::optional<std::string> workspace_ref;
    std::optional<ExecutionResult> result;
    std::optional<std::string> status_reason;
};

}  // namespace parallel_orchestrator
