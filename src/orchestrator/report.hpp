/**
 * @file report.hpp
 * @brief Final run report and plan rendering.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "analyzer/conflict_detector.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "telemetry/audit_log.hpp"
#include "workload/task.hpp"

#include <optional>
#include <string>
#include <vector>

namespace parallel_orchestrator {

struct TaskReport {
    TaskId id;
    std::string name;
    TaskStatus status = TaskStatus::Queued;
    uint32_t attempts = 0;
    Duration duration{0};                          ///< Summed over all attempts
    std::optional<std::string> error;              ///< Last error or status reason
};

/**
 * @brief Outcome of a whole run: one line per task plus run-level state.
 */
struct RunReport {
    RunId run_id;
    RunPhase phase = RunPhase::Initialized;
    std::vector<TaskReport> tasks;
    std::vector<std::vector<TaskId>> groups;
    size_t conflict_count = 0;
    bool checkpoint_ok = true;                     ///< False if any checkpoint write failed
    std::optional<Error> failure;                  ///< Unrecoverable phase error, if any

    [[nodiscard]] bool all_succeeded() const noexcept;
    [[nodiscard]] size_t count(TaskStatus status) const noexcept;
    [[nodiscard]] const TaskReport* find(const TaskId& id) const;

    /// Fixed-width text table followed by a summary line.
    [[nodiscard]] std::string render() const;

    /**
     * @brief Build a report from the final task models.
     *
     * Durations come from the audit log when it holds the task's attempts,
     * otherwise from the last recorded result.
     */
    static RunReport build(const RunId& run_id, RunPhase phase,
                           const std::vector<TaskModel>& tasks,
                           const std::vector<std::vector<TaskId>>& groups,
                           size_t conflict_count,
                           const AuditLog* audit = nullptr);
};

/// Group plan and conflicting pairs as printed by a dry run.
[[nodiscard]] std::string render_plan(const std::vector<TaskModel>& tasks,
                                      const std::vector<std::vector<TaskId>>& groups,
                                      const ConflictMatrix& conflicts);

}  // namespace parallel_orchestrator
