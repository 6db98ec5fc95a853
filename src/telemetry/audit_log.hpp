/**
 * @file audit_log.hpp
 * @brief Structured audit trail of a run, written as NDJSON.
 * @author Dimitris Kafetzis
 *
 * Every execution attempt is kept in memory per task, in order, so
 * superseded attempts stay queryable after a retry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "workload/task.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace parallel_orchestrator {

class AuditLog {
public:
    explicit AuditLog(std::unique_ptr<ILogSink> sink);

    void record_attempt(const ExecutionResult& result);
    void record_state_change(const TaskId& id, TaskStatus from, TaskStatus to,
                             std::string_view reason = {});
    void record_plan(const RunId& run_id, const std::vector<std::vector<TaskId>>& groups,
                     size_t conflict_count);
    void record_checkpoint(const RunId& run_id, uint64_t sequence, std::string_view phase,
                           bool ok, std::string_view message = {});
    void record_circuit_change(std::string_view from, std::string_view to, double failure_rate);
    void record_workspace_event(const TaskId& id, std::string_view event, std::string_view detail);

    /// Every recorded attempt of `id`, oldest first.
    [[nodiscard]] std::vector<ExecutionResult> attempts(const TaskId& id) const;
    [[nodiscard]] size_t attempt_count() const;

    void flush();

private:
    void emit(std::string_view event, std::string_view fields);

    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex mutex_;
    std::map<TaskId, std::vector<ExecutionResult>> attempts_;
};

}  // namespace parallel_orchestrator
