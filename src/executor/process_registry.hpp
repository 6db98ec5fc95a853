/**
 * @file process_registry.hpp
 * @brief Lock-guarded table of task id → execution state.
 * @author Dimitris Kafetzis
 *
 * The registry is the single source of truth for what is queued, running
 * or finished. Every status change goes through a transition method that
 * checks the state machine:
 *
 *   Queued  → Running | Cancelled
 *   Running → Succeeded | Failed | TimedOut | Cancelled | Queued (retry)
 *
 * Observers are notified after the lock is released, so they may perform
 * I/O (audit log, checkpoints) or read the registry again.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workload/task.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace parallel_orchestrator {

class ProcessRegistry {
public:
    /// Called as (task after the change, previous status).
    using Observer = std::function<void(const TaskModel&, TaskStatus)>;

    ProcessRegistry() = default;
    ProcessRegistry(const ProcessRegistry&) = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    /// Insert a task as-is (fresh tasks or tasks restored from a checkpoint).
    Result<void> register_task(TaskModel task);
    void set_observer(Observer observer);

    // ── Transitions ───────────────────────────
    /// Queued → Running; increments the attempt counter.
    Result<uint32_t> mark_running(const TaskId& id, std::optional<std::string> workspace_ref = std::nullopt);

    /**
     * @brief Record the outcome of the current attempt.
     *
     * With `retry` set the task goes back to Queued; otherwise it takes its
     * terminal status (a timed-out task that may not retry ends Failed).
     */
    Result<void> finish_attempt(const ExecutionResult& result, bool retry);

    /// Queued/Running → Cancelled with a reason. Terminal tasks are left untouched.
    Result<bool> cancel(const TaskId& id, std::string reason,
                        std::optional<ExecutionResult> result = std::nullopt);

    // ── Queries ───────────────────────────────
    [[nodiscard]] std::optional<TaskModel> get(const TaskId& id) const;
    [[nodiscard]] std::optional<TaskStatus> status(const TaskId& id) const;
    [[nodiscard]] bool contains(const TaskId& id) const;
    /// Copy of every task, ordered by id.
    [[nodiscard]] std::vector<TaskModel> snapshot() const;
    [[nodiscard]] std::vector<TaskId> running() const;
    [[nodiscard]] size_t running_count() const;
    [[nodiscard]] size_t size() const;

    /// Block until any transition happens or `timeout` passes.
    /// Returns false on timeout.
    bool wait_for_change(Duration timeout);

private:
    void notify(const TaskModel& task, TaskStatus previous);

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    uint64_t version_ = 0;
    std::map<TaskId, TaskModel> tasks_;

    std::mutex observer_mutex_;
    Observer observer_;
};

}  // namespace parallel_orchestrator
