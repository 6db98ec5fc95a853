/**
 * @file execution_engine.hpp
 * @brief Bounded-parallel task execution with retry, timeout, circuit
 *        breaking and cancellation.
 * @author Dimitris Kafetzis
 *
 * A dispatcher loop on the calling thread owns all scheduling decisions;
 * a WorkerPool of `max_parallel` workers blocks on executor invocations.
 * Workers hand completions back through a condition variable, and the
 * dispatcher also wakes on a fixed poll interval to enforce deadlines and
 * release backed-off retries.
 *
 * The allowed parallelism is the lowest of `max_parallel`, the circuit
 * breaker's limit and, when a resource monitor is attached, the limit for
 * the current host pressure.
 *
 * Invariants upheld by the dispatcher:
 *   - never more than the allowed parallelism in Running
 *   - never two conflicting tasks in Running at the same time
 *   - a task starts only after every dependency Succeeded
 */

#pragma once

#include "analyzer/conflict_detector.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/circuit_breaker.hpp"
#include "executor/process_registry.hpp"
#include "executor/task_executor.hpp"
#include "resource_monitor/monitor.hpp"
#include "telemetry/audit_log.hpp"
#include "workspace/workspace_manager.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <stop_token>
#include <vector>

namespace parallel_orchestrator {

struct EngineOptions {
    RetryConfig retry;
    CircuitBreakerConfig circuit_breaker;
    ResourceConfig resources;                  ///< Thresholds applied to the monitor's snapshots
    Duration poll_interval{100};
    std::filesystem::path output_dir;          ///< Empty = do not write output files
};

class ExecutionEngine {
public:
    using ResultMap = std::map<TaskId, ExecutionResult>;

    /**
     * @param workspaces Optional. When set, each attempt runs in the task's
     *        workspace (created on demand, recreated fresh for retries).
     * @param monitor Optional. When set, host pressure lowers the allowed
     *        parallelism; the caller starts and stops it.
     */
    ExecutionEngine(EngineOptions options,
                    ITaskExecutor& executor,
                    ProcessRegistry& registry,
                    const ConflictMatrix& conflicts,
                    Logger& logger,
                    AuditLog* audit = nullptr,
                    WorkspaceManager* workspaces = nullptr,
                    IResourceMonitor* monitor = nullptr);

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    /**
     * @brief Execute `tasks` (all registered in the registry) to completion.
     * @return The latest ExecutionResult of every task in the batch.
     *
     * Tasks already terminal are skipped. Returns only after
     * every started attempt has finished.
     */
    Result<ResultMap> run(const std::vector<TaskId>& tasks,
                          size_t max_parallel,
                          Duration per_task_timeout);

    /// Cancel queued and running work. Idempotent and thread-safe; sticky
    /// for later run() calls.
    void cancel();
    [[nodiscard]] bool cancel_requested() const noexcept { return cancel_requested_.load(); }

    [[nodiscard]] CircuitBreaker& circuit_breaker() noexcept { return breaker_; }

    /// Delay before the attempt after `failed_attempt` (1-based).
    [[nodiscard]] static Duration backoff_delay(const RetryConfig& retry, uint32_t failed_attempt);

    /// Highest number of simultaneously running tasks seen so far.
    [[nodiscard]] size_t peak_parallelism() const noexcept { return peak_parallelism_.load(); }

private:
    struct Slot {
        uint32_t attempt = 0;
        std::stop_source stop;
        std::optional<SteadyTime> deadline;
        Timestamp started{};
        std::string stdout_ref;
        std::string stderr_ref;
        bool timed_out = false;
        bool cancelled = false;
    };

    struct Completion {
        TaskId id;
        Result<ExecutorOutput> output;
        Timestamp finished;
    };

    struct Batch;

    void start_attempt(Batch& batch, const TaskModel& task, Duration per_task_timeout);
    void handle_completion(Batch& batch, Completion completion);
    void cancel_pending(Batch& batch);
    void enforce_deadlines(Batch& batch);
    void dispatch(Batch& batch, Duration per_task_timeout);
    void settle_stalled(Batch& batch);
    size_t resource_limit(size_t max_parallel);
    void finish_without_running(Batch& batch, const TaskId& id, const std::string& reason);
    Result<std::filesystem::path> prepare_workspace(const TaskId& id, uint32_t attempt);

    EngineOptions options_;
    ITaskExecutor& executor_;
    ProcessRegistry& registry_;
    const ConflictMatrix& conflicts_;
    Logger& logger_;
    AuditLog* audit_;
    WorkspaceManager* workspaces_;
    IResourceMonitor* monitor_;
    CircuitBreaker breaker_;
    size_t resource_limit_ = 0;                ///< 0 while unthrottled; dispatcher only

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Completion> completions_;
    std::atomic<bool> cancel_requested_{false};
    std::atomic<size_t> peak_parallelism_{0};
};

}  // namespace parallel_orchestrator
