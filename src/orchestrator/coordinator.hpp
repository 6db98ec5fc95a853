/**
 * @file coordinator.hpp
 * @brief Top-level Coordinator facade that drives a run from task inputs to
 *        the final report.
 * @author Dimitris Kafetzis
 *
 * Pipeline per run:
 *   parse inputs → analyze → checkpoint → for each group:
 *     cancel blocked tasks → create workspaces → execute → integrate
 *     → remove workspaces → checkpoint
 *   → cleanup → final checkpoint → report
 *
 * A checkpoint is also written whenever a task reaches a terminal status,
 * so an interrupted run resumes without re-running finished tasks.
 */

#pragma once

#include "analyzer/task_analyzer.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/execution_engine.hpp"
#include "executor/process_registry.hpp"
#include "executor/task_executor.hpp"
#include "orchestrator/report.hpp"
#include "resource_monitor/monitor.hpp"
#include "state/checkpoint_manager.hpp"
#include "telemetry/audit_log.hpp"
#include "workspace/workspace_manager.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace parallel_orchestrator {

class Coordinator {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;                    ///< Default: StdoutSink
        std::unique_ptr<ILogSink> audit_sink;                  ///< Default: NDJSON file in telemetry.log_dir
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ITaskExecutor> executor;               ///< Default: from config.executor
        std::unique_ptr<IWorkspaceBackend> workspace_backend;  ///< Default: from config.workspace
        std::unique_ptr<IResourceMonitor> resource_monitor;    ///< Default: from config.resources
    };

    /// Validate the config and build every collaborator.
    static Result<std::unique_ptr<Coordinator>> create(Options opts);

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // ── Runs ─────────────────────────────────

    /// Parse task input files and run them.
    Result<RunReport> run(const std::vector<std::filesystem::path>& inputs);

    /// Run already-parsed task specs. `inputs` is recorded in the checkpoint.
    Result<RunReport> run_specs(const std::vector<TaskSpec>& specs,
                                std::vector<std::string> inputs = {});

    /// Continue a checkpointed run; terminal tasks are not executed again.
    Result<RunReport> resume(const RunId& run_id);

    /// Analyze task input files without executing anything.
    Result<AnalysisResult> plan(const std::vector<std::filesystem::path>& inputs) const;

    [[nodiscard]] Result<std::vector<RunId>> resumable_runs() const;

    /// Stop the current run. Thread-safe and idempotent. The request
    /// applies until the next run() or resume() starts.
    void cancel();
    [[nodiscard]] bool cancel_requested() const noexcept { return cancel_requested_.load(); }

    /// `run-YYYYMMDD-HHMMSS-<pid>-<n>` in UTC.
    [[nodiscard]] static RunId make_run_id(Timestamp now, uint32_t process, uint32_t sequence);

    // ── Accessors ────────────────────────────

    Logger& logger() { return logger_; }
    AuditLog& audit() { return *audit_; }
    const Config& config() const { return config_; }
    WorkspaceManager& workspaces() { return *workspaces_; }
    CheckpointManager& checkpoints() { return checkpoints_; }

private:
    struct RunContext;

    Coordinator(Config config,
                std::unique_ptr<ILogSink> log_sink,
                std::unique_ptr<ILogSink> audit_sink,
                LogLevel log_level,
                std::unique_ptr<ITaskExecutor> executor,
                std::unique_ptr<IWorkspaceBackend> backend,
                std::unique_ptr<IResourceMonitor> monitor);

    void reset_cancellation();
    Result<RunReport> execute(RunContext& ctx);
    void execute_group(RunContext& ctx, ExecutionEngine& engine, size_t group_index);
    size_t cancel_blocked(RunContext& ctx, const std::vector<TaskId>& group);
    void create_workspaces(const std::vector<TaskId>& tasks);
    void release_workspace(const TaskId& id, TaskStatus status);
    void cleanup_workspaces(RunContext& ctx);
    void cancel_remaining(RunContext& ctx);
    void save_checkpoint(RunContext& ctx);
    void save_checkpoint_locked(RunContext& ctx);

    Config config_;
    Logger logger_;
    std::unique_ptr<AuditLog> audit_;
    std::unique_ptr<ITaskExecutor> executor_;
    std::unique_ptr<IResourceMonitor> monitor_;        ///< May be null
    std::unique_ptr<WorkspaceManager> workspaces_;
    CheckpointManager checkpoints_;
    TaskAnalyzer analyzer_;

    std::atomic<bool> cancel_requested_{false};
    std::atomic<uint32_t> run_sequence_{0};
    std::mutex engine_mutex_;
    ExecutionEngine* active_engine_ = nullptr;
};

}  // namespace parallel_orchestrator
