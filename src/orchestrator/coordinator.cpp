/**
 * @file coordinator.cpp
 * @brief Coordinator implementation.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/coordinator.hpp"

#include "telemetry/json_sink.hpp"
#include "workload/task_parser.hpp"

#include <algorithm>
#include <ctime>
#include <system_error>

#include <unistd.h>

namespace parallel_orchestrator {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kComponent = "coordinator";
constexpr std::string_view kCancelledReason = "cancelled";

ExecutionResult cancelled_result(const TaskModel& task, std::string_view reason) {
    ExecutionResult result;
    result.task_id = task.id;
    result.attempt = task.attempts;
    result.status = TaskStatus::Cancelled;
    result.start_time = result.end_time = std::chrono::system_clock::now();
    result.error_message = std::string{reason};
    return result;
}

}  // anonymous namespace

/// Mutable state of one run, shared with the registry observer.
struct Coordinator::RunContext {
    WorkflowState state;
    ProcessRegistry registry;
    std::mutex state_mutex;
    bool checkpoint_ok = true;
    std::optional<Error> failure;
};

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<std::unique_ptr<Coordinator>> Coordinator::create(Options opts) {
    if (auto valid = validate_config(opts.config); !valid) {
        return valid.error();
    }

    if (!opts.executor) {
        auto executor = make_executor(opts.config.executor);
        if (!executor) return executor.error();
        opts.executor = std::move(*executor);
    }
    if (!opts.workspace_backend) {
        auto backend = make_workspace_backend(opts.config);
        if (!backend) return backend.error();
        opts.workspace_backend = std::move(*backend);
    }
    if (!opts.resource_monitor) {
        opts.resource_monitor = make_resource_monitor(opts.config);
    }
    if (!opts.log_sink) {
        opts.log_sink = std::make_unique<StdoutSink>();
    }
    if (!opts.audit_sink) {
        const auto& telemetry = opts.config.telemetry;
        opts.audit_sink = std::make_unique<JsonFileSink>(
            telemetry.log_dir, telemetry.audit_log, telemetry.max_file_size_mb, telemetry.rotate_count);
    }

    return std::unique_ptr<Coordinator>(new Coordinator(
        std::move(opts.config), std::move(opts.log_sink), std::move(opts.audit_sink),
        opts.log_level, std::move(opts.executor), std::move(opts.workspace_backend),
        std::move(opts.resource_monitor)));
}

Coordinator::Coordinator(Config config,
                         std::unique_ptr<ILogSink> log_sink,
                         std::unique_ptr<ILogSink> audit_sink,
                         LogLevel log_level,
                         std::unique_ptr<ITaskExecutor> executor,
                         std::unique_ptr<IWorkspaceBackend> backend,
                         std::unique_ptr<IResourceMonitor> monitor)
    : config_(std::move(config))
    , logger_(std::move(log_sink), log_level, std::string{kComponent})
    , audit_(std::make_unique<AuditLog>(std::move(audit_sink)))
    , executor_(std::move(executor))
    , monitor_(std::move(monitor))
    , workspaces_(std::make_unique<WorkspaceManager>(config_.workspace, std::move(backend)))
    , checkpoints_(config_.state.checkpoint_dir, config_.retry.max_attempts, &logger_)
    , analyzer_(config_.analyzer) {}

RunId Coordinator::make_run_id(Timestamp now, uint32_t process, uint32_t sequence) {
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &utc);
    return "run-" + std::string{buf} + "-" + std::to_string(process) + "-" + std::to_string(sequence);
}

// ─────────────────────────────────────────────
// Entry Points
// ─────────────────────────────────────────────

Result<AnalysisResult> Coordinator::plan(const std::vector<fs::path>& inputs) const {
    auto specs = TaskParser::parse_files(inputs);
    if (!specs) return specs.error();
    return analyzer_.analyze(*specs);
}

Result<RunReport> Coordinator::run(const std::vector<fs::path>& inputs) {
    auto specs = TaskParser::parse_files(inputs);
    if (!specs) {
        logger_.error(specs.error().describe());
        return specs.error();
    }
    std::vector<std::string> names;
    names.reserve(inputs.size());
    for (const auto& p : inputs) names.push_back(p.string());
    return run_specs(*specs, std::move(names));
}

Result<RunReport> Coordinator::run_specs(const std::vector<TaskSpec>& specs,
                                         std::vector<std::string> inputs) {
    reset_cancellation();

    // The pid separates concurrent processes; an existing checkpoint means
    // a previous process with the same pid already used the id.
    const auto now = std::chrono::system_clock::now();
    const auto process = static_cast<uint32_t>(::getpid());
    RunContext ctx;
    std::error_code ec;
    do {
        ctx.state.run_id = make_run_id(now, process, ++run_sequence_);
    } while (fs::exists(checkpoints_.path_for(ctx.state.run_id), ec));
    ctx.state.inputs = std::move(inputs);
    logger_.info("run " + ctx.state.run_id + ": analyzing " + std::to_string(specs.size()) + " task spec(s)");

    auto analysis = analyzer_.analyze(specs);
    if (!analysis) {
        logger_.error("run " + ctx.state.run_id + " aborted: " + analysis.error().describe());
        return analysis.error();
    }

    ctx.state.phase = RunPhase::Analyzed;
    ctx.state.tasks = analysis->graph.tasks();
    ctx.state.groups = analysis->groups;
    ctx.state.conflicts = analysis->conflicts;

    logger_.info("run " + ctx.state.run_id + ": " + std::to_string(ctx.state.tasks.size())
                 + " task(s), " + std::to_string(ctx.state.groups.size()) + " group(s), "
                 + std::to_string(ctx.state.conflicts.conflict_count()) + " conflicting pair(s)");
    audit_->record_plan(ctx.state.run_id, ctx.state.groups, ctx.state.conflicts.conflict_count());
    save_checkpoint(ctx);

    return execute(ctx);
}

Result<RunReport> Coordinator::resume(const RunId& run_id) {
    reset_cancellation();

    auto loaded = checkpoints_.load(run_id);
    if (!loaded) {
        logger_.error(loaded.error().describe());
        return loaded.error();
    }

    RunContext ctx;
    ctx.state = std::move(*loaded);

    if (ctx.state.phase == RunPhase::Completed) {
        logger_.info("run " + run_id + " already completed; nothing to resume");
        return RunReport::build(run_id, ctx.state.phase, ctx.state.tasks, ctx.state.groups,
                                ctx.state.conflicts.conflict_count(), audit_.get());
    }

    // Tasks stopped by a run-wide cancellation get another chance.
    size_t requeued = 0;
    size_t terminal = 0;
    for (auto& task : ctx.state.tasks) {
        if (task.status == TaskStatus::Cancelled && task.status_reason == kCancelledReason) {
            task.status = TaskStatus::Queued;
            task.status_reason.reset();
            ++requeued;
        }
        if (is_terminal(task.status)) ++terminal;
    }

    logger_.info("resuming run " + run_id + " (sequence " + std::to_string(ctx.state.sequence)
                 + "): " + std::to_string(terminal) + " terminal, "
                 + std::to_string(ctx.state.tasks.size() - terminal) + " remaining"
                 + (requeued ? ", " + std::to_string(requeued) + " re-queued after cancellation" : std::string{}));

    return execute(ctx);
}

Result<std::vector<RunId>> Coordinator::resumable_runs() const {
    return checkpoints_.detect_resumable_runs();
}

void Coordinator::reset_cancellation() {
    std::lock_guard lock(engine_mutex_);
    cancel_requested_ = false;
}

void Coordinator::cancel() {
    cancel_requested_ = true;
    std::lock_guard lock(engine_mutex_);
    if (active_engine_) active_engine_->cancel();
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

Result<RunReport> Coordinator::execute(RunContext& ctx) {
    for (const auto& task : ctx.state.tasks) {
        if (auto registered = ctx.registry.register_task(task); !registered) {
            logger_.error(registered.error().describe());
            return registered.error();
        }
    }

    ctx.registry.set_observer([this, &ctx](const TaskModel& task, TaskStatus previous) {
        audit_->record_state_change(task.id, previous, task.status, task.status_reason.value_or(""));
        std::lock_guard lock(ctx.state_mutex);
        if (auto* stored = ctx.state.find(task.id)) *stored = task;
        if (is_terminal(task.status)) save_checkpoint_locked(ctx);
    });

    {
        std::lock_guard lock(ctx.state_mutex);
        ctx.state.phase = RunPhase::Executing;
        save_checkpoint_locked(ctx);
    }

    EngineOptions engine_options;
    engine_options.retry = config_.retry;
    engine_options.circuit_breaker = config_.circuit_breaker;
    engine_options.resources = config_.resources;
    engine_options.poll_interval = Duration{config_.orchestrator.poll_interval_ms};
    engine_options.output_dir = config_.orchestrator.run_root / ctx.state.run_id / "logs";

    ExecutionEngine engine(engine_options, *executor_, ctx.registry, ctx.state.conflicts,
                           logger_, audit_.get(), workspaces_.get(), monitor_.get());
    if (monitor_) monitor_->start();
    {
        std::lock_guard lock(engine_mutex_);
        active_engine_ = &engine;
        if (cancel_requested_) engine.cancel();
    }

    for (size_t g = 0; g < ctx.state.groups.size(); ++g) {
        if (cancel_requested_ || ctx.failure) break;
        execute_group(ctx, engine, g);
    }

    {
        std::lock_guard lock(engine_mutex_);
        active_engine_ = nullptr;
    }
    if (monitor_) monitor_->stop();

    if (cancel_requested_) cancel_remaining(ctx);
    cleanup_workspaces(ctx);

    RunPhase phase = RunPhase::Completed;
    if (ctx.failure) phase = RunPhase::Failed;
    else if (cancel_requested_) phase = RunPhase::Cancelled;

    {
        std::lock_guard lock(ctx.state_mutex);
        ctx.state.phase = phase;
        save_checkpoint_locked(ctx);
    }
    ctx.registry.set_observer(nullptr);
    audit_->flush();

    auto report = RunReport::build(ctx.state.run_id, phase, ctx.registry.snapshot(), ctx.state.groups,
                                   ctx.state.conflicts.conflict_count(), audit_.get());
    report.checkpoint_ok = ctx.checkpoint_ok;
    report.failure = ctx.failure;

    for (const auto& line : report.tasks) {
        std::string msg = line.id + " " + std::string{to_string(line.status)}
                        + " after " + std::to_string(line.attempts) + " attempt(s)";
        if (line.error) msg += ": " + *line.error;
        logger_.log(line.status == TaskStatus::Succeeded ? LogLevel::Info : LogLevel::Warn, msg);
    }
    logger_.info("run " + ctx.state.run_id + " " + std::string{to_string(phase)} + ": "
                 + std::to_string(report.count(TaskStatus::Succeeded)) + "/"
                 + std::to_string(report.tasks.size()) + " succeeded");
    logger_.flush();
    return report;
}

void Coordinator::execute_group(RunContext& ctx, ExecutionEngine& engine, size_t group_index) {
    const auto& group = ctx.state.groups[group_index];

    const size_t blocked = cancel_blocked(ctx, group);
    if (blocked > 0) {
        logger_.warn("group " + std::to_string(group_index + 1) + ": " + std::to_string(blocked)
                     + " task(s) blocked by failed dependencies");
    }

    std::vector<TaskId> runnable;
    for (const auto& id : group) {
        if (ctx.registry.status(id) == TaskStatus::Queued) runnable.push_back(id);
    }
    if (runnable.empty()) return;

    {
        std::lock_guard lock(ctx.state_mutex);
        ctx.state.current_group = static_cast<uint32_t>(group_index);
        save_checkpoint_locked(ctx);
    }
    logger_.info("group " + std::to_string(group_index + 1) + "/" + std::to_string(ctx.state.groups.size())
                 + ": executing " + std::to_string(runnable.size()) + " task(s)");

    create_workspaces(runnable);

    auto results = engine.run(runnable, config_.orchestrator.max_parallel,
                              Duration{config_.orchestrator.per_task_timeout_ms});
    if (!results) {
        logger_.error("group " + std::to_string(group_index + 1) + " failed: " + results.error().describe());
        ctx.failure = results.error();
        return;
    }

    // Integrate: settle workspaces according to each task's outcome.
    size_t succeeded = 0;
    for (const auto& id : runnable) {
        auto status = ctx.registry.status(id).value_or(TaskStatus::Failed);
        if (status == TaskStatus::Succeeded) ++succeeded;
        release_workspace(id, status);
    }
    logger_.info("group " + std::to_string(group_index + 1) + " done: " + std::to_string(succeeded)
                 + "/" + std::to_string(runnable.size()) + " succeeded");

    std::lock_guard lock(ctx.state_mutex);
    save_checkpoint_locked(ctx);
}

size_t Coordinator::cancel_blocked(RunContext& ctx, const std::vector<TaskId>& group) {
    size_t blocked = 0;
    for (const auto& id : group) {
        auto task = ctx.registry.get(id);
        if (!task || task->status != TaskStatus::Queued) continue;

        const bool dependency_failed = std::any_of(
            task->dependencies.begin(), task->dependencies.end(), [&](const TaskId& dep) {
                auto st = ctx.registry.status(dep);
                return st && (*st == TaskStatus::Failed || *st == TaskStatus::Cancelled);
            });
        if (!dependency_failed) continue;

        auto cancelled = ctx.registry.cancel(id, std::string{kBlockedDependencyFailed},
                                             cancelled_result(*task, kBlockedDependencyFailed));
        if (!cancelled) {
            logger_.error(cancelled.error().describe());
            continue;
        }
        if (*cancelled) ++blocked;
    }
    return blocked;
}

void Coordinator::cancel_remaining(RunContext& ctx) {
    for (const auto& task : ctx.registry.snapshot()) {
        if (task.status != TaskStatus::Queued) continue;
        auto cancelled = ctx.registry.cancel(task.id, std::string{kCancelledReason},
                                             cancelled_result(task, kCancelledReason));
        if (!cancelled) logger_.error(cancelled.error().describe());
    }
}

// ─────────────────────────────────────────────
// Workspaces
// ─────────────────────────────────────────────

void Coordinator::create_workspaces(const std::vector<TaskId>& tasks) {
    for (const auto& id : tasks) {
        if (workspaces_->get(id)) continue;

        auto created = workspaces_->create(id);
        if (!created && created.error().kind == ErrorKind::WorkspaceExists) {
            // Leftover from an interrupted run: remove it, then start fresh.
            logger_.warn(created.error().describe() + "; removing stale workspace");
            auto removed = workspaces_->remove(id);
            if (!removed) {
                logger_.error(removed.error().describe());
                continue;
            }
            created = workspaces_->create(id);
        }
        if (!created) {
            // The engine retries creation and counts a failure as an attempt.
            logger_.error(created.error().describe());
            continue;
        }
        audit_->record_workspace_event(id, "created", created->path.string());
    }
}

void Coordinator::release_workspace(const TaskId& id, TaskStatus status) {
    const bool keep = status == TaskStatus::Succeeded
        ? !config_.workspace.cleanup_on_success
        : config_.workspace.preserve_on_failure;
    if (keep) {
        if (auto ws = workspaces_->get(id)) {
            logger_.info("keeping workspace of " + id + " at " + ws->path.string());
        }
        return;
    }

    auto removed = workspaces_->remove(id);
    if (!removed) {
        logger_.error(removed.error().describe());
        return;
    }
    if (*removed) audit_->record_workspace_event(id, "removed", std::string{to_string(status)});
}

void Coordinator::cleanup_workspaces(RunContext& ctx) {
    for (const auto& ws : workspaces_->list()) {
        auto status = ctx.registry.status(ws.task_id).value_or(TaskStatus::Cancelled);
        if (status == TaskStatus::Succeeded && !config_.workspace.cleanup_on_success) continue;
        if (status == TaskStatus::Failed && config_.workspace.preserve_on_failure) continue;

        auto removed = workspaces_->remove(ws.task_id);
        if (!removed) {
            logger_.error(removed.error().describe());
            continue;
        }
        if (*removed) audit_->record_workspace_event(ws.task_id, "removed", "shutdown cleanup");
    }
}

// ─────────────────────────────────────────────
// Checkpoints
// ─────────────────────────────────────────────

void Coordinator::save_checkpoint(RunContext& ctx) {
    std::lock_guard lock(ctx.state_mutex);
    save_checkpoint_locked(ctx);
}

void Coordinator::save_checkpoint_locked(RunContext& ctx) {
    auto saved = checkpoints_.save(ctx.state);
    const auto phase = to_string(ctx.state.phase);
    if (saved) {
        audit_->record_checkpoint(ctx.state.run_id, ctx.state.sequence, phase, true);
        return;
    }
    if (ctx.checkpoint_ok) {
        logger_.error(saved.error().describe() + "; run continues in memory and cannot be resumed");
    }
    ctx.checkpoint_ok = false;
    audit_->record_checkpoint(ctx.state.run_id, ctx.state.sequence, phase, false, saved.error().message);
}

}  // namespace parallel_orchestrator
