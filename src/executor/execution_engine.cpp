/**
 * @file execution_engine.cpp
 * @brief ExecutionEngine implementation: dispatcher loop and attempt
 *        bookkeeping.
 * @author Dimitris Kafetzis
 */

#include "executor/execution_engine.hpp"

#include "executor/worker_pool.hpp"

#include <algorithm>
#include <fstream>
#include <unordered_set>

namespace parallel_orchestrator {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kComponent = "engine";
constexpr std::string_view kBlockedDependencyUnscheduled = "blocked-dependency-unscheduled";
constexpr std::string_view kCancelledReason = "cancelled";

std::string last_line(const std::string& text) {
    auto end = text.find_last_not_of("\r\n \t");
    if (end == std::string::npos) return {};
    auto begin = text.find_last_of('\n', end);
    begin = begin == std::string::npos ? 0 : begin + 1;
    return text.substr(begin, end - begin + 1);
}

}  // anonymous namespace

/// Per-run dispatcher state. Only touched by the dispatcher thread.
struct ExecutionEngine::Batch {
    size_t max_parallel = 1;
    fs::path output_dir;
    WorkerPool* pool = nullptr;
    std::vector<TaskId> pending;                   ///< Not yet terminal, dispatch order
    std::unordered_set<TaskId> members;
    std::map<TaskId, Slot> running;
    std::map<TaskId, SteadyTime> not_before;       ///< Backoff release times
    ResultMap results;
    bool cancel_seen = false;
};

ExecutionEngine::ExecutionEngine(EngineOptions options,
                                 ITaskExecutor& executor,
                                 ProcessRegistry& registry,
                                 const ConflictMatrix& conflicts,
                                 Logger& logger,
                                 AuditLog* audit,
                                 WorkspaceManager* workspaces,
                                 IResourceMonitor* monitor)
    : options_(std::move(options))
    , executor_(executor)
    , registry_(registry)
    , conflicts_(conflicts)
    , logger_(logger)
    , audit_(audit)
    , workspaces_(workspaces)
    , monitor_(monitor)
    , breaker_(options_.circuit_breaker) {
    breaker_.set_listener([this](CircuitState from, CircuitState to, double rate) {
        if (to == CircuitState::Open) {
            Error err{ErrorKind::CircuitOpen,
                      "failure rate " + std::to_string(rate)
                      + " exceeded threshold; falling back to sequential execution"};
            logger_.log(LogLevel::Warn, kComponent, err.describe());
        } else {
            logger_.log(LogLevel::Info, kComponent,
                        "circuit " + std::string{to_string(from)} + " -> " + std::string{to_string(to)});
        }
        if (audit_) audit_->record_circuit_change(to_string(from), to_string(to), rate);
    });
}

Duration ExecutionEngine::backoff_delay(const RetryConfig& retry, uint32_t failed_attempt) {
    uint64_t delay = retry.base_delay_ms;
    for (uint32_t i = 1; i < failed_attempt && delay < retry.max_delay_ms; ++i) {
        delay *= 2;
    }
    return Duration{std::min(delay, retry.max_delay_ms)};
}

void ExecutionEngine::cancel() {
    if (cancel_requested_.exchange(true)) return;
    logger_.log(LogLevel::Warn, kComponent, "cancellation requested");
    {
        std::lock_guard lock(mutex_);
    }
    cv_.notify_all();
}

// ─────────────────────────────────────────────
// Run Loop
// ─────────────────────────────────────────────

Result<ExecutionEngine::ResultMap> ExecutionEngine::run(const std::vector<TaskId>& tasks,
                                                        size_t max_parallel,
                                                        Duration per_task_timeout) {
    if (max_parallel == 0) {
        return Error{ErrorKind::InvalidArgument, "max_parallel must be at least 1"};
    }

    Batch batch;
    batch.max_parallel = max_parallel;

    for (const auto& id : tasks) {
        if (batch.members.contains(id)) continue;
        auto task = registry_.get(id);
        if (!task) {
            return Error{ErrorKind::InvalidArgument, "task '" + id + "' is not registered"};
        }
        if (is_terminal(task->status)) {
            if (task->result) batch.results.emplace(id, *task->result);
            continue;
        }
        if (task->status != TaskStatus::Queued) {
            return Error{ErrorKind::InvalidArgument,
                         "task '" + id + "' is " + std::string{to_string(task->status)}
                         + ", expected queued"};
        }
        batch.members.insert(id);
        batch.pending.push_back(id);
    }
    if (batch.pending.empty()) return batch.results;

    if (!options_.output_dir.empty()) {
        std::error_code ec;
        fs::create_directories(options_.output_dir, ec);
        if (ec) {
            logger_.log(LogLevel::Warn, kComponent,
                        "cannot create output directory " + options_.output_dir.string()
                        + ": " + ec.message() + "; output kept in memory only");
        } else {
            auto abs = fs::absolute(options_.output_dir, ec);
            batch.output_dir = ec ? options_.output_dir : abs.lexically_normal();
        }
    }

    logger_.log(LogLevel::Info, kComponent,
                "executing " + std::to_string(batch.pending.size()) + " task(s), max_parallel="
                + std::to_string(max_parallel));

    WorkerPool pool(max_parallel);
    batch.pool = &pool;

    while (true) {
        std::vector<Completion> done;
        {
            std::lock_guard lock(mutex_);
            done.swap(completions_);
        }
        for (auto& completion : done) {
            handle_completion(batch, std::move(completion));
        }

        if (cancel_requested_) cancel_pending(batch);
        enforce_deadlines(batch);
        if (!cancel_requested_) dispatch(batch, per_task_timeout);

        if (batch.pending.empty() && batch.running.empty()) break;

        auto now = std::chrono::steady_clock::now();
        auto wake = now + options_.poll_interval;
        for (const auto& [id, release] : batch.not_before) {
            if (release > now) wake = std::min(wake, release);
        }
        for (const auto& [id, slot] : batch.running) {
            if (slot.deadline && *slot.deadline > now) wake = std::min(wake, *slot.deadline);
        }

        std::unique_lock lock(mutex_);
        cv_.wait_until(lock, wake, [&] {
            return !completions_.empty() || (cancel_requested_.load() && !batch.cancel_seen);
        });
    }

    pool.wait_idle();
    return batch.results;
}

// ─────────────────────────────────────────────
// Dispatch
// ─────────────────────────────────────────────

void ExecutionEngine::dispatch(Batch& batch, Duration per_task_timeout) {
    const size_t limit = std::min(breaker_.allowed_parallelism(batch.max_parallel),
                                  resource_limit(batch.max_parallel));
    const auto now = std::chrono::steady_clock::now();
    const auto candidates = batch.pending;

    for (const auto& id : candidates) {
        if (batch.running.size() >= limit) break;
        if (batch.running.contains(id)) continue;

        auto task = registry_.get(id);
        if (!task || task->status != TaskStatus::Queued) continue;

        if (auto it = batch.not_before.find(id); it != batch.not_before.end() && it->second > now) {
            continue;
        }

        std::optional<std::string_view> blocked;
        bool waiting = false;
        for (const auto& dep : task->dependencies) {
            auto st = registry_.status(dep);
            if (!st || *st == TaskStatus::Succeeded) continue;
            if (*st == TaskStatus::Failed || *st == TaskStatus::Cancelled) {
                blocked = kBlockedDependencyFailed;
                break;
            }
            if (!batch.members.contains(dep)) {
                blocked = kBlockedDependencyUnscheduled;
                break;
            }
            waiting = true;
        }
        if (blocked) {
            finish_without_running(batch, id, std::string{*blocked});
            continue;
        }
        if (waiting) continue;

        bool clash = std::any_of(batch.running.begin(), batch.running.end(),
                                 [&](const auto& entry) { return conflicts_.conflicts(entry.first, id); });
        if (clash) continue;

        start_attempt(batch, *task, per_task_timeout);
    }

    // Nothing running and nothing startable: remaining tasks can never run.
    if (batch.running.empty() && !batch.pending.empty()) {
        bool backoff_pending = std::any_of(batch.pending.begin(), batch.pending.end(), [&](const TaskId& id) {
            auto it = batch.not_before.find(id);
            return it != batch.not_before.end() && it->second > now;
        });
        if (!backoff_pending) settle_stalled(batch);
    }
}

size_t ExecutionEngine::resource_limit(size_t max_parallel) {
    if (!monitor_) return max_parallel;

    // Without a sample yet there is nothing to throttle on.
    auto snapshot = monitor_->read();
    if (!snapshot) return max_parallel;

    const auto pressure = assess_pressure(*snapshot, options_.resources);
    const size_t limit = pressure.any() ? pressure.allowed_parallelism(max_parallel) : 0;
    if (limit != resource_limit_) {
        if (limit != 0) {
            logger_.log(LogLevel::Warn, kComponent,
                        "resource pressure (" + describe_pressure(*snapshot, options_.resources)
                        + "); parallelism limited to " + std::to_string(limit));
        } else {
            logger_.log(LogLevel::Info, kComponent, "resource pressure cleared");
        }
        resource_limit_ = limit;
    }
    return limit != 0 ? limit : max_parallel;
}

void ExecutionEngine::settle_stalled(Batch& batch) {
    // Dependencies are settled before their dependents, whatever the pending
    // order, so a dependent sees a dependency this pass already cancelled.
    while (!batch.pending.empty()) {
        bool progressed = false;
        for (const auto& id : std::vector<TaskId>{batch.pending}) {
            auto task = registry_.get(id);
            bool dependency_pending = false;
            bool dependency_failed = false;
            if (task) {
                for (const auto& dep : task->dependencies) {
                    if (std::find(batch.pending.begin(), batch.pending.end(), dep) != batch.pending.end()) {
                        dependency_pending = true;
                        continue;
                    }
                    auto st = registry_.status(dep);
                    if (st && (*st == TaskStatus::Failed || *st == TaskStatus::Cancelled)) {
                        dependency_failed = true;
                    }
                }
            }
            if (dependency_pending && !dependency_failed) continue;
            finish_without_running(batch, id, std::string{dependency_failed ? kBlockedDependencyFailed
                                                                             : kBlockedDependencyUnscheduled});
            progressed = true;
        }
        if (!progressed) {
            for (const auto& id : std::vector<TaskId>{batch.pending}) {
                finish_without_running(batch, id, std::string{kBlockedDependencyUnscheduled});
            }
        }
    }
}

Result<fs::path> ExecutionEngine::prepare_workspace(const TaskId& id, uint32_t attempt) {
    auto existing = workspaces_->get(id);

    // A workspace used by an earlier attempt is replaced by a fresh one.
    if (existing && existing->status == WorkspaceStatus::Active) {
        auto removed = workspaces_->remove(id);
        if (!removed) return removed.error();
        if (audit_) audit_->record_workspace_event(id, "removed", "stale after attempt " + std::to_string(attempt - 1));
        existing.reset();
    }
    if (!existing) {
        auto created = workspaces_->create(id);
        if (!created) return created.error();
        if (audit_) audit_->record_workspace_event(id, "created", created->path.string());
        existing = *created;
    }
    workspaces_->mark_active(id);
    // Executors run the child inside the workspace, so hand them an absolute path.
    std::error_code ec;
    auto abs = fs::absolute(existing->path, ec);
    return ec ? existing->path : abs.lexically_normal();
}

void ExecutionEngine::start_attempt(Batch& batch, const TaskModel& task, Duration per_task_timeout) {
    const uint32_t attempt = task.attempts + 1;

    fs::path workspace;
    std::optional<Error> setup_error;
    if (workspaces_) {
        auto ws = prepare_workspace(task.id, attempt);
        if (ws) workspace = *ws;
        else setup_error = ws.error();
    }

    auto marked = registry_.mark_running(
        task.id, workspace.empty() ? std::nullopt : std::optional<std::string>{workspace.string()});
    if (!marked) {
        logger_.log(LogLevel::Error, kComponent, marked.error().describe());
        std::erase(batch.pending, task.id);
        return;
    }

    Slot slot;
    slot.attempt = *marked;
    slot.started = std::chrono::system_clock::now();
    if (per_task_timeout.count() > 0) {
        slot.deadline = std::chrono::steady_clock::now() + per_task_timeout;
    }

    ExecutionRequest request;
    request.task_id = task.id;
    request.name = task.name;
    request.description = task.description;
    request.workspace_path = workspace;
    request.attempt = slot.attempt;
    request.timeout = per_task_timeout;

    if (!batch.output_dir.empty()) {
        const auto stem = task.id + "." + std::to_string(slot.attempt);
        request.stdout_path = batch.output_dir / (stem + ".out");
        request.stderr_path = batch.output_dir / (stem + ".err");
        slot.stdout_ref = request.stdout_path->string();
        slot.stderr_ref = request.stderr_path->string();

        auto task_file = batch.output_dir / (task.id + ".task.md");
        std::ofstream out(task_file, std::ios::trunc);
        if (out << task.description << '\n') {
            request.task_file = task_file;
        } else {
            logger_.log(LogLevel::Warn, kComponent, "cannot write task file " + task_file.string());
        }
    }

    logger_.log(LogLevel::Info, kComponent,
                "start " + task.id + " attempt " + std::to_string(slot.attempt)
                + "/" + std::to_string(options_.retry.max_attempts));

    if (setup_error) {
        // Workspace could not be prepared: the attempt fails without running.
        std::lock_guard lock(mutex_);
        completions_.push_back(Completion{task.id, Result<ExecutorOutput>{*setup_error},
                                          std::chrono::system_clock::now()});
    } else {
        batch.pool->submit([this, request, token = slot.stop.get_token()]() {
            Result<ExecutorOutput> output{Error{ErrorKind::Internal, "executor did not run"}};
            try {
                output = executor_.execute(request, token);
            } catch (const std::exception& e) {
                output = Error{ErrorKind::ExecutorFailure, std::string{"executor threw: "} + e.what()};
            } catch (...) {
                output = Error{ErrorKind::ExecutorFailure, "executor threw a non-standard exception"};
            }
            {
                std::lock_guard lock(mutex_);
                completions_.push_back(Completion{request.task_id, std::move(output),
                                                  std::chrono::system_clock::now()});
            }
            cv_.notify_all();
        });
    }

    batch.running.emplace(task.id, std::move(slot));
    batch.not_before.erase(task.id);

    size_t peak = peak_parallelism_.load();
    while (batch.running.size() > peak
           && !peak_parallelism_.compare_exchange_weak(peak, batch.running.size())) {
    }
}

// ─────────────────────────────────────────────
// Completion / Deadlines / Cancellation
// ─────────────────────────────────────────────

void ExecutionEngine::handle_completion(Batch& batch, Completion completion) {
    auto it = batch.running.find(completion.id);
    if (it == batch.running.end()) return;
    Slot slot = std::move(it->second);
    batch.running.erase(it);

    ExecutionResult result;
    result.task_id = completion.id;
    result.attempt = slot.attempt;
    result.start_time = slot.started;
    result.end_time = completion.finished;
    result.stdout_ref = slot.stdout_ref;
    result.stderr_ref = slot.stderr_ref;

    if (!completion.output) {
        result.status = slot.cancelled ? TaskStatus::Cancelled : TaskStatus::Failed;
        result.error_message = completion.output.error().describe();
    } else {
        const auto& out = *completion.output;
        result.exit_code = out.exit_code;
        if (slot.cancelled) {
            result.status = TaskStatus::Cancelled;
            result.error_message = std::string{kCancelledReason};
        } else if (slot.timed_out || out.timed_out) {
            result.status = TaskStatus::TimedOut;
            result.error_message = Error{ErrorKind::ExecutorTimeout,
                                         "attempt exceeded the per-task timeout"}.describe();
        } else if (out.exit_code == 0) {
            result.status = TaskStatus::Succeeded;
        } else {
            result.status = TaskStatus::Failed;
            std::string msg = "exit code " + std::to_string(out.exit_code);
            if (auto tail = last_line(out.stderr_text); !tail.empty()) msg += ": " + tail;
            result.error_message = Error{ErrorKind::ExecutorFailure, msg}.describe();
        }
    }

    if (audit_) audit_->record_attempt(result);
    if (result.status != TaskStatus::Cancelled) {
        breaker_.record(result.status == TaskStatus::Succeeded);
    }

    const bool retryable = result.status == TaskStatus::Failed || result.status == TaskStatus::TimedOut;
    const bool retry = retryable && result.attempt < options_.retry.max_attempts;

    if (auto finished = registry_.finish_attempt(result, retry); !finished) {
        logger_.log(LogLevel::Error, kComponent, finished.error().describe());
    }
    batch.results[result.task_id] = result;

    const std::string label = result.task_id + " attempt " + std::to_string(result.attempt)
                            + " " + std::string{to_string(result.status)};
    if (retry) {
        auto delay = backoff_delay(options_.retry, result.attempt);
        batch.not_before[result.task_id] = std::chrono::steady_clock::now() + delay;
        logger_.log(LogLevel::Warn, kComponent,
                    label + "; retrying in " + std::to_string(delay.count()) + "ms"
                    + (result.error_message ? " (" + *result.error_message + ")" : std::string{}));
        return;
    }

    std::erase(batch.pending, result.task_id);
    batch.not_before.erase(result.task_id);
    if (result.status == TaskStatus::Succeeded) {
        logger_.log(LogLevel::Info, kComponent, label);
    } else {
        logger_.log(LogLevel::Warn, kComponent,
                    label + (result.error_message ? ": " + *result.error_message : std::string{}));
    }
}

void ExecutionEngine::enforce_deadlines(Batch& batch) {
    const auto now = std::chrono::steady_clock::now();
    for (auto& [id, slot] : batch.running) {
        if (!slot.deadline || slot.timed_out || slot.cancelled) continue;
        if (now >= *slot.deadline) {
            slot.timed_out = true;
            slot.stop.request_stop();
            logger_.log(LogLevel::Warn, kComponent,
                        id + " attempt " + std::to_string(slot.attempt) + " timed out; terminating");
        }
    }
}

void ExecutionEngine::cancel_pending(Batch& batch) {
    batch.cancel_seen = true;
    for (auto& [id, slot] : batch.running) {
        if (slot.cancelled) continue;
        slot.cancelled = true;
        slot.stop.request_stop();
    }
    for (const auto& id : std::vector<TaskId>{batch.pending}) {
        if (!batch.running.contains(id)) {
            finish_without_running(batch, id, std::string{kCancelledReason});
        }
    }
}

void ExecutionEngine::finish_without_running(Batch& batch, const TaskId& id, const std::string& reason) {
    auto task = registry_.get(id);

    ExecutionResult result;
    result.task_id = id;
    result.attempt = task ? task->attempts : 0;
    result.status = TaskStatus::Cancelled;
    result.start_time = result.end_time = std::chrono::system_clock::now();
    result.error_message = reason;

    auto cancelled = registry_.cancel(id, reason, result);
    if (!cancelled) {
        logger_.log(LogLevel::Error, kComponent, cancelled.error().describe());
    }
    batch.results[id] = result;
    std::erase(batch.pending, id);
    batch.not_before.erase(id);
    logger_.log(LogLevel::Warn, kComponent, id + " cancelled: " + reason);
}

}  // namespace parallel_orchestrator
