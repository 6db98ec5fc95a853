/**
 * @file process_registry.cpp
 * @brief ProcessRegistry implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/process_registry.hpp"

namespace parallel_orchestrator {

namespace {

Error bad_transition(const TaskId& id, TaskStatus from, std::string_view to) {
    return Error{ErrorKind::InvalidArgument,
                 "task '" + id + "': illegal transition " + std::string{to_string(from)}
                 + " -> " + std::string{to}};
}

}  // anonymous namespace

Result<void> ProcessRegistry::register_task(TaskModel task) {
    {
        std::lock_guard lock(mutex_);
        if (tasks_.contains(task.id)) {
            return Error{ErrorKind::InvalidArgument, "task '" + task.id + "' already registered"};
        }
        tasks_.emplace(task.id, std::move(task));
        ++version_;
    }
    changed_.notify_all();
    return Result<void>{};
}

void ProcessRegistry::set_observer(Observer observer) {
    std::lock_guard lock(observer_mutex_);
    observer_ = std::move(observer);
}

void ProcessRegistry::notify(const TaskModel& task, TaskStatus previous) {
    changed_.notify_all();
    Observer observer;
    {
        std::lock_guard lock(observer_mutex_);
        observer = observer_;
    }
    if (observer) observer(task, previous);
}

// ─────────────────────────────────────────────
// Transitions
// ─────────────────────────────────────────────

Result<uint32_t> ProcessRegistry::mark_running(const TaskId& id, std::optional<std::string> workspace_ref) {
    TaskModel copy;
    TaskStatus previous;
    {
        std::lock_guard lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            return Error{ErrorKind::InvalidArgument, "unknown task '" + id + "'"};
        }
        auto& task = it->second;
        if (task.status != TaskStatus::Queued) {
            return bad_transition(id, task.status, "running");
        }
        previous = task.status;
        task.status = TaskStatus::Running;
        task.status_reason.reset();
        ++task.attempts;
        if (workspace_ref) task.workspace_ref = std::move(workspace_ref);
        ++version_;
        copy = task;
    }
    notify(copy, previous);
    return copy.attempts;
}

Result<void> ProcessRegistry::finish_attempt(const ExecutionResult& result, bool retry) {
    TaskModel copy;
    TaskStatus previous;
    {
        std::lock_guard lock(mutex_);
        auto it = tasks_.find(result.task_id);
        if (it == tasks_.end()) {
            return Error{ErrorKind::InvalidArgument, "unknown task '" + result.task_id + "'"};
        }
        auto& task = it->second;
        if (task.status != TaskStatus::Running) {
            return bad_transition(task.id, task.status, to_string(result.status));
        }
        previous = task.status;
        task.result = result;
        if (retry) {
            task.status = TaskStatus::Queued;
        } else if (result.status == TaskStatus::TimedOut) {
            task.status = TaskStatus::Failed;
        } else {
            task.status = result.status;
        }
        task.status_reason = result.error_message;
        ++version_;
        copy = task;
    }
    notify(copy, previous);
    return Result<void>{};
}

Result<bool> ProcessRegistry::cancel(const TaskId& id, std::string reason,
                                     std::optional<ExecutionResult> result) {
    TaskModel copy;
    TaskStatus previous;
    {
        std::lock_guard lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            return Error{ErrorKind::InvalidArgument, "unknown task '" + id + "'"};
        }
        auto& task = it->second;
        if (is_terminal(task.status)) return false;

        previous = task.status;
        task.status = TaskStatus::Cancelled;
        task.status_reason = std::move(reason);
        if (result) task.result = std::move(result);
        ++version_;
        copy = task;
    }
    notify(copy, previous);
    return true;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::optional<TaskModel> ProcessRegistry::get(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

std::optional<TaskStatus> ProcessRegistry::status(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second.status;
}

bool ProcessRegistry::contains(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    return tasks_.contains(id);
}

std::vector<TaskModel> ProcessRegistry::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<TaskModel> out;
    out.reserve(tasks_.size());
    for (const auto& [_, task] : tasks_) out.push_back(task);
    return out;
}

std::vector<TaskId> ProcessRegistry::running() const {
    std::lock_guard lock(mutex_);
    std::vector<TaskId> out;
    for (const auto& [id, task] : tasks_) {
        if (task.status == TaskStatus::Running) out.push_back(id);
    }
    return out;
}

size_t ProcessRegistry::running_count() const {
    std::lock_guard lock(mutex_);
    size_t n = 0;
    for (const auto& [_, task] : tasks_) {
        if (task.status == TaskStatus::Running) ++n;
    }
    return n;
}

size_t ProcessRegistry::size() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

bool ProcessRegistry::wait_for_change(Duration timeout) {
    std::unique_lock lock(mutex_);
    const auto seen = version_;
    return changed_.wait_for(lock, timeout, [&] { return version_ != seen; });
}

}  // namespace parallel_orchestrator
