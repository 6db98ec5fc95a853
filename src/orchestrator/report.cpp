/**
 * @file report.cpp
 * @brief RunReport construction and text rendering.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/report.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>

namespace parallel_orchestrator {

namespace {

std::string pad(std::string text, size_t width) {
    if (text.size() > width) {
        text.resize(width - 1);
        text += '~';
    }
    text.append(width - text.size(), ' ');
    return text;
}

std::string format_seconds(Duration d) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1fs", static_cast<double>(d.count()) / 1000.0);
    return buf;
}

}  // anonymous namespace

bool RunReport::all_succeeded() const noexcept {
    if (failure) return false;
    return std::all_of(tasks.begin(), tasks.end(),
                       [](const TaskReport& t) { return t.status == TaskStatus::Succeeded; });
}

size_t RunReport::count(TaskStatus status) const noexcept {
    return static_cast<size_t>(std::count_if(tasks.begin(), tasks.end(),
                                             [status](const TaskReport& t) { return t.status == status; }));
}

const TaskReport* RunReport::find(const TaskId& id) const {
    auto it = std::find_if(tasks.begin(), tasks.end(), [&](const TaskReport& t) { return t.id == id; });
    return it == tasks.end() ? nullptr : &*it;
}

RunReport RunReport::build(const RunId& run_id, RunPhase phase,
                           const std::vector<TaskModel>& tasks,
                           const std::vector<std::vector<TaskId>>& groups,
                           size_t conflict_count,
                           const AuditLog* audit) {
    RunReport report;
    report.run_id = run_id;
    report.phase = phase;
    report.groups = groups;
    report.conflict_count = conflict_count;

    for (const auto& task : tasks) {
        TaskReport line;
        line.id = task.id;
        line.name = task.name;
        line.status = task.status;
        line.attempts = task.attempts;

        auto history = audit ? audit->attempts(task.id) : std::vector<ExecutionResult>{};
        if (!history.empty()) {
            for (const auto& attempt : history) line.duration += attempt.duration();
        } else if (task.result) {
            line.duration = task.result->duration();
        }

        if (task.status != TaskStatus::Succeeded) {
            if (task.status_reason) line.error = task.status_reason;
            else if (task.result && task.result->error_message) line.error = task.result->error_message;
        }
        report.tasks.push_back(std::move(line));
    }
    return report;
}

std::string RunReport::render() const {
    std::ostringstream out;
    out << "Run " << run_id << " (" << to_string(phase) << ")\n";
    out << pad("TASK", 36) << pad("STATUS", 11) << pad("ATTEMPTS", 9) << pad("DURATION", 10) << "ERROR\n";
    for (const auto& t : tasks) {
        out << pad(t.id, 36)
            << pad(std::string{to_string(t.status)}, 11)
            << pad(std::to_string(t.attempts), 9)
            << pad(format_seconds(t.duration), 10)
            << t.error.value_or("-") << '\n';
    }
    out << count(TaskStatus::Succeeded) << " succeeded, "
        << count(TaskStatus::Failed) << " failed, "
        << count(TaskStatus::Cancelled) << " cancelled of " << tasks.size() << " task(s)\n";
    if (!checkpoint_ok) {
        out << "WARNING: checkpoint writes failed; this run cannot be resumed\n";
    }
    if (failure) {
        out << "Run failed: " << failure->describe() << '\n';
    }
    return out.str();
}

std::string render_plan(const std::vector<TaskModel>& tasks,
                        const std::vector<std::vector<TaskId>>& groups,
                        const ConflictMatrix& conflicts) {
    auto find = [&](const TaskId& id) -> const TaskModel* {
        auto it = std::find_if(tasks.begin(), tasks.end(), [&](const TaskModel& t) { return t.id == id; });
        return it == tasks.end() ? nullptr : &*it;
    };

    std::ostringstream out;
    out << tasks.size() << " task(s) in " << groups.size() << " group(s)\n";
    for (size_t g = 0; g < groups.size(); ++g) {
        out << "Group " << (g + 1) << ":\n";
        for (const auto& id : groups[g]) {
            out << "  " << id;
            if (const auto* task = find(id)) {
                out << "  [" << to_string(task->complexity) << ", ~"
                    << task->estimated_duration.count() / 60000 << "m]";
                if (!task->dependencies.empty()) {
                    out << " after";
                    for (const auto& dep : task->dependencies) out << ' ' << dep;
                }
            }
            out << '\n';
        }
    }
    if (!conflicts.empty()) {
        out << "Conflicts:\n";
        for (const auto& [pair, descriptor] : conflicts.entries()) {
            out << "  " << pair.first << " <-> " << pair.second
                << " (" << descriptor.describe() << ")\n";
        }
    }
    return out.str();
}

}  // namespace parallel_orchestrator
