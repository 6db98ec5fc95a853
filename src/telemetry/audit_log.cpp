/**
 * @file audit_log.cpp
 * @brief AuditLog implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/audit_log.hpp"

#include <chrono>
#include <sstream>

namespace parallel_orchestrator {

AuditLog::AuditLog(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void AuditLog::record_attempt(const ExecutionResult& result) {
    std::ostringstream oss;
    oss << R"(,"task":")" << json_escape(result.task_id) << "\""
        << R"(,"attempt":)" << result.attempt
        << R"(,"status":")" << to_string(result.status) << "\""
        << R"(,"exit_code":)" << result.exit_code
        << R"(,"duration_ms":)" << result.duration().count()
        << R"(,"stdout":")" << json_escape(result.stdout_ref) << "\""
        << R"(,"stderr":")" << json_escape(result.stderr_ref) << "\"";
    if (result.error_message) {
        oss << R"(,"error":")" << json_escape(*result.error_message) << "\"";
    }

    {
        std::lock_guard lock(mutex_);
        attempts_[result.task_id].push_back(result);
    }
    emit("attempt_finished", oss.str());
}

void AuditLog::record_state_change(const TaskId& id, TaskStatus from, TaskStatus to,
                                   std::string_view reason) {
    std::ostringstream oss;
    oss << R"(,"task":")" << json_escape(id) << "\""
        << R"(,"from":")" << to_string(from) << "\""
        << R"(,"to":")" << to_string(to) << "\"";
    if (!reason.empty()) {
        oss << R"(,"reason":")" << json_escape(reason) << "\"";
    }
    emit("task_state_change", oss.str());
}

void AuditLog::record_plan(const RunId& run_id, const std::vector<std::vector<TaskId>>& groups,
                           size_t conflict_count) {
    std::ostringstream oss;
    oss << R"(,"run":")" << json_escape(run_id) << "\""
        << R"(,"conflicts":)" << conflict_count
        << R"(,"groups":[)";
    for (size_t g = 0; g < groups.size(); ++g) {
        if (g > 0) oss << ',';
        oss << '[';
        for (size_t i = 0; i < groups[g].size(); ++i) {
            if (i > 0) oss << ',';
            oss << '"' << json_escape(groups[g][i]) << '"';
        }
        oss << ']';
    }
    oss << ']';
    emit("plan_computed", oss.str());
}

void AuditLog::record_checkpoint(const RunId& run_id, uint64_t sequence, std::string_view phase,
                                 bool ok, std::string_view message) {
    std::ostringstream oss;
    oss << R"(,"run":")" << json_escape(run_id) << "\""
        << R"(,"sequence":)" << sequence
        << R"(,"phase":")" << phase << "\""
        << R"(,"ok":)" << (ok ? "true" : "false");
    if (!message.empty()) {
        oss << R"(,"error":")" << json_escape(message) << "\"";
    }
    emit("checkpoint_written", oss.str());
}

void AuditLog::record_circuit_change(std::string_view from, std::string_view to, double failure_rate) {
    std::ostringstream oss;
    oss << R"(,"from":")" << from << "\""
        << R"(,"to":")" << to << "\""
        << R"(,"failure_rate":)" << failure_rate;
    emit("circuit_state_change", oss.str());
}

void AuditLog::record_workspace_event(const TaskId& id, std::string_view event, std::string_view detail) {
    std::ostringstream oss;
    oss << R"(,"task":")" << json_escape(id) << "\""
        << R"(,"action":")" << json_escape(event) << "\""
        << R"(,"detail":")" << json_escape(detail) << "\"";
    emit("workspace_event", oss.str());
}

std::vector<ExecutionResult> AuditLog::attempts(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    auto it = attempts_.find(id);
    if (it == attempts_.end()) return {};
    return it->second;
}

size_t AuditLog::attempt_count() const {
    std::lock_guard lock(mutex_);
    size_t total = 0;
    for (const auto& [_, list] : attempts_) total += list.size();
    return total;
}

void AuditLog::emit(std::string_view event, std::string_view fields) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"ts":")" << format_timestamp(std::chrono::system_clock::now()) << "\""
        << fields << "}";

    std::lock_guard lock(mutex_);
    sink_->write(oss.str());
}

void AuditLog::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

}  // namespace parallel_orchestrator
