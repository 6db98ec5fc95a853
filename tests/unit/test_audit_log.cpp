/**
 * @file test_audit_log.cpp
 * @brief Unit tests for the NDJSON audit trail.
 * @author Dimitris Kafetzis
 */

#include "telemetry/audit_log.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

using namespace parallel_orchestrator;

class AuditLogTest : public ::testing::Test {
protected:
    std::shared_ptr<MemorySink::Buffer> lines_;
    std::unique_ptr<AuditLog> audit_;

    void SetUp() override {
        auto sink = std::make_unique<MemorySink>();
        lines_ = sink->buffer();
        audit_ = std::make_unique<AuditLog>(std::move(sink));
    }

    std::vector<std::string> lines() {
        std::lock_guard lock(lines_->mutex);
        return lines_->lines;
    }

    static ExecutionResult attempt(const TaskId& id, uint32_t n, TaskStatus status, int64_t ms) {
        ExecutionResult r;
        r.task_id = id;
        r.attempt = n;
        r.status = status;
        r.start_time = Timestamp{std::chrono::milliseconds{1000}};
        r.end_time = r.start_time + std::chrono::milliseconds{ms};
        r.exit_code = status == TaskStatus::Succeeded ? 0 : 1;
        if (status != TaskStatus::Succeeded) r.error_message = "ExecutorFailure: exit code 1";
        return r;
    }
};

TEST_F(AuditLogTest, KeepsEveryAttemptInOrder) {
    audit_->record_attempt(attempt("a", 1, TaskStatus::Failed, 100));
    audit_->record_attempt(attempt("b", 1, TaskStatus::Succeeded, 50));
    audit_->record_attempt(attempt("a", 2, TaskStatus::Succeeded, 200));

    auto history = audit_->attempts("a");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].attempt, 1u);
    EXPECT_EQ(history[0].status, TaskStatus::Failed);
    EXPECT_EQ(history[1].attempt, 2u);
    EXPECT_EQ(audit_->attempt_count(), 3u);
    EXPECT_TRUE(audit_->attempts("zzz").empty());
}

TEST_F(AuditLogTest, AttemptRecordFields) {
    audit_->record_attempt(attempt("task \"q\"", 1, TaskStatus::Failed, 1500));

    auto out = lines();
    ASSERT_EQ(out.size(), 1u);
    const auto& line = out[0];
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find(R"("event":"attempt_finished")"), std::string::npos);
    EXPECT_NE(line.find(R"("task":"task \"q\"")"), std::string::npos);
    EXPECT_NE(line.find(R"("status":"failed")"), std::string::npos);
    EXPECT_NE(line.find(R"("duration_ms":1500)"), std::string::npos);
    EXPECT_NE(line.find(R"("error":"ExecutorFailure: exit code 1")"), std::string::npos);
}

TEST_F(AuditLogTest, RunLevelEvents) {
    audit_->record_plan("run-1", {{"a"}, {"b", "c"}}, 1);
    audit_->record_state_change("a", TaskStatus::Queued, TaskStatus::Cancelled, kBlockedDependencyFailed);
    audit_->record_checkpoint("run-1", 4, "executing", false, "disk full");
    audit_->record_circuit_change("closed", "open", 0.75);
    audit_->record_workspace_event("a", "created", "/tmp/ws/a");

    auto out = lines();
    ASSERT_EQ(out.size(), 5u);
    EXPECT_NE(out[0].find(R"("groups":[["a"],["b","c"]])"), std::string::npos);
    EXPECT_NE(out[1].find(R"("reason":"blocked-dependency-failed")"), std::string::npos);
    EXPECT_NE(out[2].find(R"("ok":false)"), std::string::npos);
    EXPECT_NE(out[2].find(R"("error":"disk full")"), std::string::npos);
    EXPECT_NE(out[3].find(R"("event":"circuit_state_change")"), std::string::npos);
    EXPECT_NE(out[4].find(R"("action":"created")"), std::string::npos);
}
