/**
 * @file test_execution_engine.cpp
 * @brief Unit tests for the execution engine: parallelism bound, conflict
 *        exclusion, retry/backoff, timeout, cancellation and fallback.
 * @author Dimitris Kafetzis
 */

#include "executor/execution_engine.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <thread>

using namespace parallel_orchestrator;
namespace fs = std::filesystem;

namespace {

/**
 * @brief Scripted executor. Each task consumes one Step per attempt; the
 *        last step repeats once the script is exhausted.
 */
class FakeExecutor : public ITaskExecutor {
public:
    struct Step {
        int exit_code = 0;
        Duration delay{10};
        bool hang = false;              ///< Run until stopped
        bool fail_to_start = false;     ///< Return an error instead of an output
        std::string stderr_text;
    };

    struct Call {
        TaskId id;
        uint32_t attempt = 0;
        SteadyTime start;
        SteadyTime end;
        fs::path workspace;
        std::optional<fs::path> task_file;
    };

    void script(const TaskId& id, std::vector<Step> steps) {
        std::lock_guard lock(mutex_);
        scripts_[id] = std::move(steps);
    }

    Result<ExecutorOutput> execute(const ExecutionRequest& request, std::stop_token stop) override {
        Step step;
        Call call{request.task_id, request.attempt, std::chrono::steady_clock::now(), {},
                  request.workspace_path, request.task_file};
        {
            std::lock_guard lock(mutex_);
            auto& steps = scripts_[request.task_id];
            size_t& cursor = cursors_[request.task_id];
            if (!steps.empty()) step = steps[std::min(cursor, steps.size() - 1)];
            ++cursor;
            ++current_;
            peak_ = std::max(peak_, current_);
            if (!request.workspace_path.empty()) workspace_seen_ = fs::is_directory(request.workspace_path);
        }

        const auto until = std::chrono::steady_clock::now() + step.delay;
        while (!stop.stop_requested() && (step.hang || std::chrono::steady_clock::now() < until)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }

        call.end = std::chrono::steady_clock::now();
        {
            std::lock_guard lock(mutex_);
            --current_;
            calls_.push_back(call);
        }

        if (step.fail_to_start) return Error{ErrorKind::ExecutorFailure, "could not start"};
        ExecutorOutput out;
        out.cancelled = stop.stop_requested();
        out.exit_code = out.cancelled ? -1 : step.exit_code;
        out.stderr_text = step.stderr_text;
        return out;
    }

    std::string_view name() const noexcept override { return "fake"; }

    std::vector<Call> calls_for(const TaskId& id) const {
        std::lock_guard lock(mutex_);
        std::vector<Call> out;
        for (const auto& c : calls_) {
            if (c.id == id) out.push_back(c);
        }
        std::sort(out.begin(), out.end(), [](const Call& a, const Call& b) { return a.attempt < b.attempt; });
        return out;
    }

    size_t call_count() const {
        std::lock_guard lock(mutex_);
        return calls_.size();
    }

    int peak() const {
        std::lock_guard lock(mutex_);
        return peak_;
    }

    bool workspace_seen() const {
        std::lock_guard lock(mutex_);
        return workspace_seen_;
    }

private:
    mutable std::mutex mutex_;
    std::map<TaskId, std::vector<Step>> scripts_;
    std::map<TaskId, size_t> cursors_;
    std::vector<Call> calls_;
    int current_ = 0;
    int peak_ = 0;
    bool workspace_seen_ = false;
};

bool overlaps(const FakeExecutor::Call& a, const FakeExecutor::Call& b) {
    return a.start < b.end && b.start < a.end;
}

}  // anonymous namespace

class ExecutionEngineTest : public ::testing::Test {
protected:
    FakeExecutor executor_;
    ProcessRegistry registry_;
    ConflictMatrix conflicts_;
    std::shared_ptr<MemorySink::Buffer> log_lines_;
    std::unique_ptr<Logger> logger_;
    std::unique_ptr<AuditLog> audit_;
    EngineOptions options_;

    void SetUp() override {
        auto sink = std::make_unique<MemorySink>();
        log_lines_ = sink->buffer();
        logger_ = std::make_unique<Logger>(std::move(sink), LogLevel::Debug);
        audit_ = std::make_unique<AuditLog>(std::make_unique<NullSink>());

        options_.retry = RetryConfig{3, 5, 100};
        options_.poll_interval = Duration{10};
    }

    void add_task(const TaskId& id, std::vector<TaskId> deps = {}) {
        TaskModel t;
        t.id = id;
        t.name = id;
        t.description = "work on " + id;
        t.dependencies = std::move(deps);
        ASSERT_TRUE(registry_.register_task(std::move(t)).has_value());
    }

    void add_conflict(const TaskId& a, const TaskId& b) {
        ConflictDescriptor d;
        d.set(ConflictDimension::File);
        conflicts_.add(a, b, d);
    }

    std::unique_ptr<ExecutionEngine> make_engine(WorkspaceManager* workspaces = nullptr,
                                                 IResourceMonitor* monitor = nullptr) {
        return std::make_unique<ExecutionEngine>(options_, executor_, registry_, conflicts_,
                                                 *logger_, audit_.get(), workspaces, monitor);
    }

    bool logged(std::string_view needle) {
        std::lock_guard lock(log_lines_->mutex);
        return std::any_of(log_lines_->lines.begin(), log_lines_->lines.end(),
                           [&](const std::string& l) { return l.find(needle) != std::string::npos; });
    }
};

// ─── Backoff ─────────────────────────────────

TEST(BackoffTest, DoublesUpToTheCap) {
    RetryConfig retry{5, 1000, 60000};
    EXPECT_EQ(ExecutionEngine::backoff_delay(retry, 1), Duration{1000});
    EXPECT_EQ(ExecutionEngine::backoff_delay(retry, 2), Duration{2000});
    EXPECT_EQ(ExecutionEngine::backoff_delay(retry, 3), Duration{4000});
    EXPECT_EQ(ExecutionEngine::backoff_delay(retry, 10), Duration{60000});
    EXPECT_EQ(ExecutionEngine::backoff_delay(retry, 100), Duration{60000});
}

// ─── Basics ──────────────────────────────────

TEST_F(ExecutionEngineTest, AllTasksSucceed) {
    for (const char* id : {"a", "b", "c"}) add_task(id);
    auto engine = make_engine();

    auto results = engine->run({"a", "b", "c"}, 3, Duration{5000});
    ASSERT_TRUE(results.has_value()) << results.error().describe();
    ASSERT_EQ(results->size(), 3u);
    for (const auto& [id, r] : *results) {
        EXPECT_EQ(r.status, TaskStatus::Succeeded) << id;
        EXPECT_EQ(r.attempt, 1u);
        EXPECT_EQ(r.exit_code, 0);
        EXPECT_EQ(registry_.status(id), TaskStatus::Succeeded);
    }
    EXPECT_EQ(audit_->attempt_count(), 3u);
}

TEST_F(ExecutionEngineTest, RejectsZeroParallelismAndUnknownTasks) {
    add_task("a");
    auto engine = make_engine();

    auto zero = engine->run({"a"}, 0, Duration{1000});
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().kind, ErrorKind::InvalidArgument);

    auto unknown = engine->run({"missing"}, 1, Duration{1000});
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(ExecutionEngineTest, TerminalTasksAreSkipped) {
    add_task("a");
    auto engine = make_engine();
    ASSERT_TRUE(engine->run({"a"}, 1, Duration{5000}).has_value());
    ASSERT_EQ(executor_.call_count(), 1u);

    auto again = engine->run({"a"}, 1, Duration{5000});
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(executor_.call_count(), 1u);
    EXPECT_EQ(again->at("a").status, TaskStatus::Succeeded);
}

// ─── Parallelism and conflicts ───────────────

TEST_F(ExecutionEngineTest, NeverExceedsMaxParallel) {
    std::vector<TaskId> ids;
    for (int i = 0; i < 8; ++i) {
        ids.push_back("t" + std::to_string(i));
        add_task(ids.back());
        executor_.script(ids.back(), {{.exit_code = 0, .delay = Duration{30}}});
    }
    auto engine = make_engine();

    auto results = engine->run(ids, 2, Duration{5000});
    ASSERT_TRUE(results.has_value());
    EXPECT_LE(executor_.peak(), 2);
    EXPECT_EQ(engine->peak_parallelism(), 2u);
    EXPECT_EQ(executor_.call_count(), 8u);
}

TEST_F(ExecutionEngineTest, ConflictingTasksNeverOverlap) {
    for (const char* id : {"a", "b", "c"}) {
        add_task(id);
        executor_.script(id, {{.exit_code = 0, .delay = Duration{40}}});
    }
    add_conflict("a", "b");
    auto engine = make_engine();

    ASSERT_TRUE(engine->run({"a", "b", "c"}, 3, Duration{5000}).has_value());

    auto a = executor_.calls_for("a");
    auto b = executor_.calls_for("b");
    auto c = executor_.calls_for("c");
    ASSERT_EQ(a.size(), 1u);
    ASSERT_EQ(b.size(), 1u);
    ASSERT_EQ(c.size(), 1u);
    EXPECT_FALSE(overlaps(a[0], b[0]));
    EXPECT_TRUE(overlaps(a[0], c[0]));
}

TEST_F(ExecutionEngineTest, DependentStartsAfterDependencySucceeded) {
    add_task("base");
    add_task("next", {"base"});
    executor_.script("base", {{.exit_code = 0, .delay = Duration{30}}});
    auto engine = make_engine();

    ASSERT_TRUE(engine->run({"next", "base"}, 2, Duration{5000}).has_value());
    auto base = executor_.calls_for("base");
    auto next = executor_.calls_for("next");
    ASSERT_EQ(base.size(), 1u);
    ASSERT_EQ(next.size(), 1u);
    EXPECT_GE(next[0].start, base[0].end);
}

// ─── Retry and timeout ───────────────────────

TEST_F(ExecutionEngineTest, RetriesUpToMaxAttempts) {
    add_task("flaky");
    executor_.script("flaky", {{.exit_code = 2, .delay = Duration{1}, .stderr_text = "compile\nlink failed\n"}});
    auto engine = make_engine();

    auto results = engine->run({"flaky"}, 1, Duration{5000});
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(executor_.calls_for("flaky").size(), 3u);

    const auto& r = results->at("flaky");
    EXPECT_EQ(r.status, TaskStatus::Failed);
    EXPECT_EQ(r.attempt, 3u);
    EXPECT_EQ(r.error_message, "ExecutorFailure: exit code 2: link failed");

    auto task = registry_.get("flaky");
    EXPECT_EQ(task->status, TaskStatus::Failed);
    EXPECT_EQ(task->attempts, 3u);
    EXPECT_EQ(audit_->attempts("flaky").size(), 3u);
}

TEST_F(ExecutionEngineTest, RetrySucceedsOnSecondAttempt) {
    add_task("t");
    executor_.script("t", {{.exit_code = 1, .delay = Duration{1}}, {.exit_code = 0, .delay = Duration{1}}});
    auto engine = make_engine();

    auto results = engine->run({"t"}, 1, Duration{5000});
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(results->at("t").status, TaskStatus::Succeeded);
    EXPECT_EQ(results->at("t").attempt, 2u);
    EXPECT_EQ(registry_.get("t")->attempts, 2u);
}

TEST_F(ExecutionEngineTest, StartFailureCountsAsFailedAttempt) {
    add_task("t");
    executor_.script("t", {{.delay = Duration{0}, .fail_to_start = true}});
    options_.retry.max_attempts = 2;
    auto engine = make_engine();

    auto results = engine->run({"t"}, 1, Duration{5000});
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(results->at("t").status, TaskStatus::Failed);
    EXPECT_EQ(results->at("t").attempt, 2u);
    EXPECT_NE(results->at("t").error_message->find("could not start"), std::string::npos);
}

TEST_F(ExecutionEngineTest, TimeoutRetriesWithGrowingBackoffThenFails) {
    add_task("slow");
    executor_.script("slow", {{.hang = true}});
    options_.retry = RetryConfig{3, 50, 1000};
    auto engine = make_engine();

    auto results = engine->run({"slow"}, 1, Duration{100});
    ASSERT_TRUE(results.has_value());

    auto calls = executor_.calls_for("slow");
    ASSERT_EQ(calls.size(), 3u);
    // timeout + backoff(1) = 150ms, timeout + backoff(2) = 200ms
    EXPECT_GE(calls[1].start - calls[0].start, std::chrono::milliseconds(150));
    EXPECT_GE(calls[2].start - calls[1].start, std::chrono::milliseconds(200));

    const auto& r = results->at("slow");
    EXPECT_EQ(r.status, TaskStatus::TimedOut);
    EXPECT_EQ(r.error_message, "ExecutorTimeoutError: attempt exceeded the per-task timeout");
    EXPECT_EQ(registry_.status("slow"), TaskStatus::Failed);
}

// ─── Blocked dependencies ────────────────────

TEST_F(ExecutionEngineTest, FailedDependencyCancelsDependent) {
    add_task("base");
    add_task("next", {"base"});
    add_task("last", {"next"});
    executor_.script("base", {{.exit_code = 1, .delay = Duration{1}}});
    options_.retry.max_attempts = 1;
    auto engine = make_engine();

    auto results = engine->run({"base", "next", "last"}, 3, Duration{5000});
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(registry_.status("base"), TaskStatus::Failed);
    for (const char* id : {"next", "last"}) {
        auto task = registry_.get(id);
        EXPECT_EQ(task->status, TaskStatus::Cancelled) << id;
        EXPECT_EQ(task->status_reason, std::string{kBlockedDependencyFailed}) << id;
        EXPECT_EQ(task->attempts, 0u);
        EXPECT_TRUE(executor_.calls_for(id).empty());
    }
}

TEST_F(ExecutionEngineTest, DependencyOutsideTheBatchIsUnscheduled) {
    add_task("elsewhere");
    add_task("needs", {"elsewhere"});
    auto engine = make_engine();

    auto results = engine->run({"needs"}, 1, Duration{5000});
    ASSERT_TRUE(results.has_value());
    auto task = registry_.get("needs");
    EXPECT_EQ(task->status, TaskStatus::Cancelled);
    EXPECT_EQ(task->status_reason, "blocked-dependency-unscheduled");
    EXPECT_EQ(registry_.status("elsewhere"), TaskStatus::Queued);
}

TEST_F(ExecutionEngineTest, DependentListedFirstSeesBlockedDependency) {
    add_task("elsewhere");
    add_task("mid", {"elsewhere"});
    add_task("top", {"mid"});
    auto engine = make_engine();

    auto results = engine->run({"top", "mid"}, 2, Duration{5000});
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(registry_.get("mid")->status_reason, "blocked-dependency-unscheduled");

    auto top = registry_.get("top");
    EXPECT_EQ(top->status, TaskStatus::Cancelled);
    EXPECT_EQ(top->status_reason, std::string{kBlockedDependencyFailed});
    EXPECT_EQ(results->at("top").error_message, std::string{kBlockedDependencyFailed});
    EXPECT_EQ(executor_.call_count(), 0u);
}

// ─── Cancellation ────────────────────────────

TEST_F(ExecutionEngineTest, RepeatedCancelIsLoggedOnce) {
    add_task("a");
    executor_.script("a", {{.hang = true}});
    auto engine = make_engine();

    std::jthread canceller([&engine] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        engine->cancel();
        engine->cancel();
    });
    auto results = engine->run({"a"}, 1, Duration{60000});
    canceller.join();
    engine->cancel();

    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(registry_.status("a"), TaskStatus::Cancelled);
    EXPECT_EQ(executor_.call_count(), 1u);

    std::lock_guard lock(log_lines_->mutex);
    auto requested = std::count_if(log_lines_->lines.begin(), log_lines_->lines.end(), [](const std::string& l) {
        return l.find("cancellation requested") != std::string::npos;
    });
    EXPECT_EQ(requested, 1);
}

TEST_F(ExecutionEngineTest, CancelStopsRunningAndQueuedTasks) {
    for (const char* id : {"a", "b", "c", "d"}) {
        add_task(id);
        executor_.script(id, {{.hang = true}});
    }
    auto engine = make_engine();

    std::jthread canceller([&engine] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        engine->cancel();
    });

    auto started = std::chrono::steady_clock::now();
    auto results = engine->run({"a", "b", "c", "d"}, 2, Duration{60000});
    ASSERT_TRUE(results.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));

    for (const char* id : {"a", "b", "c", "d"}) {
        auto task = registry_.get(id);
        EXPECT_EQ(task->status, TaskStatus::Cancelled) << id;
        EXPECT_EQ(task->status_reason, "cancelled") << id;
    }
    EXPECT_EQ(executor_.call_count(), 2u);
    EXPECT_TRUE(engine->cancel_requested());

    // Cancellation is sticky
    add_task("later");
    auto later = engine->run({"later"}, 1, Duration{1000});
    ASSERT_TRUE(later.has_value());
    EXPECT_EQ(registry_.status("later"), TaskStatus::Cancelled);
}

// ─── Circuit breaker ─────────────────────────

TEST_F(ExecutionEngineTest, OpenCircuitFallsBackToSequential) {
    options_.retry.max_attempts = 1;
    options_.circuit_breaker = CircuitBreakerConfig{0.4, 10, 2, 60000};

    std::vector<TaskId> ids = {"f1", "f2", "s1", "s2", "s3", "s4"};
    for (const auto& id : ids) add_task(id);
    executor_.script("f1", {{.exit_code = 1, .delay = Duration{5}}});
    executor_.script("f2", {{.exit_code = 1, .delay = Duration{5}}});
    for (const char* id : {"s1", "s2", "s3", "s4"}) {
        executor_.script(id, {{.exit_code = 0, .delay = Duration{20}}});
    }
    auto engine = make_engine();

    ASSERT_TRUE(engine->run(ids, 2, Duration{5000}).has_value());
    EXPECT_EQ(engine->circuit_breaker().state(), CircuitState::Open);
    EXPECT_TRUE(logged("CircuitOpenError"));

    std::vector<FakeExecutor::Call> successes;
    for (const char* id : {"s1", "s2", "s3", "s4"}) {
        auto calls = executor_.calls_for(id);
        ASSERT_EQ(calls.size(), 1u);
        successes.push_back(calls[0]);
    }
    for (size_t i = 0; i < successes.size(); ++i) {
        for (size_t j = i + 1; j < successes.size(); ++j) {
            EXPECT_FALSE(overlaps(successes[i], successes[j])) << i << "," << j;
        }
    }
}

// ─── Resource pressure ───────────────────────

TEST_F(ExecutionEngineTest, CpuPressureHalvesParallelism) {
    std::vector<TaskId> ids;
    for (int i = 0; i < 6; ++i) {
        ids.push_back("t" + std::to_string(i));
        add_task(ids.back());
        executor_.script(ids.back(), {{.exit_code = 0, .delay = Duration{30}}});
    }
    MockMonitor monitor;
    monitor.set_cpu(97.0f);
    auto engine = make_engine(nullptr, &monitor);

    auto results = engine->run(ids, 4, Duration{5000});
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(engine->peak_parallelism(), 2u);
    EXPECT_EQ(executor_.call_count(), 6u);
    EXPECT_TRUE(logged("parallelism limited to 2"));
    EXPECT_GT(monitor.read_count(), 0u);
}

TEST_F(ExecutionEngineTest, MemoryPressureRunsSequentiallyUntilCleared) {
    std::vector<TaskId> ids;
    for (int i = 0; i < 8; ++i) {
        ids.push_back("t" + std::to_string(i));
        add_task(ids.back());
        executor_.script(ids.back(), {{.exit_code = 0, .delay = Duration{40}}});
    }
    MockMonitor monitor;
    monitor.set_memory(512ULL * 1024 * 1024, 8ULL * 1024 * 1024 * 1024);
    auto engine = make_engine(nullptr, &monitor);

    std::jthread relief([&monitor] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        monitor.set_memory(6ULL * 1024 * 1024 * 1024, 8ULL * 1024 * 1024 * 1024);
    });

    auto results = engine->run(ids, 3, Duration{5000});
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(executor_.call_count(), 8u);
    EXPECT_TRUE(logged("parallelism limited to 1"));
    EXPECT_TRUE(logged("resource pressure cleared"));

    auto first = executor_.calls_for("t0");
    auto second = executor_.calls_for("t1");
    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_FALSE(overlaps(first[0], second[0]));
    EXPECT_GE(engine->peak_parallelism(), 2u);
}

TEST_F(ExecutionEngineTest, MonitorWithoutSampleDoesNotThrottle) {
    for (const char* id : {"a", "b"}) {
        add_task(id);
        executor_.script(id, {{.exit_code = 0, .delay = Duration{100}}});
    }
    MockMonitor monitor;
    monitor.set_unavailable(true);
    auto engine = make_engine(nullptr, &monitor);

    ASSERT_TRUE(engine->run({"a", "b"}, 2, Duration{5000}).has_value());
    EXPECT_EQ(engine->peak_parallelism(), 2u);
    EXPECT_FALSE(logged("resource pressure"));
}

// ─── Workspaces and output ───────────────────

TEST_F(ExecutionEngineTest, RunsInsideFreshWorkspacePerAttempt) {
    auto dir = fs::temp_directory_path() / "po_test_engine";
    fs::remove_all(dir);
    fs::create_directories(dir / "source");
    std::ofstream(dir / "source" / "file.txt") << "x\n";

    WorkspaceConfig wcfg;
    wcfg.backend = "directory";
    wcfg.repository = dir / "source";
    wcfg.root = dir / "worktrees";
    auto backend = make_workspace_backend(wcfg);
    ASSERT_TRUE(backend.has_value());
    WorkspaceManager workspaces(wcfg, std::move(*backend));

    options_.output_dir = dir / "logs";
    add_task("w");
    executor_.script("w", {{.exit_code = 1, .delay = Duration{1}}, {.exit_code = 0, .delay = Duration{1}}});
    auto engine = make_engine(&workspaces);

    auto results = engine->run({"w"}, 1, Duration{5000});
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(results->at("w").status, TaskStatus::Succeeded);
    EXPECT_TRUE(executor_.workspace_seen());

    auto calls = executor_.calls_for("w");
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[1].workspace.string(), workspaces.path_for("w").string());
    ASSERT_TRUE(calls[1].task_file.has_value());
    EXPECT_TRUE(fs::exists(*calls[1].task_file));
    EXPECT_EQ(results->at("w").stdout_ref, (dir / "logs" / "w.2.out").string());
    EXPECT_EQ(registry_.get("w")->workspace_ref, workspaces.path_for("w").string());

    fs::remove_all(dir);
}

TEST_F(ExecutionEngineTest, RelativeConfigPathsReachExecutorAbsolute) {
    auto dir = fs::temp_directory_path() / "po_test_engine_relative";
    fs::remove_all(dir);
    fs::create_directories(dir / "source");
    const auto previous = fs::current_path();
    fs::current_path(dir);

    WorkspaceConfig wcfg;
    wcfg.backend = "directory";
    wcfg.repository = "source";
    wcfg.root = ".worktrees";
    auto backend = make_workspace_backend(wcfg);
    ASSERT_TRUE(backend.has_value());
    WorkspaceManager workspaces(wcfg, std::move(*backend));

    options_.output_dir = ".orchestrator/run-1/logs";
    add_task("r");
    auto engine = make_engine(&workspaces);
    auto results = engine->run({"r"}, 1, Duration{5000});
    fs::current_path(previous);

    ASSERT_TRUE(results.has_value());
    auto calls = executor_.calls_for("r");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_TRUE(calls[0].workspace.is_absolute());
    EXPECT_EQ(calls[0].workspace.string(), (dir / ".worktrees" / "r").string());
    ASSERT_TRUE(calls[0].task_file.has_value());
    EXPECT_TRUE(calls[0].task_file->is_absolute());
    EXPECT_TRUE(fs::path{results->at("r").stdout_ref}.is_absolute());

    fs::remove_all(dir);
}

TEST_F(ExecutionEngineTest, WorkspaceFailureCountsAsAttempt) {
    auto dir = fs::temp_directory_path() / "po_test_engine_missing";
    fs::remove_all(dir);

    WorkspaceConfig wcfg;
    wcfg.backend = "directory";
    wcfg.repository = dir / "does-not-exist";
    wcfg.root = dir / "worktrees";
    auto backend = make_workspace_backend(wcfg);
    ASSERT_TRUE(backend.has_value());
    WorkspaceManager workspaces(wcfg, std::move(*backend));

    options_.retry.max_attempts = 2;
    add_task("w");
    auto engine = make_engine(&workspaces);

    auto results = engine->run({"w"}, 1, Duration{5000});
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(results->at("w").status, TaskStatus::Failed);
    EXPECT_EQ(registry_.get("w")->attempts, 2u);
    EXPECT_EQ(executor_.call_count(), 0u);
    EXPECT_NE(results->at("w").error_message->find("VersionControlError"), std::string::npos);

    fs::remove_all(dir);
}
