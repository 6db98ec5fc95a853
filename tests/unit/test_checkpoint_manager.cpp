/**
 * @file test_checkpoint_manager.cpp
 * @brief Unit tests for run checkpoints: persistence, recovery and discovery.
 * @author Dimitris Kafetzis
 */

#include "state/checkpoint_manager.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace parallel_orchestrator;
namespace fs = std::filesystem;

class CheckpointManagerTest : public ::testing::Test {
protected:
    fs::path temp_dir_;

    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() / "po_test_checkpoint";
        fs::remove_all(temp_dir_);
    }

    void TearDown() override {
        fs::remove_all(temp_dir_);
    }

    static WorkflowState make_state(const RunId& run_id) {
        WorkflowState state;
        state.run_id = run_id;
        state.phase = RunPhase::Executing;
        state.current_group = 1;
        state.inputs = {"tasks/a.md", "tasks/b.toml"};

        TaskModel done;
        done.id = "task-01-done";
        done.name = "done";
        done.description = "Finished work\nwith two lines and \"quotes\"";
        done.footprint.target_files = {"src/a.cpp"};
        done.footprint.exclusive_resources = {"db"};
        done.complexity = Complexity::Medium;
        done.complexity_score = 5.5;
        done.estimated_duration = Duration{1200000};
        done.status = TaskStatus::Succeeded;
        done.attempts = 2;
        done.workspace_ref = ".worktrees/task-01-done";
        ExecutionResult r;
        r.task_id = done.id;
        r.attempt = 2;
        r.status = TaskStatus::Succeeded;
        r.start_time = Timestamp{std::chrono::milliseconds{1700000000000}};
        r.end_time = Timestamp{std::chrono::milliseconds{1700000004500}};
        r.exit_code = 0;
        r.stdout_ref = "logs/task-01-done.2.out";
        done.result = r;

        TaskModel part;
        part.id = "task-02-big.1";
        part.name = "big (part 1/2)";
        part.description = "First half";
        part.parent = "task-02-big";
        part.dependencies = {"task-01-done"};

        TaskModel blocked;
        blocked.id = "task-03-blocked";
        blocked.name = "blocked";
        blocked.description = "Never ran";
        blocked.status = TaskStatus::Cancelled;
        blocked.status_reason = std::string{kBlockedDependencyFailed};

        state.tasks = {done, part, blocked};
        state.groups = {{"task-01-done"}, {"task-02-big.1", "task-03-blocked"}};

        ConflictDescriptor d;
        d.set(ConflictDimension::File);
        d.set(ConflictDimension::State);
        state.conflicts.add("task-01-done", "task-03-blocked", d);
        return state;
    }

    void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }
};

TEST_F(CheckpointManagerTest, SaveAndLoadPreservesState) {
    CheckpointManager mgr(temp_dir_);
    auto state = make_state("run-a");

    ASSERT_TRUE(mgr.save(state).has_value());
    EXPECT_EQ(state.sequence, 1u);
    EXPECT_NE(state.created_at, Timestamp{});
    EXPECT_TRUE(fs::exists(mgr.path_for("run-a")));

    auto loaded = mgr.load("run-a");
    ASSERT_TRUE(loaded.has_value()) << loaded.error().describe();
    EXPECT_EQ(loaded->run_id, "run-a");
    EXPECT_EQ(loaded->sequence, 1u);
    EXPECT_EQ(loaded->phase, RunPhase::Executing);
    EXPECT_EQ(loaded->current_group, 1u);
    EXPECT_EQ(loaded->inputs, state.inputs);
    EXPECT_EQ(loaded->groups, state.groups);
    EXPECT_EQ(loaded->conflicts, state.conflicts);
    ASSERT_EQ(loaded->tasks.size(), 3u);

    const auto* done = loaded->find("task-01-done");
    ASSERT_NE(done, nullptr);
    EXPECT_EQ(done->description, "Finished work\nwith two lines and \"quotes\"");
    EXPECT_EQ(done->footprint.target_files, std::vector<std::string>{"src/a.cpp"});
    EXPECT_EQ(done->footprint.exclusive_resources, std::vector<std::string>{"db"});
    EXPECT_EQ(done->complexity, Complexity::Medium);
    EXPECT_DOUBLE_EQ(done->complexity_score, 5.5);
    EXPECT_EQ(done->estimated_duration, Duration{1200000});
    EXPECT_EQ(done->status, TaskStatus::Succeeded);
    EXPECT_EQ(done->attempts, 2u);
    EXPECT_EQ(done->workspace_ref, ".worktrees/task-01-done");
    ASSERT_TRUE(done->result.has_value());
    EXPECT_EQ(done->result->duration(), Duration{4500});
    EXPECT_EQ(done->result->stdout_ref, "logs/task-01-done.2.out");

    const auto* part = loaded->find("task-02-big.1");
    ASSERT_NE(part, nullptr);
    EXPECT_EQ(part->parent, "task-02-big");
    EXPECT_EQ(part->dependencies, std::vector<TaskId>{"task-01-done"});
    EXPECT_FALSE(part->result.has_value());

    EXPECT_EQ(loaded->find("task-03-blocked")->status_reason, std::string{kBlockedDependencyFailed});
}

TEST_F(CheckpointManagerTest, SequenceGrowsWithEverySave) {
    CheckpointManager mgr(temp_dir_);
    auto state = make_state("run-a");
    for (int i = 0; i < 3; ++i) ASSERT_TRUE(mgr.save(state).has_value());

    auto loaded = mgr.load("run-a");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->sequence, 3u);
    EXPECT_GE(loaded->updated_at, loaded->created_at);

    // No temporary files are left behind
    size_t files = 0;
    for (const auto& entry : fs::directory_iterator(temp_dir_)) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(CheckpointManagerTest, LoadRecoversInterruptedAttempts) {
    CheckpointManager mgr(temp_dir_, 3);
    auto state = make_state("run-a");
    state.tasks[1].status = TaskStatus::Running;
    state.tasks[1].attempts = 1;
    ASSERT_TRUE(mgr.save(state).has_value());

    auto loaded = mgr.load("run-a");
    ASSERT_TRUE(loaded.has_value());
    const auto* task = loaded->find("task-02-big.1");
    EXPECT_EQ(task->status, TaskStatus::Queued);
    EXPECT_EQ(task->attempts, 1u);
    EXPECT_EQ(task->status_reason, std::string{CheckpointManager::kInterruptedReason});
    ASSERT_TRUE(task->result.has_value());
    EXPECT_EQ(task->result->status, TaskStatus::Failed);

    // Terminal tasks are untouched
    EXPECT_EQ(loaded->find("task-01-done")->status, TaskStatus::Succeeded);
}

TEST_F(CheckpointManagerTest, InterruptedAttemptWithoutBudgetEndsFailed) {
    auto state = make_state("run-a");
    state.tasks[1].status = TaskStatus::Running;
    state.tasks[1].attempts = 3;

    EXPECT_EQ(CheckpointManager::recover_interrupted(state, 3), 1u);
    EXPECT_EQ(state.tasks[1].status, TaskStatus::Failed);
    EXPECT_EQ(CheckpointManager::recover_interrupted(state, 3), 0u);
}

TEST_F(CheckpointManagerTest, LoadMissingRunIsError) {
    CheckpointManager mgr(temp_dir_);
    auto loaded = mgr.load("nope");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().kind, ErrorKind::CheckpointIO);
}

TEST_F(CheckpointManagerTest, RejectsMalformedAndUnknownSchema) {
    auto garbage = CheckpointManager::parse("this is [not toml", "garbage");
    ASSERT_FALSE(garbage.has_value());
    EXPECT_EQ(garbage.error().kind, ErrorKind::CheckpointIO);

    auto future = CheckpointManager::parse("schema_version = 99\nrun_id = \"r\"\nphase = \"executing\"\n", "future");
    ASSERT_FALSE(future.has_value());
    EXPECT_NE(future.error().message.find("schema_version"), std::string::npos);

    auto no_phase = CheckpointManager::parse("schema_version = 1\nrun_id = \"r\"\nphase = \"sleeping\"\n", "bad");
    EXPECT_FALSE(no_phase.has_value());
}

TEST_F(CheckpointManagerTest, DetectResumableRuns) {
    auto sink = std::make_unique<MemorySink>();
    auto lines = sink->buffer();
    Logger logger(std::move(sink), LogLevel::Debug);
    CheckpointManager mgr(temp_dir_, 3, &logger);

    auto b = make_state("run-b");
    auto a = make_state("run-a");
    auto done = make_state("run-c");
    done.phase = RunPhase::Completed;
    auto failed = make_state("run-d");
    failed.phase = RunPhase::Failed;
    for (auto* s : {&b, &a, &done, &failed}) ASSERT_TRUE(mgr.save(*s).has_value());
    write_file(temp_dir_ / "broken.toml", "schema_version = [");
    write_file(temp_dir_ / "notes.txt", "ignored");

    auto runs = mgr.detect_resumable_runs();
    ASSERT_TRUE(runs.has_value());
    EXPECT_EQ(*runs, (std::vector<RunId>{"run-a", "run-b", "run-d"}));

    std::lock_guard lock(lines->mutex);
    ASSERT_EQ(lines->lines.size(), 1u);
    EXPECT_NE(lines->lines[0].find("broken.toml"), std::string::npos);
}

TEST_F(CheckpointManagerTest, NoDirectoryMeansNoRuns) {
    CheckpointManager mgr(temp_dir_ / "absent");
    auto runs = mgr.detect_resumable_runs();
    ASSERT_TRUE(runs.has_value());
    EXPECT_TRUE(runs->empty());
}

TEST_F(CheckpointManagerTest, Remove) {
    CheckpointManager mgr(temp_dir_);
    auto state = make_state("run-a");
    ASSERT_TRUE(mgr.save(state).has_value());

    auto first = mgr.remove("run-a");
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(*first);
    auto second = mgr.remove("run-a");
    ASSERT_TRUE(second.has_value());
    EXPECT_FALSE(*second);
}

TEST_F(CheckpointManagerTest, UnwritableDirectoryIsCheckpointError) {
    write_file(temp_dir_ / "file", "x");
    CheckpointManager mgr(temp_dir_ / "file" / "sub");
    auto state = make_state("run-a");
    auto saved = mgr.save(state);
    ASSERT_FALSE(saved.has_value());
    EXPECT_EQ(saved.error().kind, ErrorKind::CheckpointIO);
}
