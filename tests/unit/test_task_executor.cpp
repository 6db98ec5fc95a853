/**
 * @file test_task_executor.cpp
 * @brief Unit tests for the process and container executors.
 * @author Dimitris Kafetzis
 */

#include "executor/task_executor.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace parallel_orchestrator;
namespace fs = std::filesystem;

static ExecutionRequest make_request(const fs::path& workspace) {
    ExecutionRequest req;
    req.task_id = "task-01-x";
    req.name = "x";
    req.description = "Add {task_id} support";
    req.workspace_path = workspace;
    req.task_file = workspace / "task.md";
    req.timeout = Duration{10000};
    return req;
}

TEST(TaskExecutorTest, ExpandSubstitutesPlaceholders) {
    auto req = make_request("/tmp/ws");
    auto argv = LocalProcessExecutor::expand(
        {"agent", "--cwd={workspace}", "{task_id}", "{task_file}", "{description}"}, req, "/tmp/ws");

    ASSERT_EQ(argv.size(), 5u);
    EXPECT_EQ(argv[1], "--cwd=/tmp/ws");
    EXPECT_EQ(argv[2], "task-01-x");
    EXPECT_EQ(argv[3], "/tmp/ws/task.md");
    // Placeholders inside the description are left alone
    EXPECT_EQ(argv[4], "Add {task_id} support");
}

class LocalExecutorTest : public ::testing::Test {
protected:
    fs::path workspace_;

    void SetUp() override {
        workspace_ = fs::temp_directory_path() / "po_test_executor";
        fs::create_directories(workspace_);
    }

    void TearDown() override {
        fs::remove_all(workspace_);
    }
};

TEST_F(LocalExecutorTest, RunsInsideWorkspace) {
    LocalProcessExecutor exec({"/bin/sh", "-c", "pwd; echo {task_id}"});
    auto out = exec.execute(make_request(workspace_), {});
    ASSERT_TRUE(out.has_value()) << out.error().describe();
    EXPECT_EQ(out->exit_code, 0);
    EXPECT_NE(out->stdout_text.find("po_test_executor"), std::string::npos);
    EXPECT_NE(out->stdout_text.find("task-01-x"), std::string::npos);
}

TEST_F(LocalExecutorTest, NonZeroExitIsNotAnError) {
    LocalProcessExecutor exec({"/bin/sh", "-c", "echo broken >&2; exit 7"});
    auto out = exec.execute(make_request(workspace_), {});
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->exit_code, 7);
    EXPECT_EQ(out->stderr_text, "broken\n");
}

TEST_F(LocalExecutorTest, TimeoutIsReported) {
    LocalProcessExecutor exec({"/bin/sh", "-c", "sleep 30"}, Duration{100});
    auto req = make_request(workspace_);
    req.timeout = Duration{200};
    auto out = exec.execute(req, {});
    ASSERT_TRUE(out.has_value());
    EXPECT_TRUE(out->timed_out);
}

TEST_F(LocalExecutorTest, MissingWorkspaceIsError) {
    LocalProcessExecutor exec({"/bin/sh", "-c", "true"});
    auto out = exec.execute(make_request(workspace_ / "missing"), {});
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().kind, ErrorKind::ExecutorFailure);
}

TEST_F(LocalExecutorTest, RelativePathsResolveInsideChild) {
    const auto previous = fs::current_path();
    fs::current_path(workspace_);

    fs::create_directories(".worktrees/task-01-a");
    fs::create_directories(".orchestrator/run-1/logs");
    {
        std::ofstream task(".orchestrator/run-1/logs/task-01-a.task.md");
        task << "Rename the config loader\n";
    }

    ExecutionRequest req;
    req.task_id = "task-01-a";
    req.workspace_path = ".worktrees/task-01-a";
    req.task_file = fs::path{".orchestrator/run-1/logs/task-01-a.task.md"};
    req.stdout_path = fs::path{".orchestrator/run-1/logs/task-01-a.1.out"};
    req.timeout = Duration{10000};

    LocalProcessExecutor exec({"/bin/sh", "-c", "cat {task_file} && test -d {workspace} && echo WS_OK"});
    auto out = exec.execute(req, {});
    const bool log_written = fs::exists(".orchestrator/run-1/logs/task-01-a.1.out");
    fs::current_path(previous);

    ASSERT_TRUE(out.has_value()) << out.error().describe();
    EXPECT_EQ(out->exit_code, 0) << out->stderr_text;
    EXPECT_EQ(out->stdout_text, "Rename the config loader\nWS_OK\n");
    EXPECT_TRUE(log_written);
}

TEST(ContainerExecutorTest, WrapsCommandInContainerRun) {
    ContainerExecutor exec({"agent", "{workspace}", "{task_id}", "{task_file}"}, "podman", "alpine:3");
    auto req = make_request("/abs/ws");
    req.task_file = fs::path{"/abs/run/logs/task-01-x.task.md"};
    auto argv = exec.container_argv(req);

    std::vector<std::string> expected = {
        "podman", "run", "--rm", "--name", ContainerExecutor::container_name(req),
        "-v", "/abs/ws:/workspace",
        "-v", "/abs/run/logs/task-01-x.task.md:/orchestrator/task.md:ro",
        "-w", "/workspace", "alpine:3",
        "agent", "/workspace", "task-01-x", "/orchestrator/task.md"
    };
    EXPECT_EQ(argv, expected);
}

TEST(ContainerExecutorTest, NameIsPerAttemptAndValid) {
    auto req = make_request("/abs/ws");
    req.task_id = "task-02-a b.1";
    req.attempt = 2;
    auto name = ContainerExecutor::container_name(req);

    EXPECT_EQ(name.rfind("po-", 0), 0u);
    EXPECT_NE(name.find("task-02-a-b.1-2"), std::string::npos);
    req.attempt = 3;
    EXPECT_NE(ContainerExecutor::container_name(req), name);
}

TEST_F(LocalExecutorTest, ContainerIsKilledOnTimeout) {
    // Stand-in runtime: records its arguments, and "run" blocks.
    const auto runtime = workspace_ / "runtime.sh";
    const auto calls = workspace_ / "calls.log";
    {
        std::ofstream script(runtime);
        script << "#!/bin/sh\necho \"$@\" >> " << calls.string()
               << "\nif [ \"$1\" = run ]; then sleep 30; fi\n";
    }
    fs::permissions(runtime, fs::perms::owner_all);

    ContainerExecutor exec({"agent"}, runtime.string(), "img", Duration{100});
    auto req = make_request(workspace_);
    req.task_file.reset();
    req.timeout = Duration{200};
    auto out = exec.execute(req, {});
    ASSERT_TRUE(out.has_value()) << out.error().describe();
    EXPECT_TRUE(out->timed_out);

    std::ifstream in(calls);
    std::string run_line, kill_line;
    std::getline(in, run_line);
    std::getline(in, kill_line);
    EXPECT_EQ(run_line.rfind("run --rm --name " + ContainerExecutor::container_name(req), 0), 0u);
    EXPECT_EQ(kill_line, "kill " + ContainerExecutor::container_name(req));
}

TEST(ExecutorFactoryTest, SelectsStrategy) {
    ExecutorConfig cfg;
    auto process = make_executor(cfg);
    ASSERT_TRUE(process.has_value());
    EXPECT_EQ((*process)->name(), "process");

    cfg.strategy = "container";
    auto container = make_executor(cfg);
    ASSERT_TRUE(container.has_value());
    EXPECT_EQ((*container)->name(), "container");

    cfg.strategy = "remote";
    EXPECT_FALSE(make_executor(cfg).has_value());

    cfg.strategy = "process";
    cfg.command.clear();
    EXPECT_FALSE(make_executor(cfg).has_value());
}
