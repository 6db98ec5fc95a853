/**
 * @file task_executor.hpp
 * @brief External task executor interface and its process-based strategies.
 * @author Dimitris Kafetzis
 *
 * The engine treats an executor as an opaque, slow and fallible black box:
 * it only consumes the exit code and the captured output. The strategy is
 * chosen once, at construction time.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace parallel_orchestrator {

/**
 * @brief Everything an executor receives for one attempt.
 */
struct ExecutionRequest {
    TaskId task_id;
    std::string name;
    std::string description;
    std::filesystem::path workspace_path;
    uint32_t attempt = 1;
    Duration timeout{0};
    std::optional<std::filesystem::path> task_file;     ///< Description written to disk
    std::optional<std::filesystem::path> stdout_path;
    std::optional<std::filesystem::path> stderr_path;
};

struct ExecutorOutput {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
};

// ─────────────────────────────────────────────
// ITaskExecutor (Virtual)
// ─────────────────────────────────────────────

class ITaskExecutor {
public:
    virtual ~ITaskExecutor() = default;

    /**
     * @brief Run one attempt. Must return promptly once `stop` is requested.
     *
     * An error means the attempt could not be started at all; a started
     * attempt that fails is reported through a non-zero exit code.
     */
    virtual Result<ExecutorOutput> execute(const ExecutionRequest& request,
                                           std::stop_token stop) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Runs an argv template as a local child process inside the workspace.
 *
 * Placeholders `{workspace}`, `{task_id}`, `{description}` and
 * `{task_file}` are substituted per argument. Relative paths in the request
 * are made absolute first, since the child runs inside the workspace.
 */
class LocalProcessExecutor : public ITaskExecutor {
public:
    explicit LocalProcessExecutor(std::vector<std::string> command,
                                  Duration kill_grace = Duration{2000});

    Result<ExecutorOutput> execute(const ExecutionRequest& request,
                                   std::stop_token stop) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "process"; }

    [[nodiscard]] static std::vector<std::string> expand(const std::vector<std::string>& command,
                                                         const ExecutionRequest& request,
                                                         const std::filesystem::path& workspace);

protected:
    Result<ExecutorOutput> spawn(std::vector<std::string> argv,
                                 const std::filesystem::path& working_dir,
                                 const ExecutionRequest& request,
                                 std::stop_token stop) const;

    std::vector<std::string> command_;
    Duration kill_grace_;
};

/**
 * @brief Runs the same argv template inside a throwaway container with the
 *        workspace mounted at /workspace.
 *
 * The container is named per process, task and attempt, and is killed
 * through the runtime on timeout or stop. `{task_file}` expands to a
 * read-only mount of the task file.
 */
class ContainerExecutor : public LocalProcessExecutor {
public:
    ContainerExecutor(std::vector<std::string> command,
                      std::string runtime,
                      std::string image,
                      Duration kill_grace = Duration{2000});

    Result<ExecutorOutput> execute(const ExecutionRequest& request,
                                   std::stop_token stop) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "container"; }

    [[nodiscard]] std::vector<std::string> container_argv(const ExecutionRequest& request) const;
    [[nodiscard]] static std::string container_name(const ExecutionRequest& request);

private:
    std::string runtime_;
    std::string image_;
    Duration kill_timeout_;
};

/**
 * @brief Executor selected by `executor.strategy`.
 */
Result<std::unique_ptr<ITaskExecutor>> make_executor(const ExecutorConfig& config);

}  // namespace parallel_orchestrator
