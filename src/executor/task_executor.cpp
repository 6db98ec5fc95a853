/**
 * @file task_executor.cpp
 * @brief Local-process and container executors.
 * @author Dimitris Kafetzis
 */

#include "executor/task_executor.hpp"

#include "executor/process.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <unistd.h>

namespace parallel_orchestrator {

namespace fs = std::filesystem;

namespace {

void replace_all(std::string& text, std::string_view token, std::string_view value) {
    for (auto pos = text.find(token); pos != std::string::npos;
         pos = text.find(token, pos + value.size())) {
        text.replace(pos, token.size(), value);
    }
}

/// The child chdirs into the workspace, so every path it sees must be absolute.
fs::path absolute_or_same(const fs::path& path) {
    if (path.empty() || path.is_absolute()) return path;
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    return ec ? path : abs.lexically_normal();
}

ExecutionRequest with_absolute_paths(const ExecutionRequest& request) {
    ExecutionRequest out = request;
    out.workspace_path = absolute_or_same(request.workspace_path);
    if (out.task_file) out.task_file = absolute_or_same(*out.task_file);
    if (out.stdout_path) out.stdout_path = absolute_or_same(*out.stdout_path);
    if (out.stderr_path) out.stderr_path = absolute_or_same(*out.stderr_path);
    return out;
}

constexpr std::string_view kContainerTaskFile = "/orchestrator/task.md";

}  // anonymous namespace

// ─────────────────────────────────────────────
// LocalProcessExecutor
// ─────────────────────────────────────────────

LocalProcessExecutor::LocalProcessExecutor(std::vector<std::string> command, Duration kill_grace)
    : command_(std::move(command))
    , kill_grace_(kill_grace) {}

std::vector<std::string> LocalProcessExecutor::expand(const std::vector<std::string>& command,
                                                      const ExecutionRequest& request,
                                                      const fs::path& workspace) {
    const std::string task_file = request.task_file ? request.task_file->string() : std::string{};
    std::vector<std::string> argv;
    argv.reserve(command.size());
    for (auto arg : command) {
        replace_all(arg, "{workspace}", workspace.string());
        replace_all(arg, "{task_id}", request.task_id);
        replace_all(arg, "{task_file}", task_file);
        // Substituted last so a description containing a placeholder stays literal
        replace_all(arg, "{description}", request.description);
        argv.push_back(std::move(arg));
    }
    return argv;
}

Result<ExecutorOutput> LocalProcessExecutor::spawn(std::vector<std::string> argv,
                                                   const fs::path& working_dir,
                                                   const ExecutionRequest& request,
                                                   std::stop_token stop) const {
    ProcessOptions opts;
    opts.argv = std::move(argv);
    opts.working_dir = working_dir;
    opts.stdout_path = request.stdout_path;
    opts.stderr_path = request.stderr_path;
    opts.timeout = request.timeout;
    opts.kill_grace = kill_grace_;

    auto outcome = run_process(opts, std::move(stop));
    if (!outcome) return outcome.error();

    ExecutorOutput out;
    out.exit_code = outcome->exit_code;
    out.timed_out = outcome->timed_out;
    out.cancelled = outcome->stopped;
    out.stdout_text = std::move(outcome->stdout_text);
    out.stderr_text = std::move(outcome->stderr_text);
    return out;
}

Result<ExecutorOutput> LocalProcessExecutor::execute(const ExecutionRequest& request,
                                                     std::stop_token stop) {
    if (command_.empty()) {
        return Error{ErrorKind::InvalidArgument, "executor command is empty"};
    }
    auto req = with_absolute_paths(request);
    std::error_code ec;
    if (!req.workspace_path.empty() && !fs::is_directory(req.workspace_path, ec)) {
        return Error{ErrorKind::ExecutorFailure,
                     "workspace " + req.workspace_path.string() + " does not exist"};
    }
    return spawn(expand(command_, req, req.workspace_path), req.workspace_path, req, std::move(stop));
}

// ─────────────────────────────────────────────
// ContainerExecutor
// ─────────────────────────────────────────────

ContainerExecutor::ContainerExecutor(std::vector<std::string> command,
                                     std::string runtime,
                                     std::string image,
                                     Duration kill_grace)
    : LocalProcessExecutor(std::move(command), kill_grace)
    , runtime_(std::move(runtime))
    , image_(std::move(image))
    , kill_timeout_(std::max(kill_grace, Duration{10000})) {}

std::string ContainerExecutor::container_name(const ExecutionRequest& request) {
    std::string name = "po-" + std::to_string(::getpid()) + "-" + request.task_id
                     + "-" + std::to_string(request.attempt);
    for (auto& c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.' && c != '-') c = '-';
    }
    return name;
}

std::vector<std::string> ContainerExecutor::container_argv(const ExecutionRequest& request) const {
    auto req = with_absolute_paths(request);

    std::vector<std::string> argv = {
        runtime_, "run", "--rm",
        "--name", container_name(req),
        "-v", req.workspace_path.string() + ":/workspace"
    };
    // The task file lives under the run directory, which is not inside the workspace.
    if (req.task_file) {
        argv.push_back("-v");
        argv.push_back(req.task_file->string() + ":" + std::string{kContainerTaskFile} + ":ro");
        req.task_file = fs::path{kContainerTaskFile};
    }
    argv.insert(argv.end(), {"-w", "/workspace", image_});

    // Inside the container the workspace is always /workspace
    auto inner = expand(command_, req, fs::path{"/workspace"});
    argv.insert(argv.end(), inner.begin(), inner.end());
    return argv;
}

Result<ExecutorOutput> ContainerExecutor::execute(const ExecutionRequest& request,
                                                  std::stop_token stop) {
    if (command_.empty()) {
        return Error{ErrorKind::InvalidArgument, "executor command is empty"};
    }
    auto req = with_absolute_paths(request);
    auto out = spawn(container_argv(req), {}, req, std::move(stop));
    if (!out || !(out->timed_out || out->cancelled)) return out;

    // Signalling the client does not stop the container itself.
    ProcessOptions stop_container;
    stop_container.argv = {runtime_, "kill", container_name(req)};
    stop_container.timeout = kill_timeout_;
    auto killed = run_process(stop_container);
    if (!killed) {
        out->stderr_text += "\n" + killed.error().describe();
    } else if (killed->exit_code != 0
               && killed->stderr_text.find("No such container") == std::string::npos) {
        out->stderr_text += "\ncontainer kill failed: " + killed->stderr_text;
    }
    return out;
}

// ─────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────

Result<std::unique_ptr<ITaskExecutor>> make_executor(const ExecutorConfig& config) {
    if (config.command.empty()) {
        return Error{ErrorKind::InvalidArgument, "executor.command must not be empty"};
    }
    if (config.strategy == "process") {
        return std::unique_ptr<ITaskExecutor>(std::make_unique<LocalProcessExecutor>(config.command));
    }
    if (config.strategy == "container") {
        return std::unique_ptr<ITaskExecutor>(std::make_unique<ContainerExecutor>(
            config.command, config.container_runtime, config.container_image));
    }
    return Error{ErrorKind::InvalidArgument, "unknown executor strategy '" + config.strategy + "'"};
}

}  // namespace parallel_orchestrator
