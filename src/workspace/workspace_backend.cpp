/**
 * @file workspace_backend.cpp
 * @brief Git worktree and directory-copy backends.
 * @author Dimitris Kafetzis
 */

#include "workspace/workspace_backend.hpp"

#include "executor/process.hpp"

#include <system_error>

namespace parallel_orchestrator {

namespace fs = std::filesystem;

namespace {

constexpr Duration kGitTimeout{120000};

std::string first_line(const std::string& text) {
    auto end = text.find('\n');
    return end == std::string::npos ? text : text.substr(0, end);
}

fs::path absolute_normal(const fs::path& p) {
    std::error_code ec;
    auto abs = fs::absolute(p, ec);
    if (ec) return p.lexically_normal();
    return abs.lexically_normal();
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// GitWorktreeBackend
// ─────────────────────────────────────────────

GitWorktreeBackend::GitWorktreeBackend(fs::path repository)
    : repository_(std::move(repository)) {}

Result<GitWorktreeBackend::GitOutput> GitWorktreeBackend::git(std::vector<std::string> args) const {
    ProcessOptions opts;
    opts.argv = {"git", "-C", repository_.string()};
    opts.argv.insert(opts.argv.end(), args.begin(), args.end());
    opts.timeout = kGitTimeout;

    auto outcome = run_process(opts);
    if (!outcome) {
        return Error{ErrorKind::VersionControl, outcome.error().message};
    }
    return GitOutput{outcome->exit_code, outcome->stdout_text + outcome->stderr_text};
}

bool GitWorktreeBackend::branch_exists(const std::string& branch) const {
    auto out = git({"rev-parse", "--verify", "--quiet", "refs/heads/" + branch});
    return out && out->exit_code == 0;
}

Result<void> GitWorktreeBackend::create(const fs::path& path,
                                        const std::string& branch,
                                        const std::string& base_ref) {
    if (branch_exists(branch)) {
        return Error{ErrorKind::WorkspaceExists, "branch '" + branch + "' already exists"};
    }

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Error{ErrorKind::VersionControl,
                     "cannot create " + path.parent_path().string() + ": " + ec.message()};
    }

    auto out = git({"worktree", "add", "-b", branch, absolute_normal(path).string(), base_ref});
    if (!out) return out.error();
    if (out->exit_code != 0) {
        return Error{ErrorKind::VersionControl,
                     "git worktree add failed: " + first_line(out->output)};
    }
    return Result<void>{};
}

Result<void> GitWorktreeBackend::remove(const fs::path& path, const std::string& branch) {
    std::error_code ec;
    if (fs::exists(path, ec)) {
        auto out = git({"worktree", "remove", "--force", absolute_normal(path).string()});
        if (!out) return out.error();
        if (out->exit_code != 0) {
            // Not a registered worktree any more; drop the directory directly.
            fs::remove_all(path, ec);
            if (ec) {
                return Error{ErrorKind::VersionControl,
                             "cannot remove " + path.string() + ": " + ec.message()};
            }
        }
    }

    auto prune = git({"worktree", "prune"});
    if (!prune) return prune.error();

    if (branch_exists(branch)) {
        auto out = git({"branch", "-D", branch});
        if (!out) return out.error();
        if (out->exit_code != 0) {
            return Error{ErrorKind::VersionControl,
                         "git branch -D failed: " + first_line(out->output)};
        }
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// DirectoryBackend
// ─────────────────────────────────────────────

DirectoryBackend::DirectoryBackend(fs::path source, std::vector<fs::path> excluded)
    : source_(absolute_normal(source)) {
    excluded_.reserve(excluded.size());
    for (const auto& p : excluded) {
        excluded_.push_back(absolute_normal(p));
    }
}

bool DirectoryBackend::is_excluded(const fs::path& p) const {
    auto abs = absolute_normal(p);
    if (abs.filename() == ".git") return true;
    for (const auto& ex : excluded_) {
        if (abs == ex) return true;
    }
    return false;
}

Result<void> DirectoryBackend::copy_tree(const fs::path& from, const fs::path& to) const {
    std::error_code ec;
    fs::create_directories(to, ec);
    if (ec) {
        return Error{ErrorKind::VersionControl, "cannot create " + to.string() + ": " + ec.message()};
    }

    for (const auto& entry : fs::directory_iterator(from, ec)) {
        if (is_excluded(entry.path())) continue;
        auto target = to / entry.path().filename();

        if (entry.is_directory(ec) && !entry.is_symlink(ec)) {
            if (auto r = copy_tree(entry.path(), target); !r) return r;
        } else {
            fs::copy(entry.path(), target,
                     fs::copy_options::overwrite_existing | fs::copy_options::copy_symlinks, ec);
            if (ec) {
                return Error{ErrorKind::VersionControl,
                             "cannot copy " + entry.path().string() + ": " + ec.message()};
            }
        }
    }
    if (ec) {
        return Error{ErrorKind::VersionControl, "cannot read " + from.string() + ": " + ec.message()};
    }
    return Result<void>{};
}

Result<void> DirectoryBackend::create(const fs::path& path,
                                      const std::string& /*branch*/,
                                      const std::string& /*base_ref*/) {
    std::error_code ec;
    if (!fs::is_directory(source_, ec)) {
        return Error{ErrorKind::VersionControl, "source directory missing: " + source_.string()};
    }
    auto result = copy_tree(source_, path);
    if (!result) {
        fs::remove_all(path, ec);
    }
    return result;
}

Result<void> DirectoryBackend::remove(const fs::path& path, const std::string& /*branch*/) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        return Error{ErrorKind::VersionControl, "cannot remove " + path.string() + ": " + ec.message()};
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────

Result<std::unique_ptr<IWorkspaceBackend>> make_workspace_backend(const WorkspaceConfig& config,
                                                                  std::vector<fs::path> excluded) {
    if (config.backend == "git") {
        return std::unique_ptr<IWorkspaceBackend>(
            std::make_unique<GitWorktreeBackend>(config.repository));
    }
    if (config.backend == "directory") {
        excluded.push_back(config.root);
        return std::unique_ptr<IWorkspaceBackend>(
            std::make_unique<DirectoryBackend>(config.repository, std::move(excluded)));
    }
    return Error{ErrorKind::InvalidArgument, "unknown workspace backend '" + config.backend + "'"};
}

Result<std::unique_ptr<IWorkspaceBackend>> make_workspace_backend(const Config& config) {
    return make_workspace_backend(config.workspace, {
        config.orchestrator.run_root,
        config.state.checkpoint_dir,
        config.telemetry.log_dir
    });
}

}  // namespace parallel_orchestrator
