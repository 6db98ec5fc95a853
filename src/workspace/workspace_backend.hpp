/**
 * @file workspace_backend.hpp
 * @brief Version-control backends that materialize isolated working copies.
 * @author Dimitris Kafetzis
 *
 * A backend offers two operations: create a working copy from a base
 * reference on a new branch, and remove it again. Removal tolerates
 * partially removed state.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace parallel_orchestrator {

// ─────────────────────────────────────────────
// IWorkspaceBackend (Virtual)
// ─────────────────────────────────────────────

class IWorkspaceBackend {
public:
    virtual ~IWorkspaceBackend() = default;

    virtual Result<void> create(const std::filesystem::path& path,
                                const std::string& branch,
                                const std::string& base_ref) = 0;

    /// Remove the working copy and its branch. Missing pieces are skipped.
    virtual Result<void> remove(const std::filesystem::path& path,
                                const std::string& branch) = 0;

    [[nodiscard]] virtual bool branch_exists(const std::string& branch) const = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief `git worktree` backed workspaces on new branches.
 */
class GitWorktreeBackend : public IWorkspaceBackend {
public:
    explicit GitWorktreeBackend(std::filesystem::path repository);

    Result<void> create(const std::filesystem::path& path,
                        const std::string& branch,
                        const std::string& base_ref) override;
    Result<void> remove(const std::filesystem::path& path,
                        const std::string& branch) override;
    [[nodiscard]] bool branch_exists(const std::string& branch) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "git"; }

private:
    struct GitOutput {
        int exit_code = -1;
        std::string output;
    };
    Result<GitOutput> git(std::vector<std::string> args) const;

    std::filesystem::path repository_;
};

/**
 * @brief Plain recursive copy of a source tree. No branches.
 *
 * Excluded paths (the workspace root itself, VCS metadata) are skipped
 * during the copy.
 */
class DirectoryBackend : public IWorkspaceBackend {
public:
    DirectoryBackend(std::filesystem::path source,
                     std::vector<std::filesystem::path> excluded = {});

    Result<void> create(const std::filesystem::path& path,
                        const std::string& branch,
                        const std::string& base_ref) override;
    Result<void> remove(const std::filesystem::path& path,
                        const std::string& branch) override;
    [[nodiscard]] bool branch_exists(const std::string& /*branch*/) const override { return false; }
    [[nodiscard]] std::string_view name() const noexcept override { return "directory"; }

private:
    [[nodiscard]] bool is_excluded(const std::filesystem::path& p) const;
    Result<void> copy_tree(const std::filesystem::path& from, const std::filesystem::path& to) const;

    std::filesystem::path source_;
    std::vector<std::filesystem::path> excluded_;
};

/**
 * @brief Backend selected by `workspace.backend`.
 *
 * A directory backend never copies `workspace.root` or the `excluded` paths.
 */
Result<std::unique_ptr<IWorkspaceBackend>> make_workspace_backend(
    const WorkspaceConfig& config, std::vector<std::filesystem::path> excluded = {});

/// Same, also excluding the run root, checkpoint and log directories.
Result<std::unique_ptr<IWorkspaceBackend>> make_workspace_backend(const Config& config);

}  // namespace parallel_orchestrator
