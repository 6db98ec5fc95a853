/**
 * @file workspace_manager.hpp
 * @brief Per-task workspace lifecycle: at most one live workspace per task id.
 * @author Dimitris Kafetzis
 *
 * Calls for different task ids run concurrently; calls for the same task
 * id serialize on a per-id mutex. Backend work (git, copying) never runs
 * under the table lock.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "workload/task.hpp"
#include "workspace/workspace_backend.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace parallel_orchestrator {

class WorkspaceManager {
public:
    WorkspaceManager(WorkspaceConfig config, std::unique_ptr<IWorkspaceBackend> backend);

    WorkspaceManager(const WorkspaceManager&) = delete;
    WorkspaceManager& operator=(const WorkspaceManager&) = delete;

    /**
     * @brief Create the workspace for `task_id` from `base_ref`
     *        (config default when empty).
     *
     * Fails with WorkspaceExists when a live workspace, a leftover
     * directory or a colliding branch exists for the task.
     */
    Result<Workspace> create(const TaskId& task_id, const std::string& base_ref = {});

    /**
     * @brief Remove the workspace for `task_id`.
     * @return true if something was removed, false if nothing existed.
     *
     * Leftovers from an earlier process (directory or branch on disk but
     * unknown to this manager) are removed too.
     */
    Result<bool> remove(const TaskId& task_id);

    /// Mark a created workspace as in use by a running task.
    void mark_active(const TaskId& task_id);

    [[nodiscard]] std::optional<Workspace> get(const TaskId& task_id) const;
    /// Live workspaces ordered by task id.
    [[nodiscard]] std::vector<Workspace> list() const;

    /// Remove every live workspace. Every removal is attempted; the first
    /// failure is returned after the pass.
    Result<size_t> cleanup_all();

    [[nodiscard]] std::filesystem::path path_for(const TaskId& task_id) const;
    [[nodiscard]] std::string branch_for(const TaskId& task_id) const;
    [[nodiscard]] const IWorkspaceBackend& backend() const noexcept { return *backend_; }

private:
    std::shared_ptr<std::mutex> lock_for(const TaskId& task_id);

    WorkspaceConfig config_;
    std::unique_ptr<IWorkspaceBackend> backend_;

    mutable std::mutex table_mutex_;
    std::map<TaskId, Workspace> live_;
    std::unordered_map<TaskId, std::shared_ptr<std::mutex>> task_locks_;
};

}  // namespace parallel_orchestrator
