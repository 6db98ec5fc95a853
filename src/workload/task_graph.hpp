/**
 * @file task_graph.hpp
 * @brief Dependency DAG over analysed tasks.
 * @author Dimitris Kafetzis
 *
 * Tasks live in an arena (insertion-ordered vector) indexed by id; edges are
 * explicit adjacency lists. Validation rejects dangling references and
 * cycles at construction time, naming the offending cycle.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workload/task.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace parallel_orchestrator {

class TaskGraph {
public:
    TaskGraph() = default;

    /**
     * @brief Build and validate a graph from task models whose
     *        `dependencies` field lists the ids they depend on.
     */
    static Result<TaskGraph> build(std::vector<TaskModel> tasks);

    // ── Construction ──────────────────────────
    Result<void> add_task(TaskModel task);
    /// Record that `dependent` cannot start before `dependency` succeeds.
    Result<void> add_dependency(const TaskId& dependency, const TaskId& dependent);

    /// Unknown references or a cycle are reported as errors.
    [[nodiscard]] Result<void> validate() const;

    // ── Queries ───────────────────────────────
    [[nodiscard]] std::optional<std::vector<TaskId>> find_cycle() const;
    [[nodiscard]] bool has_cycle() const { return find_cycle().has_value(); }
    [[nodiscard]] std::vector<TaskId> topological_order() const;
    [[nodiscard]] std::vector<TaskId> dependents(const TaskId& id) const;
    [[nodiscard]] std::vector<TaskId> dependencies(const TaskId& id) const;
    /// Every task reachable through dependents() from `id`.
    [[nodiscard]] std::vector<TaskId> transitive_dependents(const TaskId& id) const;

    [[nodiscard]] bool contains(const TaskId& id) const;
    [[nodiscard]] size_t task_count() const noexcept { return tasks_.size(); }
    [[nodiscard]] const TaskModel* find(const TaskId& id) const;
    [[nodiscard]] TaskModel* find(const TaskId& id);
    [[nodiscard]] const std::vector<TaskModel>& tasks() const noexcept { return tasks_; }
    [[nodiscard]] std::vector<TaskId> ids() const;

private:
    std::vector<TaskModel> tasks_;
    std::unordered_map<TaskId, size_t> index_;
    std::unordered_map<TaskId, std::vector<TaskId>> adj_list_;       // dependency -> dependents
    std::unordered_map<TaskId, std::vector<TaskId>> reverse_adj_;    // dependent -> dependencies
};

}  // namespace parallel_orchestrator
