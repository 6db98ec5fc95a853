/**
 * @file task_graph.cpp
 * @brief TaskGraph implementation: construction, validation, ordering.
 * @author Dimitris Kafetzis
 *
 * Kahn's algorithm (ties broken by insertion order) for topological
 * ordering and iterative DFS colouring for cycle detection. All algorithms
 * are O(V+E) and deterministic for a given insertion order.
 */

#include "workload/task_graph.hpp"

#include <algorithm>
#include <queue>
#include <stack>
#include <unordered_set>

namespace parallel_orchestrator {

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<TaskGraph> TaskGraph::build(std::vector<TaskModel> tasks) {
    TaskGraph graph;

    std::vector<std::pair<TaskId, std::vector<TaskId>>> edges;
    edges.reserve(tasks.size());

    for (auto& task : tasks) {
        edges.emplace_back(task.id, task.dependencies);
        task.dependencies.clear();
        if (auto added = graph.add_task(std::move(task)); !added) {
            return added.error();
        }
    }

    for (const auto& [dependent, deps] : edges) {
        for (const auto& dep : deps) {
            if (!graph.contains(dep)) {
                return Error{ErrorKind::InputParse,
                             "task '" + dependent + "' depends on unknown task '" + dep + "'"};
            }
            if (auto added = graph.add_dependency(dep, dependent); !added) {
                return added.error();
            }
        }
    }

    if (auto valid = graph.validate(); !valid) {
        return valid.error();
    }
    return graph;
}

Result<void> TaskGraph::add_task(TaskModel task) {
    if (task.id.empty()) {
        return Error{ErrorKind::InvalidArgument, "task id must not be empty"};
    }
    if (index_.contains(task.id)) {
        return Error{ErrorKind::InvalidArgument, "duplicate task id '" + task.id + "'"};
    }

    TaskId id = task.id;
    adj_list_[id];
    reverse_adj_[id];
    index_.emplace(id, tasks_.size());
    tasks_.push_back(std::move(task));
    return Result<void>{};
}

Result<void> TaskGraph::add_dependency(const TaskId& dependency, const TaskId& dependent) {
    if (!contains(dependency) || !contains(dependent)) {
        return Error{ErrorKind::InvalidArgument,
                     "dependency edge references unknown task: "
                     + dependency + " -> " + dependent};
    }
    if (dependency == dependent) {
        return Error{ErrorKind::DependencyCycle,
                     "task '" + dependent + "' depends on itself"};
    }

    auto& forward = adj_list_[dependency];
    if (std::find(forward.begin(), forward.end(), dependent) != forward.end()) {
        return Result<void>{};
    }
    forward.push_back(dependent);
    reverse_adj_[dependent].push_back(dependency);
    tasks_[index_.at(dependent)].dependencies.push_back(dependency);
    return Result<void>{};
}

Result<void> TaskGraph::validate() const {
    for (const auto& task : tasks_) {
        for (const auto& dep : task.dependencies) {
            if (!contains(dep)) {
                return Error{ErrorKind::InputParse,
                             "task '" + task.id + "' depends on unknown task '" + dep + "'"};
            }
        }
    }

    if (auto cycle = find_cycle()) {
        std::string path;
        for (size_t i = 0; i < cycle->size(); ++i) {
            if (i > 0) path += " -> ";
            path += (*cycle)[i];
        }
        return Error{ErrorKind::DependencyCycle, "dependency cycle: " + path};
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Cycle Detection (DFS colouring)
// ─────────────────────────────────────────────

std::optional<std::vector<TaskId>> TaskGraph::find_cycle() const {
    enum class Color : uint8_t { White, Gray, Black };
    std::unordered_map<TaskId, Color> color;
    for (const auto& task : tasks_) {
        color[task.id] = Color::White;
    }

    struct Frame {
        TaskId node;
        size_t neighbor_idx;
    };

    for (const auto& start : tasks_) {
        if (color[start.id] != Color::White) continue;

        std::vector<Frame> dfs_stack;
        dfs_stack.push_back({start.id, 0});
        color[start.id] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& frame = dfs_stack.back();
            const auto& neighbors = adj_list_.at(frame.node);

            if (frame.neighbor_idx >= neighbors.size()) {
                color[frame.node] = Color::Black;
                dfs_stack.pop_back();
                continue;
            }

            const TaskId neighbor = neighbors[frame.neighbor_idx++];

            if (color[neighbor] == Color::Gray) {
                // The gray nodes on the stack from `neighbor` upward form the cycle.
                std::vector<TaskId> cycle;
                auto it = std::find_if(dfs_stack.begin(), dfs_stack.end(),
                                       [&](const Frame& f) { return f.node == neighbor; });
                for (; it != dfs_stack.end(); ++it) {
                    cycle.push_back(it->node);
                }
                cycle.push_back(neighbor);
                return cycle;
            }
            if (color[neighbor] == Color::White) {
                color[neighbor] = Color::Gray;
                dfs_stack.push_back({neighbor, 0});
            }
        }
    }

    return std::nullopt;
}

// ─────────────────────────────────────────────
// Topological Ordering (Kahn's Algorithm)
// ─────────────────────────────────────────────

std::vector<TaskId> TaskGraph::topological_order() const {
    std::vector<size_t> in_degree(tasks_.size(), 0);
    for (size_t i = 0; i < tasks_.size(); ++i) {
        in_degree[i] = reverse_adj_.at(tasks_[i].id).size();
    }

    // Min-heap on insertion index keeps the order stable across runs.
    std::priority_queue<size_t, std::vector<size_t>, std::greater<>> zero_in;
    for (size_t i = 0; i < tasks_.size(); ++i) {
        if (in_degree[i] == 0) zero_in.push(i);
    }

    std::vector<TaskId> order;
    order.reserve(tasks_.size());

    while (!zero_in.empty()) {
        size_t current = zero_in.top();
        zero_in.pop();
        order.push_back(tasks_[current].id);

        for (const auto& neighbor : adj_list_.at(tasks_[current].id)) {
            size_t idx = index_.at(neighbor);
            if (--in_degree[idx] == 0) {
                zero_in.push(idx);
            }
        }
    }

    return order;
}

// ─────────────────────────────────────────────
// Query Methods
// ─────────────────────────────────────────────

std::vector<TaskId> TaskGraph::dependents(const TaskId& id) const {
    auto it = adj_list_.find(id);
    if (it == adj_list_.end()) return {};
    return it->second;
}

std::vector<TaskId> TaskGraph::dependencies(const TaskId& id) const {
    auto it = reverse_adj_.find(id);
    if (it == reverse_adj_.end()) return {};
    return it->second;
}

std::vector<TaskId> TaskGraph::transitive_dependents(const TaskId& id) const {
    std::vector<TaskId> out;
    std::unordered_set<TaskId> seen;
    std::stack<TaskId> pending;
    pending.push(id);

    while (!pending.empty()) {
        auto current = pending.top();
        pending.pop();
        for (const auto& next : dependents(current)) {
            if (seen.insert(next).second) {
                out.push_back(next);
                pending.push(next);
            }
        }
    }
    return out;
}

bool TaskGraph::contains(const TaskId& id) const {
    return index_.contains(id);
}

const TaskModel* TaskGraph::find(const TaskId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &tasks_[it->second];
}

TaskModel* TaskGraph::find(const TaskId& id) {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &tasks_[it->second];
}

std::vector<TaskId> TaskGraph::ids() const {
    std::vector<TaskId> out;
    out.reserve(tasks_.size());
    for (const auto& task : tasks_) {
        out.push_back(task.id);
    }
    return out;
}

}  // namespace parallel_orchestrator
