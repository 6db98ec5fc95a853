/**
 * @file task_analyzer.cpp
 * @brief TaskAnalyzer implementation.
 * @author Dimitris Kafetzis
 */

#include "analyzer/task_analyzer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <unordered_map>
#include <unordered_set>

namespace parallel_orchestrator {

namespace {

constexpr size_t kMaxSlugLength = 40;

std::string slugify(std::string_view name) {
    std::string slug;
    bool pending_dash = false;
    for (unsigned char c : name) {
        if (std::isalnum(c)) {
            if (pending_dash && !slug.empty()) slug += '-';
            pending_dash = false;
            slug += static_cast<char>(std::tolower(c));
        } else {
            pending_dash = true;
        }
        if (slug.size() >= kMaxSlugLength) break;
    }
    while (!slug.empty() && slug.back() == '-') slug.pop_back();
    return slug.empty() ? std::string{"task"} : slug;
}

bool is_blank(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

}  // anonymous namespace

TaskAnalyzer::TaskAnalyzer(AnalyzerConfig config)
    : estimator_(std::move(config)) {}

std::string TaskAnalyzer::make_task_id(size_t index, std::string_view name) {
    char prefix[24];
    std::snprintf(prefix, sizeof(prefix), "task-%02zu-", index + 1);
    return std::string{prefix} + slugify(name);
}

// ─────────────────────────────────────────────
// Analysis
// ─────────────────────────────────────────────

Result<AnalysisResult> TaskAnalyzer::analyze(const std::vector<TaskSpec>& specs) const {
    if (specs.empty()) {
        return Error{ErrorKind::InputParse, "no tasks to analyze"};
    }

    // ── Ids and name resolution ──────────────
    std::vector<TaskModel> models;
    models.reserve(specs.size());
    std::unordered_map<std::string, TaskId> by_name;

    for (size_t i = 0; i < specs.size(); ++i) {
        const auto& spec = specs[i];
        if (is_blank(spec.description)) {
            return Error{ErrorKind::InputParse,
                         (spec.source.empty() ? std::string{"<inline>"} : spec.source)
                         + ": task '" + spec.name + "' has no description"};
        }

        TaskModel model;
        model.name = spec.name.empty() ? "task" : spec.name;
        model.id = make_task_id(i, model.name);
        model.description = spec.description;
        model.footprint = spec.footprint;

        if (!by_name.emplace(model.name, model.id).second) {
            return Error{ErrorKind::InputParse, "duplicate task name '" + model.name + "'"};
        }
        models.push_back(std::move(model));
    }

    for (size_t i = 0; i < specs.size(); ++i) {
        for (const auto& dep_name : specs[i].depends_on) {
            auto it = by_name.find(dep_name);
            if (it != by_name.end()) {
                models[i].dependencies.push_back(it->second);
                continue;
            }
            // Direct id references are accepted as well
            bool is_id = std::any_of(models.begin(), models.end(),
                                     [&](const TaskModel& m) { return m.id == dep_name; });
            if (!is_id) {
                return Error{ErrorKind::InputParse,
                             "task '" + models[i].name + "' depends on unknown task '" + dep_name + "'"};
            }
            models[i].dependencies.push_back(dep_name);
        }
    }

    // ── Scoring and decomposition ────────────
    std::vector<TaskModel> expanded;
    std::unordered_map<TaskId, TaskId> tail_of;

    for (size_t i = 0; i < models.size(); ++i) {
        auto& model = models[i];
        auto est = estimator_.estimate(model.footprint, model.description,
                                       model.dependencies.size(), specs[i].estimated_minutes);
        model.complexity_score = est.score;
        model.complexity = est.level;
        model.estimated_duration = est.estimated_duration;

        auto subtasks = estimator_.decompose(model);
        if (subtasks.empty()) {
            expanded.push_back(std::move(model));
            continue;
        }
        tail_of.emplace(model.id, subtasks.back().id);
        for (auto& sub : subtasks) expanded.push_back(std::move(sub));
    }

    // Edges onto a decomposed task now point at the end of its chain
    for (auto& task : expanded) {
        for (auto& dep : task.dependencies) {
            if (auto it = tail_of.find(dep); it != tail_of.end()) dep = it->second;
        }
    }

    // ── Graph, conflicts, plan ───────────────
    auto graph = TaskGraph::build(std::move(expanded));
    if (!graph) return graph.error();

    AnalysisResult result{std::move(*graph), {}, {}};
    result.conflicts = detector_.build_matrix(result.graph.tasks());
    result.groups = compute_groups(result.graph, result.conflicts);
    return result;
}

// ─────────────────────────────────────────────
// Group Layering
// ─────────────────────────────────────────────

GroupPlan TaskAnalyzer::compute_groups(const TaskGraph& graph, const ConflictMatrix& conflicts) {
    const auto order = graph.topological_order();

    // Height = longest path (in edges) to a sink; processed in reverse topological order.
    std::unordered_map<TaskId, size_t> height;
    size_t max_height = 0;
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        size_t h = 0;
        for (const auto& dependent : graph.dependents(*it)) {
            h = std::max(h, height[dependent] + 1);
        }
        height[*it] = h;
        max_height = std::max(max_height, h);
    }

    std::unordered_map<TaskId, size_t> placed;   // id -> group index
    std::vector<TaskId> remaining = order;
    GroupPlan groups;

    for (size_t layer = 0; !remaining.empty(); ++layer) {
        std::vector<const TaskModel*> candidates;
        for (const auto& id : remaining) {
            if (max_height - height[id] > layer) continue;
            const auto deps = graph.dependencies(id);
            bool ready = std::all_of(deps.begin(), deps.end(), [&](const TaskId& dep) {
                auto p = placed.find(dep);
                return p != placed.end() && p->second < groups.size();
            });
            if (ready) candidates.push_back(graph.find(id));
        }

        std::sort(candidates.begin(), candidates.end(),
                  [](const TaskModel* a, const TaskModel* b) {
                      if (a->estimated_duration != b->estimated_duration) {
                          return a->estimated_duration < b->estimated_duration;
                      }
                      return a->id < b->id;
                  });

        std::vector<TaskId> group;
        for (const auto* task : candidates) {
            bool clash = std::any_of(group.begin(), group.end(), [&](const TaskId& member) {
                return conflicts.conflicts(member, task->id);
            });
            if (!clash) group.push_back(task->id);
        }
        if (group.empty()) continue;

        std::unordered_set<TaskId> in_group(group.begin(), group.end());
        for (const auto& id : group) placed.emplace(id, groups.size());
        std::erase_if(remaining, [&](const TaskId& id) { return in_group.contains(id); });
        groups.push_back(std::move(group));
    }
    return groups;
}

}  // namespace parallel_orchestrator
