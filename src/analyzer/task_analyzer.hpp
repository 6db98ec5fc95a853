/**
 * @file task_analyzer.hpp
 * @brief Turns task specs into a validated task graph, a conflict matrix
 *        and a plan of parallel groups.
 * @author Dimitris Kafetzis
 *
 * Analysis pipeline:
 *   1. Assign ids (`task-<NN>-<slug>`) in input order, resolve dependency names
 *   2. Score complexity and estimate duration
 *   3. Decompose oversized tasks into chained subtasks
 *   4. Build the dependency DAG (cycles are fatal)
 *   5. Pairwise conflict detection
 *   6. Layer the DAG into conflict-free parallel groups
 *
 * The result depends only on the input specs and the analyzer config.
 */

#pragma once

#include "analyzer/complexity_estimator.hpp"
#include "analyzer/conflict_detector.hpp"
#include "core/config.hpp"
#include "core/result.hpp"
#include "workload/task.hpp"
#include "workload/task_graph.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace parallel_orchestrator {

using GroupPlan = std::vector<std::vector<TaskId>>;

struct AnalysisResult {
    TaskGraph graph;
    ConflictMatrix conflicts;
    GroupPlan groups;
};

class TaskAnalyzer {
public:
    explicit TaskAnalyzer(AnalyzerConfig config = {});

    [[nodiscard]] Result<AnalysisResult> analyze(const std::vector<TaskSpec>& specs) const;

    /**
     * @brief Partition a DAG into parallel groups.
     *
     * Each task is anchored to the latest layer its dependents allow
     * (critical-path chains start first). A task enters group k only when
     * every dependency sits in an earlier group and it conflicts with no
     * task already in group k; otherwise it moves to a later group.
     * Candidates for a group are taken in order of estimated duration,
     * then task id.
     */
    [[nodiscard]] static GroupPlan compute_groups(const TaskGraph& graph,
                                                  const ConflictMatrix& conflicts);

    /// `task-<NN>-<slug>` where NN is the 1-based input position.
    [[nodiscard]] static std::string make_task_id(size_t index, std::string_view name);

    [[nodiscard]] const ComplexityEstimator& estimator() const noexcept { return estimator_; }

private:
    ComplexityEstimator estimator_;
    ConflictDetector detector_;
};

}  // namespace parallel_orchestrator
