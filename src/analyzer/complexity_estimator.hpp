/**
 * @file complexity_estimator.hpp
 * @brief Complexity scoring, duration estimation and task decomposition.
 * @author Dimitris Kafetzis
 *
 * Scoring is a weighted sum over the task footprint and description.
 * Decomposition splits an oversized task into a chain of subtasks over
 * contiguous chunks of its (sorted) target files. Both are pure functions
 * of their inputs.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "workload/task.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace parallel_orchestrator {

struct ComplexityEstimate {
    double score = 0.0;
    Complexity level = Complexity::Low;
    Duration estimated_duration{0};
};

class ComplexityEstimator {
public:
    // Feature weights
    static constexpr double kFileWeight = 1.0;
    static constexpr double kDirWeight = 0.5;
    static constexpr double kDependencyWeight = 1.5;
    static constexpr double kKeywordWeight = 2.0;
    static constexpr double kResourceFlagWeight = 1.0;
    static constexpr size_t kCharsPerPoint = 200;

    explicit ComplexityEstimator(AnalyzerConfig config = {});

    [[nodiscard]] double score(const TaskFootprint& footprint,
                               std::string_view description,
                               size_t dependency_count) const;

    [[nodiscard]] Complexity classify(double score) const noexcept;

    [[nodiscard]] Duration estimate_duration(Complexity level,
                                             std::optional<uint32_t> stated_minutes = std::nullopt) const;

    /// Score, classify and estimate in one step.
    [[nodiscard]] ComplexityEstimate estimate(const TaskFootprint& footprint,
                                              std::string_view description,
                                              size_t dependency_count,
                                              std::optional<uint32_t> stated_minutes = std::nullopt) const;

    /// Distinct high-risk keywords contained in the description (case-insensitive).
    [[nodiscard]] size_t count_keywords(std::string_view description) const;

    [[nodiscard]] bool should_decompose(const TaskModel& task) const noexcept;

    /**
     * @brief Split a task into an ordered chain of subtasks.
     *
     * Subtask ids are `<parent id>.<k>`. The first subtask inherits the
     * parent's dependencies and every later one depends on its
     * predecessor. Subtasks that are still oversized are split again, so
     * the result is flattened and the last element is the chain tail.
     * Returns an empty vector when the task does not need splitting.
     */
    [[nodiscard]] std::vector<TaskModel> decompose(const TaskModel& task) const;

    [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }

private:
    void apply_estimate(TaskModel& task, std::optional<uint32_t> stated_minutes) const;

    AnalyzerConfig config_;
};

}  // namespace parallel_orchestrator
