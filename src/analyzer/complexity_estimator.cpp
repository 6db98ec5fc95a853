/**
 * @file complexity_estimator.cpp
 * @brief ComplexityEstimator implementation.
 * @author Dimitris Kafetzis
 */

#include "analyzer/complexity_estimator.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_set>

namespace parallel_orchestrator {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // anonymous namespace

ComplexityEstimator::ComplexityEstimator(AnalyzerConfig config)
    : config_(std::move(config)) {}

// ─────────────────────────────────────────────
// Scoring
// ─────────────────────────────────────────────

size_t ComplexityEstimator::count_keywords(std::string_view description) const {
    auto text = lower(description);
    std::unordered_set<std::string> hits;
    for (const auto& keyword : config_.high_risk_keywords) {
        auto needle = lower(keyword);
        if (!needle.empty() && text.find(needle) != std::string::npos) {
            hits.insert(needle);
        }
    }
    return hits.size();
}

double ComplexityEstimator::score(const TaskFootprint& footprint,
                                  std::string_view description,
                                  size_t dependency_count) const {
    double s = 0.0;
    s += kFileWeight * static_cast<double>(footprint.target_files.size());
    s += kDirWeight * static_cast<double>(footprint.target_dirs.size());
    s += kDependencyWeight * static_cast<double>(dependency_count);
    s += kKeywordWeight * static_cast<double>(count_keywords(description));
    s += static_cast<double>(description.size() / kCharsPerPoint);
    if (footprint.cpu_intensive) s += kResourceFlagWeight;
    if (footprint.memory_intensive) s += kResourceFlagWeight;
    return s;
}

Complexity ComplexityEstimator::classify(double score) const noexcept {
    if (score >= config_.high_threshold) return Complexity::High;
    if (score >= config_.medium_threshold) return Complexity::Medium;
    return Complexity::Low;
}

Duration ComplexityEstimator::estimate_duration(Complexity level,
                                                std::optional<uint32_t> stated_minutes) const {
    if (stated_minutes && *stated_minutes > 0) {
        return std::chrono::minutes(*stated_minutes);
    }
    uint32_t factor = 1;
    switch (level) {
        case Complexity::Low:    factor = 1; break;
        case Complexity::Medium: factor = 2; break;
        case Complexity::High:   factor = 4; break;
    }
    return std::chrono::minutes(config_.base_minutes * factor);
}

ComplexityEstimate ComplexityEstimator::estimate(const TaskFootprint& footprint,
                                                 std::string_view description,
                                                 size_t dependency_count,
                                                 std::optional<uint32_t> stated_minutes) const {
    ComplexityEstimate est;
    est.score = score(footprint, description, dependency_count);
    est.level = classify(est.score);
    est.estimated_duration = estimate_duration(est.level, stated_minutes);
    return est;
}

void ComplexityEstimator::apply_estimate(TaskModel& task, std::optional<uint32_t> stated_minutes) const {
    auto est = estimate(task.footprint, task.description, task.dependencies.size(), stated_minutes);
    task.complexity_score = est.score;
    task.complexity = est.level;
    task.estimated_duration = est.estimated_duration;
}

// ─────────────────────────────────────────────
// Decomposition
// ─────────────────────────────────────────────

bool ComplexityEstimator::should_decompose(const TaskModel& task) const noexcept {
    return task.complexity_score > config_.decomposition_threshold
        && task.footprint.target_files.size() >= 2;
}

std::vector<TaskModel> ComplexityEstimator::decompose(const TaskModel& task) const {
    if (!should_decompose(task)) return {};

    auto files = task.footprint.target_files;
    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());

    const size_t k = std::min<size_t>(std::max<uint32_t>(config_.max_subtasks, 2), files.size());
    if (k < 2) return {};

    std::vector<TaskModel> out;
    std::optional<TaskId> previous_tail;

    const size_t base = files.size() / k;
    const size_t extra = files.size() % k;
    size_t offset = 0;

    for (size_t i = 0; i < k; ++i) {
        size_t count = base + (i < extra ? 1 : 0);

        TaskModel sub;
        sub.id = task.id + "." + std::to_string(i + 1);
        sub.name = task.name + " (part " + std::to_string(i + 1) + "/" + std::to_string(k) + ")";
        sub.description = task.description;
        sub.footprint = task.footprint;
        sub.footprint.target_files.assign(files.begin() + static_cast<std::ptrdiff_t>(offset),
                                          files.begin() + static_cast<std::ptrdiff_t>(offset + count));
        sub.parent = task.parent.value_or(task.id);
        sub.dependencies = previous_tail ? std::vector<TaskId>{*previous_tail} : task.dependencies;
        offset += count;

        apply_estimate(sub, std::nullopt);

        auto nested = decompose(sub);
        if (nested.empty()) {
            previous_tail = sub.id;
            out.push_back(std::move(sub));
        } else {
            previous_tail = nested.back().id;
            for (auto& n : nested) out.push_back(std::move(n));
        }
    }
    return out;
}

}  // namespace parallel_orchestrator
