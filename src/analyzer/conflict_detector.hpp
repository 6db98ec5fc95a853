/**
 * @file conflict_detector.hpp
 * @brief Pairwise multi-dimensional conflict detection between tasks.
 * @author Dimitris Kafetzis
 *
 * Six independent checks (file, semantic, resource, interface, state,
 * test-environment) are OR-ed into one symmetric descriptor. The
 * ConflictMatrix is built once per analysis pass and is read-only
 * afterwards, so it may be shared across worker threads without locking.
 */

#pragma once

#include "core/types.hpp"
#include "workload/task.hpp"

#include <bitset>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace parallel_orchestrator {

enum class ConflictDimension : uint8_t {
    File,
    Semantic,
    Resource,
    Interface,
    State,
    TestEnvironment
};

inline constexpr size_t kConflictDimensionCount = 6;

[[nodiscard]] constexpr std::string_view to_string(ConflictDimension dim) noexcept {
    switch (dim) {
        case ConflictDimension::File:            return "file";
        case ConflictDimension::Semantic:        return "semantic";
        case ConflictDimension::Resource:        return "resource";
        case ConflictDimension::Interface:       return "interface";
        case ConflictDimension::State:           return "state";
        case ConflictDimension::TestEnvironment: return "test_environment";
    }
    return "unknown";
}

[[nodiscard]] std::optional<ConflictDimension> parse_conflict_dimension(std::string_view text) noexcept;

/**
 * @brief Result of comparing two tasks.
 */
struct ConflictDescriptor {
    std::bitset<kConflictDimensionCount> dimensions;

    [[nodiscard]] bool has_conflict() const noexcept { return dimensions.any(); }
    /// Number of dimensions that conflict (0–6).
    [[nodiscard]] size_t severity() const noexcept { return dimensions.count(); }
    [[nodiscard]] bool has(ConflictDimension dim) const noexcept {
        return dimensions.test(static_cast<size_t>(dim));
    }
    void set(ConflictDimension dim) { dimensions.set(static_cast<size_t>(dim)); }
    [[nodiscard]] std::vector<ConflictDimension> list() const;
    /// Comma-separated dimension names, e.g. "file,state".
    [[nodiscard]] std::string describe() const;

    bool operator==(const ConflictDescriptor&) const = default;
};

/**
 * @brief Symmetric map of unordered task pairs to their conflict descriptor.
 *
 * Only conflicting pairs are stored.
 */
class ConflictMatrix {
public:
    using Pair = std::pair<TaskId, TaskId>;

    void add(const TaskId& a, const TaskId& b, ConflictDescriptor descriptor);

    [[nodiscard]] bool conflicts(const TaskId& a, const TaskId& b) const;
    [[nodiscard]] ConflictDescriptor get(const TaskId& a, const TaskId& b) const;
    [[nodiscard]] std::vector<TaskId> conflicting_with(const TaskId& id) const;
    [[nodiscard]] size_t conflict_count() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// Entries keyed by (min id, max id), in sorted order.
    [[nodiscard]] const std::map<Pair, ConflictDescriptor>& entries() const noexcept {
        return entries_;
    }

    bool operator==(const ConflictMatrix&) const = default;

private:
    static Pair key(const TaskId& a, const TaskId& b);

    std::map<Pair, ConflictDescriptor> entries_;
};

/**
 * @brief Stateless pairwise detector.
 */
class ConflictDetector {
public:
    [[nodiscard]] ConflictDescriptor detect(const TaskModel& a, const TaskModel& b) const;

    /// Compare every unordered pair of tasks.
    [[nodiscard]] ConflictMatrix build_matrix(const std::vector<TaskModel>& tasks) const;

    // Individual dimensions, exposed for testing.
    [[nodiscard]] static bool file_conflict(const TaskFootprint& a, const TaskFootprint& b);
    [[nodiscard]] static bool semantic_conflict(const TaskFootprint& a, const TaskFootprint& b);
    [[nodiscard]] static bool resource_conflict(const TaskFootprint& a, const TaskFootprint& b);
    [[nodiscard]] static bool interface_conflict(const TaskFootprint& a, const TaskFootprint& b);
    [[nodiscard]] static bool state_conflict(const TaskFootprint& a, const TaskFootprint& b);
    [[nodiscard]] static bool test_environment_conflict(const TaskFootprint& a, const TaskFootprint& b);
};

}  // namespace parallel_orchestrator
