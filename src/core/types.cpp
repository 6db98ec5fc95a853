/**
 * @file types.cpp
 * @brief String parsing for the shared enumerations.
 */

#include "core/types.hpp"

#include <array>
#include <utility>

namespace parallel_orchestrator {

namespace {

template <typename Enum, size_t N>
std::optional<Enum> parse_enum(std::string_view text, const std::array<Enum, N>& values) {
    for (auto value : values) {
        if (to_string(value) == text) return value;
    }
    return std::nullopt;
}

}  // anonymous namespace

std::optional<TaskStatus> parse_task_status(std::string_view text) noexcept {
    static constexpr std::array values{
        TaskStatus::Queued, TaskStatus::Running, TaskStatus::Succeeded,
        TaskStatus::Failed, TaskStatus::TimedOut, TaskStatus::Cancelled
    };
    return parse_enum(text, values);
}

std::optional<Complexity> parse_complexity(std::string_view text) noexcept {
    static constexpr std::array values{
        Complexity::Low, Complexity::Medium, Complexity::High
    };
    return parse_enum(text, values);
}

std::optional<RunPhase> parse_run_phase(std::string_view text) noexcept {
    static constexpr std::array values{
        RunPhase::Initialized, RunPhase::Analyzed, RunPhase::Executing,
        RunPhase::Completed, RunPhase::Failed, RunPhase::Cancelled
    };
    return parse_enum(text, values);
}

}  // namespace parallel_orchestrator
