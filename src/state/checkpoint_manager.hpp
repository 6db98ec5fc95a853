/**
 * @file checkpoint_manager.hpp
 * @brief Durable, versioned snapshots of a run for crash recovery.
 * @author Dimitris Kafetzis
 *
 * One TOML file per run id under the checkpoint directory. Writes go to a
 * temporary file in the same directory and are renamed over the previous
 * checkpoint, so a reader sees either the old or the new snapshot.
 */

#pragma once

#include "analyzer/conflict_detector.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "workload/task.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace parallel_orchestrator {

/**
 * @brief Everything needed to resume a run without re-analysing it.
 */
struct WorkflowState {
    static constexpr int64_t kSchemaVersion = 1;

    RunId run_id;
    uint64_t sequence = 0;                         ///< Bumped by every save
    RunPhase phase = RunPhase::Initialized;
    uint32_t current_group = 0;                    ///< 0-based index into groups
    Timestamp created_at{};
    Timestamp updated_at{};
    std::vector<std::string> inputs;               ///< Task input files of the run
    std::vector<TaskModel> tasks;
    std::vector<std::vector<TaskId>> groups;
    ConflictMatrix conflicts;

    [[nodiscard]] const TaskModel* find(const TaskId& id) const;
    [[nodiscard]] TaskModel* find(const TaskId& id);
};

class CheckpointManager {
public:
    /// Recorded on attempts that were running when the coordinator died.
    static constexpr std::string_view kInterruptedReason = "interrupted by coordinator restart";

    /**
     * @param max_attempts Retry budget used when recovering interrupted
     *        attempts on load.
     */
    explicit CheckpointManager(std::filesystem::path directory,
                               uint32_t max_attempts = 3,
                               Logger* logger = nullptr);

    /**
     * @brief Atomically persist `state`.
     *
     * Increments `state.sequence` and stamps `updated_at` before writing.
     * Failures are CheckpointIO errors; the caller keeps running in memory.
     */
    Result<void> save(WorkflowState& state);

    /**
     * @brief Read the checkpoint of `run_id` and make it safe to resume.
     *
     * Attempts left running are recorded as failed and re-queued while
     * attempts remain (see recover_interrupted).
     */
    [[nodiscard]] Result<WorkflowState> load(const RunId& run_id) const;

    /// Run ids whose checkpoint phase is not completed, sorted.
    [[nodiscard]] Result<std::vector<RunId>> detect_resumable_runs() const;

    /// Delete the checkpoint of `run_id`. Returns false if none existed.
    Result<bool> remove(const RunId& run_id);

    [[nodiscard]] std::filesystem::path path_for(const RunId& run_id) const;
    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

    // ── Serialization ─────────────────────────

    [[nodiscard]] static std::string serialize(const WorkflowState& state);
    [[nodiscard]] static Result<WorkflowState> parse(std::string_view text, const std::string& source);

    /**
     * @brief Convert Running tasks into a failed attempt.
     * @return Number of tasks recovered.
     *
     * A recovered task is re-queued if it has attempts left, otherwise it
     * ends Failed. Queued and terminal tasks are left as they are.
     */
    static size_t recover_interrupted(WorkflowState& state, uint32_t max_attempts);

private:
    std::filesystem::path directory_;
    uint32_t max_attempts_;
    Logger* logger_;
    std::mutex write_mutex_;
};

}  // namespace parallel_orchestrator
