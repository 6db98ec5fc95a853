/**
 * @file process.hpp
 * @brief Child process execution with captured output, deadlines and
 *        cooperative stop.
 * @author Dimitris Kafetzis
 *
 * The child runs in its own process group. On timeout or stop request the
 * group receives SIGTERM, then SIGKILL once the grace period has passed.
 * Output pipes are drained with poll() so a chatty child never blocks on a
 * full pipe.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace parallel_orchestrator {

struct ProcessOptions {
    std::vector<std::string> argv;                 ///< argv[0] is resolved through PATH
    std::filesystem::path working_dir;             ///< Empty = inherit
    std::optional<std::filesystem::path> stdout_path;
    std::optional<std::filesystem::path> stderr_path;
    Duration timeout{0};                           ///< Zero disables the deadline
    Duration kill_grace{2000};                     ///< SIGTERM → SIGKILL delay
    Duration poll_interval{50};
};

struct ProcessOutcome {
    int exit_code = -1;                            ///< -1 when killed by a signal
    int term_signal = 0;
    bool timed_out = false;
    bool stopped = false;                          ///< Terminated because of a stop request
    std::string stdout_text;                       ///< Capped at kMaxCapturedBytes
    std::string stderr_text;
    Duration elapsed{0};
};

inline constexpr size_t kMaxCapturedBytes = 1024 * 1024;

/**
 * @brief Spawn `options.argv` and wait for it to finish.
 *
 * Returns an error only when the process could not be started or its
 * output files could not be opened; a non-zero exit, timeout or stop is
 * reported through ProcessOutcome.
 */
Result<ProcessOutcome> run_process(const ProcessOptions& options,
                                   std::stop_token stop = {});

}  // namespace parallel_orchestrator
