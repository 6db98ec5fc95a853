/**
 * @file task_parser.hpp
 * @brief Turns task input files into TaskSpec records.
 * @author Dimitris Kafetzis
 *
 * Supported inputs:
 *   *.toml      : task keys at top level, or a [[task]] array of tables
 *   *.md / text : prompt file; body is the description, the first `#`
 *                 heading the name, file paths are extracted from the text
 */

#pragma once

#include "core/result.hpp"
#include "workload/task.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace parallel_orchestrator {

class TaskParser {
public:
    /// Parse one input file into one or more task specs.
    static Result<std::vector<TaskSpec>> parse_file(const std::filesystem::path& path);

    /// Parse several inputs, preserving order.
    static Result<std::vector<TaskSpec>> parse_files(const std::vector<std::filesystem::path>& paths);

    /// Parse TOML text. `source` is used in error messages.
    static Result<std::vector<TaskSpec>> parse_toml(std::string_view text, const std::string& source);

    /// Parse a free-form prompt document.
    static Result<TaskSpec> parse_prompt(std::string_view text, const std::string& source);

    /// Extract relative source-file paths mentioned in free text, sorted and unique.
    [[nodiscard]] static std::vector<std::string> extract_target_files(std::string_view text);
};

}  // namespace parallel_orchestrator
