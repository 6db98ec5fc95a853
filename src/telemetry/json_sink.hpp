/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: rotating file, stdout, null and in-memory.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace parallel_orchestrator {

/**
 * @brief Writes NDJSON to rotating log files.
 *
 * The active file is `<log_dir>/<prefix>.ndjson`. When it grows past
 * max_file_size_mb it is renamed to `<prefix>.1.ndjson`, older files shift
 * up by one and anything beyond max_files is deleted.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Keeps every line in memory. Used by tests to inspect log output.
 *
 * The line buffer is shared so a test can keep a handle after the sink
 * has been moved into a Logger.
 */
class MemorySink : public ILogSink {
public:
    struct Buffer {
        std::mutex mutex;
        std::vector<std::string> lines;
    };

    MemorySink();

    void write(std::string_view json_line) override;
    void flush() override {}

    [[nodiscard]] std::shared_ptr<Buffer> buffer() const noexcept { return buffer_; }
    [[nodiscard]] std::vector<std::string> lines() const;

private:
    std::shared_ptr<Buffer> buffer_;
};

}  // namespace parallel_orchestrator
