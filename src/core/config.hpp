/**
 * @file config.hpp
 * @brief Orchestrator configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace parallel_orchestrator {

struct OrchestratorConfig {
    uint32_t max_parallel = 3;
    uint64_t per_task_timeout_ms = 600000;
    uint32_t poll_interval_ms = 100;
    std::filesystem::path run_root = ".orchestrator";
};

struct RetryConfig {
    uint32_t max_attempts = 3;
    uint64_t base_delay_ms = 1000;
    uint64_t max_delay_ms = 60000;
};

struct CircuitBreakerConfig {
    double failure_threshold = 0.5;     ///< Failed fraction of the window that trips
    uint32_t window_size = 10;          ///< Most recent attempt outcomes considered
    uint32_t min_samples = 4;
    uint64_t cooldown_ms = 30000;
};

struct AnalyzerConfig {
    double medium_threshold = 4.0;
    double high_threshold = 8.0;
    double decomposition_threshold = 10.0;
    uint32_t max_subtasks = 4;
    uint32_t base_minutes = 10;
    std::vector<std::string> high_risk_keywords = {
        "migration", "schema", "refactor", "security", "authentication",
        "concurrency", "database", "breaking", "rewrite", "performance"
    };
};

struct WorkspaceConfig {
    std::string backend = "git";        ///< "git", "directory"
    std::filesystem::path repository = ".";
    std::filesystem::path root = ".worktrees";
    std::string base_ref = "main";
    std::string branch_prefix = "orchestrator/";
    bool cleanup_on_success = true;
    bool preserve_on_failure = false;
};

struct ExecutorConfig {
    std::string strategy = "process";   ///< "process", "container"
    std::vector<std::string> command = {"claude", "-p", "{description}"};
    std::string container_image = "ubuntu:24.04";
    std::string container_runtime = "docker";
};

struct ResourceConfig {
    bool enabled = true;
    uint32_t sample_interval_ms = 1000;
    double max_cpu_percent = 90.0;      ///< Above: half of max_parallel
    double max_memory_percent = 85.0;   ///< Above: sequential
    double max_disk_percent = 95.0;     ///< Above: sequential
    std::filesystem::path disk_path = ".";
};

struct StateConfig {
    std::filesystem::path checkpoint_dir = ".orchestrator/checkpoints";
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    std::string audit_log = "audit";
};

/**
 * @brief Top-level orchestrator configuration.
 */
struct Config {
    OrchestratorConfig orchestrator;
    RetryConfig retry;
    CircuitBreakerConfig circuit_breaker;
    AnalyzerConfig analyzer;
    WorkspaceConfig workspace;
    ExecutorConfig executor;
    ResourceConfig resources;
    StateConfig state;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Out-of-range values (zero parallelism,
 * zero attempts, thresholds outside their domain) are rejected.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Check cross-field invariants of a configuration.
 */
Result<void> validate_config(const Config& config);

}  // namespace parallel_orchestrator
