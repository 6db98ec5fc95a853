/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <utility>

namespace parallel_orchestrator {

namespace {

std::vector<std::string> string_array(toml::node_view<toml::node> node,
                                      const std::vector<std::string>& fallback) {
    auto* arr = node.as_array();
    if (!arr) return fallback;

    std::vector<std::string> out;
    out.reserve(arr->size());
    for (const auto& elem : *arr) {
        if (auto s = elem.value<std::string>()) {
            out.push_back(*s);
        }
    }
    return out;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::InvalidArgument,
                     "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [orchestrator]
        if (auto orch = tbl["orchestrator"]; orch.is_table()) {
            config.orchestrator.max_parallel = static_cast<uint32_t>(
                orch["max_parallel"].value_or(int64_t{3}));
            config.orchestrator.per_task_timeout_ms = static_cast<uint64_t>(
                orch["per_task_timeout_ms"].value_or(int64_t{600000}));
            config.orchestrator.poll_interval_ms = static_cast<uint32_t>(
                orch["poll_interval_ms"].value_or(int64_t{100}));
            config.orchestrator.run_root =
                orch["run_root"].value_or(std::string{".orchestrator"});
        }

        // [retry]
        if (auto retry = tbl["retry"]; retry.is_table()) {
            config.retry.max_attempts = static_cast<uint32_t>(
                retry["max_attempts"].value_or(int64_t{3}));
            config.retry.base_delay_ms = static_cast<uint64_t>(
                retry["base_delay_ms"].value_or(int64_t{1000}));
            config.retry.max_delay_ms = static_cast<uint64_t>(
                retry["max_delay_ms"].value_or(int64_t{60000}));
        }

        // [circuit_breaker]
        if (auto cb = tbl["circuit_breaker"]; cb.is_table()) {
            config.circuit_breaker.failure_threshold =
                cb["failure_threshold"].value_or(0.5);
            config.circuit_breaker.window_size = static_cast<uint32_t>(
                cb["window_size"].value_or(int64_t{10}));
            config.circuit_breaker.min_samples = static_cast<uint32_t>(
                cb["min_samples"].value_or(int64_t{4}));
            config.circuit_breaker.cooldown_ms = static_cast<uint64_t>(
                cb["cooldown_ms"].value_or(int64_t{30000}));
        }

        // [analyzer]
        if (auto analyzer = tbl["analyzer"]; analyzer.is_table()) {
            config.analyzer.medium_threshold = analyzer["medium_threshold"].value_or(4.0);
            config.analyzer.high_threshold = analyzer["high_threshold"].value_or(8.0);
            config.analyzer.decomposition_threshold =
                analyzer["decomposition_threshold"].value_or(10.0);
            config.analyzer.max_subtasks = static_cast<uint32_t>(
                analyzer["max_subtasks"].value_or(int64_t{4}));
            config.analyzer.base_minutes = static_cast<uint32_t>(
                analyzer["base_minutes"].value_or(int64_t{10}));
            config.analyzer.high_risk_keywords = string_array(
                analyzer["high_risk_keywords"], config.analyzer.high_risk_keywords);
        }

        // [workspace]
        if (auto ws = tbl["workspace"]; ws.is_table()) {
            config.workspace.backend = ws["backend"].value_or(std::string{"git"});
            config.workspace.repository = ws["repository"].value_or(std::string{"."});
            config.workspace.root = ws["root"].value_or(std::string{".worktrees"});
            config.workspace.base_ref = ws["base_ref"].value_or(std::string{"main"});
            config.workspace.branch_prefix =
                ws["branch_prefix"].value_or(std::string{"orchestrator/"});
            config.workspace.cleanup_on_success = ws["cleanup_on_success"].value_or(true);
            config.workspace.preserve_on_failure = ws["preserve_on_failure"].value_or(false);
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            config.executor.strategy = executor["strategy"].value_or(std::string{"process"});
            config.executor.command = string_array(executor["command"], config.executor.command);
            config.executor.container_image =
                executor["container_image"].value_or(std::string{"ubuntu:24.04"});
            config.executor.container_runtime =
                executor["container_runtime"].value_or(std::string{"docker"});
        }

        // [resources]
        if (auto res = tbl["resources"]; res.is_table()) {
            config.resources.enabled = res["enabled"].value_or(true);
            config.resources.sample_interval_ms = static_cast<uint32_t>(
                res["sample_interval_ms"].value_or(int64_t{1000}));
            config.resources.max_cpu_percent = res["max_cpu_percent"].value_or(90.0);
            config.resources.max_memory_percent = res["max_memory_percent"].value_or(85.0);
            config.resources.max_disk_percent = res["max_disk_percent"].value_or(95.0);
            config.resources.disk_path = res["disk_path"].value_or(std::string{"."});
        }

        // [state]
        if (auto state = tbl["state"]; state.is_table()) {
            config.state.checkpoint_dir =
                state["checkpoint_dir"].value_or(std::string{".orchestrator/checkpoints"});
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.audit_log = telemetry["audit_log"].value_or(std::string{"audit"});
        }

        if (auto valid = validate_config(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::InvalidArgument,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    if (config.orchestrator.max_parallel == 0) {
        return Error{ErrorKind::InvalidArgument, "orchestrator.max_parallel must be >= 1"};
    }
    if (config.orchestrator.poll_interval_ms == 0) {
        return Error{ErrorKind::InvalidArgument, "orchestrator.poll_interval_ms must be >= 1"};
    }
    if (config.retry.max_attempts == 0) {
        return Error{ErrorKind::InvalidArgument, "retry.max_attempts must be >= 1"};
    }
    if (config.retry.max_delay_ms < config.retry.base_delay_ms) {
        return Error{ErrorKind::InvalidArgument, "retry.max_delay_ms must be >= base_delay_ms"};
    }
    if (config.circuit_breaker.failure_threshold <= 0.0
        || config.circuit_breaker.failure_threshold > 1.0) {
        return Error{ErrorKind::InvalidArgument,
                     "circuit_breaker.failure_threshold must be in (0, 1]"};
    }
    if (config.circuit_breaker.window_size == 0) {
        return Error{ErrorKind::InvalidArgument, "circuit_breaker.window_size must be >= 1"};
    }
    if (config.analyzer.medium_threshold > config.analyzer.high_threshold) {
        return Error{ErrorKind::InvalidArgument,
                     "analyzer.medium_threshold must not exceed high_threshold"};
    }
    if (config.analyzer.max_subtasks < 2) {
        return Error{ErrorKind::InvalidArgument, "analyzer.max_subtasks must be >= 2"};
    }
    if (config.workspace.backend != "git" && config.workspace.backend != "directory") {
        return Error{ErrorKind::InvalidArgument,
                     "workspace.backend must be \"git\" or \"directory\""};
    }
    if (config.executor.strategy != "process" && config.executor.strategy != "container") {
        return Error{ErrorKind::InvalidArgument,
                     "executor.strategy must be \"process\" or \"container\""};
    }
    if (config.executor.command.empty()) {
        return Error{ErrorKind::InvalidArgument, "executor.command must not be empty"};
    }
    if (config.resources.sample_interval_ms == 0) {
        return Error{ErrorKind::InvalidArgument, "resources.sample_interval_ms must be >= 1"};
    }
    for (auto [name, value] : {std::pair{"resources.max_cpu_percent", config.resources.max_cpu_percent},
                               std::pair{"resources.max_memory_percent", config.resources.max_memory_percent},
                               std::pair{"resources.max_disk_percent", config.resources.max_disk_percent}}) {
        if (value <= 0.0 || value > 100.0) {
            return Error{ErrorKind::InvalidArgument, std::string{name} + " must be in (0, 100]"};
        }
    }
    return Result<void>{};
}

}  // namespace parallel_orchestrator
