/**
 * @file main.cpp
 * @brief parallel_orchestrator command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into one run:
 *   Config → Logger → Coordinator (Analyzer → Workspaces → Engine → Checkpoints) → Report
 *
 * Exit status: 0 when every task succeeded, 1 when any task did not,
 * 2 on configuration, input or analysis errors.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/coordinator.hpp"
#include "orchestrator/report.hpp"
#include "telemetry/json_sink.hpp"

#include <charconv>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace parallel_orchestrator;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitTaskFailure = 1;
constexpr int kExitFatal = 2;

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    bool config_given = false;
    std::optional<uint32_t> max_parallel;
    std::optional<uint64_t> timeout_seconds;
    std::optional<std::string> log_level;
    std::optional<RunId> resume;
    bool list_resumable = false;
    bool dry_run = false;
    std::vector<std::filesystem::path> inputs;
};

void print_usage() {
    std::cout << "Usage: parallel_orchestrator [OPTIONS] task-files...\n"
              << "  --config <path>        Configuration file (default: config/default.toml)\n"
              << "  --max-parallel <n>     Maximum concurrently running tasks\n"
              << "  --timeout <seconds>    Per-task timeout\n"
              << "  --log-level <level>    debug, info, warn or error\n"
              << "  --resume <run-id>      Continue an interrupted run\n"
              << "  --list-resumable       List runs that can be resumed\n"
              << "  --dry-run              Print the group plan without executing\n"
              << "  --help, -h             Show this help message\n";
}

template <typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string{argv[++i]};
        };

        if (arg == "--config") {
            auto v = next();
            if (!v) return Error{ErrorKind::InvalidArgument, "--config needs a path"};
            args.config_path = *v;
            args.config_given = true;
        } else if (arg == "--max-parallel") {
            auto v = next();
            auto n = v ? parse_number<uint32_t>(*v) : std::nullopt;
            if (!n || *n == 0) return Error{ErrorKind::InvalidArgument, "--max-parallel needs a positive integer"};
            args.max_parallel = *n;
        } else if (arg == "--timeout") {
            auto v = next();
            auto n = v ? parse_number<uint64_t>(*v) : std::nullopt;
            if (!n) return Error{ErrorKind::InvalidArgument, "--timeout needs a number of seconds"};
            args.timeout_seconds = *n;
        } else if (arg == "--log-level") {
            auto v = next();
            if (!v) return Error{ErrorKind::InvalidArgument, "--log-level needs a value"};
            args.log_level = *v;
        } else if (arg == "--resume") {
            auto v = next();
            if (!v) return Error{ErrorKind::InvalidArgument, "--resume needs a run id"};
            args.resume = *v;
        } else if (arg == "--list-resumable") {
            args.list_resumable = true;
        } else if (arg == "--dry-run") {
            args.dry_run = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(kExitSuccess);
        } else if (arg.starts_with("--")) {
            return Error{ErrorKind::InvalidArgument, "unknown option " + arg};
        } else {
            args.inputs.emplace_back(arg);
        }
    }

    if (!args.list_resumable && !args.resume && args.inputs.empty()) {
        return Error{ErrorKind::InvalidArgument, "no task files given"};
    }
    return args;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << args_result.error().describe() << "\n";
        print_usage();
        return kExitFatal;
    }
    auto args = *args_result;

    // Load configuration
    Config config = default_config();
    if (args.config_given || std::filesystem::exists(args.config_path)) {
        auto config_result = load_config(args.config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().describe() << std::endl;
            return kExitFatal;
        }
        config = *config_result;
    }

    // Apply CLI overrides
    if (args.max_parallel) config.orchestrator.max_parallel = *args.max_parallel;
    if (args.timeout_seconds) config.orchestrator.per_task_timeout_ms = *args.timeout_seconds * 1000;
    if (args.log_level) config.telemetry.log_level = *args.log_level;

    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Unknown log level '" << config.telemetry.log_level << "'" << std::endl;
        return kExitFatal;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "parallel_orchestrator",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }

    Coordinator::Options opts;
    opts.config = config;
    opts.log_sink = std::move(log_sink);
    opts.log_level = *level;

    auto created = Coordinator::create(std::move(opts));
    if (!created) {
        std::cerr << created.error().describe() << std::endl;
        return kExitFatal;
    }
    auto coordinator = std::move(*created);

    // ── Read-only modes ──────────────────────
    if (args.list_resumable) {
        auto runs = coordinator->resumable_runs();
        if (!runs) {
            std::cerr << runs.error().describe() << std::endl;
            return kExitFatal;
        }
        for (const auto& run : *runs) std::cout << run << "\n";
        return kExitSuccess;
    }

    if (args.dry_run) {
        auto analysis = coordinator->plan(args.inputs);
        if (!analysis) {
            std::cerr << analysis.error().describe() << std::endl;
            return kExitFatal;
        }
        std::cout << render_plan(analysis->graph.tasks(), analysis->groups, analysis->conflicts);
        return kExitSuccess;
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::jthread signal_watcher([&coordinator](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (g_shutdown_requested) {
                coordinator->cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto report = args.resume ? coordinator->resume(*args.resume) : coordinator->run(args.inputs);

    signal_watcher.request_stop();
    signal_watcher.join();

    if (!report) {
        std::cerr << report.error().describe() << std::endl;
        return kExitFatal;
    }

    std::cout << report->render();
    return report->all_succeeded() ? kExitSuccess : kExitTaskFailure;
}
