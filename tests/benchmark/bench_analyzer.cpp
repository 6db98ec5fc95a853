/**
 * @file bench_analyzer.cpp
 * @brief Performance benchmarks for task analysis and coordinator bookkeeping.
 * @author Dimitris Kafetzis
 *
 * Measures planning overhead (graph validation, pairwise conflict detection,
 * group computation) and the per-transition costs paid during a run
 * (registry updates, checkpoint serialization, worker hand-off).
 *
 * Usage: ./bench_analyzer [--csv]
 */

#include "analyzer/complexity_estimator.hpp"
#include "analyzer/conflict_detector.hpp"
#include "analyzer/task_analyzer.hpp"
#include "core/types.hpp"
#include "executor/process_registry.hpp"
#include "executor/worker_pool.hpp"
#include "state/checkpoint_manager.hpp"
#include "workload/task_graph.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <future>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace parallel_orchestrator;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Workloads
// ─────────────────────────────────────────────

/// `n` specs in layers of `width`; each task depends on one task of the
/// previous layer and every fourth task shares a file with its neighbour.
std::vector<TaskSpec> layered_specs(size_t n, size_t width) {
    std::vector<TaskSpec> specs;
    specs.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        TaskSpec s;
        s.name = "t" + std::to_string(i);
        s.description = "Refactor module " + std::to_string(i) + " and update its tests";
        s.footprint.target_files = {"src/mod" + std::to_string(i / 4) + ".cpp",
                                    "tests/test_mod" + std::to_string(i) + ".cpp"};
        s.footprint.components = {"component-" + std::to_string(i % 7)};
        if (i >= width) s.depends_on = {"t" + std::to_string(i - width)};
        specs.push_back(std::move(s));
    }
    return specs;
}

std::vector<TaskModel> to_models(const std::vector<TaskSpec>& specs) {
    std::vector<TaskModel> tasks;
    tasks.reserve(specs.size());
    for (size_t i = 0; i < specs.size(); ++i) {
        TaskModel t;
        t.id = specs[i].name;
        t.name = specs[i].name;
        t.description = specs[i].description;
        t.footprint = specs[i].footprint;
        t.dependencies = specs[i].depends_on;
        t.estimated_duration = std::chrono::minutes(10 + static_cast<int>(i % 5));
        tasks.push_back(std::move(t));
    }
    return tasks;
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_graph() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;

    for (size_t n : {10, 50, 200}) {
        auto models = to_models(layered_specs(n, 5));
        R.push_back(run_bench("graph_build(" + std::to_string(n) + ")", "Task Graph", N,
            [&]{ auto g = TaskGraph::build(models); (void)g; }, std::to_string(n) + " tasks"));

        auto graph = TaskGraph::build(models);
        if (!graph) continue;
        R.push_back(run_bench("topo_order(" + std::to_string(n) + ")", "Task Graph", N,
            [&]{ auto o = graph->topological_order(); (void)o; }, std::to_string(n) + " tasks"));
        R.push_back(run_bench("find_cycle(" + std::to_string(n) + ")", "Task Graph", N,
            [&]{ auto c = graph->find_cycle(); (void)c; }, std::to_string(n) + " tasks"));
    }
    return R;
}

std::vector<BenchResult> bench_analysis() {
    std::vector<BenchResult> R;
    ConflictDetector detector;
    ComplexityEstimator estimator;
    TaskAnalyzer analyzer;

    for (size_t n : {10, 50, 200}) {
        auto specs = layered_specs(n, 5);
        auto models = to_models(specs);
        auto label = std::to_string(n) + " tasks";
        const size_t iters = n >= 200 ? 50 : 200;

        R.push_back(run_bench("conflict_matrix(" + std::to_string(n) + ")", "Analysis", iters,
            [&]{ auto m = detector.build_matrix(models); (void)m; },
            std::to_string(n * (n - 1) / 2) + " pairs"));

        R.push_back(run_bench("complexity(" + std::to_string(n) + ")", "Analysis", iters,
            [&]{
                for (const auto& t : models) {
                    auto e = estimator.estimate(t.footprint, t.description, t.dependencies.size());
                    (void)e;
                }
            }, label));

        auto graph = TaskGraph::build(models);
        if (graph) {
            auto matrix = detector.build_matrix(models);
            R.push_back(run_bench("compute_groups(" + std::to_string(n) + ")", "Analysis", iters,
                [&]{ auto g = TaskAnalyzer::compute_groups(*graph, matrix); (void)g; }, label));
        }

        R.push_back(run_bench("analyze(" + std::to_string(n) + ")", "Analysis", iters,
            [&]{ auto a = analyzer.analyze(specs); (void)a; }, label));
    }
    return R;
}

std::vector<BenchResult> bench_runtime() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;

    R.push_back(run_bench("registry_attempt_cycle", "Runtime", N, [&]{
        ProcessRegistry reg;
        TaskModel t;
        t.id = "bench";
        (void)reg.register_task(t);
        (void)reg.mark_running("bench");
        ExecutionResult r;
        r.task_id = "bench";
        r.attempt = 1;
        r.status = TaskStatus::Succeeded;
        (void)reg.finish_attempt(r, false);
    }, "register+run+finish"));

    TaskAnalyzer analyzer;
    auto analysis = analyzer.analyze(layered_specs(50, 5));
    if (analysis) {
        WorkflowState state;
        state.run_id = "run-bench";
        state.phase = RunPhase::Executing;
        state.tasks = analysis->graph.tasks();
        state.groups = analysis->groups;
        state.conflicts = analysis->conflicts;

        auto text = CheckpointManager::serialize(state);
        R.push_back(run_bench("checkpoint_serialize(50)", "Runtime", N,
            [&]{ auto s = CheckpointManager::serialize(state); (void)s; },
            std::to_string(text.size()) + " bytes"));
        R.push_back(run_bench("checkpoint_parse(50)", "Runtime", N,
            [&]{ auto s = CheckpointManager::parse(text, "bench"); (void)s; },
            std::to_string(text.size()) + " bytes"));
    }

    WorkerPool pool(4);
    R.push_back(run_bench("worker_pool_submit", "Runtime", N, [&]{
        auto f = pool.submit([]{ return 1; });
        f.wait();
    }));

    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  ParallelOrchestrator Performance Benchmarks\n"
                  << "  " << std::string(44, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_graph());
    append(bench_analysis());
    append(bench_runtime());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
