/**
 * @file linux_monitor.cpp
 * @brief LinuxMonitor: samples CPU, memory and disk from /proc and
 *        statvfs, plus the pressure assessment shared by every monitor.
 * @author Dimitris Kafetzis
 */

#include "resource_monitor/monitor.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>

#include <sys/statvfs.h>

namespace parallel_orchestrator {

using CpuTimes = LinuxMonitor::CpuTimes;

// ─────────────────────────────────────────────
// Internal helpers for /proc parsing
// ─────────────────────────────────────────────
namespace {

/**
 * @brief Parse the aggregate line of /proc/stat.
 * Format: "cpu user nice system idle iowait irq softirq steal ..."
 */
CpuTimes read_cpu_times() {
    CpuTimes times;
    std::ifstream ifs("/proc/stat");
    std::string line;
    if (!std::getline(ifs, line) || !line.starts_with("cpu ")) return times;

    std::istringstream iss(line);
    std::string label;
    iss >> label >> times.user >> times.nice >> times.system >> times.idle
        >> times.iowait >> times.irq >> times.softirq >> times.steal;
    return times;
}

struct MemInfo {
    uint64_t total_kb{0};
    uint64_t available_kb{0};
};

MemInfo read_meminfo() {
    MemInfo info;
    std::ifstream ifs("/proc/meminfo");
    for (std::string line; std::getline(ifs, line);) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            iss >> info.total_kb;
        } else if (line.starts_with("MemAvailable:")) {
            std::istringstream iss(line.substr(13));
            iss >> info.available_kb;
        }
    }
    return info;
}

std::string percent(float value) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.1f%%", static_cast<double>(value));
    return buf;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Pressure
// ─────────────────────────────────────────────

size_t ResourcePressure::allowed_parallelism(size_t max_parallel) const noexcept {
    if (memory || disk) return 1;
    if (cpu) return std::max<size_t>(1, max_parallel / 2);
    return std::max<size_t>(1, max_parallel);
}

ResourcePressure assess_pressure(const ResourceSnapshot& snapshot, const ResourceConfig& limits) {
    ResourcePressure pressure;
    pressure.cpu = snapshot.cpu_usage_percent > limits.max_cpu_percent;
    pressure.memory = snapshot.memory_usage_percent() > limits.max_memory_percent;
    pressure.disk = snapshot.disk_usage_percent() > limits.max_disk_percent;
    return pressure;
}

std::string describe_pressure(const ResourceSnapshot& snapshot, const ResourceConfig& limits) {
    const auto pressure = assess_pressure(snapshot, limits);
    std::string out;
    auto add = [&out](const char* name, float value, double limit) {
        if (!out.empty()) out += ", ";
        out += std::string{name} + " " + percent(value) + " > " + percent(static_cast<float>(limit));
    };
    if (pressure.cpu) add("cpu", snapshot.cpu_usage_percent, limits.max_cpu_percent);
    if (pressure.memory) add("memory", snapshot.memory_usage_percent(), limits.max_memory_percent);
    if (pressure.disk) add("disk", snapshot.disk_usage_percent(), limits.max_disk_percent);
    return out;
}

// ─────────────────────────────────────────────
// LinuxMonitor implementation
// ─────────────────────────────────────────────

LinuxMonitor::LinuxMonitor(std::filesystem::path disk_path, uint32_t sampling_interval_ms)
    : disk_path_(std::move(disk_path)), interval_ms_(std::max<uint32_t>(sampling_interval_ms, 1)) {}

LinuxMonitor::~LinuxMonitor() {
    stop();
}

float LinuxMonitor::cpu_percent(const CpuTimes& prev, const CpuTimes& curr) noexcept {
    auto prev_total = prev.user + prev.nice + prev.system + prev.idle
                    + prev.iowait + prev.irq + prev.softirq + prev.steal;
    auto curr_total = curr.user + curr.nice + curr.system + curr.idle
                    + curr.iowait + curr.irq + curr.softirq + curr.steal;
    auto prev_active = prev.user + prev.nice + prev.system
                     + prev.irq + prev.softirq + prev.steal;
    auto curr_active = curr.user + curr.nice + curr.system
                     + curr.irq + curr.softirq + curr.steal;

    if (curr_total <= prev_total || curr_active < prev_active) return 0.0f;
    uint64_t total_delta = curr_total - prev_total;
    uint64_t active_delta = std::min(curr_active - prev_active, total_delta);
    return 100.0f * static_cast<float>(active_delta) / static_cast<float>(total_delta);
}

void LinuxMonitor::start() {
    if (sampling_thread_.joinable()) return;
    prev_cpu_times_ = read_cpu_times();
    sampling_thread_ = std::jthread([this](std::stop_token stop) {
        sampling_loop(stop);
    });
}

void LinuxMonitor::stop() {
    if (!sampling_thread_.joinable()) return;
    sampling_thread_.request_stop();
    sampling_thread_.join();
}

Result<ResourceSnapshot> LinuxMonitor::read() {
    auto snapshot = latest_.load();
    if (!snapshot) {
        return Error{ErrorKind::Internal, "no resource snapshot available yet"};
    }
    return *snapshot;
}

void LinuxMonitor::sampling_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(wake_mutex_);
            const bool stopping = wake_.wait_for(lock, stop, std::chrono::milliseconds(interval_ms_),
                                                 [&stop] { return stop.stop_requested(); });
            if (stopping) break;
        }
        latest_.store(std::make_shared<ResourceSnapshot>(sample_once()));
    }
}

ResourceSnapshot LinuxMonitor::sample_once() {
    ResourceSnapshot snap;
    snap.timestamp = std::chrono::system_clock::now();

    auto curr = read_cpu_times();
    snap.cpu_usage_percent = cpu_percent(prev_cpu_times_, curr);
    prev_cpu_times_ = curr;

    auto mem = read_meminfo();
    snap.memory_total_bytes = mem.total_kb * 1024;
    snap.memory_available_bytes = std::min(mem.available_kb, mem.total_kb) * 1024;

    // An unreadable filesystem reports no disk figures rather than pressure.
    struct statvfs vfs{};
    if (::statvfs(disk_path_.c_str(), &vfs) == 0) {
        snap.disk_total_bytes = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
        snap.disk_available_bytes = std::min(static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize,
                                             snap.disk_total_bytes);
    }
    return snap;
}

std::unique_ptr<IResourceMonitor> make_resource_monitor(const Config& config) {
    if (!config.resources.enabled) return nullptr;
    return std::make_unique<LinuxMonitor>(config.resources.disk_path,
                                          config.resources.sample_interval_ms);
}

}  // namespace parallel_orchestrator
