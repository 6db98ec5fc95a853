/**
 * @file monitor.hpp
 * @brief Host resource monitor interface, its implementations, and the
 *        pressure assessment that throttles the execution engine.
 * @author Dimitris Kafetzis
 *
 * LinuxMonitor samples /proc and statvfs on a dedicated std::jthread;
 * MockMonitor returns configured snapshots for tests.
 *
 * Pressure policy:
 *   cpu above max_cpu_percent          → half of max_parallel (at least 1)
 *   memory or disk above their maximum → sequential execution
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace parallel_orchestrator {

struct ResourceSnapshot {
    Timestamp timestamp{};

    float cpu_usage_percent{0.0f};                    ///< Aggregate CPU [0.0, 100.0]

    uint64_t memory_available_bytes{0};
    uint64_t memory_total_bytes{0};

    uint64_t disk_available_bytes{0};                 ///< Filesystem holding the workspaces
    uint64_t disk_total_bytes{0};

    [[nodiscard]] constexpr float memory_usage_percent() const noexcept {
        if (memory_total_bytes == 0) return 0.0f;
        return 100.0f * static_cast<float>(memory_total_bytes - memory_available_bytes)
               / static_cast<float>(memory_total_bytes);
    }

    [[nodiscard]] constexpr float disk_usage_percent() const noexcept {
        if (disk_total_bytes == 0) return 0.0f;
        return 100.0f * static_cast<float>(disk_total_bytes - disk_available_bytes)
               / static_cast<float>(disk_total_bytes);
    }
};

/**
 * @brief Which resources exceed their configured maximum.
 */
struct ResourcePressure {
    bool cpu = false;
    bool memory = false;
    bool disk = false;

    [[nodiscard]] bool any() const noexcept { return cpu || memory || disk; }

    /// Parallelism allowed under this pressure, never below 1.
    [[nodiscard]] size_t allowed_parallelism(size_t max_parallel) const noexcept;
};

[[nodiscard]] ResourcePressure assess_pressure(const ResourceSnapshot& snapshot,
                                               const ResourceConfig& limits);

/// e.g. "cpu 97.0% > 90.0%, disk 96.2% > 95.0%"; empty when nothing is over.
[[nodiscard]] std::string describe_pressure(const ResourceSnapshot& snapshot,
                                            const ResourceConfig& limits);

// ─────────────────────────────────────────────
// Interface
// ─────────────────────────────────────────────

class IResourceMonitor {
public:
    virtual ~IResourceMonitor() = default;

    /// Latest snapshot; an error until the first sample exists.
    virtual Result<ResourceSnapshot> read() = 0;
    virtual void start() = 0;
    virtual void stop() = 0;
};

// ─────────────────────────────────────────────
// LinuxMonitor
// ─────────────────────────────────────────────

/**
 * @brief Reads host resources from Linux pseudo-filesystems.
 *
 * Data sources:
 *   /proc/stat     CPU utilization (delta between samples)
 *   /proc/meminfo  MemTotal and MemAvailable
 *   statvfs(2)     space on the filesystem holding `disk_path`
 *
 * The latest snapshot is published atomically; read() never blocks on
 * the sampling thread.
 */
class LinuxMonitor final : public IResourceMonitor {
public:
    explicit LinuxMonitor(std::filesystem::path disk_path, uint32_t sampling_interval_ms = 1000);
    ~LinuxMonitor() override;

    LinuxMonitor(const LinuxMonitor&) = delete;
    LinuxMonitor& operator=(const LinuxMonitor&) = delete;

    Result<ResourceSnapshot> read() override;
    void start() override;
    void stop() override;

    struct CpuTimes {
        uint64_t user{0}, nice{0}, system{0}, idle{0};
        uint64_t iowait{0}, irq{0}, softirq{0}, steal{0};
    };

    /// Active share of the jiffies elapsed between two /proc/stat samples.
    [[nodiscard]] static float cpu_percent(const CpuTimes& prev, const CpuTimes& curr) noexcept;

private:
    void sampling_loop(std::stop_token stop);
    ResourceSnapshot sample_once();

    std::filesystem::path disk_path_;
    uint32_t interval_ms_;
    std::jthread sampling_thread_;
    std::mutex wake_mutex_;
    std::condition_variable_any wake_;
    std::atomic<std::shared_ptr<ResourceSnapshot>> latest_;
    CpuTimes prev_cpu_times_{};
};

// ─────────────────────────────────────────────
// MockMonitor
// ─────────────────────────────────────────────

/**
 * @brief Configurable monitor for tests. Thread-safe, so a test may change
 *        the snapshot while an engine is dispatching.
 *
 * Default snapshot: 25% cpu, 4 GiB memory with 2 GiB available, 100 GiB
 * disk with 60 GiB available.
 */
class MockMonitor final : public IResourceMonitor {
public:
    MockMonitor();

    Result<ResourceSnapshot> read() override;
    void start() override;
    void stop() override;

    void push_snapshot(ResourceSnapshot snapshot);
    void set_static_snapshot(ResourceSnapshot snapshot);
    void set_cpu(float percent);
    void set_memory(uint64_t available, uint64_t total);
    void set_disk(uint64_t available, uint64_t total);
    /// read() fails until cleared, as before a first sample.
    void set_unavailable(bool unavailable);

    [[nodiscard]] bool running() const;
    [[nodiscard]] size_t read_count() const;

private:
    mutable std::mutex mutex_;
    std::vector<ResourceSnapshot> sequence_;
    size_t index_{0};
    ResourceSnapshot static_snapshot_;
    bool use_static_{true};
    bool unavailable_{false};
    bool running_{false};
    size_t reads_{0};
};

/**
 * @brief Monitor selected by `config.resources`: LinuxMonitor when enabled,
 *        nullptr otherwise.
 */
std::unique_ptr<IResourceMonitor> make_resource_monitor(const Config& config);

}  // namespace parallel_orchestrator
