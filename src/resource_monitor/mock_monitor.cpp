/**
 * @file mock_monitor.cpp
 * @brief MockMonitor implementation: configurable resource snapshots for testing.
 * @author Dimitris Kafetzis
 */

#include "resource_monitor/monitor.hpp"

namespace parallel_orchestrator {

MockMonitor::MockMonitor() {
    static_snapshot_.cpu_usage_percent = 25.0f;
    static_snapshot_.memory_total_bytes = 4ULL * 1024 * 1024 * 1024;     // 4 GiB
    static_snapshot_.memory_available_bytes = 2ULL * 1024 * 1024 * 1024; // 2 GiB
    static_snapshot_.disk_total_bytes = 100ULL * 1024 * 1024 * 1024;
    static_snapshot_.disk_available_bytes = 60ULL * 1024 * 1024 * 1024;
}

Result<ResourceSnapshot> MockMonitor::read() {
    std::lock_guard lock(mutex_);
    ++reads_;
    if (unavailable_) {
        return Error{ErrorKind::Internal, "no resource snapshot available yet"};
    }
    if (use_static_) {
        static_snapshot_.timestamp = std::chrono::system_clock::now();
        return static_snapshot_;
    }
    if (index_ >= sequence_.size()) {
        return Error{ErrorKind::Internal, "mock sequence exhausted"};
    }
    auto snap = sequence_[index_++];
    snap.timestamp = std::chrono::system_clock::now();
    return snap;
}

void MockMonitor::start() {
    std::lock_guard lock(mutex_);
    running_ = true;
}

void MockMonitor::stop() {
    std::lock_guard lock(mutex_);
    running_ = false;
}

void MockMonitor::push_snapshot(ResourceSnapshot snapshot) {
    std::lock_guard lock(mutex_);
    use_static_ = false;
    sequence_.push_back(std::move(snapshot));
}

void MockMonitor::set_static_snapshot(ResourceSnapshot snapshot) {
    std::lock_guard lock(mutex_);
    use_static_ = true;
    static_snapshot_ = std::move(snapshot);
}

void MockMonitor::set_cpu(float percent) {
    std::lock_guard lock(mutex_);
    static_snapshot_.cpu_usage_percent = percent;
}

void MockMonitor::set_memory(uint64_t available, uint64_t total) {
    std::lock_guard lock(mutex_);
    static_snapshot_.memory_available_bytes = available;
    static_snapshot_.memory_total_bytes = total;
}

void MockMonitor::set_disk(uint64_t available, uint64_t total) {
    std::lock_guard lock(mutex_);
    static_snapshot_.disk_available_bytes = available;
    static_snapshot_.disk_total_bytes = total;
}

void MockMonitor::set_unavailable(bool unavailable) {
    std::lock_guard lock(mutex_);
    unavailable_ = unavailable;
}

bool MockMonitor::running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

size_t MockMonitor::read_count() const {
    std::lock_guard lock(mutex_);
    return reads_;
}

}  // namespace parallel_orchestrator
