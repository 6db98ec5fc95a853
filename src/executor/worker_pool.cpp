/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/worker_pool.hpp"

namespace parallel_orchestrator {

WorkerPool::WorkerPool(size_t num_workers) {
    if (num_workers == 0) num_workers = 1;

    workers_.reserve(num_workers);
    for (size_t i = 0; i < num_workers; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

WorkerPool::~WorkerPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    // jthreads join in their destructors
}

void WorkerPool::worker_loop(std::stop_token stop) {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !jobs_.empty(); });

            if (jobs_.empty()) {
                if (stop.stop_requested()) return;
                continue;
            }
            job = std::move(jobs_.front());
            jobs_.pop();
            ++active_jobs_;
        }

        job();

        {
            std::lock_guard lock(queue_mutex_);
            --active_jobs_;
        }
        idle_cv_.notify_all();
    }
}

void WorkerPool::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return jobs_.empty() && active_jobs_.load() == 0; });
}

size_t WorkerPool::active_count() const noexcept {
    return active_jobs_.load();
}

size_t WorkerPool::queued_count() const {
    std::lock_guard lock(queue_mutex_);
    return jobs_.size();
}

size_t WorkerPool::worker_count() const noexcept {
    return workers_.size();
}

}  // namespace parallel_orchestrator
