/**
 * @file circuit_breaker.cpp
 * @brief CircuitBreaker implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/circuit_breaker.hpp"

#include <algorithm>

namespace parallel_orchestrator {

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, Clock clock)
    : config_(config)
    , clock_(clock ? std::move(clock) : Clock{[] { return std::chrono::steady_clock::now(); }}) {}

void CircuitBreaker::set_listener(Listener listener) {
    std::lock_guard lock(mutex_);
    listener_ = std::move(listener);
}

double CircuitBreaker::rate_locked() const {
    if (window_.empty()) return 0.0;
    auto failures = std::count(window_.begin(), window_.end(), true);
    return static_cast<double>(failures) / static_cast<double>(window_.size());
}

double CircuitBreaker::failure_rate() const {
    std::lock_guard lock(mutex_);
    return rate_locked();
}

void CircuitBreaker::transition(CircuitState to, std::unique_lock<std::mutex>& lock) {
    if (state_ == to) return;
    const auto from = state_;
    const double rate = rate_locked();
    state_ = to;
    if (to == CircuitState::Open) opened_at_ = clock_();
    if (to == CircuitState::Closed) window_.clear();

    auto listener = listener_;
    lock.unlock();
    if (listener) listener(from, to, rate);
    lock.lock();
}

void CircuitBreaker::refresh(std::unique_lock<std::mutex>& lock) {
    if (state_ == CircuitState::Open
        && clock_() - opened_at_ >= std::chrono::milliseconds(config_.cooldown_ms)) {
        transition(CircuitState::HalfOpen, lock);
    }
}

void CircuitBreaker::record(bool success) {
    std::unique_lock lock(mutex_);
    refresh(lock);

    window_.push_back(!success);
    while (window_.size() > config_.window_size) window_.pop_front();

    switch (state_) {
        case CircuitState::HalfOpen:
            transition(success ? CircuitState::Closed : CircuitState::Open, lock);
            break;
        case CircuitState::Closed:
            if (window_.size() >= config_.min_samples && rate_locked() > config_.failure_threshold) {
                transition(CircuitState::Open, lock);
            }
            break;
        case CircuitState::Open:
            break;
    }
}

CircuitState CircuitBreaker::state() {
    std::unique_lock lock(mutex_);
    refresh(lock);
    return state_;
}

size_t CircuitBreaker::allowed_parallelism(size_t max_parallel) {
    return state() == CircuitState::Closed ? std::max<size_t>(max_parallel, 1) : 1;
}

void CircuitBreaker::reset() {
    std::unique_lock lock(mutex_);
    window_.clear();
    transition(CircuitState::Closed, lock);
}

}  // namespace parallel_orchestrator
