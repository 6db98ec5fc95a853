/**
 * @file circuit_breaker.hpp
 * @brief Failure-rate circuit breaker that throttles the engine to
 *        sequential execution.
 * @author Dimitris Kafetzis
 *
 *   Closed ──(failure rate > threshold)──► Open
 *   Open ──(cooldown elapsed)──► HalfOpen
 *   HalfOpen ──(success)──► Closed
 *   HalfOpen ──(failure)──► Open
 *
 * While Open or HalfOpen the engine runs at most one task at a time.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string_view>

namespace parallel_orchestrator {

enum class CircuitState : uint8_t {
    Closed,
    Open,
    HalfOpen
};

[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::Closed:   return "closed";
        case CircuitState::Open:     return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "unknown";
}

class CircuitBreaker {
public:
    using Clock = std::function<SteadyTime()>;
    /// Called as (from, to, failure rate at the time of the change).
    using Listener = std::function<void(CircuitState, CircuitState, double)>;

    explicit CircuitBreaker(CircuitBreakerConfig config, Clock clock = {});

    /// Record the outcome of one finished attempt.
    void record(bool success);

    [[nodiscard]] CircuitState state();
    /// `max_parallel` while closed, 1 otherwise.
    [[nodiscard]] size_t allowed_parallelism(size_t max_parallel);
    /// Failed fraction of the current window (0 when empty).
    [[nodiscard]] double failure_rate() const;

    void set_listener(Listener listener);
    void reset();

private:
    void transition(CircuitState to, std::unique_lock<std::mutex>& lock);
    void refresh(std::unique_lock<std::mutex>& lock);
    [[nodiscard]] double rate_locked() const;

    CircuitBreakerConfig config_;
    Clock clock_;
    Listener listener_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::Closed;
    std::deque<bool> window_;                  ///< true = failure
    SteadyTime opened_at_{};
};

}  // namespace parallel_orchestrator
