#pragma once

#include <atomic>
#include <chrono>
#include <optional>

/**
 * @brief Cooperative stop signal shared between a caller and long running walks.
 *
 * A token is cancelled once requestStop() has been called or its deadline
 * has passed. Workers poll isCancelled() between units of work.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    explicit CancellationToken(Clock::duration timeout)
        : deadline_(Clock::now() + timeout) {}

    // Safe to call from a signal handler
    void requestStop() { stopRequested_.store(true, std::memory_order_relaxed); }

    void setDeadline(Clock::time_point deadline) { deadline_ = deadline; }

    bool isCancelled() const {
        if (stopRequested_.load(std::memory_order_relaxed)) {
            return true;
        }
        return deadline_ && Clock::now() >= *deadline_;
    }

    bool stopRequested() const { return stopRequested_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> stopRequested_{false};
    std::optional<Clock::time_point> deadline_;
};
