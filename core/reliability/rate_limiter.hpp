#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "reliability_config.hpp"

namespace tether {
namespace reliability {

// RateLimiter spaces outbound calls by min_interval_ms and caps them at
// max_requests_per_window per sliding window.
//
// acquire() reserves the earliest permitted start time under the mutex and then
// sleeps outside it, so concurrent callers are spaced relative to each other
// without serialising their waits.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(RateLimiterConfig config);

    // Blocks until the caller may proceed. Returns the time spent waiting.
    std::chrono::milliseconds acquire();

    bool enabled() const { return config_.min_interval_ms > 0; }

    // Permitted starts still inside the window (including reserved future ones)
    size_t window_size() const;

    const RateLimiterConfig &config() const { return config_; }

private:
    RateLimiterConfig config_;

    mutable std::mutex mutex_;
    std::optional<Clock::time_point> last_request_time_;
    mutable std::deque<Clock::time_point> history_;  // ascending start times

    void purge_locked(Clock::time_point now) const;
};

}  // namespace reliability
}  // namespace tether
