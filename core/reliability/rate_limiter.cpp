#include "rate_limiter.hpp"

#include <algorithm>
#include <thread>

#include "logging/logger.hpp"

namespace tether {
namespace reliability {

RateLimiter::RateLimiter(RateLimiterConfig config) : config_(config) {
    if (config_.max_requests_per_window < 1) {
        config_.max_requests_per_window = 1;
    }
}

void RateLimiter::purge_locked(Clock::time_point now) const {
    const auto window = std::chrono::milliseconds(config_.window_ms);
    while (!history_.empty() && now - history_.front() >= window) {
        history_.pop_front();
    }
}

std::chrono::milliseconds RateLimiter::acquire() {
    if (!enabled()) {
        return std::chrono::milliseconds(0);
    }

    const auto window = std::chrono::milliseconds(config_.window_ms);
    const auto min_interval = std::chrono::milliseconds(config_.min_interval_ms);
    const size_t max_in_window = static_cast<size_t>(config_.max_requests_per_window);

    Clock::time_point now = Clock::now();
    Clock::time_point start = now;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        purge_locked(now);

        if (history_.size() >= max_in_window) {
            // Oldest entry that has to leave the window before another start is allowed
            start = std::max(start, history_[history_.size() - max_in_window] + window);
        }
        if (last_request_time_) {
            start = std::max(start, *last_request_time_ + min_interval);
        }

        last_request_time_ = start;
        history_.push_back(start);
        while (history_.size() > max_in_window) {
            history_.pop_front();
        }
    }

    auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(start - now);
    if (start > now) {
        LOG_DEBUG("[RateLimiter] Waiting " << wait.count() << "ms");
        std::this_thread::sleep_until(start);
    }
    return wait;
}

size_t RateLimiter::window_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_locked(Clock::now());
    return history_.size();
}

}  // namespace reliability
}  // namespace tether
