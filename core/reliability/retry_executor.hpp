#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <random>
#include <string>

#include "logging/logger.hpp"
#include "reliability_config.hpp"

namespace tether {
namespace reliability {

/**
 * @brief Retries a fallible operation with exponential backoff and jitter
 *
 * Attempt n (1-based) that fails with a retryable error waits
 * min(base_delay_ms * 2^(n-1) * (1 + jitter), max_delay_ms) with jitter drawn
 * uniformly from [0, jitter_factor], then tries again. max_retries counts total
 * attempts. Non-retryable errors and the error of the last attempt propagate
 * unchanged.
 */
class RetryExecutor {
public:
    using RetryPredicate = std::function<bool(const std::exception &)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    // Called before each backoff sleep: (operation key, failed attempt, error, delay)
    using RetryObserver = std::function<void(const std::string &, int, const std::exception &, int)>;

    explicit RetryExecutor(RetryConfig config, RetryPredicate predicate = RetryPredicate());

    template <typename Fn>
    auto run(const std::string &key, Fn &&operation) -> decltype(operation()) {
        const int max_attempts = config_.max_retries > 0 ? config_.max_retries : 1;
        for (int attempt = 1;; ++attempt) {
            try {
                return operation();
            } catch (const std::exception &e) {
                if (!predicate_(e)) {
                    LOG_DEBUG("[Retry] '" << key << "' failed with non-retryable error: " << e.what());
                    throw;
                }
                if (attempt >= max_attempts) {
                    LOG_WARN("[Retry] '" << key << "' failed after " << attempt << " attempt(s): " << e.what());
                    throw;
                }
                int delay_ms = next_delay_ms(attempt);
                LOG_WARN("[Retry] '" << key << "' attempt " << attempt << "/" << max_attempts
                                     << " failed: " << e.what() << " (retry in " << delay_ms << "ms)");
                if (observer_) {
                    observer_(key, attempt, e, delay_ms);
                }
                sleeper_(std::chrono::milliseconds(delay_ms));
            }
        }
    }

    // Delay after failed attempt number attempt, for a given jitter draw
    static int backoff_delay_ms(const RetryConfig &config, int attempt, double jitter);

    // Same with a fresh jitter draw
    int next_delay_ms(int attempt);

    // Transient failures: timeouts, connection/network/socket problems, 429/502/503/504,
    // crashed or disconnected automation backends. Never circuit-open, restart-limit,
    // protocol or invalid-argument errors.
    static bool is_retryable(const std::exception &error);

    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void set_observer(RetryObserver observer) { observer_ = std::move(observer); }

    const RetryConfig &config() const { return config_; }

private:
    RetryConfig config_;
    RetryPredicate predicate_;
    Sleeper sleeper_;
    RetryObserver observer_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

}  // namespace reliability
}  // namespace tether
