#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "client/errors.hpp"
#include "reliability_config.hpp"

namespace tether {
namespace reliability {

enum class CircuitState { CLOSED, OPEN, HALF_OPEN };

const char *circuit_state_to_string(CircuitState state);

/**
 * @brief Three-state failure isolation for one logical operation key
 *
 * CLOSED: calls run; consecutive failures are counted and reaching
 *         failure_threshold opens the circuit.
 * OPEN: calls are rejected with CircuitBreakerOpenError without running the
 *       operation, until recovery_timeout_ms has passed since the last failure.
 * HALF_OPEN: up to half_open_max_calls probes run; a success closes the
 *            circuit, a failure reopens it and restarts the recovery clock.
 *
 * All transitions happen under one mutex so a failure recorded by one caller
 * is visible to the next.
 */
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    CircuitBreaker(std::string key, CircuitBreakerConfig config);

    template <typename Fn>
    auto execute(Fn &&operation) -> decltype(operation()) {
        using Result = decltype(operation());
        acquire();
        try {
            if constexpr (std::is_void_v<Result>) {
                operation();
                record_success();
            } else {
                Result result = operation();
                record_success();
                return result;
            }
        } catch (...) {
            record_failure();
            throw;
        }
    }

    // Admission check. Throws CircuitBreakerOpenError when the call must not run.
    void acquire();

    void record_success();
    void record_failure();

    // Force CLOSED with a zero failure count
    void reset();

    CircuitState state() const;
    int failure_count() const;
    std::optional<Clock::time_point> last_failure_time() const;

    const std::string &key() const { return key_; }
    const CircuitBreakerConfig &config() const { return config_; }

private:
    const std::string key_;
    const CircuitBreakerConfig config_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    int failure_count_ = 0;
    int half_open_in_flight_ = 0;
    std::optional<Clock::time_point> last_failure_time_;
};

// One breaker per operation key, created on first use
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(CircuitBreakerConfig config);

    std::shared_ptr<CircuitBreaker> get(const std::string &key);
    std::shared_ptr<CircuitBreaker> find(const std::string &key) const;

    // Returns false if no breaker exists for key
    bool reset(const std::string &key);

    std::vector<std::string> keys() const;

private:
    CircuitBreakerConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

}  // namespace reliability
}  // namespace tether
