#include "circuit_breaker.hpp"

#include "logging/logger.hpp"

namespace tether {
namespace reliability {

const char *circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED:
            return "CLOSED";
        case CircuitState::OPEN:
            return "OPEN";
        case CircuitState::HALF_OPEN:
            return "HALF_OPEN";
    }
    return "UNKNOWN";
}

CircuitBreaker::CircuitBreaker(std::string key, CircuitBreakerConfig config)
    : key_(std::move(key)), config_(config) {}

void CircuitBreaker::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == CircuitState::OPEN) {
        auto since_failure = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - last_failure_time_.value_or(Clock::time_point{}));
        if (since_failure.count() < config_.recovery_timeout_ms) {
            throw client::CircuitBreakerOpenError("Circuit breaker open for '" + key_ + "' (retry in " +
                                                  std::to_string(config_.recovery_timeout_ms - since_failure.count()) +
                                                  "ms)");
        }
        state_ = CircuitState::HALF_OPEN;
        half_open_in_flight_ = 0;
        LOG_INFO("[CircuitBreaker:" << key_ << "] OPEN -> HALF_OPEN");
    }

    if (state_ == CircuitState::HALF_OPEN) {
        int max_probes = config_.half_open_max_calls > 0 ? config_.half_open_max_calls : 1;
        if (half_open_in_flight_ >= max_probes) {
            throw client::CircuitBreakerOpenError("Circuit breaker half-open for '" + key_ +
                                                  "' (probe already in flight)");
        }
        ++half_open_in_flight_;
    }
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != CircuitState::CLOSED) {
        LOG_INFO("[CircuitBreaker:" << key_ << "] " << circuit_state_to_string(state_) << " -> CLOSED");
    }
    state_ = CircuitState::CLOSED;
    failure_count_ = 0;
    half_open_in_flight_ = 0;
}

void CircuitBreaker::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++failure_count_;
    last_failure_time_ = Clock::now();

    if (state_ == CircuitState::HALF_OPEN) {
        state_ = CircuitState::OPEN;
        half_open_in_flight_ = 0;
        LOG_WARN("[CircuitBreaker:" << key_ << "] Probe failed, HALF_OPEN -> OPEN");
    } else if (state_ == CircuitState::CLOSED && failure_count_ >= config_.failure_threshold) {
        state_ = CircuitState::OPEN;
        LOG_WARN("[CircuitBreaker:" << key_ << "] CLOSED -> OPEN after " << failure_count_ << " failures");
    }
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = CircuitState::CLOSED;
    failure_count_ = 0;
    half_open_in_flight_ = 0;
    last_failure_time_.reset();
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int CircuitBreaker::failure_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_count_;
}

std::optional<CircuitBreaker::Clock::time_point> CircuitBreaker::last_failure_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_failure_time_;
}

CircuitBreakerRegistry::CircuitBreakerRegistry(CircuitBreakerConfig config) : config_(config) {}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &breaker = breakers_[key];
    if (!breaker) {
        breaker = std::make_shared<CircuitBreaker>(key, config_);
    }
    return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(const std::string &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(key);
    return it == breakers_.end() ? nullptr : it->second;
}

bool CircuitBreakerRegistry::reset(const std::string &key) {
    auto breaker = find(key);
    if (!breaker) {
        return false;
    }
    breaker->reset();
    return true;
}

std::vector<std::string> CircuitBreakerRegistry::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(breakers_.size());
    for (const auto &[key, breaker] : breakers_) {
        result.push_back(key);
    }
    return result;
}

}  // namespace reliability
}  // namespace tether
