#pragma once

namespace tether {
namespace reliability {

struct RetryConfig {
    int max_retries = 3;  // Total attempts, not additional retries
    int base_delay_ms = 1000;
    int max_delay_ms = 30000;
    double jitter_factor = 0.1;  // 0.0 - 1.0
};

struct CircuitBreakerConfig {
    int failure_threshold = 5;       // Consecutive failures before opening
    int recovery_timeout_ms = 60000; // OPEN -> HALF_OPEN after this long
    int half_open_max_calls = 1;     // Concurrent probes admitted while HALF_OPEN
};

struct RateLimiterConfig {
    int min_interval_ms = 500;  // 0 disables rate limiting entirely
    int max_requests_per_window = 30;
    int window_ms = 60000;
};

struct ReliabilityConfig {
    RetryConfig retry;
    CircuitBreakerConfig circuit_breaker;
    RateLimiterConfig rate_limit;
    int request_timeout_ms = 30000;  // Per-attempt transport deadline
};

}  // namespace reliability
}  // namespace tether
