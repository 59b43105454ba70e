#include "retry_executor.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <thread>

#include "client/errors.hpp"

namespace tether {
namespace reliability {

namespace {

// Lower-cased substrings that mark a failure as transient
const char *const kTransientMarkers[] = {
    "timeout",           "timed out",          "connection",      "network",
    "socket",            "429",                "502",             "503",
    "504",               "page crashed",       "browser disconnected",
    "navigation timeout", "element not found", "selector not found", "process crash",
};

std::string to_lower(const std::string &text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

}  // namespace

RetryExecutor::RetryExecutor(RetryConfig config, RetryPredicate predicate)
    : config_(config),
      predicate_(predicate ? std::move(predicate) : RetryPredicate(&RetryExecutor::is_retryable)),
      sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }),
      rng_(std::random_device{}()) {}

int RetryExecutor::backoff_delay_ms(const RetryConfig &config, int attempt, double jitter) {
    double exponential = static_cast<double>(config.base_delay_ms) * std::pow(2.0, std::max(attempt - 1, 0));
    double delay = exponential * (1.0 + jitter);
    double cap = static_cast<double>(config.max_delay_ms);
    return static_cast<int>(std::min(delay, cap));
}

int RetryExecutor::next_delay_ms(int attempt) {
    double jitter = 0.0;
    if (config_.jitter_factor > 0.0) {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        std::uniform_real_distribution<double> dist(0.0, config_.jitter_factor);
        jitter = dist(rng_);
    }
    return backoff_delay_ms(config_, attempt, jitter);
}

bool RetryExecutor::is_retryable(const std::exception &error) {
    if (auto client_error = dynamic_cast<const client::ClientError *>(&error)) {
        switch (client_error->code()) {
            case client::ErrorCode::TIMEOUT:
            case client::ErrorCode::CONNECTION_LOST:
            case client::ErrorCode::CONNECTION:
                return true;
            case client::ErrorCode::CIRCUIT_OPEN:
            case client::ErrorCode::RESTART_LIMIT_EXCEEDED:
            case client::ErrorCode::PROTOCOL:
            case client::ErrorCode::INVALID_ARGUMENT:
            case client::ErrorCode::NOT_FOUND:
                return false;
            default:
                break;  // REMOTE, PROCESS_SPAWN, INTERNAL: decided by message
        }
    }

    const std::string message = to_lower(error.what());
    for (const char *marker : kTransientMarkers) {
        if (message.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace reliability
}  // namespace tether
