#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "mcp_models.hpp"
#include "process_supervisor.hpp"
#include "reliability/circuit_breaker.hpp"
#include "reliability/rate_limiter.hpp"
#include "reliability/reliability_config.hpp"
#include "reliability/retry_executor.hpp"
#include "server_config.hpp"

namespace tether {
namespace client {

// Per operation-key bookkeeping, combined with the key's breaker state
struct OperationStats {
    std::string operation;
    int attempts = 0;  // operation bodies invoked (including retries)
    int failures = 0;  // attempts that threw
    int retries = 0;   // backoff sleeps taken
    std::string last_failure;
    reliability::CircuitState breaker_state = reliability::CircuitState::CLOSED;
    int breaker_failure_count = 0;
};

/**
 * @brief Single call surface over one supervised tool server
 *
 * call() = connection check -> RateLimiter -> RetryExecutor -> CircuitBreaker(key) -> send.
 * A missing or stopped server fails fast with ConnectionError before a
 * rate-limit slot is taken. A FAILED server surfaces RestartLimitExceededError.
 * Circuit-open errors are never retried.
 */
class ReliableClient {
public:
    ReliableClient(std::shared_ptr<ProcessSupervisor> supervisor, ServerConfig server,
                   reliability::ReliabilityConfig config = reliability::ReliabilityConfig{});
    ~ReliableClient() = default;

    ReliableClient(const ReliableClient &) = delete;
    ReliableClient &operator=(const ReliableClient &) = delete;

    // Spawns (or reuses) the server through the supervisor
    void connect();

    nlohmann::json call(const std::string &operation_key, const std::string &method,
                        const nlohmann::json &params);

    // Operation key defaults to the method name
    nlohmann::json call(const std::string &method, const nlohmann::json &params = nullptr);

    std::vector<ToolDescriptor> list_tools();

    // tools/call under key "tool:<name>". isError results throw RemoteError.
    ToolResponse call_tool(const ToolRequest &request);

    OperationStats stats(const std::string &operation_key) const;
    std::vector<OperationStats> all_stats() const;

    // Clears the key's counters and closes its breaker
    void reset_stats(const std::string &operation_key);

    // Stops the server process. Never throws.
    void disconnect() noexcept;

    bool is_connected() const;

    const std::string &server_name() const { return server_.name; }
    const reliability::ReliabilityConfig &config() const { return config_; }
    reliability::RetryExecutor &retry_executor() { return retry_; }

private:
    struct Counters {
        int attempts = 0;
        int failures = 0;
        int retries = 0;
        std::string last_failure;
    };

    std::shared_ptr<ProcessSupervisor> supervisor_;
    const ServerConfig server_;
    const reliability::ReliabilityConfig config_;

    reliability::RateLimiter rate_limiter_;
    reliability::RetryExecutor retry_;
    reliability::CircuitBreakerRegistry breakers_;

    mutable std::mutex stats_mutex_;
    std::map<std::string, Counters> counters_;

    std::shared_ptr<StdioTransport> healthy_transport();
    void record_attempt(const std::string &key);
    void record_failure(const std::string &key, const std::string &message);
};

}  // namespace client
}  // namespace tether
