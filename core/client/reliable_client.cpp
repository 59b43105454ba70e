#include "reliable_client.hpp"

#include "jsonrpc.hpp"
#include "logging/logger.hpp"

namespace tether {
namespace client {

ReliableClient::ReliableClient(std::shared_ptr<ProcessSupervisor> supervisor, ServerConfig server,
                               reliability::ReliabilityConfig config)
    : supervisor_(std::move(supervisor)),
      server_(std::move(server)),
      config_(config),
      rate_limiter_(config.rate_limit),
      retry_(config.retry),
      breakers_(config.circuit_breaker) {
    if (!supervisor_) {
        throw InvalidArgumentError("ReliableClient requires a supervisor");
    }
    retry_.set_observer([this](const std::string &key, int, const std::exception &, int) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        counters_[key].retries++;
    });
}

void ReliableClient::connect() {
    auto transport = supervisor_->get_client(server_);
    LOG_INFO("[Client:" << server_.name << "] Connected (PID=" << transport->pid() << ")");
}

std::shared_ptr<StdioTransport> ReliableClient::healthy_transport() {
    try {
        // Rides out a restart in progress; STOPPED and FAILED servers fail immediately
        return supervisor_->current_client(server_.name, config_.request_timeout_ms);
    } catch (const NotFoundError &) {
        throw ConnectionError("Not connected to server '" + server_.name + "'");
    }
}

nlohmann::json ReliableClient::call(const std::string &operation_key, const std::string &method,
                                    const nlohmann::json &params) {
    // Fail fast without consuming a rate-limit slot
    healthy_transport();

    rate_limiter_.acquire();

    auto breaker = breakers_.get(operation_key);
    return retry_.run(operation_key, [&]() {
        return breaker->execute([&]() {
            record_attempt(operation_key);
            try {
                auto transport = supervisor_->current_client(server_.name, config_.request_timeout_ms);
                return transport->send(method, params, config_.request_timeout_ms);
            } catch (const std::exception &e) {
                record_failure(operation_key, e.what());
                throw;
            }
        });
    });
}

nlohmann::json ReliableClient::call(const std::string &method, const nlohmann::json &params) {
    return call(method, method, params);
}

std::vector<ToolDescriptor> ReliableClient::list_tools() {
    nlohmann::json result = call("tools/list", "tools/list", nlohmann::json::object());
    try {
        return parse_tool_list(result);
    } catch (const nlohmann::json::exception &e) {
        throw ProtocolError("Malformed tools/list result from '" + server_.name + "': " + std::string(e.what()));
    }
}

ToolResponse ReliableClient::call_tool(const ToolRequest &request) {
    if (request.name.empty()) {
        throw InvalidArgumentError("Tool name must not be empty");
    }

    nlohmann::json result = call("tool:" + request.name, "tools/call", nlohmann::json(request));

    ToolResponse response;
    try {
        response = result.get<ToolResponse>();
    } catch (const nlohmann::json::exception &e) {
        throw ProtocolError("Malformed tools/call result for '" + request.name + "': " + std::string(e.what()));
    }

    if (response.is_error) {
        std::string text = response.first_text();
        if (text.empty()) {
            text = "Tool '" + request.name + "' reported an error";
        }
        throw RemoteError(jsonrpc::kInternalError, text, result);
    }
    return response;
}

void ReliableClient::record_attempt(const std::string &key) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    counters_[key].attempts++;
}

void ReliableClient::record_failure(const std::string &key, const std::string &message) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    auto &counters = counters_[key];
    counters.failures++;
    counters.last_failure = message;
}

OperationStats ReliableClient::stats(const std::string &operation_key) const {
    OperationStats stats;
    stats.operation = operation_key;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        auto it = counters_.find(operation_key);
        if (it != counters_.end()) {
            stats.attempts = it->second.attempts;
            stats.failures = it->second.failures;
            stats.retries = it->second.retries;
            stats.last_failure = it->second.last_failure;
        }
    }
    if (auto breaker = breakers_.find(operation_key)) {
        stats.breaker_state = breaker->state();
        stats.breaker_failure_count = breaker->failure_count();
    }
    return stats;
}

std::vector<OperationStats> ReliableClient::all_stats() const {
    std::vector<std::string> keys;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        for (const auto &[key, counters] : counters_) {
            keys.push_back(key);
        }
    }
    std::vector<OperationStats> result;
    result.reserve(keys.size());
    for (const auto &key : keys) {
        result.push_back(stats(key));
    }
    return result;
}

void ReliableClient::reset_stats(const std::string &operation_key) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        counters_.erase(operation_key);
    }
    breakers_.reset(operation_key);
    LOG_INFO("[Client:" << server_.name << "] Reset stats for '" << operation_key << "'");
}

void ReliableClient::disconnect() noexcept {
    OperationResult result = supervisor_->stop_server(server_.name);
    if (!result.success) {
        LOG_DEBUG("[Client:" << server_.name << "] " << result.error_message);
    }
}

bool ReliableClient::is_connected() const {
    auto status = supervisor_->status(server_.name);
    return status && status->connected;
}

}  // namespace client
}  // namespace tether
