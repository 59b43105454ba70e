#pragma once

#include <string>
#include <vector>

#include "client/server_config.hpp"
#include "reliability/reliability_config.hpp"

namespace tether {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct RuntimeConfig {
    LoggingConfig logging;
    std::vector<client::ServerConfig> servers;
    reliability::ReliabilityConfig reliability;
    client::ClientIdentity client;
};

// Loads configuration from a YAML file, applies TETHER_* environment overrides and validates
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

// TETHER_LOG_LEVEL, TETHER_MAX_RETRIES, TETHER_RETRY_DELAY, TETHER_RATE_LIMIT_DELAY,
// TETHER_CIRCUIT_BREAKER_THRESHOLD, TETHER_CIRCUIT_BREAKER_TIMEOUT, TETHER_REQUEST_TIMEOUT.
// Non-numeric values are ignored with a warning.
void apply_env_overrides(RuntimeConfig &config);

// nullptr if no server has that name
const client::ServerConfig *find_server(const RuntimeConfig &config, const std::string &name);

}  // namespace runtime
}  // namespace tether
