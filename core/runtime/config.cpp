#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <optional>
#include <set>
#include <stdexcept>

#include "logging/logger.hpp"

namespace tether {
namespace runtime {

namespace {

std::optional<int> parse_int(const std::string &text) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument &) {
        return std::nullopt;
    } catch (const std::out_of_range &) {
        return std::nullopt;
    }
}

void override_int(const char *name, int &target) {
    const char *value = std::getenv(name);
    if (value == nullptr) {
        return;
    }
    auto parsed = parse_int(value);
    if (!parsed) {
        LOG_WARN("[Config] Ignoring non-numeric " << name << "='" << value << "'");
        return;
    }
    target = *parsed;
    LOG_DEBUG("[Config] " << name << " override: " << target);
}

client::ServerConfig parse_server(const YAML::Node &node) {
    client::ServerConfig server;

    if (node["name"]) {
        server.name = node["name"].as<std::string>();
    }

    // command: scalar executable or sequence (executable + args)
    if (node["command"]) {
        const auto &command = node["command"];
        if (command.IsSequence()) {
            for (const auto &part : command) {
                server.command_line.push_back(part.as<std::string>());
            }
        } else {
            server.command_line.push_back(command.as<std::string>());
        }
    }
    if (node["args"]) {
        for (const auto &arg : node["args"]) {
            server.command_line.push_back(arg.as<std::string>());
        }
    }

    if (node["env"]) {
        for (const auto &entry : node["env"]) {
            server.environment[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }
    if (node["working_directory"]) {
        server.working_directory = node["working_directory"].as<std::string>();
    }

    if (node["auto_restart"]) {
        server.auto_restart = node["auto_restart"].as<bool>();
    }
    if (node["max_restart_attempts"]) {
        server.max_restart_attempts = node["max_restart_attempts"].as<int>();
    }
    if (node["restart_delay_ms"]) {
        server.restart_delay_ms = node["restart_delay_ms"].as<int>();
    }
    if (node["restart_backoff_multiplier"]) {
        server.restart_backoff_multiplier = node["restart_backoff_multiplier"].as<double>();
    }
    if (node["max_restart_delay_ms"]) {
        server.max_restart_delay_ms = node["max_restart_delay_ms"].as<int>();
    }
    if (node["restart_success_reset_ms"]) {
        server.restart_success_reset_ms = node["restart_success_reset_ms"].as<int>();
    }
    if (node["connect_timeout_ms"]) {
        server.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
    }
    if (node["shutdown_timeout_ms"]) {
        server.shutdown_timeout_ms = node["shutdown_timeout_ms"].as<int>();
    }
    if (node["health_check_timeout_ms"]) {
        server.health_check_timeout_ms = node["health_check_timeout_ms"].as<int>();
    }

    return server;
}

void parse_reliability(const YAML::Node &node, reliability::ReliabilityConfig &config) {
    if (node["max_retries"]) {
        config.retry.max_retries = node["max_retries"].as<int>();
    }
    if (node["base_delay_ms"]) {
        config.retry.base_delay_ms = node["base_delay_ms"].as<int>();
    }
    if (node["max_delay_ms"]) {
        config.retry.max_delay_ms = node["max_delay_ms"].as<int>();
    }
    if (node["jitter_factor"]) {
        config.retry.jitter_factor = node["jitter_factor"].as<double>();
    }
    if (node["rate_limit_delay_ms"]) {
        config.rate_limit.min_interval_ms = node["rate_limit_delay_ms"].as<int>();
    }
    if (node["max_requests_per_window"]) {
        config.rate_limit.max_requests_per_window = node["max_requests_per_window"].as<int>();
    }
    if (node["rate_limit_window_ms"]) {
        config.rate_limit.window_ms = node["rate_limit_window_ms"].as<int>();
    }
    if (node["circuit_breaker_failure_threshold"]) {
        config.circuit_breaker.failure_threshold = node["circuit_breaker_failure_threshold"].as<int>();
    }
    if (node["circuit_breaker_recovery_timeout_ms"]) {
        config.circuit_breaker.recovery_timeout_ms = node["circuit_breaker_recovery_timeout_ms"].as<int>();
    }
    if (node["circuit_breaker_half_open_max_calls"]) {
        config.circuit_breaker.half_open_max_calls = node["circuit_breaker_half_open_max_calls"].as<int>();
    }
    if (node["request_timeout_ms"]) {
        config.request_timeout_ms = node["request_timeout_ms"].as<int>();
    }
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Servers
    if (config.servers.empty()) {
        error = "Config must specify at least one server";
        return false;
    }

    std::set<std::string> names;
    for (const auto &server : config.servers) {
        if (server.name.empty()) {
            error = "Server missing 'name' field";
            return false;
        }
        if (!names.insert(server.name).second) {
            error = "Duplicate server name: " + server.name;
            return false;
        }
        if (server.command_line.empty() || server.command_line.front().empty()) {
            error = "Server '" + server.name + "' missing 'command' field";
            return false;
        }
        if (server.max_restart_attempts < 0) {
            error = "Server '" + server.name + "' max_restart_attempts must be >= 0";
            return false;
        }
        if (server.restart_delay_ms < 0) {
            error = "Server '" + server.name + "' restart_delay_ms must be >= 0";
            return false;
        }
        if (server.restart_backoff_multiplier < 1.0) {
            error = "Server '" + server.name + "' restart_backoff_multiplier must be >= 1.0";
            return false;
        }
        if (server.max_restart_delay_ms < server.restart_delay_ms) {
            error = "Server '" + server.name + "' max_restart_delay_ms must be >= restart_delay_ms";
            return false;
        }
        if (server.connect_timeout_ms < 1 || server.shutdown_timeout_ms < 0 || server.health_check_timeout_ms < 1) {
            error = "Server '" + server.name + "' timeouts must be positive";
            return false;
        }
    }

    // Reliability
    const auto &rel = config.reliability;
    if (rel.retry.max_retries < 1) {
        error = "reliability.max_retries must be >= 1";
        return false;
    }
    if (rel.retry.jitter_factor < 0.0 || rel.retry.jitter_factor > 1.0) {
        error = "reliability.jitter_factor must be between 0 and 1";
        return false;
    }
    if (rel.retry.base_delay_ms < 0 || rel.retry.base_delay_ms > rel.retry.max_delay_ms) {
        error = "reliability.base_delay_ms must be between 0 and max_delay_ms";
        return false;
    }
    if (rel.rate_limit.min_interval_ms < 0) {
        error = "reliability.rate_limit_delay_ms must be >= 0";
        return false;
    }
    if (rel.rate_limit.max_requests_per_window < 1) {
        error = "reliability.max_requests_per_window must be >= 1";
        return false;
    }
    if (rel.rate_limit.window_ms < 1) {
        error = "reliability.rate_limit_window_ms must be >= 1";
        return false;
    }
    if (rel.circuit_breaker.failure_threshold < 1) {
        error = "reliability.circuit_breaker_failure_threshold must be >= 1";
        return false;
    }
    if (rel.circuit_breaker.recovery_timeout_ms < 0) {
        error = "reliability.circuit_breaker_recovery_timeout_ms must be >= 0";
        return false;
    }
    if (rel.circuit_breaker.half_open_max_calls < 1) {
        error = "reliability.circuit_breaker_half_open_max_calls must be >= 1";
        return false;
    }
    if (rel.request_timeout_ms < 1) {
        error = "reliability.request_timeout_ms must be >= 1";
        return false;
    }

    // Logging
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

void apply_env_overrides(RuntimeConfig &config) {
    if (const char *level = std::getenv("TETHER_LOG_LEVEL")) {
        config.logging.level = level;
    }
    override_int("TETHER_MAX_RETRIES", config.reliability.retry.max_retries);
    override_int("TETHER_RETRY_DELAY", config.reliability.retry.base_delay_ms);
    override_int("TETHER_RATE_LIMIT_DELAY", config.reliability.rate_limit.min_interval_ms);
    override_int("TETHER_CIRCUIT_BREAKER_THRESHOLD", config.reliability.circuit_breaker.failure_threshold);
    override_int("TETHER_CIRCUIT_BREAKER_TIMEOUT", config.reliability.circuit_breaker.recovery_timeout_ms);
    override_int("TETHER_REQUEST_TIMEOUT", config.reliability.request_timeout_ms);
}

const client::ServerConfig *find_server(const RuntimeConfig &config, const std::string &name) {
    for (const auto &server : config.servers) {
        if (server.name == name) {
            return &server;
        }
    }
    return nullptr;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"logging", "servers", "reliability", "client"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (yaml["servers"]) {
            config.servers.clear();  // Ensure idempotent parsing
            for (const auto &server_node : yaml["servers"]) {
                config.servers.push_back(parse_server(server_node));
            }
        }

        if (yaml["reliability"]) {
            parse_reliability(yaml["reliability"], config.reliability);
        }

        if (yaml["client"]) {
            const auto &client_node = yaml["client"];
            if (client_node["name"]) {
                config.client.name = client_node["name"].as<std::string>();
            }
            if (client_node["version"]) {
                config.client.version = client_node["version"].as<std::string>();
            }
            if (client_node["protocol_version"]) {
                config.client.protocol_version = client_node["protocol_version"].as<std::string>();
            }
        }

        apply_env_overrides(config);

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Loaded " << config.servers.size() << " server(s)");
        LOG_INFO("[Config] Retry: max_retries=" << config.reliability.retry.max_retries
                                                << ", base_delay=" << config.reliability.retry.base_delay_ms << "ms");
        LOG_INFO("[Config] Rate limit: " << config.reliability.rate_limit.min_interval_ms << "ms interval, "
                                         << config.reliability.rate_limit.max_requests_per_window << " per window");
        LOG_INFO("[Config] Circuit breaker: threshold=" << config.reliability.circuit_breaker.failure_threshold
                                                        << ", recovery="
                                                        << config.reliability.circuit_breaker.recovery_timeout_ms
                                                        << "ms");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace tether
