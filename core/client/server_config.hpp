#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tether {
namespace client {

// Immutable description of one tool-server child process. Shared read-only by every
// process lifetime spawned for the same name.
struct ServerConfig {
    std::string name;                                // Unique key, e.g. "playwright"
    std::vector<std::string> command_line;           // Executable + arguments (PATH lookup applies)
    std::map<std::string, std::string> environment;  // Added on top of the parent's environment
    std::optional<std::string> working_directory;    // Inherit parent's cwd when unset

    bool auto_restart = true;                  // Restart automatically on connection loss
    int max_restart_attempts = 3;              // Restarts allowed before the server is marked FAILED
    int restart_delay_ms = 1000;               // Base restart delay
    double restart_backoff_multiplier = 2.0;   // delay = restart_delay_ms * multiplier^attempt
    int max_restart_delay_ms = 30000;          // Backoff cap
    int restart_success_reset_ms = 60000;      // Healthy uptime before restart attempts reset

    int connect_timeout_ms = 30000;       // initialize handshake deadline
    int shutdown_timeout_ms = 2000;       // Grace period after closing stdin
    int health_check_timeout_ms = 5000;   // ping deadline during health checks
};

// Identity announced in the initialize handshake
struct ClientIdentity {
    std::string name = "tether";
    std::string version = "0.1.0";
    std::string protocol_version = "2024-11-05";
};

}  // namespace client
}  // namespace tether
