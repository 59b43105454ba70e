#pragma once

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "errors.hpp"
#include "server_config.hpp"
#include "stdio_transport.hpp"

namespace tether {
namespace client {

enum class ServerState { STARTING, RUNNING, RESTARTING, FAILED, STOPPED };

const char *server_state_to_string(ServerState state);

// Snapshot of one supervised server, safe to hand across threads
struct ServerStatus {
    std::string name;
    bool connected = false;
    bool running = false;
    int restart_attempts = 0;
    int max_restart_attempts = 0;
    ServerState state = ServerState::STOPPED;
    pid_t pid = -1;
    std::string last_error;
};

/**
 * @brief Owns the lifecycle of every named tool-server process
 *
 * One StdioTransport per server name. Spawn, restart and stop of a given name
 * are serialised by that server's lifecycle mutex; different names never block
 * each other. Connection loss reported by a transport schedules an automatic
 * restart (when the server's config allows it) on the supervisor's worker
 * thread, after restart_delay_ms * multiplier^attempt capped at
 * max_restart_delay_ms. Once restart attempts exceed max_restart_attempts the
 * server is FAILED until reset_server() is called.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - The name table uses std::shared_mutex (lookups are concurrent)
 * - Lock order: server lifecycle mutex -> name table / server state mutex
 */
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(ClientIdentity identity = ClientIdentity{});
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor &) = delete;
    ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

    // Connected transport for config.name, spawning and connecting one if none is healthy.
    // Throws ProcessSpawnError / ConnectionError on failure (the name is then forgotten),
    // RestartLimitExceededError if the server is FAILED.
    std::shared_ptr<StdioTransport> get_client(const ServerConfig &config);

    // Transport of an already registered server. Waits up to wait_ms while the server
    // is starting or restarting.
    // Throws NotFoundError, RestartLimitExceededError (FAILED) or ConnectionError (no healthy process).
    std::shared_ptr<StdioTransport> current_client(const std::string &name, int wait_ms = 0);

    // Ping plus OS liveness. Unknown names are unhealthy. Never throws.
    // An unhealthy RUNNING server with auto_restart gets a restart scheduled.
    bool health_check(const std::string &name) noexcept;

    // Tear down and respawn immediately, counting one restart attempt
    OperationResult restart_server(const std::string &name);

    // Tear down one server and forget it. Unknown name -> NOT_FOUND result.
    OperationResult stop_server(const std::string &name);

    // Stop every server. No-op when nothing is registered.
    void stop_all() noexcept;

    // Operator reset: clears restart attempts and lifts the FAILED state
    OperationResult reset_server(const std::string &name);

    std::vector<ServerStatus> status() const;
    std::optional<ServerStatus> status(const std::string &name) const;

    bool has_server(const std::string &name) const;
    size_t server_count() const;

    // Delay before automatic restart number attempt + 1
    static int restart_backoff_ms(const ServerConfig &config, int attempt);

private:
    struct ManagedServer {
        explicit ManagedServer(ServerConfig cfg) : config(std::move(cfg)) {}

        const ServerConfig config;
        std::mutex lifecycle_mutex;  // serialises spawn/restart/stop for this name

        mutable std::mutex state_mutex;     // guards everything below
        std::condition_variable state_cv;   // signalled when STARTING/RESTARTING ends
        std::shared_ptr<StdioTransport> transport;
        ServerState state = ServerState::STARTING;
        int restart_attempts = 0;
        std::string last_error;
        uint64_t generation = 0;  // bumped per spawn/stop; stale loss reports and restarts are ignored
    };

    struct RestartRequest {
        std::string name;
        uint64_t generation;
        std::chrono::steady_clock::time_point due;
    };

    ClientIdentity identity_;

    mutable std::shared_mutex servers_mutex_;
    std::unordered_map<std::string, std::shared_ptr<ManagedServer>> servers_;

    std::mutex worker_mutex_;
    std::condition_variable worker_cv_;
    std::vector<RestartRequest> restart_queue_;
    bool worker_stop_ = false;
    std::thread worker_;

    std::shared_ptr<ManagedServer> find(const std::string &name) const;
    void forget(const std::string &name, const std::shared_ptr<ManagedServer> &server);
    // False once stop_server or a failed get_client has dropped this entry
    bool is_registered(const std::shared_ptr<ManagedServer> &server) const;

    // Caller holds server.lifecycle_mutex
    std::shared_ptr<StdioTransport> spawn_locked(const std::shared_ptr<ManagedServer> &server);
    OperationResult restart_locked(const std::shared_ptr<ManagedServer> &server, bool automatic);

    void handle_failure(const std::shared_ptr<ManagedServer> &server, uint64_t generation, const std::string &reason);
    void schedule_restart(const std::string &name, uint64_t generation, int delay_ms);
    void worker_loop();

    ServerStatus snapshot(const ManagedServer &server) const;
};

}  // namespace client
}  // namespace tether
