#pragma once

#include <sys/types.h>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

#include "line_stream.hpp"
#include "server_config.hpp"

namespace tether {
namespace client {

// ServerProcess manages one spawned tool-server child.
// Responsibilities:
// - Spawn with redirected stdin/stdout (stderr is inherited)
// - Report OS-level liveness and exit status
// - Clean/forced shutdown
class ServerProcess {
public:
    explicit ServerProcess(ServerConfig config);
    ~ServerProcess();

    ServerProcess(const ServerProcess &) = delete;
    ServerProcess &operator=(const ServerProcess &) = delete;

    // Spawn the child. Returns false on failure (sets last_error()); a missing or
    // non-executable program is reported before this returns.
    bool spawn();

    // True while the child has not exited. Reaps the child once it has.
    bool is_running() const;

    // Shutdown sequence: EOF -> wait -> SIGTERM -> SIGKILL. Idempotent.
    void shutdown();

    LineStream &stream() { return stream_; }

    const std::string &server_name() const { return config_.name; }
    const ServerConfig &config() const { return config_; }

    pid_t pid() const;

    // Exit code (or 128 + signal) once the child has been reaped
    std::optional<int> exit_status() const;

    // Time since a successful spawn
    std::chrono::milliseconds uptime() const;

    const std::string &last_error() const { return error_; }

private:
    ServerConfig config_;
    std::string error_;
    LineStream stream_;

    mutable std::mutex mutex_;  // guards pid_ / exit_status_ across reader and supervisor threads
    mutable pid_t pid_;
    mutable std::optional<int> exit_status_;
    std::chrono::steady_clock::time_point started_at_;

    bool spawn_posix();
    bool wait_for_exit(int timeout_ms);
    bool reap_locked(bool block) const;
    void signal_child(int sig);
};

}  // namespace client
}  // namespace tether
