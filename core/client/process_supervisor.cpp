#include "process_supervisor.hpp"

#include <algorithm>
#include <cmath>

#include "logging/logger.hpp"

namespace tether {
namespace client {

const char *server_state_to_string(ServerState state) {
    switch (state) {
        case ServerState::STARTING:
            return "STARTING";
        case ServerState::RUNNING:
            return "RUNNING";
        case ServerState::RESTARTING:
            return "RESTARTING";
        case ServerState::FAILED:
            return "FAILED";
        case ServerState::STOPPED:
            return "STOPPED";
    }
    return "UNKNOWN";
}

ProcessSupervisor::ProcessSupervisor(ClientIdentity identity) : identity_(std::move(identity)) {
    worker_ = std::thread(&ProcessSupervisor::worker_loop, this);
}

ProcessSupervisor::~ProcessSupervisor() {
    {
        std::lock_guard<std::mutex> lock(worker_mutex_);
        worker_stop_ = true;
    }
    worker_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    stop_all();
}

int ProcessSupervisor::restart_backoff_ms(const ServerConfig &config, int attempt) {
    double delay = static_cast<double>(config.restart_delay_ms) *
                   std::pow(config.restart_backoff_multiplier, static_cast<double>(std::max(attempt, 0)));
    if (delay > static_cast<double>(config.max_restart_delay_ms)) {
        delay = static_cast<double>(config.max_restart_delay_ms);
    }
    return static_cast<int>(delay);
}

std::shared_ptr<ProcessSupervisor::ManagedServer> ProcessSupervisor::find(const std::string &name) const {
    std::shared_lock<std::shared_mutex> lock(servers_mutex_);
    auto it = servers_.find(name);
    return it == servers_.end() ? nullptr : it->second;
}

void ProcessSupervisor::forget(const std::string &name, const std::shared_ptr<ManagedServer> &server) {
    std::unique_lock<std::shared_mutex> lock(servers_mutex_);
    auto it = servers_.find(name);
    if (it != servers_.end() && it->second == server) {
        servers_.erase(it);
    }
}

bool ProcessSupervisor::is_registered(const std::shared_ptr<ManagedServer> &server) const {
    return find(server->config.name) == server;
}

bool ProcessSupervisor::has_server(const std::string &name) const { return find(name) != nullptr; }

size_t ProcessSupervisor::server_count() const {
    std::shared_lock<std::shared_mutex> lock(servers_mutex_);
    return servers_.size();
}

std::shared_ptr<StdioTransport> ProcessSupervisor::get_client(const ServerConfig &config) {
    if (config.name.empty()) {
        throw InvalidArgumentError("Server name must not be empty");
    }

    for (;;) {
        auto server = find(config.name);
        if (!server) {
            std::unique_lock<std::shared_mutex> lock(servers_mutex_);
            auto &slot = servers_[config.name];
            if (!slot) {
                slot = std::make_shared<ManagedServer>(config);
                LOG_DEBUG("[Supervisor] Registered server '" << config.name << "'");
            }
            server = slot;
        }

        std::lock_guard<std::mutex> lifecycle(server->lifecycle_mutex);
        if (!is_registered(server)) {
            continue;  // stopped and forgotten while we waited; register afresh
        }

        std::shared_ptr<StdioTransport> stale;
        {
            std::lock_guard<std::mutex> lock(server->state_mutex);
            if (server->state == ServerState::FAILED) {
                throw RestartLimitExceededError("Server '" + config.name +
                                                "' exceeded its restart limit: " + server->last_error);
            }
            if (server->state == ServerState::RUNNING && server->transport && server->transport->is_connected()) {
                return server->transport;
            }
            stale = std::move(server->transport);
        }
        if (stale) {
            stale->disconnect();
        }

        try {
            return spawn_locked(server);
        } catch (const ClientError &e) {
            {
                std::lock_guard<std::mutex> lock(server->state_mutex);
                server->state = ServerState::STOPPED;
                server->last_error = e.what();
            }
            server->state_cv.notify_all();
            forget(config.name, server);
            LOG_ERROR("[Supervisor] Failed to start '" << config.name << "': " << e.what());
            throw;
        }
    }
}

std::shared_ptr<StdioTransport> ProcessSupervisor::spawn_locked(const std::shared_ptr<ManagedServer> &server) {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(server->state_mutex);
        generation = ++server->generation;
        if (server->state != ServerState::RESTARTING) {
            server->state = ServerState::STARTING;
        }
    }

    auto transport = std::make_shared<StdioTransport>(server->config, identity_);
    std::weak_ptr<ManagedServer> weak = server;
    transport->set_connection_lost_handler([this, weak, generation](const std::string &reason) {
        if (auto owner = weak.lock()) {
            handle_failure(owner, generation, reason);
        }
    });

    transport->connect();

    {
        std::lock_guard<std::mutex> lock(server->state_mutex);
        server->transport = transport;
        server->state = ServerState::RUNNING;
        server->last_error.clear();
    }
    server->state_cv.notify_all();

    LOG_INFO("[Supervisor] Server '" << server->config.name << "' running (PID=" << transport->pid() << ")");
    return transport;
}

std::shared_ptr<StdioTransport> ProcessSupervisor::current_client(const std::string &name, int wait_ms) {
    auto server = find(name);
    if (!server) {
        throw NotFoundError("Unknown server: " + name);
    }

    std::unique_lock<std::mutex> lock(server->state_mutex);
    auto settled = [&server] {
        return server->state != ServerState::STARTING && server->state != ServerState::RESTARTING;
    };
    if (wait_ms > 0 && !settled()) {
        server->state_cv.wait_for(lock, std::chrono::milliseconds(wait_ms), settled);
    }

    if (server->state == ServerState::FAILED) {
        throw RestartLimitExceededError("Server '" + name + "' exceeded its restart limit: " + server->last_error);
    }
    if (server->state == ServerState::RUNNING && server->transport && server->transport->is_connected()) {
        return server->transport;
    }
    if (!settled()) {
        throw ConnectionError("Server '" + name + "' is " + server_state_to_string(server->state));
    }
    std::string message = "No healthy process for server '" + name + "'";
    if (!server->last_error.empty()) {
        message += ": " + server->last_error;
    }
    throw ConnectionError(message);
}

bool ProcessSupervisor::health_check(const std::string &name) noexcept {
    try {
        auto server = find(name);
        if (!server) {
            return false;
        }

        std::shared_ptr<StdioTransport> transport;
        uint64_t generation;
        {
            std::lock_guard<std::mutex> lock(server->state_mutex);
            if (server->state != ServerState::RUNNING || !server->transport) {
                return false;
            }
            transport = server->transport;
            generation = server->generation;
        }

        bool healthy = transport->is_connected() && transport->ping(server->config.health_check_timeout_ms);
        if (healthy) {
            std::lock_guard<std::mutex> lock(server->state_mutex);
            if (server->generation == generation && server->restart_attempts > 0 &&
                transport->uptime().count() >= server->config.restart_success_reset_ms) {
                LOG_INFO("[Supervisor] Server '" << name << "' recovered (stable for "
                                                 << transport->uptime().count() << "ms), restart attempts reset");
                server->restart_attempts = 0;
            }
            return true;
        }

        LOG_WARN("[Supervisor] Health check failed for '" << name << "'");
        if (server->config.auto_restart) {
            handle_failure(server, generation, "Health check failed");
        }
        return false;
    } catch (const std::exception &e) {
        LOG_ERROR("[Supervisor] Health check error for '" << name << "': " << e.what());
        return false;
    }
}

OperationResult ProcessSupervisor::restart_server(const std::string &name) {
    auto server = find(name);
    if (!server) {
        return OperationResult::failure(ErrorCode::NOT_FOUND, "Unknown server: " + name);
    }
    std::lock_guard<std::mutex> lifecycle(server->lifecycle_mutex);
    if (!is_registered(server)) {
        return OperationResult::failure(ErrorCode::NOT_FOUND, "Unknown server: " + name);
    }
    return restart_locked(server, false);
}

OperationResult ProcessSupervisor::restart_locked(const std::shared_ptr<ManagedServer> &server, bool automatic) {
    const std::string &name = server->config.name;
    const int max_attempts = server->config.max_restart_attempts;

    std::shared_ptr<StdioTransport> old;
    int attempt;
    bool exhausted;
    std::string message;
    {
        std::lock_guard<std::mutex> lock(server->state_mutex);
        attempt = ++server->restart_attempts;
        exhausted = attempt > max_attempts;
        old = std::move(server->transport);
        ++server->generation;
        if (exhausted) {
            message = "Restart limit exceeded for '" + name + "' (" + std::to_string(max_attempts) + " attempts)";
            if (!server->last_error.empty()) {
                message += ": " + server->last_error;
            }
            server->state = ServerState::FAILED;
            server->last_error = message;
        } else {
            server->state = ServerState::RESTARTING;
        }
    }
    if (exhausted) {
        server->state_cv.notify_all();
    }

    if (old) {
        old->disconnect();
    }

    if (exhausted) {
        LOG_ERROR("[Supervisor] " << message);
        return OperationResult::failure(ErrorCode::RESTART_LIMIT_EXCEEDED, message);
    }

    LOG_INFO("[Supervisor] Restarting '" << name << "' (attempt " << attempt << "/" << max_attempts << ")");

    try {
        spawn_locked(server);
        return OperationResult::ok();
    } catch (const ClientError &e) {
        LOG_ERROR("[Supervisor] Restart of '" << name << "' failed: " << e.what());
        {
            std::lock_guard<std::mutex> lock(server->state_mutex);
            server->last_error = e.what();
            if (server->restart_attempts >= max_attempts) {
                server->state = ServerState::FAILED;
            } else if (automatic && server->config.auto_restart) {
                server->state = ServerState::RESTARTING;
                schedule_restart(name, server->generation, restart_backoff_ms(server->config, server->restart_attempts));
            } else {
                server->state = ServerState::STOPPED;
            }
        }
        server->state_cv.notify_all();
        return OperationResult::failure(e.code(), e.what());
    }
}

void ProcessSupervisor::handle_failure(const std::shared_ptr<ManagedServer> &server, uint64_t generation,
                                       const std::string &reason) {
    const std::string &name = server->config.name;
    {
        std::lock_guard<std::mutex> lock(server->state_mutex);
        if (server->generation != generation || server->state != ServerState::RUNNING) {
            return;  // stale report, or the server is already being handled
        }
        server->last_error = reason;

        if (!server->config.auto_restart) {
            server->state = ServerState::STOPPED;
            LOG_WARN("[Supervisor] Server '" << name << "' lost (auto restart disabled): " << reason);
        } else if (server->restart_attempts >= server->config.max_restart_attempts) {
            server->state = ServerState::FAILED;
            server->last_error = "Restart limit exceeded for '" + name + "' (" +
                                 std::to_string(server->config.max_restart_attempts) + " attempts): " + reason;
            LOG_ERROR("[Supervisor] " << server->last_error);
        } else {
            server->state = ServerState::RESTARTING;
            int delay_ms = restart_backoff_ms(server->config, server->restart_attempts);
            LOG_WARN("[Supervisor] Server '" << name << "' lost: " << reason << " (restart "
                                             << (server->restart_attempts + 1) << "/"
                                             << server->config.max_restart_attempts << " in " << delay_ms << "ms)");
            schedule_restart(name, generation, delay_ms);
            return;
        }
    }
    server->state_cv.notify_all();
}

void ProcessSupervisor::schedule_restart(const std::string &name, uint64_t generation, int delay_ms) {
    {
        std::lock_guard<std::mutex> lock(worker_mutex_);
        if (worker_stop_) {
            return;
        }
        restart_queue_.push_back(
            RestartRequest{name, generation, std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms)});
    }
    worker_cv_.notify_all();
}

void ProcessSupervisor::worker_loop() {
    std::unique_lock<std::mutex> lock(worker_mutex_);
    while (!worker_stop_) {
        if (restart_queue_.empty()) {
            worker_cv_.wait(lock, [this] { return worker_stop_ || !restart_queue_.empty(); });
            continue;
        }

        auto next = std::min_element(restart_queue_.begin(), restart_queue_.end(),
                                     [](const RestartRequest &a, const RestartRequest &b) { return a.due < b.due; });
        if (std::chrono::steady_clock::now() < next->due) {
            // Woken early by new work, stop_server or shutdown
            worker_cv_.wait_until(lock, next->due);
            continue;
        }

        RestartRequest request = *next;
        restart_queue_.erase(next);
        lock.unlock();

        auto server = find(request.name);
        if (server) {
            std::lock_guard<std::mutex> lifecycle(server->lifecycle_mutex);
            bool current;
            {
                std::lock_guard<std::mutex> state_lock(server->state_mutex);
                current = server->generation == request.generation && server->state == ServerState::RESTARTING;
            }
            if (current) {
                restart_locked(server, true);
            }
        }

        lock.lock();
    }
}

OperationResult ProcessSupervisor::stop_server(const std::string &name) {
    auto server = find(name);
    if (!server) {
        LOG_DEBUG("[Supervisor] stop_server: unknown server '" << name << "'");
        return OperationResult::failure(ErrorCode::NOT_FOUND, "Unknown server: " + name);
    }

    std::lock_guard<std::mutex> lifecycle(server->lifecycle_mutex);
    if (!is_registered(server)) {
        return OperationResult::failure(ErrorCode::NOT_FOUND, "Unknown server: " + name);
    }

    std::shared_ptr<StdioTransport> transport;
    {
        std::lock_guard<std::mutex> lock(server->state_mutex);
        server->state = ServerState::STOPPED;
        ++server->generation;
        transport = std::move(server->transport);
    }
    server->state_cv.notify_all();

    {
        std::lock_guard<std::mutex> lock(worker_mutex_);
        restart_queue_.erase(std::remove_if(restart_queue_.begin(), restart_queue_.end(),
                                            [&name](const RestartRequest &r) { return r.name == name; }),
                             restart_queue_.end());
    }
    worker_cv_.notify_all();

    if (transport) {
        transport->disconnect();
    }
    forget(name, server);

    LOG_INFO("[Supervisor] Server '" << name << "' stopped");
    return OperationResult::ok();
}

void ProcessSupervisor::stop_all() noexcept {
    std::vector<std::string> names;
    {
        std::shared_lock<std::shared_mutex> lock(servers_mutex_);
        names.reserve(servers_.size());
        for (const auto &[name, server] : servers_) {
            names.push_back(name);
        }
    }

    for (const auto &name : names) {
        try {
            OperationResult result = stop_server(name);
            if (!result.success) {
                LOG_DEBUG("[Supervisor] " << result.error_message);
            }
        } catch (const std::exception &e) {
            LOG_ERROR("[Supervisor] Failed to stop '" << name << "': " << e.what());
        }
    }
}

OperationResult ProcessSupervisor::reset_server(const std::string &name) {
    auto server = find(name);
    if (!server) {
        return OperationResult::failure(ErrorCode::NOT_FOUND, "Unknown server: " + name);
    }

    std::lock_guard<std::mutex> lifecycle(server->lifecycle_mutex);
    if (!is_registered(server)) {
        return OperationResult::failure(ErrorCode::NOT_FOUND, "Unknown server: " + name);
    }
    {
        std::lock_guard<std::mutex> lock(server->state_mutex);
        server->restart_attempts = 0;
        if (server->state == ServerState::FAILED) {
            server->state = ServerState::STOPPED;
        }
    }
    server->state_cv.notify_all();
    LOG_INFO("[Supervisor] Server '" << name << "' reset");
    return OperationResult::ok();
}

ServerStatus ProcessSupervisor::snapshot(const ManagedServer &server) const {
    std::lock_guard<std::mutex> lock(server.state_mutex);
    ServerStatus status;
    status.name = server.config.name;
    status.restart_attempts = server.restart_attempts;
    status.max_restart_attempts = server.config.max_restart_attempts;
    status.state = server.state;
    status.last_error = server.last_error;
    if (server.transport) {
        status.connected = server.transport->is_connected();
        status.running = server.transport->is_process_running();
        status.pid = status.running ? server.transport->pid() : -1;
    }
    return status;
}

std::vector<ServerStatus> ProcessSupervisor::status() const {
    std::vector<std::shared_ptr<ManagedServer>> servers;
    {
        std::shared_lock<std::shared_mutex> lock(servers_mutex_);
        servers.reserve(servers_.size());
        for (const auto &[name, server] : servers_) {
            servers.push_back(server);
        }
    }

    std::vector<ServerStatus> result;
    result.reserve(servers.size());
    for (const auto &server : servers) {
        result.push_back(snapshot(*server));
    }
    std::sort(result.begin(), result.end(),
              [](const ServerStatus &a, const ServerStatus &b) { return a.name < b.name; });
    return result;
}

std::optional<ServerStatus> ProcessSupervisor::status(const std::string &name) const {
    auto server = find(name);
    if (!server) {
        return std::nullopt;
    }
    return snapshot(*server);
}

}  // namespace client
}  // namespace tether
