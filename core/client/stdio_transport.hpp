#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "errors.hpp"
#include "jsonrpc.hpp"
#include "server_config.hpp"
#include "server_process.hpp"

namespace tether {
namespace client {

// Protocol revisions accepted in the initialize reply
extern const std::vector<std::string> kSupportedProtocolVersions;

/**
 * @brief Request/response session with one tool-server child over stdio
 *
 * Owns the child process and both of its standard streams. Requests get a
 * fresh integer id and a PendingRequest entry; a single reader thread resolves
 * entries as responses arrive, in whatever order the server answers. Many
 * threads may call send() at once; each waits only for its own id.
 *
 * Thread Safety:
 * - send(), notify(), ping(), is_connected() may be called from any thread
 * - connect()/disconnect() are serialised internally
 * - The reader thread is the only resolver of pending entries, apart from
 *   teardown which fails whatever remains
 */
class StdioTransport {
public:
    using NotificationHandler = std::function<void(const std::string &method, const nlohmann::json &params)>;
    using ConnectionLostHandler = std::function<void(const std::string &reason)>;

    explicit StdioTransport(ServerConfig config, ClientIdentity identity = ClientIdentity{});
    ~StdioTransport();

    StdioTransport(const StdioTransport &) = delete;
    StdioTransport &operator=(const StdioTransport &) = delete;

    // Spawn the child, run the initialize handshake and start the reader loop.
    // Throws ProcessSpawnError if the program cannot be launched, ConnectionError if the
    // handshake fails, times out or negotiates an unsupported protocol version.
    void connect();

    // Send one request and wait for its response. timeout_ms <= 0 waits until the
    // response arrives or the session ends.
    // Throws TimeoutError, ConnectionLostError, ConnectionError (never connected),
    // RemoteError (server error member) or ProtocolError.
    nlohmann::json send(const std::string &method, const nlohmann::json &params, int timeout_ms);

    // Fire-and-forget message without id
    void notify(const std::string &method, const nlohmann::json &params = nullptr);

    // Best-effort teardown: fails pending requests, stops the child, joins the reader. Idempotent.
    void disconnect() noexcept;

    // Handshake completed and the child is alive
    bool is_connected() const;

    // OS-level liveness of the child, independent of the session
    bool is_process_running() const { return process_.is_running(); }

    // Lightweight liveness probe. Any reply, including an error reply, counts as alive.
    bool ping(int timeout_ms) noexcept;

    void set_notification_handler(NotificationHandler handler);

    // Invoked from the reader thread when the stream closes without disconnect() being called
    void set_connection_lost_handler(ConnectionLostHandler handler);

    size_t pending_count() const;

    const std::string &server_name() const { return config_.name; }
    const ServerConfig &config() const { return config_; }
    pid_t pid() const { return process_.pid(); }
    std::chrono::milliseconds uptime() const { return process_.uptime(); }

    // Handshake results (empty until connected)
    std::string negotiated_protocol_version() const;
    nlohmann::json server_capabilities() const;
    nlohmann::json server_info() const;

    // Reason recorded when the session ended unexpectedly (empty otherwise)
    std::string last_error() const;

private:
    struct PendingRequest {
        std::string method;
        std::chrono::steady_clock::time_point created_at;
        std::promise<nlohmann::json> completion;  // filled exactly once
    };

    ServerConfig config_;
    ClientIdentity identity_;
    ServerProcess process_;

    std::atomic<bool> connected_{false};   // handshake done, session usable
    std::atomic<bool> stopping_{false};    // disconnect() in progress
    std::atomic<bool> lost_{false};        // session ended without disconnect()
    std::atomic<int64_t> next_request_id_{1};

    mutable std::mutex pending_mutex_;
    std::unordered_map<int64_t, PendingRequest> pending_;
    bool accepting_ = false;  // guarded by pending_mutex_; false once teardown has failed the table

    std::mutex lifecycle_mutex_;
    std::thread reader_thread_;

    mutable std::mutex info_mutex_;
    std::string protocol_version_;
    nlohmann::json server_capabilities_;
    nlohmann::json server_info_;
    std::string last_error_;

    std::mutex handler_mutex_;
    NotificationHandler notification_handler_;
    ConnectionLostHandler connection_lost_handler_;

    void handshake();
    void teardown_locked() noexcept;

    nlohmann::json request(const std::string &method, const nlohmann::json &params, int timeout_ms);
    void write_message(const nlohmann::json &message, int timeout_ms);

    std::future<nlohmann::json> register_pending(int64_t id, const std::string &method);
    bool remove_pending(int64_t id);
    void fail_all_pending(const std::string &reason);

    void reader_loop();
    void handle_message(jsonrpc::IncomingMessage &message);
    void handle_response(jsonrpc::IncomingMessage &message);
    void handle_server_request(const jsonrpc::IncomingMessage &message);
    void on_stream_closed(const std::string &reason);
};

}  // namespace client
}  // namespace tether
