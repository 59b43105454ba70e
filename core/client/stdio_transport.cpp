#include "stdio_transport.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace tether {
namespace client {

const std::vector<std::string> kSupportedProtocolVersions = {"2024-11-05", "2025-03-26", "2025-06-18"};

namespace {
constexpr int kReaderPollMs = 100;
constexpr int kReplyWriteTimeoutMs = 1000;
}  // namespace

StdioTransport::StdioTransport(ServerConfig config, ClientIdentity identity)
    : config_(config), identity_(std::move(identity)), process_(std::move(config)) {}

StdioTransport::~StdioTransport() { disconnect(); }

void StdioTransport::connect() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (connected_) {
        return;
    }

    // Previous session (lost or failed) must be fully torn down before reuse
    teardown_locked();

    stopping_ = false;
    lost_ = false;
    {
        std::lock_guard<std::mutex> info_lock(info_mutex_);
        last_error_.clear();
        protocol_version_.clear();
        server_capabilities_ = nlohmann::json::object();
        server_info_ = nlohmann::json::object();
    }

    if (!process_.spawn()) {
        throw ProcessSpawnError("[" + config_.name + "] " + process_.last_error());
    }

    {
        std::lock_guard<std::mutex> pending_lock(pending_mutex_);
        accepting_ = true;
    }
    reader_thread_ = std::thread(&StdioTransport::reader_loop, this);

    try {
        handshake();
    } catch (const ClientError &) {
        teardown_locked();
        throw;
    }

    connected_ = true;
    LOG_INFO("[Transport:" << config_.name << "] Connected (protocol " << negotiated_protocol_version() << ")");
}

void StdioTransport::handshake() {
    nlohmann::json params = {
        {"protocolVersion", identity_.protocol_version},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"clientInfo", {{"name", identity_.name}, {"version", identity_.version}}},
    };

    nlohmann::json result;
    try {
        result = request("initialize", params, config_.connect_timeout_ms);
    } catch (const TimeoutError &) {
        throw ConnectionError("[" + config_.name + "] Handshake timed out after " +
                              std::to_string(config_.connect_timeout_ms) + "ms");
    } catch (const RemoteError &e) {
        throw ConnectionError("[" + config_.name + "] Server rejected initialize: " + std::string(e.what()));
    } catch (const ConnectionLostError &e) {
        throw ConnectionError("[" + config_.name + "] Server exited during handshake: " + std::string(e.what()));
    } catch (const ProtocolError &e) {
        throw ConnectionError("[" + config_.name + "] Malformed initialize reply: " + std::string(e.what()));
    }

    if (!result.is_object() || !result.contains("protocolVersion") || !result["protocolVersion"].is_string()) {
        throw ConnectionError("[" + config_.name + "] Initialize reply carries no protocolVersion");
    }

    const std::string version = result["protocolVersion"].get<std::string>();
    if (std::find(kSupportedProtocolVersions.begin(), kSupportedProtocolVersions.end(), version) ==
        kSupportedProtocolVersions.end()) {
        throw ConnectionError("[" + config_.name + "] Unsupported protocol version: " + version);
    }

    {
        std::lock_guard<std::mutex> info_lock(info_mutex_);
        protocol_version_ = version;
        if (result.contains("capabilities") && result["capabilities"].is_object()) {
            server_capabilities_ = result["capabilities"];
        }
        if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
            server_info_ = result["serverInfo"];
        }
    }

    try {
        write_message(jsonrpc::make_notification("notifications/initialized", nullptr), config_.connect_timeout_ms);
    } catch (const ClientError &e) {
        throw ConnectionError("[" + config_.name + "] Failed to confirm initialization: " + std::string(e.what()));
    }
}

nlohmann::json StdioTransport::send(const std::string &method, const nlohmann::json &params, int timeout_ms) {
    if (!connected_) {
        if (lost_) {
            throw ConnectionLostError("[" + config_.name + "] Connection lost: " + last_error());
        }
        throw ConnectionError("[" + config_.name + "] Transport not connected");
    }
    return request(method, params, timeout_ms);
}

nlohmann::json StdioTransport::request(const std::string &method, const nlohmann::json &params, int timeout_ms) {
    const int64_t id = next_request_id_.fetch_add(1);

    // Registered before the write so a fast reply always finds its entry
    std::future<nlohmann::json> future = register_pending(id, method);

    try {
        write_message(jsonrpc::make_request(id, method, params), timeout_ms);
    } catch (const ClientError &) {
        remove_pending(id);
        throw;
    }

    LOG_DEBUG("[Transport:" << config_.name << "] -> " << method << " (id=" << id << ")");

    if (timeout_ms > 0) {
        if (future.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
            if (remove_pending(id)) {
                throw TimeoutError("[" + config_.name + "] Request '" + method + "' (id=" + std::to_string(id) +
                                   ") timed out after " + std::to_string(timeout_ms) + "ms");
            }
            // The reader resolved the entry between the timeout and the removal; take its value
        }
    }
    return future.get();
}

void StdioTransport::notify(const std::string &method, const nlohmann::json &params) {
    if (!connected_) {
        if (lost_) {
            throw ConnectionLostError("[" + config_.name + "] Connection lost: " + last_error());
        }
        throw ConnectionError("[" + config_.name + "] Transport not connected");
    }
    write_message(jsonrpc::make_notification(method, params), config_.connect_timeout_ms);
}

void StdioTransport::write_message(const nlohmann::json &message, int timeout_ms) {
    std::string error;
    if (!process_.stream().write_line(jsonrpc::encode(message), error, timeout_ms > 0 ? timeout_ms : -1)) {
        if (error.find("Timeout") != std::string::npos) {
            throw TimeoutError("[" + config_.name + "] " + error);
        }
        throw ConnectionLostError("[" + config_.name + "] " + error);
    }
}

std::future<nlohmann::json> StdioTransport::register_pending(int64_t id, const std::string &method) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (!accepting_) {
        if (lost_) {
            throw ConnectionLostError("[" + config_.name + "] Connection lost");
        }
        throw ConnectionLostError("[" + config_.name + "] Connection closed");
    }
    PendingRequest &entry = pending_[id];
    entry.method = method;
    entry.created_at = std::chrono::steady_clock::now();
    return entry.completion.get_future();
}

bool StdioTransport::remove_pending(int64_t id) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.erase(id) > 0;
}

void StdioTransport::fail_all_pending(const std::string &reason) {
    std::unordered_map<int64_t, PendingRequest> failed;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        accepting_ = false;
        failed.swap(pending_);
    }
    if (!failed.empty()) {
        LOG_WARN("[Transport:" << config_.name << "] Failing " << failed.size() << " pending request(s): " << reason);
    }
    for (auto &[id, entry] : failed) {
        entry.completion.set_exception(std::make_exception_ptr(ConnectionLostError(
            "[" + config_.name + "] " + reason + " (request '" + entry.method + "', id=" + std::to_string(id) + ")")));
    }
}

size_t StdioTransport::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

void StdioTransport::reader_loop() {
    LineStream &stream = process_.stream();
    std::string line;
    std::string reason;

    while (!stopping_) {
        LineStream::ReadStatus status = stream.read_line(line, kReaderPollMs);

        if (status == LineStream::ReadStatus::LINE) {
            jsonrpc::IncomingMessage message;
            std::string error;
            if (!jsonrpc::decode(line, message, error)) {
                LOG_WARN("[Transport:" << config_.name << "] Skipping malformed message: " << error);
                continue;
            }
            handle_message(message);
            continue;
        }
        if (status == LineStream::ReadStatus::TIMEOUT) {
            // A descendant may still hold the pipe open after the child itself died
            if (!process_.is_running() && !stopping_) {
                reason = "Server process exited";
                break;
            }
            continue;
        }
        if (status == LineStream::ReadStatus::OVERSIZED) {
            LOG_WARN("[Transport:" << config_.name << "] Dropped message larger than " << kMaxLineSize << " bytes");
            continue;
        }
        if (status == LineStream::ReadStatus::END_OF_STREAM) {
            reason = "Server closed its output stream";
        } else {
            reason = "Read error: " + stream.last_read_error();
        }
        break;
    }

    if (stopping_) {
        return;
    }

    // Exit status is usually available right after EOF
    process_.is_running();
    auto status = process_.exit_status();
    if (status) {
        reason += " (exit status " + std::to_string(*status) + ")";
    }
    on_stream_closed(reason);
}

void StdioTransport::on_stream_closed(const std::string &reason) {
    {
        std::lock_guard<std::mutex> info_lock(info_mutex_);
        last_error_ = reason;
    }
    lost_ = true;
    connected_ = false;

    LOG_ERROR("[Transport:" << config_.name << "] Connection lost: " << reason);
    fail_all_pending("Connection lost: " + reason);

    ConnectionLostHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = connection_lost_handler_;
    }
    if (handler) {
        handler(reason);
    }
}

void StdioTransport::handle_message(jsonrpc::IncomingMessage &message) {
    switch (message.kind) {
        case jsonrpc::MessageKind::RESPONSE:
            handle_response(message);
            break;
        case jsonrpc::MessageKind::REQUEST:
            handle_server_request(message);
            break;
        case jsonrpc::MessageKind::NOTIFICATION: {
            NotificationHandler handler;
            {
                std::lock_guard<std::mutex> lock(handler_mutex_);
                handler = notification_handler_;
            }
            if (handler) {
                handler(message.method, message.params);
            } else {
                LOG_DEBUG("[Transport:" << config_.name << "] Notification: " << message.method);
            }
            break;
        }
    }
}

void StdioTransport::handle_response(jsonrpc::IncomingMessage &message) {
    if (!message.id) {
        LOG_WARN("[Transport:" << config_.name << "] Dropping response with unusable id " << message.raw_id.dump());
        return;
    }

    PendingRequest entry;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(*message.id);
        if (it == pending_.end()) {
            LOG_WARN("[Transport:" << config_.name << "] Dropping response for unknown request id " << *message.id);
            return;
        }
        entry = std::move(it->second);
        pending_.erase(it);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                         entry.created_at);
    LOG_DEBUG("[Transport:" << config_.name << "] <- " << entry.method << " (id=" << *message.id << ", " << elapsed.count()
                  << "ms)");

    if (message.has_error) {
        int code = 0;
        std::string text;
        nlohmann::json data;
        jsonrpc::extract_error(message.error, code, text, data);
        entry.completion.set_exception(std::make_exception_ptr(RemoteError(code, text, std::move(data))));
    } else if (message.has_result) {
        entry.completion.set_value(std::move(message.result));
    } else {
        entry.completion.set_exception(std::make_exception_ptr(
            ProtocolError("[" + config_.name + "] Response carries neither result nor error")));
    }
}

void StdioTransport::handle_server_request(const jsonrpc::IncomingMessage &message) {
    nlohmann::json reply;
    if (message.method == "ping") {
        reply = jsonrpc::make_result_response(message.raw_id, nlohmann::json::object());
    } else {
        LOG_DEBUG("[Transport:" << config_.name << "] Rejecting server request: " << message.method);
        reply = jsonrpc::make_error_response(message.raw_id, jsonrpc::kMethodNotFound,
                                             "Method not found: " + message.method);
    }

    try {
        write_message(reply, kReplyWriteTimeoutMs);
    } catch (const ClientError &e) {
        LOG_WARN("[Transport:" << config_.name << "] Failed to answer server request '" << message.method << "': " << e.what());
    }
}

void StdioTransport::disconnect() noexcept {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    teardown_locked();
}

void StdioTransport::teardown_locked() noexcept {
    const bool had_session = connected_ || reader_thread_.joinable();
    stopping_ = true;
    connected_ = false;

    fail_all_pending("Connection closed");

    try {
        process_.shutdown();
    } catch (const std::exception &e) {
        LOG_ERROR("[Transport:" << config_.name << "] Shutdown failed: " << e.what());
    }

    if (reader_thread_.joinable()) {
        if (reader_thread_.get_id() == std::this_thread::get_id()) {
            // Called from a connection-lost callback; the loop is already exiting
            reader_thread_.detach();
        } else {
            reader_thread_.join();
        }
    }
    process_.stream().close_stdout();

    if (had_session) {
        LOG_INFO("[Transport:" << config_.name << "] Disconnected");
    }
}

bool StdioTransport::is_connected() const { return connected_ && process_.is_running(); }

bool StdioTransport::ping(int timeout_ms) noexcept {
    try {
        send("ping", nullptr, timeout_ms);
        return true;
    } catch (const RemoteError &) {
        // Server answered, only the method is unsupported
        return true;
    } catch (const ClientError &e) {
        LOG_DEBUG("[Transport:" << config_.name << "] Ping failed: " << e.what());
        return false;
    } catch (const std::exception &e) {
        LOG_WARN("[Transport:" << config_.name << "] Ping failed: " << e.what());
        return false;
    }
}

void StdioTransport::set_notification_handler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    notification_handler_ = std::move(handler);
}

void StdioTransport::set_connection_lost_handler(ConnectionLostHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    connection_lost_handler_ = std::move(handler);
}

std::string StdioTransport::negotiated_protocol_version() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return protocol_version_;
}

nlohmann::json StdioTransport::server_capabilities() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return server_capabilities_;
}

nlohmann::json StdioTransport::server_info() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return server_info_;
}

std::string StdioTransport::last_error() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return last_error_;
}

}  // namespace client
}  // namespace tether
