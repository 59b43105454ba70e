#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace tether {
namespace client {
namespace jsonrpc {

/**
 * @brief JSON-RPC 2.0 envelope encoding for the stdio wire
 *
 * One envelope per line. The transport only looks at envelope fields
 * (id, method, result, error); params and result payloads stay opaque.
 */

constexpr const char *kVersion = "2.0";

// Standard JSON-RPC error codes
constexpr int kMethodNotFound = -32601;
constexpr int kInternalError = -32603;

enum class MessageKind {
    RESPONSE,      // id present, no method
    REQUEST,       // id and method present (server-initiated)
    NOTIFICATION,  // method present, id absent or null
};

struct IncomingMessage {
    MessageKind kind = MessageKind::RESPONSE;
    nlohmann::json raw_id;           // id exactly as received (null when absent)
    std::optional<int64_t> id;       // integer id, also parsed from numeric strings
    std::string method;
    nlohmann::json params;
    bool has_result = false;
    nlohmann::json result;
    bool has_error = false;
    nlohmann::json error;
};

nlohmann::json make_request(int64_t id, const std::string &method, const nlohmann::json &params);
nlohmann::json make_notification(const std::string &method, const nlohmann::json &params);
nlohmann::json make_result_response(const nlohmann::json &id, const nlohmann::json &result);
nlohmann::json make_error_response(const nlohmann::json &id, int code, const std::string &message);

// Serialise to a single line (no embedded newlines; nlohmann escapes them in strings)
std::string encode(const nlohmann::json &message);

// Parse one line into an envelope. Returns false and sets error on malformed input.
bool decode(const std::string &line, IncomingMessage &out, std::string &error);

// Pulls code/message/data out of a JSON-RPC error member, tolerating missing fields
void extract_error(const nlohmann::json &error, int &code, std::string &message, nlohmann::json &data);

}  // namespace jsonrpc
}  // namespace client
}  // namespace tether
