#include "jsonrpc.hpp"

#include <cctype>

namespace tether {
namespace client {
namespace jsonrpc {

namespace {

std::optional<int64_t> parse_integer_id(const nlohmann::json &id) {
    if (id.is_number_integer()) {
        return id.get<int64_t>();
    }
    if (id.is_number_unsigned()) {
        return static_cast<int64_t>(id.get<uint64_t>());
    }
    if (id.is_string()) {
        const auto &s = id.get_ref<const std::string &>();
        if (s.empty() || s.size() > 18) {
            return std::nullopt;
        }
        size_t start = (s[0] == '-') ? 1 : 0;
        if (start == s.size()) {
            return std::nullopt;
        }
        for (size_t i = start; i < s.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
                return std::nullopt;
            }
        }
        return std::stoll(s);
    }
    return std::nullopt;
}

}  // namespace

nlohmann::json make_request(int64_t id, const std::string &method, const nlohmann::json &params) {
    nlohmann::json msg = {{"jsonrpc", kVersion}, {"id", id}, {"method", method}};
    if (!params.is_null()) {
        msg["params"] = params;
    }
    return msg;
}

nlohmann::json make_notification(const std::string &method, const nlohmann::json &params) {
    nlohmann::json msg = {{"jsonrpc", kVersion}, {"method", method}};
    if (!params.is_null()) {
        msg["params"] = params;
    }
    return msg;
}

nlohmann::json make_result_response(const nlohmann::json &id, const nlohmann::json &result) {
    return {{"jsonrpc", kVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json &id, int code, const std::string &message) {
    return {{"jsonrpc", kVersion}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

std::string encode(const nlohmann::json &message) {
    // Replace invalid UTF-8 rather than throwing mid-write
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool decode(const std::string &line, IncomingMessage &out, std::string &error) {
    nlohmann::json msg = nlohmann::json::parse(line, nullptr, false);
    if (msg.is_discarded()) {
        error = "Invalid JSON";
        return false;
    }
    if (!msg.is_object()) {
        error = "Message is not a JSON object";
        return false;
    }

    out = IncomingMessage{};

    auto id_it = msg.find("id");
    if (id_it != msg.end()) {
        out.raw_id = *id_it;
        if (!id_it->is_null() && !id_it->is_string() && !id_it->is_number()) {
            error = "Message id must be a string or number";
            return false;
        }
        out.id = parse_integer_id(*id_it);
    }

    auto method_it = msg.find("method");
    if (method_it != msg.end()) {
        if (!method_it->is_string()) {
            error = "Message method must be a string";
            return false;
        }
        out.method = method_it->get<std::string>();
    }

    auto result_it = msg.find("result");
    if (result_it != msg.end()) {
        out.has_result = true;
        out.result = *result_it;
    }

    auto error_it = msg.find("error");
    if (error_it != msg.end()) {
        out.has_error = true;
        out.error = *error_it;
    }

    if (out.has_result && out.has_error) {
        error = "Message carries both result and error";
        return false;
    }

    const bool has_id = !out.raw_id.is_null();
    if (!out.method.empty()) {
        if (out.has_result || out.has_error) {
            error = "Request carries a result or error member";
            return false;
        }
        out.kind = has_id ? MessageKind::REQUEST : MessageKind::NOTIFICATION;
        auto params_it = msg.find("params");
        if (params_it != msg.end()) {
            out.params = *params_it;
        }
        return true;
    }

    if (!has_id) {
        error = "Message has neither id nor method";
        return false;
    }

    out.kind = MessageKind::RESPONSE;
    return true;
}

void extract_error(const nlohmann::json &error, int &code, std::string &message, nlohmann::json &data) {
    code = kInternalError;
    message = "Unknown remote error";
    data = nullptr;

    if (error.is_string()) {
        message = error.get<std::string>();
        return;
    }
    if (!error.is_object()) {
        message = error.dump();
        return;
    }
    auto code_it = error.find("code");
    if (code_it != error.end() && code_it->is_number_integer()) {
        code = code_it->get<int>();
    }
    auto msg_it = error.find("message");
    if (msg_it != error.end() && msg_it->is_string()) {
        message = msg_it->get<std::string>();
    }
    auto data_it = error.find("data");
    if (data_it != error.end()) {
        data = *data_it;
    }
}

}  // namespace jsonrpc
}  // namespace client
}  // namespace tether
