#include "mcp_models.hpp"

namespace tether {
namespace client {

namespace {

std::optional<std::string> optional_string(const nlohmann::json &j, const char *key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

}  // namespace

std::string ToolResponse::first_text() const {
    for (const auto &item : content) {
        if (item.type == "text" && item.text) {
            return *item.text;
        }
    }
    return std::string();
}

void to_json(nlohmann::json &j, const ToolRequest &request) {
    j = nlohmann::json{{"name", request.name},
                       {"arguments", request.arguments.is_null() ? nlohmann::json::object() : request.arguments}};
}

void from_json(const nlohmann::json &j, ToolRequest &request) {
    request.name = j.at("name").get<std::string>();
    request.arguments = j.value("arguments", nlohmann::json::object());
}

void to_json(nlohmann::json &j, const Content &content) {
    j = nlohmann::json{{"type", content.type}};
    if (content.text) {
        j["text"] = *content.text;
    }
    if (content.data) {
        j["data"] = *content.data;
    }
    if (content.mime_type) {
        j["mimeType"] = *content.mime_type;
    }
}

void from_json(const nlohmann::json &j, Content &content) {
    content.type = j.at("type").get<std::string>();
    content.text = optional_string(j, "text");
    content.data = optional_string(j, "data");
    content.mime_type = optional_string(j, "mimeType");
}

void to_json(nlohmann::json &j, const ToolResponse &response) {
    j = nlohmann::json{{"content", response.content}, {"isError", response.is_error}};
}

void from_json(const nlohmann::json &j, ToolResponse &response) {
    response.content = j.value("content", std::vector<Content>{});
    response.is_error = j.value("isError", false);
}

void to_json(nlohmann::json &j, const PropertySchema &property) {
    j = nlohmann::json{{"type", property.type}};
    if (property.description) {
        j["description"] = *property.description;
    }
    if (property.enum_values) {
        j["enum"] = *property.enum_values;
    }
}

void from_json(const nlohmann::json &j, PropertySchema &property) {
    property.type = j.value("type", std::string());
    property.description = optional_string(j, "description");
    if (j.contains("enum") && j["enum"].is_array()) {
        property.enum_values = j["enum"].get<std::vector<std::string>>();
    } else {
        property.enum_values.reset();
    }
}

void to_json(nlohmann::json &j, const InputSchema &schema) {
    j = nlohmann::json{{"type", schema.type}, {"properties", schema.properties}, {"required", schema.required}};
}

void from_json(const nlohmann::json &j, InputSchema &schema) {
    schema.type = j.value("type", std::string("object"));
    schema.properties = j.value("properties", std::map<std::string, PropertySchema>{});
    schema.required = j.value("required", std::vector<std::string>{});
}

void to_json(nlohmann::json &j, const ToolDescriptor &tool) {
    j = nlohmann::json{{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}};
}

void from_json(const nlohmann::json &j, ToolDescriptor &tool) {
    tool.name = j.at("name").get<std::string>();
    tool.description = j.value("description", std::string());
    tool.input_schema = j.value("inputSchema", InputSchema{});
}

std::vector<ToolDescriptor> parse_tool_list(const nlohmann::json &result) {
    if (!result.is_object() || !result.contains("tools")) {
        return {};
    }
    return result.at("tools").get<std::vector<ToolDescriptor>>();
}

}  // namespace client
}  // namespace tether
