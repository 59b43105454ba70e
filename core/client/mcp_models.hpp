#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tether {
namespace client {

// tools/call params
struct ToolRequest {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

// One content item of a tool result ("text", "image", ...)
struct Content {
    std::string type;
    std::optional<std::string> text;
    std::optional<std::string> data;
    std::optional<std::string> mime_type;
};

// tools/call result
struct ToolResponse {
    std::vector<Content> content;
    bool is_error = false;

    // Text of the first text item, empty if there is none
    std::string first_text() const;
};

struct PropertySchema {
    std::string type;
    std::optional<std::string> description;
    std::optional<std::vector<std::string>> enum_values;
};

struct InputSchema {
    std::string type = "object";
    std::map<std::string, PropertySchema> properties;
    std::vector<std::string> required;
};

// One entry of the tools/list result
struct ToolDescriptor {
    std::string name;
    std::string description;
    InputSchema input_schema;
};

// JSON conversion (wire field names: isError, mimeType, inputSchema, enum).
// from_json throws nlohmann::json::exception on wrong types; absent optional fields are tolerated.
void to_json(nlohmann::json &j, const ToolRequest &request);
void from_json(const nlohmann::json &j, ToolRequest &request);
void to_json(nlohmann::json &j, const Content &content);
void from_json(const nlohmann::json &j, Content &content);
void to_json(nlohmann::json &j, const ToolResponse &response);
void from_json(const nlohmann::json &j, ToolResponse &response);
void to_json(nlohmann::json &j, const PropertySchema &property);
void from_json(const nlohmann::json &j, PropertySchema &property);
void to_json(nlohmann::json &j, const InputSchema &schema);
void from_json(const nlohmann::json &j, InputSchema &schema);
void to_json(nlohmann::json &j, const ToolDescriptor &tool);
void from_json(const nlohmann::json &j, ToolDescriptor &tool);

// Parses a tools/list result ({"tools": [...]})
std::vector<ToolDescriptor> parse_tool_list(const nlohmann::json &result);

}  // namespace client
}  // namespace tether
