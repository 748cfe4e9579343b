#include "wxmcp/types.hpp"

namespace wxmcp {

CallToolResult CallToolResult::text(std::string body) {
    CallToolResult result;
    result.content.push_back(TextContent{std::move(body)});
    return result;
}

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"description", t.description}, {"inputSchema", t.input_schema}};
}

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void to_json(nlohmann::json& j, const CallToolResult& t) {
    nlohmann::json content = nlohmann::json::array();
    for (const auto& c : t.content) content.push_back(c);
    j = {{"content", std::move(content)}};
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"serverInfo", t.server_info}
    };
    if (t.instructions) j["instructions"] = *t.instructions;
}

} // namespace wxmcp
