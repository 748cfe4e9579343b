#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace wxmcp {

/// A tool as advertised by tools/list. input_schema is an object schema of
/// primitive-typed properties plus a required list.
struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

struct TextContent {
    std::string text;
};

/// Successful tool output; only text content is produced.
struct CallToolResult {
    std::vector<TextContent> content;

    static CallToolResult text(std::string body);
};

struct Implementation {
    std::string name;
    std::string version;
};

/// Reply to initialize. The advertised capabilities are always tools only.
struct InitializeResult {
    std::string protocol_version;
    Implementation server_info;
    std::optional<std::string> instructions;
};

void to_json(nlohmann::json& j, const ToolDefinition& t);
void to_json(nlohmann::json& j, const TextContent& t);
void to_json(nlohmann::json& j, const CallToolResult& t);
void to_json(nlohmann::json& j, const Implementation& t);
void to_json(nlohmann::json& j, const InitializeResult& t);

} // namespace wxmcp
