#include <gtest/gtest.h>
#include "wxmcp/types.hpp"
#include <nlohmann/json.hpp>

using namespace wxmcp;

TEST(ToolDefinition, UsesCamelCaseSchemaKey) {
    ToolDefinition td{"get_weather", "Weather by coordinates", {{"type", "object"}}};
    nlohmann::json j = td;
    EXPECT_EQ(j["name"], "get_weather");
    EXPECT_EQ(j["description"], "Weather by coordinates");
    EXPECT_EQ(j["inputSchema"]["type"], "object");
    EXPECT_FALSE(j.contains("input_schema"));
}

TEST(CallToolResult, TextFactoryWrapsOneTextBlock) {
    nlohmann::json j = CallToolResult::text("72F");
    ASSERT_EQ(j["content"].size(), 1u);
    EXPECT_EQ(j["content"][0]["type"], "text");
    EXPECT_EQ(j["content"][0]["text"], "72F");
    EXPECT_FALSE(j.contains("isError"));
}

TEST(CallToolResult, KeepsContentOrder) {
    CallToolResult r;
    r.content.push_back(TextContent{"a"});
    r.content.push_back(TextContent{"b"});
    nlohmann::json j = r;
    ASSERT_EQ(j["content"].size(), 2u);
    EXPECT_EQ(j["content"][1]["text"], "b");
}

TEST(CallToolResult, EmptyContentIsAnArray) {
    nlohmann::json j = CallToolResult{};
    EXPECT_TRUE(j["content"].is_array());
    EXPECT_TRUE(j["content"].empty());
}

TEST(InitializeResult, AdvertisesToolsOnly) {
    InitializeResult r{"2025-06-18", Implementation{"weather", "1.0.0"}, std::nullopt};
    nlohmann::json j = r;
    EXPECT_EQ(j["protocolVersion"], "2025-06-18");
    ASSERT_EQ(j["capabilities"].size(), 1u);
    EXPECT_TRUE(j["capabilities"]["tools"].is_object());
    EXPECT_EQ(j["serverInfo"]["name"], "weather");
    EXPECT_EQ(j["serverInfo"]["version"], "1.0.0");
    EXPECT_FALSE(j.contains("instructions"));
}

TEST(InitializeResult, IncludesInstructionsWhenSet) {
    InitializeResult r{"2025-06-18", Implementation{"weather", "1.0.0"}, std::string("Ask about US weather")};
    nlohmann::json j = r;
    EXPECT_EQ(j["instructions"], "Ask about US weather");
}
