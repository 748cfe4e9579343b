#include <gtest/gtest.h>
#include "wxmcp/codec.hpp"
#include "wxmcp/error.hpp"
#include <limits>

using namespace wxmcp;

namespace {

JsonRpcRequest parse_request(std::string_view frame) {
    auto msg = Codec::parse(frame);
    EXPECT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    return std::get<JsonRpcRequest>(msg);
}

} // namespace

// ---- Frame shapes ----

TEST(CodecShape, ClassifiesByFields) {
    EXPECT_EQ(Codec::shape_of({{"id", 1}, {"method", "ping"}}), FrameShape::Request);
    EXPECT_EQ(Codec::shape_of({{"method", "notifications/initialized"}}), FrameShape::Notification);
    EXPECT_EQ(Codec::shape_of({{"id", 1}, {"result", nlohmann::json::object()}}), FrameShape::Response);
    EXPECT_EQ(Codec::shape_of({{"id", 1}, {"error", {{"code", -1}}}}), FrameShape::Response);
    EXPECT_EQ(Codec::shape_of({{"id", 1}}), FrameShape::Unknown);
    EXPECT_EQ(Codec::shape_of(nlohmann::json::array()), FrameShape::Unknown);
}

// ---- Parse ----

TEST(CodecParse, ToolCallRequest) {
    auto req = parse_request(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"get_weather","arguments":{"latitude":40.7,"longitude":-74}}})");
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "tools/call");
    ASSERT_TRUE(req.params.has_value());
    EXPECT_EQ(req.params->at("name"), "get_weather");
    EXPECT_DOUBLE_EQ(req.params->at("arguments").at("latitude").get<double>(), 40.7);
    EXPECT_TRUE(req.params->at("arguments").at("longitude").is_number_integer());
}

TEST(CodecParse, StringIdWithoutParams) {
    auto req = parse_request(R"({"jsonrpc":"2.0","id":"list-1","method":"tools/list"})");
    EXPECT_EQ(std::get<std::string>(req.id), "list-1");
    EXPECT_FALSE(req.params.has_value());
}

TEST(CodecParse, LargeUnsignedNumbersSurvive) {
    auto req = parse_request(R"({"jsonrpc":"2.0","id":2,"method":"ping","params":{"n":18446744073709551615}})");
    EXPECT_EQ(req.params->at("n").get<uint64_t>(), 18446744073709551615ull);
}

TEST(CodecParse, EscapedStrings) {
    auto req = parse_request(R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"get_location_weather","arguments":{"state":"New York"}}})");
    EXPECT_EQ(req.params->at("arguments").at("state"), "New York");
}

TEST(CodecParse, Notification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    EXPECT_EQ(std::get<JsonRpcNotification>(msg).method, "notifications/initialized");
}

TEST(CodecParse, ResultResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":42,"result":{"tools":[]}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    const auto& resp = std::get<JsonRpcResponse>(msg);
    EXPECT_EQ(std::get<int64_t>(*resp.id), 42);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_TRUE(resp.result->at("tools").empty());
}

TEST(CodecParse, ErrorResponseWithNullId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    const auto& resp = std::get<JsonRpcResponse>(msg);
    EXPECT_FALSE(resp.id.has_value());
    EXPECT_EQ(resp.error->code, error::ParseError);
}

// ---- Rejected frames ----

TEST(CodecReject, NotJson) {
    EXPECT_THROW(Codec::parse("{invalid json"), McpParseError);
    EXPECT_THROW(Codec::parse(""), McpParseError);
}

TEST(CodecReject, NotAnObject) {
    EXPECT_THROW(Codec::parse("42"), McpParseError);
    EXPECT_THROW(Codec::parse(R"("tools/list")"), McpParseError);
    EXPECT_THROW(Codec::parse(R"([{"jsonrpc":"2.0","id":1,"method":"ping"}])"), McpParseError);
}

TEST(CodecReject, VersionField) {
    EXPECT_THROW(Codec::parse(R"({"id":1,"method":"ping"})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"1.0","id":1,"method":"ping"})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":2,"id":1,"method":"ping"})"), McpParseError);
}

TEST(CodecReject, BadIdsAndMethods) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"ping"})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":{},"method":"ping"})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":7})"), McpParseError);
}

TEST(CodecParse, IdsOutsideInt64Range) {
    auto big = parse_request(R"({"jsonrpc":"2.0","id":18446744073709551615,"method":"ping"})");
    EXPECT_EQ(std::get<uint64_t>(big.id), 18446744073709551615ull);

    auto negative = parse_request(R"({"jsonrpc":"2.0","id":-9223372036854775808,"method":"ping"})");
    EXPECT_EQ(std::get<int64_t>(negative.id), std::numeric_limits<int64_t>::min());

    auto fractional = parse_request(R"({"jsonrpc":"2.0","id":1.5,"method":"ping"})");
    EXPECT_DOUBLE_EQ(std::get<double>(fractional.id), 1.5);
}

TEST(CodecReject, IdWithoutMethod) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"params":{}})"), McpParseError);
}

TEST(CodecReject, TrailingContent) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping"} {"x":1})"), McpParseError);
}

TEST(CodecReject, MalformedErrorObject) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"error":{"message":"no code"}})"), McpParseError);
}

// ---- Serialize ----

TEST(CodecSerialize, ResultResponse) {
    auto out = nlohmann::json::parse(Codec::serialize(
        make_result(RequestId{int64_t{1}}, nlohmann::json{{"content", nlohmann::json::array()}})));
    EXPECT_EQ(out["jsonrpc"], "2.0");
    EXPECT_EQ(out["id"], 1);
    EXPECT_TRUE(out["result"]["content"].is_array());
    EXPECT_FALSE(out.contains("error"));
}

TEST(CodecSerialize, ParseErrorCarriesNullId) {
    auto out = nlohmann::json::parse(Codec::serialize(
        make_error(std::nullopt, JsonRpcError{error::ParseError, "Parse error", std::nullopt})));
    ASSERT_TRUE(out.contains("id"));
    EXPECT_TRUE(out["id"].is_null());
    EXPECT_EQ(out["error"]["code"], -32700);
    EXPECT_FALSE(out.contains("result"));
}

TEST(CodecSerialize, MultiLineTextStaysOnOneLine) {
    auto reply = make_result(RequestId{std::string{"w"}},
                             nlohmann::json{{"text", "Weather for texas:\n{\n  \"x\": 1\n}"}});
    std::string out = Codec::serialize(reply);
    EXPECT_EQ(out.find('\n'), std::string::npos);
    EXPECT_EQ(nlohmann::json::parse(out)["result"]["text"], "Weather for texas:\n{\n  \"x\": 1\n}");
}

TEST(CodecSerialize, RequestIsReadBack) {
    JsonRpcRequest req{RequestId{std::string{"x"}}, "tools/list", nlohmann::json::object()};
    auto back = parse_request(Codec::serialize(req));
    EXPECT_EQ(std::get<std::string>(back.id), "x");
    EXPECT_EQ(back.method, "tools/list");
}
