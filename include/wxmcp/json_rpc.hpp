#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace wxmcp {

/// Number or string, echoed back verbatim on the response. Integers beyond
/// int64 keep their unsigned value and fractional ids stay doubles.
using RequestId = std::variant<int64_t, uint64_t, double, std::string>;

/// JSON form of an id; an absent id is written as null.
nlohmann::json id_to_json(const std::optional<RequestId>& id);

/// Reads an id field. null yields nullopt; anything other than a number or a
/// string throws McpParseError.
std::optional<RequestId> id_from_json(const nlohmann::json& j);

/// Readable form of an id for log lines.
std::string to_string(const RequestId& id);

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;
};

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;
};

struct JsonRpcResponse {
    // Empty when the originating frame could not be identified
    std::optional<RequestId> id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;
};

struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

[[nodiscard]] JsonRpcResponse make_result(std::optional<RequestId> id, nlohmann::json result);
[[nodiscard]] JsonRpcResponse make_error(std::optional<RequestId> id, JsonRpcError error);

void to_json(nlohmann::json& j, const JsonRpcError& e);
void from_json(const nlohmann::json& j, JsonRpcError& e);

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void to_json(nlohmann::json& j, const JsonRpcNotification& n);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

void to_json(nlohmann::json& j, const JsonRpcMessage& m);

} // namespace wxmcp
