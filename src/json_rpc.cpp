#include "wxmcp/json_rpc.hpp"
#include "wxmcp/error.hpp"
#include "wxmcp/version.hpp"
#include <limits>

namespace wxmcp {

namespace {

nlohmann::json envelope() {
    return nlohmann::json{{"jsonrpc", std::string(JSONRPC_VERSION)}};
}

} // anonymous namespace

nlohmann::json id_to_json(const std::optional<RequestId>& id) {
    if (!id) return nullptr;
    return std::visit([](const auto& v) { return nlohmann::json(v); }, *id);
}

std::optional<RequestId> id_from_json(const nlohmann::json& j) {
    if (j.is_null()) return std::nullopt;
    if (j.is_number_unsigned()) {
        const auto u = j.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return RequestId{u};
        return RequestId{static_cast<int64_t>(u)};
    }
    if (j.is_number_integer()) return RequestId{j.get<int64_t>()};
    if (j.is_number_float()) return RequestId{j.get<double>()};
    if (j.is_string()) return RequestId{j.get<std::string>()};
    throw McpParseError("Request id must be a number or a string, got " + std::string(j.type_name()));
}

std::string to_string(const RequestId& id) {
    return id_to_json(id).dump();
}

JsonRpcResponse make_result(std::optional<RequestId> id, nlohmann::json result) {
    return JsonRpcResponse{std::move(id), std::move(result), std::nullopt};
}

JsonRpcResponse make_error(std::optional<RequestId> id, JsonRpcError error) {
    return JsonRpcResponse{std::move(id), std::nullopt, std::move(error)};
}

void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = {{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

void from_json(const nlohmann::json& j, JsonRpcError& e) {
    j.at("code").get_to(e.code);
    j.at("message").get_to(e.message);
    auto data = j.find("data");
    e.data = data != j.end() ? std::optional<nlohmann::json>(*data) : std::nullopt;
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = envelope();
    j["id"] = id_to_json(r.id);
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = envelope();
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

// Exactly one of result / error is written
void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = envelope();
    j["id"] = id_to_json(r.id);
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result.value_or(nlohmann::json::object());
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    auto id = j.find("id");
    r.id = id != j.end() ? id_from_json(*id) : std::nullopt;
    if (auto result = j.find("result"); result != j.end()) r.result = *result;
    if (auto err = j.find("error"); err != j.end()) r.error = err->get<JsonRpcError>();
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

} // namespace wxmcp
