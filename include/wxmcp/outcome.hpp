#pragma once
#include "json_rpc.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <nlohmann/json.hpp>

namespace wxmcp {

enum class FailureKind {
    InvalidRequest,
    MethodNotFound,
    UnknownTool,
    InvalidParams,
    ToolExecutionFailed,
    InternalError
};

/// A failed dispatch, not yet bound to a request id.
struct Failure {
    FailureKind kind;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const Failure& o) const {
        return kind == o.kind && message == o.message && data == o.data;
    }
};

/// Result of dispatching one request: a result payload or a typed failure.
using Outcome = std::variant<nlohmann::json, Failure>;

/// What a tool handler resolves to. Handlers report expected failures
/// (bad region, upstream error) as a Failure instead of throwing.
using ToolResult = std::variant<CallToolResult, Failure>;

std::string_view to_string(FailureKind kind);

/// Map a failure onto its JSON-RPC error envelope.
[[nodiscard]] JsonRpcError to_json_rpc_error(const Failure& failure);

} // namespace wxmcp
