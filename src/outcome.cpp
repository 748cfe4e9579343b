#include "wxmcp/outcome.hpp"
#include "wxmcp/error.hpp"

namespace wxmcp {

std::string_view to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::InvalidRequest:      return "InvalidRequest";
        case FailureKind::MethodNotFound:      return "MethodNotFound";
        case FailureKind::UnknownTool:         return "UnknownTool";
        case FailureKind::InvalidParams:       return "InvalidParams";
        case FailureKind::ToolExecutionFailed: return "ToolExecutionFailed";
        case FailureKind::InternalError:       return "InternalError";
    }
    return "InternalError";
}

JsonRpcError to_json_rpc_error(const Failure& failure) {
    int code = error::InternalError;
    switch (failure.kind) {
        case FailureKind::InvalidRequest:      code = error::InvalidRequest; break;
        // Unknown tools share the wire code; the message tells them apart
        case FailureKind::MethodNotFound:
        case FailureKind::UnknownTool:         code = error::MethodNotFound; break;
        case FailureKind::InvalidParams:       code = error::InvalidParams; break;
        case FailureKind::ToolExecutionFailed: code = error::ToolExecutionFailed; break;
        case FailureKind::InternalError:       code = error::InternalError; break;
    }
    return JsonRpcError{code, failure.message, failure.data};
}

} // namespace wxmcp
