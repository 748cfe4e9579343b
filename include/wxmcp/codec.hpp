#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace wxmcp {

/// Wire shape of a decoded JSON-RPC object, decided from which of
/// id / method / result / error it carries.
enum class FrameShape {
    Request,
    Notification,
    Response,
    Unknown
};

class Codec {
public:
    /// Parse one raw frame into a message.
    /// Throws McpParseError on invalid JSON, a non-object frame, a wrong
    /// jsonrpc version or a shape that is neither request, notification
    /// nor response.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a message to a compact JSON string (no trailing newline).
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

    [[nodiscard]] static FrameShape shape_of(const nlohmann::json& frame);

private:
    static nlohmann::json decode(std::string_view raw);
    static JsonRpcMessage to_message(const nlohmann::json& frame);
};

} // namespace wxmcp
