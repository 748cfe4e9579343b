#pragma once
#include <stdexcept>
#include <string>

namespace wxmcp {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class McpParseError : public McpError {
public:
    using McpError::McpError;
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError          = -32700;
    constexpr int InvalidRequest      = -32600;
    constexpr int MethodNotFound      = -32601;
    constexpr int InvalidParams       = -32602;
    constexpr int InternalError       = -32603;
    // Implementation-defined server error range (-32000 .. -32099)
    constexpr int ToolExecutionFailed = -32000;
} // namespace error

} // namespace wxmcp
