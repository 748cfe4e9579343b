#pragma once
#include "transport.hpp"
#include "../session_manager.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace wxmcp {

/// WebSocket listener: one session per connection, one text frame per
/// message. Plain HTTP GETs on the same port answer the status endpoints.
class WebSocketTransport : public ITransport {
public:
    struct Options {
        std::string host = "0.0.0.0";
        uint16_t port = 3000;           // 0 picks a free port
        std::vector<std::string> tool_names; // reported by GET /
    };

    WebSocketTransport(SessionManager& sessions, Options opts);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    /// Bind and start the event loop thread. Throws McpTransportError when
    /// the address cannot be bound.
    void start() override;
    void stop_accepting() override;
    void shutdown() override;
    bool is_running() const override;

    /// Port actually bound; valid after start().
    uint16_t port() const;

    /// Connections currently open.
    size_t connection_count() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace wxmcp
