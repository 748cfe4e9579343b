#pragma once
#include "config.hpp"
#include "session_manager.hpp"
#include "tool_registry.hpp"
#include <csignal>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace wxmcp {

/// Owns the transports and the session manager for the lifetime of the
/// process. At most one Server exists at a time.
class Server {
public:
    struct Options {
        ServerConfig config;
        std::optional<std::string> instructions;
        // Descriptors for the stdio transport instead of stdin/stdout; the
        // server closes them (for testing)
        int stdio_read_fd = -1;
        int stdio_write_fd = -1;
    };

    /// Throws McpError when another Server is alive.
    Server(std::shared_ptr<const ToolRegistry> registry, Options opts);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Start the WebSocket listener, and stdio unless running in production.
    /// Throws McpTransportError when the listener cannot be bound.
    void start();

    /// Stop accepting, close every session, wait for workers up to the
    /// configured timeout, then stop the transports. Idempotent.
    void shutdown();

    /// start(), block until stop_flag becomes non-zero or request_stop() is
    /// called, then shutdown().
    void run(const volatile std::sig_atomic_t& stop_flag);

    void request_stop();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] bool stdio_enabled() const;

    /// Port the WebSocket listener is bound to; 0 before start().
    [[nodiscard]] uint16_t websocket_port() const;

    SessionManager& sessions();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace wxmcp
