#pragma once
#include <string>

namespace wxmcp {

enum class TransportKind {
    Stdio,
    WebSocket
};

const char* to_string(TransportKind kind);

/// Send/close half of one client connection. Owned by exactly one Session,
/// which is the only party that closes it.
class IConnection {
public:
    virtual ~IConnection() = default;

    /// Queue one serialized message. Returns false (and drops the frame) when
    /// the connection is already closed or the write fails. Never throws.
    virtual bool send(const std::string& frame) = 0;

    /// Close the connection. Idempotent.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

/// Abstract transport: accepts clients and feeds their frames to sessions.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start accepting. Returns once the transport's own threads are running.
    virtual void start() = 0;

    /// Stop taking new clients and new input. Live sessions stay open.
    virtual void stop_accepting() = 0;

    /// Stop the transport's threads. Live sessions are closed by the session manager.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;
};

} // namespace wxmcp
