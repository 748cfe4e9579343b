#pragma once
#include "dispatcher.hpp"
#include "json_rpc.hpp"
#include "transport/transport.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace wxmcp {

enum class SessionState {
    Uninitialized,
    Ready,
    Closed
};

/// One connected client. Frames are handled strictly one at a time, in
/// arrival order, on the session's own worker thread; sessions never wait on
/// each other.
class Session : public std::enable_shared_from_this<Session> {
public:
    using FinishedCallback = std::function<void(const std::string& session_id)>;

    Session(std::string id, TransportKind kind,
            std::shared_ptr<IConnection> connection,
            std::shared_ptr<const Dispatcher> dispatcher);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Spawn the worker. on_finished runs on the worker thread when it exits.
    void start(FinishedCallback on_finished = nullptr);

    /// Append a raw frame to the inbound queue. Ignored once the session is closed.
    void enqueue(std::string frame);

    /// No more input will arrive: finish the queued frames, then close.
    void end_of_input();

    /// Close the connection now. Queued frames are dropped; a result still
    /// being computed is discarded when it completes.
    void close();

    /// Run one dispatch cycle on a frame and return the reply, if any.
    /// Does not touch the connection.
    [[nodiscard]] std::optional<JsonRpcMessage> process(std::string_view frame);

    const std::string& id() const { return id_; }
    TransportKind kind() const { return kind_; }
    SessionState state() const;
    bool is_open() const;
    size_t pending() const;
    /// Frames handled so far, including ones rejected as unparsable.
    uint64_t processed() const;

private:
    void run();
    void deliver(const JsonRpcMessage& msg);
    std::optional<JsonRpcMessage> handle_request(const JsonRpcRequest& req);
    void handle_notification(const JsonRpcNotification& notif);
    bool gated(const std::string& method) const;
    void count_frame();

    const std::string id_;
    const TransportKind kind_;
    std::shared_ptr<IConnection> connection_;
    std::shared_ptr<const Dispatcher> dispatcher_;

    mutable std::mutex mutex_;
    std::condition_variable inbox_cv_;
    std::deque<std::string> inbox_;
    SessionState state_{SessionState::Uninitialized};
    bool input_done_{false};
    uint64_t processed_{0};

    std::thread worker_;
    FinishedCallback on_finished_;
};

} // namespace wxmcp
