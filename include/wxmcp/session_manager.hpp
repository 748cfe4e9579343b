#pragma once
#include "dispatcher.hpp"
#include "session.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace wxmcp {

/// The set of live sessions. Transports open and release sessions here; the
/// server closes and drains them on shutdown.
class SessionManager {
public:
    explicit SessionManager(std::shared_ptr<const Dispatcher> dispatcher);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// Create and start a session for a new connection. An empty id gets a
    /// generated one.
    std::shared_ptr<Session> open(TransportKind kind,
                                  std::shared_ptr<IConnection> connection,
                                  std::string id = {});

    /// Close a session after its transport went away. Unknown ids are ignored.
    void release(const std::string& id);

    [[nodiscard]] std::shared_ptr<Session> find(const std::string& id) const;
    [[nodiscard]] size_t size() const;

    /// Close every live session.
    void close_all();

    /// Wait until every session worker has exited. False on timeout.
    bool wait_drained(std::chrono::milliseconds timeout);

    /// Random identifier for a new session.
    static std::string generate_session_id();

private:
    // Shared with session workers so a late exit never touches a destroyed manager
    struct State {
        std::mutex mutex;
        std::condition_variable drained_cv;
        std::map<std::string, std::shared_ptr<Session>> sessions;
        size_t running_workers = 0;
    };

    std::shared_ptr<const Dispatcher> dispatcher_;
    std::shared_ptr<State> state_;
};

} // namespace wxmcp
