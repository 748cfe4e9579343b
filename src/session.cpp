#include "wxmcp/session.hpp"
#include "wxmcp/codec.hpp"
#include "wxmcp/error.hpp"
#include "wxmcp/logger.hpp"

namespace wxmcp {

const char* to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio:     return "stdio";
        case TransportKind::WebSocket: return "websocket";
    }
    return "unknown";
}

Session::Session(std::string id, TransportKind kind,
                 std::shared_ptr<IConnection> connection,
                 std::shared_ptr<const Dispatcher> dispatcher)
    : id_(std::move(id))
    , kind_(kind)
    , connection_(std::move(connection))
    , dispatcher_(std::move(dispatcher)) {
}

Session::~Session() {
    close();
    if (worker_.joinable()) {
        // The worker holds the last reference when it exits on its own
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

void Session::start(FinishedCallback on_finished) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) return;
    on_finished_ = std::move(on_finished);
    worker_ = std::thread([self = shared_from_this()] { self->run(); });
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Session::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ != SessionState::Closed;
}

size_t Session::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inbox_.size();
}

uint64_t Session::processed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processed_;
}

void Session::enqueue(std::string frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Closed || input_done_) return;
        inbox_.push_back(std::move(frame));
    }
    inbox_cv_.notify_one();
}

void Session::end_of_input() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        input_done_ = true;
    }
    inbox_cv_.notify_all();
}

void Session::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Closed) return;
        state_ = SessionState::Closed;
        inbox_.clear();
    }
    inbox_cv_.notify_all();
    if (connection_) connection_->close();
    LOG4CPLUS_DEBUG(session_logger(), "Session " << id_ << " closed");
}

void Session::run() {
    LOG4CPLUS_DEBUG(session_logger(), "Session " << id_ << " (" << to_string(kind_) << ") worker started");
    while (true) {
        std::string frame;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            inbox_cv_.wait(lock, [this] {
                return !inbox_.empty() || input_done_ || state_ == SessionState::Closed;
            });
            if (state_ == SessionState::Closed) break;
            if (inbox_.empty()) break; // input finished and drained
            frame = std::move(inbox_.front());
            inbox_.pop_front();
        }

        auto reply = process(frame);
        if (reply) deliver(*reply);
    }

    // Input ended (stdio EOF) rather than an explicit close
    close();

    FinishedCallback on_finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_finished = std::move(on_finished_);
    }
    if (on_finished) on_finished(id_);
}

void Session::deliver(const JsonRpcMessage& msg) {
    std::string serialized;
    try {
        serialized = Codec::serialize(msg);
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(session_logger(), "Session " << id_ << " could not serialize reply: " << e.what());
        const auto* resp = std::get_if<JsonRpcResponse>(&msg);
        JsonRpcResponse fallback = make_error(resp ? resp->id : std::nullopt,
            JsonRpcError{error::InternalError, "Failed to serialize response", std::nullopt});
        serialized = Codec::serialize(fallback);
    }

    if (!connection_ || !connection_->send(serialized)) {
        LOG4CPLUS_DEBUG(session_logger(), "Session " << id_ << " connection closed, reply discarded");
    }
}

std::optional<JsonRpcMessage> Session::process(std::string_view frame) {
    JsonRpcMessage msg;
    try {
        msg = Codec::parse(frame);
    } catch (const McpParseError& e) {
        LOG4CPLUS_WARN(session_logger(), "Session " << id_ << " received unparsable frame: " << e.what());
        count_frame();
        return make_error(std::nullopt, JsonRpcError{error::ParseError, std::string("Parse error: ") + e.what(), std::nullopt});
    }

    std::optional<JsonRpcMessage> reply;
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        reply = handle_request(*req);
    } else if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        handle_notification(*notif);
    } else {
        // Nothing is ever sent to clients as a request, so no response can be awaited
        LOG4CPLUS_DEBUG(session_logger(), "Session " << id_ << " ignoring unsolicited response");
    }

    count_frame();
    return reply;
}

void Session::count_frame() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++processed_;
}

bool Session::gated(const std::string& method) const {
    if (kind_ != TransportKind::WebSocket) return false;
    if (method == "initialize" || method == "ping") return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == SessionState::Uninitialized;
}

std::optional<JsonRpcMessage> Session::handle_request(const JsonRpcRequest& req) {
    if (gated(req.method)) {
        return make_error(req.id, JsonRpcError{error::InvalidRequest,
            "Session not initialized: send 'initialize' before '" + req.method + "'", std::nullopt});
    }

    const nlohmann::json params = req.params ? *req.params : nlohmann::json::object();
    try {
        Outcome outcome = dispatcher_->dispatch(req.method, params);

        if (auto* failure = std::get_if<Failure>(&outcome)) {
            LOG4CPLUS_DEBUG(session_logger(), "Session " << id_ << " request " << to_string(req.id)
                            << " " << req.method << " failed: " << failure->message);
            return make_error(req.id, to_json_rpc_error(*failure));
        }

        if (req.method == "initialize") {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == SessionState::Uninitialized) state_ = SessionState::Ready;
        }
        return make_result(req.id, std::move(std::get<nlohmann::json>(outcome)));
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(session_logger(), "Session " << id_ << " request " << to_string(req.id)
                        << " " << req.method << " raised: " << e.what());
        return make_error(req.id, JsonRpcError{error::InternalError, e.what(), std::nullopt});
    }
}

void Session::handle_notification(const JsonRpcNotification& notif) {
    const nlohmann::json params = notif.params ? *notif.params : nlohmann::json::object();
    if (!dispatcher_->notify(notif.method, params)) {
        LOG4CPLUS_DEBUG(session_logger(), "Session " << id_ << " dropped unknown notification " << notif.method);
    }
}

} // namespace wxmcp
