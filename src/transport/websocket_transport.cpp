#include "wxmcp/transport/websocket_transport.hpp"
#include "wxmcp/error.hpp"
#include "wxmcp/logger.hpp"

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <ctime>
#include <future>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>

namespace wxmcp {

namespace {

using ws_server = websocketpp::server<websocketpp::config::asio>;
using connection_hdl = websocketpp::connection_hdl;
using message_ptr = ws_server::message_ptr;

// Upper bound on waiting for close handshakes before the loop is stopped hard
constexpr auto CLOSE_GRACE = std::chrono::seconds(1);

std::string iso8601_now() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

/// Send/close half of one websocket connection.
class WsConnection : public IConnection {
public:
    WsConnection(ws_server& server, connection_hdl hdl)
        : server_(server), hdl_(std::move(hdl)) {}

    bool send(const std::string& frame) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) return false;
        websocketpp::lib::error_code ec;
        server_.send(hdl_, frame, websocketpp::frame::opcode::text, ec);
        if (ec) {
            LOG4CPLUS_DEBUG(transport_logger(), "websocket send failed: " << ec.message());
            open_ = false;
            return false;
        }
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) return;
        open_ = false;
        websocketpp::lib::error_code ec;
        server_.close(hdl_, websocketpp::close::status::going_away, "Session closed", ec);
        if (ec) {
            LOG4CPLUS_DEBUG(transport_logger(), "websocket close failed: " << ec.message());
        }
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    // The peer is gone; later sends are discarded without touching the socket
    void mark_closed() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
    }

private:
    ws_server& server_;
    connection_hdl hdl_;
    mutable std::mutex mutex_;
    bool open_ = true;
};

struct Peer {
    std::shared_ptr<Session> session;
    std::shared_ptr<WsConnection> connection;
};

} // namespace

struct WebSocketTransport::Impl {
    Impl(SessionManager& s, Options o) : sessions(s), opts(std::move(o)) {}

    SessionManager& sessions;
    Options opts;
    ws_server server;
    std::thread loop_thread;
    std::future<void> loop_done;
    std::atomic<bool> running{false};
    std::atomic<bool> accepting{false};
    std::atomic<uint16_t> bound_port{0};

    mutable std::mutex peers_mutex;
    std::map<connection_hdl, Peer, std::owner_less<connection_hdl>> peers;

    void on_open(connection_hdl hdl);
    void on_gone(connection_hdl hdl, const char* why);
    void on_message(connection_hdl hdl, message_ptr msg);
    void on_http(connection_hdl hdl);
    void release_all();
};

void WebSocketTransport::Impl::on_open(connection_hdl hdl) {
    // Handshakes already in flight when stop_accepting() ran end up here
    if (!accepting) {
        websocketpp::lib::error_code ec;
        server.close(hdl, websocketpp::close::status::going_away, "Server shutting down", ec);
        if (ec) {
            LOG4CPLUS_DEBUG(transport_logger(), "websocket close failed: " << ec.message());
        }
        LOG4CPLUS_INFO(transport_logger(), "websocket client refused, transport not accepting");
        return;
    }
    auto connection = std::make_shared<WsConnection>(server, hdl);
    auto session = sessions.open(TransportKind::WebSocket, connection);
    {
        std::lock_guard<std::mutex> lock(peers_mutex);
        peers[hdl] = Peer{session, connection};
    }
    LOG4CPLUS_INFO(transport_logger(), "websocket client connected, session " << session->id());
}

void WebSocketTransport::Impl::on_gone(connection_hdl hdl, const char* why) {
    Peer peer;
    {
        std::lock_guard<std::mutex> lock(peers_mutex);
        auto it = peers.find(hdl);
        if (it == peers.end()) return;
        peer = std::move(it->second);
        peers.erase(it);
    }
    peer.connection->mark_closed();
    sessions.release(peer.session->id());
    LOG4CPLUS_INFO(transport_logger(), "websocket session " << peer.session->id() << " " << why);
}

void WebSocketTransport::Impl::on_message(connection_hdl hdl, message_ptr msg) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(peers_mutex);
        auto it = peers.find(hdl);
        if (it != peers.end()) session = it->second.session;
    }
    if (!session) {
        LOG4CPLUS_DEBUG(transport_logger(), "frame for an unknown websocket connection dropped");
        return;
    }
    // Enqueue only; the session worker does the rest
    session->enqueue(msg->get_payload());
}

void WebSocketTransport::Impl::on_http(connection_hdl hdl) {
    auto con = server.get_con_from_hdl(hdl);
    std::string path = con->get_resource();
    auto q = path.find('?');
    if (q != std::string::npos) path.erase(q);

    nlohmann::json body;
    if (path == "/") {
        body = {
            {"message", "Weather MCP Server is running"},
            {"status", "healthy"},
            {"tools", opts.tool_names}
        };
        con->set_status(websocketpp::http::status_code::ok);
    } else if (path == "/health") {
        body = {{"status", "ok"}, {"timestamp", iso8601_now()}};
        con->set_status(websocketpp::http::status_code::ok);
    } else {
        body = {{"error", "Not found"}};
        con->set_status(websocketpp::http::status_code::not_found);
    }
    con->append_header("Content-Type", "application/json");
    con->set_body(body.dump());
}

void WebSocketTransport::Impl::release_all() {
    std::map<connection_hdl, Peer, std::owner_less<connection_hdl>> gone;
    {
        std::lock_guard<std::mutex> lock(peers_mutex);
        gone.swap(peers);
    }
    for (auto& [hdl, peer] : gone) {
        sessions.release(peer.session->id());
        peer.connection->mark_closed();
    }
}

WebSocketTransport::WebSocketTransport(SessionManager& sessions, Options opts)
    : impl_(std::make_unique<Impl>(sessions, std::move(opts))) {
    auto& server = impl_->server;

    // websocketpp logs to stdout by default, which belongs to the stdio transport
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.set_error_channels(websocketpp::log::elevel::warn | websocketpp::log::elevel::rerror |
                              websocketpp::log::elevel::fatal);
    server.get_elog().set_ostream(&std::cerr);

    server.init_asio();
    server.set_reuse_addr(true);

    Impl* impl = impl_.get();
    server.set_open_handler([impl](connection_hdl hdl) { impl->on_open(hdl); });
    server.set_close_handler([impl](connection_hdl hdl) { impl->on_gone(hdl, "disconnected"); });
    server.set_fail_handler([impl](connection_hdl hdl) { impl->on_gone(hdl, "failed"); });
    server.set_message_handler([impl](connection_hdl hdl, message_ptr msg) {
        impl->on_message(hdl, msg);
    });
    server.set_http_handler([impl](connection_hdl hdl) { impl->on_http(hdl); });
}

WebSocketTransport::~WebSocketTransport() {
    shutdown();
    // Sessions may outlive the transport; detach them before the server goes away
    impl_->release_all();
}

void WebSocketTransport::start() {
    if (impl_->running.exchange(true)) return;

    auto& server = impl_->server;
    websocketpp::lib::error_code ec;
    server.listen(impl_->opts.host, std::to_string(impl_->opts.port), ec);
    if (ec) {
        impl_->running = false;
        throw McpTransportError("Failed to listen on " + impl_->opts.host + ":" +
                                std::to_string(impl_->opts.port) + ": " + ec.message());
    }
    websocketpp::lib::asio::error_code endpoint_ec;
    auto endpoint = server.get_local_endpoint(endpoint_ec);
    impl_->bound_port = endpoint_ec ? impl_->opts.port : endpoint.port();

    server.start_accept(ec);
    if (ec) {
        impl_->running = false;
        throw McpTransportError("Failed to accept connections: " + ec.message());
    }
    impl_->accepting = true;

    std::packaged_task<void()> loop([impl = impl_.get()] {
        try {
            impl->server.run();
        } catch (const std::exception& e) {
            LOG4CPLUS_ERROR(transport_logger(), "websocket event loop failed: " << e.what());
        }
    });
    impl_->loop_done = loop.get_future();
    impl_->loop_thread = std::thread(std::move(loop));

    LOG4CPLUS_INFO(transport_logger(), "websocket transport listening on "
                   << impl_->opts.host << ":" << impl_->bound_port.load());
}

void WebSocketTransport::stop_accepting() {
    if (!impl_->accepting.exchange(false)) return;
    // The acceptor belongs to the event loop thread
    impl_->server.get_io_service().post([impl = impl_.get()] {
        websocketpp::lib::error_code ec;
        impl->server.stop_listening(ec);
        if (ec) {
            LOG4CPLUS_WARN(transport_logger(), "stop_listening failed: " << ec.message());
        }
    });
    LOG4CPLUS_INFO(transport_logger(), "websocket transport no longer accepting connections");
}

void WebSocketTransport::shutdown() {
    if (!impl_->running.exchange(false)) return;
    stop_accepting();
    impl_->release_all();

    // Let close handshakes finish, then stop the loop regardless
    if (impl_->loop_done.valid() &&
        impl_->loop_done.wait_for(CLOSE_GRACE) != std::future_status::ready) {
        impl_->server.stop();
    }
    if (impl_->loop_thread.joinable()) impl_->loop_thread.join();
    LOG4CPLUS_INFO(transport_logger(), "websocket transport stopped");
}

bool WebSocketTransport::is_running() const {
    return impl_->running;
}

uint16_t WebSocketTransport::port() const {
    return impl_->bound_port;
}

size_t WebSocketTransport::connection_count() const {
    std::lock_guard<std::mutex> lock(impl_->peers_mutex);
    return impl_->peers.size();
}

} // namespace wxmcp
