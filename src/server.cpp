#include "wxmcp/server.hpp"
#include "wxmcp/dispatcher.hpp"
#include "wxmcp/error.hpp"
#include "wxmcp/logger.hpp"
#include "wxmcp/transport/stdio_transport.hpp"
#include "wxmcp/transport/websocket_transport.hpp"
#include "wxmcp/version.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <unistd.h>

namespace wxmcp {

namespace {
std::atomic<bool> g_instance_alive{false};
} // namespace

struct Server::Impl {
    Options opts;
    std::shared_ptr<const Dispatcher> dispatcher;
    SessionManager sessions;
    // Declared after the session manager so they are destroyed first
    std::unique_ptr<StdioTransport> stdio;
    std::unique_ptr<WebSocketTransport> websocket;

    std::atomic<bool> running{false};
    std::mutex stop_mutex;
    std::condition_variable stop_cv;
    bool stop_requested = false;

    Impl(std::shared_ptr<const ToolRegistry> registry, Options o)
        : opts(std::move(o))
        , dispatcher(std::make_shared<Dispatcher>(std::move(registry), Dispatcher::Options{
              Implementation{std::string(SERVER_NAME), std::string(LIBRARY_VERSION)},
              opts.instructions}))
        , sessions(dispatcher) {}

    ~Impl() {
        // Descriptors handed over for a stdio transport that never started
        if (opts.stdio_read_fd >= 0) ::close(opts.stdio_read_fd);
        if (opts.stdio_write_fd >= 0) ::close(opts.stdio_write_fd);
    }
};

Server::Server(std::shared_ptr<const ToolRegistry> registry, Options opts) {
    if (g_instance_alive.exchange(true)) {
        throw McpError("A server is already running in this process");
    }
    try {
        impl_ = std::make_unique<Impl>(std::move(registry), std::move(opts));
    } catch (...) {
        g_instance_alive = false;
        throw;
    }
}

Server::~Server() {
    shutdown();
    impl_.reset();
    g_instance_alive = false;
}

void Server::start() {
    if (impl_->running.exchange(true)) return;

    const auto& config = impl_->opts.config;
    LOG4CPLUS_INFO(server_logger(), "Starting " << SERVER_NAME << " " << LIBRARY_VERSION
                   << " (" << describe(config) << ")");

    WebSocketTransport::Options ws_opts;
    ws_opts.host = config.host;
    ws_opts.port = config.port;
    for (const auto& def : impl_->dispatcher->registry().list()) {
        ws_opts.tool_names.push_back(def.name);
    }

    try {
        impl_->websocket = std::make_unique<WebSocketTransport>(impl_->sessions, std::move(ws_opts));
        impl_->websocket->start();

        if (!config.production) {
            if (impl_->opts.stdio_read_fd >= 0 && impl_->opts.stdio_write_fd >= 0) {
                impl_->stdio = std::make_unique<StdioTransport>(
                    impl_->sessions, impl_->opts.stdio_read_fd, impl_->opts.stdio_write_fd,
                    config.shutdown_timeout);
                impl_->opts.stdio_read_fd = impl_->opts.stdio_write_fd = -1;
            } else {
                impl_->stdio = std::make_unique<StdioTransport>(impl_->sessions, config.shutdown_timeout);
            }
            impl_->stdio->start();
        } else {
            LOG4CPLUS_INFO(server_logger(), "Production mode: stdio transport disabled");
        }
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(server_logger(), "Startup failed: " << e.what());
        shutdown();
        throw;
    }
}

void Server::shutdown() {
    if (!impl_ || !impl_->running.exchange(false)) return;
    LOG4CPLUS_INFO(server_logger(), "Shutting down");

    if (impl_->websocket) impl_->websocket->stop_accepting();
    if (impl_->stdio) impl_->stdio->stop_accepting();

    impl_->sessions.close_all();
    if (!impl_->sessions.wait_drained(impl_->opts.config.shutdown_timeout)) {
        LOG4CPLUS_WARN(server_logger(), "Sessions still busy after "
                       << impl_->opts.config.shutdown_timeout.count() << " ms, continuing shutdown");
    }

    if (impl_->websocket) impl_->websocket->shutdown();
    if (impl_->stdio) impl_->stdio->shutdown();
    impl_->websocket.reset();
    impl_->stdio.reset();
    LOG4CPLUS_INFO(server_logger(), "Shutdown complete");
}

void Server::run(const volatile std::sig_atomic_t& stop_flag) {
    start();
    {
        std::unique_lock<std::mutex> lock(impl_->stop_mutex);
        // Signal handlers can only set the flag, so it is polled
        while (!stop_flag && !impl_->stop_requested) {
            impl_->stop_cv.wait_for(lock, std::chrono::milliseconds(100));
        }
    }
    shutdown();
}

void Server::request_stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->stop_mutex);
        impl_->stop_requested = true;
    }
    impl_->stop_cv.notify_all();
}

bool Server::is_running() const {
    return impl_->running;
}

bool Server::stdio_enabled() const {
    return !impl_->opts.config.production;
}

uint16_t Server::websocket_port() const {
    return impl_->websocket ? impl_->websocket->port() : 0;
}

SessionManager& Server::sessions() {
    return impl_->sessions;
}

} // namespace wxmcp
