#include <gtest/gtest.h>
#include "wxmcp/server.hpp"
#include "wxmcp/transport/websocket_transport.hpp"
#include "wxmcp/weather/weather_tools.hpp"
#include "../support/test_support.hpp"
#include "../support/pipe_io.hpp"
#include "../support/ws_client.hpp"
#include <httplib.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <regex>

using namespace wxmcp;
using namespace wxmcp::testing;

namespace {

/// Plain TCP connection to the listener, driven by hand.
class RawSocket {
public:
    explicit RawSocket(uint16_t port) : fd_(::socket(AF_INET, SOCK_STREAM, 0)) {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        connected_ = fd_ >= 0 && ::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    }

    ~RawSocket() {
        if (fd_ >= 0) ::close(fd_);
    }

    RawSocket(const RawSocket&) = delete;
    RawSocket& operator=(const RawSocket&) = delete;

    bool connected() const { return connected_; }

    bool send_all(const std::string& data) {
        return ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(data.size());
    }

    /// Everything received until the peer closes or the timeout passes.
    std::string read_until_quiet(std::chrono::milliseconds timeout) {
        std::string got;
        auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) break;
            pollfd pfd{fd_, POLLIN, 0};
            if (::poll(&pfd, 1, static_cast<int>(left.count())) <= 0) break;
            char chunk[1024];
            ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
            if (n <= 0) break;
            got.append(chunk, static_cast<size_t>(n));
            // Handshake reply plus a close frame is all we wait for
            auto header_end = got.find("\r\n\r\n");
            if (header_end != std::string::npos && got.size() > header_end + 4) break;
        }
        return got;
    }

private:
    int fd_;
    bool connected_ = false;
};

/// Forecast provider that blocks on a latch for one region.
class GatedProvider : public weather::ForecastProvider {
public:
    explicit GatedProvider(Latch& gate) : gate_(gate) {}

    std::string fetch(const weather::Coordinates& where) override {
        // Texas is the slow one
        if (where.latitude > 31.0 && where.latitude < 32.0) gate_.wait();
        return "forecast";
    }

private:
    Latch& gate_;
};

struct WebSocketServerFixture : ::testing::Test {
    Latch gate;
    PipePeer stdio_peer;
    std::unique_ptr<Server> server;
    uint16_t port = 0;

    void SetUp() override {
        auto registry = std::make_shared<ToolRegistry>();
        weather::register_weather_tools(*registry, std::make_shared<GatedProvider>(gate));

        Server::Options opts;
        opts.config.host = "127.0.0.1";
        opts.config.port = 0;
        opts.config.shutdown_timeout = std::chrono::milliseconds(2000);
        opts.stdio_read_fd = stdio_peer.server_read_fd();
        opts.stdio_write_fd = stdio_peer.server_write_fd();
        server = std::make_unique<Server>(registry, std::move(opts));
        server->start();
        port = server->websocket_port();
        ASSERT_NE(port, 0);
    }

    void TearDown() override {
        gate.open();
        server.reset();
    }

    void initialize(WsTestClient& client, int64_t id = 1) {
        client.send(request(id, "initialize", {{"protocolVersion", "2025-06-18"}}));
        auto reply = client.next();
        ASSERT_TRUE(reply.has_value());
        ASSERT_TRUE(reply->contains("result"));
        client.send(notification("notifications/initialized"));
    }
};

} // namespace

TEST_F(WebSocketServerFixture, InitializeThenCall) {
    WsTestClient client;
    ASSERT_TRUE(client.connect(port));
    initialize(client);

    client.send(tool_call(2, "get_location_weather", {{"state", "California"}}));
    auto reply = client.next();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["id"], 2);
    EXPECT_EQ((*reply)["result"]["content"][0]["text"], "Weather for California:\nforecast");
}

TEST_F(WebSocketServerFixture, RequestBeforeInitializeRejected) {
    WsTestClient client;
    ASSERT_TRUE(client.connect(port));

    client.send(request(1, "tools/list"));
    auto reply = client.next();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["id"], 1);
    EXPECT_EQ((*reply)["error"]["code"], -32600);

    initialize(client, 2);
    client.send(request(3, "tools/list"));
    reply = client.next();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["result"]["tools"].size(), 2u);
}

TEST_F(WebSocketServerFixture, ToolsListSameOnBothTransports) {
    WsTestClient client;
    ASSERT_TRUE(client.connect(port));
    initialize(client);
    client.send(request(2, "tools/list"));
    auto ws_reply = client.next();
    ASSERT_TRUE(ws_reply.has_value());

    stdio_peer.write_line(request(2, "tools/list"));
    auto line = stdio_peer.read_line();
    ASSERT_TRUE(line.has_value());
    auto stdio_reply = nlohmann::json::parse(*line);

    EXPECT_EQ((*ws_reply)["result"], stdio_reply["result"]);
}

TEST_F(WebSocketServerFixture, ParseErrorKeepsConnection) {
    WsTestClient client;
    ASSERT_TRUE(client.connect(port));
    client.send("not json at all");
    auto reply = client.next();
    ASSERT_TRUE(reply.has_value());
    EXPECT_TRUE((*reply)["id"].is_null());
    EXPECT_EQ((*reply)["error"]["code"], -32700);

    client.send(request(7, "ping"));
    reply = client.next();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["id"], 7);
}

TEST_F(WebSocketServerFixture, NotificationGetsNoReply) {
    WsTestClient client;
    ASSERT_TRUE(client.connect(port));
    client.send(notification("notifications/initialized"));
    EXPECT_FALSE(client.next(std::chrono::milliseconds(200)).has_value());
}

TEST_F(WebSocketServerFixture, SlowClientDoesNotBlockOthers) {
    WsTestClient slow;
    WsTestClient fast;
    ASSERT_TRUE(slow.connect(port));
    ASSERT_TRUE(fast.connect(port));
    initialize(slow);
    initialize(fast);

    slow.send(tool_call(10, "get_location_weather", {{"state", "texas"}}));
    fast.send(tool_call(20, "get_location_weather", {{"state", "florida"}}));

    auto fast_reply = fast.next(std::chrono::seconds(3));
    ASSERT_TRUE(fast_reply.has_value());
    EXPECT_EQ((*fast_reply)["id"], 20);
    EXPECT_FALSE(slow.next(std::chrono::milliseconds(100)).has_value());

    gate.open();
    auto slow_reply = slow.next();
    ASSERT_TRUE(slow_reply.has_value());
    EXPECT_EQ((*slow_reply)["id"], 10);
}

TEST_F(WebSocketServerFixture, DisconnectReleasesSession) {
    {
        WsTestClient client;
        ASSERT_TRUE(client.connect(port));
        initialize(client);
        // stdio plus this connection
        EXPECT_EQ(server->sessions().size(), 2u);
        client.close();
        EXPECT_TRUE(client.wait_closed());
    }
    for (int i = 0; i < 100 && server->sessions().size() > 1; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_EQ(server->sessions().size(), 1u);
}

TEST_F(WebSocketServerFixture, ShutdownClosesClients) {
    WsTestClient client;
    ASSERT_TRUE(client.connect(port));
    initialize(client);
    server->shutdown();
    EXPECT_TRUE(client.wait_closed());
}

// ---- HTTP side channel ----

TEST_F(WebSocketServerFixture, RootStatus) {
    httplib::Client http("127.0.0.1", port);
    auto res = http.Get("/");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["message"], "Weather MCP Server is running");
    EXPECT_EQ(body["status"], "healthy");
    EXPECT_EQ(body["tools"], nlohmann::json::array({"get_weather", "get_location_weather"}));
}

TEST_F(WebSocketServerFixture, Health) {
    httplib::Client http("127.0.0.1", port);
    auto res = http.Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["status"], "ok");
    std::regex iso("\\d{4}-\\d{2}-\\d{2}T\\d{2}:\\d{2}:\\d{2}\\.\\d{3}Z");
    EXPECT_TRUE(std::regex_match(body["timestamp"].get<std::string>(), iso));
}

TEST_F(WebSocketServerFixture, UnknownPath) {
    httplib::Client http("127.0.0.1", port);
    auto res = http.Get("/mcp");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(nlohmann::json::parse(res->body)["error"], "Not found");
}

// ---- Transport on its own ----

TEST(WebSocketTransport, BindFailureThrows) {
    auto registry = std::make_shared<ToolRegistry>();
    auto dispatcher = std::make_shared<Dispatcher>(registry, Dispatcher::Options{});
    SessionManager sessions(dispatcher);

    WebSocketTransport first(sessions, {"127.0.0.1", 0, {}});
    first.start();
    ASSERT_NE(first.port(), 0);

    WebSocketTransport second(sessions, {"127.0.0.1", first.port(), {}});
    EXPECT_THROW(second.start(), McpTransportError);
    EXPECT_FALSE(second.is_running());
    first.shutdown();
}

TEST(WebSocketTransport, StopAcceptingRefusesNewClients) {
    auto registry = std::make_shared<ToolRegistry>();
    auto dispatcher = std::make_shared<Dispatcher>(registry, Dispatcher::Options{});
    SessionManager sessions(dispatcher);

    WebSocketTransport transport(sessions, {"127.0.0.1", 0, {}});
    transport.start();
    WsTestClient before;
    ASSERT_TRUE(before.connect(transport.port()));

    transport.stop_accepting();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    WsTestClient after;
    EXPECT_FALSE(after.connect(transport.port(), std::chrono::seconds(2)));
    EXPECT_EQ(transport.connection_count(), 1u);
    transport.shutdown();
}

TEST(WebSocketTransport, HandshakeAfterStopAcceptingIsClosed) {
    auto registry = std::make_shared<ToolRegistry>();
    auto dispatcher = std::make_shared<Dispatcher>(registry, Dispatcher::Options{});
    SessionManager sessions(dispatcher);

    WebSocketTransport transport(sessions, {"127.0.0.1", 0, {}});
    transport.start();

    // Accepted by the listener, but the upgrade request only arrives later
    RawSocket socket(transport.port());
    ASSERT_TRUE(socket.connected());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    transport.stop_accepting();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    ASSERT_TRUE(socket.send_all(
        "GET / HTTP/1.1\r\n"
        "Host: 127.0.0.1\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
        "Sec-WebSocket-Version: 13\r\n\r\n"));
    std::string reply = socket.read_until_quiet(std::chrono::seconds(3));

    ASSERT_EQ(reply.rfind("HTTP/1.1 101", 0), 0u);
    auto header_end = reply.find("\r\n\r\n");
    ASSERT_NE(header_end, std::string::npos);
    ASSERT_GT(reply.size(), header_end + 4);
    // FIN + close opcode
    EXPECT_EQ(static_cast<unsigned char>(reply[header_end + 4]), 0x88);

    EXPECT_EQ(transport.connection_count(), 0u);
    EXPECT_EQ(sessions.size(), 0u);
    transport.shutdown();
}
