#include <benchmark/benchmark.h>
#include "wxmcp/session_manager.hpp"
#include "wxmcp/transport/stdio_transport.hpp"
#include "wxmcp/weather/weather_tools.hpp"
#include "../tests/support/pipe_io.hpp"
#include <memory>

using namespace wxmcp;

namespace {

class ConstantProvider : public weather::ForecastProvider {
public:
    std::string fetch(const weather::Coordinates&) override { return "72F"; }
};

// Stdio transport over pipes with the weather tools behind it
struct E2EFixture {
    wxmcp::testing::PipePeer peer;
    std::unique_ptr<SessionManager> sessions;
    std::unique_ptr<StdioTransport> transport;

    E2EFixture() {
        auto registry = std::make_shared<ToolRegistry>();
        weather::register_weather_tools(*registry, std::make_shared<ConstantProvider>());
        auto dispatcher = std::make_shared<Dispatcher>(
            registry, Dispatcher::Options{{"bench-server", "1.0"}, std::nullopt});
        sessions = std::make_unique<SessionManager>(dispatcher);
        transport = std::make_unique<StdioTransport>(*sessions, peer.server_read_fd(), peer.server_write_fd());
        transport->start();
    }

    ~E2EFixture() {
        transport.reset();
        sessions.reset();
    }

    bool roundtrip(const std::string& frame) {
        peer.write_line(frame);
        return peer.read_line().has_value();
    }
};

} // namespace

static void BM_ToolCallStdio(benchmark::State& state) {
    E2EFixture fixture;
    const std::string frame =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"get_weather","arguments":{"latitude":40.7,"longitude":-74.0}}})";

    for (auto _ : state) {
        if (!fixture.roundtrip(frame)) {
            state.SkipWithError("no reply");
            break;
        }
    }
    state.SetLabel("stdio tools/call roundtrip");
}
BENCHMARK(BM_ToolCallStdio)->MinTime(2.0)->UseRealTime();

static void BM_ListToolsStdio(benchmark::State& state) {
    E2EFixture fixture;
    const std::string frame = R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})";

    for (auto _ : state) {
        if (!fixture.roundtrip(frame)) {
            state.SkipWithError("no reply");
            break;
        }
    }
    state.SetLabel("tools/list roundtrip");
}
BENCHMARK(BM_ListToolsStdio)->MinTime(2.0)->UseRealTime();

static void BM_PingStdio(benchmark::State& state) {
    E2EFixture fixture;
    const std::string frame = R"({"jsonrpc":"2.0","id":3,"method":"ping"})";

    for (auto _ : state) {
        if (!fixture.roundtrip(frame)) {
            state.SkipWithError("no reply");
            break;
        }
    }
    state.SetLabel("ping roundtrip");
}
BENCHMARK(BM_PingStdio)->MinTime(2.0)->UseRealTime();
