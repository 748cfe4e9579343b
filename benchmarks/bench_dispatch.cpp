#include <benchmark/benchmark.h>
#include "wxmcp/dispatcher.hpp"
#include "wxmcp/session.hpp"
#include "wxmcp/validator.hpp"
#include "wxmcp/weather/weather_tools.hpp"
#include <memory>
#include <string>

using namespace wxmcp;

namespace {

class ConstantProvider : public weather::ForecastProvider {
public:
    std::string fetch(const weather::Coordinates&) override { return "72F"; }
};

class NullConnection : public IConnection {
public:
    bool send(const std::string&) override { return true; }
    void close() override {}
    bool is_open() const override { return true; }
};

std::shared_ptr<const Dispatcher> make_dispatcher() {
    auto registry = std::make_shared<ToolRegistry>();
    weather::register_weather_tools(*registry, std::make_shared<ConstantProvider>());
    return std::make_shared<Dispatcher>(registry, Dispatcher::Options{{"weather", "1.0.0"}, std::nullopt});
}

} // namespace

static void BM_DispatchPing(benchmark::State& state) {
    auto d = make_dispatcher();
    const auto params = nlohmann::json::object();
    for (auto _ : state) {
        auto out = d->dispatch("ping", params);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_DispatchPing)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto d = make_dispatcher();
    const auto params = nlohmann::json::object();
    for (auto _ : state) {
        auto out = d->dispatch("not_registered_method", params);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_DispatchToolsList(benchmark::State& state) {
    auto d = make_dispatcher();
    const auto params = nlohmann::json::object();
    for (auto _ : state) {
        auto out = d->dispatch("tools/list", params);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_DispatchToolsList)->MinTime(1.0);

// Includes the std::async hop for the tool body
static void BM_DispatchGetWeather(benchmark::State& state) {
    auto d = make_dispatcher();
    const nlohmann::json params = {{"name", "get_weather"},
                                   {"arguments", {{"latitude", 52.2297}, {"longitude", 21.0122}}}};
    for (auto _ : state) {
        auto out = d->dispatch("tools/call", params);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_DispatchGetWeather)->MinTime(1.0);

static void BM_DispatchRejectedArguments(benchmark::State& state) {
    auto d = make_dispatcher();
    const nlohmann::json params = {{"name", "get_weather"}, {"arguments", {{"latitude", "north"}}}};
    for (auto _ : state) {
        auto out = d->dispatch("tools/call", params);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_DispatchRejectedArguments)->MinTime(1.0);

static void BM_ValidateArguments(benchmark::State& state) {
    const auto schema = weather::get_weather_definition().input_schema;
    const nlohmann::json args = {{"latitude", 52.2297}, {"longitude", 21.0122}};
    for (auto _ : state) {
        auto result = InputValidator::validate(schema, args);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ValidateArguments)->MinTime(1.0);

// Parse, dispatch and build the reply for one raw frame
static void BM_SessionProcessFrame(benchmark::State& state) {
    auto session = std::make_shared<Session>("bench", TransportKind::Stdio,
                                             std::make_shared<NullConnection>(), make_dispatcher());
    const std::string frame = R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})";
    for (auto _ : state) {
        auto reply = session->process(frame);
        benchmark::DoNotOptimize(reply);
    }
}
BENCHMARK(BM_SessionProcessFrame)->MinTime(1.0);
