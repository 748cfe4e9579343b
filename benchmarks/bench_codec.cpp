#include <benchmark/benchmark.h>
#include "wxmcp/codec.hpp"
#include "wxmcp/json_rpc.hpp"
#include <string>

using namespace wxmcp;

static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"get_weather","arguments":{"latitude":52.2297,"longitude":21.0122}}})";

// A forecast-sized result: 48 hourly samples per series
static std::string make_forecast_response() {
    nlohmann::json hourly = {{"time", nlohmann::json::array()},
                             {"temperature_2m", nlohmann::json::array()},
                             {"relative_humidity_2m", nlohmann::json::array()},
                             {"wind_speed_10m", nlohmann::json::array()}};
    for (int i = 0; i < 48; ++i) {
        hourly["time"].push_back("2025-06-18T" + std::to_string(i % 24) + ":00");
        hourly["temperature_2m"].push_back(20.0 + i * 0.1);
        hourly["relative_humidity_2m"].push_back(40 + i % 30);
        hourly["wind_speed_10m"].push_back(5.5 + (i % 7));
    }
    nlohmann::json forecast = {{"latitude", 52.23}, {"longitude", 21.01}, {"hourly", hourly}};
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"content", {{{"type", "text"}, {"text", forecast.dump(2)}}}}}}
    };
    return resp.dump();
}

static const std::string kForecastResponse = make_forecast_response();

// ---- Parse benchmarks ----

static void BM_ParseSmallMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kSmallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_ParseSmallMessage)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseForecastResponse(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kForecastResponse);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kForecastResponse.size());
}
BENCHMARK(BM_ParseForecastResponse)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeSmallResult(benchmark::State& state) {
    JsonRpcMessage msg = make_result(RequestId{int64_t{1}}, nlohmann::json::object());
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeSmallResult)->MinTime(1.0);

static void BM_SerializeForecastResponse(benchmark::State& state) {
    auto msg = Codec::parse(kForecastResponse);
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kForecastResponse.size());
}
BENCHMARK(BM_SerializeForecastResponse)->MinTime(1.0);
