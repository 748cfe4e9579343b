#include "wxmcp/weather/weather_tools.hpp"
#include "wxmcp/logger.hpp"
#include <stdexcept>

namespace wxmcp::weather {

namespace {

ToolResult fetch_as_result(ForecastProvider& provider, const Coordinates& where,
                           const std::string& prefix) {
    try {
        return CallToolResult::text(prefix + provider.fetch(where));
    } catch (const std::exception& e) {
        return Failure{FailureKind::ToolExecutionFailed,
                       std::string("Weather API error: ") + e.what(), std::nullopt};
    }
}

} // namespace

ToolDefinition get_weather_definition() {
    return ToolDefinition{
        "get_weather",
        "Get current weather for a location by coordinates",
        {
            {"type", "object"},
            {"properties", {
                {"latitude",  {{"type", "number"}, {"description", "Latitude coordinate"}}},
                {"longitude", {{"type", "number"}, {"description", "Longitude coordinate"}}}
            }},
            {"required", nlohmann::json::array({"latitude", "longitude"})}
        }
    };
}

ToolDefinition get_location_weather_definition() {
    return ToolDefinition{
        "get_location_weather",
        "Get current weather for a US state",
        {
            {"type", "object"},
            {"properties", {
                {"state", {{"type", "string"}, {"description", "US state name"}}}
            }},
            {"required", nlohmann::json::array({"state"})}
        }
    };
}

void register_weather_tools(ToolRegistry& registry,
                            std::shared_ptr<ForecastProvider> provider,
                            RegionTable regions) {
    if (!provider) {
        throw std::invalid_argument("weather tools require a forecast provider");
    }

    registry.add(get_weather_definition(), [provider](const nlohmann::json& args) {
        Coordinates where{args.at("latitude").get<double>(), args.at("longitude").get<double>()};
        return std::async(std::launch::async, [provider, where] {
            return fetch_as_result(*provider, where, "");
        });
    });

    auto table = std::make_shared<const RegionTable>(std::move(regions));
    registry.add(get_location_weather_definition(), [provider, table](const nlohmann::json& args) {
        std::string state = args.at("state").get<std::string>();
        return std::async(std::launch::async, [provider, table, state]() -> ToolResult {
            auto where = table->find(state);
            if (!where) {
                LOG4CPLUS_DEBUG(tools_logger(), "unknown region " << state);
                return Failure{FailureKind::InvalidParams,
                               "State \"" + state + "\" not found. Available states: " +
                                   table->joined_names(),
                               std::nullopt};
            }
            return fetch_as_result(*provider, *where, "Weather for " + state + ":\n");
        });
    });
}

} // namespace wxmcp::weather
