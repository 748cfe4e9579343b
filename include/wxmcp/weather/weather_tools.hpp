#pragma once
#include "../tool_registry.hpp"
#include "forecast_provider.hpp"
#include "region_table.hpp"
#include <memory>

namespace wxmcp::weather {

ToolDefinition get_weather_definition();
ToolDefinition get_location_weather_definition();

/// Register get_weather and get_location_weather. Both run on their own
/// thread and report provider failures as ToolExecutionFailed.
void register_weather_tools(ToolRegistry& registry,
                            std::shared_ptr<ForecastProvider> provider,
                            RegionTable regions = RegionTable::us_states());

} // namespace wxmcp::weather
