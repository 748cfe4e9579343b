#pragma once

// Umbrella header
#include "version.hpp"
#include "error.hpp"
#include "json_rpc.hpp"
#include "types.hpp"
#include "outcome.hpp"
#include "codec.hpp"
#include "validator.hpp"
#include "tool_registry.hpp"
#include "dispatcher.hpp"
#include "session.hpp"
#include "session_manager.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/websocket_transport.hpp"
#include "weather/forecast_provider.hpp"
#include "weather/open_meteo_client.hpp"
#include "weather/region_table.hpp"
#include "weather/weather_tools.hpp"
