#include "wxmcp/weather/open_meteo_client.hpp"
#include "wxmcp/error.hpp"
#include "wxmcp/logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>

namespace wxmcp::weather {

namespace {

// Shortest text that round-trips, e.g. 40.7 rather than 40.700000
std::string format_coordinate(double v) {
    return nlohmann::json(v).dump();
}

} // namespace

OpenMeteoClient::OpenMeteoClient(Options opts)
    : opts_(std::move(opts)) {
    while (!opts_.base_url.empty() && opts_.base_url.back() == '/') {
        opts_.base_url.pop_back();
    }
}

std::string OpenMeteoClient::forecast_path(const Coordinates& where) {
    return "/v1/forecast?latitude=" + format_coordinate(where.latitude) +
           "&longitude=" + format_coordinate(where.longitude) +
           "&current_weather=true&hourly=temperature_2m,relative_humidity_2m,wind_speed_10m";
}

std::string OpenMeteoClient::fetch(const Coordinates& where) {
    httplib::Client client(opts_.base_url);
    if (!client.is_valid()) {
        throw McpTransportError("Invalid forecast service URL: " + opts_.base_url);
    }
    client.set_connection_timeout(opts_.connect_timeout_sec);
    client.set_read_timeout(opts_.read_timeout_sec);

    const std::string path = forecast_path(where);
    LOG4CPLUS_DEBUG(tools_logger(), "GET " << opts_.base_url << path);

    auto res = client.Get(path);
    if (!res) {
        throw McpTransportError("request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw McpTransportError("HTTP " + std::to_string(res->status));
    }

    try {
        return nlohmann::json::parse(res->body).dump(2);
    } catch (const nlohmann::json::parse_error& e) {
        throw McpTransportError(std::string("invalid response body: ") + e.what());
    }
}

} // namespace wxmcp::weather
