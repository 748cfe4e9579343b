#pragma once
#include "forecast_provider.hpp"
#include <string>

namespace wxmcp::weather {

/// Forecast provider backed by the Open-Meteo HTTP API.
class OpenMeteoClient : public ForecastProvider {
public:
    struct Options {
        std::string base_url = "https://api.open-meteo.com";
        int connect_timeout_sec = 10;
        int read_timeout_sec = 30;
    };

    explicit OpenMeteoClient(Options opts);

    /// GET /v1/forecast and return the body re-indented with two spaces.
    /// Throws McpTransportError on connection failure, a non-200 status or
    /// a body that is not JSON.
    std::string fetch(const Coordinates& where) override;

    /// Request path and query for a point.
    static std::string forecast_path(const Coordinates& where);

private:
    Options opts_;
};

} // namespace wxmcp::weather
