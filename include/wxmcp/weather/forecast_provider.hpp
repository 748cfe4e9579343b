#pragma once
#include <string>

namespace wxmcp::weather {

struct Coordinates {
    double latitude = 0.0;
    double longitude = 0.0;
};

/// Source of forecast documents. Implementations throw on failure; the
/// message ends up in the tool error text.
class ForecastProvider {
public:
    virtual ~ForecastProvider() = default;

    /// Forecast for a point, as text ready to hand back to the client.
    virtual std::string fetch(const Coordinates& where) = 0;
};

} // namespace wxmcp::weather
