#pragma once
#include "forecast_provider.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wxmcp::weather {

/// Region name to representative coordinates. Lookups ignore case; names are
/// listed in insertion order.
class RegionTable {
public:
    RegionTable() = default;
    RegionTable(std::initializer_list<std::pair<std::string, Coordinates>> regions);

    /// The five US states served out of the box.
    static RegionTable us_states();

    /// Add or replace a region.
    void add(const std::string& name, Coordinates where);

    [[nodiscard]] std::optional<Coordinates> find(const std::string& name) const;

    /// Stored (lower-case) names.
    [[nodiscard]] std::vector<std::string> names() const;

    /// Names joined with ", ".
    [[nodiscard]] std::string joined_names() const;

    [[nodiscard]] size_t size() const { return regions_.size(); }

private:
    std::vector<std::pair<std::string, Coordinates>> regions_;
};

} // namespace wxmcp::weather
