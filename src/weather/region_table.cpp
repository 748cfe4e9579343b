#include "wxmcp/weather/region_table.hpp"
#include <algorithm>
#include <cctype>

namespace wxmcp::weather {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

RegionTable::RegionTable(std::initializer_list<std::pair<std::string, Coordinates>> regions) {
    for (const auto& r : regions) add(r.first, r.second);
}

RegionTable RegionTable::us_states() {
    return RegionTable{
        {"california", {36.7783, -119.4179}},
        {"texas",      {31.9686, -99.9018}},
        {"florida",    {27.6648, -81.5158}},
        {"new york",   {42.1657, -74.9481}},
        {"illinois",   {40.3363, -89.0022}},
    };
}

void RegionTable::add(const std::string& name, Coordinates where) {
    std::string key = to_lower(name);
    for (auto& r : regions_) {
        if (r.first == key) {
            r.second = where;
            return;
        }
    }
    regions_.emplace_back(std::move(key), where);
}

std::optional<Coordinates> RegionTable::find(const std::string& name) const {
    const std::string key = to_lower(name);
    for (const auto& r : regions_) {
        if (r.first == key) return r.second;
    }
    return std::nullopt;
}

std::vector<std::string> RegionTable::names() const {
    std::vector<std::string> out;
    out.reserve(regions_.size());
    for (const auto& r : regions_) out.push_back(r.first);
    return out;
}

std::string RegionTable::joined_names() const {
    std::string out;
    for (const auto& r : regions_) {
        if (!out.empty()) out += ", ";
        out += r.first;
    }
    return out;
}

} // namespace wxmcp::weather
