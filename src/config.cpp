#include "wxmcp/config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace wxmcp {

namespace {

constexpr std::array<const char*, 6> CONFIG_KEYS = {
    "PORT", "HOST", "WXMCP_ENV", "WXMCP_FORECAST_URL",
    "WXMCP_LOG_CONFIG", "WXMCP_SHUTDOWN_TIMEOUT_MS"
};

std::string trim(const std::string& value) {
    const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

long long parse_integer(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(key + " must be an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(key + " must be an integer, got '" + value + "'");
    }
    return parsed;
}

void apply_key_value(ServerConfig& config, const std::string& key, const std::string& raw) {
    const std::string value = trim(raw);
    if (value.empty()) {
        return;
    }

    if (key == "PORT") {
        const auto port = parse_integer(key, value);
        if (port <= 0 || port > 65535) {
            throw std::invalid_argument("PORT must be in range 1..65535");
        }
        config.port = static_cast<uint16_t>(port);
        return;
    }

    if (key == "HOST") {
        config.host = value;
        return;
    }

    if (key == "WXMCP_ENV") {
        config.production = to_lower(value) == "production";
        return;
    }

    if (key == "WXMCP_FORECAST_URL") {
        if (value.rfind("http://", 0) != 0 && value.rfind("https://", 0) != 0) {
            throw std::invalid_argument("WXMCP_FORECAST_URL must start with http:// or https://");
        }
        std::string url = value;
        while (!url.empty() && url.back() == '/') url.pop_back();
        config.forecast_base_url = url;
        return;
    }

    if (key == "WXMCP_LOG_CONFIG") {
        config.log_config = value;
        return;
    }

    if (key == "WXMCP_SHUTDOWN_TIMEOUT_MS") {
        const auto ms = parse_integer(key, value);
        if (ms < 0) {
            throw std::invalid_argument("WXMCP_SHUTDOWN_TIMEOUT_MS must not be negative");
        }
        config.shutdown_timeout = std::chrono::milliseconds(ms);
        return;
    }
}

} // anonymous namespace

ServerConfig load_config(const EnvironmentMap& env) {
    ServerConfig config;
    for (const auto& [key, value] : env) {
        apply_key_value(config, key, value);
    }
    return config;
}

ServerConfig load_config_from_env() {
    EnvironmentMap env;
    for (const char* key : CONFIG_KEYS) {
        if (const char* value = std::getenv(key)) {
            env[key] = value;
        }
    }
    return load_config(env);
}

std::string describe(const ServerConfig& config) {
    std::ostringstream output;
    output << "host=" << config.host
           << " port=" << config.port
           << " mode=" << (config.production ? "production" : "development")
           << " stdio=" << (config.production ? "off" : "on")
           << " forecast_url=" << config.forecast_base_url
           << " shutdown_timeout_ms=" << config.shutdown_timeout.count();
    return output.str();
}

} // namespace wxmcp
