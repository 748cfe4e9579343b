#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace wxmcp {

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 3000;
    bool production = false;
    std::string forecast_base_url = "https://api.open-meteo.com";
    std::string log_config = "log4cplus.properties";
    std::chrono::milliseconds shutdown_timeout{5000};
};

using EnvironmentMap = std::map<std::string, std::string>;

/// Build a config from explicit key/value pairs (environment variable names).
/// Unset keys keep their defaults; invalid values throw std::invalid_argument.
ServerConfig load_config(const EnvironmentMap& env);

/// Same as load_config(), reading PORT, HOST, WXMCP_ENV, WXMCP_FORECAST_URL,
/// WXMCP_LOG_CONFIG and WXMCP_SHUTDOWN_TIMEOUT_MS from the process environment.
ServerConfig load_config_from_env();

/// One-line summary for the startup log.
std::string describe(const ServerConfig& config);

} // namespace wxmcp
