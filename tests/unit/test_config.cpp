#include <gtest/gtest.h>
#include "wxmcp/config.hpp"
#include <cstdlib>

using namespace wxmcp;

TEST(Config, Defaults) {
    auto config = load_config({});
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 3000);
    EXPECT_FALSE(config.production);
    EXPECT_EQ(config.forecast_base_url, "https://api.open-meteo.com");
    EXPECT_EQ(config.log_config, "log4cplus.properties");
    EXPECT_EQ(config.shutdown_timeout, std::chrono::milliseconds(5000));
}

TEST(Config, AllKeys) {
    auto config = load_config({
        {"PORT", "8080"},
        {"HOST", "127.0.0.1"},
        {"WXMCP_ENV", "Production"},
        {"WXMCP_FORECAST_URL", "http://localhost:9000//"},
        {"WXMCP_LOG_CONFIG", "/etc/wxmcp/log.properties"},
        {"WXMCP_SHUTDOWN_TIMEOUT_MS", " 250 "},
    });
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_TRUE(config.production);
    EXPECT_EQ(config.forecast_base_url, "http://localhost:9000");
    EXPECT_EQ(config.log_config, "/etc/wxmcp/log.properties");
    EXPECT_EQ(config.shutdown_timeout, std::chrono::milliseconds(250));
}

TEST(Config, BlankValuesKeepDefaults) {
    auto config = load_config({{"PORT", "   "}, {"HOST", ""}});
    EXPECT_EQ(config.port, 3000);
    EXPECT_EQ(config.host, "0.0.0.0");
}

TEST(Config, OtherEnvironmentIsDevelopment) {
    EXPECT_FALSE(load_config({{"WXMCP_ENV", "staging"}}).production);
}

TEST(Config, InvalidPort) {
    EXPECT_THROW(load_config({{"PORT", "abc"}}), std::invalid_argument);
    EXPECT_THROW(load_config({{"PORT", "80x"}}), std::invalid_argument);
    EXPECT_THROW(load_config({{"PORT", "0"}}), std::invalid_argument);
    EXPECT_THROW(load_config({{"PORT", "70000"}}), std::invalid_argument);
}

TEST(Config, ErrorNamesVariable) {
    try {
        load_config({{"WXMCP_SHUTDOWN_TIMEOUT_MS", "-1"}});
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("WXMCP_SHUTDOWN_TIMEOUT_MS"), std::string::npos);
    }
}

TEST(Config, ForecastUrlNeedsScheme) {
    EXPECT_THROW(load_config({{"WXMCP_FORECAST_URL", "api.open-meteo.com"}}), std::invalid_argument);
}

TEST(Config, FromProcessEnvironment) {
    ::setenv("PORT", "4321", 1);
    ::setenv("WXMCP_ENV", "production", 1);
    auto config = load_config_from_env();
    ::unsetenv("PORT");
    ::unsetenv("WXMCP_ENV");
    EXPECT_EQ(config.port, 4321);
    EXPECT_TRUE(config.production);
}

TEST(Config, Describe) {
    auto text = describe(load_config({{"PORT", "9000"}, {"WXMCP_ENV", "production"}}));
    EXPECT_NE(text.find("port=9000"), std::string::npos);
    EXPECT_NE(text.find("stdio=off"), std::string::npos);
}
