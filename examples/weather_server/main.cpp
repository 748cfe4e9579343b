/// Weather server: get_weather and get_location_weather over stdio and WebSocket.
/// Usage: PORT=3000 ./weather_server
/// Set WXMCP_ENV=production to serve WebSocket only.

#include <wxmcp/wxmcp.hpp>
#include <csignal>
#include <iostream>

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
    g_shutdown_requested = 1;
}

} // namespace

int main() {
    std::signal(SIGINT, handle_shutdown_signal);
    std::signal(SIGTERM, handle_shutdown_signal);
    // A client that exits turns stdout writes into EPIPE instead of a kill
    std::signal(SIGPIPE, SIG_IGN);

    wxmcp::ServerConfig config;
    try {
        config = wxmcp::load_config_from_env();
    } catch (const std::exception& ex) {
        std::cerr << "config error: " << ex.what() << '\n';
        return 1;
    }

    wxmcp::init_logging(config.log_config);

    auto registry = std::make_shared<wxmcp::ToolRegistry>();
    wxmcp::weather::OpenMeteoClient::Options forecast_opts;
    forecast_opts.base_url = config.forecast_base_url;
    wxmcp::weather::register_weather_tools(
        *registry, std::make_shared<wxmcp::weather::OpenMeteoClient>(forecast_opts));

    wxmcp::Server::Options opts;
    opts.config = config;

    try {
        wxmcp::Server server{registry, std::move(opts)};
        server.run(g_shutdown_requested);
    } catch (const std::exception& ex) {
        LOG4CPLUS_FATAL(wxmcp::server_logger(), "Server failed: " << ex.what());
        return 1;
    }

    LOG4CPLUS_INFO(wxmcp::server_logger(), "Shutdown signal handled; exiting cleanly");
    return 0;
}
