#pragma once

#include <string>
#include <log4cplus/logger.h>
#include <log4cplus/loggingmacros.h>

namespace wxmcp {

log4cplus::Logger& server_logger();
log4cplus::Logger& session_logger();
log4cplus::Logger& transport_logger();
log4cplus::Logger& tools_logger();

/// Configure from a log4cplus properties file, or fall back to INFO on stderr.
/// stdout is never used: it carries the stdio protocol stream.
void init_logging(const std::string& config_path);

} // namespace wxmcp
