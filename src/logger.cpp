#include "wxmcp/logger.hpp"

#include <filesystem>
#include <memory>

#include <log4cplus/configurator.h>
#include <log4cplus/consoleappender.h>
#include <log4cplus/helpers/loglog.h>
#include <log4cplus/layout.h>

namespace wxmcp {

log4cplus::Logger& server_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("wxmcp"));
    return logger;
}

log4cplus::Logger& session_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("wxmcp.session"));
    return logger;
}

log4cplus::Logger& transport_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("wxmcp.transport"));
    return logger;
}

log4cplus::Logger& tools_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("wxmcp.tools"));
    return logger;
}

void init_logging(const std::string& config_path) {
    try {
        std::filesystem::path path(config_path);
        if (!config_path.empty() && std::filesystem::exists(path)) {
            log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(path.string()));
            return;
        }
    } catch (const std::exception& e) {
        log4cplus::helpers::LogLog::getLogLog()->error(
            LOG4CPLUS_TEXT("Failed to load logging config: ") + LOG4CPLUS_STRING_TO_TSTRING(std::string(e.what())));
    }

    // ConsoleAppender(logToStdErr, immediateFlush)
    log4cplus::SharedAppenderPtr appender(new log4cplus::ConsoleAppender(true, true));
    appender->setLayout(std::make_unique<log4cplus::PatternLayout>(
        LOG4CPLUS_TEXT("%D{%Y-%m-%dT%H:%M:%S.%q} %-5p [%c] %m%n")));

    log4cplus::Logger root = log4cplus::Logger::getRoot();
    root.removeAllAppenders();
    root.addAppender(appender);
    root.setLogLevel(log4cplus::INFO_LOG_LEVEL);
}

} // namespace wxmcp
