#pragma once

#include <string>
#include <log4cplus/logger.h>

#define FLITIFY_LOG_FALLBACK_APPENDER "flitify_fallback"

log4cplus::Logger& core_logger();
log4cplus::Logger& router_logger();
log4cplus::Logger& transport_logger();

/// Loads `config_path` as a log4cplus property file. When it cannot be
/// loaded, logs INFO and above to stderr and returns false.
bool init_logging(const std::string& config_path);
