#include "logger.hpp"

#include <filesystem>
#include <memory>

#include <log4cplus/configurator.h>
#include <log4cplus/consoleappender.h>
#include <log4cplus/layout.h>
#include <log4cplus/helpers/loglog.h>

log4cplus::Logger& core_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("flitify_agent"));
	return logger;
}

log4cplus::Logger& router_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("flitify_agent.router"));
	return logger;
}

log4cplus::Logger& transport_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("flitify_agent.transport"));
	return logger;
}

static std::filesystem::path resolve_config_path(const std::string& config_path) {
	std::filesystem::path path(config_path);
	if (path.is_absolute()) {
		return path;
	}
	return std::filesystem::current_path() / path;
}

static void configure_fallback() {
	log4cplus::Logger root = log4cplus::Logger::getRoot();
	if (root.getAppender(LOG4CPLUS_TEXT(FLITIFY_LOG_FALLBACK_APPENDER)).get() != nullptr) {
		return;
	}
	log4cplus::SharedAppenderPtr console(new log4cplus::ConsoleAppender(true));
	console->setName(LOG4CPLUS_TEXT(FLITIFY_LOG_FALLBACK_APPENDER));
	console->setLayout(std::make_unique<log4cplus::PatternLayout>(
		LOG4CPLUS_TEXT("%D{%Y-%m-%d %H:%M:%S.%q} [%-5p] flitify_agent[%i] %c - %m%n")));
	root.addAppender(console);
	root.setLogLevel(log4cplus::INFO_LOG_LEVEL);
}

bool init_logging(const std::string& config_path) {
	try {
		auto resolved = resolve_config_path(config_path);
		if (std::filesystem::exists(resolved)) {
			std::filesystem::create_directories("logs");
			log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
			return true;
		}
	} catch (const std::exception& exc) {
		log4cplus::helpers::LogLog::getLogLog()->error(
			LOG4CPLUS_TEXT("Failed to load logging config: ") + LOG4CPLUS_STRING_TO_TSTRING(std::string(exc.what())));
	}

	configure_fallback();
	return false;
}
