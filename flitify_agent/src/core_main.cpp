#include "action_router.hpp"
#include "agent_config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "osagent/system_agent.hpp"
#include "transport/tcp_transport.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    flitify::AgentConfig config;
    try {
        config = flitify::parse_agent_args(argc, argv);
    } catch (const std::invalid_argument& exc) {
        std::cerr << exc.what() << "\n" << flitify::agent_usage(argv[0]);
        return 2;
    }

    if (config.show_version) {
        std::cout << "Version: " << VERSION_STRING << std::endl;
        std::cout << "Commit: " << GIT_VERSION_STRING << std::endl;
        std::cout << "Build Time: " << BUILD_TIMESTAMP << std::endl;
        return 0;
    }

    bool configured = init_logging(config.log_config);

    LOG4CPLUS_INFO(core_logger(), "flitify_agent starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << VERSION_STRING << ", Commit: " << GIT_VERSION_STRING);
    if (!configured) {
        LOG4CPLUS_WARN(core_logger(), "Logging config " << config.log_config << " not loaded, logging to stderr");
    }
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Controller: " << config.host << ":" << config.port);

    std::unique_ptr<flitify::osagent::SystemAgent> agent;
    try {
        agent = flitify::osagent::make_system_agent();
    } catch (const flitify::UnsupportedPlatformError& exc) {
        LOG4CPLUS_ERROR(core_logger(), exc.what());
        return 1;
    }

    flitify::transport::TcpTransport transport(config.host, config.port, config.max_frame_bytes);
    if (!transport.connect()) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to connect to controller");
        return 1;
    }

    int exit_code = 0;
    try {
        flitify::ActionRouter router(transport, *agent, config);
        router.run();
    } catch (const flitify::SessionKicked& kicked) {
        LOG4CPLUS_ERROR(core_logger(), transport.peer_address() << ": " << kicked.what());
    } catch (const flitify::MalformedActionError& exc) {
        LOG4CPLUS_ERROR(core_logger(), transport.peer_address() << ": malformed request: " << exc.what());
        exit_code = 1;
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(core_logger(), transport.peer_address() << ": session failed: " << exc.what());
        exit_code = 1;
    }

    transport.close();
    LOG4CPLUS_INFO(core_logger(), "flitify_agent exiting with " << exit_code);
    return exit_code;
}
