#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace flitify {

struct AgentConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 5050;
    std::string log_config = "log4cplus.ini";

    std::string shell = "/bin/sh";
    double shell_timeout_seconds = 5.0;   // used when a request carries none

    size_t max_transfer_bytes = 0;        // 0 = unlimited
    size_t max_frame_bytes = 256u * 1024u * 1024u;

    bool show_version = false;
};

/**
 * Parse the agent command line.
 * Accepts "--opt value" and "--opt=value" forms, plus a positional HOST:PORT.
 * @throws std::invalid_argument on unknown options or bad values
 */
AgentConfig parse_agent_args(int argc, const char* const* argv);

std::string agent_usage(const char* program);

} // namespace flitify
