#include "agent_config.hpp"

#include <cstring>
#include <limits>
#include <stdexcept>

namespace flitify {

namespace {

uint64_t parse_unsigned(const std::string& option, const std::string& text, uint64_t max) {
    size_t consumed = 0;
    unsigned long long value = 0;
    try {
        if (text.empty() || text[0] == '-') {
            throw std::invalid_argument(text);
        }
        value = std::stoull(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + ": expected a non-negative integer, got '" + text + "'");
    }
    if (consumed != text.size() || value > max) {
        throw std::invalid_argument(option + ": invalid value '" + text + "'");
    }
    return value;
}

uint16_t parse_port(const std::string& option, const std::string& text) {
    uint64_t port = parse_unsigned(option, text, std::numeric_limits<uint16_t>::max());
    if (port == 0) {
        throw std::invalid_argument(option + ": port must be non-zero");
    }
    return static_cast<uint16_t>(port);
}

double parse_seconds(const std::string& option, const std::string& text) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + ": expected seconds, got '" + text + "'");
    }
    if (consumed != text.size() || !(value > 0.0)) {
        throw std::invalid_argument(option + ": invalid value '" + text + "'");
    }
    return value;
}

// Matches "--name value" or "--name=value"; advances i past a separate value
bool take_option(int argc, const char* const* argv, int& i, const char* name, std::string& value) {
    const size_t len = std::strlen(name);
    if (std::strcmp(argv[i], name) == 0) {
        if (i + 1 >= argc) {
            throw std::invalid_argument(std::string(name) + ": missing value");
        }
        value = argv[++i];
        return true;
    }
    if (std::strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        value = argv[i] + len + 1;
        return true;
    }
    return false;
}

void apply_endpoint(AgentConfig& config, const std::string& endpoint) {
    auto colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        throw std::invalid_argument("expected HOST:PORT, got '" + endpoint + "'");
    }
    std::string host = endpoint.substr(0, colon);
    // [::1]:5050
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    config.host = host;
    config.port = parse_port("HOST:PORT", endpoint.substr(colon + 1));
}

} // namespace

AgentConfig parse_agent_args(int argc, const char* const* argv) {
    AgentConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string value;

        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            config.show_version = true;
            continue;
        }
        if (take_option(argc, argv, i, "--host", value)) {
            if (value.empty()) {
                throw std::invalid_argument("--host: empty value");
            }
            config.host = value;
            continue;
        }
        if (take_option(argc, argv, i, "--port", value)) {
            config.port = parse_port("--port", value);
            continue;
        }
        if (take_option(argc, argv, i, "--config", value)) {
            config.log_config = value;
            continue;
        }
        if (take_option(argc, argv, i, "--shell", value)) {
            if (value.empty()) {
                throw std::invalid_argument("--shell: empty value");
            }
            config.shell = value;
            continue;
        }
        if (take_option(argc, argv, i, "--shell-timeout", value)) {
            config.shell_timeout_seconds = parse_seconds("--shell-timeout", value);
            continue;
        }
        if (take_option(argc, argv, i, "--max-transfer-bytes", value)) {
            config.max_transfer_bytes = static_cast<size_t>(
                parse_unsigned("--max-transfer-bytes", value, std::numeric_limits<size_t>::max()));
            continue;
        }
        if (take_option(argc, argv, i, "--max-frame-bytes", value)) {
            config.max_frame_bytes = static_cast<size_t>(
                parse_unsigned("--max-frame-bytes", value, std::numeric_limits<uint32_t>::max()));
            continue;
        }

        if (argv[i][0] != '-') {
            apply_endpoint(config, argv[i]);
            continue;
        }

        throw std::invalid_argument(std::string("unknown option '") + argv[i] + "'");
    }

    return config;
}

std::string agent_usage(const char* program) {
    return std::string("Usage: ") + program + " [options] [HOST:PORT]\n"
           "  --host HOST                controller host (default 127.0.0.1)\n"
           "  --port PORT                controller port (default 5050)\n"
           "  --config FILE              log4cplus configuration (default log4cplus.ini)\n"
           "  --shell PATH               shell used for shell_command (default /bin/sh)\n"
           "  --shell-timeout SECONDS    default shell_command timeout (default 5)\n"
           "  --max-transfer-bytes N     file transfer ceiling, 0 for none (default 0)\n"
           "  --max-frame-bytes N        largest accepted frame (default 268435456)\n"
           "  -v, --version              print version and exit\n";
}

} // namespace flitify
