#include "system_agent.hpp"

#include "../errors.hpp"

#ifdef __linux__
#include "linux_agent.hpp"
#endif

namespace flitify::osagent {

std::unique_ptr<SystemAgent> make_system_agent() {
#ifdef __linux__
    return std::make_unique<LinuxAgent>();
#else
    throw UnsupportedPlatformError("no system agent for this platform");
#endif
}

} // namespace flitify::osagent
