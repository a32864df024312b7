#pragma once

#include "../protocol.hpp"

#include <memory>
#include <string>
#include <vector>

namespace flitify::osagent {

/**
 * Platform specific system introspection.
 * Implementations are stateless from the router's point of view.
 */
class SystemAgent {
public:
    virtual ~SystemAgent() = default;

    virtual StatusMap get_status() = 0;

    /// @throws flitify::NotFoundError when `path` does not exist
    virtual std::vector<DirEntry> list_directory(const std::string& path) = 0;
};

/// Agent for the platform this binary was built for.
/// @throws flitify::UnsupportedPlatformError when there is none
std::unique_ptr<SystemAgent> make_system_agent();

} // namespace flitify::osagent
