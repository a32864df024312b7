#pragma once

#include "system_agent.hpp"

namespace flitify::osagent {

class LinuxAgent final : public SystemAgent {
public:
    StatusMap get_status() override;
    std::vector<DirEntry> list_directory(const std::string& path) override;
};

} // namespace flitify::osagent
