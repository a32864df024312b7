#pragma once

#include "action_base.hpp"

#include <array>
#include <memory>

namespace flitify::actions {

class ActionRegistry {
public:
    void add(std::unique_ptr<ActionHandler> handler);
    ActionHandler* find(Command command) const;

    /// True when every Command has a handler
    bool complete() const;

private:
    std::array<std::unique_ptr<ActionHandler>, kCommandCount> handlers_;
};

void register_session_actions(ActionRegistry& registry);
void register_system_actions(ActionRegistry& registry);
void register_shell_actions(ActionRegistry& registry);
void register_file_actions(ActionRegistry& registry);

/// Registry with a handler for every Command
ActionRegistry make_default_registry();

} // namespace flitify::actions
