#include "action_registry.hpp"

namespace flitify::actions {

void ActionRegistry::add(std::unique_ptr<ActionHandler> handler) {
    if (!handler) {
        return;
    }
    handlers_[command_index(handler->command())] = std::move(handler);
}

ActionHandler* ActionRegistry::find(Command command) const {
    return handlers_[command_index(command)].get();
}

bool ActionRegistry::complete() const {
    for (const auto& handler : handlers_) {
        if (!handler) {
            return false;
        }
    }
    return true;
}

ActionRegistry make_default_registry() {
    ActionRegistry registry;
    register_session_actions(registry);
    register_system_actions(registry);
    register_shell_actions(registry);
    register_file_actions(registry);
    return registry;
}

} // namespace flitify::actions
