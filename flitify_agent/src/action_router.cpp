#include "action_router.hpp"

#include "logger.hpp"
#include "protocol.hpp"

#include <log4cplus/loggingmacros.h>

#include <stdexcept>

namespace flitify {

ActionRouter::ActionRouter(transport::TransportPort& port, osagent::SystemAgent& agent, const AgentConfig& config)
    : ActionRouter(port, agent, config, actions::make_default_registry()) {}

ActionRouter::ActionRouter(transport::TransportPort& port, osagent::SystemAgent& agent, const AgentConfig& config,
                           actions::ActionRegistry registry)
    : port_(port), agent_(agent), config_(config), registry_(std::move(registry)) {
    if (!registry_.complete()) {
        throw std::logic_error("action registry is missing handlers");
    }
}

void ActionRouter::run() {
    while (true) {
        if (!port_.connected()) {
            LOG4CPLUS_ERROR(router_logger(), port_.peer_address() << ": connection closed during action loop");
            break;
        }

        auto action = port_.receive_action();
        if (!action) {
            continue;
        }

        LOG4CPLUS_DEBUG(router_logger(), port_.peer_address() << ": received command " << action->command);
        dispatch(*action);
    }
}

void ActionRouter::dispatch(const codec::Action& action) {
    auto command = actions::parse_command(action.command);
    if (!command) {
        LOG4CPLUS_WARN(router_logger(), port_.peer_address() << ": invalid action '" << action.command << "'");
        msgpack::sbuffer empty;
        msgpack::packer<msgpack::sbuffer> pk(&empty);
        pk.pack_map(0);
        port_.send_response(response::kInvalidAction, empty);
        return;
    }

    actions::ActionContext ctx{action, port_, agent_, config_};
    registry_.find(*command)->handle(ctx);
}

} // namespace flitify
