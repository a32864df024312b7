#pragma once

#include "action/action_registry.hpp"
#include "agent_config.hpp"
#include "msgpack_codec.hpp"
#include "osagent/system_agent.hpp"
#include "transport/transport_port.hpp"

namespace flitify {

/**
 * Pulls actions from the transport one at a time and hands each to the
 * handler registered for its command.
 *
 * run() returns when the transport reports the connection gone. It exits
 * by exception on a kick (SessionKicked) or a malformed request
 * (MalformedActionError); closing the connection is left to the caller.
 */
class ActionRouter {
public:
    ActionRouter(transport::TransportPort& port, osagent::SystemAgent& agent, const AgentConfig& config);
    ActionRouter(transport::TransportPort& port, osagent::SystemAgent& agent, const AgentConfig& config,
                 actions::ActionRegistry registry);

    void run();

    /// Handle one action as if it had just been received
    void dispatch(const codec::Action& action);

private:
    transport::TransportPort& port_;
    osagent::SystemAgent& agent_;
    const AgentConfig& config_;
    actions::ActionRegistry registry_;
};

} // namespace flitify
