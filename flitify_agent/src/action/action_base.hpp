#pragma once

#include "command.hpp"
#include "../agent_config.hpp"
#include "../msgpack_codec.hpp"
#include "../osagent/system_agent.hpp"
#include "../transport/transport_port.hpp"

#include <msgpack.hpp>

#include <functional>
#include <string>

namespace flitify::actions {

using PayloadPacker = msgpack::packer<msgpack::sbuffer>;

struct ActionContext {
	const codec::Action& action;
	transport::TransportPort& port;
	osagent::SystemAgent& agent;
	const AgentConfig& config;
};

class ActionHandler {
public:
	virtual ~ActionHandler() = default;
	virtual Command command() const = 0;
	const char* name() const { return command_name(command()); }

	/// Sends its own response; failures it does not contain propagate
	virtual void handle(ActionContext& ctx) = 0;

protected:
	void respond(ActionContext& ctx, const char* type, const std::function<void(PayloadPacker&)>& pack_payload);
	void respond_status(ActionContext& ctx, const char* type, const char* status);

	/**
	 * Non-empty string field `key` of the payload.
	 * When absent, sends `failure_type` with {status: failed} (unless null)
	 * and throws MalformedActionError.
	 */
	std::string require_string(ActionContext& ctx, const std::string& key, const char* failure_type);

	/// Field `key` of any type and value; only an absent key is malformed
	const msgpack::object& require_field(ActionContext& ctx, const std::string& key, const char* failure_type);

	std::string optional_string(const ActionContext& ctx, const std::string& key, const std::string& fallback);

private:
	[[noreturn]] void reject_missing(ActionContext& ctx, const std::string& key, const char* failure_type);
};

} // namespace flitify::actions
