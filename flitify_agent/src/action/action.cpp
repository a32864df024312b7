#include "action_base.hpp"

#include "../errors.hpp"
#include "../logger.hpp"
#include "../protocol.hpp"

#include <log4cplus/loggingmacros.h>

namespace flitify::actions {

void ActionHandler::respond(ActionContext& ctx, const char* type,
                            const std::function<void(PayloadPacker&)>& pack_payload) {
	msgpack::sbuffer buffer;
	PayloadPacker pk(&buffer);
	pack_payload(pk);
	ctx.port.send_response(type, buffer);
}

void ActionHandler::respond_status(ActionContext& ctx, const char* type, const char* status) {
	respond(ctx, type, [status](PayloadPacker& pk) {
		pk.pack_map(1);
		pk.pack("status");
		pk.pack(status);
	});
}

std::string ActionHandler::require_string(ActionContext& ctx, const std::string& key, const char* failure_type) {
	std::string value;
	if (ctx.action.has_payload) {
		if (auto obj = codec::find_key(ctx.action.payload, key)) {
			value = codec::as_string(*obj, "");
		}
	}
	if (value.empty()) {
		reject_missing(ctx, key, failure_type);
	}
	return value;
}

const msgpack::object& ActionHandler::require_field(ActionContext& ctx, const std::string& key,
                                                    const char* failure_type) {
	const msgpack::object* obj = ctx.action.has_payload ? codec::find_key(ctx.action.payload, key) : nullptr;
	if (!obj) {
		reject_missing(ctx, key, failure_type);
	}
	return *obj;
}

void ActionHandler::reject_missing(ActionContext& ctx, const std::string& key, const char* failure_type) {
	LOG4CPLUS_ERROR(router_logger(), ctx.port.peer_address() << ": " << name() << ": '" << key
	                                 << "' missing from request");
	if (failure_type) {
		respond_status(ctx, failure_type, status::kFailed);
	}
	throw MalformedActionError(std::string(name()) + ": '" + key + "' missing from request");
}

std::string ActionHandler::optional_string(const ActionContext& ctx, const std::string& key,
                                           const std::string& fallback) {
	if (!ctx.action.has_payload) {
		return fallback;
	}
	if (auto obj = codec::find_key(ctx.action.payload, key)) {
		return codec::as_string(*obj, fallback);
	}
	return fallback;
}

} // namespace flitify::actions
