#include "action_base.hpp"
#include "action_registry.hpp"

#include "../errors.hpp"
#include "../logger.hpp"
#include "../protocol.hpp"

#include <log4cplus/loggingmacros.h>

namespace flitify::actions {

class PingAction final : public ActionHandler {
public:
    Command command() const override { return Command::Ping; }

    void handle(ActionContext& ctx) override {
        respond(ctx, response::kPong, [](PayloadPacker& pk) { pk.pack_map(0); });
    }
};

class KickAction final : public ActionHandler {
public:
    Command command() const override { return Command::Kick; }

    void handle(ActionContext& ctx) override {
        const msgpack::object* reason_obj =
            ctx.action.has_payload ? codec::find_key(ctx.action.payload, "reason") : nullptr;
        if (!reason_obj) {
            LOG4CPLUS_ERROR(router_logger(), ctx.port.peer_address() << ": kicked without reason");
            throw MalformedActionError("kick: 'reason' missing from request");
        }

        throw SessionKicked(codec::as_text(*reason_obj));
    }
};

void register_session_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<PingAction>());
    registry.add(std::make_unique<KickAction>());
}

} // namespace flitify::actions
