#include "action_base.hpp"
#include "action_registry.hpp"

#include "../errors.hpp"
#include "../logger.hpp"
#include "../protocol.hpp"

#include <log4cplus/loggingmacros.h>

namespace flitify::actions {

class GetStatusAction final : public ActionHandler {
public:
    Command command() const override { return Command::GetStatus; }

    void handle(ActionContext& ctx) override {
        StatusMap report;
        try {
            report = ctx.agent.get_status();
        } catch (const std::exception& exc) {
            LOG4CPLUS_WARN(router_logger(), ctx.port.peer_address() << ": get_status failed: " << exc.what());
            respond_status(ctx, response::kStatus, status::kFailed);
            return;
        }
        respond(ctx, response::kStatus, [&report](PayloadPacker& pk) { codec::pack_status_map(pk, report); });
    }
};

class ListDirAction final : public ActionHandler {
public:
    Command command() const override { return Command::ListDir; }

    void handle(ActionContext& ctx) override {
        const std::string path = optional_string(ctx, "path", "/");

        std::vector<DirEntry> entries;
        try {
            entries = ctx.agent.list_directory(path);
        } catch (const NotFoundError&) {
            respond_status(ctx, response::kListDir, status::kNotFound);
            return;
        } catch (const std::exception& exc) {
            respond_status(ctx, response::kListDir, status::kFailed);
            LOG4CPLUS_WARN(router_logger(), ctx.port.peer_address() << ": list_dir failed: " << exc.what());
            return;
        }

        respond(ctx, response::kListDir, [&entries](PayloadPacker& pk) {
            pk.pack_map(2);
            pk.pack("status");
            pk.pack(status::kOk);
            pk.pack("entries");
            codec::pack_entries(pk, entries);
        });
    }
};

void register_system_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<GetStatusAction>());
    registry.add(std::make_unique<ListDirAction>());
}

} // namespace flitify::actions
