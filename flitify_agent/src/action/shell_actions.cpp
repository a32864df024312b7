#include "action_base.hpp"
#include "action_registry.hpp"

#include "../logger.hpp"
#include "../protocol.hpp"
#include "../shell_runner.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace flitify::actions {

namespace {

constexpr double kMaxTimeoutSeconds = 30.0 * 24 * 3600;

// Request timeout in seconds; anything unusable falls back to the configured default
std::chrono::milliseconds request_timeout(const ActionContext& ctx) {
    double seconds = ctx.config.shell_timeout_seconds;
    if (ctx.action.has_payload) {
        if (auto obj = codec::find_key(ctx.action.payload, "timeout")) {
            if (codec::is_number(*obj)) {
                double requested = codec::as_double(*obj);
                if (std::isfinite(requested) && requested > 0.0) {
                    seconds = requested;
                }
            }
        }
    }
    seconds = std::min(seconds, kMaxTimeoutSeconds);
    return std::chrono::milliseconds(static_cast<int64_t>(std::ceil(seconds * 1000.0)));
}

} // namespace

class ShellCommandAction final : public ActionHandler {
public:
    Command command() const override { return Command::ShellCommand; }

    void handle(ActionContext& ctx) override {
        const std::string cmd = require_string(ctx, "command", response::kShellFailure);
        const auto timeout = request_timeout(ctx);

        ShellResult result;
        try {
            result = run_shell_command(cmd, timeout, ctx.config.shell);
        } catch (const std::exception& exc) {
            respond_status(ctx, response::kShellResult, status::kFailed);
            LOG4CPLUS_WARN(router_logger(), ctx.port.peer_address() << ": shell_command failed: " << exc.what());
            return;
        }

        if (result.timed_out) {
            respond(ctx, response::kShellResult, [](PayloadPacker& pk) {
                pk.pack_map(3);
                pk.pack("status");
                pk.pack(status::kTimeout);
                pk.pack("stderr");
                pk.pack("Command timed out");
                pk.pack("exitcode");
                pk.pack(-1);
            });
            return;
        }

        respond(ctx, response::kShellResult, [&result](PayloadPacker& pk) {
            pk.pack_map(4);
            pk.pack("status");
            pk.pack(status::kOk);
            pk.pack("stdout");
            pk.pack(result.stdout_output);
            pk.pack("stderr");
            pk.pack(result.stderr_output);
            pk.pack("exitcode");
            pk.pack(result.exit_code);
        });
    }
};

void register_shell_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<ShellCommandAction>());
}

} // namespace flitify::actions
