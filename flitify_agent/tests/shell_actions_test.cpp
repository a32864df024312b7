#include <gtest/gtest.h>

#include "action_router.hpp"
#include "errors.hpp"
#include "shell_runner.hpp"
#include "test_helpers.hpp"

#include <signal.h>

#include <chrono>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override { init_test_logging(); }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

PackFn shell_request(const std::string& command, double timeout) {
    return [command, timeout](msgpack::packer<msgpack::sbuffer>& pk) {
        pk.pack_map(2);
        pk.pack("command");
        pk.pack(command);
        pk.pack("timeout");
        pk.pack(timeout);
    };
}

// Zombies count as gone: whether they get reaped depends on the container's init
bool process_alive(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat) {
        return false;
    }
    std::string line;
    std::getline(stat, line);
    auto close_paren = line.rfind(')');
    if (close_paren == std::string::npos || close_paren + 2 >= line.size()) {
        return false;
    }
    char state = line[close_paren + 2];
    return state != 'Z' && state != 'X';
}

} // namespace

TEST(ShellRunner, CapturesStdoutStderrAndExitCode) {
    auto result = flitify::run_shell_command("echo out; echo err >&2; exit 3", std::chrono::seconds(5));

    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
    EXPECT_EQ(result.exit_code, 3);
}

TEST(ShellRunner, SignalledChildReportsNegativeSignal) {
    auto result = flitify::run_shell_command("kill -TERM $$", std::chrono::seconds(5));

    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, -SIGTERM);
}

TEST(ShellRunner, LargeOutputIsNotTruncated) {
    auto result = flitify::run_shell_command("head -c 200000 /dev/zero | tr '\\0' x", std::chrono::seconds(10));

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output.size(), 200000u);
}

TEST(ShellRunner, TimeoutKillsChildWithinBound) {
    const auto start = std::chrono::steady_clock::now();
    auto result = flitify::run_shell_command("echo $$; exec sleep 30", std::chrono::milliseconds(300));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_LT(elapsed, std::chrono::seconds(3));

    ASSERT_FALSE(result.stdout_output.empty());
    pid_t pid = static_cast<pid_t>(std::stol(result.stdout_output));
    EXPECT_FALSE(process_alive(pid));
}

TEST(ShellRunner, TimeoutAlsoKillsBackgroundedGrandchildren) {
    auto result = flitify::run_shell_command("sleep 30 & echo $!; wait", std::chrono::milliseconds(300));

    EXPECT_TRUE(result.timed_out);
    ASSERT_FALSE(result.stdout_output.empty());
    pid_t grandchild = static_cast<pid_t>(std::stol(result.stdout_output));

    // SIGKILL delivery to the reparented grandchild is asynchronous
    for (int i = 0; i < 50 && process_alive(grandchild); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_FALSE(process_alive(grandchild));
}

TEST(ShellRunner, MissingShellThrows) {
    EXPECT_THROW(flitify::run_shell_command("true", std::chrono::seconds(1), "/nonexistent/sh"), std::system_error);
}

TEST(ShellCommandAction, ReturnsOutputAndExitCode) {
    FakeTransport transport;
    FakeSystemAgent agent;
    flitify::AgentConfig config;
    transport.push("shell_command", string_fields({{"command", "printf hello; printf oops >&2; exit 7"}}));

    flitify::ActionRouter(transport, agent, config).run();

    ASSERT_EQ(transport.responses.size(), 1u);
    const auto& resp = transport.responses[0];
    EXPECT_EQ(resp.type, "shell_result");
    EXPECT_EQ(resp.string_field("status"), "ok");
    EXPECT_EQ(resp.string_field("stdout"), "hello");
    EXPECT_EQ(resp.string_field("stderr"), "oops");
    EXPECT_EQ(resp.int_field("exitcode"), 7);
}

TEST(ShellCommandAction, TimeoutRespondsTimeoutAndSessionContinues) {
    FakeTransport transport;
    FakeSystemAgent agent;
    flitify::AgentConfig config;
    transport.push("shell_command", shell_request("sleep 30", 0.5));
    transport.push("ping");

    const auto start = std::chrono::steady_clock::now();
    flitify::ActionRouter(transport, agent, config).run();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_EQ(transport.responses.size(), 2u);
    const auto& resp = transport.responses[0];
    EXPECT_EQ(resp.type, "shell_result");
    EXPECT_EQ(resp.string_field("status"), "timeout");
    EXPECT_EQ(resp.string_field("stderr"), "Command timed out");
    EXPECT_EQ(resp.int_field("exitcode", 0), -1);
    EXPECT_FALSE(resp.has_field("stdout"));
    EXPECT_LT(elapsed, std::chrono::seconds(3));
    EXPECT_EQ(transport.responses[1].type, "pong");
}

TEST(ShellCommandAction, IntegerTimeoutIsAccepted) {
    FakeTransport transport;
    FakeSystemAgent agent;
    flitify::AgentConfig config;
    transport.push("shell_command", [](msgpack::packer<msgpack::sbuffer>& pk) {
        pk.pack_map(2);
        pk.pack("command");
        pk.pack("echo done");
        pk.pack("timeout");
        pk.pack(2);
    });

    flitify::ActionRouter(transport, agent, config).run();

    ASSERT_EQ(transport.responses.size(), 1u);
    EXPECT_EQ(transport.responses[0].string_field("status"), "ok");
    EXPECT_EQ(transport.responses[0].string_field("stdout"), "done\n");
}

TEST(ShellCommandAction, ConfiguredDefaultTimeoutApplies) {
    FakeTransport transport;
    FakeSystemAgent agent;
    flitify::AgentConfig config;
    config.shell_timeout_seconds = 0.3;
    transport.push("shell_command", string_fields({{"command", "sleep 30"}, {"timeout", "not-a-number"}}));

    flitify::ActionRouter(transport, agent, config).run();

    ASSERT_EQ(transport.responses.size(), 1u);
    EXPECT_EQ(transport.responses[0].string_field("status"), "timeout");
}

TEST(ShellCommandAction, ExecutionFailureIsContained) {
    FakeTransport transport;
    FakeSystemAgent agent;
    flitify::AgentConfig config;
    config.shell = "/nonexistent/sh";
    transport.push("shell_command", string_fields({{"command", "true"}}));
    transport.push("ping");

    flitify::ActionRouter(transport, agent, config).run();

    ASSERT_EQ(transport.responses.size(), 2u);
    EXPECT_EQ(transport.responses[0].type, "shell_result");
    EXPECT_EQ(transport.responses[0].string_field("status"), "failed");
    EXPECT_EQ(transport.responses[0].field_count(), 1u);
    EXPECT_EQ(transport.responses[1].type, "pong");
}

TEST(ShellCommandAction, EmptyCommandIsMalformed) {
    FakeTransport transport;
    FakeSystemAgent agent;
    flitify::AgentConfig config;
    transport.push("shell_command", string_fields({{"command", ""}}));

    EXPECT_THROW(flitify::ActionRouter(transport, agent, config).run(), flitify::MalformedActionError);
    ASSERT_EQ(transport.responses.size(), 1u);
    EXPECT_EQ(transport.responses[0].string_field("status"), "failed");
}
