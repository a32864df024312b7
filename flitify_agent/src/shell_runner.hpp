#pragma once

#include <chrono>
#include <string>

namespace flitify {

struct ShellResult {
    std::string stdout_output;
    std::string stderr_output;
    int exit_code = 0;       // negative signal number when killed by a signal
    bool timed_out = false;
};

/**
 * Run `command` through `shell -c` and collect its output.
 *
 * The child leads its own process group. When `timeout` elapses the whole
 * group is killed and reaped before returning; output read up to that
 * point is kept in the result.
 *
 * @throws std::system_error if the shell is not executable or the child
 *         cannot be set up.
 */
ShellResult run_shell_command(const std::string& command,
                              std::chrono::milliseconds timeout,
                              const std::string& shell = "/bin/sh");

} // namespace flitify
