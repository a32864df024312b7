#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace flitify::actions {

/// Closed set of commands a controller may send
enum class Command {
    Ping,
    GetStatus,
    ListDir,
    ShellCommand,
    GetFile,
    UploadFile,
    Kick,
};

constexpr size_t kCommandCount = 7;

constexpr size_t command_index(Command command) {
    return static_cast<size_t>(command);
}

const char* command_name(Command command);

/// std::nullopt for anything outside the vocabulary
std::optional<Command> parse_command(const std::string& name);

} // namespace flitify::actions
