#include "command.hpp"

#include <array>

namespace flitify::actions {

const char* command_name(Command command) {
    switch (command) {
        case Command::Ping: return "ping";
        case Command::GetStatus: return "get_status";
        case Command::ListDir: return "list_dir";
        case Command::ShellCommand: return "shell_command";
        case Command::GetFile: return "get_file";
        case Command::UploadFile: return "upload_file";
        case Command::Kick: return "kick";
    }
    return "unknown";
}

std::optional<Command> parse_command(const std::string& name) {
    static const std::array<Command, kCommandCount> all = {
        Command::Ping,
        Command::GetStatus,
        Command::ListDir,
        Command::ShellCommand,
        Command::GetFile,
        Command::UploadFile,
        Command::Kick,
    };
    for (Command command : all) {
        if (name == command_name(command)) {
            return command;
        }
    }
    return std::nullopt;
}

} // namespace flitify::actions
