#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace flitify {

/// Scalar value carried in status mappings
using Value = std::variant<std::string, int64_t, double, bool>;

/// Status report returned by a system agent, keyed by field name
using StatusMap = std::map<std::string, Value>;

struct DirEntry {
    std::string name;
    std::string type;       // "file", "dir", "symlink" or "other"
    uint64_t size = 0;      // bytes, 0 for anything but regular files
    int64_t modified = 0;   // seconds since epoch
};

/// Largest frame body the 4-byte length prefix can describe
constexpr uint64_t kMaxFrameLength = std::numeric_limits<uint32_t>::max();

namespace response {
constexpr const char* kPong = "pong";
constexpr const char* kStatus = "status";
constexpr const char* kListDir = "list_dir";
constexpr const char* kShellResult = "shell_result";
constexpr const char* kShellFailure = "shell_response";
constexpr const char* kFileSend = "file_send";
constexpr const char* kFileUpload = "file_upload";
constexpr const char* kInvalidAction = "invalid_action";
} // namespace response

namespace status {
constexpr const char* kOk = "ok";
constexpr const char* kFailed = "failed";
constexpr const char* kNotFound = "not_found";
constexpr const char* kTimeout = "timeout";
constexpr const char* kFileExists = "file_exists";
} // namespace status

} // namespace flitify
