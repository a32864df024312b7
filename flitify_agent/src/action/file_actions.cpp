#include "action_base.hpp"
#include "action_registry.hpp"

#include "../logger.hpp"
#include "../protocol.hpp"
#include "../utils/base64.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <log4cplus/loggingmacros.h>

namespace flitify::actions {

namespace {

void check_transfer_size(const AgentConfig& config, uintmax_t size, const std::string& path) {
    if (config.max_transfer_bytes != 0 && size > config.max_transfer_bytes) {
        throw std::length_error(path + ": " + std::to_string(size) + " bytes exceeds transfer limit of " +
                                std::to_string(config.max_transfer_bytes));
    }
}

// Room left in a frame for the response envelope around `filedata`
constexpr uint64_t kEnvelopeReserve = 256;

void check_frame_size(uintmax_t size, const std::string& path) {
    if (utils::base64_encoded_size(size) > kMaxFrameLength - kEnvelopeReserve) {
        throw std::length_error(path + ": " + std::to_string(size) + " bytes does not fit in a response frame");
    }
}

std::vector<unsigned char> read_file(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "open " + path);
    }

    std::vector<unsigned char> data;
    unsigned char chunk[65536];
    for (;;) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0) {
            int err = errno;
            ::close(fd);
            throw std::system_error(err, std::generic_category(), "read " + path);
        }
        if (n == 0) {
            break;
        }
        data.insert(data.end(), chunk, chunk + n);
    }
    ::close(fd);
    return data;
}

enum class WriteOutcome { Written, Exists };

// O_EXCL makes the existence check and the create a single step
WriteOutcome write_new_file(const std::string& path, const std::vector<unsigned char>& data) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            return WriteOutcome::Exists;
        }
        throw std::system_error(errno, std::generic_category(), "create " + path);
    }

    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::write(fd, data.data() + offset, data.size() - offset);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            int err = errno;
            ::close(fd);
            ::unlink(path.c_str());
            throw std::system_error(err, std::generic_category(), "write " + path);
        }
        offset += static_cast<size_t>(n);
    }

    if (::close(fd) != 0) {
        int err = errno;
        ::unlink(path.c_str());
        throw std::system_error(err, std::generic_category(), "close " + path);
    }
    return WriteOutcome::Written;
}

} // namespace

class GetFileAction final : public ActionHandler {
public:
    Command command() const override { return Command::GetFile; }

    void handle(ActionContext& ctx) override {
        // Present but empty or non-string paths are answered as not_found
        const std::string path = codec::as_string(require_field(ctx, "path", response::kFileSend), "");

        std::string encoded;
        try {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec)) {
                respond_status(ctx, response::kFileSend, status::kNotFound);
                return;
            }
            auto size = std::filesystem::file_size(path);
            check_transfer_size(ctx.config, size, path);
            check_frame_size(size, path);

            auto data = read_file(path);
            check_frame_size(data.size(), path);
            encoded = utils::base64_encode(data.data(), data.size());
        } catch (const std::exception& exc) {
            respond_status(ctx, response::kFileSend, status::kFailed);
            LOG4CPLUS_WARN(router_logger(), ctx.port.peer_address() << ": file_send failed: " << exc.what());
            return;
        }

        LOG4CPLUS_INFO(router_logger(), ctx.port.peer_address() << ": sending " << path);
        respond(ctx, response::kFileSend, [&encoded](PayloadPacker& pk) {
            pk.pack_map(2);
            pk.pack("status");
            pk.pack(status::kOk);
            pk.pack("filedata");
            pk.pack(encoded);
        });
    }
};

class UploadFileAction final : public ActionHandler {
public:
    Command command() const override { return Command::UploadFile; }

    void handle(ActionContext& ctx) override {
        const std::string path = require_string(ctx, "path", response::kFileUpload);
        const std::string filedata = require_string(ctx, "filedata", response::kFileUpload);

        try {
            auto bytes = utils::base64_decode(filedata);
            check_transfer_size(ctx.config, bytes.size(), path);

            if (write_new_file(path, bytes) == WriteOutcome::Exists) {
                respond_status(ctx, response::kFileUpload, status::kFileExists);
                return;
            }
            LOG4CPLUS_INFO(router_logger(), ctx.port.peer_address() << ": saved " << bytes.size() << " bytes to "
                                                                    << path);
        } catch (const std::exception& exc) {
            respond_status(ctx, response::kFileUpload, status::kFailed);
            LOG4CPLUS_WARN(router_logger(), ctx.port.peer_address() << ": file_upload failed: " << exc.what());
            return;
        }

        respond_status(ctx, response::kFileUpload, status::kOk);
    }
};

void register_file_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<GetFileAction>());
    registry.add(std::make_unique<UploadFileAction>());
}

} // namespace flitify::actions
