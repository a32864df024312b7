#include "tcp_transport.hpp"

#include "../logger.hpp"
#include "../protocol.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <vector>

#include <log4cplus/loggingmacros.h>

namespace flitify::transport {

TcpTransport::TcpTransport(std::string host, uint16_t port, size_t max_frame_bytes)
    : host_(std::move(host)),
      port_(port),
      max_frame_bytes_(max_frame_bytes),
      peer_addr_(host_ + ":" + std::to_string(port)) {}

TcpTransport::~TcpTransport() {
    close();
}

bool TcpTransport::connect() {
    if (running_) {
        return true;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    std::string service = std::to_string(port_);
    int rc = ::getaddrinfo(host_.c_str(), service.c_str(), &hints, &result);
    if (rc != 0) {
        LOG4CPLUS_ERROR(transport_logger(), peer_addr_ << ": resolve failed: " << ::gai_strerror(rc));
        return false;
    }

    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            fd_ = fd;
            break;
        }
        LOG4CPLUS_DEBUG(transport_logger(), peer_addr_ << ": connect attempt failed: " << std::strerror(errno));
        ::close(fd);
    }
    ::freeaddrinfo(result);

    if (fd_ < 0) {
        LOG4CPLUS_ERROR(transport_logger(), peer_addr_ << ": unable to connect");
        return false;
    }

    int one = 1;
    ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    running_ = true;
    LOG4CPLUS_INFO(transport_logger(), peer_addr_ << ": connected");
    return true;
}

void TcpTransport::close() {
    running_ = false;
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
        LOG4CPLUS_INFO(transport_logger(), peer_addr_ << ": connection closed");
    }
}

bool TcpTransport::read_exact(char* data, size_t size) {
    size_t offset = 0;
    while (offset < size) {
        ssize_t chunk = ::recv(fd_, data + offset, size - offset, 0);
        if (chunk < 0 && errno == EINTR) {
            continue;
        }
        if (chunk <= 0) {
            return false;
        }
        offset += static_cast<size_t>(chunk);
    }
    return true;
}

bool TcpTransport::write_all(const char* data, size_t size) {
    size_t offset = 0;
    while (offset < size) {
        ssize_t chunk = ::send(fd_, data + offset, size - offset, MSG_NOSIGNAL);
        if (chunk < 0 && errno == EINTR) {
            continue;
        }
        if (chunk <= 0) {
            return false;
        }
        offset += static_cast<size_t>(chunk);
    }
    return true;
}

std::optional<uint32_t> frame_prefix(uint64_t size) {
    if (size > kMaxFrameLength) {
        return std::nullopt;
    }
    return htonl(static_cast<uint32_t>(size));
}

bool TcpTransport::read_frame(std::string& frame) {
    uint32_t length_be = 0;
    if (!read_exact(reinterpret_cast<char*>(&length_be), sizeof(length_be))) {
        return false;
    }

    uint32_t length = ntohl(length_be);
    if (length > max_frame_bytes_) {
        LOG4CPLUS_ERROR(transport_logger(), peer_addr_ << ": frame of " << length << " bytes exceeds limit of "
                                                       << max_frame_bytes_);
        return false;
    }

    std::vector<char> buffer(length);
    if (length > 0 && !read_exact(buffer.data(), length)) {
        return false;
    }
    frame.assign(buffer.data(), buffer.size());
    return true;
}

std::optional<codec::Action> TcpTransport::receive_action() {
    if (!running_) {
        return std::nullopt;
    }

    std::string frame;
    if (!read_frame(frame)) {
        running_ = false;
        return std::nullopt;
    }

    try {
        return codec::decode_action(frame);
    } catch (const std::exception& exc) {
        // Answered as an unknown action by the router
        LOG4CPLUS_ERROR(transport_logger(), peer_addr_ << ": decode error: " << exc.what());
        return codec::Action{};
    }
}

void TcpTransport::send_response(const std::string& type, const msgpack::sbuffer& payload) {
    if (!running_) {
        LOG4CPLUS_WARN(transport_logger(), peer_addr_ << ": dropping " << type << " response, not connected");
        return;
    }

    std::string body = codec::encode_response(type, payload);
    auto prefix = frame_prefix(body.size());
    if (!prefix) {
        LOG4CPLUS_ERROR(transport_logger(), peer_addr_ << ": dropping " << type << " response, " << body.size()
                                                       << " bytes exceeds frame limit");
        return;
    }
    uint32_t length_be = *prefix;

    if (!write_all(reinterpret_cast<const char*>(&length_be), sizeof(length_be)) ||
        !write_all(body.data(), body.size())) {
        LOG4CPLUS_ERROR(transport_logger(), peer_addr_ << ": send failed: " << std::strerror(errno));
        running_ = false;
    }
}

} // namespace flitify::transport
