#pragma once

#include "transport_port.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace flitify::transport {

/// Network order length prefix for a body of `size` bytes, or nullopt if
/// the prefix cannot describe it
std::optional<uint32_t> frame_prefix(uint64_t size);

/**
 * Client side TCP connection to the controller.
 * Frames are a 4 byte big-endian length followed by a msgpack map.
 */
class TcpTransport final : public TransportPort {
public:
    TcpTransport(std::string host, uint16_t port, size_t max_frame_bytes);
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    /// Resolve and connect; false on failure (logged)
    bool connect();

    void close();

    std::optional<codec::Action> receive_action() override;
    void send_response(const std::string& type, const msgpack::sbuffer& payload) override;
    bool connected() const override { return running_.load(); }
    std::string peer_address() const override { return peer_addr_; }

private:
    std::string host_;
    uint16_t port_;
    size_t max_frame_bytes_;
    int fd_ = -1;
    std::atomic<bool> running_{false};
    std::string peer_addr_;

    bool read_exact(char* data, size_t size);
    bool write_all(const char* data, size_t size);
    bool read_frame(std::string& frame);
};

} // namespace flitify::transport
