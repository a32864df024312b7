#pragma once

#include "../msgpack_codec.hpp"

#include <msgpack.hpp>

#include <optional>
#include <string>

namespace flitify::transport {

/**
 * Connection to the controller, as seen by the action router.
 */
class TransportPort {
public:
    virtual ~TransportPort() = default;

    /**
     * Block until the next action arrives.
     * Returns std::nullopt when the connection went away while waiting;
     * connected() is false afterwards.
     */
    virtual std::optional<codec::Action> receive_action() = 0;

    /// `payload` holds exactly one packed msgpack map (or nothing for {})
    virtual void send_response(const std::string& type, const msgpack::sbuffer& payload) = 0;

    virtual bool connected() const = 0;

    /// Printable controller address used in log lines
    virtual std::string peer_address() const = 0;
};

} // namespace flitify::transport
