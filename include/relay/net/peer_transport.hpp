/// @file peer_transport.hpp
/// @brief Boundary to the external websocket layer

#pragma once

#include <relay/core/error.hpp>
#include <relay/core/value.hpp>

#include <cstdint>
#include <string>

namespace relay_net {

/// Frame type of a websocket message, numbered as the wire opcodes
enum class PeerMessageType : std::uint8_t {
    Text = 1,
    Binary = 2,
};

[[nodiscard]] const char* to_string(PeerMessageType type);

/// A websocket peer as seen by the session manager. Framing, handshakes
/// and pings belong to the implementation; the session manager only sends
/// messages and closes. Inbound traffic is reported back through
/// SessionManager::peer_message / peer_closed / peer_error.
class IPeerTransport {
public:
    virtual ~IPeerTransport() = default;

    /// Queue one message; delivery failures are reported via peer_error
    [[nodiscard]] virtual relay_core::Result<void> send(PeerMessageType type, const relay_core::Bytes& data) = 0;

    /// Start a close handshake; safe to call more than once
    virtual void close() = 0;

    /// Remote address for logs
    [[nodiscard]] virtual std::string remote_endpoint() const = 0;
};

} // namespace relay_net
