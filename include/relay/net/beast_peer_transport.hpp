/// @file beast_peer_transport.hpp
/// @brief Boost.Beast websocket peers and the listener that accepts them

#pragma once

#include "peer_transport.hpp"
#include "types.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace relay_net {

class SessionManager;

// =============================================================================
// BeastPeerTransport
// =============================================================================

/// IPeerTransport over a server-side `websocket::stream<tcp::socket>`.
///
/// All stream operations run on the socket's strand. Inbound frames are
/// reported to the SessionManager once start() has bound the transport to
/// a connection id.
class BeastPeerTransport : public IPeerTransport,
                           public std::enable_shared_from_this<BeastPeerTransport> {
public:
    /// Completion of the upgrade; target is the request path
    using HandshakeHandler = std::function<void(boost::beast::error_code ec, std::string target)>;

    explicit BeastPeerTransport(boost::asio::ip::tcp::socket socket);

    /// Read the HTTP upgrade request and accept the websocket
    void async_handshake(HandshakeHandler handler);

    /// Begin the read loop, reporting to sessions under the given id
    void start(SessionManager& sessions, ConnectionId id);

    relay_core::Result<void> send(PeerMessageType type, const relay_core::Bytes& data) override;
    void close() override;
    std::string remote_endpoint() const override { return m_remote; }

private:
    struct Outgoing {
        PeerMessageType type;
        relay_core::Bytes data;
    };

    void do_read();
    void do_write();

    boost::beast::websocket::stream<boost::asio::ip::tcp::socket> m_ws;
    boost::beast::flat_buffer m_buffer;
    boost::beast::http::request<boost::beast::http::string_body> m_request;
    std::string m_remote;

    SessionManager* m_sessions = nullptr;
    ConnectionId m_id;

    std::deque<Outgoing> m_outgoing;
    bool m_writing = false;
    std::atomic<bool> m_closing{false};
};

// =============================================================================
// PeerListener
// =============================================================================

/// Accepts websocket upgrades on one TCP endpoint and hands each peer,
/// with its request path, to a handler
class PeerListener : public std::enable_shared_from_this<PeerListener> {
public:
    using PeerHandler = std::function<void(std::shared_ptr<BeastPeerTransport> peer, const std::string& target)>;

    PeerListener(boost::asio::io_context& io, PeerHandler handler);

    /// Bind and listen; port 0 picks an ephemeral port
    [[nodiscard]] relay_core::Result<void> listen(const std::string& address, std::uint16_t port);

    /// Start accepting (call after listen)
    void start();

    void stop();

    [[nodiscard]] std::uint16_t port() const;

private:
    void do_accept();

    boost::asio::io_context& m_io;
    boost::asio::ip::tcp::acceptor m_acceptor;
    PeerHandler m_handler;
};

} // namespace relay_net
