/// @file beast_peer_transport.cpp
/// @brief Websocket peers using Boost.Beast

#include <relay/net/beast_peer_transport.hpp>
#include <relay/net/session_manager.hpp>
#include <relay/core/log.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

namespace relay_net {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using relay_core::ConnectionError;
using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Ok;
using relay_core::Result;

// =============================================================================
// BeastPeerTransport
// =============================================================================

BeastPeerTransport::BeastPeerTransport(tcp::socket socket)
    : m_ws(std::move(socket))
{
    beast::error_code ec;
    auto remote = m_ws.next_layer().remote_endpoint(ec);
    m_remote = ec ? std::string("unknown") : remote.address().to_string() + ":" + std::to_string(remote.port());
}

void BeastPeerTransport::async_handshake(HandshakeHandler handler) {
    auto self = shared_from_this();
    http::async_read(m_ws.next_layer(), m_buffer, m_request,
        [self, handler = std::move(handler)](beast::error_code ec, std::size_t) {
            if (ec) {
                handler(ec, {});
                return;
            }
            if (!websocket::is_upgrade(self->m_request)) {
                handler(websocket::error::no_connection_upgrade, {});
                return;
            }

            self->m_ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            self->m_ws.async_accept(self->m_request,
                [self, handler](beast::error_code aec) {
                    handler(aec, std::string(self->m_request.target()));
                });
        });
}

void BeastPeerTransport::start(SessionManager& sessions, ConnectionId id) {
    auto self = shared_from_this();
    asio::post(m_ws.get_executor(), [self, &sessions, id]() {
        self->m_sessions = &sessions;
        self->m_id = id;
        self->do_read();
    });
}

void BeastPeerTransport::do_read() {
    auto self = shared_from_this();
    m_ws.async_read(m_buffer, [self](beast::error_code ec, std::size_t bytes) {
        if (ec == websocket::error::closed || (ec && self->m_closing.load())) {
            self->m_sessions->peer_closed(self->m_id);
            return;
        }
        if (ec) {
            self->m_sessions->peer_error(self->m_id, ec.message());
            return;
        }

        auto type = self->m_ws.got_text() ? PeerMessageType::Text : PeerMessageType::Binary;
        auto data = static_cast<const std::uint8_t*>(self->m_buffer.data().data());
        relay_core::Bytes frame(data, data + bytes);
        self->m_buffer.consume(bytes);

        if (auto reported = self->m_sessions->peer_message(self->m_id, type, std::move(frame)); !reported) {
            relay_core::net_logger()->debug("Dropped frame from {}: {}", self->m_remote, reported.error().message());
        }
        self->do_read();
    });
}

Result<void> BeastPeerTransport::send(PeerMessageType type, const relay_core::Bytes& data) {
    if (m_closing.load()) {
        return Err(ConnectionError::closed(m_remote));
    }

    auto self = shared_from_this();
    asio::post(m_ws.get_executor(), [self, type, data]() {
        self->m_outgoing.push_back(Outgoing{type, data});
        if (!self->m_writing) {
            self->do_write();
        }
    });
    return Ok();
}

void BeastPeerTransport::do_write() {
    if (m_outgoing.empty()) {
        m_writing = false;
        return;
    }
    m_writing = true;

    auto& next = m_outgoing.front();
    m_ws.text(next.type == PeerMessageType::Text);

    auto self = shared_from_this();
    m_ws.async_write(asio::buffer(next.data), [self](beast::error_code ec, std::size_t) {
        self->m_outgoing.pop_front();
        if (self->m_closing.load()) {
            self->m_outgoing.clear();
            self->m_writing = false;
            self->m_ws.async_close(websocket::close_code::normal, [self](beast::error_code) {});
            return;
        }
        if (ec) {
            self->m_writing = false;
            if (self->m_sessions) {
                self->m_sessions->peer_error(self->m_id, ec.message());
            }
            return;
        }
        self->do_write();
    });
}

void BeastPeerTransport::close() {
    if (m_closing.exchange(true)) {
        return;
    }

    auto self = shared_from_this();
    asio::post(m_ws.get_executor(), [self]() {
        if (self->m_writing || !self->m_ws.is_open()) {
            return;
        }
        self->m_ws.async_close(websocket::close_code::normal, [self](beast::error_code ec) {
            if (ec) {
                relay_core::net_logger()->debug("Websocket close to {}: {}", self->m_remote, ec.message());
            }
        });
    });
}

// =============================================================================
// PeerListener
// =============================================================================

PeerListener::PeerListener(asio::io_context& io, PeerHandler handler)
    : m_io(io)
    , m_acceptor(asio::make_strand(io))
    , m_handler(std::move(handler))
{
}

Result<void> PeerListener::listen(const std::string& address, std::uint16_t port) {
    beast::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
        return Err(relay_core::ValidationError::invalid_config("web.address", ec.message()));
    }

    tcp::endpoint endpoint{ip, port};
    auto fail = [&](const char* what) {
        return Err(Error(ErrorCode::IOError,
            std::string(what) + " " + address + ":" + std::to_string(port) + ": " + ec.message()));
    };

    m_acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        return fail("Cannot open");
    }
    m_acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) {
        return fail("Cannot configure");
    }
    m_acceptor.bind(endpoint, ec);
    if (ec) {
        return fail("Cannot bind");
    }
    m_acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        return fail("Cannot listen on");
    }

    relay_core::net_logger()->info("Accepting websocket peers on {}:{}", address, this->port());
    return Ok();
}

void PeerListener::start() {
    do_accept();
}

void PeerListener::stop() {
    auto self = shared_from_this();
    asio::post(m_acceptor.get_executor(), [self]() {
        beast::error_code ignored;
        self->m_acceptor.close(ignored);
    });
}

std::uint16_t PeerListener::port() const {
    beast::error_code ec;
    auto endpoint = m_acceptor.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void PeerListener::do_accept() {
    auto self = shared_from_this();
    m_acceptor.async_accept(asio::make_strand(m_io), [self](beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !self->m_acceptor.is_open()) {
            return;
        }
        if (ec) {
            relay_core::net_logger()->warn("Websocket accept failed: {}", ec.message());
        } else {
            auto peer = std::make_shared<BeastPeerTransport>(std::move(socket));
            peer->async_handshake([self, peer](beast::error_code hec, std::string target) {
                if (hec) {
                    relay_core::net_logger()->debug("Websocket handshake with {} failed: {}",
                        peer->remote_endpoint(), hec.message());
                    return;
                }
                self->m_handler(peer, target);
            });
        }
        self->do_accept();
    });
}

} // namespace relay_net
