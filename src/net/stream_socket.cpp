/// @file stream_socket.cpp
/// @brief Outbound TCP sockets for the net module

#include <relay/net/session_manager.hpp>
#include <relay/core/log.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

namespace relay_net {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using relay_core::ConnectionError;
using relay_core::Err;
using relay_core::Error;
using relay_core::Result;
using relay_core::Value;

// =============================================================================
// Open
// =============================================================================

Result<ConnectionId> SessionManager::open_socket(const relay_kernel::ScriptContext& context,
                                                 const ConnectParams& params,
                                                 OpenCallback on_open) {
    if (auto valid = params.validate(); !valid) {
        return Err<ConnectionId>(valid.error());
    }

    auto created = create_connection(context, ConnectionKind::StreamSocket, params.endpoint(), std::move(on_open));
    if (!created) {
        return Err<ConnectionId>(created.error());
    }
    auto conn = created.value();

    relay_core::net_logger()->debug("Script '{}' connecting to {} as connection {}",
        context.script(), conn->endpoint(), conn->id().value);

    asio::post(conn->strand(), [this, conn, host = params.host, port = params.port]() {
        start_connect(conn, host, port, [this, conn](std::optional<Error> error) {
            finish_open(conn, error);
            if (!error) {
                start_read(conn);
            }
        });
    });

    return conn->id();
}

void SessionManager::start_connect(const ConnectionPtr& conn, const std::string& host, std::uint32_t port,
                                   ConnectCompletion done) {
    if (conn->state() != ConnectionState::Connecting) {
        return;
    }
    if (!conn->socket) {
        conn->socket = std::make_unique<tcp::socket>(conn->strand());
    }
    conn->resolver = std::make_unique<tcp::resolver>(conn->strand());
    conn->timer = std::make_unique<asio::steady_timer>(conn->strand());
    conn->connect_done = false;

    // Whichever of timer, resolve or connect finishes first reports
    auto complete = std::make_shared<ConnectCompletion>(std::move(done));
    auto endpoint = host + ":" + std::to_string(port);

    conn->timer->expires_after(m_config.connect_timeout);
    conn->timer->async_wait([conn, complete, endpoint](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted || conn->connect_done) {
            return;
        }
        conn->connect_done = true;
        boost::system::error_code ignored;
        if (conn->resolver) {
            conn->resolver->cancel();
        }
        if (conn->socket) {
            conn->socket->close(ignored);
        }
        (*complete)(Error(ConnectionError::timeout(endpoint)));
    });

    conn->resolver->async_resolve(host, std::to_string(port),
        [conn, complete, endpoint](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            if (conn->connect_done) {
                return;
            }
            if (ec) {
                conn->connect_done = true;
                if (conn->timer) {
                    conn->timer->cancel();
                }
                (*complete)(Error(ConnectionError::resolve_failed(endpoint, ec.message())));
                return;
            }
            if (!conn->socket) {
                return;
            }

            asio::async_connect(*conn->socket, results,
                [conn, complete, endpoint](const boost::system::error_code& cec, const tcp::endpoint&) {
                    if (conn->connect_done) {
                        return;
                    }
                    conn->connect_done = true;
                    if (conn->timer) {
                        conn->timer->cancel();
                    }
                    if (cec) {
                        (*complete)(Error(ConnectionError::connect_failed(endpoint, cec.message())));
                        return;
                    }
                    (*complete)(std::nullopt);
                });
        });
}

// =============================================================================
// Read / Write
// =============================================================================

void SessionManager::start_read(const ConnectionPtr& conn) {
    if (!conn->socket || conn->state() != ConnectionState::Open) {
        return;
    }
    conn->read_buffer.resize(m_config.read_buffer_size == 0 ? 4096 : m_config.read_buffer_size);

    conn->socket->async_read_some(asio::buffer(conn->read_buffer),
        [this, conn](const boost::system::error_code& ec, std::size_t bytes) {
            if (ec) {
                handle_socket_end(conn, ec);
                return;
            }

            m_bytes_read.fetch_add(bytes, std::memory_order_relaxed);
            relay_core::Bytes data(conn->read_buffer.begin(), conn->read_buffer.begin() + bytes);

            Value payload = Value::object();
            payload["id"] = conn->id().to_string();
            payload["data"] = relay_core::bytes_value(std::move(data));
            emit_event(conn, relay_event::events::kNetData, std::move(payload));

            start_read(conn);
        });
}

void SessionManager::do_write(const ConnectionPtr& conn) {
    if (conn->write_queue.empty() || !conn->socket) {
        conn->writing = false;
        return;
    }
    conn->writing = true;

    asio::async_write(*conn->socket, asio::buffer(conn->write_queue.front()),
        [this, conn](const boost::system::error_code& ec, std::size_t bytes) {
            if (ec) {
                conn->writing = false;
                handle_socket_end(conn, ec);
                return;
            }
            m_bytes_written.fetch_add(bytes, std::memory_order_relaxed);
            if (!conn->write_queue.empty()) {
                conn->write_queue.pop_front();
            }
            do_write(conn);
        });
}

void SessionManager::handle_socket_end(const ConnectionPtr& conn, const boost::system::error_code& ec) {
    if (ec == asio::error::operation_aborted) {
        return;
    }

    Value payload = Value::object();
    payload["id"] = conn->id().to_string();

    if (ec == asio::error::eof || ec == asio::error::connection_reset) {
        if (!conn->transition(ConnectionState::Closed)) {
            return;
        }
        m_closed.fetch_add(1, std::memory_order_relaxed);
        relay_core::net_logger()->debug("Connection {} closed by {}", conn->id().value, conn->endpoint());
        forget(conn->id());
        emit_event(conn, relay_event::events::kNetClose, std::move(payload));
    } else {
        if (!conn->transition(ConnectionState::Errored)) {
            return;
        }
        m_errored.fetch_add(1, std::memory_order_relaxed);
        relay_core::net_logger()->warn("Connection {} to {} failed: {}",
            conn->id().value, conn->endpoint(), ec.message());
        forget(conn->id());
        payload["error"] = ec.message();
        emit_event(conn, relay_event::events::kNetError, std::move(payload));
    }

    release_transport(conn);
}

} // namespace relay_net
