/// @file session_manager.cpp
/// @brief SessionManager lifecycle, bookkeeping and websocket peers

#include <relay/net/session_manager.hpp>
#include <relay/core/log.hpp>

#include <boost/asio/post.hpp>

namespace relay_net {

namespace asio = boost::asio;

using relay_core::CapabilityError;
using relay_core::ConnectionError;
using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Ok;
using relay_core::Result;
using relay_core::Value;
using relay_kernel::ContextId;

namespace {

Error unknown_connection(ConnectionId id) {
    return Error(ErrorCode::NotFound, "Unknown connection " + id.to_string());
}

} // anonymous namespace

// =============================================================================
// Lifecycle
// =============================================================================

SessionManager::SessionManager(relay_event::EventBus& bus,
                               SessionConfig config,
                               std::shared_ptr<DatabaseDriverRegistry> drivers)
    : m_bus(bus)
    , m_config(config)
    , m_drivers(drivers ? std::move(drivers) : DatabaseDriverRegistry::with_builtin_drivers(config.connect_timeout))
    , m_work(asio::make_work_guard(m_io))
{
    std::size_t threads = m_config.io_threads == 0 ? 1 : m_config.io_threads;
    m_threads.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        m_threads.emplace_back([this]() {
            for (;;) {
                try {
                    m_io.run();
                    return;
                } catch (const std::exception& e) {
                    relay_core::net_logger()->error("I/O handler threw: {}", e.what());
                }
            }
        });
    }
    relay_core::net_logger()->debug("Session manager started with {} I/O threads", threads);
}

SessionManager::~SessionManager() {
    shutdown();
}

void SessionManager::shutdown() {
    if (m_stopped.exchange(true)) {
        return;
    }

    std::vector<ConnectionId> ids;
    {
        std::shared_lock lock(m_mutex);
        for (const auto& [id, conn] : m_connections) {
            ids.push_back(id);
        }
    }
    for (auto id : ids) {
        close(id);
    }

    m_work.reset();
    m_io.stop();
    for (auto& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    m_threads.clear();
    relay_core::net_logger()->debug("Session manager stopped");
}

// =============================================================================
// Bookkeeping
// =============================================================================

Result<ConnectionPtr> SessionManager::create_connection(const relay_kernel::ScriptContext& context,
                                                        ConnectionKind kind,
                                                        std::string endpoint,
                                                        OpenCallback on_open) {
    if (m_stopped.load()) {
        return Err<ConnectionPtr>(Error(ErrorCode::InvalidState, "Session manager is shut down"));
    }
    if (!context.is_active()) {
        return Err<ConnectionPtr>(Error(ErrorCode::InvalidState,
            "Script '" + context.script() + "' has been unloaded"));
    }
    auto queue = m_bus.queue(context.instance_id());
    if (!queue) {
        return Err<ConnectionPtr>(Error(ErrorCode::InvalidState,
            "Instance '" + context.instance_id() + "' is not running"));
    }

    auto conn = std::make_shared<Connection>(ConnectionId{m_ids.next()},
                                             kind,
                                             context.id(),
                                             context.instance_id(),
                                             context.script(),
                                             std::move(endpoint),
                                             asio::make_strand(m_io),
                                             std::move(queue));
    conn->on_open = std::move(on_open);

    std::unique_lock lock(m_mutex);
    m_connections.emplace(conn->id(), conn);
    return conn;
}

ConnectionPtr SessionManager::find(ConnectionId id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_connections.find(id);
    return it != m_connections.end() ? it->second : nullptr;
}

void SessionManager::forget(ConnectionId id) {
    std::unique_lock lock(m_mutex);
    m_connections.erase(id);
}

void SessionManager::release_transport(const ConnectionPtr& conn) {
    boost::system::error_code ignored;
    if (conn->timer) {
        conn->timer->cancel();
    }
    if (conn->resolver) {
        conn->resolver->cancel();
    }
    if (conn->socket) {
        conn->socket->shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        conn->socket->close(ignored);
    }
    conn->write_queue.clear();
    if (conn->peer) {
        conn->peer->close();
        conn->peer.reset();
    }
    if (conn->database) {
        conn->database->close();
        conn->database.reset();
    }
}

// =============================================================================
// Open Completion
// =============================================================================

void SessionManager::finish_open(const ConnectionPtr& conn, std::optional<Error> error) {
    auto target = error ? ConnectionState::Failed : ConnectionState::Open;
    if (!conn->transition(target)) {
        return;
    }

    if (conn->timer) {
        conn->timer->cancel();
    }

    if (error) {
        m_failed.fetch_add(1, std::memory_order_relaxed);
        relay_core::net_logger()->warn("{} connection {} to {} failed: {}",
            to_string(conn->kind()), conn->id().value, conn->endpoint(), error->message());
        release_transport(conn);
        forget(conn->id());
    } else {
        m_opened.fetch_add(1, std::memory_order_relaxed);
        relay_core::net_logger()->debug("{} connection {} to {} open",
            to_string(conn->kind()), conn->id().value, conn->endpoint());
    }

    post_open_result(conn, std::move(error));
}

void SessionManager::post_open_result(const ConnectionPtr& conn, std::optional<Error> error) {
    auto callback = std::move(conn->on_open);
    conn->on_open = nullptr;
    if (!callback) {
        return;
    }

    conn->queue()->post([conn, callback = std::move(callback), error = std::move(error)]() {
        if (conn->owner_released()) {
            return;
        }
        callback(error ? &*error : nullptr);
    });
}

// =============================================================================
// Events
// =============================================================================

void SessionManager::emit_event(const ConnectionPtr& conn, const char* name, Value payload) {
    auto delivered = m_bus.emit_to(conn->instance_id(), conn->owner(), name, std::move(payload),
        [conn]() { return !conn->closed_locally(); });
    if (!delivered) {
        relay_core::net_logger()->debug("Dropped {} for connection {}: {}",
            name, conn->id().value, delivered.error().message());
    }
}

// =============================================================================
// Operations
// =============================================================================

Result<void> SessionManager::write(ConnectionId id, relay_core::Bytes data, PeerMessageType type) {
    auto conn = find(id);
    if (!conn) {
        return Err(unknown_connection(id));
    }
    if (conn->state() != ConnectionState::Open) {
        return Err(ConnectionError::closed(conn->endpoint()));
    }

    switch (conn->kind()) {
        case ConnectionKind::StreamSocket:
            asio::post(conn->strand(), [this, conn, data = std::move(data)]() mutable {
                if (conn->state() != ConnectionState::Open || !conn->socket) {
                    return;
                }
                conn->write_queue.push_back(std::move(data));
                if (!conn->writing) {
                    do_write(conn);
                }
            });
            return Ok();

        case ConnectionKind::WebSocketPeer:
            asio::post(conn->strand(), [this, conn, type, data = std::move(data)]() {
                if (conn->state() != ConnectionState::Open || !conn->peer) {
                    return;
                }
                auto sent = conn->peer->send(type, data);
                if (!sent) {
                    peer_error(conn->id(), sent.error().message());
                    return;
                }
                m_bytes_written.fetch_add(data.size(), std::memory_order_relaxed);
            });
            return Ok();

        case ConnectionKind::Database:
        default:
            return Err(Error(ErrorCode::InvalidArgument,
                "Connection " + id.to_string() + " does not accept raw writes"));
    }
}

std::size_t SessionManager::broadcast_peers(ContextId owner, PeerMessageType type, const relay_core::Bytes& data) {
    std::size_t sent = 0;
    for (auto id : connections_of(owner)) {
        auto conn = find(id);
        if (!conn || conn->kind() != ConnectionKind::WebSocketPeer) {
            continue;
        }
        if (write(id, data, type)) {
            ++sent;
        }
    }
    return sent;
}

Result<void> SessionManager::close(ConnectionId id) {
    auto conn = find(id);
    if (!conn) {
        return Ok();
    }

    conn->mark_closed_locally();

    if (conn->transition(ConnectionState::Closed)) {
        m_closed.fetch_add(1, std::memory_order_relaxed);
    } else if (conn->transition(ConnectionState::Failed)) {
        // Closed while still connecting: the open callback reports it
        m_failed.fetch_add(1, std::memory_order_relaxed);
        asio::post(conn->strand(), [this, conn]() {
            post_open_result(conn, Error(ConnectionError::closed(conn->endpoint())));
        });
    }

    forget(id);
    asio::post(conn->strand(), [conn]() { release_transport(conn); });
    relay_core::net_logger()->debug("Closed connection {}", id.value);
    return Ok();
}

void SessionManager::close_all(ContextId owner) {
    auto ids = connections_of(owner);
    for (auto id : ids) {
        if (auto conn = find(id)) {
            conn->mark_owner_released();
        }
        close(id);
    }
    if (!ids.empty()) {
        relay_core::net_logger()->debug("Closed {} connections of context {}", ids.size(), owner.value);
    }
}

// =============================================================================
// Websocket Peers
// =============================================================================

Result<ConnectionId> SessionManager::attach_peer(const relay_kernel::ScriptContext& context,
                                                 std::shared_ptr<IPeerTransport> transport) {
    if (!transport) {
        return Err<ConnectionId>(Error(ErrorCode::InvalidArgument, "Peer transport must not be null"));
    }
    if (!context.privileges().has("ws")) {
        return Err<ConnectionId>(CapabilityError::not_granted(context.script(), "ws"));
    }

    auto endpoint = transport->remote_endpoint();
    auto created = create_connection(context, ConnectionKind::WebSocketPeer, endpoint, nullptr);
    if (!created) {
        return Err<ConnectionId>(created.error());
    }
    auto conn = created.value();
    conn->peer = std::move(transport);
    conn->transition(ConnectionState::Open);
    m_opened.fetch_add(1, std::memory_order_relaxed);

    Value payload = Value::object();
    payload["id"] = conn->id().to_string();
    emit_event(conn, relay_event::events::kWsConnect, std::move(payload));

    relay_core::net_logger()->info("Websocket peer {} attached to script '{}' on instance '{}'",
        endpoint, context.script(), context.instance_id());
    return conn->id();
}

Result<void> SessionManager::peer_message(ConnectionId id, PeerMessageType type, relay_core::Bytes data) {
    auto conn = find(id);
    if (!conn) {
        return Err(unknown_connection(id));
    }
    if (conn->kind() != ConnectionKind::WebSocketPeer || conn->state() != ConnectionState::Open) {
        return Err(ConnectionError::closed(conn->endpoint()));
    }

    m_bytes_read.fetch_add(data.size(), std::memory_order_relaxed);
    Value payload = Value::object();
    payload["id"] = id.to_string();
    payload["type"] = static_cast<int>(type);
    payload["data"] = relay_core::bytes_value(std::move(data));
    emit_event(conn, relay_event::events::kWsData, std::move(payload));
    return Ok();
}

void SessionManager::peer_closed(ConnectionId id) {
    auto conn = find(id);
    if (!conn || !conn->transition(ConnectionState::Closed)) {
        return;
    }
    m_closed.fetch_add(1, std::memory_order_relaxed);
    forget(id);

    Value payload = Value::object();
    payload["id"] = id.to_string();
    emit_event(conn, relay_event::events::kWsDisconnect, std::move(payload));
    asio::post(conn->strand(), [conn]() { conn->peer.reset(); });
}

void SessionManager::peer_error(ConnectionId id, const std::string& message) {
    auto conn = find(id);
    if (!conn || !conn->transition(ConnectionState::Errored)) {
        return;
    }
    m_errored.fetch_add(1, std::memory_order_relaxed);
    forget(id);

    Value payload = Value::object();
    payload["id"] = id.to_string();
    payload["error"] = message;
    emit_event(conn, relay_event::events::kWsError, std::move(payload));
    asio::post(conn->strand(), [conn]() { release_transport(conn); });
}

// =============================================================================
// Queries
// =============================================================================

std::optional<ConnectionState> SessionManager::state(ConnectionId id) const {
    auto conn = find(id);
    if (!conn) {
        return std::nullopt;
    }
    return conn->state();
}

std::optional<ContextId> SessionManager::owner_of(ConnectionId id) const {
    auto conn = find(id);
    if (!conn) {
        return std::nullopt;
    }
    return conn->owner();
}

std::vector<ConnectionId> SessionManager::connections_of(ContextId owner) const {
    std::vector<ConnectionId> ids;
    std::shared_lock lock(m_mutex);
    for (const auto& [id, conn] : m_connections) {
        if (conn->owner() == owner) {
            ids.push_back(id);
        }
    }
    return ids;
}

SessionStats SessionManager::stats() const {
    SessionStats s;
    s.opened = m_opened.load(std::memory_order_relaxed);
    s.failed = m_failed.load(std::memory_order_relaxed);
    s.closed = m_closed.load(std::memory_order_relaxed);
    s.errored = m_errored.load(std::memory_order_relaxed);
    s.bytes_written = m_bytes_written.load(std::memory_order_relaxed);
    s.bytes_read = m_bytes_read.load(std::memory_order_relaxed);
    std::shared_lock lock(m_mutex);
    s.active = m_connections.size();
    return s;
}

} // namespace relay_net
