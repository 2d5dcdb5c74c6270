/// @file session_manager.hpp
/// @brief Asynchronous connections feeding their completions to scripts
///
/// The SessionManager owns every stream socket, websocket peer and
/// database session opened on behalf of a script. Network work runs on
/// its own io_context threads; each connection has a strand so writes,
/// queries and closes on one connection never interleave. Results reach
/// scripts only as tasks posted to the owning instance's queue:
/// - exactly one open callback per open (success or a single error)
/// - connection events through EventBus::emit_to, in arrival order
/// - nothing at all for an id once close() has returned

#pragma once

#include "types.hpp"
#include "connection.hpp"
#include "database.hpp"
#include "peer_transport.hpp"

#include <relay/core/error.hpp>
#include <relay/event/event_bus.hpp>
#include <relay/kernel/capability_registry.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <vector>

namespace relay_net {

class SessionManager {
public:
    SessionManager(relay_event::EventBus& bus,
                   SessionConfig config,
                   std::shared_ptr<DatabaseDriverRegistry> drivers = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// Close every connection and join the I/O threads
    void shutdown();

    [[nodiscard]] boost::asio::io_context& io_context() { return m_io; }
    [[nodiscard]] const SessionConfig& config() const { return m_config; }
    [[nodiscard]] DatabaseDriverRegistry& drivers() { return *m_drivers; }

    // =========================================================================
    // Opening
    // =========================================================================

    /// Connect a TCP socket for a context
    /// @return ValidationError for malformed params; otherwise the id of a
    ///         connection in Connecting whose outcome arrives via on_open
    [[nodiscard]] relay_core::Result<ConnectionId> open_socket(const relay_kernel::ScriptContext& context,
                                                               const ConnectParams& params,
                                                               OpenCallback on_open);

    /// Open a database session for a context
    [[nodiscard]] relay_core::Result<ConnectionId> open_database(const relay_kernel::ScriptContext& context,
                                                                 const DbParams& params,
                                                                 OpenCallback on_open);

    /// Attach an accepted websocket peer to a context holding the ws
    /// privilege; emits ws.connect to that context
    [[nodiscard]] relay_core::Result<ConnectionId> attach_peer(const relay_kernel::ScriptContext& context,
                                                               std::shared_ptr<IPeerTransport> transport);

    // =========================================================================
    // Operations
    // =========================================================================

    /// Queue data for sending; never blocks. Transport failures surface as
    /// a net.error / ws.error event.
    [[nodiscard]] relay_core::Result<void> write(ConnectionId id,
                                                 relay_core::Bytes data,
                                                 PeerMessageType type = PeerMessageType::Binary);

    /// Send to every open websocket peer owned by a context
    /// @return number of peers written to
    std::size_t broadcast_peers(relay_kernel::ContextId owner, PeerMessageType type, const relay_core::Bytes& data);

    /// Run a query on a database connection; results arrive in request order
    [[nodiscard]] relay_core::Result<void> query(ConnectionId id,
                                                 std::string sql,
                                                 relay_core::Value params,
                                                 QueryCallback callback);

    /// Run a statement without rows on a database connection
    [[nodiscard]] relay_core::Result<void> exec(ConnectionId id,
                                                std::string sql,
                                                relay_core::Value params,
                                                ExecCallback callback);

    /// Close a connection; idempotent. No event for the id is delivered
    /// once this returns.
    relay_core::Result<void> close(ConnectionId id);

    /// Close every connection owned by a context and drop pending open callbacks
    void close_all(relay_kernel::ContextId owner);

    // =========================================================================
    // Websocket Peer Reports
    // =========================================================================

    /// Inbound frame from a peer -> ws.data
    [[nodiscard]] relay_core::Result<void> peer_message(ConnectionId id, PeerMessageType type, relay_core::Bytes data);

    /// Peer went away -> ws.disconnect
    void peer_closed(ConnectionId id);

    /// Peer transport failed -> ws.error
    void peer_error(ConnectionId id, const std::string& message);

    // =========================================================================
    // Queries
    // =========================================================================

    /// State of a live connection; nullopt once it has been forgotten
    [[nodiscard]] std::optional<ConnectionState> state(ConnectionId id) const;

    /// Owner of a live connection
    [[nodiscard]] std::optional<relay_kernel::ContextId> owner_of(ConnectionId id) const;

    [[nodiscard]] std::vector<ConnectionId> connections_of(relay_kernel::ContextId owner) const;

    [[nodiscard]] SessionStats stats() const;

private:
    using ConnectCompletion = std::function<void(std::optional<relay_core::Error>)>;

    relay_core::Result<ConnectionPtr> create_connection(const relay_kernel::ScriptContext& context,
                                                       ConnectionKind kind,
                                                       std::string endpoint,
                                                       OpenCallback on_open);

    [[nodiscard]] ConnectionPtr find(ConnectionId id) const;
    void forget(ConnectionId id);

    /// Resolve and connect conn->socket with the connect timeout (strand)
    void start_connect(const ConnectionPtr& conn, const std::string& host, std::uint32_t port,
                       ConnectCompletion done);

    /// Move Connecting -> Open/Failed and post the open callback once
    void finish_open(const ConnectionPtr& conn, std::optional<relay_core::Error> error);

    void post_open_result(const ConnectionPtr& conn, std::optional<relay_core::Error> error);

    void start_read(const ConnectionPtr& conn);
    void do_write(const ConnectionPtr& conn);

    /// Peer or transport ended a socket (strand)
    void handle_socket_end(const ConnectionPtr& conn, const boost::system::error_code& ec);

    void open_database_session(const ConnectionPtr& conn, const DbParams& params);

    /// Drop every transport object (strand)
    static void release_transport(const ConnectionPtr& conn);

    /// Context-scoped event, suppressed once the connection is closed locally
    void emit_event(const ConnectionPtr& conn, const char* name, relay_core::Value payload);

    relay_event::EventBus& m_bus;
    SessionConfig m_config;
    std::shared_ptr<DatabaseDriverRegistry> m_drivers;

    boost::asio::io_context m_io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> m_work;
    std::vector<std::thread> m_threads;
    std::atomic<bool> m_stopped{false};

    mutable std::shared_mutex m_mutex;
    std::map<ConnectionId, ConnectionPtr> m_connections;
    relay_core::IdGenerator m_ids;

    std::atomic<std::uint64_t> m_opened{0};
    std::atomic<std::uint64_t> m_failed{0};
    std::atomic<std::uint64_t> m_closed{0};
    std::atomic<std::uint64_t> m_errored{0};
    std::atomic<std::uint64_t> m_bytes_written{0};
    std::atomic<std::uint64_t> m_bytes_read{0};
};

} // namespace relay_net
