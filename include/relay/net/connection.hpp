/// @file connection.hpp
/// @brief One externally driven connection and its state machine

#pragma once

#include "types.hpp"
#include "peer_transport.hpp"
#include "database.hpp"

#include <relay/exec/execution_queue.hpp>
#include <relay/kernel/types.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace relay_net {

/// Connection record shared by the session manager, its I/O handlers and
/// the tasks it posts to the owning instance queue.
///
/// The state machine is guarded by a mutex and may be driven from any
/// thread; the transport members are only touched on the strand.
class Connection {
public:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    Connection(ConnectionId id,
               ConnectionKind kind,
               relay_kernel::ContextId owner,
               std::string instance_id,
               std::string script,
               std::string endpoint,
               Strand strand,
               std::shared_ptr<relay_exec::ExecutionQueue> queue);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] ConnectionId id() const { return m_id; }
    [[nodiscard]] ConnectionKind kind() const { return m_kind; }
    [[nodiscard]] relay_kernel::ContextId owner() const { return m_owner; }
    [[nodiscard]] const std::string& instance_id() const { return m_instance_id; }
    [[nodiscard]] const std::string& script() const { return m_script; }
    [[nodiscard]] const std::string& endpoint() const { return m_endpoint; }

    [[nodiscard]] Strand& strand() { return m_strand; }
    [[nodiscard]] const std::shared_ptr<relay_exec::ExecutionQueue>& queue() const { return m_queue; }

    // =========================================================================
    // State Machine
    // =========================================================================

    [[nodiscard]] ConnectionState state() const;

    /// Apply a transition if the state machine allows it
    /// @return false when the transition is invalid (another path won)
    bool transition(ConnectionState to);

    /// Set by close(); every delivery still in flight is dropped
    void mark_closed_locally() { m_closed_locally.store(true, std::memory_order_release); }
    [[nodiscard]] bool closed_locally() const { return m_closed_locally.load(std::memory_order_acquire); }

    /// Set when the owning context is torn down; the open callback is dropped
    void mark_owner_released() { m_owner_released.store(true, std::memory_order_release); }
    [[nodiscard]] bool owner_released() const { return m_owner_released.load(std::memory_order_acquire); }

    // =========================================================================
    // Transport (strand only)
    // =========================================================================

    std::unique_ptr<boost::asio::ip::tcp::resolver> resolver;
    std::unique_ptr<boost::asio::ip::tcp::socket> socket;
    std::unique_ptr<boost::asio::steady_timer> timer;
    bool connect_done = false;

    std::vector<std::uint8_t> read_buffer;
    std::deque<relay_core::Bytes> write_queue;
    bool writing = false;

    std::shared_ptr<IPeerTransport> peer;
    std::shared_ptr<IDatabaseSession> database;

    /// Terminal open callback; consumed by whichever path finishes the open
    OpenCallback on_open;

private:
    ConnectionId m_id;
    ConnectionKind m_kind;
    relay_kernel::ContextId m_owner;
    std::string m_instance_id;
    std::string m_script;
    std::string m_endpoint;
    Strand m_strand;
    std::shared_ptr<relay_exec::ExecutionQueue> m_queue;

    mutable std::mutex m_state_mutex;
    ConnectionState m_state = ConnectionState::Connecting;
    std::atomic<bool> m_closed_locally{false};
    std::atomic<bool> m_owner_released{false};
};

using ConnectionPtr = std::shared_ptr<Connection>;

} // namespace relay_net
