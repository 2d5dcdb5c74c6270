/// @file types.hpp
/// @brief Connection identity, state machine and parameters for relay_net

#pragma once

#include <relay/core/error.hpp>
#include <relay/core/id.hpp>
#include <relay/core/value.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace relay_net {

// =============================================================================
// Connection Identification
// =============================================================================

struct ConnectionTag {};

/// Unique per SessionManager; rendered as a decimal string to scripts
using ConnectionId = relay_core::TypedId<ConnectionTag>;

/// Kind of externally driven connection
enum class ConnectionKind : std::uint8_t {
    StreamSocket,   ///< Outbound TCP socket
    WebSocketPeer,  ///< Peer attached by the web layer
    Database,       ///< Database session
};

[[nodiscard]] const char* to_string(ConnectionKind kind);

// =============================================================================
// Connection State Machine
// =============================================================================

/// Connecting -> {Open, Failed}; Open -> {Closed, Errored}
enum class ConnectionState : std::uint8_t {
    Connecting,
    Open,
    Failed,   ///< terminal
    Closed,   ///< terminal
    Errored,  ///< terminal
};

[[nodiscard]] const char* to_string(ConnectionState state);

/// Check whether a state transition is allowed
[[nodiscard]] bool is_valid_transition(ConnectionState from, ConnectionState to);

[[nodiscard]] inline bool is_terminal(ConnectionState state) {
    return state == ConnectionState::Failed
        || state == ConnectionState::Closed
        || state == ConnectionState::Errored;
}

// =============================================================================
// Parameters
// =============================================================================

/// Stream socket parameters (`{host, port, protocol}`)
struct ConnectParams {
    std::string host;
    std::uint32_t port = 0;
    std::string protocol = "tcp";

    /// Parse from the script-facing object form
    [[nodiscard]] static relay_core::Result<ConnectParams> from_json(const relay_core::Value& j);

    /// Host required, port within 1..65535, protocol "tcp"
    [[nodiscard]] relay_core::Result<void> validate() const;

    [[nodiscard]] std::string endpoint() const;
};

/// Database parameters (`{driver, host, port, username, password, database}`)
struct DbParams {
    std::string driver;
    std::string host;
    std::uint32_t port = 0;
    std::string username;
    std::string password;
    std::string database;

    [[nodiscard]] static relay_core::Result<DbParams> from_json(const relay_core::Value& j);

    /// Driver required; remote drivers need a host
    [[nodiscard]] relay_core::Result<void> validate() const;

    /// True for drivers reached over the network
    [[nodiscard]] bool is_remote() const;

    /// Port to connect to, falling back to the driver's well-known port
    [[nodiscard]] std::uint32_t effective_port() const;

    [[nodiscard]] std::string endpoint() const;
};

// =============================================================================
// Callbacks
// =============================================================================

/// Terminal callback of an open; error is null on success
using OpenCallback = std::function<void(const relay_core::Error* error)>;

/// Query completion; rows is an array of objects keyed by column name
using QueryCallback = std::function<void(const relay_core::Error* error, const relay_core::Value& rows)>;

/// Statement completion
using ExecCallback = std::function<void(const relay_core::Error* error)>;

// =============================================================================
// Configuration and Statistics
// =============================================================================

/// Session manager configuration
struct SessionConfig {
    std::size_t io_threads = 2;
    std::chrono::milliseconds connect_timeout{5000};
    std::size_t read_buffer_size = 4096;
};

/// Session manager statistics
struct SessionStats {
    std::uint64_t opened = 0;
    std::uint64_t failed = 0;
    std::uint64_t closed = 0;
    std::uint64_t errored = 0;
    std::uint64_t bytes_written = 0;
    std::uint64_t bytes_read = 0;
    std::size_t active = 0;
};

} // namespace relay_net
