/// @file types.hpp
/// @brief Core types for relay_kernel
///
/// Provides the identifiers and enumerations shared by the capability
/// registry, the event bus and the session manager:
/// - Context identification
/// - Script-facing module kinds

#pragma once

#include "fwd.hpp"

#include <relay/core/id.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace relay_kernel {

// =============================================================================
// Context Identification
// =============================================================================

struct ContextTag {};

/// Process-unique id of a ScriptContext; zero marks host-origin events
using ContextId = relay_core::TypedId<ContextTag>;

// =============================================================================
// Module Kinds
// =============================================================================

/// One tag per script-facing module handle class
enum class ModuleKind : std::uint8_t {
    Engine,   ///< Instance and bot information, logging
    Store,    ///< Scoped key/value store
    Event,    ///< Event subscription and emission
    Backend,  ///< Backend identity
    Net,      ///< Outbound stream sockets (privileged)
    Ws,       ///< Websocket peers (privileged)
    Db,       ///< Database connections (privileged)
};

/// Convert module kind to its registry name
[[nodiscard]] const char* to_string(ModuleKind kind);

} // namespace relay_kernel
