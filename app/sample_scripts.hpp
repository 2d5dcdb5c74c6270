/// @file sample_scripts.hpp
/// @brief Scripts shipped with relay_host

#pragma once

#include <relay/host/script.hpp>

namespace relay_app {

/// Register the bundled scripts:
/// - ping: answers "ping" broadcasts with "pong" and counts them globally
/// - greeter: logs backend connect/disconnect and remembers the last client
/// - echo_web: echoes websocket frames back to the peer (needs "ws")
/// - audit_db: records backend events into an in-memory SQLite table (needs "db")
void register_sample_scripts(relay_host::ScriptCatalog& catalog);

} // namespace relay_app
