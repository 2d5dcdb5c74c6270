/// @file host.hpp
/// @brief Process-scoped owner of the registry, store, bus and sessions

#pragma once

#include "config.hpp"
#include "instance.hpp"
#include "modules.hpp"
#include "script.hpp"

#include <relay/core/error.hpp>
#include <relay/event/event_bus.hpp>
#include <relay/exec/execution_queue.hpp>
#include <relay/kernel/capability_registry.hpp>
#include <relay/net/beast_peer_transport.hpp>
#include <relay/net/session_manager.hpp>
#include <relay/store/scoped_store.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace relay_host {

/// The host: created once at startup, shared by reference by every
/// Instance and module handle, torn down at shutdown.
class Host {
public:
    /// @param backend store backend; nullptr picks one from the config
    Host(HostConfig config,
         std::shared_ptr<ScriptCatalog> catalog,
         std::shared_ptr<relay_store::IStoreBackend> backend = nullptr);
    ~Host();

    Host(const Host&) = delete;
    Host& operator=(const Host&) = delete;

    /// Build a host and load the persisted store
    [[nodiscard]] static relay_core::Result<std::unique_ptr<Host>> create(
        HostConfig config,
        std::shared_ptr<ScriptCatalog> catalog,
        std::shared_ptr<relay_store::IStoreBackend> backend = nullptr);

    /// Start the configured instances and, if enabled, the websocket listener
    [[nodiscard]] relay_core::Result<void> start();

    /// Stop every instance, close all connections, join all threads
    void shutdown();

    // =========================================================================
    // Instances
    // =========================================================================

    /// Create, register and start an instance
    [[nodiscard]] relay_core::Result<Instance*> add_instance(InstanceConfig config);

    /// Stop and forget an instance
    [[nodiscard]] relay_core::Result<void> remove_instance(const std::string& id);

    [[nodiscard]] Instance* instance(const std::string& id) const;
    [[nodiscard]] std::vector<std::string> instance_ids() const;

    // =========================================================================
    // External Adapters
    // =========================================================================

    /// Attach an accepted websocket peer to a script of an instance
    [[nodiscard]] relay_core::Result<relay_net::ConnectionId> accept_peer(
        const std::string& instance_id, const std::string& script,
        std::shared_ptr<relay_net::IPeerTransport> transport);

    /// Backend event to every running instance
    void broadcast_backend_event(const std::string& name, relay_core::Value payload);

    /// Port of the websocket listener, 0 when not listening
    [[nodiscard]] std::uint16_t web_port() const;

    // =========================================================================
    // Bot Log Level
    // =========================================================================

    /// @return false if the level is outside 0..11
    bool set_bot_log_level(int level);
    [[nodiscard]] int bot_log_level() const { return m_bot_log_level.load(); }

    // =========================================================================
    // Components
    // =========================================================================

    [[nodiscard]] const HostConfig& config() const { return m_config; }
    [[nodiscard]] const ScriptCatalog& catalog() const { return *m_catalog; }
    [[nodiscard]] relay_kernel::CapabilityRegistry& registry() { return m_registry; }
    [[nodiscard]] relay_store::ScopedStore& store() { return m_store; }
    [[nodiscard]] relay_event::EventBus& bus() { return m_bus; }
    [[nodiscard]] relay_exec::Executor& executor() { return m_executor; }
    [[nodiscard]] relay_net::SessionManager& sessions() { return m_sessions; }

private:
    /// Register the module table
    void register_modules();

    /// Route `/<instance>/<script>` peers to accept_peer
    void on_peer(std::shared_ptr<relay_net::BeastPeerTransport> peer, const std::string& target);

    HostConfig m_config;
    std::shared_ptr<ScriptCatalog> m_catalog;
    relay_kernel::CapabilityRegistry m_registry;
    relay_store::ScopedStore m_store;
    relay_event::EventBus m_bus;
    relay_exec::Executor m_executor;
    relay_net::SessionManager m_sessions;
    std::shared_ptr<relay_net::PeerListener> m_listener;

    mutable std::shared_mutex m_mutex;
    std::map<std::string, std::unique_ptr<Instance>> m_instances;

    std::atomic<int> m_bot_log_level;
    std::atomic<bool> m_stopped{false};
};

} // namespace relay_host
