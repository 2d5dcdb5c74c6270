/// @file modules.hpp
/// @brief Module handles handed to scripts
///
/// One handle class per module kind. The registry resolves a handle once
/// per context; scripts then call typed methods on it. A handle keeps a
/// reference to its ScriptContext and must not outlive the script.

#pragma once

#include <relay/core/error.hpp>
#include <relay/core/value.hpp>
#include <relay/event/event_bus.hpp>
#include <relay/kernel/capability_registry.hpp>
#include <relay/net/session_manager.hpp>
#include <relay/store/scoped_store.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relay_host {

class Host;
class Instance;

using relay_kernel::IModule;
using relay_kernel::ModuleKind;
using relay_kernel::ScriptContext;

// =============================================================================
// engine
// =============================================================================

class EngineModule : public IModule {
public:
    static constexpr ModuleKind kKind = ModuleKind::Engine;

    EngineModule(Host& host, Instance& instance, const ScriptContext& context);

    ModuleKind kind() const override { return kKind; }

    [[nodiscard]] const std::string& instance_id() const;
    [[nodiscard]] const std::string& bot_id() const;
    [[nodiscard]] const std::string& backend() const;

    /// @return false if the level is outside 0..11
    bool set_instance_log_level(int level);
    [[nodiscard]] int instance_log_level() const;

    /// @return false if the level is outside 0..11
    bool set_bot_log_level(int level);
    [[nodiscard]] int bot_log_level() const;

    /// Write to the instance's script log
    void log(const std::string& message) const;

    /// Unload and load every script of the instance again
    /// @return false when reloading is disabled
    bool reload_scripts();

private:
    Host& m_host;
    Instance& m_instance;
    std::string m_script;
};

// =============================================================================
// store
// =============================================================================

class StoreModule : public IModule {
public:
    static constexpr ModuleKind kKind = ModuleKind::Store;

    StoreModule(relay_store::ScopedStore& store, const ScriptContext& context);

    ModuleKind kind() const override { return kKind; }

    // Script scope
    [[nodiscard]] relay_core::Result<void> set(const std::string& key, relay_core::Value value);
    [[nodiscard]] std::optional<relay_core::Value> get(const std::string& key) const;
    [[nodiscard]] relay_core::Result<void> unset(const std::string& key);
    [[nodiscard]] std::vector<std::string> keys() const;
    [[nodiscard]] relay_core::Value all() const;

    // Global scope
    [[nodiscard]] relay_core::Result<void> set_global(const std::string& key, relay_core::Value value);
    [[nodiscard]] std::optional<relay_core::Value> get_global(const std::string& key) const;
    [[nodiscard]] relay_core::Result<void> unset_global(const std::string& key);
    [[nodiscard]] std::vector<std::string> keys_global() const;
    [[nodiscard]] relay_core::Value all_global() const;

    // Instance scope
    [[nodiscard]] relay_core::Result<void> set_instance(const std::string& key, relay_core::Value value);
    [[nodiscard]] std::optional<relay_core::Value> get_instance(const std::string& key) const;
    [[nodiscard]] relay_core::Result<void> unset_instance(const std::string& key);
    [[nodiscard]] std::vector<std::string> keys_instance() const;
    [[nodiscard]] relay_core::Value all_instance() const;

private:
    relay_store::ScopedStore& m_store;
    std::string m_script_owner;
    std::string m_instance_owner;
};

// =============================================================================
// event
// =============================================================================

class EventModule : public IModule {
public:
    static constexpr ModuleKind kKind = ModuleKind::Event;

    EventModule(relay_event::EventBus& bus, const ScriptContext& context);

    ModuleKind kind() const override { return kKind; }

    [[nodiscard]] relay_core::Result<relay_event::SubscriptionId> on(const std::string& name,
                                                                     relay_event::EventCallback callback);
    [[nodiscard]] relay_core::Result<void> emit(const std::string& name, relay_core::Value payload = {});
    [[nodiscard]] relay_core::Result<void> broadcast(const std::string& name, relay_core::Value payload = {});

private:
    relay_event::EventBus& m_bus;
    const ScriptContext& m_context;
};

// =============================================================================
// backend
// =============================================================================

class BackendModule : public IModule {
public:
    static constexpr ModuleKind kKind = ModuleKind::Backend;

    BackendModule(std::string backend, std::string instance_id, std::string bot_id)
        : m_backend(std::move(backend)), m_instance_id(std::move(instance_id)), m_bot_id(std::move(bot_id)) {}

    ModuleKind kind() const override { return kKind; }

    /// Backend kind of the instance ("ts3", "discord", ...)
    [[nodiscard]] const std::string& backend_kind() const { return m_backend; }
    [[nodiscard]] const std::string& instance_id() const { return m_instance_id; }
    [[nodiscard]] const std::string& bot_id() const { return m_bot_id; }

private:
    std::string m_backend;
    std::string m_instance_id;
    std::string m_bot_id;
};

// =============================================================================
// net
// =============================================================================

/// Payload of a net.data / net.close / net.error event
using ConnectionEventCallback = std::function<void(const relay_core::Value& payload)>;

/// Script-side handle of one stream socket.
/// Subscriptions made through on() last until the connection closes, errors,
/// fails to open or is closed by the script, whichever comes first.
class NetClient {
public:
    /// Bus subscriptions owned by one connection
    struct Listeners;

    NetClient(relay_net::SessionManager& sessions, const ScriptContext& context,
              relay_net::ConnectionId id, std::shared_ptr<Listeners> listeners);

    /// Connection id as scripts see it
    [[nodiscard]] std::string id() const { return m_id.to_string(); }
    [[nodiscard]] relay_net::ConnectionId connection_id() const { return m_id; }

    [[nodiscard]] relay_core::Result<void> write(relay_core::Bytes data);

    /// Write text decoded as "" (raw), "hex" or "base64"
    [[nodiscard]] relay_core::Result<void> write(const std::string& text, const std::string& format);

    /// Subscribe to "data", "close" or "error" of this connection only
    [[nodiscard]] relay_core::Result<relay_event::SubscriptionId> on(const std::string& event,
                                                                     ConnectionEventCallback callback);

    /// Close the socket and drop this client's subscriptions
    relay_core::Result<void> close();

private:
    relay_net::SessionManager& m_sessions;
    const ScriptContext& m_context;
    relay_net::ConnectionId m_id;
    std::shared_ptr<Listeners> m_listeners;
};

class NetModule : public IModule {
public:
    static constexpr ModuleKind kKind = ModuleKind::Net;

    NetModule(relay_net::SessionManager& sessions, relay_event::EventBus& bus, const ScriptContext& context);

    ModuleKind kind() const override { return kKind; }

    /// Open a TCP connection; on_open runs once with null or the failure
    [[nodiscard]] relay_core::Result<std::shared_ptr<NetClient>> connect(const relay_core::Value& params,
                                                                         relay_net::OpenCallback on_open);

private:
    relay_net::SessionManager& m_sessions;
    relay_event::EventBus& m_bus;
    const ScriptContext& m_context;
};

// =============================================================================
// ws
// =============================================================================

class WsModule : public IModule {
public:
    static constexpr ModuleKind kKind = ModuleKind::Ws;

    WsModule(relay_net::SessionManager& sessions, const ScriptContext& context);

    ModuleKind kind() const override { return kKind; }

    /// Send to one peer owned by this script
    [[nodiscard]] relay_core::Result<void> write(const std::string& id, relay_net::PeerMessageType type,
                                                 relay_core::Bytes data);

    /// Send to every peer owned by this script
    /// @return number of peers written to
    std::size_t broadcast(relay_net::PeerMessageType type, const relay_core::Bytes& data);

    relay_core::Result<void> close(const std::string& id);

private:
    /// Parse an id and check this script owns it
    [[nodiscard]] relay_core::Result<relay_net::ConnectionId> owned(const std::string& id) const;

    relay_net::SessionManager& m_sessions;
    const ScriptContext& m_context;
};

// =============================================================================
// db
// =============================================================================

/// Script-side handle of one database session
class DbConnection {
public:
    DbConnection(relay_net::SessionManager& sessions, relay_net::ConnectionId id)
        : m_sessions(sessions), m_id(id) {}

    [[nodiscard]] std::string id() const { return m_id.to_string(); }

    [[nodiscard]] relay_core::Result<void> query(std::string sql, relay_core::Value params,
                                                 relay_net::QueryCallback callback);
    [[nodiscard]] relay_core::Result<void> exec(std::string sql, relay_core::Value params,
                                                relay_net::ExecCallback callback);
    relay_core::Result<void> close();

private:
    relay_net::SessionManager& m_sessions;
    relay_net::ConnectionId m_id;
};

class DbModule : public IModule {
public:
    static constexpr ModuleKind kKind = ModuleKind::Db;

    DbModule(relay_net::SessionManager& sessions, const ScriptContext& context);

    ModuleKind kind() const override { return kKind; }

    /// Open a database session; on_open runs once with null or the failure
    [[nodiscard]] relay_core::Result<std::shared_ptr<DbConnection>> connect(const relay_core::Value& params,
                                                                            relay_net::OpenCallback on_open);

private:
    relay_net::SessionManager& m_sessions;
    const ScriptContext& m_context;
};

} // namespace relay_host
