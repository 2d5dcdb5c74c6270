/// @file modules.cpp
/// @brief Script-facing module handles

#include <relay/host/modules.hpp>
#include <relay/host/host.hpp>
#include <relay/host/instance.hpp>
#include <relay/net/codec.hpp>

#include <charconv>
#include <mutex>
#include <vector>

namespace relay_host {

using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Ok;
using relay_core::Result;
using relay_core::ValidationError;
using relay_core::Value;
using relay_store::Scope;

// =============================================================================
// EngineModule
// =============================================================================

EngineModule::EngineModule(Host& host, Instance& instance, const ScriptContext& context)
    : m_host(host)
    , m_instance(instance)
    , m_script(context.script())
{
}

const std::string& EngineModule::instance_id() const {
    return m_instance.id();
}

const std::string& EngineModule::bot_id() const {
    return m_host.config().bot_id;
}

const std::string& EngineModule::backend() const {
    return m_instance.backend();
}

bool EngineModule::set_instance_log_level(int level) {
    return m_instance.set_log_level(level);
}

int EngineModule::instance_log_level() const {
    return m_instance.log_level();
}

bool EngineModule::set_bot_log_level(int level) {
    return m_host.set_bot_log_level(level);
}

int EngineModule::bot_log_level() const {
    return m_host.bot_log_level();
}

void EngineModule::log(const std::string& message) const {
    m_instance.script_logger()->info("[{}] {}", m_script, message);
}

bool EngineModule::reload_scripts() {
    if (!m_host.config().allow_reload) {
        return false;
    }
    auto reloaded = m_instance.reload();
    if (!reloaded) {
        relay_core::host_logger()->warn("Reload of instance '{}' requested by '{}' failed: {}",
            m_instance.id(), m_script, reloaded.error().message());
        return false;
    }
    return true;
}

// =============================================================================
// StoreModule
// =============================================================================

StoreModule::StoreModule(relay_store::ScopedStore& store, const ScriptContext& context)
    : m_store(store)
    , m_script_owner(context.script())
    , m_instance_owner(context.owner_key())
{
}

Result<void> StoreModule::set(const std::string& key, Value value) {
    return m_store.set(Scope::Script, m_script_owner, key, std::move(value));
}

std::optional<Value> StoreModule::get(const std::string& key) const {
    return m_store.get(Scope::Script, m_script_owner, key);
}

Result<void> StoreModule::unset(const std::string& key) {
    return m_store.unset(Scope::Script, m_script_owner, key);
}

std::vector<std::string> StoreModule::keys() const {
    return m_store.keys(Scope::Script, m_script_owner);
}

Value StoreModule::all() const {
    return m_store.all(Scope::Script, m_script_owner);
}

Result<void> StoreModule::set_global(const std::string& key, Value value) {
    return m_store.set(Scope::Global, {}, key, std::move(value));
}

std::optional<Value> StoreModule::get_global(const std::string& key) const {
    return m_store.get(Scope::Global, {}, key);
}

Result<void> StoreModule::unset_global(const std::string& key) {
    return m_store.unset(Scope::Global, {}, key);
}

std::vector<std::string> StoreModule::keys_global() const {
    return m_store.keys(Scope::Global, {});
}

Value StoreModule::all_global() const {
    return m_store.all(Scope::Global, {});
}

Result<void> StoreModule::set_instance(const std::string& key, Value value) {
    return m_store.set(Scope::Instance, m_instance_owner, key, std::move(value));
}

std::optional<Value> StoreModule::get_instance(const std::string& key) const {
    return m_store.get(Scope::Instance, m_instance_owner, key);
}

Result<void> StoreModule::unset_instance(const std::string& key) {
    return m_store.unset(Scope::Instance, m_instance_owner, key);
}

std::vector<std::string> StoreModule::keys_instance() const {
    return m_store.keys(Scope::Instance, m_instance_owner);
}

Value StoreModule::all_instance() const {
    return m_store.all(Scope::Instance, m_instance_owner);
}

// =============================================================================
// EventModule
// =============================================================================

EventModule::EventModule(relay_event::EventBus& bus, const ScriptContext& context)
    : m_bus(bus)
    , m_context(context)
{
}

Result<relay_event::SubscriptionId> EventModule::on(const std::string& name, relay_event::EventCallback callback) {
    return m_bus.on(m_context, name, std::move(callback));
}

Result<void> EventModule::emit(const std::string& name, Value payload) {
    return m_bus.emit(m_context, name, std::move(payload));
}

Result<void> EventModule::broadcast(const std::string& name, Value payload) {
    return m_bus.broadcast(m_context, name, std::move(payload));
}

// =============================================================================
// NetClient / NetModule
// =============================================================================

struct NetClient::Listeners {
    Listeners(relay_event::EventBus& event_bus, std::string instance)
        : bus(event_bus), instance_id(std::move(instance)) {}

    /// Unsubscribe everything; later on() calls are refused
    void release() {
        std::vector<relay_event::SubscriptionId> dropped;
        {
            std::lock_guard lock(mutex);
            if (released) {
                return;
            }
            released = true;
            dropped.swap(ids);
        }
        for (auto id : dropped) {
            bus.off(instance_id, id);
        }
    }

    /// Release after the current dispatch so the script's own close/error
    /// callbacks in that dispatch still run
    static void release_later(const std::shared_ptr<Listeners>& self) {
        auto queue = self->bus.queue(self->instance_id);
        if (!queue || !queue->post([self] { self->release(); })) {
            self->release();
        }
    }

    relay_event::EventBus& bus;
    std::string instance_id;
    std::mutex mutex;
    std::vector<relay_event::SubscriptionId> ids;
    bool watching = false;
    bool released = false;
};

NetClient::NetClient(relay_net::SessionManager& sessions, const ScriptContext& context,
                     relay_net::ConnectionId id, std::shared_ptr<Listeners> listeners)
    : m_sessions(sessions)
    , m_context(context)
    , m_id(id)
    , m_listeners(std::move(listeners))
{
}

Result<void> NetClient::write(relay_core::Bytes data) {
    return m_sessions.write(m_id, std::move(data));
}

Result<void> NetClient::write(const std::string& text, const std::string& format) {
    auto decoded = relay_net::decode_text(text, format);
    if (!decoded) {
        return Err(decoded.error());
    }
    return m_sessions.write(m_id, std::move(decoded).value());
}

Result<relay_event::SubscriptionId> NetClient::on(const std::string& event, ConnectionEventCallback callback) {
    const char* name = nullptr;
    if (event == "data") {
        name = relay_event::events::kNetData;
    } else if (event == "close") {
        name = relay_event::events::kNetClose;
    } else if (event == "error") {
        name = relay_event::events::kNetError;
    } else {
        return Err<relay_event::SubscriptionId>(ValidationError::invalid_params(
            "event", "expected \"data\", \"close\" or \"error\", got '" + event + "'"));
    }

    auto& bus = m_listeners->bus;
    auto id = m_id.to_string();

    std::lock_guard lock(m_listeners->mutex);
    if (m_listeners->released) {
        return Err<relay_event::SubscriptionId>(relay_core::ConnectionError::closed(id));
    }

    auto subscribed = bus.on(m_context, name, [id, callback = std::move(callback)](const relay_event::Event& e) {
        if (e.payload.is_object() && e.payload.value("id", std::string()) == id) {
            callback(e.payload);
        }
    });
    if (!subscribed) {
        return subscribed;
    }
    m_listeners->ids.push_back(subscribed.value());

    if (!m_listeners->watching) {
        // The connection's own end releases every listener above
        m_listeners->watching = true;
        auto watcher = [id, listeners = m_listeners](const relay_event::Event& e) {
            if (e.payload.is_object() && e.payload.value("id", std::string()) == id) {
                Listeners::release_later(listeners);
            }
        };
        for (const char* terminal : {relay_event::events::kNetClose, relay_event::events::kNetError}) {
            auto watched = bus.on(m_context, terminal, watcher);
            if (!watched) {
                return Err<relay_event::SubscriptionId>(watched.error());
            }
            m_listeners->ids.push_back(watched.value());
        }
    }

    return subscribed;
}

Result<void> NetClient::close() {
    m_listeners->release();
    return m_sessions.close(m_id);
}

NetModule::NetModule(relay_net::SessionManager& sessions, relay_event::EventBus& bus, const ScriptContext& context)
    : m_sessions(sessions)
    , m_bus(bus)
    , m_context(context)
{
}

Result<std::shared_ptr<NetClient>> NetModule::connect(const Value& params, relay_net::OpenCallback on_open) {
    auto parsed = relay_net::ConnectParams::from_json(params);
    if (!parsed) {
        return Err<std::shared_ptr<NetClient>>(parsed.error());
    }

    auto listeners = std::make_shared<NetClient::Listeners>(m_bus, m_context.instance_id());
    auto id = m_sessions.open_socket(m_context, parsed.value(),
        [listeners, on_open = std::move(on_open)](const Error* error) {
            if (error) {
                listeners->release();
            }
            if (on_open) {
                on_open(error);
            }
        });
    if (!id) {
        return Err<std::shared_ptr<NetClient>>(id.error());
    }
    return std::make_shared<NetClient>(m_sessions, m_context, id.value(), std::move(listeners));
}

// =============================================================================
// WsModule
// =============================================================================

WsModule::WsModule(relay_net::SessionManager& sessions, const ScriptContext& context)
    : m_sessions(sessions)
    , m_context(context)
{
}

Result<relay_net::ConnectionId> WsModule::owned(const std::string& id) const {
    std::uint64_t raw = 0;
    auto [end, ec] = std::from_chars(id.data(), id.data() + id.size(), raw);
    if (ec != std::errc() || end != id.data() + id.size() || raw == 0) {
        return Err<relay_net::ConnectionId>(ValidationError::invalid_params("id", "not a connection id: '" + id + "'"));
    }

    relay_net::ConnectionId conn{raw};
    auto owner = m_sessions.owner_of(conn);
    if (!owner || *owner != m_context.id()) {
        return Err<relay_net::ConnectionId>(Error(ErrorCode::NotFound,
            "No websocket peer " + id + " for script '" + m_context.script() + "'"));
    }
    return conn;
}

Result<void> WsModule::write(const std::string& id, relay_net::PeerMessageType type, relay_core::Bytes data) {
    auto conn = owned(id);
    if (!conn) {
        return Err(conn.error());
    }
    return m_sessions.write(conn.value(), std::move(data), type);
}

std::size_t WsModule::broadcast(relay_net::PeerMessageType type, const relay_core::Bytes& data) {
    return m_sessions.broadcast_peers(m_context.id(), type, data);
}

Result<void> WsModule::close(const std::string& id) {
    auto conn = owned(id);
    if (!conn) {
        // Already gone counts as closed
        return conn.error().code() == ErrorCode::NotFound ? Ok() : Err(conn.error());
    }
    return m_sessions.close(conn.value());
}

// =============================================================================
// DbConnection / DbModule
// =============================================================================

Result<void> DbConnection::query(std::string sql, Value params, relay_net::QueryCallback callback) {
    return m_sessions.query(m_id, std::move(sql), std::move(params), std::move(callback));
}

Result<void> DbConnection::exec(std::string sql, Value params, relay_net::ExecCallback callback) {
    return m_sessions.exec(m_id, std::move(sql), std::move(params), std::move(callback));
}

Result<void> DbConnection::close() {
    return m_sessions.close(m_id);
}

DbModule::DbModule(relay_net::SessionManager& sessions, const ScriptContext& context)
    : m_sessions(sessions)
    , m_context(context)
{
}

Result<std::shared_ptr<DbConnection>> DbModule::connect(const Value& params, relay_net::OpenCallback on_open) {
    auto parsed = relay_net::DbParams::from_json(params);
    if (!parsed) {
        return Err<std::shared_ptr<DbConnection>>(parsed.error());
    }

    auto id = m_sessions.open_database(m_context, parsed.value(), std::move(on_open));
    if (!id) {
        return Err<std::shared_ptr<DbConnection>>(id.error());
    }
    return std::make_shared<DbConnection>(m_sessions, id.value());
}

} // namespace relay_host
