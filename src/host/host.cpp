/// @file host.cpp
/// @brief Host construction, module table and shutdown

#include <relay/host/host.hpp>
#include <relay/core/log.hpp>
#include <relay/store/backend.hpp>

#include <mutex>

namespace relay_host {

using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Ok;
using relay_core::Result;
using relay_core::Value;
using relay_kernel::IModule;
using relay_kernel::ModuleKind;
using relay_kernel::ScriptContext;

namespace {

constexpr int kMaxLogLevel = 11;

std::shared_ptr<relay_store::IStoreBackend> make_backend(const HostConfig& config) {
    if (config.store_backend == "file") {
        return std::make_shared<relay_store::JsonFileBackend>(config.store_path);
    }
    return std::make_shared<relay_store::MemoryBackend>();
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

Host::Host(HostConfig config,
           std::shared_ptr<ScriptCatalog> catalog,
           std::shared_ptr<relay_store::IStoreBackend> backend)
    : m_config(std::move(config))
    , m_catalog(catalog ? std::move(catalog) : std::make_shared<ScriptCatalog>())
    , m_store(backend ? std::move(backend) : make_backend(m_config))
    , m_executor(m_config.exec_workers)
    , m_sessions(m_bus, m_config.net)
    , m_bot_log_level(relay_core::verbosity_from_level(m_config.log.level))
{
    register_modules();
}

Host::~Host() {
    shutdown();
}

Result<std::unique_ptr<Host>> Host::create(HostConfig config,
                                           std::shared_ptr<ScriptCatalog> catalog,
                                           std::shared_ptr<relay_store::IStoreBackend> backend) {
    auto host = std::make_unique<Host>(std::move(config), std::move(catalog), std::move(backend));

    if (auto loaded = host->m_store.load(); !loaded) {
        relay_core::host_logger()->error("Cannot load store from '{}' backend: {}",
            host->m_store.backend().name(), loaded.error().message());
        return Err<std::unique_ptr<Host>>(loaded.error());
    }

    relay_core::host_logger()->info("Host '{}' ready: {} workers, {} I/O threads, {} store",
        host->m_config.bot_id, host->m_executor.worker_count(), host->m_config.net.io_threads,
        host->m_store.backend().name());
    return host;
}

void Host::register_modules() {
    auto add = [this](ModuleKind kind, bool privileged, relay_kernel::ModuleFactory factory) {
        if (auto r = m_registry.register_module(relay_kernel::to_string(kind), kind, privileged, std::move(factory)); !r) {
            relay_core::host_logger()->error("Module table: {}", r.error().message());
        }
    };

    add(ModuleKind::Engine, false, [this](ScriptContext& ctx) -> std::shared_ptr<IModule> {
        auto* inst = instance(ctx.instance_id());
        if (!inst) {
            return nullptr;
        }
        return std::make_shared<EngineModule>(*this, *inst, ctx);
    });
    add(ModuleKind::Store, false, [this](ScriptContext& ctx) -> std::shared_ptr<IModule> {
        return std::make_shared<StoreModule>(m_store, ctx);
    });
    add(ModuleKind::Event, false, [this](ScriptContext& ctx) -> std::shared_ptr<IModule> {
        return std::make_shared<EventModule>(m_bus, ctx);
    });
    add(ModuleKind::Backend, false, [this](ScriptContext& ctx) -> std::shared_ptr<IModule> {
        auto* inst = instance(ctx.instance_id());
        if (!inst) {
            return nullptr;
        }
        return std::make_shared<BackendModule>(inst->backend(), inst->id(), m_config.bot_id);
    });
    add(ModuleKind::Net, true, [this](ScriptContext& ctx) -> std::shared_ptr<IModule> {
        return std::make_shared<NetModule>(m_sessions, m_bus, ctx);
    });
    add(ModuleKind::Ws, true, [this](ScriptContext& ctx) -> std::shared_ptr<IModule> {
        return std::make_shared<WsModule>(m_sessions, ctx);
    });
    add(ModuleKind::Db, true, [this](ScriptContext& ctx) -> std::shared_ptr<IModule> {
        return std::make_shared<DbModule>(m_sessions, ctx);
    });
}

// =============================================================================
// Lifecycle
// =============================================================================

Result<void> Host::start() {
    for (const auto& instance_config : m_config.instances) {
        auto added = add_instance(instance_config);
        if (!added) {
            relay_core::host_logger()->error("Instance '{}' not started: {}",
                instance_config.id, relay_core::build_error_chain(added.error()));
        }
    }

    if (m_config.web.enabled) {
        m_listener = std::make_shared<relay_net::PeerListener>(m_sessions.io_context(),
            [this](std::shared_ptr<relay_net::BeastPeerTransport> peer, const std::string& target) {
                on_peer(std::move(peer), target);
            });
        if (auto listening = m_listener->listen(m_config.web.address, m_config.web.port); !listening) {
            m_listener.reset();
            return listening;
        }
        m_listener->start();
    }

    return Ok();
}

void Host::shutdown() {
    if (m_stopped.exchange(true)) {
        return;
    }
    relay_core::host_logger()->info("Host '{}' shutting down", m_config.bot_id);

    if (m_listener) {
        m_listener->stop();
    }

    std::map<std::string, std::unique_ptr<Instance>> instances;
    {
        std::unique_lock lock(m_mutex);
        instances.swap(m_instances);
    }
    for (auto& [id, inst] : instances) {
        inst->stop();
    }
    instances.clear();

    m_sessions.shutdown();
    m_listener.reset();
    m_executor.shutdown();
    relay_core::flush_all_loggers();
}

// =============================================================================
// Instances
// =============================================================================

Result<Instance*> Host::add_instance(InstanceConfig config) {
    if (m_stopped.load()) {
        return Err<Instance*>(Error(ErrorCode::InvalidState, "Host is shut down"));
    }
    if (instance(config.id)) {
        return Err<Instance*>(Error(ErrorCode::AlreadyExists, "Instance '" + config.id + "' already exists"));
    }

    auto created = Instance::create(*this, std::move(config));
    if (!created) {
        return Err<Instance*>(created.error());
    }

    Instance* inst = created.value().get();
    {
        std::unique_lock lock(m_mutex);
        m_instances.emplace(inst->id(), std::move(created).value());
    }

    auto loaded = inst->start();
    relay_core::host_logger()->info("Instance '{}' started with {}/{} scripts",
        inst->id(), loaded, inst->config().scripts.size());
    return inst;
}

Result<void> Host::remove_instance(const std::string& id) {
    std::unique_ptr<Instance> removed;
    {
        std::unique_lock lock(m_mutex);
        auto it = m_instances.find(id);
        if (it == m_instances.end()) {
            return Err(Error(ErrorCode::NotFound, "Unknown instance '" + id + "'"));
        }
        removed = std::move(it->second);
        m_instances.erase(it);
    }
    removed->stop();
    return Ok();
}

Instance* Host::instance(const std::string& id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_instances.find(id);
    return it != m_instances.end() ? it->second.get() : nullptr;
}

std::vector<std::string> Host::instance_ids() const {
    std::shared_lock lock(m_mutex);
    std::vector<std::string> ids;
    ids.reserve(m_instances.size());
    for (const auto& [id, inst] : m_instances) {
        ids.push_back(id);
    }
    return ids;
}

// =============================================================================
// External Adapters
// =============================================================================

Result<relay_net::ConnectionId> Host::accept_peer(const std::string& instance_id,
                                                  const std::string& script,
                                                  std::shared_ptr<relay_net::IPeerTransport> transport) {
    auto* inst = instance(instance_id);
    if (!inst) {
        return Err<relay_net::ConnectionId>(Error(ErrorCode::NotFound, "Unknown instance '" + instance_id + "'"));
    }
    auto context = inst->context(script);
    if (!context) {
        return Err<relay_net::ConnectionId>(Error(ErrorCode::NotFound,
            "Script '" + script + "' is not loaded on instance '" + instance_id + "'"));
    }
    return m_sessions.attach_peer(*context, std::move(transport));
}

void Host::on_peer(std::shared_ptr<relay_net::BeastPeerTransport> peer, const std::string& target) {
    // Target is /<instance>/<script>
    auto first = target.find('/', 1);
    if (target.size() < 4 || target[0] != '/' || first == std::string::npos || first + 1 >= target.size()) {
        relay_core::net_logger()->warn("Rejected websocket peer {}: bad path '{}'", peer->remote_endpoint(), target);
        peer->close();
        return;
    }
    auto instance_id = target.substr(1, first - 1);
    auto script = target.substr(first + 1);

    auto* inst = instance(instance_id);
    auto context = inst ? inst->context(script) : nullptr;
    if (!context || !context->manifest().enable_web) {
        relay_core::net_logger()->warn("Rejected websocket peer {}: no web-enabled script at '{}'",
            peer->remote_endpoint(), target);
        peer->close();
        return;
    }

    auto attached = accept_peer(instance_id, script, peer);
    if (!attached) {
        relay_core::net_logger()->warn("Rejected websocket peer {}: {}", peer->remote_endpoint(),
            attached.error().message());
        peer->close();
        return;
    }
    peer->start(m_sessions, attached.value());
}

void Host::broadcast_backend_event(const std::string& name, Value payload) {
    m_bus.broadcast_host(name, std::move(payload));
}

std::uint16_t Host::web_port() const {
    return m_listener ? m_listener->port() : 0;
}

// =============================================================================
// Bot Log Level
// =============================================================================

bool Host::set_bot_log_level(int level) {
    if (level < 0 || level > kMaxLogLevel) {
        return false;
    }
    m_bot_log_level = level;
    relay_core::set_global_log_level(relay_core::level_from_verbosity(level));
    return true;
}

} // namespace relay_host
