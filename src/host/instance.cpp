/// @file instance.cpp
/// @brief Instance lifecycle and script loading

#include <relay/host/instance.hpp>
#include <relay/host/host.hpp>

namespace relay_host {

using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Ok;
using relay_core::Result;
using relay_core::Value;
using relay_kernel::ContextId;

namespace {

constexpr int kMaxLogLevel = 11;

Value script_payload(const std::string& script) {
    Value payload = Value::object();
    payload["script"] = script;
    return payload;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

Instance::Instance(Host& host, InstanceConfig config, std::shared_ptr<relay_exec::ExecutionQueue> queue)
    : m_host(host)
    , m_config(std::move(config))
    , m_queue(std::move(queue))
    , m_logger(relay_core::script_logger(m_config.id))
    , m_log_level(m_config.log_level)
{
    relay_core::pin_logger_level(*m_logger, relay_core::level_from_verbosity(m_config.log_level));
}

Instance::~Instance() {
    stop();
}

Result<std::unique_ptr<Instance>> Instance::create(Host& host, InstanceConfig config) {
    auto queue = relay_exec::ExecutionQueue::create(host.executor(), config.id);
    if (!queue) {
        relay_core::host_logger()->critical("Cannot create execution queue for instance '{}': {}",
            config.id, queue.error().message());
        return Err<std::unique_ptr<Instance>>(queue.error());
    }

    auto instance = std::make_unique<Instance>(host, std::move(config), queue.value());
    if (auto attached = host.bus().attach_instance(instance->id(), instance->queue()); !attached) {
        return Err<std::unique_ptr<Instance>>(attached.error());
    }
    instance->m_running = true;

    relay_core::host_logger()->info("Instance '{}' ({}) running", instance->id(), instance->backend());
    return instance;
}

// =============================================================================
// Lifecycle
// =============================================================================

std::size_t Instance::start() {
    std::size_t loaded = 0;
    for (const auto& name : m_config.scripts) {
        auto result = load_script(name);
        if (!result) {
            relay_core::host_logger()->error("Instance '{}': script '{}' failed to load: {}",
                id(), name, relay_core::build_error_chain(result.error()));
            continue;
        }
        ++loaded;
    }
    return loaded;
}

void Instance::stop() {
    if (!m_running.exchange(false)) {
        return;
    }

    std::map<std::string, LoadedScript> scripts;
    {
        std::lock_guard lock(m_mutex);
        scripts.swap(m_scripts);
    }
    for (auto& [name, loaded] : scripts) {
        post_unload(std::move(loaded));
    }

    if (auto flushed = m_queue->flush(); !flushed) {
        relay_core::host_logger()->warn("Instance '{}' did not drain before stopping: {}",
            id(), flushed.error().message());
    }

    m_host.bus().detach_instance(id());
    m_queue->close();
    relay_core::host_logger()->info("Instance '{}' stopped", id());
}

// =============================================================================
// Scripts
// =============================================================================

Result<ContextId> Instance::load_script(const std::string& name) {
    return load_script(name, m_config.config_for(name));
}

Result<ContextId> Instance::load_script(const std::string& name, const Value& config) {
    if (!m_running.load()) {
        return Err<ContextId>(Error(ErrorCode::InvalidState, "Instance '" + id() + "' is not running"));
    }
    if (is_loaded(name)) {
        return Err<ContextId>(Error(ErrorCode::AlreadyExists,
            "Script '" + name + "' is already loaded on instance '" + id() + "'"));
    }

    auto script = m_host.catalog().create(name);
    if (!script) {
        return Err<ContextId>(Error(ErrorCode::NotFound, "Unknown script '" + name + "'"));
    }

    const auto& manifest = script->manifest();
    if (auto valid = manifest.validate(); !valid) {
        return Err<ContextId>(valid.error().with_context("script", name));
    }
    if (auto backend = manifest.check_backend(m_config.backend); !backend) {
        return Err<ContextId>(backend.error().with_context("script", name));
    }

    auto privileges = m_host.config().privileges.for_script(name);
    if (auto allowed = m_host.registry().check_required(name, manifest, privileges); !allowed) {
        return Err<ContextId>(allowed.error());
    }

    LoadedScript loaded{script, m_host.registry().create_context(name, id(), manifest, privileges)};
    {
        std::lock_guard lock(m_mutex);
        if (!m_scripts.emplace(name, loaded).second) {
            return Err<ContextId>(Error(ErrorCode::AlreadyExists,
                "Script '" + name + "' is already loaded on instance '" + id() + "'"));
        }
    }

    if (auto ran = run_setup(loaded, manifest.apply_defaults(config)); !ran) {
        {
            std::lock_guard lock(m_mutex);
            m_scripts.erase(name);
        }
        teardown(*loaded.context);
        return Err<ContextId>(ran.error());
    }

    auto context_id = loaded.context->id();
    if (auto emitted = m_host.bus().emit_to(id(), context_id, relay_event::events::kLoad, script_payload(name)); !emitted) {
        relay_core::host_logger()->warn("Instance '{}': load event for '{}' not delivered: {}",
            id(), name, emitted.error().message());
    }

    relay_core::host_logger()->info("Instance '{}': loaded script '{}' {} (context {})",
        id(), name, manifest.version, context_id.value);
    return context_id;
}

Result<void> Instance::run_setup(const LoadedScript& loaded, const Value& config) {
    auto setup = [loaded, config]() -> Result<void> {
        try {
            loaded.script->setup(*loaded.context, config);
            return Ok();
        } catch (const std::exception& e) {
            return Err(Error(ErrorCode::InvalidState,
                "Setup of '" + loaded.context->script() + "' threw: " + e.what()));
        } catch (...) {
            return Err(Error(ErrorCode::InvalidState,
                "Setup of '" + loaded.context->script() + "' threw an unknown exception"));
        }
    };

    if (m_queue->running_in_this_thread()) {
        return setup();
    }

    auto outcome = std::make_shared<Result<void>>(Err(Error(ErrorCode::Timeout, "Setup did not run")));
    if (!m_queue->post([outcome, setup]() { *outcome = setup(); })) {
        return Err(Error(ErrorCode::InvalidState, "Instance '" + id() + "' queue is closed"));
    }
    if (auto flushed = m_queue->flush(); !flushed) {
        return flushed;
    }
    return *outcome;
}

Result<void> Instance::unload_script(const std::string& name) {
    LoadedScript loaded;
    {
        std::lock_guard lock(m_mutex);
        auto it = m_scripts.find(name);
        if (it == m_scripts.end()) {
            return Err(Error(ErrorCode::NotFound,
                "Script '" + name + "' is not loaded on instance '" + id() + "'"));
        }
        loaded = std::move(it->second);
        m_scripts.erase(it);
    }

    post_unload(std::move(loaded));
    relay_core::host_logger()->info("Instance '{}': unloading script '{}'", id(), name);
    return Ok();
}

Result<void> Instance::reload() {
    if (!m_running.load()) {
        return Err(Error(ErrorCode::InvalidState, "Instance '" + id() + "' is not running"));
    }

    std::map<std::string, LoadedScript> scripts;
    {
        std::lock_guard lock(m_mutex);
        scripts.swap(m_scripts);
    }
    for (auto& [name, loaded] : scripts) {
        post_unload(std::move(loaded));
    }

    // Runs after every unload delivery and teardown posted above
    auto posted = m_queue->post([this]() {
        auto loaded = start();
        relay_core::host_logger()->info("Instance '{}' reloaded {} scripts", id(), loaded);
    });
    if (!posted) {
        return Err(Error(ErrorCode::InvalidState, "Instance '" + id() + "' queue is closed"));
    }
    return Ok();
}

bool Instance::is_loaded(const std::string& name) const {
    std::lock_guard lock(m_mutex);
    return m_scripts.count(name) > 0;
}

std::vector<std::string> Instance::loaded_scripts() const {
    std::lock_guard lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_scripts.size());
    for (const auto& [name, loaded] : m_scripts) {
        names.push_back(name);
    }
    return names;
}

std::shared_ptr<relay_kernel::ScriptContext> Instance::context(const std::string& name) const {
    std::lock_guard lock(m_mutex);
    auto it = m_scripts.find(name);
    return it != m_scripts.end() ? it->second.context : nullptr;
}

Result<void> Instance::flush(std::chrono::milliseconds timeout) {
    return m_queue->flush(timeout);
}

// =============================================================================
// Unload
// =============================================================================

void Instance::post_unload(LoadedScript loaded) {
    auto context_id = loaded.context->id();
    auto name = loaded.context->script();

    if (auto emitted = m_host.bus().emit_to(id(), context_id, relay_event::events::kUnload, script_payload(name)); !emitted) {
        relay_core::host_logger()->debug("Instance '{}': unload event for '{}' not delivered: {}",
            id(), name, emitted.error().message());
    }

    auto context = loaded.context;
    if (!m_queue->post([this, loaded = std::move(loaded)]() { teardown(*loaded.context); })) {
        teardown(*context);
    }
}

void Instance::teardown(relay_kernel::ScriptContext& context) {
    context.deactivate();
    m_host.bus().remove_context(context.id());
    m_host.sessions().close_all(context.id());
    relay_core::host_logger()->debug("Instance '{}': released script '{}' (context {})",
        id(), context.script(), context.id().value);
}

// =============================================================================
// Backend Adapter / Logging
// =============================================================================

Result<void> Instance::dispatch_backend_event(const std::string& name, Value payload) {
    return m_host.bus().emit_host(id(), name, std::move(payload));
}

bool Instance::set_log_level(int level) {
    if (level < 0 || level > kMaxLogLevel) {
        return false;
    }
    m_log_level = level;
    relay_core::pin_logger_level(*m_logger, relay_core::level_from_verbosity(level));
    return true;
}

} // namespace relay_host
