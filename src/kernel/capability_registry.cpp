/// @file capability_registry.cpp
/// @brief CapabilityRegistry and ScriptContext implementation

#include <relay/kernel/capability_registry.hpp>
#include <relay/core/log.hpp>

namespace relay_kernel {

using relay_core::CapabilityError;
using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Ok;
using relay_core::Result;

// =============================================================================
// ModuleKind
// =============================================================================

const char* to_string(ModuleKind kind) {
    switch (kind) {
        case ModuleKind::Engine: return "engine";
        case ModuleKind::Store: return "store";
        case ModuleKind::Event: return "event";
        case ModuleKind::Backend: return "backend";
        case ModuleKind::Net: return "net";
        case ModuleKind::Ws: return "ws";
        case ModuleKind::Db: return "db";
        default: return "unknown";
    }
}

// =============================================================================
// ScriptContext
// =============================================================================

ScriptContext::ScriptContext(const CapabilityRegistry& registry,
                             ContextId id,
                             std::string script,
                             std::string instance_id,
                             Manifest manifest,
                             PrivilegeSet privileges)
    : m_registry(registry)
    , m_id(id)
    , m_script(std::move(script))
    , m_instance_id(std::move(instance_id))
    , m_manifest(std::move(manifest))
    , m_privileges(std::move(privileges))
{
}

std::string ScriptContext::owner_key() const {
    return m_script + "@" + m_instance_id;
}

Result<std::shared_ptr<IModule>> ScriptContext::require(const std::string& name) {
    return m_registry.resolve(*this, name);
}

void ScriptContext::deactivate() {
    m_active.store(false, std::memory_order_release);

    std::map<std::string, std::shared_ptr<IModule>> released;
    {
        std::lock_guard lock(m_modules_mutex);
        released.swap(m_modules);
    }
    // Handles are destroyed outside the lock
}

std::shared_ptr<IModule> ScriptContext::cached_module(const std::string& name) const {
    std::lock_guard lock(m_modules_mutex);
    auto it = m_modules.find(name);
    return it != m_modules.end() ? it->second : nullptr;
}

std::shared_ptr<IModule> ScriptContext::cache_module(const std::string& name, std::shared_ptr<IModule> module) {
    std::lock_guard lock(m_modules_mutex);
    auto it = m_modules.emplace(name, std::move(module)).first;
    return it->second;
}

std::size_t ScriptContext::cached_count() const {
    std::lock_guard lock(m_modules_mutex);
    return m_modules.size();
}

// =============================================================================
// Registration
// =============================================================================

Result<void> CapabilityRegistry::register_module(const std::string& name,
                                                 ModuleKind kind,
                                                 bool requires_privilege,
                                                 ModuleFactory factory) {
    if (name.empty() || !factory) {
        return Err(Error(ErrorCode::InvalidArgument, "Module registration needs a name and a factory"));
    }

    std::unique_lock lock(m_mutex);
    if (m_modules.count(name) > 0) {
        return Err(Error(ErrorCode::AlreadyExists, "Module already registered: " + name));
    }

    m_modules.emplace(name, ModuleEntry{name, kind, requires_privilege, std::move(factory)});
    relay_core::host_logger()->debug("Registered module '{}'{}", name,
        requires_privilege ? " (privileged)" : "");
    return Ok();
}

bool CapabilityRegistry::has_module(const std::string& name) const {
    std::shared_lock lock(m_mutex);
    return m_modules.count(name) > 0;
}

bool CapabilityRegistry::is_privileged(const std::string& name) const {
    std::shared_lock lock(m_mutex);
    auto it = m_modules.find(name);
    return it != m_modules.end() && it->second.requires_privilege;
}

std::vector<std::string> CapabilityRegistry::module_names() const {
    std::shared_lock lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_modules.size());
    for (const auto& [name, entry] : m_modules) {
        names.push_back(name);
    }
    return names;
}

// =============================================================================
// Capability Checks
// =============================================================================

Result<void> CapabilityRegistry::check_required(const std::string& script,
                                                const Manifest& manifest,
                                                const PrivilegeSet& privileges) const {
    std::shared_lock lock(m_mutex);

    for (const auto& name : manifest.required_modules) {
        auto it = m_modules.find(name);
        if (it == m_modules.end()) {
            return Err(CapabilityError::unknown_module(script, name));
        }
        if (it->second.requires_privilege && !privileges.has(name)) {
            return Err(CapabilityError::declared_not_granted(script, name));
        }
    }

    return Ok();
}

Result<std::shared_ptr<IModule>> CapabilityRegistry::resolve(ScriptContext& context,
                                                             const std::string& name) const {
    using ModulePtr = std::shared_ptr<IModule>;

    if (!context.is_active()) {
        return Err<ModulePtr>(Error(ErrorCode::InvalidState,
            "Script '" + context.script() + "' has been unloaded"));
    }

    if (auto cached = context.cached_module(name)) {
        return cached;
    }

    ModuleFactory factory;
    {
        std::shared_lock lock(m_mutex);
        auto it = m_modules.find(name);
        if (it == m_modules.end()) {
            return Err<ModulePtr>(CapabilityError::unknown_module(context.script(), name));
        }
        if (it->second.requires_privilege && !context.privileges().has(name)) {
            return Err<ModulePtr>(CapabilityError::not_granted(context.script(), name));
        }
        factory = it->second.factory;
    }

    auto module = factory(context);
    if (!module) {
        return Err<ModulePtr>(Error(ErrorCode::InvalidState, "Factory for module '" + name + "' returned nothing"));
    }

    return context.cache_module(name, std::move(module));
}

// =============================================================================
// Contexts
// =============================================================================

std::shared_ptr<ScriptContext> CapabilityRegistry::create_context(const std::string& script,
                                                                  const std::string& instance_id,
                                                                  Manifest manifest,
                                                                  PrivilegeSet privileges) {
    return std::make_shared<ScriptContext>(*this,
                                           ContextId{m_context_ids.next()},
                                           script,
                                           instance_id,
                                           std::move(manifest),
                                           std::move(privileges));
}

} // namespace relay_kernel
