/// @file capability_registry.hpp
/// @brief Module table, privilege gating and script contexts
///
/// Scripts reach every host facility through a module handle resolved
/// here. The registry is the only place where module names are looked up
/// as strings; script code then holds typed handles (see
/// ScriptContext::require).

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "manifest.hpp"
#include "privileges.hpp"

#include <relay/core/error.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace relay_kernel {

// =============================================================================
// IModule
// =============================================================================

/// Base of every script-facing module handle.
///
/// Concrete handles declare `static constexpr ModuleKind kKind` so they can
/// be requested by type.
class IModule {
public:
    virtual ~IModule() = default;

    /// Kind tag of this handle
    [[nodiscard]] virtual ModuleKind kind() const = 0;
};

/// Builds a module handle for one script context
using ModuleFactory = std::function<std::shared_ptr<IModule>(ScriptContext&)>;

// =============================================================================
// ScriptContext
// =============================================================================

/// Runtime identity of one loaded script within one instance
class ScriptContext {
public:
    ScriptContext(const CapabilityRegistry& registry,
                  ContextId id,
                  std::string script,
                  std::string instance_id,
                  Manifest manifest,
                  PrivilegeSet privileges);

    ScriptContext(const ScriptContext&) = delete;
    ScriptContext& operator=(const ScriptContext&) = delete;

    [[nodiscard]] ContextId id() const { return m_id; }
    [[nodiscard]] const std::string& script() const { return m_script; }
    [[nodiscard]] const std::string& instance_id() const { return m_instance_id; }

    /// Owner key of the instance store scope ("script@instance")
    [[nodiscard]] std::string owner_key() const;

    [[nodiscard]] const Manifest& manifest() const { return m_manifest; }
    [[nodiscard]] const PrivilegeSet& privileges() const { return m_privileges; }

    /// Resolve a module by name
    [[nodiscard]] relay_core::Result<std::shared_ptr<IModule>> require(const std::string& name);

    /// Resolve a module by handle type
    template<typename T>
    [[nodiscard]] relay_core::Result<std::shared_ptr<T>> require();

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// False once the context has been torn down
    [[nodiscard]] bool is_active() const { return m_active.load(std::memory_order_acquire); }

    /// Stop resolving modules and drop every cached handle
    void deactivate();

    // =========================================================================
    // Module Cache (used by CapabilityRegistry)
    // =========================================================================

    [[nodiscard]] std::shared_ptr<IModule> cached_module(const std::string& name) const;

    /// Store a handle unless one is cached already; returns the cached one
    std::shared_ptr<IModule> cache_module(const std::string& name, std::shared_ptr<IModule> module);

    [[nodiscard]] std::size_t cached_count() const;

private:
    const CapabilityRegistry& m_registry;
    ContextId m_id;
    std::string m_script;
    std::string m_instance_id;
    Manifest m_manifest;
    PrivilegeSet m_privileges;
    std::atomic<bool> m_active{true};

    mutable std::mutex m_modules_mutex;
    std::map<std::string, std::shared_ptr<IModule>> m_modules;
};

// =============================================================================
// CapabilityRegistry
// =============================================================================

/// Registered module description
struct ModuleEntry {
    std::string name;
    ModuleKind kind;
    bool requires_privilege = false;
    ModuleFactory factory;
};

/// Static table of {name -> {requires_privilege, factory}}
class CapabilityRegistry {
public:
    CapabilityRegistry() = default;

    CapabilityRegistry(const CapabilityRegistry&) = delete;
    CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

    // =========================================================================
    // Registration
    // =========================================================================

    /// Register a module
    /// @return AlreadyExists error if the name is taken
    relay_core::Result<void> register_module(const std::string& name,
                                             ModuleKind kind,
                                             bool requires_privilege,
                                             ModuleFactory factory);

    [[nodiscard]] bool has_module(const std::string& name) const;

    /// True if the module exists and needs a privilege grant
    [[nodiscard]] bool is_privileged(const std::string& name) const;

    /// Registered names in sorted order
    [[nodiscard]] std::vector<std::string> module_names() const;

    // =========================================================================
    // Capability Checks
    // =========================================================================

    /// Load-time check of the manifest's required modules.
    /// Unknown names fail with UnknownModule, privileged modules without a
    /// grant with DeclaredNotGranted.
    [[nodiscard]] relay_core::Result<void> check_required(const std::string& script,
                                                          const Manifest& manifest,
                                                          const PrivilegeSet& privileges) const;

    /// Resolve a module for a context. Idempotent per (context, name).
    /// Unknown names fail with UnknownModule, privileged modules without a
    /// grant with NotGranted; neither affects the context.
    [[nodiscard]] relay_core::Result<std::shared_ptr<IModule>> resolve(ScriptContext& context,
                                                                       const std::string& name) const;

    // =========================================================================
    // Contexts
    // =========================================================================

    /// Create a context with a fresh process-unique id
    [[nodiscard]] std::shared_ptr<ScriptContext> create_context(const std::string& script,
                                                                const std::string& instance_id,
                                                                Manifest manifest,
                                                                PrivilegeSet privileges);

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, ModuleEntry> m_modules;
    relay_core::IdGenerator m_context_ids;
};

// =============================================================================
// Template Implementation
// =============================================================================

template<typename T>
relay_core::Result<std::shared_ptr<T>> ScriptContext::require() {
    auto module = require(to_string(T::kKind));
    if (!module) {
        return relay_core::Err<std::shared_ptr<T>>(module.error());
    }
    auto typed = std::dynamic_pointer_cast<T>(module.value());
    if (!typed) {
        return relay_core::Err<std::shared_ptr<T>>(relay_core::Error(relay_core::ErrorCode::InvalidState,
            std::string("Module '") + to_string(T::kKind) + "' has an unexpected handle type"));
    }
    return typed;
}

} // namespace relay_kernel
