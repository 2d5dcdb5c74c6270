/// @file script.hpp
/// @brief Script plugins and the catalog they are registered in

#pragma once

#include <relay/core/error.hpp>
#include <relay/core/value.hpp>
#include <relay/kernel/capability_registry.hpp>
#include <relay/kernel/manifest.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace relay_host {

// =============================================================================
// IScript
// =============================================================================

/// A script: a manifest plus a setup entry point.
///
/// setup() runs once per load on the instance queue. It resolves the
/// modules it needs through the context and registers its callbacks;
/// throwing fails the load.
class IScript {
public:
    virtual ~IScript() = default;

    [[nodiscard]] virtual const relay_kernel::Manifest& manifest() const = 0;

    /// @param config script configuration with var defaults applied
    virtual void setup(relay_kernel::ScriptContext& context, const relay_core::Value& config) = 0;
};

/// Setup signature of a FunctionScript
using SetupFn = std::function<void(relay_kernel::ScriptContext& context, const relay_core::Value& config)>;

/// Script made of a manifest and a setup function
class FunctionScript : public IScript {
public:
    FunctionScript(relay_kernel::Manifest manifest, SetupFn setup)
        : m_manifest(std::move(manifest)), m_setup(std::move(setup)) {}

    const relay_kernel::Manifest& manifest() const override { return m_manifest; }

    void setup(relay_kernel::ScriptContext& context, const relay_core::Value& config) override {
        if (m_setup) {
            m_setup(context, config);
        }
    }

private:
    relay_kernel::Manifest m_manifest;
    SetupFn m_setup;
};

// =============================================================================
// ScriptCatalog
// =============================================================================

/// Creates a fresh script object for every load
using ScriptFactory = std::function<std::shared_ptr<IScript>()>;

/// Scripts available to the host, by manifest name
class ScriptCatalog {
public:
    ScriptCatalog() = default;

    /// Register a script factory
    /// @return AlreadyExists if the name is taken
    relay_core::Result<void> register_script(const std::string& name, ScriptFactory factory);

    /// Register a manifest and setup function; the name comes from the manifest
    relay_core::Result<void> register_plugin(relay_kernel::Manifest manifest, SetupFn setup);

    [[nodiscard]] bool has(const std::string& name) const;

    /// New script object, or nullptr for an unknown name
    [[nodiscard]] std::shared_ptr<IScript> create(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> names() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, ScriptFactory> m_factories;
};

} // namespace relay_host
