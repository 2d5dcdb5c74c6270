/// @file script.cpp
/// @brief Script catalog

#include <relay/host/script.hpp>

namespace relay_host {

using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Ok;
using relay_core::Result;

Result<void> ScriptCatalog::register_script(const std::string& name, ScriptFactory factory) {
    if (name.empty()) {
        return Err(Error(ErrorCode::InvalidArgument, "Script name must not be empty"));
    }
    if (!factory) {
        return Err(Error(ErrorCode::InvalidArgument, "Script '" + name + "' has no factory"));
    }

    std::lock_guard lock(m_mutex);
    if (!m_factories.emplace(name, std::move(factory)).second) {
        return Err(Error(ErrorCode::AlreadyExists, "Script '" + name + "' is already registered"));
    }
    return Ok();
}

Result<void> ScriptCatalog::register_plugin(relay_kernel::Manifest manifest, SetupFn setup) {
    auto name = manifest.name;
    return register_script(name, [manifest = std::move(manifest), setup = std::move(setup)]() {
        return std::make_shared<FunctionScript>(manifest, setup);
    });
}

bool ScriptCatalog::has(const std::string& name) const {
    std::lock_guard lock(m_mutex);
    return m_factories.count(name) > 0;
}

std::shared_ptr<IScript> ScriptCatalog::create(const std::string& name) const {
    ScriptFactory factory;
    {
        std::lock_guard lock(m_mutex);
        auto it = m_factories.find(name);
        if (it == m_factories.end()) {
            return nullptr;
        }
        factory = it->second;
    }
    return factory();
}

std::vector<std::string> ScriptCatalog::names() const {
    std::lock_guard lock(m_mutex);
    std::vector<std::string> result;
    result.reserve(m_factories.size());
    for (const auto& [name, factory] : m_factories) {
        result.push_back(name);
    }
    return result;
}

} // namespace relay_host
