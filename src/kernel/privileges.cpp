/// @file privileges.cpp
/// @brief PrivilegeSet and PrivilegeTable implementation

#include <relay/kernel/privileges.hpp>

namespace relay_kernel {

// =============================================================================
// PrivilegeSet
// =============================================================================

PrivilegeSet::PrivilegeSet(const std::vector<std::string>& modules) {
    for (const auto& module : modules) {
        grant(module);
    }
}

void PrivilegeSet::grant(const std::string& module) {
    if (module == kWildcard) {
        m_all = true;
        return;
    }
    m_modules.insert(module);
}

void PrivilegeSet::revoke(const std::string& module) {
    if (module == kWildcard) {
        m_all = false;
        return;
    }
    m_modules.erase(module);
}

bool PrivilegeSet::has(const std::string& module) const {
    return m_all || m_modules.count(module) > 0;
}

std::vector<std::string> PrivilegeSet::granted() const {
    return std::vector<std::string>(m_modules.begin(), m_modules.end());
}

PrivilegeSet PrivilegeSet::full() {
    PrivilegeSet set;
    set.m_all = true;
    return set;
}

// =============================================================================
// PrivilegeTable
// =============================================================================

relay_core::Result<PrivilegeTable> PrivilegeTable::from_json(const relay_core::Value& j) {
    using relay_core::Err;
    using relay_core::ValidationError;

    PrivilegeTable table;
    if (j.is_null()) {
        return table;
    }
    if (!j.is_object()) {
        return Err<PrivilegeTable>(ValidationError::invalid_config("privileges", "expected an object"));
    }

    for (const auto& [script, modules] : j.items()) {
        if (!modules.is_array()) {
            return Err<PrivilegeTable>(ValidationError::invalid_config(
                "privileges." + script, "expected an array of module names"));
        }
        std::vector<std::string> names;
        for (const auto& module : modules) {
            if (!module.is_string()) {
                return Err<PrivilegeTable>(ValidationError::invalid_config(
                    "privileges." + script, "expected an array of module names"));
            }
            names.push_back(module.get<std::string>());
        }
        table.set(script, names);
    }

    return table;
}

void PrivilegeTable::set(const std::string& script, const std::vector<std::string>& modules) {
    m_grants[script] = modules;
}

PrivilegeSet PrivilegeTable::for_script(const std::string& script) const {
    auto it = m_grants.find(script);
    if (it == m_grants.end()) {
        return PrivilegeSet{};
    }
    return PrivilegeSet(it->second);
}

} // namespace relay_kernel
