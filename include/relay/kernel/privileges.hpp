/// @file privileges.hpp
/// @brief Privilege grants for restricted script modules
///
/// Grants come from the host configuration (`privileges: {script: [...]}`)
/// and are turned into a PrivilegeSet once per script at load time.

#pragma once

#include "fwd.hpp"

#include <relay/core/error.hpp>
#include <relay/core/value.hpp>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace relay_kernel {

// =============================================================================
// PrivilegeSet
// =============================================================================

/// Names of the privileged modules one script may use
class PrivilegeSet {
public:
    /// Entry granting every privileged module
    static constexpr const char* kWildcard = "*";

    PrivilegeSet() = default;
    explicit PrivilegeSet(const std::vector<std::string>& modules);

    /// Grant a module; the wildcard grants everything
    void grant(const std::string& module);

    /// Revoke a module grant
    void revoke(const std::string& module);

    /// Check if a module is granted
    [[nodiscard]] bool has(const std::string& module) const;

    [[nodiscard]] bool is_unrestricted() const { return m_all; }
    [[nodiscard]] bool empty() const { return !m_all && m_modules.empty(); }

    /// Explicitly granted modules (the wildcard is not expanded)
    [[nodiscard]] std::vector<std::string> granted() const;

    /// Set granting every privileged module
    static PrivilegeSet full();

private:
    std::set<std::string> m_modules;
    bool m_all = false;
};

// =============================================================================
// PrivilegeTable
// =============================================================================

/// Host privilege configuration keyed by script name
class PrivilegeTable {
public:
    PrivilegeTable() = default;

    /// Parse `{"script": ["net", "db"], ...}`
    [[nodiscard]] static relay_core::Result<PrivilegeTable> from_json(const relay_core::Value& j);

    /// Replace the grants of a script
    void set(const std::string& script, const std::vector<std::string>& modules);

    /// Grants for a script; scripts without an entry get an empty set
    [[nodiscard]] PrivilegeSet for_script(const std::string& script) const;

    [[nodiscard]] std::size_t size() const { return m_grants.size(); }

private:
    std::map<std::string, std::vector<std::string>> m_grants;
};

} // namespace relay_kernel
