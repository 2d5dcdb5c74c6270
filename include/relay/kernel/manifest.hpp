/// @file manifest.hpp
/// @brief Script manifest model and validation
///
/// A manifest is consumed once at load time. It seeds the capability
/// decision (required modules), the backend check and the default
/// configuration handed to the script's setup.

#pragma once

#include "fwd.hpp"

#include <relay/core/error.hpp>
#include <relay/core/value.hpp>

#include <string>
#include <vector>

namespace relay_kernel {

// =============================================================================
// ManifestVar
// =============================================================================

/// Declared configuration variable
struct ManifestVar {
    std::string name;
    std::string title;
    std::string type = "string";
    relay_core::Value default_value;  ///< null when no default was declared
    std::vector<std::string> options;

    /// Parse one entry of the "vars" array
    [[nodiscard]] static relay_core::Result<ManifestVar> from_json(const relay_core::Value& j);

    [[nodiscard]] relay_core::Value to_json() const;
};

// =============================================================================
// Manifest
// =============================================================================

/// Metadata and requirements declared by a script
struct Manifest {
    std::string name;
    std::string version;
    std::string author;
    std::string description;
    bool autorun = false;
    bool hidden = false;
    bool enable_web = false;
    std::vector<std::string> backends{"ts3"};
    std::string engine;  ///< version requirement, e.g. ">= 0.9.16"; empty accepts any
    std::vector<ManifestVar> vars;
    std::vector<std::string> required_modules;
    std::vector<std::string> voice_commands;

    /// Parse a manifest object; field types are checked, semantics are not
    [[nodiscard]] static relay_core::Result<Manifest> from_json(const relay_core::Value& j);

    /// Parse manifest JSON text
    [[nodiscard]] static relay_core::Result<Manifest> from_json_string(const std::string& text);

    /// Check required fields, hidden/vars exclusion, var names and the
    /// engine requirement against the running relay version
    [[nodiscard]] relay_core::Result<void> validate() const;

    /// Check that the script may run on a backend kind
    [[nodiscard]] relay_core::Result<void> check_backend(const std::string& backend) const;

    [[nodiscard]] bool supports_backend(const std::string& backend) const;

    [[nodiscard]] bool requires_module(const std::string& module) const;

    /// Fill entries missing from a script configuration with var defaults
    [[nodiscard]] relay_core::Value apply_defaults(const relay_core::Value& config) const;

    [[nodiscard]] relay_core::Value to_json() const;
};

} // namespace relay_kernel
