/// @file fwd.hpp
/// @brief Forward declarations for relay_kernel

#pragma once

#include <cstdint>
#include <memory>

namespace relay_kernel {

// =============================================================================
// Module System
// =============================================================================

/// Script-facing module kinds
enum class ModuleKind : std::uint8_t;

/// Base of every script-facing module handle
class IModule;

/// Name -> factory table with privilege gating
class CapabilityRegistry;

// =============================================================================
// Scripts
// =============================================================================

/// Declared variable of a manifest
struct ManifestVar;

/// Script manifest
struct Manifest;

/// Privileged modules granted to one script
class PrivilegeSet;

/// Host privilege table from configuration
class PrivilegeTable;

/// Tag for context ids
struct ContextTag;

/// One loaded script within one instance
class ScriptContext;

} // namespace relay_kernel
