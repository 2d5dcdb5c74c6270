/// @file types.hpp
/// @brief Scope and entry types for relay_store

#pragma once

#include <relay/core/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace relay_store {

// =============================================================================
// Scope
// =============================================================================

/// Breadth of visibility for a stored key, narrowest first
enum class Scope : std::uint8_t {
    Instance,  ///< owner = "script@instance"
    Script,    ///< owner = script name
    Global,    ///< no owner
};

/// Convert scope to its persisted name
[[nodiscard]] const char* to_string(Scope scope);

/// Parse a persisted scope name
[[nodiscard]] std::optional<Scope> scope_from_string(const std::string& name);

// =============================================================================
// Bucket and Entry
// =============================================================================

/// (scope, owner) pair identifying one key namespace
struct BucketKey {
    Scope scope = Scope::Global;
    std::string owner;

    bool operator<(const BucketKey& other) const {
        return std::tie(scope, owner) < std::tie(other.scope, other.owner);
    }
    bool operator==(const BucketKey& other) const {
        return scope == other.scope && owner == other.owner;
    }
};

/// One persisted key/value pair
struct StoredEntry {
    BucketKey bucket;
    std::string key;
    relay_core::Value value;
};

// =============================================================================
// Statistics
// =============================================================================

/// Store statistics
struct StoreStats {
    std::uint64_t reads = 0;
    std::uint64_t writes = 0;
    std::uint64_t removals = 0;
    std::uint64_t validation_failures = 0;
    std::uint64_t backend_failures = 0;
    std::size_t buckets = 0;
};

} // namespace relay_store
