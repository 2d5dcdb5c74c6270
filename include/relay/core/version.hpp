#pragma once

/// @file version.hpp
/// @brief Runtime version and script engine requirements

#include "fwd.hpp"
#include "error.hpp"
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relay_core {

// =============================================================================
// Version
// =============================================================================

/// major.minor.patch triple used by the runtime and by script manifests
struct Version {
    std::uint16_t major = 0;
    std::uint16_t minor = 0;
    std::uint16_t patch = 0;

    constexpr Version() noexcept = default;
    constexpr Version(std::uint16_t maj, std::uint16_t min, std::uint16_t pat) noexcept
        : major(maj), minor(min), patch(pat) {}

    /// Accepts "1.2" and "1.2.3"; a missing patch reads as 0
    [[nodiscard]] static std::optional<Version> parse(std::string_view text);

    [[nodiscard]] std::string to_string() const;

    constexpr auto operator<=>(const Version&) const noexcept = default;
};

/// Version of the relay runtime, checked against manifest engine requirements
Version relay_version();

// =============================================================================
// VersionRange
// =============================================================================

/// Conjunction of comparator clauses, e.g. ">=1.0.0,<2.0.0".
/// "^x.y.z" and "~x.y.z" expand to a pair of clauses; a bare version means "==".
struct VersionRange {
    enum class Op : std::uint8_t { Eq, Lt, Le, Gt, Ge };

    struct Clause {
        Op op = Op::Eq;
        Version version;
    };

    std::vector<Clause> clauses;

    [[nodiscard]] bool contains(const Version& v) const;
};

/// Parse an engine requirement; whitespace around each clause is ignored
Result<VersionRange> parse_version_range(const std::string& str);

} // namespace relay_core
