#pragma once

/// @file id.hpp
/// @brief Numeric identifiers and their generator for relay_core

#include "fwd.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace relay_core {

// =============================================================================
// IdGenerator
// =============================================================================

/// Thread-safe monotonic generator; zero is never handed out
class IdGenerator {
public:
    IdGenerator() noexcept : m_next(1) {}

    [[nodiscard]] std::uint64_t next() noexcept {
        return m_next.fetch_add(1, std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> m_next;
};

// =============================================================================
// TypedId
// =============================================================================

/// Strongly typed numeric id; the tag keeps context, connection and
/// subscription ids from being mixed up
template<typename Tag>
struct TypedId {
    std::uint64_t value = 0;

    constexpr TypedId() = default;
    constexpr explicit TypedId(std::uint64_t v) : value(v) {}

    [[nodiscard]] constexpr bool is_valid() const { return value != 0; }
    constexpr bool operator==(const TypedId& other) const { return value == other.value; }
    constexpr bool operator!=(const TypedId& other) const { return value != other.value; }
    constexpr bool operator<(const TypedId& other) const { return value < other.value; }

    [[nodiscard]] std::string to_string() const { return std::to_string(value); }
};

} // namespace relay_core

template<typename Tag>
struct std::hash<relay_core::TypedId<Tag>> {
    std::size_t operator()(const relay_core::TypedId<Tag>& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};
