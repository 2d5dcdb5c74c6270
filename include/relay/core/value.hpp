#pragma once

/// @file value.hpp
/// @brief Serializable value tree shared by the store, events and connections

#include "error.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relay_core {

/// Tree of null / bool / number / string / array / object
using Value = nlohmann::json;

/// Raw octets carried by connection events
using Bytes = std::vector<std::uint8_t>;

/// Deepest nesting accepted by validate_value
inline constexpr std::size_t kMaxValueDepth = 256;

/// Check that a value is a finite tree that serializes to JSON text:
/// no binary or discarded nodes, finite numbers, valid UTF-8 strings,
/// nesting no deeper than max_depth
[[nodiscard]] Result<void> validate_value(const Value& value, std::size_t max_depth = kMaxValueDepth);

/// Wrap octets as a binary value
[[nodiscard]] Value bytes_value(Bytes bytes);

/// Extract octets from a binary or string value
[[nodiscard]] std::optional<Bytes> value_bytes(const Value& value);

/// Text rendering for logs; invalid UTF-8 is replaced rather than thrown
[[nodiscard]] std::string value_to_text(const Value& value);

} // namespace relay_core
