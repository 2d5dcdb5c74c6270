/// @file codec.hpp
/// @brief Text encodings accepted by connection writes

#pragma once

#include <relay/core/error.hpp>
#include <relay/core/value.hpp>

#include <optional>
#include <string>

namespace relay_net {

/// Lowercase hex rendering
[[nodiscard]] std::string hex_encode(const relay_core::Bytes& bytes);

/// Decode hex text (either case); nullopt on odd length or bad digits
[[nodiscard]] std::optional<relay_core::Bytes> hex_decode(const std::string& text);

/// Standard base64 with padding
[[nodiscard]] std::string base64_encode(const relay_core::Bytes& bytes);

/// Decode standard base64; padding is optional, whitespace is rejected
[[nodiscard]] std::optional<relay_core::Bytes> base64_decode(const std::string& text);

/// Turn script text into octets. Format "" sends the text as is,
/// "hex" and "base64" decode it first.
[[nodiscard]] relay_core::Result<relay_core::Bytes> decode_text(const std::string& text, const std::string& format);

} // namespace relay_net
