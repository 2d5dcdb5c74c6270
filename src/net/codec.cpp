/// @file codec.cpp
/// @brief Hex and base64 codecs

#include <relay/net/codec.hpp>

namespace relay_net {

using relay_core::Bytes;

namespace {

constexpr const char* kHexDigits = "0123456789abcdef";
constexpr const char* kBase64Alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // anonymous namespace

// =============================================================================
// Hex
// =============================================================================

std::string hex_encode(const Bytes& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0F]);
    }
    return out;
}

std::optional<Bytes> hex_decode(const std::string& text) {
    if (text.size() % 2 != 0) {
        return std::nullopt;
    }
    Bytes out;
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

// =============================================================================
// Base64
// =============================================================================

std::string base64_encode(const Bytes& bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        std::uint32_t chunk = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        out.push_back(kBase64Alphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(chunk >> 6) & 0x3F]);
        out.push_back(kBase64Alphabet[chunk & 0x3F]);
    }

    std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        std::uint32_t chunk = bytes[i] << 16;
        out.push_back(kBase64Alphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(chunk >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        std::uint32_t chunk = (bytes[i] << 16) | (bytes[i + 1] << 8);
        out.push_back(kBase64Alphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(chunk >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::optional<Bytes> base64_decode(const std::string& text) {
    std::size_t length = text.size();
    while (length > 0 && text[length - 1] == '=') {
        --length;
    }
    if (text.size() - length > 2 || length % 4 == 1) {
        return std::nullopt;
    }

    Bytes out;
    out.reserve(length * 3 / 4);

    std::uint32_t buffer = 0;
    int bits = 0;
    for (std::size_t i = 0; i < length; ++i) {
        int value = base64_value(text[i]);
        if (value < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<std::uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

// =============================================================================
// Script Text
// =============================================================================

relay_core::Result<Bytes> decode_text(const std::string& text, const std::string& format) {
    using relay_core::Err;
    using relay_core::ValidationError;

    if (format.empty() || format == "string") {
        return Bytes(text.begin(), text.end());
    }
    if (format == "hex") {
        auto bytes = hex_decode(text);
        if (!bytes) {
            return Err<Bytes>(ValidationError::invalid_params("data", "malformed hex"));
        }
        return std::move(*bytes);
    }
    if (format == "base64") {
        auto bytes = base64_decode(text);
        if (!bytes) {
            return Err<Bytes>(ValidationError::invalid_params("data", "malformed base64"));
        }
        return std::move(*bytes);
    }
    return Err<Bytes>(ValidationError::invalid_params("format", "unknown format '" + format + "'"));
}

} // namespace relay_net
