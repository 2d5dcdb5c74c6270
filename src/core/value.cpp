/// @file value.cpp
/// @brief Value validation and byte helpers for relay_core

#include <relay/core/value.hpp>

#include <cmath>

namespace relay_core {

namespace {

/// Well-formed UTF-8: no overlongs, surrogates or code points past U+10FFFF
bool is_valid_utf8(const std::string& text) {
    const auto* p = reinterpret_cast<const unsigned char*>(text.data());
    const auto* end = p + text.size();
    while (p < end) {
        unsigned char lead = *p;
        std::size_t extra = 0;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (lead < 0x80) {
            ++p;
            continue;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            extra = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            extra = 2;
            if (lead == 0xE0) low = 0xA0;
            if (lead == 0xED) high = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            extra = 3;
            if (lead == 0xF0) low = 0x90;
            if (lead == 0xF4) high = 0x8F;
        } else {
            return false;
        }
        if (static_cast<std::size_t>(end - p) <= extra) {
            return false;
        }
        // Only the first continuation byte has a narrowed range
        if (p[1] < low || p[1] > high) {
            return false;
        }
        for (std::size_t i = 2; i <= extra; ++i) {
            if (p[i] < 0x80 || p[i] > 0xBF) {
                return false;
            }
        }
        p += extra + 1;
    }
    return true;
}

Result<void> check_node(const Value& node, std::size_t depth, std::size_t max_depth) {
    if (depth > max_depth) {
        return Err(ValidationError::invalid_value(
            "nesting deeper than " + std::to_string(max_depth) + " levels"));
    }

    switch (node.type()) {
        case Value::value_t::string:
            if (!is_valid_utf8(node.get_ref<const std::string&>())) {
                return Err(ValidationError::invalid_value("string is not valid UTF-8"));
            }
            return Ok();

        case Value::value_t::null:
        case Value::value_t::boolean:
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
            return Ok();

        case Value::value_t::number_float:
            if (!std::isfinite(node.get<double>())) {
                return Err(ValidationError::invalid_value("non-finite number"));
            }
            return Ok();

        case Value::value_t::array:
            for (const auto& element : node) {
                auto r = check_node(element, depth + 1, max_depth);
                if (!r) return r;
            }
            return Ok();

        case Value::value_t::object:
            for (const auto& [key, element] : node.items()) {
                if (!is_valid_utf8(key)) {
                    return Err(ValidationError::invalid_value("object key is not valid UTF-8"));
                }
                auto r = check_node(element, depth + 1, max_depth);
                if (!r) return r.error().with_context("key", key);
            }
            return Ok();

        case Value::value_t::binary:
            return Err(ValidationError::invalid_value("binary data is not serializable"));

        case Value::value_t::discarded:
            return Err(ValidationError::invalid_value("discarded value"));
    }

    return Err(ValidationError::invalid_value("unknown value type"));
}

} // anonymous namespace

Result<void> validate_value(const Value& value, std::size_t max_depth) {
    return check_node(value, 0, max_depth);
}

Value bytes_value(Bytes bytes) {
    return Value::binary(std::move(bytes));
}

std::optional<Bytes> value_bytes(const Value& value) {
    if (value.is_binary()) {
        const auto& bin = value.get_binary();
        return Bytes(bin.begin(), bin.end());
    }
    if (value.is_string()) {
        const auto& str = value.get_ref<const std::string&>();
        return Bytes(str.begin(), str.end());
    }
    return std::nullopt;
}

std::string value_to_text(const Value& value) {
    return value.dump(-1, ' ', false, Value::error_handler_t::replace);
}

} // namespace relay_core
