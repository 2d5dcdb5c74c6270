/// @file types.cpp
/// @brief Connection state machine and parameter validation

#include <relay/net/types.hpp>

#include <algorithm>

namespace relay_net {

using relay_core::Err;
using relay_core::Ok;
using relay_core::Result;
using relay_core::ValidationError;
using relay_core::Value;

const char* to_string(ConnectionKind kind) {
    switch (kind) {
        case ConnectionKind::StreamSocket: return "socket";
        case ConnectionKind::WebSocketPeer: return "websocket";
        case ConnectionKind::Database: return "database";
        default: return "unknown";
    }
}

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Open: return "Open";
        case ConnectionState::Failed: return "Failed";
        case ConnectionState::Closed: return "Closed";
        case ConnectionState::Errored: return "Errored";
        default: return "Unknown";
    }
}

bool is_valid_transition(ConnectionState from, ConnectionState to) {
    switch (from) {
        case ConnectionState::Connecting:
            return to == ConnectionState::Open || to == ConnectionState::Failed;
        case ConnectionState::Open:
            return to == ConnectionState::Closed || to == ConnectionState::Errored;
        default:
            return false;
    }
}

namespace {

Result<void> read_port(const Value& j, std::uint32_t& out) {
    if (!j.contains("port") || j["port"].is_null()) {
        return Ok();
    }
    const auto& port = j["port"];
    if (port.is_number_unsigned()) {
        out = static_cast<std::uint32_t>(std::min<std::uint64_t>(port.get<std::uint64_t>(), 0xFFFFFFFFu));
        return Ok();
    }
    if (port.is_number_integer()) {
        // Negative ports end up as 0 and fail validation
        auto value = port.get<std::int64_t>();
        out = value < 0 ? 0u : static_cast<std::uint32_t>(std::min<std::int64_t>(value, 0xFFFFFFFF));
        return Ok();
    }
    if (port.is_string()) {
        try {
            std::size_t consumed = 0;
            auto text = port.get<std::string>();
            unsigned long value = std::stoul(text, &consumed);
            if (consumed != text.size()) {
                return Err(ValidationError::invalid_params("port", "not a number"));
            }
            out = static_cast<std::uint32_t>(std::min<unsigned long>(value, 0xFFFFFFFFul));
            return Ok();
        } catch (const std::exception&) {
            return Err(ValidationError::invalid_params("port", "not a number"));
        }
    }
    return Err(ValidationError::invalid_params("port", "not a number"));
}

Result<void> read_text(const Value& j, const char* key, std::string& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return Ok();
    }
    if (!j[key].is_string()) {
        return Err(ValidationError::invalid_params(key, "expected a string"));
    }
    out = j[key].get<std::string>();
    return Ok();
}

} // anonymous namespace

// =============================================================================
// ConnectParams
// =============================================================================

Result<ConnectParams> ConnectParams::from_json(const Value& j) {
    if (!j.is_object()) {
        return Err<ConnectParams>(ValidationError::invalid_params("params", "expected an object"));
    }

    ConnectParams params;
    if (auto r = read_text(j, "host", params.host); !r) return Err<ConnectParams>(r.error());
    if (auto r = read_text(j, "protocol", params.protocol); !r) return Err<ConnectParams>(r.error());
    if (auto r = read_port(j, params.port); !r) return Err<ConnectParams>(r.error());
    if (params.protocol.empty()) {
        params.protocol = "tcp";
    }
    return params;
}

Result<void> ConnectParams::validate() const {
    if (host.empty()) {
        return Err(ValidationError::invalid_params("host", "is required"));
    }
    if (port == 0 || port > 65535) {
        return Err(ValidationError::invalid_params("port", "must be within 1..65535"));
    }
    if (protocol != "tcp") {
        return Err(ValidationError::invalid_params("protocol", "unsupported protocol '" + protocol + "'"));
    }
    return Ok();
}

std::string ConnectParams::endpoint() const {
    return host + ":" + std::to_string(port);
}

// =============================================================================
// DbParams
// =============================================================================

Result<DbParams> DbParams::from_json(const Value& j) {
    if (!j.is_object()) {
        return Err<DbParams>(ValidationError::invalid_params("params", "expected an object"));
    }

    DbParams params;
    if (auto r = read_text(j, "driver", params.driver); !r) return Err<DbParams>(r.error());
    if (auto r = read_text(j, "host", params.host); !r) return Err<DbParams>(r.error());
    if (auto r = read_text(j, "username", params.username); !r) return Err<DbParams>(r.error());
    if (auto r = read_text(j, "password", params.password); !r) return Err<DbParams>(r.error());
    if (auto r = read_text(j, "database", params.database); !r) return Err<DbParams>(r.error());
    if (auto r = read_port(j, params.port); !r) return Err<DbParams>(r.error());
    return params;
}

Result<void> DbParams::validate() const {
    if (driver.empty()) {
        return Err(ValidationError::invalid_params("driver", "is required"));
    }
    if (driver != "sqlite3" && driver != "postgres") {
        return Err(ValidationError::invalid_params("driver", "unsupported driver '" + driver + "'"));
    }
    if (is_remote() && host.empty()) {
        return Err(ValidationError::invalid_params("host", "is required for " + driver));
    }
    if (port > 65535) {
        return Err(ValidationError::invalid_params("port", "must be within 1..65535"));
    }
    return Ok();
}

bool DbParams::is_remote() const {
    return driver == "postgres";
}

std::uint32_t DbParams::effective_port() const {
    if (port != 0) {
        return port;
    }
    return driver == "postgres" ? 5432 : 0;
}

std::string DbParams::endpoint() const {
    if (!is_remote()) {
        return driver + ":memory";
    }
    return host + ":" + std::to_string(effective_port());
}

} // namespace relay_net
