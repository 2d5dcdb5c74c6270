#pragma once

/// @file error.hpp
/// @brief Error kinds, Error and Result<T> for relay_core

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace relay_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// Coarse category reported to scripts and the host
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    IncompatibleVersion,
    Timeout,
    OutOfMemory,
    PermissionDenied,
    NotSupported,
};

[[nodiscard]] const char* error_code_name(ErrorCode code);

// =============================================================================
// Error Kinds
// =============================================================================

/// Module access errors raised by the capability registry
struct CapabilityError {
    enum class Kind : std::uint8_t {
        UnknownModule,       // No module registered under the name
        NotGranted,          // Privileged module requested at runtime without grant
        DeclaredNotGranted,  // Privileged module declared required without grant
    };

    Kind kind;
    std::string message;
    std::string script;
    std::string module;

    static CapabilityError unknown_module(const std::string& script_name, const std::string& module_name) {
        return {Kind::UnknownModule,
            "Unknown module '" + module_name + "' requested by script '" + script_name + "'",
            script_name, module_name};
    }

    static CapabilityError not_granted(const std::string& script_name, const std::string& module_name) {
        return {Kind::NotGranted,
            "Script '" + script_name + "' is not privileged to use module '" + module_name + "'",
            script_name, module_name};
    }

    static CapabilityError declared_not_granted(const std::string& script_name, const std::string& module_name) {
        return {Kind::DeclaredNotGranted,
            "Script '" + script_name + "' requires module '" + module_name + "' which is not granted",
            script_name, module_name};
    }
};

/// Malformed keys, values, parameters, manifests and config
struct ValidationError {
    enum class Kind : std::uint8_t {
        InvalidValue,     // Value is not a finite serializable tree
        InvalidKey,       // Store key is empty
        InvalidParams,    // Connection parameters are malformed
        InvalidManifest,  // Script manifest rejected
        InvalidConfig,    // Host configuration rejected
    };

    Kind kind;
    std::string message;
    std::string field;

    static ValidationError invalid_value(const std::string& reason) {
        return {Kind::InvalidValue, "Invalid value: " + reason, {}};
    }

    static ValidationError invalid_key(const std::string& key) {
        return {Kind::InvalidKey, "Invalid key: '" + key + "'", key};
    }

    static ValidationError invalid_params(const std::string& field_name, const std::string& reason) {
        return {Kind::InvalidParams, "Invalid parameter '" + field_name + "': " + reason, field_name};
    }

    static ValidationError invalid_manifest(const std::string& field_name, const std::string& reason) {
        return {Kind::InvalidManifest, "Invalid manifest field '" + field_name + "': " + reason, field_name};
    }

    static ValidationError invalid_config(const std::string& field_name, const std::string& reason) {
        return {Kind::InvalidConfig, "Invalid config field '" + field_name + "': " + reason, field_name};
    }
};

/// Socket and database failures
struct ConnectionError {
    enum class Kind : std::uint8_t {
        ResolveFailed,      // Host name could not be resolved
        ConnectFailed,      // Peer refused or unreachable
        Timeout,            // Connect did not complete in time
        Closed,             // Connection closed before the operation ran
        DriverUnavailable,  // No protocol driver for the requested database
        QueryFailed,        // Database rejected a statement
    };

    Kind kind;
    std::string message;
    std::string endpoint;

    static ConnectionError resolve_failed(const std::string& ep, const std::string& reason) {
        return {Kind::ResolveFailed, "Cannot resolve " + ep + ": " + reason, ep};
    }

    static ConnectionError connect_failed(const std::string& ep, const std::string& reason) {
        return {Kind::ConnectFailed, "Cannot connect to " + ep + ": " + reason, ep};
    }

    static ConnectionError timeout(const std::string& ep) {
        return {Kind::Timeout, "Connect to " + ep + " timed out", ep};
    }

    static ConnectionError closed(const std::string& ep) {
        return {Kind::Closed, "Connection closed", ep};
    }

    static ConnectionError driver_unavailable(const std::string& driver) {
        return {Kind::DriverUnavailable, "No database driver available for '" + driver + "'", {}};
    }

    static ConnectionError query_failed(const std::string& reason) {
        return {Kind::QueryFailed, "Query failed: " + reason, {}};
    }
};

/// An event handler threw while the bus was delivering to it
struct SubscriberError {
    enum class Kind : std::uint8_t {
        Threw,
    };

    Kind kind;
    std::string message;
    std::string event_name;
    std::string script;

    static SubscriberError threw(const std::string& event, const std::string& script_name, const std::string& what) {
        return {Kind::Threw,
            "Handler for '" + event + "' in script '" + script_name + "' threw: " + what,
            event, script_name};
    }
};

namespace detail {
ErrorCode code_of(CapabilityError::Kind kind);
ErrorCode code_of(ValidationError::Kind kind);
ErrorCode code_of(ConnectionError::Kind kind);
} // namespace detail

// =============================================================================
// Error
// =============================================================================

/// One of the error kinds above, or a plain message, tagged with an ErrorCode
/// and optional key/value context ("script", "instance", "file", ...)
class Error {
public:
    using Variant = std::variant<std::string, CapabilityError, ValidationError, ConnectionError, SubscriberError>;

    Error() : m_code(ErrorCode::Unknown), m_error(std::string("Unknown error")) {}
    Error(CapabilityError err) : m_code(detail::code_of(err.kind)), m_error(std::move(err)) {}
    Error(ValidationError err) : m_code(detail::code_of(err.kind)), m_error(std::move(err)) {}
    Error(ConnectionError err) : m_code(detail::code_of(err.kind)), m_error(std::move(err)) {}
    Error(SubscriberError err) : m_code(ErrorCode::InvalidState), m_error(std::move(err)) {}
    Error(std::string msg) : m_code(ErrorCode::Unknown), m_error(std::move(msg)) {}
    Error(const char* msg) : Error(std::string(msg)) {}
    Error(ErrorCode code, std::string msg) : m_code(code), m_error(std::move(msg)) {}
    Error(ErrorCode code, const char* msg) : Error(code, std::string(msg)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            if constexpr (std::is_same_v<std::decay_t<decltype(err)>, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    template<typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(m_error); }

    /// The typed kind, or nullptr when the error holds another alternative
    template<typename T>
    [[nodiscard]] const T* as() const { return std::get_if<T>(&m_error); }

    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it == m_context.end() ? nullptr : &it->second;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

/// Thrown by Result::unwrap on an error result
class UnwrapError : public std::runtime_error {
public:
    explicit UnwrapError(Error error)
        : std::runtime_error(error.message()), m_error(std::move(error)) {}

    [[nodiscard]] const Error& error() const noexcept { return m_error; }

private:
    Error m_error;
};

// =============================================================================
// Result<T>
// =============================================================================

/// Value or Error. Accessing the wrong side is undefined; unwrap() throws.
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_state(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_state(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_state.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_state.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & { return *std::get_if<0>(&m_state); }
    [[nodiscard]] const T& value() const& { return *std::get_if<0>(&m_state); }
    [[nodiscard]] T&& value() && { return std::move(*std::get_if<0>(&m_state)); }

    [[nodiscard]] E& error() & { return *std::get_if<1>(&m_state); }
    [[nodiscard]] const E& error() const& { return *std::get_if<1>(&m_state); }

    [[nodiscard]] T value_or(T fallback) const {
        return is_ok() ? value() : std::move(fallback);
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] T& unwrap() & {
        check();
        return value();
    }

    [[nodiscard]] T&& unwrap() && {
        check();
        return std::move(*this).value();
    }

private:
    void check() const {
        if (is_err()) {
            throw UnwrapError(error());
        }
    }

    std::variant<T, E> m_state;
};

template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_error.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return m_error.has_value(); }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] E& error() & { return *m_error; }
    [[nodiscard]] const E& error() const& { return *m_error; }

    void unwrap() const {
        if (m_error) {
            throw UnwrapError(*m_error);
        }
    }

private:
    std::optional<E> m_error;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// "[Code] [Kind] message (detail) {key=value}..." for logs and host output
std::string build_error_chain(const Error& error);

} // namespace relay_core
