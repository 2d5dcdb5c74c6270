/// @file error.cpp
/// @brief ErrorCode mapping and error chain formatting

#include <relay/core/error.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <vector>

namespace relay_core {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::IncompatibleVersion: return "IncompatibleVersion";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::OutOfMemory: return "OutOfMemory";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::NotSupported: return "NotSupported";
    }
    return "Unknown";
}

namespace detail {

ErrorCode code_of(CapabilityError::Kind kind) {
    return kind == CapabilityError::Kind::UnknownModule ? ErrorCode::NotFound : ErrorCode::PermissionDenied;
}

ErrorCode code_of(ValidationError::Kind kind) {
    switch (kind) {
        case ValidationError::Kind::InvalidKey:
        case ValidationError::Kind::InvalidParams:
            return ErrorCode::InvalidArgument;
        case ValidationError::Kind::InvalidValue:
        case ValidationError::Kind::InvalidManifest:
        case ValidationError::Kind::InvalidConfig:
            return ErrorCode::ValidationError;
    }
    return ErrorCode::ValidationError;
}

ErrorCode code_of(ConnectionError::Kind kind) {
    switch (kind) {
        case ConnectionError::Kind::Timeout: return ErrorCode::Timeout;
        case ConnectionError::Kind::Closed: return ErrorCode::InvalidState;
        case ConnectionError::Kind::DriverUnavailable: return ErrorCode::NotSupported;
        case ConnectionError::Kind::ResolveFailed:
        case ConnectionError::Kind::ConnectFailed:
        case ConnectionError::Kind::QueryFailed:
            return ErrorCode::IOError;
    }
    return ErrorCode::IOError;
}

} // namespace detail

namespace {

struct KindFormatter {
    std::string operator()(const std::string& text) const { return text; }

    std::string operator()(const CapabilityError& err) const {
        return err.module.empty()
            ? fmt::format("[CapabilityError] {}", err.message)
            : fmt::format("[CapabilityError] {} (module: {})", err.message, err.module);
    }

    std::string operator()(const ValidationError& err) const {
        return fmt::format("[ValidationError] {}", err.message);
    }

    std::string operator()(const ConnectionError& err) const {
        return err.endpoint.empty()
            ? fmt::format("[ConnectionError] {}", err.message)
            : fmt::format("[ConnectionError] {} (endpoint: {})", err.message, err.endpoint);
    }

    std::string operator()(const SubscriberError& err) const {
        return fmt::format("[SubscriberError] {}", err.message);
    }
};

} // anonymous namespace

// =============================================================================
// Error Chain
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::string out = fmt::format("[{}] {}", error_code_name(error.code()), std::visit(KindFormatter{}, error.variant()));
    for (const auto& [key, value] : error.context()) {
        out += fmt::format(" {{{}={}}}", key, value);
    }
    return out;
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint64_t, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint8_t>, Error>;

} // namespace relay_core
