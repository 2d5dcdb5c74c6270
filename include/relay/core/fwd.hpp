#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for relay_core module

#include <cstdint>

namespace relay_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct CapabilityError;
struct ValidationError;
struct ConnectionError;
struct SubscriberError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Version
// =============================================================================

struct Version;
struct VersionRange;

// =============================================================================
// ID Types
// =============================================================================

class IdGenerator;

} // namespace relay_core
