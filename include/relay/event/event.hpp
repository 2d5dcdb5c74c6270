#pragma once

/// @file event.hpp
/// @brief Event, subscription and statistics types for relay_event

#include <relay/core/value.hpp>
#include <relay/kernel/types.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace relay_event {

using relay_kernel::ContextId;

// =============================================================================
// Delivery Mode
// =============================================================================

/// How an event reaches its subscribers
enum class DeliveryMode : std::uint8_t {
    Local,      ///< Subscribers in the originating instance
    Broadcast,  ///< Subscribers in every attached instance, originator included
    Context,    ///< Subscribers of one script context
};

[[nodiscard]] const char* to_string(DeliveryMode mode);

// =============================================================================
// Event
// =============================================================================

/// Named event as seen by a subscriber
struct Event {
    std::string name;
    relay_core::Value payload;
    ContextId origin;              ///< invalid (0) for host-origin events
    std::string origin_instance;   ///< empty for host-wide broadcasts
    DeliveryMode mode = DeliveryMode::Local;
};

/// Subscriber callback; runs on the subscriber's instance queue
using EventCallback = std::function<void(const Event&)>;

/// Re-checked on the instance queue right before dispatch; returning false
/// drops the event
using DeliveryGuard = std::function<bool()>;

/// Unique subscription identifier
struct SubscriptionId {
    std::uint64_t id = 0;

    [[nodiscard]] bool is_valid() const { return id != 0; }
    bool operator==(const SubscriptionId& other) const { return id == other.id; }
    bool operator!=(const SubscriptionId& other) const { return id != other.id; }
};

// =============================================================================
// Built-in Event Names
// =============================================================================

namespace events {

inline constexpr const char* kLoad = "load";
inline constexpr const char* kUnload = "unload";
inline constexpr const char* kConnect = "connect";
inline constexpr const char* kDisconnect = "disconnect";

inline constexpr const char* kNetData = "net.data";
inline constexpr const char* kNetClose = "net.close";
inline constexpr const char* kNetError = "net.error";

inline constexpr const char* kWsConnect = "ws.connect";
inline constexpr const char* kWsDisconnect = "ws.disconnect";
inline constexpr const char* kWsData = "ws.data";
inline constexpr const char* kWsError = "ws.error";

} // namespace events

// =============================================================================
// Event Statistics
// =============================================================================

/// Statistics for event bus operations
struct EventBusStats {
    std::uint64_t events_emitted = 0;
    std::uint64_t events_broadcast = 0;
    std::uint64_t dispatches_posted = 0;
    std::uint64_t callbacks_invoked = 0;
    std::uint64_t subscriber_failures = 0;
    std::uint64_t events_dropped = 0;
    std::size_t active_subscriptions = 0;
    std::size_t attached_instances = 0;
};

} // namespace relay_event
