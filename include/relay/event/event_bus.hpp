#pragma once

/// @file event_bus.hpp
/// @brief Per-instance listener registry with local and broadcast delivery
///
/// The EventBus provides:
/// - Ordered subscriber lists per (instance, event name)
/// - Local, context-scoped and broadcast delivery
/// - Dispatch onto the subscriber's instance queue, never inline
/// - Failure isolation between subscribers
///
/// A dispatch iterates the subscriber snapshot taken at emit time:
/// subscriptions added during a dispatch first fire on the next one, and
/// subscriptions removed mid-dispatch are skipped if not yet invoked.

#include "event.hpp"

#include <relay/core/error.hpp>
#include <relay/exec/execution_queue.hpp>
#include <relay/kernel/capability_registry.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace relay_event {

// =============================================================================
// Event Bus
// =============================================================================

class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    // Non-copyable
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // =========================================================================
    // Instances
    // =========================================================================

    /// Register a running instance and the queue its callbacks run on
    [[nodiscard]] relay_core::Result<void> attach_instance(
        const std::string& instance_id, std::shared_ptr<relay_exec::ExecutionQueue> queue);

    /// Forget an instance and every subscription in it
    void detach_instance(const std::string& instance_id);

    [[nodiscard]] bool is_attached(const std::string& instance_id) const;

    /// Queue of an attached instance, or nullptr
    [[nodiscard]] std::shared_ptr<relay_exec::ExecutionQueue> queue(const std::string& instance_id) const;

    // =========================================================================
    // Subscription
    // =========================================================================

    /// Append a callback to the list for (context instance, event name)
    [[nodiscard]] relay_core::Result<SubscriptionId> on(const relay_kernel::ScriptContext& context,
                                                        const std::string& event_name,
                                                        EventCallback callback);

    /// Remove one subscription; an in-flight dispatch skips it
    /// @return false if the instance or subscription is unknown
    bool off(const std::string& instance_id, SubscriptionId id);

    /// Remove every subscription of a context; in-flight dispatches skip them
    void remove_context(ContextId context);

    /// Subscriptions currently registered for a name in an instance
    [[nodiscard]] std::size_t subscriber_count(const std::string& instance_id,
                                               const std::string& event_name) const;

    // =========================================================================
    // Emission
    // =========================================================================

    /// Local delivery within the context's instance
    [[nodiscard]] relay_core::Result<void> emit(const relay_kernel::ScriptContext& context,
                                                const std::string& event_name,
                                                relay_core::Value payload);

    /// Delivery to one context's subscribers only
    [[nodiscard]] relay_core::Result<void> emit_to(const std::string& instance_id,
                                                   ContextId target,
                                                   const std::string& event_name,
                                                   relay_core::Value payload,
                                                   DeliveryGuard guard = nullptr);

    /// Host-origin local delivery (backend adapters, lifecycle)
    [[nodiscard]] relay_core::Result<void> emit_host(const std::string& instance_id,
                                                     const std::string& event_name,
                                                     relay_core::Value payload);

    /// Delivery to every attached instance with subscribers, originator included
    [[nodiscard]] relay_core::Result<void> broadcast(const relay_kernel::ScriptContext& context,
                                                     const std::string& event_name,
                                                     relay_core::Value payload);

    /// Host-origin broadcast
    void broadcast_host(const std::string& event_name, relay_core::Value payload);

    // =========================================================================
    // Statistics
    // =========================================================================

    [[nodiscard]] EventBusStats stats() const;

private:
    struct Subscription {
        SubscriptionId id;
        ContextId context;
        std::string script;
        EventCallback callback;
        std::atomic<bool> active{true};
    };

    using SubscriptionPtr = std::shared_ptr<Subscription>;

    struct InstanceEntry {
        std::string id;
        std::shared_ptr<relay_exec::ExecutionQueue> queue;
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::vector<SubscriptionPtr>> listeners;
    };

    using InstancePtr = std::shared_ptr<InstanceEntry>;

    [[nodiscard]] InstancePtr find_instance(const std::string& instance_id) const;

    /// Snapshot the listeners of a name, optionally restricted to one context
    static std::vector<SubscriptionPtr> snapshot(const InstanceEntry& entry,
                                                 const std::string& event_name,
                                                 ContextId only_context);

    /// Post one dispatch task for a snapshot
    void dispatch(const InstanceEntry& entry, std::vector<SubscriptionPtr> subscribers,
                  Event event, DeliveryGuard guard);

    void invoke(const Subscription& subscription, const Event& event);

    mutable std::shared_mutex m_mutex;
    std::map<std::string, InstancePtr> m_instances;
    std::atomic<std::uint64_t> m_next_subscription_id{1};

    std::atomic<std::uint64_t> m_emitted{0};
    std::atomic<std::uint64_t> m_broadcast{0};
    std::atomic<std::uint64_t> m_posted{0};
    std::atomic<std::uint64_t> m_invoked{0};
    std::atomic<std::uint64_t> m_failures{0};
    std::atomic<std::uint64_t> m_dropped{0};
};

} // namespace relay_event
