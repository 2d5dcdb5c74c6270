/// @file event_bus.cpp
/// @brief EventBus implementation

#include <relay/event/event_bus.hpp>
#include <relay/core/log.hpp>

#include <algorithm>

namespace relay_event {

using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Ok;
using relay_core::Result;
using relay_core::Value;

const char* to_string(DeliveryMode mode) {
    switch (mode) {
        case DeliveryMode::Local: return "local";
        case DeliveryMode::Broadcast: return "broadcast";
        case DeliveryMode::Context: return "context";
        default: return "unknown";
    }
}

// =============================================================================
// Instances
// =============================================================================

Result<void> EventBus::attach_instance(const std::string& instance_id,
                                       std::shared_ptr<relay_exec::ExecutionQueue> queue) {
    if (!queue) {
        return Err(Error(ErrorCode::InvalidArgument, "Instance '" + instance_id + "' has no queue"));
    }

    auto entry = std::make_shared<InstanceEntry>();
    entry->id = instance_id;
    entry->queue = std::move(queue);

    std::unique_lock lock(m_mutex);
    if (m_instances.count(instance_id) > 0) {
        return Err(Error(ErrorCode::AlreadyExists, "Instance already attached: " + instance_id));
    }
    m_instances.emplace(instance_id, std::move(entry));
    relay_core::event_logger()->debug("Attached instance '{}'", instance_id);
    return Ok();
}

void EventBus::detach_instance(const std::string& instance_id) {
    InstancePtr entry;
    {
        std::unique_lock lock(m_mutex);
        auto it = m_instances.find(instance_id);
        if (it == m_instances.end()) {
            return;
        }
        entry = std::move(it->second);
        m_instances.erase(it);
    }

    std::lock_guard lock(entry->mutex);
    for (auto& [name, subscribers] : entry->listeners) {
        for (auto& sub : subscribers) {
            sub->active.store(false, std::memory_order_release);
        }
    }
    entry->listeners.clear();
    relay_core::event_logger()->debug("Detached instance '{}'", instance_id);
}

bool EventBus::is_attached(const std::string& instance_id) const {
    std::shared_lock lock(m_mutex);
    return m_instances.count(instance_id) > 0;
}

std::shared_ptr<relay_exec::ExecutionQueue> EventBus::queue(const std::string& instance_id) const {
    auto entry = find_instance(instance_id);
    return entry ? entry->queue : nullptr;
}

EventBus::InstancePtr EventBus::find_instance(const std::string& instance_id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_instances.find(instance_id);
    return it != m_instances.end() ? it->second : nullptr;
}

// =============================================================================
// Subscription
// =============================================================================

Result<SubscriptionId> EventBus::on(const relay_kernel::ScriptContext& context,
                                    const std::string& event_name,
                                    EventCallback callback) {
    if (event_name.empty()) {
        return Err<SubscriptionId>(Error(ErrorCode::InvalidArgument, "Event name must not be empty"));
    }
    if (!callback) {
        return Err<SubscriptionId>(Error(ErrorCode::InvalidArgument, "Event callback must not be empty"));
    }

    auto entry = find_instance(context.instance_id());
    if (!entry) {
        return Err<SubscriptionId>(Error(ErrorCode::InvalidState,
            "Instance '" + context.instance_id() + "' is not running"));
    }

    auto sub = std::make_shared<Subscription>();
    sub->id = SubscriptionId{m_next_subscription_id.fetch_add(1, std::memory_order_relaxed)};
    sub->context = context.id();
    sub->script = context.script();
    sub->callback = std::move(callback);

    std::lock_guard lock(entry->mutex);
    // Checked under the lock so a concurrent remove_context cannot miss it
    if (!context.is_active()) {
        return Err<SubscriptionId>(Error(ErrorCode::InvalidState,
            "Script '" + context.script() + "' has been unloaded"));
    }
    entry->listeners[event_name].push_back(sub);
    return sub->id;
}

bool EventBus::off(const std::string& instance_id, SubscriptionId id) {
    auto entry = find_instance(instance_id);
    if (!entry) {
        return false;
    }

    std::lock_guard lock(entry->mutex);
    for (auto it = entry->listeners.begin(); it != entry->listeners.end(); ++it) {
        auto& subscribers = it->second;
        auto found = std::find_if(subscribers.begin(), subscribers.end(),
            [id](const SubscriptionPtr& sub) { return sub->id == id; });
        if (found == subscribers.end()) {
            continue;
        }
        (*found)->active.store(false, std::memory_order_release);
        subscribers.erase(found);
        if (subscribers.empty()) {
            entry->listeners.erase(it);
        }
        return true;
    }
    return false;
}

void EventBus::remove_context(ContextId context) {
    std::vector<InstancePtr> entries;
    {
        std::shared_lock lock(m_mutex);
        for (const auto& [id, entry] : m_instances) {
            entries.push_back(entry);
        }
    }

    std::size_t removed = 0;
    for (auto& entry : entries) {
        std::lock_guard lock(entry->mutex);
        for (auto it = entry->listeners.begin(); it != entry->listeners.end();) {
            auto& subscribers = it->second;
            for (auto& sub : subscribers) {
                if (sub->context == context) {
                    sub->active.store(false, std::memory_order_release);
                    ++removed;
                }
            }
            subscribers.erase(std::remove_if(subscribers.begin(), subscribers.end(),
                [context](const SubscriptionPtr& sub) { return sub->context == context; }),
                subscribers.end());
            it = subscribers.empty() ? entry->listeners.erase(it) : std::next(it);
        }
    }

    if (removed > 0) {
        relay_core::event_logger()->debug("Removed {} subscriptions of context {}", removed, context.value);
    }
}

std::size_t EventBus::subscriber_count(const std::string& instance_id, const std::string& event_name) const {
    auto entry = find_instance(instance_id);
    if (!entry) {
        return 0;
    }
    std::lock_guard lock(entry->mutex);
    auto it = entry->listeners.find(event_name);
    return it != entry->listeners.end() ? it->second.size() : 0;
}

// =============================================================================
// Emission
// =============================================================================

std::vector<EventBus::SubscriptionPtr> EventBus::snapshot(const InstanceEntry& entry,
                                                          const std::string& event_name,
                                                          ContextId only_context) {
    std::vector<SubscriptionPtr> result;
    std::lock_guard lock(entry.mutex);
    auto it = entry.listeners.find(event_name);
    if (it == entry.listeners.end()) {
        return result;
    }
    for (const auto& sub : it->second) {
        if (!only_context.is_valid() || sub->context == only_context) {
            result.push_back(sub);
        }
    }
    return result;
}

void EventBus::dispatch(const InstanceEntry& entry, std::vector<SubscriptionPtr> subscribers,
                        Event event, DeliveryGuard guard) {
    if (subscribers.empty()) {
        return;
    }

    bool posted = entry.queue->post(
        [this, subscribers = std::move(subscribers), event = std::move(event), guard = std::move(guard)]() {
            if (guard && !guard()) {
                m_dropped.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            for (const auto& sub : subscribers) {
                if (!sub->active.load(std::memory_order_acquire)) {
                    continue;
                }
                invoke(*sub, event);
            }
        });

    if (posted) {
        m_posted.fetch_add(1, std::memory_order_relaxed);
    } else {
        m_dropped.fetch_add(1, std::memory_order_relaxed);
    }
}

void EventBus::invoke(const Subscription& subscription, const Event& event) {
    m_invoked.fetch_add(1, std::memory_order_relaxed);
    try {
        subscription.callback(event);
    } catch (const std::exception& e) {
        m_failures.fetch_add(1, std::memory_order_relaxed);
        relay_core::Error err = relay_core::SubscriberError::threw(event.name, subscription.script, e.what());
        relay_core::event_logger()->error("{}", relay_core::build_error_chain(err));
    } catch (...) {
        m_failures.fetch_add(1, std::memory_order_relaxed);
        relay_core::Error err = relay_core::SubscriberError::threw(event.name, subscription.script, "unknown exception");
        relay_core::event_logger()->error("{}", relay_core::build_error_chain(err));
    }
}

Result<void> EventBus::emit(const relay_kernel::ScriptContext& context,
                            const std::string& event_name,
                            Value payload) {
    if (!context.is_active()) {
        return Err(Error(ErrorCode::InvalidState, "Script '" + context.script() + "' has been unloaded"));
    }
    auto entry = find_instance(context.instance_id());
    if (!entry) {
        return Err(Error(ErrorCode::InvalidState, "Instance '" + context.instance_id() + "' is not running"));
    }

    m_emitted.fetch_add(1, std::memory_order_relaxed);
    Event event{event_name, std::move(payload), context.id(), context.instance_id(), DeliveryMode::Local};
    dispatch(*entry, snapshot(*entry, event_name, ContextId{}), std::move(event), nullptr);
    return Ok();
}

Result<void> EventBus::emit_to(const std::string& instance_id,
                               ContextId target,
                               const std::string& event_name,
                               Value payload,
                               DeliveryGuard guard) {
    if (!target.is_valid()) {
        return Err(Error(ErrorCode::InvalidArgument, "Context-scoped delivery needs a target context"));
    }
    auto entry = find_instance(instance_id);
    if (!entry) {
        return Err(Error(ErrorCode::InvalidState, "Instance '" + instance_id + "' is not running"));
    }

    m_emitted.fetch_add(1, std::memory_order_relaxed);
    Event event{event_name, std::move(payload), ContextId{}, instance_id, DeliveryMode::Context};
    dispatch(*entry, snapshot(*entry, event_name, target), std::move(event), std::move(guard));
    return Ok();
}

Result<void> EventBus::emit_host(const std::string& instance_id,
                                 const std::string& event_name,
                                 Value payload) {
    auto entry = find_instance(instance_id);
    if (!entry) {
        return Err(Error(ErrorCode::InvalidState, "Instance '" + instance_id + "' is not running"));
    }

    m_emitted.fetch_add(1, std::memory_order_relaxed);
    Event event{event_name, std::move(payload), ContextId{}, instance_id, DeliveryMode::Local};
    dispatch(*entry, snapshot(*entry, event_name, ContextId{}), std::move(event), nullptr);
    return Ok();
}

Result<void> EventBus::broadcast(const relay_kernel::ScriptContext& context,
                                 const std::string& event_name,
                                 Value payload) {
    if (!context.is_active()) {
        return Err(Error(ErrorCode::InvalidState, "Script '" + context.script() + "' has been unloaded"));
    }

    std::vector<InstancePtr> entries;
    {
        std::shared_lock lock(m_mutex);
        for (const auto& [id, entry] : m_instances) {
            entries.push_back(entry);
        }
    }

    m_broadcast.fetch_add(1, std::memory_order_relaxed);
    for (const auto& entry : entries) {
        Event event{event_name, payload, context.id(), context.instance_id(), DeliveryMode::Broadcast};
        dispatch(*entry, snapshot(*entry, event_name, ContextId{}), std::move(event), nullptr);
    }
    return Ok();
}

void EventBus::broadcast_host(const std::string& event_name, Value payload) {
    std::vector<InstancePtr> entries;
    {
        std::shared_lock lock(m_mutex);
        for (const auto& [id, entry] : m_instances) {
            entries.push_back(entry);
        }
    }

    m_broadcast.fetch_add(1, std::memory_order_relaxed);
    for (const auto& entry : entries) {
        Event event{event_name, payload, ContextId{}, std::string{}, DeliveryMode::Broadcast};
        dispatch(*entry, snapshot(*entry, event_name, ContextId{}), std::move(event), nullptr);
    }
}

// =============================================================================
// Statistics
// =============================================================================

EventBusStats EventBus::stats() const {
    EventBusStats s;
    s.events_emitted = m_emitted.load(std::memory_order_relaxed);
    s.events_broadcast = m_broadcast.load(std::memory_order_relaxed);
    s.dispatches_posted = m_posted.load(std::memory_order_relaxed);
    s.callbacks_invoked = m_invoked.load(std::memory_order_relaxed);
    s.subscriber_failures = m_failures.load(std::memory_order_relaxed);
    s.events_dropped = m_dropped.load(std::memory_order_relaxed);

    std::shared_lock lock(m_mutex);
    s.attached_instances = m_instances.size();
    for (const auto& [id, entry] : m_instances) {
        std::lock_guard entry_lock(entry->mutex);
        for (const auto& [name, subscribers] : entry->listeners) {
            s.active_subscriptions += subscribers.size();
        }
    }
    return s;
}

} // namespace relay_event
