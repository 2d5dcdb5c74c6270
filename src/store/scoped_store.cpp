/// @file scoped_store.cpp
/// @brief ScopedStore implementation

#include <relay/store/scoped_store.hpp>
#include <relay/core/log.hpp>

#include <mutex>

namespace relay_store {

using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Ok;
using relay_core::Result;
using relay_core::ValidationError;
using relay_core::Value;

ScopedStore::ScopedStore(std::shared_ptr<IStoreBackend> backend)
    : m_backend(std::move(backend))
{
    if (!m_backend) {
        m_backend = std::make_shared<MemoryBackend>();
    }
}

Result<void> ScopedStore::load() {
    auto entries = m_backend->load_all();
    if (!entries) {
        return Err(entries.error());
    }

    std::unique_lock lock(m_buckets_mutex);
    m_buckets.clear();
    for (auto& entry : *entries) {
        auto& slot = m_buckets[make_key(entry.bucket.scope, entry.bucket.owner)];
        if (!slot) {
            slot = std::make_unique<Bucket>();
        }
        slot->entries[entry.key] = std::move(entry.value);
    }

    relay_core::store_logger()->info("Store ready: {} entries in {} buckets ({} backend)",
        entries->size(), m_buckets.size(), m_backend->name());
    return Ok();
}

// =============================================================================
// Bucket Lookup
// =============================================================================

BucketKey ScopedStore::make_key(Scope scope, const std::string& owner) {
    if (scope == Scope::Global) {
        return BucketKey{Scope::Global, {}};
    }
    return BucketKey{scope, owner};
}

Result<void> ScopedStore::check_owner(Scope scope, const std::string& owner) {
    if (scope != Scope::Global && owner.empty()) {
        return Err(Error(ErrorCode::InvalidArgument,
            std::string("Store scope '") + to_string(scope) + "' needs an owner"));
    }
    return Ok();
}

ScopedStore::Bucket* ScopedStore::find_bucket(const BucketKey& key) const {
    std::shared_lock lock(m_buckets_mutex);
    auto it = m_buckets.find(key);
    return it != m_buckets.end() ? it->second.get() : nullptr;
}

ScopedStore::Bucket& ScopedStore::bucket(const BucketKey& key) {
    {
        std::shared_lock lock(m_buckets_mutex);
        auto it = m_buckets.find(key);
        if (it != m_buckets.end()) {
            return *it->second;
        }
    }

    std::unique_lock lock(m_buckets_mutex);
    auto& slot = m_buckets[key];
    if (!slot) {
        slot = std::make_unique<Bucket>();
    }
    return *slot;
}

// =============================================================================
// Operations
// =============================================================================

Result<void> ScopedStore::set(Scope scope, const std::string& owner, const std::string& key, Value value) {
    if (key.empty()) {
        m_validation_failures.fetch_add(1, std::memory_order_relaxed);
        return Err(ValidationError::invalid_key(key));
    }
    if (auto r = check_owner(scope, owner); !r) {
        m_validation_failures.fetch_add(1, std::memory_order_relaxed);
        return r;
    }
    if (auto r = relay_core::validate_value(value); !r) {
        m_validation_failures.fetch_add(1, std::memory_order_relaxed);
        return Err(r.error().with_context("key", key));
    }

    auto bucket_key = make_key(scope, owner);
    auto& target = bucket(bucket_key);

    std::unique_lock lock(target.mutex);
    if (auto r = m_backend->put(bucket_key, key, value); !r) {
        m_backend_failures.fetch_add(1, std::memory_order_relaxed);
        relay_core::store_logger()->error("Backend write of '{}' failed: {}", key, r.error().message());
        return r;
    }
    target.entries[key] = std::move(value);
    m_writes.fetch_add(1, std::memory_order_relaxed);
    return Ok();
}

std::optional<Value> ScopedStore::get(Scope scope, const std::string& owner, const std::string& key) const {
    m_reads.fetch_add(1, std::memory_order_relaxed);

    const Bucket* source = find_bucket(make_key(scope, owner));
    if (!source) {
        return std::nullopt;
    }

    std::shared_lock lock(source->mutex);
    auto it = source->entries.find(key);
    if (it == source->entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<void> ScopedStore::unset(Scope scope, const std::string& owner, const std::string& key) {
    if (key.empty()) {
        m_validation_failures.fetch_add(1, std::memory_order_relaxed);
        return Err(ValidationError::invalid_key(key));
    }

    auto bucket_key = make_key(scope, owner);
    Bucket* target = find_bucket(bucket_key);
    if (!target) {
        return Ok();
    }

    std::unique_lock lock(target->mutex);
    if (target->entries.count(key) == 0) {
        return Ok();
    }
    if (auto r = m_backend->erase(bucket_key, key); !r) {
        m_backend_failures.fetch_add(1, std::memory_order_relaxed);
        relay_core::store_logger()->error("Backend removal of '{}' failed: {}", key, r.error().message());
        return r;
    }
    target->entries.erase(key);
    m_removals.fetch_add(1, std::memory_order_relaxed);
    return Ok();
}

std::vector<std::string> ScopedStore::keys(Scope scope, const std::string& owner) const {
    std::vector<std::string> result;

    const Bucket* source = find_bucket(make_key(scope, owner));
    if (!source) {
        return result;
    }

    std::shared_lock lock(source->mutex);
    result.reserve(source->entries.size());
    for (const auto& [key, value] : source->entries) {
        result.push_back(key);
    }
    return result;
}

Value ScopedStore::all(Scope scope, const std::string& owner) const {
    Value result = Value::object();

    const Bucket* source = find_bucket(make_key(scope, owner));
    if (!source) {
        return result;
    }

    std::shared_lock lock(source->mutex);
    for (const auto& [key, value] : source->entries) {
        result[key] = value;
    }
    return result;
}

// =============================================================================
// Diagnostics
// =============================================================================

StoreStats ScopedStore::stats() const {
    StoreStats s;
    s.reads = m_reads.load(std::memory_order_relaxed);
    s.writes = m_writes.load(std::memory_order_relaxed);
    s.removals = m_removals.load(std::memory_order_relaxed);
    s.validation_failures = m_validation_failures.load(std::memory_order_relaxed);
    s.backend_failures = m_backend_failures.load(std::memory_order_relaxed);
    {
        std::shared_lock lock(m_buckets_mutex);
        s.buckets = m_buckets.size();
    }
    return s;
}

} // namespace relay_store
