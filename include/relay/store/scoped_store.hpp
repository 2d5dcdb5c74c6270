/// @file scoped_store.hpp
/// @brief Tiered key/value store shared by every script and instance
///
/// Keys live in buckets identified by (scope, owner). Each bucket has its
/// own reader/writer lock, so operations on one key are linearizable while
/// unrelated buckets never contend. There are no cross-key transactions:
/// keys() and all() are consistent snapshots of one bucket, nothing more.

#pragma once

#include "types.hpp"
#include "backend.hpp"

#include <relay/core/error.hpp>
#include <relay/core/value.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace relay_store {

// =============================================================================
// ScopedStore
// =============================================================================

class ScopedStore {
public:
    explicit ScopedStore(std::shared_ptr<IStoreBackend> backend);

    ScopedStore(const ScopedStore&) = delete;
    ScopedStore& operator=(const ScopedStore&) = delete;

    /// Populate the buckets from the backend; call once before use
    [[nodiscard]] relay_core::Result<void> load();

    // =========================================================================
    // Operations
    // =========================================================================

    /// Store a value, replacing any previous one.
    /// @return ValidationError for an empty key or a value that is not a
    ///         finite serializable tree; backend errors otherwise
    [[nodiscard]] relay_core::Result<void> set(Scope scope, const std::string& owner,
                                               const std::string& key, relay_core::Value value);

    /// Read a value; nullopt when absent (a stored null is returned as null)
    [[nodiscard]] std::optional<relay_core::Value> get(Scope scope, const std::string& owner,
                                                       const std::string& key) const;

    /// Remove a value; removing an absent key is a no-op
    [[nodiscard]] relay_core::Result<void> unset(Scope scope, const std::string& owner,
                                                 const std::string& key);

    /// Sorted keys of one bucket
    [[nodiscard]] std::vector<std::string> keys(Scope scope, const std::string& owner) const;

    /// All entries of one bucket as a JSON object
    [[nodiscard]] relay_core::Value all(Scope scope, const std::string& owner) const;

    // =========================================================================
    // Diagnostics
    // =========================================================================

    [[nodiscard]] StoreStats stats() const;

    [[nodiscard]] const IStoreBackend& backend() const { return *m_backend; }

private:
    struct Bucket {
        mutable std::shared_mutex mutex;
        std::map<std::string, relay_core::Value> entries;
    };

    /// Global scope ignores the owner
    static BucketKey make_key(Scope scope, const std::string& owner);

    static relay_core::Result<void> check_owner(Scope scope, const std::string& owner);

    [[nodiscard]] Bucket* find_bucket(const BucketKey& key) const;
    Bucket& bucket(const BucketKey& key);

    std::shared_ptr<IStoreBackend> m_backend;

    mutable std::shared_mutex m_buckets_mutex;
    std::map<BucketKey, std::unique_ptr<Bucket>> m_buckets;

    mutable std::atomic<std::uint64_t> m_reads{0};
    std::atomic<std::uint64_t> m_writes{0};
    std::atomic<std::uint64_t> m_removals{0};
    std::atomic<std::uint64_t> m_validation_failures{0};
    std::atomic<std::uint64_t> m_backend_failures{0};
};

} // namespace relay_store
