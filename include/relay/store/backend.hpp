/// @file backend.hpp
/// @brief Durable backing for the scoped store

#pragma once

#include "types.hpp"

#include <relay/core/error.hpp>

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace relay_store {

// =============================================================================
// IStoreBackend
// =============================================================================

/// Persistence collaborator keyed by (scope, owner, key).
/// Implementations must accept calls from several threads.
class IStoreBackend {
public:
    virtual ~IStoreBackend() = default;

    /// Every persisted entry, read once at startup
    [[nodiscard]] virtual relay_core::Result<std::vector<StoredEntry>> load_all() = 0;

    /// Persist one value
    [[nodiscard]] virtual relay_core::Result<void> put(const BucketKey& bucket,
                                                       const std::string& key,
                                                       const relay_core::Value& value) = 0;

    /// Remove one value; removing an absent key succeeds
    [[nodiscard]] virtual relay_core::Result<void> erase(const BucketKey& bucket, const std::string& key) = 0;

    /// Backend name for logs
    [[nodiscard]] virtual const char* name() const = 0;
};

// =============================================================================
// MemoryBackend
// =============================================================================

/// Non-durable backend for tests and ephemeral hosts
class MemoryBackend : public IStoreBackend {
public:
    relay_core::Result<std::vector<StoredEntry>> load_all() override;
    relay_core::Result<void> put(const BucketKey& bucket, const std::string& key,
                                 const relay_core::Value& value) override;
    relay_core::Result<void> erase(const BucketKey& bucket, const std::string& key) override;
    const char* name() const override { return "memory"; }

    /// Number of persisted entries
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::map<BucketKey, std::map<std::string, relay_core::Value>> m_data;
};

// =============================================================================
// JsonFileBackend
// =============================================================================

/// Single JSON document on disk, rewritten through a temp file and rename
/// on every change.
///
/// Layout: `{"global": {"": {...}}, "script": {owner: {...}}, "instance": {owner: {...}}}`
class JsonFileBackend : public IStoreBackend {
public:
    explicit JsonFileBackend(std::filesystem::path path);

    relay_core::Result<std::vector<StoredEntry>> load_all() override;
    relay_core::Result<void> put(const BucketKey& bucket, const std::string& key,
                                 const relay_core::Value& value) override;
    relay_core::Result<void> erase(const BucketKey& bucket, const std::string& key) override;
    const char* name() const override { return "file"; }

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    relay_core::Result<void> write_document();

    std::filesystem::path m_path;
    std::mutex m_mutex;
    relay_core::Value m_document = relay_core::Value::object();
};

} // namespace relay_store
