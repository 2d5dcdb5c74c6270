/// @file backend.cpp
/// @brief Memory and JSON file store backends

#include <relay/store/backend.hpp>
#include <relay/core/log.hpp>

#include <fstream>
#include <sstream>
#include <system_error>

namespace relay_store {

using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Ok;
using relay_core::Result;
using relay_core::Value;

// =============================================================================
// Scope Names
// =============================================================================

const char* to_string(Scope scope) {
    switch (scope) {
        case Scope::Instance: return "instance";
        case Scope::Script: return "script";
        case Scope::Global: return "global";
        default: return "unknown";
    }
}

std::optional<Scope> scope_from_string(const std::string& name) {
    if (name == "instance") return Scope::Instance;
    if (name == "script") return Scope::Script;
    if (name == "global") return Scope::Global;
    return std::nullopt;
}

// =============================================================================
// MemoryBackend
// =============================================================================

Result<std::vector<StoredEntry>> MemoryBackend::load_all() {
    std::lock_guard lock(m_mutex);
    std::vector<StoredEntry> entries;
    for (const auto& [bucket, values] : m_data) {
        for (const auto& [key, value] : values) {
            entries.push_back(StoredEntry{bucket, key, value});
        }
    }
    return entries;
}

Result<void> MemoryBackend::put(const BucketKey& bucket, const std::string& key, const Value& value) {
    std::lock_guard lock(m_mutex);
    m_data[bucket][key] = value;
    return Ok();
}

Result<void> MemoryBackend::erase(const BucketKey& bucket, const std::string& key) {
    std::lock_guard lock(m_mutex);
    auto it = m_data.find(bucket);
    if (it != m_data.end()) {
        it->second.erase(key);
        if (it->second.empty()) {
            m_data.erase(it);
        }
    }
    return Ok();
}

std::size_t MemoryBackend::size() const {
    std::lock_guard lock(m_mutex);
    std::size_t count = 0;
    for (const auto& [bucket, values] : m_data) {
        count += values.size();
    }
    return count;
}

// =============================================================================
// JsonFileBackend
// =============================================================================

JsonFileBackend::JsonFileBackend(std::filesystem::path path)
    : m_path(std::move(path))
{
}

Result<std::vector<StoredEntry>> JsonFileBackend::load_all() {
    std::lock_guard lock(m_mutex);
    std::vector<StoredEntry> entries;

    std::error_code ec;
    if (!std::filesystem::exists(m_path, ec)) {
        relay_core::store_logger()->info("Store file {} does not exist yet, starting empty", m_path.string());
        m_document = Value::object();
        return entries;
    }

    std::ifstream file(m_path);
    if (!file) {
        return Err<std::vector<StoredEntry>>(Error(ErrorCode::IOError,
            "Cannot open store file: " + m_path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Value document;
    try {
        document = Value::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        return Err<std::vector<StoredEntry>>(Error(ErrorCode::ParseError,
            "Store file " + m_path.string() + " is corrupt: " + e.what()));
    }

    if (!document.is_object()) {
        return Err<std::vector<StoredEntry>>(Error(ErrorCode::ParseError,
            "Store file " + m_path.string() + " is not a JSON object"));
    }

    for (const auto& [scope_name, owners] : document.items()) {
        auto scope = scope_from_string(scope_name);
        if (!scope || !owners.is_object()) {
            relay_core::store_logger()->warn("Skipping unknown store section '{}'", scope_name);
            continue;
        }
        for (const auto& [owner, values] : owners.items()) {
            if (!values.is_object()) {
                continue;
            }
            for (const auto& [key, value] : values.items()) {
                entries.push_back(StoredEntry{BucketKey{*scope, owner}, key, value});
            }
        }
    }

    m_document = std::move(document);
    relay_core::store_logger()->info("Loaded {} store entries from {}", entries.size(), m_path.string());
    return entries;
}

Result<void> JsonFileBackend::put(const BucketKey& bucket, const std::string& key, const Value& value) {
    std::lock_guard lock(m_mutex);

    auto& slot = m_document[to_string(bucket.scope)][bucket.owner];
    std::optional<Value> previous;
    if (slot.contains(key)) {
        previous = slot[key];
    }
    slot[key] = value;

    auto written = write_document();
    if (!written) {
        if (previous) {
            slot[key] = std::move(*previous);
        } else {
            slot.erase(key);
        }
    }
    return written;
}

Result<void> JsonFileBackend::erase(const BucketKey& bucket, const std::string& key) {
    std::lock_guard lock(m_mutex);

    const char* scope_name = to_string(bucket.scope);
    if (!m_document.contains(scope_name) || !m_document[scope_name].contains(bucket.owner)) {
        return Ok();
    }
    auto& slot = m_document[scope_name][bucket.owner];
    if (!slot.contains(key)) {
        return Ok();
    }

    Value previous = slot[key];
    slot.erase(key);

    auto written = write_document();
    if (!written) {
        slot[key] = std::move(previous);
    }
    return written;
}

Result<void> JsonFileBackend::write_document() {
    std::error_code ec;
    if (m_path.has_parent_path()) {
        std::filesystem::create_directories(m_path.parent_path(), ec);
        if (ec) {
            return Err(Error(ErrorCode::IOError,
                "Cannot create store directory " + m_path.parent_path().string() + ": " + ec.message()));
        }
    }

    auto temp_path = m_path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file) {
            return Err(Error(ErrorCode::IOError, "Cannot write store file: " + temp_path.string()));
        }
        file << m_document.dump(2);
        if (!file) {
            return Err(Error(ErrorCode::IOError, "Short write to store file: " + temp_path.string()));
        }
    }

    std::filesystem::rename(temp_path, m_path, ec);
    if (ec) {
        return Err(Error(ErrorCode::IOError,
            "Cannot replace store file " + m_path.string() + ": " + ec.message()));
    }
    return Ok();
}

} // namespace relay_store
