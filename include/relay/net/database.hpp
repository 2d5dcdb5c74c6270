/// @file database.hpp
/// @brief Database drivers behind the db module
///
/// Sessions are used from one connection strand at a time and need no
/// locking of their own. The remote driver (postgres) is looked up in the
/// registry once the session manager has reached the server.

#pragma once

#include "types.hpp"

#include <relay/core/error.hpp>
#include <relay/core/value.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;
struct pg_conn;

namespace relay_net {

// =============================================================================
// Interfaces
// =============================================================================

/// One open database session
class IDatabaseSession {
public:
    virtual ~IDatabaseSession() = default;

    /// Run a statement and collect its rows as an array of objects.
    /// `?` placeholders bind the elements of params in order.
    [[nodiscard]] virtual relay_core::Result<void> query(const std::string& sql,
                                                         const relay_core::Value& params,
                                                         relay_core::Value& rows) = 0;

    /// Run a statement without rows
    /// @return number of changed rows
    [[nodiscard]] virtual relay_core::Result<std::uint64_t> exec(const std::string& sql,
                                                                 const relay_core::Value& params) = 0;

    virtual void close() = 0;
};

/// Factory for sessions of one driver name
class IDatabaseDriver {
public:
    virtual ~IDatabaseDriver() = default;

    [[nodiscard]] virtual const char* name() const = 0;

    [[nodiscard]] virtual relay_core::Result<std::shared_ptr<IDatabaseSession>> open(const DbParams& params) = 0;
};

// =============================================================================
// SQLite
// =============================================================================

/// In-memory SQLite session
class SqliteSession : public IDatabaseSession {
public:
    explicit SqliteSession(sqlite3* db);
    ~SqliteSession() override;

    SqliteSession(const SqliteSession&) = delete;
    SqliteSession& operator=(const SqliteSession&) = delete;

    relay_core::Result<void> query(const std::string& sql, const relay_core::Value& params,
                                   relay_core::Value& rows) override;
    relay_core::Result<std::uint64_t> exec(const std::string& sql, const relay_core::Value& params) override;
    void close() override;

private:
    sqlite3* m_db;
};

/// Built-in "sqlite3" driver; every session is a private in-memory database
class SqliteDriver : public IDatabaseDriver {
public:
    const char* name() const override { return "sqlite3"; }
    relay_core::Result<std::shared_ptr<IDatabaseSession>> open(const DbParams& params) override;
};

// =============================================================================
// PostgreSQL
// =============================================================================

/// Rewrite `?` placeholders as `$1`, `$2`, ... outside quoted literals,
/// identifiers and comments
/// @param count receives the number of placeholders
[[nodiscard]] std::string number_placeholders(const std::string& sql, std::size_t& count);

/// Session over one libpq connection. Parameters go as text, byte strings
/// as bytea; text columns come back as bytes.
class PostgresSession : public IDatabaseSession {
public:
    PostgresSession(pg_conn* conn, std::string endpoint);
    ~PostgresSession() override;

    PostgresSession(const PostgresSession&) = delete;
    PostgresSession& operator=(const PostgresSession&) = delete;

    relay_core::Result<void> query(const std::string& sql, const relay_core::Value& params,
                                   relay_core::Value& rows) override;
    relay_core::Result<std::uint64_t> exec(const std::string& sql, const relay_core::Value& params) override;
    void close() override;

private:
    pg_conn* m_conn;
    std::string m_endpoint;
};

/// Built-in "postgres" driver
class PostgresDriver : public IDatabaseDriver {
public:
    explicit PostgresDriver(std::chrono::milliseconds connect_timeout = std::chrono::seconds(5))
        : m_connect_timeout(connect_timeout) {}

    const char* name() const override { return "postgres"; }
    relay_core::Result<std::shared_ptr<IDatabaseSession>> open(const DbParams& params) override;

private:
    std::chrono::milliseconds m_connect_timeout;
};

// =============================================================================
// DatabaseDriverRegistry
// =============================================================================

class DatabaseDriverRegistry {
public:
    DatabaseDriverRegistry() = default;

    /// Registry holding the built-in drivers (sqlite3, postgres)
    [[nodiscard]] static std::shared_ptr<DatabaseDriverRegistry> with_builtin_drivers(
        std::chrono::milliseconds connect_timeout = std::chrono::seconds(5));

    /// @return AlreadyExists if a driver of that name is registered
    [[nodiscard]] relay_core::Result<void> register_driver(std::shared_ptr<IDatabaseDriver> driver);

    /// Driver for a name, or nullptr
    [[nodiscard]] std::shared_ptr<IDatabaseDriver> find(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> names() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<IDatabaseDriver>> m_drivers;
};

} // namespace relay_net
