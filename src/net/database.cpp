/// @file database.cpp
/// @brief SQLite driver and driver registry
///
/// The PostgreSQL driver lives in postgres_driver.cpp.

#include <relay/net/database.hpp>
#include <relay/core/error.hpp>
#include <relay/core/log.hpp>

#include <sqlite3.h>

#include <vector>

namespace relay_net {

using relay_core::ConnectionError;
using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Ok;
using relay_core::Result;
using relay_core::Value;

namespace {

/// Finalizes a prepared statement on scope exit
class Statement {
public:
    Statement() = default;
    ~Statement() {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt** out() { return &m_stmt; }
    sqlite3_stmt* get() const { return m_stmt; }

private:
    sqlite3_stmt* m_stmt = nullptr;
};

Error sqlite_error(sqlite3* db, const std::string& what) {
    return Error(ConnectionError::query_failed(what + ": " + sqlite3_errmsg(db)));
}

Result<void> bind_params(sqlite3* db, sqlite3_stmt* stmt, const Value& params) {
    if (params.is_null()) {
        return Ok();
    }
    if (!params.is_array()) {
        return Err(relay_core::ValidationError::invalid_params("params", "expected an array"));
    }

    int expected = sqlite3_bind_parameter_count(stmt);
    if (static_cast<int>(params.size()) != expected) {
        return Err(ConnectionError::query_failed("statement expects " + std::to_string(expected)
            + " parameters, got " + std::to_string(params.size())));
    }

    int index = 1;
    for (const auto& param : params) {
        int rc = SQLITE_OK;
        switch (param.type()) {
            case Value::value_t::null:
                rc = sqlite3_bind_null(stmt, index);
                break;
            case Value::value_t::boolean:
                rc = sqlite3_bind_int(stmt, index, param.get<bool>() ? 1 : 0);
                break;
            case Value::value_t::number_integer:
                rc = sqlite3_bind_int64(stmt, index, param.get<std::int64_t>());
                break;
            case Value::value_t::number_unsigned:
                rc = sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(param.get<std::uint64_t>()));
                break;
            case Value::value_t::number_float:
                rc = sqlite3_bind_double(stmt, index, param.get<double>());
                break;
            case Value::value_t::string: {
                const auto& text = param.get_ref<const std::string&>();
                rc = sqlite3_bind_text(stmt, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
                break;
            }
            case Value::value_t::binary: {
                const auto& blob = param.get_binary();
                rc = sqlite3_bind_blob(stmt, index, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
                break;
            }
            default: {
                auto text = relay_core::value_to_text(param);
                rc = sqlite3_bind_text(stmt, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
                break;
            }
        }
        if (rc != SQLITE_OK) {
            return Err(sqlite_error(db, "cannot bind parameter " + std::to_string(index)));
        }
        ++index;
    }
    return Ok();
}

Value column_value(sqlite3_stmt* stmt, int column) {
    switch (sqlite3_column_type(stmt, column)) {
        case SQLITE_INTEGER:
            return static_cast<std::int64_t>(sqlite3_column_int64(stmt, column));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, column);
        case SQLITE_TEXT: {
            auto* text = sqlite3_column_text(stmt, column);
            int size = sqlite3_column_bytes(stmt, column);
            return relay_core::bytes_value(relay_core::Bytes(text, text + size));
        }
        case SQLITE_BLOB: {
            auto* blob = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, column));
            int size = sqlite3_column_bytes(stmt, column);
            if (!blob) {
                return relay_core::bytes_value({});
            }
            return relay_core::bytes_value(relay_core::Bytes(blob, blob + size));
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

} // anonymous namespace

// =============================================================================
// SqliteSession
// =============================================================================

SqliteSession::SqliteSession(sqlite3* db)
    : m_db(db)
{
}

SqliteSession::~SqliteSession() {
    close();
}

Result<void> SqliteSession::query(const std::string& sql, const Value& params, Value& rows) {
    if (!m_db) {
        return Err(ConnectionError::closed("sqlite3"));
    }

    Statement stmt;
    if (sqlite3_prepare_v2(m_db, sql.c_str(), static_cast<int>(sql.size()), stmt.out(), nullptr) != SQLITE_OK) {
        return Err(sqlite_error(m_db, "cannot prepare statement"));
    }
    if (!stmt.get()) {
        rows = Value::array();
        return Ok();
    }
    if (auto r = bind_params(m_db, stmt.get(), params); !r) {
        return r;
    }

    Value result = Value::array();
    int columns = sqlite3_column_count(stmt.get());
    for (;;) {
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            return Err(sqlite_error(m_db, "statement failed"));
        }
        Value row = Value::object();
        for (int c = 0; c < columns; ++c) {
            row[sqlite3_column_name(stmt.get(), c)] = column_value(stmt.get(), c);
        }
        result.push_back(std::move(row));
    }

    rows = std::move(result);
    return Ok();
}

Result<std::uint64_t> SqliteSession::exec(const std::string& sql, const Value& params) {
    if (!m_db) {
        return Err<std::uint64_t>(ConnectionError::closed("sqlite3"));
    }

    Statement stmt;
    if (sqlite3_prepare_v2(m_db, sql.c_str(), static_cast<int>(sql.size()), stmt.out(), nullptr) != SQLITE_OK) {
        return Err<std::uint64_t>(sqlite_error(m_db, "cannot prepare statement"));
    }
    if (!stmt.get()) {
        return std::uint64_t{0};
    }
    if (auto r = bind_params(m_db, stmt.get(), params); !r) {
        return Err<std::uint64_t>(r.error());
    }

    int rc = SQLITE_ROW;
    while (rc == SQLITE_ROW) {
        rc = sqlite3_step(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        return Err<std::uint64_t>(sqlite_error(m_db, "statement failed"));
    }
    return static_cast<std::uint64_t>(sqlite3_changes(m_db));
}

void SqliteSession::close() {
    if (m_db) {
        sqlite3_close_v2(m_db);
        m_db = nullptr;
    }
}

// =============================================================================
// SqliteDriver
// =============================================================================

Result<std::shared_ptr<IDatabaseSession>> SqliteDriver::open(const DbParams& params) {
    using SessionPtr = std::shared_ptr<IDatabaseSession>;

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(":memory:", &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) {
            sqlite3_close_v2(db);
        }
        return Err<SessionPtr>(ConnectionError::connect_failed(params.endpoint(), reason));
    }

    relay_core::net_logger()->debug("Opened in-memory sqlite3 database");
    return SessionPtr(std::make_shared<SqliteSession>(db));
}

// =============================================================================
// DatabaseDriverRegistry
// =============================================================================

std::shared_ptr<DatabaseDriverRegistry> DatabaseDriverRegistry::with_builtin_drivers(
    std::chrono::milliseconds connect_timeout) {
    auto registry = std::make_shared<DatabaseDriverRegistry>();
    std::vector<std::shared_ptr<IDatabaseDriver>> builtin{
        std::make_shared<SqliteDriver>(),
        std::make_shared<PostgresDriver>(connect_timeout),
    };
    for (auto& driver : builtin) {
        std::string name = driver->name();
        if (auto registered = registry->register_driver(std::move(driver)); !registered) {
            relay_core::net_logger()->error("Cannot register database driver '{}': {}",
                name, relay_core::build_error_chain(registered.error()));
        }
    }
    return registry;
}

Result<void> DatabaseDriverRegistry::register_driver(std::shared_ptr<IDatabaseDriver> driver) {
    if (!driver) {
        return Err(Error(ErrorCode::InvalidArgument, "Driver must not be null"));
    }
    std::lock_guard lock(m_mutex);
    std::string name = driver->name();
    if (m_drivers.count(name) > 0) {
        return Err(Error(ErrorCode::AlreadyExists, "Database driver already registered: " + name));
    }
    m_drivers.emplace(std::move(name), std::move(driver));
    return Ok();
}

std::shared_ptr<IDatabaseDriver> DatabaseDriverRegistry::find(const std::string& name) const {
    std::lock_guard lock(m_mutex);
    auto it = m_drivers.find(name);
    return it != m_drivers.end() ? it->second : nullptr;
}

std::vector<std::string> DatabaseDriverRegistry::names() const {
    std::lock_guard lock(m_mutex);
    std::vector<std::string> result;
    for (const auto& [name, driver] : m_drivers) {
        result.push_back(name);
    }
    return result;
}

} // namespace relay_net
