/// @file database_session.cpp
/// @brief Database connections for the db module

#include <relay/net/session_manager.hpp>
#include <relay/core/log.hpp>

#include <boost/asio/post.hpp>

namespace relay_net {

namespace asio = boost::asio;

using relay_core::ConnectionError;
using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Ok;
using relay_core::Result;
using relay_core::Value;

namespace {

Result<void> check_database(const ConnectionPtr& conn, ConnectionId id) {
    if (!conn) {
        return Err(Error(ErrorCode::NotFound, "Unknown connection " + id.to_string()));
    }
    if (conn->kind() != ConnectionKind::Database) {
        return Err(Error(ErrorCode::InvalidArgument,
            "Connection " + id.to_string() + " is not a database connection"));
    }
    if (conn->state() != ConnectionState::Open) {
        return Err(ConnectionError::closed(conn->endpoint()));
    }
    return Ok();
}

} // anonymous namespace

// =============================================================================
// Open
// =============================================================================

Result<ConnectionId> SessionManager::open_database(const relay_kernel::ScriptContext& context,
                                                   const DbParams& params,
                                                   OpenCallback on_open) {
    if (auto valid = params.validate(); !valid) {
        return Err<ConnectionId>(valid.error());
    }

    auto created = create_connection(context, ConnectionKind::Database, params.endpoint(), std::move(on_open));
    if (!created) {
        return Err<ConnectionId>(created.error());
    }
    auto conn = created.value();

    relay_core::net_logger()->debug("Script '{}' opening {} database as connection {}",
        context.script(), params.driver, conn->id().value);

    asio::post(conn->strand(), [this, conn, params]() {
        if (!params.is_remote()) {
            open_database_session(conn, params);
            return;
        }

        // Reachability check before handing the server to a driver
        start_connect(conn, params.host, params.effective_port(),
            [this, conn, params](std::optional<Error> error) {
                if (error) {
                    finish_open(conn, std::move(error));
                    return;
                }
                boost::system::error_code ignored;
                if (conn->socket) {
                    conn->socket->close(ignored);
                    conn->socket.reset();
                }
                open_database_session(conn, params);
            });
    });

    return conn->id();
}

void SessionManager::open_database_session(const ConnectionPtr& conn, const DbParams& params) {
    if (conn->state() != ConnectionState::Connecting) {
        return;
    }

    auto driver = m_drivers->find(params.driver);
    if (!driver) {
        finish_open(conn, Error(ConnectionError::driver_unavailable(params.driver)));
        return;
    }

    auto session = driver->open(params);
    if (!session) {
        finish_open(conn, session.error());
        return;
    }

    conn->database = session.value();
    finish_open(conn, std::nullopt);
}

// =============================================================================
// Statements
// =============================================================================

Result<void> SessionManager::query(ConnectionId id, std::string sql, Value params, QueryCallback callback) {
    auto conn = find(id);
    if (auto usable = check_database(conn, id); !usable) {
        return usable;
    }

    asio::post(conn->strand(), [conn, sql = std::move(sql), params = std::move(params),
                                callback = std::move(callback)]() mutable {
        std::optional<Error> error;
        Value rows = Value::array();

        if (!conn->database || conn->closed_locally()) {
            error = Error(ConnectionError::closed(conn->endpoint()));
        } else if (auto ran = conn->database->query(sql, params, rows); !ran) {
            error = ran.error();
            rows = Value::array();
        }

        if (error) {
            relay_core::net_logger()->debug("Query on connection {} failed: {}",
                conn->id().value, error->message());
        }
        if (!callback) {
            return;
        }
        conn->queue()->post([conn, callback = std::move(callback), error = std::move(error),
                             rows = std::move(rows)]() {
            if (conn->closed_locally()) {
                return;
            }
            callback(error ? &*error : nullptr, rows);
        });
    });
    return Ok();
}

Result<void> SessionManager::exec(ConnectionId id, std::string sql, Value params, ExecCallback callback) {
    auto conn = find(id);
    if (auto usable = check_database(conn, id); !usable) {
        return usable;
    }

    asio::post(conn->strand(), [conn, sql = std::move(sql), params = std::move(params),
                                callback = std::move(callback)]() mutable {
        std::optional<Error> error;

        if (!conn->database || conn->closed_locally()) {
            error = Error(ConnectionError::closed(conn->endpoint()));
        } else if (auto ran = conn->database->exec(sql, params); !ran) {
            error = ran.error();
        } else {
            relay_core::net_logger()->trace("Statement on connection {} changed {} rows",
                conn->id().value, ran.value());
        }

        if (error) {
            relay_core::net_logger()->debug("Statement on connection {} failed: {}",
                conn->id().value, error->message());
        }
        if (!callback) {
            return;
        }
        conn->queue()->post([conn, callback = std::move(callback), error = std::move(error)]() {
            if (conn->closed_locally()) {
                return;
            }
            callback(error ? &*error : nullptr);
        });
    });
    return Ok();
}

} // namespace relay_net
