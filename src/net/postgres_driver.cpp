/// @file postgres_driver.cpp
/// @brief PostgreSQL driver over libpq

#include <relay/net/database.hpp>
#include <relay/core/log.hpp>

#include <libpq-fe.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string_view>
#include <vector>

namespace relay_net {

using relay_core::ConnectionError;
using relay_core::Err;
using relay_core::Ok;
using relay_core::Result;
using relay_core::Value;

namespace {

// Type OIDs from pg_type.h
constexpr Oid kBoolOid = 16;
constexpr Oid kByteaOid = 17;
constexpr Oid kInt8Oid = 20;
constexpr Oid kInt2Oid = 21;
constexpr Oid kInt4Oid = 23;
constexpr Oid kFloat4Oid = 700;
constexpr Oid kFloat8Oid = 701;

using ResultPtr = std::unique_ptr<PGresult, decltype(&PQclear)>;

std::string connection_message(PGconn* conn) {
    std::string message = conn ? PQerrorMessage(conn) : "out of memory";
    while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
        message.pop_back();
    }
    return message;
}

/// Parameter arrays handed to PQexecParams; the strings own the text
struct BoundParams {
    std::vector<std::string> text;
    std::vector<const char*> values;
    std::vector<int> lengths;
    std::vector<int> formats;
    std::vector<Oid> types;
};

Result<void> bind_params(const Value& params, std::size_t expected, BoundParams& bound) {
    if (params.is_null()) {
        if (expected != 0) {
            return Err(ConnectionError::query_failed("statement expects " + std::to_string(expected)
                + " parameters, got 0"));
        }
        return Ok();
    }
    if (!params.is_array()) {
        return Err(relay_core::ValidationError::invalid_params("params", "expected an array"));
    }
    if (params.size() != expected) {
        return Err(ConnectionError::query_failed("statement expects " + std::to_string(expected)
            + " parameters, got " + std::to_string(params.size())));
    }

    const std::size_t count = params.size();
    bound.text.resize(count);
    bound.values.assign(count, nullptr);
    bound.lengths.assign(count, 0);
    bound.formats.assign(count, 0);
    bound.types.assign(count, 0);

    for (std::size_t i = 0; i < count; ++i) {
        const auto& param = params[i];
        switch (param.type()) {
            case Value::value_t::null:
                continue;
            case Value::value_t::boolean:
                bound.text[i] = param.get<bool>() ? "true" : "false";
                break;
            case Value::value_t::number_integer:
            case Value::value_t::number_unsigned:
            case Value::value_t::number_float:
                bound.text[i] = param.dump();
                break;
            case Value::value_t::string:
                bound.text[i] = param.get_ref<const std::string&>();
                break;
            case Value::value_t::binary: {
                const auto& blob = param.get_binary();
                bound.text[i].assign(blob.begin(), blob.end());
                bound.formats[i] = 1;
                bound.types[i] = kByteaOid;
                break;
            }
            default:
                bound.text[i] = relay_core::value_to_text(param);
                break;
        }
        bound.values[i] = bound.text[i].c_str();
        bound.lengths[i] = static_cast<int>(bound.text[i].size());
    }
    return Ok();
}

template <typename T>
Value parse_number(const char* text, int length) {
    T number{};
    auto [end, ec] = std::from_chars(text, text + length, number);
    if (ec != std::errc() || end != text + length) {
        return relay_core::bytes_value(relay_core::Bytes(text, text + length));
    }
    return number;
}

Value column_value(const PGresult* result, int row, int column) {
    if (PQgetisnull(result, row, column)) {
        return nullptr;
    }
    const char* text = PQgetvalue(result, row, column);
    const int length = PQgetlength(result, row, column);

    switch (PQftype(result, column)) {
        case kBoolOid:
            return length > 0 && text[0] == 't';
        case kInt2Oid:
        case kInt4Oid:
        case kInt8Oid:
            return parse_number<std::int64_t>(text, length);
        case kFloat4Oid:
        case kFloat8Oid: {
            // from_chars for double is missing from older libstdc++
            std::string copy(text, static_cast<std::size_t>(length));
            char* end = nullptr;
            double number = std::strtod(copy.c_str(), &end);
            if (end != copy.c_str() + copy.size()) {
                return relay_core::bytes_value(relay_core::Bytes(copy.begin(), copy.end()));
            }
            return number;
        }
        case kByteaOid: {
            std::size_t size = 0;
            unsigned char* raw = PQunescapeBytea(reinterpret_cast<const unsigned char*>(text), &size);
            if (!raw) {
                return relay_core::bytes_value({});
            }
            relay_core::Bytes bytes(raw, raw + size);
            PQfreemem(raw);
            return relay_core::bytes_value(std::move(bytes));
        }
        default:
            return relay_core::bytes_value(relay_core::Bytes(text, text + length));
    }
}

} // anonymous namespace

// =============================================================================
// Placeholders
// =============================================================================

std::string number_placeholders(const std::string& sql, std::size_t& count) {
    std::string out;
    out.reserve(sql.size() + 8);
    count = 0;

    std::size_t i = 0;
    while (i < sql.size()) {
        char c = sql[i];
        if (c == '\'' || c == '"') {
            // Doubled quotes reopen the literal on the next pass
            std::size_t close = sql.find(c, i + 1);
            std::size_t end = close == std::string::npos ? sql.size() : close + 1;
            out.append(sql, i, end - i);
            i = end;
        } else if (c == '-' && i + 1 < sql.size() && sql[i + 1] == '-') {
            std::size_t end = std::min(sql.find('\n', i), sql.size());
            out.append(sql, i, end - i);
            i = end;
        } else if (c == '/' && i + 1 < sql.size() && sql[i + 1] == '*') {
            std::size_t close = sql.find("*/", i + 2);
            std::size_t end = close == std::string::npos ? sql.size() : close + 2;
            out.append(sql, i, end - i);
            i = end;
        } else if (c == '?') {
            out += '$';
            out += std::to_string(++count);
            ++i;
        } else {
            out += c;
            ++i;
        }
    }
    return out;
}

// =============================================================================
// PostgresSession
// =============================================================================

PostgresSession::PostgresSession(pg_conn* conn, std::string endpoint)
    : m_conn(conn)
    , m_endpoint(std::move(endpoint))
{
}

PostgresSession::~PostgresSession() {
    close();
}

Result<void> PostgresSession::query(const std::string& sql, const Value& params, Value& rows) {
    if (!m_conn) {
        return Err(ConnectionError::closed(m_endpoint));
    }

    std::size_t expected = 0;
    std::string statement = number_placeholders(sql, expected);
    BoundParams bound;
    if (auto r = bind_params(params, expected, bound); !r) {
        return r;
    }

    ResultPtr result(PQexecParams(m_conn, statement.c_str(), static_cast<int>(expected),
                                  bound.types.empty() ? nullptr : bound.types.data(),
                                  bound.values.empty() ? nullptr : bound.values.data(),
                                  bound.lengths.empty() ? nullptr : bound.lengths.data(),
                                  bound.formats.empty() ? nullptr : bound.formats.data(),
                                  0),
                     &PQclear);
    ExecStatusType status = result ? PQresultStatus(result.get()) : PGRES_FATAL_ERROR;
    if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
        return Err(ConnectionError::query_failed("statement failed: " + connection_message(m_conn)));
    }

    Value out = Value::array();
    const int columns = PQnfields(result.get());
    const int count = PQntuples(result.get());
    for (int r = 0; r < count; ++r) {
        Value row = Value::object();
        for (int c = 0; c < columns; ++c) {
            row[PQfname(result.get(), c)] = column_value(result.get(), r, c);
        }
        out.push_back(std::move(row));
    }

    rows = std::move(out);
    return Ok();
}

Result<std::uint64_t> PostgresSession::exec(const std::string& sql, const Value& params) {
    if (!m_conn) {
        return Err<std::uint64_t>(ConnectionError::closed(m_endpoint));
    }

    std::size_t expected = 0;
    std::string statement = number_placeholders(sql, expected);
    BoundParams bound;
    if (auto r = bind_params(params, expected, bound); !r) {
        return Err<std::uint64_t>(r.error());
    }

    ResultPtr result(PQexecParams(m_conn, statement.c_str(), static_cast<int>(expected),
                                  bound.types.empty() ? nullptr : bound.types.data(),
                                  bound.values.empty() ? nullptr : bound.values.data(),
                                  bound.lengths.empty() ? nullptr : bound.lengths.data(),
                                  bound.formats.empty() ? nullptr : bound.formats.data(),
                                  0),
                     &PQclear);
    ExecStatusType status = result ? PQresultStatus(result.get()) : PGRES_FATAL_ERROR;
    if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
        return Err<std::uint64_t>(ConnectionError::query_failed("statement failed: " + connection_message(m_conn)));
    }

    std::string_view affected = PQcmdTuples(result.get());
    std::uint64_t changes = 0;
    if (auto [end, ec] = std::from_chars(affected.data(), affected.data() + affected.size(), changes);
        ec != std::errc()) {
        // Utility commands report no row count
        changes = 0;
    }
    return changes;
}

void PostgresSession::close() {
    if (m_conn) {
        PQfinish(m_conn);
        m_conn = nullptr;
    }
}

// =============================================================================
// PostgresDriver
// =============================================================================

Result<std::shared_ptr<IDatabaseSession>> PostgresDriver::open(const DbParams& params) {
    using SessionPtr = std::shared_ptr<IDatabaseSession>;

    // libpq counts whole seconds and treats anything under two as two
    auto timeout_ms = std::max<std::int64_t>(m_connect_timeout.count(), 0);
    std::string timeout = std::to_string(std::max<std::int64_t>((timeout_ms + 999) / 1000, 2));
    std::string port = std::to_string(params.effective_port());

    std::vector<const char*> keys;
    std::vector<const char*> values;
    auto add = [&](const char* key, const std::string& value) {
        if (!value.empty()) {
            keys.push_back(key);
            values.push_back(value.c_str());
        }
    };
    add("host", params.host);
    add("port", port);
    add("user", params.username);
    add("password", params.password);
    add("dbname", params.database);
    add("connect_timeout", timeout);
    keys.push_back("client_encoding");
    values.push_back("UTF8");
    keys.push_back(nullptr);
    values.push_back(nullptr);

    PGconn* conn = PQconnectdbParams(keys.data(), values.data(), 0);
    if (!conn || PQstatus(conn) != CONNECTION_OK) {
        std::string reason = connection_message(conn);
        if (conn) {
            PQfinish(conn);
        }
        return Err<SessionPtr>(ConnectionError::connect_failed(params.endpoint(), reason));
    }

    relay_core::net_logger()->debug("Opened postgres session to {}", params.endpoint());
    return SessionPtr(std::make_shared<PostgresSession>(conn, params.endpoint()));
}

} // namespace relay_net
