/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <errors.hpp>
#include <utils/logger.hpp>
#include <cstdlib>
#include <exception>

namespace PhishLedger {

ErrorKind classify_sqlstate(const std::string& sqlstate) {
    if (sqlstate == "23505") return ErrorKind::Conflict;
    if (sqlstate == "23503") return ErrorKind::NotFound;
    if (sqlstate == "23514" || sqlstate == "23502") return ErrorKind::Validation;
    if (sqlstate.size() == 5 && sqlstate.compare(0, 2, "22") == 0) return ErrorKind::Validation;
    return ErrorKind::Storage;
}

void throw_for_sqlstate(const std::string& sqlstate, const std::string& message) {
    switch (classify_sqlstate(sqlstate)) {
        case ErrorKind::Conflict:   throw ConflictError(message);
        case ErrorKind::NotFound:   throw NotFoundError(message);
        case ErrorKind::Validation: throw ValidationError(message);
        default:                    throw StorageError(message, sqlstate);
    }
}

PostgresConnection::PostgresConnection() {
    connect(DbConfig::load_from_env().conninfo());
}

PostgresConnection::PostgresConnection(const DbConfig& config) {
    connect(config.conninfo());
}

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

PostgresConnection::PostgresConnection(PostgresConnection&& other) noexcept
    : conn_(other.conn_), last_error_(std::move(other.last_error_)) {
    other.conn_ = nullptr;
}

PostgresConnection& PostgresConnection::operator=(PostgresConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        conn_ = other.conn_;
        last_error_ = std::move(other.last_error_);
        other.conn_ = nullptr;
    }
    return *this;
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw StorageError("PostgreSQL connection failed: " + last_error_);
    }

    // Timestamps are exchanged as UTC strings
    try {
        execute("SET TIME ZONE 'UTC'");
    } catch (const Error&) {
        disconnect();
        throw;
    }
    Logger::debug("Connected to PostgreSQL database " + std::string(PQdb(conn_)));
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

void PostgresConnection::close() {
    disconnect();
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PostgresConnection::require_connection() const {
    if (!is_connected()) {
        throw StorageError("Not connected to database");
    }
}

void PostgresConnection::check_result(const PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK || status == PGRES_SINGLE_TUPLE) {
        return;
    }

    const char* state = result ? PQresultErrorField(result, PG_DIAG_SQLSTATE) : nullptr;
    std::string sqlstate = state ? state : "";
    last_error_ = result ? PQresultErrorMessage(result) : PQerrorMessage(conn_);
    if (last_error_.empty()) last_error_ = PQerrorMessage(conn_);

    throw_for_sqlstate(sqlstate, "PostgreSQL query failed: " + last_error_);
}

PostgresConnection::ResultPtr PostgresConnection::exec_params(const std::string& sql,
                                                              const std::vector<std::string>& params) {
    require_connection();

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p.c_str());
    }

    ResultPtr result(
        params.empty()
            ? PQexec(conn_, sql.c_str())
            : PQexecParams(
                  conn_,
                  sql.c_str(),
                  static_cast<int>(params.size()),
                  nullptr,
                  param_values.data(),
                  nullptr,
                  nullptr,
                  0  // Text format
              ),
        &PQclear);

    if (!result) {
        last_error_ = PQerrorMessage(conn_);
        throw StorageError("PostgreSQL query failed: " + last_error_);
    }

    check_result(result.get());
    return result;
}

size_t PostgresConnection::execute(const std::string& sql) {
    return execute(sql, {});
}

size_t PostgresConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    ResultPtr result = exec_params(sql, params);
    const char* affected = PQcmdTuples(result.get());
    return (affected && *affected) ? static_cast<size_t>(std::strtoull(affected, nullptr, 10)) : 0;
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql,
                                                            const std::vector<std::string>& params) {
    ResultPtr result = exec_params(sql, params);

    std::optional<std::string> value;
    if (PQntuples(result.get()) > 0 && PQnfields(result.get()) > 0) {
        value = PQgetvalue(result.get(), 0, 0);
    }
    return value;
}

void PostgresConnection::query(const std::string& sql, const RowCallback& callback) {
    query(sql, {}, callback);
}

void PostgresConnection::query(const std::string& sql, const std::vector<std::string>& params,
                               const RowCallback& callback) {
    ResultPtr result = exec_params(sql, params);

    int nrows = PQntuples(result.get());
    int nfields = PQnfields(result.get());

    for (int i = 0; i < nrows; ++i) {
        Row row;
        row.reserve(nfields);

        for (int j = 0; j < nfields; ++j) {
            row.push_back(PQgetvalue(result.get(), i, j));
        }

        callback(row);
    }
}

void PostgresConnection::stream_query(const std::string& sql, const std::vector<std::string>& params,
                                      const RowCallback& callback) {
    require_connection();

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p.c_str());
    }

    if (PQsendQueryParams(conn_, sql.c_str(), static_cast<int>(params.size()), nullptr,
                          param_values.data(), nullptr, nullptr, 0) == 0) {
        last_error_ = PQerrorMessage(conn_);
        throw StorageError("PQsendQueryParams failed: " + last_error_);
    }

    if (PQsetSingleRowMode(conn_) == 0) {
        throw StorageError("PQsetSingleRowMode failed");
    }

    // The result queue must be drained even if the callback throws,
    // otherwise the connection is left busy.
    std::exception_ptr pending;
    PGresult* raw;
    while ((raw = PQgetResult(conn_)) != nullptr) {
        ResultPtr res(raw, &PQclear);
        if (pending) continue;

        try {
            if (PQresultStatus(res.get()) == PGRES_SINGLE_TUPLE) {
                int nfields = PQnfields(res.get());
                Row row;
                row.reserve(nfields);
                for (int i = 0; i < nfields; ++i) {
                    row.push_back(PQgetvalue(res.get(), 0, i));
                }
                callback(row);
            } else {
                // PGRES_TUPLES_OK marks the end of the result set
                check_result(res.get());
            }
        } catch (...) {
            pending = std::current_exception();
        }
    }

    if (pending) std::rethrow_exception(pending);
}

void PostgresConnection::begin() {
    execute("BEGIN");
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    execute("ROLLBACK");
}

std::string PostgresConnection::last_error() const {
    return last_error_;
}

// Transaction RAII
PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.begin();
}

PostgresConnection::Transaction::~Transaction() {
    if (!committed_ && !rolled_back_) {
        try {
            conn_.rollback();
        } catch (const std::exception& e) {
            Logger::warn(std::string("Rollback in transaction destructor failed: ") + e.what());
        }
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.commit();
    committed_ = true;
}

void PostgresConnection::Transaction::rollback() {
    conn_.rollback();
    rolled_back_ = true;
}

} // namespace PhishLedger
