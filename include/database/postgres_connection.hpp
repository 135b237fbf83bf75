/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <config/config.hpp>
#include <errors.hpp>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <libpq-fe.h>

namespace PhishLedger {

/**
 * @brief Map a five-character SQLSTATE to an error kind
 *
 * 23505 (unique_violation) -> Conflict, 23503 (foreign_key_violation) ->
 * NotFound, 23514 (check_violation), 23502 (not_null_violation) and class 22
 * (data exception) -> Validation, anything else -> Storage.
 */
ErrorKind classify_sqlstate(const std::string& sqlstate);

/**
 * @brief Throw the exception type matching a SQLSTATE
 */
[[noreturn]] void throw_for_sqlstate(const std::string& sqlstate, const std::string& message);

/**
 * @brief PostgreSQL connection wrapper
 *
 * Owns one libpq connection. The session time zone is pinned to UTC on
 * connect so that timestamps read back are comparable strings.
 * Not thread-safe; use one instance per thread.
 */
class PostgresConnection {
public:
    using Row = std::vector<std::string>;
    using RowCallback = std::function<void(const Row&)>;

    /**
     * @brief Connect using environment variables (see DbConfig)
     */
    PostgresConnection();

    /**
     * @brief Connect with explicit settings
     */
    explicit PostgresConnection(const DbConfig& config);

    /**
     * @brief Connect with explicit connection string
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    // Move OK
    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    /**
     * @brief Check if connected
     */
    bool is_connected() const;

    /**
     * @brief Close the connection. Further queries throw StorageError.
     */
    void close();

    /**
     * @brief Execute statement(s) with no parameters
     * @return Number of rows affected by the last command
     */
    size_t execute(const std::string& sql);

    /**
     * @brief Execute a parameterized statement
     * @return Number of rows affected
     */
    size_t execute(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query and return the first column of the first row
     */
    std::optional<std::string> query_single(const std::string& sql, const std::vector<std::string>& params = {});

    /**
     * @brief Execute query and iterate rows
     * @param callback Called for each row: callback(row_data)
     */
    void query(const std::string& sql, const RowCallback& callback);

    /**
     * @brief Execute query with params and iterate rows
     */
    void query(const std::string& sql, const std::vector<std::string>& params, const RowCallback& callback);

    /**
     * @brief Execute query in single-row mode, invoking the callback as rows arrive
     *
     * Rows are never all held in memory at once.
     */
    void stream_query(const std::string& sql, const std::vector<std::string>& params, const RowCallback& callback);

    void begin();
    void commit();
    void rollback();

    /**
     * @brief RAII transaction guard; rolls back unless committed
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();
        void rollback();

    private:
        PostgresConnection& conn_;
        bool committed_ = false;
        bool rolled_back_ = false;
    };

    /**
     * @brief Get last error message
     */
    std::string last_error() const;

private:
    using ResultPtr = std::unique_ptr<PGresult, decltype(&PQclear)>;

    void connect(const std::string& conninfo);
    void disconnect();
    void require_connection() const;
    ResultPtr exec_params(const std::string& sql, const std::vector<std::string>& params);
    void check_result(const PGresult* result);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

} // namespace PhishLedger
