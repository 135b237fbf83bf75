/**
 * @file config.hpp
 * @brief Environment-driven configuration for the database and components
 */

#pragma once

#include <utils/logger.hpp>
#include <cstddef>
#include <string>

namespace PhishLedger {

/**
 * @brief PostgreSQL connection settings
 *
 * Uses the standard libpq variables: PGHOST, PGPORT, PGDATABASE, PGUSER,
 * PGPASSWORD. PHISHLEDGER_DATABASE_URL, when set, is passed to libpq as-is
 * and overrides all of them.
 */
struct DbConfig {
    std::string host = "localhost";
    std::string port = "5432";
    std::string dbname = "phishledger";
    std::string user = "postgres";
    std::string password;
    std::string conninfo_override;

    static DbConfig load_from_env();

    /**
     * @brief Build a libpq conninfo string, quoting values as libpq requires
     */
    std::string conninfo() const;
};

/**
 * @brief Application-wide settings
 */
struct AppConfig {
    DbConfig db;
    Logger::Level log_level = Logger::Level::Info;
    std::string default_source = "manual";
    size_t history_page_size = 50;

    /**
     * @brief Load from the environment
     * @throws ConfigError when a variable is set to an unusable value
     */
    static AppConfig load_from_env();
};

/**
 * @brief Parse a log level name (debug, info, warning, error)
 * @throws ConfigError on an unknown name
 */
Logger::Level parse_log_level(const std::string& name);

} // namespace PhishLedger
