/**
 * @file schema.hpp
 * @brief DDL for the urls and analysis_results relations
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <string>
#include <vector>

namespace PhishLedger {

/**
 * @brief Ordered DDL statements; every statement is idempotent (IF NOT EXISTS)
 */
const std::vector<std::string>& schema_statements();

/**
 * @brief Schema as one SQL script, statements terminated by ';'
 */
std::string schema_sql();

/**
 * @brief Create tables and indexes in a single transaction
 */
void apply_schema(PostgresConnection& db);

} // namespace PhishLedger
