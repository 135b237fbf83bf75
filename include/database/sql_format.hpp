/**
 * @file sql_format.hpp
 * @brief SQL fragments shared by the relation readers
 */

#pragma once

#include <string>

namespace PhishLedger {

// Select-list expression rendering a timestamptz column as
// "YYYY-MM-DDTHH:MM:SS.ffffffZ" ('' for NULL). Relies on the session
// time zone being UTC, which PostgresConnection sets on connect.
inline std::string iso_timestamp_sql(const std::string& column) {
    return "COALESCE(to_char(" + column + ", 'YYYY-MM-DD\"T\"HH24:MI:SS.US\"Z\"'), '')";
}

} // namespace PhishLedger
