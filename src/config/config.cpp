/**
 * @file config.cpp
 * @brief Environment loading for database and application settings
 */

#include <config/config.hpp>
#include <errors.hpp>
#include <utils/text.hpp>
#include <cstdlib>
#include <sstream>

namespace PhishLedger {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

// libpq conninfo values containing spaces or quotes must be single-quoted
std::string quote_conninfo_value(const std::string& value) {
    bool needs_quotes = value.empty();
    for (char c : value) {
        if (c == ' ' || c == '\'' || c == '\\') {
            needs_quotes = true;
            break;
        }
    }
    if (!needs_quotes) return value;

    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') quoted += '\\';
        quoted += c;
    }
    quoted += "'";
    return quoted;
}

} // namespace

DbConfig DbConfig::load_from_env() {
    DbConfig config;
    config.host = env_or("PGHOST", config.host);
    config.port = env_or("PGPORT", config.port);
    config.dbname = env_or("PGDATABASE", config.dbname);
    config.user = env_or("PGUSER", config.user);
    config.password = env_or("PGPASSWORD", "");
    config.conninfo_override = env_or("PHISHLEDGER_DATABASE_URL", "");
    return config;
}

std::string DbConfig::conninfo() const {
    if (!conninfo_override.empty()) return conninfo_override;

    std::ostringstream out;
    out << "host=" << quote_conninfo_value(host)
        << " port=" << quote_conninfo_value(port)
        << " dbname=" << quote_conninfo_value(dbname)
        << " user=" << quote_conninfo_value(user);
    if (!password.empty()) {
        out << " password=" << quote_conninfo_value(password);
    }
    return out.str();
}

Logger::Level parse_log_level(const std::string& name) {
    std::string lower = to_lower(name);

    if (lower == "debug") return Logger::Level::Debug;
    if (lower == "info") return Logger::Level::Info;
    if (lower == "warning" || lower == "warn") return Logger::Level::Warning;
    if (lower == "error") return Logger::Level::Error;
    throw ConfigError("Unknown log level: " + name);
}

AppConfig AppConfig::load_from_env() {
    AppConfig config;
    config.db = DbConfig::load_from_env();

    std::string level = env_or("PHISHLEDGER_LOG_LEVEL", "");
    if (!level.empty()) config.log_level = parse_log_level(level);

    config.default_source = env_or("PHISHLEDGER_DEFAULT_SOURCE", config.default_source);

    std::string page_size = env_or("PHISHLEDGER_HISTORY_PAGE_SIZE", "");
    if (!page_size.empty()) {
        size_t value = 0;
        if (!parse_count(page_size, value) || value == 0) {
            throw ConfigError("PHISHLEDGER_HISTORY_PAGE_SIZE must be a positive integer, got: " + page_size);
        }
        config.history_page_size = value;
    }

    return config;
}

} // namespace PhishLedger
