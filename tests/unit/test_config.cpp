/**
 * @file test_config.cpp
 * @brief Unit tests for environment-driven configuration
 */

#include <gtest/gtest.h>
#include <config/config.hpp>
#include <errors.hpp>
#include <cstdlib>
#include <map>
#include <string>

using namespace PhishLedger;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kVariables) {
            const char* value = std::getenv(name);
            if (value) saved_[name] = value;
            unsetenv(name);
        }
    }

    void TearDown() override {
        for (const char* name : kVariables) {
            auto it = saved_.find(name);
            if (it != saved_.end()) {
                setenv(name, it->second.c_str(), 1);
            } else {
                unsetenv(name);
            }
        }
    }

    static constexpr const char* kVariables[] = {
        "PGHOST", "PGPORT", "PGDATABASE", "PGUSER", "PGPASSWORD",
        "PHISHLEDGER_DATABASE_URL", "PHISHLEDGER_LOG_LEVEL",
        "PHISHLEDGER_DEFAULT_SOURCE", "PHISHLEDGER_HISTORY_PAGE_SIZE"
    };

    std::map<std::string, std::string> saved_;
};

TEST_F(ConfigTest, Defaults) {
    AppConfig config = AppConfig::load_from_env();

    EXPECT_EQ(config.db.host, "localhost");
    EXPECT_EQ(config.db.port, "5432");
    EXPECT_EQ(config.db.dbname, "phishledger");
    EXPECT_EQ(config.db.user, "postgres");
    EXPECT_EQ(config.log_level, Logger::Level::Info);
    EXPECT_EQ(config.default_source, "manual");
    EXPECT_EQ(config.history_page_size, 50u);
    EXPECT_EQ(config.db.conninfo(), "host=localhost port=5432 dbname=phishledger user=postgres");
}

TEST_F(ConfigTest, ReadsEnvironment) {
    setenv("PGHOST", "db.internal", 1);
    setenv("PGPORT", "6432", 1);
    setenv("PGDATABASE", "ledger", 1);
    setenv("PGUSER", "analyst", 1);
    setenv("PGPASSWORD", "it's secret", 1);
    setenv("PHISHLEDGER_LOG_LEVEL", "WARNING", 1);
    setenv("PHISHLEDGER_DEFAULT_SOURCE", "n8n", 1);
    setenv("PHISHLEDGER_HISTORY_PAGE_SIZE", "10", 1);

    AppConfig config = AppConfig::load_from_env();

    EXPECT_EQ(config.log_level, Logger::Level::Warning);
    EXPECT_EQ(config.default_source, "n8n");
    EXPECT_EQ(config.history_page_size, 10u);
    EXPECT_EQ(config.db.conninfo(),
              "host=db.internal port=6432 dbname=ledger user=analyst password='it\\'s secret'");
}

TEST_F(ConfigTest, DatabaseUrlOverrides) {
    setenv("PGHOST", "ignored", 1);
    setenv("PHISHLEDGER_DATABASE_URL", "postgresql://u@h:5433/d", 1);

    EXPECT_EQ(DbConfig::load_from_env().conninfo(), "postgresql://u@h:5433/d");
}

TEST_F(ConfigTest, RejectsBadValues) {
    setenv("PHISHLEDGER_HISTORY_PAGE_SIZE", "0", 1);
    EXPECT_THROW(AppConfig::load_from_env(), ConfigError);

    setenv("PHISHLEDGER_HISTORY_PAGE_SIZE", "12abc", 1);
    EXPECT_THROW(AppConfig::load_from_env(), ConfigError);

    setenv("PHISHLEDGER_HISTORY_PAGE_SIZE", "-5", 1);
    EXPECT_THROW(AppConfig::load_from_env(), ConfigError);

    unsetenv("PHISHLEDGER_HISTORY_PAGE_SIZE");
    setenv("PHISHLEDGER_LOG_LEVEL", "verbose", 1);
    EXPECT_THROW(AppConfig::load_from_env(), ConfigError);
}

TEST(LogLevelTest, ParseNames) {
    EXPECT_EQ(parse_log_level("debug"), Logger::Level::Debug);
    EXPECT_EQ(parse_log_level("Info"), Logger::Level::Info);
    EXPECT_EQ(parse_log_level("warn"), Logger::Level::Warning);
    EXPECT_EQ(parse_log_level("ERROR"), Logger::Level::Error);
    EXPECT_THROW(parse_log_level(""), ConfigError);
}

TEST(LoggerTest, MinLevelFilters) {
    Logger::Level previous = Logger::get_min_level();
    Logger::set_min_level(Logger::Level::Warning);
    EXPECT_FALSE(Logger::enabled(Logger::Level::Info));
    EXPECT_TRUE(Logger::enabled(Logger::Level::Error));
    Logger::set_min_level(previous);
}
