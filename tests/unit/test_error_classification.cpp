/**
 * @file test_error_classification.cpp
 * @brief Unit tests for SQLSTATE to error-kind mapping
 */

#include <gtest/gtest.h>
#include <database/postgres_connection.hpp>
#include <errors.hpp>

using namespace PhishLedger;

TEST(ErrorClassificationTest, IntegrityViolations) {
    EXPECT_EQ(classify_sqlstate("23505"), ErrorKind::Conflict);
    EXPECT_EQ(classify_sqlstate("23503"), ErrorKind::NotFound);
    EXPECT_EQ(classify_sqlstate("23514"), ErrorKind::Validation);
    EXPECT_EQ(classify_sqlstate("23502"), ErrorKind::Validation);
}

TEST(ErrorClassificationTest, DataExceptionsAreValidation) {
    EXPECT_EQ(classify_sqlstate("22P02"), ErrorKind::Validation);  // invalid_text_representation
    EXPECT_EQ(classify_sqlstate("22007"), ErrorKind::Validation);  // invalid_datetime_format
    EXPECT_EQ(classify_sqlstate("22008"), ErrorKind::Validation);  // datetime_field_overflow
}

TEST(ErrorClassificationTest, EverythingElseIsStorage) {
    EXPECT_EQ(classify_sqlstate("08006"), ErrorKind::Storage);
    EXPECT_EQ(classify_sqlstate("40001"), ErrorKind::Storage);
    EXPECT_EQ(classify_sqlstate("42P01"), ErrorKind::Storage);
    EXPECT_EQ(classify_sqlstate(""), ErrorKind::Storage);
    EXPECT_EQ(classify_sqlstate("22"), ErrorKind::Storage);
}

TEST(ErrorClassificationTest, ThrowsMatchingType) {
    EXPECT_THROW(throw_for_sqlstate("23505", "dup"), ConflictError);
    EXPECT_THROW(throw_for_sqlstate("23503", "fk"), NotFoundError);
    EXPECT_THROW(throw_for_sqlstate("23514", "check"), ValidationError);
    EXPECT_THROW(throw_for_sqlstate("57P01", "shutdown"), StorageError);
}

TEST(ErrorClassificationTest, StorageErrorKeepsSqlstate) {
    try {
        throw_for_sqlstate("40P01", "deadlock detected");
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.sqlstate(), "40P01");
        EXPECT_STREQ(e.what(), "deadlock detected");
        EXPECT_TRUE(e.retriable());
    }
}

TEST(ErrorClassificationTest, KindNames) {
    EXPECT_STREQ(error_kind_name(ErrorKind::Validation), "ValidationError");
    EXPECT_STREQ(error_kind_name(ErrorKind::NotFound), "NotFound");
    EXPECT_STREQ(error_kind_name(ErrorKind::Conflict), "ConflictError");
    EXPECT_STREQ(error_kind_name(ErrorKind::Storage), "StorageError");
    EXPECT_FALSE(ConflictError("x").retriable());
    EXPECT_FALSE(ConfigError("x").retriable());
}

TEST(ErrorClassificationTest, UnreachableServerIsStorageError) {
    EXPECT_THROW(PostgresConnection("host=127.0.0.1 port=1 connect_timeout=1 dbname=none user=none"),
                 StorageError);
}
