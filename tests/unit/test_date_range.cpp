/**
 * @file test_date_range.cpp
 * @brief Unit tests for date bound parsing
 */

#include <gtest/gtest.h>
#include <utils/time.hpp>
#include <errors.hpp>

using namespace PhishLedger;

TEST(DateRangeTest, DateOnlyBoundsCoverWholeDays) {
    DateRange range = DateRange::parse("2026-10-01", "2026-10-19");
    EXPECT_EQ(range.start, "2026-10-01T00:00:00Z");
    EXPECT_EQ(range.end, "2026-10-19T23:59:59Z");
}

TEST(DateRangeTest, SameDayIsValid) {
    DateRange range = DateRange::parse("2026-10-19", "2026-10-19");
    EXPECT_EQ(range.start, "2026-10-19T00:00:00Z");
    EXPECT_EQ(range.end, "2026-10-19T23:59:59Z");
}

TEST(DateRangeTest, StartAfterEndRejected) {
    EXPECT_THROW(DateRange::parse("2026-10-20", "2026-10-19"), ValidationError);
    EXPECT_THROW(DateRange::parse("2026-10-19T12:00", "2026-10-19T11:59"), ValidationError);
}

TEST(DateRangeTest, FractionalSecondsOrdered) {
    EXPECT_THROW(DateRange::parse("2026-01-01T10:00:00.9", "2026-01-01T10:00:00.1"), ValidationError);
    EXPECT_THROW(DateRange::parse("2026-01-01T10:00:00.5", "2026-01-01T10:00:00"), ValidationError);
    EXPECT_NO_THROW(DateRange::parse("2026-01-01T10:00:00.1", "2026-01-01T10:00:00.100000"));
    EXPECT_NO_THROW(DateRange::parse("2026-01-01T10:00:00", "2026-01-01T10:00:00.000001"));
    EXPECT_NO_THROW(DateRange::parse("2026-01-01T10:00:00.099999", "2026-01-01T10:00:00.1"));
}

TEST(DateRangeTest, OffsetBoundsComparedInUtc) {
    // 09:00+02:00 is 07:00Z, before 08:00Z
    EXPECT_NO_THROW(DateRange::parse("2026-10-19T09:00:00+02:00", "2026-10-19T08:00:00Z"));
    EXPECT_THROW(DateRange::parse("2026-10-19T09:00:00Z", "2026-10-19T10:00:00+02:00"), ValidationError);
}

TEST(DateBoundTest, TimeForms) {
    EXPECT_EQ(parse_date_bound("2026-10-19T08:15", false), "2026-10-19T08:15:00Z");
    EXPECT_EQ(parse_date_bound("2026-10-19 08:15:30", false), "2026-10-19T08:15:30Z");
    EXPECT_EQ(parse_date_bound("2026-10-19T08:15:30Z", true), "2026-10-19T08:15:30Z");
    EXPECT_EQ(parse_date_bound("2026-10-19T08:15:30.123456Z", false), "2026-10-19T08:15:30.123456Z");
    EXPECT_EQ(parse_date_bound("  2026-10-19  ", false), "2026-10-19T00:00:00Z");
}

TEST(DateBoundTest, UtcOffsetsConvertToUtc) {
    EXPECT_EQ(parse_date_bound("2026-10-19T08:15:00+00:00", false), "2026-10-19T08:15:00Z");
    EXPECT_EQ(parse_date_bound("2026-10-19T08:15:00.123+02:00", false), "2026-10-19T06:15:00.123Z");
    EXPECT_EQ(parse_date_bound("2026-10-19T08:15:00-0530", false), "2026-10-19T13:45:00Z");
    EXPECT_EQ(parse_date_bound("2026-10-19T08:15+01", false), "2026-10-19T07:15:00Z");
}

TEST(DateBoundTest, UtcOffsetsCrossDayMonthAndYear) {
    EXPECT_EQ(parse_date_bound("2026-03-01T01:00:00+02:00", false), "2026-02-28T23:00:00Z");
    EXPECT_EQ(parse_date_bound("2024-03-01T01:00:00+02:00", false), "2024-02-29T23:00:00Z");
    EXPECT_EQ(parse_date_bound("2026-12-31T22:30:00-03:00", false), "2027-01-01T01:30:00Z");
    EXPECT_EQ(parse_date_bound("2027-01-01T00:30:00+01:00", false), "2026-12-31T23:30:00Z");
    EXPECT_THROW(parse_date_bound("0001-01-01T00:30:00+01:00", false), ValidationError);
}

TEST(DateBoundTest, CalendarChecks) {
    EXPECT_NO_THROW(parse_date_bound("2024-02-29", false));
    EXPECT_NO_THROW(parse_date_bound("2000-02-29", false));
    EXPECT_THROW(parse_date_bound("2025-02-29", false), ValidationError);
    EXPECT_THROW(parse_date_bound("1900-02-29", false), ValidationError);
    EXPECT_THROW(parse_date_bound("2026-04-31", false), ValidationError);
    EXPECT_THROW(parse_date_bound("2026-13-01", false), ValidationError);
    EXPECT_THROW(parse_date_bound("2026-00-10", false), ValidationError);
}

TEST(DateBoundTest, MalformedInput) {
    EXPECT_THROW(parse_date_bound("", false), ValidationError);
    EXPECT_THROW(parse_date_bound("yesterday", false), ValidationError);
    EXPECT_THROW(parse_date_bound("2026/10/19", false), ValidationError);
    EXPECT_THROW(parse_date_bound("2026-10-19T24:00", false), ValidationError);
    EXPECT_THROW(parse_date_bound("2026-10-19T08:60", false), ValidationError);
    EXPECT_THROW(parse_date_bound("2026-10-19T08", false), ValidationError);
    EXPECT_THROW(parse_date_bound("2026-10-19T08:15:30+2", false), ValidationError);
    EXPECT_THROW(parse_date_bound("2026-10-19T08:15:30+02:0", false), ValidationError);
    EXPECT_THROW(parse_date_bound("2026-10-19T08:15:30+24:00", false), ValidationError);
    EXPECT_THROW(parse_date_bound("2026-10-19T08:15:30+02:60", false), ValidationError);
    EXPECT_THROW(parse_date_bound("2026-10-19T08:15:30Z+02:00", false), ValidationError);
    EXPECT_THROW(parse_date_bound("2026-10-19T08:15:30.", false), ValidationError);
    EXPECT_THROW(parse_date_bound("2026-10-19T08:15:30.1234567", false), ValidationError);
}

TEST(TimerTest, ElapsedIsMonotonic) {
    Timer timer;
    double first = timer.elapsed_ms();
    double second = timer.elapsed_ms();
    EXPECT_GE(first, 0.0);
    EXPECT_GE(second, first);
}
