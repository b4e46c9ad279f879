// time_utils_test.cpp - Tests for ISO date parsing and range validation

#include <gtest/gtest.h>

#include "time_utils.hpp"

class TimeUtilsTest : public ::testing::Test {};

// ===========================================================================
// 1. Parsing
// ===========================================================================

TEST_F(TimeUtilsTest, ParsesIsoDateToPackedInteger) {
    EXPECT_EQ(time_utils::parse_iso_date("2021-01-01"), 20210101);
    EXPECT_EQ(time_utils::parse_iso_date("2023-12-31"), 20231231);
}

TEST_F(TimeUtilsTest, AcceptsLeapDayOnlyInLeapYears) {
    EXPECT_EQ(time_utils::parse_iso_date("2020-02-29"), 20200229);
    EXPECT_THROW(time_utils::parse_iso_date("2021-02-29"), InvalidRangeError);
}

TEST_F(TimeUtilsTest, RejectsMalformedDates) {
    EXPECT_THROW(time_utils::parse_iso_date("2021/01/01"), InvalidRangeError);
    EXPECT_THROW(time_utils::parse_iso_date("2021-1-01"), InvalidRangeError);
    EXPECT_THROW(time_utils::parse_iso_date("20a1-01-01"), InvalidRangeError);
    EXPECT_THROW(time_utils::parse_iso_date("2021-13-01"), InvalidRangeError);
    EXPECT_THROW(time_utils::parse_iso_date(""), InvalidRangeError);
}

TEST_F(TimeUtilsTest, InvalidRangeErrorIsInvalidArgument) {
    EXPECT_THROW(time_utils::parse_iso_date("nope"), std::invalid_argument);
}

TEST_F(TimeUtilsTest, FormatsBackToIso) {
    EXPECT_EQ(time_utils::format_iso_date(20200215), "2020-02-15");
}

// ===========================================================================
// 2. Ranges and day arithmetic
// ===========================================================================

TEST_F(TimeUtilsTest, DateRangeRequiresEndNotBeforeStart) {
    auto [s, e] = time_utils::parse_date_range("2022-01-01", "2022-12-31");
    EXPECT_EQ(s, 20220101);
    EXPECT_EQ(e, 20221231);
    EXPECT_NO_THROW(time_utils::parse_date_range("2022-05-05", "2022-05-05"));
    EXPECT_THROW(time_utils::parse_date_range("2022-12-31", "2022-01-01"), InvalidRangeError);
}

TEST_F(TimeUtilsTest, DaysBetweenCountsCalendarDays) {
    EXPECT_EQ(time_utils::days_between(20210101, 20211231), 364);
    EXPECT_EQ(time_utils::days_between(20200101, 20201231), 365);
    EXPECT_EQ(time_utils::days_from_civil(19700101), 0);
}

TEST_F(TimeUtilsTest, ValidatesPackedDates) {
    EXPECT_TRUE(time_utils::is_valid_date(20240229));
    EXPECT_FALSE(time_utils::is_valid_date(20230229));
    EXPECT_FALSE(time_utils::is_valid_date(20230431));
    EXPECT_FALSE(time_utils::is_valid_date(0));
}
