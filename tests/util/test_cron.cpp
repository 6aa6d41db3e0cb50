// LIQUIDSTAKE - Cron Schedule Tests
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include <gtest/gtest.h>

#include "liquidstake/util/cron.h"

#include <string>

namespace liquidstake {
namespace util {
namespace test {

namespace {

// 2024-01-01T00:00:00Z, a Monday
constexpr int64_t JAN_1_2024 = 1704067200;
constexpr int64_t MINUTE = 60;
constexpr int64_t HOUR = 3600;
constexpr int64_t DAY = 86400;

CronSchedule MustParse(const std::string& expr) {
    std::string error;
    auto schedule = CronSchedule::Parse(expr, &error);
    EXPECT_TRUE(schedule.has_value()) << expr << ": " << error;
    if (!schedule) {
        return *CronSchedule::Parse("* * * * *");
    }
    return *schedule;
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(CronScheduleTest, ParsesCommonForms) {
    EXPECT_TRUE(CronSchedule::Parse("0 * * * *").has_value());
    EXPECT_TRUE(CronSchedule::Parse("*/15 9-17 * * MON-FRI").has_value());
    EXPECT_TRUE(CronSchedule::Parse("0,30 0 1,15 jan,jul *").has_value());
    EXPECT_TRUE(CronSchedule::Parse("  5   4 * * 7 ").has_value());
    EXPECT_EQ(MustParse("0 * * * *").Expression(), "0 * * * *");
}

TEST(CronScheduleTest, RejectsMalformed) {
    std::string error;

    EXPECT_FALSE(CronSchedule::Parse("* * * *", &error).has_value());
    EXPECT_EQ(error, "expected 5 fields, got 4");

    EXPECT_FALSE(CronSchedule::Parse("60 * * * *", &error).has_value());
    EXPECT_NE(error.find("minute"), std::string::npos);

    EXPECT_FALSE(CronSchedule::Parse("*/0 * * * *", &error).has_value());
    EXPECT_NE(error.find("invalid step"), std::string::npos);

    EXPECT_FALSE(CronSchedule::Parse("0 * * FOO *", &error).has_value());
    EXPECT_NE(error.find("month"), std::string::npos);

    EXPECT_FALSE(CronSchedule::Parse("0 5-2 * * *").has_value());
    EXPECT_FALSE(CronSchedule::Parse("0 0 0 * *").has_value());
    EXPECT_FALSE(CronSchedule::Parse("1,,2 * * * *").has_value());
}

// ============================================================================
// Matching and Next Run
// ============================================================================

TEST(CronScheduleTest, HourlyNextRunIsStrictlyAfter) {
    CronSchedule hourly = MustParse("0 * * * *");

    EXPECT_EQ(hourly.NextAfter(JAN_1_2024), JAN_1_2024 + HOUR);
    EXPECT_EQ(hourly.NextAfter(JAN_1_2024 - 1), JAN_1_2024);
    EXPECT_EQ(hourly.NextAfter(JAN_1_2024 + 59 * MINUTE + 59), JAN_1_2024 + HOUR);

    EXPECT_TRUE(hourly.Matches(JAN_1_2024 + HOUR));
    EXPECT_TRUE(hourly.Matches(JAN_1_2024 + HOUR + 30));
    EXPECT_FALSE(hourly.Matches(JAN_1_2024 + HOUR + MINUTE));
}

TEST(CronScheduleTest, StepsWithinHour) {
    CronSchedule quarter = MustParse("*/15 * * * *");
    EXPECT_EQ(quarter.NextAfter(JAN_1_2024 + 16 * MINUTE), JAN_1_2024 + 30 * MINUTE);
    EXPECT_EQ(quarter.NextAfter(JAN_1_2024 + 50 * MINUTE), JAN_1_2024 + HOUR);
}

TEST(CronScheduleTest, WeekdaysSkipWeekend) {
    CronSchedule weekdays = MustParse("30 9 * * MON-FRI");
    int64_t saturday = JAN_1_2024 + 5 * DAY;
    int64_t monday = JAN_1_2024 + 7 * DAY;

    EXPECT_EQ(weekdays.NextAfter(saturday), monday + 9 * HOUR + 30 * MINUTE);
}

TEST(CronScheduleTest, SevenMeansSunday) {
    CronSchedule sunday = MustParse("0 0 * * 7");
    EXPECT_EQ(sunday.NextAfter(JAN_1_2024), JAN_1_2024 + 6 * DAY);
}

TEST(CronScheduleTest, DayOfMonthOrDayOfWeek) {
    // Either the 13th or any Friday
    CronSchedule either = MustParse("0 0 13 * FRI");
    int64_t firstFriday = JAN_1_2024 + 4 * DAY;
    EXPECT_EQ(either.NextAfter(JAN_1_2024), firstFriday);

    int64_t secondFriday = firstFriday + 7 * DAY;
    int64_t thirteenth = JAN_1_2024 + 12 * DAY;
    EXPECT_EQ(either.NextAfter(secondFriday), thirteenth);
}

TEST(CronScheduleTest, ImpossibleDateNeverFires) {
    CronSchedule never = MustParse("0 0 30 2 *");
    EXPECT_FALSE(never.NextAfter(JAN_1_2024).has_value());
}

} // namespace test
} // namespace util
} // namespace liquidstake
