#include <gtest/gtest.h>
#include "cron_schedule.hpp"

namespace {

std::chrono::system_clock::time_point localTime(int year, int month, int day, int hour, int minute) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

std::tm brokenDown(std::chrono::system_clock::time_point point) {
    std::time_t t = std::chrono::system_clock::to_time_t(point);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

} // namespace

TEST(CronScheduleTest, DailyAtTwo) {
    auto schedule = CronSchedule::parse("0 2 * * *");
    ASSERT_TRUE(schedule.has_value()) << schedule.error();
    EXPECT_EQ(schedule->nextAfter(localTime(2025, 1, 1, 1, 30)), localTime(2025, 1, 1, 2, 0));
    EXPECT_EQ(schedule->nextAfter(localTime(2025, 1, 1, 2, 0)), localTime(2025, 1, 2, 2, 0));
}

TEST(CronScheduleTest, WeeklyOnSunday) {
    auto schedule = CronSchedule::parse("0 3 * * 0");
    ASSERT_TRUE(schedule.has_value());
    // 2025-01-01 is a Wednesday.
    EXPECT_EQ(schedule->nextAfter(localTime(2025, 1, 1, 12, 0)), localTime(2025, 1, 5, 3, 0));
}

TEST(CronScheduleTest, SevenMeansSunday) {
    auto schedule = CronSchedule::parse("0 3 * * 7");
    ASSERT_TRUE(schedule.has_value());
    EXPECT_EQ(schedule->nextAfter(localTime(2025, 1, 1, 12, 0)), localTime(2025, 1, 5, 3, 0));
}

TEST(CronScheduleTest, StepsRangesAndLists) {
    auto schedule = CronSchedule::parse("*/15 9-17 * * 1-5");
    ASSERT_TRUE(schedule.has_value());
    EXPECT_EQ(schedule->nextAfter(localTime(2025, 1, 1, 9, 1)), localTime(2025, 1, 1, 9, 15));
    EXPECT_EQ(schedule->nextAfter(localTime(2025, 1, 1, 17, 45)), localTime(2025, 1, 2, 9, 0));
    // Friday evening rolls over to Monday.
    EXPECT_EQ(schedule->nextAfter(localTime(2025, 1, 3, 18, 0)), localTime(2025, 1, 6, 9, 0));

    auto list = CronSchedule::parse("0,30 1 * * *");
    ASSERT_TRUE(list.has_value());
    EXPECT_EQ(list->nextAfter(localTime(2025, 1, 1, 1, 10)), localTime(2025, 1, 1, 1, 30));
}

TEST(CronScheduleTest, DayOfMonthOrDayOfWeek) {
    auto schedule = CronSchedule::parse("0 0 15 * 1");
    ASSERT_TRUE(schedule.has_value());
    // First Monday after Jan 1 2025 is Jan 6, before the 15th.
    EXPECT_EQ(schedule->nextAfter(localTime(2025, 1, 1, 12, 0)), localTime(2025, 1, 6, 0, 0));
}

TEST(CronScheduleTest, MatchesBrokenDownTime) {
    auto schedule = CronSchedule::parse("30 1 * * *");
    ASSERT_TRUE(schedule.has_value());
    EXPECT_TRUE(schedule->matches(brokenDown(localTime(2025, 6, 10, 1, 30))));
    EXPECT_FALSE(schedule->matches(brokenDown(localTime(2025, 6, 10, 1, 31))));
}

TEST(CronScheduleTest, ImpossibleDateNeverFires) {
    auto schedule = CronSchedule::parse("0 0 30 2 *");
    ASSERT_TRUE(schedule.has_value());
    EXPECT_FALSE(schedule->nextAfter(localTime(2025, 1, 1, 0, 0)).has_value());
}

TEST(CronScheduleTest, RejectsMalformedExpressions) {
    EXPECT_FALSE(CronSchedule::parse("").has_value());
    EXPECT_FALSE(CronSchedule::parse("* * *").has_value());
    EXPECT_FALSE(CronSchedule::parse("60 * * * *").has_value());
    EXPECT_FALSE(CronSchedule::parse("0 24 * * *").has_value());
    EXPECT_FALSE(CronSchedule::parse("0 0 0 * *").has_value());
    EXPECT_FALSE(CronSchedule::parse("0 0 * 13 *").has_value());
    EXPECT_FALSE(CronSchedule::parse("0 0 * * 8").has_value());
    EXPECT_FALSE(CronSchedule::parse("*/0 * * * *").has_value());
    EXPECT_FALSE(CronSchedule::parse("5-1 * * * *").has_value());
    EXPECT_FALSE(CronSchedule::parse("a * * * *").has_value());
    EXPECT_FALSE(CronSchedule::parse("1,,2 * * * *").has_value());
}

TEST(CronScheduleTest, KeepsExpressionText) {
    auto schedule = CronSchedule::parse("0 2 * * *");
    ASSERT_TRUE(schedule.has_value());
    EXPECT_EQ(schedule->expression(), "0 2 * * *");
}
