/**
 * @file cron_schedule.hpp
 * @brief Five-field cron cadence expressions.
 *
 * Supports "minute hour day-of-month month day-of-week" fields made of '*', numbers,
 * ranges (a-b), lists (a,b,c) and steps (x/n). Day-of-week accepts 0-7 with 0 and 7
 * both meaning Sunday. Times are evaluated in the local timezone.
 */

#ifndef CRON_SCHEDULE_HPP
#define CRON_SCHEDULE_HPP

#include <string>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <expected>
#include <optional>

class CronSchedule {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * @brief Parses a cron expression.
     *
     * @param expression Expression such as "0 2 * * *".
     * @return std::expected<CronSchedule, std::string> The schedule or a description of the syntax error.
     */
    static std::expected<CronSchedule, std::string> parse(const std::string& expression);

    /**
     * @brief Computes the first firing strictly after the given instant.
     *
     * @param after Reference instant.
     * @return std::optional<TimePoint> Next firing, or std::nullopt if the expression never
     *         matches (e.g. "0 0 30 2 *").
     */
    std::optional<TimePoint> nextAfter(TimePoint after) const;

    /**
     * @brief Tests whether a broken-down local time matches every field.
     */
    bool matches(const std::tm& tm) const;

    const std::string& expression() const { return source; }

private:
    CronSchedule() = default;

    bool dayMatches(const std::tm& tm) const;

    std::string source;
    uint64_t minutes = 0;
    uint64_t hours = 0;
    uint64_t daysOfMonth = 0;
    uint64_t months = 0;
    uint64_t daysOfWeek = 0;
    bool anyDayOfMonth = true;
    bool anyDayOfWeek = true;
};

#endif // CRON_SCHEDULE_HPP
