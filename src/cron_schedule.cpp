#include "cron_schedule.hpp"
#include <sstream>
#include <vector>
#include <cstdlib>

namespace {

bool parseNumber(const std::string& text, int& value) {
    if (text.empty() || text.size() > 2) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    value = std::atoi(text.c_str());
    return true;
}

std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream ss(text);
    while (std::getline(ss, part, separator)) {
        parts.push_back(part);
    }
    if (!text.empty() && text.back() == separator) {
        parts.push_back("");
    }
    return parts;
}

// Parses one field into a bit mask of allowed values in [low, high].
std::expected<uint64_t, std::string> parseField(const std::string& field, int low, int high, const std::string& name) {
    uint64_t mask = 0;
    for (const auto& item : split(field, ',')) {
        if (item.empty()) {
            return std::unexpected("empty list item in " + name + " field");
        }

        std::string rangePart = item;
        int step = 1;
        auto slash = item.find('/');
        if (slash != std::string::npos) {
            rangePart = item.substr(0, slash);
            if (!parseNumber(item.substr(slash + 1), step) || step < 1) {
                return std::unexpected("invalid step '" + item.substr(slash + 1) + "' in " + name + " field");
            }
        }

        int first = low;
        int last = high;
        if (rangePart == "*") {
            // full range
        } else {
            auto dash = rangePart.find('-');
            if (dash != std::string::npos) {
                if (!parseNumber(rangePart.substr(0, dash), first) || !parseNumber(rangePart.substr(dash + 1), last)) {
                    return std::unexpected("invalid range '" + rangePart + "' in " + name + " field");
                }
            } else {
                if (!parseNumber(rangePart, first)) {
                    return std::unexpected("invalid value '" + rangePart + "' in " + name + " field");
                }
                last = slash != std::string::npos ? high : first;
            }
        }

        if (first < low || last > high || first > last) {
            return std::unexpected("value out of range in " + name + " field: " + item);
        }
        for (int v = first; v <= last; v += step) {
            mask |= (uint64_t{1} << v);
        }
    }
    return mask;
}

bool hasBit(uint64_t mask, int bit) {
    return (mask >> bit) & 1u;
}

} // namespace

std::expected<CronSchedule, std::string> CronSchedule::parse(const std::string& expression) {
    std::istringstream ss(expression);
    std::vector<std::string> fields;
    std::string field;
    while (ss >> field) {
        fields.push_back(field);
    }
    if (fields.size() != 5) {
        return std::unexpected("expected 5 fields, got " + std::to_string(fields.size()) + ": '" + expression + "'");
    }

    CronSchedule schedule;
    schedule.source = expression;

    auto minutes = parseField(fields[0], 0, 59, "minute");
    if (!minutes) return std::unexpected(minutes.error());
    auto hours = parseField(fields[1], 0, 23, "hour");
    if (!hours) return std::unexpected(hours.error());
    auto dom = parseField(fields[2], 1, 31, "day-of-month");
    if (!dom) return std::unexpected(dom.error());
    auto months = parseField(fields[3], 1, 12, "month");
    if (!months) return std::unexpected(months.error());
    auto dow = parseField(fields[4], 0, 7, "day-of-week");
    if (!dow) return std::unexpected(dow.error());

    schedule.minutes = *minutes;
    schedule.hours = *hours;
    schedule.daysOfMonth = *dom;
    schedule.months = *months;
    schedule.daysOfWeek = *dow;
    if (hasBit(schedule.daysOfWeek, 7)) {
        schedule.daysOfWeek |= 1u;
    }
    schedule.anyDayOfMonth = fields[2] == "*";
    schedule.anyDayOfWeek = fields[4] == "*";
    return schedule;
}

bool CronSchedule::dayMatches(const std::tm& tm) const {
    bool domMatch = hasBit(daysOfMonth, tm.tm_mday);
    bool dowMatch = hasBit(daysOfWeek, tm.tm_wday);
    // Standard cron: when both day fields are restricted, either may match.
    if (!anyDayOfMonth && !anyDayOfWeek) {
        return domMatch || dowMatch;
    }
    return domMatch && dowMatch;
}

bool CronSchedule::matches(const std::tm& tm) const {
    return hasBit(minutes, tm.tm_min) && hasBit(hours, tm.tm_hour) &&
           hasBit(months, tm.tm_mon + 1) && dayMatches(tm);
}

std::optional<CronSchedule::TimePoint> CronSchedule::nextAfter(TimePoint after) const {
    auto afterT = std::chrono::system_clock::to_time_t(after);
    std::tm tmNext{};
    localtime_r(&afterT, &tmNext);
    tmNext.tm_sec = 0;
    tmNext.tm_min += 1;
    tmNext.tm_isdst = -1;
    std::mktime(&tmNext);

    // Bounded walk: skip whole months, days and hours that cannot match.
    // Five years covers every satisfiable expression including Feb 29.
    for (int guard = 0; guard < 5 * 366 * 24 + 60 * 24; ++guard) {
        if (!hasBit(months, tmNext.tm_mon + 1)) {
            tmNext.tm_mon += 1;
            tmNext.tm_mday = 1;
            tmNext.tm_hour = 0;
            tmNext.tm_min = 0;
        } else if (!dayMatches(tmNext)) {
            tmNext.tm_mday += 1;
            tmNext.tm_hour = 0;
            tmNext.tm_min = 0;
        } else if (!hasBit(hours, tmNext.tm_hour)) {
            tmNext.tm_hour += 1;
            tmNext.tm_min = 0;
        } else if (!hasBit(minutes, tmNext.tm_min)) {
            tmNext.tm_min += 1;
        } else {
            return std::chrono::system_clock::from_time_t(std::mktime(&tmNext));
        }
        tmNext.tm_isdst = -1;
        std::mktime(&tmNext);
    }
    return std::nullopt;
}
