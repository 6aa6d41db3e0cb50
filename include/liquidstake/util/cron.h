// LIQUIDSTAKE - Cron Schedule
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Five-field cron expressions evaluated in UTC:
//
//   minute hour day-of-month month day-of-week
//
// Each field accepts "*", numbers, lists (1,15), ranges (1-5), steps (*/15,
// 0-30/10) and, for month and day-of-week, three-letter names (JAN, MON).
// Day-of-week 0 and 7 are both Sunday. When both day fields are restricted a
// day matches if either field matches.

#ifndef LIQUIDSTAKE_UTIL_CRON_H
#define LIQUIDSTAKE_UTIL_CRON_H

#include <bitset>
#include <cstdint>
#include <optional>
#include <string>

namespace liquidstake {
namespace util {

class CronSchedule {
public:
    /**
     * Parse an expression.
     *
     * @param expression Five whitespace-separated fields
     * @param error Receives a description on failure (may be null)
     * @return Schedule, or nullopt if the expression is malformed
     */
    static std::optional<CronSchedule> Parse(const std::string& expression,
                                             std::string* error = nullptr);

    /**
     * First matching minute strictly after a Unix timestamp.
     * Returns nullopt if nothing matches within four years (e.g. Feb 30).
     */
    std::optional<int64_t> NextAfter(int64_t timestamp) const;

    /// True if the minute containing timestamp matches
    bool Matches(int64_t timestamp) const;

    const std::string& Expression() const { return expression_; }

private:
    CronSchedule() = default;

    bool DayMatches(int dayOfMonth, int month, int dayOfWeek) const;

    std::string expression_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> daysOfMonth_;   // 1-31
    std::bitset<13> months_;        // 1-12
    std::bitset<7> daysOfWeek_;     // 0-6, Sunday = 0
    bool domRestricted_{false};
    bool dowRestricted_{false};
};

} // namespace util
} // namespace liquidstake

#endif // LIQUIDSTAKE_UTIL_CRON_H
