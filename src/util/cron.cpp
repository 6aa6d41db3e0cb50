// LIQUIDSTAKE - Cron Schedule Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/util/cron.h"
#include "liquidstake/util/time.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <sstream>
#include <vector>

namespace liquidstake {
namespace util {

namespace {

constexpr int64_t SECONDS_PER_MINUTE = 60;

const char* const MONTH_NAMES[] = {
    "JAN", "FEB", "MAR", "APR", "MAY", "JUN",
    "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"
};

const char* const DAY_NAMES[] = {
    "SUN", "MON", "TUE", "WED", "THU", "FRI", "SAT"
};

/// Days searched before giving up on an expression
constexpr int MAX_SEARCH_DAYS = 366 * 4;

struct FieldSpec {
    const char* name;
    int min;
    int max;
    const char* const* names;   // Optional symbolic names, index 0 == min
    size_t nameCount;
};

bool ParseValue(const std::string& token, const FieldSpec& limits, int& out) {
    if (token.empty()) {
        return false;
    }

    if (limits.names && std::isalpha(static_cast<unsigned char>(token[0]))) {
        std::string upper = token;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        for (size_t i = 0; i < limits.nameCount; ++i) {
            if (upper == limits.names[i]) {
                out = limits.min + static_cast<int>(i);
                return true;
            }
        }
        return false;
    }

    int value = 0;
    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
        if (value > 1000) {
            return false;
        }
    }
    out = value;
    return true;
}

/// Parse one field into a vector of allowed values; sets restricted to
/// false only for a bare "*"
bool ParseField(const std::string& field, const FieldSpec& limits, int upper,
                std::vector<int>& values, bool& restricted, std::string& error) {
    restricted = field != "*";

    std::stringstream ss(field);
    std::string part;
    while (std::getline(ss, part, ',')) {
        if (part.empty()) {
            error = std::string("empty list element in ") + limits.name + " field";
            return false;
        }

        int step = 1;
        size_t slash = part.find('/');
        std::string range = part;
        if (slash != std::string::npos) {
            range = part.substr(0, slash);
            std::string stepStr = part.substr(slash + 1);
            FieldSpec stepSpec{limits.name, 1, 1000, nullptr, 0};
            if (!ParseValue(stepStr, stepSpec, step) || step == 0) {
                error = std::string("invalid step '") + stepStr + "' in " + limits.name + " field";
                return false;
            }
        }

        int lo = limits.min;
        int hi = upper;
        if (range != "*") {
            size_t dash = range.find('-');
            if (dash == std::string::npos) {
                if (!ParseValue(range, limits, lo)) {
                    error = std::string("invalid value '") + range + "' in " + limits.name + " field";
                    return false;
                }
                hi = slash == std::string::npos ? lo : upper;
            } else if (!ParseValue(range.substr(0, dash), limits, lo) ||
                       !ParseValue(range.substr(dash + 1), limits, hi)) {
                error = std::string("invalid range '") + range + "' in " + limits.name + " field";
                return false;
            }
        }

        if (lo < limits.min || hi > upper || lo > hi) {
            error = std::string("value out of range in ") + limits.name + " field: " + part;
            return false;
        }

        for (int v = lo; v <= hi; v += step) {
            values.push_back(v);
        }
    }

    if (values.empty()) {
        error = std::string("empty ") + limits.name + " field";
        return false;
    }
    return true;
}

} // anonymous namespace

std::optional<CronSchedule> CronSchedule::Parse(const std::string& expression,
                                                 std::string* error) {
    std::istringstream iss(expression);
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) {
        fields.push_back(field);
    }

    std::string message;
    auto fail = [&](const std::string& msg) -> std::optional<CronSchedule> {
        if (error) *error = msg;
        return std::nullopt;
    };

    if (fields.size() != 5) {
        return fail("expected 5 fields, got " + std::to_string(fields.size()));
    }

    CronSchedule schedule;
    schedule.expression_ = expression;

    const FieldSpec specs[] = {
        {"minute", 0, 59, nullptr, 0},
        {"hour", 0, 23, nullptr, 0},
        {"day-of-month", 1, 31, nullptr, 0},
        {"month", 1, 12, MONTH_NAMES, 12},
        {"day-of-week", 0, 6, DAY_NAMES, 7},
    };

    for (size_t i = 0; i < 5; ++i) {
        std::vector<int> values;
        bool restricted = false;
        // Day-of-week accepts 7 as an alias for Sunday
        int upper = (i == 4) ? 7 : specs[i].max;
        if (!ParseField(fields[i], specs[i], upper, values, restricted, message)) {
            return fail(message);
        }

        for (int v : values) {
            switch (i) {
                case 0: schedule.minutes_.set(v); break;
                case 1: schedule.hours_.set(v); break;
                case 2: schedule.daysOfMonth_.set(v); break;
                case 3: schedule.months_.set(v); break;
                case 4: schedule.daysOfWeek_.set(v % 7); break;
            }
        }
        if (i == 2) schedule.domRestricted_ = restricted;
        if (i == 4) schedule.dowRestricted_ = restricted;
    }

    return schedule;
}

bool CronSchedule::DayMatches(int dayOfMonth, int month, int dayOfWeek) const {
    if (!months_.test(month)) {
        return false;
    }
    bool domMatch = daysOfMonth_.test(dayOfMonth);
    bool dowMatch = daysOfWeek_.test(dayOfWeek);
    if (domRestricted_ && dowRestricted_) {
        return domMatch || dowMatch;
    }
    return domMatch && dowMatch;
}

bool CronSchedule::Matches(int64_t timestamp) const {
    std::time_t t = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);
    return minutes_.test(tm_buf.tm_min) && hours_.test(tm_buf.tm_hour) &&
           DayMatches(tm_buf.tm_mday, tm_buf.tm_mon + 1, tm_buf.tm_wday);
}

std::optional<int64_t> CronSchedule::NextAfter(int64_t timestamp) const {
    int64_t start = (timestamp / SECONDS_PER_MINUTE + 1) * SECONDS_PER_MINUTE;
    if (timestamp < 0 && timestamp % SECONDS_PER_MINUTE != 0) {
        start -= SECONDS_PER_MINUTE;
    }

    std::time_t t = static_cast<std::time_t>(start);
    std::tm day;
    gmtime_r(&t, &day);
    int firstHour = day.tm_hour;
    int firstMinute = day.tm_min;

    for (int d = 0; d < MAX_SEARCH_DAYS; ++d) {
        if (DayMatches(day.tm_mday, day.tm_mon + 1, day.tm_wday)) {
            for (int h = (d == 0 ? firstHour : 0); h < 24; ++h) {
                if (!hours_.test(h)) continue;
                int m0 = (d == 0 && h == firstHour) ? firstMinute : 0;
                for (int m = m0; m < 60; ++m) {
                    if (!minutes_.test(m)) continue;
                    std::tm candidate = day;
                    candidate.tm_hour = h;
                    candidate.tm_min = m;
                    candidate.tm_sec = 0;
                    return static_cast<int64_t>(timegm(&candidate));
                }
            }
        }

        // Advance to midnight of the following day
        day.tm_mday += 1;
        day.tm_hour = 0;
        day.tm_min = 0;
        day.tm_sec = 0;
        std::time_t next = timegm(&day);
        gmtime_r(&next, &day);
    }

    return std::nullopt;
}

} // namespace util
} // namespace liquidstake
