// LIQUIDSTAKE - Time Utilities Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/util/time.h"

#include <cstdio>
#include <ctime>
#include <thread>

namespace liquidstake {
namespace util {

namespace {

std::atomic<int64_t> g_mockTime{0};

/// Longest single nap while waiting on an interrupt flag
constexpr Milliseconds POLL_SLICE{50};

std::string FormatUTC(int64_t timestamp, const char* layout) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm parts;
    char buffer[32];
    if (gmtime_r(&time, &parts) == nullptr ||
        std::strftime(buffer, sizeof(buffer), layout, &parts) == 0) {
        return std::to_string(timestamp);
    }
    return buffer;
}

} // namespace

int64_t GetTime() {
    int64_t mock = g_mockTime.load();
    if (mock != 0) {
        return mock;
    }
    return ToUnixTime(std::chrono::system_clock::now());
}

int64_t GetTimeMillis() {
    int64_t mock = g_mockTime.load();
    if (mock != 0) {
        return mock * 1000;
    }
    return std::chrono::duration_cast<Milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

int64_t GetMockTime() {
    return g_mockTime.load();
}

void AdvanceMockTime(int64_t seconds) {
    g_mockTime.fetch_add(seconds);
}

SystemTimePoint FromUnixTime(int64_t timestamp) {
    return SystemTimePoint(std::chrono::seconds(timestamp));
}

int64_t ToUnixTime(SystemTimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::string FormatISO8601(int64_t timestamp) {
    return FormatUTC(timestamp, "%Y-%m-%dT%H:%M:%SZ");
}

std::string FormatISO8601Millis(SystemTimePoint tp) {
    auto sinceEpoch = std::chrono::duration_cast<Milliseconds>(tp.time_since_epoch()).count();
    int64_t seconds = sinceEpoch / 1000;
    int64_t millis = sinceEpoch % 1000;
    if (millis < 0) {
        millis += 1000;
        --seconds;
    }
    char fraction[8];
    std::snprintf(fraction, sizeof(fraction), ".%03dZ", static_cast<int>(millis));
    return FormatUTC(seconds, "%Y-%m-%dT%H:%M:%S") + fraction;
}

std::string FormatDuration(int64_t seconds) {
    if (seconds == 0) {
        return "0s";
    }
    std::string out;
    uint64_t left = seconds < 0 ? 0 - static_cast<uint64_t>(seconds)
                                : static_cast<uint64_t>(seconds);

    static const struct { uint64_t size; char suffix; } units[] = {
        {86400, 'd'}, {3600, 'h'}, {60, 'm'}, {1, 's'},
    };
    for (const auto& unit : units) {
        uint64_t count = left / unit.size;
        left %= unit.size;
        if (count == 0) {
            continue;
        }
        if (!out.empty()) {
            out += ' ';
        }
        out += std::to_string(count) + unit.suffix;
    }
    return seconds < 0 ? "-" + out : out;
}

bool SleepInterruptible(Milliseconds duration, const std::atomic<bool>& interrupt) {
    const auto deadline = SteadyClock::now() + duration;
    for (;;) {
        if (interrupt.load()) {
            return true;
        }
        auto now = SteadyClock::now();
        if (now >= deadline) {
            return false;
        }
        auto left = std::chrono::duration_cast<Milliseconds>(deadline - now);
        std::this_thread::sleep_for(left < POLL_SLICE ? left + Milliseconds(1) : POLL_SLICE);
    }
}

} // namespace util
} // namespace liquidstake
