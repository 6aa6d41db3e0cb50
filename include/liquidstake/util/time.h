// LIQUIDSTAKE - Time Utilities
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Unix-seconds clock used by the staking service and the claim scheduler.
// Tests pin it with SetMockTime(); a mock time of 0 means the real clock.

#ifndef LIQUIDSTAKE_UTIL_TIME_H
#define LIQUIDSTAKE_UTIL_TIME_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace liquidstake {
namespace util {

using Milliseconds = std::chrono::milliseconds;
using SteadyClock = std::chrono::steady_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

/// Seconds since the epoch, or the mock time when one is set
int64_t GetTime();

/// GetTime() in milliseconds; whole seconds while mocked
int64_t GetTimeMillis();

/// Pin GetTime() to timestamp; 0 returns to the system clock
void SetMockTime(int64_t timestamp);
int64_t GetMockTime();
void AdvanceMockTime(int64_t seconds);

SystemTimePoint FromUnixTime(int64_t timestamp);
int64_t ToUnixTime(SystemTimePoint tp);

/// UTC, "2024-01-15T10:30:00Z"
std::string FormatISO8601(int64_t timestamp);

/// UTC with milliseconds, "2024-01-15T10:30:00.123Z"
std::string FormatISO8601Millis(SystemTimePoint tp);

/// Largest units first, zero units skipped: 90061 -> "1d 1h 1m 1s"
std::string FormatDuration(int64_t seconds);

/**
 * Block for duration, waking early once interrupt is set.
 * @return true if interrupted
 */
bool SleepInterruptible(Milliseconds duration, const std::atomic<bool>& interrupt);

} // namespace util
} // namespace liquidstake

#endif // LIQUIDSTAKE_UTIL_TIME_H
