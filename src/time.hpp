#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "result.hpp"

constexpr int64_t SecondsPerMinute = 60;
constexpr int64_t SecondsPerHour = 60 * SecondsPerMinute;
constexpr int64_t SecondsPerDay = 24 * SecondsPerHour;

// Decodes "h:mm:ss am|pm" (12-hour clock) or "h:mm:ss" (24-hour clock or elapsed time) into
// seconds. Without a modifier the hours are not bounded, so elapsed totals like "168:00:00" parse.
Result<int64_t> parseClockOrDuration(std::string_view text);

// "h:mm:ss" with unpadded hours. Negative values are clamped to zero.
std::string formatSeconds(int64_t seconds);

struct Duration {
    int64_t seconds = 0;

    constexpr int64_t toSeconds() const { return seconds; }
    constexpr int64_t toMinutes() const { return seconds / SecondsPerMinute; }
    constexpr int64_t toHours() const { return seconds / SecondsPerHour; }

    // Negative durations become zero
    constexpr Duration clamped() const { return Duration { seconds < 0 ? 0 : seconds }; }

    // Only elapsed values ("h:mm:ss"), no am/pm modifier
    static Result<Duration> parse(std::string_view str);
    static constexpr Duration fromHours(int64_t h) { return Duration { h * SecondsPerHour }; }
    static constexpr Duration fromMinutes(int64_t m) { return Duration { m * SecondsPerMinute }; }
    static constexpr Duration fromSeconds(int64_t s) { return Duration { s }; }
};

std::string toString(const Duration& d);

constexpr Duration operator+(const Duration& a, const Duration& b)
{
    return Duration { a.seconds + b.seconds };
}

constexpr Duration operator-(const Duration& a, const Duration& b)
{
    return Duration { a.seconds - b.seconds };
}

constexpr Duration operator*(const Duration& d, int64_t factor)
{
    return Duration { d.seconds * factor };
}

inline Duration& operator+=(Duration& a, const Duration& b)
{
    a.seconds += b.seconds;
    return a;
}

constexpr bool operator==(const Duration& a, const Duration& b)
{
    return a.seconds == b.seconds;
}

constexpr bool operator!=(const Duration& a, const Duration& b)
{
    return !(a == b);
}

constexpr bool operator<(const Duration& a, const Duration& b)
{
    return a.seconds < b.seconds;
}

constexpr bool operator>=(const Duration& a, const Duration& b)
{
    return !(a < b);
}

// A wall clock time within a single day
struct TimePoint {
    uint32_t hours;
    uint32_t minutes;
    uint32_t seconds = 0;

    constexpr int64_t toSeconds() const
    {
        return static_cast<int64_t>(seconds) + SecondsPerMinute * minutes
            + SecondsPerHour * hours;
    }

    static Result<TimePoint> parse(std::string_view str);
    static TimePoint fromSeconds(int64_t secondsOfDay);
};

// 12-hour form, e.g. "5:00:00 pm"
std::string toString(const TimePoint& tp);
