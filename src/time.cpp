#include "time.hpp"

#include <array>
#include <cassert>

#include "error.hpp"
#include "string.hpp"

Result<int64_t> parseClockOrDuration(std::string_view text)
{
    const auto str = toLower(trim(text));
    const auto parts = split(str, ' ');
    assert(parts.size() > 0);
    if (parts.size() > 2) {
        return error(ShiftError::InvalidFormat);
    }

    const auto fields = split(parts[0], ':');
    if (fields.size() != 3) {
        return error(ShiftError::InvalidFormat);
    }

    std::array<uint32_t, 3> nums = {};
    for (size_t i = 0; i < fields.size(); ++i) {
        const auto n = parseInt<uint32_t>(fields[i]);
        if (!n) {
            return error(ShiftError::InvalidFormat);
        }
        nums[i] = *n;
    }

    auto [hours, minutes, seconds] = nums;
    if (minutes >= 60 || seconds >= 60) {
        return error(ShiftError::InvalidFormat);
    }

    if (parts.size() == 2) {
        const auto modifier = parts[1];
        if (hours < 1 || hours > 12) {
            return error(ShiftError::InvalidFormat);
        }
        if (modifier == "pm") {
            if (hours != 12) {
                hours += 12;
            }
        } else if (modifier == "am") {
            if (hours == 12) {
                hours = 0;
            }
        } else {
            return error(ShiftError::InvalidFormat);
        }
    }

    return static_cast<int64_t>(hours) * SecondsPerHour
        + static_cast<int64_t>(minutes) * SecondsPerMinute + static_cast<int64_t>(seconds);
}

std::string formatSeconds(int64_t seconds)
{
    if (seconds < 0) {
        seconds = 0;
    }

    const auto h = seconds / SecondsPerHour;
    const auto m = (seconds % SecondsPerHour) / SecondsPerMinute;
    const auto s = seconds % SecondsPerMinute;
    return std::to_string(h) + ":" + rjust(std::to_string(m), 2, '0') + ":"
        + rjust(std::to_string(s), 2, '0');
}

Result<Duration> Duration::parse(std::string_view str)
{
    if (trim(str).find(' ') != std::string_view::npos) {
        return error(ShiftError::InvalidFormat);
    }
    const auto secs = parseClockOrDuration(str);
    if (!secs) {
        return error(secs.error());
    }
    return Duration { *secs };
}

std::string toString(const Duration& d)
{
    return formatSeconds(d.seconds);
}

Result<TimePoint> TimePoint::parse(std::string_view str)
{
    const auto secs = parseClockOrDuration(str);
    if (!secs) {
        return error(secs.error());
    }
    if (*secs >= SecondsPerDay) {
        return error(ShiftError::InvalidFormat);
    }
    return TimePoint::fromSeconds(*secs);
}

TimePoint TimePoint::fromSeconds(int64_t secondsOfDay)
{
    assert(secondsOfDay >= 0 && secondsOfDay < SecondsPerDay);
    const auto h = secondsOfDay / SecondsPerHour;
    const auto m = (secondsOfDay % SecondsPerHour) / SecondsPerMinute;
    const auto s = secondsOfDay % SecondsPerMinute;
    return TimePoint { static_cast<uint32_t>(h), static_cast<uint32_t>(m),
        static_cast<uint32_t>(s) };
}

std::string toString(const TimePoint& tp)
{
    const auto pm = tp.hours >= 12;
    auto h = tp.hours % 12;
    if (h == 0) {
        h = 12;
    }
    return std::to_string(h) + ":" + rjust(std::to_string(tp.minutes), 2, '0') + ":"
        + rjust(std::to_string(tp.seconds), 2, '0') + (pm ? " pm" : " am");
}
