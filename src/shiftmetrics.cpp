#include "shiftmetrics.hpp"

#include <algorithm>
#include <utility>

#include "error.hpp"

namespace {
// [start, end) in seconds relative to the midnight before start. end > start unless both are equal.
std::pair<int64_t, int64_t> getInterval(const TimePoint& start, const TimePoint& end)
{
    const auto startSeconds = start.toSeconds();
    auto endSeconds = end.toSeconds();
    if (endSeconds < startSeconds) {
        endSeconds += SecondsPerDay;
    }
    return { startSeconds, endSeconds };
}
}

Duration getShiftDuration(const TimePoint& start, const TimePoint& end)
{
    const auto [startSeconds, endSeconds] = getInterval(start, end);
    return Duration { endSeconds - startSeconds };
}

Duration getIdleTime(
    const Config::DeliveryWindow& window, const TimePoint& start, const TimePoint& end)
{
    const auto [startSeconds, endSeconds] = getInterval(start, end);

    int64_t idle = 0;
    auto cursor = startSeconds;
    while (cursor < endSeconds) {
        const auto dayStart = (cursor / SecondsPerDay) * SecondsPerDay;
        const auto dayEnd = dayStart + SecondsPerDay;
        const auto segmentEnd = std::min(endSeconds, dayEnd);

        const auto deliveryStart = dayStart + window.start.toSeconds();
        const auto deliveryEnd = dayStart + window.end.toSeconds();

        if (cursor < deliveryStart) {
            idle += std::max<int64_t>(0, std::min(segmentEnd, deliveryStart) - cursor);
        }
        if (segmentEnd > deliveryEnd) {
            idle += std::max<int64_t>(0, segmentEnd - std::max(cursor, deliveryEnd));
        }

        cursor = segmentEnd;
    }

    return Duration { idle };
}

Duration getActiveTime(const Duration& shiftDuration, const Duration& idleTime)
{
    return (shiftDuration - idleTime).clamped();
}

Result<Duration> getShiftDuration(std::string_view start, std::string_view end)
{
    const auto startTime = TimePoint::parse(start);
    const auto endTime = TimePoint::parse(end);
    if (!startTime || !endTime) {
        return error(ShiftError::InvalidFormat);
    }
    return getShiftDuration(*startTime, *endTime);
}

Result<Duration> getIdleTime(
    const Config::DeliveryWindow& window, std::string_view start, std::string_view end)
{
    const auto startTime = TimePoint::parse(start);
    const auto endTime = TimePoint::parse(end);
    if (!startTime || !endTime) {
        return error(ShiftError::InvalidFormat);
    }
    return getIdleTime(window, *startTime, *endTime);
}

Result<Duration> getActiveTime(std::string_view shiftDuration, std::string_view idleTime)
{
    const auto shift = Duration::parse(shiftDuration);
    const auto idle = Duration::parse(idleTime);
    if (!shift || !idle) {
        return error(ShiftError::InvalidFormat);
    }
    return getActiveTime(*shift, *idle);
}
