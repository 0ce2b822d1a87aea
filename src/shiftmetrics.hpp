#pragma once

#include <string_view>

#include "config.hpp"
#include "result.hpp"
#include "time.hpp"

// All of these treat an end time before the start time as a shift that crosses midnight.

Duration getShiftDuration(const TimePoint& start, const TimePoint& end);

// The part of the shift that lies outside of the delivery window of the day(s) it touches
Duration getIdleTime(
    const Config::DeliveryWindow& window, const TimePoint& start, const TimePoint& end);

Duration getActiveTime(const Duration& shiftDuration, const Duration& idleTime);

Result<Duration> getShiftDuration(std::string_view start, std::string_view end);
Result<Duration> getIdleTime(
    const Config::DeliveryWindow& window, std::string_view start, std::string_view end);
Result<Duration> getActiveTime(std::string_view shiftDuration, std::string_view idleTime);
