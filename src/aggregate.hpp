#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "result.hpp"
#include "time.hpp"

// Number of bonus-flagged shifts of the driver in the month (1-12, any year).
// Returns -1 if the file does not exist or the driver has no bonus-flagged shift at all, in any
// month. Drivers that only have shifts without a bonus are considered unknown here.
Result<int> countBonusPerMonth(const std::string& shiftFile, std::string_view driverId, int month);

// Sum of the active time of all the driver's shifts in the month. Zero if there are none.
Result<Duration> getTotalActiveHoursPerMonth(
    const std::string& shiftFile, std::string_view driverId, int month);
