#pragma once

#include <string>
#include <string_view>

#include "config.hpp"
#include "result.hpp"
#include "time.hpp"

// The hours the driver had to work in the month: the daily minimum for every distinct date with a
// recorded shift, except dates on the driver's day-off, minus the bonus credit for every bonus.
// Drivers without an entry in the rate file get no day-off exemption. A negative bonusCount (the
// "unknown driver" result of countBonusPerMonth) counts as zero.
Result<Duration> getRequiredHoursPerMonth(const Config& config, const std::string& shiftFile,
    const std::string& rateFile, int bonusCount, std::string_view driverId, int month);
