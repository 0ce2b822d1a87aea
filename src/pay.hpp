#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "config.hpp"
#include "ratetable.hpp"
#include "result.hpp"
#include "time.hpp"

// Whole missing hours according to config.missingHoursRounding. For Exact this rounds down, the
// deduction itself is computed on seconds.
int64_t getMissingHours(const Config& config, const Duration& actual, const Duration& required);

// basePay minus the deduction for every missing hour beyond the tier's allowance, at
// basePay / deductionDivisor per hour. Never negative.
int64_t calculateNetPay(
    const Config& config, const DriverRate& rate, const Duration& actual, const Duration& required);

// Fails with ShiftError::DriverNotFound if the rate file is missing or has no entry for the driver
Result<int64_t> getNetPay(const Config& config, std::string_view driverId, const Duration& actual,
    const Duration& required, const std::string& rateFile);
Result<int64_t> getNetPay(const Config& config, std::string_view driverId,
    std::string_view actualHours, std::string_view requiredHours, const std::string& rateFile);
