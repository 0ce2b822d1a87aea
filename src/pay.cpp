#include "pay.hpp"

#include <algorithm>
#include <cassert>

#include "error.hpp"
#include "log.hpp"

namespace {
int64_t toHours(int64_t seconds, MissingHoursRounding rounding)
{
    if (rounding == MissingHoursRounding::Ceil) {
        return (seconds + SecondsPerHour - 1) / SecondsPerHour;
    }
    return seconds / SecondsPerHour;
}
}

int64_t getMissingHours(const Config& config, const Duration& actual, const Duration& required)
{
    const auto missing = (required - actual).clamped();
    return toHours(missing.toSeconds(), config.missingHoursRounding);
}

int64_t calculateNetPay(
    const Config& config, const DriverRate& rate, const Duration& actual, const Duration& required)
{
    assert(config.deductionDivisor > 0);
    const auto allowance = config.getTierAllowanceHours(rate.tier).value_or(0);
    const auto ratePerHour = rate.basePay / config.deductionDivisor;

    int64_t deduction = 0;
    if (config.missingHoursRounding == MissingHoursRounding::Exact) {
        const auto missing = (required - actual).clamped();
        const auto deductible
            = std::max<int64_t>(0, missing.toSeconds() - allowance * SecondsPerHour);
        deduction = deductible * ratePerHour / SecondsPerHour;
    } else {
        const auto deductible
            = std::max<int64_t>(0, getMissingHours(config, actual, required) - allowance);
        deduction = deductible * ratePerHour;
    }

    return std::max<int64_t>(0, rate.basePay - deduction);
}

Result<int64_t> getNetPay(const Config& config, std::string_view driverId, const Duration& actual,
    const Duration& required, const std::string& rateFile)
{
    const auto rate = findDriverRate(rateFile, driverId);
    if (!rate) {
        return error(rate.error());
    }
    if (!*rate) {
        slog::error("Driver '", driverId, "' not found in rate file '", rateFile, "'");
        return error(ShiftError::DriverNotFound);
    }

    const auto netPay = calculateNetPay(config, **rate, actual, required);
    slog::debug("Net pay for driver '", driverId, "': ", netPay, " (actual ", toString(actual),
        ", required ", toString(required), ")");
    return netPay;
}

Result<int64_t> getNetPay(const Config& config, std::string_view driverId,
    std::string_view actualHours, std::string_view requiredHours, const std::string& rateFile)
{
    const auto actual = Duration::parse(actualHours);
    const auto required = Duration::parse(requiredHours);
    if (!actual || !required) {
        slog::error("Invalid hours '", actualHours, "' / '", requiredHours, "'");
        return error(ShiftError::InvalidFormat);
    }
    return getNetPay(config, driverId, *actual, *required, rateFile);
}
