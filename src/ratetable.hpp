#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "date.hpp"
#include "result.hpp"

// One line of the rate file: driverID,dayOff,basePay,tier
struct DriverRate {
    static constexpr size_t NumFields = 4;

    std::string driverId;
    Weekday dayOff;
    // Per month, in whole units. A fractional part in the file is dropped.
    int64_t basePay;
    int64_t tier; // 1-4

    static std::optional<DriverRate> parse(std::string_view line);
};

// Skips malformed lines. A missing file yields an empty table.
Result<std::vector<DriverRate>> readDriverRates(const std::string& path);

// nullopt if the file does not exist or has no entry for the driver
Result<std::optional<DriverRate>> findDriverRate(const std::string& path, std::string_view driverId);
