#pragma once

#include <array>
#include <optional>
#include <string>

#include "date.hpp"
#include "log.hpp"
#include "time.hpp"

enum class MissingHoursRounding { Floor, Ceil, Exact };

std::string_view toString(MissingHoursRounding rounding);
std::optional<MissingHoursRounding> parseMissingHoursRounding(std::string_view str);

// The business rules of the payroll. Components copy this at construction and never modify it, so
// alternative settings (e.g. another holiday window) can live side by side.
struct Config {
    // Time outside of this window counts as idle time
    struct DeliveryWindow {
        TimePoint start = { 8, 0, 0 };
        TimePoint end = { 22, 0, 0 };
    };

    // Active time needed per day to meet the quota
    struct DailyMinimum {
        Duration ordinary = Duration::fromMinutes(8 * 60 + 24);
        Duration holiday = Duration::fromHours(6);
    };

    // Both ends inclusive
    struct Holiday {
        Date start = { 2025, 4, 10 };
        Date end = { 2025, 4, 30 };
    };

    DeliveryWindow deliveryWindow;
    DailyMinimum dailyMinimum;
    Holiday holiday;
    // Subtracted from the monthly required hours for every bonus
    Duration bonusCredit = Duration::fromHours(2);
    // Missing hours tolerated without deduction, index 0 is tier 1
    std::array<int64_t, 4> tierAllowanceHours = { 50, 20, 10, 3 };
    // The hourly deduction rate is basePay / deductionDivisor (rounded down)
    int64_t deductionDivisor = 185;
    MissingHoursRounding missingHoursRounding = MissingHoursRounding::Floor;
    // Nothing in the library applies this. The embedding application passes it to
    // slog::setLogLevel after loading the config.
    slog::Severity logLevel = slog::Severity::Info;

    std::optional<int64_t> getTierAllowanceHours(int64_t tier) const;

    // On failure the error is logged and the config is left untouched
    bool loadFromFile(const std::string& path);
};
