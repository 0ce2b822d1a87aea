#include "aggregate.hpp"

#include "date.hpp"
#include "error.hpp"
#include "log.hpp"
#include "shiftstore.hpp"
#include "util.hpp"

Result<int> countBonusPerMonth(const std::string& shiftFile, std::string_view driverId, int month)
{
    if (!isValidMonth(month)) {
        slog::error("Invalid month ", month);
        return error(ShiftError::InvalidFormat);
    }
    if (!fileExists(shiftFile)) {
        return -1;
    }

    const auto records = readShiftRecords(shiftFile);
    if (!records) {
        return error(records.error());
    }

    bool anyBonus = false;
    int count = 0;
    for (const auto& record : *records) {
        if (record.driverId != driverId || !record.hasBonus) {
            continue;
        }
        anyBonus = true;
        if (record.date.month == static_cast<uint32_t>(month)) {
            count++;
        }
    }
    return anyBonus ? count : -1;
}

Result<Duration> getTotalActiveHoursPerMonth(
    const std::string& shiftFile, std::string_view driverId, int month)
{
    if (!isValidMonth(month)) {
        slog::error("Invalid month ", month);
        return error(ShiftError::InvalidFormat);
    }

    const auto records = readShiftRecords(shiftFile);
    if (!records) {
        return error(records.error());
    }

    Duration total;
    for (const auto& record : *records) {
        if (record.driverId == driverId && record.date.month == static_cast<uint32_t>(month)) {
            total += record.activeTime;
        }
    }
    return total;
}
