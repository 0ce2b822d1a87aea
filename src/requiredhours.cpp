#include "requiredhours.hpp"

#include <algorithm>
#include <set>

#include "date.hpp"
#include "error.hpp"
#include "log.hpp"
#include "quota.hpp"
#include "ratetable.hpp"
#include "shiftstore.hpp"

Result<Duration> getRequiredHoursPerMonth(const Config& config, const std::string& shiftFile,
    const std::string& rateFile, int bonusCount, std::string_view driverId, int month)
{
    if (!isValidMonth(month)) {
        slog::error("Invalid month ", month);
        return error(ShiftError::InvalidFormat);
    }

    const auto rate = findDriverRate(rateFile, driverId);
    if (!rate) {
        return error(rate.error());
    }
    std::optional<Weekday> dayOff;
    if (*rate) {
        dayOff = (*rate)->dayOff;
    } else {
        slog::warning("Driver '", driverId, "' has no entry in '", rateFile,
            "', no day-off is applied");
    }

    const auto records = readShiftRecords(shiftFile);
    if (!records) {
        return error(records.error());
    }

    // The store keeps one shift per driver and date, but a hand-edited file might not
    std::set<Date> dates;
    for (const auto& record : *records) {
        if (record.driverId == driverId && record.date.month == static_cast<uint32_t>(month)) {
            dates.insert(record.date);
        }
    }

    Duration required;
    for (const auto& date : dates) {
        if (dayOff && date.weekday() == *dayOff) {
            continue;
        }
        required += getDailyMinimum(config, date);
    }

    const auto bonusCredit = config.bonusCredit * std::max(bonusCount, 0);
    return (required - bonusCredit).clamped();
}
