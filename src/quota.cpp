#include "quota.hpp"

#include "error.hpp"

bool isHolidayDate(const Config& config, const Date& date)
{
    return config.holiday.start <= date && date <= config.holiday.end;
}

Duration getDailyMinimum(const Config& config, const Date& date)
{
    return isHolidayDate(config, date) ? config.dailyMinimum.holiday
                                       : config.dailyMinimum.ordinary;
}

bool metQuota(const Config& config, const Date& date, const Duration& activeTime)
{
    return activeTime >= getDailyMinimum(config, date);
}

Result<bool> metQuota(const Config& config, std::string_view date, std::string_view activeTime)
{
    const auto d = Date::parse(date);
    const auto active = Duration::parse(activeTime);
    if (!d || !active) {
        return error(ShiftError::InvalidFormat);
    }
    return metQuota(config, *d, *active);
}
