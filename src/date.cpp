#include "date.hpp"

#include <array>
#include <tuple>

#include "error.hpp"
#include "string.hpp"

namespace {
constexpr std::array<std::string_view, 7> weekdayNames = { "Sunday", "Monday", "Tuesday",
    "Wednesday", "Thursday", "Friday", "Saturday" };

// Howard Hinnant's days_from_civil
int64_t daysFromCivil(int32_t y, uint32_t m, uint32_t d)
{
    y -= m <= 2;
    const int32_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<uint32_t>(y - era * 400);
    const uint32_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const uint32_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool allDigits(std::string_view str)
{
    for (const auto c : str) {
        if (!isDigit(c)) {
            return false;
        }
    }
    return !str.empty();
}
}

std::string_view toString(Weekday weekday)
{
    const auto idx = static_cast<size_t>(weekday);
    if (idx >= weekdayNames.size()) {
        return "INVALID";
    }
    return weekdayNames[idx];
}

std::optional<Weekday> parseWeekday(std::string_view str)
{
    const auto trimmed = trim(str);
    for (size_t i = 0; i < weekdayNames.size(); ++i) {
        if (ciEqual(trimmed, weekdayNames[i])) {
            return static_cast<Weekday>(i);
        }
    }
    return std::nullopt;
}

bool isLeapYear(int32_t year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

uint32_t daysInMonth(int32_t year, uint32_t month)
{
    static constexpr std::array<uint32_t, 12> days
        = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return days[month - 1];
}

int64_t Date::toDays() const
{
    return daysFromCivil(year, month, day);
}

Weekday Date::weekday() const
{
    // 1970-01-01 was a thursday
    auto wd = (toDays() + 4) % 7;
    if (wd < 0) {
        wd += 7;
    }
    return static_cast<Weekday>(wd);
}

Result<Date> Date::parse(std::string_view str)
{
    str = trim(str);
    const auto parts = split(str, '-');
    if (parts.size() != 3 || parts[0].size() != 4 || parts[1].size() != 2
        || parts[2].size() != 2) {
        return error(ShiftError::InvalidFormat);
    }
    if (!allDigits(parts[0]) || !allDigits(parts[1]) || !allDigits(parts[2])) {
        return error(ShiftError::InvalidFormat);
    }

    const auto year = parseInt<int32_t>(parts[0]);
    const auto month = parseInt<uint32_t>(parts[1]);
    const auto day = parseInt<uint32_t>(parts[2]);
    if (!year || !month || !day) {
        return error(ShiftError::InvalidFormat);
    }
    if (!isValidMonth(*month) || *day < 1 || *day > daysInMonth(*year, *month)) {
        return error(ShiftError::InvalidFormat);
    }
    return Date { *year, *month, *day };
}

std::string toString(const Date& date)
{
    return rjust(std::to_string(date.year), 4, '0') + "-" + rjust(std::to_string(date.month), 2, '0')
        + "-" + rjust(std::to_string(date.day), 2, '0');
}

bool operator==(const Date& a, const Date& b)
{
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const Date& a, const Date& b)
{
    return !(a == b);
}

bool operator<(const Date& a, const Date& b)
{
    return std::make_tuple(a.year, a.month, a.day) < std::make_tuple(b.year, b.month, b.day);
}

bool operator<=(const Date& a, const Date& b)
{
    return !(b < a);
}

bool isValidMonth(int64_t month)
{
    return month >= 1 && month <= 12;
}

Result<uint32_t> parseMonth(std::string_view str)
{
    str = trim(str);
    if (str.empty() || str.size() > 2) {
        return error(ShiftError::InvalidFormat);
    }
    const auto month = parseInt<uint32_t>(str);
    if (!month || !isValidMonth(*month)) {
        return error(ShiftError::InvalidFormat);
    }
    return *month;
}
