#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "result.hpp"

enum class Weekday { Sunday, Monday, Tuesday, Wednesday, Thursday, Friday, Saturday };

std::string_view toString(Weekday weekday);
// Full english weekday name, case-insensitive
std::optional<Weekday> parseWeekday(std::string_view str);

bool isLeapYear(int32_t year);
uint32_t daysInMonth(int32_t year, uint32_t month);

struct Date {
    int32_t year;
    uint32_t month; // 1-12
    uint32_t day; // 1-31

    // Days since 1970-01-01, proleptic gregorian
    int64_t toDays() const;
    Weekday weekday() const;

    // Strictly "yyyy-mm-dd"
    static Result<Date> parse(std::string_view str);
};

std::string toString(const Date& date);

bool operator==(const Date& a, const Date& b);
bool operator!=(const Date& a, const Date& b);
bool operator<(const Date& a, const Date& b);
bool operator<=(const Date& a, const Date& b);

bool isValidMonth(int64_t month);
// "m" or "mm", 1-12
Result<uint32_t> parseMonth(std::string_view str);
