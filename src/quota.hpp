#pragma once

#include <string_view>

#include "config.hpp"
#include "date.hpp"
#include "result.hpp"
#include "time.hpp"

bool isHolidayDate(const Config& config, const Date& date);

// The active time a driver has to reach on this date
Duration getDailyMinimum(const Config& config, const Date& date);

bool metQuota(const Config& config, const Date& date, const Duration& activeTime);
Result<bool> metQuota(const Config& config, std::string_view date, std::string_view activeTime);
