#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "date.hpp"
#include "time.hpp"

// What the caller provides when recording a shift. Everything else is derived.
struct NewShift {
    std::string driverId;
    std::string driverName;
    std::string date; // yyyy-mm-dd
    std::string startTime; // h:mm:ss am|pm
    std::string endTime;
};

// One line of the shift file:
// driverID,driverName,date,startTime,endTime,shiftDuration,idleTime,activeTime,metQuota,hasBonus
struct ShiftRecord {
    static constexpr size_t NumFields = 10;
    static constexpr size_t DriverIdField = 0;
    static constexpr size_t DateField = 2;
    static constexpr size_t HasBonusField = 9;

    std::string driverId;
    std::string driverName;
    Date date;
    // Kept as written, so a rewrite does not change them
    std::string startTime;
    std::string endTime;
    Duration shiftDuration;
    Duration idleTime;
    Duration activeTime;
    bool metQuota = false;
    bool hasBonus = false;

    // Lines with fewer than NumFields fields or unparsable fields yield nullopt
    static std::optional<ShiftRecord> parse(std::string_view line);
};

std::string toString(const ShiftRecord& record);

std::string_view formatBool(bool value);
std::optional<bool> parseBool(std::string_view str);

// Ids and names are written without escaping, so they must not contain separators
bool isValidField(std::string_view str);
