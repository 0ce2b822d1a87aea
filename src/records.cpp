#include "records.hpp"

#include "string.hpp"

std::optional<ShiftRecord> ShiftRecord::parse(std::string_view line)
{
    const auto fields = split(line, ',');
    if (fields.size() < NumFields) {
        return std::nullopt;
    }

    const auto date = Date::parse(fields[DateField]);
    const auto start = TimePoint::parse(fields[3]);
    const auto end = TimePoint::parse(fields[4]);
    const auto shiftDuration = Duration::parse(fields[5]);
    const auto idleTime = Duration::parse(fields[6]);
    const auto activeTime = Duration::parse(fields[7]);
    const auto metQuota = parseBool(fields[8]);
    const auto hasBonus = parseBool(fields[HasBonusField]);
    if (!date || !start || !end || !shiftDuration || !idleTime || !activeTime || !metQuota
        || !hasBonus) {
        return std::nullopt;
    }

    return ShiftRecord {
        std::string(trim(fields[DriverIdField])),
        std::string(trim(fields[1])),
        *date,
        std::string(trim(fields[3])),
        std::string(trim(fields[4])),
        *shiftDuration,
        *idleTime,
        *activeTime,
        *metQuota,
        *hasBonus,
    };
}

std::string toString(const ShiftRecord& r)
{
    std::string line;
    line.reserve(96);
    line.append(r.driverId);
    line.push_back(',');
    line.append(r.driverName);
    line.push_back(',');
    line.append(toString(r.date));
    line.push_back(',');
    line.append(r.startTime);
    line.push_back(',');
    line.append(r.endTime);
    line.push_back(',');
    line.append(toString(r.shiftDuration));
    line.push_back(',');
    line.append(toString(r.idleTime));
    line.push_back(',');
    line.append(toString(r.activeTime));
    line.push_back(',');
    line.append(formatBool(r.metQuota));
    line.push_back(',');
    line.append(formatBool(r.hasBonus));
    return line;
}

std::string_view formatBool(bool value)
{
    return value ? "true" : "false";
}

std::optional<bool> parseBool(std::string_view str)
{
    str = trim(str);
    if (str == "true") {
        return true;
    }
    if (str == "false") {
        return false;
    }
    return std::nullopt;
}

bool isValidField(std::string_view str)
{
    return !trim(str).empty() && str.find_first_of(",\r\n") == std::string_view::npos;
}
