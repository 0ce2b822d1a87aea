#include "shiftstore.hpp"

#include <algorithm>

#include "error.hpp"
#include "log.hpp"
#include "metrics.hpp"
#include "quota.hpp"
#include "shiftmetrics.hpp"
#include "string.hpp"
#include "util.hpp"

namespace {
struct StoredLine {
    // Lines without a parsable date are kept, but sort before all others
    std::optional<Date> date;
    std::string_view text;
};

bool lineMatches(const std::vector<std::string_view>& fields, std::string_view driverId,
    std::string_view date)
{
    return fields.size() > ShiftRecord::DateField
        && trim(fields[ShiftRecord::DriverIdField]) == driverId
        && trim(fields[ShiftRecord::DateField]) == date;
}

std::error_code rewrite(const std::string& path, const std::vector<std::string>& lines)
{
    Metrics::get().fileWrites.labels(path).inc();
    return writeFile(path, join(lines, "\n"));
}
}

ShiftStore::ShiftStore(std::string path, Config config)
    : path_(std::move(path))
    , config_(std::move(config))
{
}

const std::string& ShiftStore::getPath() const
{
    return path_;
}

Result<ShiftRecord> ShiftStore::makeRecord(const NewShift& shift) const
{
    if (!isValidField(shift.driverId) || !isValidField(shift.driverName)) {
        slog::error("Driver id and name must be non-empty and must not contain ',' or newlines");
        return error(ShiftError::InvalidFormat);
    }
    const auto date = Date::parse(shift.date);
    if (!date) {
        slog::error("Invalid shift date '", shift.date, "'");
        return error(ShiftError::InvalidFormat);
    }
    const auto start = TimePoint::parse(shift.startTime);
    const auto end = TimePoint::parse(shift.endTime);
    if (!start || !end) {
        slog::error("Invalid shift times '", shift.startTime, "' - '", shift.endTime, "'");
        return error(ShiftError::InvalidFormat);
    }

    ShiftRecord record;
    record.driverId = std::string(trim(shift.driverId));
    record.driverName = std::string(trim(shift.driverName));
    record.date = *date;
    record.startTime = std::string(trim(shift.startTime));
    record.endTime = std::string(trim(shift.endTime));
    record.shiftDuration = getShiftDuration(*start, *end);
    record.idleTime = getIdleTime(config_.deliveryWindow, *start, *end);
    record.activeTime = getActiveTime(record.shiftDuration, record.idleTime);
    record.metQuota = metQuota(config_, record.date, record.activeTime);
    record.hasBonus = false;
    return record;
}

Result<std::optional<ShiftRecord>> ShiftStore::append(const NewShift& shift)
{
    const auto record = makeRecord(shift);
    if (!record) {
        Metrics::get().appendsRejected.labels("invalid").inc();
        return error(record.error());
    }

    if (!fileExists(path_)) {
        if (const auto ec = writeFile(path_, ""); ec) {
            return error(ec);
        }
    }

    const auto contents = readFile(path_);
    if (!contents) {
        return error(contents.error());
    }

    const auto dateStr = toString(record->date);
    std::vector<StoredLine> lines;
    for (const auto line : splitLines(*contents)) {
        const auto fields = split(line, ',');
        if (lineMatches(fields, record->driverId, dateStr)) {
            slog::info("Shift for driver '", record->driverId, "' on ", dateStr,
                " is already recorded");
            Metrics::get().appendsRejected.labels("duplicate").inc();
            return std::optional<ShiftRecord>();
        }

        auto& stored = lines.emplace_back(StoredLine { std::nullopt, line });
        if (fields.size() > ShiftRecord::DateField) {
            const auto date = Date::parse(fields[ShiftRecord::DateField]);
            if (date) {
                stored.date = *date;
            }
        }
    }

    const auto newLine = toString(*record);
    lines.push_back(StoredLine { record->date, newLine });

    std::stable_sort(lines.begin(), lines.end(), [](const StoredLine& a, const StoredLine& b) {
        if (!a.date || !b.date) {
            return !a.date && b.date;
        }
        return *a.date < *b.date;
    });

    std::vector<std::string> out;
    out.reserve(lines.size());
    for (const auto& line : lines) {
        out.emplace_back(line.text);
    }
    if (const auto ec = rewrite(path_, out); ec) {
        return error(ec);
    }

    slog::info("Recorded shift for driver '", record->driverId, "' on ", dateStr, ": active ",
        toString(record->activeTime), ", idle ", toString(record->idleTime));
    Metrics::get().shiftsAppended.labels().inc();
    return std::optional<ShiftRecord>(*record);
}

Result<bool> ShiftStore::setBonus(std::string_view driverId, std::string_view date, bool value)
{
    if (!fileExists(path_)) {
        return false;
    }

    const auto contents = readFile(path_);
    if (!contents) {
        return error(contents.error());
    }

    bool updated = false;
    std::vector<std::string> out;
    for (const auto line : splitLines(*contents)) {
        auto fields = split(line, ',');
        if (fields.size() < ShiftRecord::NumFields || !lineMatches(fields, driverId, date)) {
            out.emplace_back(line);
            continue;
        }
        fields[ShiftRecord::HasBonusField] = formatBool(value);
        out.push_back(join(fields, ","));
        updated = true;
    }

    if (!updated) {
        slog::debug("No shift for driver '", driverId, "' on ", date, ", bonus not changed");
        return false;
    }

    if (const auto ec = rewrite(path_, out); ec) {
        return error(ec);
    }
    Metrics::get().bonusUpdates.labels(std::string(formatBool(value))).inc();
    return true;
}

Result<std::vector<ShiftRecord>> ShiftStore::readAll() const
{
    return readShiftRecords(path_);
}

Result<std::vector<ShiftRecord>> readShiftRecords(const std::string& path)
{
    std::vector<ShiftRecord> records;
    if (!fileExists(path)) {
        return records;
    }

    const auto contents = readFile(path);
    if (!contents) {
        return error(contents.error());
    }

    for (const auto line : splitLines(*contents)) {
        auto record = ShiftRecord::parse(line);
        if (!record) {
            slog::debug("Skipping malformed line in '", path, "': ", line);
            Metrics::get().malformedLines.labels(path).inc();
            continue;
        }
        records.push_back(std::move(*record));
    }
    return records;
}
