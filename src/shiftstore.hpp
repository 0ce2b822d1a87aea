#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "records.hpp"
#include "result.hpp"

// The shift file is the only state. Every operation reads it from disk again and write operations
// replace the whole file, which keeps it sorted by date. There is no locking, so only one process
// may write to a given file at a time.
class ShiftStore {
public:
    ShiftStore(std::string path, Config config = Config());

    const std::string& getPath() const;

    // Computes the derived fields and inserts the record in date order.
    // Returns nullopt without touching the file if (driverId, date) is already recorded.
    Result<std::optional<ShiftRecord>> append(const NewShift& shift);

    // Returns whether the file was rewritten. If no record matches, the file is left as it is.
    Result<bool> setBonus(std::string_view driverId, std::string_view date, bool value);

    Result<std::vector<ShiftRecord>> readAll() const;

private:
    Result<ShiftRecord> makeRecord(const NewShift& shift) const;

    std::string path_;
    Config config_;
};

// Skips lines that are too short or do not parse. A missing file yields no records.
Result<std::vector<ShiftRecord>> readShiftRecords(const std::string& path);
