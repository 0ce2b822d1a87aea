#include "test.hpp"

#include "error.hpp"
#include "requiredhours.hpp"
#include "tempfile.hpp"

namespace {
std::string line(const std::string& id, const std::string& date)
{
    return id + ",Name," + date + ",8:00:00 am,5:00:00 pm,9:00:00,0:00:00,9:00:00,true,false\n";
}

// 2025-04-05 is a saturday, 2025-04-12 is in the holiday
const std::string shifts = line("D1", "2025-04-05") + line("D1", "2025-04-06")
    + line("D1", "2025-04-07") + line("D1", "2025-04-12") + line("D1", "2025-05-04")
    + line("D2", "2025-04-05") + line("D3", "2025-04-06") + line("D3", "2025-04-07");

const std::string rates = "D1,Sunday,18500,2\n"
                          "D2,saturday,20000,1\n";

std::string required(const std::string& shiftFile, const std::string& rateFile, int bonusCount,
    const std::string& driverId, int month)
{
    const Config config;
    return toString(
        *getRequiredHoursPerMonth(config, shiftFile, rateFile, bonusCount, driverId, month));
}
}

TEST_CASE("required hours skip the day-off")
{
    TempFile shiftFile(shifts);
    TempFile rateFile(rates);
    // 8:24 + 8:24 + 6:00, sunday skipped
    TEST_CHECK(required(shiftFile.path(), rateFile.path(), 0, "D1", 4) == "22:48:00");
    // Only shift is on the day-off
    TEST_CHECK(required(shiftFile.path(), rateFile.path(), 0, "D2", 4) == "0:00:00");
    // Sunday 2025-05-04 is the day-off
    TEST_CHECK(required(shiftFile.path(), rateFile.path(), 0, "D1", 5) == "0:00:00");
}

TEST_CASE("required hours subtract the bonus credit")
{
    TempFile shiftFile(shifts);
    TempFile rateFile(rates);
    TEST_CHECK(required(shiftFile.path(), rateFile.path(), 1, "D1", 4) == "20:48:00");
    TEST_CHECK(required(shiftFile.path(), rateFile.path(), 3, "D1", 4) == "16:48:00");
    TEST_CHECK(required(shiftFile.path(), rateFile.path(), 20, "D1", 4) == "0:00:00");
    TEST_CHECK(required(shiftFile.path(), rateFile.path(), -1, "D1", 4) == "22:48:00");
}

TEST_CASE("required hours without a rate entry")
{
    TempFile shiftFile(shifts);
    TempFile rateFile(rates);
    TEST_CHECK(required(shiftFile.path(), rateFile.path(), 0, "D3", 4) == "16:48:00");

    TempFile missingRates;
    TEST_CHECK(required(shiftFile.path(), missingRates.path(), 0, "D1", 4) == "31:12:00");
}

TEST_CASE("required hours count every date once")
{
    TempFile shiftFile(line("D1", "2025-05-05") + line("D1", "2025-05-05") + line("D1", "2025-05-06"));
    TempFile rateFile(rates);
    TEST_CHECK(required(shiftFile.path(), rateFile.path(), 0, "D1", 5) == "16:48:00");
}

TEST_CASE("required hours with no shifts")
{
    TempFile shiftFile;
    TempFile rateFile(rates);
    TEST_CHECK(required(shiftFile.path(), rateFile.path(), 0, "D1", 4) == "0:00:00");
}

TEST_CASE("required hours reject invalid months")
{
    TempFile shiftFile(shifts);
    TempFile rateFile(rates);
    const Config config;
    const auto res = getRequiredHoursPerMonth(config, shiftFile.path(), rateFile.path(), 0, "D1", 0);
    TEST_CHECK(res.error() == make_error_code(ShiftError::InvalidFormat));
}
