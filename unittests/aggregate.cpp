#include "test.hpp"

#include "aggregate.hpp"
#include "error.hpp"
#include "tempfile.hpp"

namespace {
const std::string shifts
    = "D1,A,2025-04-12,8:00:00 am,5:00:00 pm,9:00:00,0:00:00,9:00:00,true,true\n"
      "D1,A,2025-04-13,8:00:00 am,4:00:00 pm,8:00:00,0:00:00,8:00:00,true,false\n"
      "D2,B,2025-04-13,8:00:00 am,12:00:00 pm,4:00:00,0:00:00,4:00:00,false,false\n"
      "short,line\n"
      "D1,A,2025-05-02,8:00:00 am,5:00:00 pm,9:00:00,0:00:00,9:00:00,true,true\n"
      "D1,A,2026-04-01,8:00:00 am,10:30:15 am,2:30:15,0:00:00,2:30:15,false,true\n";
}

TEST_CASE("countBonusPerMonth")
{
    TempFile file(shifts);
    TEST_CHECK(*countBonusPerMonth(file.path(), "D1", 4) == 2);
    TEST_CHECK(*countBonusPerMonth(file.path(), "D1", 5) == 1);
    TEST_CHECK(*countBonusPerMonth(file.path(), "D1", 6) == 0);
}

TEST_CASE("countBonusPerMonth for drivers without any bonus")
{
    TempFile file(shifts);
    // D2 has shifts, but never a bonus
    TEST_CHECK(*countBonusPerMonth(file.path(), "D2", 4) == -1);
    TEST_CHECK(*countBonusPerMonth(file.path(), "D3", 4) == -1);

    TempFile missing;
    TEST_CHECK(*countBonusPerMonth(missing.path(), "D1", 4) == -1);
}

TEST_CASE("getTotalActiveHoursPerMonth")
{
    TempFile file(shifts);
    TEST_CHECK(toString(*getTotalActiveHoursPerMonth(file.path(), "D1", 4)) == "19:30:15");
    TEST_CHECK(toString(*getTotalActiveHoursPerMonth(file.path(), "D2", 4)) == "4:00:00");
    TEST_CHECK(toString(*getTotalActiveHoursPerMonth(file.path(), "D1", 5)) == "9:00:00");
    TEST_CHECK(toString(*getTotalActiveHoursPerMonth(file.path(), "D1", 6)) == "0:00:00");

    TempFile missing;
    TEST_CHECK(*getTotalActiveHoursPerMonth(missing.path(), "D1", 4) == Duration {});
}

TEST_CASE("monthly aggregates reject invalid months")
{
    TempFile file(shifts);
    const auto invalid = make_error_code(ShiftError::InvalidFormat);
    TEST_CHECK(countBonusPerMonth(file.path(), "D1", 0).error() == invalid);
    TEST_CHECK(getTotalActiveHoursPerMonth(file.path(), "D1", 13).error() == invalid);
}
