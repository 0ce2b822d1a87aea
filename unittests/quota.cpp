#include "test.hpp"

#include "error.hpp"
#include "quota.hpp"

TEST_CASE("metQuota holiday and ordinary thresholds")
{
    const Config config;
    TEST_CHECK(*metQuota(config, "2025-04-15", "6:30:00"));
    TEST_CHECK(!*metQuota(config, "2025-05-15", "6:30:00"));
}

TEST_CASE("metQuota holiday window is inclusive")
{
    const Config config;
    TEST_CHECK(*metQuota(config, "2025-04-10", "6:00:00"));
    TEST_CHECK(*metQuota(config, "2025-04-30", "6:00:00"));
    TEST_CHECK(!*metQuota(config, "2025-04-09", "6:00:00"));
    TEST_CHECK(!*metQuota(config, "2025-05-01", "6:00:00"));
    TEST_CHECK(!*metQuota(config, "2024-04-15", "6:00:00"));
}

TEST_CASE("metQuota meeting the minimum exactly is enough")
{
    const Config config;
    TEST_CHECK(*metQuota(config, "2025-05-01", "8:24:00"));
    TEST_CHECK(!*metQuota(config, "2025-05-01", "8:23:59"));
    TEST_CHECK(*metQuota(config, "2025-04-20", "5:59:59") == false);
}

TEST_CASE("metQuota with a different holiday")
{
    Config config;
    config.holiday = { Date { 2026, 3, 20 }, Date { 2026, 3, 22 } };
    TEST_CHECK(*metQuota(config, "2026-03-21", "6:00:00"));
    TEST_CHECK(!*metQuota(config, "2025-04-15", "6:30:00"));
    TEST_CHECK(isHolidayDate(config, Date { 2026, 3, 22 }));
    TEST_CHECK(getDailyMinimum(config, Date { 2026, 3, 23 }) == Duration::fromMinutes(504));
}

TEST_CASE("metQuota rejects malformed input")
{
    const Config config;
    const auto invalid = make_error_code(ShiftError::InvalidFormat);
    TEST_CHECK(metQuota(config, "15/04/2025", "6:30:00").error() == invalid);
    TEST_CHECK(metQuota(config, "2025-04-15", "6:30").error() == invalid);
}
