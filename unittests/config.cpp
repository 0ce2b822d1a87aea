#include "test.hpp"

#include <cstdlib>

#include "config.hpp"
#include "tempfile.hpp"

TEST_CASE("Config defaults")
{
    const Config config;
    TEST_CHECK(toString(config.deliveryWindow.start) == "8:00:00 am");
    TEST_CHECK(toString(config.deliveryWindow.end) == "10:00:00 pm");
    TEST_CHECK(toString(config.dailyMinimum.ordinary) == "8:24:00");
    TEST_CHECK(toString(config.dailyMinimum.holiday) == "6:00:00");
    TEST_CHECK(toString(config.holiday.start) == "2025-04-10");
    TEST_CHECK(toString(config.holiday.end) == "2025-04-30");
    TEST_CHECK(toString(config.bonusCredit) == "2:00:00");
    TEST_CHECK(config.getTierAllowanceHours(1) == 50);
    TEST_CHECK(config.getTierAllowanceHours(4) == 3);
    TEST_CHECK(!config.getTierAllowanceHours(0));
    TEST_CHECK(!config.getTierAllowanceHours(5));
    TEST_CHECK(config.deductionDivisor == 185);
    TEST_CHECK(config.missingHoursRounding == MissingHoursRounding::Floor);
}

TEST_CASE("Config loadFromFile overrides given keys")
{
    TempFile file("# Next year's holiday\n"
                  "holiday: {\n"
                  "  start: \"2026-03-20\"\n"
                  "  end: \"2026-04-19\"\n"
                  "}\n"
                  "daily_minimum: {\n"
                  "  ordinary: \"8:00:00\"\n"
                  "}\n"
                  "tier_allowance_hours: {\n"
                  "  tier4: 5\n"
                  "}\n"
                  "deduction_divisor: 200\n"
                  "missing_hours_rounding: \"ceil\"\n"
                  "log_level: \"debug\"\n");
    Config config;
    TEST_REQUIRE(config.loadFromFile(file.path()));
    TEST_CHECK(toString(config.holiday.start) == "2026-03-20");
    TEST_CHECK(toString(config.holiday.end) == "2026-04-19");
    TEST_CHECK(toString(config.dailyMinimum.ordinary) == "8:00:00");
    TEST_CHECK(toString(config.dailyMinimum.holiday) == "6:00:00");
    TEST_CHECK(config.getTierAllowanceHours(4) == 5);
    TEST_CHECK(config.getTierAllowanceHours(3) == 10);
    TEST_CHECK(config.deductionDivisor == 200);
    TEST_CHECK(config.missingHoursRounding == MissingHoursRounding::Ceil);
    TEST_CHECK(config.logLevel == slog::Severity::Debug);
}

TEST_CASE("Config loadFromFile rejects invalid files")
{
    const char* invalid[] = {
        "unknown_key: 1\n",
        "deduction_divisor: 0\n",
        "deduction_divisor: \"185\"\n",
        "holiday: {\n  start: \"2025-02-30\"\n}\n",
        "holiday: {\n  start: \"2025-05-01\"\n  end: \"2025-04-01\"\n}\n",
        "delivery_window: {\n  start: \"11:00:00 pm\"\n  end: \"8:00:00 am\"\n}\n",
        "tier_allowance_hours: {\n  tier5: 1\n}\n",
        "tier_allowance_hours: {\n  tier1: -1\n}\n",
        "missing_hours_rounding: \"round\"\n",
        "bonus_credit: \"2 hours\"\n",
    };
    for (const auto source : invalid) {
        TempFile file(source);
        Config config;
        TEST_CHECK(!config.loadFromFile(file.path()));
        TEST_CHECK(config.deductionDivisor == 185);
        TEST_CHECK(toString(config.holiday.start) == "2025-04-10");
    }

    TempFile missing;
    Config config;
    TEST_CHECK(!config.loadFromFile(missing.path()));
}

TEST_CASE("Config loadFromFile keeps the config on partial failure")
{
    TempFile file("deduction_divisor: 150\n"
                  "missing_hours_rounding: \"nearest\"\n");
    Config config;
    TEST_CHECK(!config.loadFromFile(file.path()));
    TEST_CHECK(config.deductionDivisor == 185);
}

TEST_CASE("Config loadFromFile substitutes environment variables")
{
    ::unsetenv("SHIFTPAY_TEST_BONUS");
    ::setenv("SHIFTPAY_TEST_DIVISOR", "150", 1);
    TempFile file("bonus_credit: \"${SHIFTPAY_TEST_BONUS:3:00:00}\"\n"
                  "deduction_divisor: ${SHIFTPAY_TEST_DIVISOR}\n");
    Config config;
    TEST_REQUIRE(config.loadFromFile(file.path()));
    TEST_CHECK(toString(config.bonusCredit) == "3:00:00");
    TEST_CHECK(config.deductionDivisor == 150);

    TempFile undefined("deduction_divisor: ${SHIFTPAY_TEST_UNDEFINED}\n");
    TEST_CHECK(!config.loadFromFile(undefined.path()));
    ::unsetenv("SHIFTPAY_TEST_DIVISOR");
}
