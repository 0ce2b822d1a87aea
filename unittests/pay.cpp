#include "test.hpp"

#include "error.hpp"
#include "pay.hpp"
#include "tempfile.hpp"

namespace {
const std::string rates = "D1,Sunday,18500,2\n"
                          "D4,Monday,18500,4\n"
                          "D5,Friday,1000,4\n";

Duration hours(int64_t h)
{
    return Duration::fromHours(h);
}
}

TEST_CASE("getNetPay deducts missing hours beyond the tier allowance")
{
    TempFile rateFile(rates);
    const Config config;
    // 25 missing, 20 allowed, 100 per hour
    TEST_CHECK(*getNetPay(config, "D1", hours(75), hours(100), rateFile.path()) == 18000);
    TEST_CHECK(*getNetPay(config, "D1", hours(80), hours(100), rateFile.path()) == 18500);
    TEST_CHECK(*getNetPay(config, "D1", hours(120), hours(100), rateFile.path()) == 18500);
    TEST_CHECK(*getNetPay(config, "D4", hours(75), hours(100), rateFile.path()) == 16300);
}

TEST_CASE("getNetPay is never negative")
{
    TempFile rateFile(rates);
    const Config config;
    TEST_CHECK(*getNetPay(config, "D5", hours(0), hours(500), rateFile.path()) == 0);
}

TEST_CASE("getNetPay for unknown drivers")
{
    TempFile rateFile(rates);
    TempFile missing;
    const Config config;
    const auto notFound = make_error_code(ShiftError::DriverNotFound);
    TEST_CHECK(getNetPay(config, "D9", hours(0), hours(0), rateFile.path()).error() == notFound);
    TEST_CHECK(getNetPay(config, "D1", hours(0), hours(0), missing.path()).error() == notFound);
}

TEST_CASE("missing hours rounding")
{
    TempFile rateFile(rates);
    const auto actual = Duration::fromMinutes(79 * 60 + 30);
    const auto required = hours(100);

    Config config;
    TEST_CHECK(getMissingHours(config, actual, required) == 20);
    TEST_CHECK(*getNetPay(config, "D1", actual, required, rateFile.path()) == 18500);

    config.missingHoursRounding = MissingHoursRounding::Ceil;
    TEST_CHECK(getMissingHours(config, actual, required) == 21);
    TEST_CHECK(*getNetPay(config, "D1", actual, required, rateFile.path()) == 18400);

    config.missingHoursRounding = MissingHoursRounding::Exact;
    TEST_CHECK(*getNetPay(config, "D1", actual, required, rateFile.path()) == 18450);
}

TEST_CASE("calculateNetPay uses the configured allowances")
{
    Config config;
    config.tierAllowanceHours = { 50, 20, 10, 0 };
    config.deductionDivisor = 100;
    const DriverRate rate { "D1", Weekday::Sunday, 10000, 4 };
    TEST_CHECK(calculateNetPay(config, rate, hours(98), hours(100)) == 9800);
    TEST_CHECK(getMissingHours(config, hours(100), hours(98)) == 0);
}

TEST_CASE("getNetPay from strings")
{
    TempFile rateFile(rates);
    const Config config;
    TEST_CHECK(*getNetPay(config, "D1", "75:00:00", "100:00:00", rateFile.path()) == 18000);
    TEST_CHECK(getNetPay(config, "D1", "75 hours", "100:00:00", rateFile.path()).error()
        == make_error_code(ShiftError::InvalidFormat));
    TEST_CHECK(getNetPay(config, "D1", "75:00:00", "5:00:00 pm", rateFile.path()).error()
        == make_error_code(ShiftError::InvalidFormat));
}

TEST_CASE("getNetPay with a decimal base pay")
{
    TempFile rateFile("D1,Sunday,18500.00,2\n"
                      "D2,Sunday,18500.90,2\n");
    const Config config;
    TEST_CHECK(*getNetPay(config, "D1", hours(75), hours(100), rateFile.path()) == 18000);
    TEST_CHECK(*getNetPay(config, "D2", hours(75), hours(100), rateFile.path()) == 18000);
    TEST_CHECK(*getNetPay(config, "D2", hours(100), hours(100), rateFile.path()) == 18500);
}
