#include "test.hpp"

#include "ratetable.hpp"
#include "tempfile.hpp"

TEST_CASE("DriverRate::parse")
{
    const auto rate = DriverRate::parse("D1, sunday ,18500,2");
    TEST_REQUIRE(rate.has_value());
    TEST_CHECK(rate->driverId == "D1");
    TEST_CHECK(rate->dayOff == Weekday::Sunday);
    TEST_CHECK(rate->basePay == 18500);
    TEST_CHECK(rate->tier == 2);
}

TEST_CASE("DriverRate::parse accepts a decimal base pay")
{
    TEST_CHECK(DriverRate::parse("D1,Sunday,18500.00,2")->basePay == 18500);
    TEST_CHECK(DriverRate::parse("D1,Sunday,18500.75,2")->basePay == 18500);
    TEST_CHECK(DriverRate::parse("D1,Sunday,0.5,2")->basePay == 0);
}

TEST_CASE("DriverRate::parse rejects malformed lines")
{
    const char* invalid[] = {
        "D1,Sunday,18500",
        ",Sunday,18500,2",
        "D1,Sundays,18500,2",
        "D1,,18500,2",
        "D1,Sunday,abc,2",
        "D1,Sunday,-18500,2",
        "D1,Sunday,18500.,2",
        "D1,Sunday,.5,2",
        "D1,Sunday,18500.0.0,2",
        "D1,Sunday,1e4,2",
        "D1,Sunday,18500,0",
        "D1,Sunday,18500,5",
        "D1,Sunday,18500,two",
    };
    for (const auto line : invalid) {
        TEST_CHECK(!DriverRate::parse(line));
    }
}

TEST_CASE("readDriverRates skips malformed lines")
{
    TempFile file("D1,Sunday,18500\n"
                  "D2,Funday,20000,1\n"
                  "D3,Monday,lots,1\n"
                  "D4,Tuesday,20000,7\n"
                  "D5,Wednesday,21000.50,3\r\n"
                  "\n"
                  "D6,Friday,19000,4\n");
    const auto rates = readDriverRates(file.path());
    TEST_REQUIRE(rates.hasValue() && rates->size() == 2);
    TEST_CHECK((*rates)[0].driverId == "D5");
    TEST_CHECK((*rates)[0].dayOff == Weekday::Wednesday);
    TEST_CHECK((*rates)[0].basePay == 21000);
    TEST_CHECK((*rates)[0].tier == 3);
    TEST_CHECK((*rates)[1].driverId == "D6");

    TempFile missing;
    const auto none = readDriverRates(missing.path());
    TEST_CHECK(none.hasValue() && none->empty());
}

TEST_CASE("findDriverRate")
{
    TempFile file("D1,Sunday,18500\n"
                  "D1,Monday,19000,2\n"
                  "D2,Saturday,20000,1\n");
    const auto d1 = findDriverRate(file.path(), "D1");
    TEST_REQUIRE(d1.hasValue() && d1->has_value());
    TEST_CHECK((*d1)->dayOff == Weekday::Monday);
    TEST_CHECK((*d1)->basePay == 19000);

    const auto d3 = findDriverRate(file.path(), "D3");
    TEST_CHECK(d3.hasValue() && !d3->has_value());

    TempFile missing;
    const auto none = findDriverRate(missing.path(), "D1");
    TEST_CHECK(none.hasValue() && !none->has_value());
}
