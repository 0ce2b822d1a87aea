#include "test.hpp"

#include "date.hpp"

TEST_CASE("Date::parse")
{
    const auto d = Date::parse("2025-04-15");
    TEST_REQUIRE(d.hasValue());
    TEST_CHECK(d->year == 2025 && d->month == 4 && d->day == 15);
    TEST_CHECK(toString(*d) == "2025-04-15");
    TEST_CHECK(Date::parse("2024-02-29").hasValue());
}

TEST_CASE("Date::parse fails")
{
    TEST_CHECK(!Date::parse(""));
    TEST_CHECK(!Date::parse("2025-4-15"));
    TEST_CHECK(!Date::parse("2025-13-01"));
    TEST_CHECK(!Date::parse("2025-00-10"));
    TEST_CHECK(!Date::parse("2025-02-29"));
    TEST_CHECK(!Date::parse("2025-04-31"));
    TEST_CHECK(!Date::parse("2025/04/15"));
    TEST_CHECK(!Date::parse("2025-04-1a"));
}

TEST_CASE("Date weekday")
{
    TEST_CHECK((Date { 1970, 1, 1 }.weekday() == Weekday::Thursday));
    TEST_CHECK((Date { 2025, 4, 15 }.weekday() == Weekday::Tuesday));
    TEST_CHECK((Date { 2025, 4, 6 }.weekday() == Weekday::Sunday));
    TEST_CHECK((Date { 2024, 2, 29 }.weekday() == Weekday::Thursday));
    TEST_CHECK((Date { 1969, 12, 31 }.weekday() == Weekday::Wednesday));
}

TEST_CASE("Date ordering")
{
    TEST_CHECK((Date { 2025, 4, 9 } < Date { 2025, 4, 10 }));
    TEST_CHECK((Date { 2024, 12, 31 } < Date { 2025, 1, 1 }));
    TEST_CHECK((Date { 2025, 4, 10 } <= Date { 2025, 4, 10 }));
    TEST_CHECK((!(Date { 2025, 5, 1 } <= Date { 2025, 4, 30 })));
    TEST_CHECK((Date { 2025, 1, 2 }.toDays() - Date { 2025, 1, 1 }.toDays() == 1));
}

TEST_CASE("parseWeekday")
{
    TEST_CHECK(parseWeekday("monday") == Weekday::Monday);
    TEST_CHECK(parseWeekday("SUNDAY") == Weekday::Sunday);
    TEST_CHECK(parseWeekday(" Friday ") == Weekday::Friday);
    TEST_CHECK(!parseWeekday("Funday"));
    TEST_CHECK(!parseWeekday("mon"));
    TEST_CHECK(toString(Weekday::Wednesday) == "Wednesday");
}

TEST_CASE("parseMonth")
{
    TEST_CHECK(*parseMonth("4") == 4);
    TEST_CHECK(*parseMonth("04") == 4);
    TEST_CHECK(*parseMonth("12") == 12);
    TEST_CHECK(!parseMonth("0"));
    TEST_CHECK(!parseMonth("13"));
    TEST_CHECK(!parseMonth(""));
    TEST_CHECK(!parseMonth("004"));
}
