#include "test.hpp"

#include "error.hpp"
#include "time.hpp"

TEST_CASE("parseClockOrDuration 12-hour clock")
{
    TEST_CHECK(*parseClockOrDuration("8:00:00 am") == 8 * 3600);
    TEST_CHECK(*parseClockOrDuration("5:00:00 pm") == 17 * 3600);
    TEST_CHECK(*parseClockOrDuration("12:00:00 am") == 0);
    TEST_CHECK(*parseClockOrDuration("12:30:00 pm") == 12 * 3600 + 30 * 60);
    TEST_CHECK(*parseClockOrDuration("  6:01:02 PM ") == 18 * 3600 + 62);
}

TEST_CASE("parseClockOrDuration without modifier")
{
    TEST_CHECK(*parseClockOrDuration("0:00:00") == 0);
    TEST_CHECK(*parseClockOrDuration("23:59:59") == 86399);
    TEST_CHECK(*parseClockOrDuration("168:00:00") == 168 * 3600);
    TEST_CHECK(*parseClockOrDuration("8:05:09") == 8 * 3600 + 5 * 60 + 9);
}

TEST_CASE("parseClockOrDuration fails")
{
    const auto invalid = make_error_code(ShiftError::InvalidFormat);
    TEST_CHECK(parseClockOrDuration("").error() == invalid);
    TEST_CHECK(parseClockOrDuration("8:00").error() == invalid);
    TEST_CHECK(parseClockOrDuration("8:00:00:00").error() == invalid);
    TEST_CHECK(parseClockOrDuration("a:00:00").error() == invalid);
    TEST_CHECK(parseClockOrDuration("8:60:00").error() == invalid);
    TEST_CHECK(parseClockOrDuration("8:00:60").error() == invalid);
    TEST_CHECK(parseClockOrDuration("8:00:00 xm").error() == invalid);
    TEST_CHECK(parseClockOrDuration("8:00:00 am pm").error() == invalid);
    TEST_CHECK(parseClockOrDuration("8:00:00  am").error() == invalid);
    TEST_CHECK(parseClockOrDuration("13:00:00 pm").error() == invalid);
    TEST_CHECK(parseClockOrDuration("0:30:00 am").error() == invalid);
    TEST_CHECK(parseClockOrDuration("-1:00:00").error() == invalid);
}

TEST_CASE("formatSeconds")
{
    TEST_CHECK(formatSeconds(0) == "0:00:00");
    TEST_CHECK(formatSeconds(-5) == "0:00:00");
    TEST_CHECK(formatSeconds(9 * 3600) == "9:00:00");
    TEST_CHECK(formatSeconds(8 * 3600 + 24 * 60) == "8:24:00");
    TEST_CHECK(formatSeconds(25 * 3600 + 61) == "25:01:01");
    TEST_CHECK(formatSeconds(152 * 3600 + 5) == "152:00:05");
}

TEST_CASE("format after parse is idempotent")
{
    for (const auto str : { "8:00:00 am", "12:00:00 am", "11:59:59 pm", "07:05:00", "0:00:01",
             "100:10:10", " 3:04:05 PM" }) {
        const auto once = formatSeconds(*parseClockOrDuration(str));
        const auto twice = formatSeconds(*parseClockOrDuration(once));
        TEST_CHECK(once == twice);
    }
}

TEST_CASE("TimePoint::parse")
{
    const auto tp = TimePoint::parse("5:06:07 pm");
    TEST_REQUIRE(tp.hasValue());
    TEST_CHECK(tp->hours == 17 && tp->minutes == 6 && tp->seconds == 7);
    TEST_CHECK(TimePoint::parse("23:59:59").hasValue());
    TEST_CHECK(!TimePoint::parse("24:00:00"));
    TEST_CHECK(!TimePoint::parse("1:00"));
}

TEST_CASE("TimePoint toString")
{
    TEST_CHECK(toString(TimePoint { 17, 0, 0 }) == "5:00:00 pm");
    TEST_CHECK(toString(TimePoint { 0, 5, 0 }) == "12:05:00 am");
    TEST_CHECK(toString(TimePoint { 12, 0, 9 }) == "12:00:09 pm");
    TEST_CHECK(toString(TimePoint { 8, 30 }) == "8:30:00 am");
}

TEST_CASE("Duration")
{
    TEST_CHECK(Duration::parse("8:24:00")->toSeconds() == 8 * 3600 + 24 * 60);
    TEST_CHECK(!Duration::parse("8:00:00 am"));
    TEST_CHECK(toString(Duration::fromHours(2) - Duration::fromHours(3)) == "0:00:00");
    TEST_CHECK((Duration::fromHours(2) - Duration::fromHours(3)).clamped() == Duration {});
    TEST_CHECK(Duration::fromHours(2) * 3 == Duration::fromHours(6));
    TEST_CHECK(Duration::fromMinutes(90).toHours() == 1);
    TEST_CHECK(Duration::fromHours(2).toMinutes() == 120);
    TEST_CHECK(Duration::fromSeconds(59) < Duration::fromMinutes(1));
}
