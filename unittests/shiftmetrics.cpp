#include "test.hpp"

#include "error.hpp"
#include "shiftmetrics.hpp"

namespace {
const Config::DeliveryWindow window;

std::string idle(std::string_view start, std::string_view end)
{
    return toString(*getIdleTime(window, start, end));
}

std::string duration(std::string_view start, std::string_view end)
{
    return toString(*getShiftDuration(start, end));
}
}

TEST_CASE("shift inside the delivery window")
{
    TEST_CHECK(duration("8:00:00 am", "5:00:00 pm") == "9:00:00");
    TEST_CHECK(idle("8:00:00 am", "5:00:00 pm") == "0:00:00");
    TEST_CHECK(idle("8:00:00 am", "10:00:00 pm") == "0:00:00");
}

TEST_CASE("shift starting before the delivery window")
{
    TEST_CHECK(duration("7:30:00 am", "9:00:00 am") == "1:30:00");
    TEST_CHECK(idle("7:30:00 am", "9:00:00 am") == "0:30:00");
}

TEST_CASE("shift covering both tails of the delivery window")
{
    TEST_CHECK(duration("6:00:00 am", "11:00:00 pm") == "17:00:00");
    TEST_CHECK(idle("6:00:00 am", "11:00:00 pm") == "3:00:00");
}

TEST_CASE("shift crossing midnight")
{
    TEST_CHECK(duration("10:00:00 pm", "2:00:00 am") == "4:00:00");
    TEST_CHECK(idle("10:00:00 pm", "2:00:00 am") == "4:00:00");

    TEST_CHECK(duration("9:00:00 pm", "9:00:00 am") == "12:00:00");
    TEST_CHECK(idle("9:00:00 pm", "9:00:00 am") == "10:00:00");
}

TEST_CASE("zero length shift")
{
    TEST_CHECK(duration("8:00:00 am", "8:00:00 am") == "0:00:00");
    TEST_CHECK(idle("8:00:00 am", "8:00:00 am") == "0:00:00");
}

TEST_CASE("custom delivery window")
{
    const Config::DeliveryWindow narrow { TimePoint { 9, 0, 0 }, TimePoint { 17, 0, 0 } };
    const auto idleTime = getIdleTime(narrow, TimePoint { 8, 0, 0 }, TimePoint { 18, 30, 0 });
    TEST_CHECK(toString(idleTime) == "2:30:00");
}

TEST_CASE("no idle time for shifts inside the window")
{
    for (uint32_t start = 8; start < 22; ++start) {
        for (uint32_t end = start + 1; end <= 22; ++end) {
            const auto idleTime = getIdleTime(window, TimePoint { start, 0 }, TimePoint { end, 0 });
            TEST_CHECK(idleTime == Duration {});
        }
    }
}

TEST_CASE("everything is idle for shifts outside the window")
{
    for (uint32_t start = 22; start < 24; ++start) {
        for (uint32_t end = 0; end <= 8; ++end) {
            const auto s = TimePoint { start, 0 };
            const auto e = TimePoint { end, 0 };
            TEST_CHECK(getIdleTime(window, s, e) == getShiftDuration(s, e));
        }
    }
    TEST_CHECK(idle("1:00:00 am", "7:59:59 am") == duration("1:00:00 am", "7:59:59 am"));
}

TEST_CASE("getActiveTime")
{
    TEST_CHECK(toString(*getActiveTime("9:00:00", "0:30:00")) == "8:30:00");
    TEST_CHECK(toString(*getActiveTime("1:00:00", "2:00:00")) == "0:00:00");
    TEST_CHECK(getActiveTime(Duration::fromHours(12), Duration::fromHours(10))
        == Duration::fromHours(2));
}

TEST_CASE("malformed times are rejected")
{
    const auto invalid = make_error_code(ShiftError::InvalidFormat);
    TEST_CHECK(getIdleTime(window, "25:00:00", "8:00:00 am").error() == invalid);
    TEST_CHECK(getShiftDuration("8:00 am", "5:00:00 pm").error() == invalid);
    TEST_CHECK(getActiveTime("9:00:00", "half an hour").error() == invalid);
}
