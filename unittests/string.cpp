#include "test.hpp"

#include "string.hpp"

TEST_CASE("splitLines")
{
    const auto lines = splitLines("a,b\r\n\nc\n\r\nd");
    TEST_REQUIRE(lines.size() == 3);
    TEST_CHECK(lines[0] == "a,b");
    TEST_CHECK(lines[1] == "c");
    TEST_CHECK(lines[2] == "d");
    TEST_CHECK(splitLines("").empty());
}

TEST_CASE("split")
{
    const auto fields = split("D1,,Name", ',');
    TEST_REQUIRE(fields.size() == 3);
    TEST_CHECK(fields[1].empty());
    TEST_CHECK(split("", ',').size() == 1);
}

TEST_CASE("trim and case")
{
    TEST_CHECK(trim("  8:00:00 am\t") == "8:00:00 am");
    TEST_CHECK(trim("   ").empty());
    TEST_CHECK(toLower("SunDay") == "sunday");
    TEST_CHECK(ciEqual("Floor", "FLOOR"));
    TEST_CHECK(!ciEqual("floor", "floors"));
    TEST_CHECK(startsWith("tier2", "tier"));
    TEST_CHECK(!startsWith("tie", "tier"));
}

TEST_CASE("parseInt")
{
    TEST_CHECK(parseInt<int64_t>("18500") == 18500);
    TEST_CHECK(parseInt<int64_t>("-3") == -3);
    TEST_CHECK(!parseInt<int64_t>("185.5"));
    TEST_CHECK(!parseInt<int64_t>(" 12"));
    TEST_CHECK(!parseInt<int64_t>(""));
}

TEST_CASE("join and rjust")
{
    const std::vector<std::string> parts { "a", "b", "c" };
    TEST_CHECK(join(parts, ",") == "a,b,c");
    TEST_CHECK(rjust("5", 2, '0') == "05");
    TEST_CHECK(rjust("123", 2, '0') == "123");
}
