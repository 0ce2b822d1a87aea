#include "test.hpp"

#include "log.hpp"

TEST_CASE("slog::parseSeverity")
{
    TEST_CHECK(slog::parseSeverity("debug") == slog::Severity::Debug);
    TEST_CHECK(slog::parseSeverity("WARNING") == slog::Severity::Warning);
    TEST_CHECK(slog::parseSeverity("Fatal") == slog::Severity::Fatal);
    TEST_CHECK(!slog::parseSeverity("verbose"));
    TEST_CHECK(!slog::parseSeverity(""));
    TEST_CHECK(slog::toString(slog::Severity::Error) == "ERROR");
}

TEST_CASE("slog log level")
{
    const auto previous = slog::getLogLevel();
    slog::init(slog::Severity::Fatal);
    TEST_CHECK(slog::getLogLevel() == slog::Severity::Fatal);
    // Filtered out
    slog::error("This should not be printed");
    slog::setLogLevel(slog::Severity::Debug);
    TEST_CHECK(slog::getLogLevel() == slog::Severity::Debug);
    slog::setLogLevel(previous);
}
