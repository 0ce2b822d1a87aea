#include "config.hpp"

#include <cstdlib>

#include <joml.hpp>

#include "log.hpp"
#include "string.hpp"
#include "util.hpp"

namespace {
std::optional<std::string> substituteEnvVars(std::string_view source)
{
    std::string ret;
    size_t cursor = 0;
    while (cursor < source.size()) {
        const auto start = source.find("${", cursor);
        ret.append(source.substr(cursor, start - cursor));
        if (start == std::string_view::npos) {
            break;
        }

        const auto end = source.find("}", start);
        if (end == std::string_view::npos) {
            slog::error("Unmatched environment variable expansion");
            return std::nullopt;
        }

        const auto arg = source.substr(start + 2, end - start - 2);
        const auto colon = arg.find(':');
        const auto var = std::string(colon == std::string_view::npos ? arg : arg.substr(0, colon));
        const auto defaultValue = colon == std::string_view::npos
            ? std::optional<std::string_view> { std::nullopt }
            : std::optional<std::string_view> { arg.substr(colon + 1) };

        const auto envValue = ::getenv(var.c_str());
        if (envValue) {
            ret.append(envValue);
        } else if (defaultValue) {
            ret.append(*defaultValue);
        } else {
            slog::error("Environment variable '", var, "' is not defined.");
            return std::nullopt;
        }

        cursor = end + 1;
    }
    return ret;
}

template <typename T>
bool loadSingle(const joml::Node& value, std::string_view name, std::string_view typeName, T& dest)
{
    if (!value) {
        return true;
    }
    if (!value.is<T>()) {
        slog::error("'", name, "' must be a ", typeName);
        return false;
    }
    dest = value.as<T>();
    return true;
}

bool load(const joml::Node& value, std::string_view name, int64_t& dest)
{
    return loadSingle(value, name, "integer", dest);
}

bool load(const joml::Node& value, std::string_view name, std::string& dest)
{
    return loadSingle(value, name, "string", dest);
}

bool loadNonNegative(const joml::Node& value, std::string_view name, int64_t& dest)
{
    int64_t i = 0;
    if (!load(value, name, i)) {
        return false;
    }
    if (i < 0) {
        slog::error("'", name, "' must not be negative");
        return false;
    }
    dest = i;
    return true;
}

template <typename T>
bool loadParse(const joml::Node& value, std::string_view name, std::string_view typeName, T& dest)
{
    std::string str;
    if (!value) {
        return true;
    }
    if (!load(value, name, str)) {
        return false;
    }
    const auto parsed = T::parse(str);
    if (!parsed) {
        slog::error("'", name, "' must be a valid ", typeName);
        return false;
    }
    dest = *parsed;
    return true;
}

bool load(const joml::Node& value, std::string_view name, TimePoint& dest)
{
    return loadParse(value, name, "time of day (h:mm:ss [am|pm])", dest);
}

bool load(const joml::Node& value, std::string_view name, Duration& dest)
{
    return loadParse(value, name, "duration (h:mm:ss)", dest);
}

bool load(const joml::Node& value, std::string_view name, Date& dest)
{
    return loadParse(value, name, "date (yyyy-mm-dd)", dest);
}

#define CHECK_OR_FALSE(cond)                                                                       \
    if (!(cond)) {                                                                                 \
        return false;                                                                              \
    }

bool loadDeliveryWindow(const joml::Node& node, Config::DeliveryWindow& window)
{
    if (!node.isDictionary()) {
        slog::error("'delivery_window' must be a dictionary");
        return false;
    }
    for (const auto& [key, value] : node.asDictionary()) {
        if (key == "start") {
            CHECK_OR_FALSE(load(value, "delivery_window.start", window.start));
        } else if (key == "end") {
            CHECK_OR_FALSE(load(value, "delivery_window.end", window.end));
        } else {
            slog::error("Invalid key '", key, "' in 'delivery_window'");
            return false;
        }
    }
    if (!(window.start.toSeconds() < window.end.toSeconds())) {
        slog::error("'delivery_window.start' must be before 'delivery_window.end'");
        return false;
    }
    return true;
}

bool loadDailyMinimum(const joml::Node& node, Config::DailyMinimum& minimum)
{
    if (!node.isDictionary()) {
        slog::error("'daily_minimum' must be a dictionary");
        return false;
    }
    for (const auto& [key, value] : node.asDictionary()) {
        if (key == "ordinary") {
            CHECK_OR_FALSE(load(value, "daily_minimum.ordinary", minimum.ordinary));
        } else if (key == "holiday") {
            CHECK_OR_FALSE(load(value, "daily_minimum.holiday", minimum.holiday));
        } else {
            slog::error("Invalid key '", key, "' in 'daily_minimum'");
            return false;
        }
    }
    return true;
}

bool loadHoliday(const joml::Node& node, Config::Holiday& holiday)
{
    if (!node.isDictionary()) {
        slog::error("'holiday' must be a dictionary");
        return false;
    }
    for (const auto& [key, value] : node.asDictionary()) {
        if (key == "start") {
            CHECK_OR_FALSE(load(value, "holiday.start", holiday.start));
        } else if (key == "end") {
            CHECK_OR_FALSE(load(value, "holiday.end", holiday.end));
        } else {
            slog::error("Invalid key '", key, "' in 'holiday'");
            return false;
        }
    }
    if (holiday.end < holiday.start) {
        slog::error("'holiday.start' must not be after 'holiday.end'");
        return false;
    }
    return true;
}

bool loadTierAllowances(const joml::Node& node, std::array<int64_t, 4>& allowances)
{
    if (!node.isDictionary()) {
        slog::error("'tier_allowance_hours' must be a dictionary");
        return false;
    }
    for (const auto& [key, value] : node.asDictionary()) {
        // "tier1" to "tier4"
        const auto tier = startsWith(key, "tier")
            ? parseInt<size_t>(std::string_view(key).substr(4))
            : std::nullopt;
        if (!tier || *tier < 1 || *tier > allowances.size()) {
            slog::error("Invalid key '", key, "' in 'tier_allowance_hours'. Must be 'tier1' to 'tier",
                allowances.size(), "'");
            return false;
        }
        CHECK_OR_FALSE(loadNonNegative(
            value, "tier_allowance_hours." + std::string(key), allowances[*tier - 1]));
    }
    return true;
}
}

std::string_view toString(MissingHoursRounding rounding)
{
    switch (rounding) {
    case MissingHoursRounding::Floor:
        return "floor";
    case MissingHoursRounding::Ceil:
        return "ceil";
    case MissingHoursRounding::Exact:
        return "exact";
    default:
        return "INVALID";
    }
}

std::optional<MissingHoursRounding> parseMissingHoursRounding(std::string_view str)
{
    for (const auto rounding : { MissingHoursRounding::Floor, MissingHoursRounding::Ceil,
             MissingHoursRounding::Exact }) {
        if (ciEqual(str, toString(rounding))) {
            return rounding;
        }
    }
    return std::nullopt;
}

std::optional<int64_t> Config::getTierAllowanceHours(int64_t tier) const
{
    if (tier < 1 || tier > static_cast<int64_t>(tierAllowanceHours.size())) {
        return std::nullopt;
    }
    return tierAllowanceHours[static_cast<size_t>(tier - 1)];
}

bool Config::loadFromFile(const std::string& path)
{
    const auto source = readFile(path);
    if (!source) {
        slog::error("Could not read config file '", path, "': ", source.error().message());
        return false;
    }

    const auto substSource = substituteEnvVars(*source);
    if (!substSource) {
        return false;
    }

    const auto joml = joml::parse(*substSource);
    if (!joml) {
        const auto err = joml.error();
        slog::error("Could not parse JOML config: ", err.string(), "\n",
            joml::getContextString(*substSource, err.position));
        return false;
    }

    auto copy = *this;

    for (const auto& [key, value] : *joml) {
        if (key == "delivery_window") {
            CHECK_OR_FALSE(loadDeliveryWindow(value, copy.deliveryWindow));
        } else if (key == "daily_minimum") {
            CHECK_OR_FALSE(loadDailyMinimum(value, copy.dailyMinimum));
        } else if (key == "holiday") {
            CHECK_OR_FALSE(loadHoliday(value, copy.holiday));
        } else if (key == "bonus_credit") {
            CHECK_OR_FALSE(load(value, "bonus_credit", copy.bonusCredit));
        } else if (key == "tier_allowance_hours") {
            CHECK_OR_FALSE(loadTierAllowances(value, copy.tierAllowanceHours));
        } else if (key == "deduction_divisor") {
            int64_t divisor = 0;
            CHECK_OR_FALSE(load(value, "deduction_divisor", divisor));
            if (divisor < 1) {
                slog::error("'deduction_divisor' must be a positive integer");
                return false;
            }
            copy.deductionDivisor = divisor;
        } else if (key == "missing_hours_rounding") {
            std::string str;
            CHECK_OR_FALSE(load(value, "missing_hours_rounding", str));
            const auto rounding = parseMissingHoursRounding(str);
            if (!rounding) {
                slog::error("'missing_hours_rounding' must be one of 'floor', 'ceil' or 'exact'");
                return false;
            }
            copy.missingHoursRounding = *rounding;
        } else if (key == "log_level") {
            std::string str;
            CHECK_OR_FALSE(load(value, "log_level", str));
            const auto severity = slog::parseSeverity(str);
            if (!severity) {
                slog::error(
                    "'log_level' must be one of 'debug', 'info', 'warning', 'error' or 'fatal'");
                return false;
            }
            copy.logLevel = *severity;
        } else {
            slog::error("Invalid key '", key, "'");
            return false;
        }
    }

    *this = copy;

    return true;
}
