#include "ratetable.hpp"

#include "log.hpp"
#include "metrics.hpp"
#include "string.hpp"
#include "util.hpp"

namespace {
// "18500" or "18500.00". The fraction is dropped, since pay is computed in whole units and
// floor(x / d) == floor(floor(x) / d) for a positive integer d.
std::optional<int64_t> parseWholeUnits(std::string_view str)
{
    const auto dot = str.find('.');
    const auto whole = str.substr(0, dot);
    if (whole.empty() || !isDigit(whole[0])) {
        return std::nullopt;
    }
    if (dot != std::string_view::npos) {
        const auto fraction = str.substr(dot + 1);
        if (fraction.empty()) {
            return std::nullopt;
        }
        for (const auto c : fraction) {
            if (!isDigit(c)) {
                return std::nullopt;
            }
        }
    }
    return parseInt<int64_t>(whole);
}
}

std::optional<DriverRate> DriverRate::parse(std::string_view line)
{
    const auto fields = split(line, ',');
    if (fields.size() < NumFields) {
        return std::nullopt;
    }

    const auto driverId = trim(fields[0]);
    const auto dayOff = parseWeekday(fields[1]);
    const auto basePay = parseWholeUnits(trim(fields[2]));
    const auto tier = parseInt<int64_t>(trim(fields[3]));
    if (driverId.empty() || !dayOff || !basePay || !tier || *tier < 1 || *tier > 4) {
        return std::nullopt;
    }
    return DriverRate { std::string(driverId), *dayOff, *basePay, *tier };
}

Result<std::vector<DriverRate>> readDriverRates(const std::string& path)
{
    std::vector<DriverRate> rates;
    if (!fileExists(path)) {
        return rates;
    }

    const auto contents = readFile(path);
    if (!contents) {
        return error(contents.error());
    }

    for (const auto line : splitLines(*contents)) {
        auto rate = DriverRate::parse(line);
        if (!rate) {
            slog::warning("Skipping malformed line in rate file '", path, "': ", line);
            Metrics::get().malformedLines.labels(path).inc();
            continue;
        }
        rates.push_back(std::move(*rate));
    }
    return rates;
}

Result<std::optional<DriverRate>> findDriverRate(const std::string& path, std::string_view driverId)
{
    const auto rates = readDriverRates(path);
    if (!rates) {
        return error(rates.error());
    }
    for (const auto& rate : *rates) {
        if (rate.driverId == driverId) {
            return std::optional<DriverRate>(rate);
        }
    }
    return std::optional<DriverRate>();
}
