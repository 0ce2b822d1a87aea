#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// NO. LOCALES.
char toLower(char c);
std::string toLower(std::string_view str);

bool ciEqual(std::string_view a, std::string_view b);

bool isWhitespace(char c);
bool isDigit(char c);

std::vector<std::string_view> split(std::string_view str, char delim);

// Splits the file contents into lines, dropping a trailing '\r' per line and all empty lines
std::vector<std::string_view> splitLines(std::string_view str);

std::string_view trim(std::string_view str);

bool startsWith(std::string_view str, std::string_view start);

template <typename T = uint64_t>
std::optional<T> parseInt(std::string_view str, int base = 10)
{
    const auto first = str.data();
    const auto last = first + str.size();
    T value;
    const auto res = std::from_chars(first, last, value, base);
    if (res.ec == std::errc() && res.ptr == last) {
        return value;
    } else {
        return std::nullopt;
    }
}

template <typename Container>
std::string join(const Container& container, std::string_view delim = ", ")
{
    std::string ret;
    bool first = true;
    for (const auto& elem : container) {
        if (!first) {
            ret.append(delim);
        }
        first = false;
        ret.append(elem);
    }
    return ret;
}

std::string rjust(std::string_view str, size_t length, char ch);
