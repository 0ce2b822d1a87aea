#include "string.hpp"

#include <array>
#include <cassert>

constexpr std::array<char, 256> getToLowerTable()
{
    std::array<char, 256> table = {};
    for (size_t i = 0; i < 256; ++i) {
        table[i] = static_cast<char>(static_cast<uint8_t>(i));
        if (i >= 'A' && i <= 'Z') {
            table[i] -= 'A' - 'a';
        }
    }
    return table;
}

char toLower(char c)
{
    static auto table = getToLowerTable();
    return table[static_cast<uint8_t>(c)];
}

std::string toLower(std::string_view str)
{
    std::string ret(str);
    for (auto& c : ret) {
        c = toLower(c);
    }
    return ret;
}

bool ciEqual(std::string_view a, std::string_view b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (toLower(a[i]) != toLower(b[i])) {
            return false;
        }
    }
    return true;
}

bool isWhitespace(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

std::vector<std::string_view> split(std::string_view str, char delim)
{
    std::vector<std::string_view> parts;
    size_t i = 0;
    while (i < str.size()) {
        const auto delimPos = str.find(delim, i);
        if (delimPos == std::string_view::npos) {
            break;
        }
        parts.push_back(str.substr(i, delimPos - i));
        i = delimPos + 1;
    }
    parts.push_back(str.substr(i));
    return parts;
}

std::vector<std::string_view> splitLines(std::string_view str)
{
    std::vector<std::string_view> lines;
    for (auto line : split(str, '\n')) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (!trim(line).empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

std::string_view trim(std::string_view str)
{
    if (str.empty()) {
        return str;
    }

    size_t start = 0;
    while (start < str.size() && isWhitespace(str[start])) {
        start++;
    }
    if (start == str.size()) {
        return str.substr(start, 0);
    }
    assert(start < str.size());

    auto end = str.size() - 1;
    while (end > start && isWhitespace(str[end])) {
        end--;
    }

    return str.substr(start, end + 1 - start);
}

bool startsWith(std::string_view str, std::string_view start)
{
    return str.substr(0, start.size()) == start;
}

std::string rjust(std::string_view str, size_t length, char ch)
{
    if (str.size() >= length) {
        return std::string(str);
    }
    return std::string(length - str.size(), ch) + std::string(str);
}
