#include "log.hpp"

#include <array>
#include <cassert>
#include <ctime>
#include <mutex>

#include <unistd.h>

#include "string.hpp"

namespace slog {
namespace {
    std::mutex& writeMutex()
    {
        static std::mutex mutex;
        return mutex;
    }
}

std::string_view toString(Severity severity)
{
    static constexpr std::array strings { "DEBUG", "INFO", "WARNING", "ERROR", "FATAL" };
    const auto idx = static_cast<int>(severity);
    if (idx < 0 || static_cast<size_t>(idx) >= strings.size()) {
        return "INVALID";
    }
    return strings[idx];
}

std::optional<Severity> parseSeverity(std::string_view str)
{
    static constexpr std::array severities { Severity::Debug, Severity::Info, Severity::Warning,
        Severity::Error, Severity::Fatal };
    for (const auto severity : severities) {
        if (ciEqual(str, toString(severity))) {
            return severity;
        }
    }
    return std::nullopt;
}

void setLogLevel(Severity severity)
{
    detail::getCurrentLogLevel() = severity;
}

Severity getLogLevel()
{
    return detail::getCurrentLogLevel();
}

void init(Severity severity)
{
    setLogLevel(severity);
}

namespace detail {
    StringStreamBuf::StringStreamBuf(size_t initialSize)
        : str_(initialSize, 0)
    {
        str_.resize(0);
    }

    std::streamsize StringStreamBuf::xsputn(const char* s, std::streamsize n)
    {
        str_.append(s, n);
        return n;
    }

    StringStreamBuf::int_type StringStreamBuf::overflow(int_type ch)
    {
        if (!traits_type::eq_int_type(ch, traits_type::eof())) {
            str_.push_back(traits_type::to_char_type(ch));
        }
        return traits_type::not_eof(ch);
    }

    void StringStreamBuf::clear()
    {
        str_.clear();
    }

    std::string& StringStreamBuf::string()
    {
        return str_;
    }

    Severity& getCurrentLogLevel()
    {
        static Severity severity = Severity::Info;
        return severity;
    }

    void replaceDateTime(char* buffer, size_t size, const char* format)
    {
        const auto t = std::time(nullptr);
        std::tm tm {};
        ::localtime_r(&t, &tm);
        [[maybe_unused]] const auto n = std::strftime(buffer, size, format, &tm);
        assert(n > 0);
    }

    void write(const std::string& str)
    {
        std::lock_guard<std::mutex> lock(writeMutex());
        [[maybe_unused]] auto ignore = ::write(STDERR_FILENO, str.data(), str.size());
    }
}
}
