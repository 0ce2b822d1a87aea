#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace slog {
enum class Severity { Debug, Info, Warning, Error, Fatal };

void init(Severity severity = Severity::Info);
void setLogLevel(Severity severity);
Severity getLogLevel();

std::string_view toString(Severity severity);
std::optional<Severity> parseSeverity(std::string_view str);

namespace detail {
    // Reused per thread, so formatting a line does not allocate once the buffer has grown
    class StringStreamBuf : public std::streambuf {
    public:
        StringStreamBuf(size_t initialSize);

        std::streamsize xsputn(const char* s, std::streamsize n) override;
        int_type overflow(int_type ch) override;

        void clear();
        std::string& string();

    private:
        std::string str_;
    };

    Severity& getCurrentLogLevel();

    void replaceDateTime(char* buffer, size_t size, const char* format);

    void write(const std::string& str);

    template <typename... Args>
    void log(Severity severity, std::string_view severityStr, Args&&... args)
    {
        if (static_cast<int>(severity) < static_cast<int>(getCurrentLogLevel())) {
            return;
        }
        thread_local StringStreamBuf buf(1024);
        thread_local std::ostream os(&buf);
        buf.clear();
        static constexpr std::string_view dtDummy = "YYYY-mm-dd HH:MM:SS";
        (os << "[" << dtDummy << "] [" << severityStr << "] " << ... << args) << "\n";
        replaceDateTime(buf.string().data() + 1, dtDummy.size() + 1, "%F %T");
        // strftime writes a terminating null over the closing bracket
        buf.string().data()[1 + dtDummy.size()] = ']';
        write(buf.string());
    }
}

template <typename... Args>
void debug(Args&&... args)
{
    detail::log(Severity::Debug, "DEBUG", std::forward<Args>(args)...);
}

template <typename... Args>
void info(Args&&... args)
{
    detail::log(Severity::Info, "INFO", std::forward<Args>(args)...);
}

template <typename... Args>
void warning(Args&&... args)
{
    detail::log(Severity::Warning, "WARNING", std::forward<Args>(args)...);
}

template <typename... Args>
void error(Args&&... args)
{
    detail::log(Severity::Error, "ERROR", std::forward<Args>(args)...);
}

template <typename... Args>
void fatal(Args&&... args)
{
    detail::log(Severity::Fatal, "FATAL", std::forward<Args>(args)...);
}
}
