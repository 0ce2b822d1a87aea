#include "util.hpp"

#include <cerrno>
#include <cstdio>
#include <memory>

#include <sys/stat.h>

#include "log.hpp"
#include "metrics.hpp"

namespace {
template <typename T, typename Deleter>
std::unique_ptr<T, Deleter> makeUnique(T* ptr, Deleter deleter)
{
    return std::unique_ptr<T, Deleter>(ptr, deleter);
}

std::error_code lastError()
{
    return std::make_error_code(static_cast<std::errc>(errno));
}
}

bool fileExists(const std::string& path)
{
    struct ::stat st;
    return ::stat(path.c_str(), &st) == 0;
}

Result<std::string> readFile(const std::string& path)
{
    const auto timeHandle = Metrics::get().fileReadDuration.labels(path).time();
    auto f = makeUnique(std::fopen(path.c_str(), "rb"), &std::fclose);
    if (!f) {
        const auto ec = lastError();
        slog::error("Could not open file: '", path, "': ", ec.message());
        return error(ec);
    }

    const auto fd = ::fileno(f.get());
    if (fd == -1) {
        const auto ec = lastError();
        slog::error("Could not retrieve file descriptor for file: '", path, "'");
        return error(ec);
    }

    struct ::stat st;
    if (::fstat(fd, &st)) {
        const auto ec = lastError();
        slog::error("Could not stat file: '", path, "'");
        return error(ec);
    }

    // fopen-ing a directory in read-only mode will actually not fail!
    if (!S_ISREG(st.st_mode)) {
        slog::error("'", path, "' is not a regular file");
        return error(std::make_error_code(std::errc::is_a_directory));
    }

    if (std::fseek(f.get(), 0, SEEK_END) != 0) {
        const auto ec = lastError();
        slog::error("Error seeking to end of file: '", path, "'");
        return error(ec);
    }
    const auto size = std::ftell(f.get());
    if (size < 0) {
        const auto ec = lastError();
        slog::error("Error getting size of file: '", path, "'");
        return error(ec);
    }
    if (std::fseek(f.get(), 0, SEEK_SET) != 0) {
        const auto ec = lastError();
        slog::error("Error seeking to start of file: '", path, "'");
        return error(ec);
    }
    std::string buf(size, '\0');
    if (std::fread(buf.data(), 1, size, f.get()) != static_cast<size_t>(size)) {
        const auto ec = lastError();
        slog::error("Error reading file: '", path, "'");
        return error(ec);
    }
    return buf;
}

std::error_code writeFile(const std::string& path, std::string_view contents)
{
    auto f = makeUnique(std::fopen(path.c_str(), "wb"), &std::fclose);
    if (!f) {
        const auto ec = lastError();
        slog::error("Could not open file for writing: '", path, "': ", ec.message());
        return ec;
    }
    if (std::fwrite(contents.data(), 1, contents.size(), f.get()) != contents.size()) {
        const auto ec = lastError();
        slog::error("Could not write file: '", path, "': ", ec.message());
        return ec;
    }
    if (std::fclose(f.release()) != 0) {
        const auto ec = lastError();
        slog::error("Could not close file: '", path, "': ", ec.message());
        return ec;
    }
    return {};
}
