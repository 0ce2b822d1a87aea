#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

// A path in the temp directory that is removed again when this goes out of scope.
// The file itself is only created if contents are given.
class TempFile {
public:
    TempFile()
        : path_(makePath())
    {
    }

    explicit TempFile(const std::string& contents)
        : TempFile()
    {
        write(contents);
    }

    ~TempFile()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

    bool exists() const { return std::filesystem::exists(path_); }

    void write(const std::string& contents) const
    {
        std::ofstream f(path_, std::ios::binary | std::ios::trunc);
        f << contents;
    }

    std::string read() const
    {
        std::ifstream f(path_, std::ios::binary);
        std::stringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

private:
    static std::string makePath()
    {
        static std::atomic<int> counter { 0 };
        const auto name = "shiftpay-test-" + std::to_string(::getpid()) + "-"
            + std::to_string(counter++) + ".txt";
        return (std::filesystem::temp_directory_path() / name).string();
    }

    std::string path_;
};
