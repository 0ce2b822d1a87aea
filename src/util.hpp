#pragma once

#include <string>
#include <string_view>
#include <system_error>

#include "result.hpp"

bool fileExists(const std::string& path);

Result<std::string> readFile(const std::string& path);
// Replaces the whole file. Returns an empty error code on success.
std::error_code writeFile(const std::string& path, std::string_view contents);
