#pragma once

#include <system_error>

enum class ShiftError {
    InvalidFormat = 1,
    DriverNotFound,
};

const std::error_category& shiftErrorCategory();

std::error_code make_error_code(ShiftError e);

namespace std {
template <>
struct is_error_code_enum<ShiftError> : true_type { };
}
