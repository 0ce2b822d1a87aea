#include "error.hpp"

#include <string>

namespace {
class ShiftErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "shiftpay"; }

    std::string message(int ev) const override
    {
        switch (static_cast<ShiftError>(ev)) {
        case ShiftError::InvalidFormat:
            return "Invalid format";
        case ShiftError::DriverNotFound:
            return "Driver not found in rate table";
        default:
            return "Unknown error";
        }
    }
};
}

const std::error_category& shiftErrorCategory()
{
    static ShiftErrorCategory category;
    return category;
}

std::error_code make_error_code(ShiftError e)
{
    return std::error_code(static_cast<int>(e), shiftErrorCategory());
}
