/**
 * @file Error.cpp
 * @brief Printable names for error codes and errors.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#include "rwd/core/Error.hpp"

namespace rwd::core {

std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::kOutOfMemory:     return "OutOfMemory";
    case ErrorCode::kInvalidArgument: return "InvalidArgument";
    case ErrorCode::kInvalidState:    return "InvalidState";
    case ErrorCode::kNotFound:        return "NotFound";
    case ErrorCode::kAlreadyExists:   return "AlreadyExists";
    case ErrorCode::kOutOfRange:      return "OutOfRange";
    case ErrorCode::kClockDesync:     return "ClockDesync";
    }
    return "Unknown";
}

std::string Error::describe() const
{
    std::string_view file{_location.file_name()};
    if (const auto slash = file.find_last_of('/'); slash != std::string_view::npos)
        file.remove_prefix(slash + 1);

    std::string out{toString(_code)};
    out += ": ";
    out += _message;
    out += " (";
    out += file;
    out += ':';
    out += std::to_string(_location.line());
    out += ')';
    return out;
}

} // namespace rwd::core
