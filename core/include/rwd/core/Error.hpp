/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Defines the error codes raised by the prediction engine and a
 * lightweight Error value type carrying the code, a human-readable
 * message, and the source location where the error was raised.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_CORE_ERROR_HPP
    #define RWD_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace rwd::core {

/**
 * @brief Engine-wide error code enumeration.
 */
enum class ErrorCode : u16 {
    kOutOfMemory = 1,
    kInvalidArgument,
    kInvalidState,
    kNotFound,
    kAlreadyExists,
    kOutOfRange,

    kClockDesync,
};

/**
 * @brief Returns a stable, printable name for an error code.
 */
[[nodiscard]] std::string_view toString(ErrorCode code) noexcept;

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Intended to be stored inside Expected<T>.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode            code()     const { return _code; }
    [[nodiscard]] const std::string &  message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /** @brief "Code: message (file:line)", the form written to the log. */
    [[nodiscard]] std::string describe() const;

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace rwd::core

#endif // RWD_CORE_ERROR_HPP
