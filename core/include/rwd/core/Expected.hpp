/**
 * @file Expected.hpp
 * @brief Expected<T> and the helpers used to propagate or report it.
 *
 * Fallible engine calls return Expected. Call sites that can recover
 * forward the error with RWD_TRY / RWD_TRY_VOID; frame hooks, which have
 * no caller to hand it to, log it with reportFailure() and carry on.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_CORE_EXPECTED_HPP
    #define RWD_CORE_EXPECTED_HPP

    #include "Error.hpp"
    #include "Log.hpp"

    #include <expected>
    #include <string_view>

namespace rwd::core {

template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Logs the error held by @p result, if any.
 * @return @c true when @p result holds a value.
 */
template <typename T>
bool reportFailure(const Expected<T> &result, std::string_view tag, LogLevel level = LogLevel::kError)
{
    if (result.has_value())
        return true;

    const std::string line = result.error().describe();
    switch (level)
    {
    case LogLevel::kDebug: Log::debug(tag, line); break;
    case LogLevel::kInfo:  Log::info(tag, line);  break;
    case LogLevel::kWarn:  Log::warn(tag, line);  break;
    case LogLevel::kError: Log::error(tag, line); break;
    }
    return false;
}

} // namespace rwd::core

/**
 * @brief Yields the value of an Expected expression, or returns its
 *        error from the enclosing function.
 */
#define RWD_TRY(expr)                                                  \
    ({                                                                 \
        auto &&_rwd_try = (expr);                                      \
        if (!_rwd_try) [[unlikely]]                                    \
            return ::rwd::core::Unexpected{std::move(_rwd_try).error()}; \
        std::move(_rwd_try).value();                                   \
    })

/** @brief RWD_TRY for results whose value is discarded. */
#define RWD_TRY_VOID(expr)                                             \
    do {                                                               \
        if (auto &&_rwd_try = (expr); !_rwd_try) [[unlikely]]          \
            return ::rwd::core::Unexpected{std::move(_rwd_try).error()}; \
    } while (false)

#endif // RWD_CORE_EXPECTED_HPP
