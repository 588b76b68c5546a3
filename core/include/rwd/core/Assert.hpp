/**
 * @file Assert.hpp
 * @brief Debug-only invariant checks.
 *
 * RWD_ASSERT guards internal invariants such as the tick ordering of a
 * history buffer. It is compiled in when RWD_DEBUG is defined (Debug
 * builds) and reports through core::Log, so the failing tick is part of
 * the message. Recoverable conditions go through core::Expected.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_CORE_ASSERT_HPP
    #define RWD_CORE_ASSERT_HPP

    #include <source_location>

namespace rwd::core::detail {

[[noreturn]] void assertFail(const char *expr, std::source_location loc);

} // namespace rwd::core::detail

    #ifdef RWD_DEBUG
        #define RWD_ASSERT(cond)                                                              \
            do {                                                                              \
                if (!(cond)) [[unlikely]]                                                     \
                    ::rwd::core::detail::assertFail(#cond, std::source_location::current()); \
            } while (false)
    #else
        #define RWD_ASSERT(cond) ((void)0)
    #endif

#endif // RWD_CORE_ASSERT_HPP
