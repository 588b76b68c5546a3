/**
 * @file Assert.cpp
 * @brief Failure path of RWD_ASSERT.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#include "rwd/core/Assert.hpp"
#include "rwd/core/Log.hpp"

#include <cstdlib>
#include <string>

namespace rwd::core::detail {

void assertFail(const char *expr, std::source_location loc)
{
    Log::error("assert", std::string{loc.file_name()} + ":" + std::to_string(loc.line()) + " in "
                             + loc.function_name() + ": '" + expr + "' failed");
    std::abort();
}

} // namespace rwd::core::detail
