/**
 * @file TestFixedTime.cpp
 * @brief Unit tests for engine::FixedTime.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "rwd/engine/FixedTime.hpp"

namespace rwd::engine {

using Catch::Matchers::WithinAbs;

TEST_CASE("FixedTime expends whole timesteps and keeps the overstep", "[engine][time]")
{
    FixedTime clock{0.25};
    clock.accumulate(0.6);

    REQUIRE(clock.expend());
    REQUIRE(clock.expend());
    REQUIRE_FALSE(clock.expend());

    REQUIRE_THAT(clock.elapsed(), WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(clock.overstep(), WithinAbs(0.1, 1e-12));
    REQUIRE_THAT(clock.overstepFraction(), WithinAbs(0.4, 1e-12));
}

TEST_CASE("FixedTime rewind and restore bracket a replay", "[engine][time]")
{
    FixedTime clock{0.25};
    clock.accumulate(1.1);
    while (clock.expend()) {}

    const FixedTime::State saved = clock.save();

    clock.rewind(3);
    REQUIRE_THAT(clock.elapsed(), WithinAbs(0.25, 1e-12));
    REQUIRE(clock.overstep() == 0.0);

    for (int i = 0; i < 3; ++i)
        clock.advance();
    REQUIRE_THAT(clock.elapsed(), WithinAbs(saved.elapsed, 1e-12));

    clock.restore(saved);
    REQUIRE_THAT(clock.overstep(), WithinAbs(0.1, 1e-12));
}

} // namespace rwd::engine
