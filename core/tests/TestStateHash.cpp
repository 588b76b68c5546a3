/**
 * @file TestStateHash.cpp
 * @brief Unit tests for core::StateHash.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwd/core/StateHash.hpp"

namespace rwd::core {

TEST_CASE("StateHash of nothing is the FNV offset basis", "[core][hash]")
{
    StateHash hash;
    CHECK(hash.digest() == StateHash::kOffsetBasis);
}

TEST_CASE("StateHash matches the FNV-1a reference for 'a'", "[core][hash]")
{
    StateHash hash;
    hash.hashString("a");
    CHECK(hash.digest() == 0xaf63dc4c8601ec8cULL);
}

TEST_CASE("StateHash is order sensitive and resettable", "[core][hash]")
{
    StateHash ab;
    ab.combine(u32{1}).combine(u32{2});

    StateHash ba;
    ba.combine(u32{2}).combine(u32{1});

    CHECK(ab.digest() != ba.digest());

    ba.reset();
    ba.combine(u32{1}).combine(u32{2});
    CHECK(ab.digest() == ba.digest());
}

} // namespace rwd::core
