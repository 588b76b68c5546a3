/**
 * @file TestSparseSet.cpp
 * @brief Unit tests for container::SparseSet.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwd/container/SparseSet.hpp"

#include <algorithm>

namespace rwd::container {

TEST_CASE("SparseSet insert, find and contains", "[container][sparseset]")
{
    SparseSet<int> set{64};

    REQUIRE(set.empty());
    REQUIRE(set.insert(3, 30));
    REQUIRE(set.insert(7, 70));
    REQUIRE_FALSE(set.insert(3, 31));

    REQUIRE(set.size() == 2);
    REQUIRE(set.contains(3));
    REQUIRE_FALSE(set.contains(4));
    REQUIRE(*set.find(3) == 30);
    REQUIRE(set.find(4) == nullptr);
}

TEST_CASE("SparseSet insertOrAssign overwrites in place", "[container][sparseset]")
{
    SparseSet<int> set{16};
    set.insertOrAssign(5, 1);
    int *value = set.insertOrAssign(5, 2);

    REQUIRE(value != nullptr);
    REQUIRE(*value == 2);
    REQUIRE(set.size() == 1);
}

TEST_CASE("SparseSet remove keeps the dense array packed", "[container][sparseset]")
{
    SparseSet<int> set{16};
    set.insert(1, 10);
    set.insert(2, 20);
    set.insert(3, 30);

    REQUIRE(set.remove(1));
    REQUIRE_FALSE(set.remove(1));
    REQUIRE(set.size() == 2);
    REQUIRE(*set.find(2) == 20);
    REQUIRE(*set.find(3) == 30);

    const auto ids = set.ids();
    REQUIRE(std::find(ids.begin(), ids.end(), 1u) == ids.end());
    REQUIRE(set.dense().size() == ids.size());
}

TEST_CASE("SparseSet rejects slots past its capacity", "[container][sparseset]")
{
    SparseSet<int> set{8};
    REQUIRE_FALSE(set.insert(8, 1));
    REQUIRE_FALSE(set.contains(100));
}

TEST_CASE("SparseSet allocates sparse pages on demand", "[container][sparseset]")
{
    SparseSet<int> set{4 * SparseSet<int>::kPageSize};
    REQUIRE(set.pageCount() == 0);

    set.insert(3, 1);
    set.insert(5, 2);
    REQUIRE(set.pageCount() == 1);

    set.insert(3 * SparseSet<int>::kPageSize + 1, 3);
    REQUIRE(set.pageCount() == 2);
    REQUIRE_FALSE(set.contains(SparseSet<int>::kPageSize + 1));
    REQUIRE(*set.find(3 * SparseSet<int>::kPageSize + 1) == 3);
}

TEST_CASE("SparseSet remove of the last dense value across pages", "[container][sparseset]")
{
    SparseSet<int> set{1024};
    set.insert(700, 7);
    set.insert(2, 2);

    REQUIRE(set.remove(700));
    REQUIRE(set.size() == 1);
    REQUIRE(*set.find(2) == 2);
    REQUIRE(set.ids()[0] == 2u);
    REQUIRE(set.insert(700, 8));
    REQUIRE(*set.find(700) == 8);
}

} // namespace rwd::container
