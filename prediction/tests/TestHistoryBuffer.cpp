/**
 * @file TestHistoryBuffer.cpp
 * @brief Unit tests for prediction::HistoryBuffer.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwd/prediction/HistoryBuffer.hpp"

namespace rwd::prediction {

using engine::Tick;

TEST_CASE("HistoryBuffer popUntilTick returns the most recent state at or before", "[prediction][history]")
{
    HistoryBuffer<int> history;
    history.record(Tick{2}, 20);
    history.record(Tick{5}, 50);
    history.record(Tick{9}, 90);

    auto state = history.popUntilTick(Tick{7});
    REQUIRE(state.has_value());
    REQUIRE(state->isUpdated());
    REQUIRE(state->value() == 50);

    // The popped state is re-filed at the requested tick, older ones are gone.
    REQUIRE(history.size() == 2);
    REQUIRE(history.front()->tick == Tick{7});
    REQUIRE(history.peek()->tick == Tick{9});
}

TEST_CASE("HistoryBuffer popUntilTick before every record leaves the buffer", "[prediction][history]")
{
    HistoryBuffer<int> history;
    history.record(Tick{10}, 1);

    REQUIRE_FALSE(history.popUntilTick(Tick{9}).has_value());
    REQUIRE(history.size() == 1);
}

TEST_CASE("HistoryBuffer records removals distinctly from missing records", "[prediction][history]")
{
    HistoryBuffer<int> history;
    history.record(Tick{1}, 7);
    history.record(Tick{3}, std::nullopt);

    auto removed = history.stateAt(Tick{4});
    REQUIRE(removed.has_value());
    REQUIRE(removed->isRemoved());

    REQUIRE(history.stateAt(Tick{2})->value() == 7);
    REQUIRE_FALSE(history.stateAt(Tick{0}).has_value());
}

TEST_CASE("HistoryBuffer overwrites a record at the same tick", "[prediction][history]")
{
    HistoryBuffer<int> history;
    history.record(Tick{4}, 1);
    history.record(Tick{4}, 2);

    REQUIRE(history.size() == 1);
    REQUIRE(history.peek()->state.value() == 2);
}

TEST_CASE("HistoryBuffer seekAndClearAfter drops the future", "[prediction][history]")
{
    HistoryBuffer<int> history;
    for (core::u16 t = 1; t <= 6; ++t)
        history.record(Tick{t}, t * 10);

    auto state = history.seekAndClearAfter(Tick{3});
    REQUIRE(state->value() == 30);
    REQUIRE(history.size() == 1);
    REQUIRE(history.peek()->tick == Tick{3});
}

TEST_CASE("HistoryBuffer clearUntilTick and truncateAfter bound the range", "[prediction][history]")
{
    HistoryBuffer<int> history;
    for (core::u16 t = 1; t <= 6; ++t)
        history.record(Tick{t}, t);

    history.clearUntilTick(Tick{3});
    REQUIRE(history.front()->tick == Tick{3});

    history.truncateAfter(Tick{4});
    REQUIRE(history.peek()->tick == Tick{4});
    REQUIRE(history.size() == 2);

    history.clear();
    REQUIRE(history.empty());
}

TEST_CASE("HistoryBuffer works across the tick wrap", "[prediction][history]")
{
    HistoryBuffer<int> history;
    history.record(Tick{65534}, 1);
    history.record(Tick{65535}, 2);
    history.record(Tick{0}, 3);
    history.record(Tick{1}, 4);

    REQUIRE(history.stateAt(Tick{0})->value() == 3);
    REQUIRE(history.popUntilTick(Tick{65535})->value() == 2);
    REQUIRE(history.size() == 3);
}

TEST_CASE("HistoryBuffer shiftTicks moves every record", "[prediction][history]")
{
    HistoryBuffer<int> history;
    history.record(Tick{10}, 1);
    history.record(Tick{12}, 2);

    history.shiftTicks(-3);
    REQUIRE(history.front()->tick == Tick{7});
    REQUIRE(history.peek()->tick == Tick{9});
}

} // namespace rwd::prediction
