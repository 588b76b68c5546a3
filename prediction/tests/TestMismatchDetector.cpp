/**
 * @file TestMismatchDetector.cpp
 * @brief Unit tests for prediction::MismatchDetector.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwd/prediction/MismatchDetector.hpp"
#include "rwd/prediction/ReplicationBridge.hpp"

#include <optional>
#include <vector>

namespace rwd::prediction {

using engine::Tick;

namespace {

struct Health
{
    int value{0};

    bool operator!=(const Health &other) const { return value != other.value; }
};

struct Tint
{
    int rgb{0};
};

PredictionConfig makeConfig(RollbackMode state = RollbackMode::Check,
                            RollbackMode input = RollbackMode::Disabled,
                            core::u16 maxRollback = 100)
{
    auto config = PredictionConfig::Builder{}
                      .stateRollback(state)
                      .inputRollback(input)
                      .maxRollbackTicks(maxRollback)
                      .parallelDetection(true)
                      .parallelThreshold(8)
                      .build();
    REQUIRE(config.has_value());
    return *config;
}

struct Fixture
{
    explicit Fixture(PredictionConfig cfg = makeConfig()) : config{cfg}
    {
        REQUIRE(registry.registerComponent<Health>("Health", ComponentOptions<Health>{}.withEquality()));
        REQUIRE(registry.registerComponent<Tint>("Tint"));
    }

    /// Predicted entity whose history holds @p past at @p tick, mirror not yet updated.
    LinkedPair pairWithHistory(Tick tick, std::optional<Health> past)
    {
        auto pair = bridge.spawnPair();
        REQUIRE(pair.has_value());
        auto *history = world.insert(pair->predicted, HistoryBuffer<Health>{});
        if (past)
        {
            history->record(tick, *past);
        }
        else
        {
            history->record(tick - 1, Health{1});
            history->record(tick, std::nullopt);
        }
        return *pair;
    }

    ecs::World           world{512};
    PredictionConfig     config;
    PredictionRegistry   registry;
    RollbackCoordinator  coordinator;
    InputMismatchTracker inputs;
    PrespawnTracker      prespawn;
    PredictionMetrics    metrics;
    ReplicationBridge    bridge{world};
    MismatchDetector     detector{config, registry, coordinator, inputs, prespawn, metrics};
};

} // namespace

TEST_CASE("MismatchDetector decision table", "[prediction][detector]")
{
    Fixture f;
    const Tick confirmedTick{10};
    const Tick now{12};

    SECTION("confirmed absent, no history: no rollback")
    {
        auto pair = f.bridge.spawnPair();
        REQUIRE(f.bridge.receive<Health>(pair->confirmed, confirmedTick, std::nullopt));
        REQUIRE_FALSE(f.detector.run(f.world, now));
    }

    SECTION("confirmed absent, history updated: rollback")
    {
        auto pair = f.pairWithHistory(confirmedTick, Health{5});
        REQUIRE(f.bridge.receive<Health>(pair.confirmed, confirmedTick, std::nullopt));
        REQUIRE(f.detector.run(f.world, now));
    }

    SECTION("confirmed absent, history removed: no rollback")
    {
        auto pair = f.pairWithHistory(confirmedTick, std::nullopt);
        REQUIRE(f.bridge.receive<Health>(pair.confirmed, confirmedTick, std::nullopt));
        REQUIRE_FALSE(f.detector.run(f.world, now));
    }

    SECTION("confirmed present, no history: rollback")
    {
        auto pair = f.bridge.spawnPair();
        REQUIRE(f.bridge.receive<Health>(pair->confirmed, confirmedTick, Health{9}));
        REQUIRE(f.detector.run(f.world, now));
    }

    SECTION("confirmed present, history equal: no rollback")
    {
        auto pair = f.pairWithHistory(confirmedTick, Health{9});
        REQUIRE(f.bridge.receive<Health>(pair.confirmed, confirmedTick, Health{9}));
        REQUIRE_FALSE(f.detector.run(f.world, now));
    }

    SECTION("confirmed present, history differs: rollback")
    {
        auto pair = f.pairWithHistory(confirmedTick, Health{5});
        REQUIRE(f.bridge.receive<Health>(pair.confirmed, confirmedTick, Health{9}));
        REQUIRE(f.detector.run(f.world, now));
    }

    SECTION("confirmed present, history removed: rollback")
    {
        auto pair = f.pairWithHistory(confirmedTick, std::nullopt);
        REQUIRE(f.bridge.receive<Health>(pair.confirmed, confirmedTick, Health{9}));
        REQUIRE(f.detector.run(f.world, now));
    }
}

TEST_CASE("MismatchDetector targets the tick after the confirmed one", "[prediction][detector]")
{
    Fixture f;
    auto pair = f.pairWithHistory(Tick{10}, Health{5});
    REQUIRE(f.bridge.receive<Health>(pair.confirmed, Tick{10}, Health{9}));

    REQUIRE(f.detector.run(f.world, Tick{12}));
    REQUIRE(f.coordinator.currentTarget() == Tick{11});
    REQUIRE(f.coordinator.cause() == RollbackCause::State);
    REQUIRE(f.coordinator.phase() == RollbackPhase::Preparing);
    REQUIRE(f.metrics.snapshot().stateMismatches == 1);
    REQUIRE_FALSE(f.world.get<Confirmed>(pair.confirmed)->changed);
}

TEST_CASE("MismatchDetector matching history is idempotent", "[prediction][detector]")
{
    Fixture f;
    auto pair = f.pairWithHistory(Tick{10}, Health{9});
    auto *history = f.world.get<HistoryBuffer<Health>>(pair.predicted);
    history->record(Tick{11}, Health{8});
    history->record(Tick{12}, Health{7});

    REQUIRE(f.bridge.receive<Health>(pair.confirmed, Tick{10}, Health{9}));
    REQUIRE_FALSE(f.detector.run(f.world, Tick{12}));

    REQUIRE_FALSE(f.coordinator.isRollingBack());
    REQUIRE(f.coordinator.phase() == RollbackPhase::Idle);
    REQUIRE(history->size() == 3);
    REQUIRE(history->stateAt(Tick{12})->value().value == 7);
}

TEST_CASE("MismatchDetector kinds without comparator never trigger", "[prediction][detector]")
{
    Fixture f;
    auto pair = f.bridge.spawnPair();
    auto *history = f.world.insert(pair->predicted, HistoryBuffer<Tint>{});
    history->record(Tick{4}, Tint{1});
    history->record(Tick{8}, Tint{2});

    REQUIRE(f.bridge.receive<Tint>(pair->confirmed, Tick{8}, Tint{3}));
    REQUIRE_FALSE(f.detector.run(f.world, Tick{10}));

    // Checks only read the history.
    REQUIRE(history->size() == 2);
    REQUIRE(history->front()->tick == Tick{4});
}

TEST_CASE("MismatchDetector policies", "[prediction][detector]")
{
    SECTION("Always rolls back on any update")
    {
        Fixture f{makeConfig(RollbackMode::Always)};
        auto pair = f.pairWithHistory(Tick{10}, Health{9});
        REQUIRE(f.bridge.receive<Health>(pair.confirmed, Tick{10}, Health{9}));
        REQUIRE(f.detector.run(f.world, Tick{12}));
        REQUIRE(f.coordinator.currentTarget() == Tick{11});
    }

    SECTION("Disabled ignores state mismatches")
    {
        Fixture f{makeConfig(RollbackMode::Disabled)};
        auto pair = f.pairWithHistory(Tick{10}, Health{5});
        REQUIRE(f.bridge.receive<Health>(pair.confirmed, Tick{10}, Health{9}));
        REQUIRE_FALSE(f.detector.run(f.world, Tick{12}));
    }

    SECTION("Input Check rolls back from the mismatching input tick")
    {
        Fixture f{makeConfig(RollbackMode::Check, RollbackMode::Check)};
        f.inputs.reportRemoteInput(Tick{6});
        f.inputs.reportMismatch(Tick{8});

        REQUIRE(f.detector.run(f.world, Tick{12}));
        REQUIRE(f.coordinator.currentTarget() == Tick{8});
        REQUIRE(f.coordinator.cause() == RollbackCause::Input);
        REQUIRE(f.metrics.snapshot().inputMismatches == 1);
    }

    SECTION("Input Always rolls back from the earliest remote input")
    {
        Fixture f{makeConfig(RollbackMode::Check, RollbackMode::Always)};
        f.inputs.reportRemoteInput(Tick{6});
        f.inputs.reportMismatch(Tick{8});

        REQUIRE(f.detector.run(f.world, Tick{12}));
        REQUIRE(f.coordinator.currentTarget() == Tick{6});
    }

    SECTION("Inputs for ticks not simulated yet are ignored")
    {
        Fixture f{makeConfig(RollbackMode::Check, RollbackMode::Check)};
        f.inputs.reportMismatch(Tick{15});
        REQUIRE_FALSE(f.detector.run(f.world, Tick{12}));
    }
}

TEST_CASE("MismatchDetector gives state precedence over input", "[prediction][detector]")
{
    Fixture f{makeConfig(RollbackMode::Check, RollbackMode::Check)};
    auto pair = f.pairWithHistory(Tick{10}, Health{5});
    REQUIRE(f.bridge.receive<Health>(pair.confirmed, Tick{10}, Health{9}));
    f.inputs.reportMismatch(Tick{4});

    REQUIRE(f.detector.run(f.world, Tick{12}));
    REQUIRE(f.coordinator.currentTarget() == Tick{11});
    REQUIRE(f.coordinator.cause() == RollbackCause::State);
    REQUIRE(f.metrics.snapshot().inputMismatches == 0);

    // Input signals are consumed by every pass.
    REQUIRE_FALSE(f.inputs.peek().earliestMismatch.has_value());
}

TEST_CASE("MismatchDetector postpones confirmed ticks from the future", "[prediction][detector]")
{
    Fixture f;
    auto pair = f.pairWithHistory(Tick{20}, Health{5});
    REQUIRE(f.bridge.receive<Health>(pair.confirmed, Tick{20}, Health{9}));

    REQUIRE_FALSE(f.detector.run(f.world, Tick{12}));
    REQUIRE(f.metrics.snapshot().futureConfirmedTicks == 1);
    REQUIRE(f.world.get<Confirmed>(pair.confirmed)->changed);

    // Once reached, the check happens with an empty replay window.
    REQUIRE(f.detector.run(f.world, Tick{20}));
    REQUIRE(f.coordinator.currentTarget() == Tick{21});
    REQUIRE(f.coordinator.replayTicks(Tick{20}) == 0);
}

TEST_CASE("MismatchDetector aborts rollbacks beyond the window", "[prediction][detector]")
{
    Fixture f{makeConfig(RollbackMode::Check, RollbackMode::Disabled, 4)};
    auto pair = f.pairWithHistory(Tick{5}, Health{5});
    REQUIRE(f.bridge.receive<Health>(pair.confirmed, Tick{5}, Health{9}));

    REQUIRE_FALSE(f.detector.run(f.world, Tick{12}));
    REQUIRE_FALSE(f.coordinator.isRollingBack());
    REQUIRE(f.coordinator.phase() == RollbackPhase::Idle);
    REQUIRE(f.metrics.snapshot().abortedRollbacks == 1);
}

TEST_CASE("MismatchDetector skips mirrors without a live link", "[prediction][detector]")
{
    Fixture f;
    auto pair = f.pairWithHistory(Tick{10}, Health{5});
    REQUIRE(f.bridge.despawn(pair.predicted));
    REQUIRE(f.bridge.receive<Health>(pair.confirmed, Tick{10}, Health{9}));

    REQUIRE_FALSE(f.detector.run(f.world, Tick{12}));
    REQUIRE_FALSE(f.world.get<Confirmed>(pair.confirmed)->changed);
}

TEST_CASE("MismatchDetector ignores rollback-exempt entities", "[prediction][detector]")
{
    Fixture f;
    auto pair = f.pairWithHistory(Tick{10}, Health{5});
    f.world.insert(pair.predicted, DisableRollback{});
    REQUIRE(f.bridge.receive<Health>(pair.confirmed, Tick{10}, Health{9}));

    REQUIRE_FALSE(f.detector.run(f.world, Tick{12}));
}

TEST_CASE("MismatchDetector parallel pass keeps the earliest target", "[prediction][detector]")
{
    concurrency::ThreadPool pool{3};

    for (int round = 0; round < 5; ++round)
    {
        Fixture f;
        for (core::u16 i = 0; i < 120; ++i)
        {
            const Tick tick{static_cast<core::u16>(i == 77 ? 15 : 20 + i % 40)};
            auto pair = f.pairWithHistory(tick, Health{0});
            REQUIRE(f.bridge.receive<Health>(pair.confirmed, tick, Health{1}));
        }

        REQUIRE(f.detector.run(f.world, Tick{80}, &pool));
        REQUIRE(f.coordinator.currentTarget() == Tick{16});
        REQUIRE(f.coordinator.cause() == RollbackCause::State);
    }
}

TEST_CASE("MismatchDetector despawns speculative entities before replay", "[prediction][detector]")
{
    Fixture f;
    auto early = f.prespawn.spawnPrespawned(f.world, Tick{9}, 0xA);
    auto late  = f.prespawn.spawnPrespawned(f.world, Tick{11}, 0xB);
    REQUIRE(early.has_value());
    REQUIRE(late.has_value());

    auto pair = f.pairWithHistory(Tick{10}, Health{5});
    REQUIRE(f.bridge.receive<Health>(pair.confirmed, Tick{10}, Health{9}));

    REQUIRE(f.detector.run(f.world, Tick{12}));
    REQUIRE(f.world.isAlive(*early));
    REQUIRE_FALSE(f.world.isAlive(*late));
    REQUIRE(f.metrics.snapshot().prespawnDespawns == 1);
    REQUIRE(f.prespawn.tracked() == 1);
}

} // namespace rwd::prediction
