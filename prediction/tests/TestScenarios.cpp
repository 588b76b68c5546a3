/**
 * @file TestScenarios.cpp
 * @brief End-to-end rollback scenarios through App and PredictionManager.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "rwd/prediction/Components.hpp"
#include "rwd/prediction/PredictionDespawn.hpp"
#include "rwd/prediction/PredictionManager.hpp"
#include "rwd/prediction/ReplicationBridge.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace rwd::prediction {

using engine::Tick;
using Catch::Matchers::WithinAbs;

namespace {

constexpr core::f64 kFrame = 1.0 / 64.0;

struct Position
{
    float x{0.0f};

    bool operator!=(const Position &other) const { return x != other.x; }
    static Position lerp(const Position &a, const Position &b, core::f32 t) { return {a.x + (b.x - a.x) * t}; }
};

struct Velocity
{
    float dx{0.0f};
};

struct MatchClock
{
    core::u32 elapsed{0};
};

PredictionConfig::Builder defaults()
{
    return PredictionConfig::Builder{};
}

engine::Config appConfig()
{
    auto config = engine::Config::Builder{}.tickRate(64).workerThreads(2).maxEntities(256).build();
    REQUIRE(config.has_value());
    return *config;
}

/// App with a "move" gameplay system and Position registered for prediction.
struct Sim
{
    explicit Sim(const PredictionConfig::Builder &builder = defaults())
        : manager{*builder.build()}
    {
        REQUIRE(manager.registerComponent<Position>(
            "Position", ComponentOptions<Position>{}.withEquality().withLerp()));

        REQUIRE(app.addSystem(std::make_unique<ecs::FunctionSystem>(
            "steer", ecs::SchedulePhase::Input, std::vector<ecs::ComponentAccess>{ecs::writes<Velocity>()},
            [this](core::f32) {
                if (!steerFrom)
                    return;
                const Tick now = app.timeline().tick();
                app.world().each<Velocity>([&](ecs::EntityId, Velocity &v) {
                    v.dx = (*steerFrom <= now) ? 3.0f : 1.0f;
                });
            })));

        REQUIRE(app.addSystem(std::make_unique<ecs::FunctionSystem>(
            "move", ecs::SchedulePhase::Simulation,
            std::vector<ecs::ComponentAccess>{ecs::writes<Position>(), ecs::reads<Velocity>()},
            [this](core::f32) {
                app.world().each<Position, Velocity>([](ecs::EntityId, Position &p, Velocity &v) { p.x += v.dx; });
            })));

        REQUIRE(manager.install(app));
    }

    void step(int frames)
    {
        for (int i = 0; i < frames; ++i)
            REQUIRE(app.update(kFrame));
    }

    LinkedPair spawnMoving(float x, float dx)
    {
        auto pair = bridge.spawnPair();
        REQUIRE(pair.has_value());
        app.world().insert(pair->predicted, Position{x});
        app.world().insert(pair->predicted, Velocity{dx});
        return *pair;
    }

    float x(ecs::EntityId entity) { return app.world().get<Position>(entity)->x; }

    float historyAt(ecs::EntityId entity, Tick tick)
    {
        auto state = app.world().get<HistoryBuffer<Position>>(entity)->stateAt(tick);
        REQUIRE(state.has_value());
        REQUIRE(state->isUpdated());
        return state->value().x;
    }

    PredictionManager           manager;
    engine::App                 app{appConfig()};
    ReplicationBridge           bridge{app.world()};
    std::optional<Tick>         steerFrom;
};

} // namespace

TEST_CASE("A late correction rolls back and converges", "[prediction][pipeline]")
{
    Sim sim{defaults().correctionTicksFactor(1.0f)};
    const LinkedPair pair = sim.spawnMoving(-5.0f, 1.0f);

    sim.step(12);
    REQUIRE(sim.app.timeline().tick() == Tick{12});
    REQUIRE(sim.historyAt(pair.predicted, Tick{10}) == 5.0f);

    REQUIRE(sim.bridge.receive<Position>(pair.confirmed, Tick{10}, Position{9.0f}));
    sim.step(1);

    const auto metrics = sim.manager.metrics().snapshot();
    REQUIRE(metrics.rollbacks == 1);
    REQUIRE(metrics.rollbackTicks == 2);
    REQUIRE(metrics.stateMismatches == 1);

    // Converged history: confirmed value at 10, then re-simulated.
    REQUIRE(sim.historyAt(pair.predicted, Tick{10}) == 9.0f);
    REQUIRE(sim.historyAt(pair.predicted, Tick{11}) == 10.0f);
    REQUIRE(sim.historyAt(pair.predicted, Tick{12}) == 11.0f);
    REQUIRE(sim.historyAt(pair.predicted, Tick{13}) == 12.0f);
    REQUIRE(sim.app.timeline().tick() == Tick{13});

    // Half way through a two tick window, eased: 7 + 5 * 0.75.
    REQUIRE(sim.x(pair.predicted) == 10.75f);
    const auto *correction = sim.app.world().get<Correction<Position>>(pair.predicted);
    REQUIRE(correction != nullptr);
    REQUIRE(correction->currentCorrection->x == 12.0f);

    sim.step(1);
    REQUIRE(sim.x(pair.predicted) == 13.0f);
    REQUIRE_FALSE(sim.app.world().has<Correction<Position>>(pair.predicted));
    REQUIRE_FALSE(sim.manager.coordinator().isRollingBack());
}

TEST_CASE("A component removed locally is restored from the authority", "[prediction][pipeline]")
{
    Sim sim;
    const LinkedPair pair = sim.spawnMoving(0.0f, 0.0f);

    sim.step(3);
    REQUIRE(sim.app.world().remove<Position>(pair.predicted));
    sim.step(3);

    const auto *history = sim.app.world().get<HistoryBuffer<Position>>(pair.predicted);
    REQUIRE(history->stateAt(Tick{5})->isRemoved());

    REQUIRE(sim.bridge.receive<Position>(pair.confirmed, Tick{5}, Position{2.0f}));
    sim.step(1);

    REQUIRE(sim.manager.metrics().snapshot().rollbacks == 1);
    REQUIRE(sim.app.world().has<Position>(pair.predicted));
    REQUIRE(sim.x(pair.predicted) == 2.0f);
    REQUIRE(sim.historyAt(pair.predicted, Tick{5}) == 2.0f);
    REQUIRE_FALSE(sim.app.world().has<Correction<Position>>(pair.predicted));
}

TEST_CASE("A pre-spawned entity is despawned and re-created by replay", "[prediction][pipeline]")
{
    Sim sim;
    std::vector<ecs::EntityId> spawned;

    REQUIRE(sim.app.addSystem(std::make_unique<ecs::FunctionSystem>(
        "fire", ecs::SchedulePhase::PreSimulation, std::vector<ecs::ComponentAccess>{ecs::writes<PreSpawned>()},
        [&](core::f32) {
            const Tick now = sim.app.timeline().tick();
            if (now != Tick{20})
                return;
            auto bullet = sim.manager.prespawn().spawnPrespawned(sim.app.world(), now, 0xB011E7);
            REQUIRE(bullet.has_value());
            spawned.push_back(*bullet);
        })));

    const LinkedPair pair = sim.spawnMoving(0.0f, 0.0f);
    sim.step(22);
    REQUIRE(spawned.size() == 1);
    REQUIRE(sim.manager.prespawn().tracked() == 1);

    REQUIRE(sim.bridge.receive<Position>(pair.confirmed, Tick{14}, Position{1.0f}));
    sim.step(1);

    REQUIRE(sim.manager.metrics().snapshot().prespawnDespawns == 1);
    REQUIRE(spawned.size() == 2);
    REQUIRE_FALSE(sim.app.world().isAlive(spawned[0]));
    REQUIRE(sim.app.world().isAlive(spawned[1]));
    REQUIRE(sim.app.world().get<PreSpawned>(spawned[1])->spawnTick == Tick{20});
    REQUIRE(sim.manager.prespawn().tracked() == 1);

    auto matched = sim.manager.prespawn().match(sim.app.world(), 0xB011E7);
    REQUIRE(matched == spawned[1]);
}

TEST_CASE("Back-to-back rollbacks blend from the displayed value", "[prediction][pipeline]")
{
    Sim sim{defaults().correctionTicksFactor(4.0f)};
    const LinkedPair pair = sim.spawnMoving(-5.0f, 1.0f);

    sim.step(12);
    REQUIRE(sim.bridge.receive<Position>(pair.confirmed, Tick{10}, Position{9.0f}));
    sim.step(1);

    // One tick into an eight tick window: 7 + 5 * (1 - 0.875^2).
    REQUIRE(sim.x(pair.predicted) == 8.171875f);

    REQUIRE(sim.bridge.receive<Position>(pair.confirmed, Tick{12}, Position{20.0f}));
    sim.step(1);

    REQUIRE(sim.manager.metrics().snapshot().rollbacks == 2);
    const auto *correction = sim.app.world().get<Correction<Position>>(pair.predicted);
    REQUIRE(correction != nullptr);
    REQUIRE(correction->originalPrediction.x == 8.171875f);
    REQUIRE(correction->originalTick == Tick{13});
    REQUIRE(correction->finalCorrectionTick == Tick{17});
    REQUIRE(correction->currentCorrection->x == 22.0f);
    REQUIRE_THAT(sim.x(pair.predicted), WithinAbs(8.171875 + (22.0 - 8.171875) * 0.4375, 1e-4));
}

TEST_CASE("Matching confirmed state changes nothing", "[prediction][pipeline]")
{
    Sim sim;
    const LinkedPair pair = sim.spawnMoving(-5.0f, 1.0f);

    sim.step(12);
    REQUIRE(sim.bridge.receive<Position>(pair.confirmed, Tick{10}, Position{5.0f}));
    sim.step(1);

    REQUIRE(sim.manager.metrics().snapshot().rollbacks == 0);
    REQUIRE(sim.x(pair.predicted) == 8.0f);
    REQUIRE(sim.historyAt(pair.predicted, Tick{12}) == 7.0f);
    REQUIRE_FALSE(sim.app.world().has<Correction<Position>>(pair.predicted));
}

TEST_CASE("Replaying twice from the same target is deterministic", "[prediction][pipeline]")
{
    Sim sim{defaults().stateRollback(RollbackMode::Always).correctionTicksFactor(0.0f)};
    const LinkedPair pair = sim.spawnMoving(-5.0f, 1.0f);

    sim.step(12);
    REQUIRE(sim.bridge.receive<Position>(pair.confirmed, Tick{10}, Position{9.0f}));
    sim.step(1);

    std::vector<float> first;
    for (core::u16 t = 10; t <= 13; ++t)
        first.push_back(sim.historyAt(pair.predicted, Tick{t}));

    REQUIRE(sim.bridge.receive<Position>(pair.confirmed, Tick{10}, Position{9.0f}));
    sim.step(1);

    std::vector<float> second;
    for (core::u16 t = 10; t <= 13; ++t)
        second.push_back(sim.historyAt(pair.predicted, Tick{t}));

    REQUIRE(sim.manager.metrics().snapshot().rollbacks == 2);
    REQUIRE(first == second);
    REQUIRE(sim.x(pair.predicted) == 13.0f);
}

TEST_CASE("A rollback past the window is abandoned", "[prediction][pipeline]")
{
    Sim sim{defaults().maxRollbackTicks(4)};
    const LinkedPair pair = sim.spawnMoving(-5.0f, 1.0f);

    sim.step(12);
    REQUIRE(sim.bridge.receive<Position>(pair.confirmed, Tick{5}, Position{100.0f}));
    sim.step(1);

    const auto metrics = sim.manager.metrics().snapshot();
    REQUIRE(metrics.abortedRollbacks == 1);
    REQUIRE(metrics.rollbacks == 0);
    REQUIRE(sim.x(pair.predicted) == 8.0f);
    REQUIRE_FALSE(sim.manager.coordinator().isRollingBack());
    REQUIRE(sim.manager.coordinator().phase() == RollbackPhase::Idle);
}

TEST_CASE("An input mismatch replays from the input tick", "[prediction][pipeline]")
{
    Sim sim{defaults().inputRollback(RollbackMode::Check).correctionTicksFactor(1.0f)};
    const LinkedPair pair = sim.spawnMoving(-5.0f, 1.0f);

    sim.step(12);
    REQUIRE(sim.x(pair.predicted) == 7.0f);

    // The remote input for tick 8 turns out different from the assumption.
    sim.steerFrom = Tick{8};
    sim.manager.inputs().reportMismatch(Tick{8});
    sim.step(1);

    const auto metrics = sim.manager.metrics().snapshot();
    REQUIRE(metrics.rollbacks == 1);
    REQUIRE(metrics.rollbackTicks == 5);
    REQUIRE(metrics.inputMismatches == 1);

    REQUIRE(sim.historyAt(pair.predicted, Tick{7}) == 2.0f);
    REQUIRE(sim.historyAt(pair.predicted, Tick{12}) == 17.0f);
    const auto *correction = sim.app.world().get<Correction<Position>>(pair.predicted);
    REQUIRE(correction != nullptr);
    REQUIRE(correction->currentCorrection->x == 20.0f);
}

TEST_CASE("Rollback-exempt entities keep their own timeline", "[prediction][pipeline]")
{
    Sim sim;
    const LinkedPair tracked = sim.spawnMoving(-5.0f, 1.0f);
    const LinkedPair exempt  = sim.spawnMoving(0.0f, 1.0f);
    sim.app.world().insert(exempt.predicted, DisableRollback{});

    sim.step(12);
    REQUIRE(sim.x(exempt.predicted) == 12.0f);
    REQUIRE(sim.bridge.receive<Position>(tracked.confirmed, Tick{10}, Position{9.0f}));
    REQUIRE(sim.bridge.receive<Position>(exempt.confirmed, Tick{10}, Position{50.0f}));
    sim.step(1);

    REQUIRE(sim.manager.metrics().snapshot().rollbacks == 1);
    // Not restored and hidden during the replay: only the forward tick moved it.
    REQUIRE(sim.x(exempt.predicted) == 13.0f);
    REQUIRE(sim.historyAt(exempt.predicted, Tick{12}) == 12.0f);
    REQUIRE(sim.historyAt(exempt.predicted, Tick{13}) == 13.0f);
    REQUIRE_FALSE(sim.app.world().has<Correction<Position>>(exempt.predicted));
    REQUIRE(sim.historyAt(tracked.predicted, Tick{13}) == 12.0f);
    REQUIRE_FALSE(sim.app.world().isDisabled(exempt.predicted));
}

TEST_CASE("Every predicted entity converges when one of them mismatches", "[prediction][pipeline]")
{
    Sim sim{defaults().correctionTicksFactor(1.0f)};
    const LinkedPair a = sim.spawnMoving(-5.0f, 1.0f);
    const LinkedPair b = sim.spawnMoving(-5.0f, 1.0f);

    sim.step(12);
    // B is confirmed further ahead than the restore tick and agrees with its prediction.
    REQUIRE(sim.bridge.receive<Position>(b.confirmed, Tick{12}, Position{7.0f}));
    REQUIRE(sim.bridge.receive<Position>(a.confirmed, Tick{10}, Position{9.0f}));
    sim.step(1);

    const auto metrics = sim.manager.metrics().snapshot();
    REQUIRE(metrics.rollbacks == 1);
    REQUIRE(metrics.stateMismatches == 1);

    REQUIRE(sim.historyAt(a.predicted, Tick{12}) == 11.0f);
    REQUIRE(sim.historyAt(b.predicted, Tick{10}) == 5.0f);
    REQUIRE(sim.historyAt(b.predicted, Tick{12}) == 7.0f);
    REQUIRE(sim.historyAt(b.predicted, Tick{13}) == 8.0f);
}

TEST_CASE("A deterministic entity inside its grace window survives an earlier rollback", "[prediction][pipeline]")
{
    Sim sim{defaults().deterministicGraceTicks(20)};
    const LinkedPair pair = sim.spawnMoving(-5.0f, 1.0f);

    sim.step(11);
    auto spawned = sim.manager.spawnDeterministic(sim.app.world(), Tick{11}, true);
    REQUIRE(spawned.has_value());
    const ecs::EntityId orb = *spawned;
    sim.app.world().insert(orb, Position{100.0f});
    sim.app.world().insert(orb, Velocity{1.0f});

    sim.step(1);
    REQUIRE(sim.x(orb) == 101.0f);

    REQUIRE(sim.bridge.receive<Position>(pair.confirmed, Tick{10}, Position{9.0f}));
    sim.step(1);

    REQUIRE(sim.manager.metrics().snapshot().rollbacks == 1);
    REQUIRE(sim.app.world().isAlive(orb));
    REQUIRE(sim.app.world().has<DisableRollback>(orb));
    REQUIRE_FALSE(sim.app.world().isDisabled(orb));
    REQUIRE(sim.x(orb) == 102.0f);
    REQUIRE_FALSE(sim.app.world().has<Correction<Position>>(orb));
}

TEST_CASE("A prediction despawn inside the replay window is undone", "[prediction][pipeline]")
{
    Sim sim;
    const LinkedPair a = sim.spawnMoving(-5.0f, 1.0f);
    const LinkedPair b = sim.spawnMoving(0.0f, 1.0f);

    sim.step(11);
    REQUIRE(sim.manager.despawnPredicted(sim.app, b.predicted));
    REQUIRE(sim.app.world().isDisabled(b.predicted));

    sim.step(1);
    REQUIRE(sim.app.world().isDisabled(b.predicted));

    REQUIRE(sim.bridge.receive<Position>(a.confirmed, Tick{10}, Position{9.0f}));
    sim.step(1);

    REQUIRE(sim.manager.metrics().snapshot().rollbacks == 1);
    REQUIRE(sim.app.world().isAlive(b.predicted));
    REQUIRE_FALSE(sim.app.world().isDisabled(b.predicted));
    REQUIRE_FALSE(sim.app.world().has<PredictionDisable>(b.predicted));
    REQUIRE(sim.historyAt(b.predicted, Tick{12}) == 12.0f);
    REQUIRE(sim.historyAt(b.predicted, Tick{13}) == 13.0f);
}

TEST_CASE("Registered resources are rewound with the entities", "[prediction][pipeline][resource]")
{
    Sim sim;
    REQUIRE(sim.manager.registerResource<MatchClock>("MatchClock"));
    sim.app.world().insertResource(MatchClock{});
    REQUIRE(sim.app.addSystem(std::make_unique<ecs::FunctionSystem>(
        "clock", ecs::SchedulePhase::Simulation, std::vector<ecs::ComponentAccess>{},
        [&sim](core::f32) { ++sim.app.world().resource<MatchClock>()->elapsed; })));
    const LinkedPair pair = sim.spawnMoving(-5.0f, 1.0f);

    sim.step(12);
    REQUIRE(sim.app.world().resource<MatchClock>()->elapsed == 12);

    REQUIRE(sim.bridge.receive<Position>(pair.confirmed, Tick{10}, Position{9.0f}));
    sim.step(1);

    REQUIRE(sim.manager.metrics().snapshot().rollbacks == 1);
    REQUIRE(sim.app.world().resource<MatchClock>()->elapsed == 13);
}

TEST_CASE("A timeline snap shifts stored ticks", "[prediction][pipeline]")
{
    Sim sim;
    const LinkedPair pair = sim.spawnMoving(0.0f, 1.0f);
    sim.step(5);

    sim.manager.onTickSnap(sim.app, 10);
    REQUIRE(sim.app.timeline().tick() == Tick{15});
    REQUIRE(sim.historyAt(pair.predicted, Tick{15}) == 5.0f);
    REQUIRE(sim.historyAt(pair.predicted, Tick{11}) == 1.0f);

    sim.step(1);
    REQUIRE(sim.historyAt(pair.predicted, Tick{16}) == 6.0f);
}

TEST_CASE("PredictionManager installs once", "[prediction][manager]")
{
    Sim sim;
    auto again = sim.manager.install(sim.app);
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code() == core::ErrorCode::kAlreadyExists);

    auto duplicate = sim.manager.registerComponent<Position>("Position");
    REQUIRE_FALSE(duplicate.has_value());
}

} // namespace rwd::prediction
