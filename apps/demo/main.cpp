/**
 * @file main.cpp
 * @brief Rewind demo: a predicted client fed by a lagging, drifting authority.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/prediction/HistoryBuffer.hpp>
#include <rwd/prediction/PredictionManager.hpp>
#include <rwd/prediction/ReplicationBridge.hpp>
#include <rwd/engine/App.hpp>
#include <rwd/engine/Config.hpp>
#include <rwd/engine/GameLoop.hpp>
#include <rwd/core/Log.hpp>
#include <rwd/core/Types.hpp>

#include <memory>
#include <string>
#include <vector>

namespace {

constexpr rwd::core::u16 kRunTicks       = 192;
constexpr rwd::core::u16 kAuthorityDelay = 6;
constexpr rwd::core::u16 kSendInterval   = 8;

struct Position
{
    float x{0.0f};
    float y{0.0f};

    bool operator!=(const Position &other) const { return x != other.x || y != other.y; }

    static Position lerp(const Position &a, const Position &b, rwd::core::f32 t)
    {
        return {a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
    }
};

struct Velocity
{
    float dx{0.0f};
    float dy{0.0f};
};

} // namespace

int main(int /*argc*/, char* /*argv*/[])
{
    using namespace rwd;

    core::Log::info("demo", "=== Rewind demo ===");

    auto config = engine::Config::Builder{}
        .tickRate(64)
        .workerThreads(2)
        .maxEntities(1024)
        .build();
    if (!config)
    {
        core::Log::error("demo", config.error().message());
        return 1;
    }

    auto predictionConfig = prediction::PredictionConfig::Builder{}
        .maxRollbackTicks(32)
        .correctionTicksFactor(2.0f)
        .build();
    if (!predictionConfig)
    {
        core::Log::error("demo", predictionConfig.error().message());
        return 1;
    }

    prediction::PredictionManager manager{*predictionConfig};
    engine::App                   app{*config};
    engine::GameLoop              loop{app};
    prediction::ReplicationBridge bridge{app.world()};

    auto registered = manager.registerComponent<Position>(
        "Position", prediction::ComponentOptions<Position>{}.withEquality().withLerp());
    if (!registered)
    {
        core::Log::error("demo", registered.error().message());
        return 1;
    }

    auto moved = app.addSystem(std::make_unique<ecs::FunctionSystem>(
        "move", ecs::SchedulePhase::Simulation,
        std::vector<ecs::ComponentAccess>{ecs::writes<Position>(), ecs::reads<Velocity>()},
        [&app](core::f32 dt) {
            app.world().each<Position, Velocity>([dt](ecs::EntityId, Position &p, Velocity &v) {
                p.x += v.dx * dt;
                p.y += v.dy * dt;
            });
        }));
    if (!moved)
    {
        core::Log::error("demo", moved.error().message());
        return 1;
    }

    if (auto installed = manager.install(app); !installed)
    {
        core::Log::error("demo", installed.error().message());
        return 1;
    }

    std::vector<prediction::LinkedPair> players;
    for (int i = 0; i < 4; ++i)
    {
        auto pair = bridge.spawnPair();
        if (!pair)
        {
            core::Log::error("demo", pair.error().message());
            return 1;
        }
        app.world().insert(pair->predicted, Position{static_cast<float>(i), 0.0f});
        app.world().insert(pair->predicted, Velocity{1.0f, 0.5f * static_cast<float>(i)});
        players.push_back(*pair);
    }

    // Stand-in authority: echoes the client's own history a few ticks late,
    // nudging one player every third message.
    engine::Tick lastSent{};
    core::u32    messages = 0;
    app.addHook(engine::Stage::PostUpdate, "demo::authority", [&](engine::App &a) {
        const engine::Tick now = a.timeline().tick();
        if (now.value() >= kRunTicks)
        {
            loop.requestStop();
            return;
        }
        if (now.value() < kAuthorityDelay || now.value() % kSendInterval != 0 || now == lastSent)
            return;
        lastSent = now;

        const engine::Tick confirmedTick = now - kAuthorityDelay;
        for (core::usize i = 0; i < players.size(); ++i)
        {
            const auto *history = a.world().get<prediction::HistoryBuffer<Position>>(players[i].predicted);
            if (!history)
                continue;
            const auto past = history->stateAt(confirmedTick);
            if (!past || !past->isUpdated())
                continue;

            Position authoritative = past->value();
            if (messages % 3 == 0 && i == messages % players.size())
                authoritative.y += 0.25f;

            if (auto sent = bridge.receive<Position>(players[i].confirmed, confirmedTick, authoritative); !sent)
                core::Log::warn("demo", sent.error().message());
        }
        ++messages;
    });

    if (auto result = loop.run(); !result)
    {
        core::Log::error("demo", "loop failed: " + result.error().message());
        return 1;
    }

    const auto metrics = manager.metrics().snapshot();
    core::Log::info("demo", "ticks " + std::to_string(app.timeline().tick().value())
                            + ", rollbacks " + std::to_string(metrics.rollbacks)
                            + ", replayed ticks " + std::to_string(metrics.rollbackTicks)
                            + ", state mismatches " + std::to_string(metrics.stateMismatches)
                            + ", aborted " + std::to_string(metrics.abortedRollbacks));

    core::Log::info("demo", "exited cleanly");
    return 0;
}
