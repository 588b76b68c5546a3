/**
 * @file PredictionDespawn.cpp
 * @brief Reversible despawn of predicted entities.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/prediction/PredictionDespawn.hpp>
#include <rwd/prediction/Components.hpp>
#include <rwd/core/Log.hpp>

#include <string>
#include <vector>

namespace rwd::prediction {

core::Expected<void> predictionDespawn(ecs::World &world, ecs::EntityId entity, engine::Tick now)
{
    if (!world.isAlive(entity))
        return core::makeError(core::ErrorCode::kNotFound, "prediction despawn of dead entity " + ecs::toString(entity));

    const bool predicted = world.has<Predicted>(entity) || world.has<PreSpawned>(entity)
                        || world.has<DeterministicPredicted>(entity);
    if (!predicted)
        return world.despawn(entity);

    if (!world.has<PredictionDisable>(entity))
        world.insert(entity, PredictionDisable{now});
    return world.setDisabled(entity, true);
}

core::u32 reviveDespawned(ecs::World &world, engine::Tick target)
{
    std::vector<ecs::EntityId> revived;
    world.eachIncludingDisabled<PredictionDisable>([&](ecs::EntityId entity, PredictionDisable &marker) {
        if (marker.despawnTick < target || world.has<DisableRollback>(entity))
            return;
        revived.push_back(entity);
    });

    for (const ecs::EntityId entity : revived)
    {
        world.remove<PredictionDisable>(entity);
        core::reportFailure(world.setDisabled(entity, false), "prediction", core::LogLevel::kWarn);
    }

    if (!revived.empty())
    {
        core::Log::debug("prediction", std::to_string(revived.size()) + " despawned entities revived for replay from tick "
                                       + engine::toString(target));
    }
    return static_cast<core::u32>(revived.size());
}

core::u32 purgeDespawned(ecs::World &world, engine::Tick now, core::u16 window)
{
    std::vector<ecs::EntityId> expired;
    world.eachIncludingDisabled<PredictionDisable>([&](ecs::EntityId entity, PredictionDisable &marker) {
        if ((now - marker.despawnTick) > static_cast<core::i32>(window))
            expired.push_back(entity);
    });

    core::u32 purged = 0;
    for (const ecs::EntityId entity : expired)
    {
        if (const auto *link = world.get<Predicted>(entity))
        {
            if (auto *confirmed = world.get<Confirmed>(link->confirmedEntity))
                confirmed->predictedEntity = ecs::EntityId{};
        }
        if (core::reportFailure(world.despawn(entity), "prediction", core::LogLevel::kWarn))
            ++purged;
    }
    return purged;
}

void shiftDespawnTicks(ecs::World &world, core::i16 delta)
{
    world.eachIncludingDisabled<PredictionDisable>([delta](ecs::EntityId, PredictionDisable &marker) {
        marker.despawnTick += delta;
    });
}

} // namespace rwd::prediction
