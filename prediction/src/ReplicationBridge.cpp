/**
 * @file ReplicationBridge.cpp
 * @brief ReplicationBridge implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/prediction/ReplicationBridge.hpp>
#include <rwd/core/Log.hpp>

namespace rwd::prediction {

core::Expected<LinkedPair> ReplicationBridge::spawnPair()
{
    const ecs::EntityId predicted = RWD_TRY(_world.spawn());
    auto mirror = _world.spawn();
    if (!mirror)
    {
        RWD_TRY_VOID(_world.despawn(predicted));
        return std::unexpected(std::move(mirror.error()));
    }

    _world.insert(predicted, Predicted{*mirror});
    _world.insert(*mirror, Confirmed{predicted, engine::Tick{}, false});
    return LinkedPair{predicted, *mirror};
}

core::Expected<void> ReplicationBridge::link(ecs::EntityId predicted, ecs::EntityId mirror)
{
    if (!_world.isAlive(predicted) || !_world.isAlive(mirror))
        return core::makeError(core::ErrorCode::kNotFound, "cannot link dead entities");

    if (const auto *existing = _world.get<Confirmed>(mirror);
        existing && existing->predictedEntity != predicted && _world.isAlive(existing->predictedEntity))
    {
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               "mirror " + ecs::toString(mirror) + " already linked to "
                               + ecs::toString(existing->predictedEntity));
    }

    _world.insert(predicted, Predicted{mirror});
    if (auto *confirmed = _world.get<Confirmed>(mirror))
        confirmed->predictedEntity = predicted;
    else
        _world.insert(mirror, Confirmed{predicted, engine::Tick{}, false});
    return {};
}

core::Expected<Confirmed *> ReplicationBridge::acceptUpdate(ecs::EntityId mirror, engine::Tick tick)
{
    auto *confirmed = _world.get<Confirmed>(mirror);
    if (!confirmed)
        return core::makeError(core::ErrorCode::kNotFound,
                               "entity " + ecs::toString(mirror) + " is not a confirmed mirror");

    if (confirmed->received && tick < confirmed->tick)
    {
        return core::makeError(core::ErrorCode::kOutOfRange,
                               "stale update for tick " + engine::toString(tick) + ", mirror holds tick "
                               + engine::toString(confirmed->tick));
    }
    return confirmed;
}

core::Expected<void> ReplicationBridge::despawn(ecs::EntityId entity)
{
    if (const auto *predicted = _world.get<Predicted>(entity))
    {
        if (auto *confirmed = _world.get<Confirmed>(predicted->confirmedEntity))
            confirmed->predictedEntity = ecs::EntityId{};
    }
    if (const auto *confirmed = _world.get<Confirmed>(entity))
    {
        const ecs::EntityId predictedEntity = confirmed->predictedEntity;
        if (_world.has<PredictionDisable>(predictedEntity))
        {
            // The authority confirms a despawn the client already predicted.
            RWD_TRY_VOID(_world.despawn(predictedEntity));
        }
        else if (auto *predicted = _world.get<Predicted>(predictedEntity))
        {
            predicted->confirmedEntity = ecs::EntityId{};
        }
    }

    RWD_TRY_VOID(_world.despawn(entity));
    core::Log::debug("prediction", "linked entity " + ecs::toString(entity) + " despawned");
    return {};
}

} // namespace rwd::prediction
