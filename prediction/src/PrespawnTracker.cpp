/**
 * @file PrespawnTracker.cpp
 * @brief PrespawnTracker implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/prediction/PrespawnTracker.hpp>
#include <rwd/prediction/Components.hpp>
#include <rwd/core/Log.hpp>
#include <rwd/core/StateHash.hpp>

#include <algorithm>
#include <string>

namespace rwd::prediction {

core::u64 PrespawnTracker::computeHash(engine::Tick spawnTick,
                                       std::span<const ecs::ComponentKind> kinds,
                                       core::u64 salt)
{
    core::StateHash hash;
    hash.combine(spawnTick.value());
    for (const ecs::ComponentKind kind : kinds)
        hash.combine(kind);
    hash.combine(salt);
    return hash.digest();
}

void PrespawnTracker::track(Entry entry)
{
    const auto it = std::partition_point(_entries.begin(), _entries.end(),
        [&entry](const Entry &e) { return !(entry.spawnTick < e.spawnTick); });
    _entries.insert(it, entry);
}

core::Expected<ecs::EntityId> PrespawnTracker::spawnPrespawned(ecs::World &world,
                                                               engine::Tick spawnTick,
                                                               core::u64 hash)
{
    const ecs::EntityId entity = RWD_TRY(world.spawn());
    world.insert(entity, Predicted{});
    world.insert(entity, PreSpawned{hash, spawnTick});
    track(Entry{spawnTick, hash, entity});
    return entity;
}

core::Expected<ecs::EntityId> PrespawnTracker::spawnDeterministic(ecs::World &world,
                                                                  engine::Tick spawnTick,
                                                                  bool skipDespawn,
                                                                  core::u16 graceTicks)
{
    const ecs::EntityId entity = RWD_TRY(world.spawn());
    world.insert(entity, Predicted{});
    world.insert(entity, DeterministicPredicted{spawnTick, skipDespawn, graceTicks, skipDespawn});
    if (skipDespawn)
        world.insert(entity, DisableRollback{});
    return entity;
}

core::Expected<ecs::EntityId> PrespawnTracker::match(ecs::World &world, core::u64 hash)
{
    std::erase_if(_entries, [&world](const Entry &e) { return !world.isAlive(e.entity); });

    const auto it = std::find_if(_entries.begin(), _entries.end(),
                                 [hash](const Entry &e) { return e.hash == hash; });
    if (it == _entries.end())
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "no pre-spawned entity with hash " + std::to_string(hash));
    }

    const ecs::EntityId entity = it->entity;
    world.remove<PreSpawned>(entity);
    _entries.erase(it);
    core::Log::debug("prediction", "pre-spawned entity " + ecs::toString(entity) + " matched");
    return entity;
}

core::u32 PrespawnTracker::despawnFrom(ecs::World &world, ecs::CommandBuffer &commands,
                                       engine::Tick target, engine::Tick now)
{
    core::u32 despawned = 0;

    const auto first = std::partition_point(_entries.begin(), _entries.end(),
        [target](const Entry &e) { return e.spawnTick < target; });
    for (auto it = first; it != _entries.end(); ++it)
    {
        if (world.isAlive(it->entity))
        {
            commands.despawn(it->entity);
            ++despawned;
        }
    }
    _entries.erase(first, _entries.end());

    world.eachIncludingDisabled<DeterministicPredicted>(
        [&](ecs::EntityId entity, DeterministicPredicted &marker) {
            if (marker.spawnTick < target)
                return;

            if (!marker.skipDespawn)
            {
                commands.despawn(entity);
                ++despawned;
                return;
            }

            const bool inGrace = (now - marker.spawnTick) < static_cast<core::i32>(marker.enableRollbackAfter);
            if (inGrace && !world.has<DisableRollback>(entity))
            {
                marker.graceActive = true;
                commands.insert(entity, DisableRollback{});
            }
        });

    if (despawned > 0)
    {
        core::Log::debug("prediction", std::to_string(despawned)
                                       + " speculative entities despawned before replay from tick "
                                       + engine::toString(target));
    }
    return despawned;
}

void PrespawnTracker::refreshGraceWindows(ecs::World &world, engine::Tick now)
{
    std::vector<ecs::EntityId> expired;
    world.eachIncludingDisabled<DeterministicPredicted>(
        [&](ecs::EntityId entity, DeterministicPredicted &marker) {
            if (!marker.graceActive)
                return;
            if ((now - marker.spawnTick) >= static_cast<core::i32>(marker.enableRollbackAfter))
            {
                marker.graceActive = false;
                expired.push_back(entity);
            }
        });

    for (const ecs::EntityId entity : expired)
        world.remove<DisableRollback>(entity);
}

core::u32 PrespawnTracker::pruneUnmatched(ecs::World &world, engine::Tick now, core::u16 maxAge)
{
    core::u32 pruned = 0;
    std::erase_if(_entries, [&](const Entry &e) {
        if (!world.isAlive(e.entity))
            return true;
        if ((now - e.spawnTick) <= static_cast<core::i32>(maxAge))
            return false;
        if (world.despawn(e.entity))
            ++pruned;
        return true;
    });

    if (pruned > 0)
    {
        core::Log::info("prediction", std::to_string(pruned)
                                      + " pre-spawned entities never matched by the authority, despawned");
    }
    return pruned;
}

void PrespawnTracker::shiftTicks(ecs::World &world, core::i16 delta)
{
    for (auto &entry : _entries)
        entry.spawnTick += delta;

    world.eachIncludingDisabled<PreSpawned>([delta](ecs::EntityId, PreSpawned &marker) {
        marker.spawnTick += delta;
    });
    world.eachIncludingDisabled<DeterministicPredicted>([delta](ecs::EntityId, DeterministicPredicted &marker) {
        marker.spawnTick += delta;
    });
}

} // namespace rwd::prediction
