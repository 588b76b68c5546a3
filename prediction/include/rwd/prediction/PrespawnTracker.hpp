/**
 * @file PrespawnTracker.hpp
 * @brief Bookkeeping of client-spawned entities awaiting the authority.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_PRESPAWNTRACKER_HPP
    #define RWD_PREDICTION_PRESPAWNTRACKER_HPP

#include <rwd/ecs/CommandBuffer.hpp>
#include <rwd/ecs/Component.hpp>
#include <rwd/ecs/World.hpp>
#include <rwd/engine/Tick.hpp>
#include <rwd/core/Expected.hpp>
#include <rwd/core/Pinned.hpp>
#include <rwd/core/Types.hpp>

#include <span>
#include <vector>

namespace rwd::prediction {

/**
 * @class PrespawnTracker
 * @brief Tracks PreSpawned entities by spawn tick and reconciles both
 *        PreSpawned and DeterministicPredicted entities with rollbacks.
 *
 * An entity spawned at or after a rollback target will be spawned again by
 * the replay, so the current copy is despawned before replay.
 */
class PrespawnTracker final : public core::Pinned
{
public:
    PrespawnTracker() = default;

    /**
     * @brief FNV-1a fingerprint of a pre-spawned entity.
     * @param spawnTick Tick the entity is spawned at.
     * @param kinds     Component kinds it is spawned with.
     * @param salt      Caller-chosen discriminator (e.g. spawner id).
     */
    [[nodiscard]] static core::u64 computeHash(engine::Tick spawnTick,
                                               std::span<const ecs::ComponentKind> kinds,
                                               core::u64 salt = 0);

    /**
     * @brief Spawns a Predicted + PreSpawned entity and tracks it.
     * @return The new entity, or the World's spawn error.
     */
    [[nodiscard]] core::Expected<ecs::EntityId> spawnPrespawned(ecs::World &world,
                                                                engine::Tick spawnTick,
                                                                core::u64 hash);

    /**
     * @brief Spawns a Predicted + DeterministicPredicted entity.
     *
     * With @p skipDespawn the entity starts exempt from rollback for
     * @p graceTicks ticks.
     */
    [[nodiscard]] core::Expected<ecs::EntityId> spawnDeterministic(ecs::World &world,
                                                                   engine::Tick spawnTick,
                                                                   bool skipDespawn,
                                                                   core::u16 graceTicks);

    /**
     * @brief Hands over the oldest live pre-spawned entity with @p hash to
     *        the authority: its PreSpawned marker is removed and it stops
     *        being tracked.
     * @return The entity, or kNotFound.
     */
    [[nodiscard]] core::Expected<ecs::EntityId> match(ecs::World &world, core::u64 hash);

    /**
     * @brief Schedules the despawn of every PreSpawned and non-exempt
     *        DeterministicPredicted entity spawned at or after @p target.
     *
     * DeterministicPredicted entities with skipDespawn are kept; inside
     * their grace window they receive DisableRollback instead.
     *
     * @return Number of despawns queued into @p commands.
     */
    core::u32 despawnFrom(ecs::World &world, ecs::CommandBuffer &commands,
                          engine::Tick target, engine::Tick now);

    /** @brief Lifts DisableRollback from entities whose grace window ended. */
    void refreshGraceWindows(ecs::World &world, engine::Tick now);

    /**
     * @brief Despawns pre-spawned entities still unmatched after @p maxAge
     *        ticks.
     * @return Number of entities despawned.
     */
    core::u32 pruneUnmatched(ecs::World &world, engine::Tick now, core::u16 maxAge);

    /** @brief Shifts every tracked and stored spawn tick by @p delta. */
    void shiftTicks(ecs::World &world, core::i16 delta);

    /** @brief Number of pre-spawned entities awaiting a match. */
    [[nodiscard]] core::usize tracked() const noexcept { return _entries.size(); }

private:
    struct Entry
    {
        engine::Tick  spawnTick;
        core::u64     hash;
        ecs::EntityId entity;
    };

    void track(Entry entry);

    std::vector<Entry> _entries; ///< Ordered by spawn tick.
};

} // namespace rwd::prediction

#endif // RWD_PREDICTION_PRESPAWNTRACKER_HPP
