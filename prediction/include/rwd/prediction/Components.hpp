/**
 * @file Components.hpp
 * @brief Marker and link components of the prediction engine.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_COMPONENTS_HPP
    #define RWD_PREDICTION_COMPONENTS_HPP

#include <rwd/ecs/Entity.hpp>
#include <rwd/engine/Tick.hpp>
#include <rwd/core/Types.hpp>

namespace rwd::prediction {

/**
 * @brief Marks a locally simulated entity.
 *
 * @c confirmedEntity is the authority mirror, or a null id for purely
 * local entities (pre-spawned, deterministic).  It is a reference, never
 * an ownership edge.
 */
struct Predicted
{
    ecs::EntityId confirmedEntity{};
};

/**
 * @brief Marks an authority mirror.
 *
 * The mirror entity also carries the authoritative value of every
 * replicated component.  @c tick is the tick those values were valid at;
 * @c changed is raised by the replication layer on each update and lowered
 * once the mismatch detector has consumed it.
 */
struct Confirmed
{
    ecs::EntityId predictedEntity{};
    engine::Tick  tick{};
    bool          changed{false};
    bool          received{false}; ///< False until the first update arrives.
};

/**
 * @brief Entity spawned by the client ahead of the authority.
 *
 * The authority's spawn carrying the same @c hash adopts it.
 */
struct PreSpawned
{
    core::u64    hash{0};
    engine::Tick spawnTick{};
};

/**
 * @brief Entity spawned deterministically on both sides, never replicated.
 *
 * With @c skipDespawn, a rollback to before @c spawnTick keeps the entity
 * and only exempts it from the rollback until @c enableRollbackAfter ticks
 * have passed since spawning.
 */
struct DeterministicPredicted
{
    engine::Tick spawnTick{};
    bool         skipDespawn{false};
    core::u16    enableRollbackAfter{0};
    bool         graceActive{false};
};

/** @brief Exempts an entity from rollback resets and hides it during replay. */
struct DisableRollback {};

/** @brief Present on DisableRollback entities while a replay is running. */
struct DisabledDuringRollback {};

/**
 * @brief A predicted entity despawned locally at @c despawnTick.
 *
 * The entity is disabled instead of destroyed so that a rollback to or
 * before that tick can bring it back.
 */
struct PredictionDisable
{
    engine::Tick despawnTick{};
};

} // namespace rwd::prediction

#endif // RWD_PREDICTION_COMPONENTS_HPP
