/**
 * @file PredictionDespawn.hpp
 * @brief Reversible despawn of predicted entities.
 *
 * Gameplay despawning a predicted entity (a projectile hitting a wall, a
 * pickup being collected) may be wrong: the server can disagree, and a
 * rollback to before the despawn must replay it with the entity present.
 * predictionDespawn() therefore only marks and disables the entity. The
 * marker is lifted again when a rollback replays the despawn tick, and
 * the entity is destroyed for good once no rollback can reach that tick.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_PREDICTIONDESPAWN_HPP
    #define RWD_PREDICTION_PREDICTIONDESPAWN_HPP

#include <rwd/ecs/World.hpp>
#include <rwd/engine/Tick.hpp>
#include <rwd/core/Expected.hpp>
#include <rwd/core/Types.hpp>

namespace rwd::prediction {

/**
 * @brief Despawns @p entity as seen by prediction at tick @p now.
 *
 * Predicted, PreSpawned and DeterministicPredicted entities are disabled
 * and tagged PredictionDisable; any other entity is despawned outright.
 * Calling it again on an already disabled entity keeps the first tick.
 *
 * @return kNotFound if @p entity is dead.
 */
[[nodiscard]] core::Expected<void> predictionDespawn(ecs::World &world, ecs::EntityId entity, engine::Tick now);

/**
 * @brief Re-enables every prediction-despawned entity whose despawn tick
 *        will be replayed by a rollback starting at @p target.
 *
 * Entities exempt from rollback keep their despawn.
 * @return Number of revived entities.
 */
core::u32 reviveDespawned(ecs::World &world, engine::Tick target);

/**
 * @brief Destroys prediction-despawned entities whose despawn tick is
 *        more than @p window ticks behind @p now.
 * @return Number of destroyed entities.
 */
core::u32 purgeDespawned(ecs::World &world, engine::Tick now, core::u16 window);

/** @brief Shifts stored despawn ticks after a timeline re-sync. */
void shiftDespawnTicks(ecs::World &world, core::i16 delta);

} // namespace rwd::prediction

#endif // RWD_PREDICTION_PREDICTIONDESPAWN_HPP
