/**
 * @file RollbackPreparer.hpp
 * @brief Resets predicted components to their state before the target tick.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_ROLLBACKPREPARER_HPP
    #define RWD_PREDICTION_ROLLBACKPREPARER_HPP

#include <rwd/prediction/PredictionConfig.hpp>
#include <rwd/prediction/PredictionRegistry.hpp>
#include <rwd/prediction/RollbackCoordinator.hpp>
#include <rwd/ecs/World.hpp>
#include <rwd/engine/Tick.hpp>
#include <rwd/core/Expected.hpp>
#include <rwd/core/Pinned.hpp>

namespace rwd::prediction {

/**
 * @class RollbackPreparer
 * @brief Puts the world back to the tick before the latched target.
 *
 * Prediction-despawned entities whose despawn will be replayed are
 * revived first. Each predicted entity then takes its mirror's value when
 * a state rollback restores the tick that mirror was confirmed at, and its
 * own history otherwise; DisableRollback entities are not touched.
 * Registered resources are restored from their history. Visual
 * corrections are opened here.
 */
class RollbackPreparer final : public core::Pinned
{
public:
    RollbackPreparer(const PredictionConfig &config, const PredictionRegistry &registry,
                     RollbackCoordinator &coordinator) noexcept
        : _config{config}, _registry{registry}, _coordinator{coordinator}
    {}

    /**
     * @brief Prepares the world for replay.
     * @return The restore tick, or kInvalidState when no rollback is latched.
     */
    [[nodiscard]] core::Expected<engine::Tick> prepare(ecs::World &world, engine::Tick now);

    /** @brief Visual correction window for a rollback restoring @p restoreTick. */
    [[nodiscard]] core::u16 correctionTicks(engine::Tick restoreTick, engine::Tick now) const noexcept;

private:
    const PredictionConfig   &_config;
    const PredictionRegistry &_registry;
    RollbackCoordinator      &_coordinator;
};

} // namespace rwd::prediction

#endif // RWD_PREDICTION_ROLLBACKPREPARER_HPP
