/**
 * @file CorrectionSmoother.hpp
 * @brief Frame-level blending of post-rollback corrections.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_CORRECTIONSMOOTHER_HPP
    #define RWD_PREDICTION_CORRECTIONSMOOTHER_HPP

#include <rwd/prediction/PredictionRegistry.hpp>
#include <rwd/ecs/World.hpp>
#include <rwd/engine/Tick.hpp>
#include <rwd/core/Pinned.hpp>
#include <rwd/core/Types.hpp>

namespace rwd::prediction {

/**
 * @class CorrectionSmoother
 * @brief Shows blended values between frames and puts the simulated values
 *        back before the next simulation step.
 *
 * @ref smooth runs after the fixed ticks of a frame, @ref restore at the
 * start of the following one. Simulation never observes a blended value.
 */
class CorrectionSmoother final : public core::Pinned
{
public:
    explicit CorrectionSmoother(const PredictionRegistry &registry) noexcept : _registry{registry} {}

    /** @brief Writes every pending correction's simulated value back. */
    void restore(ecs::World &world) const;

    /**
     * @brief Advances every correction and displays the blend.
     * @param overstepFraction Fraction of the next tick already elapsed.
     */
    void smooth(ecs::World &world, engine::Tick now, core::f32 overstepFraction) const;

private:
    const PredictionRegistry &_registry;
};

} // namespace rwd::prediction

#endif // RWD_PREDICTION_CORRECTIONSMOOTHER_HPP
