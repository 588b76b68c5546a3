/**
 * @file PredictionContext.hpp
 * @brief Per-pass inputs handed to the per-component operations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_PREDICTIONCONTEXT_HPP
    #define RWD_PREDICTION_PREDICTIONCONTEXT_HPP

#include <rwd/prediction/RollbackCoordinator.hpp>
#include <rwd/engine/Tick.hpp>
#include <rwd/core/Types.hpp>

namespace rwd::prediction {

/** @brief Inputs of the per-component prepare step. */
struct PrepareContext
{
    engine::Tick  restoreTick;     ///< Tick whose state is restored (target - 1).
    engine::Tick  now;             ///< Current tick.
    RollbackCause cause;
    core::u16     correctionTicks; ///< Visual correction window, 0 to snap.
};

/** @brief Inputs of the per-component smoothing step. */
struct SmoothContext
{
    engine::Tick now;
    core::f32    overstepFraction;
};

} // namespace rwd::prediction

#endif // RWD_PREDICTION_PREDICTIONCONTEXT_HPP
