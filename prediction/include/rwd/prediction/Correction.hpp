/**
 * @file Correction.hpp
 * @brief Visual blend state between a mispredicted and a corrected value.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_CORRECTION_HPP
    #define RWD_PREDICTION_CORRECTION_HPP

#include <rwd/engine/Tick.hpp>
#include <rwd/core/Types.hpp>

#include <algorithm>
#include <optional>

namespace rwd::prediction {

/**
 * @brief Transient component living on a predicted entity while its
 *        component @p C is being visually smoothed after a rollback.
 *
 * Invariant: finalCorrectionTick > originalTick.
 */
template <typename C>
struct Correction
{
    C                originalPrediction;
    engine::Tick     originalTick{};
    engine::Tick     finalCorrectionTick{};
    std::optional<C> currentVisual{};
    std::optional<C> currentCorrection{};
};

/** @brief Quadratic ease-out on [0, 1]. */
[[nodiscard]] constexpr core::f32 easeOutQuad(core::f32 t) noexcept
{
    return 1.0f - (1.0f - t) * (1.0f - t);
}

/**
 * @brief Linear progress of a correction window, clamped to [0, 1].
 * @param now              Current tick.
 * @param overstepFraction Fraction of the next tick already elapsed.
 */
[[nodiscard]] inline core::f32 correctionProgress(engine::Tick originalTick,
                                                  engine::Tick finalTick,
                                                  engine::Tick now,
                                                  core::f32 overstepFraction) noexcept
{
    const auto span = static_cast<core::f32>(finalTick - originalTick);
    if (span <= 0.0f)
        return 1.0f;
    const core::f32 elapsed = static_cast<core::f32>(now - originalTick) + overstepFraction;
    return std::clamp(elapsed / span, 0.0f, 1.0f);
}

} // namespace rwd::prediction

#endif // RWD_PREDICTION_CORRECTION_HPP
