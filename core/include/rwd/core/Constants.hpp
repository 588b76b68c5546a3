/**
 * @file Constants.hpp
 * @brief Engine-wide compile-time constants.
 *
 * Default values for the simulation clock, the entity space, and the
 * prediction / rollback policy.  Runtime overrides go through
 * engine::Config and prediction::PredictionConfig.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_CORE_CONSTANTS_HPP
    #define RWD_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace rwd::core {

inline constexpr u32   kTickRate                   = 64;
inline constexpr f64   kFixedDeltaTime             = 1.0 / static_cast<f64>(kTickRate);
inline constexpr f64   kMaxFrameTime               = 0.25;

inline constexpr u32   kMaxEntities                = 16'384;
inline constexpr u32   kGenerationBits             = 18;
inline constexpr u32   kSlotBits                   = 14;

inline constexpr u16   kMaxRollbackTicks           = 100;
inline constexpr u16   kTickOrderingHorizon        = 32'768;
inline constexpr f32   kCorrectionTicksFactor      = 1.0f;
inline constexpr u16   kDeterministicGraceTicks    = 20;
inline constexpr u16   kPrespawnMaxAgeTicks        = 64;
inline constexpr u32   kParallelDetectionThreshold = 64;

/// Padding for atomics written by pool workers.
inline constexpr usize kCacheLineSize              = 64;

} // namespace rwd::core

#endif // RWD_CORE_CONSTANTS_HPP
