/**
 * @file PredictionConfig.hpp
 * @brief Rollback policy configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_PREDICTIONCONFIG_HPP
    #define RWD_PREDICTION_PREDICTIONCONFIG_HPP

#include <rwd/core/Constants.hpp>
#include <rwd/core/Expected.hpp>
#include <rwd/core/Types.hpp>

#include <string_view>

namespace rwd::prediction {

/**
 * @enum RollbackMode
 * @brief Policy of one mismatch source.
 */
enum class RollbackMode : core::u8
{
    Always   = 0, ///< Roll back on every update signal without comparing.
    Check    = 1, ///< Roll back only when a comparison reports a mismatch.
    Disabled = 2, ///< Never roll back from this source.
};

[[nodiscard]] std::string_view toString(RollbackMode mode) noexcept;

/** @brief Immutable prediction configuration. */
class PredictionConfig
{
public:
    /** @brief Fluent builder for PredictionConfig. */
    class Builder
    {
    public:
        Builder& maxRollbackTicks(core::u16 ticks) noexcept;
        Builder& correctionTicksFactor(core::f32 factor) noexcept;
        Builder& stateRollback(RollbackMode mode) noexcept;
        Builder& inputRollback(RollbackMode mode) noexcept;
        Builder& deterministicGraceTicks(core::u16 ticks) noexcept;
        Builder& prespawnMaxAgeTicks(core::u16 ticks) noexcept;
        Builder& parallelDetection(bool enabled) noexcept;
        Builder& parallelThreshold(core::u32 entities) noexcept;

        /**
         * @brief Validates and produces the configuration.
         * @return kInvalidArgument when the rollback window is zero or past
         *         the tick ordering horizon, or the factor is negative.
         */
        [[nodiscard]] core::Expected<PredictionConfig> build() const;

    private:
        core::u16    _maxRollbackTicks{core::kMaxRollbackTicks};
        core::f32    _correctionTicksFactor{core::kCorrectionTicksFactor};
        RollbackMode _stateRollback{RollbackMode::Check};
        RollbackMode _inputRollback{RollbackMode::Disabled};
        core::u16    _deterministicGraceTicks{core::kDeterministicGraceTicks};
        core::u16    _prespawnMaxAgeTicks{core::kPrespawnMaxAgeTicks};
        bool         _parallelDetection{false};
        core::u32    _parallelThreshold{core::kParallelDetectionThreshold};
    };

    /** @brief Maximum number of ticks a single rollback may replay. */
    [[nodiscard]] core::u16    maxRollbackTicks()        const noexcept { return _maxRollbackTicks; }
    /** @brief Correction window length per replayed tick. */
    [[nodiscard]] core::f32    correctionTicksFactor()   const noexcept { return _correctionTicksFactor; }
    [[nodiscard]] RollbackMode stateRollback()           const noexcept { return _stateRollback; }
    [[nodiscard]] RollbackMode inputRollback()           const noexcept { return _inputRollback; }
    [[nodiscard]] core::u16    deterministicGraceTicks() const noexcept { return _deterministicGraceTicks; }
    [[nodiscard]] core::u16    prespawnMaxAgeTicks()     const noexcept { return _prespawnMaxAgeTicks; }
    [[nodiscard]] bool         parallelDetection()       const noexcept { return _parallelDetection; }
    [[nodiscard]] core::u32    parallelThreshold()       const noexcept { return _parallelThreshold; }

    /** @brief Ticks of history kept behind the current tick. */
    [[nodiscard]] core::u16 historyHorizon() const noexcept
    {
        return static_cast<core::u16>(_maxRollbackTicks + 1);
    }

private:
    friend class Builder;

    core::u16    _maxRollbackTicks{core::kMaxRollbackTicks};
    core::f32    _correctionTicksFactor{core::kCorrectionTicksFactor};
    RollbackMode _stateRollback{RollbackMode::Check};
    RollbackMode _inputRollback{RollbackMode::Disabled};
    core::u16    _deterministicGraceTicks{core::kDeterministicGraceTicks};
    core::u16    _prespawnMaxAgeTicks{core::kPrespawnMaxAgeTicks};
    bool         _parallelDetection{false};
    core::u32    _parallelThreshold{core::kParallelDetectionThreshold};
};

} // namespace rwd::prediction

#endif // RWD_PREDICTION_PREDICTIONCONFIG_HPP
