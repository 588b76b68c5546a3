/**
 * @file PredictionConfig.cpp
 * @brief PredictionConfig::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/prediction/PredictionConfig.hpp>

#include <string>

namespace rwd::prediction {

std::string_view toString(RollbackMode mode) noexcept
{
    switch (mode)
    {
    case RollbackMode::Always:   return "Always";
    case RollbackMode::Check:    return "Check";
    case RollbackMode::Disabled: return "Disabled";
    }
    return "Unknown";
}

PredictionConfig::Builder& PredictionConfig::Builder::maxRollbackTicks(core::u16 ticks) noexcept
{
    _maxRollbackTicks = ticks;
    return *this;
}

PredictionConfig::Builder& PredictionConfig::Builder::correctionTicksFactor(core::f32 factor) noexcept
{
    _correctionTicksFactor = factor;
    return *this;
}

PredictionConfig::Builder& PredictionConfig::Builder::stateRollback(RollbackMode mode) noexcept
{
    _stateRollback = mode;
    return *this;
}

PredictionConfig::Builder& PredictionConfig::Builder::inputRollback(RollbackMode mode) noexcept
{
    _inputRollback = mode;
    return *this;
}

PredictionConfig::Builder& PredictionConfig::Builder::deterministicGraceTicks(core::u16 ticks) noexcept
{
    _deterministicGraceTicks = ticks;
    return *this;
}

PredictionConfig::Builder& PredictionConfig::Builder::prespawnMaxAgeTicks(core::u16 ticks) noexcept
{
    _prespawnMaxAgeTicks = ticks;
    return *this;
}

PredictionConfig::Builder& PredictionConfig::Builder::parallelDetection(bool enabled) noexcept
{
    _parallelDetection = enabled;
    return *this;
}

PredictionConfig::Builder& PredictionConfig::Builder::parallelThreshold(core::u32 entities) noexcept
{
    _parallelThreshold = entities;
    return *this;
}

core::Expected<PredictionConfig> PredictionConfig::Builder::build() const
{
    if (_maxRollbackTicks == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "maxRollbackTicks must be > 0");
    }
    if (_maxRollbackTicks >= core::kTickOrderingHorizon)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "maxRollbackTicks must stay below "
                               + std::to_string(core::kTickOrderingHorizon));
    }
    if (!(_correctionTicksFactor >= 0.0f))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "correctionTicksFactor must be >= 0");
    }

    PredictionConfig cfg;
    cfg._maxRollbackTicks        = _maxRollbackTicks;
    cfg._correctionTicksFactor   = _correctionTicksFactor;
    cfg._stateRollback           = _stateRollback;
    cfg._inputRollback           = _inputRollback;
    cfg._deterministicGraceTicks = _deterministicGraceTicks;
    cfg._prespawnMaxAgeTicks     = _prespawnMaxAgeTicks;
    cfg._parallelDetection       = _parallelDetection;
    cfg._parallelThreshold       = _parallelThreshold;
    return cfg;
}

} // namespace rwd::prediction
