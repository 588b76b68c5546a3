/**
 * @file Config.cpp
 * @brief Config::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/engine/Config.hpp>

namespace rwd::engine {

Config::Builder& Config::Builder::tickRate(core::u32 hz) noexcept
{
    _tickRate = hz;
    return *this;
}

Config::Builder& Config::Builder::workerThreads(core::u32 n) noexcept
{
    _workerThreads = n;
    return *this;
}

Config::Builder& Config::Builder::maxEntities(core::u32 n) noexcept
{
    _maxEntities = n;
    return *this;
}

core::Expected<Config> Config::Builder::build() const
{
    if (_tickRate == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "tickRate must be > 0");
    }
    if (_maxEntities == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "maxEntities must be > 0");
    }

    Config cfg;
    cfg._tickRate      = _tickRate;
    cfg._workerThreads = _workerThreads;
    cfg._maxEntities   = _maxEntities;
    return cfg;
}

} // namespace rwd::engine
