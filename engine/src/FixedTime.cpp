/**
 * @file FixedTime.cpp
 * @brief FixedTime implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/engine/FixedTime.hpp>
#include <rwd/core/Assert.hpp>

namespace rwd::engine {

FixedTime::FixedTime(core::f64 timestep)
    : _state{timestep, 0.0, 0.0}
{
    RWD_ASSERT(timestep > 0.0);
}

core::f64 FixedTime::overstepFraction() const noexcept
{
    return _state.overstep / _state.timestep;
}

void FixedTime::accumulate(core::f64 delta) noexcept
{
    _state.overstep += delta;
}

bool FixedTime::expend() noexcept
{
    if (_state.overstep < _state.timestep)
        return false;
    _state.overstep -= _state.timestep;
    _state.elapsed  += _state.timestep;
    return true;
}

void FixedTime::advance() noexcept
{
    _state.elapsed += _state.timestep;
}

void FixedTime::rewind(core::u32 steps) noexcept
{
    _state.elapsed -= static_cast<core::f64>(steps) * _state.timestep;
    _state.overstep = 0.0;
}

} // namespace rwd::engine
