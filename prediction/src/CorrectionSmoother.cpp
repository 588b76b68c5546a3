/**
 * @file CorrectionSmoother.cpp
 * @brief CorrectionSmoother implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/prediction/CorrectionSmoother.hpp>

namespace rwd::prediction {

void CorrectionSmoother::restore(ecs::World &world) const
{
    for (const ComponentHooks &hooks : _registry.hooks())
    {
        if (hooks.smoothed)
            hooks.restore(world);
    }
}

void CorrectionSmoother::smooth(ecs::World &world, engine::Tick now, core::f32 overstepFraction) const
{
    const SmoothContext ctx{now, overstepFraction};
    for (const ComponentHooks &hooks : _registry.hooks())
    {
        if (hooks.smoothed)
            hooks.smooth(world, ctx);
    }
}

} // namespace rwd::prediction
