/**
 * @file RollbackPreparer.cpp
 * @brief RollbackPreparer implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/prediction/RollbackPreparer.hpp>
#include <rwd/prediction/PredictionDespawn.hpp>
#include <rwd/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace rwd::prediction {

core::u16 RollbackPreparer::correctionTicks(engine::Tick restoreTick, engine::Tick now) const noexcept
{
    const core::f32 span    = static_cast<core::f32>(std::max<core::i32>(now - restoreTick, 0));
    const core::f32 rounded = std::round(span * _config.correctionTicksFactor());
    return static_cast<core::u16>(std::clamp(rounded, 0.0f,
                                             static_cast<core::f32>(std::numeric_limits<core::u16>::max())));
}

core::Expected<engine::Tick> RollbackPreparer::prepare(ecs::World &world, engine::Tick now)
{
    const auto target = _coordinator.currentTarget();
    if (!target)
        return core::makeError(core::ErrorCode::kInvalidState, "prepare without a latched rollback");

    _coordinator.setPhase(RollbackPhase::Preparing);

    const PrepareContext ctx{
        *target - 1,
        now,
        _coordinator.cause(),
        correctionTicks(*target - 1, now),
    };

    // Revived entities must be enabled before the hooks gather predicted entities.
    const core::u32 revived = reviveDespawned(world, *target);

    for (const ComponentHooks &hooks : _registry.hooks())
        hooks.prepare(world, ctx);
    for (const ResourceHooks &hooks : _registry.resourceHooks())
        hooks.prepare(world, ctx.restoreTick);

    core::Log::debug("prediction", "restored " + std::to_string(_registry.size()) + " kinds and "
                                   + std::to_string(_registry.resourceHooks().size()) + " resources at tick "
                                   + engine::toString(ctx.restoreTick) + " (" + std::to_string(revived)
                                   + " revived), correction over " + std::to_string(ctx.correctionTicks)
                                   + " ticks");
    return ctx.restoreTick;
}

} // namespace rwd::prediction
