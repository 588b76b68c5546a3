/**
 * @file RollbackExecutor.cpp
 * @brief RollbackExecutor implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/prediction/RollbackExecutor.hpp>
#include <rwd/prediction/Components.hpp>
#include <rwd/core/Log.hpp>

#include <string>

namespace rwd::prediction {

core::Expected<core::u16> RollbackExecutor::replay(engine::App &app)
{
    const auto target = _coordinator.currentTarget();
    if (!target)
        return core::makeError(core::ErrorCode::kInvalidState, "replay without a latched rollback");

    engine::Timeline  &timeline = app.timeline();
    engine::FixedTime &clock    = app.fixedTime();

    const engine::Tick now   = timeline.tick();
    const core::u16    ticks = _coordinator.replayTicks(now);

    const engine::FixedTime::State saved = clock.save();
    clock.rewind(ticks);
    timeline.setTick(*target - 1);

    hideExempt(app.world());
    _coordinator.setPhase(RollbackPhase::Replaying);

    for (core::u16 i = 0; i < ticks; ++i)
    {
        timeline.advance();
        clock.advance();
        app.runFixedSchedule();
    }

    unhideExempt(app.world());
    clock.restore(saved);

    if (const engine::Tick reached = timeline.tick(); reached != now)
    {
        timeline.setTick(now);
        return core::makeError(core::ErrorCode::kClockDesync,
                               "replay ended at tick " + engine::toString(reached)
                               + " instead of " + engine::toString(now));
    }

    _replayed = ticks;
    core::Log::debug("prediction", "replayed " + std::to_string(ticks) + " ticks from "
                                   + engine::toString(*target));
    return ticks;
}

void RollbackExecutor::endRollback() noexcept
{
    PredictionMetrics::bump(_metrics.rollbacks);
    PredictionMetrics::bump(_metrics.rollbackTicks, _replayed);
    _replayed = 0;
    _coordinator.clear();
}

void RollbackExecutor::hideExempt(ecs::World &world)
{
    _hidden = world.entitiesWith<DisableRollback>();
    for (const ecs::EntityId entity : _hidden)
    {
        world.insert(entity, DisabledDuringRollback{});
        core::reportFailure(world.setDisabled(entity, true), "prediction", core::LogLevel::kWarn);
    }
}

void RollbackExecutor::unhideExempt(ecs::World &world)
{
    for (const ecs::EntityId entity : _hidden)
    {
        if (!world.isAlive(entity))
            continue;
        world.remove<DisabledDuringRollback>(entity);
        core::reportFailure(world.setDisabled(entity, false), "prediction", core::LogLevel::kWarn);
    }
    _hidden.clear();
}

} // namespace rwd::prediction
