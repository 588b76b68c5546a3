/**
 * @file PredictionHistorySystem.hpp
 * @brief Fixed-update system recording predicted component history.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_PREDICTIONHISTORYSYSTEM_HPP
    #define RWD_PREDICTION_PREDICTIONHISTORYSYSTEM_HPP

#include <rwd/prediction/Components.hpp>
#include <rwd/prediction/PredictionRegistry.hpp>
#include <rwd/prediction/RollbackCoordinator.hpp>
#include <rwd/ecs/System.hpp>
#include <rwd/ecs/World.hpp>
#include <rwd/engine/Timeline.hpp>

#include <array>

namespace rwd::prediction {

/**
 * @class PredictionHistorySystem
 * @brief Records every registered kind and resource at the end of each
 *        fixed tick.
 *
 * Runs in the History phase, after gameplay, both in forward simulation
 * and during replay. While a state rollback replays a tick the server
 * confirmed, the confirmed values are snapped in before recording.
 */
class PredictionHistorySystem final : public ecs::ISystem
{
public:
    PredictionHistorySystem(ecs::World &world, const engine::Timeline &timeline, const PredictionRegistry &registry,
                            const RollbackCoordinator &coordinator, core::u16 horizon) noexcept
        : _world{world}, _timeline{timeline}, _registry{registry}, _coordinator{coordinator}, _horizon{horizon}
    {}

    [[nodiscard]] const ecs::SystemDescriptor &descriptor() const noexcept override { return _descriptor; }

    void execute(core::f32) override
    {
        const engine::Tick now  = _timeline.tick();
        const bool         snap = _coordinator.isReplaying() && _coordinator.cause() == RollbackCause::State;

        for (const ComponentHooks &hooks : _registry.hooks())
        {
            if (snap)
                hooks.snap(_world, now);
            hooks.record(_world, now, _horizon);
        }
        for (const ResourceHooks &hooks : _registry.resourceHooks())
            hooks.record(_world, now, _horizon);
    }

private:
    ecs::World                &_world;
    const engine::Timeline    &_timeline;
    const PredictionRegistry  &_registry;
    const RollbackCoordinator &_coordinator;
    core::u16                  _horizon;

    std::array<ecs::ComponentAccess, 1> _accesses{ecs::writes<Predicted>()};
    ecs::SystemDescriptor _descriptor{"prediction::history", ecs::SchedulePhase::History, _accesses};
};

} // namespace rwd::prediction

#endif // RWD_PREDICTION_PREDICTIONHISTORYSYSTEM_HPP
