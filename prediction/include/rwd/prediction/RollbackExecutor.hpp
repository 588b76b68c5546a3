/**
 * @file RollbackExecutor.hpp
 * @brief Re-runs the fixed schedule from the rollback target to now.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_ROLLBACKEXECUTOR_HPP
    #define RWD_PREDICTION_ROLLBACKEXECUTOR_HPP

#include <rwd/prediction/PredictionMetrics.hpp>
#include <rwd/prediction/RollbackCoordinator.hpp>
#include <rwd/engine/App.hpp>
#include <rwd/core/Expected.hpp>
#include <rwd/core/Pinned.hpp>
#include <rwd/core/Types.hpp>

#include <vector>

namespace rwd::prediction {

/**
 * @class RollbackExecutor
 * @brief Replays ticks `target ..= now` through App::runFixedSchedule.
 *
 * The fixed clock is rewound for the replay and restored afterwards, so
 * the frame's real overstep is untouched. Rollback-exempt entities are
 * disabled for the duration of the replay.
 */
class RollbackExecutor final : public core::Pinned
{
public:
    RollbackExecutor(RollbackCoordinator &coordinator, PredictionMetrics &metrics) noexcept
        : _coordinator{coordinator}, _metrics{metrics}
    {}

    /**
     * @brief Replays the latched rollback.
     * @return Number of ticks replayed, or kInvalidState when idle.
     */
    [[nodiscard]] core::Expected<core::u16> replay(engine::App &app);

    /** @brief Closes the rollback: coordinator idle, metrics updated. */
    void endRollback() noexcept;

private:
    void hideExempt(ecs::World &world);
    void unhideExempt(ecs::World &world);

    RollbackCoordinator       &_coordinator;
    PredictionMetrics         &_metrics;
    core::u16                  _replayed{0};
    std::vector<ecs::EntityId> _hidden;
};

} // namespace rwd::prediction

#endif // RWD_PREDICTION_ROLLBACKEXECUTOR_HPP
