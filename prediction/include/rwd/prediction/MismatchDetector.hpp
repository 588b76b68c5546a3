/**
 * @file MismatchDetector.hpp
 * @brief Decides, once per frame, whether and from where to roll back.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_MISMATCHDETECTOR_HPP
    #define RWD_PREDICTION_MISMATCHDETECTOR_HPP

#include <rwd/prediction/InputMismatchTracker.hpp>
#include <rwd/prediction/PredictionConfig.hpp>
#include <rwd/prediction/PredictionMetrics.hpp>
#include <rwd/prediction/PredictionRegistry.hpp>
#include <rwd/prediction/PrespawnTracker.hpp>
#include <rwd/prediction/RollbackCoordinator.hpp>
#include <rwd/concurrency/ThreadPool.hpp>
#include <rwd/ecs/World.hpp>
#include <rwd/engine/Tick.hpp>
#include <rwd/core/Pinned.hpp>

#include <vector>

namespace rwd::prediction {

/**
 * @class MismatchDetector
 * @brief Compares confirmed mirrors with predicted history and latches the
 *        earliest rollback target on the coordinator.
 *
 * State signals are evaluated first. Input signals are only considered when
 * no state rollback was latched in the same pass. A state mismatch at
 * confirmed tick C targets C + 1; an input mismatch at tick T targets T.
 *
 * Per-entity comparisons may run on a ThreadPool: each task only touches
 * its own predicted entity's history, and the target is reduced with an
 * atomic minimum so the outcome does not depend on scheduling.
 */
class MismatchDetector final : public core::Pinned
{
public:
    MismatchDetector(const PredictionConfig &config, const PredictionRegistry &registry,
                     RollbackCoordinator &coordinator, InputMismatchTracker &inputs,
                     PrespawnTracker &prespawn, PredictionMetrics &metrics) noexcept;

    /**
     * @brief Runs one detection pass at tick @p now.
     *
     * On an accepted rollback the speculative entities spawned at or after
     * the target are despawned before returning.
     *
     * @param pool Optional pool for parallel comparison.
     * @return True when a rollback was latched and validated.
     */
    bool run(ecs::World &world, engine::Tick now, concurrency::ThreadPool *pool = nullptr);

private:
    struct Candidate
    {
        ecs::EntityId predicted;
        ecs::EntityId mirror;
        engine::Tick  tick;
    };

    void collect(ecs::World &world, engine::Tick now);
    void checkState(ecs::World &world, concurrency::ThreadPool *pool);
    void checkCandidate(ecs::World &world, const Candidate &candidate);
    void checkInput(engine::Tick now);

    const PredictionConfig   &_config;
    const PredictionRegistry &_registry;
    RollbackCoordinator      &_coordinator;
    InputMismatchTracker     &_inputs;
    PrespawnTracker          &_prespawn;
    PredictionMetrics        &_metrics;
    std::vector<Candidate>    _candidates;
};

} // namespace rwd::prediction

#endif // RWD_PREDICTION_MISMATCHDETECTOR_HPP
