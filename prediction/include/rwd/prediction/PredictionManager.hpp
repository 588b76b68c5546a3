/**
 * @file PredictionManager.hpp
 * @brief Owns the prediction state and wires it into an App.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_PREDICTIONMANAGER_HPP
    #define RWD_PREDICTION_PREDICTIONMANAGER_HPP

#include <rwd/prediction/CorrectionSmoother.hpp>
#include <rwd/prediction/InputMismatchTracker.hpp>
#include <rwd/prediction/MismatchDetector.hpp>
#include <rwd/prediction/PredictionConfig.hpp>
#include <rwd/prediction/PredictionMetrics.hpp>
#include <rwd/prediction/PredictionRegistry.hpp>
#include <rwd/prediction/PrespawnTracker.hpp>
#include <rwd/prediction/RollbackCoordinator.hpp>
#include <rwd/prediction/RollbackExecutor.hpp>
#include <rwd/prediction/RollbackPreparer.hpp>
#include <rwd/engine/App.hpp>
#include <rwd/core/Expected.hpp>
#include <rwd/core/Pinned.hpp>

#include <string>

namespace rwd::prediction {

/**
 * @class PredictionManager
 * @brief Client-side prediction and rollback for one App.
 *
 * After @ref install, every App::update runs:
 *  - PreUpdate: restore corrections, grace windows, prespawn pruning and
 *    purge of old prediction despawns, mismatch detection (idle only),
 *    prepare, replay, end of rollback;
 *  - fixed ticks, ending with history recording;
 *  - PostUpdate: correction smoothing.
 *
 * The manager must outlive the App it is installed into.
 */
class PredictionManager final : public core::Pinned
{
public:
    explicit PredictionManager(PredictionConfig config = {});

    /** @brief Registers @p C for prediction (see PredictionRegistry). */
    template <core::ComponentType C>
    [[nodiscard]] core::Expected<void> registerComponent(std::string name, ComponentOptions<C> options = {})
    {
        return _registry.registerComponent<C>(std::move(name), std::move(options));
    }

    /** @brief Registers resource @p R for rollback (see ResourceHistory). */
    template <core::ComponentType R>
    [[nodiscard]] core::Expected<void> registerResource(std::string name)
    {
        return _registry.registerResource<R>(std::move(name));
    }

    /**
     * @brief Adds the history system and the frame hooks to @p app.
     * @return kAlreadyExists on a second call, or the scheduler's error.
     */
    [[nodiscard]] core::Expected<void> install(engine::App &app);

    /**
     * @brief Moves the timeline by @p delta after a clock re-sync and
     *        shifts every stored local tick with it.
     *
     * Confirmed ticks are authoritative and stay as received.
     */
    void onTickSnap(engine::App &app, core::i16 delta);

    /**
     * @brief Spawns a DeterministicPredicted entity using the configured
     *        grace window.
     */
    [[nodiscard]] core::Expected<ecs::EntityId> spawnDeterministic(ecs::World &world, engine::Tick spawnTick,
                                                                   bool skipDespawn);

    /**
     * @brief Despawns @p entity at the current tick of @p app, reversibly
     *        for predicted entities (see predictionDespawn).
     */
    [[nodiscard]] core::Expected<void> despawnPredicted(engine::App &app, ecs::EntityId entity);

    /** @brief True while the fixed schedule is re-run for a rollback. */
    [[nodiscard]] bool isReplaying() const noexcept { return _coordinator.isReplaying(); }

    /** @name Frame steps, in hook order */
    ///@{
    void restoreCorrections(engine::App &app);
    void maintain(engine::App &app);
    void checkRollback(engine::App &app);
    void prepareRollback(engine::App &app);
    void replayRollback(engine::App &app);
    void endRollback(engine::App &app);
    void smoothCorrections(engine::App &app);
    ///@}

    [[nodiscard]] const PredictionConfig   &config() const noexcept { return _config; }
    [[nodiscard]] const PredictionRegistry &registry() const noexcept { return _registry; }
    [[nodiscard]] RollbackCoordinator      &coordinator() noexcept { return _coordinator; }
    [[nodiscard]] InputMismatchTracker     &inputs() noexcept { return _inputs; }
    [[nodiscard]] PrespawnTracker          &prespawn() noexcept { return _prespawn; }
    [[nodiscard]] const PredictionMetrics  &metrics() const noexcept { return _metrics; }

private:
    PredictionConfig     _config;
    PredictionRegistry   _registry;
    RollbackCoordinator  _coordinator;
    InputMismatchTracker _inputs;
    PrespawnTracker      _prespawn;
    PredictionMetrics    _metrics;
    MismatchDetector     _detector;
    RollbackPreparer     _preparer;
    RollbackExecutor     _executor;
    CorrectionSmoother   _smoother;
    bool                 _installed{false};
};

} // namespace rwd::prediction

#endif // RWD_PREDICTION_PREDICTIONMANAGER_HPP
