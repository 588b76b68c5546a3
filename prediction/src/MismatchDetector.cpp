/**
 * @file MismatchDetector.cpp
 * @brief MismatchDetector implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/prediction/MismatchDetector.hpp>
#include <rwd/prediction/Components.hpp>
#include <rwd/ecs/CommandBuffer.hpp>
#include <rwd/core/Log.hpp>

#include <string>

namespace rwd::prediction {

namespace {

constexpr core::usize kDetectionChunk = 16;

} // namespace

MismatchDetector::MismatchDetector(const PredictionConfig &config, const PredictionRegistry &registry,
                                   RollbackCoordinator &coordinator, InputMismatchTracker &inputs,
                                   PrespawnTracker &prespawn, PredictionMetrics &metrics) noexcept
    : _config{config}
    , _registry{registry}
    , _coordinator{coordinator}
    , _inputs{inputs}
    , _prespawn{prespawn}
    , _metrics{metrics}
{}

bool MismatchDetector::run(ecs::World &world, engine::Tick now, concurrency::ThreadPool *pool)
{
    _coordinator.setPhase(RollbackPhase::Checking);

    collect(world, now);
    if (_config.stateRollback() != RollbackMode::Disabled)
        checkState(world, pool);
    _candidates.clear();

    checkInput(now);

    if (!_coordinator.isRollingBack())
    {
        _coordinator.setPhase(RollbackPhase::Idle);
        return false;
    }

    auto span = _coordinator.validate(now, _config.maxRollbackTicks());
    if (!span)
    {
        PredictionMetrics::bump(_metrics.abortedRollbacks);
        return false;
    }

    const engine::Tick  target = *_coordinator.currentTarget();
    const RollbackCause cause  = _coordinator.cause();
    core::Log::info("prediction", "rollback (" + std::string{toString(cause)} + ") to tick "
                                  + engine::toString(target) + ", replaying " + std::to_string(*span)
                                  + " ticks");

    ecs::CommandBuffer commands;
    const core::u32 despawned = _prespawn.despawnFrom(world, commands, target, now);
    commands.apply(world);
    PredictionMetrics::bump(_metrics.prespawnDespawns, despawned);

    _coordinator.setPhase(RollbackPhase::Preparing);
    return true;
}

void MismatchDetector::collect(ecs::World &world, engine::Tick now)
{
    _candidates.clear();

    for (const ecs::EntityId mirror : world.entitiesWith<Confirmed>(true))
    {
        auto *confirmed = world.get<Confirmed>(mirror);
        if (!confirmed->changed)
            continue;

        if (now < confirmed->tick)
        {
            // Kept flagged: compared once the local timeline reaches it.
            PredictionMetrics::bump(_metrics.futureConfirmedTicks);
            core::Log::warn("prediction", "confirmed tick " + engine::toString(confirmed->tick)
                                          + " is ahead of local tick " + engine::toString(now)
                                          + ", check postponed");
            continue;
        }

        confirmed->changed = false;

        const ecs::EntityId predicted = confirmed->predictedEntity;
        const auto *link = world.get<Predicted>(predicted);
        if (!link || link->confirmedEntity != mirror)
        {
            core::Log::debug("prediction", "mirror " + ecs::toString(mirror) + " has no predicted entity");
            continue;
        }
        if (world.isDisabled(predicted))
            continue;

        _candidates.push_back(Candidate{predicted, mirror, confirmed->tick});
    }
}

void MismatchDetector::checkState(ecs::World &world, concurrency::ThreadPool *pool)
{
    if (_config.stateRollback() == RollbackMode::Always)
    {
        for (const Candidate &candidate : _candidates)
        {
            if (world.has<DisableRollback>(candidate.predicted))
                continue;
            if (_coordinator.setRollback(candidate.tick + 1, RollbackCause::State))
                PredictionMetrics::bump(_metrics.stateMismatches);
        }
        return;
    }

    const bool parallel = _config.parallelDetection() && pool != nullptr
                       && _candidates.size() >= _config.parallelThreshold();
    if (!parallel)
    {
        for (const Candidate &candidate : _candidates)
            checkCandidate(world, candidate);
        return;
    }

    pool->parallelFor(_candidates.size(), kDetectionChunk, [this, &world](core::usize begin, core::usize end) {
        for (core::usize i = begin; i < end; ++i)
            checkCandidate(world, _candidates[i]);
    });
}

void MismatchDetector::checkCandidate(ecs::World &world, const Candidate &candidate)
{
    const engine::Tick target = candidate.tick + 1;

    // A latched target at or before ours already covers this entity.
    if (const auto latched = _coordinator.currentTarget(); latched && !(target < *latched))
        return;

    if (world.has<DisableRollback>(candidate.predicted))
        return;

    for (const ComponentHooks &hooks : _registry.hooks())
    {
        if (!hooks.comparable || !hooks.check(world, candidate.predicted, candidate.mirror, candidate.tick))
            continue;

        PredictionMetrics::bump(_metrics.stateMismatches);
        core::Log::debug("prediction", hooks.name + " mismatch on " + ecs::toString(candidate.predicted)
                                       + " at confirmed tick " + engine::toString(candidate.tick));
        _coordinator.setRollback(target, RollbackCause::State);
        break;
    }
}

void MismatchDetector::checkInput(engine::Tick now)
{
    const InputMismatchTracker::Signals signals = _inputs.take();

    if (_coordinator.isRollingBack())
        return;

    std::optional<engine::Tick> tick;
    switch (_config.inputRollback())
    {
    case RollbackMode::Always:   tick = signals.earliestRemoteInput; break;
    case RollbackMode::Check:    tick = signals.earliestMismatch; break;
    case RollbackMode::Disabled: return;
    }

    // Inputs for ticks not yet simulated are simply used when reached.
    if (!tick || now < *tick)
        return;

    PredictionMetrics::bump(_metrics.inputMismatches);
    _coordinator.setRollback(*tick, RollbackCause::Input);
}

} // namespace rwd::prediction
