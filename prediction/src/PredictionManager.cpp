/**
 * @file PredictionManager.cpp
 * @brief PredictionManager implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/prediction/PredictionManager.hpp>
#include <rwd/prediction/PredictionDespawn.hpp>
#include <rwd/prediction/PredictionHistorySystem.hpp>
#include <rwd/core/Log.hpp>

#include <memory>
#include <string>

namespace rwd::prediction {

PredictionManager::PredictionManager(PredictionConfig config)
    : _config{config}
    , _detector{_config, _registry, _coordinator, _inputs, _prespawn, _metrics}
    , _preparer{_config, _registry, _coordinator}
    , _executor{_coordinator, _metrics}
    , _smoother{_registry}
{}

core::Expected<void> PredictionManager::install(engine::App &app)
{
    if (_installed)
        return core::makeError(core::ErrorCode::kAlreadyExists, "prediction already installed");

    RWD_TRY_VOID(app.addSystem(std::make_unique<PredictionHistorySystem>(
        app.world(), app.timeline(), _registry, _coordinator, _config.historyHorizon())));

    using engine::Stage;
    app.addHook(Stage::PreUpdate,  "prediction::restore",  [this](engine::App &a) { restoreCorrections(a); });
    app.addHook(Stage::PreUpdate,  "prediction::maintain", [this](engine::App &a) { maintain(a); });
    app.addHook(Stage::PreUpdate,  "prediction::check",    [this](engine::App &a) { checkRollback(a); });
    app.addHook(Stage::PreUpdate,  "prediction::prepare",  [this](engine::App &a) { prepareRollback(a); });
    app.addHook(Stage::PreUpdate,  "prediction::replay",   [this](engine::App &a) { replayRollback(a); });
    app.addHook(Stage::PreUpdate,  "prediction::end",      [this](engine::App &a) { endRollback(a); });
    app.addHook(Stage::PostUpdate, "prediction::smooth",   [this](engine::App &a) { smoothCorrections(a); });

    _installed = true;
    core::Log::info("prediction", "installed with " + std::to_string(_registry.size())
                                  + " predicted kinds, state rollback "
                                  + std::string{toString(_config.stateRollback())} + ", input rollback "
                                  + std::string{toString(_config.inputRollback())});
    return {};
}

void PredictionManager::onTickSnap(engine::App &app, core::i16 delta)
{
    app.timeline().applyDelta(delta);
    for (const ComponentHooks &hooks : _registry.hooks())
        hooks.shiftTicks(app.world(), delta);
    for (const ResourceHooks &hooks : _registry.resourceHooks())
        hooks.shiftTicks(app.world(), delta);
    _prespawn.shiftTicks(app.world(), delta);
    shiftDespawnTicks(app.world(), delta);
    core::Log::info("prediction", "timeline snapped by " + std::to_string(delta) + " ticks to "
                                  + engine::toString(app.timeline().tick()));
}

core::Expected<ecs::EntityId> PredictionManager::spawnDeterministic(ecs::World &world, engine::Tick spawnTick,
                                                                    bool skipDespawn)
{
    return _prespawn.spawnDeterministic(world, spawnTick, skipDespawn, _config.deterministicGraceTicks());
}

core::Expected<void> PredictionManager::despawnPredicted(engine::App &app, ecs::EntityId entity)
{
    return predictionDespawn(app.world(), entity, app.timeline().tick());
}

void PredictionManager::restoreCorrections(engine::App &app)
{
    _smoother.restore(app.world());
}

void PredictionManager::maintain(engine::App &app)
{
    const engine::Tick now = app.timeline().tick();
    _prespawn.refreshGraceWindows(app.world(), now);
    _prespawn.pruneUnmatched(app.world(), now, _config.prespawnMaxAgeTicks());
    purgeDespawned(app.world(), now, _config.maxRollbackTicks());
}

void PredictionManager::checkRollback(engine::App &app)
{
    if (_coordinator.phase() != RollbackPhase::Idle)
        return;
    _detector.run(app.world(), app.timeline().tick(), &app.threadPool());
}

void PredictionManager::prepareRollback(engine::App &app)
{
    if (!_coordinator.isRollingBack())
        return;
    if (!core::reportFailure(_preparer.prepare(app.world(), app.timeline().tick()), "prediction"))
        _coordinator.clear();
}

void PredictionManager::replayRollback(engine::App &app)
{
    if (!_coordinator.isRollingBack())
        return;
    core::reportFailure(_executor.replay(app), "prediction");
}

void PredictionManager::endRollback(engine::App &)
{
    if (_coordinator.isRollingBack())
        _executor.endRollback();
}

void PredictionManager::smoothCorrections(engine::App &app)
{
    _smoother.smooth(app.world(), app.timeline().tick(),
                     static_cast<core::f32>(app.fixedTime().overstepFraction()));
}

} // namespace rwd::prediction
