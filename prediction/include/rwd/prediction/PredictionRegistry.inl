/**
 * @file PredictionRegistry.inl
 * @brief Binding of the per-component operations into ComponentHooks.
 * @see   PredictionRegistry.hpp
 */

#ifndef RWD_PREDICTION_PREDICTIONREGISTRY_INL
    #define RWD_PREDICTION_PREDICTIONREGISTRY_INL

#include <rwd/prediction/ComponentOps.hpp>
#include <rwd/prediction/ResourceHistory.hpp>
#include <rwd/core/Log.hpp>

namespace rwd::prediction {

template <core::ComponentType C>
core::Expected<void> PredictionRegistry::registerComponent(std::string name,
                                                           ComponentOptions<C> options)
{
    const ecs::ComponentKind kind = ecs::componentKind<C>();
    if (find(kind))
    {
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               "component '" + name + "' already registered for prediction");
    }

    ComponentHooks hooks;
    hooks.kind       = kind;
    hooks.name       = name;
    hooks.comparable = static_cast<bool>(options.shouldRollback);
    hooks.smoothed   = static_cast<bool>(options.blend);

    hooks.check = [options](const ecs::World &world, ecs::EntityId predicted, ecs::EntityId mirror,
                            engine::Tick confirmedTick) {
        return ops::checkComponent<C>(world, predicted, mirror, confirmedTick, options);
    };
    hooks.prepare = [options](ecs::World &world, const PrepareContext &ctx) {
        ops::prepareComponent<C>(world, ctx, options);
    };
    hooks.snap = [](ecs::World &world, engine::Tick now) {
        ops::snapComponent<C>(world, now);
    };
    hooks.record = [](ecs::World &world, engine::Tick now, core::u16 horizon) {
        ops::recordComponent<C>(world, now, horizon);
    };
    hooks.smooth = [options](ecs::World &world, const SmoothContext &ctx) {
        ops::smoothComponent<C>(world, ctx, options);
    };
    hooks.restore = [](ecs::World &world) {
        ops::restoreComponent<C>(world);
    };
    hooks.shiftTicks = [](ecs::World &world, core::i16 delta) {
        ops::shiftComponent<C>(world, delta);
    };

    _hooks.push_back(std::move(hooks));
    core::Log::debug("prediction", "registered component '" + name + "'");
    return {};
}

template <core::ComponentType R>
core::Expected<void> PredictionRegistry::registerResource(std::string name)
{
    const ecs::ComponentKind kind = ecs::componentKind<R>();
    for (const ResourceHooks &existing : _resources)
    {
        if (existing.kind == kind)
            return core::makeError(core::ErrorCode::kAlreadyExists,
                                   "resource '" + name + "' already registered for rollback");
    }

    ResourceHooks hooks;
    hooks.kind    = kind;
    hooks.name    = name;
    hooks.record  = [](ecs::World &world, engine::Tick now, core::u16 horizon) {
        ops::recordResource<R>(world, now, horizon);
    };
    hooks.prepare = [](ecs::World &world, engine::Tick restoreTick) {
        ops::prepareResource<R>(world, restoreTick);
    };
    hooks.shiftTicks = [](ecs::World &world, core::i16 delta) {
        ops::shiftResource<R>(world, delta);
    };

    _resources.push_back(std::move(hooks));
    core::Log::debug("prediction", "registered resource '" + name + "'");
    return {};
}

} // namespace rwd::prediction

#endif // RWD_PREDICTION_PREDICTIONREGISTRY_INL
