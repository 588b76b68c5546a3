/**
 * @file PredictionRegistry.hpp
 * @brief Type-erased per-component prediction hooks.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_PREDICTIONREGISTRY_HPP
    #define RWD_PREDICTION_PREDICTIONREGISTRY_HPP

#include <rwd/prediction/ComponentOptions.hpp>
#include <rwd/prediction/PredictionContext.hpp>
#include <rwd/ecs/Component.hpp>
#include <rwd/ecs/World.hpp>
#include <rwd/engine/Tick.hpp>
#include <rwd/core/Expected.hpp>
#include <rwd/core/Pinned.hpp>
#include <rwd/core/Types.hpp>

#include <functional>
#include <span>
#include <string>
#include <vector>

namespace rwd::prediction {

/**
 * @brief Hooks bound to one registered component type.
 *
 * @c check compares one predicted entity against its mirror and is only
 * run for @c comparable kinds; every other hook walks all entities
 * holding the component.
 */
struct ComponentHooks
{
    ecs::ComponentKind kind{};
    std::string        name;
    bool               comparable{false};
    bool               smoothed{false};

    std::function<bool(const ecs::World &, ecs::EntityId predicted, ecs::EntityId mirror,
                       engine::Tick confirmedTick)>                          check;
    std::function<void(ecs::World &, const PrepareContext &)>                prepare;
    std::function<void(ecs::World &, engine::Tick now)>                      snap;
    std::function<void(ecs::World &, engine::Tick now, core::u16 horizon)>   record;
    std::function<void(ecs::World &, const SmoothContext &)>                 smooth;
    std::function<void(ecs::World &)>                                        restore;
    std::function<void(ecs::World &, core::i16 delta)>                       shiftTicks;
};

/** @brief Hooks bound to one registered resource type. */
struct ResourceHooks
{
    ecs::ComponentKind kind{};
    std::string        name;

    std::function<void(ecs::World &, engine::Tick now, core::u16 horizon)> record;
    std::function<void(ecs::World &, engine::Tick restoreTick)>            prepare;
    std::function<void(ecs::World &, core::i16 delta)>                     shiftTicks;
};

/**
 * @class PredictionRegistry
 * @brief Startup-populated tables of ComponentHooks and ResourceHooks,
 *        iterated in registration order by the detector, preparer,
 *        smoother and history recorder.
 */
class PredictionRegistry final : public core::Pinned
{
public:
    PredictionRegistry() = default;

    /**
     * @brief Registers component @p C for prediction.
     * @param name    Name used in log messages.
     * @param options Comparator and blend function.
     * @return kAlreadyExists if @p C is already registered.
     */
    template <core::ComponentType C>
    [[nodiscard]] core::Expected<void> registerComponent(std::string name,
                                                         ComponentOptions<C> options = {});

    /**
     * @brief Registers resource @p R for rollback.
     * @return kAlreadyExists if @p R is already registered.
     */
    template <core::ComponentType R>
    [[nodiscard]] core::Expected<void> registerResource(std::string name);

    template <core::ComponentType C>
    [[nodiscard]] bool contains() const noexcept
    {
        return find(ecs::componentKind<C>()) != nullptr;
    }

    [[nodiscard]] const ComponentHooks *find(ecs::ComponentKind kind) const noexcept;

    [[nodiscard]] std::span<const ComponentHooks> hooks() const noexcept { return _hooks; }
    [[nodiscard]] core::usize                     size()  const noexcept { return _hooks.size(); }

    [[nodiscard]] std::span<const ResourceHooks> resourceHooks() const noexcept { return _resources; }

private:
    std::vector<ComponentHooks> _hooks;
    std::vector<ResourceHooks>  _resources;
};

} // namespace rwd::prediction

#include "PredictionRegistry.inl"

#endif // RWD_PREDICTION_PREDICTIONREGISTRY_HPP
