/**
 * @file ResourceHistory.hpp
 * @brief Tick history of world resources and its rollback operations.
 *
 * A predicted resource (match clock, score, shared random state) is
 * rewound like a component. Its history is itself a world resource,
 * created on the first recorded tick.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_RESOURCEHISTORY_HPP
    #define RWD_PREDICTION_RESOURCEHISTORY_HPP

#include <rwd/prediction/HistoryBuffer.hpp>
#include <rwd/ecs/World.hpp>
#include <rwd/engine/Tick.hpp>
#include <rwd/core/Types.hpp>

#include <optional>

namespace rwd::prediction {

template <typename R>
using ResourceHistory = HistoryBuffer<R>;

namespace ops {

/**
 * @brief Records @p R at @p now, or Removed the first tick it is missing,
 *        then trims the history to @p horizon ticks.
 */
template <typename R>
void recordResource(ecs::World &world, engine::Tick now, core::u16 horizon)
{
    auto *history = world.resource<ResourceHistory<R>>();
    if (!history)
        history = &world.insertResource(ResourceHistory<R>{});

    if (const R *value = world.resource<R>())
    {
        history->record(now, *value);
    }
    else
    {
        const auto *last = history->peek();
        if (!last || last->state.isUpdated())
            history->record(now, std::nullopt);
    }

    history->popUntilTick(now - horizon);
}

/**
 * @brief Puts @p R back to its recorded state at @p restoreTick and drops
 *        the history after it. Left alone when nothing was recorded yet.
 */
template <typename R>
void prepareResource(ecs::World &world, engine::Tick restoreTick)
{
    auto *history = world.resource<ResourceHistory<R>>();
    if (!history)
        return;

    const auto state = history->seekAndClearAfter(restoreTick);
    if (!state)
        return;

    if (state->isUpdated())
        world.insertResource(state->value());
    else
        world.removeResource<R>();
}

template <typename R>
void shiftResource(ecs::World &world, core::i16 delta)
{
    if (auto *history = world.resource<ResourceHistory<R>>())
        history->shiftTicks(delta);
}

} // namespace ops
} // namespace rwd::prediction

#endif // RWD_PREDICTION_RESOURCEHISTORY_HPP
