/**
 * @file ComponentOps.hpp
 * @brief Per-component prediction operations, instantiated once per
 *        registered component type by PredictionRegistry.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_COMPONENTOPS_HPP
    #define RWD_PREDICTION_COMPONENTOPS_HPP

#include <rwd/prediction/Components.hpp>
#include <rwd/prediction/ComponentOptions.hpp>
#include <rwd/prediction/Correction.hpp>
#include <rwd/prediction/HistoryBuffer.hpp>
#include <rwd/prediction/PredictionContext.hpp>
#include <rwd/ecs/World.hpp>
#include <rwd/engine/Tick.hpp>

#include <optional>
#include <vector>

namespace rwd::prediction {

namespace ops {

/**
 * @brief Value of @p C carried by the mirror of @p predicted when that
 *        mirror was confirmed exactly at @p tick.
 *
 * Empty when there is no live mirror or it was confirmed at another tick.
 * The inner optional is empty when the server state lacks @p C.
 */
template <typename C>
std::optional<std::optional<C>> confirmedAt(const ecs::World &world, ecs::EntityId predicted, engine::Tick tick)
{
    const auto *link = world.get<Predicted>(predicted);
    if (!link || !world.isAlive(link->confirmedEntity))
        return std::nullopt;

    const auto *confirmed = world.get<Confirmed>(link->confirmedEntity);
    if (!confirmed || !confirmed->received || confirmed->tick != tick)
        return std::nullopt;

    std::optional<std::optional<C>> out{std::in_place};
    if (const C *value = world.get<C>(link->confirmedEntity))
        *out = *value;
    return out;
}

/**
 * @brief Compares the predicted history of @p C at @p confirmedTick with
 *        the mirror's value. Read-only, so chunks of candidates can be
 *        checked from several workers.
 *
 * | confirmed | history        | mismatch                        |
 * |-----------|----------------|---------------------------------|
 * | absent    | none           | no                              |
 * | absent    | Updated        | yes                             |
 * | absent    | Removed        | no                              |
 * | present   | none           | yes                             |
 * | present   | Updated(v)     | shouldRollback(v, confirmed)    |
 * | present   | Removed        | yes                             |
 */
template <typename C>
bool checkComponent(const ecs::World &world, ecs::EntityId predicted, ecs::EntityId mirror,
                    engine::Tick confirmedTick, const ComponentOptions<C> &options)
{
    if (!options.shouldRollback)
        return false;

    std::optional<HistoryState<C>> past;
    if (const auto *history = world.get<HistoryBuffer<C>>(predicted))
        past = history->stateAt(confirmedTick);

    const C *confirmed = world.get<C>(mirror);
    if (!confirmed)
        return past.has_value() && past->isUpdated();
    if (!past || past->isRemoved())
        return true;
    return options.shouldRollback(past->value(), *confirmed);
}

/**
 * @brief Puts @p C on every predicted entity back to its state at the
 *        restore tick and opens or extends a visual correction.
 *
 * The restored state is the mirror's when a state rollback restores the
 * very tick that mirror was confirmed at, and the entity's own history
 * otherwise. Entities without any record at or before the restore tick
 * did not exist yet and are left as they are, as are DisableRollback
 * entities.
 */
template <typename C>
void prepareComponent(ecs::World &world, const PrepareContext &ctx, const ComponentOptions<C> &options)
{
    for (const ecs::EntityId entity : world.entitiesWith<Predicted>())
    {
        if (world.has<DisableRollback>(entity))
            continue;

        auto *history = world.get<HistoryBuffer<C>>(entity);

        std::optional<HistoryState<C>> restored;
        if (ctx.cause == RollbackCause::State)
        {
            if (auto confirmed = confirmedAt<C>(world, entity, ctx.restoreTick))
                restored = HistoryState<C>::from(std::move(*confirmed));
        }
        if (!restored && history)
            restored = history->stateAt(ctx.restoreTick);
        if (!restored)
            continue;

        if (!history)
            history = world.insert<HistoryBuffer<C>>(entity, HistoryBuffer<C>{});
        history->truncateAfter(ctx.restoreTick);
        history->recordState(ctx.restoreTick, *restored);

        if (restored->isRemoved())
        {
            world.remove<C>(entity);
            world.remove<Correction<C>>(entity);
            continue;
        }
        const C &correct = restored->value();

        std::optional<C> previous;
        if (const C *current = world.get<C>(entity))
            previous = *current;

        world.insert<C>(entity, correct);

        if (!options.blend || !previous || ctx.correctionTicks == 0)
            continue;

        const auto *existing = world.get<Correction<C>>(entity);
        const bool  differs  = !options.shouldRollback || options.shouldRollback(*previous, correct);
        if (!existing && !differs)
            continue;

        C original = (existing && existing->currentVisual) ? *existing->currentVisual : *previous;
        world.insert<Correction<C>>(entity, Correction<C>{
            std::move(original),
            ctx.now,
            ctx.now + ctx.correctionTicks,
            std::nullopt,
            correct,
        });
    }
}

/**
 * @brief While a state rollback replays tick @p now, overwrites @p C with
 *        the mirror's value on entities whose mirror was confirmed at
 *        @p now, so the rest of the replay starts from server state.
 */
template <typename C>
void snapComponent(ecs::World &world, engine::Tick now)
{
    world.each<Predicted>([&](ecs::EntityId entity, Predicted &) {
        auto confirmed = confirmedAt<C>(world, entity, now);
        if (!confirmed)
            return;
        if (*confirmed)
            world.insert<C>(entity, std::move(**confirmed));
        else
            world.remove<C>(entity);
    });
}

/**
 * @brief Appends the current value of @p C (or Removed) to the history of
 *        every enabled predicted entity, trimming it to @p horizon ticks.
 */
template <typename C>
void recordComponent(ecs::World &world, engine::Tick now, core::u16 horizon)
{
    world.each<Predicted>([&](ecs::EntityId entity, Predicted &) {
        auto *history = world.get<HistoryBuffer<C>>(entity);

        if (const C *value = world.get<C>(entity))
        {
            if (!history)
                history = world.insert<HistoryBuffer<C>>(entity, HistoryBuffer<C>{});
            history->record(now, *value);
        }
        else if (history)
        {
            const auto *last = history->peek();
            if (last && last->state.isUpdated())
                history->record(now, std::nullopt);
        }
        else
        {
            return;
        }

        history->popUntilTick(now - horizon);
    });
}

/**
 * @brief Blends the displayed value of @p C toward the simulated one and
 *        retires finished corrections.
 */
template <typename C>
void smoothComponent(ecs::World &world, const SmoothContext &ctx, const ComponentOptions<C> &options)
{
    std::vector<ecs::EntityId> finished;

    world.each<Correction<C>>([&](ecs::EntityId entity, Correction<C> &correction) {
        C *component = world.get<C>(entity);
        if (!component || !options.blend)
        {
            finished.push_back(entity);
            return;
        }

        const core::f32 t = easeOutQuad(correctionProgress(
            correction.originalTick, correction.finalCorrectionTick, ctx.now, ctx.overstepFraction));

        if (t >= 1.0f
            || (options.shouldRollback && !options.shouldRollback(correction.originalPrediction, *component)))
        {
            finished.push_back(entity);
            return;
        }

        correction.currentCorrection = *component;
        C visual = options.blend(correction.originalPrediction, *component, t);
        correction.currentVisual = visual;
        *component = std::move(visual);
    });

    for (const ecs::EntityId entity : finished)
        world.remove<Correction<C>>(entity);
}

/** @brief Puts the simulated value back in place of the displayed one. */
template <typename C>
void restoreComponent(ecs::World &world)
{
    world.eachIncludingDisabled<Correction<C>>([&](ecs::EntityId entity, Correction<C> &correction) {
        if (!correction.currentCorrection)
            return;
        if (C *component = world.get<C>(entity))
            *component = *correction.currentCorrection;
        correction.currentCorrection.reset();
    });
}

/** @brief Shifts history and correction ticks after a timeline re-sync. */
template <typename C>
void shiftComponent(ecs::World &world, core::i16 delta)
{
    world.eachIncludingDisabled<HistoryBuffer<C>>([delta](ecs::EntityId, HistoryBuffer<C> &history) {
        history.shiftTicks(delta);
    });
    world.eachIncludingDisabled<Correction<C>>([delta](ecs::EntityId, Correction<C> &correction) {
        correction.originalTick        += delta;
        correction.finalCorrectionTick += delta;
    });
}

} // namespace ops
} // namespace rwd::prediction

#endif // RWD_PREDICTION_COMPONENTOPS_HPP
