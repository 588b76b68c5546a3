/**
 * @file ComponentOptions.hpp
 * @brief Per-component comparator and blend function.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_COMPONENTOPTIONS_HPP
    #define RWD_PREDICTION_COMPONENTOPTIONS_HPP

#include <rwd/core/Concepts.hpp>
#include <rwd/core/Types.hpp>

#include <functional>

namespace rwd::prediction {

/**
 * @brief How the prediction engine treats component @p C.
 *
 * - @c shouldRollback(predicted, confirmed) returns true when the two
 *   values diverge enough to roll back.  Without it the component is
 *   never compared and never triggers a rollback.
 * - @c blend(from, to, t) interpolates for visual correction.  Without it
 *   corrections snap instantly.
 */
template <typename C>
struct ComponentOptions
{
    using Comparator = std::function<bool(const C &, const C &)>;
    using Blend      = std::function<C(const C &, const C &, core::f32)>;

    Comparator shouldRollback;
    Blend      blend;

    ComponentOptions &comparator(Comparator fn)
    {
        shouldRollback = std::move(fn);
        return *this;
    }

    ComponentOptions &interpolate(Blend fn)
    {
        blend = std::move(fn);
        return *this;
    }

    /** @brief Roll back whenever the values differ under operator!=. */
    ComponentOptions &withEquality() requires core::InequalityComparable<C>
    {
        return comparator([](const C &a, const C &b) { return a != b; });
    }

    /** @brief Smooth corrections with @c C::lerp. */
    ComponentOptions &withLerp() requires core::Lerpable<C>
    {
        return interpolate([](const C &a, const C &b, core::f32 t) { return C::lerp(a, b, t); });
    }
};

} // namespace rwd::prediction

#endif // RWD_PREDICTION_COMPONENTOPTIONS_HPP
