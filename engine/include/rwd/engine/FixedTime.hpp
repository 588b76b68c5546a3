/**
 * @file FixedTime.hpp
 * @brief Fixed-step simulation clock with accumulated overstep.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_ENGINE_FIXEDTIME_HPP
    #define RWD_ENGINE_FIXEDTIME_HPP

#include <rwd/core/Types.hpp>

namespace rwd::engine {

/**
 * @class FixedTime
 * @brief Clock read by fixed-tick systems.
 *
 * Frame time is accumulated into the overstep; each fixed tick expends
 * one timestep from it and adds it to the elapsed time.  The whole clock
 * fits in a small State value so it can be saved, rewound for a replay,
 * and restored afterwards.
 */
class FixedTime final
{
public:
    /** @brief Complete clock state. */
    struct State
    {
        core::f64 timestep{0.0};
        core::f64 elapsed{0.0};
        core::f64 overstep{0.0};
    };

    /** @param timestep Seconds per fixed tick (> 0). */
    explicit FixedTime(core::f64 timestep);

    [[nodiscard]] core::f64 timestep() const noexcept { return _state.timestep; }
    [[nodiscard]] core::f64 elapsed()  const noexcept { return _state.elapsed; }
    [[nodiscard]] core::f64 overstep() const noexcept { return _state.overstep; }

    /** @brief Overstep as a fraction of one timestep, in [0, 1). */
    [[nodiscard]] core::f64 overstepFraction() const noexcept;

    /** @brief Adds frame time to the overstep. */
    void accumulate(core::f64 delta) noexcept;

    /**
     * @brief Consumes one timestep from the overstep if enough is banked.
     * @return True if a fixed tick must run.
     */
    [[nodiscard]] bool expend() noexcept;

    /** @brief Advances elapsed by exactly one timestep (overstep untouched). */
    void advance() noexcept;

    /**
     * @brief Moves elapsed back by @p steps timesteps and zeroes the
     *        overstep.
     */
    void rewind(core::u32 steps) noexcept;

    [[nodiscard]] State save() const noexcept { return _state; }
    void restore(const State &state) noexcept { _state = state; }

private:
    State _state;
};

} // namespace rwd::engine

#endif // RWD_ENGINE_FIXEDTIME_HPP
