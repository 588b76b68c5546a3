/**
 * @file Timeline.hpp
 * @brief The engine's current simulation tick.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_ENGINE_TIMELINE_HPP
    #define RWD_ENGINE_TIMELINE_HPP

#include <rwd/engine/Tick.hpp>

namespace rwd::engine {

/**
 * @class Timeline
 * @brief Local tick counter advanced once per fixed update.
 *
 * Rollback replay moves it back to the restore tick and forward again;
 * every other writer only advances it.
 */
class Timeline final
{
public:
    constexpr Timeline() noexcept = default;
    constexpr explicit Timeline(Tick start) noexcept : _tick{start} {}

    [[nodiscard]] constexpr Tick tick() const noexcept { return _tick; }

    constexpr void setTick(Tick tick) noexcept { _tick = tick; }

    constexpr void advance(core::u16 n = 1) noexcept { _tick += n; }

    /** @brief Moves the tick by a signed amount (clock re-sync). */
    constexpr void applyDelta(core::i16 delta) noexcept { _tick += delta; }

private:
    Tick _tick{};
};

} // namespace rwd::engine

#endif // RWD_ENGINE_TIMELINE_HPP
