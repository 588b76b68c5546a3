/**
 * @file Tick.hpp
 * @brief Wrapping 16-bit simulation tick with modular-safe arithmetic.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_ENGINE_TICK_HPP
    #define RWD_ENGINE_TICK_HPP

#include <rwd/core/Types.hpp>

#include <compare>
#include <functional>
#include <string>

namespace rwd::engine {

/**
 * @class Tick
 * @brief One discrete simulation step.
 *
 * The counter wraps at 2^16.  The difference of two ticks is the signed
 * 16-bit wrapping distance, and ordering follows that distance, so
 * comparisons stay correct across the wrap as long as both ticks are
 * less than 2^15 apart.
 */
class Tick final
{
public:
    constexpr Tick() noexcept = default;
    constexpr explicit Tick(core::u16 value) noexcept : _value{value} {}

    [[nodiscard]] constexpr core::u16 value() const noexcept { return _value; }

    /** @brief Signed wrapping distance `a - b`. */
    [[nodiscard]] friend constexpr core::i16 operator-(Tick a, Tick b) noexcept
    {
        return static_cast<core::i16>(static_cast<core::u16>(a._value - b._value));
    }

    [[nodiscard]] friend constexpr Tick operator+(Tick a, core::i32 delta) noexcept
    {
        return Tick{static_cast<core::u16>(static_cast<core::i32>(a._value) + delta)};
    }

    [[nodiscard]] friend constexpr Tick operator-(Tick a, core::i32 delta) noexcept
    {
        return Tick{static_cast<core::u16>(static_cast<core::i32>(a._value) - delta)};
    }

    constexpr Tick &operator+=(core::i32 delta) noexcept { return *this = *this + delta; }
    constexpr Tick &operator-=(core::i32 delta) noexcept { return *this = *this - delta; }
    constexpr Tick &operator++() noexcept { return *this += 1; }

    [[nodiscard]] friend constexpr bool operator==(Tick a, Tick b) noexcept
    {
        return a._value == b._value;
    }

    [[nodiscard]] friend constexpr std::strong_ordering operator<=>(Tick a, Tick b) noexcept
    {
        return (a - b) <=> core::i16{0};
    }

private:
    core::u16 _value{0};
};

[[nodiscard]] inline std::string toString(Tick tick)
{
    return std::to_string(tick.value());
}

} // namespace rwd::engine

template <>
struct std::hash<rwd::engine::Tick>
{
    [[nodiscard]] std::size_t operator()(rwd::engine::Tick tick) const noexcept
    {
        return std::hash<rwd::core::u16>{}(tick.value());
    }
};

#endif // RWD_ENGINE_TICK_HPP
