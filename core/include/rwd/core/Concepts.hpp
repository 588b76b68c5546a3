/**
 * @file Concepts.hpp
 * @brief Concepts constraining generic interfaces across the engine.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_CORE_CONCEPTS_HPP
    #define RWD_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>
    #include <type_traits>

namespace rwd::core {

/**
 * @brief A type that is trivially copyable and standard-layout, making it
 *        safe for raw memory operations (memcpy, hashing).
 */
template <typename T>
concept Blittable = std::is_trivially_copyable_v<T> && std::is_standard_layout_v<T>;

/**
 * @brief A type that can be stored as an ECS component.
 */
template <typename T>
concept ComponentType = std::is_object_v<T> && std::is_move_constructible_v<T>
                     && std::is_move_assignable_v<T> && !std::is_const_v<T>;

/**
 * @brief A type that can be compared with operator!=.
 */
template <typename T>
concept InequalityComparable = requires(const T &a, const T &b) {
    { a != b } -> std::convertible_to<bool>;
};

/**
 * @brief A type exposing a static linear interpolation
 *        `T::lerp(const T&, const T&, f32)`.
 */
template <typename T>
concept Lerpable = requires(const T &a, const T &b, f32 t) {
    { T::lerp(a, b, t) } -> std::convertible_to<T>;
};

} // namespace rwd::core

#endif // RWD_CORE_CONCEPTS_HPP
