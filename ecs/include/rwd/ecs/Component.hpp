/**
 * @file Component.hpp
 * @brief Runtime component kind identifiers and access metadata.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#pragma once

#ifndef RWD_ECS_COMPONENT_HPP
    #define RWD_ECS_COMPONENT_HPP

#include <rwd/core/Types.hpp>

#include <atomic>
#include <type_traits>

namespace rwd::ecs {

/**
 * @brief Dense runtime identifier of a component type.
 *
 * Assigned on first use of @ref componentKind, in call order.  Values are
 * stable for the lifetime of the process and index World's pool table.
 */
using ComponentKind = core::u32;

namespace detail {

inline std::atomic<ComponentKind> gNextComponentKind{0};

} // namespace detail

/**
 * @brief Returns the kind identifier of @p T.
 * @tparam T Component type (cv-qualifiers ignored).
 */
template <typename T>
[[nodiscard]] ComponentKind componentKind() noexcept
{
    using Bare = std::remove_cvref_t<T>;
    if constexpr (!std::is_same_v<Bare, T>)
    {
        return componentKind<Bare>();
    }
    else
    {
        static const ComponentKind kind =
            detail::gNextComponentKind.fetch_add(1, std::memory_order_relaxed);
        return kind;
    }
}

/**
 * @enum AccessMode
 * @brief Describes how a System accesses a component (read-only or
 *        read-write).  Used by the SystemScheduler DAG builder.
 */
enum class AccessMode : core::u8
{
    ReadOnly  = 0,
    ReadWrite = 1
};

/**
 * @struct ComponentAccess
 * @brief Pair of component kind + access mode used in system descriptors.
 */
struct ComponentAccess
{
    ComponentKind kind;
    AccessMode    mode;
};

/** @brief Shorthand for a read-only access to @p T. */
template <typename T>
[[nodiscard]] ComponentAccess reads() noexcept
{
    return {componentKind<T>(), AccessMode::ReadOnly};
}

/** @brief Shorthand for a read-write access to @p T. */
template <typename T>
[[nodiscard]] ComponentAccess writes() noexcept
{
    return {componentKind<T>(), AccessMode::ReadWrite};
}

} // namespace rwd::ecs

#endif // RWD_ECS_COMPONENT_HPP
