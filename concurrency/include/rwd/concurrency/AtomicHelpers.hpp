/**
 * @file AtomicHelpers.hpp
 * @brief Atomic operations shared by the rollback target and the metrics.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#pragma once

#ifndef RWD_CONCURRENCY_ATOMICHELPERS_HPP
    #define RWD_CONCURRENCY_ATOMICHELPERS_HPP

#include <rwd/core/Types.hpp>
#include <rwd/core/Concepts.hpp>

#include <atomic>

namespace rwd::concurrency {

template <typename T>
    requires core::Blittable<T>
[[nodiscard]] inline T atomicLoad(const std::atomic<T>& atom,
                                  std::memory_order order = std::memory_order_acquire) noexcept
{
    return atom.load(order);
}

/** @brief Relaxed counter increment; returns the previous value. */
template <typename T>
    requires std::integral<T>
inline T atomicFetchAdd(std::atomic<T>& atom, T delta) noexcept
{
    return atom.fetch_add(delta, std::memory_order_relaxed);
}

/**
 * @brief Stores @p value when @p replaces(current, value) holds.
 *
 * Used to keep the earliest rollback target offered by concurrent
 * detector chunks: whatever the interleaving, the atomic ends on the
 * value every other candidate was rejected against.
 *
 * @param replaces Strict predicate, true when the candidate must win.
 * @return @c true if @p value was stored.
 */
template <typename T, typename Replaces>
    requires core::Blittable<T>
inline bool atomicFetchMin(std::atomic<T>& atom, T value, Replaces&& replaces) noexcept
{
    T current = atom.load(std::memory_order_acquire);
    while (replaces(current, value))
    {
        if (atom.compare_exchange_weak(current, value, std::memory_order_acq_rel, std::memory_order_acquire))
            return true;
    }
    return false;
}

} // namespace rwd::concurrency

#endif // RWD_CONCURRENCY_ATOMICHELPERS_HPP
