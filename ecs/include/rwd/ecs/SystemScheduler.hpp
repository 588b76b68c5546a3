/**
 * @file SystemScheduler.hpp
 * @brief DAG-based system scheduler with automatic parallelism.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#pragma once

#ifndef RWD_ECS_SYSTEMSCHEDULER_HPP
    #define RWD_ECS_SYSTEMSCHEDULER_HPP

#include <rwd/ecs/System.hpp>
#include <rwd/concurrency/ThreadPool.hpp>
#include <rwd/core/Types.hpp>
#include <rwd/core/Pinned.hpp>
#include <rwd/core/Expected.hpp>

#include <memory>
#include <vector>

namespace rwd::ecs {

/**
 * @class SystemScheduler
 * @brief Builds a directed acyclic graph (DAG) from system descriptors and
 *        runs independent systems in parallel, respecting data dependencies.
 *
 * @par Algorithm
 * 1. Systems in an earlier phase precede every system of a later phase.
 * 2. Within a phase, if system A writes component C and system B reads or
 *    writes C, B depends on A when A was registered first.
 * 3. A topological sort yields execution waves.
 * 4. Each wave is dispatched to the ThreadPool in parallel; a latch waits
 *    for all systems in the wave to finish before advancing.
 *
 * The wave order is fixed once built, so running the same schedule twice
 * from the same state produces the same result as long as systems in one
 * wave touch disjoint data.
 */
class SystemScheduler final : public core::Pinned
{
public:
    /**
     * @brief Constructs a scheduler backed by the given thread pool.
     * @param pool Thread pool used for parallel dispatch.
     */
    explicit SystemScheduler(concurrency::ThreadPool& pool);

    ~SystemScheduler();

    // --------------------------------------------------------------------- //
    //  Registration                                                          //
    // --------------------------------------------------------------------- //

    /**
     * @brief Registers a system instance.
     * @param system Owning pointer to the system.
     * @return OK on success, kInvalidArgument on a null system.
     */
    [[nodiscard]] core::Expected<void> registerSystem(std::unique_ptr<ISystem> system);

    /**
     * @brief Rebuilds the DAG after all systems have been registered.
     * @return OK if a valid topological order exists.
     */
    [[nodiscard]] core::Expected<void> buildGraph();

    /** @brief Whether the DAG reflects every registered system. */
    [[nodiscard]] bool isBuilt() const noexcept;

    // --------------------------------------------------------------------- //
    //  Execution                                                             //
    // --------------------------------------------------------------------- //

    /**
     * @brief Runs all systems for one tick in dependency order.
     * @param dt Fixed delta-time.
     */
    void tick(core::f32 dt);

    /** @brief Returns the number of registered systems. */
    [[nodiscard]] core::u32 systemCount() const noexcept;

    /** @brief Returns the number of execution waves of the built graph. */
    [[nodiscard]] core::u32 waveCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace rwd::ecs

#endif // RWD_ECS_SYSTEMSCHEDULER_HPP
