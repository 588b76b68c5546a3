/**
 * @file App.hpp
 * @brief Frame pipeline façade: world, clocks, fixed schedule and hooks.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_ENGINE_APP_HPP
    #define RWD_ENGINE_APP_HPP

#include <rwd/engine/Config.hpp>
#include <rwd/engine/FixedTime.hpp>
#include <rwd/engine/Timeline.hpp>
#include <rwd/ecs/SystemScheduler.hpp>
#include <rwd/ecs/World.hpp>
#include <rwd/concurrency/ThreadPool.hpp>
#include <rwd/core/Expected.hpp>
#include <rwd/core/Pinned.hpp>
#include <rwd/core/Types.hpp>

#include <functional>
#include <memory>
#include <string>

namespace rwd::engine {

/**
 * @enum Stage
 * @brief Per-frame hook points around the fixed ticks.
 */
enum class Stage : core::u8
{
    PreUpdate  = 0, ///< Before the fixed ticks of the frame.
    PostUpdate = 1, ///< After the fixed ticks of the frame.

    Count
};

class App;

/** @brief Per-frame hook, invoked in registration order within its stage. */
using FrameHook = std::function<void(App&)>;

/**
 * @class App
 * @brief Owns the simulation instance and runs one frame at a time.
 *
 * A frame is:
 * 1. every PreUpdate hook;
 * 2. as many fixed ticks as the accumulated frame time allows, each one
 *    advancing the Timeline then running the fixed schedule;
 * 3. every PostUpdate hook.
 */
class App final : public core::Pinned
{
public:
    /// @param config Validated engine configuration.
    explicit App(Config config);
    ~App();

    /**
     * @brief Registers a fixed-tick system.
     * @return Error from the scheduler on a null system.
     */
    [[nodiscard]] core::Expected<void> addSystem(std::unique_ptr<ecs::ISystem> system);

    /** @brief Appends a frame hook to @p stage. */
    void addHook(Stage stage, std::string name, FrameHook hook);

    /**
     * @brief Runs one frame.
     * @param frameSeconds Wall time elapsed since the previous frame,
     *        clamped to core::kMaxFrameTime.
     * @return Error if the fixed schedule cannot be built.
     */
    [[nodiscard]] core::Expected<void> update(core::f64 frameSeconds);

    /**
     * @brief Runs the fixed schedule once without touching the Timeline
     *        or the clock.  Used by rollback replay.
     */
    void runFixedSchedule();

    [[nodiscard]] ecs::World&              world() noexcept;
    [[nodiscard]] const ecs::World&        world() const noexcept;
    [[nodiscard]] Timeline&                timeline() noexcept;
    [[nodiscard]] const Timeline&          timeline() const noexcept;
    [[nodiscard]] FixedTime&               fixedTime() noexcept;
    [[nodiscard]] const FixedTime&         fixedTime() const noexcept;
    [[nodiscard]] concurrency::ThreadPool& threadPool() noexcept;
    [[nodiscard]] ecs::SystemScheduler&    schedule() noexcept;
    [[nodiscard]] const Config&            config() const noexcept;

    /** @brief Frames run so far. */
    [[nodiscard]] core::u64 frameCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace rwd::engine

#endif // RWD_ENGINE_APP_HPP
