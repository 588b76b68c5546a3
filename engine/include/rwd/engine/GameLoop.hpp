/**
 * @file GameLoop.hpp
 * @brief Wall-clock driver for App frames.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_ENGINE_GAMELOOP_HPP
    #define RWD_ENGINE_GAMELOOP_HPP

#include <rwd/engine/App.hpp>
#include <rwd/core/Types.hpp>
#include <rwd/core/Expected.hpp>

#include <atomic>

namespace rwd::engine {

/** @brief Runs App::update from a steady clock until stopped. */
class GameLoop
{
public:
    /// @param app Application to drive; must outlive the loop.
    explicit GameLoop(App& app);
    ~GameLoop();

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;

    /**
     * @brief Run until requestStop() is called or a frame fails.
     * @return The first frame error, if any.
     */
    [[nodiscard]] core::Expected<void> run();

    /** @brief Request graceful loop termination (thread-safe). */
    void requestStop() noexcept;

    /** @brief Whether the loop is currently running. */
    [[nodiscard]] bool isRunning() const noexcept;

    /** @brief Frames run since run() was called. */
    [[nodiscard]] core::u64 frameCount() const noexcept;

private:
    App&              _app;
    std::atomic<bool> _running{false};
    std::atomic<bool> _stopRequested{false};
    core::u64         _frameCount{0};
};

} // namespace rwd::engine

#endif // RWD_ENGINE_GAMELOOP_HPP
