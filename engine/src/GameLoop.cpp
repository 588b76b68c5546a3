/**
 * @file GameLoop.cpp
 * @brief GameLoop implementation: steady-clock frame pacing.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/engine/GameLoop.hpp>
#include <rwd/core/Log.hpp>

#include <chrono>

namespace rwd::engine {

GameLoop::GameLoop(App& app)
    : _app{app}
{
}

GameLoop::~GameLoop() = default;

core::Expected<void> GameLoop::run()
{
    _running.store(true, std::memory_order_release);
    _frameCount = 0;

    using Clock = std::chrono::steady_clock;
    auto previous = Clock::now();

    while (!_stopRequested.load(std::memory_order_acquire))
    {
        const auto current = Clock::now();
        const core::f64 frameTime = std::chrono::duration<core::f64>(current - previous).count();
        previous = current;

        auto frame = _app.update(frameTime);
        if (!frame)
        {
            core::Log::error("engine", "GameLoop: frame failed: " + frame.error().describe());
            _running.store(false, std::memory_order_release);
            return frame;
        }
        ++_frameCount;
    }

    _running.store(false, std::memory_order_release);
    _stopRequested.store(false, std::memory_order_release);
    core::Log::info("engine", "GameLoop: stopped after " + std::to_string(_frameCount) + " frames");
    return {};
}

void GameLoop::requestStop() noexcept
{
    _stopRequested.store(true, std::memory_order_release);
}

bool GameLoop::isRunning() const noexcept
{
    return _running.load(std::memory_order_acquire);
}

core::u64 GameLoop::frameCount() const noexcept
{
    return _frameCount;
}

} // namespace rwd::engine
