/**
 * @file App.cpp
 * @brief App frame pipeline implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/engine/App.hpp>
#include <rwd/core/Constants.hpp>
#include <rwd/core/Log.hpp>

#include <algorithm>
#include <array>
#include <vector>

namespace rwd::engine {

struct App::Impl
{
    struct NamedHook
    {
        std::string name;
        FrameHook   hook;
    };

    Config                  config;
    ecs::World              world;
    Timeline                timeline;
    FixedTime               fixedTime;
    concurrency::ThreadPool threadPool;
    ecs::SystemScheduler    schedule;

    std::array<std::vector<NamedHook>, static_cast<core::usize>(Stage::Count)> hooks;
    core::u64 frameCount{0};

    explicit Impl(Config cfg)
        : config{std::move(cfg)}
        , world{config.maxEntities()}
        , timeline{}
        , fixedTime{config.timestep()}
        , threadPool{config.workerThreads()}
        , schedule{threadPool}
    {
    }

    void runStage(App& app, Stage stage)
    {
        for (auto& entry : hooks[static_cast<core::usize>(stage)])
        {
            entry.hook(app);
        }
    }
};

App::App(Config config)
    : _impl{std::make_unique<Impl>(std::move(config))}
{
    core::Log::info("engine", "App created at " + std::to_string(_impl->config.tickRate())
                              + " Hz with " + std::to_string(_impl->threadPool.threadCount())
                              + " workers");
}

App::~App() = default;

core::Expected<void> App::addSystem(std::unique_ptr<ecs::ISystem> system)
{
    return _impl->schedule.registerSystem(std::move(system));
}

void App::addHook(Stage stage, std::string name, FrameHook hook)
{
    core::Log::debug("engine", "hook '" + name + "' added");
    _impl->hooks[static_cast<core::usize>(stage)].push_back({std::move(name), std::move(hook)});
}

core::Expected<void> App::update(core::f64 frameSeconds)
{
    if (!_impl->schedule.isBuilt())
    {
        RWD_TRY_VOID(_impl->schedule.buildGraph());
    }

    _impl->runStage(*this, Stage::PreUpdate);

    _impl->fixedTime.accumulate(std::clamp(frameSeconds, 0.0, core::kMaxFrameTime));
    while (_impl->fixedTime.expend())
    {
        _impl->timeline.advance();
        runFixedSchedule();
    }

    _impl->runStage(*this, Stage::PostUpdate);
    ++_impl->frameCount;
    return {};
}

void App::runFixedSchedule()
{
    core::Log::stampTick(_impl->timeline.tick().value());
    _impl->schedule.tick(static_cast<core::f32>(_impl->fixedTime.timestep()));
}

ecs::World&              App::world() noexcept            { return _impl->world; }
const ecs::World&        App::world() const noexcept      { return _impl->world; }
Timeline&                App::timeline() noexcept         { return _impl->timeline; }
const Timeline&          App::timeline() const noexcept   { return _impl->timeline; }
FixedTime&               App::fixedTime() noexcept        { return _impl->fixedTime; }
const FixedTime&         App::fixedTime() const noexcept  { return _impl->fixedTime; }
concurrency::ThreadPool& App::threadPool() noexcept       { return _impl->threadPool; }
ecs::SystemScheduler&    App::schedule() noexcept         { return _impl->schedule; }
const Config&            App::config() const noexcept     { return _impl->config; }
core::u64                App::frameCount() const noexcept { return _impl->frameCount; }

} // namespace rwd::engine
