/**
 * @file SystemScheduler.cpp
 * @brief DAG system scheduler implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/ecs/SystemScheduler.hpp>
#include <rwd/core/Assert.hpp>
#include <rwd/core/Log.hpp>

#include <algorithm>
#include <queue>
#include <string>
#include <unordered_set>

namespace rwd::ecs {

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct SystemScheduler::Impl
{
    concurrency::ThreadPool&                        pool;
    std::vector<std::unique_ptr<ISystem>>           systems;
    std::vector<std::vector<core::u32>>             waves;
    bool                                            graphBuilt{false};

    explicit Impl(concurrency::ThreadPool& p) : pool{p} {}
};

namespace {

bool conflicts(const SystemDescriptor& a, const SystemDescriptor& b) noexcept
{
    for (const auto& x : a.accesses)
    {
        for (const auto& y : b.accesses)
        {
            if (x.kind == y.kind &&
                (x.mode == AccessMode::ReadWrite || y.mode == AccessMode::ReadWrite))
            {
                return true;
            }
        }
    }
    return false;
}

} // namespace

// ========================================================================== //
//  Public API                                                                //
// ========================================================================== //

SystemScheduler::SystemScheduler(concurrency::ThreadPool& pool)
    : _impl{std::make_unique<Impl>(pool)}
{}

SystemScheduler::~SystemScheduler() = default;

core::Expected<void> SystemScheduler::registerSystem(std::unique_ptr<ISystem> system)
{
    if (!system)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "Null system");
    }
    _impl->systems.push_back(std::move(system));
    _impl->graphBuilt = false;
    return {};
}

core::Expected<void> SystemScheduler::buildGraph()
{
    const core::u32 n = static_cast<core::u32>(_impl->systems.size());

    std::vector<std::unordered_set<core::u32>> adj(n);
    std::vector<core::u32> inDegree(n, 0);

    for (core::u32 i = 0; i < n; ++i)
    {
        const auto& descA = _impl->systems[i]->descriptor();

        for (core::u32 j = i + 1; j < n; ++j)
        {
            const auto& descB = _impl->systems[j]->descriptor();

            if (descA.phase != descB.phase)
            {
                const core::u32 from = (descA.phase < descB.phase) ? i : j;
                const core::u32 to   = (from == i) ? j : i;
                if (adj[from].insert(to).second)
                {
                    ++inDegree[to];
                }
                continue;
            }

            if (conflicts(descA, descB) && adj[i].insert(j).second)
            {
                ++inDegree[j];
            }
        }
    }

    std::queue<core::u32> ready;
    for (core::u32 i = 0; i < n; ++i)
    {
        if (inDegree[i] == 0)
        {
            ready.push(i);
        }
    }

    _impl->waves.clear();
    core::u32 processed = 0;

    while (!ready.empty())
    {
        std::vector<core::u32> wave;
        const auto waveSize = static_cast<core::u32>(ready.size());

        for (core::u32 w = 0; w < waveSize; ++w)
        {
            wave.push_back(ready.front());
            ready.pop();
        }
        std::sort(wave.begin(), wave.end());

        for (auto idx : wave)
        {
            for (auto dep : adj[idx])
            {
                if (--inDegree[dep] == 0)
                {
                    ready.push(dep);
                }
            }
        }

        _impl->waves.push_back(std::move(wave));
        processed += waveSize;
    }

    if (processed != n)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "Cycle detected in system DAG");
    }

    _impl->graphBuilt = true;
    core::Log::debug("ecs", "schedule built: " + std::to_string(n) + " systems in "
                            + std::to_string(_impl->waves.size()) + " waves");
    return {};
}

bool SystemScheduler::isBuilt() const noexcept
{
    return _impl->graphBuilt;
}

void SystemScheduler::tick(core::f32 dt)
{
    RWD_ASSERT(_impl->graphBuilt);

    std::vector<concurrency::ThreadPool::Task> batch;
    for (const auto& wave : _impl->waves)
    {
        batch.clear();
        batch.reserve(wave.size());
        for (auto idx : wave)
        {
            batch.emplace_back([this, idx, dt]() { _impl->systems[idx]->execute(dt); });
        }
        _impl->pool.runBatch(batch);
    }
}

core::u32 SystemScheduler::systemCount() const noexcept
{
    return static_cast<core::u32>(_impl->systems.size());
}

core::u32 SystemScheduler::waveCount() const noexcept
{
    return static_cast<core::u32>(_impl->waves.size());
}

} // namespace rwd::ecs
