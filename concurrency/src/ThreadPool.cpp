/**
 * @file ThreadPool.cpp
 * @brief ThreadPool implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/concurrency/ThreadPool.hpp>
#include <rwd/core/Assert.hpp>

#include <algorithm>
#include <latch>

namespace rwd::concurrency {

ThreadPool::ThreadPool(core::u32 threadCount)
{
    const core::u32 count = threadCount != 0
        ? threadCount
        : std::max<core::u32>(static_cast<core::u32>(std::thread::hardware_concurrency()), 1);

    _workers.reserve(count);
    for (core::u32 i = 0; i < count; ++i)
        _workers.emplace_back(&ThreadPool::workerLoop, this);
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

// -------------------------------------------------------------------------- //
//  Batches                                                                   //
// -------------------------------------------------------------------------- //

void ThreadPool::runBatch(std::vector<Task> &batch)
{
    if (batch.empty())
        return;

    if (batch.size() == 1 || !isRunning())
    {
        for (auto &task : batch)
            task();
        return;
    }

    const core::usize offloaded = batch.size() - 1;
    std::latch done{static_cast<std::ptrdiff_t>(offloaded)};

    for (core::usize i = 0; i < offloaded; ++i)
    {
        push([&task = batch[i], &done]() {
            task();
            done.count_down();
        });
    }

    batch.back()();
    done.wait();
}

void ThreadPool::parallelFor(core::usize count, core::usize minChunk, const RangeTask &func)
{
    if (count == 0)
        return;

    const core::usize lanes = static_cast<core::usize>(threadCount()) + 1;
    const core::usize chunk = std::max<core::usize>(std::max<core::usize>(minChunk, 1), (count + lanes - 1) / lanes);

    std::vector<Task> batch;
    batch.reserve((count + chunk - 1) / chunk);
    for (core::usize begin = 0; begin < count; begin += chunk)
    {
        const core::usize end = std::min(begin + chunk, count);
        batch.emplace_back([&func, begin, end]() { func(begin, end); });
    }

    runBatch(batch);
}

// -------------------------------------------------------------------------- //
//  Lifecycle                                                                 //
// -------------------------------------------------------------------------- //

void ThreadPool::shutdown()
{
    if (_stopping.exchange(true, std::memory_order_acq_rel))
        return;

    _cv.notify_all();
    for (auto &worker : _workers)
    {
        if (worker.joinable())
            worker.join();
    }
}

core::u32 ThreadPool::threadCount() const noexcept
{
    return static_cast<core::u32>(_workers.size());
}

bool ThreadPool::isRunning() const noexcept
{
    return !_workers.empty() && !_stopping.load(std::memory_order_acquire);
}

// -------------------------------------------------------------------------- //
//  Workers                                                                   //
// -------------------------------------------------------------------------- //

void ThreadPool::push(Task task)
{
    {
        std::lock_guard<std::mutex> lock{_mutex};
        _queue.push_back(std::move(task));
    }
    _cv.notify_one();
}

void ThreadPool::workerLoop()
{
    for (;;)
    {
        Task task;
        {
            std::unique_lock<std::mutex> lock{_mutex};
            _cv.wait(lock, [this] { return _stopping.load(std::memory_order_relaxed) || !_queue.empty(); });
            if (_queue.empty())
                return;
            task = std::move(_queue.front());
            _queue.pop_front();
        }
        RWD_ASSERT(task);
        task();
    }
}

} // namespace rwd::concurrency
