/**
 * @file ThreadPool.hpp
 * @brief Worker pool that runs the systems of a schedule wave and the
 *        chunks of the parallel mismatch scan.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#pragma once

#ifndef RWD_CONCURRENCY_THREADPOOL_HPP
    #define RWD_CONCURRENCY_THREADPOOL_HPP

#include <rwd/core/Types.hpp>
#include <rwd/core/Pinned.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace rwd::concurrency {

/**
 * @class ThreadPool
 * @brief Fixed set of workers fed from a mutex-guarded FIFO.
 *
 * Work is always submitted as a blocking batch: the caller hands over a
 * group of tasks, runs one of them itself and returns once every task of
 * the group is done. Nothing outlives the call, so tasks may capture the
 * caller's stack by reference.
 *
 * Neither entry point may be called from inside a pool task. After
 * @ref shutdown both run their work inline on the calling thread.
 */
class ThreadPool final : public core::Pinned
{
public:
    using Task      = std::function<void()>;
    using RangeTask = std::function<void(core::usize begin, core::usize end)>;

    /**
     * @param threadCount Number of workers. Zero means
     *        @c std::thread::hardware_concurrency().
     */
    explicit ThreadPool(core::u32 threadCount = 0);
    ~ThreadPool();

    /**
     * @brief Runs every task of @p batch and blocks until all finished.
     *
     * The calling thread takes the last task. A batch of one, or a pool
     * without running workers, is executed inline in order.
     */
    void runBatch(std::vector<Task> &batch);

    /**
     * @brief Splits [0, count) into contiguous chunks of at least
     *        @p minChunk indices and runs @p func on each as one batch.
     */
    void parallelFor(core::usize count, core::usize minChunk, const RangeTask &func);

    /** @brief Lets workers drain the queue, then joins them. Idempotent. */
    void shutdown();

    [[nodiscard]] core::u32 threadCount() const noexcept;
    [[nodiscard]] bool isRunning() const noexcept;

private:
    void push(Task task);
    void workerLoop();

    std::vector<std::thread> _workers;
    std::deque<Task>         _queue;
    std::mutex               _mutex;
    std::condition_variable  _cv;
    std::atomic<bool>        _stopping{false};
};

} // namespace rwd::concurrency

#endif // RWD_CONCURRENCY_THREADPOOL_HPP
