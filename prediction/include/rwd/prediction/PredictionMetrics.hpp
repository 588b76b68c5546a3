/**
 * @file PredictionMetrics.hpp
 * @brief Rollback observability counters.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_PREDICTIONMETRICS_HPP
    #define RWD_PREDICTION_PREDICTIONMETRICS_HPP

#include <rwd/concurrency/AtomicHelpers.hpp>
#include <rwd/core/Types.hpp>

#include <atomic>

namespace rwd::prediction {

/**
 * @brief Counters updated by the detector (possibly from worker threads)
 *        and by the executor.
 */
struct PredictionMetrics
{
    /** @brief Plain copy of the counters. */
    struct Snapshot
    {
        core::u64 rollbacks{0};
        core::u64 rollbackTicks{0};
        core::u64 abortedRollbacks{0};
        core::u64 stateMismatches{0};
        core::u64 inputMismatches{0};
        core::u64 futureConfirmedTicks{0};
        core::u64 prespawnDespawns{0};
    };

    std::atomic<core::u64> rollbacks{0};
    std::atomic<core::u64> rollbackTicks{0};
    std::atomic<core::u64> abortedRollbacks{0};
    std::atomic<core::u64> stateMismatches{0};
    std::atomic<core::u64> inputMismatches{0};
    std::atomic<core::u64> futureConfirmedTicks{0};
    std::atomic<core::u64> prespawnDespawns{0};

    static void bump(std::atomic<core::u64> &counter, core::u64 by = 1) noexcept
    {
        concurrency::atomicFetchAdd(counter, by);
    }

    [[nodiscard]] Snapshot snapshot() const noexcept
    {
        Snapshot s;
        s.rollbacks            = concurrency::atomicLoad(rollbacks);
        s.rollbackTicks        = concurrency::atomicLoad(rollbackTicks);
        s.abortedRollbacks     = concurrency::atomicLoad(abortedRollbacks);
        s.stateMismatches      = concurrency::atomicLoad(stateMismatches);
        s.inputMismatches      = concurrency::atomicLoad(inputMismatches);
        s.futureConfirmedTicks = concurrency::atomicLoad(futureConfirmedTicks);
        s.prespawnDespawns     = concurrency::atomicLoad(prespawnDespawns);
        return s;
    }
};

} // namespace rwd::prediction

#endif // RWD_PREDICTION_PREDICTIONMETRICS_HPP
