/**
 * @file RollbackCoordinator.hpp
 * @brief Single source of truth for the engine-wide rollback target.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_ROLLBACKCOORDINATOR_HPP
    #define RWD_PREDICTION_ROLLBACKCOORDINATOR_HPP

#include <rwd/engine/Tick.hpp>
#include <rwd/core/Constants.hpp>
#include <rwd/core/Expected.hpp>
#include <rwd/core/Pinned.hpp>
#include <rwd/core/Types.hpp>

#include <atomic>
#include <optional>
#include <string_view>

namespace rwd::prediction {

/** @brief What latched the current rollback. */
enum class RollbackCause : core::u8
{
    State = 0, ///< A confirmed value disagreed with the predicted history.
    Input = 1, ///< A remote input disagreed with the assumed one.
};

/** @brief Where the engine is in the rollback state machine. */
enum class RollbackPhase : core::u8
{
    Idle      = 0,
    Checking  = 1,
    Preparing = 2,
    Replaying = 3,
};

[[nodiscard]] std::string_view toString(RollbackCause cause) noexcept;
[[nodiscard]] std::string_view toString(RollbackPhase phase) noexcept;

/**
 * @class RollbackCoordinator
 * @brief Holds `NotRolling | ShouldRollBackTo(tick)`.
 *
 * The target is the first tick to replay: the state is restored at
 * `target - 1` and ticks `target ..= now` are simulated again.
 *
 * @ref setRollback may be called concurrently by detection workers; the
 * stored target is the earliest tick offered during the pass.  Everything
 * else is called from the frame thread.
 */
class RollbackCoordinator final : public core::Pinned
{
public:
    RollbackCoordinator() = default;

    /**
     * @brief Offers @p target as rollback target (earliest wins).
     * @return True if @p target became the latched target.
     */
    bool setRollback(engine::Tick target, RollbackCause cause) noexcept;

    /** @brief Back to NotRolling / Idle. */
    void clear() noexcept;

    [[nodiscard]] std::optional<engine::Tick> currentTarget() const noexcept;
    [[nodiscard]] RollbackCause               cause() const noexcept;

    [[nodiscard]] bool isRollingBack() const noexcept { return currentTarget().has_value(); }

    /** @brief True while the fixed schedule is being re-run for a rollback. */
    [[nodiscard]] bool isReplaying() const noexcept { return phase() == RollbackPhase::Replaying; }

    [[nodiscard]] RollbackPhase phase() const noexcept;
    void setPhase(RollbackPhase phase) noexcept;

    /** @brief Number of ticks to replay to reach @p now (0 when idle). */
    [[nodiscard]] core::u16 replayTicks(engine::Tick now) const noexcept;

    /**
     * @brief Enforces the replay window.
     *
     * A target whose replay length is negative or larger than
     * @p maxRollbackTicks is abandoned: the error is logged and the
     * coordinator goes back to idle.
     *
     * @return Replay length, or kOutOfRange / kInvalidState.
     */
    [[nodiscard]] core::Expected<core::u16> validate(engine::Tick now, core::u16 maxRollbackTicks);

private:
    static constexpr core::u32 kNoTarget = 0x1'0000;

    alignas(core::kCacheLineSize) std::atomic<core::u32> _target{kNoTarget};
    std::atomic<RollbackCause> _cause{RollbackCause::State};
    std::atomic<RollbackPhase> _phase{RollbackPhase::Idle};
};

} // namespace rwd::prediction

#endif // RWD_PREDICTION_ROLLBACKCOORDINATOR_HPP
