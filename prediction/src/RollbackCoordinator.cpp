/**
 * @file RollbackCoordinator.cpp
 * @brief Earliest-tick-wins rollback latch.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/prediction/RollbackCoordinator.hpp>
#include <rwd/concurrency/AtomicHelpers.hpp>
#include <rwd/core/Log.hpp>

#include <string>

namespace rwd::prediction {

std::string_view toString(RollbackCause cause) noexcept
{
    switch (cause)
    {
    case RollbackCause::State: return "state";
    case RollbackCause::Input: return "input";
    }
    return "unknown";
}

std::string_view toString(RollbackPhase phase) noexcept
{
    switch (phase)
    {
    case RollbackPhase::Idle:      return "Idle";
    case RollbackPhase::Checking:  return "Checking";
    case RollbackPhase::Preparing: return "Preparing";
    case RollbackPhase::Replaying: return "Replaying";
    }
    return "Unknown";
}

bool RollbackCoordinator::setRollback(engine::Tick target, RollbackCause cause) noexcept
{
    const core::u32 candidate = target.value();
    const bool stored = concurrency::atomicFetchMin(
        _target, candidate,
        [](core::u32 current, core::u32 offered) {
            if (current == kNoTarget)
                return true;
            return engine::Tick{static_cast<core::u16>(offered)}
                 < engine::Tick{static_cast<core::u16>(current)};
        });

    if (stored)
    {
        _cause.store(cause, std::memory_order_release);
    }
    return stored;
}

void RollbackCoordinator::clear() noexcept
{
    _target.store(kNoTarget, std::memory_order_release);
    _cause.store(RollbackCause::State, std::memory_order_release);
    _phase.store(RollbackPhase::Idle, std::memory_order_release);
}

std::optional<engine::Tick> RollbackCoordinator::currentTarget() const noexcept
{
    const core::u32 raw = concurrency::atomicLoad(_target);
    if (raw == kNoTarget)
        return std::nullopt;
    return engine::Tick{static_cast<core::u16>(raw)};
}

RollbackCause RollbackCoordinator::cause() const noexcept
{
    return _cause.load(std::memory_order_acquire);
}

RollbackPhase RollbackCoordinator::phase() const noexcept
{
    return _phase.load(std::memory_order_acquire);
}

void RollbackCoordinator::setPhase(RollbackPhase phase) noexcept
{
    _phase.store(phase, std::memory_order_release);
}

core::u16 RollbackCoordinator::replayTicks(engine::Tick now) const noexcept
{
    const auto target = currentTarget();
    if (!target)
        return 0;
    const core::i16 span = now - (*target - 1);
    return span > 0 ? static_cast<core::u16>(span) : core::u16{0};
}

core::Expected<core::u16> RollbackCoordinator::validate(engine::Tick now, core::u16 maxRollbackTicks)
{
    const auto target = currentTarget();
    if (!target)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "no rollback target latched");
    }

    const core::i16 span = now - (*target - 1);
    if (span < 0 || span > static_cast<core::i32>(maxRollbackTicks))
    {
        const std::string message = "rollback to tick " + engine::toString(*target)
                                  + " at tick " + engine::toString(now) + " spans "
                                  + std::to_string(span) + " ticks (max "
                                  + std::to_string(maxRollbackTicks) + "), aborted";
        core::Log::error("rollback", message);
        clear();
        return core::makeError(core::ErrorCode::kOutOfRange, message);
    }
    return static_cast<core::u16>(span);
}

} // namespace rwd::prediction
