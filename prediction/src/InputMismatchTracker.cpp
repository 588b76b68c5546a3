/**
 * @file InputMismatchTracker.cpp
 * @brief InputMismatchTracker implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/prediction/InputMismatchTracker.hpp>
#include <rwd/concurrency/AtomicHelpers.hpp>

namespace rwd::prediction {

void InputMismatchTracker::offer(std::atomic<core::u32> &slot, engine::Tick tick) noexcept
{
    concurrency::atomicFetchMin(slot, static_cast<core::u32>(tick.value()),
        [](core::u32 current, core::u32 offered) {
            if (current == kNone)
                return true;
            return engine::Tick{static_cast<core::u16>(offered)}
                 < engine::Tick{static_cast<core::u16>(current)};
        });
}

std::optional<engine::Tick> InputMismatchTracker::decode(core::u32 raw) noexcept
{
    if (raw == kNone)
        return std::nullopt;
    return engine::Tick{static_cast<core::u16>(raw)};
}

void InputMismatchTracker::reportRemoteInput(engine::Tick tick) noexcept
{
    offer(_earliestRemoteInput, tick);
}

void InputMismatchTracker::reportMismatch(engine::Tick tick) noexcept
{
    offer(_earliestRemoteInput, tick);
    offer(_earliestMismatch, tick);
}

InputMismatchTracker::Signals InputMismatchTracker::peek() const noexcept
{
    return Signals{decode(concurrency::atomicLoad(_earliestRemoteInput)),
                   decode(concurrency::atomicLoad(_earliestMismatch))};
}

InputMismatchTracker::Signals InputMismatchTracker::take() noexcept
{
    return Signals{decode(_earliestRemoteInput.exchange(kNone, std::memory_order_acq_rel)),
                   decode(_earliestMismatch.exchange(kNone, std::memory_order_acq_rel))};
}

} // namespace rwd::prediction
