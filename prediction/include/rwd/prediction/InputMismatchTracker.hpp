/**
 * @file InputMismatchTracker.hpp
 * @brief Earliest remote-input signals fed by the input layer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_INPUTMISMATCHTRACKER_HPP
    #define RWD_PREDICTION_INPUTMISMATCHTRACKER_HPP

#include <rwd/engine/Tick.hpp>
#include <rwd/core/Pinned.hpp>
#include <rwd/core/Types.hpp>

#include <atomic>
#include <optional>

namespace rwd::prediction {

/**
 * @class InputMismatchTracker
 * @brief Collects, between two detection passes, the earliest tick for
 *        which a remote input arrived and the earliest tick for which it
 *        disagreed with what the client assumed when predicting.
 *
 * Reports may come from any thread.
 */
class InputMismatchTracker final : public core::Pinned
{
public:
    struct Signals
    {
        std::optional<engine::Tick> earliestRemoteInput;
        std::optional<engine::Tick> earliestMismatch;
    };

    InputMismatchTracker() = default;

    /** @brief A remote input for @p tick was received. */
    void reportRemoteInput(engine::Tick tick) noexcept;

    /** @brief The remote input for @p tick differs from the predicted one. */
    void reportMismatch(engine::Tick tick) noexcept;

    /** @brief Current signals, without resetting. */
    [[nodiscard]] Signals peek() const noexcept;

    /** @brief Returns the signals and resets both to "nothing". */
    Signals take() noexcept;

private:
    static constexpr core::u32 kNone = 0x1'0000;

    static void offer(std::atomic<core::u32> &slot, engine::Tick tick) noexcept;
    static std::optional<engine::Tick> decode(core::u32 raw) noexcept;

    std::atomic<core::u32> _earliestRemoteInput{kNone};
    std::atomic<core::u32> _earliestMismatch{kNone};
};

} // namespace rwd::prediction

#endif // RWD_PREDICTION_INPUTMISMATCHTRACKER_HPP
