/**
 * @file HistoryBuffer.hpp
 * @brief Per-entity, per-component log of predicted values indexed by tick.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_HISTORYBUFFER_HPP
    #define RWD_PREDICTION_HISTORYBUFFER_HPP

#include <rwd/engine/Tick.hpp>
#include <rwd/core/Assert.hpp>
#include <rwd/core/Types.hpp>

#include <algorithm>
#include <deque>
#include <optional>

namespace rwd::prediction {

/**
 * @class HistoryState
 * @brief Value recorded at one tick: either Updated(value) or Removed.
 *
 * "No record" is expressed by an empty std::optional<HistoryState<T>>.
 */
template <typename T>
class HistoryState final
{
public:
    [[nodiscard]] static HistoryState updated(T value) { return HistoryState{std::move(value)}; }
    [[nodiscard]] static HistoryState removed() { return HistoryState{std::nullopt}; }

    /** @brief Updated when @p value holds something, Removed otherwise. */
    [[nodiscard]] static HistoryState from(std::optional<T> value) { return HistoryState{std::move(value)}; }

    [[nodiscard]] bool isUpdated() const noexcept { return _value.has_value(); }
    [[nodiscard]] bool isRemoved() const noexcept { return !_value.has_value(); }

    /** @brief The recorded value; only valid when @ref isUpdated. */
    [[nodiscard]] const T &value() const { return *_value; }

    [[nodiscard]] const std::optional<T> &asOptional() const noexcept { return _value; }

    [[nodiscard]] bool operator==(const HistoryState &other) const
        requires requires(const T &a, const T &b) { a == b; }
    {
        return _value == other._value;
    }

private:
    explicit HistoryState(std::optional<T> value) : _value{std::move(value)} {}

    std::optional<T> _value;
};

/**
 * @class HistoryBuffer
 * @brief Sparse, tick-ordered record of a component's predicted states.
 *
 * Entries are appended in non-decreasing tick order at the engine's current
 * tick, so the buffer never holds a tick newer than "now". The recorder
 * prunes everything older than the rollback horizon with @ref popUntilTick;
 * mismatch checks only read it through @ref stateAt.
 *
 * @tparam T Component type.
 */
template <typename T>
class HistoryBuffer final
{
public:
    struct Entry
    {
        engine::Tick    tick;
        HistoryState<T> state;
    };

    /**
     * @brief Records Updated(value), or Removed if @p value is empty.
     *
     * Recording twice at the same tick overwrites the first record.
     * @p tick must not be older than the most recent entry.
     */
    void record(engine::Tick tick, std::optional<T> value)
    {
        recordState(tick, HistoryState<T>::from(std::move(value)));
    }

    void recordState(engine::Tick tick, HistoryState<T> state)
    {
        if (!_entries.empty())
        {
            Entry &last = _entries.back();
            RWD_ASSERT(!(tick < last.tick));
            if (last.tick == tick)
            {
                last.state = std::move(state);
                return;
            }
        }
        _entries.push_back(Entry{tick, std::move(state)});
    }

    /**
     * @brief Returns the state at or most recently before @p tick, drops
     *        every older entry and re-files the returned state at @p tick.
     *
     * Returns empty and leaves the buffer untouched when every entry is
     * newer than @p tick.
     */
    std::optional<HistoryState<T>> popUntilTick(engine::Tick tick)
    {
        const auto it = upperBound(tick);
        if (it == _entries.begin())
            return std::nullopt;

        HistoryState<T> state = std::prev(it)->state;
        _entries.erase(_entries.begin(), it);
        _entries.push_front(Entry{tick, state});
        return state;
    }

    /**
     * @brief @ref popUntilTick followed by dropping every entry strictly
     *        after @p tick.
     */
    std::optional<HistoryState<T>> seekAndClearAfter(engine::Tick tick)
    {
        auto state = popUntilTick(tick);
        truncateAfter(tick);
        return state;
    }

    /** @brief Non-mutating lookup of the state at or before @p tick. */
    [[nodiscard]] std::optional<HistoryState<T>> stateAt(engine::Tick tick) const
    {
        const auto it = upperBound(tick);
        if (it == _entries.begin())
            return std::nullopt;
        return std::prev(it)->state;
    }

    /** @brief Drops entries strictly older than @p tick. */
    void clearUntilTick(engine::Tick tick)
    {
        const auto it = std::partition_point(_entries.begin(), _entries.end(),
                                             [tick](const Entry &e) { return e.tick < tick; });
        _entries.erase(_entries.begin(), it);
    }

    /** @brief Drops entries strictly newer than @p tick. */
    void truncateAfter(engine::Tick tick)
    {
        _entries.erase(upperBound(tick), _entries.end());
    }

    void clear() noexcept { _entries.clear(); }

    /** @brief Most recent entry, or nullptr. */
    [[nodiscard]] const Entry *peek() const noexcept
    {
        return _entries.empty() ? nullptr : &_entries.back();
    }

    /** @brief Oldest entry, or nullptr. */
    [[nodiscard]] const Entry *front() const noexcept
    {
        return _entries.empty() ? nullptr : &_entries.front();
    }

    /** @brief Shifts every stored tick by @p delta (timeline re-sync). */
    void shiftTicks(core::i16 delta)
    {
        for (auto &entry : _entries)
            entry.tick += delta;
    }

    [[nodiscard]] core::usize size()  const noexcept { return _entries.size(); }
    [[nodiscard]] bool        empty() const noexcept { return _entries.empty(); }

    [[nodiscard]] auto begin() const noexcept { return _entries.begin(); }
    [[nodiscard]] auto end()   const noexcept { return _entries.end(); }

private:
    using Storage = std::deque<Entry>;

    [[nodiscard]] typename Storage::const_iterator upperBound(engine::Tick tick) const
    {
        return std::partition_point(_entries.begin(), _entries.end(),
                                    [tick](const Entry &e) { return !(tick < e.tick); });
    }

    [[nodiscard]] typename Storage::iterator upperBound(engine::Tick tick)
    {
        return std::partition_point(_entries.begin(), _entries.end(),
                                    [tick](const Entry &e) { return !(tick < e.tick); });
    }

    Storage _entries;
};

} // namespace rwd::prediction

#endif // RWD_PREDICTION_HISTORYBUFFER_HPP
