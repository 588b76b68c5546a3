/**
 * @file SparseSet.hpp
 * @brief Slot-indexed sparse set with a paged sparse index.
 *
 * Every World component pool is one SparseSet, so most of them only ever
 * see a handful of slots out of kMaxEntities. The sparse index is split
 * into pages of kPageSize slots that are allocated on first insert,
 * which keeps an idle pool at a few bytes. Values stay packed in the
 * dense array for iteration; removal is swap-and-pop.
 *
 * Generation checks are the owner's job (see ecs::World).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_CONTAINER_SPARSE_SET_HPP
    #define RWD_CONTAINER_SPARSE_SET_HPP

    #include <rwd/core/Constants.hpp>
    #include <rwd/core/Types.hpp>

    #include <array>
    #include <memory>
    #include <span>
    #include <vector>

namespace rwd::container {

template <typename T>
class SparseSet final {
public:
    static constexpr core::u32 kPageSize = 256;

    /** @param capacity Exclusive upper bound on slot values. */
    explicit SparseSet(core::u32 capacity = core::kMaxEntities);

    /** @return false if @p slot is out of range or already present. */
    bool insert(core::u32 slot, T value);

    /** @return the stored value, or nullptr if @p slot is out of range. */
    T *insertOrAssign(core::u32 slot, T value);

    bool remove(core::u32 slot);

    [[nodiscard]] T       *find(core::u32 slot);
    [[nodiscard]] const T *find(core::u32 slot) const;
    [[nodiscard]] bool     contains(core::u32 slot) const { return denseIndex(slot) != kAbsent; }

    [[nodiscard]] core::u32                  size()  const { return static_cast<core::u32>(_values.size()); }
    [[nodiscard]] bool                       empty() const { return _values.empty(); }
    [[nodiscard]] std::span<T>               dense()       { return _values; }
    [[nodiscard]] std::span<const T>         dense() const { return _values; }
    [[nodiscard]] std::span<const core::u32> ids()   const { return _slots; }

    /** @brief Number of sparse pages currently allocated. */
    [[nodiscard]] core::u32 pageCount() const;

private:
    static constexpr core::u32 kAbsent = ~core::u32{0};
    using Page = std::array<core::u32, kPageSize>;

    [[nodiscard]] core::u32 denseIndex(core::u32 slot) const;
    core::u32 *indexCell(core::u32 slot);

    core::u32                          _capacity;
    std::vector<std::unique_ptr<Page>> _pages;
    std::vector<T>                     _values;
    std::vector<core::u32>             _slots; ///< Slot of each dense value.
};

} // namespace rwd::container

    #include "SparseSet.inl"

#endif // RWD_CONTAINER_SPARSE_SET_HPP
