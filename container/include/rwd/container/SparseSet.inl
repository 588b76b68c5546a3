/**
 * @file SparseSet.inl
 * @brief SparseSet template implementation.
 */

#ifndef RWD_CONTAINER_SPARSE_SET_INL
    #define RWD_CONTAINER_SPARSE_SET_INL

    #include <algorithm>

namespace rwd::container {

template <typename T>
SparseSet<T>::SparseSet(core::u32 capacity)
    : _capacity{capacity}
    , _pages((capacity + kPageSize - 1) / kPageSize)
{
}

template <typename T>
core::u32 SparseSet<T>::denseIndex(core::u32 slot) const
{
    if (slot >= _capacity)
        return kAbsent;
    const auto &page = _pages[slot / kPageSize];
    return page ? (*page)[slot % kPageSize] : kAbsent;
}

template <typename T>
core::u32 *SparseSet<T>::indexCell(core::u32 slot)
{
    auto &page = _pages[slot / kPageSize];
    if (!page)
    {
        page = std::make_unique<Page>();
        page->fill(kAbsent);
    }
    return &(*page)[slot % kPageSize];
}

template <typename T>
bool SparseSet<T>::insert(core::u32 slot, T value)
{
    if (slot >= _capacity)
        return false;

    core::u32 *cell = indexCell(slot);
    if (*cell != kAbsent)
        return false;

    *cell = static_cast<core::u32>(_values.size());
    _values.push_back(std::move(value));
    _slots.push_back(slot);
    return true;
}

template <typename T>
T *SparseSet<T>::insertOrAssign(core::u32 slot, T value)
{
    if (T *existing = find(slot))
    {
        *existing = std::move(value);
        return existing;
    }
    return insert(slot, std::move(value)) ? &_values.back() : nullptr;
}

template <typename T>
bool SparseSet<T>::remove(core::u32 slot)
{
    const core::u32 index = denseIndex(slot);
    if (index == kAbsent)
        return false;

    const core::u32 last = size() - 1;
    if (index != last)
    {
        const core::u32 moved = _slots[last];
        _values[index] = std::move(_values[last]);
        _slots[index] = moved;
        *indexCell(moved) = index;
    }
    _values.pop_back();
    _slots.pop_back();
    *indexCell(slot) = kAbsent;
    return true;
}

template <typename T>
T *SparseSet<T>::find(core::u32 slot)
{
    const core::u32 index = denseIndex(slot);
    return index == kAbsent ? nullptr : &_values[index];
}

template <typename T>
const T *SparseSet<T>::find(core::u32 slot) const
{
    const core::u32 index = denseIndex(slot);
    return index == kAbsent ? nullptr : &_values[index];
}

template <typename T>
core::u32 SparseSet<T>::pageCount() const
{
    return static_cast<core::u32>(std::count_if(_pages.begin(), _pages.end(), [](const auto &page) { return page != nullptr; }));
}

} // namespace rwd::container

#endif // RWD_CONTAINER_SPARSE_SET_INL
