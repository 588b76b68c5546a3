/**
 * @file World.cpp
 * @brief Slot table, free-list and whole-entity operations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/ecs/World.hpp>
#include <rwd/core/Assert.hpp>

#include <algorithm>

namespace rwd::ecs {

// ========================================================================== //
//  Impl: slot metadata + LIFO free-list                                      //
// ========================================================================== //

struct World::Impl
{
    struct SlotInfo
    {
        core::u32 generation{0};
        bool      alive{false};
        bool      disabled{false};
    };

    std::vector<SlotInfo>  slots;
    std::vector<core::u32> freeList;
    core::u32              liveCount{0};

    core::u32 allocateSlot(core::u32 capacity)
    {
        if (!freeList.empty())
        {
            const core::u32 slot = freeList.back();
            freeList.pop_back();
            return slot;
        }
        const auto slot = static_cast<core::u32>(slots.size());
        if (slot >= capacity)
            return capacity;
        slots.emplace_back();
        return slot;
    }
};

// ========================================================================== //
//  World                                                                     //
// ========================================================================== //

World::World(core::u32 capacity)
    : _impl{std::make_unique<Impl>()}
    , _capacity{std::min<core::u32>(capacity, 1u << EntityId::kSlotBits)}
{
    _impl->slots.reserve(std::min<core::u32>(_capacity, 1024));
}

World::~World() = default;

core::Expected<EntityId> World::spawn()
{
    const core::u32 slot = _impl->allocateSlot(_capacity);
    if (slot >= _capacity)
    {
        return core::makeError(core::ErrorCode::kOutOfMemory, "Entity slot pool exhausted");
    }

    auto &info    = _impl->slots[slot];
    info.alive    = true;
    info.disabled = false;
    ++_impl->liveCount;

    return EntityId{info.generation, slot};
}

core::Expected<void> World::despawn(EntityId id)
{
    if (!isAlive(id))
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "despawn of dead entity " + toString(id));
    }

    const core::u32 slot = id.slot();
    for (auto &pool : _pools)
    {
        if (pool)
            pool->removeSlot(slot);
    }

    auto &info = _impl->slots[slot];
    info.alive    = false;
    info.disabled = false;
    info.generation = id.recycled().generation();
    _impl->freeList.push_back(slot);

    RWD_ASSERT(_impl->liveCount > 0);
    --_impl->liveCount;
    return {};
}

bool World::isAlive(EntityId id) const noexcept
{
    if (!id.isValid())
        return false;
    const core::u32 slot = id.slot();
    if (slot >= _impl->slots.size())
        return false;
    const auto &info = _impl->slots[slot];
    return info.alive && info.generation == id.generation();
}

core::u32 World::liveCount() const noexcept
{
    return _impl->liveCount;
}

core::Expected<void> World::setDisabled(EntityId id, bool disabled)
{
    if (!isAlive(id))
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "setDisabled on dead entity " + toString(id));
    }
    _impl->slots[id.slot()].disabled = disabled;
    return {};
}

bool World::isDisabled(EntityId id) const noexcept
{
    return isAlive(id) && _impl->slots[id.slot()].disabled;
}

EntityId World::entityAtSlot(core::u32 slot) const noexcept
{
    if (slot >= _impl->slots.size() || !_impl->slots[slot].alive)
        return EntityId{};
    return EntityId{_impl->slots[slot].generation, slot};
}

bool World::isSlotDisabled(core::u32 slot) const noexcept
{
    return slot < _impl->slots.size() && _impl->slots[slot].disabled;
}

} // namespace rwd::ecs
