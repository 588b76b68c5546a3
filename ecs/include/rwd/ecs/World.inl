/**
 * @file World.inl
 * @brief Template implementation of the World component accessors.
 * @see   World.hpp
 */

#ifndef RWD_ECS_WORLD_INL
    #define RWD_ECS_WORLD_INL

#include <tuple>

namespace rwd::ecs {

template <core::ComponentType T>
detail::ComponentPool<T> *World::findPool() const
{
    const ComponentKind kind = componentKind<T>();
    if (kind >= _pools.size() || !_pools[kind])
        return nullptr;
    return static_cast<detail::ComponentPool<T> *>(_pools[kind].get());
}

template <core::ComponentType T>
detail::ComponentPool<T> &World::ensurePool()
{
    const ComponentKind kind = componentKind<T>();
    if (kind >= _pools.size())
        _pools.resize(kind + 1);
    if (!_pools[kind])
        _pools[kind] = std::make_unique<detail::ComponentPool<T>>(_capacity);
    return *static_cast<detail::ComponentPool<T> *>(_pools[kind].get());
}

template <core::ComponentType T>
T *World::insert(EntityId id, T value)
{
    if (!isAlive(id))
        return nullptr;
    return ensurePool<T>().set.insertOrAssign(id.slot(), std::move(value));
}

template <core::ComponentType T>
bool World::remove(EntityId id)
{
    if (!isAlive(id))
        return false;
    auto *pool = findPool<T>();
    return pool && pool->set.remove(id.slot());
}

template <core::ComponentType T>
T *World::get(EntityId id)
{
    if (!isAlive(id))
        return nullptr;
    auto *pool = findPool<T>();
    return pool ? pool->set.find(id.slot()) : nullptr;
}

template <core::ComponentType T>
const T *World::get(EntityId id) const
{
    if (!isAlive(id))
        return nullptr;
    const auto *pool = findPool<T>();
    return pool ? pool->set.find(id.slot()) : nullptr;
}

template <core::ComponentType T>
bool World::has(EntityId id) const
{
    return get<T>(id) != nullptr;
}

template <core::ComponentType T>
core::u32 World::count() const
{
    const auto *pool = findPool<T>();
    return pool ? pool->set.size() : 0;
}

template <bool IncludeDisabled, core::ComponentType T, core::ComponentType... Others, typename F>
void World::iterate(F &&fn)
{
    auto *pool = findPool<T>();
    if (!pool)
        return;

    auto others = std::make_tuple(findPool<Others>()...);
    const bool missing = std::apply([](auto *...p) { return ((p == nullptr) || ...); }, others);
    if (missing)
        return;

    const auto ids = pool->set.ids();
    for (core::usize i = 0; i < ids.size(); ++i)
    {
        const core::u32 slot = ids[i];
        if constexpr (!IncludeDisabled)
        {
            if (isSlotDisabled(slot))
                continue;
        }

        const bool complete = std::apply(
            [slot](auto *...p) { return (p->set.contains(slot) && ...); }, others);
        if (!complete)
            continue;

        std::apply(
            [&](auto *...p) {
                fn(entityAtSlot(slot), pool->set.dense()[i], *p->set.find(slot)...);
            },
            others);
    }
}

template <core::ComponentType T, core::ComponentType... Others, typename F>
void World::each(F &&fn)
{
    iterate<false, T, Others...>(std::forward<F>(fn));
}

template <core::ComponentType T, core::ComponentType... Others, typename F>
void World::eachIncludingDisabled(F &&fn)
{
    iterate<true, T, Others...>(std::forward<F>(fn));
}

template <core::ComponentType T>
std::vector<EntityId> World::entitiesWith(bool includeDisabled) const
{
    std::vector<EntityId> out;
    const auto *pool = findPool<T>();
    if (!pool)
        return out;

    out.reserve(pool->set.size());
    for (const core::u32 slot : pool->set.ids())
    {
        if (!includeDisabled && isSlotDisabled(slot))
            continue;
        out.push_back(entityAtSlot(slot));
    }
    return out;
}

// -------------------------------------------------------------------------- //
//  Resources                                                                 //
// -------------------------------------------------------------------------- //

template <core::ComponentType R>
R &World::insertResource(R value)
{
    const ComponentKind kind = componentKind<R>();
    if (kind >= _resources.size())
        _resources.resize(kind + 1);

    if (auto *slot = static_cast<detail::ResourceSlot<R> *>(_resources[kind].get()))
    {
        slot->value = std::move(value);
        return slot->value;
    }
    auto slot = std::make_unique<detail::ResourceSlot<R>>(std::move(value));
    R &stored = slot->value;
    _resources[kind] = std::move(slot);
    return stored;
}

template <core::ComponentType R>
bool World::removeResource()
{
    const ComponentKind kind = componentKind<R>();
    if (kind >= _resources.size() || !_resources[kind])
        return false;
    _resources[kind].reset();
    return true;
}

template <core::ComponentType R>
R *World::resource()
{
    const ComponentKind kind = componentKind<R>();
    if (kind >= _resources.size() || !_resources[kind])
        return nullptr;
    return &static_cast<detail::ResourceSlot<R> *>(_resources[kind].get())->value;
}

template <core::ComponentType R>
const R *World::resource() const
{
    const ComponentKind kind = componentKind<R>();
    if (kind >= _resources.size() || !_resources[kind])
        return nullptr;
    return &static_cast<const detail::ResourceSlot<R> *>(_resources[kind].get())->value;
}

} // namespace rwd::ecs

#endif // RWD_ECS_WORLD_INL
