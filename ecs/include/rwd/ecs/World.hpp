/**
 * @file World.hpp
 * @brief Entity store: slot/generation table plus one sparse-set pool per
 *        component kind.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#pragma once

#ifndef RWD_ECS_WORLD_HPP
    #define RWD_ECS_WORLD_HPP

#include <rwd/ecs/Entity.hpp>
#include <rwd/ecs/Component.hpp>
#include <rwd/container/SparseSet.hpp>
#include <rwd/core/Concepts.hpp>
#include <rwd/core/Constants.hpp>
#include <rwd/core/Expected.hpp>
#include <rwd/core/Pinned.hpp>
#include <rwd/core/Types.hpp>

#include <memory>
#include <vector>

namespace rwd::ecs {

namespace detail {

/**
 * @brief Type-erased view of a component pool, used for whole-entity
 *        operations (despawn) that do not know the component type.
 */
class IComponentPool
{
public:
    virtual ~IComponentPool() = default;

    virtual bool                    removeSlot(core::u32 slot)         = 0;
    [[nodiscard]] virtual bool      containsSlot(core::u32 slot) const = 0;
    [[nodiscard]] virtual core::u32 size() const                       = 0;
};

template <typename T>
class ComponentPool final : public IComponentPool
{
public:
    explicit ComponentPool(core::u32 capacity) : set{capacity} {}

    bool removeSlot(core::u32 slot) override { return set.remove(slot); }
    [[nodiscard]] bool containsSlot(core::u32 slot) const override { return set.contains(slot); }
    [[nodiscard]] core::u32 size() const override { return set.size(); }

    container::SparseSet<T> set;
};

class IResourceSlot
{
public:
    virtual ~IResourceSlot() = default;
};

template <typename R>
class ResourceSlot final : public IResourceSlot
{
public:
    explicit ResourceSlot(R initial) : value{std::move(initial)} {}

    R value;
};

} // namespace detail

/**
 * @class World
 * @brief Owns entities and their components.
 *
 * Entities are created with a unique slot + generation. On despawn the
 * slot is recycled and the generation is bumped, invalidating stale
 * EntityIds.  Components live in one SparseSet per type, created lazily
 * on first insertion.
 *
 * A disabled entity keeps its components but is skipped by @ref each.
 *
 * Resources are single values owned by the world itself (match clock,
 * score, random state), keyed by type like components.
 *
 * @par Thread safety
 * Concurrent @ref get / @ref has calls on distinct entities are safe as
 * long as no thread inserts, removes or despawns.  Structural changes
 * made while iterating must go through a CommandBuffer.
 */
class World final : public core::Pinned
{
public:
    /**
     * @brief Creates an empty world.
     * @param capacity Maximum number of simultaneously live entities.
     */
    explicit World(core::u32 capacity = core::kMaxEntities);
    ~World();

    // --------------------------------------------------------------------- //
    //  Entity lifecycle                                                      //
    // --------------------------------------------------------------------- //

    /**
     * @brief Creates a new, empty entity.
     * @return Entity identifier, or error on slot exhaustion.
     */
    [[nodiscard]] core::Expected<EntityId> spawn();

    /**
     * @brief Destroys an entity and all of its components.
     * @return OK, or kNotFound if the entity is already dead.
     */
    [[nodiscard]] core::Expected<void> despawn(EntityId id);

    /** @brief Tests whether an entity is alive (generation matches). */
    [[nodiscard]] bool isAlive(EntityId id) const noexcept;

    /** @brief Returns the total number of live entities. */
    [[nodiscard]] core::u32 liveCount() const noexcept;

    /**
     * @brief Enables or disables an entity.
     * @return OK, or kNotFound if the entity is dead.
     */
    [[nodiscard]] core::Expected<void> setDisabled(EntityId id, bool disabled);

    /** @brief Tests whether a live entity is disabled. */
    [[nodiscard]] bool isDisabled(EntityId id) const noexcept;

    // --------------------------------------------------------------------- //
    //  Components                                                            //
    // --------------------------------------------------------------------- //

    /**
     * @brief Inserts or overwrites a component.
     * @return Pointer to the stored component, or nullptr if @p id is dead.
     */
    template <core::ComponentType T>
    T *insert(EntityId id, T value);

    /**
     * @brief Removes a component.
     * @return True if the entity had the component.
     */
    template <core::ComponentType T>
    bool remove(EntityId id);

    template <core::ComponentType T>
    [[nodiscard]] T *get(EntityId id);

    template <core::ComponentType T>
    [[nodiscard]] const T *get(EntityId id) const;

    template <core::ComponentType T>
    [[nodiscard]] bool has(EntityId id) const;

    /** @brief Number of entities holding @p T (disabled included). */
    template <core::ComponentType T>
    [[nodiscard]] core::u32 count() const;

    /**
     * @brief Calls @p fn(EntityId, T&, Others&...) for every enabled entity
     *        holding all listed components.
     *
     * The pool of @p T must not change shape while iterating.
     */
    template <core::ComponentType T, core::ComponentType... Others, typename F>
    void each(F &&fn);

    /** @brief Same as @ref each, disabled entities included. */
    template <core::ComponentType T, core::ComponentType... Others, typename F>
    void eachIncludingDisabled(F &&fn);

    /** @brief Snapshot of the entities holding @p T. */
    template <core::ComponentType T>
    [[nodiscard]] std::vector<EntityId> entitiesWith(bool includeDisabled = false) const;

    // --------------------------------------------------------------------- //
    //  Resources                                                             //
    // --------------------------------------------------------------------- //

    /** @brief Inserts or overwrites the resource of type @p R. */
    template <core::ComponentType R>
    R &insertResource(R value);

    /** @return True if the resource existed. */
    template <core::ComponentType R>
    bool removeResource();

    template <core::ComponentType R>
    [[nodiscard]] R *resource();

    template <core::ComponentType R>
    [[nodiscard]] const R *resource() const;

    template <core::ComponentType R>
    [[nodiscard]] bool hasResource() const { return resource<R>() != nullptr; }

private:
    template <core::ComponentType T>
    detail::ComponentPool<T> *findPool() const;

    template <core::ComponentType T>
    detail::ComponentPool<T> &ensurePool();

    template <bool IncludeDisabled, core::ComponentType T, core::ComponentType... Others, typename F>
    void iterate(F &&fn);

    /** @brief Returns the live id occupying @p slot, or a null id. */
    [[nodiscard]] EntityId entityAtSlot(core::u32 slot) const noexcept;
    [[nodiscard]] bool     isSlotDisabled(core::u32 slot) const noexcept;

    struct Impl;
    std::unique_ptr<Impl>                                 _impl;
    std::vector<std::unique_ptr<detail::IComponentPool>>  _pools;
    std::vector<std::unique_ptr<detail::IResourceSlot>>   _resources;
    core::u32                                             _capacity;
};

} // namespace rwd::ecs

#include "World.inl"

#endif // RWD_ECS_WORLD_HPP
