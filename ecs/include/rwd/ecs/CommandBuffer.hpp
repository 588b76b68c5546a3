/**
 * @file CommandBuffer.hpp
 * @brief Deferred structural mutations, applied after iteration.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#pragma once

#ifndef RWD_ECS_COMMANDBUFFER_HPP
    #define RWD_ECS_COMMANDBUFFER_HPP

#include <rwd/ecs/World.hpp>
#include <rwd/core/Expected.hpp>
#include <rwd/core/Types.hpp>

#include <functional>
#include <vector>

namespace rwd::ecs {

/**
 * @class CommandBuffer
 * @brief Records spawns, despawns and component changes while a World is
 *        being iterated, then replays them in submission order.
 *
 * A command that fails on apply (e.g. despawning an entity that another
 * command already removed) is logged at debug level and skipped; the
 * remaining commands still run.
 *
 * Not thread-safe: record from one thread.
 */
class CommandBuffer final
{
public:
    using Command = std::function<core::Expected<void>(World &)>;

    /** @brief Queues a despawn. */
    void despawn(EntityId id);

    /** @brief Queues a disable / enable toggle. */
    void setDisabled(EntityId id, bool disabled);

    /** @brief Queues an insert-or-overwrite of @p value. */
    template <core::ComponentType T>
    void insert(EntityId id, T value)
    {
        _commands.emplace_back([id, v = std::move(value)](World &world) mutable -> core::Expected<void> {
            if (!world.insert<T>(id, std::move(v)))
                return core::makeError(core::ErrorCode::kNotFound,
                                       "insert on dead entity " + toString(id));
            return {};
        });
    }

    /** @brief Queues a component removal (missing component is not an error). */
    template <core::ComponentType T>
    void remove(EntityId id)
    {
        _commands.emplace_back([id](World &world) -> core::Expected<void> {
            world.remove<T>(id);
            return {};
        });
    }

    /** @brief Queues an arbitrary mutation. */
    void push(Command command);

    /**
     * @brief Applies and drains every queued command.
     * @return Number of commands that succeeded.
     */
    core::u32 apply(World &world);

    [[nodiscard]] core::usize size()  const noexcept { return _commands.size(); }
    [[nodiscard]] bool        empty() const noexcept { return _commands.empty(); }
    void                      clear() noexcept       { _commands.clear(); }

private:
    std::vector<Command> _commands;
};

} // namespace rwd::ecs

#endif // RWD_ECS_COMMANDBUFFER_HPP
