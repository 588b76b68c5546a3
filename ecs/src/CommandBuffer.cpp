/**
 * @file CommandBuffer.cpp
 * @brief CommandBuffer implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/ecs/CommandBuffer.hpp>
#include <rwd/core/Log.hpp>

#include <string>

namespace rwd::ecs {

void CommandBuffer::despawn(EntityId id)
{
    _commands.emplace_back([id](World &world) { return world.despawn(id); });
}

void CommandBuffer::setDisabled(EntityId id, bool disabled)
{
    _commands.emplace_back([id, disabled](World &world) { return world.setDisabled(id, disabled); });
}

void CommandBuffer::push(Command command)
{
    _commands.push_back(std::move(command));
}

core::u32 CommandBuffer::apply(World &world)
{
    std::vector<Command> pending;
    pending.swap(_commands);

    core::u32 applied = 0;
    for (auto &command : pending)
    {
        if (core::reportFailure(command(world), "ecs", core::LogLevel::kDebug))
            ++applied;
    }
    return applied;
}

} // namespace rwd::ecs
