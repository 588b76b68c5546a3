/**
 * @file ReplicationBridge.hpp
 * @brief Entry point for authoritative updates into the local World.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_PREDICTION_REPLICATIONBRIDGE_HPP
    #define RWD_PREDICTION_REPLICATIONBRIDGE_HPP

#include <rwd/prediction/Components.hpp>
#include <rwd/ecs/World.hpp>
#include <rwd/engine/Tick.hpp>
#include <rwd/core/Expected.hpp>
#include <rwd/core/Types.hpp>

#include <optional>
#include <string>

namespace rwd::prediction {

/** @brief A predicted entity and its confirmed mirror. */
struct LinkedPair
{
    ecs::EntityId predicted;
    ecs::EntityId confirmed;
};

/**
 * @class ReplicationBridge
 * @brief Writes authoritative state into confirmed mirrors.
 *
 * The transport layer decodes packets and calls @ref receive once per
 * (mirror, component, tick). The bridge only touches mirror entities and
 * raises their changed flag; the next detection pass does the rest.
 */
class ReplicationBridge final
{
public:
    explicit ReplicationBridge(ecs::World &world) noexcept : _world{world} {}

    /** @brief Spawns a predicted entity and its mirror, already linked. */
    [[nodiscard]] core::Expected<LinkedPair> spawnPair();

    /**
     * @brief Links an existing predicted entity to an existing mirror.
     * @return kNotFound if either entity is dead, kAlreadyExists if the
     *         mirror already serves another predicted entity.
     */
    [[nodiscard]] core::Expected<void> link(ecs::EntityId predicted, ecs::EntityId mirror);

    /**
     * @brief Applies the authoritative value of @p C at @p tick.
     *
     * An empty @p value means the authority removed the component.
     *
     * @return kNotFound for an unknown mirror, kOutOfRange for an update
     *         older than what the mirror already holds.
     */
    template <core::ComponentType C>
    [[nodiscard]] core::Expected<void> receive(ecs::EntityId mirror, engine::Tick tick,
                                               std::optional<C> value)
    {
        auto *confirmed = RWD_TRY(acceptUpdate(mirror, tick));
        if (value)
            _world.insert(mirror, std::move(*value));
        else
            _world.remove<C>(mirror);
        confirmed->tick     = tick;
        confirmed->changed  = true;
        confirmed->received = true;
        return {};
    }

    /**
     * @brief Despawns one side of a link.
     *
     * The other side survives with its link cleared: a predicted entity
     * without mirror keeps running on its own history. A predicted entity
     * that was already prediction-despawned goes with its mirror.
     */
    [[nodiscard]] core::Expected<void> despawn(ecs::EntityId entity);

private:
    [[nodiscard]] core::Expected<Confirmed *> acceptUpdate(ecs::EntityId mirror, engine::Tick tick);

    ecs::World &_world;
};

} // namespace rwd::prediction

#endif // RWD_PREDICTION_REPLICATIONBRIDGE_HPP
