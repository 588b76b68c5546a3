/**
 * @file Entity.hpp
 * @brief Generation-checked entity handle.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#pragma once

#ifndef RWD_ECS_ENTITY_HPP
    #define RWD_ECS_ENTITY_HPP

#include <rwd/core/Types.hpp>
#include <rwd/core/Constants.hpp>

#include <functional>
#include <string>

namespace rwd::ecs {

/**
 * @brief 32-bit handle: generation in the high kGenerationBits, slot in
 *        the low kSlotBits.
 *
 * A predicted entity keeps the handle of its confirmed mirror (and the
 * other way round) across many frames, so the generation is what tells a
 * link to a despawned, recycled slot from a live one. The all-ones value
 * is the null handle.
 */
class EntityId final
{
public:
    static constexpr core::u32 kSlotBits       = core::kSlotBits;
    static constexpr core::u32 kSlotMask       = (1u << kSlotBits) - 1u;
    static constexpr core::u32 kGenerationMask = (1u << core::kGenerationBits) - 1u;

    constexpr EntityId() noexcept = default;

    constexpr EntityId(core::u32 generation, core::u32 slot) noexcept
        : _bits{((generation & kGenerationMask) << kSlotBits) | (slot & kSlotMask)}
    {}

    [[nodiscard]] constexpr core::u32 slot() const noexcept       { return _bits & kSlotMask; }
    [[nodiscard]] constexpr core::u32 generation() const noexcept { return _bits >> kSlotBits; }
    [[nodiscard]] constexpr core::u32 raw() const noexcept        { return _bits; }
    [[nodiscard]] constexpr bool      isValid() const noexcept    { return _bits != kNullBits; }

    /** @brief Handle the slot gets once this one is despawned. */
    [[nodiscard]] constexpr EntityId recycled() const noexcept { return EntityId{generation() + 1, slot()}; }

    [[nodiscard]] constexpr bool operator==(const EntityId &) const noexcept = default;

private:
    static constexpr core::u32 kNullBits = ~core::u32{0};

    core::u32 _bits{kNullBits};
};

/** @brief "slot:generation", or "null". */
[[nodiscard]] inline std::string toString(EntityId id)
{
    if (!id.isValid())
        return "null";
    return std::to_string(id.slot()) + ":" + std::to_string(id.generation());
}

} // namespace rwd::ecs

template <>
struct std::hash<rwd::ecs::EntityId>
{
    [[nodiscard]] std::size_t operator()(rwd::ecs::EntityId id) const noexcept
    {
        return std::hash<rwd::core::u32>{}(id.raw());
    }
};

#endif // RWD_ECS_ENTITY_HPP
