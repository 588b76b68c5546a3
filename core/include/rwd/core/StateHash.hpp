/**
 * @file StateHash.hpp
 * @brief FNV-1a incremental hash.
 *
 * Used to fingerprint locally pre-spawned entities so that the authority's
 * spawn of the same entity can be matched back to the local copy.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_CORE_STATE_HASH_HPP
    #define RWD_CORE_STATE_HASH_HPP

    #include "Types.hpp"
    #include "Concepts.hpp"

    #include <span>
    #include <string_view>

namespace rwd::core {

/**
 * @brief Incremental FNV-1a hasher.
 */
class StateHash final {
public:
    static constexpr u64 kOffsetBasis = 14695981039346656037ULL;
    static constexpr u64 kPrime       = 1099511628211ULL;

    constexpr StateHash() = default;

    /**
     * @brief Feed a span of raw bytes into the hash.
     * @param data Byte span.
     * @return Reference to this hasher (for chaining).
     */
    constexpr StateHash &hashBytes(std::span<const byte> data)
    {
        for (const byte b : data) {
            _hash ^= static_cast<u64>(b);
            _hash *= kPrime;
        }
        return *this;
    }

    /**
     * @brief Feed a string into the hash (without terminator).
     */
    StateHash &hashString(std::string_view text)
    {
        return hashBytes(std::as_bytes(std::span<const char>{text.data(), text.size()}));
    }

    /**
     * @brief Feed a trivially-copyable value into the hash.
     * @tparam T Blittable type.
     * @param value Value to hash.
     * @return Reference to this hasher (for chaining).
     */
    template <Blittable T>
    StateHash &combine(const T &value)
    {
        const auto *ptr = reinterpret_cast<const byte *>(&value);
        return hashBytes({ptr, sizeof(T)});
    }

    /** @brief Returns the current digest. */
    [[nodiscard]] constexpr u64 digest() const { return _hash; }

    /** @brief Reset the hasher to its initial state. */
    constexpr void reset() { _hash = kOffsetBasis; }

private:
    u64 _hash = kOffsetBasis;
};

} // namespace rwd::core

#endif // RWD_CORE_STATE_HASH_HPP
