/**
 * @file Config.hpp
 * @brief Engine configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_ENGINE_CONFIG_HPP
    #define RWD_ENGINE_CONFIG_HPP

#include <rwd/core/Types.hpp>
#include <rwd/core/Constants.hpp>
#include <rwd/core/Expected.hpp>

namespace rwd::engine {

/** @brief Immutable engine configuration. */
class Config
{
public:
    /** @brief Fluent builder for Config. */
    class Builder
    {
    public:
        Builder& tickRate(core::u32 hz) noexcept;
        Builder& workerThreads(core::u32 n) noexcept;
        Builder& maxEntities(core::u32 n) noexcept;

        /**
         * @brief Validates and produces the configuration.
         * @return kInvalidArgument on a zero tick rate or entity budget.
         */
        [[nodiscard]] core::Expected<Config> build() const;

    private:
        core::u32 _tickRate{core::kTickRate};
        core::u32 _workerThreads{0};
        core::u32 _maxEntities{core::kMaxEntities};
    };

    [[nodiscard]] core::u32 tickRate()      const noexcept { return _tickRate; }
    [[nodiscard]] core::u32 workerThreads() const noexcept { return _workerThreads; }
    [[nodiscard]] core::u32 maxEntities()   const noexcept { return _maxEntities; }
    [[nodiscard]] core::f64 timestep()      const noexcept { return 1.0 / static_cast<core::f64>(_tickRate); }

private:
    friend class Builder;

    core::u32 _tickRate{core::kTickRate};
    core::u32 _workerThreads{0};
    core::u32 _maxEntities{core::kMaxEntities};
};

} // namespace rwd::engine

#endif // RWD_ENGINE_CONFIG_HPP
