/**
 * @file System.hpp
 * @brief System descriptor and scheduling phase definitions.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#pragma once

#ifndef RWD_ECS_SYSTEM_HPP
    #define RWD_ECS_SYSTEM_HPP

#include <rwd/ecs/Component.hpp>
#include <rwd/core/Types.hpp>

#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rwd::ecs {

/**
 * @enum SchedulePhase
 * @brief Logical phases within a single fixed tick, ordered by execution
 *        priority.
 */
enum class SchedulePhase : core::u8
{
    Input          = 0,
    PreSimulation  = 1,
    Simulation     = 2,
    PostSimulation = 3,
    History        = 4,

    Count
};

/**
 * @struct SystemDescriptor
 * @brief Declares a system's identity, phase, and component dependencies.
 *
 * The SystemScheduler uses these descriptors to build a DAG and detect
 * data hazards at registration time rather than runtime.
 */
struct SystemDescriptor
{
    std::string_view                 name;
    SchedulePhase                    phase;
    std::span<const ComponentAccess> accesses;
};

/**
 * @class ISystem
 * @brief Abstract base for all fixed-tick systems.
 *
 * Implementations override @ref descriptor to declare metadata and
 * @ref execute to perform per-tick logic.  The same instances run during
 * forward simulation and during rollback replay.
 */
class ISystem
{
public:
    virtual ~ISystem() = default;

    /** @brief Returns the static descriptor for this system. */
    [[nodiscard]] virtual const SystemDescriptor& descriptor() const noexcept = 0;

    /**
     * @brief Executes the system logic for one tick.
     * @param dt Fixed delta-time in seconds.
     */
    virtual void execute(core::f32 dt) = 0;
};

/**
 * @class FunctionSystem
 * @brief ISystem adapter around a callable, for small gameplay systems.
 */
class FunctionSystem final : public ISystem
{
public:
    FunctionSystem(std::string name,
                   SchedulePhase phase,
                   std::vector<ComponentAccess> accesses,
                   std::function<void(core::f32)> body)
        : _name{std::move(name)}
        , _accesses{std::move(accesses)}
        , _body{std::move(body)}
        , _descriptor{_name, phase, _accesses}
    {}

    [[nodiscard]] const SystemDescriptor& descriptor() const noexcept override { return _descriptor; }

    void execute(core::f32 dt) override { _body(dt); }

private:
    std::string                    _name;
    std::vector<ComponentAccess>   _accesses;
    std::function<void(core::f32)> _body;
    SystemDescriptor               _descriptor;
};

} // namespace rwd::ecs

#endif // RWD_ECS_SYSTEM_HPP
