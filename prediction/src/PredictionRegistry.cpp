/**
 * @file PredictionRegistry.cpp
 * @brief PredictionRegistry lookup.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwd/prediction/PredictionRegistry.hpp>

#include <algorithm>

namespace rwd::prediction {

const ComponentHooks *PredictionRegistry::find(ecs::ComponentKind kind) const noexcept
{
    const auto it = std::find_if(_hooks.begin(), _hooks.end(),
                                 [kind](const ComponentHooks &h) { return h.kind == kind; });
    return it == _hooks.end() ? nullptr : &*it;
}

} // namespace rwd::prediction
