/**
 * @file Pinned.hpp
 * @brief Base for objects that live at a fixed address.
 *
 * The engine services are wired together by reference (the preparer
 * holds the registry, the executor holds the coordinator, systems hold
 * the World) so none of them may be copied or moved once constructed.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_CORE_PINNED_HPP
    #define RWD_CORE_PINNED_HPP

namespace rwd::core {

class Pinned {
protected:
    Pinned()  = default;
    ~Pinned() = default;

public:
    Pinned(const Pinned &)            = delete;
    Pinned &operator=(const Pinned &) = delete;
    Pinned(Pinned &&)                 = delete;
    Pinned &operator=(Pinned &&)      = delete;
};

} // namespace rwd::core

#endif // RWD_CORE_PINNED_HPP
