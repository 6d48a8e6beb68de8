/**
 * @file NonCopyable.hpp
 * @brief CRTP base classes that delete copy (and optionally move) operations.
 *
 * @copyright MIT License
 */
#pragma once

#ifndef REIN_CORE_NON_COPYABLE_HPP
    #define REIN_CORE_NON_COPYABLE_HPP

namespace rein::core {

/**
 * @brief Inherit (privately) to disable copy construction and assignment.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &)  = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)       = default;
};

/**
 * @brief Inherit to pin an object in memory: no copy, no move.
 *
 * Used by types whose address is held by peers as a back-reference
 * (controllers, receivers, players).
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonMovable {
protected:
    NonMovable()  = default;
    ~NonMovable() = default;

    NonMovable(const NonMovable &)            = delete;
    NonMovable &operator=(const NonMovable &)  = delete;

    NonMovable(NonMovable &&)                 = delete;
    NonMovable &operator=(NonMovable &&)       = delete;
};

} // namespace rein::core

#endif // REIN_CORE_NON_COPYABLE_HPP
