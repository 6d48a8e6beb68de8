/**
 * @file Constants.hpp
 * @brief Library-wide compile-time defaults.
 *
 * Every tunable default lives here; runtime overrides go through
 * rein::engine::Config.
 *
 * @copyright MIT License
 */
#pragma once

#ifndef REIN_CORE_CONSTANTS_HPP
    #define REIN_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace rein::core {

inline constexpr u32 kMaxSessions        = 256;

/// Dedup window capacity of a group is floor(factor * active members).
inline constexpr f64 kDedupWindowFactor  = 1.5;

inline constexpr const char *kLostConnectionPrefix = "Lost connection with ";

} // namespace rein::core

#endif // REIN_CORE_CONSTANTS_HPP
