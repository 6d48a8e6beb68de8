/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every module.
 *
 * Provides fixed-width integer aliases, floating-point aliases, and the
 * text aliases used for commands and messages travelling between
 * controllers and receivers.
 *
 * @copyright MIT License
 */
#pragma once

#ifndef REIN_CORE_TYPES_HPP
    #define REIN_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>
    #include <string>

namespace rein::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

/// @brief Stable external key of one connected actor.
using SessionId = u32;

/// @brief Opaque inbound instruction, consumed in FIFO order.
using Command = std::string;

/// @brief Opaque outbound feedback line, delivered in FIFO order.
using Message = std::string;

} // namespace rein::core

#endif // REIN_CORE_TYPES_HPP
