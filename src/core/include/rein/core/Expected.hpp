/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * REIN_TRY_VOID macro for early-return propagation.
 *
 * @copyright MIT License
 */
#pragma once

#ifndef REIN_CORE_EXPECTED_HPP
    #define REIN_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace rein::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace rein::core

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type rein::core::ExpectedVoid.
 */
#define REIN_TRY_VOID(expr)                                               \
    do {                                                                    \
        auto &&_rein_result = (expr);                                      \
        if (!_rein_result.has_value()) [[unlikely]]                        \
            return std::unexpected(std::move(_rein_result.error()));        \
    } while (false)

#endif // REIN_CORE_EXPECTED_HPP
