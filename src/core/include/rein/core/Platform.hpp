/**
 * @file Platform.hpp
 * @brief Branch-prediction hint used by the contract-checking macros.
 *
 * @copyright MIT License
 */
#pragma once

#ifndef REIN_CORE_PLATFORM_HPP
    #define REIN_CORE_PLATFORM_HPP

    #if defined(__GNUC__) || defined(__clang__)
        #define REIN_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #else
        #define REIN_UNLIKELY(x) (x)
    #endif

#endif // REIN_CORE_PLATFORM_HPP
