/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * REIN_ASSERT checks internal invariants of the composites (a routed
 * message always comes from a current member, a MultiController is never
 * empty).  With REIN_DEBUG defined a failure prints the expression with its
 * file, line and function, then aborts.  Otherwise it compiles to nothing.
 *
 * @copyright MIT License
 */
#pragma once

#ifndef REIN_CORE_ASSERT_HPP
    #define REIN_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace rein::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[REIN ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace rein::core::detail

    #ifdef REIN_DEBUG
        #define REIN_ASSERT(cond)                                         \
            do {                                                           \
                if (REIN_UNLIKELY(!(cond)))                                \
                    ::rein::core::detail::assertFail(#cond);               \
            } while (false)
    #else
        #define REIN_ASSERT(cond) ((void)0)
    #endif

#endif // REIN_CORE_ASSERT_HPP
