/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * Provides ZYPPY_ASSERT (debug-only) and ZYPPY_VERIFY (always evaluated).
 * Both are reserved for programming-contract violations; runtime failures
 * travel as core::Error values instead.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_CORE_ASSERT_HPP
    #define ZYPPY_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace zyppy::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[ZYPPY ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace zyppy::core::detail

    #ifdef ZYPPY_DEBUG
        #define ZYPPY_ASSERT(cond)                                        \
            do {                                                           \
                if (ZYPPY_UNLIKELY(!(cond)))                               \
                    ::zyppy::core::detail::assertFail(#cond);              \
            } while (false)
    #else
        #define ZYPPY_ASSERT(cond) ((void)0)
    #endif

    #define ZYPPY_VERIFY(cond)                                            \
        do {                                                               \
            if (ZYPPY_UNLIKELY(!(cond)))                                   \
                ::zyppy::core::detail::assertFail(#cond);                  \
        } while (false)

#endif // ZYPPY_CORE_ASSERT_HPP
