/**
 * @file Assert.hpp
 * @brief Contract-checking macros with source location.
 *
 * Provides RLOG_ASSERT (debug-only), RLOG_VERIFY (always evaluated), and
 * RLOG_UNREACHABLE (marks provably dead code paths).  A failing check prints
 * the expression together with the file, line, and function, then aborts.
 * In release builds RLOG_ASSERT is a no-op; RLOG_VERIFY is kept for contract
 * violations that must never be silently ignored on the robot.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef RLOG_CORE_ASSERT_HPP
    #define RLOG_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace rlog::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[RLOG ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace rlog::core::detail

    #ifdef RLOG_DEBUG
        #define RLOG_ASSERT(cond)                                         \
            do {                                                           \
                if (RLOG_UNLIKELY(!(cond)))                                \
                    ::rlog::core::detail::assertFail(#cond);               \
            } while (false)
    #else
        #define RLOG_ASSERT(cond) ((void)0)
    #endif

    #define RLOG_VERIFY(cond)                                             \
        do {                                                               \
            if (RLOG_UNLIKELY(!(cond)))                                    \
                ::rlog::core::detail::assertFail(#cond);                   \
        } while (false)

    #define RLOG_UNREACHABLE()                                            \
        do {                                                               \
            ::rlog::core::detail::assertFail("UNREACHABLE");               \
            __builtin_unreachable();                                       \
        } while (false)

#endif // RLOG_CORE_ASSERT_HPP
