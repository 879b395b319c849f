/**
 * @file Platform.hpp
 * @brief Compile-time compiler detection and portability macros.
 *
 * Detects the compiler at preprocessing time and provides branch-prediction
 * hints and forced inlining used by the contract-checking macros.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef RLOG_CORE_PLATFORM_HPP
    #define RLOG_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define RLOG_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define RLOG_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define RLOG_COMPILER_MSVC  1
    #else
        #define RLOG_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(RLOG_COMPILER_GCC) || defined(RLOG_COMPILER_CLANG)
        #define RLOG_LIKELY(x)       __builtin_expect(!!(x), 1)
        #define RLOG_UNLIKELY(x)     __builtin_expect(!!(x), 0)
        #define RLOG_FORCEINLINE     inline __attribute__((always_inline))
    #elif defined(RLOG_COMPILER_MSVC)
        #define RLOG_LIKELY(x)       (x)
        #define RLOG_UNLIKELY(x)     (x)
        #define RLOG_FORCEINLINE     __forceinline
    #else
        #define RLOG_LIKELY(x)       (x)
        #define RLOG_UNLIKELY(x)     (x)
        #define RLOG_FORCEINLINE     inline
    #endif

#endif // RLOG_CORE_PLATFORM_HPP
