/**
 * @file Platform.hpp
 * @brief Compile-time compiler detection and branch-prediction hints.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_CORE_PLATFORM_HPP
    #define ZYPPY_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define ZYPPY_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define ZYPPY_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define ZYPPY_COMPILER_MSVC  1
    #else
        #define ZYPPY_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(ZYPPY_COMPILER_GCC) || defined(ZYPPY_COMPILER_CLANG)
        #define ZYPPY_LIKELY(x)     __builtin_expect(!!(x), 1)
        #define ZYPPY_UNLIKELY(x)   __builtin_expect(!!(x), 0)
    #else
        #define ZYPPY_LIKELY(x)     (x)
        #define ZYPPY_UNLIKELY(x)   (x)
    #endif

#endif // ZYPPY_CORE_PLATFORM_HPP
