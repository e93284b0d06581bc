#pragma once

/// @file config.hpp
/// @brief Configuration macros for the lazyjson library.
///
/// Controls:
///   - SIMD support for the byte scanner
///   - Branch prediction hints
///   - Nesting depth limit
///   - Hash index threshold for member tables

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define LAZYJSON_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define LAZYJSON_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define LAZYJSON_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define LAZYJSON_LIKELY(x)   (x)
    #define LAZYJSON_UNLIKELY(x) (x)
    #define LAZYJSON_NOINLINE    __declspec(noinline)
#else
    #define LAZYJSON_LIKELY(x)   (x)
    #define LAZYJSON_UNLIKELY(x) (x)
    #define LAZYJSON_NOINLINE
#endif

// =====================================================================
// SIMD
// =====================================================================
// The build defines LAZYJSON_SIMD_ENABLED (CMake option LAZYJSON_ENABLE_SIMD).
// Without it the scanner uses the scalar loops only.

#if defined(LAZYJSON_SIMD_ENABLED)
    #if defined(__SSE2__) || defined(_M_X64) || defined(_M_AMD64)
        #define LAZYJSON_SSE2 1
    #elif defined(__ARM_NEON) || defined(__ARM_NEON__)
        #define LAZYJSON_NEON 1
    #endif
#endif

// =====================================================================
// Recursion depth limit (stack overflow protection)
// =====================================================================

#if !defined(LAZYJSON_MAX_DEPTH)
    #define LAZYJSON_MAX_DEPTH 512
#endif

// =====================================================================
// Member count above which member tables keep a hash index
// =====================================================================

#if !defined(LAZYJSON_OBJECT_INDEX_THRESHOLD)
    #define LAZYJSON_OBJECT_INDEX_THRESHOLD 16
#endif
