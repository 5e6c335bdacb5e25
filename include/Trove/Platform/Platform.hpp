#pragma once

// Platform Detection
#if defined(_WIN32) || defined(_WIN64)
    #define TROVE_PLATFORM_WINDOWS 1
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#endif

// Compiler Detection
#if defined(_MSC_VER) && !defined(__clang__)
    #define TROVE_COMPILER_MSVC 1
#elif defined(__clang__)
    #define TROVE_COMPILER_CLANG 1
#elif defined(__GNUC__) || defined(__GNUG__)
    #define TROVE_COMPILER_GCC 1
#else
    #error "Unknown compiler"
#endif

#if (defined(_MSVC_LANG) ? _MSVC_LANG : __cplusplus) < 202002L
    #error "Requires C++20 or later"
#endif

// SIMD Capabilities Detection
// Control-byte groups are 16 bytes wide, so only 128-bit paths are used.
// Define TROVE_NO_SIMD to force the scalar fallback.
#if !defined(TROVE_NO_SIMD)
    #if defined(__x86_64__) || defined(_M_X64) || defined(__SSE2__) || (defined(_M_IX86_FP) && _M_IX86_FP >= 2)
        #define TROVE_HAS_SSE2 1
    #elif defined(__aarch64__) || defined(_M_ARM64)
        #define TROVE_HAS_NEON 1
    #endif
#endif
