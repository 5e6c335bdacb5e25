#pragma once

#include "../Platform/Platform.hpp"

// Base macros shared by every Trove header

// Feature Detection Macros
#ifdef __has_builtin
    #define TROVE_HAS_BUILTIN(x) __has_builtin(x)
#else
    #define TROVE_HAS_BUILTIN(x) 0
#endif

#define TROVE_NODISCARD [[nodiscard]]
#define TROVE_MAYBE_UNUSED [[maybe_unused]]
#define TROVE_LIKELY [[likely]]
#define TROVE_UNLIKELY [[unlikely]]

// Compiler-specific attributes
#if defined(TROVE_COMPILER_MSVC)
    #define TROVE_FORCEINLINE __forceinline
    #define TROVE_NOINLINE __declspec(noinline)
    #define TROVE_ASSUME(x) __assume(x)
    #define TROVE_UNREACHABLE() __assume(0)
#elif defined(TROVE_COMPILER_GCC) || defined(TROVE_COMPILER_CLANG)
    #define TROVE_FORCEINLINE inline __attribute__((always_inline))
    #define TROVE_NOINLINE __attribute__((noinline))

    #if TROVE_HAS_BUILTIN(__builtin_assume)
        #define TROVE_ASSUME(x) __builtin_assume(x)
    #else
        #define TROVE_ASSUME(x) do { if (!(x)) __builtin_unreachable(); } while(0)
    #endif

    #define TROVE_UNREACHABLE() __builtin_unreachable()
#endif

#define TROVE_UNUSED(x) ((void)(x))

// Runtime assertion macro
// Define TROVE_BUILD_DEBUG in the build system for debug builds
#ifdef TROVE_BUILD_DEBUG
    #include <cassert>
    #define TROVE_ASSERT(condition, message) assert((condition) && (message))
#else
    #define TROVE_ASSERT(condition, message) ((void)0)
#endif
