#pragma once

#include "velo/config.hpp"
#include <cstdint>
#include <cstdlib>

// =============================================================================
// FILE: velo/core/macros.hpp
// BRIEF: Compiler abstractions and optimization hints
// =============================================================================

// =============================================================================
// SECTION 1: Branch Prediction Hints
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define VELO_LIKELY(x)   (__builtin_expect(!!(x), 1))
    #define VELO_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
    #define VELO_LIKELY(x)   (x)
    #define VELO_UNLIKELY(x) (x)
#endif

// =============================================================================
// SECTION 2: Compiler Attributes
// =============================================================================

#if defined(__has_cpp_attribute)
    #if __has_cpp_attribute(nodiscard) >= 201603L
        #define VELO_NODISCARD [[nodiscard]]
    #else
        #define VELO_NODISCARD
    #endif
#else
    #define VELO_NODISCARD
#endif

// =============================================================================
// SECTION 3: Function Inlining & Visibility
// =============================================================================

#if defined(_MSC_VER)
    #define VELO_FORCE_INLINE __forceinline
    #define VELO_RESTRICT __restrict
    #define VELO_EXPORT __declspec(dllexport)
#else
    #define VELO_FORCE_INLINE inline __attribute__((always_inline))
    #define VELO_RESTRICT __restrict__
    #define VELO_EXPORT __attribute__((visibility("default")))
#endif

// Hot path: frequently called, optimize for speed
#if defined(__clang__) || defined(__GNUC__)
    #define VELO_HOT __attribute__((hot))
    #define VELO_COLD __attribute__((cold))
#else
    #define VELO_HOT
    #define VELO_COLD
#endif

// =============================================================================
// SECTION 4: Prefetching
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define VELO_PREFETCH_READ(ptr, locality) __builtin_prefetch((ptr), 0, (locality))
#else
    #define VELO_PREFETCH_READ(ptr, locality) ((void)0)
#endif

// =============================================================================
// SECTION 5: Unreachable
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define VELO_UNREACHABLE() __builtin_unreachable()
#elif defined(_MSC_VER)
    #define VELO_UNREACHABLE() __assume(0)
#else
    #define VELO_UNREACHABLE() ((void)0)
#endif
