#pragma once

#include "sal/config.hpp"
#include <cstdint>
#include <cstdlib>

// =============================================================================
// FILE: sal/core/macros.hpp
// BRIEF: Compiler abstractions and optimization hints
// =============================================================================

// =============================================================================
// SECTION 1: Branch Prediction
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define SAL_LIKELY(x)   (__builtin_expect(!!(x), 1))
    #define SAL_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
    #define SAL_LIKELY(x)   (x)
    #define SAL_UNLIKELY(x) (x)
#endif

// =============================================================================
// SECTION 2: Inlining, Aliasing, Visibility
// =============================================================================

#if defined(_MSC_VER)
    #define SAL_FORCE_INLINE __forceinline
    #define SAL_RESTRICT __restrict
    #define SAL_EXPORT __declspec(dllexport)
#else
    #define SAL_FORCE_INLINE inline __attribute__((always_inline))
    #define SAL_RESTRICT __restrict__
    #define SAL_EXPORT __attribute__((visibility("default")))
#endif

// =============================================================================
// SECTION 3: Alignment
// =============================================================================

#define SAL_ALIGNMENT 64  // 64-byte alignment for AVX-512


// =============================================================================
// SECTION 4: Function Attributes
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define SAL_COLD __attribute__((cold))
#else
    #define SAL_COLD
#endif
