#pragma once

#include <cstdint>

// =============================================================================
// FILE: sal/config.hpp
// BRIEF: SAL Configuration Header
// =============================================================================

// =============================================================================
// HWY Scalar-Only Control
// =============================================================================

#ifdef SAL_ONLY_SCALAR
    #ifndef HWY_COMPILE_ONLY_SCALAR
        #define HWY_COMPILE_ONLY_SCALAR
    #endif
#endif

// =============================================================================
// Platform Detection
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define SAL_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
    #define SAL_OS_MAC
#elif defined(__linux__) || defined(__linux)
    #define SAL_OS_LINUX
#else
    #define SAL_OS_UNKNOWN
#endif

// =============================================================================
// Threading Backend Selection
// =============================================================================

// Auto-select backend based on platform if none specified
#if !defined(SAL_BACKEND_SERIAL) && !defined(SAL_BACKEND_TBB) && \
    !defined(SAL_BACKEND_OPENMP) && !defined(SAL_BACKEND_BS)
    #if defined(SAL_OS_MAC)
        // macOS: BS::thread_pool unless SAL_MAC_USE_OPENMP is set
        #if defined(SAL_MAC_USE_OPENMP)
            #define SAL_BACKEND_OPENMP
        #else
            #define SAL_BACKEND_BS
        #endif
    #elif defined(SAL_OS_WINDOWS) || defined(SAL_OS_LINUX)
        #define SAL_BACKEND_OPENMP
    #else
        #define SAL_BACKEND_BS
    #endif
#endif

// Exactly one backend must be selected
#if !defined(SAL_BACKEND_SERIAL) && !defined(SAL_BACKEND_TBB) && \
    !defined(SAL_BACKEND_OPENMP) && !defined(SAL_BACKEND_BS)
    #error "SAL Configuration Error: No threading backend selected! " \
           "Please define exactly one backend: SAL_BACKEND_SERIAL, " \
           "SAL_BACKEND_TBB, SAL_BACKEND_OPENMP, or SAL_BACKEND_BS."
#endif

#if (defined(SAL_BACKEND_SERIAL) && (defined(SAL_BACKEND_TBB) || defined(SAL_BACKEND_OPENMP) || defined(SAL_BACKEND_BS))) || \
    (defined(SAL_BACKEND_TBB) && (defined(SAL_BACKEND_OPENMP) || defined(SAL_BACKEND_BS))) || \
    (defined(SAL_BACKEND_OPENMP) && defined(SAL_BACKEND_BS))
    #error "SAL Configuration Error: Multiple threading backends defined! " \
           "Please define only one backend."
#endif

#if defined(SAL_OS_MAC) && defined(SAL_BACKEND_OPENMP)
    #pragma GCC warning "SAL_WARNING: OpenMP enabled on macOS. " \
                        "Ensure 'libomp' is installed (brew install libomp) " \
                        "and linker flags are correct."
#endif

// =============================================================================
// Feature Flags (Public API)
// =============================================================================

#if defined(SAL_BACKEND_OPENMP)
    #define SAL_USE_OPENMP 1
#elif defined(SAL_BACKEND_TBB)
    #define SAL_USE_TBB 1
#elif defined(SAL_BACKEND_BS)
    #define SAL_USE_BS 1
#elif defined(SAL_BACKEND_SERIAL)
    #define SAL_USE_SERIAL 1
#endif

// =============================================================================
// Precision Control
// =============================================================================

// Floating-point precision selection
// 0: float32
// 1: float64 (default)
// Fourth-moment sums in the global G variance lose too much in half precision,
// so float16 is not offered.
#ifndef SAL_PRECISION
    #define SAL_PRECISION 1
#endif

#if SAL_PRECISION == 0
    #define SAL_USE_FLOAT32
#elif SAL_PRECISION == 1
    #define SAL_USE_FLOAT64
#else
    #error "SAL Configuration Error: Invalid SAL_PRECISION value. " \
           "Must be 0 (f32) or 1 (f64)."
#endif

// =============================================================================
// Index Precision Control
// =============================================================================

// Integer index type precision selection
// 1: int32 - Max 2B locations
// 2: int64 - NumPy-compatible (default)
#ifndef SAL_INDEX_PRECISION
    #define SAL_INDEX_PRECISION 2
#endif

#if SAL_INDEX_PRECISION == 1
    #define SAL_USE_INT32
#elif SAL_INDEX_PRECISION == 2
    #define SAL_USE_INT64
#else
    #error "SAL Configuration Error: Invalid SAL_INDEX_PRECISION value. " \
           "Must be 1 (int32) or 2 (int64)."
#endif

// =============================================================================
// Memory Configuration
// =============================================================================

#include <cstddef>

namespace sal::memory {
    inline constexpr std::size_t DEFAULT_ALIGNMENT = 64;  // AVX-512 friendly
    inline constexpr std::size_t CACHE_LINE_SIZE = 64;
}
