#pragma once

// =============================================================================
// FILE: sal/binding/c_api/core/core.h
// BRIEF: C ABI for the SAL spatial association library
// =============================================================================
//
// DESIGN PRINCIPLES:
//   - Stable C ABI for Python FFI and cross-language bindings
//   - Opaque handles for weights graphs and cancellation tokens
//   - Thread-safe error reporting via thread-local storage
//   - Compatible with C99 and C++11+
//
// ABI STABILITY GUARANTEE:
//   - Error codes are stable across versions
//   - Handle types remain opaque
//   - Function signatures will not change within major version
//
// MEMORY MODEL:
//   - Handles are created by sal_*_create() and released by sal_*_destroy()
//   - All numeric buffers are caller-owned; the library never keeps them
//   - A weights handle copies its CSR arrays on creation
// =============================================================================

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

// =============================================================================
// Version Information
// =============================================================================

#define SAL_C_API_VERSION_MAJOR 1
#define SAL_C_API_VERSION_MINOR 0
#define SAL_C_API_VERSION_PATCH 0

// =============================================================================
// Export Macro (Platform-Specific DLL/SO Symbol Visibility)
// =============================================================================

#ifndef SAL_EXPORT
#if defined(_MSC_VER)
    #define SAL_EXPORT __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
    #define SAL_EXPORT __attribute__((visibility("default")))
#else
    #define SAL_EXPORT
#endif
#endif

// Get runtime version string (e.g., "1.0.0")
const char* sal_get_version(void);

// Get build configuration (e.g., "float64+int64+avx2+openmp")
const char* sal_get_build_config(void);

// =============================================================================
// Opaque Handle Types
// =============================================================================

// Spatial weights graph (CSR adjacency + active transform)
typedef struct sal_weights sal_weights;
typedef sal_weights* sal_weights_t;

// Cooperative cancellation flag
typedef struct sal_cancel sal_cancel;
typedef sal_cancel* sal_cancel_t;

// =============================================================================
// Primitive Types (must match the C++ build configuration)
// =============================================================================

#if defined(SAL_PRECISION) && SAL_PRECISION == 0
    typedef float sal_real_t;
#else
    typedef double sal_real_t;
#endif

#if defined(SAL_INDEX_PRECISION) && SAL_INDEX_PRECISION == 1
    typedef int32_t sal_index_t;
#else
    typedef int64_t sal_index_t;
#endif

typedef size_t sal_size_t;

typedef int32_t sal_bool_t;
#define SAL_TRUE  1
#define SAL_FALSE 0

// =============================================================================
// Enumerations
// =============================================================================

// Weight transform
typedef int32_t sal_transform_t;
#define SAL_TRANSFORM_ORIGINAL 0
#define SAL_TRANSFORM_BINARY   1
#define SAL_TRANSFORM_ROW      2

// Which p-value a batch call reports
typedef int32_t sal_pvalue_kind_t;
#define SAL_PVALUE_NORM  0
#define SAL_PVALUE_SIM   1
#define SAL_PVALUE_Z_SIM 2

// =============================================================================
// Error Codes
// =============================================================================

typedef int32_t sal_error_t;

#define SAL_OK                          0

// General errors (1-9)
#define SAL_ERROR_UNKNOWN               1
#define SAL_ERROR_INTERNAL              2
#define SAL_ERROR_OUT_OF_MEMORY         3
#define SAL_ERROR_NULL_POINTER          4

// Argument errors (10-19)
#define SAL_ERROR_INVALID_ARGUMENT     10
#define SAL_ERROR_DIMENSION_MISMATCH   11
#define SAL_ERROR_RANGE_ERROR          13
#define SAL_ERROR_INDEX_OUT_OF_BOUNDS  14

// Weights state errors (60-69)
#define SAL_ERROR_TRANSFORM_RESTORE    60

// =============================================================================
// Error Handling
// =============================================================================

// Get last error message (thread-local, valid until next API call on the
// same thread)
const char* sal_get_last_error(void);

// Get last error code (thread-local)
sal_error_t sal_get_last_error_code(void);

// Clear error state (thread-local)
void sal_clear_error(void);

sal_bool_t sal_is_ok(sal_error_t code);
sal_bool_t sal_is_error(sal_error_t code);

// =============================================================================
// Threading
// =============================================================================

// 0 selects the hardware concurrency
sal_error_t sal_set_num_threads(sal_size_t n);

sal_size_t sal_get_num_threads(void);

// =============================================================================
// Cancellation
// =============================================================================

// A token may be passed to any statistic call and requested from another
// thread; the call stops between permutation rounds and reports how many
// rounds completed.
sal_error_t sal_cancel_create(sal_cancel_t* out);
sal_error_t sal_cancel_destroy(sal_cancel_t* token);
sal_error_t sal_cancel_request(sal_cancel_t token);
sal_error_t sal_cancel_reset(sal_cancel_t token);
sal_error_t sal_cancel_requested(sal_cancel_t token, sal_bool_t* out);

#ifdef __cplusplus
}
#endif
