#pragma once

// =============================================================================
// FILE: sal/binding/c_api/weights.h
// BRIEF: C API for spatial weights graphs and the spatial lag
// =============================================================================

#include "sal/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// Lifecycle
// =============================================================================

// Build a graph from CSR arrays (copied). indptr has n + 1 entries and
// indptr[n] = nnz. weights may be NULL (every edge weighs 1); ids may be
// NULL (ids are 0..n-1). The graph starts in SAL_TRANSFORM_ORIGINAL.
sal_error_t sal_weights_create(
    sal_weights_t* out,
    sal_size_t n,
    const sal_index_t* indptr,            // [n + 1]
    const sal_index_t* indices,           // [nnz]
    const sal_real_t* weights,            // [nnz] or NULL
    const sal_index_t* ids                // [n] or NULL
);

sal_error_t sal_weights_destroy(sal_weights_t* weights);

// =============================================================================
// Property Queries
// =============================================================================

sal_error_t sal_weights_n(sal_weights_t weights, sal_size_t* out);

sal_error_t sal_weights_nnz(sal_weights_t weights, sal_size_t* out);

sal_error_t sal_weights_max_cardinality(sal_weights_t weights, sal_index_t* out);

sal_error_t sal_weights_cardinalities(
    sal_weights_t weights,
    sal_index_t* out,                     // Output [n]
    sal_size_t n
);

sal_error_t sal_weights_ids(
    sal_weights_t weights,
    sal_index_t* out,                     // Output [n]
    sal_size_t n
);

// Aggregates s0, s1, s2 under the current transform. Any output may be NULL.
sal_error_t sal_weights_sums(
    sal_weights_t weights,
    sal_real_t* s0,
    sal_real_t* s1,
    sal_real_t* s2
);

// =============================================================================
// Transform
// =============================================================================

sal_error_t sal_weights_get_transform(sal_weights_t weights, sal_transform_t* out);

// Setting the current transform again is a no-op
sal_error_t sal_weights_set_transform(sal_weights_t weights, sal_transform_t transform);

// Force a transform until sal_transform_scope_end(). One scope per handle.
// scope_end restores the transform that was active at scope_begin and fails
// with SAL_ERROR_TRANSFORM_RESTORE when the transform was changed in between;
// the scope is closed either way.
sal_error_t sal_transform_scope_begin(sal_weights_t weights, sal_transform_t forced);

sal_error_t sal_transform_scope_end(sal_weights_t weights);

// =============================================================================
// Spatial Lag
// =============================================================================

// out[i] = sum_j w_ij * y[j] under the current transform
sal_error_t sal_spatial_lag(
    sal_weights_t weights,
    const sal_real_t* y,                  // [n]
    sal_size_t n,
    sal_real_t* out                       // Output [n]
);

#ifdef __cplusplus
}
#endif
