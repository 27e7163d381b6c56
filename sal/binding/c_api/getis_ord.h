#pragma once

// =============================================================================
// FILE: sal/binding/c_api/getis_ord.h
// BRIEF: C API for Getis-Ord global G and local G / G*
// =============================================================================

#include "sal/binding/c_api/core/core.h"
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// Result Types
// =============================================================================

// Simulation fields are NaN unless completed > 0
typedef struct sal_global_g_result {
    sal_real_t G;
    sal_real_t EG;
    sal_real_t EG2;
    sal_real_t VG;
    sal_real_t z_norm;
    sal_real_t p_norm;

    sal_real_t b0, b1, b2, b3, b4;
    sal_real_t den_sum;

    sal_size_t permutations;
    sal_size_t completed;
    sal_bool_t cancelled;

    sal_real_t p_sim;
    sal_real_t EG_sim;
    sal_real_t seG_sim;
    sal_real_t VG_sim;
    sal_real_t z_sim;
    sal_real_t p_z_sim;
} sal_global_g_result_t;

// Pooled over the n x completed simulation block; NaN unless completed > 0
typedef struct sal_local_g_summary {
    sal_real_t EG_sim;
    sal_real_t seG_sim;
    sal_real_t VG_sim;

    sal_size_t permutations;
    sal_size_t completed;
    sal_bool_t cancelled;
} sal_local_g_summary_t;

// =============================================================================
// Global G
// =============================================================================

// The graph's transform is forced to binary for the call and restored.
// sim may be NULL; otherwise it receives the simulated G values.
// cancel may be NULL.
sal_error_t sal_getis_ord_global(
    sal_weights_t weights,
    const sal_real_t* y,                  // [n]
    sal_size_t n,
    sal_size_t n_permutations,
    uint64_t seed,
    sal_real_t* sim,                      // Output [n_permutations] or NULL
    sal_cancel_t cancel,
    sal_global_g_result_t* result         // Output
);

// =============================================================================
// Local G / G*
// =============================================================================

// transform: SAL_TRANSFORM_BINARY or SAL_TRANSFORM_ROW.
// star != 0 includes each location in its own neighborhood (G*).
// p_sim, z_sim and p_z_sim may be NULL only when n_permutations == 0.
// sim may be NULL; otherwise row i (length n_permutations) receives the
// simulated values of location i. summary may be NULL.
sal_error_t sal_getis_ord_local(
    sal_weights_t weights,
    const sal_real_t* y,                  // [n]
    sal_size_t n,
    sal_transform_t transform,
    sal_bool_t star,
    sal_size_t n_permutations,
    uint64_t seed,
    sal_real_t* Gs,                       // Output [n]
    sal_real_t* EGs,                      // Output [n]
    sal_real_t* VGs,                      // Output [n]
    sal_real_t* Zs,                       // Output [n]
    sal_real_t* p_norm,                   // Output [n]
    sal_real_t* p_sim,                    // Output [n] or NULL
    sal_real_t* z_sim,                    // Output [n] or NULL
    sal_real_t* p_z_sim,                  // Output [n] or NULL
    sal_real_t* sim,                      // Output [n * n_permutations] or NULL
    sal_cancel_t cancel,
    sal_local_g_summary_t* summary        // Output or NULL
);

// =============================================================================
// Batch (one statistic per feature)
// =============================================================================

// values is feature-major [n_features * n]; feature f uses seed + f.
// stat[f] = G, pval[f] = the p-value selected by kind. completed may be NULL;
// otherwise completed[f] receives the simulated-sample count of feature f.
// On cancellation the running feature keeps its partial result and the
// remaining features are skipped (NaN outputs, completed = 0).
sal_error_t sal_getis_ord_global_batch(
    sal_weights_t weights,
    const sal_real_t* values,             // [n_features * n]
    sal_size_t n_features,
    sal_size_t n,
    sal_pvalue_kind_t kind,
    sal_size_t n_permutations,
    uint64_t seed,
    sal_real_t* stat,                     // Output [n_features]
    sal_real_t* pval,                     // Output [n_features]
    sal_size_t* completed,                // Output [n_features] or NULL
    sal_cancel_t cancel
);

// stat and pval are feature-major [n_features * n]
sal_error_t sal_getis_ord_local_batch(
    sal_weights_t weights,
    const sal_real_t* values,             // [n_features * n]
    sal_size_t n_features,
    sal_size_t n,
    sal_transform_t transform,
    sal_bool_t star,
    sal_pvalue_kind_t kind,
    sal_size_t n_permutations,
    uint64_t seed,
    sal_real_t* stat,                     // Output [n_features * n]
    sal_real_t* pval,                     // Output [n_features * n]
    sal_size_t* completed,                // Output [n_features] or NULL
    sal_cancel_t cancel
);

#ifdef __cplusplus
}
#endif
