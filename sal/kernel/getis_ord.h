// =============================================================================
// FILE: sal/kernel/getis_ord.h
// BRIEF: API reference for Getis-Ord global G and local G / G* kernels
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "sal/core/type.hpp"
#include "sal/core/weights.hpp"
#include "sal/core/cancel.hpp"

namespace sal::kernel::getis_ord {

// =============================================================================
// Configuration Constants
// =============================================================================

namespace config {
    constexpr Size MIN_LOCATIONS = 4;
    constexpr Size DEFAULT_PERMUTATIONS = 999;
    constexpr uint64_t DEFAULT_SEED = 42;
    constexpr Size CANCEL_CHECK_INTERVAL = 64;
    constexpr Size LOCAL_GRAIN = 16;
    constexpr Size POOL_REBUILD_RATIO = 8;
}

// =============================================================================
// Enumerations
// =============================================================================

/* -----------------------------------------------------------------------------
 * ENUM: PValueKind
 * -----------------------------------------------------------------------------
 * VALUES:
 *     Normal - one-sided normal p-value of the analytic z-score
 *     Sim    - folded pseudo p-value from the permutation distribution
 *     ZSim   - one-sided normal p-value of the simulated z-score
 * -------------------------------------------------------------------------- */
enum class PValueKind : std::int32_t {
    Normal = 0,
    Sim = 1,
    ZSim = 2
};

// =============================================================================
// Core Functions
// =============================================================================

/* -----------------------------------------------------------------------------
 * FUNCTION: global_g
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Global Getis-Ord G with an analytic normal test and an optional
 *     permutation test.
 *
 * PARAMETERS:
 *     w              [in,out] Weights graph; transform forced to binary for
 *                             the call and restored on return
 *     y              [in]     Attribute values [n]
 *     n_permutations [in]     Number of random permutations (0 disables)
 *     seed           [in]     Seed of the single permutation stream
 *     sim            [out]    Simulated G values [n_permutations] or empty
 *     cancel         [in]     Optional cancellation token
 *
 * PRECONDITIONS:
 *     - w.n() >= 4 (ValueError otherwise)
 *     - y.len == w.n() (DimensionError otherwise)
 *     - sim empty or sim.len >= n_permutations
 *
 * POSTCONDITIONS:
 *     - G = sum_i y_i * lag(y)_i / ((sum y)^2 - sum y^2)
 *     - EG = s0 / (n (n - 1)); EG2 from b0..b4 and the power sums of y
 *     - VG = EG2 - EG^2, z_norm = (G - EG) / sqrt(VG)
 *     - p_norm = P(Z > |z_norm|)
 *     - When completed > 0: p_sim by the folded tail rule, EG_sim and
 *       seG_sim as mean and population std of the simulated values
 *     - Transform of w equals its value on entry
 *
 * ALGORITHM:
 *     1. Force binary weights, read s0, s1, s2
 *     2. Observed G through the spatial lag
 *     3. Analytic moments from the weight sums and power sums of y
 *     4. Sequential full shuffles of y from one FastRNG stream
 *     5. Restore the caller's transform
 *
 * COMPLEXITY:
 *     Time:  O(n_permutations * (n + nnz))
 *     Space: O(n + n_permutations)
 *
 * THREAD SAFETY:
 *     Unsafe on a shared graph (scoped transform mutation)
 * -------------------------------------------------------------------------- */
GlobalGResult global_g(
    WeightsGraph& w,
    Array<const Real> y,
    Size n_permutations = config::DEFAULT_PERMUTATIONS,
    uint64_t seed = config::DEFAULT_SEED,
    Array<Real> sim = {},
    const CancelToken* cancel = nullptr
);

/* -----------------------------------------------------------------------------
 * FUNCTION: local_g
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Local Getis-Ord G (star = false) or G* (star = true) per location with
 *     analytic z-scores and conditional permutation inference.
 *
 * PARAMETERS:
 *     w              [in,out] Weights graph; transform forced for the call
 *     y              [in]     Attribute values [n]
 *     out            [out]    Caller buffers (see LocalGOutput)
 *     transform      [in]     Binary or RowStandardized
 *     star           [in]     Include each location in its own neighborhood
 *     n_permutations [in]     Conditional permutations per location
 *     seed           [in]     Master seed
 *     cancel         [in]     Optional cancellation token
 *
 * PRECONDITIONS:
 *     - w.n() >= 4, y.len == w.n()
 *     - transform is Binary or RowStandardized (ValueError otherwise)
 *     - Gs, EGs, VGs, Zs, p_norm hold n values; p_sim, z_sim, p_z_sim too
 *       when n_permutations > 0; sim empty or n * n_permutations
 *
 * POSTCONDITIONS:
 *     G (star = false), N = n - 1:
 *       - Gs_i = lag_i / (sum y - y_i) under the requested transform
 *       - mean and variance exclude y_i
 *     G* (star = true), N = n:
 *       - Gs_i = (lag_i + y_i) / sum y over binary weights, divided by
 *         (card_i + 1) under row standardization
 *       - global mean and population variance
 *     Both:
 *       - EGs_i = W_i / N, VGs_i = W_i (N - W_i) / (N - 1) / N^2 * s^2 / mean^2
 *         with W_i = card_i + star for binary weights, 1 for row-standardized
 *       - Zs_i = (Gs_i - EGs_i) / sqrt(VGs_i), p_norm_i = P(Z > |Zs_i|)
 *       - p_sim_i per location; z_sim_i against the pooled EG_sim / seG_sim
 *
 * ALGORITHM:
 *     1. Force the transform (binary for G*), compute the lag
 *     2. Observed Gs and analytic moments in parallel over locations
 *     3. Draw n_permutations rows of k = min(max_card + 1, n - 1) positions
 *        into [0, n - 1) from the master stream
 *     4. Rounds run in blocks of B (a multiple of CANCEL_CHECK_INTERVAL with
 *        B * k >= POOL_REBUILD_RATIO * (n - 1)). Per block and location
 *        (parallel): shuffle the other n - 1 ids with a stream derived from
 *        (seed, i); round r sums y over the first card_i positions of row r
 *     5. Pooled summary over the n x completed block; per-location p-values
 *
 * ISLANDS:
 *     Under G (star = false) a location with no neighbors gets a NaN sim row
 *     and NaN p_sim, z_sim, p_z_sim, and is left out of the pooled summary.
 *     Under G* it keeps its own value and is treated like any location.
 *
 * CANCELLATION:
 *     Polled before each block and every CANCEL_CHECK_INTERVAL rounds inside
 *     it. A cancel drops the block in flight: completed is the number of
 *     rounds every location finished (a multiple of CANCEL_CHECK_INTERVAL
 *     below n_permutations) and p_sim, z_sim, the summary use those rounds.
 *
 * COMPLEXITY:
 *     Time:  O(n * n_permutations * max_card + n^2 * blocks)
 *     Space: O(n * n_permutations + n_threads * n)
 *
 * THREAD SAFETY:
 *     Unsafe on a shared graph (scoped transform mutation); results do not
 *     depend on the thread count
 * -------------------------------------------------------------------------- */
LocalGResult local_g(
    WeightsGraph& w,
    Array<const Real> y,
    const LocalGOutput& out,
    Transform transform = Transform::RowStandardized,
    bool star = false,
    Size n_permutations = config::DEFAULT_PERMUTATIONS,
    uint64_t seed = config::DEFAULT_SEED,
    const CancelToken* cancel = nullptr
);

/* -----------------------------------------------------------------------------
 * FUNCTION: statistic / pvalue
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Uniform access to the primary statistic (G or Gs) and to the p-value
 *     selected by PValueKind.
 * -------------------------------------------------------------------------- */
Real statistic(const GlobalGResult& r) noexcept;
Real pvalue(const GlobalGResult& r, PValueKind kind);
Array<Real> statistic(const LocalGOutput& out) noexcept;
Array<Real> pvalue(const LocalGOutput& out, PValueKind kind);

/* -----------------------------------------------------------------------------
 * FUNCTION: global_g_batch / local_g_batch
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Run the statistic once per feature of a feature-major matrix
 *     (n_features x n). Feature f uses seed + f. The transform is forced
 *     once for the whole batch.
 *
 * PARAMETERS:
 *     values     [in]  Feature-major values [n_features * n]
 *     stat       [out] G per feature [n_features] / Gs [n_features * n]
 *     pval       [out] Selected p-value, same shape as stat
 *     completed  [out] Simulated-sample count per feature [n_features],
 *                      may be empty
 *     kind       [in]  Which p-value to report (Sim and ZSim need
 *                      n_permutations > 0)
 *
 * RETURNS:
 *     Number of features that ran
 *
 * CANCELLATION:
 *     The feature running when cancellation is seen keeps its partial
 *     result (completed[f] < n_permutations). The loop stops there; later
 *     features get NaN stat and pval and completed = 0.
 *
 * THREAD SAFETY:
 *     Features run one after another; each local call is parallel inside
 * -------------------------------------------------------------------------- */
Size global_g_batch(
    WeightsGraph& w,
    Array<const Real> values,
    Size n_features,
    Array<Real> stat,
    Array<Real> pval,
    Array<Size> completed = {},
    PValueKind kind = PValueKind::Sim,
    Size n_permutations = config::DEFAULT_PERMUTATIONS,
    uint64_t seed = config::DEFAULT_SEED,
    const CancelToken* cancel = nullptr
);

Size local_g_batch(
    WeightsGraph& w,
    Array<const Real> values,
    Size n_features,
    Array<Real> stat,
    Array<Real> pval,
    Array<Size> completed = {},
    PValueKind kind = PValueKind::Sim,
    Transform transform = Transform::RowStandardized,
    bool star = false,
    Size n_permutations = config::DEFAULT_PERMUTATIONS,
    uint64_t seed = config::DEFAULT_SEED,
    const CancelToken* cancel = nullptr
);

} // namespace sal::kernel::getis_ord
