#pragma once

#include "sal/core/type.hpp"
#include "sal/core/error.hpp"
#include "sal/core/macros.hpp"
#include "sal/core/weights.hpp"
#include "sal/threading/parallel_for.hpp"

// =============================================================================
// FILE: sal/kernel/lag.hpp
// BRIEF: Spatial lag, out_i = sum_j w_ij * y_j under the current transform
// =============================================================================

namespace sal::kernel::lag {

namespace config {
    constexpr Size PARALLEL_THRESHOLD = 4096;
}

namespace detail {

// Row dot product, unrolled
SAL_FORCE_INLINE Real row_lag(
    const Index* SAL_RESTRICT indices, const Real* SAL_RESTRICT weights,
    Size n_neighbors, const Real* SAL_RESTRICT values
) noexcept {
    Real acc0 = 0;
    Real acc1 = 0;
    Size k = 0;

    for (; k + 4 <= n_neighbors; k += 4) {
        acc0 += weights[k] * values[indices[k]] + weights[k + 1] * values[indices[k + 1]];
        acc1 += weights[k + 2] * values[indices[k + 2]] + weights[k + 3] * values[indices[k + 3]];
    }

    for (; k < n_neighbors; ++k) {
        acc0 += weights[k] * values[indices[k]];
    }

    return acc0 + acc1;
}

} // namespace detail

// Unchecked lag used inside kernels that already validated their inputs.
inline void spatial_lag_unchecked(const WeightsGraph& w, const Real* values, Real* out) {
    const Size n = w.n();

    auto body = [&](size_t i) {
        const auto nbrs = w.neighbors(i);
        const auto wts = w.weights(i);
        out[i] = detail::row_lag(nbrs.ptr, wts.ptr, nbrs.len, values);
    };

    if (n < config::PARALLEL_THRESHOLD) {
        for (Size i = 0; i < n; ++i) body(i);
    } else {
        sal::threading::parallel_for(Size(0), n, body);
    }
}

inline void spatial_lag(const WeightsGraph& w, Array<const Real> values, Array<Real> out) {
    SAL_CHECK_DIM(values.len == w.n(), "spatial_lag: values length must equal number of locations");
    SAL_CHECK_DIM(out.len >= w.n(), "spatial_lag: output buffer too small");
    spatial_lag_unchecked(w, values.ptr, out.ptr);
}

} // namespace sal::kernel::lag
