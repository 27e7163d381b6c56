#pragma once

#include "sal/core/type.hpp"
#include "sal/core/simd.hpp"
#include "sal/core/error.hpp"
#include "sal/core/macros.hpp"
#include "sal/core/memory.hpp"
#include "sal/core/random.hpp"
#include "sal/core/cancel.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

// =============================================================================
// FILE: sal/kernel/permutation.hpp
// BRIEF: Shared Monte Carlo inference for the Getis-Ord statistics
//
// Tail rule shared by the global and the per-location tests:
//   larger = #(sim >= observed)
//   larger = min(larger, completed - larger)
//   p_sim  = (larger + 1) / (completed + 1)
//
// Summaries use population moments (divide by the sample count).
// =============================================================================

namespace sal::kernel::permutation {

namespace config {
    constexpr Size DEFAULT_PERMUTATIONS = 999;
    constexpr uint64_t DEFAULT_SEED = 42;
}

struct SimSummary {
    Real mean;
    Real std;
    Real var;
};

namespace detail {

// Count of data[i] >= thresh
SAL_FORCE_INLINE Size count_geq_simd(const Real* data, Size n, Real thresh) noexcept {
    namespace s = sal::simd;
    const s::RealTag d;
    const Size lanes = s::Lanes(d);
    const auto tv = s::Set(d, thresh);

    Size count = 0;
    Size i = 0;

    for (; i + lanes <= n; i += lanes) {
        count += s::CountTrue(d, s::Ge(s::LoadU(d, data + i), tv));
    }

    for (; i < n; ++i) {
        count += (data[i] >= thresh);
    }

    return count;
}

// Sum and centered sum of squares over rows[r * stride + c], c < cols.
// Rows with skip[r] != 0 are left out; skip may be null.
SAL_FORCE_INLINE SimSummary summarize_strided(
    const Real* data, Size rows, Size stride, Size cols, const std::uint8_t* skip = nullptr
) noexcept {
    Size kept = 0;
    Real sum = 0;
    for (Size r = 0; r < rows; ++r) {
        if (skip && skip[r]) continue;
        ++kept;
        const Real* row = data + r * stride;
        for (Size c = 0; c < cols; ++c) sum += row[c];
    }

    const Size total = kept * cols;
    if (total == 0) {
        const Real nan = std::numeric_limits<Real>::quiet_NaN();
        return SimSummary{nan, nan, nan};
    }
    const Real mean = sum / static_cast<Real>(total);

    Real ss = 0;
    for (Size r = 0; r < rows; ++r) {
        if (skip && skip[r]) continue;
        const Real* row = data + r * stride;
        for (Size c = 0; c < cols; ++c) {
            const Real dv = row[c] - mean;
            ss += dv * dv;
        }
    }
    const Real var = ss / static_cast<Real>(total);

    return SimSummary{mean, std::sqrt(var), var};
}

} // namespace detail

// =============================================================================
// Tail Counting
// =============================================================================

SAL_FORCE_INLINE Size count_geq(Array<const Real> sim, Real observed) noexcept {
    return detail::count_geq_simd(sim.ptr, sim.len, observed);
}

// Folded one-sided pseudo p-value, in [1/(completed+1), 1/2 + 1/(completed+1)]
SAL_FORCE_INLINE Real tail_pvalue(Size larger, Size completed) noexcept {
    const Size smaller = completed - std::min(larger, completed);
    const Size tail = std::min(larger, smaller);
    return static_cast<Real>(tail + 1) / static_cast<Real>(completed + 1);
}

// =============================================================================
// Summaries
// =============================================================================

SAL_FORCE_INLINE SimSummary summarize(Array<const Real> sim) noexcept {
    return detail::summarize_strided(sim.ptr, 1, sim.len, sim.len);
}

// Pooled summary of a rows x cols block stored with the given row stride,
// leaving out rows flagged in skip (optional)
SAL_FORCE_INLINE SimSummary summarize_pooled(
    const Real* data, Size rows, Size stride, Size cols, const std::uint8_t* skip = nullptr
) noexcept {
    return detail::summarize_strided(data, rows, stride, cols, skip);
}

// =============================================================================
// Full-Shuffle Driver
// =============================================================================

// Draws up to sim.len uniform permutations of values from one stream seeded
// by seed, in sequence, writing stat(permuted) to sim[t]. The cancel token is
// polled before every trial. Returns the number of trials completed.
//
// StatFunc: Real(const Real* permuted)
template <typename StatFunc>
Size run_full_shuffles(
    Array<const Real> values,
    uint64_t seed,
    StatFunc&& stat,
    Array<Real> sim,
    const CancelToken* cancel = nullptr
) {
    const Size n = values.len;
    memory::AlignedBuffer<Real> permuted(n);
    std::copy(values.begin(), values.end(), permuted.get());

    random::FastRNG rng(seed);

    Size t = 0;
    for (; t < sim.len; ++t) {
        if (SAL_UNLIKELY(cancel_requested(cancel))) break;
        random::shuffle(permuted.get(), n, rng);
        sim[t] = stat(static_cast<const Real*>(permuted.get()));
    }
    return t;
}

} // namespace sal::kernel::permutation
