#pragma once

#include "sal/core/type.hpp"
#include "sal/core/error.hpp"
#include "sal/core/macros.hpp"
#include "sal/core/memory.hpp"
#include "sal/core/random.hpp"
#include "sal/core/cancel.hpp"
#include "sal/core/vectorize.hpp"
#include "sal/core/weights.hpp"
#include "sal/math/normal.hpp"
#include "sal/kernel/lag.hpp"
#include "sal/kernel/permutation.hpp"
#include "sal/threading/parallel_for.hpp"
#include "sal/threading/workspace.hpp"
#include "sal/threading/scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>

// =============================================================================
// FILE: sal/kernel/getis_ord.hpp
// BRIEF: Getis-Ord global G and local G / G* with analytic and permutation
//        inference
//
// Notes:
//   1. Both engines force the weight transform they need through a
//      ScopedTransform and hand the caller's transform back on return.
//   2. Global permutations run sequentially from one stream, so the simulated
//      sequence depends only on the seed.
//   3. Local conditional permutation draws one shared matrix of candidate
//      positions from the master stream and, per location, one shuffled pool
//      of the other ids from a stream derived from (seed, location). Results
//      do not depend on the thread count.
//   4. The local simulation summary (EG_sim, seG_sim, VG_sim) is pooled over
//      the whole n x permutations matrix; z_sim / p_z_sim per location use
//      that pooled summary. Islands under G are left out of it.
//   5. Local rounds run in blocks over all locations. Cancellation drops the
//      block in flight, so completed is the common prefix every location ran.
// =============================================================================

namespace sal::kernel::getis_ord {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    constexpr Size MIN_LOCATIONS = 4;  // fourth-moment formulas need n >= 4
    constexpr Size DEFAULT_PERMUTATIONS = permutation::config::DEFAULT_PERMUTATIONS;
    constexpr uint64_t DEFAULT_SEED = permutation::config::DEFAULT_SEED;
    constexpr Size CANCEL_CHECK_INTERVAL = 64;
    constexpr Size LOCAL_GRAIN = 16;
    constexpr Size POOL_REBUILD_RATIO = 8;  // block work >= ratio * pool shuffle
}

enum class PValueKind : std::int32_t {
    Normal = 0,   // p_norm
    Sim = 1,      // p_sim
    ZSim = 2      // p_z_sim
};

// =============================================================================
// Result Types
// =============================================================================

struct GlobalGResult {
    Real G;
    Real EG;
    Real EG2;
    Real VG;
    Real z_norm;
    Real p_norm;

    // Moment polynomials of the analytic variance
    Real b0, b1, b2, b3, b4;
    Real den_sum;   // (sum y)^2 - sum y^2

    Size permutations;
    Size completed;
    bool cancelled;

    // NaN unless completed > 0
    Real p_sim;
    Real EG_sim;
    Real seG_sim;
    Real VG_sim;
    Real z_sim;
    Real p_z_sim;

    [[nodiscard]] bool has_simulation() const noexcept { return completed > 0; }
};

// Caller-owned output buffers for local_g. The first five are required
// (length >= n). p_sim, z_sim and p_z_sim are required when permutations > 0.
// sim is optional; when supplied it receives the simulated values with row i
// (length permutations) holding location i.
struct LocalGOutput {
    Array<Real> Gs;
    Array<Real> EGs;
    Array<Real> VGs;
    Array<Real> Zs;
    Array<Real> p_norm;

    Array<Real> p_sim;
    Array<Real> z_sim;
    Array<Real> p_z_sim;

    Array<Real> sim;
};

struct LocalGResult {
    Real EG_sim;
    Real seG_sim;
    Real VG_sim;

    Size permutations;
    Size completed;
    bool cancelled;

    [[nodiscard]] bool has_simulation() const noexcept { return completed > 0; }
};

// =============================================================================
// Internal Helpers
// =============================================================================

namespace detail {

constexpr Real NaN = std::numeric_limits<Real>::quiet_NaN();

SAL_FORCE_INLINE Real normal_tail_p(Real z) noexcept {
    return static_cast<Real>(sal::math::normal_sf(std::abs(static_cast<double>(z))));
}

SAL_FORCE_INLINE void check_common(const WeightsGraph& w, Array<const Real> y, const char* who) {
    SAL_CHECK_ARG(w.n() >= config::MIN_LOCATIONS,
                  std::string(who) + ": need at least 4 locations, got " + std::to_string(w.n()));
    SAL_CHECK_DIM(y.len == w.n(),
                  std::string(who) + ": values length " + std::to_string(y.len) +
                  " does not match " + std::to_string(w.n()) + " locations");
}

SAL_COLD inline void warn_cancelled(const char* who, Size completed, Size requested) {
    std::fprintf(stderr, "WARNING: %s cancelled after %zu of %zu permutations\n",
                 who, completed, requested);
}

// Rounds per local block: a multiple of CANCEL_CHECK_INTERVAL, long enough
// that rebuilding an (n - 1) pool is a small share of a location's work
inline Size local_block_rounds(Size n_1, Size k, Size n_permutations) noexcept {
    const Size step = config::CANCEL_CHECK_INTERVAL;
    const Size want = (config::POOL_REBUILD_RATIO * n_1 + k - 1) / k;
    const Size block = std::max(step, ((want + step - 1) / step) * step);
    return std::min(block, n_permutations);
}

// Analytic moments of G under normality. Expects binary weight sums.
inline void global_moments(
    Size n_locations, const WeightSums& ws, const vectorize::PowerSums<Real>& ps,
    GlobalGResult& r
) noexcept {
    const Real n = static_cast<Real>(n_locations);
    const Real s0 = ws.s0;
    const Real s1 = ws.s1;
    const Real s2 = ws.s2;
    const Real s02 = s0 * s0;

    r.EG = s0 / (n * (n - 1));

    r.b0 = (n * n - 3 * n + 3) * s1 - n * s2 + 3 * s02;
    r.b1 = -((n * n - n) * s1 - 2 * n * s2 + 6 * s02);
    r.b2 = -(2 * n * s1 - (n + 3) * s2 + 6 * s02);
    r.b3 = 4 * (n - 1) * s1 - 2 * (n + 1) * s2 + 8 * s02;
    r.b4 = s1 - s2 + s02;

    const Real sy = ps.s1;
    const Real sy2 = ps.s2;
    const Real sy_sq = sy * sy;

    const Real num = r.b0 * sy2 * sy2 + r.b1 * ps.s4 + r.b2 * sy_sq * sy2 +
                     r.b3 * sy * ps.s3 + r.b4 * sy_sq * sy_sq;
    const Real den = r.den_sum * r.den_sum * n * (n - 1) * (n - 2) * (n - 3);

    r.EG2 = num / den;
    r.VG = r.EG2 - r.EG * r.EG;
    r.z_norm = (r.G - r.EG) / std::sqrt(r.VG);
    r.p_norm = normal_tail_p(r.z_norm);
}

inline void clear_global_simulation(GlobalGResult& r) noexcept {
    r.p_sim = NaN;
    r.EG_sim = NaN;
    r.seG_sim = NaN;
    r.VG_sim = NaN;
    r.z_sim = NaN;
    r.p_z_sim = NaN;
}

// Global G on a graph already in the binary transform
inline GlobalGResult global_g_binary(
    const WeightsGraph& w,
    Array<const Real> y,
    Size n_permutations,
    uint64_t seed,
    Array<Real> sim,
    const CancelToken* cancel
) {
    const Size n = w.n();

    GlobalGResult r{};
    r.permutations = n_permutations;
    r.completed = 0;
    r.cancelled = false;

    const auto ps = vectorize::power_sums(y);
    r.den_sum = ps.s1 * ps.s1 - ps.s2;

    memory::AlignedBuffer<Real> wy(n);
    lag::spatial_lag_unchecked(w, y.ptr, wy.get());
    r.G = vectorize::dot(y, Array<const Real>(wy.get(), n)) / r.den_sum;

    global_moments(n, w.sums(), ps, r);
    clear_global_simulation(r);

    if (n_permutations == 0) {
        return r;
    }

    memory::AlignedBuffer<Real> own_sim;
    Array<Real> samples = sim;
    if (samples.len == 0) {
        own_sim = memory::AlignedBuffer<Real>(n_permutations);
        samples = own_sim.array();
    }
    samples = samples.first(n_permutations);

    const Real den_sum = r.den_sum;
    auto stat = [&](const Real* permuted) -> Real {
        lag::spatial_lag_unchecked(w, permuted, wy.get());
        return vectorize::dot(Array<const Real>(permuted, n),
                              Array<const Real>(wy.get(), n)) / den_sum;
    };

    const Size done = permutation::run_full_shuffles(y, seed, stat, samples, cancel);
    r.completed = done;
    if (done < n_permutations) {
        r.cancelled = true;
        warn_cancelled("global G", done, n_permutations);
    }
    if (done == 0) {
        return r;
    }

    const Array<const Real> drawn(samples.ptr, done);
    const Size larger = permutation::count_geq(drawn, r.G);
    r.p_sim = permutation::tail_pvalue(larger, done);

    const auto summary = permutation::summarize(drawn);
    r.EG_sim = summary.mean;
    r.seG_sim = summary.std;
    r.VG_sim = summary.var;
    r.z_sim = (r.G - r.EG_sim) / r.seG_sim;
    r.p_z_sim = normal_tail_p(r.z_sim);

    return r;
}

// Local statistic on a graph already in the transform the variant needs:
// binary for G*, the requested transform for G.
inline LocalGResult local_g_prepared(
    const WeightsGraph& w,
    Array<const Real> y,
    const LocalGOutput& out,
    Transform transform,
    bool star,
    Size n_permutations,
    uint64_t seed,
    const CancelToken* cancel
) {
    const Size n = w.n();
    const bool row_std = (transform == Transform::RowStandardized);
    const Real star_r = star ? Real(1) : Real(0);

    const Real sy = vectorize::sum(y);
    const Real sy2 = vectorize::sum_squared(y);

    // Global population moments for G*
    const Real mean_all = sy / static_cast<Real>(n);
    Real var_all = 0;
    for (Size i = 0; i < n; ++i) {
        const Real dv = y[i] - mean_all;
        var_all += dv * dv;
    }
    var_all /= static_cast<Real>(n);

    memory::AlignedBuffer<Real> wy(n);
    lag::spatial_lag_unchecked(w, y.ptr, wy.get());

    // -------------------------------------------------------------------------
    // Observed statistic and analytic moments
    // -------------------------------------------------------------------------

    sal::threading::parallel_for(Size(0), n, [&](size_t i) {
        const Real yi = y[i];
        const auto card = static_cast<Real>(w.cardinality(i));

        Real gs;
        Real big_n;
        Real mean_i;
        Real s2_i;

        if (!star) {
            const Real rest = sy - yi;
            gs = wy[i] / rest;
            big_n = static_cast<Real>(n - 1);
            mean_i = rest / big_n;
            s2_i = (sy2 - yi * yi) / big_n - mean_i * mean_i;
        } else {
            Real yl = wy[i] + yi;
            if (row_std) yl = yl / (card + Real(1));
            gs = yl / sy;
            big_n = static_cast<Real>(n);
            mean_i = mean_all;
            s2_i = var_all;
        }

        Real eg_num = 1;
        Real vg_num = 1;
        if (!row_std) {
            const Real wi = card + star_r;
            eg_num = wi;
            vg_num = wi * (big_n - wi) / (big_n - 1);
        }

        const Real eg = eg_num / big_n;
        const Real vg = vg_num * (Real(1) / (big_n * big_n)) * (s2_i / (mean_i * mean_i));
        const Real z = (gs - eg) / std::sqrt(vg);

        out.Gs[i] = gs;
        out.EGs[i] = eg;
        out.VGs[i] = vg;
        out.Zs[i] = z;
        out.p_norm[i] = normal_tail_p(z);
    });

    LocalGResult res{};
    res.EG_sim = NaN;
    res.seG_sim = NaN;
    res.VG_sim = NaN;
    res.permutations = n_permutations;
    res.completed = 0;
    res.cancelled = false;

    if (n_permutations == 0) {
        return res;
    }

    // -------------------------------------------------------------------------
    // Conditional permutation
    // -------------------------------------------------------------------------

    const Size n_1 = n - 1;
    const Size k = std::min(static_cast<Size>(w.max_cardinality()) + 1, n_1);

    // Shared candidate positions: row r is the first k entries of a uniform
    // permutation of [0, n - 1)
    memory::AlignedBuffer<Index> positions(n_permutations * k);
    {
        memory::AlignedBuffer<Index> rid(n_1);
        for (Size t = 0; t < n_1; ++t) rid[t] = static_cast<Index>(t);

        random::FastRNG master(seed);
        for (Size r = 0; r < n_permutations; ++r) {
            random::partial_shuffle(rid.get(), n_1, k, master);
            std::copy(rid.get(), rid.get() + k, positions.get() + r * k);
        }
    }

    memory::AlignedBuffer<Real> own_sim;
    Real* sim = out.sim.ptr;
    if (out.sim.len == 0) {
        own_sim = memory::AlignedBuffer<Real>(n * n_permutations);
        sim = own_sim.get();
    }

    // Under G an island has no neighborhood to permute: its row is NaN and
    // it stays out of the pooled summary
    memory::AlignedBuffer<std::uint8_t> island(n);
    for (Size i = 0; i < n; ++i) {
        island[i] = (!star && w.cardinality(i) == 0) ? 1 : 0;
    }

    const Size n_slots = sal::threading::Scheduler::workspace_slots();
    sal::threading::WorkspacePool<Index> pools(n_slots, n_1);
    const Size block = local_block_rounds(n_1, k, n_permutations);

    // Every location finishes a block before the next one starts, so a
    // cancelled run keeps a common prefix of rounds
    Size done = 0;
    while (done < n_permutations) {
        const Size r0 = done;
        const Size r1 = std::min(n_permutations, r0 + block);
        std::atomic<bool> abandoned{false};

        sal::threading::parallel_for(Size(0), n, [&](size_t i, size_t rank) {
            Real* row = sim + i * n_permutations;
            if (island[i]) {
                std::fill(row + r0, row + r1, NaN);
                return;
            }

            // The pool depends only on (seed, i); every block rebuilds the same one
            Index* pool = pools.get(rank);
            for (Size t = 0; t < n_1; ++t) {
                pool[t] = static_cast<Index>(t < i ? t : t + 1);
            }
            random::FastRNG rng(random::derive_seed(seed, i));
            random::shuffle(pool, n_1, rng);

            const auto card = static_cast<Size>(w.cardinality(i));
            const Real yi = y[i];
            const Real self = star ? yi : Real(0);
            const Real den = row_std ? static_cast<Real>(card) + star_r : Real(1);
            const Real norm = sy - (Real(1) - star_r) * yi;
            const Index* pos = positions.get();

            for (Size r = r0; r < r1; ++r) {
                if (r % config::CANCEL_CHECK_INTERVAL == 0 && SAL_UNLIKELY(cancel_requested(cancel))) {
                    abandoned.store(true, std::memory_order_relaxed);
                    return;
                }
                const Index* prow = pos + r * k;
                Real acc = 0;
                for (Size c = 0; c < card; ++c) {
                    acc += y[static_cast<Size>(pool[prow[c]])];
                }
                row[r] = ((acc + self) / den) / norm;
            }
        }, config::LOCAL_GRAIN);

        if (abandoned.load(std::memory_order_relaxed)) {
            break;
        }
        done = r1;
    }

    res.completed = done;
    if (done < n_permutations) {
        res.cancelled = true;
        warn_cancelled("local G", done, n_permutations);
    }

    if (done == 0) {
        memory::fill(out.p_sim.first(n), NaN);
        memory::fill(out.z_sim.first(n), NaN);
        memory::fill(out.p_z_sim.first(n), NaN);
        return res;
    }

    const auto summary = permutation::summarize_pooled(sim, n, n_permutations, done, island.get());
    res.EG_sim = summary.mean;
    res.seG_sim = summary.std;
    res.VG_sim = summary.var;

    sal::threading::parallel_for(Size(0), n, [&](size_t i) {
        if (island[i]) {
            out.p_sim[i] = NaN;
            out.z_sim[i] = NaN;
            out.p_z_sim[i] = NaN;
            return;
        }
        const Array<const Real> drawn(sim + i * n_permutations, done);
        const Real gs = out.Gs[i];
        out.p_sim[i] = permutation::tail_pvalue(permutation::count_geq(drawn, gs), done);
        const Real z = (gs - summary.mean) / summary.std;
        out.z_sim[i] = z;
        out.p_z_sim[i] = normal_tail_p(z);
    });

    return res;
}

inline void check_local_output(const LocalGOutput& out, Size n, Size n_permutations) {
    SAL_CHECK_DIM(out.Gs.len >= n, "local_g: Gs buffer too small");
    SAL_CHECK_DIM(out.EGs.len >= n, "local_g: EGs buffer too small");
    SAL_CHECK_DIM(out.VGs.len >= n, "local_g: VGs buffer too small");
    SAL_CHECK_DIM(out.Zs.len >= n, "local_g: Zs buffer too small");
    SAL_CHECK_DIM(out.p_norm.len >= n, "local_g: p_norm buffer too small");
    if (n_permutations > 0) {
        SAL_CHECK_DIM(out.p_sim.len >= n, "local_g: p_sim buffer too small");
        SAL_CHECK_DIM(out.z_sim.len >= n, "local_g: z_sim buffer too small");
        SAL_CHECK_DIM(out.p_z_sim.len >= n, "local_g: p_z_sim buffer too small");
        SAL_CHECK_DIM(out.sim.len == 0 || out.sim.len >= n * n_permutations,
                      "local_g: sim buffer too small (need n * permutations)");
    }
}

inline void check_local_transform(Transform transform) {
    SAL_CHECK_ARG(transform == Transform::Binary || transform == Transform::RowStandardized,
                  std::string("local_g: transform must be binary or row-standardized, got ") +
                  transform_name(transform));
}

inline void check_pvalue_kind(PValueKind kind, Size n_permutations) {
    SAL_CHECK_ARG(kind == PValueKind::Normal || kind == PValueKind::Sim || kind == PValueKind::ZSim,
                  "getis_ord: unknown p-value kind");
    SAL_CHECK_ARG(kind == PValueKind::Normal || n_permutations > 0,
                  "getis_ord: simulated p-values need permutations > 0");
}

} // namespace detail

// =============================================================================
// Global G
// =============================================================================

// Global Getis-Ord G over the binary graph. The caller's transform is
// restored on return. sim, when non-empty, must hold n_permutations values
// and receives the simulated G sequence.
inline GlobalGResult global_g(
    WeightsGraph& w,
    Array<const Real> y,
    Size n_permutations = config::DEFAULT_PERMUTATIONS,
    uint64_t seed = config::DEFAULT_SEED,
    Array<Real> sim = {},
    const CancelToken* cancel = nullptr
) {
    detail::check_common(w, y, "global_g");
    SAL_CHECK_DIM(sim.len == 0 || sim.len >= n_permutations, "global_g: sim buffer too small");

    ScopedTransform scope(w, Transform::Binary);
    GlobalGResult r = detail::global_g_binary(w, y, n_permutations, seed, sim, cancel);
    scope.restore();
    return r;
}

// =============================================================================
// Local G / G*
// =============================================================================

// Local Getis-Ord statistic. transform selects binary or row-standardized
// weights; star includes each location in its own neighborhood (G*).
inline LocalGResult local_g(
    WeightsGraph& w,
    Array<const Real> y,
    const LocalGOutput& out,
    Transform transform = Transform::RowStandardized,
    bool star = false,
    Size n_permutations = config::DEFAULT_PERMUTATIONS,
    uint64_t seed = config::DEFAULT_SEED,
    const CancelToken* cancel = nullptr
) {
    detail::check_local_transform(transform);
    detail::check_common(w, y, "local_g");
    detail::check_local_output(out, w.n(), n_permutations);

    // G* always sums over binary neighbors and rescales itself
    ScopedTransform scope(w, star ? Transform::Binary : transform);
    LocalGResult r = detail::local_g_prepared(w, y, out, transform, star,
                                              n_permutations, seed, cancel);
    scope.restore();
    return r;
}

// =============================================================================
// Standardized Accessors
// =============================================================================

SAL_FORCE_INLINE Real statistic(const GlobalGResult& r) noexcept {
    return r.G;
}

inline Real pvalue(const GlobalGResult& r, PValueKind kind) {
    switch (kind) {
        case PValueKind::Normal: return r.p_norm;
        case PValueKind::Sim:    return r.p_sim;
        case PValueKind::ZSim:   return r.p_z_sim;
    }
    throw ValueError("pvalue: unknown p-value kind");
}

SAL_FORCE_INLINE Array<Real> statistic(const LocalGOutput& out) noexcept {
    return out.Gs;
}

inline Array<Real> pvalue(const LocalGOutput& out, PValueKind kind) {
    switch (kind) {
        case PValueKind::Normal: return out.p_norm;
        case PValueKind::Sim:    return out.p_sim;
        case PValueKind::ZSim:   return out.p_z_sim;
    }
    throw ValueError("pvalue: unknown p-value kind");
}

// =============================================================================
// Batch (one statistic per column)
// =============================================================================

// values is feature-major (n_features x n). Column f uses seed + f.
// stat[f] = G, pval[f] = chosen p-value. completed, when non-empty, receives
// the simulated-sample count of each feature. A cancelled feature keeps its
// partial result; the features after it are not run and come back NaN with
// completed = 0. Returns the number of features that ran.
inline Size global_g_batch(
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
) {
    const Size n = w.n();
    SAL_CHECK_ARG(n >= config::MIN_LOCATIONS, "global_g_batch: need at least 4 locations");
    SAL_CHECK_DIM(values.len >= n_features * n, "global_g_batch: values buffer too small");
    SAL_CHECK_DIM(stat.len >= n_features, "global_g_batch: stat buffer too small");
    SAL_CHECK_DIM(pval.len >= n_features, "global_g_batch: pval buffer too small");
    SAL_CHECK_DIM(completed.len == 0 || completed.len >= n_features,
                  "global_g_batch: completed buffer too small");
    detail::check_pvalue_kind(kind, n_permutations);

    ScopedTransform scope(w, Transform::Binary);
    Size ran = 0;
    bool cancelled = false;
    for (; ran < n_features && !cancelled; ++ran) {
        const auto r = detail::global_g_binary(w, values.subspan(ran * n, n), n_permutations,
                                               seed + ran, Array<Real>(), cancel);
        stat[ran] = statistic(r);
        pval[ran] = pvalue(r, kind);
        if (completed.len > 0) completed[ran] = r.completed;
        cancelled = r.cancelled;
    }
    scope.restore();

    for (Size f = ran; f < n_features; ++f) {
        stat[f] = detail::NaN;
        pval[f] = detail::NaN;
        if (completed.len > 0) completed[f] = 0;
    }
    return ran;
}

// stat and pval are feature-major (n_features x n): row f holds Gs and the
// chosen p-value for column f. Cancellation behaves as in global_g_batch.
inline Size local_g_batch(
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
) {
    const Size n = w.n();
    detail::check_local_transform(transform);
    SAL_CHECK_ARG(n >= config::MIN_LOCATIONS, "local_g_batch: need at least 4 locations");
    SAL_CHECK_DIM(values.len >= n_features * n, "local_g_batch: values buffer too small");
    SAL_CHECK_DIM(stat.len >= n_features * n, "local_g_batch: stat buffer too small");
    SAL_CHECK_DIM(pval.len >= n_features * n, "local_g_batch: pval buffer too small");
    SAL_CHECK_DIM(completed.len == 0 || completed.len >= n_features,
                  "local_g_batch: completed buffer too small");
    detail::check_pvalue_kind(kind, n_permutations);

    memory::AlignedBuffer<Real> scratch(7 * n);
    Real* base = scratch.get();

    ScopedTransform scope(w, star ? Transform::Binary : transform);
    Size ran = 0;
    bool cancelled = false;
    for (; ran < n_features && !cancelled; ++ran) {
        LocalGOutput out;
        out.Gs = stat.subspan(ran * n, n);
        out.EGs = Array<Real>(base, n);
        out.VGs = Array<Real>(base + n, n);
        out.Zs = Array<Real>(base + 2 * n, n);
        out.p_norm = Array<Real>(base + 3 * n, n);
        out.p_sim = Array<Real>(base + 4 * n, n);
        out.z_sim = Array<Real>(base + 5 * n, n);
        out.p_z_sim = Array<Real>(base + 6 * n, n);

        const auto r = detail::local_g_prepared(w, values.subspan(ran * n, n), out, transform,
                                                star, n_permutations, seed + ran, cancel);

        const auto chosen = pvalue(out, kind);
        std::copy(chosen.begin(), chosen.end(), pval.ptr + ran * n);
        if (completed.len > 0) completed[ran] = r.completed;
        cancelled = r.cancelled;
    }
    scope.restore();

    memory::fill(stat.subspan(ran * n, (n_features - ran) * n), detail::NaN);
    memory::fill(pval.subspan(ran * n, (n_features - ran) * n), detail::NaN);
    for (Size f = ran; f < n_features; ++f) {
        if (completed.len > 0) completed[f] = 0;
    }
    return ran;
}

} // namespace sal::kernel::getis_ord
