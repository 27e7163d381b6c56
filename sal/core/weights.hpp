#pragma once

#include "sal/core/type.hpp"
#include "sal/core/macros.hpp"
#include "sal/core/error.hpp"
#include "sal/core/memory.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

// =============================================================================
// FILE: sal/core/weights.hpp
// BRIEF: Spatial weights graph with switchable weight transform
//
// A WeightsGraph owns a CSR neighbor structure (row i lists the neighbors of
// location i) together with the caller's original edge weights. The active
// weights follow the current Transform; switching transforms rescales edges
// but never changes the neighbor set.
//
// Cached aggregates for the active transform:
//   s0 = sum_ij w_ij
//   s1 = 1/2 sum_ij (w_ij + w_ji)^2
//   s2 = sum_i (sum_j w_ij + sum_j w_ji)^2
// =============================================================================

namespace sal {

enum class Transform : std::int32_t {
    Original = 0,         // weights as supplied
    Binary = 1,           // every listed neighbor weighs 1
    RowStandardized = 2   // each row rescaled to sum to 1
};

SAL_FORCE_INLINE const char* transform_name(Transform t) noexcept {
    switch (t) {
        case Transform::Original:        return "original";
        case Transform::Binary:          return "binary";
        case Transform::RowStandardized: return "row-standardized";
    }
    return "unknown";
}

SAL_FORCE_INLINE bool is_valid_transform(Transform t) noexcept {
    return t == Transform::Original || t == Transform::Binary ||
           t == Transform::RowStandardized;
}

struct WeightSums {
    Real s0;
    Real s1;
    Real s2;
};

// =============================================================================
// WeightsGraph
// =============================================================================

class ScopedTransform;

class WeightsGraph {
public:
    // indptr has n + 1 entries. weights may be empty, in which case every
    // listed edge gets weight 1. ids may be empty (ids default to 0..n-1).
    // Neighbor lists are sorted on construction; the graph starts in the
    // Original transform.
    WeightsGraph(Array<const Index> indptr,
                 Array<const Index> indices,
                 Array<const Real> weights = {},
                 Array<const Index> ids = {}) {
        SAL_CHECK_ARG(indptr.len >= 2, "WeightsGraph: need at least one location");
        n_ = indptr.len - 1;
        SAL_CHECK_ARG(indptr[0] == 0, "WeightsGraph: indptr[0] must be 0");
        for (Size i = 0; i < n_; ++i) {
            SAL_CHECK_ARG(indptr[i + 1] >= indptr[i], "WeightsGraph: indptr must be non-decreasing");
        }
        nnz_ = static_cast<Size>(indptr[n_]);
        SAL_CHECK_DIM(indices.len == nnz_, "WeightsGraph: indices length must equal indptr[n]");
        SAL_CHECK_DIM(weights.len == 0 || weights.len == nnz_,
                      "WeightsGraph: weights length must equal indptr[n]");
        SAL_CHECK_DIM(ids.len == 0 || ids.len == n_,
                      "WeightsGraph: ids length must equal the number of locations");

        indptr_ = memory::AlignedBuffer<Index>(n_ + 1);
        indices_ = memory::AlignedBuffer<Index>(nnz_);
        original_ = memory::AlignedBuffer<Real>(nnz_);
        active_ = memory::AlignedBuffer<Real>(nnz_);
        ids_ = memory::AlignedBuffer<Index>(n_);
        col_sum_ = memory::AlignedBuffer<Real>(n_);

        for (Size i = 0; i <= n_; ++i) {
            indptr_[i] = indptr[i];
        }

        std::vector<std::pair<Index, Real>> row;
        for (Size i = 0; i < n_; ++i) {
            const auto begin = static_cast<Size>(indptr_[i]);
            const auto end = static_cast<Size>(indptr_[i + 1]);

            row.clear();
            for (Size k = begin; k < end; ++k) {
                const Index j = indices[k];
                SAL_CHECK_BOUNDS(j, n_, "WeightsGraph: neighbor index " + std::to_string(j) +
                                 " of location " + std::to_string(i) + " is out of range");
                SAL_CHECK_ARG(static_cast<Size>(j) != i,
                              "WeightsGraph: location " + std::to_string(i) + " lists itself as a neighbor");
                const Real w = weights.len ? weights[k] : Real(1);
                SAL_CHECK_ARG(std::isfinite(w) && w >= Real(0),
                              "WeightsGraph: weights must be finite and non-negative");
                row.emplace_back(j, w);
            }

            std::sort(row.begin(), row.end(),
                      [](const auto& a, const auto& b) { return a.first < b.first; });

            for (Size k = 0; k < row.size(); ++k) {
                if (k > 0) {
                    SAL_CHECK_ARG(row[k].first != row[k - 1].first,
                                  "WeightsGraph: location " + std::to_string(i) +
                                  " lists neighbor " + std::to_string(row[k].first) + " twice");
                }
                indices_[begin + k] = row[k].first;
                original_[begin + k] = row[k].second;
            }

            const auto card = static_cast<Index>(end - begin);
            if (card > max_card_) max_card_ = card;
            if (card == 0) ++n_islands_;
        }

        if (ids.len) {
            std::vector<Index> sorted(ids.begin(), ids.end());
            std::sort(sorted.begin(), sorted.end());
            SAL_CHECK_ARG(std::adjacent_find(sorted.begin(), sorted.end()) == sorted.end(),
                          "WeightsGraph: location ids must be unique");
            for (Size i = 0; i < n_; ++i) ids_[i] = ids[i];
        } else {
            for (Size i = 0; i < n_; ++i) ids_[i] = static_cast<Index>(i);
        }

#if !defined(NDEBUG)
        if (n_islands_ > 0) {
            std::fprintf(stderr, "WARNING: WeightsGraph has %zu island(s) with no neighbors\n",
                         n_islands_);
        }
#endif

        apply(Transform::Original);
    }

    ~WeightsGraph() = default;

    WeightsGraph(const WeightsGraph&) = delete;
    WeightsGraph& operator=(const WeightsGraph&) = delete;

    WeightsGraph(WeightsGraph&&) noexcept = default;
    WeightsGraph& operator=(WeightsGraph&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Shape
    // -------------------------------------------------------------------------

    [[nodiscard]] Size n() const noexcept { return n_; }
    [[nodiscard]] Size nnz() const noexcept { return nnz_; }
    [[nodiscard]] Size n_islands() const noexcept { return n_islands_; }

    [[nodiscard]] SAL_FORCE_INLINE Index cardinality(Size i) const noexcept {
        return indptr_[i + 1] - indptr_[i];
    }

    [[nodiscard]] Index max_cardinality() const noexcept { return max_card_; }

    [[nodiscard]] SAL_FORCE_INLINE Array<const Index> neighbors(Size i) const noexcept {
        const auto begin = static_cast<Size>(indptr_[i]);
        return Array<const Index>(indices_.get() + begin, static_cast<Size>(cardinality(i)));
    }

    // Active weights of row i (current transform)
    [[nodiscard]] SAL_FORCE_INLINE Array<const Real> weights(Size i) const noexcept {
        const auto begin = static_cast<Size>(indptr_[i]);
        return Array<const Real>(active_.get() + begin, static_cast<Size>(cardinality(i)));
    }

    [[nodiscard]] Array<const Index> ids() const noexcept { return ids_.array(); }
    [[nodiscard]] Array<const Index> indptr() const noexcept { return indptr_.array(); }

    // -------------------------------------------------------------------------
    // Transform
    // -------------------------------------------------------------------------

    [[nodiscard]] Transform transform() const noexcept { return transform_; }

    // Bumped every time the transform actually changes
    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }

    // Setting the current transform again is a no-op.
    void set_transform(Transform t) {
        SAL_CHECK_ARG(is_valid_transform(t), "WeightsGraph: unknown transform");
        if (t == transform_) return;
        apply(t);
        ++generation_;
    }

    // -------------------------------------------------------------------------
    // Aggregates (current transform)
    // -------------------------------------------------------------------------

    [[nodiscard]] const WeightSums& sums() const noexcept { return sums_; }
    [[nodiscard]] Real s0() const noexcept { return sums_.s0; }
    [[nodiscard]] Real s1() const noexcept { return sums_.s1; }
    [[nodiscard]] Real s2() const noexcept { return sums_.s2; }

private:
    friend class ScopedTransform;

    // Active weight of edge (i, j), 0 when j is not a neighbor of i
    [[nodiscard]] Real edge_weight(Size i, Index j) const noexcept {
        const auto nbrs = neighbors(i);
        const auto* it = std::lower_bound(nbrs.begin(), nbrs.end(), j);
        if (it == nbrs.end() || *it != j) return Real(0);
        return active_[static_cast<Size>(indptr_[i]) + static_cast<Size>(it - nbrs.begin())];
    }

    void apply(Transform t) noexcept {
        for (Size i = 0; i < n_; ++i) {
            const auto begin = static_cast<Size>(indptr_[i]);
            const auto end = static_cast<Size>(indptr_[i + 1]);

            switch (t) {
                case Transform::Original:
                    for (Size k = begin; k < end; ++k) active_[k] = original_[k];
                    break;
                case Transform::Binary:
                    for (Size k = begin; k < end; ++k) active_[k] = Real(1);
                    break;
                case Transform::RowStandardized: {
                    Real row_sum = 0;
                    for (Size k = begin; k < end; ++k) row_sum += original_[k];
                    const Real inv = (row_sum > Real(0)) ? Real(1) / row_sum : Real(0);
                    for (Size k = begin; k < end; ++k) active_[k] = original_[k] * inv;
                    break;
                }
            }
        }
        transform_ = t;
        recompute_sums();
    }

    void recompute_sums() noexcept {
        memory::zero(col_sum_.array());
        Real s0 = 0;
        Real s1 = 0;

        for (Size i = 0; i < n_; ++i) {
            const auto nbrs = neighbors(i);
            const auto w = weights(i);
            for (Size k = 0; k < nbrs.len; ++k) {
                const auto j = static_cast<Size>(nbrs[k]);
                const Real wij = w[k];
                s0 += wij;
                // 1/2 sum (w_ij + w_ji)^2 = sum w_ij^2 + sum w_ij * w_ji
                s1 += wij * wij + wij * edge_weight(j, static_cast<Index>(i));
                col_sum_[j] += wij;
            }
        }

        Real s2 = 0;
        for (Size i = 0; i < n_; ++i) {
            Real row_sum = 0;
            for (const Real wij : weights(i)) row_sum += wij;
            const Real t = row_sum + col_sum_[i];
            s2 += t * t;
        }

        sums_ = WeightSums{s0, s1, s2};
    }

    Size n_ = 0;
    Size nnz_ = 0;
    Size n_islands_ = 0;
    Index max_card_ = 0;

    memory::AlignedBuffer<Index> indptr_;
    memory::AlignedBuffer<Index> indices_;
    memory::AlignedBuffer<Real> original_;
    memory::AlignedBuffer<Real> active_;
    memory::AlignedBuffer<Index> ids_;
    memory::AlignedBuffer<Real> col_sum_;

    Transform transform_ = Transform::Original;
    std::uint64_t generation_ = 0;
    WeightSums sums_{0, 0, 0};
};

// =============================================================================
// ScopedTransform
// =============================================================================

// Forces a transform on a graph for the lifetime of the scope.
//
// restore() puts the caller's transform back and throws TransformRestoreError
// when anyone else changed the graph's transform in between, including a
// change that was later undone. The destructor restores on paths that never
// reach restore() (exceptions) and never throws; if it detects foreign
// modification it leaves the graph alone.
//
// A scope that restores cleanly rewinds the graph's generation to the value
// it found, so scopes nest as long as each inner scope restores before the
// outer one.
class ScopedTransform {
public:
    ScopedTransform(WeightsGraph& w, Transform forced)
        : w_(w), saved_(w.transform()), forced_(forced), entry_(w.generation()) {
        w_.set_transform(forced);
        expected_ = w_.generation();
        active_ = true;
    }

    ~ScopedTransform() {
        if (active_ && unchanged()) {
            put_back();
        }
    }

    ScopedTransform(const ScopedTransform&) = delete;
    ScopedTransform& operator=(const ScopedTransform&) = delete;
    ScopedTransform(ScopedTransform&&) = delete;
    ScopedTransform& operator=(ScopedTransform&&) = delete;

    void restore() {
        if (!active_) return;
        active_ = false;
        if (SAL_UNLIKELY(!unchanged())) {
            throw TransformRestoreError(
                std::string("ScopedTransform: graph transform was modified (now '") +
                transform_name(w_.transform()) + "') while forced to '" +
                transform_name(forced_) + "'; cannot restore '" +
                transform_name(saved_) + "'");
        }
        put_back();
    }

    [[nodiscard]] Transform saved() const noexcept { return saved_; }

private:
    [[nodiscard]] bool unchanged() const noexcept {
        return w_.generation() == expected_;
    }

    void put_back() {
        w_.set_transform(saved_);
        w_.generation_ = entry_;
    }

    WeightsGraph& w_;
    Transform saved_;
    Transform forced_;
    std::uint64_t entry_;
    std::uint64_t expected_ = 0;
    bool active_ = false;
};

} // namespace sal
