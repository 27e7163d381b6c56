#pragma once

#include "sal/core/type.hpp"
#include "sal/core/macros.hpp"
#include "sal/core/error.hpp"
#include "sal/core/simd.hpp"

#include <cstddef>

// =============================================================================
// FILE: sal/core/vectorize.hpp
// BRIEF: SIMD reductions over attribute vectors
// =============================================================================
//
// Inputs are caller buffers with no alignment guarantee, so every load is
// unaligned (LoadU).

namespace sal::vectorize {

// =============================================================================
// 1. Reduction Operations
// =============================================================================

template <typename T>
SAL_FORCE_INLINE T sum(Array<const T> span) {
    namespace s = sal::simd;
    using SimdTag = s::SimdTagFor<T>;
    const SimdTag d;
    const size_t N = span.len;
    const size_t lanes = s::Lanes(d);

    if (N == 0) return T(0);

    auto sum0 = s::Zero(d);
    auto sum1 = s::Zero(d);
    auto sum2 = s::Zero(d);
    auto sum3 = s::Zero(d);

    size_t i = 0;

    for (; i + 4 * lanes <= N; i += 4 * lanes) {
        sum0 = s::Add(sum0, s::LoadU(d, span.ptr + i));
        sum1 = s::Add(sum1, s::LoadU(d, span.ptr + i + lanes));
        sum2 = s::Add(sum2, s::LoadU(d, span.ptr + i + 2 * lanes));
        sum3 = s::Add(sum3, s::LoadU(d, span.ptr + i + 3 * lanes));
    }

    sum0 = s::Add(sum0, sum1);
    sum2 = s::Add(sum2, sum3);
    sum0 = s::Add(sum0, sum2);

    for (; i + lanes <= N; i += lanes) {
        sum0 = s::Add(sum0, s::LoadU(d, span.ptr + i));
    }

    T result = s::GetLane(s::SumOfLanes(d, sum0));

    for (; i < N; ++i) {
        result += span[i];
    }

    return result;
}

template <typename T>
SAL_FORCE_INLINE T dot(Array<const T> a, Array<const T> b) {
    SAL_ASSERT(a.len == b.len, "dot: Size mismatch");

    namespace s = sal::simd;
    using SimdTag = s::SimdTagFor<T>;
    const SimdTag d;
    const size_t N = a.len;
    const size_t lanes = s::Lanes(d);

    if (N == 0) return T(0);

    auto acc0 = s::Zero(d);
    auto acc1 = s::Zero(d);
    auto acc2 = s::Zero(d);
    auto acc3 = s::Zero(d);

    size_t i = 0;

    for (; i + 4 * lanes <= N; i += 4 * lanes) {
        acc0 = s::MulAdd(s::LoadU(d, a.ptr + i), s::LoadU(d, b.ptr + i), acc0);
        acc1 = s::MulAdd(s::LoadU(d, a.ptr + i + lanes), s::LoadU(d, b.ptr + i + lanes), acc1);
        acc2 = s::MulAdd(s::LoadU(d, a.ptr + i + 2*lanes), s::LoadU(d, b.ptr + i + 2*lanes), acc2);
        acc3 = s::MulAdd(s::LoadU(d, a.ptr + i + 3*lanes), s::LoadU(d, b.ptr + i + 3*lanes), acc3);
    }

    acc0 = s::Add(acc0, acc1);
    acc2 = s::Add(acc2, acc3);
    acc0 = s::Add(acc0, acc2);

    for (; i + lanes <= N; i += lanes) {
        acc0 = s::MulAdd(s::LoadU(d, a.ptr + i), s::LoadU(d, b.ptr + i), acc0);
    }

    T result = s::GetLane(s::SumOfLanes(d, acc0));

    for (; i < N; ++i) {
        result += a[i] * b[i];
    }

    return result;
}

template <typename T>
SAL_FORCE_INLINE T sum_squared(Array<const T> span) {
    return dot(span, span);
}

// =============================================================================
// 2. Power Sums
// =============================================================================

template <typename T>
struct PowerSums {
    T s1;  // sum y
    T s2;  // sum y^2
    T s3;  // sum y^3
    T s4;  // sum y^4
};

// Single pass over the vector for the four moments used by the global
// variance polynomial.
template <typename T>
SAL_FORCE_INLINE PowerSums<T> power_sums(Array<const T> span) {
    namespace s = sal::simd;
    using SimdTag = s::SimdTagFor<T>;
    const SimdTag d;
    const size_t N = span.len;
    const size_t lanes = s::Lanes(d);

    PowerSums<T> out{T(0), T(0), T(0), T(0)};
    if (N == 0) return out;

    auto a1 = s::Zero(d);
    auto a2 = s::Zero(d);
    auto a3 = s::Zero(d);
    auto a4 = s::Zero(d);

    size_t i = 0;

    for (; i + lanes <= N; i += lanes) {
        const auto v = s::LoadU(d, span.ptr + i);
        const auto v2 = s::Mul(v, v);
        a1 = s::Add(a1, v);
        a2 = s::Add(a2, v2);
        a3 = s::MulAdd(v2, v, a3);
        a4 = s::MulAdd(v2, v2, a4);
    }

    out.s1 = s::GetLane(s::SumOfLanes(d, a1));
    out.s2 = s::GetLane(s::SumOfLanes(d, a2));
    out.s3 = s::GetLane(s::SumOfLanes(d, a3));
    out.s4 = s::GetLane(s::SumOfLanes(d, a4));

    for (; i < N; ++i) {
        const T v = span[i];
        const T v2 = v * v;
        out.s1 += v;
        out.s2 += v2;
        out.s3 += v2 * v;
        out.s4 += v2 * v2;
    }

    return out;
}

} // namespace sal::vectorize
