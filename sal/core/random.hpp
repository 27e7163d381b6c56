#pragma once

#include "sal/core/type.hpp"
#include "sal/core/macros.hpp"

#include <cstdint>
#include <utility>

// =============================================================================
// FILE: sal/core/random.hpp
// BRIEF: Xoshiro256++ generator and Fisher-Yates shuffles
// =============================================================================

namespace sal::random {

// SplitMix64 finalizer. Used for seeding and for deriving independent
// per-stream seeds from (seed, stream id).
SAL_FORCE_INLINE constexpr uint64_t mix64(uint64_t z) noexcept {
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

SAL_FORCE_INLINE constexpr uint64_t derive_seed(uint64_t seed, uint64_t stream) noexcept {
    return mix64(seed + 0x9e3779b97f4a7c15ULL * (stream + 1));
}

// Xoshiro256++ PRNG
class FastRNG {
    alignas(32) uint64_t s[4];

    static SAL_FORCE_INLINE uint64_t rotl(uint64_t x, int k) noexcept {
        return (x << k) | (x >> (64 - k));
    }

public:
    explicit FastRNG(uint64_t seed) noexcept {
        uint64_t z = seed;
        for (int i = 0; i < 4; ++i) {
            z += 0x9e3779b97f4a7c15ULL;
            s[i] = mix64(z);
        }
    }

    SAL_FORCE_INLINE uint64_t next() noexcept {
        const uint64_t result = rotl(s[0] + s[3], 23) + s[0];
        const uint64_t t = s[1] << 17;
        s[2] ^= s[0]; s[3] ^= s[1]; s[1] ^= s[2]; s[0] ^= s[3];
        s[2] ^= t; s[3] = rotl(s[3], 45);
        return result;
    }

    // Uniform integer in [0, n). Lemire's nearly divisionless method.
    SAL_FORCE_INLINE Size bounded(Size n) noexcept {
        uint64_t x = next();
        __uint128_t m = static_cast<__uint128_t>(x) * static_cast<__uint128_t>(n);
        uint64_t l = static_cast<uint64_t>(m);
        if (l < n) {
            const uint64_t t = -static_cast<uint64_t>(n) % n;
            while (l < t) {
                x = next();
                m = static_cast<__uint128_t>(x) * static_cast<__uint128_t>(n);
                l = static_cast<uint64_t>(m);
            }
        }
        return static_cast<Size>(m >> 64);
    }
};

// Full Fisher-Yates shuffle, unrolled by four.
template <typename T>
SAL_FORCE_INLINE void shuffle(T* SAL_RESTRICT data, Size n, FastRNG& rng) noexcept {
    if (n < 2) return;

    Size i = n - 1;
    for (; i >= 4; i -= 4) {
        const Size j0 = rng.bounded(i + 1), j1 = rng.bounded(i);
        const Size j2 = rng.bounded(i - 1), j3 = rng.bounded(i - 2);

        std::swap(data[i], data[j0]);
        std::swap(data[i - 1], data[j1]);
        std::swap(data[i - 2], data[j2]);
        std::swap(data[i - 3], data[j3]);
    }

    for (; i > 0; --i) {
        const Size j = rng.bounded(i + 1);
        std::swap(data[i], data[j]);
    }
}

// Forward Fisher-Yates stopped after k steps: data[0..k) is the prefix of a
// uniform permutation of data[0..n).
template <typename T>
SAL_FORCE_INLINE void partial_shuffle(T* SAL_RESTRICT data, Size n, Size k, FastRNG& rng) noexcept {
    if (k > n) k = n;
    for (Size i = 0; i < k && i + 1 < n; ++i) {
        const Size j = i + rng.bounded(n - i);
        std::swap(data[i], data[j]);
    }
}

} // namespace sal::random
