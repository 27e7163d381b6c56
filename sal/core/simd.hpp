#pragma once

#include "sal/core/type.hpp"

// =============================================================================
// Highway Configuration
// =============================================================================

#if defined(SAL_ONLY_SCALAR) && !defined(HWY_COMPILE_ONLY_SCALAR)
    #define HWY_COMPILE_ONLY_SCALAR
#endif

#define HWY_DISABLED_TARGETS_LOG

#include <hwy/highway.h>

// =============================================================================
// FILE: sal/core/simd.hpp
// BRIEF: SAL SIMD Wrapper (Google Highway)
// =============================================================================

namespace sal::simd {

    // Import Highway functions into sal::simd namespace
    using namespace hwy::HWY_NAMESPACE;

    using RealTag = ScalableTag<sal::Real>;
    using IndexTag = ScalableTag<sal::Index>;

    template <typename T>
    using SimdTagFor = std::conditional_t<
        std::is_same_v<T, Real>, RealTag,
        std::conditional_t<std::is_same_v<T, Index>, IndexTag,
            ScalableTag<T>>>;

} // namespace sal::simd
