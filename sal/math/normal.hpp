#pragma once

#include "sal/core/macros.hpp"

#include <cmath>

// =============================================================================
// Standard normal upper tail
// Full precision via std::erfc (~15 significant digits)
// =============================================================================

namespace sal::math {

// 1 - Phi(z), computed without cancellation for large z
SAL_FORCE_INLINE double normal_sf(double z) {
    return 0.5 * std::erfc(z * 0.7071067811865475);
}

} // namespace sal::math
