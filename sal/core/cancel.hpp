#pragma once

#include "sal/core/macros.hpp"

#include <atomic>

// =============================================================================
// FILE: sal/core/cancel.hpp
// BRIEF: Cooperative cancellation flag for long permutation runs
// =============================================================================

namespace sal {

// Set from any thread; kernels poll it between permutation rounds and stop
// early, reporting how many rounds finished.
class CancelToken {
public:
    CancelToken() noexcept = default;

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void request() noexcept { flag_.store(true, std::memory_order_relaxed); }
    void reset() noexcept { flag_.store(false, std::memory_order_relaxed); }

    [[nodiscard]] bool requested() const noexcept {
        return flag_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> flag_{false};
};

// Null token means "never cancelled"
SAL_FORCE_INLINE bool cancel_requested(const CancelToken* token) noexcept {
    return token != nullptr && token->requested();
}

} // namespace sal
