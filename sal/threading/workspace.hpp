#pragma once

#include "sal/config.hpp"
#include "sal/core/type.hpp"
#include "sal/core/macros.hpp"
#include "sal/core/memory.hpp"

// =============================================================================
// FILE: sal/threading/workspace.hpp
// BRIEF: Per-thread scratch buffers for parallel loops
// =============================================================================

namespace sal::threading {

// One contiguous aligned block split into n_threads slices of capacity
// elements. Slice r belongs to the worker with thread_rank r.
template <typename T>
class WorkspacePool {
public:
    WorkspacePool() = default;

    WorkspacePool(size_t n_threads, size_t capacity) {
        init(n_threads, capacity);
    }

    void init(size_t n_threads, size_t capacity) {
        // Pad each slice to a cache line so neighboring threads do not share one
        constexpr size_t per_line = SAL_ALIGNMENT / sizeof(T);
        const size_t stride = (per_line > 0)
            ? ((capacity + per_line - 1) / per_line) * per_line
            : capacity;

        buffer_ = memory::AlignedBuffer<T>(n_threads * stride, SAL_ALIGNMENT);
        stride_ = stride;
    }

    ~WorkspacePool() = default;

    WorkspacePool(const WorkspacePool&) = delete;
    WorkspacePool& operator=(const WorkspacePool&) = delete;

    WorkspacePool(WorkspacePool&&) noexcept = default;
    WorkspacePool& operator=(WorkspacePool&&) noexcept = default;

    SAL_FORCE_INLINE T* get(size_t thread_rank) noexcept {
        return buffer_.get() + thread_rank * stride_;
    }

private:
    memory::AlignedBuffer<T> buffer_;
    size_t stride_ = 0;
};

} // namespace sal::threading
