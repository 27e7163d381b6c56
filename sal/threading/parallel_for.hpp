#pragma once

#include "sal/config.hpp"
#include "sal/core/macros.hpp"
#include "sal/threading/scheduler.hpp"

#include <cstddef>
#include <utility>
#include <type_traits>
#include <vector>
#include <future>

// =============================================================================
// FILE: sal/threading/parallel_for.hpp
// BRIEF: Backend-neutral parallel loop over an index range
// =============================================================================

#if defined(SAL_USE_TBB)
    #include <tbb/parallel_for.h>
    #include <tbb/blocked_range.h>
    #include <tbb/task_arena.h>
#elif defined(SAL_USE_OPENMP)
    #include <omp.h>
#endif

namespace sal::threading {

namespace detail {

template <typename Func>
SAL_FORCE_INLINE void invoke_body(Func& func, size_t i, size_t rank) {
    if constexpr (std::is_invocable_v<Func, size_t, size_t>) {
        func(i, rank);
    } else {
        func(i);
    }
}

} // namespace detail

// Runs func over [start, end). func takes (i) or (i, thread_rank); thread_rank
// is below Scheduler::workspace_slots() and may index a WorkspacePool.
//
// grain == 0 splits the range statically. A positive grain hands out chunks of
// that size dynamically, for bodies whose cost varies per index (local
// statistics whose cost follows the neighbor count).
//
// The body must not throw: validate before entering the loop.
template <typename Func>
inline void parallel_for(size_t start, size_t end, Func&& func, size_t grain = 0) {
    if (SAL_UNLIKELY(start >= end)) {
        return;
    }

#if defined(SAL_USE_SERIAL)
    (void)grain;
    for (size_t i = start; i < end; ++i) {
        detail::invoke_body(func, i, 0);
    }

#elif defined(SAL_USE_OPENMP)
    if (omp_in_parallel()) {
        const auto rank = static_cast<size_t>(omp_get_thread_num());
        for (size_t i = start; i < end; ++i) {
            detail::invoke_body(func, i, rank);
        }
    } else if (grain == 0) {
        #pragma omp parallel for schedule(static)
        for (size_t i = start; i < end; ++i) {
            detail::invoke_body(func, i, static_cast<size_t>(omp_get_thread_num()));
        }
    } else {
        const int chunk = static_cast<int>(grain);
        #pragma omp parallel for schedule(dynamic, chunk)
        for (size_t i = start; i < end; ++i) {
            detail::invoke_body(func, i, static_cast<size_t>(omp_get_thread_num()));
        }
    }

#elif defined(SAL_USE_TBB)
    const size_t tbb_grain = (grain == 0) ? 1 : grain;
    tbb::parallel_for(tbb::blocked_range<size_t>(start, end, tbb_grain),
        [&](const tbb::blocked_range<size_t>& r) {
            const auto rank = static_cast<size_t>(tbb::this_task_arena::current_thread_index());
            for (size_t i = r.begin(); i != r.end(); ++i) {
                detail::invoke_body(func, i, rank);
            }
        });

#elif defined(SAL_USE_BS)
    (void)grain;
    auto& pool = detail::get_global_pool();
    const size_t num_threads = pool.get_thread_count();
    const size_t range_size = end - start;
    const size_t chunk_size = (range_size + num_threads - 1) / num_threads;

    if (chunk_size == 0) return;

    std::vector<std::future<void>> futures;
    futures.reserve(num_threads);

    size_t thread_rank = 0;
    for (size_t chunk_start = start; chunk_start < end; chunk_start += chunk_size) {
        const size_t chunk_end = (chunk_start + chunk_size < end) ? (chunk_start + chunk_size) : end;
        const size_t rank = thread_rank++;

        futures.push_back(pool.submit([&func, chunk_start, chunk_end, rank]() {
            for (size_t i = chunk_start; i < chunk_end; ++i) {
                detail::invoke_body(func, i, rank);
            }
        }));
    }

    for (auto& future : futures) {
        future.get();
    }
#endif
}

} // namespace sal::threading
