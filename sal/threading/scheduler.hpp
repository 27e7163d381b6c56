#pragma once

#include <memory>
#include <thread>
#include <cstddef>

#include "sal/config.hpp"
#include "sal/core/macros.hpp"

// =============================================================================
// FILE: sal/threading/scheduler.hpp
// BRIEF: Thread count control across threading backends
// =============================================================================

#if defined(SAL_USE_BS)
    #include "BS_thread_pool.hpp"
#elif defined(SAL_USE_OPENMP)
    #include <omp.h>
#elif defined(SAL_USE_TBB)
    #include <tbb/global_control.h>
    #include <tbb/task_arena.h>
#endif

namespace sal::threading {

namespace detail {
#if defined(SAL_USE_BS)
    // Global pool, never destroyed
    inline BS::thread_pool& get_global_pool() {
        static BS::thread_pool pool;
        return pool;
    }
#endif
}

class Scheduler {
public:
    // Returns 1 if detection fails
    SAL_FORCE_INLINE static size_t hardware_concurrency() noexcept {
        size_t hw = std::thread::hardware_concurrency();
        return (hw > 0) ? hw : 1;
    }

    // n == 0 selects hardware_concurrency(). Expensive on the BS backend,
    // which rebuilds its pool.
    static void set_num_threads(size_t n) {
        if (n == 0) {
            n = hardware_concurrency();
        }

        constexpr size_t MAX_THREADS = 1024;
        if (n > MAX_THREADS) {
            n = MAX_THREADS;
        }

#if defined(SAL_USE_SERIAL)
        (void)n;

#elif defined(SAL_USE_OPENMP)
        omp_set_num_threads(static_cast<int>(n));

#elif defined(SAL_USE_BS)
        detail::get_global_pool().reset(n);

#elif defined(SAL_USE_TBB)
        // global_control only acts while alive
        static ::std::unique_ptr<tbb::global_control> gc;
        gc = ::std::make_unique<tbb::global_control>(
            tbb::global_control::max_allowed_parallelism, static_cast<int>(n));
#endif
    }

    // At least 1
    static size_t get_num_threads() noexcept {
#if defined(SAL_USE_SERIAL)
        return 1;

#elif defined(SAL_USE_OPENMP)
        int n = omp_get_max_threads();
        return (n > 0) ? static_cast<size_t>(n) : 1;

#elif defined(SAL_USE_BS)
        size_t n = detail::get_global_pool().get_thread_count();
        return (n > 0) ? n : 1;

#elif defined(SAL_USE_TBB)
        auto n = tbb::global_control::active_value(tbb::global_control::max_allowed_parallelism);
        return (n > 0) ? static_cast<size_t>(n) : 1;
#endif
    }

    // Upper bound (exclusive) on the thread_rank parallel_for passes to its
    // body. TBB ranks are arena slot indices, which global_control does not cap.
    static size_t workspace_slots() noexcept {
#if defined(SAL_USE_TBB)
        int n = tbb::this_task_arena::max_concurrency();
        return (n > 0) ? static_cast<size_t>(n) : 1;
#else
        return get_num_threads();
#endif
    }

    static void init(size_t n = 0) {
        set_num_threads(n);
    }
};

} // namespace sal::threading
