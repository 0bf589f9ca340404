#pragma once

#include "velo/config.hpp"
#include "velo/core/macros.hpp"
#include "velo/threading/scheduler.hpp"

#include <cstddef>
#include <utility>
#include <type_traits>
#include <vector>
#include <future>

// =============================================================================
// FILE: velo/threading/parallel_for.hpp
// BRIEF: Backend-neutral parallel loop over gene indices
// =============================================================================

#if defined(VELO_USE_TBB)
    #include <tbb/parallel_for.h>
    #include <tbb/blocked_range.h>
    #include <tbb/task_arena.h>
#elif defined(VELO_USE_OPENMP)
    #include <omp.h>
#endif

namespace velo::threading {

// Body is func(i) or func(i, thread_rank). Bodies must not throw: the
// OpenMP backend cannot carry exceptions out of a parallel region.
//   parallel_for(0, n, [&](size_t g) { ... });
//   parallel_for(0, n, [&](size_t g, size_t rank) { ... });
template <typename Func>
inline void parallel_for(size_t start, size_t end, Func&& func) {
    if (VELO_UNLIKELY(start >= end)) {
        return;
    }

    constexpr bool has_rank_arg = std::is_invocable_v<Func, size_t, size_t>;

#if defined(VELO_USE_SERIAL)
    for (size_t i = start; i < end; ++i) {
        if constexpr (has_rank_arg) {
            func(i, 0);
        } else {
            func(i);
        }
    }

#elif defined(VELO_USE_OPENMP)
    if (omp_in_parallel()) {
        for (size_t i = start; i < end; ++i) {
            if constexpr (has_rank_arg) {
                func(i, static_cast<size_t>(omp_get_thread_num()));
            } else {
                func(i);
            }
        }
    } else {
        // Per-gene cost varies with convergence speed
        #pragma omp parallel for schedule(dynamic, 1)
        for (size_t i = start; i < end; ++i) {
            if constexpr (has_rank_arg) {
                func(i, static_cast<size_t>(omp_get_thread_num()));
            } else {
                func(i);
            }
        }
    }

#elif defined(VELO_USE_TBB)
    tbb::parallel_for(tbb::blocked_range<size_t>(start, end, 1),
        [&](const tbb::blocked_range<size_t>& r) {
            size_t thread_rank = static_cast<size_t>(tbb::this_task_arena::current_thread_index());
            for (size_t i = r.begin(); i != r.end(); ++i) {
                if constexpr (has_rank_arg) {
                    func(i, thread_rank);
                } else {
                    func(i);
                }
            }
        });

#elif defined(VELO_USE_BS)
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
                if constexpr (has_rank_arg) {
                    func(i, rank);
                } else {
                    func(i);
                }
            }
        }));
    }

    for (auto& future : futures) {
        future.get();
    }

#else
    for (size_t i = start; i < end; ++i) {
        if constexpr (has_rank_arg) {
            func(i, 0);
        } else {
            func(i);
        }
    }
#endif
}

} // namespace velo::threading
