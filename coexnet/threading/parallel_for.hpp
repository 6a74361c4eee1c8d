#pragma once

#include "coexnet/config.hpp"
#include "coexnet/core/macros.hpp"
#include "coexnet/threading/scheduler.hpp"

#include <cstddef>
#include <exception>
#include <mutex>
#include <type_traits>
#include <utility>

#if defined(COEXNET_USE_TBB)
    #include <tbb/parallel_for.h>
    #include <tbb/blocked_range.h>
    #include <tbb/task_arena.h>
#elif defined(COEXNET_USE_OPENMP)
    #include <omp.h>
#endif

// =============================================================================
// FILE: coexnet/threading/parallel_for.hpp
// BRIEF: Backend-neutral parallel loop
// =============================================================================

namespace coexnet::threading {

namespace detail {

// Exceptions must not escape an OpenMP region; the first one thrown by any
// iteration is captured and rethrown on the calling thread.
class FirstException {
public:
    template <typename Body>
    void run(Body&& body) noexcept {
        try {
            body();
        } catch (...) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!error_) {
                error_ = std::current_exception();
            }
        }
    }

    void rethrow() const {
        if (error_) {
            std::rethrow_exception(error_);
        }
    }

private:
    std::mutex mutex_;
    std::exception_ptr error_;
};

} // namespace detail

// Unified parallel loop supporting single-arg and dual-arg (with thread rank) lambdas
// Usage:
//   parallel_for(0, n, [&](size_t i) { ... });
//   parallel_for(0, n, [&](size_t i, size_t thread_rank) { ... });
// Thread ranks are < Scheduler::get_num_threads().
template <typename Func>
inline void parallel_for(size_t start, size_t end, Func&& func) {
    if (COEXNET_UNLIKELY(start >= end)) {
        return;
    }

    constexpr bool has_rank_arg = std::is_invocable_v<Func, size_t, size_t>;

#if defined(COEXNET_USE_OPENMP)
    if (omp_in_parallel()) {
        for (size_t i = start; i < end; ++i) {
            if constexpr (has_rank_arg) {
                func(i, static_cast<size_t>(omp_get_thread_num()));
            } else {
                func(i);
            }
        }
        return;
    }

    detail::FirstException guard;
    #pragma omp parallel for schedule(dynamic, 1)
    for (size_t i = start; i < end; ++i) {
        guard.run([&]() {
            if constexpr (has_rank_arg) {
                func(i, static_cast<size_t>(omp_get_thread_num()));
            } else {
                func(i);
            }
        });
    }
    guard.rethrow();

#elif defined(COEXNET_USE_TBB)
    tbb::parallel_for(tbb::blocked_range<size_t>(start, end),
        [&](const tbb::blocked_range<size_t>& r) {
            const auto thread_rank = static_cast<size_t>(tbb::this_task_arena::current_thread_index());
            for (size_t i = r.begin(); i != r.end(); ++i) {
                if constexpr (has_rank_arg) {
                    func(i, thread_rank);
                } else {
                    func(i);
                }
            }
        });

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

} // namespace coexnet::threading
