#pragma once

#include "coexnet/config.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <thread>

#if defined(COEXNET_USE_OPENMP)
    #include <omp.h>
#elif defined(COEXNET_USE_TBB)
    #include <tbb/global_control.h>
    #include <tbb/task_arena.h>
#endif

// =============================================================================
// FILE: coexnet/threading/scheduler.hpp
// BRIEF: Worker count shared by every parallel kernel
// =============================================================================

namespace coexnet::threading {

class Scheduler {
public:
    static constexpr std::size_t MAX_THREADS = 1024;

    static std::size_t hardware_concurrency() noexcept {
        return std::max<std::size_t>(std::thread::hardware_concurrency(), 1);
    }

    // 0 means one worker per hardware thread
    static void set_num_threads(std::size_t n) {
        n = std::min(n == 0 ? hardware_concurrency() : n, MAX_THREADS);
#if defined(COEXNET_USE_OPENMP)
        omp_set_num_threads(static_cast<int>(n));
#elif defined(COEXNET_USE_TBB)
        // The limit lasts as long as the control object does
        static std::unique_ptr<tbb::global_control> limit;
        limit.reset();
        limit = std::make_unique<tbb::global_control>(
            tbb::global_control::max_allowed_parallelism, n);
#else
        (void)n;
#endif
    }

    // Upper bound (exclusive) on the thread rank a parallel_for body sees
    static std::size_t get_num_threads() noexcept {
#if defined(COEXNET_USE_OPENMP)
        return static_cast<std::size_t>(std::max(omp_get_max_threads(), 1));
#elif defined(COEXNET_USE_TBB)
        return static_cast<std::size_t>(std::max(tbb::this_task_arena::max_concurrency(), 1));
#else
        return 1;
#endif
    }
};

/// Worker count for the lifetime of the object; the previous count is
/// restored on destruction.
class ScopedNumThreads {
public:
    explicit ScopedNumThreads(std::size_t n) : previous_(Scheduler::get_num_threads()) {
        Scheduler::set_num_threads(n);
    }

    ~ScopedNumThreads() { Scheduler::set_num_threads(previous_); }

    ScopedNumThreads(const ScopedNumThreads&) = delete;
    ScopedNumThreads& operator=(const ScopedNumThreads&) = delete;

private:
    std::size_t previous_;
};

} // namespace coexnet::threading
