#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/memory.hpp"

// =============================================================================
// FILE: coexnet/threading/workspace.hpp
// BRIEF: Scratch space partitioned by thread rank
// =============================================================================

namespace coexnet::threading {

/// One aligned allocation cut into `n_threads` slices of `capacity`
/// elements. parallel_for bodies index it with their thread rank, so
/// slices are never shared and need no locking.
template <typename T>
class WorkspacePool {
public:
    WorkspacePool(Size n_threads, Size capacity)
        : capacity_(capacity),
          data_(memory::aligned_alloc<T>(n_threads * capacity, COEXNET_ALIGNMENT)) {}

    WorkspacePool(const WorkspacePool&) = delete;
    WorkspacePool& operator=(const WorkspacePool&) = delete;

    COEXNET_FORCE_INLINE T* get(Size thread_rank) noexcept {
        return data_.get() + thread_rank * capacity_;
    }

    [[nodiscard]] Size capacity() const noexcept { return capacity_; }

private:
    Size capacity_;
    memory::AlignedPtr<T> data_;
};

} // namespace coexnet::threading
