#pragma once

#include "coexnet/core/type.hpp"

#include <cstring>
#include <memory>
#include <new>
#include <type_traits>

// =============================================================================
// FILE: coexnet/core/memory.hpp
// BRIEF: Aligned buffers for dense matrices and thread workspaces
// =============================================================================

namespace coexnet::memory {

template <typename T>
struct AlignedDeleter {
    std::size_t alignment = DEFAULT_ALIGNMENT;

    void operator()(T* p) const noexcept {
        ::operator delete[](p, std::align_val_t(alignment));
    }
};

template <typename T>
using AlignedPtr = std::unique_ptr<T[], AlignedDeleter<T>>;

// Zero-filled; empty pointer for count == 0. Throws std::bad_alloc.
template <typename T>
AlignedPtr<T> aligned_alloc(Size count, std::size_t alignment = DEFAULT_ALIGNMENT) {
    static_assert(std::is_arithmetic_v<T>, "aligned_alloc holds numeric data only");
    AlignedDeleter<T> deleter{alignment};
    if (count == 0) return AlignedPtr<T>(nullptr, deleter);
    return AlignedPtr<T>(new (std::align_val_t(alignment)) T[count](), deleter);
}

template <typename T>
COEXNET_FORCE_INLINE void zero(T* p, Size count) noexcept {
    if (count != 0) std::memset(p, 0, count * sizeof(T));
}

template <typename T>
COEXNET_FORCE_INLINE void copy(const T* src, T* dst, Size count) noexcept {
    if (count != 0) std::memcpy(dst, src, count * sizeof(T));
}

} // namespace coexnet::memory
