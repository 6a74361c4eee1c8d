#pragma once

#include "coexnet/config.hpp"
#include "coexnet/core/macros.hpp"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <type_traits>

// =============================================================================
// FILE: coexnet/core/type.hpp
// BRIEF: Scalar aliases, module ids and the contiguous view Array<T>
// =============================================================================

namespace coexnet {

#if COEXNET_PRECISION == 0
using Real = float;
#else
using Real = double;
#endif

#if COEXNET_INDEX_PRECISION == 1
using Index = std::int32_t;
#else
using Index = std::int64_t;
#endif

using Size = std::size_t;

// Labels are opaque; 0 marks genes left outside every module
using ModuleId = Index;
inline constexpr ModuleId UNASSIGNED_MODULE = 0;

/// Non-owning pointer + length over contiguous elements.
/// Trivially copyable so it crosses the C binding by value.
template <typename T>
struct Array {
    using value_type = T;

    T* ptr = nullptr;
    Size len = 0;

    constexpr Array() noexcept = default;
    constexpr Array(T* p, Size n) noexcept : ptr(p), len(n) {}

    // Array<Real> -> Array<const Real>
    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr Array(const Array<U>& other) noexcept : ptr(other.ptr), len(other.len) {}

    COEXNET_FORCE_INLINE constexpr T& operator[](Index i) const noexcept {
        assert(i >= 0 && static_cast<Size>(i) < len);
        return ptr[i];
    }

    [[nodiscard]] constexpr T* data() const noexcept { return ptr; }
    [[nodiscard]] constexpr Size size() const noexcept { return len; }
    [[nodiscard]] constexpr bool empty() const noexcept { return len == 0; }

    constexpr T* begin() const noexcept { return ptr; }
    constexpr T* end() const noexcept { return ptr + len; }
};

static_assert(std::is_trivially_copyable_v<Array<const Real>>);

} // namespace coexnet
