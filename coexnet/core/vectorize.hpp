#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/macros.hpp"
#include "coexnet/core/simd.hpp"

#include <cmath>

// =============================================================================
// FILE: coexnet/core/vectorize.hpp
// BRIEF: SIMD reductions over contiguous sample vectors
//
// Gene columns are gathered into contiguous rows before they reach these
// kernels, so loads are unaligned (LoadU) but unit-stride.
// =============================================================================

namespace coexnet::vectorize {

// =============================================================================
// 1. Reductions
// =============================================================================

template <typename T>
COEXNET_FORCE_INLINE T sum(Array<const T> span) noexcept {
    namespace s = coexnet::simd;
    using SimdTag = s::SimdTagFor<T>;
    const SimdTag d;
    const size_t N = span.len;
    const size_t lanes = s::Lanes(d);

    auto sum0 = s::Zero(d);
    auto sum1 = s::Zero(d);

    size_t i = 0;
    for (; i + 2 * lanes <= N; i += 2 * lanes) {
        sum0 = s::Add(sum0, s::LoadU(d, span.ptr + i));
        sum1 = s::Add(sum1, s::LoadU(d, span.ptr + i + lanes));
    }
    sum0 = s::Add(sum0, sum1);

    for (; i + lanes <= N; i += lanes) {
        sum0 = s::Add(sum0, s::LoadU(d, span.ptr + i));
    }

    T result = s::GetLane(s::SumOfLanes(d, sum0));
    for (; i < N; ++i) {
        result += span.ptr[i];
    }
    return result;
}

template <typename T>
COEXNET_FORCE_INLINE T dot(Array<const T> a, Array<const T> b) noexcept {
    namespace s = coexnet::simd;
    using SimdTag = s::SimdTagFor<T>;
    const SimdTag d;
    const size_t N = a.len < b.len ? a.len : b.len;
    const size_t lanes = s::Lanes(d);

    auto v_sum0 = s::Zero(d);
    auto v_sum1 = s::Zero(d);
    auto v_sum2 = s::Zero(d);
    auto v_sum3 = s::Zero(d);

    size_t k = 0;
    for (; k + 4 * lanes <= N; k += 4 * lanes) {
        v_sum0 = s::MulAdd(s::LoadU(d, a.ptr + k), s::LoadU(d, b.ptr + k), v_sum0);
        v_sum1 = s::MulAdd(s::LoadU(d, a.ptr + k + lanes), s::LoadU(d, b.ptr + k + lanes), v_sum1);
        v_sum2 = s::MulAdd(s::LoadU(d, a.ptr + k + 2 * lanes), s::LoadU(d, b.ptr + k + 2 * lanes), v_sum2);
        v_sum3 = s::MulAdd(s::LoadU(d, a.ptr + k + 3 * lanes), s::LoadU(d, b.ptr + k + 3 * lanes), v_sum3);
    }
    v_sum0 = s::Add(s::Add(v_sum0, v_sum1), s::Add(v_sum2, v_sum3));

    for (; k + lanes <= N; k += lanes) {
        v_sum0 = s::MulAdd(s::LoadU(d, a.ptr + k), s::LoadU(d, b.ptr + k), v_sum0);
    }

    T result = s::GetLane(s::SumOfLanes(d, v_sum0));
    for (; k < N; ++k) {
        result += a.ptr[k] * b.ptr[k];
    }
    return result;
}

// =============================================================================
// 2. In-Place Transforms
// =============================================================================

// x <- (x - shift) * factor
template <typename T>
COEXNET_FORCE_INLINE void shift_scale_inplace(Array<T> span, T shift, T factor) noexcept {
    namespace s = coexnet::simd;
    using SimdTag = s::SimdTagFor<T>;
    const SimdTag d;
    const size_t N = span.len;
    const size_t lanes = s::Lanes(d);

    const auto v_shift = s::Set(d, shift);
    const auto v_factor = s::Set(d, factor);

    size_t k = 0;
    for (; k + lanes <= N; k += lanes) {
        auto v = s::LoadU(d, span.ptr + k);
        s::StoreU(s::Mul(s::Sub(v, v_shift), v_factor), d, span.ptr + k);
    }
    for (; k < N; ++k) {
        span.ptr[k] = (span.ptr[k] - shift) * factor;
    }
}

} // namespace coexnet::vectorize
