#pragma once

#include "coexnet/core/type.hpp"

#include <type_traits>

// Keep Highway quiet about targets removed by HWY_COMPILE_ONLY_SCALAR
#define HWY_DISABLED_TARGETS_LOG
#include <hwy/highway.h>

// =============================================================================
// FILE: coexnet/core/simd.hpp
// BRIEF: Highway static-dispatch ops under coexnet::simd
// =============================================================================

namespace coexnet::simd {

using namespace hwy::HWY_NAMESPACE;

// Widest vector descriptor for the element type of a kernel
template <typename T>
using SimdTagFor = ScalableTag<std::remove_const_t<T>>;

} // namespace coexnet::simd
