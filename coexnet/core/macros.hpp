#pragma once

#include "coexnet/config.hpp"

// =============================================================================
// FILE: coexnet/core/macros.hpp
// BRIEF: Compiler hints shared by kernels and the C binding
// =============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define COEXNET_LIKELY(x)       (__builtin_expect(!!(x), 1))
    #define COEXNET_UNLIKELY(x)     (__builtin_expect(!!(x), 0))
    #define COEXNET_FORCE_INLINE    inline __attribute__((always_inline))
    #define COEXNET_RESTRICT        __restrict__
    #define COEXNET_EXPORT          __attribute__((visibility("default")))
#elif defined(_MSC_VER)
    #define COEXNET_LIKELY(x)       (x)
    #define COEXNET_UNLIKELY(x)     (x)
    #define COEXNET_FORCE_INLINE    __forceinline
    #define COEXNET_RESTRICT        __restrict
    #define COEXNET_EXPORT          __declspec(dllexport)
#else
    #define COEXNET_LIKELY(x)       (x)
    #define COEXNET_UNLIKELY(x)     (x)
    #define COEXNET_FORCE_INLINE    inline
    #define COEXNET_RESTRICT
    #define COEXNET_EXPORT
#endif

// Kept as a macro so headers compiled as C++17 by consumers still parse
#define COEXNET_NODISCARD [[nodiscard]]

// Bytes; workspace slices and dense storage start on this boundary
#define COEXNET_ALIGNMENT 64
