#pragma once

#include <cstddef>

// =============================================================================
// FILE: coexnet/config.hpp
// BRIEF: Build switches (threading backend, scalar and index width)
//
// CMake passes these as compile definitions; the defaults below cover a
// plain include of the headers.
// =============================================================================

// Scalar-only Highway build for debugging vector kernels
#if defined(COEXNET_ONLY_SCALAR) && !defined(HWY_COMPILE_ONLY_SCALAR)
    #define HWY_COMPILE_ONLY_SCALAR
#endif

// -----------------------------------------------------------------------------
// Threading backend: COEXNET_BACKEND_OPENMP | COEXNET_BACKEND_TBB | COEXNET_BACKEND_SERIAL
// -----------------------------------------------------------------------------

#if !defined(COEXNET_BACKEND_SERIAL) && !defined(COEXNET_BACKEND_TBB) && \
    !defined(COEXNET_BACKEND_OPENMP)
    #if defined(__APPLE__)
        #define COEXNET_BACKEND_TBB
    #elif defined(_OPENMP)
        #define COEXNET_BACKEND_OPENMP
    #else
        #define COEXNET_BACKEND_SERIAL
    #endif
#endif

#if defined(COEXNET_BACKEND_OPENMP) + defined(COEXNET_BACKEND_TBB) + defined(COEXNET_BACKEND_SERIAL) != 1
    #error "coexnet: select exactly one of COEXNET_BACKEND_OPENMP, COEXNET_BACKEND_TBB, COEXNET_BACKEND_SERIAL"
#endif

#if defined(COEXNET_BACKEND_OPENMP)
    #define COEXNET_USE_OPENMP 1
#elif defined(COEXNET_BACKEND_TBB)
    #define COEXNET_USE_TBB 1
#else
    #define COEXNET_USE_SERIAL 1
#endif

// -----------------------------------------------------------------------------
// Numeric widths
// -----------------------------------------------------------------------------

// Real: 0 = float, 1 = double. Student-t p-values and the scale-free
// regression lose too much in single precision, so double is the default.
#ifndef COEXNET_PRECISION
    #define COEXNET_PRECISION 1
#endif
#if COEXNET_PRECISION != 0 && COEXNET_PRECISION != 1
    #error "coexnet: COEXNET_PRECISION must be 0 (float) or 1 (double)"
#endif

// Index: 1 = int32_t, 2 = int64_t
#ifndef COEXNET_INDEX_PRECISION
    #define COEXNET_INDEX_PRECISION 2
#endif
#if COEXNET_INDEX_PRECISION != 1 && COEXNET_INDEX_PRECISION != 2
    #error "coexnet: COEXNET_INDEX_PRECISION must be 1 (int32) or 2 (int64)"
#endif

namespace coexnet::memory {
inline constexpr std::size_t DEFAULT_ALIGNMENT = 64;
}
