#pragma once

// =============================================================================
// FILE: coexnet/binding/c_api/core/core.h
// BRIEF: Shared C types, error codes and library-level calls
//
// Every entry point returns a coexnet_error_t. On failure the message is
// kept per thread until the next call on that thread. Buffers are owned by
// the caller and matrices are row-major.
// =============================================================================

#include <stddef.h>
#include <stdint.h>

#ifndef COEXNET_EXPORT
    #if defined(_MSC_VER)
        #define COEXNET_EXPORT __declspec(dllexport)
    #else
        #define COEXNET_EXPORT __attribute__((visibility("default")))
    #endif
#endif

#ifdef __cplusplus
extern "C" {
#endif

// Element types follow the COEXNET_PRECISION / COEXNET_INDEX_PRECISION
// definitions the library was built with
#if defined(COEXNET_PRECISION) && COEXNET_PRECISION == 0
    typedef float coexnet_real_t;
    #define COEXNET_REAL_TYPE_NAME "float32"
#else
    typedef double coexnet_real_t;
    #define COEXNET_REAL_TYPE_NAME "float64"
#endif

#if defined(COEXNET_INDEX_PRECISION) && COEXNET_INDEX_PRECISION == 1
    typedef int32_t coexnet_index_t;
    #define COEXNET_INDEX_TYPE_NAME "int32"
#else
    typedef int64_t coexnet_index_t;
    #define COEXNET_INDEX_TYPE_NAME "int64"
#endif

typedef size_t coexnet_size_t;
typedef int coexnet_bool_t;
typedef int32_t coexnet_error_t;

#define COEXNET_TRUE  1
#define COEXNET_FALSE 0

// Same values as coexnet::ErrorCode
#define COEXNET_OK                          0
#define COEXNET_ERROR_UNKNOWN               1
#define COEXNET_ERROR_INTERNAL              2
#define COEXNET_ERROR_OUT_OF_MEMORY         3
#define COEXNET_ERROR_NULL_POINTER          4
#define COEXNET_ERROR_INVALID_ARGUMENT      10
#define COEXNET_ERROR_DIMENSION_MISMATCH    11
#define COEXNET_ERROR_DOMAIN_ERROR          12
#define COEXNET_ERROR_RANGE_ERROR           13
#define COEXNET_ERROR_INDEX_OUT_OF_BOUNDS   14
#define COEXNET_ERROR_UNKNOWN_MODULE        15
#define COEXNET_ERROR_IO_ERROR              30
#define COEXNET_ERROR_FILE_NOT_FOUND        31
#define COEXNET_ERROR_READ_ERROR            33
#define COEXNET_ERROR_WRITE_ERROR           34
#define COEXNET_ERROR_FEATURE_UNAVAILABLE   41
#define COEXNET_ERROR_NUMERICAL_ERROR       50
#define COEXNET_ERROR_INSUFFICIENT_SAMPLES  55
#define COEXNET_ERROR_DEGENERATE_INPUT      56

/// "major.minor.patch"
const char* coexnet_get_version(void);

/// Element types, threading backend and optional features joined by '+',
/// e.g. "float64+int64+openmp+hdf5"
const char* coexnet_get_build_config(void);

/// Message of the last failure on this thread, "No error" after a success
const char* coexnet_get_last_error(void);
coexnet_error_t coexnet_get_last_error_code(void);
void coexnet_clear_error(void);

coexnet_bool_t coexnet_is_ok(coexnet_error_t code);
coexnet_bool_t coexnet_is_error(coexnet_error_t code);

/// Worker threads for every parallel kernel; 0 selects hardware concurrency
coexnet_error_t coexnet_set_num_threads(coexnet_size_t n);

#ifdef __cplusplus
}
#endif
