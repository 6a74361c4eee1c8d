#pragma once

#include "coexnet/core/macros.hpp"
#include <cstdint>
#include <exception>
#include <string>
#include <utility>

// =============================================================================
// FILE: coexnet/core/error.hpp
// BRIEF: Exception hierarchy and argument checks
//
// Every exception carries an ErrorCode whose value is the C API error code,
// so the binding maps any coexnet::Exception without a catch ladder.
//
//   Exception
//   +-- RuntimeError ........ NullPointerError, InternalError
//   +-- ValueError .......... DimensionError, DomainError, RangeError,
//   |                         IndexOutOfBoundsError, UnknownModuleError
//   +-- IOError ............. FileNotFoundError, ReadError, WriteError
//   +-- FeatureUnavailableError
//   +-- NumericalError ...... InsufficientSamplesError, DegenerateInputError
// =============================================================================

namespace coexnet {

enum class ErrorCode : std::int32_t {
    OK = 0,

    UNKNOWN = 1,
    INTERNAL_ERROR = 2,
    OUT_OF_MEMORY = 3,
    NULL_POINTER = 4,

    INVALID_ARGUMENT = 10,
    DIMENSION_MISMATCH = 11,
    DOMAIN_ERROR = 12,       // power <= 0, adjacency entry outside [0, 1]
    RANGE_ERROR = 13,        // option outside its documented interval
    INDEX_OUT_OF_BOUNDS = 14,
    UNKNOWN_MODULE = 15,

    IO_ERROR = 30,
    FILE_NOT_FOUND = 31,
    READ_ERROR = 33,
    WRITE_ERROR = 34,

    FEATURE_UNAVAILABLE = 41,

    NUMERICAL_ERROR = 50,
    INSUFFICIENT_SAMPLES = 55,
    DEGENERATE_INPUT = 56,
};

class COEXNET_EXPORT Exception : public std::exception {
public:
    Exception(ErrorCode code, std::string msg) : code_(code), msg_(std::move(msg)) {}

    [[nodiscard]] auto what() const noexcept -> const char* override { return msg_.c_str(); }
    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }

private:
    ErrorCode code_;
    std::string msg_;
};

// -----------------------------------------------------------------------------
// Runtime
// -----------------------------------------------------------------------------

class RuntimeError : public Exception {
public:
    explicit RuntimeError(std::string msg) : Exception(ErrorCode::UNKNOWN, std::move(msg)) {}

protected:
    RuntimeError(ErrorCode code, std::string msg) : Exception(code, std::move(msg)) {}
};

class NullPointerError : public RuntimeError {
public:
    explicit NullPointerError(std::string msg) : RuntimeError(ErrorCode::NULL_POINTER, std::move(msg)) {}
};

// A broken invariant inside coexnet, never a caller mistake
class InternalError : public RuntimeError {
public:
    explicit InternalError(const std::string& msg)
        : RuntimeError(ErrorCode::INTERNAL_ERROR, "coexnet internal error: " + msg) {}
};

// -----------------------------------------------------------------------------
// Caller input
// -----------------------------------------------------------------------------

class ValueError : public Exception {
public:
    explicit ValueError(std::string msg) : Exception(ErrorCode::INVALID_ARGUMENT, std::move(msg)) {}

protected:
    ValueError(ErrorCode code, std::string msg) : Exception(code, std::move(msg)) {}
};

class DimensionError : public ValueError {
public:
    explicit DimensionError(std::string msg) : ValueError(ErrorCode::DIMENSION_MISMATCH, std::move(msg)) {}
};

class DomainError : public ValueError {
public:
    explicit DomainError(std::string msg) : ValueError(ErrorCode::DOMAIN_ERROR, std::move(msg)) {}
};

class RangeError : public ValueError {
public:
    explicit RangeError(std::string msg) : ValueError(ErrorCode::RANGE_ERROR, std::move(msg)) {}
};

class IndexOutOfBoundsError : public ValueError {
public:
    explicit IndexOutOfBoundsError(std::string msg)
        : ValueError(ErrorCode::INDEX_OUT_OF_BOUNDS, std::move(msg)) {}
};

// Module id with no genes after detection and merging
class UnknownModuleError : public ValueError {
public:
    explicit UnknownModuleError(std::string msg) : ValueError(ErrorCode::UNKNOWN_MODULE, std::move(msg)) {}
};

// -----------------------------------------------------------------------------
// Storage
// -----------------------------------------------------------------------------

class IOError : public Exception {
public:
    explicit IOError(std::string msg) : Exception(ErrorCode::IO_ERROR, std::move(msg)) {}

protected:
    IOError(ErrorCode code, std::string msg) : Exception(code, std::move(msg)) {}
};

class FileNotFoundError : public IOError {
public:
    explicit FileNotFoundError(const std::string& path)
        : IOError(ErrorCode::FILE_NOT_FOUND, "no such file: " + path) {}
};

class ReadError : public IOError {
public:
    explicit ReadError(std::string msg) : IOError(ErrorCode::READ_ERROR, std::move(msg)) {}
};

class WriteError : public IOError {
public:
    explicit WriteError(std::string msg) : IOError(ErrorCode::WRITE_ERROR, std::move(msg)) {}
};

// Requested a build option that was compiled out (HDF5)
class FeatureUnavailableError : public Exception {
public:
    explicit FeatureUnavailableError(std::string msg)
        : Exception(ErrorCode::FEATURE_UNAVAILABLE, std::move(msg)) {}
};

// -----------------------------------------------------------------------------
// Numerics
// -----------------------------------------------------------------------------

class NumericalError : public Exception {
public:
    explicit NumericalError(std::string msg) : Exception(ErrorCode::NUMERICAL_ERROR, std::move(msg)) {}

protected:
    NumericalError(ErrorCode code, std::string msg) : Exception(code, std::move(msg)) {}
};

// Fewer than 3 paired observations, or no variance among them
class InsufficientSamplesError : public NumericalError {
public:
    explicit InsufficientSamplesError(std::string msg)
        : NumericalError(ErrorCode::INSUFFICIENT_SAMPLES, std::move(msg)) {}
};

// Zero-variance gene, or NaN/inf reaching adjacency, TOM, clustering or eigengenes
class DegenerateInputError : public NumericalError {
public:
    explicit DegenerateInputError(std::string msg)
        : NumericalError(ErrorCode::DEGENERATE_INPUT, std::move(msg)) {}
};

} // namespace coexnet

// =============================================================================
// Checks
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define COEXNET_THROW_UNLESS(condition, ExceptionType, msg) \
    do { \
        if (COEXNET_UNLIKELY(!(condition))) { \
            throw ::coexnet::ExceptionType(msg); \
        } \
    } while (0)

#define COEXNET_CHECK_ARG(condition, msg) COEXNET_THROW_UNLESS(condition, ValueError, msg)

#define COEXNET_CHECK_DIM(condition, msg) COEXNET_THROW_UNLESS(condition, DimensionError, msg)

// NaN passes; callers that reject NaN check it separately
#define COEXNET_CHECK_RANGE(value, lo, hi, msg) \
    COEXNET_THROW_UNLESS(!((value) < (lo) || (value) > (hi)), RangeError, msg)

// Internal invariant, active in every build
#define COEXNET_ASSERT(condition, msg) \
    COEXNET_THROW_UNLESS(condition, InternalError, \
        std::string(msg) + " (" + __FILE__ + ":" + std::to_string(__LINE__) + ")")

// NOLINTEND(cppcoreguidelines-macro-usage)
