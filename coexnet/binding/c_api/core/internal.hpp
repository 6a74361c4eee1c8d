#pragma once

// =============================================================================
// FILE: coexnet/binding/c_api/core/internal.hpp
// BRIEF: Glue shared by the C entry points (not installed)
// =============================================================================

#include "coexnet/binding/c_api/core/core.h"
#include "coexnet/core/dense.hpp"
#include "coexnet/core/error.hpp"

#include <string_view>
#include <type_traits>

static_assert(std::is_same_v<coexnet_real_t, coexnet::Real>, "C and C++ Real differ");
static_assert(std::is_same_v<coexnet_index_t, coexnet::Index>, "C and C++ Index differ");

namespace coexnet::binding {

void set_last_error(coexnet_error_t code, std::string_view message) noexcept;
void set_last_error(coexnet_error_t code, const char* message) noexcept;
void clear_last_error() noexcept;

[[nodiscard]] const char* get_last_error_message() noexcept;
[[nodiscard]] coexnet_error_t get_last_error_code() noexcept;

// Rethrows the in-flight exception and records it; call only inside a catch
[[nodiscard]] coexnet_error_t handle_exception() noexcept;

inline MatrixView dense_view(const coexnet_real_t* data, coexnet_index_t rows, coexnet_index_t cols) noexcept {
    return MatrixView(data, rows, cols);
}

inline DenseArray<Real> dense_view(coexnet_real_t* data, coexnet_index_t rows, coexnet_index_t cols) noexcept {
    return DenseArray<Real>(data, rows, cols);
}

} // namespace coexnet::binding

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define COEXNET_C_API_CHECK(cond, code, msg)                   \
    do {                                                       \
        if (COEXNET_UNLIKELY(!(cond))) {                       \
            ::coexnet::binding::set_last_error((code), (msg)); \
            return (code);                                     \
        }                                                      \
    } while (0)

#define COEXNET_C_API_CHECK_NULL(ptr, msg) \
    COEXNET_C_API_CHECK((ptr) != nullptr, COEXNET_ERROR_NULL_POINTER, msg)

// Body of an entry point: COEXNET_C_API_TRY ... COEXNET_C_API_RETURN_OK; COEXNET_C_API_CATCH
#define COEXNET_C_API_TRY try {
#define COEXNET_C_API_CATCH \
    } catch (...) { return ::coexnet::binding::handle_exception(); }

#define COEXNET_C_API_RETURN_OK                \
    do {                                       \
        ::coexnet::binding::clear_last_error(); \
        return COEXNET_OK;                     \
    } while (0)

// NOLINTEND(cppcoreguidelines-macro-usage)
