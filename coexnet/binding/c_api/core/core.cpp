// =============================================================================
// FILE: coexnet/binding/c_api/core/core.cpp
// BRIEF: Core C API: version, thread-local error state, exception mapping
// =============================================================================

#include "coexnet/binding/c_api/core/core.h"
#include "coexnet/binding/c_api/core/internal.hpp"
#include "coexnet/core/error.hpp"
#include "coexnet/threading/scheduler.hpp"

#include <algorithm>
#include <exception>
#include <new>
#include <stdexcept>
#include <string>
#include <string_view>

namespace coexnet::binding {

namespace {

// Messages longer than this are truncated so a failing call never allocates
// without bound while reporting
constexpr std::size_t MAX_ERROR_MESSAGE = 1023;

struct ErrorState {
    coexnet_error_t code = COEXNET_OK;
    std::string message;
};

auto error_state() noexcept -> ErrorState& {
    thread_local ErrorState state;
    return state;
}

} // anonymous namespace

void set_last_error(coexnet_error_t code, std::string_view message) noexcept {
    auto& state = error_state();
    state.code = code;
    try {
        state.message.assign(message.substr(0, std::min(message.size(), MAX_ERROR_MESSAGE)));
    } catch (const std::bad_alloc&) {
        state.message.clear();
    }
}

void set_last_error(coexnet_error_t code, const char* message) noexcept {
    set_last_error(code, message ? std::string_view(message) : std::string_view());
}

void clear_last_error() noexcept {
    auto& state = error_state();
    state.code = COEXNET_OK;
    state.message.clear();
}

auto get_last_error_message() noexcept -> const char* {
    const auto& state = error_state();
    return state.message.empty() ? "No error" : state.message.c_str();
}

auto get_last_error_code() noexcept -> coexnet_error_t {
    return error_state().code;
}

// =============================================================================
// Exception to Error Code Conversion
// =============================================================================

// coexnet::ErrorCode values are the C error codes; standard exceptions
// that escape a kernel are mapped by category.
[[nodiscard]] auto handle_exception() noexcept -> coexnet_error_t {
    coexnet_error_t code = COEXNET_ERROR_UNKNOWN;
    try {
        throw;
    }
    catch (const Exception& e) {
        code = static_cast<coexnet_error_t>(e.code());
        set_last_error(code, e.what());
    }
    catch (const std::bad_alloc&) {
        code = COEXNET_ERROR_OUT_OF_MEMORY;
        set_last_error(code, "allocation failed (std::bad_alloc)");
    }
    catch (const std::out_of_range& e) {
        code = COEXNET_ERROR_INDEX_OUT_OF_BOUNDS;
        set_last_error(code, e.what());
    }
    catch (const std::domain_error& e) {
        code = COEXNET_ERROR_DOMAIN_ERROR;
        set_last_error(code, e.what());
    }
    catch (const std::invalid_argument& e) {
        code = COEXNET_ERROR_INVALID_ARGUMENT;
        set_last_error(code, e.what());
    }
    catch (const std::exception& e) {
        code = COEXNET_ERROR_INTERNAL;
        set_last_error(code, e.what());
    }
    catch (...) {
        set_last_error(code, "exception not derived from std::exception");
    }
    return code;
}

} // namespace coexnet::binding

extern "C" {

COEXNET_EXPORT const char* coexnet_get_version(void) {
    return "1.0.0";
}

COEXNET_EXPORT const char* coexnet_get_build_config(void) {
    static const char* config_str =
        COEXNET_REAL_TYPE_NAME "+" COEXNET_INDEX_TYPE_NAME
#if defined(COEXNET_USE_OPENMP)
        "+openmp"
#elif defined(COEXNET_USE_TBB)
        "+tbb"
#else
        "+serial"
#endif
#if defined(COEXNET_HAS_HDF5)
        "+hdf5"
#endif
        ;
    return config_str;
}

COEXNET_EXPORT const char* coexnet_get_last_error(void) {
    return coexnet::binding::get_last_error_message();
}

COEXNET_EXPORT coexnet_error_t coexnet_get_last_error_code(void) {
    return coexnet::binding::get_last_error_code();
}

COEXNET_EXPORT void coexnet_clear_error(void) {
    coexnet::binding::clear_last_error();
}

COEXNET_EXPORT coexnet_bool_t coexnet_is_ok(coexnet_error_t code) {
    return (code == COEXNET_OK) ? COEXNET_TRUE : COEXNET_FALSE;
}

COEXNET_EXPORT coexnet_bool_t coexnet_is_error(coexnet_error_t code) {
    return (code != COEXNET_OK) ? COEXNET_TRUE : COEXNET_FALSE;
}

COEXNET_EXPORT coexnet_error_t coexnet_set_num_threads(coexnet_size_t n) {
    COEXNET_C_API_TRY
        coexnet::threading::Scheduler::set_num_threads(n);
        COEXNET_C_API_RETURN_OK;
    COEXNET_C_API_CATCH
}

} // extern "C"
