// =============================================================================
// FILE: sal/binding/c_api/core/core.cpp
// BRIEF: Core C API implementation with thread-safe error handling
// =============================================================================

#include "sal/binding/c_api/core/core.h"
#include "sal/binding/c_api/core/internal.hpp"
#include "sal/config.hpp"
#include "sal/core/error.hpp"
#include "sal/threading/scheduler.hpp"

#include <array>
#include <cstring>
#include <exception>
#include <new>
#include <stdexcept>

namespace sal::binding {

// =============================================================================
// Thread-Local Error State
// =============================================================================

namespace {

constexpr std::size_t ERROR_MESSAGE_BUFFER_SIZE = 512;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local sal_error_t g_last_error_code = SAL_OK;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local std::array<char, ERROR_MESSAGE_BUFFER_SIZE> g_last_error_message = {};

} // anonymous namespace

// =============================================================================
// Internal Error Management Functions
// =============================================================================

void set_last_error(sal_error_t code, const char* message) noexcept {
    g_last_error_code = code;

    if (SAL_LIKELY(message != nullptr)) [[likely]] {
        std::strncpy(g_last_error_message.data(), message,
                     ERROR_MESSAGE_BUFFER_SIZE - 1);
        g_last_error_message[ERROR_MESSAGE_BUFFER_SIZE - 1] = '\0';
    } else [[unlikely]] {
        g_last_error_message[0] = '\0';
    }
}

void clear_last_error() noexcept {
    g_last_error_code = SAL_OK;
    g_last_error_message[0] = '\0';
}

auto get_last_error_message() noexcept -> const char* {
    if (SAL_LIKELY(g_last_error_message[0] != '\0')) [[likely]] {
        return g_last_error_message.data();
    }
    return "No error";
}

auto get_last_error_code() noexcept -> sal_error_t {
    return g_last_error_code;
}

// =============================================================================
// Exception to Error Code Conversion
// =============================================================================

// Most specific types first: DimensionError and
// IndexOutOfBoundsError derive from ValueError.
[[nodiscard]] auto handle_exception() noexcept -> sal_error_t {
    try {
        throw;
    }
    catch (const IndexOutOfBoundsError& e) {
        set_last_error(SAL_ERROR_INDEX_OUT_OF_BOUNDS, e.what());
        return SAL_ERROR_INDEX_OUT_OF_BOUNDS;
    }
    catch (const DimensionError& e) {
        set_last_error(SAL_ERROR_DIMENSION_MISMATCH, e.what());
        return SAL_ERROR_DIMENSION_MISMATCH;
    }
    catch (const ValueError& e) {
        set_last_error(SAL_ERROR_INVALID_ARGUMENT, e.what());
        return SAL_ERROR_INVALID_ARGUMENT;
    }
    catch (const TransformRestoreError& e) {
        set_last_error(SAL_ERROR_TRANSFORM_RESTORE, e.what());
        return SAL_ERROR_TRANSFORM_RESTORE;
    }
    catch (const OutOfMemoryError& e) {
        set_last_error(SAL_ERROR_OUT_OF_MEMORY, e.what());
        return SAL_ERROR_OUT_OF_MEMORY;
    }
    catch (const InternalError& e) {
        set_last_error(SAL_ERROR_INTERNAL, e.what());
        return SAL_ERROR_INTERNAL;
    }
    catch (const Exception& e) {
        set_last_error(SAL_ERROR_UNKNOWN, e.what());
        return SAL_ERROR_UNKNOWN;
    }
    // Standard exceptions
    catch (const std::bad_alloc&) {
        set_last_error(SAL_ERROR_OUT_OF_MEMORY,
                       "Memory allocation failed (std::bad_alloc)");
        return SAL_ERROR_OUT_OF_MEMORY;
    }
    catch (const std::out_of_range& e) {
        set_last_error(SAL_ERROR_RANGE_ERROR, e.what());
        return SAL_ERROR_RANGE_ERROR;
    }
    catch (const std::logic_error& e) {
        set_last_error(SAL_ERROR_INVALID_ARGUMENT, e.what());
        return SAL_ERROR_INVALID_ARGUMENT;
    }
    catch (const std::exception& e) {
        set_last_error(SAL_ERROR_UNKNOWN, e.what());
        return SAL_ERROR_UNKNOWN;
    }
    catch (...) {
        set_last_error(SAL_ERROR_UNKNOWN,
                       "Unknown exception (not derived from std::exception)");
        return SAL_ERROR_UNKNOWN;
    }
}

} // namespace sal::binding

// =============================================================================
// C API Implementation (Stable ABI)
// =============================================================================

extern "C" {

// =============================================================================
// Version Information
// =============================================================================

SAL_EXPORT const char* sal_get_version(void) {
    return "1.0.0";
}

SAL_EXPORT const char* sal_get_build_config(void) {
    static const char* config_str =
#if defined(SAL_USE_FLOAT32)
        "float32"
#else
        "float64"
#endif
#if defined(SAL_USE_INT32)
        "+int32"
#else
        "+int64"
#endif
#if defined(__AVX512F__)
        "+avx512"
#elif defined(__AVX2__)
        "+avx2"
#elif defined(__AVX__)
        "+avx"
#elif defined(__SSE4_2__)
        "+sse4.2"
#elif defined(__SSE2__)
        "+sse2"
#else
        "+scalar"
#endif
#if defined(SAL_USE_OPENMP)
        "+openmp"
#elif defined(SAL_USE_TBB)
        "+tbb"
#elif defined(SAL_USE_BS)
        "+bs"
#else
        "+serial"
#endif
        ;
    return config_str;
}

// =============================================================================
// Error Handling
// =============================================================================

SAL_EXPORT const char* sal_get_last_error(void) {
    return sal::binding::get_last_error_message();
}

SAL_EXPORT sal_error_t sal_get_last_error_code(void) {
    return sal::binding::get_last_error_code();
}

SAL_EXPORT void sal_clear_error(void) {
    sal::binding::clear_last_error();
}

SAL_EXPORT sal_bool_t sal_is_ok(sal_error_t code) {
    return (code == SAL_OK) ? SAL_TRUE : SAL_FALSE;
}

SAL_EXPORT sal_bool_t sal_is_error(sal_error_t code) {
    return (code != SAL_OK) ? SAL_TRUE : SAL_FALSE;
}

// =============================================================================
// Threading
// =============================================================================

SAL_EXPORT sal_error_t sal_set_num_threads(sal_size_t n) {
    SAL_C_API_TRY
        sal::threading::Scheduler::set_num_threads(static_cast<size_t>(n));
        SAL_C_API_RETURN_OK;
    SAL_C_API_CATCH
}

SAL_EXPORT sal_size_t sal_get_num_threads(void) {
    return static_cast<sal_size_t>(sal::threading::Scheduler::get_num_threads());
}

// =============================================================================
// Cancellation
// =============================================================================

SAL_EXPORT sal_error_t sal_cancel_create(sal_cancel_t* out) {
    SAL_C_API_CHECK_NULL(out, "Output handle pointer is null");

    SAL_C_API_TRY
        *out = new sal_cancel();
        SAL_C_API_RETURN_OK;
    SAL_C_API_CATCH
}

SAL_EXPORT sal_error_t sal_cancel_destroy(sal_cancel_t* token) {
    if (token == nullptr || *token == nullptr) {
        SAL_C_API_RETURN_OK;  // Already null
    }
    delete *token;
    *token = nullptr;
    SAL_C_API_RETURN_OK;
}

SAL_EXPORT sal_error_t sal_cancel_request(sal_cancel_t token) {
    SAL_C_API_CHECK_NULL(token, "Cancel token is null");
    token->token.request();
    SAL_C_API_RETURN_OK;
}

SAL_EXPORT sal_error_t sal_cancel_reset(sal_cancel_t token) {
    SAL_C_API_CHECK_NULL(token, "Cancel token is null");
    token->token.reset();
    SAL_C_API_RETURN_OK;
}

SAL_EXPORT sal_error_t sal_cancel_requested(sal_cancel_t token, sal_bool_t* out) {
    SAL_C_API_CHECK_NULL(token, "Cancel token is null");
    SAL_C_API_CHECK_NULL(out, "Output pointer is null");
    *out = token->token.requested() ? SAL_TRUE : SAL_FALSE;
    SAL_C_API_RETURN_OK;
}

} // extern "C"
