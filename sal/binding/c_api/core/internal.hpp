#pragma once

// =============================================================================
// FILE: sal/binding/c_api/core/internal.hpp
// BRIEF: Internal C++ wrapper structures for C API binding layer
// =============================================================================
//
// WARNING: This header is INTERNAL to the C API binding layer
// NOT part of the public API - do not include from user code
//
// PURPOSE:
//   - Bridge C opaque handles to C++ objects
//   - Hold the transform scope opened through the C API
//   - Implement exception-to-error-code conversion
// =============================================================================

#include "sal/binding/c_api/core/core.h"
#include "sal/core/weights.hpp"
#include "sal/core/cancel.hpp"
#include "sal/core/error.hpp"
#include "sal/core/type.hpp"

#include <memory>
#include <utility>
#include <type_traits>

namespace sal::binding {

// =============================================================================
// Internal Weights Wrapper
// =============================================================================

/// @brief Owns a weights graph and at most one open transform scope
/// @details The scope references the graph, so it is declared after it and
///          torn down first.
struct WeightsWrapper {
    WeightsGraph graph;
    std::unique_ptr<ScopedTransform> scope;

    explicit WeightsWrapper(WeightsGraph&& g) noexcept
        : graph(std::move(g)) {}

    WeightsWrapper(const WeightsWrapper&) = delete;
    WeightsWrapper& operator=(const WeightsWrapper&) = delete;
    WeightsWrapper(WeightsWrapper&&) = delete;
    WeightsWrapper& operator=(WeightsWrapper&&) = delete;

    ~WeightsWrapper() = default;

    [[nodiscard]] bool scope_open() const noexcept { return scope != nullptr; }
};

/// @brief Cancellation token shared between a caller thread and a kernel
struct CancelWrapper {
    CancelToken token;
};

// =============================================================================
// Thread-Local Error State Management
// =============================================================================

// Set last error with code and message (noexcept guarantee)
void set_last_error(sal_error_t code, const char* message) noexcept;

// Clear last error state
void clear_last_error() noexcept;

// Get last error message (thread-local)
[[nodiscard]] auto get_last_error_message() noexcept -> const char*;

// Get last error code (thread-local)
[[nodiscard]] auto get_last_error_code() noexcept -> sal_error_t;

// =============================================================================
// Exception Handling
// =============================================================================

// Convert active C++ exception to C error code
// Must be called from within a catch block
[[nodiscard]] auto handle_exception() noexcept -> sal_error_t;

// =============================================================================
// Convenience Macros for Error Handling
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/// @brief Check pointer argument and return error if null
#define SAL_C_API_CHECK_NULL(ptr, msg) \
    do { \
        if (SAL_UNLIKELY((ptr) == nullptr)) { \
            sal::binding::set_last_error(SAL_ERROR_NULL_POINTER, (msg)); \
            return SAL_ERROR_NULL_POINTER; \
        } \
    } while(0)

/// @brief Check condition and return error if false
#define SAL_C_API_CHECK(cond, code, msg) \
    do { \
        if (SAL_UNLIKELY(!(cond))) { \
            sal::binding::set_last_error((code), (msg)); \
            return (code); \
        } \
    } while(0)

/// @brief Try block wrapper for C API functions
#define SAL_C_API_TRY try {

/// @brief Catch block wrapper for C API functions
#define SAL_C_API_CATCH \
    } catch (...) { \
        return sal::binding::handle_exception(); \
    }

/// @brief Clear error and return success
#define SAL_C_API_RETURN_OK \
    do { \
        sal::binding::clear_last_error(); \
        return SAL_OK; \
    } while(0)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace sal::binding

// =============================================================================
// Opaque Handle Definitions (C ABI Compatibility)
// =============================================================================

// These structs complete the forward declarations in core.h. Handles are
// allocated as the handle type itself, so no downcasting is needed.

struct sal_weights : sal::binding::WeightsWrapper {
    using WeightsWrapper::WeightsWrapper;
};

struct sal_cancel : sal::binding::CancelWrapper {};

// The C primitive types are chosen by the same macros as the C++ ones
static_assert(std::is_same_v<sal_real_t, sal::Real>,
              "sal_real_t does not match sal::Real (check SAL_PRECISION)");
static_assert(std::is_same_v<sal_index_t, sal::Index>,
              "sal_index_t does not match sal::Index (check SAL_INDEX_PRECISION)");

static_assert(std::is_base_of_v<sal::binding::WeightsWrapper, sal_weights>,
              "sal_weights must inherit from WeightsWrapper");
static_assert(!std::is_copy_constructible_v<sal_weights>,
              "sal_weights must not be copyable");
static_assert(!std::is_copy_constructible_v<sal_cancel>,
              "sal_cancel must not be copyable");
