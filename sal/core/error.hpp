#pragma once

#include "sal/core/macros.hpp"
#include <exception>
#include <string>
#include <utility>
#include <cstdint>

// =============================================================================
// FILE: sal/core/error.hpp
// BRIEF: SAL Exception System
// =============================================================================

namespace sal {

// =============================================================================
// Error Codes (C-ABI Compatible)
// =============================================================================

enum class ErrorCode : std::int32_t {
    OK = 0,

    // General errors
    UNKNOWN = 1,
    INTERNAL_ERROR = 2,
    OUT_OF_MEMORY = 3,
    NULL_POINTER = 4,

    // Argument errors
    INVALID_ARGUMENT = 10,
    DIMENSION_MISMATCH = 11,
    RANGE_ERROR = 13,
    INDEX_OUT_OF_BOUNDS = 14,

    // Weights state errors
    TRANSFORM_RESTORE_ERROR = 60,
};

// =============================================================================
// Base Exception Class
// =============================================================================

class SAL_EXPORT Exception : public std::exception {
public:
    explicit Exception(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    [[nodiscard]] auto what() const noexcept -> const char* override {
        return msg_.c_str();
    }

    [[nodiscard]] auto code() const noexcept -> ErrorCode {
        return code_;
    }

    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return msg_;
    }

protected:
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    ErrorCode code_;
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    std::string msg_;
};

// =============================================================================
// Specialized Exception Classes
// =============================================================================

class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& msg)
        : Exception(ErrorCode::UNKNOWN, msg) {}

    explicit RuntimeError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class OutOfMemoryError : public RuntimeError {
public:
    explicit OutOfMemoryError(const std::string& msg = "Out of memory")
        : RuntimeError(ErrorCode::OUT_OF_MEMORY, msg) {}
};

class InternalError : public RuntimeError {
public:
    explicit InternalError(const std::string& msg)
        : RuntimeError(ErrorCode::INTERNAL_ERROR, "Internal SAL Error: " + msg) {}
};

// A scoped weight transform could not be put back because the graph's
// transform was changed by someone else while the scope was active.
class TransformRestoreError : public RuntimeError {
public:
    explicit TransformRestoreError(const std::string& msg)
        : RuntimeError(ErrorCode::TRANSFORM_RESTORE_ERROR, msg) {}
};

class ValueError : public Exception {
public:
    explicit ValueError(const std::string& msg)
        : Exception(ErrorCode::INVALID_ARGUMENT, msg) {}

protected:
    ValueError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

class DimensionError : public ValueError {
public:
    explicit DimensionError(const std::string& msg)
        : ValueError(ErrorCode::DIMENSION_MISMATCH, msg) {}
};

class IndexOutOfBoundsError : public ValueError {
public:
    explicit IndexOutOfBoundsError(const std::string& msg)
        : ValueError(ErrorCode::INDEX_OUT_OF_BOUNDS, msg) {}
};

// =============================================================================
// Helper Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// Assertion for internal invariants (active in all builds)
#define SAL_ASSERT(condition, msg) \
    do { \
        if (SAL_UNLIKELY(!(condition))) { \
            throw sal::InternalError(std::string(msg) + " (" + __FILE__ + ":" + std::to_string(__LINE__) + ")"); \
        } \
    } while(0)

// Validation for user inputs
#define SAL_CHECK_ARG(condition, msg) \
    do { \
        if (SAL_UNLIKELY(!(condition))) { \
            throw sal::ValueError(msg); \
        } \
    } while(0)

// Validation for dimension mismatches
#define SAL_CHECK_DIM(condition, msg) \
    do { \
        if (SAL_UNLIKELY(!(condition))) { \
            throw sal::DimensionError(msg); \
        } \
    } while(0)

#define SAL_CHECK_BOUNDS(index, size, msg) \
    do { \
        if (SAL_UNLIKELY((index) < 0 || static_cast<std::size_t>(index) >= (size))) { \
            throw sal::IndexOutOfBoundsError(msg); \
        } \
    } while(0)
// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace sal
