#pragma once

#include "sal/config.hpp"
#include "sal/core/macros.hpp"
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <concepts>
#include <cassert>
#include <iterator>
#include <span>

// =============================================================================
// FILE: sal/core/type.hpp
// BRIEF: Scalar types and the non-owning Array view
// =============================================================================

namespace sal {

// =============================================================================
// SECTION 1: Basic Types
// =============================================================================

#if defined(SAL_USE_FLOAT32)
    using Real = float;
    constexpr int DTYPE_CODE = 0;
    constexpr const char* DTYPE_NAME = "float32";
#elif defined(SAL_USE_FLOAT64)
    using Real = double;
    constexpr int DTYPE_CODE = 1;
    constexpr const char* DTYPE_NAME = "float64";
#else
    #error "SAL: No precision macro defined."
#endif

#if defined(SAL_USE_INT32)
    using Index = std::int32_t;
    constexpr int INDEX_DTYPE_CODE = 1;
    constexpr const char* INDEX_DTYPE_NAME = "int32";
#elif defined(SAL_USE_INT64)
    using Index = std::int64_t;
    constexpr int INDEX_DTYPE_CODE = 2;
    constexpr const char* INDEX_DTYPE_NAME = "int64";
#else
    #error "SAL: No index precision selected."
#endif

using Size = std::size_t;

// =============================================================================
// SECTION 2: Array View
// =============================================================================

template <typename T>
struct Array {
    using value_type = T;
    using pointer = T*;
    using reference = T&;
    using size_type = Size;
    using difference_type = std::ptrdiff_t;
    using iterator = T*;
    using const_iterator = const T*;

    T* ptr;
    Size len;

    constexpr Array() noexcept : ptr(nullptr), len(0) {}
    constexpr Array(T* p, Size s) noexcept : ptr(p), len(s) {}

    // Conversion from non-const to const
    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr Array(const Array<U>& other) noexcept
        : ptr(other.ptr), len(other.len) {}

    template <std::size_t Extent = std::dynamic_extent>
    constexpr Array(std::span<T, Extent> span) noexcept
        : ptr(span.data()), len(static_cast<Size>(span.size())) {}

    SAL_FORCE_INLINE constexpr auto operator[](Size i) const noexcept -> T& {
#if !defined(NDEBUG)
        assert(i < len && "Array index out of bounds");
#endif
        return ptr[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    [[nodiscard]] SAL_FORCE_INLINE constexpr auto data() const noexcept -> T* { return ptr; }
    [[nodiscard]] SAL_FORCE_INLINE constexpr auto size() const noexcept -> Size { return len; }
    [[nodiscard]] SAL_FORCE_INLINE constexpr auto empty() const noexcept -> bool { return len == 0; }

    [[nodiscard]] SAL_FORCE_INLINE constexpr auto begin() const noexcept -> T* { return ptr; }
    [[nodiscard]] SAL_FORCE_INLINE constexpr auto end() const noexcept -> T* {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        return ptr + len;
    }

    [[nodiscard]] SAL_FORCE_INLINE constexpr auto subspan(Size offset, Size count) const noexcept -> Array<T> {
#if !defined(NDEBUG)
        assert(offset + count <= len && "Subspan exceeds array bounds");
#endif
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        return Array<T>(ptr + offset, count);
    }

    [[nodiscard]] SAL_FORCE_INLINE constexpr auto first(Size count) const noexcept -> Array<T> {
#if !defined(NDEBUG)
        assert(count <= len && "Count exceeds array size");
#endif
        return Array<T>(ptr, count);
    }

    [[nodiscard]] constexpr auto as_span() const noexcept -> std::span<T> {
        return std::span<T>(ptr, len);
    }
};

static_assert(std::is_trivially_copyable_v<Array<Real>>);
static_assert(std::is_trivially_copyable_v<Array<const Real>>);
static_assert(std::is_standard_layout_v<Array<Real>>);

// =============================================================================
// SECTION 3: ArrayLike Concept
// =============================================================================

template <typename A>
concept ArrayLike = requires(const A& a, Size i) {
    typename A::value_type;
    { a.size() } -> std::convertible_to<Size>;
    { a[i] } -> std::convertible_to<const typename A::value_type&>;
    { a.begin() };
    { a.end() };
};

static_assert(ArrayLike<Array<Real>>);
static_assert(ArrayLike<Array<const Real>>);
static_assert(ArrayLike<Array<Index>>);

} // namespace sal
