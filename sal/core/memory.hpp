#pragma once

#include "sal/config.hpp"
#include "sal/core/type.hpp"
#include "sal/core/macros.hpp"
#include "sal/core/error.hpp"
#include <cstring>
#include <new>
#include <memory>
#include <algorithm>
#include <type_traits>

// =============================================================================
// FILE: sal/core/memory.hpp
// BRIEF: Aligned buffers for numeric scratch storage
// =============================================================================

namespace sal::memory {

// =============================================================================
// Aligned Memory Allocation
// =============================================================================

template <typename T>
struct AlignedDeleter {
    std::size_t alignment_;

    explicit AlignedDeleter(std::size_t alignment = DEFAULT_ALIGNMENT) noexcept
        : alignment_(alignment) {}

    void operator()(T* ptr) const noexcept {
        if (SAL_UNLIKELY(!ptr)) return;
        operator delete[](ptr, std::align_val_t(alignment_));
    }
};

// Zero-initialized, aligned array of arithmetic type.
// Throws OutOfMemoryError when the allocation fails.
template <typename T>
// NOLINTNEXTLINE(modernize-avoid-c-arrays)
SAL_FORCE_INLINE auto aligned_alloc(Size count, std::size_t alignment = DEFAULT_ALIGNMENT) -> std::unique_ptr<T[], AlignedDeleter<T>> {
    static_assert(std::is_arithmetic_v<T>,
                  "aligned_alloc: Type must be arithmetic");

    if (SAL_UNLIKELY(count == 0)) {
        // NOLINTNEXTLINE(modernize-avoid-c-arrays)
        return std::unique_ptr<T[], AlignedDeleter<T>>(nullptr, AlignedDeleter<T>(alignment));
    }

    T* raw_ptr = nullptr;
    try {
        raw_ptr = new (std::align_val_t(alignment)) T[count]();
    } catch (const std::bad_alloc&) {
        throw OutOfMemoryError("aligned_alloc: failed to allocate " +
                               std::to_string(count * sizeof(T)) + " bytes");
    }

    // NOLINTNEXTLINE(modernize-avoid-c-arrays)
    return std::unique_ptr<T[], AlignedDeleter<T>>(raw_ptr, AlignedDeleter<T>(alignment));
}

// RAII wrapper around aligned_alloc
template <typename T>
struct AlignedBuffer {
    AlignedBuffer() noexcept
        : ptr_(nullptr, AlignedDeleter<T>()), count_(0) {}

    explicit AlignedBuffer(Size count, std::size_t alignment = DEFAULT_ALIGNMENT)
        : ptr_(aligned_alloc<T>(count, alignment)), count_(count) {}

    ~AlignedBuffer() = default;

    AlignedBuffer(const AlignedBuffer&) = delete;
    auto operator=(const AlignedBuffer&) -> AlignedBuffer& = delete;

    AlignedBuffer(AlignedBuffer&&) noexcept = default;
    auto operator=(AlignedBuffer&&) noexcept -> AlignedBuffer& = default;

    [[nodiscard]] auto array() noexcept -> Array<T> {
        return Array<T>(ptr_.get(), count_);
    }

    [[nodiscard]] auto array() const noexcept -> Array<const T> {
        return Array<const T>(ptr_.get(), count_);
    }

    auto get() noexcept -> T* { return ptr_.get(); }
    auto get() const noexcept -> const T* { return ptr_.get(); }

    [[nodiscard]] auto size() const noexcept -> Size { return count_; }

    auto operator[](Size i) noexcept -> T& { return ptr_[i]; }
    auto operator[](Size i) const noexcept -> const T& { return ptr_[i]; }

    explicit operator bool() const noexcept { return ptr_ != nullptr; }

private:
    // NOLINTNEXTLINE(modernize-avoid-c-arrays)
    std::unique_ptr<T[], AlignedDeleter<T>> ptr_;
    Size count_;
};

// =============================================================================
// Initialization (Fill / Zero / Copy)
// =============================================================================

template <typename T>
SAL_FORCE_INLINE void fill(Array<T> arr, T value) {
    if (SAL_UNLIKELY(arr.size() == 0)) return;
    std::fill(arr.begin(), arr.end(), value);
}

template <typename T>
SAL_FORCE_INLINE void zero(Array<T> arr) {
    if (SAL_UNLIKELY(arr.size() == 0)) return;
    std::memset(static_cast<void*>(arr.data()), 0, arr.size() * sizeof(T));
}

template <typename T>
SAL_FORCE_INLINE void copy(Array<const T> src, Array<T> dst) {
    SAL_CHECK_DIM(src.size() <= dst.size(), "copy: destination too small");
    if (SAL_UNLIKELY(src.size() == 0)) return;
    std::memcpy(static_cast<void*>(dst.data()), src.data(), src.size() * sizeof(T));
}

} // namespace sal::memory
