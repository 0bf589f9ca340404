#pragma once

#include "velo/config.hpp"
#include "velo/core/macros.hpp"
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <concepts>
#include <cassert>
#include <iterator>
#include <span>
#include <vector>

// =============================================================================
// FILE: velo/core/type.hpp
// BRIEF: Scalar types and zero-overhead array views
// =============================================================================

namespace velo {

// =============================================================================
// SECTION 1: Basic Types
// =============================================================================

#if defined(VELO_USE_FLOAT32)
    using Real = float;
    constexpr int DTYPE_CODE = 0;
    constexpr const char* DTYPE_NAME = "float32";
#elif defined(VELO_USE_FLOAT64)
    using Real = double;
    constexpr int DTYPE_CODE = 1;
    constexpr const char* DTYPE_NAME = "float64";
#else
    #error "VELO: No precision macro defined."
#endif

#if defined(VELO_USE_INT16)
    using Index = std::int16_t;
    constexpr const char* INDEX_DTYPE_NAME = "int16";
#elif defined(VELO_USE_INT32)
    using Index = std::int32_t;
    constexpr const char* INDEX_DTYPE_NAME = "int32";
#elif defined(VELO_USE_INT64)
    using Index = std::int64_t;
    constexpr const char* INDEX_DTYPE_NAME = "int64";
#else
    #error "VELO: No index precision selected."
#endif

using Size = std::size_t;
using Byte = std::uint8_t;

// =============================================================================
// SECTION 2: Array View
// =============================================================================

template <typename T>
struct Array {
    using value_type = T;
    using pointer = T*;
    using reference = T&;
    using size_type = Size;
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

    // Views over owned storage
    template <typename U>
        requires std::is_same_v<std::remove_const_t<T>, U>
    Array(std::vector<U>& v) noexcept : ptr(v.data()), len(v.size()) {}

    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    Array(const std::vector<U>& v) noexcept : ptr(v.data()), len(v.size()) {}

    VELO_FORCE_INLINE constexpr auto operator[](Index i) const noexcept -> T& {
#if !defined(NDEBUG)
        assert(i >= 0 && static_cast<Size>(i) < len && "Array index out of bounds");
#endif
        return ptr[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    [[nodiscard]] VELO_FORCE_INLINE constexpr auto data() const noexcept -> T* { return ptr; }
    [[nodiscard]] VELO_FORCE_INLINE constexpr auto size() const noexcept -> Size { return len; }
    [[nodiscard]] VELO_FORCE_INLINE constexpr auto empty() const noexcept -> bool { return len == 0; }

    [[nodiscard]] VELO_FORCE_INLINE constexpr auto begin() const noexcept -> T* { return ptr; }
    [[nodiscard]] VELO_FORCE_INLINE constexpr auto end() const noexcept -> T* {
        return ptr + len;  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    [[nodiscard]] VELO_FORCE_INLINE constexpr auto subspan(Index offset, Size count) const noexcept -> Array<T> {
#if !defined(NDEBUG)
        assert(offset >= 0 && static_cast<Size>(offset) + count <= len && "Subspan out of bounds");
#endif
        return Array<T>(ptr + offset, count);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
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
concept ArrayLike = requires(const A& a, Index i) {
    typename A::value_type;
    { a.size() } -> std::convertible_to<Size>;
    { a[i] } -> std::convertible_to<const typename A::value_type&>;
    { a.begin() };
    { a.end() };
};

static_assert(ArrayLike<Array<Real>>);
static_assert(ArrayLike<Array<const Real>>);

// =============================================================================
// SECTION 4: Dense Column View
// =============================================================================

// Column-major (cells x genes) dense matrix view. Gene columns are contiguous.
template <typename T>
struct ColumnView {
    T* data;
    Index rows;
    Index cols;

    constexpr ColumnView() noexcept : data(nullptr), rows(0), cols(0) {}
    constexpr ColumnView(T* p, Index r, Index c) noexcept : data(p), rows(r), cols(c) {}

    [[nodiscard]] constexpr auto valid() const noexcept -> bool {
        return data != nullptr && rows > 0 && cols > 0;
    }

    [[nodiscard]] VELO_FORCE_INLINE auto col(Index j) const noexcept -> Array<T> {
#if !defined(NDEBUG)
        assert(j >= 0 && j < cols && "Column index out of bounds");
#endif
        return Array<T>(data + static_cast<Size>(j) * static_cast<Size>(rows),
                        static_cast<Size>(rows));
    }
};

} // namespace velo
