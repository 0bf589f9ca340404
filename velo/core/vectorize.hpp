#pragma once

#include "velo/core/type.hpp"
#include "velo/core/macros.hpp"
#include "velo/core/error.hpp"
#include "velo/core/simd.hpp"

#include <cstddef>

// =============================================================================
// FILE: velo/core/vectorize.hpp
// BRIEF: SIMD reductions over array views
// =============================================================================
//
// Buffers come from std::vector and carry no over-alignment, so every load is
// an unaligned LoadU.

namespace velo::vectorize {

// =============================================================================
// 1. Reduction Operations
// =============================================================================

template <typename T>
VELO_FORCE_INLINE T sum(Array<const T> span) {
    namespace s = velo::simd;
    using SimdTag = s::SimdTagFor<T>;
    const SimdTag d;
    const size_t N = span.len;
    const size_t lanes = s::Lanes(d);

    if (N == 0) return T(0);

    auto sum0 = s::Zero(d);
    auto sum1 = s::Zero(d);

    size_t i = 0;

    for (; i + 2 * lanes <= N; i += 2 * lanes) {
        sum0 = s::Add(sum0, s::LoadU(d, span.ptr + i));
        sum1 = s::Add(sum1, s::LoadU(d, span.ptr + i + lanes));
    }

    sum0 = s::Add(sum0, sum1);

    for (; i + lanes <= N; i += lanes) {
        sum0 = s::Add(sum0, s::LoadU(d, span.ptr + i));
    }

    T result = s::GetLane(s::SumOfLanes(d, sum0));

    for (; i < N; ++i) {
        result += span[static_cast<Index>(i)];
    }

    return result;
}

template <typename T>
VELO_FORCE_INLINE T dot(Array<const T> a, Array<const T> b) {
    VELO_ASSERT(a.len == b.len, "dot: Size mismatch");

    namespace s = velo::simd;
    using SimdTag = s::SimdTagFor<T>;
    const SimdTag d;
    const size_t N = a.len;
    const size_t lanes = s::Lanes(d);

    if (N == 0) return T(0);

    auto acc0 = s::Zero(d);
    auto acc1 = s::Zero(d);
    auto acc2 = s::Zero(d);
    auto acc3 = s::Zero(d);

    size_t i = 0;

    for (; i + 4 * lanes <= N; i += 4 * lanes) {
        acc0 = s::MulAdd(s::LoadU(d, a.ptr + i), s::LoadU(d, b.ptr + i), acc0);
        acc1 = s::MulAdd(s::LoadU(d, a.ptr + i + lanes), s::LoadU(d, b.ptr + i + lanes), acc1);
        acc2 = s::MulAdd(s::LoadU(d, a.ptr + i + 2*lanes), s::LoadU(d, b.ptr + i + 2*lanes), acc2);
        acc3 = s::MulAdd(s::LoadU(d, a.ptr + i + 3*lanes), s::LoadU(d, b.ptr + i + 3*lanes), acc3);
    }

    acc0 = s::Add(acc0, acc1);
    acc2 = s::Add(acc2, acc3);
    acc0 = s::Add(acc0, acc2);

    for (; i + lanes <= N; i += lanes) {
        acc0 = s::MulAdd(s::LoadU(d, a.ptr + i), s::LoadU(d, b.ptr + i), acc0);
    }

    T result = s::GetLane(s::SumOfLanes(d, acc0));

    for (; i < N; ++i) {
        result += a[static_cast<Index>(i)] * b[static_cast<Index>(i)];
    }

    return result;
}

template <typename T>
VELO_FORCE_INLINE T sum_squared(Array<const T> span) {
    return dot(span, span);
}

// Largest value; the span must be non-empty and NaN-free.
template <typename T>
VELO_FORCE_INLINE T max_value(Array<const T> span) {
    VELO_ASSERT(span.len > 0, "max_value: Empty span");

    namespace s = velo::simd;
    using SimdTag = s::SimdTagFor<T>;
    const SimdTag d;
    const size_t N = span.len;
    const size_t lanes = s::Lanes(d);

    T max_val = span[0];
    size_t i = 0;

    if (N >= lanes) {
        auto v_max = s::LoadU(d, span.ptr);
        i = lanes;
        for (; i + lanes <= N; i += lanes) {
            v_max = s::Max(v_max, s::LoadU(d, span.ptr + i));
        }
        max_val = s::GetLane(s::MaxOfLanes(d, v_max));
    }

    for (; i < N; ++i) {
        if (span[static_cast<Index>(i)] > max_val) max_val = span[static_cast<Index>(i)];
    }

    return max_val;
}

} // namespace velo::vectorize
