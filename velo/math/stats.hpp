#pragma once

#include "velo/core/type.hpp"
#include "velo/core/macros.hpp"
#include "velo/core/error.hpp"

#include <algorithm>
#include <limits>
#include <cmath>
#include <vector>

// =============================================================================
// FILE: velo/math/stats.hpp
// BRIEF: Order statistics and grids used by the per-gene fit
// =============================================================================

namespace velo::math {

// q-th percentile, q in [0, 100], with linear interpolation between the two
// nearest order statistics (rank = q/100 * (n-1)). Empty input yields NaN.
template <typename T>
T percentile(Array<const T> values, T q) {
    VELO_CHECK_RANGE(q, T(0), T(100), "percentile: q must lie in [0, 100]");

    const Size n = values.len;
    if (n == 0) return std::numeric_limits<T>::quiet_NaN();
    if (n == 1) return values[0];

    std::vector<T> buf(values.begin(), values.end());

    const T rank = q / T(100) * static_cast<T>(n - 1);
    const auto lo = static_cast<Size>(std::floor(rank));
    const Size hi = std::min(lo + 1, n - 1);
    const T frac = rank - static_cast<T>(lo);

    std::nth_element(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(lo), buf.end());
    const T v_lo = buf[lo];
    if (hi == lo || frac == T(0)) return v_lo;

    // Smallest element above position lo
    const T v_hi = *std::min_element(buf.begin() + static_cast<std::ptrdiff_t>(lo) + 1, buf.end());
    return v_lo + frac * (v_hi - v_lo);
}

template <typename T>
VELO_FORCE_INLINE T mean(Array<const T> values) {
    if (values.len == 0) return std::numeric_limits<T>::quiet_NaN();
    T acc = T(0);
    for (Size i = 0; i < values.len; ++i) acc += values[static_cast<Index>(i)];
    return acc / static_cast<T>(values.len);
}

// n evenly spaced points covering [start, stop] inclusive
template <typename T>
std::vector<T> linspace(T start, T stop, Size n) {
    std::vector<T> out(n);
    if (n == 0) return out;
    if (n == 1) {
        out[0] = start;
        return out;
    }
    const T step = (stop - start) / static_cast<T>(n - 1);
    for (Size i = 0; i < n; ++i) {
        out[i] = start + step * static_cast<T>(i);
    }
    out[n - 1] = stop;
    return out;
}

} // namespace velo::math
