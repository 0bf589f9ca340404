#pragma once

#include "velo/core/type.hpp"
#include "velo/core/macros.hpp"

#include <array>
#include <cmath>

// =============================================================================
// FILE: velo/math/regression.hpp
// BRIEF: Tiny dense solves for normal equations
// =============================================================================

namespace velo::math::regression {

// Gaussian elimination without pivoting on an N x N system. Meant for
// normal equations (symmetric, positive definite), so a pivot that is not
// strictly positive and finite means the system is singular: returns false
// and leaves x untouched. A and b are consumed.
template <int N>
VELO_FORCE_INLINE bool solve_linear_system(
    std::array<std::array<Real, N>, N>& A,
    std::array<Real, N>& b,
    std::array<Real, N>& x
) {
    // Forward elimination
    for (int i = 0; i < N; ++i) {
        if (!(A[i][i] > Real(0)) || !std::isfinite(A[i][i])) return false;
        const Real div = Real(1) / A[i][i];
        for (int j = i + 1; j < N; ++j) {
            const Real factor = A[j][i] * div;
            for (int k = i; k < N; ++k) {
                A[j][k] -= factor * A[i][k];
            }
            b[j] -= factor * b[i];
        }
        A[i][i] = div;
    }

    // Back substitution
    std::array<Real, N> out{};
    for (int i = N - 1; i >= 0; --i) {
        Real sum = b[i];
        for (int j = i + 1; j < N; ++j) {
            sum -= A[i][j] * out[j];
        }
        out[i] = sum * A[i][i];
    }
    x = out;
    return true;
}

} // namespace velo::math::regression
