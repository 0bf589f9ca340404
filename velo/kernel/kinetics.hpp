#pragma once

#include "velo/core/type.hpp"
#include "velo/core/error.hpp"
#include "velo/core/macros.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

// =============================================================================
// FILE: velo/kernel/kinetics.hpp
// BRIEF: Closed-form two-state splicing kinetics and inverse-time solvers
// =============================================================================

namespace velo::kernel::kinetics {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    constexpr Real LOG_EPS = Real(1e-6);
    constexpr Real TAU_S_TOL = Real(1e-2);
    constexpr int TAU_S_MAX_ITER = 10;
    constexpr Real TAU_S_SHRINK = Real(10);
    constexpr Real TAU_S_PREV_INIT = Real(1e6);
}

// =============================================================================
// Guarded Primitives
// =============================================================================

// 1/x, or 0 when x == 0
VELO_FORCE_INLINE Real safe_inverse(Real x) noexcept {
    return (x != Real(0)) ? Real(1) / x : Real(0);
}

// log(clamp(x, eps, 1 - eps)); NaN passes through
VELO_FORCE_INLINE Real safe_log(Real x, Real eps = config::LOG_EPS) noexcept {
    if (std::isnan(x)) return x;
    return std::log(std::clamp(x, eps, Real(1) - eps));
}

namespace detail {

// NaN -> 0, +-inf -> largest finite value of the same sign
VELO_FORCE_INLINE Real nan_to_num(Real x) noexcept {
    if (std::isnan(x)) return Real(0);
    if (std::isinf(x)) {
        return x > 0 ? std::numeric_limits<Real>::max() : std::numeric_limits<Real>::lowest();
    }
    return x;
}

} // namespace detail

// =============================================================================
// Forward Solutions
// =============================================================================

VELO_FORCE_INLINE Real unspliced(Real tau, Real u0, Real alpha, Real beta) noexcept {
    const Real expu = std::exp(-beta * tau);
    return u0 * expu + alpha / beta * (Real(1) - expu);
}

VELO_FORCE_INLINE Real spliced(Real tau, Real s0, Real u0, Real alpha, Real beta, Real gamma) noexcept {
    const Real c = (alpha - u0 * beta) * safe_inverse(gamma - beta);
    const Real expu = std::exp(-beta * tau);
    const Real exps = std::exp(-gamma * tau);
    return s0 * exps + alpha / gamma * (Real(1) - exps) + c * (exps - expu);
}

// =============================================================================
// Inverse Solvers
// =============================================================================

// Time needed to relax from u0 to u under constant alpha
VELO_FORCE_INLINE Real tau_u(Real u, Real u0, Real alpha, Real beta) noexcept {
    const Real u_inf = alpha / beta;
    const Real ratio = (u - u_inf) * safe_inverse(u0 - u_inf);
    return -Real(1) / beta * safe_log(ratio);
}

// Joint (u, s) inversion through the linear combination that cancels the
// unspliced exponential
VELO_FORCE_INLINE Real tau_inv(
    Real u, Real s, Real u0, Real s0,
    Real alpha, Real beta, Real gamma
) noexcept {
    const Real beta_ = beta * safe_inverse(gamma - beta);
    const Real ceta_ = alpha / gamma - beta_ * (alpha / beta);

    const Real c0 = s0 - beta_ * u0 - ceta_;
    const Real cs = s - beta_ * u - ceta_;

    return -Real(1) / gamma * safe_log(cs * safe_inverse(c0));
}

// Iterative spliced inversion. tau holds the starting estimate on entry and
// the solution on exit. Each step solves the second-order expansion of
// spliced(tau) = s; alpha == 0 uses the first-order step instead. When no
// cell has a real root the whole estimate shrinks by TAU_S_SHRINK.
inline void tau_s(
    Array<const Real> s,
    Real s0, Real u0,
    Real alpha, Real beta, Real gamma,
    Array<Real> tau
) {
    VELO_CHECK_DIM(s.len == tau.len, "tau_s: s and tau length mismatch");

    const Size n = s.len;
    if (n == 0) return;

    const bool off_state = !(alpha > Real(0));
    const Real b0 = (alpha - beta * u0) * safe_inverse(gamma - beta);
    const Real g0 = s0 - alpha / gamma + b0;

    std::vector<Real> tau_prev(n, config::TAU_S_PREV_INIT);
    std::vector<Real> update(n);

    Real max_step = std::numeric_limits<Real>::infinity();
    Real residual = config::TAU_S_PREV_INIT;
    int n_iter = 0;

    auto max_abs_step = [&]() {
        Real m = Real(0);
        for (Size i = 0; i < n; ++i) {
            const Real d = std::abs(tau[static_cast<Index>(i)] - tau_prev[i]);
            if (d > m || std::isnan(d)) m = d;
        }
        return m;
    };

    max_step = max_abs_step();

    while (max_step > config::TAU_S_TOL && residual > config::TAU_S_TOL &&
           n_iter < config::TAU_S_MAX_ITER) {
        ++n_iter;
        bool any_root = false;

        for (Size i = 0; i < n; ++i) {
            const Real ti = tau[static_cast<Index>(i)];
            tau_prev[i] = ti;

            const Real expu = b0 * std::exp(-beta * ti);
            const Real exps = g0 * std::exp(-gamma * ti);
            const Real f = exps - expu + alpha / gamma;
            const Real ft = -gamma * exps + beta * expu;
            const Real ftt = gamma * gamma * exps - beta * beta * expu;

            // a x^2 + b x + c = 0 with x = tau - tau_prev
            const Real a = ftt / Real(2);
            const Real b = ft;
            const Real c = f - s[static_cast<Index>(i)];
            const Real term = b * b - Real(4) * a * c;
            if (term > Real(0)) any_root = true;

            if (off_state) {
                update[i] = -c / b;
            } else {
                update[i] = (-b + std::sqrt(term)) / (Real(2) * a);
            }
        }

        for (Size i = 0; i < n; ++i) {
            const auto ii = static_cast<Index>(i);
            if (any_root) {
                tau[ii] = (s[ii] != Real(0)) ? detail::nan_to_num(tau_prev[i] + update[i]) : Real(0);
            } else {
                tau[ii] = tau_prev[i] / config::TAU_S_SHRINK;
            }
        }

        residual = Real(0);
        for (Size i = 0; i < n; ++i) {
            const auto ii = static_cast<Index>(i);
            const Real r = std::abs(alpha / gamma + g0 * std::exp(-gamma * tau[ii])
                                    - b0 * std::exp(-beta * tau[ii]) - s[ii]);
            if (r > residual || std::isnan(r)) residual = r;
        }

        max_step = max_abs_step();
    }

    for (Size i = 0; i < n; ++i) {
        const auto ii = static_cast<Index>(i);
        if (tau[ii] < Real(0)) tau[ii] = Real(0);
    }
}

// Starts from the unspliced inversion of u
inline void tau_s(
    Array<const Real> s,
    Array<const Real> u,
    Real s0, Real u0,
    Real alpha, Real beta, Real gamma,
    Array<Real> tau
) {
    VELO_CHECK_DIM(s.len == u.len && s.len == tau.len, "tau_s: length mismatch");
    for (Size i = 0; i < u.len; ++i) {
        const auto ii = static_cast<Index>(i);
        tau[ii] = tau_u(u[ii], u0, alpha, beta);
    }
    tau_s(s, s0, u0, alpha, beta, gamma, tau);
}

// =============================================================================
// Array Forms
// =============================================================================

inline void unspliced(
    Array<const Real> tau, Real u0, Real alpha, Real beta, Array<Real> out
) {
    VELO_CHECK_DIM(tau.len == out.len, "unspliced: output length mismatch");
    for (Size i = 0; i < tau.len; ++i) {
        const auto ii = static_cast<Index>(i);
        out[ii] = unspliced(tau[ii], u0, alpha, beta);
    }
}

inline void spliced(
    Array<const Real> tau, Real s0, Real u0, Real alpha, Real beta, Real gamma, Array<Real> out
) {
    VELO_CHECK_DIM(tau.len == out.len, "spliced: output length mismatch");
    for (Size i = 0; i < tau.len; ++i) {
        const auto ii = static_cast<Index>(i);
        out[ii] = spliced(tau[ii], s0, u0, alpha, beta, gamma);
    }
}

} // namespace velo::kernel::kinetics
