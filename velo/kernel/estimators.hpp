#pragma once

#include "velo/core/type.hpp"
#include "velo/core/error.hpp"
#include "velo/core/macros.hpp"
#include "velo/core/vectorize.hpp"
#include "velo/kernel/kinetics.hpp"
#include "velo/kernel/assignment.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

// =============================================================================
// FILE: velo/kernel/estimators.hpp
// BRIEF: Closed-form least-squares updates for gamma, switch time, alpha and
//        scaling
// =============================================================================

namespace velo::kernel::estimators {

namespace detail {

// sum(c * x) / sum(c * c), 0 when every coefficient vanishes
inline Real scalar_lstsq(const std::vector<Real>& c, const std::vector<Real>& x) {
    Array<const Real> vc(c);
    Array<const Real> vx(x);
    const Real cx = vectorize::dot(vc, vx);
    const Real cc = vectorize::sum_squared(vc);
    return cx * kinetics::safe_inverse(cc);
}

} // namespace detail

// =============================================================================
// Linear Regression Through The Origin
// =============================================================================

// Slope of u ~ s without intercept
inline Real linreg(Array<const Real> u, Array<const Real> s) {
    VELO_CHECK_DIM(u.len == s.len, "linreg: u and s length mismatch");
    const Real us = vectorize::dot(u, s);
    const Real ss = vectorize::sum_squared(s);
    return us * kinetics::safe_inverse(ss);
}

// =============================================================================
// Switch Time
// =============================================================================

// Repression cells satisfy s - beta_ u = (s0_ - beta_ u0_) e^{-gamma tau}.
// Regressing that on -ceta_ e^{-gamma tau} gives e^{-gamma t_} - 1; values
// outside (-1, 0) fall back to the latest induction time.
inline Real find_switching_time(
    Array<const Real> u,
    Array<const Real> s,
    Array<const Real> tau,
    Array<const Byte> o,
    Real alpha, Real beta, Real gamma
) {
    VELO_CHECK_DIM(u.len == s.len && u.len == tau.len && u.len == o.len,
                   "find_switching_time: length mismatch");

    const Size n = u.len;
    if (n == 0) return std::numeric_limits<Real>::quiet_NaN();

    const Real beta_ = beta * kinetics::safe_inverse(gamma - beta);
    const Real ceta_ = alpha / gamma - beta_ * alpha / beta;

    std::vector<Real> x;
    std::vector<Real> y;
    Real tau_max_on = -std::numeric_limits<Real>::infinity();
    Real tau_max = -std::numeric_limits<Real>::infinity();
    bool has_on = false;

    for (Size i = 0; i < n; ++i) {
        const auto ii = static_cast<Index>(i);
        tau_max = std::max(tau_max, tau[ii]);
        if (o[ii]) {
            has_on = true;
            tau_max_on = std::max(tau_max_on, tau[ii]);
        } else {
            x.push_back(-ceta_ * std::exp(-gamma * tau[ii]));
            y.push_back(s[ii] - beta_ * u[ii]);
        }
    }

    if (x.empty()) return tau_max;

    const Real exp_t0 = detail::scalar_lstsq(x, y);
    if (exp_t0 > Real(-1) && exp_t0 < Real(0)) {
        return -Real(1) / gamma * std::log(exp_t0 + Real(1));
    }
    return has_on ? tau_max_on : tau_max;
}

// =============================================================================
// Transcription Rate
// =============================================================================

// Every (u, s) observation is linear in alpha once tau, o, beta and gamma are
// fixed. Repression cells inherit alpha through the switch point at
// t0_ = max(tau * o).
inline Real fit_alpha(
    Array<const Real> u,
    Array<const Real> s,
    Array<const Real> tau,
    Array<const Byte> o,
    Real beta, Real gamma
) {
    VELO_CHECK_DIM(u.len == s.len && u.len == tau.len && u.len == o.len,
                   "fit_alpha: length mismatch");

    const Size n = u.len;
    const Real inv_gb = kinetics::safe_inverse(gamma - beta);

    Real t0_ = Real(0);
    for (Size i = 0; i < n; ++i) {
        const auto ii = static_cast<Index>(i);
        if (o[ii]) t0_ = std::max(t0_, tau[ii]);
    }

    const Real expu0_ = std::exp(-beta * t0_);
    const Real exps0_ = std::exp(-gamma * t0_);
    const Real c_u0_ = (Real(1) - expu0_) / beta;
    const Real c_s0_ = (Real(1) - exps0_) / gamma + (exps0_ - expu0_) * inv_gb;

    std::vector<Real> c;
    std::vector<Real> x;
    c.reserve(2 * n);
    x.reserve(2 * n);

    for (Size i = 0; i < n; ++i) {
        const auto ii = static_cast<Index>(i);
        const Real expu = std::exp(-beta * tau[ii]);
        const Real exps = std::exp(-gamma * tau[ii]);

        if (o[ii]) {
            c.push_back((Real(1) - expu) / beta);
            x.push_back(u[ii]);
            c.push_back((Real(1) - exps) / gamma + (exps - expu) * inv_gb);
            x.push_back(s[ii]);
        } else {
            c.push_back(c_u0_ * expu);
            x.push_back(u[ii]);
            c.push_back(c_s0_ * exps - (Real(1) - expu0_) * (exps - expu) * inv_gb);
            x.push_back(s[ii]);
        }
    }

    return detail::scalar_lstsq(c, x);
}

// =============================================================================
// Scaling
// =============================================================================

// Factor by which u must be divided to match the modelled unspliced curve
inline Real fit_scaling(
    Array<const Real> u,
    Array<const Real> t,
    Real t_,
    Real alpha, Real beta
) {
    VELO_CHECK_DIM(u.len == t.len, "fit_scaling: u and t length mismatch");

    const Size n = u.len;
    const assignment::SwitchState sw{
        t_, kinetics::unspliced(t_, Real(0), alpha, beta), Real(0)};

    std::vector<Real> ut(n);
    for (Size i = 0; i < n; ++i) {
        const auto bp = assignment::branch_point(t[static_cast<Index>(i)], sw, alpha);
        ut[i] = kinetics::unspliced(bp.tau, bp.u0, bp.alpha, beta);
    }

    Array<const Real> vut(ut);
    return vectorize::dot(u, vut) * kinetics::safe_inverse(vectorize::sum_squared(vut));
}

} // namespace velo::kernel::estimators
