#pragma once

#include "velo/core/type.hpp"
#include "velo/core/error.hpp"
#include "velo/core/macros.hpp"
#include "velo/kernel/kinetics.hpp"
#include "velo/kernel/assignment.hpp"

#include <cmath>

// =============================================================================
// FILE: velo/kernel/derivatives.hpp
// BRIEF: Squared-residual objective and its analytic gradient
// =============================================================================
//
// Objective over cells i (weights w_i default to 1):
//
//   L = sum_i w_i * [ (u_model(t_i) - u_i / scaling)^2 + (s_model(t_i) - s_i)^2 ]
//
// The model point of a cell follows from its absolute time t_i and the switch
// time t_: induction cells (t_i < t_) start from the origin under alpha,
// repression cells start at the induction point reached at t_ with no
// transcription. That starting point depends on alpha, beta and gamma, so the
// repression gradient carries the total derivative through it.

namespace velo::kernel::derivatives {

struct Gradient {
    Real dalpha = Real(0);
    Real dbeta = Real(0);
    Real dgamma = Real(0);
    Real dt_ = Real(0);
};

namespace detail {

// Model value and first partials at (tau, u0, s0, a, beta, gamma)
struct Partials {
    Real u, s;
    Real du_u0, du_a, du_b, du_tau;
    Real ds_s0, ds_u0, ds_a, ds_b, ds_g, ds_tau;
};

VELO_FORCE_INLINE Partials partials(
    Real tau, Real u0, Real s0, Real a, Real beta, Real gamma
) noexcept {
    const Real eb = std::exp(-beta * tau);
    const Real eg = std::exp(-gamma * tau);
    const Real k = kinetics::safe_inverse(gamma - beta);
    const Real c = (a - beta * u0) * k;
    const Real d = eg - eb;

    Partials p;
    p.u = u0 * eb + a / beta * (Real(1) - eb);
    p.s = s0 * eg + a / gamma * (Real(1) - eg) + c * d;

    p.du_u0 = eb;
    p.du_a = (Real(1) - eb) / beta;
    p.du_b = -a / (beta * beta) * (Real(1) - eb) + (a / beta - u0) * tau * eb;
    p.du_tau = (a - beta * u0) * eb;

    p.ds_s0 = eg;
    p.ds_u0 = -beta * k * d;
    p.ds_a = (Real(1) - eg) / gamma + k * d;
    p.ds_b = (c * k - u0 * k) * d + c * tau * eb;
    p.ds_g = -s0 * tau * eg - a / (gamma * gamma) * (Real(1) - eg)
           + a / gamma * tau * eg - c * k * d - c * tau * eg;
    p.ds_tau = (a - gamma * s0) * eg - c * (gamma * eg - beta * eb);
    return p;
}

VELO_FORCE_INLINE Real weight_at(Array<const Real> w, Size i) noexcept {
    return w.empty() ? Real(1) : w[static_cast<Index>(i)];
}

inline void check_inputs(
    Array<const Real> u, Array<const Real> s, Array<const Real> t,
    Array<const Real> w, const char* where
) {
    VELO_CHECK_DIM(u.len == s.len && u.len == t.len, where);
    VELO_CHECK_DIM(w.empty() || w.len == u.len, where);
}

} // namespace detail

// =============================================================================
// Objective
// =============================================================================

inline Real squared_loss(
    Array<const Real> u,
    Array<const Real> s,
    Array<const Real> t,
    Real t_,
    Real alpha, Real beta, Real gamma, Real scaling,
    Array<const Real> weights = Array<const Real>()
) {
    detail::check_inputs(u, s, t, weights, "squared_loss: length mismatch");

    const auto sw = assignment::SwitchState::from_time(t_, alpha, beta, gamma);
    const Real inv_scaling = Real(1) / scaling;

    Real loss = Real(0);
    for (Size i = 0; i < u.len; ++i) {
        const auto ii = static_cast<Index>(i);
        const auto bp = assignment::branch_point(t[ii], sw, alpha);
        const Real ru = kinetics::unspliced(bp.tau, bp.u0, bp.alpha, beta) - u[ii] * inv_scaling;
        const Real rs = kinetics::spliced(bp.tau, bp.s0, bp.u0, bp.alpha, beta, gamma) - s[ii];
        loss += detail::weight_at(weights, i) * (ru * ru + rs * rs);
    }
    return loss;
}

// Residual vector behind squared_loss: out[i] is the unspliced and out[n + i]
// the spliced residual of cell i, each scaled by sqrt(w_i), so the sum of
// squares equals squared_loss.
inline void residuals(
    Array<const Real> u,
    Array<const Real> s,
    Array<const Real> t,
    Real t_,
    Real alpha, Real beta, Real gamma, Real scaling,
    Array<Real> out,
    Array<const Real> weights = Array<const Real>()
) {
    detail::check_inputs(u, s, t, weights, "residuals: length mismatch");
    VELO_CHECK_DIM(out.len == 2 * u.len, "residuals: output needs two entries per cell");

    const auto sw = assignment::SwitchState::from_time(t_, alpha, beta, gamma);
    const Real inv_scaling = Real(1) / scaling;
    const Size n = u.len;

    for (Size i = 0; i < n; ++i) {
        const auto ii = static_cast<Index>(i);
        const auto bp = assignment::branch_point(t[ii], sw, alpha);
        const Real w = std::sqrt(detail::weight_at(weights, i));
        out[ii] = w * (kinetics::unspliced(bp.tau, bp.u0, bp.alpha, beta) - u[ii] * inv_scaling);
        out[static_cast<Index>(n + i)] =
            w * (kinetics::spliced(bp.tau, bp.s0, bp.u0, bp.alpha, beta, gamma) - s[ii]);
    }
}

// =============================================================================
// Gradient
// =============================================================================

// Gradient of 0.5 * squared_loss with every t_i held fixed. dt_ moves the
// switch point with the cell times fixed, so repression cells shift in tau.
// When dtau is non-empty it receives the per-cell partial in tau.
inline Gradient loss_gradient(
    Array<const Real> u,
    Array<const Real> s,
    Array<const Real> t,
    Real t_,
    Real alpha, Real beta, Real gamma, Real scaling,
    Array<Real> dtau = Array<Real>(),
    Array<const Real> weights = Array<const Real>()
) {
    detail::check_inputs(u, s, t, weights, "loss_gradient: length mismatch");
    VELO_CHECK_DIM(dtau.empty() || dtau.len == u.len, "loss_gradient: dtau length mismatch");

    // Switch point and its sensitivities
    const auto p0 = detail::partials(t_, Real(0), Real(0), alpha, beta, gamma);
    const Real u0_ = p0.u;
    const Real s0_ = p0.s;
    const Real inv_scaling = Real(1) / scaling;

    Gradient g;
    for (Size i = 0; i < u.len; ++i) {
        const auto ii = static_cast<Index>(i);
        const Real w = detail::weight_at(weights, i);
        const bool on = t[ii] < t_;

        Real du_a, du_b, du_t_;
        Real ds_a, ds_b, ds_g, ds_t_;
        detail::Partials p;

        if (on) {
            p = detail::partials(t[ii], Real(0), Real(0), alpha, beta, gamma);
            du_a = p.du_a;
            du_b = p.du_b;
            du_t_ = Real(0);
            ds_a = p.ds_a;
            ds_b = p.ds_b;
            ds_g = p.ds_g;
            ds_t_ = Real(0);
        } else {
            p = detail::partials(t[ii] - t_, u0_, s0_, Real(0), beta, gamma);
            du_a = p.du_u0 * p0.du_a;
            du_b = p.du_b + p.du_u0 * p0.du_b;
            du_t_ = -p.du_tau + p.du_u0 * p0.du_tau;
            ds_a = p.ds_u0 * p0.du_a + p.ds_s0 * p0.ds_a;
            ds_b = p.ds_b + p.ds_u0 * p0.du_b + p.ds_s0 * p0.ds_b;
            ds_g = p.ds_g + p.ds_s0 * p0.ds_g;
            ds_t_ = -p.ds_tau + p.ds_u0 * p0.du_tau + p.ds_s0 * p0.ds_tau;
        }

        const Real ru = w * (p.u - u[ii] * inv_scaling);
        const Real rs = w * (p.s - s[ii]);

        g.dalpha += ru * du_a + rs * ds_a;
        g.dbeta += ru * du_b + rs * ds_b;
        g.dgamma += rs * ds_g;
        g.dt_ += ru * du_t_ + rs * ds_t_;

        if (!dtau.empty()) {
            dtau[ii] = ru * p.du_tau + rs * p.ds_tau;
        }
    }
    return g;
}

} // namespace velo::kernel::derivatives
