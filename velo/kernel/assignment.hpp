#pragma once

#include "velo/core/type.hpp"
#include "velo/core/error.hpp"
#include "velo/core/macros.hpp"
#include "velo/kernel/kinetics.hpp"
#include "velo/math/stats.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

// =============================================================================
// FILE: velo/kernel/assignment.hpp
// BRIEF: Per-cell latent time and induction/repression state assignment
// =============================================================================

namespace velo::kernel::assignment {

namespace config {
    constexpr Size DEFAULT_N_TIMEPOINTS = 300;
}

// =============================================================================
// Switch State
// =============================================================================

// Boundary between the induction and repression branches: the switch time and
// the (u, s) point the repression branch starts from.
struct SwitchState {
    Real t_;
    Real u0_;
    Real s0_;

    // Point reached on the induction curve at t_
    static SwitchState from_time(Real t_, Real alpha, Real beta, Real gamma) noexcept {
        return SwitchState{
            t_,
            kinetics::unspliced(t_, Real(0), alpha, beta),
            kinetics::spliced(t_, Real(0), Real(0), alpha, beta, gamma)
        };
    }

    // Seeded boundary point; the switch time is the induction time of u0_
    static SwitchState from_state(Real u0_, Real s0_, Real alpha, Real beta) noexcept {
        return SwitchState{kinetics::tau_u(u0_, Real(0), alpha, beta), u0_, s0_};
    }
};

// =============================================================================
// Per-Cell Assignment
// =============================================================================

// t = tau for induction cells (o = 1), t = t_ + tau for repression cells (o = 0)
struct Assignment {
    std::vector<Real> t;
    std::vector<Real> tau;
    std::vector<Byte> o;

    void resize(Size n) {
        t.assign(n, Real(0));
        tau.assign(n, Real(0));
        o.assign(n, Byte(0));
    }

    [[nodiscard]] Size size() const noexcept { return t.size(); }

    // Rebuild t from tau and o around a new switch time
    void rebase(Real t_) {
        for (Size i = 0; i < t.size(); ++i) {
            t[i] = o[i] ? tau[i] : tau[i] + t_;
        }
    }

    // Derive tau and o from absolute times (o = t < t_)
    static Assignment from_times(Array<const Real> t, Real t_) {
        Assignment a;
        a.resize(t.len);
        for (Size i = 0; i < t.len; ++i) {
            const Real ti = t[static_cast<Index>(i)];
            const bool on = ti < t_;
            a.t[i] = ti;
            a.o[i] = on ? Byte(1) : Byte(0);
            a.tau[i] = on ? ti : ti - t_;
        }
        return a;
    }
};

// =============================================================================
// Branch Vectorization
// =============================================================================

// Initial condition and rate of the branch a cell at time t sits on
struct BranchPoint {
    Real tau;
    Real alpha;
    Real u0;
    Real s0;
    bool on;
};

VELO_FORCE_INLINE BranchPoint branch_point(Real t, const SwitchState& sw, Real alpha) noexcept {
    if (t < sw.t_) {
        return BranchPoint{t, alpha, Real(0), Real(0), true};
    }
    return BranchPoint{t - sw.t_, Real(0), sw.u0_, sw.s0_, false};
}

namespace detail {

VELO_FORCE_INLINE Real distance(Real du, Real ds) noexcept {
    return std::sqrt(du * du + ds * ds);
}

} // namespace detail

// =============================================================================
// Closed-Form Assignment
// =============================================================================

// Each cell is inverted onto both branches independently and takes the branch
// whose reconstruction lies closer in (u, s). Ties go to repression.
inline void assign_timepoints(
    Array<const Real> u,
    Array<const Real> s,
    Real alpha, Real beta, Real gamma,
    const SwitchState& sw,
    Assignment& out
) {
    VELO_CHECK_DIM(u.len == s.len, "assign_timepoints: u and s length mismatch");

    const Size n = u.len;
    out.resize(n);
    if (n == 0) return;

    std::vector<Real> tau_on(n);
    std::vector<Real> tau_off(n);

    Real off_max_pos = -std::numeric_limits<Real>::infinity();
    Real off_max_all = -std::numeric_limits<Real>::infinity();
    bool has_pos = false;

    for (Size i = 0; i < n; ++i) {
        const auto ii = static_cast<Index>(i);
        const Real tau = kinetics::tau_inv(u[ii], s[ii], Real(0), Real(0), alpha, beta, gamma);
        tau_on[i] = std::clamp(tau, Real(0), sw.t_);

        const Real tau_ = kinetics::tau_inv(u[ii], s[ii], sw.u0_, sw.s0_, Real(0), beta, gamma);
        tau_off[i] = tau_;
        if (tau_ > off_max_all) off_max_all = tau_;
        if (s[ii] > Real(0)) {
            has_pos = true;
            if (tau_ > off_max_pos) off_max_pos = tau_;
        }
    }

    const Real off_upper = has_pos ? off_max_pos : off_max_all;

    for (Size i = 0; i < n; ++i) {
        const auto ii = static_cast<Index>(i);
        const Real tau = tau_on[i];
        const Real tau_ = std::clamp(tau_off[i], Real(0), std::max(off_upper, Real(0)));

        const Real d_on = detail::distance(
            kinetics::unspliced(tau, Real(0), alpha, beta) - u[ii],
            kinetics::spliced(tau, Real(0), Real(0), alpha, beta, gamma) - s[ii]);
        const Real d_off = detail::distance(
            kinetics::unspliced(tau_, sw.u0_, Real(0), beta) - u[ii],
            kinetics::spliced(tau_, sw.s0_, sw.u0_, Real(0), beta, gamma) - s[ii]);

        const bool on = d_on < d_off;
        out.o[i] = on ? Byte(1) : Byte(0);
        out.tau[i] = on ? tau : tau_;
        out.t[i] = on ? tau : tau_ + sw.t_;
    }
}

// =============================================================================
// Projection Assignment
// =============================================================================

// Nearest point over n_timepoints samples of each branch. The repression grid
// spans [0, tau_u(min u with s > 0)] without its first point.
inline void assign_timepoints_projection(
    Array<const Real> u,
    Array<const Real> s,
    Real alpha, Real beta, Real gamma,
    const SwitchState& sw,
    Assignment& out,
    Size n_timepoints = config::DEFAULT_N_TIMEPOINTS
) {
    VELO_CHECK_DIM(u.len == s.len, "assign_timepoints_projection: u and s length mismatch");
    VELO_CHECK_ARG(n_timepoints >= 2, "assign_timepoints_projection: need at least 2 timepoints");

    const Size n = u.len;
    out.resize(n);
    if (n == 0) return;

    Real u_min = std::numeric_limits<Real>::infinity();
    Real u_min_all = std::numeric_limits<Real>::infinity();
    for (Size i = 0; i < n; ++i) {
        const auto ii = static_cast<Index>(i);
        u_min_all = std::min(u_min_all, u[ii]);
        if (s[ii] > Real(0)) u_min = std::min(u_min, u[ii]);
    }
    if (!std::isfinite(u_min)) u_min = u_min_all;

    const auto t_on = math::linspace(Real(0), sw.t_, n_timepoints);
    const Real tau_end = kinetics::tau_u(u_min, sw.u0_, Real(0), beta);
    auto t_off = math::linspace(Real(0), tau_end, n_timepoints);
    t_off.erase(t_off.begin());

    std::vector<Real> xu_on(t_on.size()), xs_on(t_on.size());
    for (Size k = 0; k < t_on.size(); ++k) {
        xu_on[k] = kinetics::unspliced(t_on[k], Real(0), alpha, beta);
        xs_on[k] = kinetics::spliced(t_on[k], Real(0), Real(0), alpha, beta, gamma);
    }
    std::vector<Real> xu_off(t_off.size()), xs_off(t_off.size());
    for (Size k = 0; k < t_off.size(); ++k) {
        xu_off[k] = kinetics::unspliced(t_off[k], sw.u0_, Real(0), beta);
        xs_off[k] = kinetics::spliced(t_off[k], sw.s0_, sw.u0_, Real(0), beta, gamma);
    }

    auto nearest = [](const std::vector<Real>& xu, const std::vector<Real>& xs,
                      Real ui, Real si, Real& best) {
        Size idx = 0;
        best = std::numeric_limits<Real>::infinity();
        for (Size k = 0; k < xu.size(); ++k) {
            const Real d = detail::distance(xu[k] - ui, xs[k] - si);
            if (d < best) {
                best = d;
                idx = k;
            }
        }
        return idx;
    };

    for (Size i = 0; i < n; ++i) {
        const auto ii = static_cast<Index>(i);
        Real d_on = Real(0);
        Real d_off = Real(0);
        const Size k_on = nearest(xu_on, xs_on, u[ii], s[ii], d_on);
        const Size k_off = nearest(xu_off, xs_off, u[ii], s[ii], d_off);

        const bool on = d_on < d_off;
        out.o[i] = on ? Byte(1) : Byte(0);
        out.tau[i] = on ? t_on[k_on] : t_off[k_off];
        out.t[i] = on ? out.tau[i] : sw.t_ + out.tau[i];
    }
}

} // namespace velo::kernel::assignment
