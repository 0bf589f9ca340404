#pragma once

#include "velo/core/type.hpp"
#include "velo/core/error.hpp"
#include "velo/core/log.hpp"
#include "velo/core/macros.hpp"
#include "velo/core/vectorize.hpp"
#include "velo/math/stats.hpp"
#include "velo/math/regression.hpp"
#include "velo/kernel/kinetics.hpp"
#include "velo/kernel/assignment.hpp"
#include "velo/kernel/estimators.hpp"
#include "velo/kernel/derivatives.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// =============================================================================
// FILE: velo/kernel/dynamics.hpp
// BRIEF: Per-gene dynamical model fit (alternating closed-form / gradient)
// =============================================================================

namespace velo::kernel::dynamics {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    constexpr int DEFAULT_MAX_ITER = 100;
    constexpr Real LEARNING_RATE_GRADIENT = Real(1e-6);
    constexpr Real LEARNING_RATE_ADAM = Real(1e-2);

    constexpr Real ADAM_BETA1 = Real(0.9);
    constexpr Real ADAM_BETA2 = Real(0.999);
    constexpr Real ADAM_EPS = Real(1e-8);

    constexpr Real OUTLIER_PERCENTILE = Real(99);
    constexpr Real SEED_PERCENTILE = Real(95);
    constexpr Real SCALING_HEADROOM = Real(1.3);

    constexpr Size LINE_SEARCH_POINTS = 5;
    constexpr Real LINE_SEARCH_SPAN = Real(0.1);
    constexpr Size SHUFFLE_POINTS = 5;
    constexpr Real SHUFFLE_SPAN = Real(0.5);

    // Marquardt damping factors tried in order by the joint step
    constexpr std::array<Real, 4> JOINT_DAMPING = {Real(1e-3), Real(1e-1), Real(1e1), Real(1e3)};

    constexpr Size STAGNATION_WINDOW = 5;
    constexpr int STAGNATION_MIN_ITER = 5;
    constexpr Real STAGNATION_TOL = Real(1e-3);

    // Reference loss when the trace is still empty
    constexpr Real EMPTY_TRACE_LOSS = Real(1e6);

    // Gradient steps never drive a rate below this
    constexpr Real RATE_FLOOR = Real(1e-8);
}

// =============================================================================
// Enums
// =============================================================================

enum class UpdateMethod {
    GradientDescent,
    Adam
};

enum class AssignmentMode {
    ClosedForm,
    Projection
};

enum class FitStatus {
    Uninitialized,
    Initialized,
    Iterating,
    Converged,
    Exhausted
};

inline const char* status_name(FitStatus status) noexcept {
    switch (status) {
        case FitStatus::Uninitialized: return "uninitialized";
        case FitStatus::Initialized:   return "initialized";
        case FitStatus::Iterating:     return "iterating";
        case FitStatus::Converged:     return "converged";
        case FitStatus::Exhausted:     return "exhausted";
    }
    return "unknown";
}

// =============================================================================
// Fit Configuration
// =============================================================================

struct FitConfig {
    int max_iter = config::DEFAULT_MAX_ITER;
    UpdateMethod method = UpdateMethod::GradientDescent;
    std::optional<Real> learning_rate;
    std::optional<bool> clip_loss;
    AssignmentMode assignment = AssignmentMode::ClosedForm;
    Size n_timepoints = velo::kernel::assignment::config::DEFAULT_N_TIMEPOINTS;

    [[nodiscard]] Real resolved_learning_rate() const noexcept {
        if (learning_rate) return *learning_rate;
        return method == UpdateMethod::Adam ? config::LEARNING_RATE_ADAM
                                            : config::LEARNING_RATE_GRADIENT;
    }

    [[nodiscard]] bool resolved_clip_loss() const noexcept {
        if (clip_loss) return *clip_loss;
        return method != UpdateMethod::Adam;
    }

    void validate() const {
        VELO_CHECK_ARG(max_iter >= 0, "FitConfig: max_iter must be non-negative");
        VELO_CHECK_ARG(!learning_rate || (*learning_rate > Real(0) && std::isfinite(*learning_rate)),
                       "FitConfig: learning_rate must be positive and finite");
        VELO_CHECK_ARG(assignment != AssignmentMode::Projection || n_timepoints >= 2,
                       "FitConfig: projection needs at least 2 timepoints");
    }
};

// =============================================================================
// Gene Observation
// =============================================================================

// Abundances of one gene across cells plus the mask of cells used in the fit.
// A cell is fitted when both raw channels are non-zero and both (possibly
// smoothed) channels lie strictly below their 99th percentile over non-zero
// raw cells.
struct GeneObservation {
    std::vector<Real> u;
    std::vector<Real> s;
    std::vector<Byte> weights;

    [[nodiscard]] Size n_cells() const noexcept { return u.size(); }

    [[nodiscard]] Size n_fit() const noexcept {
        return static_cast<Size>(std::count(weights.begin(), weights.end(), Byte(1)));
    }

    // Empty raw views mean the fitted channels are the raw ones
    static GeneObservation build(
        Array<const Real> u,
        Array<const Real> s,
        Array<const Real> u_raw = Array<const Real>(),
        Array<const Real> s_raw = Array<const Real>()
    ) {
        VELO_CHECK_DIM(u.len == s.len, "GeneObservation: u and s length mismatch");
        if (u_raw.empty()) u_raw = u;
        if (s_raw.empty()) s_raw = s;
        VELO_CHECK_DIM(u_raw.len == u.len && s_raw.len == s.len,
                       "GeneObservation: raw channel length mismatch");

        const Size n = u.len;
        GeneObservation obs;
        obs.u.assign(u.begin(), u.end());
        obs.s.assign(s.begin(), s.end());
        obs.weights.assign(n, Byte(0));

        std::vector<Real> s_nz;
        std::vector<Real> u_nz;
        for (Size i = 0; i < n; ++i) {
            const auto ii = static_cast<Index>(i);
            if (s_raw[ii] > Real(0)) s_nz.push_back(s[ii]);
            if (u_raw[ii] > Real(0)) u_nz.push_back(u[ii]);
        }

        const Real s_hi = math::percentile(Array<const Real>(s_nz), config::OUTLIER_PERCENTILE);
        const Real u_hi = math::percentile(Array<const Real>(u_nz), config::OUTLIER_PERCENTILE);

        for (Size i = 0; i < n; ++i) {
            const auto ii = static_cast<Index>(i);
            const bool s_ok = s_raw[ii] > Real(0) && s[ii] < s_hi;
            const bool u_ok = u_raw[ii] > Real(0) && u[ii] < u_hi;
            obs.weights[i] = (s_ok && u_ok) ? Byte(1) : Byte(0);
        }
        return obs;
    }
};

// =============================================================================
// Parameters & Trace
// =============================================================================

struct KineticParameters {
    Real alpha = std::numeric_limits<Real>::quiet_NaN();
    Real beta = Real(1);
    Real gamma = std::numeric_limits<Real>::quiet_NaN();
    Real t_ = std::numeric_limits<Real>::quiet_NaN();
    Real scaling = std::numeric_limits<Real>::quiet_NaN();

    // [alpha, beta, gamma, t_, scaling]
    [[nodiscard]] std::array<Real, 5> snapshot() const noexcept {
        return {alpha, beta, gamma, t_, scaling};
    }

    [[nodiscard]] bool finite() const noexcept {
        return std::isfinite(alpha) && std::isfinite(beta) && std::isfinite(gamma)
            && std::isfinite(t_) && std::isfinite(scaling);
    }

    [[nodiscard]] bool any_nan() const noexcept {
        return std::isnan(alpha) || std::isnan(beta) || std::isnan(gamma)
            || std::isnan(t_) || std::isnan(scaling);
    }
};

// One entry per loss evaluation that went through the acceptance gate
struct OptimizationTrace {
    std::vector<Real> loss;
    std::vector<std::array<Real, 5>> pars;

    void append(const KineticParameters& p, Real value) {
        pars.push_back(p.snapshot());
        loss.push_back(value);
    }

    [[nodiscard]] Size size() const noexcept { return loss.size(); }
    [[nodiscard]] bool empty() const noexcept { return loss.empty(); }

    [[nodiscard]] Real last() const noexcept {
        return loss.empty() ? config::EMPTY_TRACE_LOSS : loss.back();
    }

    // Largest of the last n entries
    [[nodiscard]] Real recent_max(Size n) const noexcept {
        const Size k = std::min(n, loss.size());
        Real m = -std::numeric_limits<Real>::infinity();
        for (Size i = loss.size() - k; i < loss.size(); ++i) m = std::max(m, loss[i]);
        return m;
    }
};

// =============================================================================
// Update Rules
// =============================================================================

struct RateStep {
    Real alpha;
    Real beta;
    Real gamma;
};

class UpdateRule {
public:
    virtual ~UpdateRule() = default;

    // Candidate rates from the current rates and the loss gradient
    virtual RateStep propose_update(const KineticParameters& p, const derivatives::Gradient& g) = 0;

    [[nodiscard]] virtual UpdateMethod method() const noexcept = 0;
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

class GradientDescent final : public UpdateRule {
public:
    explicit GradientDescent(Real learning_rate) : lr_(learning_rate) {}

    RateStep propose_update(const KineticParameters& p, const derivatives::Gradient& g) override {
        return RateStep{p.alpha - lr_ * g.dalpha, p.beta - lr_ * g.dbeta, p.gamma - lr_ * g.dgamma};
    }

    [[nodiscard]] UpdateMethod method() const noexcept override { return UpdateMethod::GradientDescent; }
    [[nodiscard]] const char* name() const noexcept override { return "gradient"; }

private:
    Real lr_;
};

// Running first/second moments of the (alpha, beta, gamma) gradient, one
// column per step, starting from a single zero column
struct AdamMoments {
    std::vector<std::array<Real, 3>> grads{{Real(0), Real(0), Real(0)}};
    std::vector<std::array<Real, 3>> m{{Real(0), Real(0), Real(0)}};
    std::vector<std::array<Real, 3>> v{{Real(0), Real(0), Real(0)}};

    [[nodiscard]] Size steps() const noexcept { return m.size(); }
};

class Adam final : public UpdateRule {
public:
    explicit Adam(Real learning_rate) : lr_(learning_rate) {}

    RateStep propose_update(const KineticParameters& p, const derivatives::Gradient& g) override {
        using namespace config;
        const std::array<Real, 3> d{g.dalpha, g.dbeta, g.dgamma};
        const auto& m_prev = moments_.m.back();
        const auto& v_prev = moments_.v.back();

        std::array<Real, 3> m{};
        std::array<Real, 3> v{};
        for (Size k = 0; k < 3; ++k) {
            m[k] = ADAM_BETA1 * m_prev[k] + (Real(1) - ADAM_BETA1) * d[k];
            v[k] = ADAM_BETA2 * v_prev[k] + (Real(1) - ADAM_BETA2) * d[k] * d[k];
        }

        moments_.grads.push_back(d);
        moments_.m.push_back(m);
        moments_.v.push_back(v);

        const auto t = static_cast<Real>(moments_.steps());
        const Real c1 = Real(1) - std::pow(ADAM_BETA1, t);
        const Real c2 = Real(1) - std::pow(ADAM_BETA2, t);

        std::array<Real, 3> step{};
        for (Size k = 0; k < 3; ++k) {
            step[k] = lr_ * (m[k] / c1) / (std::sqrt(v[k] / c2) + ADAM_EPS);
        }
        return RateStep{p.alpha - step[0], p.beta - step[1], p.gamma - step[2]};
    }

    [[nodiscard]] UpdateMethod method() const noexcept override { return UpdateMethod::Adam; }
    [[nodiscard]] const char* name() const noexcept override { return "adam"; }

    [[nodiscard]] const AdamMoments& moments() const noexcept { return moments_; }

private:
    Real lr_;
    AdamMoments moments_;
};

inline std::unique_ptr<UpdateRule> make_update_rule(const FitConfig& cfg) {
    switch (cfg.method) {
        case UpdateMethod::Adam:
            return std::make_unique<Adam>(cfg.resolved_learning_rate());
        case UpdateMethod::GradientDescent:
            return std::make_unique<GradientDescent>(cfg.resolved_learning_rate());
    }
    throw ValueError("make_update_rule: unknown update method");
}

// =============================================================================
// Proposal
// =============================================================================

// Candidate change to the fit state. Unset fields keep their current value.
// With reassign_time the cells are reassigned under the candidate rates,
// using t_ when given and the regression switch time otherwise. An explicit
// times assignment must come with the t_ it was built for. A t_ alone
// implies reassignment.
struct Proposal {
    std::optional<Real> t_;
    std::optional<Real> alpha;
    std::optional<Real> beta;
    std::optional<Real> gamma;
    std::optional<Real> scaling;
    std::optional<assignment::Assignment> times;
    bool reassign_time = false;
    bool clip_loss = true;
};

namespace detail {

template <typename T>
std::vector<T> gather(const std::vector<T>& x, const std::vector<Byte>& mask) {
    std::vector<T> out;
    out.reserve(x.size());
    for (Size i = 0; i < x.size(); ++i) {
        if (mask[i]) out.push_back(x[i]);
    }
    return out;
}

inline std::vector<Real> scaled(const std::vector<Real>& x, Real scaling) {
    std::vector<Real> out(x.size());
    const Real inv = Real(1) / scaling;
    for (Size i = 0; i < x.size(); ++i) out[i] = x[i] * inv;
    return out;
}

// x * (1 + linspace(-span, span, n))
inline std::vector<Real> relative_grid(Real x, Real span, Size n) {
    auto offsets = math::linspace(-span, span, n);
    for (auto& v : offsets) v = x + v * x;
    return offsets;
}

} // namespace detail

// =============================================================================
// Gene Fit
// =============================================================================

// Owns the complete fit state of one gene. Not shared across threads.
class GeneFit {
public:
    explicit GeneFit(GeneObservation obs, FitConfig cfg = FitConfig())
        : obs_(std::move(obs))
        , cfg_(std::move(cfg))
    {
        cfg_.validate();
        VELO_CHECK_DIM(obs_.u.size() == obs_.s.size() && obs_.u.size() == obs_.weights.size(),
                       "GeneFit: observation channels differ in length");
        rule_ = make_update_rule(cfg_);
        u_w_ = detail::gather(obs_.u, obs_.weights);
        s_w_ = detail::gather(obs_.s, obs_.weights);
    }

    // -------------------------------------------------------------------------
    // Initialization
    // -------------------------------------------------------------------------

    // Heuristic seed from abundance ratios and 95th percentile cells, followed
    // by one closed-form sweep and a joint alpha/scaling refinement
    void initialize() {
        VELO_CHECK_ARG(status_ == FitStatus::Uninitialized, "GeneFit: already initialized");

        if (u_w_.empty()) {
            mark_degenerate("no cell passes the observation mask");
            return;
        }

        const Real u_sum = vectorize::sum(Array<const Real>(obs_.u));
        const Real s_sum = vectorize::sum(Array<const Real>(obs_.s));
        Real scaling = u_sum / s_sum * config::SCALING_HEADROOM;
        if (!std::isfinite(scaling) || scaling <= Real(0)) {
            VELO_LOG_WARN("initial scaling %g is unusable, falling back to 1",
                          static_cast<double>(scaling));
            scaling = Real(1);
        }

        const auto u_w = detail::scaled(u_w_, scaling);
        const auto& s_w = s_w_;

        // gamma from the extreme spliced cells with beta = 1
        const Real s_hi = math::percentile(Array<const Real>(s_w), config::SEED_PERCENTILE);
        std::vector<Real> u_sel;
        std::vector<Real> s_sel;
        for (Size i = 0; i < s_w.size(); ++i) {
            if (s_w[i] >= s_hi) {
                u_sel.push_back(u_w[i]);
                s_sel.push_back(s_w[i]);
            }
        }
        const Real beta = Real(1);
        const Real gamma = estimators::linreg(Array<const Real>(u_sel), Array<const Real>(s_sel));

        // alpha and the switch point from the extreme unspliced cells
        const Real u_hi = math::percentile(Array<const Real>(u_w), config::SEED_PERCENTILE);
        u_sel.clear();
        s_sel.clear();
        for (Size i = 0; i < u_w.size(); ++i) {
            if (u_w[i] >= u_hi) {
                u_sel.push_back(u_w[i]);
                s_sel.push_back(s_w[i]);
            }
        }
        const Real alpha = math::mean(Array<const Real>(u_sel));
        const Real u0_ = alpha;
        const Real s0_ = math::mean(Array<const Real>(s_sel));

        const auto sw = assignment::SwitchState::from_state(u0_, s0_, alpha, beta);
        const auto u_all = detail::scaled(obs_.u, scaling);
        times_ = assign_with(u_all, alpha, beta, gamma, sw);

        Real t_ = Real(0);
        for (Size i = 0; i < times_.size(); ++i) {
            if (times_.o[i]) t_ = std::max(t_, times_.tau[i]);
        }
        times_.rebase(t_);

        pars_ = KineticParameters{alpha, beta, gamma, t_, scaling};
        trace_.append(pars_, evaluate(pars_, times_));
        status_ = FitStatus::Initialized;

        update_state_dependent();
        update_scaling();
    }

    // Resume from persisted parameters and, when non-empty, persisted cell
    // times. Any NaN parameter falls back to initialize().
    void load(const KineticParameters& pars, Array<const Real> t = Array<const Real>()) {
        VELO_CHECK_ARG(status_ == FitStatus::Uninitialized, "GeneFit: already initialized");
        VELO_CHECK_DIM(t.empty() || t.len == obs_.n_cells(), "GeneFit: persisted time length mismatch");

        if (pars.any_nan()) {
            initialize();
            return;
        }
        if (u_w_.empty()) {
            mark_degenerate("no cell passes the observation mask");
            return;
        }

        pars_ = pars;
        if (!t.empty()) {
            times_ = assignment::Assignment::from_times(t, pars_.t_);
        } else {
            times_ = assign_all(pars_.t_, pars_.alpha, pars_.beta, pars_.gamma, pars_.scaling);
        }

        trace_.append(pars_, evaluate(pars_, times_));
        status_ = FitStatus::Initialized;
        update_state_dependent();
    }

    // -------------------------------------------------------------------------
    // Optimization Loop
    // -------------------------------------------------------------------------

    // Alternates gradient steps with closed-form sweeps. A plateau over the
    // last 5 losses triggers shuffle_pars; its failure ends the fit as
    // Converged. Running out of iterations ends it as Exhausted.
    FitStatus fit() {
        if (status_ == FitStatus::Uninitialized) initialize();
        if (status_ != FitStatus::Initialized) return status_;

        const int max_iter = cfg_.max_iter;
        if (max_iter <= 1) {
            status_ = FitStatus::Exhausted;
            return status_;
        }

        status_ = FitStatus::Iterating;
        const int idx_update = std::max(max_iter / 10, 1);
        bool improved = true;

        for (int i = 0; i < max_iter; ++i) {
            update_vars();

            if (improved || (i % idx_update == 1) || i == max_iter - 1) {
                improved = update_state_dependent();
            }

            if (i > config::STAGNATION_MIN_ITER) {
                const Real loss_prev = trace_.recent_max(config::STAGNATION_WINDOW);
                const Real loss = trace_.last();
                if (loss_prev - loss < loss_prev * config::STAGNATION_TOL) {
                    improved = shuffle_pars();
                    if (!improved) {
                        status_ = FitStatus::Converged;
                        return status_;
                    }
                }
            }
        }

        status_ = FitStatus::Exhausted;
        return status_;
    }

    // Switch time, alpha and scaling from their closed forms, each refined by
    // a 5-point line search within 10 percent, then one joint step. A line
    // search stops at its first accepted candidate.
    bool update_state_dependent() {
        require_active("update_state_dependent");

        const auto u_w = detail::scaled(u_w_, pars_.scaling);
        const auto& s_w = s_w_;

        bool improved_tau = false;
        {
            const auto tau_w = detail::gather(times_.tau, obs_.weights);
            const auto o_w = detail::gather(times_.o, obs_.weights);
            const Real t0 = estimators::find_switching_time(
                Array<const Real>(u_w), Array<const Real>(s_w), Array<const Real>(tau_w),
                Array<const Byte>(o_w), pars_.alpha, pars_.beta, pars_.gamma);

            for (Real t0_val : detail::relative_grid(t0, config::LINE_SEARCH_SPAN, config::LINE_SEARCH_POINTS)) {
                if (improved_tau) break;
                Proposal p;
                p.t_ = t0_val;
                p.reassign_time = true;
                improved_tau = update_loss(p);
            }
        }

        bool improved_alpha = false;
        {
            const auto tau_w = detail::gather(times_.tau, obs_.weights);
            const auto o_w = detail::gather(times_.o, obs_.weights);
            const Real alpha = estimators::fit_alpha(
                Array<const Real>(u_w), Array<const Real>(s_w), Array<const Real>(tau_w),
                Array<const Byte>(o_w), pars_.beta, pars_.gamma);

            for (Real alpha_val : detail::relative_grid(alpha, config::LINE_SEARCH_SPAN, config::LINE_SEARCH_POINTS)) {
                if (improved_alpha) break;
                Proposal p;
                p.alpha = alpha_val;
                p.reassign_time = true;
                improved_alpha = update_loss(p);
            }
        }

        bool improved_scaling = false;
        {
            const auto t_w = detail::gather(times_.t, obs_.weights);
            const Real factor = estimators::fit_scaling(
                Array<const Real>(u_w), Array<const Real>(t_w), pars_.t_, pars_.alpha, pars_.beta);
            Proposal p;
            p.scaling = factor * pars_.scaling;
            p.reassign_time = true;
            improved_scaling = update_loss(p);
        }

        const bool improved_joint = update_joint();

        return improved_tau || improved_alpha || improved_scaling || improved_joint;
    }

    // Damped Gauss-Newton step on (alpha, gamma, t_, scaling). The one
    // dimensional sweeps cannot follow the narrow valley these four span
    // together. Sensitivities are forward differences of the residuals with
    // every cell reassigned, so cells follow the curve as it moves. Damping
    // factors are tried in order until one step is accepted.
    bool update_joint() {
        require_active("update_joint");

        constexpr int N = 4;
        const auto r0 = residuals_of(pars_, times_);
        const Real h_rel = std::sqrt(std::numeric_limits<Real>::epsilon());

        std::array<std::vector<Real>, N> jac;
        for (int k = 0; k < N; ++k) {
            KineticParameters q = pars_;
            Real& x = *joint_coords(q)[k];
            const Real h = h_rel * std::max(std::abs(x), Real(1));
            x += h;
            auto r = residuals_of(q, assign_all(q.t_, q.alpha, q.beta, q.gamma, q.scaling));
            for (Size i = 0; i < r.size(); ++i) r[i] = (r[i] - r0[i]) / h;
            jac[k] = std::move(r);
        }

        std::array<std::array<Real, N>, N> jtj{};
        std::array<Real, N> jtr{};
        for (int a = 0; a < N; ++a) {
            const Array<const Real> ja(jac[a]);
            jtr[a] = vectorize::dot(ja, Array<const Real>(r0));
            for (int b = a; b < N; ++b) {
                jtj[a][b] = vectorize::dot(ja, Array<const Real>(jac[b]));
                jtj[b][a] = jtj[a][b];
            }
        }

        for (Real lambda : config::JOINT_DAMPING) {
            auto lhs = jtj;
            std::array<Real, N> rhs{};
            for (int k = 0; k < N; ++k) {
                lhs[k][k] *= Real(1) + lambda;
                rhs[k] = -jtr[k];
            }
            std::array<Real, N> d{};
            if (!math::regression::solve_linear_system<N>(lhs, rhs, d)) {
                VELO_LOG_DEBUG("joint step skipped: singular normal equations");
                return false;
            }

            Proposal p;
            p.alpha = std::max(pars_.alpha + d[0], config::RATE_FLOOR);
            p.gamma = std::max(pars_.gamma + d[1], config::RATE_FLOOR);
            p.t_ = std::max(pars_.t_ + d[2], config::RATE_FLOOR);
            p.scaling = std::max(pars_.scaling + d[3], config::RATE_FLOOR);
            p.reassign_time = true;
            if (update_loss(p)) return true;
        }
        return false;
    }

    // Joint refit of alpha then scaling over all cells, each with a fresh
    // switch time and assignment
    bool update_scaling() {
        require_active("update_scaling");

        const auto u = detail::scaled(obs_.u, pars_.scaling);
        const Array<const Real> vu(u);
        const Array<const Real> vs(obs_.s);
        const Real beta = pars_.beta;
        const Real gamma = pars_.gamma;
        const Real t_prev = pars_.t_;

        const Real alpha = estimators::fit_alpha(
            vu, vs, Array<const Real>(times_.tau), Array<const Byte>(times_.o), beta, gamma);
        Real t0 = estimators::find_switching_time(
            vu, vs, Array<const Real>(times_.tau), Array<const Byte>(times_.o), alpha, beta, gamma);
        auto times = assign_with(u, alpha, beta, gamma,
                                 assignment::SwitchState::from_time(t0, alpha, beta, gamma));

        Proposal pa;
        pa.t_ = t0;
        pa.alpha = alpha;
        pa.times = times;
        const bool improved_alpha = update_loss(pa);

        const Real scaling = estimators::fit_scaling(
            vu, Array<const Real>(times.t), t_prev, alpha, beta) * pars_.scaling;
        t0 = estimators::find_switching_time(
            vu, vs, Array<const Real>(times.tau), Array<const Byte>(times.o), alpha, beta, gamma);
        auto times2 = assign_with(u, alpha, beta, gamma,
                                  assignment::SwitchState::from_time(t0, alpha, beta, gamma));

        Proposal ps;
        ps.t_ = t0;
        ps.scaling = scaling;
        ps.times = std::move(times2);
        const bool improved_scaling = update_loss(ps);

        return improved_alpha || improved_scaling;
    }

    // One gradient step on (alpha, beta, gamma) with cell times held fixed
    bool update_vars() {
        require_active("update_vars");

        const auto t_w = detail::gather(times_.t, obs_.weights);
        const auto g = derivatives::loss_gradient(
            Array<const Real>(u_w_), Array<const Real>(s_w_), Array<const Real>(t_w),
            pars_.t_, pars_.alpha, pars_.beta, pars_.gamma, pars_.scaling);

        const auto step = rule_->propose_update(pars_, g);

        Proposal p;
        p.alpha = std::max(step.alpha, config::RATE_FLOOR);
        p.beta = std::max(step.beta, config::RATE_FLOOR);
        p.gamma = std::max(step.gamma, config::RATE_FLOOR);
        p.clip_loss = cfg_.resolved_clip_loss();
        return update_loss(p);
    }

    // Accept-if-improves gate. Every call appends one trace entry: the
    // candidate loss when accepted, the previous loss otherwise. A non-finite
    // candidate loss is never accepted.
    bool update_loss(const Proposal& p) {
        require_active("update_loss");

        // A non-finite reference never blocks a finite candidate
        Real loss_prev = trace_.last();
        if (!std::isfinite(loss_prev)) loss_prev = std::numeric_limits<Real>::infinity();

        KineticParameters cand;
        assignment::Assignment scratch;
        const assignment::Assignment* times = nullptr;
        const Real loss = candidate_loss(p, cand, scratch, times);

        bool accept = std::isfinite(loss) && (!p.clip_loss || loss < loss_prev);
        if (!std::isfinite(loss)) {
            VELO_LOG_DEBUG("rejecting candidate with non-finite loss (alpha=%g beta=%g gamma=%g t_=%g scaling=%g)",
                           static_cast<double>(cand.alpha), static_cast<double>(cand.beta),
                           static_cast<double>(cand.gamma), static_cast<double>(cand.t_),
                           static_cast<double>(cand.scaling));
        }

        if (accept) {
            if (times == &scratch) {
                times_ = std::move(scratch);
            } else if (times != &times_) {
                times_ = *times;
            }
            pars_ = cand;
        }

        trace_.append(pars_, accept ? loss : trace_.last());
        return accept;
    }

    // 5 x 5 grid over alpha and gamma within 50 percent, each point with a
    // fresh assignment. The best point goes through the acceptance gate.
    bool shuffle_pars() {
        require_active("shuffle_pars");

        const auto alpha_vals = detail::relative_grid(pars_.alpha, config::SHUFFLE_SPAN, config::SHUFFLE_POINTS);
        const auto gamma_vals = detail::relative_grid(pars_.gamma, config::SHUFFLE_SPAN, config::SHUFFLE_POINTS);
        const Size center = config::SHUFFLE_POINTS / 2;

        Real best = std::numeric_limits<Real>::infinity();
        Size ix = center;
        Size iy = center;

        for (Size i = 0; i < alpha_vals.size(); ++i) {
            for (Size j = 0; j < gamma_vals.size(); ++j) {
                Proposal p;
                p.alpha = alpha_vals[i];
                p.gamma = gamma_vals[j];
                p.reassign_time = true;
                const Real z = loss(p);
                if (z < best) {
                    best = z;
                    ix = i;
                    iy = j;
                }
            }
        }

        if (!std::isfinite(best)) {
            trace_.append(pars_, trace_.last());
            return false;
        }

        Proposal p;
        p.alpha = alpha_vals[ix];
        p.gamma = gamma_vals[iy];
        p.reassign_time = true;
        return update_loss(p);
    }

    // Loss the proposal would reach, without committing it
    [[nodiscard]] Real loss(const Proposal& p) const {
        KineticParameters cand;
        assignment::Assignment scratch;
        const assignment::Assignment* times = nullptr;
        return candidate_loss(p, cand, scratch, times);
    }

    // Loss of the current state
    [[nodiscard]] Real loss() const {
        return evaluate(pars_, times_);
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] const GeneObservation& observation() const noexcept { return obs_; }
    [[nodiscard]] const FitConfig& fit_config() const noexcept { return cfg_; }
    [[nodiscard]] const KineticParameters& parameters() const noexcept { return pars_; }
    [[nodiscard]] const assignment::Assignment& times() const noexcept { return times_; }
    [[nodiscard]] const OptimizationTrace& trace() const noexcept { return trace_; }
    [[nodiscard]] FitStatus status() const noexcept { return status_; }
    [[nodiscard]] const UpdateRule& update_rule() const noexcept { return *rule_; }

private:
    void require_active(const char* where) const {
        if (VELO_UNLIKELY(status_ == FitStatus::Uninitialized)) {
            throw ValueError(std::string(where) + ": fit is not initialized");
        }
        if (VELO_UNLIKELY(!pars_.finite() && u_w_.empty())) {
            throw ValueError(std::string(where) + ": gene has no fitted cells");
        }
    }

    void mark_degenerate(const char* reason) {
        VELO_LOG_WARN("gene fit skipped: %s", reason);
        pars_ = KineticParameters{};
        pars_.beta = std::numeric_limits<Real>::quiet_NaN();
        times_.resize(obs_.n_cells());
        std::fill(times_.t.begin(), times_.t.end(), std::numeric_limits<Real>::quiet_NaN());
        std::fill(times_.tau.begin(), times_.tau.end(), std::numeric_limits<Real>::quiet_NaN());
        status_ = FitStatus::Exhausted;
    }

    assignment::Assignment assign_with(
        const std::vector<Real>& u_scaled,
        Real alpha, Real beta, Real gamma,
        const assignment::SwitchState& sw
    ) const {
        assignment::Assignment out;
        if (cfg_.assignment == AssignmentMode::Projection) {
            assignment::assign_timepoints_projection(
                Array<const Real>(u_scaled), Array<const Real>(obs_.s),
                alpha, beta, gamma, sw, out, cfg_.n_timepoints);
        } else {
            assignment::assign_timepoints(
                Array<const Real>(u_scaled), Array<const Real>(obs_.s),
                alpha, beta, gamma, sw, out);
        }
        return out;
    }

    // Assignment of every cell for switch time t_
    assignment::Assignment assign_all(Real t_, Real alpha, Real beta, Real gamma, Real scaling) const {
        return assign_with(detail::scaled(obs_.u, scaling), alpha, beta, gamma,
                           assignment::SwitchState::from_time(t_, alpha, beta, gamma));
    }

    // Regression switch time on the current partition under candidate rates
    Real optimal_switch(Real alpha, Real beta, Real gamma, Real scaling) const {
        const auto u_w = detail::scaled(u_w_, scaling);
        const auto tau_w = detail::gather(times_.tau, obs_.weights);
        const auto o_w = detail::gather(times_.o, obs_.weights);
        return estimators::find_switching_time(
            Array<const Real>(u_w), Array<const Real>(s_w_), Array<const Real>(tau_w),
            Array<const Byte>(o_w), alpha, beta, gamma);
    }

    // Coordinates moved by update_joint
    static std::array<Real*, 4> joint_coords(KineticParameters& p) noexcept {
        return {&p.alpha, &p.gamma, &p.t_, &p.scaling};
    }

    std::vector<Real> residuals_of(const KineticParameters& p, const assignment::Assignment& times) const {
        const auto t_w = detail::gather(times.t, obs_.weights);
        std::vector<Real> r(2 * u_w_.size());
        derivatives::residuals(
            Array<const Real>(u_w_), Array<const Real>(s_w_), Array<const Real>(t_w),
            p.t_, p.alpha, p.beta, p.gamma, p.scaling, Array<Real>(r));
        return r;
    }

    Real evaluate(const KineticParameters& p, const assignment::Assignment& times) const {
        const auto t_w = detail::gather(times.t, obs_.weights);
        return derivatives::squared_loss(
            Array<const Real>(u_w_), Array<const Real>(s_w_), Array<const Real>(t_w),
            p.t_, p.alpha, p.beta, p.gamma, p.scaling);
    }

    // Resolves the proposal into candidate parameters and the assignment they
    // are scored with (the current one, scratch, or the proposal's own)
    Real candidate_loss(
        const Proposal& p,
        KineticParameters& cand,
        assignment::Assignment& scratch,
        const assignment::Assignment*& times
    ) const {
        cand = pars_;
        if (p.alpha) cand.alpha = *p.alpha;
        if (p.beta) cand.beta = *p.beta;
        if (p.gamma) cand.gamma = *p.gamma;
        if (p.scaling) cand.scaling = *p.scaling;

        times = &times_;
        if (p.times) {
            VELO_CHECK_ARG(p.t_.has_value(), "Proposal: explicit times need their switch time");
            VELO_CHECK_DIM(p.times->size() == obs_.n_cells(), "Proposal: times length mismatch");
            cand.t_ = *p.t_;
            times = &*p.times;
        } else if (p.reassign_time || p.t_) {
            cand.t_ = p.t_ ? *p.t_ : optimal_switch(cand.alpha, cand.beta, cand.gamma, cand.scaling);
            scratch = assign_all(cand.t_, cand.alpha, cand.beta, cand.gamma, cand.scaling);
            times = &scratch;
        }

        return evaluate(cand, *times);
    }

    GeneObservation obs_;
    FitConfig cfg_;
    std::unique_ptr<UpdateRule> rule_;

    std::vector<Real> u_w_;
    std::vector<Real> s_w_;

    KineticParameters pars_;
    assignment::Assignment times_;
    OptimizationTrace trace_;
    FitStatus status_ = FitStatus::Uninitialized;
};

} // namespace velo::kernel::dynamics
