// =============================================================================
// FILE: velo/kernel/dynamics.h
// BRIEF: API reference for the per-gene dynamical model fit
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "velo/core/type.hpp"

namespace velo::kernel::dynamics {

/* -----------------------------------------------------------------------------
 * ENUM: FitStatus
 * -----------------------------------------------------------------------------
 * VALUES:
 *     Uninitialized - Constructed, no parameters yet
 *     Initialized   - Heuristic or loaded parameters in place
 *     Iterating     - Inside fit()
 *     Converged     - Escape attempt failed on a plateau
 *     Exhausted     - Iteration budget used up (or degenerate gene)
 * -------------------------------------------------------------------------- */
enum class FitStatus {
    Uninitialized,
    Initialized,
    Iterating,
    Converged,
    Exhausted
};

/* -----------------------------------------------------------------------------
 * CLASS: GeneFit
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Fits alpha, beta, gamma, switch time t_ and scaling of one gene by
 *     alternating closed-form estimators with gradient (or Adam) steps.
 *
 * STATE:
 *     parameters()  Current KineticParameters
 *     times()       Per-cell t, tau and state o (1 = induction)
 *     trace()       Loss after every accepted-or-rejected proposal
 *     status()      FitStatus
 *
 * INVARIANTS:
 *     - Parameters change only through update_loss, and only when the
 *       candidate loss is finite and (when clipping) strictly lower
 *     - trace().loss is non-increasing whenever clipping is enabled
 *     - o[i] == 1 exactly when t[i] < t_
 *
 * METHODS:
 *     initialize()              Heuristic seed, one closed-form sweep,
 *                               joint alpha/scaling refinement
 *     load(pars, t)             Resume; NaN parameters fall back to initialize()
 *     fit()                     Iterate; returns Converged or Exhausted
 *     update_state_dependent()  Closed-form t_, alpha, scaling with line search
 *     update_scaling()          Joint alpha then scaling refinement
 *     update_vars()             One gradient step on alpha, beta, gamma
 *     update_loss(proposal)     Acceptance gate; appends to the trace
 *     shuffle_pars()            5 x 5 grid over (beta, gamma) within 50 percent
 *
 * ALGORITHM (fit):
 *     for i in [0, max_iter):
 *         update_vars()
 *         if improved or i % max(max_iter/10, 1) == 1 or last iteration:
 *             improved = update_state_dependent()
 *         if i > 5 and max(last 5 losses) - last loss < 1e-3 * max(...):
 *             if not shuffle_pars(): return Converged
 *     return Exhausted
 *
 * THREAD SAFETY:
 *     Unsafe - one instance per thread
 * -------------------------------------------------------------------------- */
class GeneFit;

/* -----------------------------------------------------------------------------
 * STRUCT: FitConfig
 * -----------------------------------------------------------------------------
 * FIELDS:
 *     max_iter       Iteration budget (default 100, <= 1 means seed only)
 *     method         GradientDescent (lr 1e-6) or Adam (lr 1e-2)
 *     learning_rate  Overrides the method default
 *     clip_loss      Accept-if-improves gate (default on for gradient only)
 *     assignment     ClosedForm or Projection time assignment
 *     n_timepoints   Projection grid size (default 300)
 * -------------------------------------------------------------------------- */
struct FitConfig;

} // namespace velo::kernel::dynamics
