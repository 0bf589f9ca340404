// =============================================================================
// FILE: velo/kernel/kinetics.h
// BRIEF: API reference for two-state transcription kinetics
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "velo/core/type.hpp"

namespace velo::kernel::kinetics {

/* -----------------------------------------------------------------------------
 * FUNCTION: unspliced
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Closed-form unspliced abundance after time tau from initial value u0.
 *
 * PARAMETERS:
 *     tau   [in]  Elapsed time
 *     u0    [in]  Initial unspliced abundance
 *     alpha [in]  Transcription rate (0 during repression)
 *     beta  [in]  Splicing rate
 *
 * POSTCONDITIONS:
 *     - Returns u0 * e^(-beta tau) + alpha / beta * (1 - e^(-beta tau))
 *
 * THREAD SAFETY:
 *     Safe - pure function
 * -------------------------------------------------------------------------- */
Real unspliced(
    Real tau,                          // Elapsed time
    Real u0,                           // Initial unspliced
    Real alpha,                        // Transcription rate
    Real beta                          // Splicing rate
) noexcept;

/* -----------------------------------------------------------------------------
 * FUNCTION: spliced
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Closed-form spliced abundance after time tau.
 *
 * PARAMETERS:
 *     tau, s0, u0, alpha, beta, gamma [in]
 *
 * POSTCONDITIONS:
 *     - Returns s0 e^(-gamma tau) + alpha/gamma (1 - e^(-gamma tau))
 *       + c (e^(-gamma tau) - e^(-beta tau)), c = (alpha - u0 beta) / (gamma - beta)
 *     - gamma == beta uses safe_inverse, so c collapses to 0
 * -------------------------------------------------------------------------- */
Real spliced(
    Real tau,                          // Elapsed time
    Real s0,                           // Initial spliced
    Real u0,                           // Initial unspliced
    Real alpha,                        // Transcription rate
    Real beta,                         // Splicing rate
    Real gamma                         // Degradation rate
) noexcept;

/* -----------------------------------------------------------------------------
 * FUNCTION: tau_u
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Time needed to move from u0 to u along the unspliced curve.
 *
 * POSTCONDITIONS:
 *     - Returns -1/beta * log((u - alpha/beta) / (u0 - alpha/beta))
 *     - The log argument is clamped to [1e-6, 1 - 1e-6]; NaN passes through
 *     - Result is finite for every finite input
 * -------------------------------------------------------------------------- */
Real tau_u(
    Real u,                            // Target unspliced
    Real u0,                           // Initial unspliced
    Real alpha,                        // Transcription rate
    Real beta                          // Splicing rate
) noexcept;

/* -----------------------------------------------------------------------------
 * FUNCTION: tau_inv
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Time from the joint (u, s) position relative to (u0, s0).
 *
 * ALGORITHM:
 *     With beta_ = beta / (gamma - beta) the combination x = s - beta_ u
 *     decays with rate gamma only:
 *         x_inf = alpha / gamma - beta_ * alpha / beta
 *         tau   = -1/gamma * log((x - x_inf) / (x0 - x_inf))
 *     The ratio goes through safe_log.
 *
 * POSTCONDITIONS:
 *     - Returns a finite value for finite inputs
 * -------------------------------------------------------------------------- */
Real tau_inv(
    Real u, Real s,                    // Observed pair
    Real u0, Real s0,                  // Reference pair
    Real alpha, Real beta, Real gamma  // Rates
) noexcept;

/* -----------------------------------------------------------------------------
 * FUNCTION: tau_s
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Newton-style inversion of the spliced curve for a vector of cells.
 *
 * PARAMETERS:
 *     s     [in]     Spliced abundances [n]
 *     s0    [in]     Initial spliced
 *     u0    [in]     Initial unspliced
 *     alpha [in]     Transcription rate
 *     beta  [in]     Splicing rate
 *     gamma [in]     Degradation rate
 *     tau   [in,out] Starting estimate on entry, solution on exit [n]
 *
 * ALGORITHM:
 *     Up to 10 iterations solving the second-order expansion of
 *     spliced(tau) = s per cell (first-order when alpha <= 0).
 *     When no cell has a real root the estimate is divided by 10.
 *     Stops once the mean step falls below 1e-2. Result clipped at 0.
 *
 * COMPLEXITY:
 *     Time:  O(10 * n)
 *     Space: O(n)
 * -------------------------------------------------------------------------- */
void tau_s(
    Array<const Real> s,               // Spliced [n]
    Real s0, Real u0,                  // Initial state
    Real alpha, Real beta, Real gamma, // Rates
    Array<Real> tau                    // In/out estimate [n]
);

} // namespace velo::kernel::kinetics
