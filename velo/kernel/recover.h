// =============================================================================
// FILE: velo/kernel/recover.h
// BRIEF: API reference for batch recovery of gene dynamics
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "velo/core/type.hpp"

namespace velo::kernel::recover {

/* -----------------------------------------------------------------------------
 * FUNCTION: recover_dynamics
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Fit the dynamical model of every selected gene and collect the results
 *     into a columnar fit record.
 *
 * PARAMETERS:
 *     layers [in]     Column-major cells x genes unspliced/spliced layers,
 *                     optional smoothed Mu/Ms and velocity_genes flags
 *     record [in,out] Fit record; shaped to the layers when empty
 *     cfg    [in]     RecoverConfig (fit options, use_raw, t_max, load_pars,
 *                     gene subset, velocity gene filter)
 *
 * PRECONDITIONS:
 *     - All layers share the same shape
 *     - A non-empty record matches the layer shape
 *
 * POSTCONDITIONS:
 *     - Selected genes get fitted parameters and a fit_t column
 *     - Genes whose fit throws get NaN parameters and times
 *     - Unselected genes keep their record entries
 *     - loss is widened to max(old width or 2, longest trace), NaN padded
 *     - With t_max, every selected gene is rescaled so its largest time
 *       equals t_max (rates / m, times * m)
 *
 * ALGORITHM:
 *     1. Select genes (subset AND velocity_genes when filtering)
 *     2. parallel_for over genes: build observation, seed or load, fit
 *     3. Serially write results, rescale, merge loss traces
 *
 * COMPLEXITY:
 *     Time:  O(n_genes * max_iter * n_cells)
 *     Space: O(n_cells) per worker plus the record
 *
 * THREAD SAFETY:
 *     Safe - one GeneFit per gene, results in pre-sized slots
 * -------------------------------------------------------------------------- */
struct RecoverSummary;
struct FitRecord;
struct Layers;
struct RecoverConfig;

RecoverSummary recover_dynamics(
    const Layers& layers,              // Input layers
    FitRecord& record,                 // Output record
    const RecoverConfig& cfg           // Options
);

/* -----------------------------------------------------------------------------
 * FUNCTION: rescale
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Rescale the listed genes to a common time horizon t_max.
 *
 * POSTCONDITIONS:
 *     - m = t_max / max finite t; m = 1 when that maximum is <= 0 or missing
 *     - alpha, beta, gamma divided by m; t_ and fit_t multiplied by m
 * -------------------------------------------------------------------------- */
void rescale(
    FitRecord& record,                 // Record to rescale
    Array<const Index> genes,          // Genes to touch
    Real t_max                         // Common horizon (> 0)
);

} // namespace velo::kernel::recover
