#pragma once

// =============================================================================
// FILE: velo/binding/c_api/dynamics/dynamics.h
// BRIEF: C API for per-gene dynamical model fits and batch recovery
// =============================================================================

#include "velo/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// Enums
// =============================================================================

typedef enum {
    VELO_METHOD_GRADIENT = 0,
    VELO_METHOD_ADAM = 1
} velo_update_method_t;

typedef enum {
    VELO_ASSIGN_CLOSED_FORM = 0,
    VELO_ASSIGN_PROJECTION = 1
} velo_assignment_mode_t;

typedef enum {
    VELO_FIT_UNINITIALIZED = 0,
    VELO_FIT_INITIALIZED = 1,
    VELO_FIT_ITERATING = 2,
    VELO_FIT_CONVERGED = 3,
    VELO_FIT_EXHAUSTED = 4
} velo_fit_status_t;

// =============================================================================
// Configuration & Parameters
// =============================================================================

typedef struct {
    int32_t max_iter;                 // default 100
    velo_update_method_t method;      // default gradient
    velo_real_t learning_rate;        // <= 0: method default
    int32_t clip_loss;                // < 0: method default, 0/1 otherwise
    velo_assignment_mode_t assignment;
    velo_size_t n_timepoints;         // projection grid size (default 300)
} velo_fit_config_t;

typedef struct {
    velo_real_t alpha;
    velo_real_t beta;
    velo_real_t gamma;
    velo_real_t t_;
    velo_real_t scaling;
} velo_kinetic_params_t;

typedef struct {
    velo_fit_config_t fit;
    velo_bool_t use_raw;              // fit raw counts even when smoothed layers are given
    velo_real_t t_max;                // <= 0: no rescaling
    velo_bool_t load_pars;            // seed from the parameter/time outputs
    velo_bool_t filter_velocity_genes;
} velo_recover_options_t;

// Fill with library defaults
velo_error_t velo_fit_config_default(velo_fit_config_t* config);

velo_error_t velo_recover_options_default(velo_recover_options_t* options);

// =============================================================================
// Single Gene Fit (Opaque Handle)
// =============================================================================

typedef struct velo_gene_fit velo_gene_fit;
typedef velo_gene_fit* velo_gene_fit_t;

// Create a fit over n_cells observations. u_raw/s_raw may be NULL (the fitted
// channels are then the raw ones). config may be NULL for defaults.
// The fit is initialized heuristically on the first velo_gene_fit_run().
velo_error_t velo_gene_fit_create(
    const velo_real_t* u,             // [n_cells]
    const velo_real_t* s,             // [n_cells]
    const velo_real_t* u_raw,         // [n_cells] or NULL
    const velo_real_t* s_raw,         // [n_cells] or NULL
    velo_size_t n_cells,
    const velo_fit_config_t* config,
    velo_gene_fit_t* out
);

// Create a fit resumed from persisted parameters and optional cell times.
// Falls back to heuristic initialization when any parameter is NaN.
velo_error_t velo_gene_fit_create_from_params(
    const velo_real_t* u,
    const velo_real_t* s,
    const velo_real_t* u_raw,
    const velo_real_t* s_raw,
    velo_size_t n_cells,
    const velo_fit_config_t* config,
    const velo_kinetic_params_t* params,
    const velo_real_t* t,             // [n_cells] or NULL
    velo_gene_fit_t* out
);

// Run the optimization loop; status may be NULL
velo_error_t velo_gene_fit_run(velo_gene_fit_t fit, velo_fit_status_t* status);

velo_error_t velo_gene_fit_params(velo_gene_fit_t fit, velo_kinetic_params_t* out);

// Cell times, local times and states; tau/o may be NULL
velo_error_t velo_gene_fit_times(
    velo_gene_fit_t fit,
    velo_real_t* t,                   // [n_cells] output
    velo_real_t* tau,                 // [n_cells] output or NULL
    uint8_t* o,                       // [n_cells] output or NULL
    velo_size_t n_cells
);

velo_error_t velo_gene_fit_loss_len(velo_gene_fit_t fit, velo_size_t* len);

// Copies the first min(len, trace length) loss entries
velo_error_t velo_gene_fit_loss(velo_gene_fit_t fit, velo_real_t* out, velo_size_t len);

velo_error_t velo_gene_fit_status(velo_gene_fit_t fit, velo_fit_status_t* out);

// Safe to call with NULL or already-destroyed handle
velo_error_t velo_gene_fit_destroy(velo_gene_fit_t* fit);

// =============================================================================
// Kinetics
// =============================================================================

velo_error_t velo_kinetics_unspliced(
    const velo_real_t* tau,           // [n]
    velo_size_t n,
    velo_real_t u0,
    velo_real_t alpha,
    velo_real_t beta,
    velo_real_t* out                  // [n] output
);

velo_error_t velo_kinetics_spliced(
    const velo_real_t* tau,           // [n]
    velo_size_t n,
    velo_real_t s0,
    velo_real_t u0,
    velo_real_t alpha,
    velo_real_t beta,
    velo_real_t gamma,
    velo_real_t* out                  // [n] output
);

// Time to reach u from u0 along the induction curve
velo_error_t velo_kinetics_tau_u(
    const velo_real_t* u,             // [n]
    velo_size_t n,
    velo_real_t u0,
    velo_real_t alpha,
    velo_real_t beta,
    velo_real_t* out                  // [n] output
);

// =============================================================================
// Batch Recovery
// =============================================================================

// Fits every selected gene of column-major (cells x genes) layers.
// Parameter columns and fit_t are outputs, and inputs when load_pars is set.
// Unselected genes keep their values. loss receives the first loss_capacity
// columns of the genes x width loss matrix (row stride loss_capacity, NaN
// padded); loss_width receives the full width. loss and loss_width may be NULL.
velo_error_t velo_recover_dynamics(
    const velo_real_t* unspliced,     // [n_cells * n_genes]
    const velo_real_t* spliced,       // [n_cells * n_genes]
    const velo_real_t* Mu,            // [n_cells * n_genes] or NULL
    const velo_real_t* Ms,            // [n_cells * n_genes] or NULL
    velo_index_t n_cells,
    velo_index_t n_genes,
    const uint8_t* gene_mask,         // [n_genes] or NULL (all genes)
    const uint8_t* velocity_genes,    // [n_genes] or NULL
    const velo_recover_options_t* options,
    velo_real_t* alpha,               // [n_genes]
    velo_real_t* beta,                // [n_genes]
    velo_real_t* gamma,               // [n_genes]
    velo_real_t* t_,                  // [n_genes]
    velo_real_t* scaling,             // [n_genes]
    velo_real_t* fit_t,               // [n_cells * n_genes]
    velo_real_t* loss,                // [n_genes * loss_capacity] or NULL
    velo_size_t loss_capacity,
    velo_size_t* loss_width
);

#ifdef __cplusplus
}
#endif
