// =============================================================================
// FILE: velo/binding/c_api/dynamics/dynamics.cpp
// BRIEF: C API implementation for dynamical model fits
// =============================================================================

#include "velo/binding/c_api/dynamics/dynamics.h"
#include "velo/binding/c_api/core/internal.hpp"
#include "velo/kernel/kinetics.hpp"
#include "velo/kernel/dynamics.hpp"
#include "velo/kernel/recover.hpp"

#include <algorithm>
#include <limits>
#include <utility>
#include <vector>

using namespace velo;
using namespace velo::binding;

namespace dyn = velo::kernel::dynamics;
namespace rec = velo::kernel::recover;

// =============================================================================
// Opaque Handle Definition
// =============================================================================

struct velo_gene_fit {
    dyn::GeneFit fit;

    explicit velo_gene_fit(dyn::GeneFit&& f) : fit(std::move(f)) {}
};

namespace {

dyn::FitConfig to_fit_config(const velo_fit_config_t* c) {
    dyn::FitConfig cfg;
    if (c == nullptr) return cfg;

    VELO_CHECK_ARG(c->method == VELO_METHOD_GRADIENT || c->method == VELO_METHOD_ADAM,
                   "fit config: unknown update method");
    VELO_CHECK_ARG(c->assignment == VELO_ASSIGN_CLOSED_FORM || c->assignment == VELO_ASSIGN_PROJECTION,
                   "fit config: unknown assignment mode");

    cfg.max_iter = static_cast<int>(c->max_iter);
    cfg.method = (c->method == VELO_METHOD_ADAM) ? dyn::UpdateMethod::Adam
                                                 : dyn::UpdateMethod::GradientDescent;
    if (c->learning_rate > Real(0)) cfg.learning_rate = c->learning_rate;
    if (c->clip_loss >= 0) cfg.clip_loss = (c->clip_loss != 0);
    cfg.assignment = (c->assignment == VELO_ASSIGN_PROJECTION) ? dyn::AssignmentMode::Projection
                                                               : dyn::AssignmentMode::ClosedForm;
    cfg.n_timepoints = static_cast<Size>(c->n_timepoints);
    cfg.validate();
    return cfg;
}

velo_fit_status_t to_c_status(dyn::FitStatus s) noexcept {
    switch (s) {
        case dyn::FitStatus::Uninitialized: return VELO_FIT_UNINITIALIZED;
        case dyn::FitStatus::Initialized:   return VELO_FIT_INITIALIZED;
        case dyn::FitStatus::Iterating:     return VELO_FIT_ITERATING;
        case dyn::FitStatus::Converged:     return VELO_FIT_CONVERGED;
        case dyn::FitStatus::Exhausted:     return VELO_FIT_EXHAUSTED;
    }
    return VELO_FIT_UNINITIALIZED;
}

Array<const Real> optional_view(const velo_real_t* p, velo_size_t n) {
    return p ? Array<const Real>(p, n) : Array<const Real>();
}

dyn::GeneObservation observe(
    const velo_real_t* u, const velo_real_t* s,
    const velo_real_t* u_raw, const velo_real_t* s_raw,
    velo_size_t n_cells
) {
    return dyn::GeneObservation::build(
        Array<const Real>(u, n_cells), Array<const Real>(s, n_cells),
        optional_view(u_raw, n_cells), optional_view(s_raw, n_cells));
}

} // anonymous namespace

extern "C" {

// =============================================================================
// Defaults
// =============================================================================

VELO_C_EXPORT velo_error_t velo_fit_config_default(velo_fit_config_t* config) {
    VELO_C_API_CHECK_NULL(config, "Config pointer is null");

    const dyn::FitConfig d;
    config->max_iter = static_cast<int32_t>(d.max_iter);
    config->method = VELO_METHOD_GRADIENT;
    config->learning_rate = Real(0);
    config->clip_loss = -1;
    config->assignment = VELO_ASSIGN_CLOSED_FORM;
    config->n_timepoints = static_cast<velo_size_t>(d.n_timepoints);
    VELO_C_API_RETURN_OK;
}

VELO_C_EXPORT velo_error_t velo_recover_options_default(velo_recover_options_t* options) {
    VELO_C_API_CHECK_NULL(options, "Options pointer is null");

    const velo_error_t err = velo_fit_config_default(&options->fit);
    if (err != VELO_OK) return err;
    options->use_raw = VELO_FALSE;
    options->t_max = Real(0);
    options->load_pars = VELO_FALSE;
    options->filter_velocity_genes = VELO_FALSE;
    VELO_C_API_RETURN_OK;
}

// =============================================================================
// Gene Fit Lifecycle
// =============================================================================

VELO_C_EXPORT velo_error_t velo_gene_fit_create(
    const velo_real_t* u,
    const velo_real_t* s,
    const velo_real_t* u_raw,
    const velo_real_t* s_raw,
    const velo_size_t n_cells,
    const velo_fit_config_t* config,
    velo_gene_fit_t* out) {

    VELO_C_API_CHECK_NULL(u, "Unspliced pointer is null");
    VELO_C_API_CHECK_NULL(s, "Spliced pointer is null");
    VELO_C_API_CHECK_NULL(out, "Output handle pointer is null");

    VELO_C_API_TRY
        dyn::GeneFit fit(observe(u, s, u_raw, s_raw, n_cells), to_fit_config(config));
        *out = new velo_gene_fit(std::move(fit));
        VELO_C_API_RETURN_OK;
    VELO_C_API_CATCH
}

VELO_C_EXPORT velo_error_t velo_gene_fit_create_from_params(
    const velo_real_t* u,
    const velo_real_t* s,
    const velo_real_t* u_raw,
    const velo_real_t* s_raw,
    const velo_size_t n_cells,
    const velo_fit_config_t* config,
    const velo_kinetic_params_t* params,
    const velo_real_t* t,
    velo_gene_fit_t* out) {

    VELO_C_API_CHECK_NULL(u, "Unspliced pointer is null");
    VELO_C_API_CHECK_NULL(s, "Spliced pointer is null");
    VELO_C_API_CHECK_NULL(params, "Parameter pointer is null");
    VELO_C_API_CHECK_NULL(out, "Output handle pointer is null");

    VELO_C_API_TRY
        dyn::GeneFit fit(observe(u, s, u_raw, s_raw, n_cells), to_fit_config(config));
        dyn::KineticParameters pars;
        pars.alpha = params->alpha;
        pars.beta = params->beta;
        pars.gamma = params->gamma;
        pars.t_ = params->t_;
        pars.scaling = params->scaling;
        fit.load(pars, optional_view(t, n_cells));
        *out = new velo_gene_fit(std::move(fit));
        VELO_C_API_RETURN_OK;
    VELO_C_API_CATCH
}

VELO_C_EXPORT velo_error_t velo_gene_fit_run(velo_gene_fit_t fit, velo_fit_status_t* status) {
    VELO_C_API_CHECK_NULL(fit, "Gene fit handle is null");

    VELO_C_API_TRY
        const auto s = fit->fit.fit();
        if (status) *status = to_c_status(s);
        VELO_C_API_RETURN_OK;
    VELO_C_API_CATCH
}

VELO_C_EXPORT velo_error_t velo_gene_fit_params(velo_gene_fit_t fit, velo_kinetic_params_t* out) {
    VELO_C_API_CHECK_NULL(fit, "Gene fit handle is null");
    VELO_C_API_CHECK_NULL(out, "Output pointer is null");

    const auto& p = fit->fit.parameters();
    out->alpha = p.alpha;
    out->beta = p.beta;
    out->gamma = p.gamma;
    out->t_ = p.t_;
    out->scaling = p.scaling;
    VELO_C_API_RETURN_OK;
}

VELO_C_EXPORT velo_error_t velo_gene_fit_times(
    velo_gene_fit_t fit,
    velo_real_t* t,
    velo_real_t* tau,
    uint8_t* o,
    const velo_size_t n_cells) {

    VELO_C_API_CHECK_NULL(fit, "Gene fit handle is null");
    VELO_C_API_CHECK_NULL(t, "Time output pointer is null");

    const auto& a = fit->fit.times();
    VELO_C_API_CHECK(a.size() == n_cells, VELO_ERROR_DIMENSION_MISMATCH,
                     "Time output length differs from the number of cells");

    std::copy(a.t.begin(), a.t.end(), t);
    if (tau) std::copy(a.tau.begin(), a.tau.end(), tau);
    if (o) std::copy(a.o.begin(), a.o.end(), o);
    VELO_C_API_RETURN_OK;
}

VELO_C_EXPORT velo_error_t velo_gene_fit_loss_len(velo_gene_fit_t fit, velo_size_t* len) {
    VELO_C_API_CHECK_NULL(fit, "Gene fit handle is null");
    VELO_C_API_CHECK_NULL(len, "Output pointer is null");

    *len = static_cast<velo_size_t>(fit->fit.trace().size());
    VELO_C_API_RETURN_OK;
}

VELO_C_EXPORT velo_error_t velo_gene_fit_loss(velo_gene_fit_t fit, velo_real_t* out, const velo_size_t len) {
    VELO_C_API_CHECK_NULL(fit, "Gene fit handle is null");
    VELO_C_API_CHECK_NULL(out, "Output pointer is null");

    const auto& loss = fit->fit.trace().loss;
    const Size n = std::min<Size>(len, loss.size());
    std::copy_n(loss.begin(), n, out);
    VELO_C_API_RETURN_OK;
}

VELO_C_EXPORT velo_error_t velo_gene_fit_status(velo_gene_fit_t fit, velo_fit_status_t* out) {
    VELO_C_API_CHECK_NULL(fit, "Gene fit handle is null");
    VELO_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = to_c_status(fit->fit.status());
    VELO_C_API_RETURN_OK;
}

VELO_C_EXPORT velo_error_t velo_gene_fit_destroy(velo_gene_fit_t* fit) {
    if (fit == nullptr || *fit == nullptr) {
        VELO_C_API_RETURN_OK;
    }
    delete *fit;
    *fit = nullptr;
    VELO_C_API_RETURN_OK;
}

// =============================================================================
// Kinetics
// =============================================================================

VELO_C_EXPORT velo_error_t velo_kinetics_unspliced(
    const velo_real_t* tau,
    const velo_size_t n,
    const velo_real_t u0,
    const velo_real_t alpha,
    const velo_real_t beta,
    velo_real_t* out) {

    VELO_C_API_CHECK_NULL(tau, "Tau pointer is null");
    VELO_C_API_CHECK_NULL(out, "Output pointer is null");

    VELO_C_API_TRY
        kernel::kinetics::unspliced(Array<const Real>(tau, n), u0, alpha, beta, Array<Real>(out, n));
        VELO_C_API_RETURN_OK;
    VELO_C_API_CATCH
}

VELO_C_EXPORT velo_error_t velo_kinetics_spliced(
    const velo_real_t* tau,
    const velo_size_t n,
    const velo_real_t s0,
    const velo_real_t u0,
    const velo_real_t alpha,
    const velo_real_t beta,
    const velo_real_t gamma,
    velo_real_t* out) {

    VELO_C_API_CHECK_NULL(tau, "Tau pointer is null");
    VELO_C_API_CHECK_NULL(out, "Output pointer is null");

    VELO_C_API_TRY
        kernel::kinetics::spliced(Array<const Real>(tau, n), s0, u0, alpha, beta, gamma,
                                  Array<Real>(out, n));
        VELO_C_API_RETURN_OK;
    VELO_C_API_CATCH
}

VELO_C_EXPORT velo_error_t velo_kinetics_tau_u(
    const velo_real_t* u,
    const velo_size_t n,
    const velo_real_t u0,
    const velo_real_t alpha,
    const velo_real_t beta,
    velo_real_t* out) {

    VELO_C_API_CHECK_NULL(u, "Unspliced pointer is null");
    VELO_C_API_CHECK_NULL(out, "Output pointer is null");

    for (velo_size_t i = 0; i < n; ++i) {
        out[i] = kernel::kinetics::tau_u(u[i], u0, alpha, beta);
    }
    VELO_C_API_RETURN_OK;
}

// =============================================================================
// Batch Recovery
// =============================================================================

VELO_C_EXPORT velo_error_t velo_recover_dynamics(
    const velo_real_t* unspliced,
    const velo_real_t* spliced,
    const velo_real_t* Mu,
    const velo_real_t* Ms,
    const velo_index_t n_cells,
    const velo_index_t n_genes,
    const uint8_t* gene_mask,
    const uint8_t* velocity_genes,
    const velo_recover_options_t* options,
    velo_real_t* alpha,
    velo_real_t* beta,
    velo_real_t* gamma,
    velo_real_t* t_,
    velo_real_t* scaling,
    velo_real_t* fit_t,
    velo_real_t* loss,
    const velo_size_t loss_capacity,
    velo_size_t* loss_width) {

    VELO_C_API_CHECK_NULL(unspliced, "Unspliced pointer is null");
    VELO_C_API_CHECK_NULL(spliced, "Spliced pointer is null");
    VELO_C_API_CHECK_NULL(alpha, "Alpha output pointer is null");
    VELO_C_API_CHECK_NULL(beta, "Beta output pointer is null");
    VELO_C_API_CHECK_NULL(gamma, "Gamma output pointer is null");
    VELO_C_API_CHECK_NULL(t_, "Switch time output pointer is null");
    VELO_C_API_CHECK_NULL(scaling, "Scaling output pointer is null");
    VELO_C_API_CHECK_NULL(fit_t, "Time output pointer is null");
    VELO_C_API_CHECK(n_cells > 0 && n_genes > 0, VELO_ERROR_INVALID_ARGUMENT,
                     "Layers must have at least one cell and one gene");
    VELO_C_API_CHECK((Mu == nullptr) == (Ms == nullptr), VELO_ERROR_INVALID_ARGUMENT,
                     "Smoothed layers must be given together");

    VELO_C_API_TRY
        const auto g = static_cast<Size>(n_genes);
        const auto total = static_cast<Size>(n_cells) * g;

        rec::Layers layers;
        layers.unspliced = ColumnView<const Real>(unspliced, n_cells, n_genes);
        layers.spliced = ColumnView<const Real>(spliced, n_cells, n_genes);
        if (Mu != nullptr) {
            layers.Mu = ColumnView<const Real>(Mu, n_cells, n_genes);
            layers.Ms = ColumnView<const Real>(Ms, n_cells, n_genes);
        }
        if (velocity_genes != nullptr) {
            layers.velocity_genes = Array<const Byte>(velocity_genes, g);
        }

        rec::RecoverConfig cfg;
        if (options != nullptr) {
            cfg.fit = to_fit_config(&options->fit);
            cfg.use_raw = options->use_raw != VELO_FALSE;
            if (options->t_max > Real(0)) cfg.t_max = options->t_max;
            cfg.load_pars = options->load_pars != VELO_FALSE;
            cfg.filter_velocity_genes = options->filter_velocity_genes != VELO_FALSE;
        }
        if (gene_mask != nullptr) {
            std::vector<Index> subset;
            for (Index j = 0; j < n_genes; ++j) {
                if (gene_mask[j]) subset.push_back(j);
            }
            cfg.gene_subset = std::move(subset);
        }

        rec::FitRecord record;
        record.n_cells = n_cells;
        record.n_genes = n_genes;
        record.alpha.assign(alpha, alpha + g);
        record.beta.assign(beta, beta + g);
        record.gamma.assign(gamma, gamma + g);
        record.t_.assign(t_, t_ + g);
        record.scaling.assign(scaling, scaling + g);
        record.fit_t.assign(fit_t, fit_t + total);

        rec::recover_dynamics(layers, record, cfg);

        std::copy(record.alpha.begin(), record.alpha.end(), alpha);
        std::copy(record.beta.begin(), record.beta.end(), beta);
        std::copy(record.gamma.begin(), record.gamma.end(), gamma);
        std::copy(record.t_.begin(), record.t_.end(), t_);
        std::copy(record.scaling.begin(), record.scaling.end(), scaling);
        std::copy(record.fit_t.begin(), record.fit_t.end(), fit_t);

        if (loss != nullptr && loss_capacity > 0) {
            const Size cols = std::min<Size>(loss_capacity, record.loss_width);
            for (Size j = 0; j < g; ++j) {
                velo_real_t* row = loss + j * loss_capacity;
                std::fill(row, row + loss_capacity, std::numeric_limits<Real>::quiet_NaN());
                if (record.has_loss()) {
                    std::copy_n(record.loss.begin() + static_cast<std::ptrdiff_t>(j * record.loss_width),
                                cols, row);
                }
            }
        }
        if (loss_width != nullptr) *loss_width = static_cast<velo_size_t>(record.loss_width);
        VELO_C_API_RETURN_OK;
    VELO_C_API_CATCH
}

} // extern "C"
