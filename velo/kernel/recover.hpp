#pragma once

#include "velo/core/type.hpp"
#include "velo/core/error.hpp"
#include "velo/core/log.hpp"
#include "velo/core/macros.hpp"
#include "velo/core/progress.hpp"
#include "velo/threading/parallel_for.hpp"
#include "velo/kernel/dynamics.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// =============================================================================
// FILE: velo/kernel/recover.hpp
// BRIEF: Batch recovery of per-gene dynamics into a columnar fit record
// =============================================================================

namespace velo::kernel::recover {

namespace config {
    constexpr const char* DEFAULT_KEY = "fit";
    constexpr Size DEFAULT_LOSS_WIDTH = 2;
}

// =============================================================================
// Inputs
// =============================================================================

// Cells x genes column-major layers. The smoothed pair (Mu, Ms) is optional;
// without it the raw counts are fitted directly.
struct Layers {
    ColumnView<const Real> unspliced;
    ColumnView<const Real> spliced;
    ColumnView<const Real> Mu;
    ColumnView<const Real> Ms;
    Array<const Byte> velocity_genes;

    [[nodiscard]] Index n_cells() const noexcept { return spliced.rows; }
    [[nodiscard]] Index n_genes() const noexcept { return spliced.cols; }

    [[nodiscard]] bool has_smoothed() const noexcept {
        return Mu.valid() && Ms.valid();
    }

    void validate() const {
        VELO_CHECK_NULL(unspliced.data, "Layers: unspliced is null");
        VELO_CHECK_NULL(spliced.data, "Layers: spliced is null");
        VELO_CHECK_DIM(unspliced.rows == spliced.rows && unspliced.cols == spliced.cols,
                       "Layers: unspliced and spliced shapes differ");
        if (has_smoothed()) {
            VELO_CHECK_DIM(Mu.rows == spliced.rows && Mu.cols == spliced.cols &&
                           Ms.rows == spliced.rows && Ms.cols == spliced.cols,
                           "Layers: smoothed layer shape differs from raw");
        }
        VELO_CHECK_DIM(velocity_genes.empty() || velocity_genes.len == static_cast<Size>(n_genes()),
                       "Layers: velocity_genes length mismatch");
    }
};

struct RecoverConfig {
    dynamics::FitConfig fit;
    bool use_raw = false;
    std::optional<Real> t_max;
    bool load_pars = false;
    bool filter_velocity_genes = false;
    std::optional<std::vector<Index>> gene_subset;
    std::string add_key = config::DEFAULT_KEY;
    std::optional<int> verbosity;

    void validate() const {
        fit.validate();
        VELO_CHECK_ARG(!t_max || (*t_max > Real(0) && std::isfinite(*t_max)),
                       "RecoverConfig: t_max must be positive and finite");
        VELO_CHECK_ARG(!add_key.empty(), "RecoverConfig: add_key is empty");
    }
};

// =============================================================================
// Fit Record
// =============================================================================

// Per-gene parameter columns, a cells x genes time layer (column-major) and a
// genes x loss_width loss matrix (row-major). NaN marks missing values.
// key prefixes the persisted column names.
struct FitRecord {
    std::string key = config::DEFAULT_KEY;

    Index n_cells = 0;
    Index n_genes = 0;

    std::vector<Real> alpha;
    std::vector<Real> beta;
    std::vector<Real> gamma;
    std::vector<Real> t_;
    std::vector<Real> scaling;

    std::vector<Real> fit_t;

    std::vector<Real> loss;
    Size loss_width = 0;

    static FitRecord empty(Index n_cells, Index n_genes) {
        VELO_CHECK_ARG(n_cells >= 0 && n_genes >= 0, "FitRecord: negative shape");
        constexpr Real nan = std::numeric_limits<Real>::quiet_NaN();
        const auto g = static_cast<Size>(n_genes);
        FitRecord r;
        r.n_cells = n_cells;
        r.n_genes = n_genes;
        r.alpha.assign(g, nan);
        r.beta.assign(g, nan);
        r.gamma.assign(g, nan);
        r.t_.assign(g, nan);
        r.scaling.assign(g, nan);
        r.fit_t.assign(static_cast<Size>(n_cells) * g, nan);
        return r;
    }

    [[nodiscard]] bool has_loss() const noexcept { return loss_width > 0; }

    [[nodiscard]] Array<Real> t_column(Index g) {
        return Array<Real>(fit_t.data() + static_cast<Size>(g) * static_cast<Size>(n_cells),
                           static_cast<Size>(n_cells));
    }

    [[nodiscard]] Array<const Real> t_column(Index g) const {
        return Array<const Real>(fit_t.data() + static_cast<Size>(g) * static_cast<Size>(n_cells),
                                 static_cast<Size>(n_cells));
    }

    [[nodiscard]] Array<const Real> loss_row(Index g) const {
        return Array<const Real>(loss.data() + static_cast<Size>(g) * loss_width, loss_width);
    }

    [[nodiscard]] dynamics::KineticParameters parameters(Index g) const {
        const auto i = static_cast<Size>(g);
        return dynamics::KineticParameters{alpha[i], beta[i], gamma[i], t_[i], scaling[i]};
    }

    void set_parameters(Index g, const dynamics::KineticParameters& p) {
        const auto i = static_cast<Size>(g);
        alpha[i] = p.alpha;
        beta[i] = p.beta;
        gamma[i] = p.gamma;
        t_[i] = p.t_;
        scaling[i] = p.scaling;
    }

    void validate() const {
        VELO_CHECK_ARG(!key.empty(), "FitRecord: key is empty");
        const auto g = static_cast<Size>(n_genes);
        VELO_CHECK_DIM(alpha.size() == g && beta.size() == g && gamma.size() == g &&
                       t_.size() == g && scaling.size() == g,
                       "FitRecord: parameter column length mismatch");
        VELO_CHECK_DIM(fit_t.size() == static_cast<Size>(n_cells) * g,
                       "FitRecord: fit_t shape mismatch");
        VELO_CHECK_DIM(loss.size() == g * loss_width, "FitRecord: loss shape mismatch");
    }
};

// =============================================================================
// Per-Gene Result
// =============================================================================

struct GeneResult {
    dynamics::KineticParameters pars;
    std::vector<Real> t;
    std::vector<Real> loss;
    dynamics::FitStatus status = dynamics::FitStatus::Uninitialized;
    bool ok = false;
};

struct RecoverSummary {
    Size n_selected = 0;
    Size n_fitted = 0;
    Size n_failed = 0;
    Size n_converged = 0;
    double seconds = 0.0;
};

// =============================================================================
// Gene Selection
// =============================================================================

inline std::vector<Index> select_genes(const Layers& layers, const RecoverConfig& cfg) {
    const Index n_genes = layers.n_genes();
    std::vector<Byte> keep(static_cast<Size>(n_genes), Byte(0));

    if (cfg.gene_subset) {
        for (Index g : *cfg.gene_subset) {
            if (g < 0 || g >= n_genes) {
                throw IndexOutOfBoundsError("select_genes: gene index " + std::to_string(g) + " out of range");
            }
            keep[static_cast<Size>(g)] = Byte(1);
        }
    } else {
        std::fill(keep.begin(), keep.end(), Byte(1));
    }

    if (cfg.filter_velocity_genes && !layers.velocity_genes.empty()) {
        for (Index g = 0; g < n_genes; ++g) {
            if (!layers.velocity_genes[g]) keep[static_cast<Size>(g)] = Byte(0);
        }
    }

    std::vector<Index> genes;
    for (Index g = 0; g < n_genes; ++g) {
        if (keep[static_cast<Size>(g)]) genes.push_back(g);
    }
    return genes;
}

// =============================================================================
// Rescaling
// =============================================================================

// Factor m = t_max / max_i t_i of one gene; 1 when the maximum is unusable
inline Real rescale_factor(Array<const Real> t, Real t_max) {
    Real t_hi = -std::numeric_limits<Real>::infinity();
    for (Size i = 0; i < t.len; ++i) {
        const Real v = t[static_cast<Index>(i)];
        if (std::isfinite(v)) t_hi = std::max(t_hi, v);
    }
    if (!std::isfinite(t_hi) || t_hi <= Real(0)) return Real(1);
    return t_max / t_hi;
}

// Rates divide by m, times multiply by m; the fitted curve is unchanged
inline void rescale(FitRecord& record, Array<const Index> genes, Real t_max) {
    VELO_CHECK_ARG(t_max > Real(0) && std::isfinite(t_max), "rescale: t_max must be positive and finite");
    for (Size k = 0; k < genes.len; ++k) {
        const Index g = genes[static_cast<Index>(k)];
        const auto i = static_cast<Size>(g);
        auto t = record.t_column(g);
        const Real m = rescale_factor(Array<const Real>(t), t_max);

        record.alpha[i] /= m;
        record.beta[i] /= m;
        record.gamma[i] /= m;
        record.t_[i] *= m;
        for (Size c = 0; c < t.len; ++c) t[static_cast<Index>(c)] *= m;
    }
}

// =============================================================================
// Loss Matrix
// =============================================================================

// Widens the loss matrix to max(current width, longest trace) and overwrites
// the rows of the given genes. Missing entries are NaN. A record without a
// loss matrix counts as width 2.
inline void merge_loss(
    FitRecord& record,
    Array<const Index> genes,
    const std::vector<std::vector<Real>>& traces
) {
    VELO_CHECK_DIM(genes.len == traces.size(), "merge_loss: one trace per gene required");

    const Size n_genes = static_cast<Size>(record.n_genes);
    const Size cur_len = record.has_loss() ? record.loss_width : config::DEFAULT_LOSS_WIDTH;
    Size max_len = cur_len;
    for (const auto& tr : traces) max_len = std::max(max_len, tr.size());

    std::vector<Real> merged(n_genes * max_len, std::numeric_limits<Real>::quiet_NaN());

    if (record.has_loss()) {
        for (Size g = 0; g < n_genes; ++g) {
            std::copy_n(record.loss.begin() + static_cast<std::ptrdiff_t>(g * cur_len), cur_len,
                        merged.begin() + static_cast<std::ptrdiff_t>(g * max_len));
        }
    }

    for (Size k = 0; k < genes.len; ++k) {
        const auto g = static_cast<Size>(genes[static_cast<Index>(k)]);
        auto row = merged.begin() + static_cast<std::ptrdiff_t>(g * max_len);
        std::fill(row, row + static_cast<std::ptrdiff_t>(max_len), std::numeric_limits<Real>::quiet_NaN());
        std::copy(traces[k].begin(), traces[k].end(), row);
    }

    record.loss = std::move(merged);
    record.loss_width = max_len;
}

// =============================================================================
// Single Gene
// =============================================================================

namespace detail {

inline bool all_finite(Array<const Real> x) {
    for (Size i = 0; i < x.len; ++i) {
        if (!std::isfinite(x[static_cast<Index>(i)])) return false;
    }
    return true;
}

} // namespace detail

inline dynamics::GeneObservation observe_gene(const Layers& layers, Index g, bool use_raw) {
    const bool raw = use_raw || !layers.has_smoothed();
    const auto u_raw = Array<const Real>(layers.unspliced.col(g));
    const auto s_raw = Array<const Real>(layers.spliced.col(g));
    if (raw) {
        return dynamics::GeneObservation::build(u_raw, s_raw);
    }
    return dynamics::GeneObservation::build(
        Array<const Real>(layers.Mu.col(g)), Array<const Real>(layers.Ms.col(g)), u_raw, s_raw);
}

// Fits gene g. With load_pars the record's parameters (and its time column
// when fully finite) seed the fit.
inline GeneResult fit_gene(
    const Layers& layers,
    Index g,
    const RecoverConfig& cfg,
    const FitRecord* prior = nullptr
) {
    dynamics::GeneFit fit(observe_gene(layers, g, cfg.use_raw), cfg.fit);

    if (cfg.load_pars && prior != nullptr) {
        const auto t_prev = prior->t_column(g);
        fit.load(prior->parameters(g),
                 detail::all_finite(t_prev) ? t_prev : Array<const Real>());
    } else {
        fit.initialize();
    }

    GeneResult res;
    res.status = fit.fit();
    res.pars = fit.parameters();
    res.t = fit.times().t;
    res.loss = fit.trace().loss;
    res.ok = res.pars.finite();
    return res;
}

// =============================================================================
// Batch Driver
// =============================================================================

// Fits every selected gene in parallel and writes parameters, times and loss
// traces into record. An empty record is shaped to the layers first.
// Genes whose fit throws get NaN entries and are counted in the summary.
inline RecoverSummary recover_dynamics(
    const Layers& layers,
    FitRecord& record,
    const RecoverConfig& cfg
) {
    layers.validate();
    cfg.validate();
    if (cfg.verbosity) log::set_verbosity(*cfg.verbosity);

    if (record.n_genes == 0 && record.n_cells == 0) {
        record = FitRecord::empty(layers.n_cells(), layers.n_genes());
    }
    record.key = cfg.add_key;
    record.validate();
    VELO_CHECK_DIM(record.n_cells == layers.n_cells() && record.n_genes == layers.n_genes(),
                   "recover_dynamics: record shape differs from layers");

    const auto start = std::chrono::steady_clock::now();
    VELO_LOG_INFO("recovering dynamics");

    const auto genes = select_genes(layers, cfg);
    RecoverSummary summary;
    summary.n_selected = genes.size();
    if (genes.empty()) {
        VELO_LOG_WARN("recover_dynamics: no genes selected");
        return summary;
    }

    std::vector<GeneResult> results(genes.size());
    std::vector<Byte> failed(genes.size(), Byte(0));
    std::exception_ptr fatal;
    std::mutex fatal_mutex;

    {
        progress::ScopedProgress progress(genes.size());
        const FitRecord* prior = cfg.load_pars ? &record : nullptr;

        threading::parallel_for(0, genes.size(), [&](size_t k) {
            const Index g = genes[k];
            try {
                results[k] = fit_gene(layers, g, cfg, prior);
            } catch (const Exception& e) {
                VELO_LOG_WARN("gene %lld: fit failed: %s", static_cast<long long>(g), e.what());
                failed[k] = Byte(1);
            } catch (...) {
                std::lock_guard<std::mutex> lock(fatal_mutex);
                if (!fatal) fatal = std::current_exception();
                failed[k] = Byte(1);
            }
            progress.tick();
        });
    }

    if (fatal) std::rethrow_exception(fatal);

    std::vector<std::vector<Real>> traces(genes.size());
    for (Size k = 0; k < genes.size(); ++k) {
        const Index g = genes[k];
        if (failed[k]) {
            dynamics::KineticParameters missing;
            missing.beta = std::numeric_limits<Real>::quiet_NaN();
            record.set_parameters(g, missing);
            auto col = record.t_column(g);
            std::fill(col.begin(), col.end(), std::numeric_limits<Real>::quiet_NaN());
            ++summary.n_failed;
            continue;
        }
        auto& res = results[k];
        record.set_parameters(g, res.pars);
        auto col = record.t_column(g);
        std::copy(res.t.begin(), res.t.end(), col.begin());
        traces[k] = std::move(res.loss);

        if (res.ok) ++summary.n_fitted;
        if (res.status == dynamics::FitStatus::Converged) ++summary.n_converged;
    }

    if (cfg.t_max) {
        rescale(record, Array<const Index>(genes), *cfg.t_max);
    }
    merge_loss(record, Array<const Index>(genes), traces);

    summary.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    VELO_LOG_INFO("    finished (%zu genes, %.2fs)", summary.n_selected, summary.seconds);
    VELO_LOG_INFO("added '%s_pars', fitted parameters for splicing dynamics", record.key.c_str());
    return summary;
}

} // namespace velo::kernel::recover
