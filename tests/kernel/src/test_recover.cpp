// =============================================================================
// Velo - Batch Recovery Tests
// =============================================================================

#include "test.hpp"
#include "velo/kernel/recover.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace rec = velo::kernel::recover;
namespace dyn = velo::kernel::dynamics;
using velo::Real;
using velo::Byte;
using velo::Index;
using velo::Array;
using velo::ColumnView;

namespace {

constexpr Real NaN = std::numeric_limits<Real>::quiet_NaN();

std::vector<velo::test::GeneTruth> three_genes() {
    velo::test::GeneTruth a;
    velo::test::GeneTruth b;
    b.alpha = 3.0;
    b.gamma = 0.3;
    b.t_ = 2.5;
    velo::test::GeneTruth c;
    c.alpha = 1.5;
    c.beta = 0.8;
    c.scaling = 2.0;
    return {a, b, c};
}

rec::Layers raw_layers(const velo::test::SyntheticLayers& d) {
    rec::Layers layers;
    const auto rows = static_cast<Index>(d.n_cells);
    const auto cols = static_cast<Index>(d.n_genes);
    layers.unspliced = ColumnView<const Real>(d.unspliced.data(), rows, cols);
    layers.spliced = ColumnView<const Real>(d.spliced.data(), rows, cols);
    return layers;
}

rec::RecoverConfig quick_config() {
    rec::RecoverConfig cfg;
    cfg.fit.max_iter = 20;
    return cfg;
}

Real max_finite(Array<const Real> t) {
    Real m = -std::numeric_limits<Real>::infinity();
    for (size_t i = 0; i < t.len; ++i) {
        const Real v = t[static_cast<Index>(i)];
        if (std::isfinite(v)) m = std::max(m, v);
    }
    return m;
}

} // namespace

VELO_TEST_BEGIN

// =============================================================================
// Gene Selection
// =============================================================================

VELO_TEST_SUITE(selection)

VELO_TEST_CASE(all_genes_by_default) {
    const auto d = velo::test::make_layers(three_genes(), 10, 10);
    const auto genes = rec::select_genes(raw_layers(d), rec::RecoverConfig());
    VELO_ASSERT_EQ(size_t(3), genes.size());
    VELO_ASSERT_EQ(Index(2), genes[2]);
}

VELO_TEST_CASE(subset_and_velocity_filter_intersect) {
    const auto d = velo::test::make_layers(three_genes(), 10, 10);
    auto layers = raw_layers(d);
    const std::vector<Byte> velocity{1, 0, 1};
    layers.velocity_genes = Array<const Byte>(velocity);

    rec::RecoverConfig cfg;
    cfg.gene_subset = std::vector<Index>{0, 1};
    VELO_ASSERT_EQ(size_t(2), rec::select_genes(layers, cfg).size());

    cfg.filter_velocity_genes = true;
    const auto genes = rec::select_genes(layers, cfg);
    VELO_ASSERT_EQ(size_t(1), genes.size());
    VELO_ASSERT_EQ(Index(0), genes[0]);
}

VELO_TEST_CASE(subset_out_of_range_throws) {
    const auto d = velo::test::make_layers(three_genes(), 10, 10);
    rec::RecoverConfig cfg;
    cfg.gene_subset = std::vector<Index>{5};
    VELO_ASSERT_THROWS(rec::select_genes(raw_layers(d), cfg), velo::IndexOutOfBoundsError);
}

VELO_TEST_SUITE_END

// =============================================================================
// Rescaling
// =============================================================================

VELO_TEST_SUITE(rescale)

VELO_TEST_CASE(factor_maps_latest_time_to_target) {
    const std::vector<Real> t{1.0, NaN, 10.0, 4.0};
    VELO_ASSERT_NEAR(2.0, rec::rescale_factor(Array<const Real>(t), 20.0), 1e-15);
}

VELO_TEST_CASE(unusable_maximum_gives_unit_factor) {
    const std::vector<Real> missing{NaN, NaN};
    const std::vector<Real> zero{0.0, -1.0};
    VELO_ASSERT_EQ(Real(1), rec::rescale_factor(Array<const Real>(missing), 20.0));
    VELO_ASSERT_EQ(Real(1), rec::rescale_factor(Array<const Real>(zero), 20.0));
}

VELO_TEST_CASE(rates_shrink_and_times_stretch) {
    auto record = rec::FitRecord::empty(3, 2);
    record.set_parameters(0, dyn::KineticParameters{2.0, 1.0, 0.5, 3.0, 1.5});
    record.set_parameters(1, dyn::KineticParameters{4.0, 1.0, 0.5, 3.0, 1.0});
    const std::vector<Real> t0{2.0, 10.0, 5.0};
    std::copy(t0.begin(), t0.end(), record.t_column(0).begin());
    std::copy(t0.begin(), t0.end(), record.t_column(1).begin());

    const std::vector<Index> genes{0};
    rec::rescale(record, Array<const Index>(genes), 20.0);

    VELO_ASSERT_NEAR(1.0, record.alpha[0], 1e-15);
    VELO_ASSERT_NEAR(0.5, record.beta[0], 1e-15);
    VELO_ASSERT_NEAR(0.25, record.gamma[0], 1e-15);
    VELO_ASSERT_NEAR(6.0, record.t_[0], 1e-15);
    VELO_ASSERT_NEAR(1.5, record.scaling[0], 1e-15);
    VELO_ASSERT_NEAR(20.0, record.t_column(0)[1], 1e-12);
    VELO_ASSERT_NEAR(4.0, record.t_column(0)[0], 1e-12);

    // Unselected genes are untouched
    VELO_ASSERT_NEAR(4.0, record.alpha[1], 1e-15);
    VELO_ASSERT_NEAR(10.0, record.t_column(1)[1], 1e-15);
}

VELO_TEST_CASE(invalid_target_throws) {
    auto record = rec::FitRecord::empty(2, 1);
    const std::vector<Index> genes{0};
    VELO_ASSERT_THROWS(rec::rescale(record, Array<const Index>(genes), 0.0), velo::ValueError);
}

VELO_TEST_SUITE_END

// =============================================================================
// Loss Matrix
// =============================================================================

VELO_TEST_SUITE(loss_matrix)

VELO_TEST_CASE(first_merge_widens_to_longest_trace) {
    auto record = rec::FitRecord::empty(4, 3);
    const std::vector<Index> genes{0, 2};
    const std::vector<std::vector<Real>> traces{{3.0, 2.0, 1.0}, {5.0}};
    rec::merge_loss(record, Array<const Index>(genes), traces);

    VELO_ASSERT_EQ(size_t(3), record.loss_width);
    VELO_ASSERT_NEAR(1.0, record.loss_row(0)[2], 1e-15);
    VELO_ASSERT_NAN(record.loss_row(1)[0]);
    VELO_ASSERT_NEAR(5.0, record.loss_row(2)[0], 1e-15);
    VELO_ASSERT_NAN(record.loss_row(2)[1]);
}

VELO_TEST_CASE(short_traces_keep_minimum_width) {
    auto record = rec::FitRecord::empty(4, 1);
    const std::vector<Index> genes{0};
    const std::vector<std::vector<Real>> traces{{7.0}};
    rec::merge_loss(record, Array<const Index>(genes), traces);
    VELO_ASSERT_EQ(rec::config::DEFAULT_LOSS_WIDTH, record.loss_width);
}

VELO_TEST_CASE(later_merge_keeps_other_rows) {
    auto record = rec::FitRecord::empty(4, 2);
    const std::vector<Index> both{0, 1};
    rec::merge_loss(record, Array<const Index>(both),
                    std::vector<std::vector<Real>>{{1.0, 1.0, 1.0, 1.0}, {2.0, 2.0}});

    const std::vector<Index> second{1};
    rec::merge_loss(record, Array<const Index>(second), std::vector<std::vector<Real>>{{9.0}});

    VELO_ASSERT_EQ(size_t(4), record.loss_width);
    VELO_ASSERT_NEAR(1.0, record.loss_row(0)[3], 1e-15);
    VELO_ASSERT_NEAR(9.0, record.loss_row(1)[0], 1e-15);
    VELO_ASSERT_NAN(record.loss_row(1)[1]);
}

VELO_TEST_CASE(trace_count_must_match_genes) {
    auto record = rec::FitRecord::empty(4, 2);
    const std::vector<Index> genes{0, 1};
    VELO_ASSERT_THROWS(
        rec::merge_loss(record, Array<const Index>(genes), std::vector<std::vector<Real>>{{1.0}}),
        velo::DimensionError);
}

VELO_TEST_SUITE_END

// =============================================================================
// Batch Driver
// =============================================================================

VELO_TEST_SUITE(driver)

VELO_TEST_CASE(fits_every_gene_into_empty_record) {
    const auto d = velo::test::make_layers(three_genes(), 60, 40, 0.05);
    rec::FitRecord record;
    const auto summary = rec::recover_dynamics(raw_layers(d), record, quick_config());

    VELO_ASSERT_EQ(size_t(3), summary.n_selected);
    VELO_ASSERT_EQ(size_t(3), summary.n_fitted);
    VELO_ASSERT_EQ(size_t(0), summary.n_failed);
    VELO_ASSERT_EQ(Index(100), record.n_cells);
    VELO_ASSERT_EQ(Index(3), record.n_genes);
    VELO_ASSERT_GE(record.loss_width, rec::config::DEFAULT_LOSS_WIDTH);

    for (Index g = 0; g < 3; ++g) {
        VELO_ASSERT_TRUE(record.parameters(g).finite());
        VELO_ASSERT_FINITE(record.loss_row(g)[0]);
        VELO_ASSERT_FINITE(record.t_column(g)[0]);
    }
    VELO_ASSERT_NO_THROW(record.validate());
}

VELO_TEST_CASE(subset_leaves_other_genes_missing) {
    const auto d = velo::test::make_layers(three_genes(), 40, 30, 0.05);
    auto cfg = quick_config();
    cfg.gene_subset = std::vector<Index>{1};

    rec::FitRecord record;
    const auto summary = rec::recover_dynamics(raw_layers(d), record, cfg);

    VELO_ASSERT_EQ(size_t(1), summary.n_selected);
    VELO_ASSERT_TRUE(record.parameters(1).finite());
    VELO_ASSERT_NAN(record.alpha[0]);
    VELO_ASSERT_NAN(record.alpha[2]);
    VELO_ASSERT_NAN(record.t_column(0)[0]);
    VELO_ASSERT_NAN(record.loss_row(0)[0]);
}

VELO_TEST_CASE(t_max_rescales_latest_time) {
    const auto d = velo::test::make_layers(three_genes(), 40, 30, 0.05);
    auto cfg = quick_config();
    cfg.t_max = 20.0;

    rec::FitRecord record;
    rec::recover_dynamics(raw_layers(d), record, cfg);

    for (Index g = 0; g < 3; ++g) {
        VELO_ASSERT_NEAR(20.0, max_finite(record.t_column(g)), 1e-9);
    }
}

VELO_TEST_CASE(empty_gene_gets_missing_parameters) {
    auto d = velo::test::make_layers(three_genes(), 40, 30, 0.05);
    std::fill(d.unspliced.begin() + static_cast<std::ptrdiff_t>(d.n_cells),
              d.unspliced.begin() + static_cast<std::ptrdiff_t>(2 * d.n_cells), 0.0);

    rec::FitRecord record;
    const auto summary = rec::recover_dynamics(raw_layers(d), record, quick_config());

    VELO_ASSERT_EQ(size_t(2), summary.n_fitted);
    VELO_ASSERT_EQ(size_t(0), summary.n_failed);
    VELO_ASSERT_NAN(record.alpha[1]);
    VELO_ASSERT_NAN(record.beta[1]);
    VELO_ASSERT_NAN(record.t_column(1)[0]);
    VELO_ASSERT_TRUE(record.parameters(0).finite());
}

VELO_TEST_CASE(smoothed_layers_are_fitted) {
    const auto d = velo::test::make_layers(three_genes(), 40, 30, 0.05);
    auto layers = raw_layers(d);
    const auto rows = static_cast<Index>(d.n_cells);
    const auto cols = static_cast<Index>(d.n_genes);
    layers.Mu = ColumnView<const Real>(d.unspliced.data(), rows, cols);
    layers.Ms = ColumnView<const Real>(d.spliced.data(), rows, cols);
    VELO_ASSERT_TRUE(layers.has_smoothed());

    rec::FitRecord record;
    const auto summary = rec::recover_dynamics(layers, record, quick_config());
    VELO_ASSERT_EQ(size_t(3), summary.n_fitted);
}

VELO_TEST_CASE(resumed_fit_extends_record) {
    const auto d = velo::test::make_layers(three_genes(), 40, 30, 0.05);
    rec::FitRecord record;
    rec::recover_dynamics(raw_layers(d), record, quick_config());
    const auto width = record.loss_width;

    auto cfg = quick_config();
    cfg.load_pars = true;
    const auto summary = rec::recover_dynamics(raw_layers(d), record, cfg);

    VELO_ASSERT_EQ(size_t(3), summary.n_fitted);
    VELO_ASSERT_GE(record.loss_width, width);
    for (Index g = 0; g < 3; ++g) {
        VELO_ASSERT_TRUE(record.parameters(g).finite());
    }
}

VELO_TEST_CASE(record_carries_add_key) {
    const auto d = velo::test::make_layers(three_genes(), 20, 10, 0.05);
    rec::FitRecord record;
    VELO_ASSERT_STR_EQ(rec::config::DEFAULT_KEY, record.key.c_str());

    auto cfg = quick_config();
    cfg.add_key = "dyn";
    rec::recover_dynamics(raw_layers(d), record, cfg);
    VELO_ASSERT_STR_EQ("dyn", record.key.c_str());

    cfg.add_key.clear();
    VELO_ASSERT_THROWS(rec::recover_dynamics(raw_layers(d), record, cfg), velo::ValueError);
}

VELO_TEST_CASE(record_shape_mismatch_throws) {
    const auto d = velo::test::make_layers(three_genes(), 20, 10);
    auto record = rec::FitRecord::empty(5, 3);
    VELO_ASSERT_THROWS(rec::recover_dynamics(raw_layers(d), record, quick_config()),
                       velo::DimensionError);
}

VELO_TEST_CASE(no_selected_genes_returns_early) {
    const auto d = velo::test::make_layers(three_genes(), 20, 10);
    auto layers = raw_layers(d);
    const std::vector<Byte> none{0, 0, 0};
    layers.velocity_genes = Array<const Byte>(none);
    auto cfg = quick_config();
    cfg.filter_velocity_genes = true;

    rec::FitRecord record;
    const auto summary = rec::recover_dynamics(layers, record, cfg);
    VELO_ASSERT_EQ(size_t(0), summary.n_selected);
    VELO_ASSERT_EQ(Index(3), record.n_genes);
    VELO_ASSERT_FALSE(record.has_loss());
}

VELO_TEST_SUITE_END

VELO_TEST_END

VELO_TEST_MAIN()
