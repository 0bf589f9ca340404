// =============================================================================
// Velo - Fit Record Persistence Tests
// =============================================================================

#include "test.hpp"
#include "velo/io/fit_store.hpp"

#include <cmath>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

namespace rec = velo::kernel::recover;
namespace dyn = velo::kernel::dynamics;
using velo::Real;
using velo::Index;

namespace {

std::string temp_path(const char* name) {
    const auto p = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(p);
    return p.string();
}

rec::FitRecord sample_record() {
    auto record = rec::FitRecord::empty(4, 3);
    record.set_parameters(0, dyn::KineticParameters{2.0, 1.0, 0.5, 3.0, 1.2});
    record.set_parameters(2, dyn::KineticParameters{1.5, 0.8, 0.3, 2.5, 0.9});
    for (Index g = 0; g < 3; g += 2) {
        auto t = record.t_column(g);
        for (Index c = 0; c < 4; ++c) t[c] = static_cast<Real>(10 * g + c);
    }
    record.loss_width = 3;
    record.loss = {5.0, 4.0, 3.0,
                   std::numeric_limits<Real>::quiet_NaN(), std::numeric_limits<Real>::quiet_NaN(),
                   std::numeric_limits<Real>::quiet_NaN(),
                   8.0, 6.0, std::numeric_limits<Real>::quiet_NaN()};
    return record;
}

} // namespace

VELO_TEST_BEGIN

#ifdef VELO_HAS_HDF5

VELO_TEST_UNIT(round_trip_preserves_record) {
    const auto path = temp_path("velo_fit_store_round_trip.h5");
    const auto record = sample_record();
    velo::io::write_fit_record(path, record);

    const auto back = velo::io::read_fit_record(path);
    VELO_ASSERT_STR_EQ(record.key.c_str(), back.key.c_str());
    VELO_ASSERT_EQ(record.n_cells, back.n_cells);
    VELO_ASSERT_EQ(record.n_genes, back.n_genes);
    VELO_ASSERT_EQ(record.loss_width, back.loss_width);
    VELO_ASSERT_TRUE(velo::test::precision::vectors_equal(record.alpha, back.alpha));
    VELO_ASSERT_TRUE(velo::test::precision::vectors_equal(record.scaling, back.scaling));
    VELO_ASSERT_TRUE(velo::test::precision::vectors_equal(record.fit_t, back.fit_t));
    VELO_ASSERT_TRUE(velo::test::precision::vectors_equal(record.loss, back.loss));
    VELO_ASSERT_NAN(back.alpha[1]);
    VELO_ASSERT_NEAR(22.0, back.t_column(2)[2], 1e-15);

    std::filesystem::remove(path);
}

VELO_TEST_UNIT(keys_coexist_and_rewrites_replace) {
    const auto path = temp_path("velo_fit_store_keys.h5");
    auto record = sample_record();
    record.key = "first";
    velo::io::write_fit_record(path, record);

    record.key = "second";
    record.alpha[0] = 7.0;
    velo::io::write_fit_record(path, record);
    record.alpha[0] = 9.0;
    velo::io::write_fit_record(path, record);

    VELO_ASSERT_NEAR(2.0, velo::io::read_fit_record(path, "first").alpha[0], 1e-15);
    const auto second = velo::io::read_fit_record(path, "second");
    VELO_ASSERT_NEAR(9.0, second.alpha[0], 1e-15);
    VELO_ASSERT_STR_EQ("second", second.key.c_str());

    std::filesystem::remove(path);
}

VELO_TEST_UNIT(missing_file_throws) {
    const auto path = temp_path("velo_fit_store_missing.h5");
    VELO_ASSERT_THROWS(velo::io::read_fit_record(path), velo::FileNotFoundError);
}

VELO_TEST_UNIT(missing_key_throws) {
    const auto path = temp_path("velo_fit_store_missing_key.h5");
    velo::io::write_fit_record(path, sample_record());
    VELO_ASSERT_THROWS(velo::io::read_fit_record(path, "other"), velo::ReadError);
    std::filesystem::remove(path);
}

VELO_TEST_UNIT(empty_key_is_rejected) {
    const auto path = temp_path("velo_fit_store_empty_key.h5");
    auto record = sample_record();
    record.key.clear();
    VELO_ASSERT_THROWS(velo::io::write_fit_record(path, record), velo::ValueError);
    VELO_ASSERT_FALSE(std::filesystem::exists(path));
}

#else

VELO_TEST_UNIT(unavailable_without_hdf5) {
    const auto path = temp_path("velo_fit_store_unavailable.h5");
    VELO_ASSERT_THROWS(velo::io::write_fit_record(path, sample_record()), velo::FeatureUnavailableError);
    VELO_ASSERT_THROWS(velo::io::read_fit_record(path), velo::FeatureUnavailableError);
}

#endif

VELO_TEST_END

VELO_TEST_MAIN()
