#pragma once

#include "velo/core/type.hpp"
#include "velo/core/error.hpp"
#include "velo/core/log.hpp"
#include "velo/kernel/recover.hpp"
#include "velo/io/hdf5.hpp"

#include <filesystem>
#include <string>
#include <vector>

// =============================================================================
// FILE: velo/io/fit_store.hpp
// BRIEF: HDF5 persistence of a columnar fit record
//
// Layout (annotated-matrix style):
//   /var/<key>_alpha, _beta, _gamma, _t_, _scaling   [n_genes]
//   /layers/<key>_t                                  [n_cells, n_genes]
//   /varm/loss                                       [n_genes, width]
// =============================================================================

namespace velo::io {

namespace config {
    constexpr const char* VAR_GROUP = "var";
    constexpr const char* LAYERS_GROUP = "layers";
    constexpr const char* VARM_GROUP = "varm";
    constexpr const char* LOSS_NAME = "loss";
}

#ifdef VELO_HAS_HDF5

namespace detail {

template <typename Loc, typename T>
inline void replace_dataset(
    Loc& loc,
    const std::string& name,
    const T* data,
    const std::vector<hsize_t>& dims
) {
    if (loc.exists(name)) {
        loc.remove(name);
    }
    loc.write_dataset(name, data, dims);
}

inline std::vector<Real> read_column(
    const h5::Group& var,
    const std::string& name,
    Index n_genes
) {
    if (!var.exists(name)) {
        throw ReadError("fit record: missing /var/" + name);
    }
    std::vector<Real> col = var.read_dataset<Real>(name);
    if (n_genes >= 0 && col.size() != static_cast<Size>(n_genes)) {
        throw ReadError("fit record: /var/" + name + " has wrong length");
    }
    return col;
}

} // namespace detail

// Writes into an existing file when present, otherwise creates it.
// Datasets under record.key are replaced.
inline void write_fit_record(
    const std::string& path,
    const kernel::recover::FitRecord& record
) {
    record.validate();
    const std::string& key = record.key;

    h5::File file = std::filesystem::exists(path)
        ? h5::File(path, H5F_ACC_RDWR)
        : h5::File::create(path);

    const auto n_genes = static_cast<hsize_t>(record.n_genes);
    const auto n_cells = static_cast<hsize_t>(record.n_cells);

    {
        h5::Group var = file.require_group(config::VAR_GROUP);
        const std::vector<hsize_t> dims{n_genes};
        detail::replace_dataset(var, key + "_alpha", record.alpha.data(), dims);
        detail::replace_dataset(var, key + "_beta", record.beta.data(), dims);
        detail::replace_dataset(var, key + "_gamma", record.gamma.data(), dims);
        detail::replace_dataset(var, key + "_t_", record.t_.data(), dims);
        detail::replace_dataset(var, key + "_scaling", record.scaling.data(), dims);
    }

    {
        // fit_t is gene-major in memory; layers are stored cell-major
        std::vector<Real> layer(record.fit_t.size());
        for (Index g = 0; g < record.n_genes; ++g) {
            for (Index c = 0; c < record.n_cells; ++c) {
                layer[static_cast<Size>(c * record.n_genes + g)] =
                    record.fit_t[static_cast<Size>(g * record.n_cells + c)];
            }
        }
        h5::Group layers = file.require_group(config::LAYERS_GROUP);
        detail::replace_dataset(layers, key + "_t", layer.data(),
                                std::vector<hsize_t>{n_cells, n_genes});
    }

    if (record.has_loss()) {
        h5::Group varm = file.require_group(config::VARM_GROUP);
        detail::replace_dataset(varm, std::string(config::LOSS_NAME), record.loss.data(),
                                std::vector<hsize_t>{n_genes,
                                                     static_cast<hsize_t>(record.loss_width)});
    }

    file.flush();
    VELO_LOG_DEBUG("wrote fit record '%s' (%lld genes) to %s",
                   key.c_str(), static_cast<long long>(record.n_genes), path.c_str());
}

inline kernel::recover::FitRecord read_fit_record(
    const std::string& path,
    const std::string& key = kernel::recover::config::DEFAULT_KEY
) {
    if (!std::filesystem::exists(path)) {
        throw FileNotFoundError(path);
    }
    h5::File file(path);

    if (!file.exists(config::VAR_GROUP)) {
        throw ReadError("fit record: missing /var in " + path);
    }
    h5::Group var = file.open_group(config::VAR_GROUP);

    kernel::recover::FitRecord record;
    record.key = key;
    record.alpha = detail::read_column(var, key + "_alpha", -1);
    record.n_genes = static_cast<Index>(record.alpha.size());
    record.beta = detail::read_column(var, key + "_beta", record.n_genes);
    record.gamma = detail::read_column(var, key + "_gamma", record.n_genes);
    record.t_ = detail::read_column(var, key + "_t_", record.n_genes);
    record.scaling = detail::read_column(var, key + "_scaling", record.n_genes);

    const std::string layer_name = key + "_t";
    if (file.exists(config::LAYERS_GROUP) &&
        file.open_group(config::LAYERS_GROUP).exists(layer_name)) {
        h5::Group layers = file.open_group(config::LAYERS_GROUP);
        h5::Dataset dset = layers.open_dataset(layer_name);
        const std::vector<hsize_t> dims = dset.get_dims();
        if (dims.size() != 2 || dims[1] != static_cast<hsize_t>(record.n_genes)) {
            throw ReadError("fit record: /layers/" + layer_name + " has wrong shape");
        }
        record.n_cells = static_cast<Index>(dims[0]);
        const std::vector<Real> layer = dset.read_vector<Real>();
        record.fit_t.resize(layer.size());
        for (Index g = 0; g < record.n_genes; ++g) {
            for (Index c = 0; c < record.n_cells; ++c) {
                record.fit_t[static_cast<Size>(g * record.n_cells + c)] =
                    layer[static_cast<Size>(c * record.n_genes + g)];
            }
        }
    }

    if (file.exists(config::VARM_GROUP) &&
        file.open_group(config::VARM_GROUP).exists(config::LOSS_NAME)) {
        h5::Dataset dset = file.open_group(config::VARM_GROUP).open_dataset(config::LOSS_NAME);
        const std::vector<hsize_t> dims = dset.get_dims();
        if (dims.size() != 2 || dims[0] != static_cast<hsize_t>(record.n_genes)) {
            throw ReadError("fit record: /varm/loss has wrong shape");
        }
        record.loss_width = static_cast<Size>(dims[1]);
        record.loss = dset.read_vector<Real>();
    }

    record.validate();
    return record;
}

#else

inline void write_fit_record(
    const std::string& /*path*/,
    const kernel::recover::FitRecord& /*record*/
) {
    throw FeatureUnavailableError("write_fit_record: built without HDF5");
}

inline kernel::recover::FitRecord read_fit_record(
    const std::string& /*path*/,
    const std::string& /*key*/ = kernel::recover::config::DEFAULT_KEY
) {
    throw FeatureUnavailableError("read_fit_record: built without HDF5");
}

#endif // VELO_HAS_HDF5

} // namespace velo::io
