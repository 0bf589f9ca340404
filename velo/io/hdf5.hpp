#pragma once

#include "velo/core/type.hpp"
#include "velo/core/error.hpp"
#include "velo/core/macros.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

#ifdef VELO_HAS_HDF5
#include <hdf5.h>

// =============================================================================
// FILE: velo/io/hdf5.hpp
// BRIEF: RAII handles over the HDF5 C API (files, groups, dense datasets)
// =============================================================================

namespace velo::io::h5 {

namespace detail {

template <typename T>
inline constexpr bool unsupported_type_v = false;

// Map C++ types to HDF5 native types
template <typename T>
inline hid_t native_type() {
    if constexpr (std::is_same_v<T, float>)        return H5T_NATIVE_FLOAT;
    else if constexpr (std::is_same_v<T, double>)  return H5T_NATIVE_DOUBLE;
    else if constexpr (std::is_same_v<T, int16_t>) return H5T_NATIVE_INT16;
    else if constexpr (std::is_same_v<T, int32_t>) return H5T_NATIVE_INT32;
    else if constexpr (std::is_same_v<T, int64_t>) return H5T_NATIVE_INT64;
    else if constexpr (std::is_same_v<T, uint8_t>) return H5T_NATIVE_UINT8;
    else static_assert(unsupported_type_v<T>, "Unsupported HDF5 type");
}

inline void check_h5(herr_t err, const char* context) {
    if (err < 0) {
        std::string msg = std::string("HDF5: ") + context;

        struct ErrorWalker {
            std::string* msg;
        } walker{&msg};

        herr_t walk_err = H5Ewalk2(H5E_DEFAULT, H5E_WALK_DOWNWARD,
            [](unsigned, const H5E_error2_t* err, void* data) -> herr_t {
                auto* w = static_cast<ErrorWalker*>(data);
                if (err->desc) {
                    *w->msg += "\n  " + std::string(err->desc);
                }
                return 0;
            }, &walker);

        if (walk_err < 0) {
            msg += " (failed to retrieve error details)";
        }

        throw IOError(msg);
    }
}

inline void check_id(hid_t id, const char* context) {
    if (id < 0) {
        throw IOError(std::string("HDF5 invalid ID: ") + context);
    }
}

} // namespace detail

// =============================================================================
// Object - owns one hid_t and its close function
// =============================================================================

class Object {
protected:
    hid_t _id;
    herr_t (*_closer)(hid_t);

    explicit Object(hid_t id, herr_t (*closer)(hid_t)) noexcept
        : _id(id), _closer(closer) {}

    Object() noexcept : _id(H5I_INVALID_HID), _closer(nullptr) {}

public:
    virtual ~Object() noexcept { close(); }

    void close() noexcept {
        if (is_valid() && _closer) {
            _closer(_id);
            _id = H5I_INVALID_HID;
        }
    }

    Object(Object&& other) noexcept
        : _id(other._id), _closer(other._closer)
    {
        other._id = H5I_INVALID_HID;
        other._closer = nullptr;
    }

    Object& operator=(Object&& other) noexcept {
        if (this != &other) {
            close();
            _id = other._id;
            _closer = other._closer;
            other._id = H5I_INVALID_HID;
            other._closer = nullptr;
        }
        return *this;
    }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    VELO_NODISCARD hid_t id() const noexcept { return _id; }

    VELO_NODISCARD bool is_valid() const noexcept {
        return _id >= 0 && _id != H5I_INVALID_HID;
    }
};

// =============================================================================
// Dataspace
// =============================================================================

class Dataspace : public Object {
public:
    explicit Dataspace(const std::vector<hsize_t>& dims)
        : Object(H5Screate_simple(static_cast<int>(dims.size()), dims.data(), nullptr),
                 H5Sclose)
    {
        detail::check_id(_id, "H5Screate_simple");
    }

    explicit Dataspace(hid_t space_id)
        : Object(space_id, H5Sclose) {}

    VELO_NODISCARD int get_rank() const {
        return H5Sget_simple_extent_ndims(_id);
    }

    std::vector<hsize_t> get_dims() const {
        int rank = get_rank();
        if (rank < 0) return {};
        std::vector<hsize_t> dims(static_cast<Size>(rank));
        detail::check_h5(H5Sget_simple_extent_dims(_id, dims.data(), nullptr),
                         "H5Sget_simple_extent_dims");
        return dims;
    }

    VELO_NODISCARD hssize_t get_num_elements() const {
        return H5Sget_simple_extent_npoints(_id);
    }
};

// =============================================================================
// Dataset
// =============================================================================

class Dataset : public Object {
public:
    Dataset(hid_t loc_id, const std::string& name)
        : Object(H5Dopen2(loc_id, name.c_str(), H5P_DEFAULT), H5Dclose)
    {
        detail::check_id(_id, ("H5Dopen: " + name).c_str());
    }

    template <typename T>
    static Dataset create(
        hid_t loc_id,
        const std::string& name,
        const std::vector<hsize_t>& dims
    ) {
        Dataspace space(dims);
        hid_t id = H5Dcreate2(loc_id, name.c_str(), detail::native_type<T>(), space.id(),
                              H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, ("H5Dcreate: " + name).c_str());
        return Dataset(id, false);
    }

    Dataspace get_space() const {
        hid_t space_id = H5Dget_space(_id);
        detail::check_id(space_id, "H5Dget_space");
        return Dataspace(space_id);
    }

    std::vector<hsize_t> get_dims() const {
        return get_space().get_dims();
    }

    VELO_NODISCARD hsize_t get_num_elements() const {
        return static_cast<hsize_t>(get_space().get_num_elements());
    }

    template <typename T>
    void read(T* buffer) const {
        detail::check_h5(
            H5Dread(_id, detail::native_type<T>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer),
            "H5Dread"
        );
    }

    template <typename T>
    void write(const T* buffer) {
        detail::check_h5(
            H5Dwrite(_id, detail::native_type<T>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer),
            "H5Dwrite"
        );
    }

    template <typename T>
    std::vector<T> read_vector() const {
        const hsize_t size = get_num_elements();
        std::vector<T> data(static_cast<Size>(size));
        if (size > 0) read(data.data());
        return data;
    }

private:
    Dataset(hid_t id, bool) : Object(id, H5Dclose) {}
};

// =============================================================================
// Location - common base of File and Group
// =============================================================================

class Group;

class Location : public Object {
protected:
    using Object::Object;
    Location() = default;

public:
    VELO_NODISCARD bool exists(const std::string& name) const {
        return H5Lexists(_id, name.c_str(), H5P_DEFAULT) > 0;
    }

    void remove(const std::string& name) {
        detail::check_h5(H5Ldelete(_id, name.c_str(), H5P_DEFAULT),
                         ("H5Ldelete: " + name).c_str());
    }

    Dataset open_dataset(const std::string& name) const {
        return Dataset(_id, name);
    }

    template <typename T>
    void write_dataset(
        const std::string& name,
        const T* data,
        const std::vector<hsize_t>& dims
    ) {
        Dataset dset = Dataset::create<T>(_id, name, dims);
        dset.write(data);
    }

    template <typename T>
    void write_dataset(const std::string& name, const std::vector<T>& data) {
        write_dataset(name, data.data(), std::vector<hsize_t>{data.size()});
    }

    template <typename T>
    std::vector<T> read_dataset(const std::string& name) const {
        return open_dataset(name).template read_vector<T>();
    }

    Group create_group(const std::string& name);
    Group open_group(const std::string& name) const;

    // Opens the group, creating it when missing
    Group require_group(const std::string& name);
};

// =============================================================================
// Group
// =============================================================================

class Group : public Location {
public:
    Group(hid_t loc_id, const std::string& name)
        : Location()
    {
        _id = H5Gopen2(loc_id, name.c_str(), H5P_DEFAULT);
        _closer = H5Gclose;
        detail::check_id(_id, ("H5Gopen: " + name).c_str());
    }

    static Group create(hid_t loc_id, const std::string& name) {
        hid_t id = H5Gcreate2(loc_id, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, ("H5Gcreate: " + name).c_str());
        return Group(id, false);
    }

private:
    Group(hid_t id, bool) : Location() {
        _id = id;
        _closer = H5Gclose;
    }
};

inline Group Location::create_group(const std::string& name) {
    return Group::create(_id, name);
}

inline Group Location::open_group(const std::string& name) const {
    return Group(_id, name);
}

inline Group Location::require_group(const std::string& name) {
    return exists(name) ? open_group(name) : create_group(name);
}

// =============================================================================
// File
// =============================================================================

class File : public Location {
public:
    explicit File(const std::string& path, unsigned flags = H5F_ACC_RDONLY)
        : Location()
    {
        _id = H5Fopen(path.c_str(), flags, H5P_DEFAULT);
        _closer = H5Fclose;
        detail::check_id(_id, ("H5Fopen: " + path).c_str());
    }

    static File create(const std::string& path, unsigned flags = H5F_ACC_TRUNC) {
        hid_t id = H5Fcreate(path.c_str(), flags, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, ("H5Fcreate: " + path).c_str());
        return File(id, false);
    }

    void flush() {
        detail::check_h5(H5Fflush(_id, H5F_SCOPE_GLOBAL), "H5Fflush");
    }

private:
    File(hid_t id, bool) : Location() {
        _id = id;
        _closer = H5Fclose;
    }
};

} // namespace velo::io::h5

#endif // VELO_HAS_HDF5
