#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/error.hpp"
#include "coexnet/core/macros.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

#ifdef COEXNET_HAS_HDF5
#include <hdf5.h>

// =============================================================================
// FILE: coexnet/io/hdf5.hpp
// BRIEF: RAII wrapper over the HDF5 C API
//
// Owns hid_t handles (files, groups, datasets, dataspaces, datatypes,
// attributes) and turns negative return codes into IOError.
// =============================================================================

namespace coexnet::io::h5 {

namespace detail {

template <typename T>
inline hid_t native_type() {
    if constexpr (std::is_same_v<T, float>)         return H5T_NATIVE_FLOAT;
    else if constexpr (std::is_same_v<T, double>)   return H5T_NATIVE_DOUBLE;
    else if constexpr (std::is_same_v<T, int32_t>)  return H5T_NATIVE_INT32;
    else if constexpr (std::is_same_v<T, int64_t>)  return H5T_NATIVE_INT64;
    else if constexpr (std::is_same_v<T, uint8_t>)  return H5T_NATIVE_UINT8;
    else {
        static_assert(std::is_arithmetic_v<T> && !std::is_arithmetic_v<T>, "Unsupported HDF5 type");
    }
}

inline void check_h5(herr_t err, const std::string& context) {
    if (err < 0) {
        std::string msg = "HDF5: " + context;

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

inline void check_id(hid_t id, const std::string& context) {
    if (id < 0) {
        throw IOError("HDF5 invalid ID: " + context);
    }
}

} // namespace detail

// =============================================================================
// Object
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

    COEXNET_NODISCARD hid_t id() const noexcept { return _id; }

    COEXNET_NODISCARD bool is_valid() const noexcept {
        return _id >= 0 && _id != H5I_INVALID_HID;
    }
};

// =============================================================================
// Dataspace / Datatype
// =============================================================================

class Dataspace : public Object {
public:
    explicit Dataspace(const std::vector<hsize_t>& dims)
        : Object(H5Screate_simple(static_cast<int>(dims.size()), dims.data(), nullptr), H5Sclose)
    {
        detail::check_id(_id, "H5Screate_simple");
    }

    explicit Dataspace(hid_t space_id)
        : Object(space_id, H5Sclose) {}

    static Dataspace scalar() {
        hid_t id = H5Screate(H5S_SCALAR);
        detail::check_id(id, "H5Screate(SCALAR)");
        return Dataspace(id);
    }

    std::vector<hsize_t> get_dims() const {
        const int rank = H5Sget_simple_extent_ndims(_id);
        detail::check_h5(rank, "H5Sget_simple_extent_ndims");
        std::vector<hsize_t> dims(static_cast<Size>(rank));
        if (rank > 0) {
            detail::check_h5(H5Sget_simple_extent_dims(_id, dims.data(), nullptr),
                             "H5Sget_simple_extent_dims");
        }
        return dims;
    }

    COEXNET_NODISCARD hssize_t get_num_elements() const {
        return H5Sget_simple_extent_npoints(_id);
    }
};

class Datatype : public Object {
public:
    static Datatype string_vlen() {
        hid_t id = H5Tcopy(H5T_C_S1);
        detail::check_id(id, "H5Tcopy(H5T_C_S1)");
        Datatype t(id);
        detail::check_h5(H5Tset_size(id, H5T_VARIABLE), "H5Tset_size(VARIABLE)");
        detail::check_h5(H5Tset_cset(id, H5T_CSET_UTF8), "H5Tset_cset");
        return t;
    }

    static Datatype string_fixed(size_t len) {
        hid_t id = H5Tcopy(H5T_C_S1);
        detail::check_id(id, "H5Tcopy(H5T_C_S1)");
        Datatype t(id);
        detail::check_h5(H5Tset_size(id, len), "H5Tset_size");
        return t;
    }

    explicit Datatype(hid_t owned_id) : Object(owned_id, H5Tclose) {}
};

// =============================================================================
// Attribute
// =============================================================================

class Attribute : public Object {
public:
    Attribute(hid_t loc_id, const std::string& name)
        : Object(H5Aopen(loc_id, name.c_str(), H5P_DEFAULT), H5Aclose)
    {
        detail::check_id(_id, "H5Aopen: " + name);
    }

    static Attribute create(hid_t loc_id, const std::string& name, hid_t type_id, const Dataspace& space) {
        hid_t id = H5Acreate2(loc_id, name.c_str(), type_id, space.id(), H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Acreate: " + name);
        return Attribute(id, false);
    }

    template <typename T>
    T read_scalar() const {
        T value{};
        detail::check_h5(H5Aread(_id, detail::native_type<T>(), &value), "H5Aread");
        return value;
    }

    template <typename T>
    void write_scalar(const T& value) {
        detail::check_h5(H5Awrite(_id, detail::native_type<T>(), &value), "H5Awrite");
    }

    std::string read_string() const {
        hid_t file_type = H5Aget_type(_id);
        detail::check_id(file_type, "H5Aget_type");
        Datatype dtype(file_type);
        const size_t size = H5Tget_size(file_type);
        if (H5Tis_variable_str(file_type) > 0) {
            throw ReadError("HDF5: variable-length string attributes are not supported");
        }
        std::string value(size, '\0');
        detail::check_h5(H5Aread(_id, dtype.id(), value.data()), "H5Aread string");
        const auto null_pos = value.find('\0');
        if (null_pos != std::string::npos) {
            value.resize(null_pos);
        }
        return value;
    }

private:
    Attribute(hid_t id, bool) : Object(id, H5Aclose) {}
};

// =============================================================================
// Dataset
// =============================================================================

class Dataset : public Object {
public:
    Dataset(hid_t loc_id, const std::string& name)
        : Object(H5Dopen2(loc_id, name.c_str(), H5P_DEFAULT), H5Dclose)
    {
        detail::check_id(_id, "H5Dopen: " + name);
    }

    static Dataset create(hid_t loc_id, const std::string& name, hid_t type_id, const Dataspace& space) {
        hid_t id = H5Dcreate2(loc_id, name.c_str(), type_id, space.id(),
                              H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Dcreate: " + name);
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

    template <typename T>
    void read(T* buffer) const {
        detail::check_h5(H5Dread(_id, detail::native_type<T>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer),
                         "H5Dread");
    }

    template <typename T>
    void write(const T* buffer) {
        detail::check_h5(H5Dwrite(_id, detail::native_type<T>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer),
                         "H5Dwrite");
    }

    std::vector<std::string> read_strings() const {
        Dataspace space = get_space();
        const hssize_t n = space.get_num_elements();
        if (n < 0) {
            throw ReadError("HDF5: cannot size string dataset");
        }

        Datatype mem_type = Datatype::string_vlen();
        std::vector<char*> raw(static_cast<Size>(n), nullptr);
        std::vector<std::string> out;
        out.reserve(raw.size());
        if (n == 0) return out;

        detail::check_h5(H5Dread(_id, mem_type.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT, raw.data()),
                         "H5Dread vlen strings");
        for (char* s : raw) {
            out.emplace_back(s ? s : "");
        }
#if H5_VERSION_GE(1, 12, 0)
        detail::check_h5(H5Treclaim(mem_type.id(), space.id(), H5P_DEFAULT, raw.data()), "H5Treclaim");
#else
        detail::check_h5(H5Dvlen_reclaim(mem_type.id(), space.id(), H5P_DEFAULT, raw.data()),
                         "H5Dvlen_reclaim");
#endif
        return out;
    }

private:
    Dataset(hid_t id, bool) : Object(id, H5Dclose) {}
};

// =============================================================================
// Group / File
// =============================================================================

class Location : public Object {
protected:
    using Object::Object;
    Location() = default;

public:
    COEXNET_NODISCARD bool exists(const std::string& name) const {
        return H5Lexists(_id, name.c_str(), H5P_DEFAULT) > 0;
    }

    COEXNET_NODISCARD bool has_attr(const std::string& name) const {
        return H5Aexists(_id, name.c_str()) > 0;
    }

    void unlink(const std::string& name) {
        detail::check_h5(H5Ldelete(_id, name.c_str(), H5P_DEFAULT), "H5Ldelete: " + name);
    }

    Dataset open_dataset(const std::string& name) const {
        return Dataset(_id, name);
    }

    template <typename T>
    void write_dataset(const std::string& name, const T* data, const std::vector<hsize_t>& dims) {
        Dataspace space(dims);
        Dataset dset = Dataset::create(_id, name, detail::native_type<T>(), space);
        Size count = 1;
        for (hsize_t d : dims) count *= static_cast<Size>(d);
        if (count > 0) {
            dset.write(data);
        }
    }

    template <typename T>
    void write_dataset(const std::string& name, const std::vector<T>& data) {
        write_dataset(name, data.data(), {static_cast<hsize_t>(data.size())});
    }

    void write_strings(const std::string& name, const std::vector<std::string>& values) {
        Datatype type = Datatype::string_vlen();
        Dataspace space({static_cast<hsize_t>(values.size())});
        Dataset dset = Dataset::create(_id, name, type.id(), space);
        if (values.empty()) return;

        std::vector<const char*> raw;
        raw.reserve(values.size());
        for (const auto& v : values) raw.push_back(v.c_str());
        detail::check_h5(H5Dwrite(dset.id(), type.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT, raw.data()),
                         "H5Dwrite vlen strings: " + name);
    }

    template <typename T>
    std::vector<T> read_dataset(const std::string& name) const {
        Dataset dset = open_dataset(name);
        const hssize_t n = dset.get_space().get_num_elements();
        std::vector<T> data(static_cast<Size>(n < 0 ? 0 : n));
        if (!data.empty()) dset.read(data.data());
        return data;
    }

    template <typename T>
    void write_attr(const std::string& name, const T& value) {
        if (has_attr(name)) {
            detail::check_h5(H5Adelete(_id, name.c_str()), "H5Adelete: " + name);
        }
        Attribute attr = Attribute::create(_id, name, detail::native_type<T>(), Dataspace::scalar());
        attr.write_scalar(value);
    }

    template <typename T>
    T read_attr(const std::string& name) const {
        return Attribute(_id, name).read_scalar<T>();
    }

    void write_attr_string(const std::string& name, const std::string& value) {
        if (has_attr(name)) {
            detail::check_h5(H5Adelete(_id, name.c_str()), "H5Adelete: " + name);
        }
        Datatype type = Datatype::string_fixed(value.size() + 1);
        Attribute attr = Attribute::create(_id, name, type.id(), Dataspace::scalar());
        detail::check_h5(H5Awrite(attr.id(), type.id(), value.c_str()), "H5Awrite string: " + name);
    }

    std::string read_attr_string(const std::string& name) const {
        return Attribute(_id, name).read_string();
    }
};

class Group : public Location {
public:
    Group(hid_t loc_id, const std::string& name)
        : Location()
    {
        _id = H5Gopen2(loc_id, name.c_str(), H5P_DEFAULT);
        _closer = H5Gclose;
        detail::check_id(_id, "H5Gopen: " + name);
    }

    static Group create(hid_t loc_id, const std::string& name) {
        hid_t id = H5Gcreate2(loc_id, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Gcreate: " + name);
        return Group(id, false);
    }

    Group create_group(const std::string& name) { return Group::create(_id, name); }
    Group open_group(const std::string& name) const { return Group(_id, name); }

private:
    Group(hid_t id, bool) : Location() {
        _id = id;
        _closer = H5Gclose;
    }
};

class File : public Location {
public:
    explicit File(const std::string& path, unsigned flags = H5F_ACC_RDONLY)
        : Location()
    {
        _id = H5Fopen(path.c_str(), flags, H5P_DEFAULT);
        _closer = H5Fclose;
        detail::check_id(_id, "H5Fopen: " + path);
    }

    static File create(const std::string& path, unsigned flags = H5F_ACC_TRUNC) {
        hid_t id = H5Fcreate(path.c_str(), flags, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Fcreate: " + path);
        return File(id, false);
    }

    void flush() {
        detail::check_h5(H5Fflush(_id, H5F_SCOPE_GLOBAL), "H5Fflush");
    }

    Group create_group(const std::string& name) { return Group::create(_id, name); }
    Group open_group(const std::string& name) const { return Group(_id, name); }

private:
    File(hid_t id, bool) : Location() {
        _id = id;
        _closer = H5Fclose;
    }
};

} // namespace coexnet::io::h5

#endif // COEXNET_HAS_HDF5
