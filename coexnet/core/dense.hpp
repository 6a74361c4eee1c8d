#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/error.hpp"
#include "coexnet/core/memory.hpp"

#include <cmath>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

// =============================================================================
/// @file dense.hpp
/// @brief Dense row-major matrices.
///
/// - DenseArray<T>: non-owning view (pointer + shape), FFI friendly
/// - DenseMatrix<T>: owning, 64-byte aligned storage
/// - LabeledMatrix: DenseMatrix<Real> with row (sample) and column names
///
/// Indexing is ptr[r * cols + c] everywhere.
// =============================================================================

namespace coexnet {

// =============================================================================
// DenseArray: Non-Owning View
// =============================================================================

template <typename T>
struct DenseArray {
    using ValueType = T;

    T* ptr;
    Index rows;
    Index cols;

    constexpr DenseArray() noexcept : ptr(nullptr), rows(0), cols(0) {}

    constexpr DenseArray(T* p, Index r, Index c) noexcept
        : ptr(p), rows(r), cols(c) {}

    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr DenseArray(const DenseArray<U>& other) noexcept
        : ptr(other.ptr), rows(other.rows), cols(other.cols) {}

    COEXNET_NODISCARD COEXNET_FORCE_INLINE T& operator()(Index r, Index c) const {
        return ptr[r * cols + c];
    }

    /// @brief Row r as contiguous span.
    COEXNET_NODISCARD COEXNET_FORCE_INLINE Array<T> row(Index r) const {
        return Array<T>(ptr + (r * cols), static_cast<Size>(cols));
    }

    /// @brief Copy column c into output (length rows).
    void col(Index c, std::remove_const_t<T>* output) const {
        for (Index r = 0; r < rows; ++r) {
            output[r] = ptr[r * cols + c];
        }
    }

    COEXNET_NODISCARD constexpr Size size() const noexcept {
        return static_cast<Size>(rows) * static_cast<Size>(cols);
    }
};

// =============================================================================
// DenseMatrix: Owning Aligned Storage
// =============================================================================

template <typename T>
class DenseMatrix {
public:
    DenseMatrix() = default;

    DenseMatrix(Index rows, Index cols)
        : rows_(rows), cols_(cols) {
        COEXNET_CHECK_ARG(rows >= 0 && cols >= 0, "DenseMatrix: negative shape");
        data_ = memory::aligned_alloc<T>(size());
    }

    DenseMatrix(Index rows, Index cols, T value)
        : DenseMatrix(rows, cols) {
        fill(value);
    }

    /// @brief Deep copy from external row-major buffer.
    static DenseMatrix from(const T* data, Index rows, Index cols) {
        DenseMatrix m(rows, cols);
        memory::copy(data, m.data(), m.size());
        return m;
    }

    DenseMatrix(const DenseMatrix& other)
        : DenseMatrix(other.rows_, other.cols_) {
        memory::copy(other.data(), data(), size());
    }

    DenseMatrix& operator=(const DenseMatrix& other) {
        if (this != &other) {
            DenseMatrix tmp(other);
            *this = std::move(tmp);
        }
        return *this;
    }

    DenseMatrix(DenseMatrix&& other) noexcept
        : data_(std::move(other.data_)), rows_(other.rows_), cols_(other.cols_) {
        other.rows_ = 0;
        other.cols_ = 0;
    }

    DenseMatrix& operator=(DenseMatrix&& other) noexcept {
        if (this != &other) {
            data_ = std::move(other.data_);
            rows_ = other.rows_;
            cols_ = other.cols_;
            other.rows_ = 0;
            other.cols_ = 0;
        }
        return *this;
    }

    ~DenseMatrix() = default;

    COEXNET_NODISCARD Index rows() const noexcept { return rows_; }
    COEXNET_NODISCARD Index cols() const noexcept { return cols_; }
    COEXNET_NODISCARD Size size() const noexcept {
        return static_cast<Size>(rows_) * static_cast<Size>(cols_);
    }
    COEXNET_NODISCARD bool empty() const noexcept { return size() == 0; }

    COEXNET_NODISCARD T* data() noexcept { return data_.get(); }
    COEXNET_NODISCARD const T* data() const noexcept { return data_.get(); }

    COEXNET_NODISCARD COEXNET_FORCE_INLINE T& operator()(Index r, Index c) noexcept {
        return data_[r * cols_ + c];
    }
    COEXNET_NODISCARD COEXNET_FORCE_INLINE const T& operator()(Index r, Index c) const noexcept {
        return data_[r * cols_ + c];
    }

    COEXNET_NODISCARD Array<T> row(Index r) noexcept {
        return Array<T>(data() + r * cols_, static_cast<Size>(cols_));
    }
    COEXNET_NODISCARD Array<const T> row(Index r) const noexcept {
        return Array<const T>(data() + r * cols_, static_cast<Size>(cols_));
    }

    COEXNET_NODISCARD DenseArray<T> view() noexcept { return DenseArray<T>(data(), rows_, cols_); }
    COEXNET_NODISCARD DenseArray<const T> view() const noexcept {
        return DenseArray<const T>(data(), rows_, cols_);
    }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator DenseArray<const T>() const noexcept { return view(); }

    void fill(T value) noexcept {
        const Size n = size();
        for (Size i = 0; i < n; ++i) {
            data_[i] = value;
        }
    }

private:
    memory::AlignedPtr<T> data_{nullptr, memory::AlignedDeleter<T>()};
    Index rows_ = 0;
    Index cols_ = 0;
};

using Matrix = DenseMatrix<Real>;
using MatrixView = DenseArray<const Real>;

// =============================================================================
// LabeledMatrix: Named Rows and Columns
// =============================================================================

/// @brief Real matrix with sample names (rows) and feature names (columns).
///
/// ExpressionMatrix: samples x genes. TraitMatrix: samples x traits.
/// ModuleEigengeneMatrix: samples x modules.
struct LabeledMatrix {
    Matrix values;
    std::vector<std::string> row_names;
    std::vector<std::string> col_names;

    COEXNET_NODISCARD Index rows() const noexcept { return values.rows(); }
    COEXNET_NODISCARD Index cols() const noexcept { return values.cols(); }

    /// @brief Column position of a name, or -1.
    COEXNET_NODISCARD Index find_col(const std::string& name) const {
        for (Size j = 0; j < col_names.size(); ++j) {
            if (col_names[j] == name) {
                return static_cast<Index>(j);
            }
        }
        return -1;
    }

    /// @brief Shape and name consistency. `what` names the matrix in messages.
    void validate_names(const char* what) const {
        COEXNET_CHECK_DIM(static_cast<Index>(row_names.size()) == rows(),
            std::string(what) + ": " + std::to_string(row_names.size()) +
            " row names for " + std::to_string(rows()) + " rows");
        COEXNET_CHECK_DIM(static_cast<Index>(col_names.size()) == cols(),
            std::string(what) + ": " + std::to_string(col_names.size()) +
            " column names for " + std::to_string(cols()) + " columns");

        std::unordered_set<std::string> seen;
        for (const auto& name : row_names) {
            COEXNET_CHECK_ARG(seen.insert(name).second,
                std::string(what) + ": duplicate row name '" + name + "'");
        }
        seen.clear();
        for (const auto& name : col_names) {
            COEXNET_CHECK_ARG(seen.insert(name).second,
                std::string(what) + ": duplicate column name '" + name + "'");
        }
    }
};

using ExpressionMatrix = LabeledMatrix;
using TraitMatrix = LabeledMatrix;

/// @brief Default names "<prefix>0", "<prefix>1", ...
inline std::vector<std::string> default_names(const char* prefix, Index n) {
    std::vector<std::string> names;
    names.reserve(static_cast<Size>(n));
    for (Index i = 0; i < n; ++i) {
        names.push_back(std::string(prefix) + std::to_string(i));
    }
    return names;
}

// =============================================================================
// Finite Checks
// =============================================================================

/// @brief First non-finite entry as (row, col), or (-1, -1).
inline std::pair<Index, Index> find_non_finite(MatrixView m) noexcept {
    for (Index r = 0; r < m.rows; ++r) {
        const Real* row = m.ptr + r * m.cols;
        for (Index c = 0; c < m.cols; ++c) {
            if (!std::isfinite(row[c])) {
                return {r, c};
            }
        }
    }
    return {-1, -1};
}

} // namespace coexnet
