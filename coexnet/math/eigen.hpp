#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/dense.hpp"

#include <Eigen/Dense>

// =============================================================================
// FILE: coexnet/math/eigen.hpp
// BRIEF: Zero-copy Eigen views over coexnet dense storage
//
// DenseMatrix is row-major, so every map uses Eigen::RowMajor. Maps never own
// memory; the DenseMatrix / DenseArray must outlive them.
// =============================================================================

namespace coexnet::math {

using RowMatrix = Eigen::Matrix<Real, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using ColMatrix = Eigen::Matrix<Real, Eigen::Dynamic, Eigen::Dynamic, Eigen::ColMajor>;
using Vector = Eigen::Matrix<Real, Eigen::Dynamic, 1>;

using RowMap = Eigen::Map<RowMatrix>;
using ConstRowMap = Eigen::Map<const RowMatrix>;
using VectorMap = Eigen::Map<Vector>;
using ConstVectorMap = Eigen::Map<const Vector>;

inline ConstRowMap map(DenseArray<const Real> m) {
    return ConstRowMap(m.ptr, m.rows, m.cols);
}

inline RowMap map(DenseArray<Real> m) {
    return RowMap(m.ptr, m.rows, m.cols);
}

inline RowMap map(DenseMatrix<Real>& m) {
    return RowMap(m.data(), m.rows(), m.cols());
}

inline ConstRowMap map(const DenseMatrix<Real>& m) {
    return ConstRowMap(m.data(), m.rows(), m.cols());
}

/// @brief Rows [begin, begin + count) of a row-major buffer with `cols` columns.
inline RowMap map_rows(Real* data, Index begin, Index count, Index cols) {
    return RowMap(data + begin * cols, count, cols);
}

inline ConstRowMap map_rows(const Real* data, Index begin, Index count, Index cols) {
    return ConstRowMap(data + begin * cols, count, cols);
}

inline ConstVectorMap map(Array<const Real> v) {
    return ConstVectorMap(v.ptr, static_cast<Eigen::Index>(v.len));
}

inline VectorMap map(Array<Real> v) {
    return VectorMap(v.ptr, static_cast<Eigen::Index>(v.len));
}

} // namespace coexnet::math
