#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/error.hpp"
#include "coexnet/core/macros.hpp"
#include "coexnet/core/dense.hpp"
#include "coexnet/kernel/correlation.hpp"
#include "coexnet/threading/parallel_for.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

// =============================================================================
// Soft-Thresholded Adjacency
//
//   Unsigned      a = |r|^p
//   Signed        a = ((1 + r) / 2)^p
//   SignedHybrid  a = r^p for r > 0, else 0
//
// Self-loops are removed: a_ii = 0.
// =============================================================================

namespace coexnet::kernel::adjacency {

enum class AdjacencyType : std::int32_t {
    Unsigned = 0,
    Signed = 1,
    SignedHybrid = 2
};

inline const char* type_name(AdjacencyType type) noexcept {
    switch (type) {
        case AdjacencyType::Unsigned: return "unsigned";
        case AdjacencyType::Signed: return "signed";
        case AdjacencyType::SignedHybrid: return "signed hybrid";
    }
    return "unknown";
}

COEXNET_FORCE_INLINE Real correlation_to_adjacency(Real r, Real power, AdjacencyType type) noexcept {
    r = std::clamp(r, Real(-1), Real(1));
    switch (type) {
        case AdjacencyType::Unsigned:
            return std::pow(std::abs(r), power);
        case AdjacencyType::Signed:
            return std::pow(Real(0.5) + Real(0.5) * r, power);
        case AdjacencyType::SignedHybrid:
            return r > Real(0) ? std::pow(r, power) : Real(0);
    }
    return Real(0);
}

inline void check_power(Real power) {
    if (COEXNET_UNLIKELY(!(power > Real(0)) || !std::isfinite(power))) {
        throw DomainError("AdjacencyTransformer: power must be a positive finite number, got " +
                          std::to_string(power));
    }
}

/// @brief Transform a block of correlation rows into adjacency, in place.
///
/// Row r of the block belongs to gene diag_cols[r] (or row_begin + r when
/// diag_cols is null); that entry becomes 0. Non-finite correlations raise
/// DegenerateInputError with the global position.
inline void transform_rows(
    Real* block,
    Index row_begin,
    Index n_rows,
    Index n_cols,
    Real power,
    AdjacencyType type,
    const Index* diag_cols = nullptr
) {
    for (Index r = 0; r < n_rows; ++r) {
        Real* row = block + r * n_cols;
        for (Index j = 0; j < n_cols; ++j) {
            if (COEXNET_UNLIKELY(!std::isfinite(row[j]))) {
                throw DegenerateInputError(
                    "AdjacencyTransformer: correlation matrix contains non-finite value at (" +
                    std::to_string(row_begin + r) + ", " + std::to_string(j) + ")");
            }
            row[j] = correlation_to_adjacency(row[j], power, type);
        }
        const Index d = diag_cols ? diag_cols[r] : row_begin + r;
        if (d >= 0 && d < n_cols) {
            row[d] = Real(0);
        }
    }
}

/// @brief Adjacency from a square correlation matrix.
inline Matrix adjacency(MatrixView cor, Real power, AdjacencyType type = AdjacencyType::Signed) {
    COEXNET_CHECK_DIM(cor.rows == cor.cols,
        "AdjacencyTransformer: correlation matrix must be square, got " +
        std::to_string(cor.rows) + " x " + std::to_string(cor.cols));
    check_power(power);

    const Index n = cor.rows;
    Matrix adj = Matrix::from(cor.ptr, n, n);
    threading::parallel_for(Size(0), static_cast<Size>(n), [&](size_t i) {
        const auto row = static_cast<Index>(i);
        transform_rows(adj.data() + row * n, row, 1, n, power, type);
    });
    return adj;
}

/// @brief Adjacency straight from a samples x genes expression matrix.
inline Matrix adjacency_from_expression(
    MatrixView expression,
    Real power,
    AdjacencyType type = AdjacencyType::Signed,
    correlation::CorrelationOptions options = {}
) {
    check_power(power);
    options.compute_pvalues = false;
    Matrix adj = correlation::correlate(expression, options).cor;

    const Index n = adj.rows();
    threading::parallel_for(Size(0), static_cast<Size>(n), [&](size_t i) {
        const auto row = static_cast<Index>(i);
        transform_rows(adj.data() + row * n, row, 1, n, power, type);
    });
    return adj;
}

/// @brief Row sums excluding the diagonal.
inline std::vector<Real> connectivity(MatrixView adj) {
    COEXNET_CHECK_DIM(adj.rows == adj.cols, "AdjacencyTransformer: adjacency must be square");
    std::vector<Real> k(static_cast<Size>(adj.rows), Real(0));
    threading::parallel_for(Size(0), static_cast<Size>(adj.rows), [&](size_t i) {
        const auto row = static_cast<Index>(i);
        Real sum = Real(0);
        for (Index j = 0; j < adj.cols; ++j) {
            if (j != row) sum += adj(row, j);
        }
        k[i] = sum;
    });
    return k;
}

} // namespace coexnet::kernel::adjacency
