#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/error.hpp"
#include "coexnet/core/macros.hpp"
#include "coexnet/core/dense.hpp"
#include "coexnet/core/vectorize.hpp"
#include "coexnet/kernel/adjacency.hpp"
#include "coexnet/kernel/correlation.hpp"
#include "coexnet/math/eigen.hpp"
#include "coexnet/threading/parallel_for.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

// =============================================================================
// Topological Overlap
//
//   TOM_ij = (l_ij + a_ij) / (min(k_i, k_j) + 1 - a_ij),   TOM_ii = 1
//   l_ij   = sum_u a_iu a_uj      (L = A * A, diagonal of A is zero)
//   k_i    = sum_u a_iu
//
// Key Optimizations:
// 1. Shared-neighbour sums as a dense GEMM
//    - Row blocks of L = A * A written straight into the output rows
//    - Blocks are independent and run in parallel
//
// 2. Block TOM for a gene subset
//    - Only the |B| x n adjacency strip is formed; l and k still run over
//      all n genes, so no cross-block neighbours are lost
// =============================================================================

namespace coexnet::kernel::tom {

namespace config {
    constexpr Index DEFAULT_ROW_BLOCK = 512;
    constexpr Real RANGE_TOLERANCE = Real(1e-10);
}

namespace detail {

inline void validate_adjacency(MatrixView adj) {
    COEXNET_CHECK_DIM(adj.rows == adj.cols,
        "TOM: adjacency must be square, got " + std::to_string(adj.rows) +
        " x " + std::to_string(adj.cols));

    const auto bad = find_non_finite(adj);
    if (COEXNET_UNLIKELY(bad.first >= 0)) {
        throw DegenerateInputError(
            "TOM: adjacency contains non-finite value at (" + std::to_string(bad.first) +
            ", " + std::to_string(bad.second) + ")");
    }

    for (Index i = 0; i < adj.rows; ++i) {
        for (Index j = 0; j < adj.cols; ++j) {
            const Real a = adj(i, j);
            if (COEXNET_UNLIKELY(a < -config::RANGE_TOLERANCE || a > Real(1) + config::RANGE_TOLERANCE)) {
                throw DomainError(
                    "TOM: adjacency entry (" + std::to_string(i) + ", " + std::to_string(j) +
                    ") = " + std::to_string(a) + " is outside [0, 1]");
            }
        }
    }
}

// In place: rows of L -> rows of TOM. a_row(r, j) reads the adjacency entry.
template <typename AdjAt>
COEXNET_FORCE_INLINE void finish_rows(
    Real* block,
    Index n_rows,
    Index n_cols,
    const Real* k_rows,
    const Real* k_cols,
    const Index* diag_cols,
    AdjAt&& a_at
) {
    for (Index r = 0; r < n_rows; ++r) {
        Real* row = block + r * n_cols;
        const Real ki = k_rows[r];
        for (Index j = 0; j < n_cols; ++j) {
            const Real a = a_at(r, j);
            const Real denom = std::min(ki, k_cols[j]) + Real(1) - a;
            const Real t = denom > Real(0) ? (row[j] + a) / denom : Real(0);
            row[j] = std::clamp(t, Real(0), Real(1));
        }
        row[diag_cols[r]] = Real(1);
    }
}

inline void mirror_upper(Matrix& m) {
    const Index n = m.rows();
    threading::parallel_for(Size(0), static_cast<Size>(n), [&](size_t i) {
        const auto row = static_cast<Index>(i);
        for (Index j = 0; j < row; ++j) {
            m(row, j) = m(j, row);
        }
    });
}

} // namespace detail

/// @brief Full TOM of an n x n adjacency matrix.
///
/// The diagonal of the input is ignored (treated as 0). Throws
/// DegenerateInputError on NaN/inf and DomainError on entries outside [0, 1].
inline Matrix topological_overlap(MatrixView adj, Index row_block = config::DEFAULT_ROW_BLOCK) {
    detail::validate_adjacency(adj);
    COEXNET_CHECK_ARG(row_block > 0, "TOM: row block must be positive");

    const Index n = adj.rows;
    Matrix tom(n, n);
    if (n == 0) {
        return tom;
    }

    // Zero-diagonal working copy
    Matrix a = Matrix::from(adj.ptr, n, n);
    for (Index i = 0; i < n; ++i) {
        a(i, i) = Real(0);
    }

    std::vector<Real> k(static_cast<Size>(n));
    std::vector<Index> diag(static_cast<Size>(n));
    threading::parallel_for(Size(0), static_cast<Size>(n), [&](size_t i) {
        k[i] = vectorize::sum(Array<const Real>(a.row(static_cast<Index>(i))));
        diag[i] = static_cast<Index>(i);
    });

    const auto A = math::map(a);
    const Index n_blocks = (n + row_block - 1) / row_block;

    threading::parallel_for(Size(0), static_cast<Size>(n_blocks), [&](size_t b) {
        const Index r0 = static_cast<Index>(b) * row_block;
        const Index rb = std::min(row_block, n - r0);

        auto out = math::map_rows(tom.data(), r0, rb, n);
        out.noalias() = A.middleRows(r0, rb) * A;

        detail::finish_rows(out.data(), rb, n, k.data() + r0, k.data(), diag.data() + r0,
            [&](Index r, Index j) { return a(r0 + r, j); });
    });

    detail::mirror_upper(tom);
    return tom;
}

/// @brief TOM among the genes in `genes`, with neighbours counted over all genes.
///
/// Builds the |B| x n adjacency strip from expression, then
/// L_BB = S * S^T and k_B = row sums of S. Memory is |B| x n + |B|^2.
inline Matrix block_topological_overlap(
    MatrixView expression,
    const std::vector<Index>& genes,
    Real power,
    adjacency::AdjacencyType type = adjacency::AdjacencyType::Signed,
    correlation::CorrelationOptions options = {}
) {
    adjacency::check_power(power);
    const Index n = expression.cols;
    const auto m = static_cast<Index>(genes.size());
    for (Index g : genes) {
        if (COEXNET_UNLIKELY(g < 0 || g >= n)) {
            throw IndexOutOfBoundsError("TOM: gene index " + std::to_string(g) +
                                        " out of range [0, " + std::to_string(n) + ")");
        }
    }

    Matrix tom(m, m);
    if (m == 0) {
        return tom;
    }

    // Expression restricted to the block, samples x |B|
    Matrix sub(expression.rows, m);
    for (Index s = 0; s < expression.rows; ++s) {
        for (Index c = 0; c < m; ++c) {
            sub(s, c) = expression(s, genes[static_cast<Size>(c)]);
        }
    }

    const correlation::PreparedColumns p_all = correlation::prepare_columns(expression, options.type);
    const correlation::PreparedColumns p_block = correlation::prepare_columns(sub.view(), options.type);

    Matrix strip(m, n);
    correlation::correlate_rows(p_block, 0, m, p_all, strip.data(), nullptr);
    adjacency::transform_rows(strip.data(), 0, m, n, power, type, genes.data());

    std::vector<Real> k(static_cast<Size>(m));
    for (Index r = 0; r < m; ++r) {
        k[static_cast<Size>(r)] = vectorize::sum(Array<const Real>(strip.row(r)));
    }

    const auto S = math::map(strip);
    math::map(tom).noalias() = S * S.transpose();

    std::vector<Index> diag(static_cast<Size>(m));
    for (Index r = 0; r < m; ++r) {
        diag[static_cast<Size>(r)] = r;
    }
    detail::finish_rows(tom.data(), m, m, k.data(), k.data(), diag.data(),
        [&](Index r, Index j) { return strip(r, genes[static_cast<Size>(j)]); });

    detail::mirror_upper(tom);
    return tom;
}

/// @brief 1 - TOM.
inline Matrix tom_dissimilarity(MatrixView tom) {
    Matrix dissim(tom.rows, tom.cols);
    threading::parallel_for(Size(0), static_cast<Size>(tom.rows), [&](size_t i) {
        const auto row = static_cast<Index>(i);
        for (Index j = 0; j < tom.cols; ++j) {
            dissim(row, j) = Real(1) - tom(row, j);
        }
    });
    return dissim;
}

} // namespace coexnet::kernel::tom
