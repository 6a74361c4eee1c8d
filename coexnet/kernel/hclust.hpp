#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/error.hpp"
#include "coexnet/core/macros.hpp"
#include "coexnet/core/dense.hpp"
#include "coexnet/threading/parallel_for.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

// =============================================================================
// Average-Linkage Hierarchical Clustering
//
// Lance-Williams update d(i+j, k) = (n_i d(i,k) + n_j d(j,k)) / (n_i + n_j)
// over a working copy of the dissimilarity matrix, with a nearest-neighbour
// cache per active cluster:
//   - the global minimum is a scan of the cache, O(n) per merge
//   - a row is rescanned only when its cached neighbour took part in the merge
//
// Ties resolve to the lowest row index, then the lowest column index, so the
// tree is a deterministic function of the input.
// =============================================================================

namespace coexnet::kernel::hclust {

namespace config {
    constexpr Index PARALLEL_THRESHOLD = 2048;
    constexpr Real SYMMETRY_TOLERANCE = Real(1e-8);
}

/// @brief Binary merge tree.
///
/// Node ids: leaves are 0..n_leaves-1, the node created by merge s is
/// n_leaves + s. heights are non-decreasing; order lists the leaves so that
/// every branch is contiguous.
struct Dendrogram {
    Index n_leaves = 0;
    std::vector<std::array<Index, 2>> merges;
    std::vector<Real> heights;
    std::vector<Index> sizes;
    std::vector<Index> order;

    COEXNET_NODISCARD Index n_merges() const noexcept {
        return static_cast<Index>(merges.size());
    }

    COEXNET_NODISCARD bool is_leaf(Index node) const noexcept {
        return node < n_leaves;
    }

    COEXNET_NODISCARD Index root() const noexcept {
        return merges.empty() ? (n_leaves > 0 ? 0 : -1) : n_leaves + n_merges() - 1;
    }

    /// @brief Leaves under a node, left subtree first.
    COEXNET_NODISCARD std::vector<Index> leaves_of(Index node) const {
        std::vector<Index> out;
        if (node < 0) return out;
        std::vector<Index> stack{node};
        while (!stack.empty()) {
            const Index v = stack.back();
            stack.pop_back();
            if (is_leaf(v)) {
                out.push_back(v);
            } else {
                const auto& m = merges[static_cast<Size>(v - n_leaves)];
                stack.push_back(m[1]);
                stack.push_back(m[0]);
            }
        }
        return out;
    }
};

namespace detail {

inline void validate_dissimilarity(MatrixView d) {
    COEXNET_CHECK_DIM(d.rows == d.cols,
        "ModuleDetector: dissimilarity must be square, got " + std::to_string(d.rows) +
        " x " + std::to_string(d.cols));

    const auto bad = find_non_finite(d);
    if (COEXNET_UNLIKELY(bad.first >= 0)) {
        throw DegenerateInputError(
            "ModuleDetector: dissimilarity contains non-finite value at (" +
            std::to_string(bad.first) + ", " + std::to_string(bad.second) + ")");
    }

    for (Index i = 0; i < d.rows; ++i) {
        for (Index j = i + 1; j < d.cols; ++j) {
            if (COEXNET_UNLIKELY(std::abs(d(i, j) - d(j, i)) > config::SYMMETRY_TOLERANCE)) {
                throw ValueError("ModuleDetector: dissimilarity is not symmetric at (" +
                                 std::to_string(i) + ", " + std::to_string(j) + ")");
            }
        }
    }
}

} // namespace detail

/// @brief UPGMA tree of an n x n dissimilarity matrix.
///
/// Throws DegenerateInputError on NaN/inf entries.
inline Dendrogram average_linkage(MatrixView dissim) {
    detail::validate_dissimilarity(dissim);

    const Index n = dissim.rows;
    Dendrogram tree;
    tree.n_leaves = n;
    if (n <= 1) {
        for (Index i = 0; i < n; ++i) tree.order.push_back(i);
        return tree;
    }

    Matrix d = Matrix::from(dissim.ptr, n, n);
    std::vector<Index> size(static_cast<Size>(n), 1);
    std::vector<Index> node(static_cast<Size>(n));
    std::vector<std::uint8_t> active(static_cast<Size>(n), 1);
    std::vector<Index> nn_idx(static_cast<Size>(n), -1);
    std::vector<Real> nn_dist(static_cast<Size>(n), std::numeric_limits<Real>::infinity());

    for (Index i = 0; i < n; ++i) {
        node[static_cast<Size>(i)] = i;
    }

    auto rescan = [&](Index i) {
        Real best = std::numeric_limits<Real>::infinity();
        Index best_j = -1;
        const Real* row = d.data() + i * n;
        for (Index j = 0; j < n; ++j) {
            if (j == i || !active[static_cast<Size>(j)]) continue;
            if (row[j] < best) {
                best = row[j];
                best_j = j;
            }
        }
        nn_dist[static_cast<Size>(i)] = best;
        nn_idx[static_cast<Size>(i)] = best_j;
    };

    threading::parallel_for(Size(0), static_cast<Size>(n), [&](size_t i) {
        rescan(static_cast<Index>(i));
    });

    tree.merges.reserve(static_cast<Size>(n - 1));
    tree.heights.reserve(static_cast<Size>(n - 1));
    tree.sizes.reserve(static_cast<Size>(n - 1));

    for (Index step = 0; step < n - 1; ++step) {
        Index best_i = -1;
        Real best_d = std::numeric_limits<Real>::infinity();
        for (Index i = 0; i < n; ++i) {
            if (active[static_cast<Size>(i)] && (best_i < 0 || nn_dist[static_cast<Size>(i)] < best_d)) {
                best_i = i;
                best_d = nn_dist[static_cast<Size>(i)];
            }
        }
        COEXNET_ASSERT(best_i >= 0 && nn_idx[static_cast<Size>(best_i)] >= 0,
                       "average_linkage: no active pair left");

        const Index i = std::min(best_i, nn_idx[static_cast<Size>(best_i)]);
        const Index j = std::max(best_i, nn_idx[static_cast<Size>(best_i)]);
        const Index si = size[static_cast<Size>(i)];
        const Index sj = size[static_cast<Size>(j)];

        tree.merges.push_back({node[static_cast<Size>(i)], node[static_cast<Size>(j)]});
        tree.heights.push_back(best_d);
        tree.sizes.push_back(si + sj);

        const Real wi = static_cast<Real>(si) / static_cast<Real>(si + sj);
        const Real wj = static_cast<Real>(sj) / static_cast<Real>(si + sj);
        for (Index k = 0; k < n; ++k) {
            if (k == i || k == j || !active[static_cast<Size>(k)]) continue;
            const Real v = wi * d(i, k) + wj * d(j, k);
            d(i, k) = v;
            d(k, i) = v;
        }

        size[static_cast<Size>(i)] = si + sj;
        active[static_cast<Size>(j)] = 0;
        node[static_cast<Size>(i)] = n + step;
        rescan(i);

        auto refresh = [&](Index k) {
            if (k == i || !active[static_cast<Size>(k)]) return;
            const Index cached = nn_idx[static_cast<Size>(k)];
            if (cached == i || cached == j) {
                rescan(k);
                return;
            }
            const Real v = d(k, i);
            if (v < nn_dist[static_cast<Size>(k)] || (v == nn_dist[static_cast<Size>(k)] && i < cached)) {
                nn_dist[static_cast<Size>(k)] = v;
                nn_idx[static_cast<Size>(k)] = i;
            }
        };

        if (n >= config::PARALLEL_THRESHOLD) {
            threading::parallel_for(Size(0), static_cast<Size>(n), [&](size_t k) {
                refresh(static_cast<Index>(k));
            });
        } else {
            for (Index k = 0; k < n; ++k) {
                refresh(k);
            }
        }
    }

    tree.order = tree.leaves_of(tree.root());
    return tree;
}

} // namespace coexnet::kernel::hclust
