#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/error.hpp"
#include "coexnet/core/macros.hpp"
#include "coexnet/core/dense.hpp"
#include "coexnet/math/eigen.hpp"
#include "coexnet/threading/parallel_for.hpp"

#include <Eigen/SVD>

#include <cmath>
#include <map>
#include <string>
#include <vector>

// =============================================================================
// Module Eigengenes
//
// The eigengene of a module is the first left singular vector of its
// column-standardized expression submatrix, rescaled to mean 0 and unit
// variance. Its sign is chosen so that it correlates positively with the
// module's average standardized expression; when that average is constant
// the sum of gene loadings decides instead.
// =============================================================================

namespace coexnet::kernel::eigengene {

struct Eigengene {
    std::vector<Real> values;          // one per sample
    std::vector<Real> average;         // mean standardized expression per sample
    Real variance_explained = 0;       // s1^2 / sum s^2
};

/// @brief Eigengenes of several modules, samples x modules.
struct EigengeneSet {
    std::vector<ModuleId> modules;
    Matrix eigengenes;
    Matrix average_expression;
    std::vector<Real> variance_explained;

    /// @brief Column of a module id, or -1.
    COEXNET_NODISCARD Index column_of(ModuleId id) const noexcept {
        for (Size c = 0; c < modules.size(); ++c) {
            if (modules[c] == id) return static_cast<Index>(c);
        }
        return -1;
    }
};

/// @brief Gene indices per module id, in ascending gene order.
inline std::map<ModuleId, std::vector<Index>> group_by_module(const std::vector<ModuleId>& labels) {
    std::map<ModuleId, std::vector<Index>> groups;
    for (Size g = 0; g < labels.size(); ++g) {
        groups[labels[g]].push_back(static_cast<Index>(g));
    }
    return groups;
}

namespace detail {

inline std::string gene_label(const std::vector<std::string>* names, Index g) {
    if (names && static_cast<Size>(g) < names->size()) {
        return "'" + (*names)[static_cast<Size>(g)] + "'";
    }
    return "gene " + std::to_string(g);
}

// Center and scale to unit sample variance; returns false for zero spread
inline bool standardize(Real* v, Index n) noexcept {
    Real mean = 0;
    for (Index i = 0; i < n; ++i) mean += v[i];
    mean /= static_cast<Real>(n);
    Real ss = 0;
    for (Index i = 0; i < n; ++i) {
        v[i] -= mean;
        ss += v[i] * v[i];
    }
    const Real sd = std::sqrt(ss / static_cast<Real>(n - 1));
    if (!(sd > Real(0))) {
        return false;
    }
    for (Index i = 0; i < n; ++i) v[i] /= sd;
    return true;
}

} // namespace detail

/// @brief Eigengene of the genes listed in `genes`.
///
/// Throws InsufficientSamplesError for fewer than 2 samples and
/// DegenerateInputError for a non-finite or zero-variance gene. A single gene
/// yields its own standardized expression.
inline Eigengene module_eigengene(
    MatrixView expression,
    const std::vector<Index>& genes,
    const std::vector<std::string>* gene_names = nullptr
) {
    const Index n = expression.rows;
    const auto m = static_cast<Index>(genes.size());
    COEXNET_CHECK_ARG(m > 0, "EigengeneCalculator: module has no genes");
    if (COEXNET_UNLIKELY(n < 2)) {
        throw InsufficientSamplesError("EigengeneCalculator: need at least 2 samples, got " +
                                       std::to_string(n));
    }

    math::ColMatrix x(n, m);
    for (Index c = 0; c < m; ++c) {
        const Index g = genes[static_cast<Size>(c)];
        if (COEXNET_UNLIKELY(g < 0 || g >= expression.cols)) {
            throw IndexOutOfBoundsError("EigengeneCalculator: gene index " + std::to_string(g) +
                                        " out of range");
        }
        for (Index s = 0; s < n; ++s) {
            const Real v = expression(s, g);
            if (COEXNET_UNLIKELY(!std::isfinite(v))) {
                throw DegenerateInputError(
                    "EigengeneCalculator: expression of " + detail::gene_label(gene_names, g) +
                    " is non-finite in sample " + std::to_string(s));
            }
            x(s, c) = v;
        }
        if (COEXNET_UNLIKELY(!detail::standardize(x.col(c).data(), n))) {
            throw DegenerateInputError("EigengeneCalculator: " + detail::gene_label(gene_names, g) +
                                       " has zero variance");
        }
    }

    Eigengene out;
    out.values.resize(static_cast<Size>(n));
    out.average.resize(static_cast<Size>(n));

    math::Vector avg = x.rowwise().mean();
    for (Index s = 0; s < n; ++s) {
        out.average[static_cast<Size>(s)] = avg(s);
    }

    if (m == 1) {
        for (Index s = 0; s < n; ++s) {
            out.values[static_cast<Size>(s)] = x(s, 0);
        }
        out.variance_explained = Real(1);
        return out;
    }

    Eigen::BDCSVD<math::ColMatrix> svd(x, Eigen::ComputeThinU | Eigen::ComputeThinV);
    const auto& sv = svd.singularValues();
    const Real total = sv.squaredNorm();
    out.variance_explained = total > Real(0) ? sv(0) * sv(0) / total : Real(0);

    math::Vector u = svd.matrixU().col(0);
    if (COEXNET_UNLIKELY(!detail::standardize(u.data(), n))) {
        throw DegenerateInputError("EigengeneCalculator: module expression has no variance");
    }

    // Orientation
    Real sign_score = u.dot(avg - math::Vector::Constant(n, avg.mean()));
    if (std::abs(sign_score) <= Real(1e-12) * static_cast<Real>(n)) {
        sign_score = svd.matrixV().col(0).sum();
    }
    if (sign_score < Real(0)) {
        u = -u;
    }

    for (Index s = 0; s < n; ++s) {
        out.values[static_cast<Size>(s)] = u(s);
    }
    return out;
}

/// @brief Eigengenes of every module in `labels` (ascending id).
///
/// UNASSIGNED_MODULE is skipped unless include_unassigned is set.
inline EigengeneSet module_eigengenes(
    MatrixView expression,
    const std::vector<ModuleId>& labels,
    bool include_unassigned = false,
    const std::vector<std::string>* gene_names = nullptr
) {
    COEXNET_CHECK_DIM(static_cast<Index>(labels.size()) == expression.cols,
        "EigengeneCalculator: " + std::to_string(labels.size()) + " labels for " +
        std::to_string(expression.cols) + " genes");

    const auto groups = group_by_module(labels);

    EigengeneSet set;
    std::vector<const std::vector<Index>*> members;
    for (const auto& [id, genes] : groups) {
        if (id == UNASSIGNED_MODULE && !include_unassigned) continue;
        set.modules.push_back(id);
        members.push_back(&genes);
    }

    const Index n = expression.rows;
    const auto k = static_cast<Index>(set.modules.size());
    set.eigengenes = Matrix(n, k);
    set.average_expression = Matrix(n, k);
    set.variance_explained.assign(static_cast<Size>(k), Real(0));

    threading::parallel_for(Size(0), static_cast<Size>(k), [&](size_t c) {
        const Eigengene me = module_eigengene(expression, *members[c], gene_names);
        const auto col = static_cast<Index>(c);
        for (Index s = 0; s < n; ++s) {
            set.eigengenes(s, col) = me.values[static_cast<Size>(s)];
            set.average_expression(s, col) = me.average[static_cast<Size>(s)];
        }
        set.variance_explained[c] = me.variance_explained;
    });
    return set;
}

} // namespace coexnet::kernel::eigengene
