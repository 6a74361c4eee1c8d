#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/error.hpp"
#include "coexnet/core/macros.hpp"
#include "coexnet/core/dense.hpp"
#include "coexnet/kernel/correlation.hpp"
#include "coexnet/kernel/eigengene.hpp"
#include "coexnet/kernel/modules.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

// =============================================================================
// Module-Trait Correlation, Module Membership (kME), Gene Significance (GS)
//
// All three are column correlations with Student-t p-values:
//   module-trait   cor(eigengenes, traits)       modules x traits
//   kME            cor(expression, eigengenes)   genes x modules
//   GS             cor(expression, trait)        genes x 1
//
// kME is reported against every module, not just the gene's own.
// =============================================================================

namespace coexnet::kernel::membership {

struct ModuleTraitStats {
    std::vector<ModuleId> modules;
    std::vector<std::string> traits;
    Matrix cor;       // modules x traits
    Matrix pvalue;
};

struct MembershipStats {
    std::vector<ModuleId> modules;
    Matrix kme;       // genes x modules
    Matrix pvalue;

    COEXNET_NODISCARD Index column_of(ModuleId id) const noexcept {
        for (Size c = 0; c < modules.size(); ++c) {
            if (modules[c] == id) return static_cast<Index>(c);
        }
        return -1;
    }
};

struct GeneSignificance {
    std::string trait;
    std::vector<Real> gs;
    std::vector<Real> pvalue;
};

/// @brief "ME<label>" column names for an eigengene set.
inline std::vector<std::string> eigengene_names(const std::vector<ModuleId>& modules) {
    std::vector<std::string> names;
    names.reserve(modules.size());
    for (ModuleId id : modules) {
        names.push_back("ME" + modules::display_label(id));
    }
    return names;
}

inline ModuleTraitStats module_trait_correlation(
    const eigengene::EigengeneSet& eigengenes,
    const TraitMatrix& traits,
    correlation::CorrelationOptions options = {}
) {
    COEXNET_CHECK_DIM(eigengenes.eigengenes.rows() == traits.rows(),
        "TraitCorrelator: eigengenes have " + std::to_string(eigengenes.eigengenes.rows()) +
        " samples, traits have " + std::to_string(traits.rows()));

    options.compute_pvalues = true;
    const auto me_names = eigengene_names(eigengenes.modules);
    auto r = correlation::correlate(eigengenes.eigengenes.view(), traits.values.view(), options,
                                    &me_names, &traits.col_names);

    ModuleTraitStats stats;
    stats.modules = eigengenes.modules;
    stats.traits = traits.col_names;
    stats.cor = std::move(r.cor);
    stats.pvalue = std::move(r.pvalue);
    return stats;
}

inline MembershipStats module_membership(
    MatrixView expression,
    const eigengene::EigengeneSet& eigengenes,
    correlation::CorrelationOptions options = {},
    const std::vector<std::string>* gene_names = nullptr
) {
    COEXNET_CHECK_DIM(expression.rows == eigengenes.eigengenes.rows(),
        "MembershipAnalyzer: expression has " + std::to_string(expression.rows) +
        " samples, eigengenes have " + std::to_string(eigengenes.eigengenes.rows()));

    options.compute_pvalues = true;
    const auto me_names = eigengene_names(eigengenes.modules);
    auto r = correlation::correlate(expression, eigengenes.eigengenes.view(), options,
                                    gene_names, &me_names);

    MembershipStats stats;
    stats.modules = eigengenes.modules;
    stats.kme = std::move(r.cor);
    stats.pvalue = std::move(r.pvalue);
    return stats;
}

/// @brief GS of every gene against one trait column.
///
/// A trait with fewer than two distinct observed values has no variance;
/// under UndefinedPolicy::Throw this raises InsufficientSamplesError, under
/// Warn every GS is NaN.
inline GeneSignificance gene_significance(
    const ExpressionMatrix& expression,
    const TraitMatrix& traits,
    const std::string& trait,
    correlation::CorrelationOptions options = {}
) {
    const Index col = traits.find_col(trait);
    if (COEXNET_UNLIKELY(col < 0)) {
        throw ValueError("MembershipAnalyzer: unknown trait '" + trait + "'");
    }
    COEXNET_CHECK_DIM(expression.rows() == traits.rows(),
        "MembershipAnalyzer: expression has " + std::to_string(expression.rows()) +
        " samples, traits have " + std::to_string(traits.rows()));

    Matrix y(traits.rows(), 1);
    Index n_finite = 0;
    Real first = std::numeric_limits<Real>::quiet_NaN();
    bool constant = true;
    for (Index s = 0; s < traits.rows(); ++s) {
        const Real v = traits.values(s, col);
        y(s, 0) = v;
        if (std::isnan(v)) continue;
        if (n_finite == 0) first = v;
        else if (v != first) constant = false;
        ++n_finite;
    }
    if (constant && options.on_undefined == correlation::UndefinedPolicy::Throw) {
        throw InsufficientSamplesError(
            "MembershipAnalyzer: trait '" + trait + "' has a single observed level; "
            "gene significance is undefined");
    }

    options.compute_pvalues = true;
    const std::vector<std::string> trait_name{trait};
    auto r = correlation::correlate(expression.values.view(), y.view(), options,
                                    &expression.col_names, &trait_name);

    GeneSignificance out;
    out.trait = trait;
    out.gs.resize(static_cast<Size>(expression.cols()));
    out.pvalue.resize(static_cast<Size>(expression.cols()));
    for (Index g = 0; g < expression.cols(); ++g) {
        out.gs[static_cast<Size>(g)] = r.cor(g, 0);
        out.pvalue[static_cast<Size>(g)] = r.pvalue(g, 0);
    }
    return out;
}

// =============================================================================
// Gene Table
// =============================================================================

struct GeneRow {
    Index gene = 0;
    std::string name;
    ModuleId module = UNASSIGNED_MODULE;
    std::vector<Real> kme;        // one per MembershipStats::modules
    std::vector<Real> kme_pvalue;
    Real gs = std::numeric_limits<Real>::quiet_NaN();
    Real gs_pvalue = std::numeric_limits<Real>::quiet_NaN();
};

/// @brief One row per gene: merged module, kME/p for every module, GS/p.
///
/// gs may be null when no trait was selected.
inline std::vector<GeneRow> gene_table(
    const std::vector<std::string>& gene_names,
    const std::vector<ModuleId>& labels,
    const MembershipStats& kme,
    const GeneSignificance* gs = nullptr
) {
    const Size n = labels.size();
    COEXNET_CHECK_DIM(gene_names.size() == n && static_cast<Size>(kme.kme.rows()) == n,
        "MembershipAnalyzer: gene table inputs disagree on the number of genes");
    if (gs) {
        COEXNET_CHECK_DIM(gs->gs.size() == n, "MembershipAnalyzer: GS length mismatch");
    }

    const Index k = kme.kme.cols();
    std::vector<GeneRow> rows(n);
    for (Size g = 0; g < n; ++g) {
        GeneRow& row = rows[g];
        const auto gi = static_cast<Index>(g);
        row.gene = gi;
        row.name = gene_names[g];
        row.module = labels[g];
        row.kme.resize(static_cast<Size>(k));
        row.kme_pvalue.resize(static_cast<Size>(k));
        for (Index c = 0; c < k; ++c) {
            row.kme[static_cast<Size>(c)] = kme.kme(gi, c);
            row.kme_pvalue[static_cast<Size>(c)] = kme.pvalue(gi, c);
        }
        if (gs) {
            row.gs = gs->gs[g];
            row.gs_pvalue = gs->pvalue[g];
        }
    }
    return rows;
}

} // namespace coexnet::kernel::membership
