// =============================================================================
// FILE: coexnet/binding/c_api/network.cpp
// BRIEF: C API implementation for co-expression network analysis
// =============================================================================

#include "coexnet/binding/c_api/network.h"
#include "coexnet/binding/c_api/core/internal.hpp"
#include "coexnet/kernel/correlation.hpp"
#include "coexnet/kernel/adjacency.hpp"
#include "coexnet/kernel/soft_threshold.hpp"
#include "coexnet/kernel/tom.hpp"
#include "coexnet/kernel/modules.hpp"
#include "coexnet/kernel/eigengene.hpp"
#include "coexnet/kernel/membership.hpp"
#include "coexnet/kernel/hub_genes.hpp"
#include "coexnet/core/memory.hpp"
#include "coexnet/core/type.hpp"
#include "coexnet/core/error.hpp"

#include <optional>
#include <vector>

using namespace coexnet;
using namespace coexnet::binding;

namespace {

namespace cor = coexnet::kernel::correlation;
namespace adj = coexnet::kernel::adjacency;

[[nodiscard]] auto convert_correlation_type(coexnet_correlation_t t) -> cor::CorrelationType {
    switch (t) {
        case COEXNET_PEARSON:  return cor::CorrelationType::Pearson;
        case COEXNET_SPEARMAN: return cor::CorrelationType::Spearman;
        case COEXNET_BICOR:    return cor::CorrelationType::Bicor;
        default:
            throw ValueError("coexnet: unknown correlation type " + std::to_string(static_cast<int>(t)));
    }
}

[[nodiscard]] auto convert_network_type(coexnet_network_t t) -> adj::AdjacencyType {
    switch (t) {
        case COEXNET_UNSIGNED:      return adj::AdjacencyType::Unsigned;
        case COEXNET_SIGNED:        return adj::AdjacencyType::Signed;
        case COEXNET_SIGNED_HYBRID: return adj::AdjacencyType::SignedHybrid;
        default:
            throw ValueError("coexnet: unknown network type " + std::to_string(static_cast<int>(t)));
    }
}

[[nodiscard]] auto correlation_options(coexnet_correlation_t type, coexnet_undefined_t on_undefined)
    -> cor::CorrelationOptions {
    cor::CorrelationOptions opts;
    opts.type = convert_correlation_type(type);
    opts.on_undefined = on_undefined == COEXNET_UNDEFINED_WARN
        ? cor::UndefinedPolicy::Warn : cor::UndefinedPolicy::Throw;
    return opts;
}

[[nodiscard]] auto eigengene_set(const coexnet_real_t* eigengenes, const coexnet_index_t* module_ids,
                                 coexnet_index_t n_samples, coexnet_index_t n_modules)
    -> kernel::eigengene::EigengeneSet {
    kernel::eigengene::EigengeneSet set;
    set.eigengenes = Matrix::from(eigengenes, n_samples, n_modules);
    if (module_ids) {
        set.modules.assign(module_ids, module_ids + n_modules);
    } else {
        for (Index c = 0; c < n_modules; ++c) set.modules.push_back(c + 1);
    }
    return set;
}

} // anonymous namespace

extern "C" {

// =============================================================================
// Correlation
// =============================================================================

COEXNET_EXPORT coexnet_error_t coexnet_correlate(
    const coexnet_real_t* x,
    const coexnet_index_t n_samples,
    const coexnet_index_t n_x,
    const coexnet_real_t* y,
    const coexnet_index_t n_y,
    const coexnet_correlation_t type,
    const coexnet_undefined_t on_undefined,
    coexnet_real_t* cor_out,
    coexnet_real_t* pvalue,
    coexnet_index_t* n_obs) {

    COEXNET_C_API_CHECK_NULL(x, "Expression matrix X is null");
    COEXNET_C_API_CHECK_NULL(cor_out, "Output correlation matrix is null");
    COEXNET_C_API_CHECK(n_samples > 0 && n_x > 0, COEXNET_ERROR_INVALID_ARGUMENT,
                        "Dimensions must be positive");
    COEXNET_C_API_CHECK(y == nullptr || n_y > 0, COEXNET_ERROR_INVALID_ARGUMENT,
                        "Y must have at least one column");

    COEXNET_C_API_TRY
        auto opts = correlation_options(type, on_undefined);
        opts.compute_pvalues = pvalue != nullptr;

        const cor::CorrelationResult r = y == nullptr
            ? cor::correlate(dense_view(x, n_samples, n_x), opts)
            : cor::correlate(dense_view(x, n_samples, n_x), dense_view(y, n_samples, n_y), opts);

        memory::copy(r.cor.data(), cor_out, r.cor.size());
        if (pvalue) {
            memory::copy(r.pvalue.data(), pvalue, r.pvalue.size());
        }
        if (n_obs) {
            memory::copy(r.n_obs.data(), n_obs, r.n_obs.size());
        }
        COEXNET_C_API_RETURN_OK;
    COEXNET_C_API_CATCH
}

// =============================================================================
// Soft Threshold
// =============================================================================

COEXNET_EXPORT coexnet_error_t coexnet_soft_threshold(
    const coexnet_real_t* expression,
    const coexnet_index_t n_samples,
    const coexnet_index_t n_genes,
    const coexnet_real_t* powers,
    const coexnet_index_t n_powers,
    const coexnet_network_t network,
    const coexnet_correlation_t type,
    coexnet_real_t* table) {

    COEXNET_C_API_CHECK_NULL(expression, "Expression matrix is null");
    COEXNET_C_API_CHECK_NULL(powers, "Powers array is null");
    COEXNET_C_API_CHECK_NULL(table, "Output table is null");
    COEXNET_C_API_CHECK(n_samples > 0 && n_genes > 0 && n_powers > 0, COEXNET_ERROR_INVALID_ARGUMENT,
                        "Dimensions must be positive");

    COEXNET_C_API_TRY
        kernel::soft_threshold::SoftThresholdOptions opts;
        opts.powers.assign(powers, powers + n_powers);
        opts.network = convert_network_type(network);
        opts.correlation = correlation_options(type, COEXNET_UNDEFINED_THROW);

        const auto rows = kernel::soft_threshold::pick_soft_threshold(
            dense_view(expression, n_samples, n_genes), opts);

        for (Size i = 0; i < rows.size(); ++i) {
            coexnet_real_t* out = table + i * COEXNET_SOFT_THRESHOLD_COLUMNS;
            out[0] = rows[i].power;
            out[1] = rows[i].signed_r2;
            out[2] = rows[i].slope;
            out[3] = rows[i].truncated_r2;
            out[4] = rows[i].mean_k;
            out[5] = rows[i].median_k;
            out[6] = rows[i].max_k;
        }
        COEXNET_C_API_RETURN_OK;
    COEXNET_C_API_CATCH
}

COEXNET_EXPORT coexnet_error_t coexnet_advise_power(
    const coexnet_real_t* table,
    const coexnet_index_t n_rows,
    const coexnet_real_t r2_target,
    const coexnet_real_t max_mean_k,
    coexnet_real_t* power,
    coexnet_bool_t* found) {

    COEXNET_C_API_CHECK_NULL(table, "Soft-threshold table is null");
    COEXNET_C_API_CHECK_NULL(power, "Output power is null");
    COEXNET_C_API_CHECK_NULL(found, "Output flag is null");
    COEXNET_C_API_CHECK(n_rows >= 0, COEXNET_ERROR_INVALID_ARGUMENT, "n_rows must be non-negative");

    COEXNET_C_API_TRY
        std::vector<kernel::soft_threshold::SoftThresholdRow> rows(static_cast<Size>(n_rows));
        for (Index i = 0; i < n_rows; ++i) {
            const coexnet_real_t* in = table + i * COEXNET_SOFT_THRESHOLD_COLUMNS;
            auto& row = rows[static_cast<Size>(i)];
            row.power = in[0];
            row.signed_r2 = in[1];
            row.slope = in[2];
            row.truncated_r2 = in[3];
            row.mean_k = in[4];
            row.median_k = in[5];
            row.max_k = in[6];
        }

        std::optional<Real> cap;
        if (max_mean_k > 0) cap = max_mean_k;
        const auto advice = kernel::soft_threshold::advise_power(rows, r2_target, cap);

        *found = advice.power ? COEXNET_TRUE : COEXNET_FALSE;
        if (advice.power) {
            *power = *advice.power;
        }
        COEXNET_C_API_RETURN_OK;
    COEXNET_C_API_CATCH
}

// =============================================================================
// Adjacency / TOM
// =============================================================================

COEXNET_EXPORT coexnet_error_t coexnet_adjacency(
    const coexnet_real_t* cor_in,
    const coexnet_index_t n,
    const coexnet_real_t power,
    const coexnet_network_t network,
    coexnet_real_t* adjacency) {

    COEXNET_C_API_CHECK_NULL(cor_in, "Correlation matrix is null");
    COEXNET_C_API_CHECK_NULL(adjacency, "Output adjacency matrix is null");
    COEXNET_C_API_CHECK(n > 0, COEXNET_ERROR_INVALID_ARGUMENT, "n must be positive");

    COEXNET_C_API_TRY
        const Matrix a = adj::adjacency(dense_view(cor_in, n, n), power, convert_network_type(network));
        memory::copy(a.data(), adjacency, a.size());
        COEXNET_C_API_RETURN_OK;
    COEXNET_C_API_CATCH
}

COEXNET_EXPORT coexnet_error_t coexnet_tom(
    const coexnet_real_t* adjacency,
    const coexnet_index_t n,
    coexnet_real_t* tom) {

    COEXNET_C_API_CHECK_NULL(adjacency, "Adjacency matrix is null");
    COEXNET_C_API_CHECK_NULL(tom, "Output TOM is null");
    COEXNET_C_API_CHECK(n > 0, COEXNET_ERROR_INVALID_ARGUMENT, "n must be positive");

    COEXNET_C_API_TRY
        const Matrix t = kernel::tom::topological_overlap(dense_view(adjacency, n, n));
        memory::copy(t.data(), tom, t.size());
        COEXNET_C_API_RETURN_OK;
    COEXNET_C_API_CATCH
}

// =============================================================================
// Modules
// =============================================================================

COEXNET_EXPORT coexnet_error_t coexnet_detect_modules(
    const coexnet_real_t* dissimilarity,
    const coexnet_index_t n,
    const coexnet_index_t min_module_size,
    const int deep_split,
    const coexnet_real_t cut_height,
    const coexnet_bool_t pam_stage,
    coexnet_index_t* labels,
    coexnet_index_t* n_modules) {

    COEXNET_C_API_CHECK_NULL(dissimilarity, "Dissimilarity matrix is null");
    COEXNET_C_API_CHECK_NULL(labels, "Output labels are null");
    COEXNET_C_API_CHECK_NULL(n_modules, "Output module count is null");
    COEXNET_C_API_CHECK(n > 0, COEXNET_ERROR_INVALID_ARGUMENT, "n must be positive");

    COEXNET_C_API_TRY
        kernel::tree_cut::TreeCutOptions opts;
        opts.min_module_size = min_module_size;
        opts.deep_split = deep_split;
        opts.cut_height = cut_height;
        opts.pam_stage = pam_stage != COEXNET_FALSE;

        const auto result = kernel::modules::detect_modules_from_dissimilarity(
            dense_view(dissimilarity, n, n), opts);
        for (Index g = 0; g < n; ++g) {
            labels[g] = result.labels[static_cast<Size>(g)];
        }
        *n_modules = result.n_modules;
        COEXNET_C_API_RETURN_OK;
    COEXNET_C_API_CATCH
}

COEXNET_EXPORT coexnet_error_t coexnet_module_eigengene(
    const coexnet_real_t* expression,
    const coexnet_index_t n_samples,
    const coexnet_index_t n_genes,
    const coexnet_index_t* genes,
    const coexnet_index_t n_module_genes,
    coexnet_real_t* eigengene,
    coexnet_real_t* variance_explained) {

    COEXNET_C_API_CHECK_NULL(expression, "Expression matrix is null");
    COEXNET_C_API_CHECK_NULL(genes, "Gene list is null");
    COEXNET_C_API_CHECK_NULL(eigengene, "Output eigengene is null");
    COEXNET_C_API_CHECK(n_samples > 0 && n_genes > 0 && n_module_genes > 0,
                        COEXNET_ERROR_INVALID_ARGUMENT, "Dimensions must be positive");

    COEXNET_C_API_TRY
        const std::vector<Index> members(genes, genes + n_module_genes);
        const auto me = kernel::eigengene::module_eigengene(
            dense_view(expression, n_samples, n_genes), members);
        memory::copy(me.values.data(), eigengene, me.values.size());
        if (variance_explained) {
            *variance_explained = me.variance_explained;
        }
        COEXNET_C_API_RETURN_OK;
    COEXNET_C_API_CATCH
}

COEXNET_EXPORT coexnet_error_t coexnet_merge_modules(
    const coexnet_real_t* expression,
    const coexnet_index_t n_samples,
    const coexnet_index_t n_genes,
    const coexnet_index_t* labels,
    const coexnet_real_t cut_height,
    coexnet_index_t* merged,
    coexnet_index_t* n_modules) {

    COEXNET_C_API_CHECK_NULL(expression, "Expression matrix is null");
    COEXNET_C_API_CHECK_NULL(labels, "Input labels are null");
    COEXNET_C_API_CHECK_NULL(merged, "Output labels are null");
    COEXNET_C_API_CHECK_NULL(n_modules, "Output module count is null");
    COEXNET_C_API_CHECK(n_samples > 0 && n_genes > 0, COEXNET_ERROR_INVALID_ARGUMENT,
                        "Dimensions must be positive");

    COEXNET_C_API_TRY
        const std::vector<ModuleId> in(labels, labels + n_genes);
        const auto result = kernel::modules::merge_close_modules(
            dense_view(expression, n_samples, n_genes), in, cut_height);
        for (Index g = 0; g < n_genes; ++g) {
            merged[g] = result.labels[static_cast<Size>(g)];
        }
        *n_modules = kernel::modules::count_modules(result.labels);
        COEXNET_C_API_RETURN_OK;
    COEXNET_C_API_CATCH
}

// =============================================================================
// Membership and Significance
// =============================================================================

COEXNET_EXPORT coexnet_error_t coexnet_module_membership(
    const coexnet_real_t* expression,
    const coexnet_index_t n_samples,
    const coexnet_index_t n_genes,
    const coexnet_real_t* eigengenes,
    const coexnet_index_t* module_ids,
    const coexnet_index_t n_modules,
    const coexnet_correlation_t type,
    const coexnet_undefined_t on_undefined,
    coexnet_real_t* kme,
    coexnet_real_t* kme_pvalue) {

    COEXNET_C_API_CHECK_NULL(expression, "Expression matrix is null");
    COEXNET_C_API_CHECK_NULL(eigengenes, "Eigengene matrix is null");
    COEXNET_C_API_CHECK_NULL(kme, "Output kME table is null");
    COEXNET_C_API_CHECK(n_samples > 0 && n_genes > 0 && n_modules > 0,
                        COEXNET_ERROR_INVALID_ARGUMENT, "Dimensions must be positive");

    COEXNET_C_API_TRY
        const auto set = eigengene_set(eigengenes, module_ids, n_samples, n_modules);
        const auto stats = kernel::membership::module_membership(
            dense_view(expression, n_samples, n_genes), set, correlation_options(type, on_undefined));
        memory::copy(stats.kme.data(), kme, stats.kme.size());
        if (kme_pvalue) {
            memory::copy(stats.pvalue.data(), kme_pvalue, stats.pvalue.size());
        }
        COEXNET_C_API_RETURN_OK;
    COEXNET_C_API_CATCH
}

COEXNET_EXPORT coexnet_error_t coexnet_module_trait_correlation(
    const coexnet_real_t* eigengenes,
    const coexnet_index_t n_samples,
    const coexnet_index_t n_modules,
    const coexnet_real_t* traits,
    const coexnet_index_t n_traits,
    const coexnet_correlation_t type,
    const coexnet_undefined_t on_undefined,
    coexnet_real_t* cor,
    coexnet_real_t* pvalue) {

    COEXNET_C_API_CHECK_NULL(eigengenes, "Eigengene matrix is null");
    COEXNET_C_API_CHECK_NULL(traits, "Trait matrix is null");
    COEXNET_C_API_CHECK_NULL(cor, "Output correlation is null");
    COEXNET_C_API_CHECK(n_samples > 0 && n_modules > 0 && n_traits > 0,
                        COEXNET_ERROR_INVALID_ARGUMENT, "Dimensions must be positive");

    COEXNET_C_API_TRY
        const auto set = eigengene_set(eigengenes, nullptr, n_samples, n_modules);
        TraitMatrix t;
        t.values = Matrix::from(traits, n_samples, n_traits);
        const auto stats = kernel::membership::module_trait_correlation(
            set, t, correlation_options(type, on_undefined));
        memory::copy(stats.cor.data(), cor, stats.cor.size());
        if (pvalue) {
            memory::copy(stats.pvalue.data(), pvalue, stats.pvalue.size());
        }
        COEXNET_C_API_RETURN_OK;
    COEXNET_C_API_CATCH
}

COEXNET_EXPORT coexnet_error_t coexnet_gene_significance(
    const coexnet_real_t* expression,
    const coexnet_index_t n_samples,
    const coexnet_index_t n_genes,
    const coexnet_real_t* trait,
    const coexnet_correlation_t type,
    const coexnet_undefined_t on_undefined,
    coexnet_real_t* gs,
    coexnet_real_t* gs_pvalue) {

    COEXNET_C_API_CHECK_NULL(expression, "Expression matrix is null");
    COEXNET_C_API_CHECK_NULL(trait, "Trait vector is null");
    COEXNET_C_API_CHECK_NULL(gs, "Output GS is null");
    COEXNET_C_API_CHECK(n_samples > 0 && n_genes > 0, COEXNET_ERROR_INVALID_ARGUMENT,
                        "Dimensions must be positive");

    COEXNET_C_API_TRY
        ExpressionMatrix x;
        x.values = Matrix::from(expression, n_samples, n_genes);
        TraitMatrix t;
        t.values = Matrix::from(trait, n_samples, 1);
        t.col_names = {"trait"};
        const auto out = kernel::membership::gene_significance(
            x, t, "trait", correlation_options(type, on_undefined));
        memory::copy(out.gs.data(), gs, out.gs.size());
        if (gs_pvalue) {
            memory::copy(out.pvalue.data(), gs_pvalue, out.pvalue.size());
        }
        COEXNET_C_API_RETURN_OK;
    COEXNET_C_API_CATCH
}

COEXNET_EXPORT coexnet_error_t coexnet_hub_mask(
    const coexnet_index_t* labels,
    const coexnet_index_t n_genes,
    const coexnet_real_t* kme,
    const coexnet_real_t* kme_pvalue,
    const coexnet_index_t* module_ids,
    const coexnet_index_t n_cols,
    const coexnet_index_t module,
    const coexnet_real_t kme_threshold,
    const coexnet_real_t pvalue_threshold,
    uint8_t* mask) {

    COEXNET_C_API_CHECK_NULL(labels, "Labels are null");
    COEXNET_C_API_CHECK_NULL(kme, "kME table is null");
    COEXNET_C_API_CHECK_NULL(kme_pvalue, "kME p-value table is null");
    COEXNET_C_API_CHECK_NULL(module_ids, "Module ids are null");
    COEXNET_C_API_CHECK_NULL(mask, "Output mask is null");
    COEXNET_C_API_CHECK(n_genes > 0 && n_cols >= 0, COEXNET_ERROR_INVALID_ARGUMENT,
                        "Dimensions must be positive");

    COEXNET_C_API_TRY
        kernel::membership::MembershipStats stats;
        stats.modules.assign(module_ids, module_ids + n_cols);
        stats.kme = Matrix::from(kme, n_genes, n_cols);
        stats.pvalue = Matrix::from(kme_pvalue, n_genes, n_cols);

        kernel::hub_genes::HubOptions opts;
        opts.kme_threshold = kme_threshold;
        opts.kme_pvalue = pvalue_threshold;

        const std::vector<ModuleId> in(labels, labels + n_genes);
        const auto out = kernel::hub_genes::hub_mask(in, stats, module, opts);
        memory::copy(out.data(), mask, out.size());
        COEXNET_C_API_RETURN_OK;
    COEXNET_C_API_CATCH
}

} // extern "C"
