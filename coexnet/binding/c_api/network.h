#pragma once

// =============================================================================
// FILE: coexnet/binding/c_api/network.h
// BRIEF: C API for weighted gene co-expression network analysis
// =============================================================================
//
// PIPELINE:
//   1. Correlation between gene columns (Pearson, Spearman, bicor)
//   2. Soft-threshold table and power advice
//   3. Adjacency (unsigned, signed, signed hybrid)
//   4. Topological overlap (TOM)
//   5. Average-linkage tree and dynamic branch cut on 1 - TOM
//   6. Module eigengenes and eigengene merging
//   7. Module membership (kME), trait correlation, gene significance
//   8. Hub genes by module membership
//
// LAYOUT:
//   All matrices are row-major, caller-allocated. Expression is
//   samples x genes. Module labels: 0 = unassigned, 1..K by size.
// =============================================================================

#include "coexnet/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// NOLINTNEXTLINE(modernize-use-using)
typedef enum {
    COEXNET_PEARSON = 0,
    COEXNET_SPEARMAN = 1,
    COEXNET_BICOR = 2
} coexnet_correlation_t;

// NOLINTNEXTLINE(modernize-use-using)
typedef enum {
    COEXNET_UNSIGNED = 0,        ///< |r|^p
    COEXNET_SIGNED = 1,          ///< ((1 + r) / 2)^p
    COEXNET_SIGNED_HYBRID = 2    ///< r^p for r > 0, else 0
} coexnet_network_t;

// NOLINTNEXTLINE(modernize-use-using)
typedef enum {
    COEXNET_UNDEFINED_THROW = 0, ///< undefined correlation is an error
    COEXNET_UNDEFINED_WARN = 1   ///< undefined correlation is NaN plus a warning
} coexnet_undefined_t;

// Columns of one soft-threshold table row:
// power, signed R^2, slope, truncated R^2, mean k, median k, max k
#define COEXNET_SOFT_THRESHOLD_COLUMNS 7

// =============================================================================
// Correlation
// =============================================================================

/// @brief cor(X, Y) between columns, or symmetric cor(X) when y is NULL
/// @param[in] x Samples x n_x (non-null)
/// @param[in] y Samples x n_y, or NULL
/// @param[out] cor [n_x * n_y] (n_y = n_x when y is NULL) (non-null)
/// @param[out] pvalue Same shape, Student-t two-sided p-values, or NULL
/// @param[out] n_obs Paired observation counts, or NULL
coexnet_error_t coexnet_correlate(
    const coexnet_real_t* x,
    coexnet_index_t n_samples,
    coexnet_index_t n_x,
    const coexnet_real_t* y,
    coexnet_index_t n_y,
    coexnet_correlation_t type,
    coexnet_undefined_t on_undefined,
    coexnet_real_t* cor,
    coexnet_real_t* pvalue,
    coexnet_index_t* n_obs
);

// =============================================================================
// Soft Threshold
// =============================================================================

/// @brief Scale-free fit table, one row per power
/// @param[out] table [n_powers * COEXNET_SOFT_THRESHOLD_COLUMNS]
coexnet_error_t coexnet_soft_threshold(
    const coexnet_real_t* expression,
    coexnet_index_t n_samples,
    coexnet_index_t n_genes,
    const coexnet_real_t* powers,
    coexnet_index_t n_powers,
    coexnet_network_t network,
    coexnet_correlation_t type,
    coexnet_real_t* table
);

/// @brief Smallest power with signed R^2 above r2_target
/// @param[in] max_mean_k Mean connectivity cap, <= 0 for none
/// @param[out] power Advised power (unchanged when none qualifies)
/// @param[out] found COEXNET_TRUE when a power qualifies
coexnet_error_t coexnet_advise_power(
    const coexnet_real_t* table,
    coexnet_index_t n_rows,
    coexnet_real_t r2_target,
    coexnet_real_t max_mean_k,
    coexnet_real_t* power,
    coexnet_bool_t* found
);

// =============================================================================
// Adjacency / TOM
// =============================================================================

/// @param[in] cor n x n correlation
/// @param[out] adjacency n x n, diagonal 0
coexnet_error_t coexnet_adjacency(
    const coexnet_real_t* cor,
    coexnet_index_t n,
    coexnet_real_t power,
    coexnet_network_t network,
    coexnet_real_t* adjacency
);

/// @param[in] adjacency n x n, entries in [0, 1]
/// @param[out] tom n x n, diagonal 1
coexnet_error_t coexnet_tom(
    const coexnet_real_t* adjacency,
    coexnet_index_t n,
    coexnet_real_t* tom
);

// =============================================================================
// Modules
// =============================================================================

/// @brief Modules from an n x n dissimilarity (typically 1 - TOM)
/// @param[out] labels [n]
/// @param[out] n_modules Number of modules (non-null)
coexnet_error_t coexnet_detect_modules(
    const coexnet_real_t* dissimilarity,
    coexnet_index_t n,
    coexnet_index_t min_module_size,
    int deep_split,
    coexnet_real_t cut_height,
    coexnet_bool_t pam_stage,
    coexnet_index_t* labels,
    coexnet_index_t* n_modules
);

/// @brief Eigengene of the listed genes
/// @param[out] eigengene [n_samples]
/// @param[out] variance_explained Share of variance on the first component, or NULL
coexnet_error_t coexnet_module_eigengene(
    const coexnet_real_t* expression,
    coexnet_index_t n_samples,
    coexnet_index_t n_genes,
    const coexnet_index_t* genes,
    coexnet_index_t n_module_genes,
    coexnet_real_t* eigengene,
    coexnet_real_t* variance_explained
);

/// @brief Merge modules whose eigengene dissimilarity is at most cut_height
/// @param[in] labels [n_genes]
/// @param[out] merged [n_genes] (may alias labels)
coexnet_error_t coexnet_merge_modules(
    const coexnet_real_t* expression,
    coexnet_index_t n_samples,
    coexnet_index_t n_genes,
    const coexnet_index_t* labels,
    coexnet_real_t cut_height,
    coexnet_index_t* merged,
    coexnet_index_t* n_modules
);

/// @brief kME: correlation of every gene with every module eigengene
/// @param[in] eigengenes n_samples x n_modules, e.g. from coexnet_module_eigengene
/// @param[in] module_ids [n_modules] id of each eigengene column, or NULL for 1..n_modules
/// @param[out] kme, kme_pvalue [n_genes * n_modules] (kme_pvalue may be NULL)
coexnet_error_t coexnet_module_membership(
    const coexnet_real_t* expression,
    coexnet_index_t n_samples,
    coexnet_index_t n_genes,
    const coexnet_real_t* eigengenes,
    const coexnet_index_t* module_ids,
    coexnet_index_t n_modules,
    coexnet_correlation_t type,
    coexnet_undefined_t on_undefined,
    coexnet_real_t* kme,
    coexnet_real_t* kme_pvalue
);

/// @brief Correlation of module eigengenes with trait columns
/// @param[in] eigengenes n_samples x n_modules
/// @param[in] traits n_samples x n_traits
/// @param[out] cor, pvalue [n_modules * n_traits] (pvalue may be NULL)
coexnet_error_t coexnet_module_trait_correlation(
    const coexnet_real_t* eigengenes,
    coexnet_index_t n_samples,
    coexnet_index_t n_modules,
    const coexnet_real_t* traits,
    coexnet_index_t n_traits,
    coexnet_correlation_t type,
    coexnet_undefined_t on_undefined,
    coexnet_real_t* cor,
    coexnet_real_t* pvalue
);

/// @brief Gene significance: correlation of every gene with one trait
/// @param[in] trait [n_samples]; a single observed level is an error under
///            COEXNET_UNDEFINED_THROW (COEXNET_ERROR_INSUFFICIENT_SAMPLES)
/// @param[out] gs, gs_pvalue [n_genes] (gs_pvalue may be NULL)
coexnet_error_t coexnet_gene_significance(
    const coexnet_real_t* expression,
    coexnet_index_t n_samples,
    coexnet_index_t n_genes,
    const coexnet_real_t* trait,
    coexnet_correlation_t type,
    coexnet_undefined_t on_undefined,
    coexnet_real_t* gs,
    coexnet_real_t* gs_pvalue
);

/// @brief Hub genes of one module
/// @param[in] kme, kme_pvalue n_genes x n_cols membership tables
/// @param[in] module_ids [n_cols] module id of each kME column
/// @param[out] mask [n_genes], 1 for hubs
/// Returns COEXNET_ERROR_UNKNOWN_MODULE when module has no genes.
coexnet_error_t coexnet_hub_mask(
    const coexnet_index_t* labels,
    coexnet_index_t n_genes,
    const coexnet_real_t* kme,
    const coexnet_real_t* kme_pvalue,
    const coexnet_index_t* module_ids,
    coexnet_index_t n_cols,
    coexnet_index_t module,
    coexnet_real_t kme_threshold,
    coexnet_real_t pvalue_threshold,
    uint8_t* mask
);

#ifdef __cplusplus
}
#endif
