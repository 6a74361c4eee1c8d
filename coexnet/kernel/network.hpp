#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/error.hpp"
#include "coexnet/core/macros.hpp"
#include "coexnet/core/dense.hpp"
#include "coexnet/threading/scheduler.hpp"
#include "coexnet/kernel/advisory.hpp"
#include "coexnet/kernel/correlation.hpp"
#include "coexnet/kernel/adjacency.hpp"
#include "coexnet/kernel/soft_threshold.hpp"
#include "coexnet/kernel/tom.hpp"
#include "coexnet/kernel/tree_cut.hpp"
#include "coexnet/kernel/modules.hpp"
#include "coexnet/kernel/eigengene.hpp"
#include "coexnet/kernel/membership.hpp"
#include "coexnet/kernel/hub_genes.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// =============================================================================
// FILE: coexnet/kernel/network.hpp
// BRIEF: End-to-end co-expression network analysis
//
// Stages, each consuming the previous stage's complete output:
//   1. input validation (names, shape, finite values, variance)
//   2. soft-threshold table and power advice (advisory only)
//   3. module detection with the configured power
//   4. eigengene merge
//   5. module-trait correlation, kME, GS, gene table
//   6. hub genes for the modules of interest
// The first fatal error aborts the run.
// =============================================================================

namespace coexnet::kernel::network {

namespace config {
    constexpr Index MIN_SAMPLES = 3;
}

/// @brief Explicit run configuration.
struct NetworkConfig {
    std::string analysis_id;

    correlation::CorrelationType correlation = correlation::CorrelationType::Pearson;
    adjacency::AdjacencyType network = adjacency::AdjacencyType::Signed;

    std::vector<Real> candidate_powers = soft_threshold::default_candidate_powers();
    Real r2_target = soft_threshold::config::DEFAULT_R2_TARGET;
    std::optional<Real> max_mean_connectivity;

    // Chosen by the caller; the advice from stage 2 is never applied
    Real power = 0;

    Index min_module_size = tree_cut::config::DEFAULT_MIN_MODULE_SIZE;
    int deep_split = tree_cut::config::DEFAULT_DEEP_SPLIT;
    Real detect_cut_height = tree_cut::config::DEFAULT_CUT_HEIGHT;
    bool pam_stage = false;
    Real merge_cut_height = modules::config::DEFAULT_MERGE_CUT_HEIGHT;
    Index max_block_size = modules::config::DEFAULT_MAX_BLOCK_SIZE;
    Index tom_row_block = tom::config::DEFAULT_ROW_BLOCK;

    Real kme_threshold = hub_genes::config::DEFAULT_KME_THRESHOLD;
    Real kme_pvalue = hub_genes::config::DEFAULT_KME_PVALUE;
    std::string gs_trait;
    std::vector<ModuleId> modules_of_interest;

    Size n_threads = 0;
    correlation::UndefinedPolicy on_undefined = correlation::UndefinedPolicy::Throw;

    void validate() const {
        COEXNET_CHECK_ARG(!analysis_id.empty(), "NetworkConfig: analysis_id must not be empty");
        COEXNET_CHECK_ARG(!candidate_powers.empty(), "NetworkConfig: candidate_powers must not be empty");
        for (Real p : candidate_powers) {
            COEXNET_CHECK_ARG(std::isfinite(p) && p > Real(0),
                "NetworkConfig: candidate_powers must be positive, got " + std::to_string(p));
        }
        COEXNET_CHECK_ARG(std::isfinite(power) && power > Real(0),
            "NetworkConfig: power is required and must be positive, got " + std::to_string(power));
        COEXNET_CHECK_RANGE(r2_target, Real(0), Real(1), "NetworkConfig: r2_target must lie in [0, 1]");
        if (max_mean_connectivity) {
            COEXNET_CHECK_ARG(*max_mean_connectivity > Real(0),
                "NetworkConfig: max_mean_connectivity must be positive");
        }
        COEXNET_CHECK_ARG(min_module_size >= 1, "NetworkConfig: min_module_size must be at least 1");
        COEXNET_CHECK_RANGE(deep_split, 0, 4, "NetworkConfig: deep_split must lie in [0, 4]");
        COEXNET_CHECK_ARG(std::isfinite(detect_cut_height) && detect_cut_height > Real(0),
            "NetworkConfig: detect_cut_height must be positive");
        COEXNET_CHECK_ARG(std::isfinite(merge_cut_height) && merge_cut_height >= Real(0),
            "NetworkConfig: merge_cut_height must be non-negative");
        COEXNET_CHECK_ARG(max_block_size >= 2, "NetworkConfig: max_block_size must be at least 2");
        COEXNET_CHECK_ARG(tom_row_block >= 1, "NetworkConfig: tom_row_block must be positive");
        COEXNET_CHECK_RANGE(kme_threshold, Real(0), Real(1), "NetworkConfig: kme_threshold must lie in [0, 1]");
        COEXNET_CHECK_RANGE(kme_pvalue, Real(0), Real(1), "NetworkConfig: kme_pvalue must lie in [0, 1]");
        for (Size i = 0; i < modules_of_interest.size(); ++i) {
            const ModuleId id = modules_of_interest[i];
            COEXNET_CHECK_ARG(id != UNASSIGNED_MODULE,
                "NetworkConfig: the unassigned module cannot be a module of interest");
            const auto seen = modules_of_interest.begin() + static_cast<std::ptrdiff_t>(i);
            COEXNET_CHECK_ARG(std::find(modules_of_interest.begin(), seen, id) == seen,
                "NetworkConfig: module " + std::to_string(id) + " listed twice in modules_of_interest");
        }
    }

    COEXNET_NODISCARD correlation::CorrelationOptions correlation_options() const {
        correlation::CorrelationOptions opts;
        opts.type = correlation;
        opts.on_undefined = on_undefined;
        return opts;
    }

    COEXNET_NODISCARD modules::DetectionOptions detection_options() const {
        modules::DetectionOptions opts;
        opts.power = power;
        opts.network = network;
        opts.correlation = correlation_options();
        opts.correlation.compute_pvalues = false;
        opts.cut.min_module_size = min_module_size;
        opts.cut.deep_split = deep_split;
        opts.cut.cut_height = detect_cut_height;
        opts.cut.pam_stage = pam_stage;
        opts.max_block_size = max_block_size;
        opts.tom_row_block = tom_row_block;
        return opts;
    }
};

/// @brief Everything one run produces, keyed by analysis_id.
struct AnalysisResult {
    std::string analysis_id;
    std::vector<std::string> sample_names;
    std::vector<std::string> gene_names;

    std::vector<soft_threshold::SoftThresholdRow> soft_threshold;
    soft_threshold::PowerAdvice advice;
    Real power = 0;

    modules::ModuleAssignment assignment;
    std::vector<std::vector<Index>> blocks;
    std::vector<hclust::Dendrogram> trees;

    eigengene::EigengeneSet eigengenes;           // merged modules
    membership::ModuleTraitStats module_trait;
    membership::MembershipStats membership;
    std::optional<membership::GeneSignificance> gene_significance;
    std::vector<membership::GeneRow> genes;
    std::vector<hub_genes::ModuleHubs> hubs;

    Advisories advisories;
};

// =============================================================================
// Input Validation
// =============================================================================

namespace detail {

inline void validate_inputs(const ExpressionMatrix& expression, const TraitMatrix& traits) {
    expression.validate_names("ExpressionMatrix");
    traits.validate_names("TraitMatrix");

    COEXNET_CHECK_DIM(expression.rows() == traits.rows(),
        "run_network_analysis: ExpressionMatrix has " + std::to_string(expression.rows()) +
        " samples, TraitMatrix has " + std::to_string(traits.rows()));
    for (Index s = 0; s < expression.rows(); ++s) {
        const auto& a = expression.row_names[static_cast<Size>(s)];
        const auto& b = traits.row_names[static_cast<Size>(s)];
        COEXNET_CHECK_ARG(a == b,
            "run_network_analysis: sample " + std::to_string(s) + " is '" + a +
            "' in ExpressionMatrix but '" + b + "' in TraitMatrix");
    }

    if (COEXNET_UNLIKELY(expression.rows() < config::MIN_SAMPLES)) {
        throw InsufficientSamplesError(
            "run_network_analysis: ExpressionMatrix has " + std::to_string(expression.rows()) +
            " samples, at least " + std::to_string(config::MIN_SAMPLES) + " are required");
    }
    COEXNET_CHECK_ARG(expression.cols() >= 2,
        "run_network_analysis: ExpressionMatrix needs at least 2 genes");

    const auto bad = find_non_finite(expression.values.view());
    if (COEXNET_UNLIKELY(bad.first >= 0)) {
        throw DegenerateInputError(
            "run_network_analysis: ExpressionMatrix has a missing or non-finite value for gene '" +
            expression.col_names[static_cast<Size>(bad.second)] + "' in sample '" +
            expression.row_names[static_cast<Size>(bad.first)] + "'");
    }

    for (Index g = 0; g < expression.cols(); ++g) {
        const Real first = expression.values(0, g);
        bool varies = false;
        for (Index s = 1; s < expression.rows() && !varies; ++s) {
            varies = expression.values(s, g) != first;
        }
        if (COEXNET_UNLIKELY(!varies)) {
            throw DegenerateInputError("run_network_analysis: gene '" +
                                       expression.col_names[static_cast<Size>(g)] +
                                       "' has zero variance");
        }
    }
}

} // namespace detail

// =============================================================================
// Pipeline
// =============================================================================

inline AnalysisResult run_network_analysis(
    const ExpressionMatrix& expression,
    const TraitMatrix& traits,
    const NetworkConfig& cfg
) {
    cfg.validate();
    detail::validate_inputs(expression, traits);
    if (!cfg.gs_trait.empty() && traits.find_col(cfg.gs_trait) < 0) {
        throw ValueError("run_network_analysis: gs_trait '" + cfg.gs_trait +
                         "' is not a TraitMatrix column");
    }
    std::optional<threading::ScopedNumThreads> thread_scope;
    if (cfg.n_threads > 0) {
        thread_scope.emplace(cfg.n_threads);
    }

    const MatrixView expr = expression.values.view();
    const auto* names = &expression.col_names;
    const correlation::CorrelationOptions cor_opts = cfg.correlation_options();

    AnalysisResult result;
    result.analysis_id = cfg.analysis_id;
    result.sample_names = expression.row_names;
    result.gene_names = expression.col_names;
    result.power = cfg.power;

    // Soft threshold (advisory)
    soft_threshold::SoftThresholdOptions st_opts;
    st_opts.powers = cfg.candidate_powers;
    st_opts.network = cfg.network;
    st_opts.correlation = cor_opts;
    result.soft_threshold = soft_threshold::pick_soft_threshold(expr, st_opts, names);
    result.advice = soft_threshold::advise_power(result.soft_threshold, cfg.r2_target,
                                                 cfg.max_mean_connectivity);
    if (result.advice.warning) {
        result.advisories.push_back(Advisory{"SoftThresholdSelector", "advise_power",
                                             result.advice.warning->message, UNASSIGNED_MODULE});
    }

    // Detection
    auto detected = modules::detect_modules(expr, cfg.detection_options());
    result.blocks = std::move(detected.blocks);
    result.trees = std::move(detected.trees);
    result.advisories.insert(result.advisories.end(),
                             detected.advisories.begin(), detected.advisories.end());

    // Merge
    auto merged = modules::merge_close_modules(expr, detected.labels, cfg.merge_cut_height, names);
    result.assignment.unmerged = std::move(detected.labels);
    result.assignment.merged = std::move(merged.labels);
    result.assignment.history = std::move(merged.history);
    result.eigengenes = std::move(merged.eigengenes);

    // Trait and membership statistics
    result.module_trait = membership::module_trait_correlation(result.eigengenes, traits, cor_opts);
    result.membership = membership::module_membership(expr, result.eigengenes, cor_opts, names);
    if (!cfg.gs_trait.empty()) {
        result.gene_significance = membership::gene_significance(expression, traits, cfg.gs_trait, cor_opts);
    }
    const membership::GeneSignificance* gs =
        result.gene_significance ? &*result.gene_significance : nullptr;
    result.genes = membership::gene_table(result.gene_names, result.assignment.merged,
                                          result.membership, gs);

    // Hubs
    hub_genes::HubOptions hub_opts;
    hub_opts.kme_threshold = cfg.kme_threshold;
    hub_opts.kme_pvalue = cfg.kme_pvalue;
    result.hubs = hub_genes::select_hub_genes(result.assignment.merged, result.membership,
                                              cfg.modules_of_interest, hub_opts, gs,
                                              result.advisories);
    return result;
}

} // namespace coexnet::kernel::network
