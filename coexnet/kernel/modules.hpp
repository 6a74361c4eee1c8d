#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/error.hpp"
#include "coexnet/core/macros.hpp"
#include "coexnet/core/dense.hpp"
#include "coexnet/core/vectorize.hpp"
#include "coexnet/kernel/adjacency.hpp"
#include "coexnet/kernel/advisory.hpp"
#include "coexnet/kernel/correlation.hpp"
#include "coexnet/kernel/eigengene.hpp"
#include "coexnet/kernel/hclust.hpp"
#include "coexnet/kernel/tom.hpp"
#include "coexnet/kernel/tree_cut.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <utility>
#include <vector>

// =============================================================================
// Module Detection and Eigengene Merging
//
// detect_modules
//   expression -> adjacency -> TOM -> 1 - TOM -> average linkage -> tree cut
//   Genes are split into contiguous blocks of at most max_block_size; each
//   block TOM still counts neighbours over all genes. Block labels are made
//   unique and then renumbered 1..K by size.
//
// merge_close_modules
//   Repeatedly merges the closest pair of module eigengenes while
//   1 - cor <= merge cut. The larger module keeps its id (ties: smaller id)
//   and its eigengene is recomputed before the next round.
// =============================================================================

namespace coexnet::kernel::modules {

namespace config {
    constexpr Index DEFAULT_MAX_BLOCK_SIZE = 5000;
    constexpr Real DEFAULT_MERGE_CUT_HEIGHT = Real(0.25);
}

// =============================================================================
// Display Labels
// =============================================================================

inline constexpr std::array<const char*, 34> MODULE_PALETTE = {
    "turquoise", "blue", "brown", "yellow", "green", "red", "black", "pink",
    "magenta", "purple", "greenyellow", "tan", "salmon", "cyan", "midnightblue",
    "lightcyan", "grey60", "lightgreen", "lightyellow", "royalblue", "darkred",
    "darkgreen", "darkturquoise", "darkgrey", "orange", "darkorange", "white",
    "skyblue", "saddlebrown", "steelblue", "paleturquoise", "violet",
    "darkolivegreen", "darkmagenta"
};

/// @brief Colour name of a module id; "grey" for unassigned.
inline std::string display_label(ModuleId id) {
    if (id == UNASSIGNED_MODULE) {
        return "grey";
    }
    if (id > 0 && static_cast<Size>(id) <= MODULE_PALETTE.size()) {
        return MODULE_PALETTE[static_cast<Size>(id - 1)];
    }
    return "module" + std::to_string(id);
}

/// @brief Module id of a display label or decimal id, or -1.
inline ModuleId parse_label(const std::string& label) {
    if (label == "grey") return UNASSIGNED_MODULE;
    for (Size i = 0; i < MODULE_PALETTE.size(); ++i) {
        if (label == MODULE_PALETTE[i]) return static_cast<ModuleId>(i + 1);
    }
    const std::string prefix = "module";
    std::string digits = label.rfind(prefix, 0) == 0 ? label.substr(prefix.size()) : label;
    if (digits.empty() || digits.size() > 18 || !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return -1;
    }
    return static_cast<ModuleId>(std::stoll(digits));
}

// =============================================================================
// Module Assignment
// =============================================================================

struct MergeRecord {
    ModuleId absorbed = UNASSIGNED_MODULE;
    ModuleId survivor = UNASSIGNED_MODULE;
    Real dissimilarity = 0;
};

/// @brief Gene -> module, before and after eigengene merging.
struct ModuleAssignment {
    std::vector<ModuleId> unmerged;
    std::vector<ModuleId> merged;
    std::vector<MergeRecord> history;

    /// @brief Distinct assigned ids in `merged`, ascending.
    COEXNET_NODISCARD std::vector<ModuleId> module_ids() const {
        std::vector<ModuleId> ids;
        for (ModuleId l : merged) {
            if (l != UNASSIGNED_MODULE) ids.push_back(l);
        }
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
        return ids;
    }

    COEXNET_NODISCARD Index n_modules() const {
        return static_cast<Index>(module_ids().size());
    }

    /// @brief Genes of a merged module, ascending.
    COEXNET_NODISCARD std::vector<Index> genes_of(ModuleId id) const {
        std::vector<Index> genes;
        for (Size g = 0; g < merged.size(); ++g) {
            if (merged[g] == id) genes.push_back(static_cast<Index>(g));
        }
        return genes;
    }
};

inline Index count_modules(const std::vector<ModuleId>& labels) {
    std::vector<ModuleId> ids;
    for (ModuleId l : labels) {
        if (l != UNASSIGNED_MODULE) ids.push_back(l);
    }
    std::sort(ids.begin(), ids.end());
    return static_cast<Index>(std::unique(ids.begin(), ids.end()) - ids.begin());
}

// =============================================================================
// Detection
// =============================================================================

struct DetectionOptions {
    Real power = 6;
    adjacency::AdjacencyType network = adjacency::AdjacencyType::Signed;
    correlation::CorrelationOptions correlation;
    tree_cut::TreeCutOptions cut;
    Index max_block_size = config::DEFAULT_MAX_BLOCK_SIZE;
    Index tom_row_block = tom::config::DEFAULT_ROW_BLOCK;
};

struct DetectionResult {
    std::vector<ModuleId> labels;               // 0 = unassigned, 1..K by size
    Index n_modules = 0;
    std::vector<std::vector<Index>> blocks;     // genes per block
    std::vector<hclust::Dendrogram> trees;      // one per block, leaves are block positions
    Advisories advisories;
};

namespace detail {

inline void report_detection(DetectionResult& result, Index n_genes, Index min_module_size) {
    if (n_genes < min_module_size) {
        report(result.advisories, "ModuleDetector", "detect_modules",
               std::to_string(n_genes) + " genes is fewer than min_module_size " +
               std::to_string(min_module_size) + "; all genes are unassigned");
    } else if (result.n_modules == 0) {
        report(result.advisories, "ModuleDetector", "detect_modules",
               "no branch qualifies as a module; all genes are unassigned");
    }
}

} // namespace detail

/// @brief Modules from a precomputed dissimilarity matrix (single block).
inline DetectionResult detect_modules_from_dissimilarity(
    MatrixView dissim,
    const tree_cut::TreeCutOptions& options = {}
) {
    DetectionResult result;
    auto clustered = tree_cut::cluster_dissimilarity(dissim, options);

    result.labels = std::move(clustered.cut.labels);
    result.n_modules = clustered.cut.n_modules;
    result.blocks.emplace_back(static_cast<Size>(dissim.rows));
    for (Index g = 0; g < dissim.rows; ++g) {
        result.blocks.back()[static_cast<Size>(g)] = g;
    }
    result.trees.push_back(std::move(clustered.tree));
    detail::report_detection(result, dissim.rows, options.min_module_size);
    return result;
}

/// @brief Contiguous blocks of at most max_block_size genes, sizes balanced.
inline std::vector<std::vector<Index>> contiguous_blocks(Index n_genes, Index max_block_size) {
    COEXNET_CHECK_ARG(max_block_size > 0, "ModuleDetector: max_block_size must be positive");
    std::vector<std::vector<Index>> blocks;
    if (n_genes == 0) return blocks;

    const Index n_blocks = (n_genes + max_block_size - 1) / max_block_size;
    const Index base = n_genes / n_blocks;
    const Index extra = n_genes % n_blocks;
    Index start = 0;
    for (Index b = 0; b < n_blocks; ++b) {
        const Index len = base + (b < extra ? 1 : 0);
        std::vector<Index> genes(static_cast<Size>(len));
        for (Index i = 0; i < len; ++i) genes[static_cast<Size>(i)] = start + i;
        blocks.push_back(std::move(genes));
        start += len;
    }
    return blocks;
}

/// @brief Modules straight from expression, blockwise when needed.
inline DetectionResult detect_modules(MatrixView expression, const DetectionOptions& options) {
    tree_cut::validate(options.cut);
    adjacency::check_power(options.power);

    const Index n = expression.cols;
    DetectionResult result;
    result.labels.assign(static_cast<Size>(n), UNASSIGNED_MODULE);
    result.blocks = contiguous_blocks(n, options.max_block_size);

    ModuleId offset = 0;
    for (const auto& block : result.blocks) {
        Matrix tom_block;
        if (result.blocks.size() == 1) {
            const Matrix adj = adjacency::adjacency_from_expression(
                expression, options.power, options.network, options.correlation);
            tom_block = tom::topological_overlap(adj.view(), options.tom_row_block);
        } else {
            tom_block = tom::block_topological_overlap(
                expression, block, options.power, options.network, options.correlation);
        }
        const Matrix dissim = tom::tom_dissimilarity(tom_block.view());
        auto clustered = tree_cut::cluster_dissimilarity(dissim.view(), options.cut);

        for (Size i = 0; i < block.size(); ++i) {
            const ModuleId l = clustered.cut.labels[i];
            result.labels[static_cast<Size>(block[i])] = l == UNASSIGNED_MODULE ? l : l + offset;
        }
        offset += clustered.cut.n_modules;
        result.trees.push_back(std::move(clustered.tree));
    }

    result.n_modules = tree_cut::relabel_by_size(result.labels);
    detail::report_detection(result, n, options.cut.min_module_size);
    return result;
}

// =============================================================================
// Eigengene Merging
// =============================================================================

struct MergeResult {
    std::vector<ModuleId> labels;
    std::vector<MergeRecord> history;
    eigengene::EigengeneSet eigengenes;   // of the merged modules
};

/// @brief Merge modules whose eigengenes satisfy 1 - cor <= cut_height.
///
/// Unassigned genes never change. The number of modules never increases.
inline MergeResult merge_close_modules(
    MatrixView expression,
    const std::vector<ModuleId>& labels,
    Real cut_height = config::DEFAULT_MERGE_CUT_HEIGHT,
    const std::vector<std::string>* gene_names = nullptr
) {
    COEXNET_CHECK_DIM(static_cast<Index>(labels.size()) == expression.cols,
        "ModuleDetector: " + std::to_string(labels.size()) + " labels for " +
        std::to_string(expression.cols) + " genes");
    COEXNET_CHECK_ARG(std::isfinite(cut_height) && cut_height >= Real(0),
        "ModuleDetector: merge cut height must be non-negative");

    MergeResult result;
    result.labels = labels;

    auto groups = eigengene::group_by_module(labels);
    groups.erase(UNASSIGNED_MODULE);

    std::vector<ModuleId> ids;
    std::vector<std::vector<Index>> members;
    std::vector<std::vector<Real>> me;
    for (auto& [id, genes] : groups) {
        ids.push_back(id);
        members.push_back(std::move(genes));
    }
    me.resize(ids.size());
    threading::parallel_for(Size(0), ids.size(), [&](size_t m) {
        me[m] = eigengene::module_eigengene(expression, members[m], gene_names).values;
    });

    const Index n = expression.rows;
    auto me_cor = [&](Size a, Size b) {
        const Real r = vectorize::dot(Array<const Real>(me[a].data(), me[a].size()),
                                      Array<const Real>(me[b].data(), me[b].size()));
        return std::clamp(r / static_cast<Real>(n - 1), Real(-1), Real(1));
    };

    std::vector<std::uint8_t> alive(ids.size(), 1);
    const Size k = ids.size();
    Matrix dissim(static_cast<Index>(k), static_cast<Index>(k), Real(0));
    for (Size a = 0; a < k; ++a) {
        for (Size b = a + 1; b < k; ++b) {
            const Real d = Real(1) - me_cor(a, b);
            dissim(static_cast<Index>(a), static_cast<Index>(b)) = d;
            dissim(static_cast<Index>(b), static_cast<Index>(a)) = d;
        }
    }

    while (true) {
        Real best = std::numeric_limits<Real>::infinity();
        Size best_a = 0, best_b = 0;
        for (Size a = 0; a < k; ++a) {
            if (!alive[a]) continue;
            for (Size b = a + 1; b < k; ++b) {
                if (!alive[b]) continue;
                const Real d = dissim(static_cast<Index>(a), static_cast<Index>(b));
                if (d < best) {
                    best = d;
                    best_a = a;
                    best_b = b;
                }
            }
        }
        if (!(best <= cut_height)) {
            break;
        }

        // ids ascend, so on equal size best_a holds the smaller id
        const bool a_survives = members[best_a].size() >= members[best_b].size();
        const Size keep = a_survives ? best_a : best_b;
        const Size drop = a_survives ? best_b : best_a;

        result.history.push_back(MergeRecord{ids[drop], ids[keep], best});
        for (Index g : members[drop]) {
            result.labels[static_cast<Size>(g)] = ids[keep];
        }
        members[keep].insert(members[keep].end(), members[drop].begin(), members[drop].end());
        std::sort(members[keep].begin(), members[keep].end());
        members[drop].clear();
        alive[drop] = 0;

        me[keep] = eigengene::module_eigengene(expression, members[keep], gene_names).values;
        for (Size c = 0; c < k; ++c) {
            if (!alive[c] || c == keep) continue;
            const Real d = Real(1) - me_cor(keep, c);
            dissim(static_cast<Index>(keep), static_cast<Index>(c)) = d;
            dissim(static_cast<Index>(c), static_cast<Index>(keep)) = d;
        }
    }

    result.eigengenes = eigengene::module_eigengenes(expression, result.labels, false, gene_names);
    return result;
}

} // namespace coexnet::kernel::modules
