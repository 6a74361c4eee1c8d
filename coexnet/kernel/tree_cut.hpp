#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/error.hpp"
#include "coexnet/core/macros.hpp"
#include "coexnet/core/dense.hpp"
#include "coexnet/kernel/hclust.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

// =============================================================================
// Dynamic Branch Cut (hybrid, tree stage)
//
// Merges are replayed bottom-up below the cut height. Every open branch keeps
// its genes and the heights at which they joined. A branch qualifies as a
// module when
//
//   size    >= min_module_size
//   scatter <= ref + max_core_scatter * (cut - ref)
//   gap     >= min_gap * (cut - ref)
//
// where scatter is the mean of the lowest (core_size - 1) joining heights,
// gap is the height of the merge that ends the branch minus its scatter and
// ref is the 5% quantile of all merge heights. deep_split picks
// max_core_scatter from {0.64, 0.73, 0.82, 0.91, 0.95}, min_gap is
// (1 - max_core_scatter) * 3/4.
//
// Genes outside every module keep UNASSIGNED_MODULE; with pam_stage they are
// then attached to the module at the smallest mean dissimilarity, provided it
// is below the cut height.
// =============================================================================

namespace coexnet::kernel::tree_cut {

namespace config {
    constexpr Index DEFAULT_MIN_MODULE_SIZE = 30;
    constexpr int DEFAULT_DEEP_SPLIT = 2;
    constexpr Real DEFAULT_CUT_HEIGHT = Real(0.995);
    constexpr Real REFERENCE_QUANTILE = Real(0.05);
    constexpr std::array<Real, 5> MAX_CORE_SCATTER = {
        Real(0.64), Real(0.73), Real(0.82), Real(0.91), Real(0.95)};
}

struct TreeCutOptions {
    Index min_module_size = config::DEFAULT_MIN_MODULE_SIZE;
    int deep_split = config::DEFAULT_DEEP_SPLIT;
    Real cut_height = config::DEFAULT_CUT_HEIGHT;
    bool pam_stage = false;
};

struct TreeCutResult {
    std::vector<ModuleId> labels;   // per gene, 0 = unassigned
    Index n_modules = 0;
    Real cut_height = 0;           // after clamping to the highest merge
};

inline void validate(const TreeCutOptions& options) {
    COEXNET_CHECK_ARG(options.min_module_size >= 1,
        "ModuleDetector: min_module_size must be at least 1, got " +
        std::to_string(options.min_module_size));
    COEXNET_CHECK_RANGE(options.deep_split, 0, 4,
        "ModuleDetector: deep_split must be in [0, 4], got " + std::to_string(options.deep_split));
    COEXNET_CHECK_ARG(options.cut_height > Real(0) && std::isfinite(options.cut_height),
        "ModuleDetector: cut_height must be positive");
}

/// @brief Genes in each branch's core, given its size.
inline Index core_size(Index branch_size, Index min_module_size) noexcept {
    const Real base = static_cast<Real>(min_module_size) / Real(2) + Real(1);
    if (base < static_cast<Real>(branch_size)) {
        return static_cast<Index>(base + std::sqrt(static_cast<Real>(branch_size) - base));
    }
    return branch_size;
}

/// @brief Relabel modules 1..K by size (largest first, ties by first gene).
inline Index relabel_by_size(std::vector<ModuleId>& labels) {
    ModuleId max_label = 0;
    for (ModuleId l : labels) max_label = std::max(max_label, l);

    std::vector<Index> size(static_cast<Size>(max_label + 1), 0);
    std::vector<Index> first(static_cast<Size>(max_label + 1), std::numeric_limits<Index>::max());
    for (Size g = 0; g < labels.size(); ++g) {
        const ModuleId l = labels[g];
        if (l == UNASSIGNED_MODULE) continue;
        ++size[static_cast<Size>(l)];
        first[static_cast<Size>(l)] = std::min(first[static_cast<Size>(l)], static_cast<Index>(g));
    }

    std::vector<ModuleId> ids;
    for (ModuleId l = 1; l <= max_label; ++l) {
        if (size[static_cast<Size>(l)] > 0) ids.push_back(l);
    }
    std::sort(ids.begin(), ids.end(), [&](ModuleId a, ModuleId b) {
        if (size[static_cast<Size>(a)] != size[static_cast<Size>(b)]) {
            return size[static_cast<Size>(a)] > size[static_cast<Size>(b)];
        }
        return first[static_cast<Size>(a)] < first[static_cast<Size>(b)];
    });

    std::vector<ModuleId> remap(static_cast<Size>(max_label + 1), UNASSIGNED_MODULE);
    for (Size r = 0; r < ids.size(); ++r) {
        remap[static_cast<Size>(ids[r])] = static_cast<ModuleId>(r + 1);
    }
    for (ModuleId& l : labels) {
        l = remap[static_cast<Size>(l)];
    }
    return static_cast<Index>(ids.size());
}

namespace detail {

struct Branch {
    bool closed = false;
    std::vector<Index> genes;
    std::vector<Real> heights;
};

struct CutParameters {
    Index min_size;
    Real cut;
    Real max_abs_scatter;
    Real min_abs_gap;
};

inline Real core_scatter(const Branch& b, Index min_size) {
    const Index core = core_size(static_cast<Index>(b.genes.size()), min_size);
    const auto n_core = static_cast<Size>(std::max<Index>(core - 1, 0));
    if (n_core == 0 || b.heights.empty()) {
        return Real(0);
    }
    std::vector<Real> h = b.heights;
    std::sort(h.begin(), h.end());
    const Size take = std::min(n_core, h.size());
    Real sum = 0;
    for (Size i = 0; i < take; ++i) sum += h[i];
    return sum / static_cast<Real>(take);
}

inline bool qualifies(const Branch& b, Real end_height, const CutParameters& p) {
    if (b.closed || static_cast<Index>(b.genes.size()) < p.min_size) {
        return false;
    }
    const Real scatter = core_scatter(b, p.min_size);
    return scatter <= p.max_abs_scatter && (end_height - scatter) >= p.min_abs_gap;
}

inline void absorb(Branch& into, Branch& from) {
    into.genes.insert(into.genes.end(), from.genes.begin(), from.genes.end());
    into.heights.insert(into.heights.end(), from.heights.begin(), from.heights.end());
    from.genes.clear();
    from.heights.clear();
}

} // namespace detail

/// @brief Tree stage of the hybrid cut; labels in 1..K by size.
inline TreeCutResult cut_tree(
    const hclust::Dendrogram& tree,
    const TreeCutOptions& options = {}
) {
    validate(options);

    const Index n = tree.n_leaves;
    TreeCutResult result;
    result.labels.assign(static_cast<Size>(n), UNASSIGNED_MODULE);
    if (tree.merges.empty()) {
        result.cut_height = options.cut_height;
        return result;
    }

    const Index n_merge = tree.n_merges();
    std::vector<Real> sorted = tree.heights;
    std::sort(sorted.begin(), sorted.end());

    const Real cut = std::min(options.cut_height, sorted.back());
    result.cut_height = cut;

    Index ref_merge = static_cast<Index>(std::lround(static_cast<Real>(n_merge) * config::REFERENCE_QUANTILE));
    ref_merge = std::max<Index>(ref_merge, 1);
    const Real ref = sorted[static_cast<Size>(ref_merge - 1)];

    const Real max_scatter = config::MAX_CORE_SCATTER[static_cast<Size>(options.deep_split)];
    const Real min_gap = (Real(1) - max_scatter) * Real(0.75);

    detail::CutParameters params{};
    params.min_size = options.min_module_size;
    params.cut = cut;
    params.max_abs_scatter = ref + max_scatter * (cut - ref);
    params.min_abs_gap = min_gap * (cut - ref);

    std::vector<detail::Branch> nodes(static_cast<Size>(n + n_merge));
    for (Index g = 0; g < n; ++g) {
        nodes[static_cast<Size>(g)].genes.push_back(g);
    }
    std::vector<std::uint8_t> consumed(nodes.size(), 0);

    ModuleId next_label = 1;
    auto emit = [&](detail::Branch& b) {
        for (Index g : b.genes) {
            result.labels[static_cast<Size>(g)] = next_label;
        }
        ++next_label;
        b.genes.clear();
        b.heights.clear();
        b.closed = true;
    };

    for (Index s = 0; s < n_merge; ++s) {
        const Real h = tree.heights[static_cast<Size>(s)];
        if (h > cut) continue;

        const Index ia = tree.merges[static_cast<Size>(s)][0];
        const Index ib = tree.merges[static_cast<Size>(s)][1];
        detail::Branch& a = nodes[static_cast<Size>(ia)];
        detail::Branch& b = nodes[static_cast<Size>(ib)];
        detail::Branch& parent = nodes[static_cast<Size>(n + s)];
        consumed[static_cast<Size>(ia)] = 1;
        consumed[static_cast<Size>(ib)] = 1;

        if (a.closed || b.closed) {
            // A closed side ends the open side: it is a module or stays unassigned
            detail::Branch& open = a.closed ? b : a;
            if (!open.closed && detail::qualifies(open, h, params)) {
                emit(open);
            }
            parent.closed = true;
            continue;
        }

        const bool qa = detail::qualifies(a, h, params);
        const bool qb = detail::qualifies(b, h, params);
        const bool small_a = static_cast<Index>(a.genes.size()) < params.min_size;
        const bool small_b = static_cast<Index>(b.genes.size()) < params.min_size;

        if (qa && qb) {
            emit(a);
            emit(b);
            parent.closed = true;
        } else if (qa != qb) {
            detail::Branch& good = qa ? a : b;
            detail::Branch& other = qa ? b : a;
            const bool other_small = qa ? small_b : small_a;
            if (other_small) {
                detail::absorb(parent, good);
                detail::absorb(parent, other);
                parent.heights.push_back(h);
            } else {
                emit(good);
                detail::absorb(parent, other);
                parent.heights.push_back(h);
            }
        } else {
            detail::absorb(parent, a);
            detail::absorb(parent, b);
            parent.heights.push_back(h);
        }
    }

    // Roots below the cut end at the cut height
    for (Size v = 0; v < nodes.size(); ++v) {
        detail::Branch& b = nodes[v];
        if (consumed[v] || b.closed || b.genes.empty()) continue;
        if (detail::qualifies(b, cut, params)) {
            emit(b);
        }
    }

    result.n_modules = relabel_by_size(result.labels);
    return result;
}

/// @brief Attach unassigned genes to the nearest module by mean dissimilarity.
///
/// A gene moves only when that mean is at most max_dissimilarity. Module
/// sizes used for the means are those before the stage.
inline Index assign_unassigned(
    MatrixView dissim,
    std::vector<ModuleId>& labels,
    Real max_dissimilarity
) {
    const auto n = static_cast<Index>(labels.size());
    COEXNET_CHECK_DIM(dissim.rows == n && dissim.cols == n,
        "ModuleDetector: dissimilarity shape does not match the number of genes");

    ModuleId max_label = 0;
    for (ModuleId l : labels) max_label = std::max(max_label, l);
    if (max_label == UNASSIGNED_MODULE) {
        return 0;
    }

    std::vector<Index> size(static_cast<Size>(max_label + 1), 0);
    for (ModuleId l : labels) ++size[static_cast<Size>(l)];

    const std::vector<ModuleId> before = labels;
    std::vector<Real> sum(static_cast<Size>(max_label + 1));
    Index moved = 0;

    for (Index g = 0; g < n; ++g) {
        if (before[static_cast<Size>(g)] != UNASSIGNED_MODULE) continue;

        std::fill(sum.begin(), sum.end(), Real(0));
        for (Index j = 0; j < n; ++j) {
            const ModuleId l = before[static_cast<Size>(j)];
            if (l != UNASSIGNED_MODULE) sum[static_cast<Size>(l)] += dissim(g, j);
        }

        ModuleId best = UNASSIGNED_MODULE;
        Real best_mean = std::numeric_limits<Real>::infinity();
        for (ModuleId l = 1; l <= max_label; ++l) {
            if (size[static_cast<Size>(l)] == 0) continue;
            const Real mean = sum[static_cast<Size>(l)] / static_cast<Real>(size[static_cast<Size>(l)]);
            if (mean < best_mean) {
                best_mean = mean;
                best = l;
            }
        }
        if (best != UNASSIGNED_MODULE && best_mean <= max_dissimilarity) {
            labels[static_cast<Size>(g)] = best;
            ++moved;
        }
    }
    return moved;
}

/// @brief average_linkage + cut_tree (+ optional PAM-like stage) on one dissimilarity matrix.
struct ClusterResult {
    hclust::Dendrogram tree;
    TreeCutResult cut;
};

inline ClusterResult cluster_dissimilarity(MatrixView dissim, const TreeCutOptions& options = {}) {
    validate(options);
    ClusterResult out;
    out.tree = hclust::average_linkage(dissim);
    out.cut = cut_tree(out.tree, options);
    if (options.pam_stage && out.cut.n_modules > 0) {
        assign_unassigned(dissim, out.cut.labels, out.cut.cut_height);
        out.cut.n_modules = relabel_by_size(out.cut.labels);
    }
    return out;
}

} // namespace coexnet::kernel::tree_cut
