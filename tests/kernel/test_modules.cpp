// =============================================================================
// coexnet - Module Detection Tests
// =============================================================================
//
// Coverage for coexnet/kernel/hclust.hpp, tree_cut.hpp and modules.hpp
//
// Functions tested:
//   hclust::average_linkage
//   tree_cut::cut_tree / relabel_by_size / assign_unassigned / validate
//   modules::detect_modules / detect_modules_from_dissimilarity
//   modules::contiguous_blocks
//   modules::merge_close_modules
//   modules::display_label / parse_label
//
// =============================================================================

#include "test.hpp"

#include "coexnet/kernel/modules.hpp"

#include <algorithm>
#include <limits>
#include <vector>

using namespace coexnet;
using namespace coexnet::test;
namespace hc = coexnet::kernel::hclust;
namespace cut = coexnet::kernel::tree_cut;
namespace mod = coexnet::kernel::modules;

namespace {

// Two tight pairs {0, 1} and {2, 3}, far apart
Matrix two_cluster_dissimilarity(Real near_a, Real near_b, Real far) {
    Matrix d(4, 4, far);
    for (Index i = 0; i < 4; ++i) d(i, i) = 0;
    d(0, 1) = d(1, 0) = near_a;
    d(2, 3) = d(3, 2) = near_b;
    return d;
}

bool same_label(const std::vector<ModuleId>& labels, Index first, Index last) {
    const ModuleId l = labels[static_cast<Size>(first)];
    for (Index g = first; g <= last; ++g) {
        if (labels[static_cast<Size>(g)] != l) return false;
    }
    return l != UNASSIGNED_MODULE;
}

mod::DetectionOptions detection(Index min_module_size) {
    mod::DetectionOptions opts;
    opts.power = 6;
    opts.cut.min_module_size = min_module_size;
    return opts;
}

} // namespace

COEXNET_TEST_BEGIN

// =============================================================================
// Hierarchical Clustering
// =============================================================================

COEXNET_TEST_SUITE(average_linkage)

COEXNET_TEST_CASE(two_pairs_tree) {
    const Matrix d = two_cluster_dissimilarity(1, 2, 10);
    const auto tree = hc::average_linkage(d.view());

    COEXNET_ASSERT_EQ(tree.n_leaves, Index(4));
    COEXNET_ASSERT_EQ(tree.n_merges(), Index(3));
    COEXNET_ASSERT_EQ(tree.merges[0][0], Index(0));
    COEXNET_ASSERT_EQ(tree.merges[0][1], Index(1));
    COEXNET_ASSERT_EQ(tree.merges[1][0], Index(2));
    COEXNET_ASSERT_EQ(tree.merges[1][1], Index(3));
    COEXNET_ASSERT_EQ(tree.merges[2][0], Index(4));
    COEXNET_ASSERT_EQ(tree.merges[2][1], Index(5));
    COEXNET_ASSERT_EQ(tree.heights[2], Real(10));
    COEXNET_ASSERT_EQ(tree.sizes[2], Index(4));
    COEXNET_ASSERT_EQ(tree.root(), Index(6));
}

COEXNET_TEST_CASE(average_of_members) {
    const Real values[] = {
        0, 1, 4,
        1, 0, 6,
        4, 6, 0,
    };
    const Matrix d = Matrix::from(values, 3, 3);
    const auto tree = hc::average_linkage(d.view());
    COEXNET_ASSERT_EQ(tree.heights[0], Real(1));
    COEXNET_ASSERT_NEAR(tree.heights[1], 5.0, 1e-15);
}

COEXNET_TEST_CASE(ties_resolve_to_lowest_index) {
    const Matrix d = two_cluster_dissimilarity(1, 1, 1);
    const auto tree = hc::average_linkage(d.view());
    COEXNET_ASSERT_EQ(tree.merges[0][0], Index(0));
    COEXNET_ASSERT_EQ(tree.merges[0][1], Index(1));
}

COEXNET_TEST_CASE(heights_non_decreasing_order_permutation) {
    const Matrix x = random_matrix(10, 60, 3);
    const auto r = kernel::correlation::correlate(x.view());
    Matrix d(60, 60);
    for (Index i = 0; i < 60; ++i) {
        for (Index j = 0; j < 60; ++j) d(i, j) = Real(1) - r.cor(i, j);
    }
    const auto tree = hc::average_linkage(d.view());

    COEXNET_ASSERT_EQ(tree.n_merges(), Index(59));
    for (Index s = 1; s < tree.n_merges(); ++s) {
        COEXNET_ASSERT_GE(tree.heights[static_cast<Size>(s)] + Real(1e-12),
                          tree.heights[static_cast<Size>(s - 1)]);
    }
    std::vector<Index> order = tree.order;
    std::sort(order.begin(), order.end());
    for (Index i = 0; i < 60; ++i) {
        COEXNET_ASSERT_EQ(order[static_cast<Size>(i)], i);
    }
    COEXNET_ASSERT_EQ(tree.sizes.back(), Index(60));
}

COEXNET_TEST_CASE(single_leaf) {
    const Matrix d(1, 1, Real(0));
    const auto tree = hc::average_linkage(d.view());
    COEXNET_ASSERT_EQ(tree.n_merges(), Index(0));
    COEXNET_ASSERT_EQ(tree.order.size(), Size(1));
    COEXNET_ASSERT_EQ(tree.root(), Index(0));
}

COEXNET_TEST_CASE(invalid_input_rejected) {
    Matrix d = two_cluster_dissimilarity(1, 2, 10);
    d(0, 3) = 9;
    COEXNET_ASSERT_THROWS(hc::average_linkage(d.view()), ValueError);
    d(0, 3) = std::numeric_limits<Real>::quiet_NaN();
    COEXNET_ASSERT_THROWS(hc::average_linkage(d.view()), DegenerateInputError);
    const Matrix rect(3, 4, Real(0));
    COEXNET_ASSERT_THROWS(hc::average_linkage(rect.view()), DimensionError);
}

COEXNET_TEST_SUITE_END

// =============================================================================
// Tree Cut
// =============================================================================

COEXNET_TEST_SUITE(tree_cut)

COEXNET_TEST_CASE(two_tight_pairs_become_modules) {
    const Matrix d = two_cluster_dissimilarity(Real(0.01), Real(0.02), Real(0.9));
    cut::TreeCutOptions opts;
    opts.min_module_size = 2;
    const auto result = cut::cluster_dissimilarity(d.view(), opts);

    COEXNET_ASSERT_EQ(result.cut.n_modules, Index(2));
    COEXNET_ASSERT_NEAR(result.cut.cut_height, 0.9, 1e-15);
    const std::vector<ModuleId> expected = {1, 1, 2, 2};
    COEXNET_ASSERT_TRUE(result.cut.labels == expected);
}

COEXNET_TEST_CASE(min_size_above_gene_count_leaves_unassigned) {
    const Matrix d = two_cluster_dissimilarity(Real(0.01), Real(0.02), Real(0.9));
    cut::TreeCutOptions opts;
    opts.min_module_size = 5;
    const auto result = cut::cluster_dissimilarity(d.view(), opts);
    COEXNET_ASSERT_EQ(result.cut.n_modules, Index(0));
    for (ModuleId l : result.cut.labels) {
        COEXNET_ASSERT_EQ(l, UNASSIGNED_MODULE);
    }
}

COEXNET_TEST_CASE(relabel_largest_first) {
    std::vector<ModuleId> labels = {3, 3, 0, 1, 2, 2, 2};
    const Index k = cut::relabel_by_size(labels);
    COEXNET_ASSERT_EQ(k, Index(3));
    const std::vector<ModuleId> expected = {2, 2, 0, 3, 1, 1, 1};
    COEXNET_ASSERT_TRUE(labels == expected);
}

COEXNET_TEST_CASE(relabel_ties_by_first_gene) {
    std::vector<ModuleId> labels = {5, 2, 5, 2};
    cut::relabel_by_size(labels);
    const std::vector<ModuleId> expected = {1, 2, 1, 2};
    COEXNET_ASSERT_TRUE(labels == expected);
}

COEXNET_TEST_CASE(assign_unassigned_respects_limit) {
    const Real values[] = {
        0,   0.1, 0.2,
        0.1, 0,   0.4,
        0.2, 0.4, 0,
    };
    const Matrix d = Matrix::from(values, 3, 3);

    std::vector<ModuleId> strict = {1, 1, 0};
    COEXNET_ASSERT_EQ(cut::assign_unassigned(d.view(), strict, Real(0.25)), Index(0));
    COEXNET_ASSERT_EQ(strict[2], UNASSIGNED_MODULE);

    std::vector<ModuleId> loose = {1, 1, 0};
    COEXNET_ASSERT_EQ(cut::assign_unassigned(d.view(), loose, Real(0.5)), Index(1));
    COEXNET_ASSERT_EQ(loose[2], ModuleId(1));
}

COEXNET_TEST_CASE(options_validated) {
    cut::TreeCutOptions opts;
    opts.min_module_size = 0;
    COEXNET_ASSERT_THROWS(cut::validate(opts), ValueError);

    opts = cut::TreeCutOptions{};
    opts.deep_split = 5;
    COEXNET_ASSERT_THROWS(cut::validate(opts), RangeError);

    opts = cut::TreeCutOptions{};
    opts.cut_height = 0;
    COEXNET_ASSERT_THROWS(cut::validate(opts), ValueError);
}

COEXNET_TEST_CASE(core_size_grows_slowly) {
    COEXNET_ASSERT_EQ(cut::core_size(2, 2), Index(2));
    COEXNET_ASSERT_EQ(cut::core_size(12, 11), Index(8));
    COEXNET_ASSERT_LT(cut::core_size(100, 20), Index(100));
}

COEXNET_TEST_SUITE_END

// =============================================================================
// Detection
// =============================================================================

COEXNET_TEST_SUITE(detect_modules)

COEXNET_TEST_CASE(two_pairs_scenario) {
    const auto x = fixture::two_pairs();
    const auto result = mod::detect_modules(x.values.view(), detection(2));

    COEXNET_ASSERT_EQ(result.n_modules, Index(2));
    COEXNET_ASSERT_EQ(result.labels[0], result.labels[1]);
    COEXNET_ASSERT_EQ(result.labels[2], result.labels[3]);
    COEXNET_ASSERT_NE(result.labels[0], result.labels[2]);
    COEXNET_ASSERT_NE(result.labels[0], UNASSIGNED_MODULE);
    COEXNET_ASSERT_TRUE(result.advisories.empty());
}

COEXNET_TEST_CASE(recovers_planted_modules) {
    const auto data = module_expression(30, {20, 16, 12}, 0, 0.25, 5);
    const auto result = mod::detect_modules(data.expression.values.view(), detection(11));

    COEXNET_ASSERT_EQ(result.n_modules, Index(3));
    COEXNET_ASSERT_TRUE(result.labels == data.truth);
    COEXNET_ASSERT_EQ(result.blocks.size(), Size(1));
    COEXNET_ASSERT_EQ(result.trees.size(), Size(1));
}

COEXNET_TEST_CASE(deterministic) {
    const auto data = module_expression(20, {12, 9}, 6, 0.3, 9);
    const auto a = mod::detect_modules(data.expression.values.view(), detection(5));
    const auto b = mod::detect_modules(data.expression.values.view(), detection(5));
    COEXNET_ASSERT_TRUE(a.labels == b.labels);
    COEXNET_ASSERT_TRUE(a.trees[0].heights == b.trees[0].heights);
}

COEXNET_TEST_CASE(labels_ordered_by_size) {
    const auto data = module_expression(30, {12, 20, 16}, 0, 0.25, 5);
    const auto result = mod::detect_modules(data.expression.values.view(), detection(11));

    std::vector<Index> sizes(static_cast<Size>(result.n_modules + 1), 0);
    for (ModuleId l : result.labels) ++sizes[static_cast<Size>(l)];
    for (Index m = 2; m <= result.n_modules; ++m) {
        COEXNET_ASSERT_GE(sizes[static_cast<Size>(m - 1)], sizes[static_cast<Size>(m)]);
    }
    COEXNET_ASSERT_EQ(result.labels[12], ModuleId(1));
}

COEXNET_TEST_CASE(blockwise_detection) {
    const auto data = module_expression(30, {20, 16, 12}, 0, 0.25, 5);
    auto opts = detection(11);
    opts.max_block_size = 24;
    const auto result = mod::detect_modules(data.expression.values.view(), opts);

    COEXNET_ASSERT_EQ(result.blocks.size(), Size(2));
    COEXNET_ASSERT_EQ(result.trees.size(), Size(2));
    COEXNET_ASSERT_EQ(result.blocks[1].front(), Index(24));
    COEXNET_ASSERT_TRUE(same_label(result.labels, 0, 19));
    COEXNET_ASSERT_TRUE(same_label(result.labels, 36, 47));
    COEXNET_ASSERT_NE(result.labels[0], result.labels[36]);
}

COEXNET_TEST_CASE(too_few_genes_advisory) {
    const auto x = fixture::two_pairs();
    const auto result = mod::detect_modules(x.values.view(), detection(30));
    COEXNET_ASSERT_EQ(result.n_modules, Index(0));
    COEXNET_ASSERT_EQ(result.advisories.size(), Size(1));
    COEXNET_ASSERT_STR_CONTAINS(result.advisories[0].message, "fewer than min_module_size");
    COEXNET_ASSERT_STR_EQ(result.advisories[0].stage, "ModuleDetector");
}

COEXNET_TEST_CASE(from_dissimilarity) {
    const Matrix d = two_cluster_dissimilarity(Real(0.01), Real(0.02), Real(0.9));
    cut::TreeCutOptions opts;
    opts.min_module_size = 2;
    const auto result = mod::detect_modules_from_dissimilarity(d.view(), opts);
    COEXNET_ASSERT_EQ(result.n_modules, Index(2));
    COEXNET_ASSERT_EQ(result.blocks.size(), Size(1));
    COEXNET_ASSERT_EQ(result.blocks[0].size(), Size(4));
    COEXNET_ASSERT_EQ(result.trees[0].n_leaves, Index(4));
    COEXNET_ASSERT_TRUE(result.advisories.empty());
}

COEXNET_TEST_CASE(invalid_power_rejected) {
    const auto x = fixture::two_pairs();
    auto opts = detection(2);
    opts.power = 0;
    COEXNET_ASSERT_THROWS(mod::detect_modules(x.values.view(), opts), DomainError);
}

COEXNET_TEST_CASE(contiguous_block_sizes) {
    const auto blocks = mod::contiguous_blocks(10, 4);
    COEXNET_ASSERT_EQ(blocks.size(), Size(3));
    COEXNET_ASSERT_EQ(blocks[0].size(), Size(4));
    COEXNET_ASSERT_EQ(blocks[1].size(), Size(3));
    COEXNET_ASSERT_EQ(blocks[2].size(), Size(3));
    COEXNET_ASSERT_EQ(blocks[1].front(), Index(4));
    COEXNET_ASSERT_EQ(blocks[2].back(), Index(9));

    COEXNET_ASSERT_TRUE(mod::contiguous_blocks(0, 5).empty());
    COEXNET_ASSERT_EQ(mod::contiguous_blocks(5, 5).size(), Size(1));
    COEXNET_ASSERT_THROWS(mod::contiguous_blocks(5, 0), ValueError);
}

COEXNET_TEST_SUITE_END

// =============================================================================
// Eigengene Merging
// =============================================================================

COEXNET_TEST_SUITE(merge)

COEXNET_TEST_CASE(split_module_is_rejoined) {
    const auto data = module_expression(30, {10, 10}, 4, 0.3, 23);
    // Module 1 split in two halves, noise genes unassigned
    std::vector<ModuleId> labels(24, UNASSIGNED_MODULE);
    for (Index g = 0; g < 5; ++g) labels[static_cast<Size>(g)] = 1;
    for (Index g = 5; g < 10; ++g) labels[static_cast<Size>(g)] = 2;
    for (Index g = 10; g < 20; ++g) labels[static_cast<Size>(g)] = 3;

    const auto merged = mod::merge_close_modules(data.expression.values.view(), labels);

    COEXNET_ASSERT_EQ(merged.history.size(), Size(1));
    COEXNET_ASSERT_EQ(merged.history[0].absorbed, ModuleId(2));
    COEXNET_ASSERT_EQ(merged.history[0].survivor, ModuleId(1));
    COEXNET_ASSERT_LT(merged.history[0].dissimilarity, Real(0.25));
    COEXNET_ASSERT_TRUE(same_label(merged.labels, 0, 9));
    COEXNET_ASSERT_EQ(merged.labels[0], ModuleId(1));
    COEXNET_ASSERT_EQ(merged.labels[15], ModuleId(3));
    for (Index g = 20; g < 24; ++g) {
        COEXNET_ASSERT_EQ(merged.labels[static_cast<Size>(g)], UNASSIGNED_MODULE);
    }
    COEXNET_ASSERT_EQ(merged.eigengenes.modules.size(), Size(2));
    COEXNET_ASSERT_EQ(merged.eigengenes.column_of(3), Index(1));
}

COEXNET_TEST_CASE(larger_module_survives) {
    const auto data = module_expression(30, {12}, 0, 0.3, 29);
    std::vector<ModuleId> labels(12, 1);
    for (Index g = 0; g < 4; ++g) labels[static_cast<Size>(g)] = 2;   // 4 genes as id 2, 8 as id 1
    const auto merged = mod::merge_close_modules(data.expression.values.view(), labels);
    COEXNET_ASSERT_EQ(merged.history.size(), Size(1));
    COEXNET_ASSERT_EQ(merged.history[0].survivor, ModuleId(1));
    for (ModuleId l : merged.labels) {
        COEXNET_ASSERT_EQ(l, ModuleId(1));
    }
}

COEXNET_TEST_CASE(count_never_increases) {
    const auto data = module_expression(25, {8, 8, 8}, 5, 0.4, 31);
    const auto detected = mod::detect_modules(data.expression.values.view(), detection(5));
    const auto merged = mod::merge_close_modules(data.expression.values.view(), detected.labels, Real(0.5));

    COEXNET_ASSERT_LE(mod::count_modules(merged.labels), mod::count_modules(detected.labels));
    for (Size g = 0; g < detected.labels.size(); ++g) {
        if (detected.labels[g] == UNASSIGNED_MODULE) {
            COEXNET_ASSERT_EQ(merged.labels[g], UNASSIGNED_MODULE);
        } else {
            COEXNET_ASSERT_NE(merged.labels[g], UNASSIGNED_MODULE);
        }
    }
    COEXNET_ASSERT_EQ(mod::count_modules(merged.labels) + static_cast<Index>(merged.history.size()),
                      mod::count_modules(detected.labels));
}

COEXNET_TEST_CASE(zero_cut_keeps_distinct_modules) {
    const auto data = module_expression(30, {6, 6}, 0, 0.3, 37);
    std::vector<ModuleId> labels(12, 1);
    for (Index g = 6; g < 12; ++g) labels[static_cast<Size>(g)] = 2;
    const auto merged = mod::merge_close_modules(data.expression.values.view(), labels, Real(0));
    COEXNET_ASSERT_TRUE(merged.history.empty());
    COEXNET_ASSERT_TRUE(merged.labels == labels);
}

COEXNET_TEST_CASE(arguments_validated) {
    const auto data = module_expression(10, {4});
    const std::vector<ModuleId> short_labels(3, 1);
    COEXNET_ASSERT_THROWS(mod::merge_close_modules(data.expression.values.view(), short_labels),
                          DimensionError);
    const std::vector<ModuleId> labels(4, 1);
    COEXNET_ASSERT_THROWS(mod::merge_close_modules(data.expression.values.view(), labels, Real(-0.1)),
                          ValueError);
}

COEXNET_TEST_SUITE_END

// =============================================================================
// Labels
// =============================================================================

COEXNET_TEST_SUITE(labels)

COEXNET_TEST_CASE(display_names) {
    COEXNET_ASSERT_STR_EQ(mod::display_label(UNASSIGNED_MODULE), "grey");
    COEXNET_ASSERT_STR_EQ(mod::display_label(1), "turquoise");
    COEXNET_ASSERT_STR_EQ(mod::display_label(2), "blue");
    COEXNET_ASSERT_STR_EQ(mod::display_label(35), "module35");
}

COEXNET_TEST_CASE(parse_inverts_display) {
    for (ModuleId id = 0; id <= 40; ++id) {
        COEXNET_ASSERT_EQ(mod::parse_label(mod::display_label(id)), id);
    }
    COEXNET_ASSERT_EQ(mod::parse_label("17"), ModuleId(17));
    COEXNET_ASSERT_EQ(mod::parse_label("mauve"), ModuleId(-1));
    COEXNET_ASSERT_EQ(mod::parse_label("module"), ModuleId(-1));
}

COEXNET_TEST_CASE(assignment_queries) {
    mod::ModuleAssignment a;
    a.merged = {2, 0, 1, 2, 1, 2};
    a.unmerged = a.merged;
    const std::vector<ModuleId> ids = {1, 2};
    COEXNET_ASSERT_TRUE(a.module_ids() == ids);
    COEXNET_ASSERT_EQ(a.n_modules(), Index(2));
    const std::vector<Index> genes = {0, 3, 5};
    COEXNET_ASSERT_TRUE(a.genes_of(2) == genes);
    COEXNET_ASSERT_TRUE(a.genes_of(7).empty());
}

COEXNET_TEST_SUITE_END

COEXNET_TEST_END

COEXNET_TEST_MAIN()
