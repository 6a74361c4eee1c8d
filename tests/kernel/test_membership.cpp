// =============================================================================
// coexnet - Trait Correlation and Module Membership Tests
// =============================================================================
//
// Coverage for coexnet/kernel/membership.hpp
//
// Functions tested:
//   eigengene_names
//   module_trait_correlation
//   module_membership
//   gene_significance
//   gene_table
//
// =============================================================================

#include "test.hpp"

#include "coexnet/kernel/membership.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace coexnet;
using namespace coexnet::test;
namespace eg = coexnet::kernel::eigengene;
namespace mb = coexnet::kernel::membership;
namespace cor = coexnet::kernel::correlation;

namespace {

EigenVector column(MatrixView m, Index c) {
    EigenVector out(m.rows);
    for (Index r = 0; r < m.rows; ++r) out(r) = m(r, c);
    return out;
}

struct Planted {
    ModuleData data;
    eg::EigengeneSet eigengenes;
};

Planted planted() {
    Planted p;
    p.data = module_expression(30, {10, 8}, 4, 0.3, 17);
    p.eigengenes = eg::module_eigengenes(p.data.expression.values.view(), p.data.truth);
    return p;
}

} // namespace

COEXNET_TEST_BEGIN

// =============================================================================
// Module-Trait Correlation
// =============================================================================

COEXNET_TEST_SUITE(module_trait)

COEXNET_TEST_CASE(eigengene_column_names) {
    const auto names = mb::eigengene_names({0, 1, 2});
    COEXNET_ASSERT_EQ(names.size(), Size(3));
    COEXNET_ASSERT_STR_EQ(names[0], "MEgrey");
    COEXNET_ASSERT_STR_EQ(names[1], "MEturquoise");
    COEXNET_ASSERT_STR_EQ(names[2], "MEblue");
}

COEXNET_TEST_CASE(shape_and_labels) {
    const auto p = planted();
    const auto traits = latent_traits(p.data, 0);
    const auto stats = mb::module_trait_correlation(p.eigengenes, traits);

    COEXNET_ASSERT_EQ(stats.cor.rows(), Index(2));
    COEXNET_ASSERT_EQ(stats.cor.cols(), Index(2));
    COEXNET_ASSERT_EQ(stats.pvalue.rows(), Index(2));
    COEXNET_ASSERT_TRUE(stats.modules == p.eigengenes.modules);
    COEXNET_ASSERT_STR_EQ(stats.traits[0], "driven");
    COEXNET_ASSERT_TRUE(all_in_range(stats.cor.view(), -1, 1));
    COEXNET_ASSERT_TRUE(all_in_range(stats.pvalue.view(), 0, 1));
}

COEXNET_TEST_CASE(driven_trait_found) {
    const auto p = planted();
    const auto traits = latent_traits(p.data, 0);
    const auto stats = mb::module_trait_correlation(p.eigengenes, traits);

    COEXNET_ASSERT_GT(stats.cor(0, 0), Real(0.8));
    COEXNET_ASSERT_LT(stats.pvalue(0, 0), Real(1e-6));
    COEXNET_ASSERT_GT(stats.pvalue(1, 0), stats.pvalue(0, 0));
}

COEXNET_TEST_CASE(matches_oracle) {
    const auto p = planted();
    const auto traits = latent_traits(p.data, 1);
    const auto stats = mb::module_trait_correlation(p.eigengenes, traits);

    const auto expected = oracle::pearson(to_eigen(p.eigengenes.eigengenes.view()),
                                          to_eigen(traits.values.view()));
    COEXNET_ASSERT_LE(max_abs_diff(stats.cor.view(), from_eigen(expected).view()), 1e-10);
}

COEXNET_TEST_CASE(sample_mismatch) {
    const auto p = planted();
    TraitMatrix traits;
    traits.values = Matrix(29, 1, Real(0));
    traits.col_names = {"t"};
    COEXNET_ASSERT_THROWS(mb::module_trait_correlation(p.eigengenes, traits), DimensionError);
}

COEXNET_TEST_CASE(constant_trait_throws_or_warns) {
    const auto x = fixture::two_pairs();
    const std::vector<ModuleId> labels = {1, 1, 2, 2};
    const auto set = eg::module_eigengenes(x.values.view(), labels);
    const auto traits = fixture::two_pairs_traits();

    COEXNET_ASSERT_THROWS(mb::module_trait_correlation(set, traits), InsufficientSamplesError);

    cor::CorrelationOptions warn;
    warn.on_undefined = cor::UndefinedPolicy::Warn;
    const auto stats = mb::module_trait_correlation(set, traits, warn);
    COEXNET_ASSERT_TRUE(std::isnan(stats.cor(0, 1)));
    COEXNET_ASSERT_FALSE(std::isnan(stats.cor(0, 0)));
}

COEXNET_TEST_SUITE_END

// =============================================================================
// Module Membership
// =============================================================================

COEXNET_TEST_SUITE(membership)

COEXNET_TEST_CASE(kme_is_correlation_with_eigengene) {
    const auto p = planted();
    const auto kme = mb::module_membership(p.data.expression.values.view(), p.eigengenes);

    COEXNET_ASSERT_EQ(kme.kme.rows(), p.data.expression.cols());
    COEXNET_ASSERT_EQ(kme.kme.cols(), Index(2));
    for (Index g = 0; g < kme.kme.rows(); ++g) {
        for (Index c = 0; c < 2; ++c) {
            const Real expected = oracle::pearson_pair(
                column(p.data.expression.values.view(), g), column(p.eigengenes.eigengenes.view(), c));
            COEXNET_ASSERT_NEAR(kme.kme(g, c), expected, 1e-10);
        }
    }
}

COEXNET_TEST_CASE(own_module_dominates) {
    const auto p = planted();
    const auto kme = mb::module_membership(p.data.expression.values.view(), p.eigengenes);
    for (Index g = 0; g < 18; ++g) {
        const Index own = kme.column_of(p.data.truth[static_cast<Size>(g)]);
        const Index other = 1 - own;
        COEXNET_ASSERT_GT(kme.kme(g, own), Real(0.9));
        COEXNET_ASSERT_GT(kme.kme(g, own), std::abs(kme.kme(g, other)));
        COEXNET_ASSERT_LT(kme.pvalue(g, own), Real(1e-6));
    }
}

COEXNET_TEST_CASE(two_pairs_membership) {
    const auto x = fixture::two_pairs();
    const std::vector<ModuleId> labels = {1, 1, 2, 2};
    const auto set = eg::module_eigengenes(x.values.view(), labels);
    const auto kme = mb::module_membership(x.values.view(), set);

    for (Index g = 0; g < 4; ++g) {
        const Index own = g < 2 ? 0 : 1;
        COEXNET_ASSERT_NEAR(kme.kme(g, own), 1.0, 1e-10);
        COEXNET_ASSERT_NEAR(kme.kme(g, 1 - own), 0.0, 1e-10);
        COEXNET_ASSERT_LT(kme.pvalue(g, own), Real(1e-3));
    }
}

COEXNET_TEST_CASE(sample_mismatch) {
    const auto p = planted();
    const Matrix x = random_matrix(12, 4);
    COEXNET_ASSERT_THROWS(mb::module_membership(x.view(), p.eigengenes), DimensionError);
}

COEXNET_TEST_SUITE_END

// =============================================================================
// Gene Significance
// =============================================================================

COEXNET_TEST_SUITE(gene_significance)

COEXNET_TEST_CASE(matches_oracle) {
    const auto p = planted();
    const auto traits = latent_traits(p.data, 0);
    const auto gs = mb::gene_significance(p.data.expression, traits, "driven");

    COEXNET_ASSERT_STR_EQ(gs.trait, "driven");
    COEXNET_ASSERT_EQ(gs.gs.size(), Size(22));
    const EigenVector t = column(traits.values.view(), 0);
    for (Index g = 0; g < 22; ++g) {
        const Real expected = oracle::pearson_pair(column(p.data.expression.values.view(), g), t);
        COEXNET_ASSERT_NEAR(gs.gs[static_cast<Size>(g)], expected, 1e-10);
    }
    COEXNET_ASSERT_GT(gs.gs[0], Real(0.7));
}

COEXNET_TEST_CASE(constant_trait_throws) {
    const auto x = fixture::two_pairs();
    const auto traits = fixture::two_pairs_traits();
    COEXNET_ASSERT_THROWS(mb::gene_significance(x, traits, "batch"), InsufficientSamplesError);
    COEXNET_ASSERT_NO_THROW(mb::gene_significance(x, traits, "treated"));
}

COEXNET_TEST_CASE(constant_trait_warns) {
    const auto x = fixture::two_pairs();
    const auto traits = fixture::two_pairs_traits();
    cor::CorrelationOptions warn;
    warn.on_undefined = cor::UndefinedPolicy::Warn;
    const auto gs = mb::gene_significance(x, traits, "batch", warn);
    for (Size g = 0; g < gs.gs.size(); ++g) {
        COEXNET_ASSERT_TRUE(std::isnan(gs.gs[g]));
        COEXNET_ASSERT_TRUE(std::isnan(gs.pvalue[g]));
    }
}

COEXNET_TEST_CASE(unknown_trait) {
    const auto x = fixture::two_pairs();
    const auto traits = fixture::two_pairs_traits();
    try {
        (void)mb::gene_significance(x, traits, "weight");
        COEXNET_FAIL("expected ValueError");
    } catch (const ValueError& e) {
        COEXNET_ASSERT_STR_CONTAINS(e.what(), "weight");
    }
}

COEXNET_TEST_CASE(missing_trait_values_skipped) {
    const auto p = planted();
    auto traits = latent_traits(p.data, 0);
    traits.values(4, 0) = std::numeric_limits<Real>::quiet_NaN();
    const auto gs = mb::gene_significance(p.data.expression, traits, "driven");

    const Real expected = oracle::pearson_pair(column(p.data.expression.values.view(), 3),
                                               column(traits.values.view(), 0));
    COEXNET_ASSERT_NEAR(gs.gs[3], expected, 1e-10);
}

COEXNET_TEST_SUITE_END

// =============================================================================
// Gene Table
// =============================================================================

COEXNET_TEST_SUITE(gene_table)

COEXNET_TEST_CASE(one_row_per_gene) {
    const auto p = planted();
    const auto kme = mb::module_membership(p.data.expression.values.view(), p.eigengenes);
    const auto traits = latent_traits(p.data, 0);
    const auto gs = mb::gene_significance(p.data.expression, traits, "driven");

    const auto rows = mb::gene_table(p.data.expression.col_names, p.data.truth, kme, &gs);
    COEXNET_ASSERT_EQ(rows.size(), Size(22));
    COEXNET_ASSERT_STR_EQ(rows[11].name, "gene11");
    COEXNET_ASSERT_EQ(rows[11].module, ModuleId(2));
    COEXNET_ASSERT_EQ(rows[20].module, UNASSIGNED_MODULE);
    COEXNET_ASSERT_EQ(rows[11].kme.size(), Size(2));
    COEXNET_ASSERT_EQ(rows[11].kme[1], kme.kme(11, 1));
    COEXNET_ASSERT_EQ(rows[11].gs, gs.gs[11]);
}

COEXNET_TEST_CASE(without_trait) {
    const auto p = planted();
    const auto kme = mb::module_membership(p.data.expression.values.view(), p.eigengenes);
    const auto rows = mb::gene_table(p.data.expression.col_names, p.data.truth, kme);
    COEXNET_ASSERT_TRUE(std::isnan(rows[0].gs));
    COEXNET_ASSERT_TRUE(std::isnan(rows[0].gs_pvalue));
}

COEXNET_TEST_CASE(inputs_must_agree) {
    const auto p = planted();
    const auto kme = mb::module_membership(p.data.expression.values.view(), p.eigengenes);
    const std::vector<ModuleId> labels(5, 1);
    COEXNET_ASSERT_THROWS(mb::gene_table(p.data.expression.col_names, labels, kme), DimensionError);
}

COEXNET_TEST_SUITE_END

COEXNET_TEST_END

COEXNET_TEST_MAIN()
