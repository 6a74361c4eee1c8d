// =============================================================================
// coexnet - Correlation Tests
// =============================================================================
//
// Coverage for coexnet/kernel/correlation.hpp and coexnet/math/stats.hpp
//
// Functions tested:
//   correlate (symmetric and cross)
//   prepare_columns via Pearson / Spearman / bicor
//   math::correlation_pvalue, student_pvalue
//
// =============================================================================

#include "test.hpp"

#include "coexnet/kernel/correlation.hpp"
#include "coexnet/math/stats.hpp"

#include <cmath>
#include <limits>

using namespace coexnet;
using namespace coexnet::test;
namespace cor = coexnet::kernel::correlation;

namespace {

constexpr Real TOL = 1e-10;
const Real NaN = std::numeric_limits<Real>::quiet_NaN();

Matrix oracle_matrix(const EigenDense& m) {
    return from_eigen(m);
}

} // namespace

COEXNET_TEST_BEGIN

// =============================================================================
// Pearson
// =============================================================================

COEXNET_TEST_SUITE(pearson)

COEXNET_TEST_CASE(matches_oracle) {
    const Matrix x = random_matrix(30, 12, 3);
    const auto r = cor::correlate(x.view());

    const Matrix expected = oracle_matrix(oracle::pearson(to_eigen(x.view())));
    COEXNET_ASSERT_LE(max_abs_diff(r.cor.view(), expected.view()), TOL);
    COEXNET_ASSERT_EQ(r.n_undefined, Size(0));
}

COEXNET_TEST_CASE(symmetric_unit_diagonal_bounded) {
    const Matrix x = random_matrix(25, 40, 5);
    const auto r = cor::correlate(x.view());

    COEXNET_ASSERT_TRUE(is_symmetric(r.cor.view()));
    COEXNET_ASSERT_TRUE(all_in_range(r.cor.view(), -1, 1));
    for (Index i = 0; i < r.cor.rows(); ++i) {
        COEXNET_ASSERT_EQ(r.cor(i, i), Real(1));
        COEXNET_ASSERT_EQ(r.n_obs(i, i), Index(25));
    }
}

COEXNET_TEST_CASE(cross_matches_oracle) {
    const Matrix x = random_matrix(18, 7, 21);
    const Matrix y = random_matrix(18, 4, 22);
    const auto r = cor::correlate(x.view(), y.view());

    COEXNET_ASSERT_EQ(r.cor.rows(), Index(7));
    COEXNET_ASSERT_EQ(r.cor.cols(), Index(4));
    const Matrix expected = oracle_matrix(oracle::pearson(to_eigen(x.view()), to_eigen(y.view())));
    COEXNET_ASSERT_LE(max_abs_diff(r.cor.view(), expected.view()), TOL);
}

COEXNET_TEST_CASE(exact_linear_relations) {
    const Real values[] = {
        1, 3, -1,
        2, 5, -2,
        4, 9, -4,
        7, 15, -7,
    };
    const Matrix x = Matrix::from(values, 4, 3);
    const auto r = cor::correlate(x.view());
    COEXNET_ASSERT_NEAR(r.cor(0, 1), 1.0, TOL);
    COEXNET_ASSERT_NEAR(r.cor(0, 2), -1.0, TOL);
    COEXNET_ASSERT_NEAR(r.pvalue(0, 1), 0.0, TOL);
}

COEXNET_TEST_CASE(deterministic) {
    const Matrix x = random_matrix(40, 300, 9);
    const auto a = cor::correlate(x.view());
    const auto b = cor::correlate(x.view());
    COEXNET_ASSERT_EQ(max_abs_diff(a.cor.view(), b.cor.view()), Real(0));
    COEXNET_ASSERT_EQ(max_abs_diff(a.pvalue.view(), b.pvalue.view()), Real(0));
}

COEXNET_TEST_CASE(sample_mismatch_rejected) {
    const Matrix x = random_matrix(10, 3);
    const Matrix y = random_matrix(11, 3);
    COEXNET_ASSERT_THROWS(cor::correlate(x.view(), y.view()), DimensionError);
}

COEXNET_TEST_CASE(pvalues_optional) {
    const Matrix x = random_matrix(10, 3);
    cor::CorrelationOptions opts;
    opts.compute_pvalues = false;
    const auto r = cor::correlate(x.view(), opts);
    COEXNET_ASSERT_TRUE(r.pvalue.empty());
}

COEXNET_TEST_SUITE_END

// =============================================================================
// Significance
// =============================================================================

COEXNET_TEST_SUITE(significance)

COEXNET_TEST_CASE(student_t_reference_value) {
    // t = 0.5 * sqrt(8 / 0.75) = 1.633 on 8 df
    COEXNET_ASSERT_NEAR(math::correlation_pvalue(0.5, 10.0), 0.1411, 5e-4);
    COEXNET_ASSERT_NEAR(math::correlation_pvalue(-0.5, 10.0), 0.1411, 5e-4);
}

COEXNET_TEST_CASE(edge_values) {
    COEXNET_ASSERT_NEAR(math::correlation_pvalue(0.0, 20.0), 1.0, 1e-12);
    COEXNET_ASSERT_EQ(math::correlation_pvalue(1.0, 5.0), 0.0);
    COEXNET_ASSERT_TRUE(std::isnan(math::correlation_pvalue(0.3, 2.0)));
    COEXNET_ASSERT_TRUE(std::isnan(math::correlation_pvalue(NaN, 10.0)));
}

COEXNET_TEST_CASE(result_pvalues_follow_pair_counts) {
    Matrix x = random_matrix(16, 3, 61);
    x(4, 2) = NaN;
    const auto r = cor::correlate(x.view());
    COEXNET_ASSERT_NEAR(r.pvalue(0, 1), cor::student_pvalue(r.cor(0, 1), 16), 1e-12);
    COEXNET_ASSERT_NEAR(r.pvalue(0, 2), cor::student_pvalue(r.cor(0, 2), 15), 1e-12);
    COEXNET_ASSERT_TRUE(std::isnan(cor::student_pvalue(Real(0.4), 2)));
}

COEXNET_TEST_CASE(pvalues_in_unit_interval) {
    const Matrix x = random_matrix(12, 20, 31);
    const auto r = cor::correlate(x.view());
    COEXNET_ASSERT_TRUE(all_in_range(r.pvalue.view(), 0, 1));
    COEXNET_ASSERT_TRUE(is_symmetric(r.pvalue.view()));
}

COEXNET_TEST_CASE(stronger_correlation_smaller_pvalue) {
    COEXNET_ASSERT_LT(math::correlation_pvalue(0.8, 12.0), math::correlation_pvalue(0.4, 12.0));
    COEXNET_ASSERT_LT(math::correlation_pvalue(0.4, 40.0), math::correlation_pvalue(0.4, 12.0));
}

COEXNET_TEST_SUITE_END

// =============================================================================
// Missing Values and Undefined Pairs
// =============================================================================

COEXNET_TEST_SUITE(missing_values)

COEXNET_TEST_CASE(pairwise_complete_matches_oracle) {
    Matrix x = random_matrix(20, 6, 44);
    x(0, 1) = NaN;
    x(3, 1) = NaN;
    x(7, 4) = NaN;
    const auto r = cor::correlate(x.view());

    const Matrix expected = oracle_matrix(oracle::pearson(to_eigen(x.view())));
    COEXNET_ASSERT_LE(max_abs_diff(r.cor.view(), expected.view()), TOL);
    COEXNET_ASSERT_EQ(r.n_obs(1, 4), Index(17));
    COEXNET_ASSERT_EQ(r.n_obs(1, 0), Index(18));
    COEXNET_ASSERT_EQ(r.n_obs(0, 2), Index(20));
}

COEXNET_TEST_CASE(spearman_reranks_paired_samples) {
    // Paired samples 1..3: x ranks (1, 2, 3), y ranks (1, 3, 2)
    const Real values[] = {
        2.5, NaN,
        1,   1,
        2,   3,
        3,   2,
    };
    const Matrix x = Matrix::from(values, 4, 2);
    cor::CorrelationOptions opts;
    opts.type = cor::CorrelationType::Spearman;
    const auto r = cor::correlate(x.view(), opts);

    COEXNET_ASSERT_EQ(r.n_obs(0, 1), Index(3));
    COEXNET_ASSERT_NEAR(r.cor(0, 1), Real(0.5), TOL);
    COEXNET_ASSERT_NEAR(r.cor(1, 0), Real(0.5), TOL);
}

COEXNET_TEST_CASE(spearman_pairwise_matches_complete_subset) {
    Matrix x = random_matrix(15, 3, 52);
    x(2, 0) = NaN;
    x(9, 2) = NaN;
    cor::CorrelationOptions opts;
    opts.type = cor::CorrelationType::Spearman;
    const auto r = cor::correlate(x.view(), opts);

    // Same pair with the missing samples removed up front
    Matrix kept(13, 3);
    Index row = 0;
    for (Index s = 0; s < 15; ++s) {
        if (s == 2 || s == 9) continue;
        for (Index c = 0; c < 3; ++c) kept(row, c) = x(s, c);
        ++row;
    }
    const auto full = cor::correlate(kept.view(), opts);
    COEXNET_ASSERT_NEAR(r.cor(0, 2), full.cor(0, 2), TOL);
    COEXNET_ASSERT_EQ(r.n_obs(0, 2), Index(13));
}

COEXNET_TEST_CASE(two_paired_samples_throw) {
    const Real values[] = {
        1,   2,
        2,   NaN,
        3,   NaN,
        NaN, 4,
        5,   8,
    };
    const Matrix x = Matrix::from(values, 5, 2);
    COEXNET_ASSERT_THROWS(cor::correlate(x.view()), InsufficientSamplesError);
}

COEXNET_TEST_CASE(two_samples_throw) {
    const Matrix x = random_matrix(2, 3);
    COEXNET_ASSERT_THROWS(cor::correlate(x.view()), InsufficientSamplesError);
}

COEXNET_TEST_CASE(constant_column_throws) {
    Matrix x = random_matrix(8, 3);
    for (Index s = 0; s < 8; ++s) x(s, 2) = 4;
    COEXNET_ASSERT_THROWS(cor::correlate(x.view()), InsufficientSamplesError);
}

COEXNET_TEST_CASE(warn_policy_yields_nan) {
    Matrix x = random_matrix(8, 3);
    for (Index s = 0; s < 8; ++s) x(s, 2) = 4;

    cor::CorrelationOptions opts;
    opts.on_undefined = cor::UndefinedPolicy::Warn;
    const auto r = cor::correlate(x.view(), opts);

    COEXNET_ASSERT_TRUE(std::isnan(r.cor(0, 2)));
    COEXNET_ASSERT_TRUE(std::isnan(r.cor(2, 0)));
    COEXNET_ASSERT_TRUE(std::isnan(r.cor(2, 2)));
    COEXNET_ASSERT_TRUE(std::isnan(r.pvalue(1, 2)));
    COEXNET_ASSERT_FALSE(std::isnan(r.cor(0, 1)));
    COEXNET_ASSERT_EQ(r.n_undefined, Size(5));
}

COEXNET_TEST_CASE(error_names_the_pair) {
    Matrix x = random_matrix(8, 2);
    for (Index s = 0; s < 8; ++s) x(s, 1) = 1;
    const std::vector<std::string> names{"TP53", "GAPDH"};
    try {
        (void)cor::correlate(x.view(), cor::CorrelationOptions{}, &names);
        COEXNET_FAIL("expected InsufficientSamplesError");
    } catch (const InsufficientSamplesError& e) {
        COEXNET_ASSERT_STR_CONTAINS(e.what(), "GAPDH");
    }
}

COEXNET_TEST_SUITE_END

// =============================================================================
// Rank and Robust Variants
// =============================================================================

COEXNET_TEST_SUITE(variants)

COEXNET_TEST_CASE(spearman_matches_oracle) {
    Matrix x = random_matrix(15, 5, 61);
    x(3, 0) = x(4, 0);   // a tie
    cor::CorrelationOptions opts;
    opts.type = cor::CorrelationType::Spearman;
    const auto r = cor::correlate(x.view(), opts);

    const Matrix expected = oracle_matrix(oracle::spearman(to_eigen(x.view())));
    COEXNET_ASSERT_LE(max_abs_diff(r.cor.view(), expected.view()), TOL);
}

COEXNET_TEST_CASE(spearman_monotone_invariant) {
    Matrix x(10, 2);
    Random rng(3);
    for (Index s = 0; s < 10; ++s) {
        x(s, 0) = static_cast<Real>(rng.normal());
        x(s, 1) = std::exp(Real(3) * x(s, 0));
    }
    cor::CorrelationOptions opts;
    opts.type = cor::CorrelationType::Spearman;
    const auto r = cor::correlate(x.view(), opts);
    COEXNET_ASSERT_NEAR(r.cor(0, 1), 1.0, TOL);
}

COEXNET_TEST_CASE(bicor_linear_relations) {
    Matrix x(9, 3);
    for (Index s = 0; s < 9; ++s) {
        const auto v = static_cast<Real>(s * s % 7) + Real(0.1) * static_cast<Real>(s);
        x(s, 0) = v;
        x(s, 1) = Real(2) * v + Real(1);
        x(s, 2) = -v;
    }
    cor::CorrelationOptions opts;
    opts.type = cor::CorrelationType::Bicor;
    const auto r = cor::correlate(x.view(), opts);
    COEXNET_ASSERT_NEAR(r.cor(0, 1), 1.0, 1e-9);
    COEXNET_ASSERT_NEAR(r.cor(0, 2), -1.0, 1e-9);
    COEXNET_ASSERT_TRUE(is_symmetric(r.cor.view()));
}

COEXNET_TEST_CASE(bicor_downweights_outlier) {
    Matrix x(12, 2);
    Random rng(17);
    for (Index s = 0; s < 12; ++s) {
        x(s, 0) = static_cast<Real>(s);
        x(s, 1) = static_cast<Real>(s) + static_cast<Real>(0.3 * rng.normal());
    }
    x(5, 1) = -200;

    cor::CorrelationOptions pearson;
    cor::CorrelationOptions bicor;
    bicor.type = cor::CorrelationType::Bicor;
    const Real r_pearson = cor::correlate(x.view(), pearson).cor(0, 1);
    const Real r_bicor = cor::correlate(x.view(), bicor).cor(0, 1);
    COEXNET_ASSERT_GT(r_bicor, r_pearson);
    COEXNET_ASSERT_GT(r_bicor, Real(0.9));
}

COEXNET_TEST_SUITE_END

COEXNET_TEST_END

COEXNET_TEST_MAIN()
