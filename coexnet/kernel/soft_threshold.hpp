#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/error.hpp"
#include "coexnet/core/macros.hpp"
#include "coexnet/core/dense.hpp"
#include "coexnet/kernel/adjacency.hpp"
#include "coexnet/kernel/correlation.hpp"
#include "coexnet/math/eigen.hpp"
#include "coexnet/math/stats.hpp"
#include "coexnet/threading/parallel_for.hpp"
#include "coexnet/threading/scheduler.hpp"
#include "coexnet/threading/workspace.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <limits>
#include <optional>
#include <string>
#include <vector>

// =============================================================================
// Soft-Threshold Power Selection
//
// For every candidate power p the connectivity k_i = sum_{j != i} a_ij(p) is
// accumulated from row blocks of the correlation matrix, so the full
// genes x genes matrix is never held. The connectivity distribution is then
// scored for scale-free topology:
//
//   bins     10 equal-width bins over [min k, max k]
//   x        log10(mean k within bin)
//   y        log10(fraction of genes in bin + 1e-9)
//   fit      y = b0 + b1 * x (OLS), signed R^2 = -sign(b1) * R^2
//   truncated fit adds the regressor 10^x
//
// Empty bins are left out of both fits.
// =============================================================================

namespace coexnet::kernel::soft_threshold {

namespace config {
    constexpr Index DEFAULT_N_BINS = 10;
    constexpr Index DEFAULT_ROW_BLOCK = 128;
    constexpr Real DEFAULT_R2_TARGET = Real(0.80);
    constexpr Real LOG_FREQ_OFFSET = Real(1e-9);
}

struct SoftThresholdOptions {
    std::vector<Real> powers;   // empty selects default_candidate_powers()
    adjacency::AdjacencyType network = adjacency::AdjacencyType::Signed;
    correlation::CorrelationOptions correlation;
    Index n_bins = config::DEFAULT_N_BINS;
    Index row_block = config::DEFAULT_ROW_BLOCK;
};

/// @brief One row of the power table.
struct SoftThresholdRow {
    Real power = 0;
    Real signed_r2 = 0;
    Real slope = 0;
    Real truncated_r2 = 0;
    Real mean_k = 0;
    Real median_k = 0;
    Real max_k = 0;
};

/// @brief Non-fatal: no candidate reached the fit target.
struct ConfigurationWarning {
    std::string message;
    Real best_power = 0;
    Real best_r2 = 0;
};

struct PowerAdvice {
    std::optional<Real> power;
    std::optional<ConfigurationWarning> warning;
};

/// @brief 1..10, then 12..50 in steps of 2.
inline std::vector<Real> default_candidate_powers() {
    std::vector<Real> powers;
    for (int p = 1; p <= 10; ++p) {
        powers.push_back(static_cast<Real>(p));
    }
    for (int p = 12; p <= 50; p += 2) {
        powers.push_back(static_cast<Real>(p));
    }
    return powers;
}

// =============================================================================
// Scale-Free Fit
// =============================================================================

namespace detail {

// R^2 of y ~ 1 + x + 10^x; NaN when under-determined or y is constant
inline Real truncated_r2(const std::vector<double>& x, const std::vector<double>& y) {
    const auto m = static_cast<Eigen::Index>(x.size());
    if (m < 4) {
        return std::numeric_limits<Real>::quiet_NaN();
    }

    Eigen::MatrixXd design(m, 3);
    Eigen::VectorXd rhs(m);
    for (Eigen::Index i = 0; i < m; ++i) {
        design(i, 0) = 1.0;
        design(i, 1) = x[static_cast<Size>(i)];
        design(i, 2) = std::pow(10.0, x[static_cast<Size>(i)]);
        rhs(i) = y[static_cast<Size>(i)];
    }

    const double mean_y = rhs.mean();
    const double ss_tot = (rhs.array() - mean_y).square().sum();
    if (!(ss_tot > 0.0)) {
        return std::numeric_limits<Real>::quiet_NaN();
    }

    const Eigen::VectorXd beta = design.colPivHouseholderQr().solve(rhs);
    const double ss_res = (design * beta - rhs).squaredNorm();
    return static_cast<Real>(1.0 - ss_res / ss_tot);
}

} // namespace detail

/// @brief Score one connectivity vector for scale-free topology.
inline SoftThresholdRow scale_free_fit(Array<const Real> k, Real power, Index n_bins = config::DEFAULT_N_BINS) {
    COEXNET_CHECK_ARG(n_bins >= 2, "SoftThresholdSelector: need at least 2 bins");

    SoftThresholdRow row;
    row.power = power;
    const Size n = k.len;
    if (n == 0) {
        row.signed_r2 = row.truncated_r2 = std::numeric_limits<Real>::quiet_NaN();
        return row;
    }

    Real k_min = k[0], k_max = k[0], k_sum = 0;
    for (Size i = 0; i < n; ++i) {
        k_min = std::min(k_min, k.ptr[i]);
        k_max = std::max(k_max, k.ptr[i]);
        k_sum += k.ptr[i];
    }
    row.mean_k = k_sum / static_cast<Real>(n);
    row.max_k = k_max;
    {
        std::vector<Real> tmp(k.begin(), k.end());
        row.median_k = math::median_inplace(tmp.data(), tmp.size());
    }

    const Real width = (k_max - k_min) / static_cast<Real>(n_bins);
    std::vector<double> bin_sum(static_cast<Size>(n_bins), 0.0);
    std::vector<Size> bin_count(static_cast<Size>(n_bins), 0);
    for (Size i = 0; i < n; ++i) {
        Index b = 0;
        if (width > Real(0)) {
            b = static_cast<Index>((k.ptr[i] - k_min) / width);
            b = std::clamp<Index>(b, 0, n_bins - 1);
        }
        bin_sum[static_cast<Size>(b)] += k.ptr[i];
        bin_count[static_cast<Size>(b)] += 1;
    }

    std::vector<double> x, y;
    for (Index b = 0; b < n_bins; ++b) {
        const Size cnt = bin_count[static_cast<Size>(b)];
        if (cnt == 0) continue;
        const double mean_k = bin_sum[static_cast<Size>(b)] / static_cast<double>(cnt);
        if (!(mean_k > 0.0)) continue;
        x.push_back(std::log10(mean_k));
        y.push_back(std::log10(static_cast<double>(cnt) / static_cast<double>(n) + config::LOG_FREQ_OFFSET));
    }

    const math::LinearFit fit = math::fit_line(x.data(), y.data(), static_cast<int>(x.size()));
    row.slope = static_cast<Real>(fit.slope);
    if (std::isnan(fit.r_squared)) {
        row.signed_r2 = std::numeric_limits<Real>::quiet_NaN();
    } else {
        const double sign = fit.slope > 0.0 ? 1.0 : (fit.slope < 0.0 ? -1.0 : 0.0);
        row.signed_r2 = static_cast<Real>(-sign * fit.r_squared);
    }
    row.truncated_r2 = detail::truncated_r2(x, y);
    return row;
}

// =============================================================================
// Power Table
// =============================================================================

/// @brief Scale-free fit table for every candidate power.
inline std::vector<SoftThresholdRow> pick_soft_threshold(
    MatrixView expression,
    const SoftThresholdOptions& options = {},
    const std::vector<std::string>* gene_names = nullptr
) {
    const std::vector<Real> powers = options.powers.empty()
        ? default_candidate_powers() : options.powers;
    for (Real p : powers) {
        adjacency::check_power(p);
    }
    COEXNET_CHECK_ARG(options.row_block > 0, "SoftThresholdSelector: row_block must be positive");

    const Index n_genes = expression.cols;
    const auto n_powers = static_cast<Index>(powers.size());

    const correlation::PreparedColumns prep =
        correlation::prepare_columns(expression, options.correlation.type);

    // k(i, p): connectivity of gene i at power p
    Matrix k(n_genes, n_powers, Real(0));

    const Index row_block = std::min<Index>(options.row_block, std::max<Index>(n_genes, 1));
    const Index n_blocks = (n_genes + row_block - 1) / row_block;
    const Size n_threads = threading::Scheduler::get_num_threads();
    threading::WorkspacePool<Real> strip_pool(n_threads, static_cast<Size>(row_block) * static_cast<Size>(n_genes));
    threading::WorkspacePool<Index> obs_pool(n_threads, static_cast<Size>(row_block) * static_cast<Size>(n_genes));

    const bool throw_undefined =
        options.correlation.on_undefined == correlation::UndefinedPolicy::Throw;
    std::atomic<Size> n_undefined{0};

    threading::parallel_for(Size(0), static_cast<Size>(n_blocks), [&](size_t b, size_t thread_rank) {
        const Index r0 = static_cast<Index>(b) * row_block;
        const Index r1 = std::min(r0 + row_block, n_genes);
        Real* strip = strip_pool.get(thread_rank);
        Index* obs = obs_pool.get(thread_rank);

        correlation::correlate_rows(prep, r0, r1, prep, strip, obs);

        for (Index r = 0; r < r1 - r0; ++r) {
            const Index i = r0 + r;
            Real* row = strip + r * n_genes;
            for (Index j = 0; j < n_genes; ++j) {
                if (j == i || COEXNET_LIKELY(!std::isnan(row[j]))) continue;
                if (throw_undefined) {
                    throw InsufficientSamplesError(
                        "SoftThresholdSelector: correlation of " +
                        correlation::detail::column_label(gene_names, "gene", i) + " and " +
                        correlation::detail::column_label(gene_names, "gene", j) +
                        " is undefined (" + std::to_string(obs[r * n_genes + j]) +
                        " paired observations)");
                }
                // Undefined pairs add no connectivity
                n_undefined.fetch_add(1, std::memory_order_relaxed);
                row[j] = Real(-2);
            }
            for (Index p = 0; p < n_powers; ++p) {
                const Real power = powers[static_cast<Size>(p)];
                Real sum = Real(0);
                for (Index j = 0; j < n_genes; ++j) {
                    if (j == i || row[j] < Real(-1)) continue;
                    sum += adjacency::correlation_to_adjacency(row[j], power, options.network);
                }
                k(i, p) = sum;
            }
        }
    });

    if (n_undefined.load() > 0) {
        std::fprintf(stderr,
            "WARNING: SoftThresholdSelector::pick_soft_threshold %zu undefined correlation(s) "
            "excluded from connectivity\n", n_undefined.load());
    }

    std::vector<SoftThresholdRow> table(static_cast<Size>(n_powers));
    std::vector<Real> column(static_cast<Size>(n_genes));
    for (Index p = 0; p < n_powers; ++p) {
        for (Index i = 0; i < n_genes; ++i) {
            column[static_cast<Size>(i)] = k(i, p);
        }
        table[static_cast<Size>(p)] = scale_free_fit(
            Array<const Real>(column.data(), column.size()), powers[static_cast<Size>(p)], options.n_bins);
    }
    return table;
}

inline std::vector<SoftThresholdRow> pick_soft_threshold(
    const LabeledMatrix& expression,
    const SoftThresholdOptions& options = {}
) {
    return pick_soft_threshold(expression.values.view(), options, &expression.col_names);
}

// =============================================================================
// Advisory Selection
// =============================================================================

/// @brief Smallest power whose signed R^2 exceeds the target.
///
/// With max_mean_k set, the row's mean connectivity must also be at or
/// below it. When nothing qualifies the advice carries no power and a
/// ConfigurationWarning with the best-scoring candidate; the choice of the
/// power to use stays with the caller.
inline PowerAdvice advise_power(
    const std::vector<SoftThresholdRow>& table,
    Real r2_target = config::DEFAULT_R2_TARGET,
    std::optional<Real> max_mean_k = std::nullopt
) {
    PowerAdvice advice;
    for (const auto& row : table) {
        if (row.signed_r2 > r2_target && (!max_mean_k || row.mean_k <= *max_mean_k)) {
            advice.power = row.power;
            return advice;
        }
    }

    ConfigurationWarning warning;
    warning.best_power = std::numeric_limits<Real>::quiet_NaN();
    warning.best_r2 = std::numeric_limits<Real>::quiet_NaN();
    for (const auto& row : table) {
        if (std::isnan(row.signed_r2)) continue;
        if (std::isnan(warning.best_r2) || row.signed_r2 > warning.best_r2) {
            warning.best_r2 = row.signed_r2;
            warning.best_power = row.power;
        }
    }

    warning.message = "no candidate power reaches scale-free fit R^2 > " + std::to_string(r2_target);
    if (max_mean_k) {
        warning.message += " with mean connectivity <= " + std::to_string(*max_mean_k);
    }
    if (!std::isnan(warning.best_r2)) {
        warning.message += "; best is power " + std::to_string(warning.best_power) +
                           " with R^2 " + std::to_string(warning.best_r2);
    }

    std::fprintf(stderr, "WARNING: SoftThresholdSelector::advise_power %s\n", warning.message.c_str());
    advice.warning = std::move(warning);
    return advice;
}

} // namespace coexnet::kernel::soft_threshold
