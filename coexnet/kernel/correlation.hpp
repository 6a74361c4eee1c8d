#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/error.hpp"
#include "coexnet/core/macros.hpp"
#include "coexnet/core/dense.hpp"
#include "coexnet/core/vectorize.hpp"
#include "coexnet/math/eigen.hpp"
#include "coexnet/math/stats.hpp"
#include "coexnet/threading/parallel_for.hpp"
#include "coexnet/threading/scheduler.hpp"
#include "coexnet/threading/workspace.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

// =============================================================================
// Column Correlation with Student-t Significance
//
// Methods:
//   Pearson   - product-moment correlation
//   Spearman  - Pearson on average ranks (ties share the mean rank)
//   Bicor     - biweight midcorrelation, u = (x - med) / (9 * MAD),
//               w = (1 - u^2)^2 for |u| < 1; Pearson fallback when MAD = 0
//
// Missing values (NaN) are handled pairwise: a sample is used for a pair
// only when both columns observe it.
//
// Key Optimizations:
// 1. Prepared columns
//    - Each column gathered once into a contiguous, transformed row
//    - Complete columns additionally stored as unit vectors
//
// 2. Blocked GEMM for complete columns
//    - cor = Z_x * Z_y^T over row blocks, blocks run in parallel
//    - Only pairs touching an incomplete or degenerate column fall back
//      to the per-pair path
// =============================================================================

namespace coexnet::kernel::correlation {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    constexpr Index GEMM_ROW_BLOCK = 256;
    constexpr Index MIN_OBSERVATIONS = 3;
    constexpr Real BICOR_MAD_SCALE = Real(9);
}

enum class CorrelationType : std::int32_t {
    Pearson = 0,
    Spearman = 1,
    Bicor = 2
};

// What to do with a pair whose correlation is undefined
enum class UndefinedPolicy : std::int32_t {
    Throw = 0,   // InsufficientSamplesError naming the pair
    Warn = 1     // NaN entry plus one warning line on stderr
};

struct CorrelationOptions {
    CorrelationType type = CorrelationType::Pearson;
    UndefinedPolicy on_undefined = UndefinedPolicy::Throw;
    bool compute_pvalues = true;
};

/// @brief Pairwise statistics between the columns of X and the columns of Y.
///
/// cor, pvalue and n_obs are all (X.cols x Y.cols). pvalue is empty when
/// p-values were not requested. Undefined entries (Warn policy) hold NaN.
struct CorrelationResult {
    Matrix cor;
    Matrix pvalue;
    DenseMatrix<Index> n_obs;
    Size n_undefined = 0;
};

inline const char* type_name(CorrelationType type) noexcept {
    switch (type) {
        case CorrelationType::Pearson: return "pearson";
        case CorrelationType::Spearman: return "spearman";
        case CorrelationType::Bicor: return "bicor";
    }
    return "unknown";
}

// =============================================================================
// Prepared Columns
// =============================================================================

// Centered: mean must be removed over the paired samples.
// Weighted: already centered and weighted (bicor), used as is.
enum class ColumnKind : std::uint8_t {
    Centered = 0,
    Weighted = 1
};

struct PreparedColumns {
    Index n_samples = 0;
    Index n_cols = 0;
    CorrelationType type = CorrelationType::Pearson;

    Matrix values;    // n_cols x n_samples, transformed, NaN where missing
    Matrix unit;      // n_cols x n_samples, unit vectors of complete columns
    std::vector<ColumnKind> kind;
    std::vector<std::uint8_t> complete;     // no missing samples
    std::vector<std::uint8_t> degenerate;   // complete with zero spread
    bool all_complete = true;
};

namespace detail {

// Average ranks (1-based) of the finite entries; NaN entries stay NaN
inline void rank_inplace(Real* values, Index n, std::vector<Index>& order) {
    order.clear();
    for (Index i = 0; i < n; ++i) {
        if (!std::isnan(values[i])) {
            order.push_back(i);
        }
    }
    std::stable_sort(order.begin(), order.end(), [values](Index a, Index b) {
        return values[a] < values[b];
    });

    const Size m = order.size();
    Size i = 0;
    while (i < m) {
        Size j = i + 1;
        while (j < m && values[order[j]] == values[order[i]]) {
            ++j;
        }
        const Real rank = Real(0.5) * static_cast<Real>(i + 1 + j);
        for (Size t = i; t < j; ++t) {
            values[order[t]] = rank;
        }
        i = j;
    }
}

// Replace x by (x - med) * w; returns false when MAD is zero (column left untouched)
inline bool bicor_weight_inplace(Real* values, Index n, Real* scratch) {
    Size m = 0;
    for (Index i = 0; i < n; ++i) {
        if (!std::isnan(values[i])) {
            scratch[m++] = values[i];
        }
    }
    if (m == 0) {
        return false;
    }

    const Real med = math::median_inplace(scratch, m);
    for (Size i = 0; i < m; ++i) {
        scratch[i] = std::abs(scratch[i] - med);
    }
    const Real mad = math::median_inplace(scratch, m);
    if (!(mad > Real(0))) {
        return false;
    }

    const Real inv_scale = Real(1) / (config::BICOR_MAD_SCALE * mad);
    for (Index i = 0; i < n; ++i) {
        if (std::isnan(values[i])) continue;
        const Real dev = values[i] - med;
        const Real u = dev * inv_scale;
        const Real u2 = u * u;
        const Real w = u2 < Real(1) ? (Real(1) - u2) * (Real(1) - u2) : Real(0);
        values[i] = dev * w;
    }
    return true;
}

// Spearman over the samples finite in both columns. Column ranks were taken
// over each column's own finite samples, so they are re-ranked over the pair.
inline Real paired_rank_correlation(const Real* xa, const Real* xb, Index n, Index& n_obs) {
    thread_local std::vector<Real> ra;
    thread_local std::vector<Real> rb;
    thread_local std::vector<Index> order;
    ra.clear();
    rb.clear();
    for (Index s = 0; s < n; ++s) {
        if (std::isnan(xa[s]) || std::isnan(xb[s])) continue;
        ra.push_back(xa[s]);
        rb.push_back(xb[s]);
    }
    const auto count = static_cast<Index>(ra.size());
    n_obs = count;
    if (count < config::MIN_OBSERVATIONS) {
        return std::numeric_limits<Real>::quiet_NaN();
    }
    rank_inplace(ra.data(), count, order);
    rank_inplace(rb.data(), count, order);

    // Average ranks of 1..count always have mean (count + 1) / 2
    const Real mean = Real(0.5) * static_cast<Real>(count + 1);
    Real sab = 0, saa = 0, sbb = 0;
    for (Index s = 0; s < count; ++s) {
        const Real da = ra[static_cast<Size>(s)] - mean;
        const Real db = rb[static_cast<Size>(s)] - mean;
        sab += da * db;
        saa += da * da;
        sbb += db * db;
    }
    if (!(saa > Real(0)) || !(sbb > Real(0))) {
        return std::numeric_limits<Real>::quiet_NaN();
    }
    return std::clamp(sab / std::sqrt(saa * sbb), Real(-1), Real(1));
}

} // namespace detail

/// @brief Gather and transform every column of x once.
///
/// Throws DegenerateInputError for +/-inf; NaN is treated as missing.
inline PreparedColumns prepare_columns(MatrixView x, CorrelationType type) {
    PreparedColumns p;
    p.n_samples = x.rows;
    p.n_cols = x.cols;
    p.type = type;
    p.values = Matrix(x.cols, x.rows);
    p.unit = Matrix(x.cols, x.rows);
    p.kind.assign(static_cast<Size>(x.cols), ColumnKind::Centered);
    p.complete.assign(static_cast<Size>(x.cols), 1);
    p.degenerate.assign(static_cast<Size>(x.cols), 0);

    for (Index r = 0; r < x.rows; ++r) {
        for (Index c = 0; c < x.cols; ++c) {
            const Real v = x(r, c);
            if (COEXNET_UNLIKELY(std::isinf(v))) {
                throw DegenerateInputError(
                    "CorrelationEngine: infinite value at (" + std::to_string(r) +
                    ", " + std::to_string(c) + ")");
            }
        }
    }

    const Size n_threads = threading::Scheduler::get_num_threads();
    threading::WorkspacePool<Real> scratch_pool(n_threads, static_cast<Size>(std::max<Index>(x.rows, 1)));

    threading::parallel_for(Size(0), static_cast<Size>(x.cols), [&](size_t c, size_t thread_rank) {
        const auto col = static_cast<Index>(c);
        Real* values = p.values.data() + col * x.rows;
        x.col(col, values);

        bool complete = true;
        for (Index i = 0; i < x.rows; ++i) {
            if (std::isnan(values[i])) {
                complete = false;
                break;
            }
        }
        p.complete[c] = complete ? 1 : 0;

        if (type == CorrelationType::Spearman) {
            std::vector<Index> order;
            order.reserve(static_cast<Size>(x.rows));
            detail::rank_inplace(values, x.rows, order);
        } else if (type == CorrelationType::Bicor) {
            if (detail::bicor_weight_inplace(values, x.rows, scratch_pool.get(thread_rank))) {
                p.kind[c] = ColumnKind::Weighted;
            }
        }

        if (!complete) {
            return;
        }

        Array<Real> unit = p.unit.row(col);
        memory::copy(values, unit.ptr, unit.len);
        if (p.kind[c] == ColumnKind::Centered) {
            const Real mean = vectorize::sum(Array<const Real>(unit)) / static_cast<Real>(x.rows);
            vectorize::shift_scale_inplace(unit, mean, Real(1));
        }
        const Real ss = vectorize::dot(Array<const Real>(unit), Array<const Real>(unit));
        if (!(ss > Real(0))) {
            p.degenerate[c] = 1;
            memory::zero(unit.ptr, unit.len);
            return;
        }
        vectorize::shift_scale_inplace(unit, Real(0), Real(1) / std::sqrt(ss));
    });

    p.all_complete = std::all_of(p.complete.begin(), p.complete.end(),
                                 [](std::uint8_t v) { return v != 0; });
    return p;
}

// =============================================================================
// Pairwise Kernel
// =============================================================================

/// @brief Correlation of column i of a with column j of b over paired samples.
///
/// Returns NaN (and the pair count in n_obs) when fewer than 3 samples are
/// paired or either side has no spread over them.
inline Real pair_correlation(
    const PreparedColumns& a, Index i,
    const PreparedColumns& b, Index j,
    Index& n_obs
) {
    const Real nan = std::numeric_limits<Real>::quiet_NaN();
    const Index n = a.n_samples;

    if (a.complete[i] && b.complete[j]) {
        n_obs = n;
        if (n < config::MIN_OBSERVATIONS || a.degenerate[i] || b.degenerate[j]) {
            return nan;
        }
        const Real r = vectorize::dot(a.unit.row(i), b.unit.row(j));
        return std::clamp(r, Real(-1), Real(1));
    }

    const Real* COEXNET_RESTRICT xa = a.values.data() + i * n;
    const Real* COEXNET_RESTRICT xb = b.values.data() + j * n;
    if (a.type == CorrelationType::Spearman) {
        return detail::paired_rank_correlation(xa, xb, n, n_obs);
    }

    Index count = 0;
    Real sum_a = 0, sum_b = 0;
    for (Index s = 0; s < n; ++s) {
        if (std::isnan(xa[s]) || std::isnan(xb[s])) continue;
        ++count;
        sum_a += xa[s];
        sum_b += xb[s];
    }
    n_obs = count;
    if (count < config::MIN_OBSERVATIONS) {
        return nan;
    }

    const Real ma = a.kind[i] == ColumnKind::Centered ? sum_a / static_cast<Real>(count) : Real(0);
    const Real mb = b.kind[j] == ColumnKind::Centered ? sum_b / static_cast<Real>(count) : Real(0);

    Real sab = 0, saa = 0, sbb = 0;
    for (Index s = 0; s < n; ++s) {
        if (std::isnan(xa[s]) || std::isnan(xb[s])) continue;
        const Real da = xa[s] - ma;
        const Real db = xb[s] - mb;
        sab += da * db;
        saa += da * da;
        sbb += db * db;
    }
    if (!(saa > Real(0)) || !(sbb > Real(0))) {
        return nan;
    }
    return std::clamp(sab / std::sqrt(saa * sbb), Real(-1), Real(1));
}

/// @brief Rows [row_begin, row_end) of cor(a, b) into out (row-major, b.n_cols wide).
///
/// n_obs_out may be null. Undefined entries are NaN; no policy is applied.
inline void correlate_rows(
    const PreparedColumns& a, Index row_begin, Index row_end,
    const PreparedColumns& b,
    Real* out, Index* n_obs_out
) {
    COEXNET_CHECK_DIM(a.n_samples == b.n_samples,
        "CorrelationEngine: sample counts differ (" + std::to_string(a.n_samples) +
        " vs " + std::to_string(b.n_samples) + ")");

    const Index n_rows = row_end - row_begin;
    const Index m = b.n_cols;
    if (n_rows <= 0 || m == 0) {
        return;
    }

    // Dense part over unit vectors
    {
        auto za = math::map_rows(a.unit.data(), row_begin, n_rows, a.n_samples);
        auto zb = math::ConstRowMap(b.unit.data(), b.n_cols, b.n_samples);
        math::RowMap c(out, n_rows, m);
        c.noalias() = za * zb.transpose();
    }

    std::vector<Index> special_b;
    for (Index j = 0; j < m; ++j) {
        if (!b.complete[j] || b.degenerate[j]) {
            special_b.push_back(j);
        }
    }

    for (Index r = 0; r < n_rows; ++r) {
        const Index i = row_begin + r;
        Real* row = out + r * m;
        Index* obs = n_obs_out ? n_obs_out + r * m : nullptr;

        const bool special_row = !a.complete[i] || a.degenerate[i];
        if (special_row) {
            for (Index j = 0; j < m; ++j) {
                Index cnt = 0;
                row[j] = pair_correlation(a, i, b, j, cnt);
                if (obs) obs[j] = cnt;
            }
            continue;
        }

        for (Index j = 0; j < m; ++j) {
            row[j] = std::clamp(row[j], Real(-1), Real(1));
            if (obs) obs[j] = a.n_samples;
        }
        if (a.n_samples < config::MIN_OBSERVATIONS) {
            std::fill(row, row + m, std::numeric_limits<Real>::quiet_NaN());
            continue;
        }
        for (Index j : special_b) {
            Index cnt = 0;
            row[j] = pair_correlation(a, i, b, j, cnt);
            if (obs) obs[j] = cnt;
        }
    }
}

/// @brief Two-sided Student-t p-value of r over n paired observations.
COEXNET_FORCE_INLINE Real student_pvalue(Real r, Index n) noexcept {
    return static_cast<Real>(math::correlation_pvalue(static_cast<double>(r), static_cast<double>(n)));
}

// =============================================================================
// Undefined Entries
// =============================================================================

namespace detail {

inline std::string column_label(const std::vector<std::string>* names, const char* side, Index j) {
    if (names && static_cast<Size>(j) < names->size()) {
        return "'" + (*names)[static_cast<Size>(j)] + "'";
    }
    return std::string(side) + "[" + std::to_string(j) + "]";
}

inline void apply_undefined_policy(
    CorrelationResult& result,
    UndefinedPolicy policy,
    const std::vector<std::string>* x_names,
    const std::vector<std::string>* y_names
) {
    const Index rows = result.cor.rows();
    const Index cols = result.cor.cols();

    Size count = 0;
    Index first_i = -1, first_j = -1;
    for (Index i = 0; i < rows; ++i) {
        for (Index j = 0; j < cols; ++j) {
            if (std::isnan(result.cor(i, j))) {
                if (count == 0) {
                    first_i = i;
                    first_j = j;
                }
                ++count;
            }
        }
    }
    result.n_undefined = count;
    if (count == 0) {
        return;
    }

    const std::string pair = column_label(x_names, "x", first_i) + " and " +
                             column_label(y_names, "y", first_j);
    const Index n_obs = result.n_obs(first_i, first_j);

    if (policy == UndefinedPolicy::Throw) {
        throw InsufficientSamplesError(
            "CorrelationEngine: correlation of " + pair + " is undefined (" +
            std::to_string(n_obs) + " paired observations, need at least " +
            std::to_string(config::MIN_OBSERVATIONS) + " with non-zero variance)");
    }

    std::fprintf(stderr,
        "WARNING: CorrelationEngine::correlate %zu undefined correlation(s) set to NaN "
        "(first: %s, %lld paired observations)\n",
        count, pair.c_str(), static_cast<long long>(n_obs));
}

inline void fill_pvalues(CorrelationResult& result) {
    const Index rows = result.cor.rows();
    const Index cols = result.cor.cols();
    result.pvalue = Matrix(rows, cols);
    threading::parallel_for(Size(0), static_cast<Size>(rows), [&](size_t i) {
        const auto r = static_cast<Index>(i);
        for (Index j = 0; j < cols; ++j) {
            result.pvalue(r, j) = student_pvalue(result.cor(r, j), result.n_obs(r, j));
        }
    });
}

} // namespace detail

// =============================================================================
// Public API
// =============================================================================

/// @brief cor(X, Y) between columns, X and Y sharing the sample axis.
inline CorrelationResult correlate(
    MatrixView x,
    MatrixView y,
    const CorrelationOptions& options = {},
    const std::vector<std::string>* x_names = nullptr,
    const std::vector<std::string>* y_names = nullptr
) {
    COEXNET_CHECK_DIM(x.rows == y.rows,
        "CorrelationEngine: X has " + std::to_string(x.rows) + " samples, Y has " +
        std::to_string(y.rows));

    const PreparedColumns px = prepare_columns(x, options.type);
    const PreparedColumns py = prepare_columns(y, options.type);

    CorrelationResult result;
    result.cor = Matrix(x.cols, y.cols);
    result.n_obs = DenseMatrix<Index>(x.cols, y.cols);

    const Index n_blocks = (x.cols + config::GEMM_ROW_BLOCK - 1) / config::GEMM_ROW_BLOCK;
    threading::parallel_for(Size(0), static_cast<Size>(n_blocks), [&](size_t b) {
        const Index r0 = static_cast<Index>(b) * config::GEMM_ROW_BLOCK;
        const Index r1 = std::min(r0 + config::GEMM_ROW_BLOCK, x.cols);
        correlate_rows(px, r0, r1, py,
                       result.cor.data() + r0 * y.cols,
                       result.n_obs.data() + r0 * y.cols);
    });

    detail::apply_undefined_policy(result, options.on_undefined, x_names, y_names);
    if (options.compute_pvalues) {
        detail::fill_pvalues(result);
    }
    return result;
}

/// @brief Symmetric cor(X) between the columns of X.
///
/// The upper triangle is mirrored onto the lower one so the result is exactly
/// symmetric; the diagonal is exactly 1 for every column with at least 3
/// observations and non-zero variance.
inline CorrelationResult correlate(
    MatrixView x,
    const CorrelationOptions& options = {},
    const std::vector<std::string>* names = nullptr
) {
    const PreparedColumns px = prepare_columns(x, options.type);
    const Index m = x.cols;

    CorrelationResult result;
    result.cor = Matrix(m, m);
    result.n_obs = DenseMatrix<Index>(m, m);

    const Index n_blocks = (m + config::GEMM_ROW_BLOCK - 1) / config::GEMM_ROW_BLOCK;
    threading::parallel_for(Size(0), static_cast<Size>(n_blocks), [&](size_t b) {
        const Index r0 = static_cast<Index>(b) * config::GEMM_ROW_BLOCK;
        const Index r1 = std::min(r0 + config::GEMM_ROW_BLOCK, m);
        correlate_rows(px, r0, r1, px,
                       result.cor.data() + r0 * m,
                       result.n_obs.data() + r0 * m);
    });

    // Exact symmetry and unit diagonal regardless of GEMM rounding
    for (Index i = 0; i < m; ++i) {
        if (!std::isnan(result.cor(i, i))) {
            result.cor(i, i) = Real(1);
        }
        for (Index j = i + 1; j < m; ++j) {
            result.cor(j, i) = result.cor(i, j);
            result.n_obs(j, i) = result.n_obs(i, j);
        }
    }

    detail::apply_undefined_policy(result, options.on_undefined, names, names);
    if (options.compute_pvalues) {
        detail::fill_pvalues(result);
        for (Index i = 0; i < m; ++i) {
            if (!std::isnan(result.cor(i, i))) {
                result.pvalue(i, i) = Real(0);
            }
        }
    }
    return result;
}

inline CorrelationResult correlate(
    const LabeledMatrix& x,
    const LabeledMatrix& y,
    const CorrelationOptions& options = {}
) {
    return correlate(x.values.view(), y.values.view(), options, &x.col_names, &y.col_names);
}

inline CorrelationResult correlate(const LabeledMatrix& x, const CorrelationOptions& options = {}) {
    return correlate(x.values.view(), options, &x.col_names);
}

/// @brief Correlation matrix only (no p-values).
inline Matrix correlation_matrix(MatrixView x, CorrelationOptions options = {}) {
    options.compute_pvalues = false;
    return std::move(correlate(x, options).cor);
}

} // namespace coexnet::kernel::correlation
