#pragma once

#include "coexnet/core/macros.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

// =============================================================================
// FILE: coexnet/math/stats.hpp
// BRIEF: Student-t tail probabilities and small regression helpers
//
// Full double precision; the incomplete beta uses the modified Lentz
// continued fraction.
// =============================================================================

namespace coexnet::math {

namespace detail {

inline constexpr int BETACF_MAX_ITER = 500;
inline constexpr double BETACF_EPS = 1e-15;
inline constexpr double BETACF_TINY = 1e-300;

// Continued fraction for I_x(a, b); converges fast for x < (a+1)/(a+b+2)
inline double beta_continued_fraction(double a, double b, double x) noexcept {
    const double qab = a + b;
    const double qap = a + 1.0;
    const double qam = a - 1.0;

    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::abs(d) < BETACF_TINY) d = BETACF_TINY;
    d = 1.0 / d;
    double h = d;

    for (int m = 1; m <= BETACF_MAX_ITER; ++m) {
        const double m2 = 2.0 * m;

        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < BETACF_TINY) d = BETACF_TINY;
        c = 1.0 + aa / c;
        if (std::abs(c) < BETACF_TINY) c = BETACF_TINY;
        d = 1.0 / d;
        h *= d * c;

        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < BETACF_TINY) d = BETACF_TINY;
        c = 1.0 + aa / c;
        if (std::abs(c) < BETACF_TINY) c = BETACF_TINY;
        d = 1.0 / d;
        const double del = d * c;
        h *= del;

        if (std::abs(del - 1.0) < BETACF_EPS) break;
    }
    return h;
}

} // namespace detail

/// @brief Regularized incomplete beta function I_x(a, b).
inline double incomplete_beta(double x, double a, double b) noexcept {
    if (std::isnan(x)) return std::numeric_limits<double>::quiet_NaN();
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;

    const double log_front = std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b)
                           + a * std::log(x) + b * std::log1p(-x);
    const double front = std::exp(log_front);

    if (x < (a + 1.0) / (a + b + 2.0)) {
        return front * detail::beta_continued_fraction(a, b, x) / a;
    }
    return 1.0 - front * detail::beta_continued_fraction(b, a, 1.0 - x) / b;
}

/// @brief Two-sided p-value of a correlation r over n paired observations.
///
/// t = r * sqrt((n-2) / (1-r^2)) on n-2 degrees of freedom. Since
/// df / (df + t^2) = 1 - r^2, the tail is I_{1-r^2}(df/2, 1/2) directly,
/// which stays accurate as |r| -> 1.
inline double correlation_pvalue(double r, double n) noexcept {
    if (std::isnan(r) || !(n > 2.0)) return std::numeric_limits<double>::quiet_NaN();
    const double r2 = r * r;
    if (r2 >= 1.0) return 0.0;
    return incomplete_beta(1.0 - r2, 0.5 * (n - 2.0), 0.5);
}

// =============================================================================
// Ordinary Least Squares (single predictor)
// =============================================================================

struct LinearFit {
    double slope = 0.0;
    double intercept = 0.0;
    double r_squared = 0.0;
};

/// @brief y = intercept + slope * x. R^2 is NaN when x or y has no spread.
inline LinearFit fit_line(const double* x, const double* y, int n) noexcept {
    LinearFit fit;
    if (n < 2) {
        fit.r_squared = std::numeric_limits<double>::quiet_NaN();
        return fit;
    }

    double mx = 0.0, my = 0.0;
    for (int i = 0; i < n; ++i) {
        mx += x[i];
        my += y[i];
    }
    mx /= n;
    my /= n;

    double sxx = 0.0, syy = 0.0, sxy = 0.0;
    for (int i = 0; i < n; ++i) {
        const double dx = x[i] - mx;
        const double dy = y[i] - my;
        sxx += dx * dx;
        syy += dy * dy;
        sxy += dx * dy;
    }

    if (sxx <= 0.0 || syy <= 0.0) {
        fit.intercept = my;
        fit.r_squared = std::numeric_limits<double>::quiet_NaN();
        return fit;
    }

    fit.slope = sxy / sxx;
    fit.intercept = my - fit.slope * mx;
    fit.r_squared = (sxy * sxy) / (sxx * syy);
    return fit;
}

// =============================================================================
// Order Statistics
// =============================================================================

/// @brief Median of data[0..n), reordering the buffer. NaN for n == 0.
template <typename T>
T median_inplace(T* data, std::size_t n) {
    if (n == 0) return std::numeric_limits<T>::quiet_NaN();
    const std::size_t mid = n / 2;
    std::nth_element(data, data + mid, data + n);
    const T upper = data[mid];
    if (n % 2 == 1) return upper;
    const T lower = *std::max_element(data, data + mid);
    return (lower + upper) / T(2);
}

} // namespace coexnet::math
