/*
===============================================================================
Fragment 2.1 - Curves: Monotone Cubic Spline (Fritsch-Carlson)
File: cpp/engine/curves/monotone_spline.cpp
===============================================================================
*/

#include "engine/curves/monotone_spline.hpp"

#include <algorithm>
#include <iterator>

namespace panelheat::curves {

MonotoneSpline::MonotoneSpline(std::vector<CurvePoint> points) {
    for (const auto& p : points) {
        PANELHEAT_REQUIRE(is_finite(p.x) && is_finite(p.y), ErrorCode::InvalidInput,
                          "MonotoneSpline: non-finite knot");
    }

    std::sort(points.begin(), points.end(),
              [](const CurvePoint& a, const CurvePoint& b) { return a.x < b.x; });

    for (std::size_t i = 1; i < points.size(); ++i) {
        PANELHEAT_REQUIRE(points[i].x != points[i - 1].x, ErrorCode::InvalidInput,
                          "MonotoneSpline: duplicate knot x");
    }

    const std::size_t n = points.size();
    xs_.reserve(n);
    ys_.reserve(n);
    for (const auto& p : points) {
        xs_.push_back(p.x);
        ys_.push_back(p.y);
    }

    d_.assign(n, 0.0);
    if (n < 2) return;

    // Secant slopes m[i] over segment i.
    std::vector<double> h(n - 1);
    std::vector<double> m(n - 1);
    for (std::size_t i = 0; i + 1 < n; ++i) {
        h[i] = xs_[i + 1] - xs_[i];
        m[i] = safe_div(ys_[i + 1] - ys_[i], h[i], 0.0);
    }

    d_[0] = m[0];
    d_[n - 1] = m[n - 2];

    for (std::size_t i = 1; i + 1 < n; ++i) {
        const double m0 = m[i - 1];
        const double m1 = m[i];
        if (m0 * m1 <= 0.0) {
            d_[i] = 0.0;  // local extremum or flat
            continue;
        }
        const double w1 = 2.0 * h[i] + h[i - 1];
        const double w2 = h[i] + 2.0 * h[i - 1];
        d_[i] = safe_div(w1 + w2, w1 / m0 + w2 / m1, 0.0);
    }
}

double MonotoneSpline::eval(double x) const noexcept {
    const std::size_t n = xs_.size();
    if (n == 0) return 0.0;
    if (n == 1) return ys_.front();

    if (x <= xs_.front()) return ys_.front();
    if (x >= xs_.back()) return ys_.back();

    // xs_[i] <= x < xs_[i+1]
    auto it = std::upper_bound(xs_.begin(), xs_.end(), x);
    const std::size_t j = static_cast<std::size_t>(std::distance(xs_.begin(), it));
    const std::size_t i = (j == 0) ? 0 : (j - 1);

    const double h = xs_[i + 1] - xs_[i];
    if (!(h > 0.0)) return ys_[i];

    const double t = (x - xs_[i]) / h;
    const double t2 = t * t;
    const double t3 = t2 * t;

    const double h00 = 2.0 * t3 - 3.0 * t2 + 1.0;
    const double h10 = t3 - 2.0 * t2 + t;
    const double h01 = -2.0 * t3 + 3.0 * t2;
    const double h11 = t3 - t2;

    const double y = h00 * ys_[i] + h10 * h * d_[i] + h01 * ys_[i + 1] + h11 * h * d_[i + 1];
    return is_finite(y) ? y : ys_[i];
}

} // namespace panelheat::curves
