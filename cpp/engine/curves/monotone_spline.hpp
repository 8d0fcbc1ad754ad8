/*
===============================================================================
Fragment 2.1 - Curves: Monotone Cubic Spline (Fritsch-Carlson)
File: cpp/engine/curves/monotone_spline.hpp
===============================================================================

Purpose:
  - Shape-preserving interpolation through digitized IEC 60890 curve points.
  - No overshoot between knots, flat extrapolation outside the knot range.

Hardening:
  - Knots are sorted on construction; duplicate or non-finite x is rejected.
  - Zero-length segments return the segment start value.
  - Empty spline evaluates to 0.0; a single knot is a constant.
===============================================================================
*/

#pragma once

#include "engine/core/require.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace panelheat::curves {

struct CurvePoint final {
    double x = 0.0;
    double y = 0.0;
};

class MonotoneSpline final {
public:
    MonotoneSpline() = default;
    explicit MonotoneSpline(std::vector<CurvePoint> points);

    double operator()(double x) const noexcept { return eval(x); }
    double eval(double x) const noexcept;

    bool empty() const noexcept { return xs_.empty(); }
    std::size_t size() const noexcept { return xs_.size(); }

    // Knot range. Both 0.0 when empty.
    double x_min() const noexcept { return xs_.empty() ? 0.0 : xs_.front(); }
    double x_max() const noexcept { return xs_.empty() ? 0.0 : xs_.back(); }

    const std::vector<double>& xs() const noexcept { return xs_; }
    const std::vector<double>& ys() const noexcept { return ys_; }
    const std::vector<double>& slopes() const noexcept { return d_; }

private:
    std::vector<double> xs_;
    std::vector<double> ys_;
    std::vector<double> d_;  // knot derivatives
};

} // namespace panelheat::curves
