/*
===============================================================================
Fragment 2.5 - Curves: Coefficient Curve Strategies
File: cpp/engine/curves/coefficient_curve.cpp
===============================================================================
*/

#include "engine/curves/coefficient_curve.hpp"

#include <cmath>
#include <utility>

namespace panelheat::curves {

namespace {

// Clamp into [lo, hi]; non-finite input goes to lo.
double clamp_query(double v, double lo, double hi) noexcept {
    return is_finite(v) ? clamp(v, lo, hi) : lo;
}

} // namespace

// -----------------------------
// SplineCurve
// -----------------------------
SplineCurve::SplineCurve(std::string figure, CurvePoints points)
    : figure_(std::move(figure)), spline_(std::move(points)) {
    PANELHEAT_REQUIRE(!spline_.empty(), ErrorCode::MissingCurveData,
                      "SplineCurve: no points (" + figure_ + ")");
}

CoefficientSample SplineCurve::sample(double /*family_key*/, double x) const {
    CoefficientSample s;
    s.x_requested = x;
    s.x_used = clamp_query(x, spline_.x_min(), spline_.x_max());
    s.x_snapped = (s.x_used != x);
    s.value = spline_.eval(s.x_used);
    return s;
}

// -----------------------------
// CurveNumberCurve
// -----------------------------
CurveNumberCurve::CurveNumberCurve(std::string figure, CurvePoints base, std::array<double, 5> offsets)
    : figure_(std::move(figure)), base_(std::move(base)), offsets_(offsets) {
    PANELHEAT_REQUIRE(!base_.empty(), ErrorCode::MissingCurveData,
                      "CurveNumberCurve: no base points (" + figure_ + ")");
    for (double o : offsets_) {
        require_finite(o, ErrorCode::InvalidInput, "CurveNumberCurve: non-finite offset");
    }
}

CoefficientSample CurveNumberCurve::sample(double curve_number, double x) const {
    CoefficientSample s;
    s.key_requested = curve_number;
    s.key_used = clamp_query(std::round(curve_number), 1.0, 5.0);
    s.key_snapped = (s.key_used != curve_number);

    s.x_requested = x;
    s.x_used = clamp_query(x, base_.x_min(), base_.x_max());
    s.x_snapped = (s.x_used != x);

    const auto idx = static_cast<std::size_t>(s.key_used) - 1;
    s.value = base_.eval(s.x_used) + offsets_[idx];
    return s;
}

// -----------------------------
// PowerLawCurve
// -----------------------------
PowerLawCurve::PowerLawCurve(std::string figure, double scale_C, double exponent_B, double x_min, double x_max)
    : figure_(std::move(figure)), C_(scale_C), B_(exponent_B), x_min_(x_min), x_max_(x_max) {
    require_finite(C_, ErrorCode::InvalidInput, "PowerLawCurve: C invalid");
    require_finite(B_, ErrorCode::InvalidInput, "PowerLawCurve: B invalid");
    PANELHEAT_REQUIRE(is_finite(x_min_) && is_finite(x_max_) && x_min_ > 0.0 && x_min_ < x_max_,
                      ErrorCode::InvalidInput, "PowerLawCurve: domain invalid (" + figure_ + ")");
}

PowerLawCurve PowerLawCurve::from_anchors(std::string figure, figures::Anchor a0, figures::Anchor a1,
                                          double x_min, double x_max) {
    PANELHEAT_REQUIRE(a0.x > 0.0 && a1.x > 0.0 && a0.y > 0.0 && a1.y > 0.0 && a0.x != a1.x,
                      ErrorCode::InvalidInput, "PowerLawCurve: anchors must be positive and distinct");
    const double B = std::log(a1.y / a0.y) / std::log(a1.x / a0.x);
    const double C = a0.y / std::pow(a0.x, B);
    return PowerLawCurve(std::move(figure), C, B, x_min, x_max);
}

CoefficientSample PowerLawCurve::sample(double /*family_key*/, double x) const {
    CoefficientSample s;
    s.x_requested = x;
    s.x_used = clamp_query(x, x_min_, x_max_);
    s.x_snapped = (s.x_used != x);
    s.value = C_ * std::pow(s.x_used, B_);
    return s;
}

// -----------------------------
// FamilyCurve
// -----------------------------
FamilyCurve::FamilyCurve(std::string figure, CurveFamilySet set)
    : figure_(std::move(figure)), set_(std::move(set)) {
    PANELHEAT_REQUIRE(set_.finalized() && !set_.empty(), ErrorCode::MissingCurveData,
                      "FamilyCurve: family set not finalized (" + figure_ + ")");
}

CoefficientSample FamilyCurve::sample(double family_key, double x) const {
    return set_.sample(family_key, x);
}

// -----------------------------
// Ventilated fallbacks
// -----------------------------
VentilatedKFallback::VentilatedKFallback()
    : figure_("Fig. 5"),
      sealed_(PowerLawCurve::from_anchors("Fig. 5", figures::kFig5FallbackAnchor0,
                                          figures::kFig5FallbackAnchor1,
                                          figures::kFig5FallbackAeMin,
                                          figures::kFig5FallbackAeMax)) {}

CoefficientSample VentilatedKFallback::sample(double ae_m2, double inlet_cm2) const {
    const CoefficientSample base = sealed_.sample(0.0, ae_m2);

    CoefficientSample s;
    s.key_requested = ae_m2;
    s.key_used = base.x_used;
    s.key_snapped = base.x_snapped;

    s.x_requested = inlet_cm2;
    s.x_used = clamp_query(inlet_cm2, figures::kVentInletMinCm2, figures::kVentInletMaxCm2);
    s.x_snapped = (s.x_used != inlet_cm2);

    const double opening = std::pow(s.x_used / 100.0, figures::kFig5FallbackOpeningExp);
    s.value = base.value * figures::kFig5FallbackScale
              / (1.0 + figures::kFig5FallbackOpeningGain * opening);
    return s;
}

CoefficientSample VentilatedCFallback::sample(double f, double inlet_cm2) const {
    CoefficientSample s;
    s.key_requested = f;
    s.key_used = clamp_query(f, figures::kFig6FallbackFMin, figures::kFig6FallbackFMax);
    s.key_snapped = (s.key_used != f);

    s.x_requested = inlet_cm2;
    s.x_used = clamp_query(inlet_cm2, figures::kVentInletMinCm2, figures::kVentInletMaxCm2);
    s.x_snapped = (s.x_used != inlet_cm2);

    s.value = figures::kFig6FallbackBase
              + figures::kFig6FallbackShapeGain * std::log(s.key_used / figures::kFig6FallbackFMin)
              + figures::kFig6FallbackOpeningGain
                    * (1.0 - std::exp(-s.x_used / figures::kFig6FallbackOpeningScaleCm2));
    return s;
}

} // namespace panelheat::curves
