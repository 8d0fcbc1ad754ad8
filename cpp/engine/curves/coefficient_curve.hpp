/*
===============================================================================
Fragment 2.5 - Curves: Coefficient Curve Strategies
File: cpp/engine/curves/coefficient_curve.hpp
===============================================================================

Purpose:
  - One interface for every k/c lookup, whatever backs it:
      SplineCurve        single digitized curve           (Fig. 3)
      CurveNumberCurve   base curve + per-number offset    (Fig. 4)
      PowerLawCurve      two-anchor power law              (Fig. 7, Fig. 8)
      FamilyCurve        digitized family set              (Fig. 5, Fig. 6)
      Ventilated*Fallback closed forms when Fig. 5/6 data is absent
  - The concrete strategy is chosen once, when CurveFamilyInterpolator is built.

Contract:
  - sample() is pure and total: out-of-domain input is clamped and reported
    through CoefficientSample, never thrown.
  - Constructors validate their data (PANELHEAT_REQUIRE).
===============================================================================
*/

#pragma once

#include "engine/curves/curve_family.hpp"
#include "engine/curves/iec60890_figures.hpp"

#include <array>
#include <string>

namespace panelheat::curves {

class CoefficientCurve {
public:
    virtual ~CoefficientCurve() = default;

    // family_key is ignored by single-variable curves.
    virtual CoefficientSample sample(double family_key, double x) const = 0;

    // Figure label for reports, e.g. "Fig. 3".
    virtual const std::string& figure() const noexcept = 0;

    // True when backed by digitized points rather than a closed form.
    virtual bool digitized() const noexcept = 0;
};

// -----------------------------
// SplineCurve
// -----------------------------
class SplineCurve final : public CoefficientCurve {
public:
    SplineCurve(std::string figure, CurvePoints points);

    CoefficientSample sample(double family_key, double x) const override;
    const std::string& figure() const noexcept override { return figure_; }
    bool digitized() const noexcept override { return true; }

    const MonotoneSpline& spline() const noexcept { return spline_; }

private:
    std::string figure_;
    MonotoneSpline spline_;
};

// -----------------------------
// CurveNumberCurve
// -----------------------------
// value(n, x) = base(x) + offsets[n - 1], n clamped to 1..5.
class CurveNumberCurve final : public CoefficientCurve {
public:
    CurveNumberCurve(std::string figure, CurvePoints base, std::array<double, 5> offsets);

    CoefficientSample sample(double curve_number, double x) const override;
    const std::string& figure() const noexcept override { return figure_; }
    bool digitized() const noexcept override { return true; }

private:
    std::string figure_;
    MonotoneSpline base_;
    std::array<double, 5> offsets_;
};

// -----------------------------
// PowerLawCurve
// -----------------------------
// y = C * x^B, x clamped to [x_min, x_max].
class PowerLawCurve final : public CoefficientCurve {
public:
    PowerLawCurve(std::string figure, double scale_C, double exponent_B, double x_min, double x_max);

    // Fits C and B exactly through two anchors.
    static PowerLawCurve from_anchors(std::string figure, figures::Anchor a0, figures::Anchor a1,
                                      double x_min, double x_max);

    CoefficientSample sample(double family_key, double x) const override;
    const std::string& figure() const noexcept override { return figure_; }
    bool digitized() const noexcept override { return false; }

    double scale() const noexcept { return C_; }
    double exponent() const noexcept { return B_; }

private:
    std::string figure_;
    double C_ = 1.0;
    double B_ = 0.0;
    double x_min_ = 0.0;
    double x_max_ = 0.0;
};

// -----------------------------
// FamilyCurve
// -----------------------------
class FamilyCurve final : public CoefficientCurve {
public:
    FamilyCurve(std::string figure, CurveFamilySet set);

    CoefficientSample sample(double family_key, double x) const override;
    const std::string& figure() const noexcept override { return figure_; }
    bool digitized() const noexcept override { return true; }

    const CurveFamilySet& set() const noexcept { return set_; }

private:
    std::string figure_;
    CurveFamilySet set_;
};

// -----------------------------
// Closed-form ventilated fallbacks
// -----------------------------
// family_key = Ae (m2), x = inlet area (cm2)
class VentilatedKFallback final : public CoefficientCurve {
public:
    VentilatedKFallback();

    CoefficientSample sample(double ae_m2, double inlet_cm2) const override;
    const std::string& figure() const noexcept override { return figure_; }
    bool digitized() const noexcept override { return false; }

private:
    std::string figure_;
    PowerLawCurve sealed_;
};

// family_key = f, x = inlet area (cm2)
class VentilatedCFallback final : public CoefficientCurve {
public:
    VentilatedCFallback() : figure_("Fig. 6") {}

    CoefficientSample sample(double f, double inlet_cm2) const override;
    const std::string& figure() const noexcept override { return figure_; }
    bool digitized() const noexcept override { return false; }

private:
    std::string figure_;
};

} // namespace panelheat::curves
