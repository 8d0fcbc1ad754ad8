/*
===============================================================================
Fragment 2.6 - Curves: CurveFamilyInterpolator
File: cpp/engine/curves/curve_family_interpolator.cpp
===============================================================================
*/

#include "engine/curves/curve_family_interpolator.hpp"

#include <utility>

namespace panelheat::curves {

CurveFamilyInterpolator::CurveFamilyInterpolator(Curves curves, std::string source)
    : c_(std::move(curves)), source_(std::move(source)) {
    PANELHEAT_REQUIRE(c_.k_sealed_large && c_.c_sealed_large && c_.k_sealed_small
                      && c_.c_sealed_small && c_.k_ventilated && c_.c_ventilated,
                      ErrorCode::InvalidConfig, "CurveFamilyInterpolator: missing coefficient curve");
}

std::shared_ptr<const CurveFamilyInterpolator> CurveFamilyInterpolator::create(const FigureData& data,
                                                                               LogSink& log) {
    Curves c;
    c.k_sealed_large = std::make_unique<SplineCurve>("Fig. 3", figures::fig3_k_sealed_large_points());
    c.c_sealed_large = std::make_unique<CurveNumberCurve>(
        "Fig. 4", figures::fig4_c_sealed_large_curve1_points(), figures::kFig4CurveOffsets);
    c.k_sealed_small = std::make_unique<PowerLawCurve>(PowerLawCurve::from_anchors(
        "Fig. 7", figures::kFig7Anchor0, figures::kFig7Anchor1, figures::kFig7XMin, figures::kFig7XMax));
    c.c_sealed_small = std::make_unique<PowerLawCurve>(PowerLawCurve::from_anchors(
        "Fig. 8", figures::kFig8Anchor0, figures::kFig8Anchor1, figures::kFig8XMin, figures::kFig8XMax));

    if (data.fig5_k_ventilated) {
        c.k_ventilated = std::make_unique<FamilyCurve>(
            "Fig. 5", CurveFamilySet::from_points("Fig. 5", *data.fig5_k_ventilated));
        log.info("curves: Fig. 5 k (ventilated) digitized, source " + data.source);
    } else {
        c.k_ventilated = std::make_unique<VentilatedKFallback>();
        log.warn("curves: Fig. 5 k (ventilated) not supplied, using closed-form fallback");
    }

    if (data.fig6_c_ventilated) {
        c.c_ventilated = std::make_unique<FamilyCurve>(
            "Fig. 6", CurveFamilySet::from_points("Fig. 6", *data.fig6_c_ventilated));
        log.info("curves: Fig. 6 c (ventilated) digitized, source " + data.source);
    } else {
        c.c_ventilated = std::make_unique<VentilatedCFallback>();
        log.warn("curves: Fig. 6 c (ventilated) not supplied, using closed-form fallback");
    }

    return std::make_shared<const CurveFamilyInterpolator>(std::move(c), data.source);
}

std::shared_ptr<const CurveFamilyInterpolator> CurveFamilyInterpolator::builtin(LogSink& log) {
    return create(builtin_figure_data(), log);
}

CoefficientSample CurveFamilyInterpolator::k_unventilated_large(double ae_m2) const {
    return c_.k_sealed_large->sample(0.0, ae_m2);
}

CoefficientSample CurveFamilyInterpolator::c_unventilated_large(int curve_number, double f) const {
    return c_.c_sealed_large->sample(static_cast<double>(curve_number), f);
}

CoefficientSample CurveFamilyInterpolator::k_unventilated_small(double ae_m2) const {
    return c_.k_sealed_small->sample(0.0, ae_m2);
}

CoefficientSample CurveFamilyInterpolator::c_unventilated_small(double g) const {
    return c_.c_sealed_small->sample(0.0, g);
}

CoefficientSample CurveFamilyInterpolator::k_ventilated(double ae_m2, double inlet_cm2) const {
    return c_.k_ventilated->sample(ae_m2, inlet_cm2);
}

CoefficientSample CurveFamilyInterpolator::c_ventilated(double f, double inlet_cm2) const {
    return c_.c_ventilated->sample(f, inlet_cm2);
}

} // namespace panelheat::curves
