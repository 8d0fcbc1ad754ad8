/*
===============================================================================
Fragment 2.6 - Curves: CurveFamilyInterpolator (IEC 60890 k / c lookups)
File: cpp/engine/curves/curve_family_interpolator.hpp
===============================================================================

Purpose:
  - The six standardized coefficient functions used by the thermal solver:
      k_unventilated_large(Ae)                  Fig. 3
      c_unventilated_large(curve_number, f)     Fig. 4
      k_unventilated_small(Ae)                  Fig. 7
      c_unventilated_small(g)                   Fig. 8
      k_ventilated(Ae, inlet_cm2)               Fig. 5
      c_ventilated(f, inlet_cm2)                Fig. 6
  - Fig. 5/6 use digitized family sets when supplied, closed forms otherwise.

Thread-safety:
  - Immutable after construction; share one instance across evaluations.
===============================================================================
*/

#pragma once

#include "engine/core/logging.hpp"
#include "engine/curves/coefficient_curve.hpp"
#include "engine/curves/curve_loader.hpp"

#include <memory>
#include <string>

namespace panelheat::curves {

class CurveFamilyInterpolator final {
public:
    struct Curves final {
        std::unique_ptr<const CoefficientCurve> k_sealed_large;
        std::unique_ptr<const CoefficientCurve> c_sealed_large;
        std::unique_ptr<const CoefficientCurve> k_sealed_small;
        std::unique_ptr<const CoefficientCurve> c_sealed_small;
        std::unique_ptr<const CoefficientCurve> k_ventilated;
        std::unique_ptr<const CoefficientCurve> c_ventilated;
    };

    // Throws InvalidConfig if any strategy is missing.
    explicit CurveFamilyInterpolator(Curves curves, std::string source = "custom");

    // Standard strategy selection from loaded data.
    static std::shared_ptr<const CurveFamilyInterpolator> create(const FigureData& data,
                                                                 LogSink& log = null_log_sink());

    // Built-in digitized data.
    static std::shared_ptr<const CurveFamilyInterpolator> builtin(LogSink& log = null_log_sink());

    CoefficientSample k_unventilated_large(double ae_m2) const;
    CoefficientSample c_unventilated_large(int curve_number, double f) const;
    CoefficientSample k_unventilated_small(double ae_m2) const;
    CoefficientSample c_unventilated_small(double g) const;
    CoefficientSample k_ventilated(double ae_m2, double inlet_cm2) const;
    CoefficientSample c_ventilated(double f, double inlet_cm2) const;

    bool ventilated_k_digitized() const noexcept { return c_.k_ventilated->digitized(); }
    bool ventilated_c_digitized() const noexcept { return c_.c_ventilated->digitized(); }

    const std::string& data_source() const noexcept { return source_; }

private:
    Curves c_;
    std::string source_;
};

} // namespace panelheat::curves
