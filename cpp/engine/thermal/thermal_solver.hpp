#pragma once
/*
================================================================================
Fragment 4.1 - Thermal: Forward Model (IEC 60890 temperature rise)
FILE: cpp/engine/thermal/thermal_solver.hpp

Purpose:
  - dt_mid = k * d * P^x,  dt_top_raw = c * dt_mid
  - Branch by (effective ventilation, Ae <= 1.25 m2):
      Ventilated   k Fig. 5, c Fig. 6 (f),  x = 0.715
      SealedSmall  k Fig. 7, c Fig. 8 (g),  x = 0.804, top = 0.75-height point
      SealedLarge  k Fig. 3, c Fig. 4 (curve no., f), x = 0.804

Hardening:
  - Total over validated input: P <= 0 gives zero rises on every branch.
  - Coefficient lookups clamp; snaps are reported on the traces and logged.
================================================================================
*/

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/curves/curve_family_interpolator.hpp"
#include "engine/enclosure/geometry_resolver.hpp"

namespace panelheat::thermal {

enum class ThermalBranch : std::uint8_t {
  Ventilated = 0,
  SealedSmall = 1,
  SealedLarge = 2
};

const char* to_string(ThermalBranch b) noexcept;

// Ventilation counts only when enabled, Ae > 1.25 m2 and the IP rating allows openings.
bool ventilation_effective(bool enabled, double ae_m2, int ip_first_digit) noexcept;

// d factor for the branch and horizontal partition count.
double partition_factor(ThermalBranch branch, int horizontal_partitions) noexcept;

struct ForwardInputs {
  SectionGeometry geometry;
  double power_W = 0.0;
  bool ventilated = false;      // already gated by ventilation_effective()
  double inlet_area_cm2 = 0.0;
  int horizontal_partitions = 0;
};

struct ForwardResult {
  ThermalBranch branch = ThermalBranch::SealedLarge;

  double x = 0.0;
  double k = 0.0;
  double c = 0.0;
  double d = 1.0;
  std::optional<double> f;
  std::optional<double> g;

  curves::CoefficientSample k_sample;
  curves::CoefficientSample c_sample;

  double dt_mid_K = 0.0;
  double dt_top_raw_K = 0.0;
  double dt_top_K = 0.0;
  std::optional<double> dt_075_K;  // small sealed branch only

  std::vector<std::string> figures_used;
};

// Sealed (unventilated) coefficients for a geometry, as used by the inversion.
struct SealedCoefficients {
  double k = 0.0;
  double c = 0.0;
  double d = 1.0;
  double x = 0.0;
};

class ThermalSolver {
 public:
  explicit ThermalSolver(std::shared_ptr<const curves::CurveFamilyInterpolator> curves,
                         LogSink& log = null_log_sink());

  ForwardResult solve(const ForwardInputs& in) const;

  SealedCoefficients sealed_coefficients(const SectionGeometry& g, int horizontal_partitions) const;

  const curves::CurveFamilyInterpolator& curves() const noexcept { return *curves_; }

 private:
  void note_snap(const char* what, const curves::CoefficientSample& s) const;

  std::shared_ptr<const curves::CurveFamilyInterpolator> curves_;
  LogSink& log_;
};

}  // namespace panelheat::thermal
