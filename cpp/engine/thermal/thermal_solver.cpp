/*
================================================================================
Fragment 4.1 - Thermal: Forward Model
FILE: cpp/engine/thermal/thermal_solver.cpp
================================================================================
*/

#include "engine/thermal/thermal_solver.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "engine/core/require.hpp"
#include "engine/enclosure/louvre.hpp"
#include "engine/thermal/iec60890.hpp"

namespace panelheat::thermal {

const char* to_string(ThermalBranch b) noexcept {
  switch (b) {
    case ThermalBranch::Ventilated:  return "ventilated";
    case ThermalBranch::SealedSmall: return "sealed_small";
    case ThermalBranch::SealedLarge: return "sealed_large";
    default:                         return "unknown";
  }
}

bool ventilation_effective(bool enabled, double ae_m2, int ip_first_digit) noexcept {
  return enabled && ae_m2 > iec60890::kSmallEnclosureAeLimit_m2 && ip_permits_openings(ip_first_digit);
}

double partition_factor(ThermalBranch branch, int horizontal_partitions) noexcept {
  const auto idx = static_cast<std::size_t>(std::clamp(horizontal_partitions, 0, 3));
  switch (branch) {
    case ThermalBranch::Ventilated:  return iec60890::kPartitionFactorVentilated[idx];
    case ThermalBranch::SealedLarge: return iec60890::kPartitionFactorSealedLarge[idx];
    case ThermalBranch::SealedSmall:
    default:                         return iec60890::kPartitionFactorSmall;
  }
}

ThermalSolver::ThermalSolver(std::shared_ptr<const curves::CurveFamilyInterpolator> curves, LogSink& log)
    : curves_(std::move(curves)), log_(log) {
  PANELHEAT_REQUIRE(curves_ != nullptr, ErrorCode::InvalidConfig, "ThermalSolver: no curve interpolator");
}

void ThermalSolver::note_snap(const char* what, const curves::CoefficientSample& s) const {
  if (!s.snapped()) return;
  std::ostringstream oss;
  oss << "curves: " << what << " query clamped";
  if (s.key_snapped) oss << " key " << s.key_requested << " -> " << s.key_used;
  if (s.x_snapped) oss << " x " << s.x_requested << " -> " << s.x_used;
  log_.warn(oss.str());
}

ForwardResult ThermalSolver::solve(const ForwardInputs& in) const {
  const SectionGeometry& g = in.geometry;
  const bool small = g.is_small();

  ForwardResult r;
  if (in.ventilated && !small) {
    r.branch = ThermalBranch::Ventilated;
    r.x = iec60890::kExponentVentilated;
    r.k_sample = curves_->k_ventilated(g.Ae_m2, in.inlet_area_cm2);
    r.c_sample = curves_->c_ventilated(g.f, in.inlet_area_cm2);
    r.f = g.f;
    r.figures_used = {"Fig. 5", "Fig. 6"};
    note_snap("k_ventilated", r.k_sample);
    note_snap("c_ventilated", r.c_sample);
  } else if (small) {
    r.branch = ThermalBranch::SealedSmall;
    r.x = iec60890::kExponentSealed;
    r.k_sample = curves_->k_unventilated_small(g.Ae_m2);
    r.c_sample = curves_->c_unventilated_small(g.g);
    r.g = g.g;
    r.figures_used = {"Fig. 7", "Fig. 8"};
    note_snap("k_unventilated_small", r.k_sample);
    note_snap("c_unventilated_small", r.c_sample);
  } else {
    r.branch = ThermalBranch::SealedLarge;
    r.x = iec60890::kExponentSealed;
    r.k_sample = curves_->k_unventilated_large(g.Ae_m2);
    r.c_sample = curves_->c_unventilated_large(g.curve_number, g.f);
    r.f = g.f;
    r.figures_used = {"Fig. 3", "Fig. 4"};
    note_snap("k_unventilated_large", r.k_sample);
    note_snap("c_unventilated_large", r.c_sample);
  }

  r.k = r.k_sample.value;
  r.c = r.c_sample.value;
  r.d = partition_factor(r.branch, in.horizontal_partitions);

  const double P = (is_finite(in.power_W) && in.power_W > 0.0) ? in.power_W : 0.0;
  r.dt_mid_K = (P > 0.0) ? r.k * r.d * std::pow(P, r.x) : 0.0;
  r.dt_top_raw_K = r.c * r.dt_mid_K;

  if (r.branch == ThermalBranch::SealedSmall) {
    // Fig. 2: top point sits vertically above the 0.75-height point.
    const double dt_075 = 0.5 * (r.dt_mid_K + r.dt_top_raw_K);
    r.dt_075_K = dt_075;
    r.dt_top_K = dt_075;
    r.figures_used.push_back("Fig. 2");
  } else {
    r.dt_top_K = r.dt_top_raw_K;
    r.figures_used.push_back("Fig. 1");
  }

  std::sort(r.figures_used.begin(), r.figures_used.end());
  return r;
}

SealedCoefficients ThermalSolver::sealed_coefficients(const SectionGeometry& g, int horizontal_partitions) const {
  SealedCoefficients sc;
  sc.x = iec60890::kExponentSealed;
  if (g.is_small()) {
    sc.k = curves_->k_unventilated_small(g.Ae_m2).value;
    sc.c = curves_->c_unventilated_small(g.g).value;
    sc.d = partition_factor(ThermalBranch::SealedSmall, horizontal_partitions);
  } else {
    sc.k = curves_->k_unventilated_large(g.Ae_m2).value;
    sc.c = curves_->c_unventilated_large(g.curve_number, g.f).value;
    sc.d = partition_factor(ThermalBranch::SealedLarge, horizontal_partitions);
  }
  return sc;
}

}  // namespace panelheat::thermal
