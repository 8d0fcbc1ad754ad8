#pragma once
/*
================================================================================
Fragment 4.4 - Thermal: ThermalResult (one record per section evaluation)
FILE: cpp/engine/thermal/thermal_result.hpp

Purpose:
  - Everything a UI overlay or a compliance report needs without re-deriving
    physics: geometry, coefficients with clamp traces, rises and temperatures
    at each height, the decision stage, the passive/active power split and the
    sized airflow.

Notes:
  - Plain value type. Copyable, no ownership, recomputed on every call.
  - airflow_m3h is unset only on the infeasible-by-ambient stage.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "engine/core/hashing.hpp"
#include "engine/core/settings.hpp"
#include "engine/curves/curve_family.hpp"
#include "engine/enclosure/geometry_resolver.hpp"
#include "engine/thermal/thermal_solver.hpp"

namespace panelheat::thermal {

// Terminal stage of the compliance procedure.
enum class ComplianceStage : std::uint8_t {
  InfeasibleAmbient = 1,
  BaseCompliant = 2,
  MaterialDissipation = 3,
  ActiveCooling = 5
};

const char* to_string(ComplianceStage s) noexcept;

enum class InfeasibilityCause : std::uint8_t {
  AmbientAtOrAboveLimit = 0,
  SolarRadiation = 1
};

const char* to_string(InfeasibilityCause c) noexcept;

struct ThermalResult {
  // Identity
  std::string section_name;
  std::size_t section_index = 0;
  Hash64 input_hash;

  ComplianceStage stage = ComplianceStage::BaseCompliant;

  // Geometry
  SectionGeometry geometry;
  std::vector<SurfaceBreakdown> surfaces;

  // Ventilation as requested vs as modeled
  bool ventilation_enabled = false;
  bool ventilation_installed = true;     // false: the opening is itself a what-if
  bool ventilation_effective = false;
  double inlet_area_cm2 = 0.0;

  // Load and limit
  double power_W = 0.0;
  double max_temp_C = 0.0;
  double ambient_C = 0.0;
  double solar_offset_K = 0.0;
  double allowed_rise_K = 0.0;  // max - ambient - solar

  // Forward model
  ThermalBranch branch = ThermalBranch::SealedLarge;
  double k = 0.0;
  double c = 0.0;
  double x = 0.0;
  double d = 1.0;
  std::optional<double> f;
  std::optional<double> g;
  curves::CoefficientSample k_sample;
  curves::CoefficientSample c_sample;

  double dt_mid_K = 0.0;
  double dt_top_K = 0.0;
  double dt_top_raw_K = 0.0;
  std::optional<double> dt_075_K;

  double T_mid_C = 0.0;
  double T_top_C = 0.0;
  std::optional<double> T_075_C;

  bool compliant_mid = false;
  bool compliant_top = false;

  // Cooling decomposition
  DissipationModel dissipation_model = DissipationModel::AnnexKInversion;
  double passive_capacity_W = 0.0;       // what the enclosure sheet could reject
  double material_dissipation_W = 0.0;   // credited to the enclosure sheet
  double active_cooling_W = 0.0;         // left for forced air
  std::optional<double> airflow_m3h;

  // Ventilation what-if (diagnostic)
  double max_inlet_area_cm2 = 0.0;               // largest louvre grid the face takes
  std::optional<double> whatif_inlet_area_cm2;   // opening actually tried
  bool ventilation_recommended = false;
  std::optional<double> hypothetical_T_top_C;

  std::vector<InfeasibilityCause> infeasibility;
  std::vector<std::string> figures_used;

  bool compliant() const {
    return stage == ComplianceStage::BaseCompliant || stage == ComplianceStage::MaterialDissipation;
  }
};

}  // namespace panelheat::thermal
