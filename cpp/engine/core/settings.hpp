#pragma once
/*
================================================================================
Fragment 1.4 - Core: Project Settings (Hardened)
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every project-wide assumption that feeds a section evaluation
    (environment, enclosure material, ingress protection, ventilation what-if,
    air properties) into one validated object.
  - ANY change here changes the result fingerprint (see thermal_engine.cpp).

Hardening:
  - validate_or_throw() catches nonsensical values at the host boundary.
  - Explicit units and documented defaults.
  - Louvre and IP-derating tables are typed structs, not string-keyed maps.
================================================================================
*/

#include <array>
#include <cstdint>

#include "engine/core/error.hpp"
#include "engine/core/require.hpp"

namespace panelheat {

// Stage-3 passive dissipation model.
enum class DissipationModel : std::uint8_t {
  AnnexKInversion = 0,  // invert the sealed forward model
  WallConductance = 1   // htc * Ae * allowed rise
};

inline const char* to_string(DissipationModel m) noexcept {
  switch (m) {
    case DissipationModel::AnnexKInversion: return "annex_k";
    case DissipationModel::WallConductance: return "wall_conductance";
    default:                                return "unknown";
  }
}

// ----------------------------- Environment -----------------------------------
struct EnvironmentSettings {
  // Ambient air temperature around the switchboard (C).
  double ambient_C = 35.0;

  // Installation altitude (m). Derates the air heat capacity.
  double altitude_m = 0.0;

  // Uniform solar-radiation offset added to every height (K). 0 = indoor.
  double solar_offset_K = 0.0;

  void validate_or_throw() const {
    require_in_range(ambient_C, -60.0, 150.0, ErrorCode::InvalidEnvironment,
                     "EnvironmentSettings: ambient_C outside sane bounds");
    require_in_range(altitude_m, -500.0, 6000.0, ErrorCode::InvalidEnvironment,
                     "EnvironmentSettings: altitude_m outside sane bounds");
    require_in_range(solar_offset_K, 0.0, 60.0, ErrorCode::InvalidEnvironment,
                     "EnvironmentSettings: solar_offset_K must be in [0,60]");
  }
};

// ----------------------------- Enclosure material ----------------------------
struct MaterialSettings {
  // Sheet heat-transfer coefficient (W/m2K). Painted steel ~5.5.
  double htc_W_m2K = 5.5;

  // When false, stage 3 credits no passive dissipation at all.
  bool allow_material_dissipation = true;

  DissipationModel model = DissipationModel::AnnexKInversion;

  void validate_or_throw() const {
    require_in_range(htc_W_m2K, 0.1, 100.0, ErrorCode::InvalidConfig,
                     "MaterialSettings: htc_W_m2K outside sane bounds");
  }
};

// ----------------------------- Louvres / IP ----------------------------------
struct LouvreDefinition {
  // Free inlet area of one louvre (cm2).
  double free_area_cm2 = 40.0;

  // Cut-out size on the door and how tightly cut-outs may be packed (mm).
  // Only bounds how many louvres a section face can take.
  double width_mm = 200.0;
  double height_mm = 50.0;
  double edge_margin_mm = 50.0;
  double spacing_mm = 25.0;

  void validate_or_throw() const {
    require_positive(free_area_cm2, ErrorCode::InvalidConfig,
                     "LouvreDefinition: free_area_cm2 must be > 0");
    require_positive(width_mm, ErrorCode::InvalidConfig, "LouvreDefinition: width_mm must be > 0");
    require_positive(height_mm, ErrorCode::InvalidConfig, "LouvreDefinition: height_mm must be > 0");
    require_nonnegative(edge_margin_mm, ErrorCode::InvalidConfig,
                        "LouvreDefinition: edge_margin_mm must be >= 0");
    require_nonnegative(spacing_mm, ErrorCode::InvalidConfig,
                        "LouvreDefinition: spacing_mm must be >= 0");
  }
};

// Mesh derating of open area by IP first digit.
// Index = first digit. Digits 5 and above permit no openings.
struct IpMeshTable {
  std::array<double, 5> open_area_factor{1.00, 1.00, 1.00, 0.65, 0.45};

  void validate_or_throw() const {
    for (double f : open_area_factor) {
      require_in_range(f, 0.0, 1.0, ErrorCode::InvalidConfig,
                       "IpMeshTable: factors must be in [0,1]");
    }
  }
};

// ----------------------------- Ventilation -----------------------------------
struct VentilationSettings {
  // IP first digit of the enclosure (0..6).
  int ip_first_digit = 2;

  // Candidate inlet area for the ventilation recommendation (cm2).
  double test_vent_area_cm2 = 300.0;

  LouvreDefinition louvre;
  IpMeshTable ip_mesh;

  void validate_or_throw() const {
    PANELHEAT_REQUIRE(ip_first_digit >= 0 && ip_first_digit <= 6, ErrorCode::InvalidConfig,
                      "VentilationSettings: ip_first_digit must be 0..6");
    require_nonnegative(test_vent_area_cm2, ErrorCode::InvalidConfig,
                        "VentilationSettings: test_vent_area_cm2 must be >= 0");
    louvre.validate_or_throw();
    ip_mesh.validate_or_throw();
  }
};

// ----------------------------- Forced air ------------------------------------
struct AirSettings {
  // Nominal volumetric heat capacity of dry air at sea level (J/m3K).
  double volumetric_heat_capacity_J_m3K = 1160.0;

  // Multiplier on the sized airflow (>= 1 adds headroom).
  double airflow_margin = 1.0;

  void validate_or_throw() const {
    require_in_range(volumetric_heat_capacity_J_m3K, 500.0, 2000.0, ErrorCode::InvalidConfig,
                     "AirSettings: volumetric_heat_capacity_J_m3K outside sane bounds");
    require_in_range(airflow_margin, 1.0, 5.0, ErrorCode::InvalidConfig,
                     "AirSettings: airflow_margin must be in [1,5]");
  }
};

// ----------------------------- ProjectSettings -------------------------------
struct ProjectSettings {
  EnvironmentSettings environment;
  MaterialSettings material;
  VentilationSettings ventilation;
  AirSettings air;

  void validate_or_throw() const {
    environment.validate_or_throw();
    material.validate_or_throw();
    ventilation.validate_or_throw();
    air.validate_or_throw();
  }

  static ProjectSettings defaults() {
    ProjectSettings s;
    return s;
  }
};

}  // namespace panelheat
