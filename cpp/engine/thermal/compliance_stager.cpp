/*
================================================================================
Fragment 4.5 - Thermal: Compliance Stager
FILE: cpp/engine/thermal/compliance_stager.cpp
================================================================================
*/

#include "engine/thermal/compliance_stager.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "engine/core/require.hpp"
#include "engine/enclosure/louvre.hpp"
#include "engine/thermal/airflow_sizer.hpp"
#include "engine/thermal/iec60890.hpp"

namespace panelheat::thermal {

const char* to_string(ComplianceStage s) noexcept {
  switch (s) {
    case ComplianceStage::InfeasibleAmbient:   return "infeasible_ambient";
    case ComplianceStage::BaseCompliant:       return "base_compliant";
    case ComplianceStage::MaterialDissipation: return "material_dissipation";
    case ComplianceStage::ActiveCooling:       return "active_cooling";
    default:                                   return "unknown";
  }
}

const char* to_string(InfeasibilityCause c) noexcept {
  switch (c) {
    case InfeasibilityCause::AmbientAtOrAboveLimit: return "ambient_at_or_above_limit";
    case InfeasibilityCause::SolarRadiation:        return "solar_radiation";
    default:                                        return "unknown";
  }
}

double passive_capacity_annex_k(const SealedCoefficients& sc, double allowed_rise_K) noexcept {
  if (!(allowed_rise_K > 0.0) || !(sc.x > 0.0)) return 0.0;
  const double gain = sc.c * sc.k * sc.d;
  if (!is_finite(gain) || gain <= 0.0) return 0.0;
  const double p = std::pow(allowed_rise_K / gain, 1.0 / sc.x);
  return is_finite(p) ? p : 0.0;
}

double passive_capacity_wall(double htc_W_m2K, double ae_m2, double allowed_rise_K) noexcept {
  if (!(allowed_rise_K > 0.0) || !(ae_m2 > 0.0) || !(htc_W_m2K > 0.0)) return 0.0;
  return htc_W_m2K * ae_m2 * allowed_rise_K;
}

ComplianceStager::ComplianceStager(const ThermalSolver& solver, LogSink& log)
    : solver_(solver), log_(log) {}

double ComplianceStager::passive_capacity(const SectionGeometry& g, int partitions,
                                          const ProjectSettings& settings, double allowed_rise_K) const {
  if (!settings.material.allow_material_dissipation) return 0.0;
  const double sea_level =
      settings.material.model == DissipationModel::WallConductance
          ? passive_capacity_wall(settings.material.htc_W_m2K, g.Ae_m2, allowed_rise_K)
          : passive_capacity_annex_k(solver_.sealed_coefficients(g, partitions), allowed_rise_K);
  // Thinner air rejects less heat from the sheet, same table as the airflow sizing.
  return sea_level * altitude_derating_factor(settings.environment.altitude_m);
}

ThermalResult ComplianceStager::run(const EnclosureSection& section,
                                    const SectionGeometry& geometry,
                                    const ProjectSettings& settings) const {
  const auto& env = settings.environment;
  const auto& vs = settings.ventilation;

  ThermalResult r;
  r.section_name = section.name;
  r.geometry = geometry;
  r.power_W = section.total_power_W();
  r.max_temp_C = section.effective_max_temp_C();
  r.ambient_C = env.ambient_C;
  r.solar_offset_K = env.solar_offset_K;
  r.allowed_rise_K = r.max_temp_C - env.ambient_C - env.solar_offset_K;
  r.dissipation_model = settings.material.model;

  r.ventilation_enabled = section.ventilation.enabled;
  r.ventilation_installed = section.ventilation.installed;
  r.inlet_area_cm2 = resolve_inlet_area_cm2(section.ventilation, vs);
  r.ventilation_effective = ventilation_effective(section.ventilation.enabled, geometry.Ae_m2, vs.ip_first_digit);
  r.max_inlet_area_cm2 = max_effective_inlet_area_cm2(geometry.width_m, geometry.height_m, vs.louvre,
                                                      vs.ip_first_digit, vs.ip_mesh);

  const double base_C = env.ambient_C + env.solar_offset_K;

  // ---- Stage 1: infeasible by ambient ----
  if (base_C >= r.max_temp_C) {
    if (env.ambient_C >= r.max_temp_C) r.infeasibility.push_back(InfeasibilityCause::AmbientAtOrAboveLimit);
    if (env.solar_offset_K > 0.0) r.infeasibility.push_back(InfeasibilityCause::SolarRadiation);

    r.stage = ComplianceStage::InfeasibleAmbient;
    r.T_mid_C = base_C;
    r.T_top_C = base_C;
    r.compliant_mid = false;
    r.compliant_top = false;
    r.airflow_m3h = std::nullopt;

    std::ostringstream oss;
    oss << "stage: '" << section.name << "' infeasible, ambient " << env.ambient_C
        << " C + solar " << env.solar_offset_K << " K >= limit " << r.max_temp_C << " C";
    log_.info(oss.str());
    return r;
  }

  if (section.ventilation.enabled && !r.ventilation_effective) {
    std::ostringstream oss;
    oss << "ventilation: '" << section.name << "' openings ignored (";
    if (!ip_permits_openings(vs.ip_first_digit)) oss << "IP" << vs.ip_first_digit << "X forbids openings";
    else oss << "Ae " << geometry.Ae_m2 << " m2 <= " << iec60890::kSmallEnclosureAeLimit_m2;
    oss << ")";
    log_.info(oss.str());
  }

  // ---- Forward model ----
  ForwardInputs in;
  in.geometry = geometry;
  in.power_W = r.power_W;
  in.ventilated = r.ventilation_effective;
  in.inlet_area_cm2 = r.inlet_area_cm2;
  in.horizontal_partitions = section.horizontal_partitions;

  const ForwardResult fw = solver_.solve(in);
  r.branch = fw.branch;
  r.k = fw.k;
  r.c = fw.c;
  r.x = fw.x;
  r.d = fw.d;
  r.f = fw.f;
  r.g = fw.g;
  r.k_sample = fw.k_sample;
  r.c_sample = fw.c_sample;
  r.dt_mid_K = fw.dt_mid_K;
  r.dt_top_K = fw.dt_top_K;
  r.dt_top_raw_K = fw.dt_top_raw_K;
  r.dt_075_K = fw.dt_075_K;
  r.figures_used = fw.figures_used;

  r.T_mid_C = base_C + r.dt_mid_K;
  r.T_top_C = base_C + r.dt_top_K;
  if (r.dt_075_K) r.T_075_C = base_C + *r.dt_075_K;

  // ---- Stage 2: base compliant ----
  if (r.T_top_C <= r.max_temp_C) {
    r.stage = ComplianceStage::BaseCompliant;
    r.compliant_mid = (r.T_mid_C <= r.max_temp_C);
    r.compliant_top = true;
    r.airflow_m3h = 0.0;
    log_.info("stage: '" + section.name + "' compliant without supplemental cooling");
    return r;
  }

  // ---- Stage 3: enclosure material dissipation ----
  r.passive_capacity_W = passive_capacity(geometry, section.horizontal_partitions, settings, r.allowed_rise_K);
  r.material_dissipation_W = std::min(r.power_W, r.passive_capacity_W);

  if (r.material_dissipation_W >= r.power_W) {
    r.stage = ComplianceStage::MaterialDissipation;
    r.compliant_mid = true;
    r.compliant_top = true;
    r.active_cooling_W = 0.0;
    r.airflow_m3h = 0.0;

    std::ostringstream oss;
    oss << "stage: '" << section.name << "' compliant via enclosure dissipation, capacity "
        << r.passive_capacity_W << " W >= load " << r.power_W << " W";
    log_.info(oss.str());
    return r;
  }

  // ---- Stage 4: ventilation what-if (diagnostic) ----
  if (!r.ventilation_effective && !geometry.is_small() && ip_permits_openings(vs.ip_first_digit)) {
    // The candidate opening cannot exceed what the section face can carry.
    r.whatif_inlet_area_cm2 = std::min(vs.test_vent_area_cm2, r.max_inlet_area_cm2);

    ForwardInputs hyp = in;
    hyp.ventilated = true;
    hyp.inlet_area_cm2 = *r.whatif_inlet_area_cm2;
    const ForwardResult hfw = solver_.solve(hyp);
    r.hypothetical_T_top_C = base_C + hfw.dt_top_K;
    r.ventilation_recommended = (*r.hypothetical_T_top_C <= r.max_temp_C);

    std::ostringstream oss;
    oss << "ventilation: '" << section.name << "' what-if " << *r.whatif_inlet_area_cm2
        << " cm2 gives top " << *r.hypothetical_T_top_C << " C"
        << (r.ventilation_recommended ? " (recommended)" : " (not sufficient)");
    log_.info(oss.str());
  }

  // ---- Stage 5: active cooling ----
  r.stage = ComplianceStage::ActiveCooling;
  r.compliant_mid = false;
  r.compliant_top = false;
  r.active_cooling_W = std::max(0.0, r.power_W - r.passive_capacity_W);

  const double cv = derated_heat_capacity(settings.air.volumetric_heat_capacity_J_m3K, env.altitude_m);
  r.airflow_m3h = try_required_flow_m3h(r.active_cooling_W, r.allowed_rise_K, cv);
  if (r.airflow_m3h) *r.airflow_m3h *= settings.air.airflow_margin;

  std::ostringstream oss;
  oss << "stage: '" << section.name << "' needs active cooling, residual " << r.active_cooling_W
      << " W, airflow ";
  if (r.airflow_m3h) oss << *r.airflow_m3h << " m3/h";
  else oss << "n/a";
  log_.info(oss.str());
  return r;
}

}  // namespace panelheat::thermal
