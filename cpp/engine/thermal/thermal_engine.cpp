/*
================================================================================
Fragment 4.6 - Thermal: Engine Facade
FILE: cpp/engine/thermal/thermal_engine.cpp
================================================================================
*/

#include "engine/thermal/thermal_engine.hpp"

#include <utility>

#include "engine/enclosure/geometry_resolver.hpp"

namespace panelheat::thermal {

namespace {

void hash_rect(InputFingerprint& h, const Rect& r) {
  h.mix_real(r.x);
  h.mix_real(r.y);
  h.mix_real(r.width);
  h.mix_real(r.height);
}

void hash_section(InputFingerprint& h, const EnclosureSection& s) {
  h.mix_text(s.name);
  hash_rect(h, s.rect);
  h.mix_real(s.depth_m);
  h.mix_real(s.extra_power_W);

  h.mix_count(s.sources.size());
  for (const auto& src : s.sources) {
    h.mix_text(src.name);
    h.mix_real(src.watts_each);
    h.mix_int(src.quantity);
    h.mix_flag(src.max_temp_C.has_value());
    if (src.max_temp_C) h.mix_real(*src.max_temp_C);
  }

  h.mix_real(s.max_temp_C);
  h.mix_flag(s.use_component_rating);

  h.mix_flag(s.ventilation.enabled);
  h.mix_real(s.ventilation.inlet_area_cm2);
  h.mix_flag(s.ventilation.installed);
  h.mix_flag(s.ventilation.grid.has_value());
  if (s.ventilation.grid) {
    h.mix_int(s.ventilation.grid->cols);
    h.mix_int(s.ventilation.grid->rows);
  }

  h.mix_int(s.horizontal_partitions);
}

void hash_settings(InputFingerprint& h, const ProjectSettings& st) {
  h.mix_text("env");
  h.mix_real(st.environment.ambient_C);
  h.mix_real(st.environment.altitude_m);
  h.mix_real(st.environment.solar_offset_K);

  h.mix_text("material");
  h.mix_real(st.material.htc_W_m2K);
  h.mix_flag(st.material.allow_material_dissipation);
  h.mix_enum(st.material.model);

  h.mix_text("vent");
  h.mix_int(st.ventilation.ip_first_digit);
  h.mix_real(st.ventilation.test_vent_area_cm2);
  h.mix_real(st.ventilation.louvre.free_area_cm2);
  h.mix_real(st.ventilation.louvre.width_mm);
  h.mix_real(st.ventilation.louvre.height_mm);
  h.mix_real(st.ventilation.louvre.edge_margin_mm);
  h.mix_real(st.ventilation.louvre.spacing_mm);
  for (double f : st.ventilation.ip_mesh.open_area_factor) h.mix_real(f);

  h.mix_text("air");
  h.mix_real(st.air.volumetric_heat_capacity_J_m3K);
  h.mix_real(st.air.airflow_margin);
}

} // namespace

Hash64 hash_section_inputs(const Layout& layout, std::size_t index,
                           const ProjectSettings& settings, const std::string& curve_source) {
  InputFingerprint h;
  h.mix_text("panelheat.section.v1");
  h.mix_text(curve_source);
  h.mix_flag(layout.wall_mounted);

  h.mix_count(index);
  if (index < layout.sections.size()) hash_section(h, layout.sections[index]);

  // Siblings only matter through their rectangles.
  h.mix_count(layout.sections.size());
  for (std::size_t i = 0; i < layout.sections.size(); ++i) {
    if (i == index) continue;
    hash_rect(h, layout.sections[i].rect);
  }

  hash_settings(h, settings);
  return h.finish();
}

ThermalEngine::ThermalEngine(std::shared_ptr<const curves::CurveFamilyInterpolator> curves, LogSink& log)
    : log_(log), solver_(std::move(curves), log), stager_(solver_, log) {}

ThermalResult ThermalEngine::evaluate(const Layout& layout, std::size_t index,
                                      const ProjectSettings& settings) const {
  PANELHEAT_REQUIRE(index < layout.sections.size(), ErrorCode::InvalidInput,
                    "ThermalEngine: section index out of range");
  settings.validate_or_throw();
  layout.sections[index].validate_or_throw();
  return evaluate_validated(layout, index, settings);
}

std::vector<ThermalResult> ThermalEngine::evaluate_all(const Layout& layout,
                                                       const ProjectSettings& settings) const {
  settings.validate_or_throw();
  layout.validate_or_throw();

  std::vector<ThermalResult> out;
  out.reserve(layout.sections.size());
  for (std::size_t i = 0; i < layout.sections.size(); ++i) {
    out.push_back(evaluate_validated(layout, i, settings));
  }
  return out;
}

ThermalResult ThermalEngine::evaluate_validated(const Layout& layout, std::size_t index,
                                                const ProjectSettings& settings) const {
  const SectionGeometry geom = resolve_geometry(layout, index, log_);

  ThermalResult r = stager_.run(layout.sections[index], geom, settings);
  r.section_index = index;
  r.surfaces = surface_breakdown(geom);
  r.input_hash = hash_section_inputs(layout, index, settings, solver_.curves().data_source());

  log_.debug("engine: '" + r.section_name + "' stage " + to_string(r.stage)
             + " hash " + hash_to_hex(r.input_hash));
  return r;
}

}  // namespace panelheat::thermal
