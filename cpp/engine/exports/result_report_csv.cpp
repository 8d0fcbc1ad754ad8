/*
================================================================================
Fragment 5.2 - Exports: Compliance Report CSV
FILE: cpp/engine/exports/result_report_csv.cpp
================================================================================
*/

#include "engine/exports/result_report_csv.hpp"

#include <fstream>
#include <optional>
#include <ostream>
#include <sstream>

#include "engine/core/csv_text.hpp"

namespace panelheat {

namespace {

std::string num(double v, int precision = 6) {
  return csv::format_double(v, precision);
}

std::string opt(const std::optional<double>& v, int precision = 6) {
  return v ? csv::format_double(*v, precision) : std::string{};
}

const char* yes_no(bool b) {
  return b ? "1" : "0";
}

template <class T, class F>
std::string join_pipe(const std::vector<T>& items, F&& fmt) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i) out += "|";
    out += fmt(items[i]);
  }
  return out;
}

} // namespace

std::string result_csv_header() {
  return "section,index,stage,compliant,branch,curve_number,"
         "Ae_m2,f,g,k,c,x,d,"
         "power_W,max_temp_C,ambient_C,solar_offset_K,allowed_rise_K,"
         "dt_mid_K,dt_075_K,dt_top_K,dt_top_raw_K,"
         "T_mid_C,T_075_C,T_top_C,compliant_mid,compliant_top,"
         "dissipation_model,passive_capacity_W,material_dissipation_W,active_cooling_W,airflow_m3h,"
         "ventilation_enabled,ventilation_installed,ventilation_effective,inlet_area_cm2,"
         "max_inlet_area_cm2,whatif_inlet_area_cm2,ventilation_recommended,hypothetical_T_top_C,"
         "k_snapped,c_snapped,infeasibility,figures_used,input_hash";
}

std::string result_csv_row(const thermal::ThermalResult& r) {
  std::ostringstream o;
  const auto& g = r.geometry;

  o << csv::escape(r.section_name) << ','
    << r.section_index << ','
    << thermal::to_string(r.stage) << ','
    << yes_no(r.compliant()) << ','
    << thermal::to_string(r.branch) << ','
    << g.curve_number << ',';

  o << num(g.Ae_m2) << ',' << opt(r.f) << ',' << opt(r.g) << ','
    << num(r.k) << ',' << num(r.c) << ',' << num(r.x, 3) << ',' << num(r.d, 3) << ',';

  o << num(r.power_W, 3) << ',' << num(r.max_temp_C, 3) << ',' << num(r.ambient_C, 3) << ','
    << num(r.solar_offset_K, 3) << ',' << num(r.allowed_rise_K, 3) << ',';

  o << num(r.dt_mid_K, 3) << ',' << opt(r.dt_075_K, 3) << ',' << num(r.dt_top_K, 3) << ','
    << num(r.dt_top_raw_K, 3) << ',';

  o << num(r.T_mid_C, 3) << ',' << opt(r.T_075_C, 3) << ',' << num(r.T_top_C, 3) << ','
    << yes_no(r.compliant_mid) << ',' << yes_no(r.compliant_top) << ',';

  o << to_string(r.dissipation_model) << ','
    << num(r.passive_capacity_W, 3) << ',' << num(r.material_dissipation_W, 3) << ','
    << num(r.active_cooling_W, 3) << ',' << opt(r.airflow_m3h, 3) << ',';

  o << yes_no(r.ventilation_enabled) << ',' << yes_no(r.ventilation_installed) << ','
    << yes_no(r.ventilation_effective) << ',' << num(r.inlet_area_cm2, 3) << ','
    << num(r.max_inlet_area_cm2, 3) << ',' << opt(r.whatif_inlet_area_cm2, 3) << ','
    << yes_no(r.ventilation_recommended) << ',' << opt(r.hypothetical_T_top_C, 3) << ',';

  o << yes_no(r.k_sample.snapped()) << ',' << yes_no(r.c_sample.snapped()) << ','
    << join_pipe(r.infeasibility, [](thermal::InfeasibilityCause c) { return std::string(thermal::to_string(c)); }) << ','
    << csv::escape(join_pipe(r.figures_used, [](const std::string& s) { return s; })) << ','
    << hash_to_hex(r.input_hash);

  return o.str();
}

void write_result_csv(std::ostream& os, const std::vector<thermal::ThermalResult>& results) {
  os << result_csv_header() << "\n";
  for (const auto& r : results) {
    os << result_csv_row(r) << "\n";
  }
}

bool write_result_csv_file(const std::string& path, const std::vector<thermal::ThermalResult>& results) {
  std::ofstream f(path);
  if (!f.is_open()) return false;
  write_result_csv(f, results);
  f.flush();
  return f.good();
}

}  // namespace panelheat
