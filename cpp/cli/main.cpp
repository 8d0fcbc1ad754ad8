/*
================================================================================
Fragment 6.0 - CLI: Main Entry Point (panelheat_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line host for the IEC 60890 thermal compliance engine.

Usage:
  panelheat_cli <command> [options]

Commands:
  evaluate   Evaluate every section of a layout CSV, write the compliance CSV
  demo       Evaluate a built-in two-section layout
  curves     Print sampled coefficients and the curve data source
  help       Show help message

Exit codes (deterministic, for CI gating):
  0  all sections compliant
  2  at least one section non-compliant
  1  usage / IO / parse error
================================================================================
*/

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/curves/curve_family_interpolator.hpp"
#include "engine/curves/curve_loader.hpp"
#include "engine/enclosure/section.hpp"
#include "engine/exports/layout_csv.hpp"
#include "engine/exports/result_report_csv.hpp"
#include "engine/thermal/thermal_engine.hpp"

namespace panelheat {
namespace {

enum class ExitCode : int {
  kCompliant = 0,
  kError = 1,
  kNonCompliant = 2,
};

constexpr int kExitErrorInt = static_cast<int>(ExitCode::kError);

struct Args {
  std::string command;
  std::string layout_path;
  std::string curves_root;
  std::string out_path = "-";
  bool wall_mounted = false;
  bool verbose = false;
  ProjectSettings settings;
};

void print_usage(std::ostream& os) {
  os <<
    "panelheat_cli - IEC 60890 enclosure temperature-rise compliance\n"
    "\n"
    "Usage:\n"
    "  panelheat_cli evaluate --layout <csv> [options]\n"
    "  panelheat_cli demo [options]\n"
    "  panelheat_cli curves [--curves <dir>]\n"
    "  panelheat_cli help\n"
    "\n"
    "Options:\n"
    "  --ambient <C>          Ambient temperature (default 35)\n"
    "  --altitude <m>         Installation altitude (default 0)\n"
    "  --solar <K>            Solar radiation offset (default 0)\n"
    "  --ip <digit>           IP first digit 0..6 (default 2)\n"
    "  --wall-mounted         Rear faces against a wall\n"
    "  --test-vent-cm2 <cm2>  Candidate opening for the ventilation what-if (default 300)\n"
    "  --no-material          Do not credit enclosure material dissipation\n"
    "  --wall-conductance     Use htc * Ae * rise for material dissipation\n"
    "  --curves <dir>         Folder with fig5/ and fig6/ digitized CSVs\n"
    "  --out <path|->         Compliance CSV destination (default stdout)\n"
    "  --verbose              Log geometry and stage decisions to stderr\n"
    "\n"
    "Exit codes:\n"
    "  0  all sections compliant\n"
    "  2  at least one section non-compliant\n"
    "  1  usage / IO / parse error\n";
}

bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

bool parse_int(const char* s, int* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (end == s || *end != '\0') return false;
  if (v < -1000 || v > 1000) return false;
  *out = static_cast<int>(v);
  return true;
}

bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

bool parse_args(int argc, char** argv, Args* a, std::string* err) {
  if (argc < 2) { *err = "missing command"; return false; }
  a->command = argv[1];

  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    auto need = [&](const char* flag) -> bool {
      if (get_next(i, argc, argv, &v)) return true;
      *err = std::string(flag) + " requires a value";
      return false;
    };
    auto need_double = [&](const char* flag, double* dst) -> bool {
      if (!need(flag)) return false;
      if (parse_double(v, dst)) return true;
      *err = std::string(flag) + " must be a finite number";
      return false;
    };

    if (std::strcmp(k, "--layout") == 0) {
      if (!need("--layout")) return false;
      a->layout_path = v;
    } else if (std::strcmp(k, "--curves") == 0) {
      if (!need("--curves")) return false;
      a->curves_root = v;
    } else if (std::strcmp(k, "--out") == 0) {
      if (!need("--out")) return false;
      a->out_path = v;
    } else if (std::strcmp(k, "--ambient") == 0) {
      if (!need_double("--ambient", &a->settings.environment.ambient_C)) return false;
    } else if (std::strcmp(k, "--altitude") == 0) {
      if (!need_double("--altitude", &a->settings.environment.altitude_m)) return false;
    } else if (std::strcmp(k, "--solar") == 0) {
      if (!need_double("--solar", &a->settings.environment.solar_offset_K)) return false;
    } else if (std::strcmp(k, "--test-vent-cm2") == 0) {
      if (!need_double("--test-vent-cm2", &a->settings.ventilation.test_vent_area_cm2)) return false;
    } else if (std::strcmp(k, "--ip") == 0) {
      if (!need("--ip")) return false;
      if (!parse_int(v, &a->settings.ventilation.ip_first_digit)) {
        *err = "--ip must be an integer";
        return false;
      }
    } else if (std::strcmp(k, "--wall-mounted") == 0) {
      a->wall_mounted = true;
    } else if (std::strcmp(k, "--no-material") == 0) {
      a->settings.material.allow_material_dissipation = false;
    } else if (std::strcmp(k, "--wall-conductance") == 0) {
      a->settings.material.model = DissipationModel::WallConductance;
    } else if (std::strcmp(k, "--verbose") == 0) {
      a->verbose = true;
    } else if (std::strcmp(k, "--help") == 0 || std::strcmp(k, "-h") == 0) {
      a->command = "help";
    } else {
      *err = std::string("unknown option: ") + k;
      return false;
    }
  }
  return true;
}

std::shared_ptr<const curves::CurveFamilyInterpolator> make_curves(const Args& a, LogSink& log) {
  if (a.curves_root.empty()) {
    log.info("curves: using built-in digitized data");
    return curves::CurveFamilyInterpolator::builtin(log);
  }
  return curves::CurveFamilyInterpolator::create(curves::load_figure_data(a.curves_root, log), log);
}

Layout demo_layout(bool wall_mounted) {
  Layout layout;
  layout.wall_mounted = wall_mounted;

  EnclosureSection incomer;
  incomer.name = "Incomer";
  incomer.rect = Rect{0.0, 0.0, 0.6, 1.2};
  incomer.depth_m = 0.4;
  incomer.sources.push_back(HeatSource{"ACB 1600A", 180.0, 1, 70.0});
  incomer.sources.push_back(HeatSource{"Busbar run", 40.0, 1, std::nullopt});
  incomer.use_component_rating = true;

  EnclosureSection feeders;
  feeders.name = "Feeders";
  feeders.rect = Rect{0.6, 0.0, 0.8, 1.2};
  feeders.depth_m = 0.4;
  feeders.sources.push_back(HeatSource{"MCCB 250A", 35.0, 8, 70.0});
  feeders.max_temp_C = 55.0;
  feeders.ventilation.enabled = true;
  feeders.ventilation.grid = LouvreGrid{2, 2};

  layout.sections.push_back(incomer);
  layout.sections.push_back(feeders);
  return layout;
}

void print_summary(std::ostream& os, const std::vector<thermal::ThermalResult>& results) {
  os << std::fixed << std::setprecision(1);
  for (const auto& r : results) {
    os << "  " << std::left << std::setw(14) << r.section_name << std::right
       << " Ae=" << std::setprecision(3) << r.geometry.Ae_m2 << std::setprecision(1)
       << " P=" << r.power_W << " W"
       << " T_mid=" << r.T_mid_C << " T_top=" << r.T_top_C
       << " limit=" << r.max_temp_C
       << " -> " << thermal::to_string(r.stage);
    if (r.airflow_m3h && *r.airflow_m3h > 0.0) os << " airflow=" << *r.airflow_m3h << " m3/h";
    if (r.ventilation_recommended) os << " [ventilation recommended]";
    os << "\n";
  }
}

int run_layout(const Args& a, const Layout& layout, LogSink& log) {
  a.settings.validate_or_throw();

  thermal::ThermalEngine engine(make_curves(a, log), log);
  const auto results = engine.evaluate_all(layout, a.settings);

  bool all_ok = true;
  for (const auto& r : results) all_ok = all_ok && r.compliant();

  if (a.out_path == "-") {
    write_result_csv(std::cout, results);
  } else {
    if (!write_result_csv_file(a.out_path, results)) {
      std::cerr << "IO error: failed to write " << a.out_path << "\n";
      return kExitErrorInt;
    }
    std::cout << "Wrote " << results.size() << " section(s) to " << a.out_path << "\n";
    print_summary(std::cout, results);
  }

  return static_cast<int>(all_ok ? ExitCode::kCompliant : ExitCode::kNonCompliant);
}

int cmd_curves(const Args& a, LogSink& log) {
  const auto c = make_curves(a, log);

  std::cout << "curve data source: " << c->data_source() << "\n"
            << "Fig. 5 k ventilated: " << (c->ventilated_k_digitized() ? "digitized" : "closed-form") << "\n"
            << "Fig. 6 c ventilated: " << (c->ventilated_c_digitized() ? "digitized" : "closed-form") << "\n\n";

  std::cout << std::fixed << std::setprecision(4);
  std::cout << "Ae_m2   k_fig3  k_fig7  k_fig5@300cm2\n";
  for (double ae : {0.5, 1.0, 1.25, 2.0, 2.5, 4.0, 8.0, 14.0}) {
    std::cout << std::setw(6) << ae << "  "
              << c->k_unventilated_large(ae).value << "  "
              << c->k_unventilated_small(ae).value << "  "
              << c->k_ventilated(ae, 300.0).value << "\n";
  }

  std::cout << "\nf       c_fig4_1 c_fig4_3 c_fig4_5 c_fig6@300cm2\n";
  for (double f : {1.0, 1.5, 2.0, 4.0, 6.0, 10.0}) {
    std::cout << std::setw(6) << f << "  "
              << c->c_unventilated_large(1, f).value << "  "
              << c->c_unventilated_large(3, f).value << "  "
              << c->c_unventilated_large(5, f).value << "  "
              << c->c_ventilated(f, 300.0).value << "\n";
  }

  std::cout << "\ng       c_fig8\n";
  for (double g : {0.5, 1.0, 1.5, 2.0, 3.0}) {
    std::cout << std::setw(6) << g << "  " << c->c_unventilated_small(g).value << "\n";
  }
  return static_cast<int>(ExitCode::kCompliant);
}

int dispatch(const Args& a, LogSink& log) {
  if (a.command == "evaluate") {
    if (a.layout_path.empty()) {
      std::cerr << "Argument error: evaluate requires --layout <csv>\n\n";
      print_usage(std::cerr);
      return kExitErrorInt;
    }
    return run_layout(a, load_layout_csv(a.layout_path, a.wall_mounted), log);
  }
  if (a.command == "demo") {
    return run_layout(a, demo_layout(a.wall_mounted), log);
  }
  if (a.command == "curves") {
    return cmd_curves(a, log);
  }
  if (a.command == "help" || a.command == "--help" || a.command == "-h") {
    print_usage(std::cout);
    return static_cast<int>(ExitCode::kCompliant);
  }

  std::cerr << "Unknown command: " << a.command << "\n\n";
  print_usage(std::cerr);
  return kExitErrorInt;
}

} // namespace
} // namespace panelheat

int main(int argc, char** argv) {
  using namespace panelheat;

  Args a{};
  std::string arg_err;
  if (!parse_args(argc, argv, &a, &arg_err)) {
    std::cerr << "Argument error: " << arg_err << "\n\n";
    print_usage(std::cerr);
    return kExitErrorInt;
  }

  StreamLogSink log(std::cerr, std::cerr, a.verbose ? LogLevel::DEBUG : LogLevel::WARN);

  try {
    return dispatch(a, log);
  } catch (const PanelHeatError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitErrorInt;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitErrorInt;
  }
}
