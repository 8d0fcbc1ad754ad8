/*
  Fragment 5.3 - Exports Selftest

  Checks:
    - CSV text helpers (quoting, trimming, strict numeric parse)
    - layout CSV import: header mapping, optional columns, error codes
    - compliance report CSV: fixed header, one aligned row per section,
      empty cells for unset values

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "engine/core/csv_text.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/curves/curve_family_interpolator.hpp"
#include "engine/exports/layout_csv.hpp"
#include "engine/exports/result_report_csv.hpp"
#include "engine/thermal/thermal_engine.hpp"

namespace panelheat {
namespace {

using namespace panelheat::selftest;
namespace fs = std::filesystem;

const char* kLayout =
    "name,x_m,y_m,width_m,height_m,depth_m,Power_W,max_temp_C,ventilated,inlet_area_cm2,"
    "louvre_cols,louvre_rows,partitions\n"
    "# front row\n"
    "\n"
    "Incomer,0,0,0.6,1.2,0.4,220,70,0,,,,\n"
    "\"Feeders, east\",0.6,0,0.8,1.2,0.4,280,55,yes,150,2,2,1\n";

std::size_t index_of(const std::vector<std::string>& cols, const std::string& name) {
  for (std::size_t i = 0; i < cols.size(); ++i) {
    if (cols[i] == name) return i;
  }
  return cols.size();
}

void test_csv_text() {
  const auto f = csv::split_row("a,\"b,c\",\"say \"\"hi\"\"\",");
  expect_true(f.size() == 4 && f[1] == "b,c" && f[2] == "say \"hi\"" && f[3].empty(),
              "CSV: quote-aware split");
  expect_true(csv::trim("  x \t") == "x", "CSV: trim");

  double d = 0.0;
  expect_true(csv::try_parse_double(" 2.5 ", d) && d == 2.5, "CSV: double with spaces");
  expect_true(!csv::try_parse_double("2.5abc", d), "CSV: trailing junk rejected");
  expect_true(!csv::try_parse_double("nan", d), "CSV: non-finite rejected");

  int i = 0;
  expect_true(csv::try_parse_int("3", i) && i == 3 && !csv::try_parse_int("3.5", i), "CSV: integer parse");

  bool b = false;
  expect_true(csv::try_parse_bool("Yes", b) && b, "CSV: bool yes");
  expect_true(csv::try_parse_bool("0", b) && !b, "CSV: bool 0");
  expect_true(!csv::try_parse_bool("maybe", b), "CSV: bool rejects junk");

  expect_true(csv::escape("a,b") == "\"a,b\"" && csv::escape("plain") == "plain", "CSV: escape");
  expect_true(csv::format_double(1.23456, 3) == "1.235", "CSV: fixed precision");
  expect_true(csv::format_double(std::nan("")).empty(), "CSV: NaN exports empty");
}

void test_parse_layout() {
  std::istringstream in(kLayout);
  const Layout layout = parse_layout_csv(in, "inline.csv", true);

  expect_true(layout.sections.size() == 2 && layout.wall_mounted, "Layout: two sections, wall flag kept");

  const EnclosureSection& a = layout.sections[0];
  expect_true(a.name == "Incomer" && a.rect.width == 0.6 && a.depth_m == 0.4, "Layout: geometry columns");
  expect_true(a.total_power_W() == 220.0 && a.max_temp_C == 70.0, "Layout: power and limit");
  expect_true(!a.ventilation.enabled && !a.ventilation.grid, "Layout: empty optional cells use defaults");
  expect_true(a.horizontal_partitions == 0 && a.ventilation.installed, "Layout: default partitions/installed");

  const EnclosureSection& b = layout.sections[1];
  expect_true(b.name == "Feeders, east", "Layout: quoted name");
  expect_true(b.ventilation.enabled && b.ventilation.inlet_area_cm2 == 150.0, "Layout: ventilation columns");
  expect_true(b.ventilation.grid && b.ventilation.grid->cols == 2 && b.ventilation.grid->rows == 2,
              "Layout: louvre grid");
  expect_true(b.horizontal_partitions == 1 && b.max_temp_C == 55.0, "Layout: partitions and limit");
}

void test_layout_errors() {
  expect_throws([] {
    std::istringstream in("name,x_m,y_m,width_m,height_m,power_W\nA,0,0,1,1,10\n");
    parse_layout_csv(in, "nodepth.csv");
  }, ErrorCode::ParseError, "Layout: missing required column");

  expect_throws([] {
    std::istringstream in("name,x_m,y_m,width_m,height_m,depth_m,power_W\nA,0,0,wide,1,0.4,10\n");
    parse_layout_csv(in, "bad.csv");
  }, ErrorCode::ParseError, "Layout: non-numeric cell");

  bool has_line = false;
  try {
    std::istringstream in("name,x_m,y_m,width_m,height_m,depth_m,power_W\n\nA,0,0,x,1,0.4,10\n");
    parse_layout_csv(in, "bad.csv");
  } catch (const PanelHeatError& e) {
    has_line = e.message().find("bad.csv:3") != std::string::npos;
  }
  expect_true(has_line, "Layout: parse error names source and line");

  expect_throws([] {
    std::istringstream in("name,x_m,y_m,width_m,height_m,depth_m,power_W,louvre_cols\nA,0,0,1,1,0.4,10,2\n");
    parse_layout_csv(in, "louvre.csv");
  }, ErrorCode::ParseError, "Layout: louvre cols without rows");

  expect_throws([] {
    std::istringstream in("# only a comment\n");
    parse_layout_csv(in, "empty.csv");
  }, ErrorCode::ParseError, "Layout: empty file");

  expect_throws([] {
    std::istringstream in("name,x_m,y_m,width_m,height_m,depth_m,power_W\nA,0,0,-1,1,0.4,10\n");
    parse_layout_csv(in, "neg.csv");
  }, ErrorCode::InvalidGeometry, "Layout: parsed layout is validated");

  expect_throws([] { load_layout_csv("/nonexistent/panelheat/layout.csv"); }, ErrorCode::IOError,
                "Layout: missing file");
}

void test_result_csv() {
  std::istringstream in(kLayout);
  const Layout layout = parse_layout_csv(in, "inline.csv");

  const thermal::ThermalEngine engine(curves::CurveFamilyInterpolator::builtin());
  auto results = engine.evaluate_all(layout, ProjectSettings::defaults());

  ProjectSettings hot;
  hot.environment.ambient_C = 72.0;
  results.push_back(engine.evaluate(layout, 0, hot));

  std::ostringstream out;
  write_result_csv(out, results);

  std::istringstream lines(out.str());
  std::string header_line;
  std::getline(lines, header_line);
  expect_true(header_line == result_csv_header(), "Report: header first");

  const auto header = csv::split_row(header_line);
  std::vector<std::vector<std::string>> rows;
  std::string line;
  while (std::getline(lines, line)) rows.push_back(csv::split_row(line));

  expect_true(rows.size() == 3, "Report: one row per result");
  bool aligned = true;
  for (const auto& r : rows) aligned = aligned && (r.size() == header.size());
  expect_true(aligned, "Report: every row has every column");

  const std::size_t name_col = index_of(header, "section");
  const std::size_t stage_col = index_of(header, "stage");
  const std::size_t air_col = index_of(header, "airflow_m3h");
  const std::size_t inf_col = index_of(header, "infeasibility");
  const std::size_t fig_col = index_of(header, "figures_used");
  const std::size_t hash_col = index_of(header, "input_hash");
  const std::size_t g_col = index_of(header, "g");

  expect_true(rows[1][name_col] == "Feeders, east", "Report: quoted name round-trips");
  expect_true(rows[0][fig_col] == "Fig. 1|Fig. 3|Fig. 4", "Report: figures '|' separated");
  expect_true(rows[0][g_col].empty(), "Report: unset g exported empty");
  expect_true(rows[0][hash_col] == hash_to_hex(results[0].input_hash), "Report: fingerprint column");

  const std::size_t inst_col = index_of(header, "ventilation_installed");
  const std::size_t whatif_col = index_of(header, "whatif_inlet_area_cm2");
  expect_true(rows[1][inst_col] == "1", "Report: fitted opening flagged installed");
  expect_true(rows[0][whatif_col].empty() == !results[0].whatif_inlet_area_cm2.has_value(),
              "Report: what-if area only when tried");

  Layout trial = layout;
  trial.sections[1].ventilation.installed = false;
  const std::string trial_row = result_csv_row(engine.evaluate(trial, 1, ProjectSettings::defaults()));
  expect_true(csv::split_row(trial_row)[inst_col] == "0", "Report: what-if opening flagged not installed");

  expect_true(rows[2][stage_col] == "infeasible_ambient", "Report: stage name");
  expect_true(rows[2][air_col].empty(), "Report: unsized airflow exported empty");
  expect_true(rows[2][inf_col] == "ambient_at_or_above_limit", "Report: infeasibility cause");

  const fs::path path = fs::temp_directory_path() / "panelheat_exports_selftest.csv";
  expect_true(write_result_csv_file(path.string(), results), "Report: file written");
  std::ifstream f(path);
  std::stringstream disk;
  disk << f.rdbuf();
  expect_true(disk.str() == out.str(), "Report: file matches stream output");
  f.close();
  fs::remove(path);

  expect_true(!write_result_csv_file("/nonexistent/panelheat/out.csv", results), "Report: unwritable path");
}

}  // namespace
}  // namespace panelheat

int main() {
  using namespace panelheat;

  test_csv_text();
  test_parse_layout();
  test_layout_errors();
  test_result_csv();

  return selftest::finish("exports_selftest");
}
