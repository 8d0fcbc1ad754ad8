/*
  Fragment 3.4 - Enclosure Geometry Selftest

  Checks:
    - Table III b factors from adjacency (sides, roof, wall-mounted rear)
    - Ae, f, g for a free-standing section
    - touch tolerance, corner contact, sibling-order independence
    - Fig. 4 curve-number assignment
    - louvre count / IP derating / inlet resolution
    - largest louvre grid a section face takes
    - section + settings validation error codes

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/enclosure/geometry_resolver.hpp"
#include "engine/enclosure/louvre.hpp"
#include "engine/enclosure/section.hpp"

namespace panelheat {
namespace {

using namespace panelheat::selftest;

EnclosureSection make_section(const std::string& name, double x, double y,
                              double w = 0.6, double h = 1.2, double d = 0.4) {
  EnclosureSection s;
  s.name = name;
  s.rect = Rect{x, y, w, h};
  s.depth_m = d;
  s.extra_power_W = 200.0;
  return s;
}

void test_free_standing() {
  Layout layout;
  layout.sections.push_back(make_section("A", 0.0, 0.0));

  MemorySink sink;
  const SectionGeometry g = resolve_geometry(layout, 0, sink);

  expect_true(!g.touching.left && !g.touching.right && !g.touching.top && !g.touching.bottom,
              "Geometry: lone section touches nothing");
  expect_true(g.b.top == 1.4 && g.b.bottom == 0.0 && g.b.left == 0.9 && g.b.right == 0.9
              && g.b.front == 0.9 && g.b.rear == 0.9,
              "Geometry: exposed Table III factors");
  expect_near(g.Ae_m2, 2.496, "Geometry: Ae = sum(b * A0)");
  expect_near(g.f, std::pow(1.2, 1.35) / 0.24, "Geometry: f = h^1.35 / (w*d)");
  expect_near(g.g, 2.0, "Geometry: g = h / w");
  expect_true(g.curve_number == 1, "Geometry: free-standing is curve 1");
  expect_true(!g.is_small(), "Geometry: Ae > 1.25 is large");
  expect_true(sink.contains("[DEBUG] geometry: 'A'"), "Geometry: b factors logged at DEBUG");

  const auto rows = surface_breakdown(g);
  double sum = 0.0;
  for (const auto& r : rows) sum += r.effective_area_m2;
  expect_true(rows.size() == 5 && rows[0].name == "Roof" && rows[4].name == "Right",
              "Geometry: breakdown has Roof/Front/Rear/Left/Right");
  expect_near(sum, g.Ae_m2, "Geometry: breakdown sums to Ae");
  expect_near(rows[0].area_m2, 0.24, "Geometry: roof A0 = w*d");
}

void test_wall_mounted() {
  Layout layout;
  layout.wall_mounted = true;
  layout.sections.push_back(make_section("A", 0.0, 0.0));

  const SectionGeometry g = resolve_geometry(layout, 0);
  expect_true(g.b.rear == 0.5, "Geometry: wall-mounted rear b = 0.5");
  expect_near(g.Ae_m2, 2.496 - 0.4 * 0.72, "Geometry: wall-mounted Ae");
  expect_true(g.curve_number == 3, "Geometry: wall-mounted free-standing is curve 3");
}

void test_side_by_side() {
  Layout layout;
  layout.sections.push_back(make_section("L", 0.0, 0.0));
  layout.sections.push_back(make_section("R", 0.6, 0.0));

  const SectionGeometry gl = resolve_geometry(layout, 0);
  const SectionGeometry gr = resolve_geometry(layout, 1);

  expect_true(gl.touching.right && !gl.touching.left, "Adjacency: left section touches on the right");
  expect_true(gr.touching.left && !gr.touching.right, "Adjacency: right section touches on the left");
  expect_true(gl.b.right == 0.5 && gl.b.left == 0.9, "Adjacency: covered side b = 0.5");
  expect_near(gl.Ae_m2, 2.304, "Adjacency: Ae drops by 0.4 * h * d");
  expect_true(gl.curve_number == 2 && gr.curve_number == 2, "Adjacency: one side covered is curve 2");

  layout.wall_mounted = true;
  expect_true(resolve_geometry(layout, 0).curve_number == 4, "Adjacency: one side + wall is curve 4");

  // Same relationship regardless of sibling order.
  Layout swapped;
  swapped.sections.push_back(layout.sections[1]);
  swapped.sections.push_back(layout.sections[0]);
  swapped.wall_mounted = true;
  const SectionGeometry a = resolve_geometry(layout, 0);
  const SectionGeometry b = resolve_geometry(swapped, 1);
  expect_true(a.Ae_m2 == b.Ae_m2 && a.curve_number == b.curve_number
              && a.touching.right == b.touching.right,
              "Adjacency: independent of sibling order");
}

void test_touch_tolerance() {
  Layout near_gap;
  near_gap.sections.push_back(make_section("L", 0.0, 0.0));
  near_gap.sections.push_back(make_section("R", 0.6005, 0.0));
  expect_true(resolve_touching(near_gap, 0).right, "Adjacency: 0.5 mm gap still touching");

  Layout wide_gap;
  wide_gap.sections.push_back(make_section("L", 0.0, 0.0));
  wide_gap.sections.push_back(make_section("R", 0.61, 0.0));
  expect_true(!resolve_touching(wide_gap, 0).right, "Adjacency: 10 mm gap not touching");

  Layout corner;
  corner.sections.push_back(make_section("A", 0.0, 0.0));
  corner.sections.push_back(make_section("B", 0.6, 1.2));
  const TouchState t = resolve_touching(corner, 0);
  expect_true(!t.right && !t.bottom, "Adjacency: corner-only contact is not touching");

  expect_throws([&] { resolve_touching(corner, 5); }, ErrorCode::InvalidInput,
                "Adjacency: index out of range");
  expect_throws([&] { resolve_geometry(corner, 2); }, ErrorCode::InvalidInput,
                "Geometry: index out of range");
}

void test_stacked() {
  Layout layout;
  layout.sections.push_back(make_section("Upper", 0.0, 0.0));
  layout.sections.push_back(make_section("Lower", 0.0, 1.2));

  const SectionGeometry lower = resolve_geometry(layout, 1);
  const SectionGeometry upper = resolve_geometry(layout, 0);

  expect_true(lower.touching.top && !lower.touching.bottom, "Stacked: lower section covered on top");
  expect_true(upper.touching.bottom && !upper.touching.top, "Stacked: upper section covered below");
  expect_true(lower.b.top == 0.7 && upper.b.top == 1.4, "Stacked: covered roof b = 0.7");
  expect_near(lower.Ae_m2, 2.496 - 0.7 * 0.24, "Stacked: lower Ae");
  expect_near(upper.Ae_m2, 2.496, "Stacked: floor contact leaves Ae unchanged");
}

void test_curve_numbers() {
  const auto cn = [](bool l, bool r, bool top, bool wall) {
    TouchState t;
    t.left = l;
    t.right = r;
    t.top = top;
    return curve_number_for(t, wall);
  };

  expect_true(cn(false, false, false, false) == 1, "Curve no.: free-standing");
  expect_true(cn(true, false, false, false) == 2, "Curve no.: one side");
  expect_true(cn(true, true, false, false) == 3, "Curve no.: both sides");
  expect_true(cn(false, false, true, false) == 3, "Curve no.: roof covered");
  expect_true(cn(true, true, true, false) == 3, "Curve no.: both sides + roof");
  expect_true(cn(false, false, false, true) == 3, "Curve no.: wall-mounted free-standing");
  expect_true(cn(false, true, false, true) == 4, "Curve no.: wall + one side");
  expect_true(cn(true, true, false, true) == 5, "Curve no.: wall + both sides");
  expect_true(cn(true, true, true, true) == 4, "Curve no.: wall + both sides + roof");

  Layout row;
  row.sections.push_back(make_section("A", 0.0, 0.0));
  row.sections.push_back(make_section("B", 0.6, 0.0));
  row.sections.push_back(make_section("C", 1.2, 0.0));
  const std::vector<int> all = assign_curve_numbers(row);
  expect_true(all == std::vector<int>({2, 3, 2}), "Curve no.: three in a row");
}

void test_louvres() {
  expect_true(louvre_count(LouvreGrid{2, 2}) == 10, "Louvre: cols * (2*rows + 1)");
  expect_true(louvre_count(LouvreGrid{1, 1}) == 3, "Louvre: 1x1 grid is three louvres");

  expect_true(ip_permits_openings(4) && !ip_permits_openings(5), "IP: openings allowed up to IP4X");
  expect_true(ip_open_area_factor(3) == 0.65 && ip_open_area_factor(6) == 0.0, "IP: mesh derating");

  const LouvreDefinition louvre;
  expect_near(effective_inlet_area_cm2(LouvreGrid{2, 2}, louvre, 2), 400.0, "Louvre: IP2X full area");
  expect_near(effective_inlet_area_cm2(LouvreGrid{2, 2}, louvre, 3), 260.0, "Louvre: IP3X derated");
  expect_true(effective_inlet_area_cm2(LouvreGrid{2, 2}, louvre, 5) == 0.0, "Louvre: IP5X no openings");

  VentilationSettings vs;
  Ventilation v;
  v.inlet_area_cm2 = 150.0;
  expect_true(resolve_inlet_area_cm2(v, vs) == 0.0, "Inlet: disabled ventilation has no inlet");
  v.enabled = true;
  expect_true(resolve_inlet_area_cm2(v, vs) == 150.0, "Inlet: explicit area");
  v.grid = LouvreGrid{1, 2};
  expect_near(resolve_inlet_area_cm2(v, vs), 200.0, "Inlet: grid overrides explicit area");
}

void test_max_louvre_grid() {
  const LouvreDefinition louvre;  // 200 x 50 mm cut-outs, 50 mm margin, 25 mm gap

  const LouvreGrid g = max_louvre_grid(0.6, 1.2, louvre);
  expect_true(g.cols == 2, "Louvre max: two columns across 600 mm");
  expect_true(g.rows == 7, "Louvre max: 15 rows high gives 7 bottom + 8 top");
  expect_near(max_effective_inlet_area_cm2(0.6, 1.2, louvre, 2), 30.0 * 40.0, "Louvre max: IP2X area");
  expect_near(max_effective_inlet_area_cm2(0.6, 1.2, louvre, 3), 30.0 * 40.0 * 0.65, "Louvre max: IP3X area");
  expect_true(max_effective_inlet_area_cm2(0.6, 1.2, louvre, 5) == 0.0, "Louvre max: IP5X no openings");

  expect_true(max_louvre_grid(0.525, 1.2, louvre).cols == 2, "Louvre max: exact fit counts");
  expect_true(max_louvre_grid(0.8, 1.2, louvre).cols == 3, "Louvre max: wider face, more columns");

  const LouvreGrid tiny = max_louvre_grid(0.2, 0.2, louvre);
  expect_true(tiny.cols == 1 && tiny.rows == 1, "Louvre max: never below 1 x 1");

  LouvreDefinition bad;
  bad.width_mm = 0.0;
  expect_throws([&] { bad.validate_or_throw(); }, ErrorCode::InvalidConfig, "Louvre max: zero cut-out width");
  bad = LouvreDefinition{};
  bad.spacing_mm = -1.0;
  expect_throws([&] { bad.validate_or_throw(); }, ErrorCode::InvalidConfig, "Louvre max: negative spacing");
}

void test_section_accessors() {
  EnclosureSection s = make_section("S", 0.0, 0.0);
  s.extra_power_W = 40.0;
  s.sources.push_back(HeatSource{"MCCB", 35.0, 4, 70.0});
  s.sources.push_back(HeatSource{"Relay", 2.0, 5, 55.0});
  s.sources.push_back(HeatSource{"Terminal", 1.0, 10, std::nullopt});
  s.max_temp_C = 60.0;

  expect_near(s.total_power_W(), 40.0 + 140.0 + 10.0 + 10.0, "Section: total power sums sources");
  expect_true(s.effective_max_temp_C() == 60.0, "Section: manual limit when rating not requested");
  s.use_component_rating = true;
  expect_true(s.effective_max_temp_C() == 55.0, "Section: lowest component rating");

  EnclosureSection unrated = make_section("U", 0.0, 0.0);
  unrated.use_component_rating = true;
  unrated.max_temp_C = 65.0;
  expect_true(unrated.effective_max_temp_C() == 65.0, "Section: no ratings falls back to manual");
}

void test_validation() {
  EnclosureSection s = make_section("Bad", 0.0, 0.0);
  s.rect.width = 0.0;
  expect_throws([&] { s.validate_or_throw(); }, ErrorCode::InvalidGeometry, "Validate: zero width");

  s = make_section("Bad", 0.0, 0.0);
  s.depth_m = -0.1;
  expect_throws([&] { s.validate_or_throw(); }, ErrorCode::InvalidGeometry, "Validate: negative depth");

  s = make_section("Bad", 0.0, 0.0);
  s.extra_power_W = -5.0;
  expect_throws([&] { s.validate_or_throw(); }, ErrorCode::InvalidInput, "Validate: negative power");

  s = make_section("Bad", 0.0, 0.0);
  s.ventilation.grid = LouvreGrid{0, 1};
  expect_throws([&] { s.validate_or_throw(); }, ErrorCode::InvalidInput, "Validate: empty louvre grid");

  ProjectSettings st;
  st.ventilation.ip_first_digit = 7;
  expect_throws([&] { st.validate_or_throw(); }, ErrorCode::InvalidConfig, "Validate: IP digit > 6");

  st = ProjectSettings::defaults();
  st.environment.ambient_C = std::nan("");
  expect_throws([&] { st.validate_or_throw(); }, ErrorCode::InvalidEnvironment, "Validate: NaN ambient");

  st = ProjectSettings::defaults();
  st.air.airflow_margin = 0.5;
  expect_throws([&] { st.validate_or_throw(); }, ErrorCode::InvalidConfig, "Validate: margin below 1");

  bool ok = true;
  try {
    ProjectSettings::defaults().validate_or_throw();
    make_section("Good", 0.0, 0.0).validate_or_throw();
  } catch (const PanelHeatError& e) {
    std::cerr << e.what() << "\n";
    ok = false;
  }
  expect_true(ok, "Validate: defaults accepted");
}

}  // namespace
}  // namespace panelheat

int main() {
  using namespace panelheat;

  test_free_standing();
  test_wall_mounted();
  test_side_by_side();
  test_touch_tolerance();
  test_stacked();
  test_curve_numbers();
  test_louvres();
  test_max_louvre_grid();
  test_section_accessors();
  test_validation();

  return selftest::finish("geometry_selftest");
}
