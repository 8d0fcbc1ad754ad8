/*
  Fragment 4.8 - End-to-end Scenario Selftest

  Drives ThermalEngine the way a host does: layout snapshot + index +
  project settings in, ThermalResult out.

    A) free-standing sealed large section, compliant
    B) two touching sections: curve 2, covered sides, lower c
    C) small sealed section: g-based c, 0.75-height point, active cooling
    D) ambient above the limit: infeasible, no rises, no airflow
    + determinism and input fingerprint behaviour

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <cstddef>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/curves/curve_family_interpolator.hpp"
#include "engine/enclosure/section.hpp"
#include "engine/thermal/thermal_engine.hpp"

namespace panelheat {
namespace {

using namespace panelheat::selftest;
using namespace panelheat::thermal;

EnclosureSection section(const std::string& name, double x, double w, double h, double d,
                         double power_W, double max_C = 70.0) {
  EnclosureSection s;
  s.name = name;
  s.rect = Rect{x, 0.0, w, h};
  s.depth_m = d;
  s.extra_power_W = power_W;
  s.max_temp_C = max_C;
  return s;
}

bool same_bits(double a, double b) {
  return std::memcmp(&a, &b, sizeof(double)) == 0;
}

bool identical(const ThermalResult& a, const ThermalResult& b) {
  return a.input_hash == b.input_hash && a.stage == b.stage && a.branch == b.branch
         && same_bits(a.k, b.k) && same_bits(a.c, b.c) && same_bits(a.d, b.d)
         && same_bits(a.geometry.Ae_m2, b.geometry.Ae_m2)
         && same_bits(a.dt_mid_K, b.dt_mid_K) && same_bits(a.dt_top_K, b.dt_top_K)
         && same_bits(a.T_top_C, b.T_top_C)
         && same_bits(a.passive_capacity_W, b.passive_capacity_W)
         && same_bits(a.active_cooling_W, b.active_cooling_W)
         && a.airflow_m3h.has_value() == b.airflow_m3h.has_value()
         && (!a.airflow_m3h || same_bits(*a.airflow_m3h, *b.airflow_m3h))
         && a.hypothetical_T_top_C.has_value() == b.hypothetical_T_top_C.has_value()
         && a.figures_used == b.figures_used;
}

void scenario_a(const ThermalEngine& engine) {
  Layout layout;
  layout.sections.push_back(section("A", 0.0, 0.6, 1.2, 0.4, 200.0));

  const ThermalResult r = engine.evaluate(layout, 0, ProjectSettings::defaults());

  expect_near(r.geometry.Ae_m2, 2.496, "Scenario A: Ae");
  expect_true(r.geometry.Ae_m2 > 1.25 && r.geometry.curve_number == 1, "Scenario A: large, curve 1");
  expect_true(r.branch == ThermalBranch::SealedLarge, "Scenario A: sealed large branch");
  expect_true(r.k == engine.curves().k_unventilated_large(r.geometry.Ae_m2).value,
              "Scenario A: k from Fig. 3");
  expect_true(r.c == engine.curves().c_unventilated_large(1, r.geometry.f).value,
              "Scenario A: c from Fig. 4 curve 1");
  expect_true(r.dt_mid_K > 0.0 && r.dt_top_K > r.dt_mid_K, "Scenario A: positive rises, top above mid");
  expect_near(r.dt_mid_K, 18.57, "Scenario A: dt_mid", 5e-3);
  expect_near(r.T_top_C, 35.0 + r.dt_top_K, "Scenario A: T_top = ambient + rise");
  expect_true(r.stage == ComplianceStage::BaseCompliant && r.compliant(), "Scenario A: compliant");
  expect_true(r.section_index == 0 && r.section_name == "A", "Scenario A: identity");
  expect_true(r.surfaces.size() == 5, "Scenario A: surface breakdown attached");
}

void scenario_b(const ThermalEngine& engine) {
  Layout single;
  single.sections.push_back(section("A", 0.0, 0.6, 1.2, 0.4, 200.0));
  Layout pair;
  pair.sections.push_back(section("L", 0.0, 0.6, 1.2, 0.4, 200.0));
  pair.sections.push_back(section("R", 0.6, 0.6, 1.2, 0.4, 200.0));

  const ProjectSettings st = ProjectSettings::defaults();
  const ThermalResult a = engine.evaluate(single, 0, st);
  const auto both = engine.evaluate_all(pair, st);

  expect_true(both.size() == 2, "Scenario B: every section evaluated");
  const ThermalResult& l = both[0];
  expect_true(l.geometry.curve_number == 2 && both[1].geometry.curve_number == 2,
              "Scenario B: touching pair uses curve 2");
  expect_true(l.geometry.b.right == 0.5 && both[1].geometry.b.left == 0.5,
              "Scenario B: covered side b drops to 0.5");
  expect_near(l.geometry.Ae_m2, 2.304, "Scenario B: Ae");
  expect_near(l.c, engine.curves().c_unventilated_large(1, l.geometry.f).value - 0.035,
              "Scenario B: c lowered by the curve-2 offset");
  expect_true(l.c < a.c, "Scenario B: c below free-standing");
  expect_true(l.k > a.k, "Scenario B: smaller Ae raises k");
  expect_true(both[1].section_index == 1, "Scenario B: index carried");

  Layout wall = pair;
  wall.wall_mounted = true;
  expect_true(engine.evaluate(wall, 0, st).geometry.curve_number == 4,
              "Scenario B: wall-mounted pair uses curve 4");
}

void scenario_c(const ThermalEngine& engine) {
  Layout layout;
  layout.sections.push_back(section("C", 0.0, 0.4, 0.5, 0.25, 50.0, 55.0));

  ProjectSettings st;
  st.environment.ambient_C = 40.0;

  const ThermalResult r = engine.evaluate(layout, 0, st);

  expect_true(r.geometry.is_small() && r.branch == ThermalBranch::SealedSmall, "Scenario C: small branch");
  expect_true(r.g.has_value() && !r.f.has_value(), "Scenario C: g-based c");
  expect_near(*r.g, 1.25, "Scenario C: g = h / w");
  expect_true(r.dt_075_K.has_value() && r.T_075_C.has_value(), "Scenario C: 0.75-height value reported");
  expect_true(*r.dt_075_K != r.dt_mid_K && *r.dt_075_K != r.c * r.dt_mid_K,
              "Scenario C: 0.75 value distinct from mid and c * mid");
  expect_near(*r.dt_075_K, 16.74, "Scenario C: dt at 0.75 height", 2e-3);
  expect_near(r.T_top_C, 40.0 + *r.dt_075_K, "Scenario C: top temperature at 0.75 point");
  expect_true(r.T_top_C > 55.0, "Scenario C: exceeds 55 C limit");

  expect_true(r.stage == ComplianceStage::ActiveCooling, "Scenario C: active cooling required");
  expect_true(r.passive_capacity_W > 35.0 && r.passive_capacity_W < 40.0, "Scenario C: passive near 37.6 W");
  expect_near(r.active_cooling_W, 50.0 - r.passive_capacity_W, "Scenario C: residual load");
  expect_true(r.airflow_m3h.has_value() && *r.airflow_m3h > 0.0, "Scenario C: airflow sized");
  expect_true(!r.hypothetical_T_top_C.has_value() && !r.ventilation_recommended,
              "Scenario C: no ventilation what-if for small enclosures");
}

void scenario_d(const ThermalEngine& engine) {
  ProjectSettings st;
  st.environment.ambient_C = 72.0;

  for (double p : {0.0, 200.0, 5000.0}) {
    Layout layout;
    layout.sections.push_back(section("D", 0.0, 0.6, 1.2, 0.4, p));
    const ThermalResult r = engine.evaluate(layout, 0, st);

    const std::string tag = "Scenario D (" + std::to_string(static_cast<int>(p)) + " W): ";
    expect_true(r.stage == ComplianceStage::InfeasibleAmbient, tag + "infeasible");
    expect_true(r.dt_mid_K == 0.0 && r.dt_top_K == 0.0, tag + "zero rises");
    expect_true(!r.airflow_m3h.has_value(), tag + "airflow not sized");
    expect_true(r.infeasibility.size() == 1
                && r.infeasibility[0] == InfeasibilityCause::AmbientAtOrAboveLimit,
                tag + "ambient cause");
    expect_true(!r.compliant(), tag + "not compliant");
  }
}

void test_determinism(const ThermalEngine& engine) {
  Layout layout;
  layout.sections.push_back(section("L", 0.0, 0.6, 1.2, 0.4, 400.0));
  layout.sections.push_back(section("R", 0.6, 0.8, 1.2, 0.4, 250.0));
  const ProjectSettings st = ProjectSettings::defaults();

  const ThermalResult r1 = engine.evaluate(layout, 0, st);
  const ThermalResult r2 = engine.evaluate(layout, 0, st);
  expect_true(identical(r1, r2), "Determinism: repeated evaluation is bit-identical");

  const ThermalEngine other(curves::CurveFamilyInterpolator::builtin());
  expect_true(identical(r1, other.evaluate(layout, 0, st)), "Determinism: fresh engine, same result");

  Layout hotter_sibling = layout;
  hotter_sibling.sections[1].extra_power_W = 900.0;
  expect_true(engine.evaluate(hotter_sibling, 0, st).input_hash == r1.input_hash,
              "Hash: sibling load does not affect this section");

  Layout moved = layout;
  moved.sections[1].rect.x = 0.7;
  const ThermalResult rm = engine.evaluate(moved, 0, st);
  expect_true(rm.input_hash != r1.input_hash, "Hash: sibling position is an input");
  expect_true(rm.geometry.curve_number == 1, "Hash: moved sibling no longer touching");

  ProjectSettings warmer = st;
  warmer.environment.ambient_C = 36.0;
  expect_true(engine.evaluate(layout, 0, warmer).input_hash != r1.input_hash, "Hash: ambient is an input");

  expect_true(engine.evaluate(layout, 1, st).input_hash != r1.input_hash, "Hash: index is an input");
  expect_true(hash_section_inputs(layout, 0, st, "builtin") == r1.input_hash,
              "Hash: reproducible from inputs");
  expect_true(hash_section_inputs(layout, 0, st, "custom") != r1.input_hash,
              "Hash: curve source is an input");
}

void test_engine_validation(const ThermalEngine& engine) {
  Layout layout;
  layout.sections.push_back(section("A", 0.0, 0.6, 1.2, 0.4, 200.0));

  expect_throws([&] { (void)engine.evaluate(layout, 3, ProjectSettings{}); }, ErrorCode::InvalidInput,
                "Engine: index out of range");

  Layout bad = layout;
  bad.sections[0].rect.height = 0.0;
  expect_throws([&] { (void)engine.evaluate(bad, 0, ProjectSettings{}); }, ErrorCode::InvalidGeometry,
                "Engine: invalid section rejected");

  ProjectSettings st;
  st.environment.altitude_m = 9000.0;
  expect_throws([&] { (void)engine.evaluate(layout, 0, st); }, ErrorCode::InvalidEnvironment,
                "Engine: invalid settings rejected");

  expect_true(engine.evaluate_all(Layout{}, ProjectSettings{}).empty(), "Engine: empty layout");
}

}  // namespace
}  // namespace panelheat

int main() {
  using namespace panelheat;

  MemorySink sink;
  const thermal::ThermalEngine engine(curves::CurveFamilyInterpolator::builtin(sink), sink);

  scenario_a(engine);
  scenario_b(engine);
  scenario_c(engine);
  scenario_d(engine);
  test_determinism(engine);
  test_engine_validation(engine);

  selftest::expect_true(sink.contains("[INFO] stage: 'C' needs active cooling"),
                        "Engine: stage decisions logged through the injected sink");

  return selftest::finish("scenario_selftest");
}
