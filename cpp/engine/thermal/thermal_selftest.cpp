/*
  Fragment 4.7 - Thermal Selftest

  Checks:
    1) Airflow sizing: P = Cv * Q * dT, altitude derating, ill-posed inputs.
    2) Forward model: branch selection, exponents, partition factor d,
       0.75-height point on the small branch, zero power.
    3) Stager: each terminal stage, the ventilation what-if (capped by the
       largest louvre grid the face takes), the passive /
       active split, airflow margin, altitude derating of the passive
       capacity, airflow monotone in load.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/curves/curve_family_interpolator.hpp"
#include "engine/enclosure/geometry_resolver.hpp"
#include "engine/enclosure/section.hpp"
#include "engine/thermal/airflow_sizer.hpp"
#include "engine/thermal/compliance_stager.hpp"
#include "engine/thermal/iec60890.hpp"
#include "engine/thermal/thermal_solver.hpp"

namespace panelheat {
namespace {

using namespace panelheat::selftest;
using namespace panelheat::thermal;

std::shared_ptr<const curves::CurveFamilyInterpolator> builtin_curves() {
  static const auto c = curves::CurveFamilyInterpolator::builtin();
  return c;
}

Layout single(double w, double h, double d, double power_W, double max_C = 70.0) {
  EnclosureSection s;
  s.name = "S";
  s.rect = Rect{0.0, 0.0, w, h};
  s.depth_m = d;
  s.extra_power_W = power_W;
  s.max_temp_C = max_C;
  Layout layout;
  layout.sections.push_back(s);
  return layout;
}

ThermalResult stage(const Layout& layout, const ProjectSettings& st, LogSink& log = null_log_sink()) {
  const ThermalSolver solver(builtin_curves(), log);
  const ComplianceStager stager(solver, log);
  return stager.run(layout.sections[0], resolve_geometry(layout, 0), st);
}

// ---------------------------------------------------------------------------
// Airflow
// ---------------------------------------------------------------------------
void test_airflow() {
  expect_near(required_flow_m3h(1160.0, 10.0, 1160.0), 360.0, "Airflow: 1160 W at 10 K is 360 m3/h");

  const double q1 = required_flow_m3h(250.0, 15.0, 1160.0);
  const double q2 = required_flow_m3h(500.0, 15.0, 1160.0);
  expect_near(q2, 2.0 * q1, "Airflow: linear in power");
  expect_true(required_flow_m3h(500.0, 30.0, 1160.0) < q2, "Airflow: larger rise needs less air");

  expect_true(required_flow_m3h(0.0, 10.0, 1160.0) == 0.0, "Airflow: zero power needs no air");
  expect_true(required_flow_m3h(100.0, 0.0, 1160.0) == 0.0, "Airflow: zero rise gives 0");
  expect_true(!try_required_flow_m3h(100.0, 0.0, 1160.0).has_value(), "Airflow: zero rise is unsized");
  expect_true(!try_required_flow_m3h(100.0, -5.0, 1160.0).has_value(), "Airflow: negative rise is unsized");
  expect_true(!try_required_flow_m3h(100.0, 10.0, 0.0).has_value(), "Airflow: zero Cv is unsized");
  const auto zero = try_required_flow_m3h(0.0, 10.0, 1160.0);
  expect_true(zero.has_value() && *zero == 0.0, "Airflow: zero power sized as 0");

  expect_true(altitude_derating_factor(0.0) == 1.0, "Altitude: sea level 1.00");
  expect_near(altitude_derating_factor(2000.0), 0.79, "Altitude: table point 2000 m");
  expect_near(altitude_derating_factor(250.0), 0.975, "Altitude: interpolated 250 m");
  expect_true(altitude_derating_factor(-200.0) == 1.0, "Altitude: clamped below 0 m");
  expect_true(altitude_derating_factor(5000.0) == 0.71, "Altitude: clamped above 3000 m");
  expect_true(altitude_derating_factor(std::nan("")) == 1.0, "Altitude: NaN treated as sea level");
  expect_near(derated_heat_capacity(1160.0, 1000.0), 1160.0 * 0.89, "Altitude: derated Cv");
}

// ---------------------------------------------------------------------------
// Forward model
// ---------------------------------------------------------------------------
void test_branch_gating() {
  expect_true(ventilation_effective(true, 2.0, 2), "Gate: enabled large IP2X is effective");
  expect_true(!ventilation_effective(false, 2.0, 2), "Gate: disabled is not effective");
  expect_true(!ventilation_effective(true, 1.25, 2), "Gate: Ae <= 1.25 ignores openings");
  expect_true(!ventilation_effective(true, 2.0, 5), "Gate: IP5X ignores openings");

  expect_true(partition_factor(ThermalBranch::SealedLarge, 0) == 1.00, "d: no partitions");
  expect_true(partition_factor(ThermalBranch::SealedLarge, 2) == 1.15, "d: sealed large, 2 partitions");
  expect_true(partition_factor(ThermalBranch::SealedLarge, 7) == 1.30, "d: sealed large, 3 or more");
  expect_true(partition_factor(ThermalBranch::Ventilated, 3) == 1.15, "d: ventilated, 3 or more");
  expect_true(partition_factor(ThermalBranch::SealedSmall, 3) == 1.00, "d: small enclosures unaffected");
  expect_true(partition_factor(ThermalBranch::SealedLarge, -1) == 1.00, "d: negative count clamped");
}

void test_forward_sealed_large() {
  const Layout layout = single(0.6, 1.2, 0.4, 200.0);
  const SectionGeometry g = resolve_geometry(layout, 0);
  const ThermalSolver solver(builtin_curves());

  ForwardInputs in;
  in.geometry = g;
  in.power_W = 200.0;
  const ForwardResult r = solver.solve(in);

  const double k = builtin_curves()->k_unventilated_large(g.Ae_m2).value;
  const double c = builtin_curves()->c_unventilated_large(1, g.f).value;

  expect_true(r.branch == ThermalBranch::SealedLarge, "Forward: sealed large branch");
  expect_true(r.x == 0.804, "Forward: sealed exponent 0.804");
  expect_true(r.k == k && r.c == c, "Forward: coefficients from Fig. 3 / Fig. 4 curve 1");
  expect_near(r.dt_mid_K, k * std::pow(200.0, 0.804), "Forward: dt_mid = k * d * P^x");
  expect_near(r.dt_top_K, c * r.dt_mid_K, "Forward: dt_top = c * dt_mid");
  expect_true(!r.dt_075_K.has_value() && !r.g.has_value() && r.f.has_value(),
              "Forward: f reported, no 0.75-height point");
  expect_true(r.figures_used == std::vector<std::string>({"Fig. 1", "Fig. 3", "Fig. 4"}),
              "Forward: figures used, sorted");
  expect_true(r.k > 0.26 && r.k < 0.265, "Forward: k near Fig. 3 at 2.5 m2");

  in.horizontal_partitions = 2;
  const ForwardResult rp = solver.solve(in);
  expect_near(rp.dt_mid_K, 1.15 * r.dt_mid_K, "Forward: partitions scale dt_mid by d");

  in.horizontal_partitions = 0;
  in.power_W = 0.0;
  const ForwardResult r0 = solver.solve(in);
  expect_true(r0.dt_mid_K == 0.0 && r0.dt_top_K == 0.0, "Forward: zero power gives zero rise");
}

void test_forward_ventilated() {
  const Layout layout = single(0.6, 1.2, 0.4, 400.0);
  const SectionGeometry g = resolve_geometry(layout, 0);
  const ThermalSolver solver(builtin_curves());

  ForwardInputs in;
  in.geometry = g;
  in.power_W = 400.0;
  in.ventilated = true;
  in.inlet_area_cm2 = 300.0;
  const ForwardResult r = solver.solve(in);

  expect_true(r.branch == ThermalBranch::Ventilated, "Forward: ventilated branch");
  expect_true(r.x == 0.715, "Forward: ventilated exponent 0.715");
  expect_true(r.k == builtin_curves()->k_ventilated(g.Ae_m2, 300.0).value,
              "Forward: k from Fig. 5 at Ae and inlet");
  expect_true(r.c == builtin_curves()->c_ventilated(g.f, 300.0).value,
              "Forward: c from Fig. 6 at f and inlet");
  expect_near(r.dt_top_K, r.c * r.k * std::pow(400.0, 0.715), "Forward: ventilated top rise");

  // Openings on a small enclosure are not modeled.
  const Layout small = single(0.4, 0.5, 0.25, 50.0);
  in.geometry = resolve_geometry(small, 0);
  in.power_W = 50.0;
  expect_true(solver.solve(in).branch == ThermalBranch::SealedSmall, "Forward: small ignores ventilated flag");
}

void test_forward_sealed_small() {
  const Layout layout = single(0.4, 0.5, 0.25, 50.0);
  const SectionGeometry g = resolve_geometry(layout, 0);
  expect_near(g.Ae_m2, 0.725, "Small: Ae");
  expect_near(g.g, 1.25, "Small: g");

  const ThermalSolver solver(builtin_curves());
  ForwardInputs in;
  in.geometry = g;
  in.power_W = 50.0;
  in.horizontal_partitions = 3;
  const ForwardResult r = solver.solve(in);

  expect_true(r.branch == ThermalBranch::SealedSmall, "Small: sealed small branch");
  expect_near(r.k, 0.62987, "Small: k from Fig. 7", 1e-4);
  expect_near(r.c, 1.28906, "Small: c from Fig. 8", 1e-4);
  expect_true(r.d == 1.0, "Small: partitions ignored");
  expect_near(r.dt_mid_K, 14.630, "Small: dt_mid", 1e-3);
  expect_near(r.dt_top_raw_K, r.c * r.dt_mid_K, "Small: raw top = c * dt_mid");
  expect_true(r.dt_075_K.has_value(), "Small: 0.75-height point reported");
  expect_near(*r.dt_075_K, 0.5 * (r.dt_mid_K + r.dt_top_raw_K), "Small: 0.75 point between mid and raw top");
  expect_true(r.dt_top_K == *r.dt_075_K, "Small: top taken at the 0.75-height point");
  expect_true(*r.dt_075_K != r.dt_mid_K && *r.dt_075_K != r.dt_top_raw_K,
              "Small: 0.75 value distinct from mid and raw top");
  expect_true(r.figures_used == std::vector<std::string>({"Fig. 2", "Fig. 7", "Fig. 8"}),
              "Small: figures used");
}

void test_forward_snap_warning() {
  SectionGeometry g;
  g.width_m = 3.0;
  g.height_m = 2.2;
  g.depth_m = 1.5;
  g.Ae_m2 = 20.0;
  g.f = 0.2;
  g.curve_number = 1;

  MemorySink sink;
  const ThermalSolver solver(builtin_curves(), sink);
  ForwardInputs in;
  in.geometry = g;
  in.power_W = 500.0;
  const ForwardResult r = solver.solve(in);

  expect_true(r.k_sample.x_snapped && r.k_sample.x_used == 14.0, "Snap: Ae clamped to 14 m2");
  expect_true(r.c_sample.x_snapped && r.c_sample.x_used == 0.6, "Snap: f clamped to 0.6");
  expect_true(r.k == 0.078, "Snap: edge value used");
  expect_true(sink.contains("[WARN] curves: k_unventilated_large query clamped"),
              "Snap: clamped lookup logged as WARN");
}

// ---------------------------------------------------------------------------
// Stager
// ---------------------------------------------------------------------------
void test_stage_infeasible() {
  ProjectSettings st;
  st.environment.ambient_C = 70.0;
  const ThermalResult r = stage(single(0.6, 1.2, 0.4, 200.0), st);
  expect_true(r.stage == ComplianceStage::InfeasibleAmbient, "Stage 1: ambient equal to limit");
  expect_true(r.infeasibility.size() == 1
              && r.infeasibility[0] == InfeasibilityCause::AmbientAtOrAboveLimit,
              "Stage 1: ambient cause");
  expect_true(!r.airflow_m3h.has_value(), "Stage 1: airflow not sized");
  expect_true(r.dt_mid_K == 0.0 && r.dt_top_K == 0.0, "Stage 1: zero rises");

  st.environment.ambient_C = 60.0;
  st.environment.solar_offset_K = 15.0;
  const ThermalResult rs = stage(single(0.6, 1.2, 0.4, 200.0), st);
  expect_true(rs.stage == ComplianceStage::InfeasibleAmbient, "Stage 1: solar pushes base over limit");
  expect_true(rs.infeasibility.size() == 1 && rs.infeasibility[0] == InfeasibilityCause::SolarRadiation,
              "Stage 1: solar cause only");
  expect_true(rs.T_top_C == 75.0 && !rs.compliant(), "Stage 1: temperatures at base value");
}

void test_stage_base_compliant() {
  ProjectSettings st;
  st.environment.solar_offset_K = 5.0;
  const ThermalResult r = stage(single(0.6, 1.2, 0.4, 200.0), st);

  expect_true(r.stage == ComplianceStage::BaseCompliant && r.compliant(), "Stage 2: compliant");
  expect_true(r.allowed_rise_K == 30.0, "Stage 2: allowed rise = max - ambient - solar");
  expect_near(r.T_top_C, 40.0 + r.dt_top_K, "Stage 2: T_top includes solar offset");
  expect_true(r.compliant_top && r.compliant_mid, "Stage 2: both heights compliant");
  expect_true(r.airflow_m3h.has_value() && *r.airflow_m3h == 0.0, "Stage 2: no airflow");
  expect_true(r.active_cooling_W == 0.0 && r.material_dissipation_W == 0.0, "Stage 2: no cooling split");

  const ThermalResult r0 = stage(single(0.6, 1.2, 0.4, 0.0), ProjectSettings{});
  expect_true(r0.stage == ComplianceStage::BaseCompliant && r0.T_top_C == 35.0,
              "Stage 2: zero power sits at ambient");
}

void test_stage_material_and_whatif() {
  MemorySink sink;
  ProjectSettings st;
  const Layout layout = single(0.6, 1.2, 0.4, 400.0);
  const ThermalResult r = stage(layout, st, sink);

  expect_true(r.T_top_C > 70.0, "Stage 3: 400 W exceeds limit sealed");
  expect_true(r.stage == ComplianceStage::ActiveCooling, "Stage 3: sealed inversion does not cover load");

  const SealedCoefficients sc{r.k, r.c, r.d, r.x};
  const double cap = passive_capacity_annex_k(sc, 35.0);
  expect_near(r.passive_capacity_W, cap, "Stage 3: capacity = (rise / (c k d))^(1/x)");
  expect_near(sc.c * sc.k * sc.d * std::pow(cap, sc.x), 35.0, "Stage 3: capacity reproduces the rise");
  expect_true(cap > 280.0 && cap < 300.0, "Stage 3: capacity near 290 W");
  expect_near(r.active_cooling_W, 400.0 - cap, "Stage 5: residual to forced air");
  expect_near(r.material_dissipation_W + r.active_cooling_W, r.power_W, "Stage 5: split sums to load");
  expect_near(*r.airflow_m3h, (400.0 - cap) / (1160.0 * 35.0) * 3600.0, "Stage 5: airflow for residual");
  expect_true(!r.compliant_mid && !r.compliant_top && !r.compliant(), "Stage 5: non-compliant");

  expect_true(r.hypothetical_T_top_C.has_value(), "Stage 4: what-if evaluated");
  expect_true(*r.hypothetical_T_top_C < 70.0 && r.ventilation_recommended,
              "Stage 4: 300 cm2 opening would suffice");
  expect_true(sink.contains("(recommended)"), "Stage 4: recommendation logged");

  st.material.model = DissipationModel::WallConductance;
  const ThermalResult rw = stage(layout, st);
  expect_true(rw.stage == ComplianceStage::MaterialDissipation && rw.compliant(),
              "Stage 3: wall conductance covers 400 W");
  expect_near(rw.passive_capacity_W, 5.5 * 2.496 * 35.0, "Stage 3: htc * Ae * rise");
  expect_true(rw.material_dissipation_W == 400.0 && rw.active_cooling_W == 0.0,
              "Stage 3: whole load credited to the sheet");
  expect_true(rw.airflow_m3h.has_value() && *rw.airflow_m3h == 0.0, "Stage 3: no airflow");
  expect_true(!rw.hypothetical_T_top_C.has_value(), "Stage 3: terminal before what-if");

  st.material.allow_material_dissipation = false;
  const ThermalResult rn = stage(layout, st);
  expect_true(rn.passive_capacity_W == 0.0 && rn.active_cooling_W == 400.0,
              "Stage 3: disabled material dissipation credits nothing");
  expect_near(*rn.airflow_m3h, 400.0 / (1160.0 * 35.0) * 3600.0, "Stage 5: full load to forced air");
}

void test_stage_whatif_bounded_by_face() {
  ProjectSettings st;
  const Layout layout = single(0.6, 1.2, 0.4, 400.0);
  const ThermalResult wide = stage(layout, st);
  expect_near(wide.max_inlet_area_cm2, 1200.0, "What-if: 2 x 7 grid of 40 cm2 louvres");
  expect_true(wide.whatif_inlet_area_cm2 && *wide.whatif_inlet_area_cm2 == 300.0,
              "What-if: test area used when the face can carry it");

  st.ventilation.louvre.free_area_cm2 = 5.0;
  MemorySink sink;
  const ThermalResult narrow = stage(layout, st, sink);
  expect_near(narrow.max_inlet_area_cm2, 150.0, "What-if: small louvres cap the face at 150 cm2");
  expect_true(narrow.whatif_inlet_area_cm2 && *narrow.whatif_inlet_area_cm2 == narrow.max_inlet_area_cm2,
              "What-if: candidate capped by the face");
  expect_true(*narrow.hypothetical_T_top_C > *wide.hypothetical_T_top_C,
              "What-if: smaller opening runs hotter");
  expect_true(sink.contains("what-if 150 cm2"), "What-if: capped area logged");

  const ThermalResult base = stage(single(0.6, 1.2, 0.4, 100.0), ProjectSettings{});
  expect_true(!base.whatif_inlet_area_cm2.has_value(), "What-if: not tried when base compliant");
}

void test_stage_ventilation_gates() {
  ProjectSettings st;
  st.ventilation.ip_first_digit = 5;
  MemorySink sink;
  Layout layout = single(0.6, 1.2, 0.4, 400.0);
  layout.sections[0].ventilation.enabled = true;
  layout.sections[0].ventilation.inlet_area_cm2 = 300.0;

  const ThermalResult r = stage(layout, st, sink);
  expect_true(r.ventilation_enabled && !r.ventilation_effective, "Vent: IP5X openings not effective");
  expect_true(r.branch == ThermalBranch::SealedLarge, "Vent: IP5X modeled sealed");
  expect_true(sink.contains("IP5X forbids openings"), "Vent: ignored openings logged");
  expect_true(!r.hypothetical_T_top_C.has_value() && !r.ventilation_recommended,
              "Vent: no what-if when IP forbids openings");

  st.ventilation.ip_first_digit = 2;
  const ThermalResult rv = stage(layout, st);
  expect_true(rv.ventilation_effective && rv.branch == ThermalBranch::Ventilated, "Vent: IP2X ventilated");
  expect_true(rv.stage == ComplianceStage::BaseCompliant, "Vent: 300 cm2 keeps 400 W compliant");

  // Sealed inversion even for a ventilated section.
  Layout hot = layout;
  hot.sections[0].extra_power_W = 2000.0;
  const ThermalResult rh = stage(hot, st);
  const ThermalSolver solver(builtin_curves());
  const SealedCoefficients sc = solver.sealed_coefficients(rh.geometry, 0);
  expect_true(rh.branch == ThermalBranch::Ventilated, "Vent: hot section still ventilated");
  expect_near(rh.passive_capacity_W, passive_capacity_annex_k(sc, 35.0),
              "Vent: stage 3 inverts sealed coefficients");
  expect_true(!rh.hypothetical_T_top_C.has_value(), "Vent: no what-if when already ventilated");
}

void test_stage_margin_and_altitude() {
  ProjectSettings st;
  st.material.allow_material_dissipation = false;
  const Layout layout = single(0.6, 1.2, 0.4, 400.0);

  const double base = *stage(layout, st).airflow_m3h;

  st.air.airflow_margin = 1.2;
  expect_near(*stage(layout, st).airflow_m3h, 1.2 * base, "Margin: scales sized airflow");

  st.air.airflow_margin = 1.0;
  st.environment.altitude_m = 2000.0;
  expect_near(*stage(layout, st).airflow_m3h, base / 0.79, "Altitude: thinner air needs more flow");
}

void test_stage_passive_altitude() {
  ProjectSettings st;
  const Layout layout = single(0.6, 1.2, 0.4, 900.0);
  const ThermalResult sea = stage(layout, st);

  st.environment.altitude_m = 3000.0;
  const ThermalResult high = stage(layout, st);
  expect_near(high.passive_capacity_W, 0.71 * sea.passive_capacity_W,
              "Altitude: sealed inversion capacity derated at 3000 m");
  expect_near(high.active_cooling_W, 900.0 - high.passive_capacity_W,
              "Altitude: derated capacity shifts load to forced air");

  st.environment.altitude_m = 2000.0;
  st.material.model = DissipationModel::WallConductance;
  st.material.htc_W_m2K = 2.0;
  const ThermalResult wall = stage(layout, st);
  expect_near(wall.passive_capacity_W, 0.79 * 2.0 * 2.496 * 35.0,
              "Altitude: wall conductance capacity derated at 2000 m");
}

// Once forced air is needed, more load never asks for less airflow.
void test_stage_airflow_monotone_in_power() {
  const ProjectSettings st;
  double prev = 0.0;
  bool all_active = true;
  bool monotone = true;
  bool split_ok = true;
  for (double p = 400.0; p <= 3000.0; p += 50.0) {
    const ThermalResult r = stage(single(0.6, 1.2, 0.4, p), st);
    all_active = all_active && r.stage == ComplianceStage::ActiveCooling && r.airflow_m3h.has_value();
    if (!r.airflow_m3h) continue;
    monotone = monotone && *r.airflow_m3h >= prev;
    split_ok = split_ok && near(r.active_cooling_W, p - r.passive_capacity_W, 1e-9, 1e-9);
    prev = *r.airflow_m3h;
  }
  expect_true(all_active, "Sweep: 400..3000 W all sized for forced air");
  expect_true(monotone, "Sweep: airflow non-decreasing in load");
  expect_true(split_ok, "Sweep: active cooling = load - passive capacity");
}

void test_passive_helpers() {
  const SealedCoefficients sc{0.3, 1.4, 1.0, 0.804};
  expect_true(passive_capacity_annex_k(sc, 0.0) == 0.0, "Passive: zero rise gives 0");
  expect_true(passive_capacity_annex_k(SealedCoefficients{0.0, 1.4, 1.0, 0.804}, 30.0) == 0.0,
              "Passive: zero k gives 0");
  expect_true(passive_capacity_wall(5.5, 2.0, -1.0) == 0.0, "Passive: negative rise gives 0");
  expect_near(passive_capacity_wall(5.5, 2.0, 30.0), 330.0, "Passive: wall conductance");
}

}  // namespace
}  // namespace panelheat

int main() {
  using namespace panelheat;

  test_airflow();
  test_branch_gating();
  test_forward_sealed_large();
  test_forward_ventilated();
  test_forward_sealed_small();
  test_forward_snap_warning();
  test_stage_infeasible();
  test_stage_base_compliant();
  test_stage_material_and_whatif();
  test_stage_whatif_bounded_by_face();
  test_stage_ventilation_gates();
  test_stage_margin_and_altitude();
  test_stage_passive_altitude();
  test_stage_airflow_monotone_in_power();
  test_passive_helpers();

  return selftest::finish("thermal_selftest");
}
