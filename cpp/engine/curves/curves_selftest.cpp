/*
  Fragment 2.7 - Curves Selftest

  Objective
  ---------
  Framework-free checks for the curve layer:
    1) MonotoneSpline hits its knots, extrapolates flat, never overshoots.
    2) CurveFamilySet returns the family spline on exact keys and blends between.
    3) Out-of-domain queries clamp and report the snap.
    4) Loader parses x,y files and rejects malformed data with stable codes.
    5) CurveFamilyInterpolator picks digitized vs closed-form strategies.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/curves/coefficient_curve.hpp"
#include "engine/curves/curve_family.hpp"
#include "engine/curves/curve_family_interpolator.hpp"
#include "engine/curves/curve_loader.hpp"
#include "engine/curves/iec60890_figures.hpp"
#include "engine/curves/monotone_spline.hpp"

namespace panelheat {
namespace {

using namespace panelheat::selftest;
using namespace panelheat::curves;
namespace fs = std::filesystem;

void test_spline_knots_and_extrapolation() {
  const auto pts = figures::fig3_k_sealed_large_points();
  const MonotoneSpline s(pts);

  bool exact = true;
  for (const auto& p : pts) exact = exact && (s.eval(p.x) == p.y);
  expect_true(exact, "Spline: evaluates to each knot's y exactly");

  expect_true(s.eval(0.5) == 0.420, "Spline: flat below first knot");
  expect_true(s.eval(100.0) == 0.078, "Spline: flat above last knot");
  expect_true(s(1.25) == s.eval(1.25), "Spline: operator() matches eval()");
}

void test_spline_monotone_and_no_overshoot() {
  const MonotoneSpline s(figures::fig3_k_sealed_large_points());
  bool monotone = true;
  double prev = s.eval(1.25);
  for (double x = 1.26; x <= 14.0; x += 0.01) {
    const double y = s.eval(x);
    if (y > prev + 1e-12) monotone = false;
    prev = y;
  }
  expect_true(monotone, "Spline: decreasing data stays non-increasing");

  const MonotoneSpline peak(std::vector<CurvePoint>{{0.0, 0.0}, {1.0, 1.0}, {2.0, 0.0}});
  bool bounded = true;
  for (double x = 0.0; x <= 2.0; x += 0.005) {
    const double y = peak.eval(x);
    if (y > 1.0 + 1e-12 || y < -1e-12) bounded = false;
  }
  expect_true(bounded, "Spline: no overshoot around a local extremum");
  expect_true(peak.slopes()[1] == 0.0, "Spline: zero derivative at extremum");
}

void test_spline_degenerate() {
  const MonotoneSpline empty;
  expect_true(empty.eval(3.0) == 0.0, "Spline: empty evaluates to 0");

  const MonotoneSpline one(std::vector<CurvePoint>{{2.0, 5.0}});
  expect_true(one.eval(-10.0) == 5.0 && one.eval(10.0) == 5.0, "Spline: single knot is constant");

  const MonotoneSpline unsorted(std::vector<CurvePoint>{{3.0, 3.0}, {1.0, 1.0}, {2.0, 2.0}});
  expect_true(unsorted.x_min() == 1.0 && unsorted.x_max() == 3.0, "Spline: knots sorted on construction");
  expect_near(unsorted.eval(1.5), 1.5, "Spline: linear data reproduced");

  expect_throws([] { MonotoneSpline s(std::vector<CurvePoint>{{1.0, 1.0}, {1.0, 2.0}}); },
                ErrorCode::InvalidInput, "Spline: duplicate x rejected");
  expect_throws([] { MonotoneSpline s(std::vector<CurvePoint>{{1.0, 1.0}, {2.0, std::nan("")}}); },
                ErrorCode::InvalidInput, "Spline: NaN rejected");
}

void test_family_set() {
  const CurveFamilySet set = CurveFamilySet::from_points("Fig. 5", figures::fig5_k_ventilated_points());

  expect_true(set.size() == 13, "FamilySet: all Fig. 5 families present");
  expect_true(set.key_min() == 1.0 && set.key_max() == 14.0, "FamilySet: key domain");
  expect_true(set.x_min() == 50.0 && set.x_max() == 1000.0, "FamilySet: x domain");

  const auto exact = set.sample(2.0, 250.0);
  expect_true(exact.value == set.family(2.0)->eval(250.0), "FamilySet: exact key equals family spline");
  expect_true(!exact.snapped(), "FamilySet: in-domain query not snapped");

  const auto mid = set.sample(1.25, 300.0);
  expect_near(mid.value, 0.5 * (0.216 + 0.160), "FamilySet: linear blend between bracketing families");

  const auto snapped = set.sample(15.0, 1200.0);
  expect_true(snapped.key_snapped && snapped.x_snapped, "FamilySet: out-of-domain flags set");
  expect_true(snapped.key_used == 14.0 && snapped.x_used == 1000.0, "FamilySet: snapped to domain edge");
  expect_true(snapped.value == 0.021, "FamilySet: snapped value is edge family at edge x");

  CurveFamilySet empty("empty");
  expect_throws([&] { empty.finalize(); }, ErrorCode::MissingCurveData, "FamilySet: finalize without data");

  CurveFamilySet dup("dup");
  dup.add_family(1.0, {{0.0, 1.0}, {1.0, 2.0}});
  expect_throws([&] { dup.add_family(1.0, {{0.0, 1.0}}); }, ErrorCode::InvalidInput,
                "FamilySet: duplicate key rejected");
}

void test_parse_curve_csv() {
  std::istringstream in("# Fig. 5, Ae = 2.0\n\n300, 0.130\n100,0.171\n50,0.194,extra\n");
  const auto pts = parse_curve_csv(in, "inline");
  expect_true(pts.size() == 3, "Loader: comments and blanks skipped");
  expect_true(pts.front().x == 50.0 && pts.back().x == 300.0, "Loader: points sorted by x");

  std::istringstream bad("100,0.1\nabc,0.2\n");
  expect_throws([&] { parse_curve_csv(bad, "bad"); }, ErrorCode::ParseError, "Loader: non-numeric row");

  std::istringstream empty("# nothing\n\n");
  expect_throws([&] { parse_curve_csv(empty, "empty"); }, ErrorCode::MissingCurveData, "Loader: empty file");
}

void write_file(const fs::path& p, const std::string& body) {
  std::ofstream f(p);
  f << body;
}

void test_load_figure_folders() {
  const fs::path root = fs::temp_directory_path() / "panelheat_curves_selftest";
  fs::remove_all(root);
  fs::create_directories(root / "fig5");
  fs::create_directories(root / "fig6");

  write_file(root / "fig5" / "1.5.csv", "50,0.240\n300,0.160\n1000,0.107\n");
  write_file(root / "fig5" / "3.csv", "50,0.144\n300,0.096\n1000,0.064\n");
  write_file(root / "fig6" / "2.csv", "50,1.394\n1000,1.573\n");

  const auto fams = load_curve_folder((root / "fig5").string());
  expect_true(fams.size() == 2 && fams.count(1.5) == 1 && fams.count(3.0) == 1,
              "Loader: filename stem is the family key");

  MemorySink sink;
  const FigureData data = load_figure_data(root.string(), sink);
  expect_true(data.fig5_k_ventilated.has_value() && data.fig6_c_ventilated.has_value(),
              "Loader: fig5/ and fig6/ picked up");
  expect_true(sink.contains("Fig. 5 loaded"), "Loader: data source logged");

  const auto interp = CurveFamilyInterpolator::create(data);
  expect_true(interp->ventilated_k_digitized() && interp->ventilated_c_digitized(),
              "Interpolator: digitized strategies from folders");
  expect_near(interp->k_ventilated(3.0, 300.0).value, 0.096, "Interpolator: folder data used");

  fs::create_directories(root / "badstem");
  write_file(root / "badstem" / "abc.csv", "1,1\n");
  expect_throws([&] { load_curve_folder((root / "badstem").string()); }, ErrorCode::ParseError,
                "Loader: non-numeric filename stem");

  fs::create_directories(root / "nocsv");
  expect_throws([&] { load_curve_folder((root / "nocsv").string()); }, ErrorCode::MissingCurveData,
                "Loader: folder without CSV files");

  expect_throws([&] { load_curve_folder((root / "missing").string()); }, ErrorCode::IOError,
                "Loader: missing folder");

  fs::remove_all(root / "fig6");
  const FigureData partial = load_figure_data(root.string());
  expect_true(partial.fig5_k_ventilated.has_value() && !partial.fig6_c_ventilated.has_value(),
              "Loader: missing figure folder leaves figure unset");

  fs::remove_all(root);
}

void test_interpolator_builtin() {
  const auto c = CurveFamilyInterpolator::builtin();

  expect_true(c->data_source() == "builtin", "Interpolator: builtin source");
  expect_true(c->k_unventilated_large(2.5).value == 0.262, "Interpolator: Fig. 3 knot");
  expect_near(c->c_unventilated_large(1, 3.0).value, 1.35, "Interpolator: Fig. 4 curve 1");
  expect_near(c->c_unventilated_large(3, 3.0).value, 1.35 - 0.070, "Interpolator: Fig. 4 curve 3 offset");

  const double c1 = c->c_unventilated_large(1, 5.0).value;
  bool decreasing = true;
  for (int n = 2; n <= 5; ++n) {
    if (!(c->c_unventilated_large(n, 5.0).value < c->c_unventilated_large(n - 1, 5.0).value)) decreasing = false;
  }
  expect_true(decreasing && c1 > 0.0, "Interpolator: c decreases with curve number");

  const auto clamped = c->c_unventilated_large(9, 5.0);
  expect_true(clamped.key_snapped && clamped.key_used == 5.0, "Interpolator: curve number clamped to 5");

  expect_near(c->k_unventilated_small(0.10).value, 2.75, "Interpolator: Fig. 7 anchor 0");
  expect_near(c->k_unventilated_small(1.25).value, 0.42, "Interpolator: Fig. 7 anchor 1");
  expect_near(c->c_unventilated_small(0.5).value, 1.10, "Interpolator: Fig. 8 anchor 0");
  expect_near(c->c_unventilated_small(3.0).value, 1.50, "Interpolator: Fig. 8 anchor 1");

  const auto pl = PowerLawCurve::from_anchors("Fig. 7", figures::kFig7Anchor0, figures::kFig7Anchor1,
                                              figures::kFig7XMin, figures::kFig7XMax);
  expect_near(pl.exponent(), -0.744, "PowerLaw: Fig. 7 exponent", 1e-3);
  expect_near(pl.scale(), 0.4958, "PowerLaw: Fig. 7 scale", 1e-3);

  const auto exact = c->k_ventilated(4.0, 400.0);
  expect_true(exact.value == 0.071 && !exact.snapped(), "Interpolator: Fig. 5 exact family + knot");

  const auto over = c->k_ventilated(15.0, 300.0);
  expect_true(over.key_snapped && over.key_used == 14.0, "Interpolator: Ae=15 evaluated on 14 m2 family");
}

void test_interpolator_fallbacks() {
  MemorySink sink;
  const auto c = CurveFamilyInterpolator::create(FigureData{}, sink);

  expect_true(!c->ventilated_k_digitized() && !c->ventilated_c_digitized(),
              "Interpolator: closed-form strategies without data");
  expect_true(sink.contains("[WARN]") && sink.contains("closed-form fallback"),
              "Interpolator: fallback selection logged as WARN");

  expect_near(c->c_ventilated(1.5, 0.0).value, 1.30, "Fallback: c_vent base value");
  expect_true(c->k_ventilated(2.5, 500.0).value < c->k_ventilated(2.5, 100.0).value,
              "Fallback: k_vent falls with opening area");
  expect_true(c->c_ventilated(6.0, 300.0).value > c->c_ventilated(2.0, 300.0).value,
              "Fallback: c_vent rises with f");
  expect_true(c->k_ventilated(2.5, 300.0).value < c->k_unventilated_large(2.5).value,
              "Fallback: ventilated k below sealed k");
}

}  // namespace
}  // namespace panelheat

int main() {
  using namespace panelheat;

  test_spline_knots_and_extrapolation();
  test_spline_monotone_and_no_overshoot();
  test_spline_degenerate();
  test_family_set();
  test_parse_curve_csv();
  test_load_figure_folders();
  test_interpolator_builtin();
  test_interpolator_fallbacks();

  return selftest::finish("curves_selftest");
}
