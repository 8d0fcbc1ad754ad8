/*
================================================================================
Fragment 3.2 - Enclosure: Geometry Resolver
FILE: cpp/engine/enclosure/geometry_resolver.cpp
================================================================================
*/

#include "engine/enclosure/geometry_resolver.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "engine/thermal/iec60890.hpp"

namespace panelheat {

bool SectionGeometry::is_small() const {
  return Ae_m2 <= iec60890::kSmallEnclosureAeLimit_m2;
}

bool overlap_1d(double a0, double a1, double b0, double b1) {
  return !(a1 <= b0 || b1 <= a0);
}

static bool near(double a, double b) {
  return std::abs(a - b) <= iec60890::kTouchTolerance_m;
}

TouchState resolve_touching(const Layout& layout, std::size_t index) {
  PANELHEAT_REQUIRE(index < layout.sections.size(), ErrorCode::InvalidInput,
                    "resolve_touching: section index out of range");

  const Rect& r = layout.sections[index].rect;
  TouchState t;

  for (std::size_t i = 0; i < layout.sections.size(); ++i) {
    if (i == index) continue;
    const Rect& o = layout.sections[i].rect;

    const bool v_overlap = overlap_1d(r.top(), r.bottom(), o.top(), o.bottom());
    const bool h_overlap = overlap_1d(r.left(), r.right(), o.left(), o.right());

    if (v_overlap && near(r.left(), o.right())) t.left = true;
    if (v_overlap && near(r.right(), o.left())) t.right = true;
    if (h_overlap && near(r.top(), o.bottom())) t.top = true;
    if (h_overlap && near(r.bottom(), o.top())) t.bottom = true;
  }
  return t;
}

FaceAreaFactors face_area_factors(const TouchState& t, bool wall_mounted) {
  using namespace iec60890;
  FaceAreaFactors b;
  b.top = t.top ? kRoofCovered : kRoofExposed;
  b.bottom = kFloor;
  b.left = t.left ? kSideCovered : kSideExposed;
  b.right = t.right ? kSideCovered : kSideExposed;
  b.front = kFrontExposed;
  b.rear = wall_mounted ? kRearWallMounted : kRearExposed;
  return b;
}

double effective_area_m2(const FaceAreaFactors& b, double w, double h, double d) {
  const double a_top = w * d;
  const double a_side = h * d;
  const double a_face = w * h;
  return b.top * a_top + b.bottom * a_top
       + b.left * a_side + b.right * a_side
       + b.front * a_face + b.rear * a_face;
}

double shape_ratio_f(double w, double h, double d) {
  const double base = std::max(iec60890::kMinShapeDenominator, w * d);
  return std::pow(std::max(0.0, h), iec60890::kShapeExponent) / base;
}

double shape_ratio_g(double w, double h) {
  return h / std::max(iec60890::kMinShapeDenominator, w);
}

int curve_number_for(const TouchState& t, bool wall_mounted) {
  const bool both = t.left && t.right;
  const bool one = (t.left != t.right);
  const bool top = t.top;

  if (!t.left && !t.right && !top) return wall_mounted ? 3 : 1;
  if (one && !top) return wall_mounted ? 4 : 2;
  if (both && !top) return wall_mounted ? 5 : 3;
  if (wall_mounted && both && top) return 4;
  return wall_mounted ? 4 : 3;
}

SectionGeometry resolve_geometry(const Layout& layout, std::size_t index, LogSink& log) {
  PANELHEAT_REQUIRE(index < layout.sections.size(), ErrorCode::InvalidInput,
                    "resolve_geometry: section index out of range");

  const EnclosureSection& s = layout.sections[index];

  SectionGeometry g;
  g.width_m = s.width_m();
  g.height_m = s.height_m();
  g.depth_m = s.depth_m;
  g.wall_mounted = layout.wall_mounted;

  g.touching = resolve_touching(layout, index);
  g.b = face_area_factors(g.touching, layout.wall_mounted);
  g.Ae_m2 = effective_area_m2(g.b, g.width_m, g.height_m, g.depth_m);
  g.f = shape_ratio_f(g.width_m, g.height_m, g.depth_m);
  g.g = shape_ratio_g(g.width_m, g.height_m);
  g.curve_number = curve_number_for(g.touching, layout.wall_mounted);

  std::ostringstream oss;
  oss << "geometry: '" << s.name << "' b top=" << g.b.top << " bottom=" << g.b.bottom
      << " left=" << g.b.left << " right=" << g.b.right << " front=" << g.b.front
      << " rear=" << g.b.rear << " touching L=" << g.touching.left << " R=" << g.touching.right
      << " T=" << g.touching.top << " B=" << g.touching.bottom
      << " wall=" << layout.wall_mounted << " Ae=" << g.Ae_m2 << " curve=" << g.curve_number;
  log.debug(oss.str());

  return g;
}

std::vector<SurfaceBreakdown> surface_breakdown(const SectionGeometry& g) {
  const auto row = [](const char* name, double a, double b, double factor) {
    SurfaceBreakdown r;
    r.name = name;
    r.dim1_m = a;
    r.dim2_m = b;
    r.b = factor;
    r.area_m2 = a * b;
    r.effective_area_m2 = r.area_m2 * factor;
    return r;
  };

  return {
      row("Roof", g.width_m, g.depth_m, g.b.top),
      row("Front", g.width_m, g.height_m, g.b.front),
      row("Rear", g.width_m, g.height_m, g.b.rear),
      row("Left", g.height_m, g.depth_m, g.b.left),
      row("Right", g.height_m, g.depth_m, g.b.right),
  };
}

std::vector<int> assign_curve_numbers(const Layout& layout) {
  std::vector<int> out;
  out.reserve(layout.sections.size());
  for (std::size_t i = 0; i < layout.sections.size(); ++i) {
    out.push_back(curve_number_for(resolve_touching(layout, i), layout.wall_mounted));
  }
  return out;
}

}  // namespace panelheat
