#pragma once
/*
================================================================================
Fragment 3.2 - Enclosure: Geometry Resolver (Adjacency -> Ae, f, g, curve no.)
FILE: cpp/engine/enclosure/geometry_resolver.hpp

Purpose:
  - From one section and its siblings, resolve:
      * which faces touch another section (top/bottom/left/right)
      * IEC 60890 Table III surface factors b per face
      * effective cooling area Ae = sum(b * A0)
      * shape ratios f = h^1.35 / (w * d) and g = h / w
      * the Fig. 4 curve number (1..5)

Hardening:
  - Pure: recomputed from the full sibling list on every call; result does not
    depend on sibling order.
  - Degenerate widths/depths are guarded (finite ratios), not rejected.
================================================================================
*/

#include <cstddef>
#include <string>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/enclosure/section.hpp"

namespace panelheat {

struct TouchState {
  bool top = false;
  bool bottom = false;
  bool left = false;
  bool right = false;
};

struct FaceAreaFactors {
  double top = 0.0;
  double bottom = 0.0;
  double left = 0.0;
  double right = 0.0;
  double front = 0.0;
  double rear = 0.0;
};

// One report row: a face with both dimensions, its b factor and areas.
struct SurfaceBreakdown {
  std::string name;   // Roof, Front, Rear, Left, Right
  double dim1_m = 0.0;
  double dim2_m = 0.0;
  double b = 0.0;
  double area_m2 = 0.0;            // A0
  double effective_area_m2 = 0.0;  // A0 * b
};

struct SectionGeometry {
  double width_m = 0.0;
  double height_m = 0.0;
  double depth_m = 0.0;

  TouchState touching;
  FaceAreaFactors b;

  double Ae_m2 = 0.0;
  double f = 0.0;
  double g = 0.0;

  int curve_number = 1;
  bool wall_mounted = false;

  bool is_small() const;
};

bool overlap_1d(double a0, double a1, double b0, double b1);

TouchState resolve_touching(const Layout& layout, std::size_t index);

FaceAreaFactors face_area_factors(const TouchState& t, bool wall_mounted);

double effective_area_m2(const FaceAreaFactors& b, double w, double h, double d);

double shape_ratio_f(double w, double h, double d);
double shape_ratio_g(double w, double h);

int curve_number_for(const TouchState& t, bool wall_mounted);

// Throws InvalidInput if index is out of range.
SectionGeometry resolve_geometry(const Layout& layout, std::size_t index,
                                 LogSink& log = null_log_sink());

std::vector<SurfaceBreakdown> surface_breakdown(const SectionGeometry& g);

// Curve number for every section, in layout order.
std::vector<int> assign_curve_numbers(const Layout& layout);

}  // namespace panelheat
