#pragma once
/*
================================================================================
Fragment 3.1 - Enclosure: Section + Layout Schema
FILE: cpp/engine/enclosure/section.hpp

Purpose:
  - Canonical snapshot of one switchboard layout as the thermal engine sees it:
      * sections ("tiers") as axis-aligned rectangles in a shared front view
      * per-section depth, heat sources, ventilation, temperature limit
      * layout-wide wall-mounted flag

Hardening:
  - Explicit units (metres, W, C, cm2).
  - validate_or_throw() is the caller-facing contract; the thermal core
    assumes a validated snapshot and never mutates it.

Notes:
  - Front view axes: x to the right, y DOWN. top() = y, bottom() = y + height.
  - Section width/height are the rectangle's; depth is separate.
  - Sections refer to siblings only by index into Layout::sections.
================================================================================
*/

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "engine/core/error.hpp"
#include "engine/core/require.hpp"

namespace panelheat {

struct Rect {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;

  double left() const { return x; }
  double right() const { return x + width; }
  double top() const { return y; }
  double bottom() const { return y + height; }
};

// Black-box heat source inside a section.
struct HeatSource {
  std::string name;
  double watts_each = 0.0;
  int quantity = 1;

  // Component temperature rating (C). Unset = no rating.
  std::optional<double> max_temp_C;

  double total_W() const { return watts_each * static_cast<double>(quantity); }
};

// Louvre grid on the door: `rows` in the bottom block, rows + 1 on top.
struct LouvreGrid {
  int cols = 1;
  int rows = 1;
};

struct Ventilation {
  bool enabled = false;

  // Effective free inlet area (cm2). Ignored when `grid` is set.
  double inlet_area_cm2 = 0.0;

  // When set, inlet area is derived from the louvre grid and IP rating.
  std::optional<LouvreGrid> grid;

  // false = "what-if" test opening, not fitted yet.
  bool installed = true;
};

struct EnclosureSection {
  std::string name;

  Rect rect;             // front view (m)
  double depth_m = 0.4;

  // Aggregate dissipation not itemised as heat sources (W).
  double extra_power_W = 0.0;
  std::vector<HeatSource> sources;

  // Manual limit (C), or the minimum source rating when use_component_rating.
  double max_temp_C = 70.0;
  bool use_component_rating = false;

  Ventilation ventilation;

  // Horizontal partitions inside the section (0 = none).
  int horizontal_partitions = 0;

  double width_m() const { return rect.width; }
  double height_m() const { return rect.height; }

  // Sum of all contributions, clamped >= 0.
  double total_power_W() const {
    double p = extra_power_W;
    for (const auto& s : sources) p += s.total_W();
    return (is_finite(p) && p > 0.0) ? p : 0.0;
  }

  // Minimum component rating when requested, else the manual value.
  double effective_max_temp_C() const {
    if (!use_component_rating) return max_temp_C;
    std::optional<double> lowest;
    for (const auto& s : sources) {
      if (!s.max_temp_C) continue;
      if (!lowest || *s.max_temp_C < *lowest) lowest = s.max_temp_C;
    }
    return lowest ? *lowest : max_temp_C;
  }

  void validate_or_throw() const {
    const std::string who = "EnclosureSection '" + name + "': ";
    PANELHEAT_REQUIRE(is_finite(rect.x) && is_finite(rect.y), ErrorCode::InvalidGeometry,
                      who + "position must be finite");
    PANELHEAT_REQUIRE(is_finite(rect.width) && rect.width > 0.0, ErrorCode::InvalidGeometry,
                      who + "width must be > 0");
    PANELHEAT_REQUIRE(is_finite(rect.height) && rect.height > 0.0, ErrorCode::InvalidGeometry,
                      who + "height must be > 0");
    PANELHEAT_REQUIRE(is_finite(depth_m) && depth_m > 0.0, ErrorCode::InvalidGeometry,
                      who + "depth must be > 0");
    PANELHEAT_REQUIRE(is_finite(extra_power_W) && extra_power_W >= 0.0, ErrorCode::InvalidInput,
                      who + "power must be >= 0");
    PANELHEAT_REQUIRE(is_finite(max_temp_C), ErrorCode::InvalidInput,
                      who + "max temperature must be finite");
    PANELHEAT_REQUIRE(horizontal_partitions >= 0, ErrorCode::InvalidInput,
                      who + "horizontal partitions must be >= 0");

    for (const auto& s : sources) {
      PANELHEAT_REQUIRE(is_finite(s.watts_each) && s.watts_each >= 0.0, ErrorCode::InvalidInput,
                        who + "heat source '" + s.name + "' watts must be >= 0");
      PANELHEAT_REQUIRE(s.quantity >= 0, ErrorCode::InvalidInput,
                        who + "heat source '" + s.name + "' quantity must be >= 0");
      PANELHEAT_REQUIRE(!s.max_temp_C || is_finite(*s.max_temp_C), ErrorCode::InvalidInput,
                        who + "heat source '" + s.name + "' rating must be finite");
    }

    PANELHEAT_REQUIRE(is_finite(ventilation.inlet_area_cm2) && ventilation.inlet_area_cm2 >= 0.0,
                      ErrorCode::InvalidInput, who + "inlet area must be >= 0");
    if (ventilation.grid) {
      PANELHEAT_REQUIRE(ventilation.grid->cols >= 1 && ventilation.grid->rows >= 1,
                        ErrorCode::InvalidInput, who + "louvre grid must be at least 1x1");
    }
  }
};

struct Layout {
  std::vector<EnclosureSection> sections;

  // Applies to every section (rear face against a wall).
  bool wall_mounted = false;

  void validate_or_throw() const {
    for (const auto& s : sections) s.validate_or_throw();
  }
};

}  // namespace panelheat
