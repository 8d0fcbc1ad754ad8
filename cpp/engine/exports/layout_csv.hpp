#pragma once
/*
================================================================================
Fragment 5.1 - Exports: Layout CSV Import
FILE: cpp/engine/exports/layout_csv.hpp

Format (header row required, column order free, names case-insensitive):
  required: name, x_m, y_m, width_m, height_m, depth_m, power_W
  optional: max_temp_C (70), use_component_rating (0), ventilated (0),
            inlet_area_cm2 (0), installed (1), partitions (0),
            louvre_cols, louvre_rows (both or neither)

Rules:
  - One section per row. Blank lines and '#' lines are skipped.
  - x/y are the front-view position, y pointing down.
  - Malformed rows throw ParseError with the line number; the parsed layout
    is then validated (InvalidGeometry / InvalidInput).
================================================================================
*/

#include <iosfwd>
#include <string>

#include "engine/enclosure/section.hpp"

namespace panelheat {

Layout parse_layout_csv(std::istream& in, const std::string& source, bool wall_mounted = false);

Layout load_layout_csv(const std::string& path, bool wall_mounted = false);

}  // namespace panelheat
