/*
===============================================================================
Fragment 2.3 - Curves: Digitized Curve Loader
File: cpp/engine/curves/curve_loader.hpp
===============================================================================

On-disk layout (one folder per figure):
  <root>/fig5/<Ae>.csv   k, ventilated   (family key Ae m2, x = inlet cm2)
  <root>/fig6/<f>.csv    c, ventilated   (family key f,     x = inlet cm2)

File format:
  - One "x,y" pair per row. Extra columns are ignored.
  - Blank lines and lines starting with '#' are skipped.
  - Filename stem is the family key ("1.5.csv" -> 1.5).

Errors:
  - IOError          : unreadable file/folder
  - ParseError       : non-numeric row or stem
  - MissingCurveData : file with no points, folder with no CSV files
===============================================================================
*/

#pragma once

#include "engine/core/logging.hpp"
#include "engine/curves/curve_family.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace panelheat::curves {

// Raw point sets for the family-keyed figures. Unset = not supplied.
struct FigureData final {
    std::optional<FamilyPoints> fig5_k_ventilated;
    std::optional<FamilyPoints> fig6_c_ventilated;
    std::string source = "none";
};

// Reads x,y rows; `source` names the stream in error messages.
CurvePoints parse_curve_csv(std::istream& in, const std::string& source);

CurvePoints load_curve_file(const std::string& path);

FamilyPoints load_curve_folder(const std::string& dir);

// A missing fig5/ or fig6/ folder leaves that figure unset.
FigureData load_figure_data(const std::string& root, LogSink& log = null_log_sink());

// Digitized sets compiled into the engine.
FigureData builtin_figure_data();

} // namespace panelheat::curves
