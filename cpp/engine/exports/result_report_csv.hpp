#pragma once
/*
================================================================================
Fragment 5.2 - Exports: Compliance Report CSV
FILE: cpp/engine/exports/result_report_csv.hpp

Purpose:
  - One row per evaluated section, fixed column order, diff-friendly.

Hardening:
  - RFC-4180 quoting for names.
  - Unset optionals (f/g, 0.75-height values, airflow) export as empty cells.
  - Multi-valued cells (infeasibility causes, figures) are '|' separated.
================================================================================
*/

#include <iosfwd>
#include <string>
#include <vector>

#include "engine/thermal/thermal_result.hpp"

namespace panelheat {

std::string result_csv_header();

std::string result_csv_row(const thermal::ThermalResult& r);

// Header + one row per result.
void write_result_csv(std::ostream& os, const std::vector<thermal::ThermalResult>& results);

// Returns false on I/O error.
bool write_result_csv_file(const std::string& path, const std::vector<thermal::ThermalResult>& results);

}  // namespace panelheat
