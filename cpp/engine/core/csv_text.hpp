#pragma once
/*
================================================================================
Fragment 1.16 - Core: CSV Text Helpers
FILE: cpp/engine/core/csv_text.hpp

Purpose:
  - Shared tokenizer/formatter for every CSV boundary of the engine
    (digitized curve files, layout import, compliance report export).

Hardening:
  - Quote-aware split ("" escape only).
  - Numeric parse must consume the whole trimmed field and be finite.
  - Non-finite doubles export as empty string (not "nan").
================================================================================
*/

#include <string>
#include <string_view>
#include <vector>

namespace panelheat::csv {

std::string trim(std::string_view v);

// Minimal CSV splitter with quote handling.
std::vector<std::string> split_row(const std::string& line, char delim = ',');

bool try_parse_double(const std::string& s, double& out);
bool try_parse_int(const std::string& s, int& out);

// Accepts 1/0, true/false, yes/no, y/n (case-insensitive).
bool try_parse_bool(const std::string& s, bool& out);

// Quote if the field contains the delimiter, a quote or a line break.
std::string escape(const std::string& s, char delim = ',');

std::string format_double(double x, int precision = 6);

}  // namespace panelheat::csv
