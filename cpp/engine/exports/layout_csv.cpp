/*
================================================================================
Fragment 5.1 - Exports: Layout CSV Import
FILE: cpp/engine/exports/layout_csv.cpp
================================================================================
*/

#include "engine/exports/layout_csv.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <optional>
#include <sstream>
#include <unordered_map>
#include <utility>
#include <vector>

#include "engine/core/csv_text.hpp"
#include "engine/core/error.hpp"

namespace panelheat {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

[[noreturn]] void parse_fail(const std::string& source, std::size_t line_no, const std::string& what) {
  std::ostringstream oss;
  oss << source << ":" << line_no << ": " << what;
  fail(ErrorCode::ParseError, oss.str(), PANELHEAT_SITE);
}

class RowReader {
 public:
  RowReader(const std::unordered_map<std::string, std::size_t>& cols,
            const std::vector<std::string>& fields,
            const std::string& source, std::size_t line_no)
      : cols_(cols), fields_(fields), source_(source), line_no_(line_no) {}

  std::optional<std::string> raw(const char* col) const {
    auto it = cols_.find(col);
    if (it == cols_.end() || it->second >= fields_.size()) return std::nullopt;
    std::string v = csv::trim(fields_[it->second]);
    if (v.empty()) return std::nullopt;
    return v;
  }

  double number(const char* col, std::optional<double> fallback = std::nullopt) const {
    const auto v = raw(col);
    if (!v) {
      if (fallback) return *fallback;
      parse_fail(source_, line_no_, std::string("missing value for '") + col + "'");
    }
    double out = 0.0;
    if (!csv::try_parse_double(*v, out)) {
      parse_fail(source_, line_no_, std::string("'") + col + "' is not a number: " + *v);
    }
    return out;
  }

  int integer(const char* col, int fallback) const {
    const auto v = raw(col);
    if (!v) return fallback;
    int out = 0;
    if (!csv::try_parse_int(*v, out)) {
      parse_fail(source_, line_no_, std::string("'") + col + "' is not an integer: " + *v);
    }
    return out;
  }

  bool flag(const char* col, bool fallback) const {
    const auto v = raw(col);
    if (!v) return fallback;
    bool out = false;
    if (!csv::try_parse_bool(*v, out)) {
      parse_fail(source_, line_no_, std::string("'") + col + "' is not a boolean: " + *v);
    }
    return out;
  }

 private:
  const std::unordered_map<std::string, std::size_t>& cols_;
  const std::vector<std::string>& fields_;
  const std::string& source_;
  std::size_t line_no_;
};

const char* const kRequired[] = {"name", "x_m", "y_m", "width_m", "height_m", "depth_m", "power_w"};

} // namespace

Layout parse_layout_csv(std::istream& in, const std::string& source, bool wall_mounted) {
  Layout layout;
  layout.wall_mounted = wall_mounted;

  std::unordered_map<std::string, std::size_t> cols;
  bool have_header = false;

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string t = csv::trim(line);
    if (t.empty() || t.front() == '#') continue;

    const auto fields = csv::split_row(t);

    if (!have_header) {
      for (std::size_t i = 0; i < fields.size(); ++i) {
        cols[lower(csv::trim(fields[i]))] = i;
      }
      for (const char* req : kRequired) {
        if (cols.find(req) == cols.end()) {
          parse_fail(source, line_no, std::string("header is missing column '") + req + "'");
        }
      }
      have_header = true;
      continue;
    }

    const RowReader row(cols, fields, source, line_no);

    EnclosureSection s;
    const auto name = row.raw("name");
    if (!name) parse_fail(source, line_no, "missing section name");
    s.name = *name;

    s.rect.x = row.number("x_m");
    s.rect.y = row.number("y_m");
    s.rect.width = row.number("width_m");
    s.rect.height = row.number("height_m");
    s.depth_m = row.number("depth_m");
    s.extra_power_W = row.number("power_w");
    s.max_temp_C = row.number("max_temp_c", 70.0);
    s.use_component_rating = row.flag("use_component_rating", false);
    s.horizontal_partitions = row.integer("partitions", 0);

    s.ventilation.enabled = row.flag("ventilated", false);
    s.ventilation.inlet_area_cm2 = row.number("inlet_area_cm2", 0.0);
    s.ventilation.installed = row.flag("installed", true);

    const bool has_cols = row.raw("louvre_cols").has_value();
    const bool has_rows = row.raw("louvre_rows").has_value();
    if (has_cols != has_rows) {
      parse_fail(source, line_no, "louvre_cols and louvre_rows must be given together");
    }
    if (has_cols) {
      s.ventilation.grid = LouvreGrid{row.integer("louvre_cols", 1), row.integer("louvre_rows", 1)};
    }

    layout.sections.push_back(std::move(s));
  }

  PANELHEAT_REQUIRE(have_header, ErrorCode::ParseError, source + ": empty layout file");
  layout.validate_or_throw();
  return layout;
}

Layout load_layout_csv(const std::string& path, bool wall_mounted) {
  std::ifstream in(path);
  PANELHEAT_REQUIRE(in.good(), ErrorCode::IOError, "Cannot open layout file: " + path);
  return parse_layout_csv(in, path, wall_mounted);
}

}  // namespace panelheat
