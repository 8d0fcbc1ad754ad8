/*
================================================================================
Fragment 1.16 - Core: CSV Text Helpers
FILE: cpp/engine/core/csv_text.cpp
================================================================================
*/

#include "engine/core/csv_text.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace panelheat::csv {

namespace {

bool is_blank(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

std::string lowered(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

} // namespace

std::string trim(std::string_view v) {
  while (!v.empty() && is_blank(v.front())) v.remove_prefix(1);
  while (!v.empty() && is_blank(v.back())) v.remove_suffix(1);
  return std::string(v);
}

std::vector<std::string> split_row(const std::string& line, char delim) {
  std::vector<std::string> fields(1);
  bool quoted = false;
  std::size_t i = 0;
  while (i < line.size()) {
    const char c = line[i++];
    std::string& field = fields.back();
    if (quoted) {
      if (c != '"') {
        field += c;
      } else if (i < line.size() && line[i] == '"') {
        field += '"';
        ++i;
      } else {
        quoted = false;
      }
      continue;
    }
    if (c == '"') quoted = true;
    else if (c == delim) fields.emplace_back();
    else if (c != '\r') field += c;
  }
  return fields;
}

bool try_parse_double(const std::string& s, double& out) {
  const std::string t = trim(s);
  if (t.empty()) return false;
  char* end = nullptr;
  const double v = std::strtod(t.c_str(), &end);
  if (end != t.c_str() + t.size() || !std::isfinite(v)) return false;
  out = v;
  return true;
}

bool try_parse_int(const std::string& s, int& out) {
  const std::string t = trim(s);
  if (t.empty()) return false;
  char* end = nullptr;
  errno = 0;
  const long v = std::strtol(t.c_str(), &end, 10);
  if (end != t.c_str() + t.size() || errno == ERANGE) return false;
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
  out = static_cast<int>(v);
  return true;
}

bool try_parse_bool(const std::string& s, bool& out) {
  const std::string t = lowered(trim(s));
  if (t == "1" || t == "true" || t == "yes" || t == "y") {
    out = true;
    return true;
  }
  if (t == "0" || t == "false" || t == "no" || t == "n") {
    out = false;
    return true;
  }
  return false;
}

std::string escape(const std::string& s, char delim) {
  const char specials[] = {delim, '"', '\n', '\r', '\0'};
  if (s.find_first_of(specials) == std::string::npos) return s;

  std::string out;
  out.reserve(s.size() + 2);
  out += '"';
  for (char c : s) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

std::string format_double(double x, int precision) {
  if (!std::isfinite(x)) return {};
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

}  // namespace panelheat::csv
