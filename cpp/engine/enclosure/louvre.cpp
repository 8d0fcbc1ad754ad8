#include "engine/enclosure/louvre.hpp"

#include <algorithm>
#include <cmath>

#include "engine/core/require.hpp"
#include "engine/core/units.hpp"
#include "engine/thermal/iec60890.hpp"

namespace panelheat {

bool ip_permits_openings(int ip_first_digit) noexcept {
  return ip_first_digit < iec60890::kIpFirstDigitNoOpenings;
}

double ip_open_area_factor(int ip_first_digit, const IpMeshTable& table) noexcept {
  if (!ip_permits_openings(ip_first_digit)) return 0.0;
  const int idx = std::clamp(ip_first_digit, 0, static_cast<int>(table.open_area_factor.size()) - 1);
  return table.open_area_factor[static_cast<std::size_t>(idx)];
}

int louvre_count(const LouvreGrid& grid) noexcept {
  const int cols = std::max(1, grid.cols);
  const int rows = std::max(1, grid.rows);
  return cols * (2 * rows + 1);
}

double effective_inlet_area_cm2(const LouvreGrid& grid,
                                const LouvreDefinition& louvre,
                                int ip_first_digit,
                                const IpMeshTable& table) noexcept {
  const double factor = ip_open_area_factor(ip_first_digit, table);
  if (factor <= 0.0) return 0.0;
  const double per = nonneg_or(louvre.free_area_cm2, 0.0) * factor;
  return static_cast<double>(louvre_count(grid)) * per;
}

namespace {

// Tolerance keeps an exact fit from flooring one short.
int fit_count(double span_mm, double size_mm, double gap_mm) noexcept {
  const double n = std::floor((span_mm + gap_mm) / (size_mm + gap_mm) + 1e-9);
  if (!is_finite(n) || n < 1.0) return 0;
  return n > 1e6 ? 1000000 : static_cast<int>(n);
}

} // namespace

LouvreGrid max_louvre_grid(double width_m, double height_m, const LouvreDefinition& louvre) noexcept {
  const double margin = 2.0 * nonneg_or(louvre.edge_margin_mm, 0.0);
  const double gap = nonneg_or(louvre.spacing_mm, 0.0);
  const double span_w = nonneg_or(width_m, 0.0) * units::m_to_mm - margin;
  const double span_h = nonneg_or(height_m, 0.0) * units::m_to_mm - margin;

  LouvreGrid g;
  g.cols = std::max(1, fit_count(span_w, louvre.width_mm, gap));
  const int total_rows = fit_count(span_h, louvre.height_mm, gap);
  g.rows = std::max(1, (total_rows - 1) / 2);
  return g;
}

double max_effective_inlet_area_cm2(double width_m, double height_m,
                                    const LouvreDefinition& louvre,
                                    int ip_first_digit,
                                    const IpMeshTable& table) noexcept {
  return effective_inlet_area_cm2(max_louvre_grid(width_m, height_m, louvre), louvre, ip_first_digit, table);
}

double resolve_inlet_area_cm2(const Ventilation& v, const VentilationSettings& vs) noexcept {
  if (!v.enabled) return 0.0;
  if (v.grid) return effective_inlet_area_cm2(*v.grid, vs.louvre, vs.ip_first_digit, vs.ip_mesh);
  return nonneg_or(v.inlet_area_cm2, 0.0);
}

}  // namespace panelheat
