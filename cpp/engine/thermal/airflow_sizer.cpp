#include "engine/thermal/airflow_sizer.hpp"

#include "engine/core/require.hpp"
#include "engine/core/units.hpp"
#include "engine/thermal/iec60890.hpp"

namespace panelheat::thermal {

double altitude_derating_factor(double altitude_m) noexcept {
  const auto& table = iec60890::kAltitudeDerating;
  if (!is_finite(altitude_m) || altitude_m <= table.front().altitude_m) return table.front().factor;
  if (altitude_m >= table.back().altitude_m) return table.back().factor;

  for (std::size_t i = 1; i < table.size(); ++i) {
    if (altitude_m <= table[i].altitude_m) {
      const auto& a = table[i - 1];
      const auto& b = table[i];
      const double t = safe_div(altitude_m - a.altitude_m, b.altitude_m - a.altitude_m, 0.0);
      return lerp(a.factor, b.factor, t);
    }
  }
  return table.back().factor;
}

double derated_heat_capacity(double nominal_J_m3K, double altitude_m) noexcept {
  return nominal_J_m3K * altitude_derating_factor(altitude_m);
}

double required_flow_m3h(double power_W, double allowed_rise_K, double heat_capacity_J_m3K) noexcept {
  if (!(power_W > 0.0) || !(allowed_rise_K > 0.0)) return 0.0;
  return safe_div(power_W, heat_capacity_J_m3K * allowed_rise_K, 0.0) * units::s_per_h;
}

std::optional<double> try_required_flow_m3h(double power_W, double allowed_rise_K,
                                            double heat_capacity_J_m3K) noexcept {
  if (!is_finite(allowed_rise_K) || allowed_rise_K <= 0.0) return std::nullopt;
  if (!is_finite(heat_capacity_J_m3K) || heat_capacity_J_m3K <= 0.0) return std::nullopt;
  return required_flow_m3h(power_W, allowed_rise_K, heat_capacity_J_m3K);
}

}  // namespace panelheat::thermal
