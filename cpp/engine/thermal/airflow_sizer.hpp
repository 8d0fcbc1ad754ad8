#pragma once
/*
================================================================================
Fragment 4.3 - Thermal: Airflow Sizer
FILE: cpp/engine/thermal/airflow_sizer.hpp

Purpose:
  - Invert the steady-state air heat balance
        P = Cv * Q * dT
    for the forced volumetric flow Q (m3/h) that removes P watts at an
    allowed rise dT, with Cv derated for altitude.
================================================================================
*/

#include <optional>

namespace panelheat::thermal {

// Linear interpolation of the altitude table, clamped at 0 m and 3000 m.
double altitude_derating_factor(double altitude_m) noexcept;

// Nominal Cv scaled by altitude_derating_factor().
double derated_heat_capacity(double nominal_J_m3K, double altitude_m) noexcept;

// 0 when power <= 0 or rise <= 0.
double required_flow_m3h(double power_W, double allowed_rise_K, double heat_capacity_J_m3K) noexcept;

// Same, but an ill-posed inversion (rise <= 0 or Cv <= 0) yields nullopt.
std::optional<double> try_required_flow_m3h(double power_W, double allowed_rise_K,
                                            double heat_capacity_J_m3K) noexcept;

}  // namespace panelheat::thermal
