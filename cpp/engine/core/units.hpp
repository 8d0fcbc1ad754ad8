#pragma once
/*
================================================================================
Fragment 1.10 - Core: Units + Conversions
FILE: cpp/engine/core/units.hpp

Purpose:
  - Explicit unit conversion helpers so the IEC 60890 code stays readable and
    avoids silent unit bugs (mm vs m, cm^2 vs m^2, s vs h, C vs K).
================================================================================
*/

namespace panelheat::units {

// Length
inline constexpr double mm_to_m = 1.0e-3;
inline constexpr double m_to_mm = 1.0 / mm_to_m;

// Area
inline constexpr double cm2_to_m2 = 1.0e-4;
inline constexpr double m2_to_cm2 = 1.0 / cm2_to_m2;

// Time
inline constexpr double s_per_h = 3600.0;

// Temperature
inline constexpr double zero_C_in_K = 273.15;
constexpr double celsius_to_kelvin(double c) { return c + zero_C_in_K; }
constexpr double kelvin_to_celsius(double k) { return k - zero_C_in_K; }

// Air at sea level
inline constexpr double rho_air_sl = 1.20;      // kg/m^3
inline constexpr double cp_air = 1005.0;        // J/(kg K)

// Helpers
constexpr double sqr(double x) { return x * x; }

} // namespace panelheat::units
