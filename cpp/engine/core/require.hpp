#pragma once
/*
===============================================================================
Fragment 1.10 - Core: Numeric Guards + Require Glue
File: cpp/engine/core/require.hpp

Curve lookups and sizing formulas run on user-supplied numbers; these helpers
keep NaN/Inf out of the arithmetic and turn bad settings into PanelHeatError.
===============================================================================
*/

#include "engine/core/error.hpp"

#include <cmath>
#include <type_traits>

namespace panelheat {

inline bool is_finite(double x) noexcept { return std::isfinite(x); }

template <typename T>
constexpr T clamp(T v, T lo, T hi) noexcept {
  static_assert(std::is_arithmetic_v<T>);
  if (v < lo) return lo;
  if (v > hi) return hi;
  return v;
}

// num/den, or `fallback` when either operand or the quotient is not finite.
inline double safe_div(double num, double den, double fallback = 0.0) noexcept {
  if (den == 0.0) return fallback;
  const double q = num / den;
  return is_finite(q) ? q : fallback;
}

constexpr double lerp(double a, double b, double t) noexcept { return a + t * (b - a); }

inline double nonneg_or(double x, double fallback) noexcept {
  return is_finite(x) && x >= 0.0 ? x : fallback;
}

// ---- settings / table validation ------------------------------------------

inline void require_finite(double x, ErrorCode code, const char* what) {
  PANELHEAT_REQUIRE(is_finite(x), code, what);
}

inline void require_positive(double x, ErrorCode code, const char* what) {
  PANELHEAT_REQUIRE(is_finite(x) && x > 0.0, code, what);
}

inline void require_nonnegative(double x, ErrorCode code, const char* what) {
  PANELHEAT_REQUIRE(is_finite(x) && x >= 0.0, code, what);
}

inline void require_in_range(double x, double lo, double hi, ErrorCode code, const char* what) {
  PANELHEAT_REQUIRE(is_finite(x) && lo <= x && x <= hi, code, what);
}

} // namespace panelheat
