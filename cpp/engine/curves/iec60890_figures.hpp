/*
===============================================================================
Fragment 2.4 - Curves: Built-in IEC 60890 Figure Data
File: cpp/engine/curves/iec60890_figures.hpp
===============================================================================

Digitized reference data compiled into the engine:

  Fig. 3  k, sealed, Ae > 1.25 m2        x = Ae (m2)
  Fig. 4  c, sealed, Ae > 1.25 m2        x = f, curve 1 base + offsets 2..5
  Fig. 5  k, ventilated                   family Ae (m2), x = inlet (cm2)
  Fig. 6  c, ventilated                   family f,       x = inlet (cm2)
  Fig. 7  k, sealed, Ae <= 1.25 m2       power law through two anchors
  Fig. 8  c, sealed, Ae <= 1.25 m2       power law through two anchors

Power-law anchors (y = C * x^B):
  B = ln(y1 / y0) / ln(x1 / x0),  C = y0 / x0^B
  Fig. 7: (0.10, 2.75) and (1.25, 0.42)  ->  B ~ -0.7440, C ~ 0.4958
  Fig. 8: (0.50, 1.10) and (3.00, 1.50)  ->  B ~ +0.1731, C ~ 1.2400
===============================================================================
*/

#pragma once

#include "engine/curves/curve_family.hpp"

#include <array>

namespace panelheat::curves::figures {

struct Anchor final {
    double x = 0.0;
    double y = 0.0;
};

// Fig. 3 / Fig. 4
CurvePoints fig3_k_sealed_large_points();
CurvePoints fig4_c_sealed_large_curve1_points();

// Added to the curve-1 value for curve numbers 1..5.
inline constexpr std::array<double, 5> kFig4CurveOffsets{0.0, -0.035, -0.070, -0.105, -0.140};

// Fig. 7 (x = Ae m2)
inline constexpr Anchor kFig7Anchor0{0.10, 2.75};
inline constexpr Anchor kFig7Anchor1{1.25, 0.42};
inline constexpr double kFig7XMin = 0.05;
inline constexpr double kFig7XMax = 1.25;

// Fig. 8 (x = g = h / w)
inline constexpr Anchor kFig8Anchor0{0.50, 1.10};
inline constexpr Anchor kFig8Anchor1{3.00, 1.50};
inline constexpr double kFig8XMin = 0.50;
inline constexpr double kFig8XMax = 5.00;

// Fig. 5 / Fig. 6 digitized families
FamilyPoints fig5_k_ventilated_points();
FamilyPoints fig6_c_ventilated_points();

// Closed-form stand-ins when Fig. 5 / Fig. 6 are not supplied.
//   k_vent(Ae, S) = C * Ae^B * 0.93 / (1 + 0.62 * (S / 100)^0.55)
//     with C, B through (1.25, 0.420) and (14.0, 0.078)
//   c_vent(f, S)  = 1.30 + 0.21 * ln(f / 1.5) + 0.22 * (1 - exp(-S / 300))
inline constexpr Anchor kFig5FallbackAnchor0{1.25, 0.420};
inline constexpr Anchor kFig5FallbackAnchor1{14.0, 0.078};
inline constexpr double kFig5FallbackScale = 0.93;
inline constexpr double kFig5FallbackOpeningGain = 0.62;
inline constexpr double kFig5FallbackOpeningExp = 0.55;
inline constexpr double kFig5FallbackAeMin = 1.0;
inline constexpr double kFig5FallbackAeMax = 14.0;

inline constexpr double kFig6FallbackBase = 1.30;
inline constexpr double kFig6FallbackShapeGain = 0.21;
inline constexpr double kFig6FallbackOpeningGain = 0.22;
inline constexpr double kFig6FallbackOpeningScaleCm2 = 300.0;
inline constexpr double kFig6FallbackFMin = 1.5;
inline constexpr double kFig6FallbackFMax = 10.0;

inline constexpr double kVentInletMinCm2 = 0.0;
inline constexpr double kVentInletMaxCm2 = 1000.0;

} // namespace panelheat::curves::figures
