#pragma once
/*
================================================================================
Fragment 4.0 - Thermal: IEC 60890 Constants
FILE: cpp/engine/thermal/iec60890.hpp

Purpose:
  - Every fixed number of the method in one place, named.

Notes:
  - Geometry is in metres, areas in m2, inlet openings in cm2.
  - Layout rectangles use a y-down axis (top edge = y, bottom edge = y + h).
================================================================================
*/

#include <array>

namespace panelheat::iec60890 {

// Small vs large enclosure boundary (m2 of effective area).
inline constexpr double kSmallEnclosureAeLimit_m2 = 1.25;

// Power-law exponent x.
inline constexpr double kExponentVentilated = 0.715;
inline constexpr double kExponentSealed = 0.804;

// f = h^kShapeExponent / (w * d)
inline constexpr double kShapeExponent = 1.35;
inline constexpr double kMinShapeDenominator = 1e-9;

// Adjacency: faces within this distance count as touching (m).
inline constexpr double kTouchTolerance_m = 1e-3;

// Table III surface factors b.
inline constexpr double kRoofExposed = 1.4;
inline constexpr double kRoofCovered = 0.7;
inline constexpr double kFloor = 0.0;
inline constexpr double kSideExposed = 0.9;
inline constexpr double kSideCovered = 0.5;
inline constexpr double kFrontExposed = 0.9;
inline constexpr double kRearExposed = 0.9;
inline constexpr double kRearWallMounted = 0.5;

// Partition factor d by horizontal partition count (index 0..3, 3 = "3 or more").
inline constexpr std::array<double, 4> kPartitionFactorSealedLarge{1.00, 1.05, 1.15, 1.30};
inline constexpr std::array<double, 4> kPartitionFactorVentilated{1.00, 1.05, 1.10, 1.15};
inline constexpr double kPartitionFactorSmall = 1.00;

// Volumetric heat capacity derating by altitude.
struct AltitudePoint {
  double altitude_m;
  double factor;
};

inline constexpr std::array<AltitudePoint, 7> kAltitudeDerating{{
    {0.0, 1.00},
    {500.0, 0.95},
    {1000.0, 0.89},
    {1500.0, 0.84},
    {2000.0, 0.79},
    {2500.0, 0.75},
    {3000.0, 0.71},
}};

// IP first digit at and above which no openings are permitted.
inline constexpr int kIpFirstDigitNoOpenings = 5;

}  // namespace panelheat::iec60890
