/*
===============================================================================
Fragment 2.2 - Curves: Curve Family Set (family key x query x)
File: cpp/engine/curves/curve_family.hpp
===============================================================================

Purpose:
  - Immutable mapping family key -> MonotoneSpline for one digitized figure
    (e.g. Fig. 5: family key Ae, x = inlet area).
  - Two-level sample: spline within each bracketing family, then linear
    blend across the family key.

Notes:
  - Out-of-domain queries are clamped, never rejected. The returned sample
    reports what was actually used so hosts can surface the snap.
  - Safe for concurrent readers after finalize().
===============================================================================
*/

#pragma once

#include "engine/curves/monotone_spline.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace panelheat::curves {

// One coefficient lookup, with clamp transparency.
struct CoefficientSample final {
    double value = 0.0;

    double key_requested = 0.0;
    double key_used = 0.0;
    double x_requested = 0.0;
    double x_used = 0.0;

    bool key_snapped = false;
    bool x_snapped = false;

    bool snapped() const noexcept { return key_snapped || x_snapped; }
};

using CurvePoints = std::vector<CurvePoint>;
using FamilyPoints = std::map<double, CurvePoints>;

class CurveFamilySet final {
public:
    CurveFamilySet() = default;
    explicit CurveFamilySet(std::string name) : name_(std::move(name)) {}

    // Build + finalize from raw loader output.
    static CurveFamilySet from_points(std::string name, const FamilyPoints& families);

    // Adds one family. Throws on duplicate key or after finalize().
    void add_family(double key, CurvePoints points);

    // Freezes the set and computes the x domain. Throws MissingCurveData if empty.
    void finalize();

    bool finalized() const noexcept { return finalized_; }
    bool empty() const noexcept { return families_.empty(); }
    std::size_t size() const noexcept { return families_.size(); }
    const std::string& name() const noexcept { return name_; }

    double key_min() const noexcept;
    double key_max() const noexcept;
    double x_min() const noexcept { return x_lo_; }
    double x_max() const noexcept { return x_hi_; }

    std::vector<double> keys() const;
    const MonotoneSpline* family(double key) const;

    // Clamp key and x to the data domain, then blend the bracketing families.
    CoefficientSample sample(double key, double x) const;

private:
    std::string name_;
    std::map<double, MonotoneSpline> families_;
    double x_lo_ = 0.0;
    double x_hi_ = 0.0;
    bool finalized_ = false;
};

} // namespace panelheat::curves
