/*
===============================================================================
Fragment 2.2 - Curves: Curve Family Set
File: cpp/engine/curves/curve_family.cpp
===============================================================================
*/

#include "engine/curves/curve_family.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace panelheat::curves {

CurveFamilySet CurveFamilySet::from_points(std::string name, const FamilyPoints& families) {
    CurveFamilySet set(std::move(name));
    for (const auto& [key, pts] : families) {
        set.add_family(key, pts);
    }
    set.finalize();
    return set;
}

void CurveFamilySet::add_family(double key, CurvePoints points) {
    PANELHEAT_REQUIRE(!finalized_, ErrorCode::InvalidConfig,
                      "CurveFamilySet: add_family after finalize (" + name_ + ")");
    PANELHEAT_REQUIRE(is_finite(key), ErrorCode::InvalidInput,
                      "CurveFamilySet: non-finite family key (" + name_ + ")");
    PANELHEAT_REQUIRE(!points.empty(), ErrorCode::MissingCurveData,
                      "CurveFamilySet: family without points (" + name_ + ")");
    PANELHEAT_REQUIRE(families_.find(key) == families_.end(), ErrorCode::InvalidInput,
                      "CurveFamilySet: duplicate family key (" + name_ + ")");

    families_.emplace(key, MonotoneSpline(std::move(points)));
}

void CurveFamilySet::finalize() {
    PANELHEAT_REQUIRE(!families_.empty(), ErrorCode::MissingCurveData,
                      "CurveFamilySet: no families (" + name_ + ")");

    bool first = true;
    for (const auto& [key, spline] : families_) {
        (void)key;
        if (first) {
            x_lo_ = spline.x_min();
            x_hi_ = spline.x_max();
            first = false;
            continue;
        }
        x_lo_ = std::min(x_lo_, spline.x_min());
        x_hi_ = std::max(x_hi_, spline.x_max());
    }
    finalized_ = true;
}

double CurveFamilySet::key_min() const noexcept {
    return families_.empty() ? 0.0 : families_.begin()->first;
}

double CurveFamilySet::key_max() const noexcept {
    return families_.empty() ? 0.0 : families_.rbegin()->first;
}

std::vector<double> CurveFamilySet::keys() const {
    std::vector<double> out;
    out.reserve(families_.size());
    for (const auto& kv : families_) out.push_back(kv.first);
    return out;
}

const MonotoneSpline* CurveFamilySet::family(double key) const {
    auto it = families_.find(key);
    return (it == families_.end()) ? nullptr : &it->second;
}

CoefficientSample CurveFamilySet::sample(double key, double x) const {
    CoefficientSample s;
    s.key_requested = key;
    s.x_requested = x;
    if (families_.empty()) return s;

    const double kq = is_finite(key) ? clamp(key, key_min(), key_max()) : key_min();
    const double xq = is_finite(x) ? clamp(x, x_lo_, x_hi_) : x_lo_;

    s.key_used = kq;
    s.x_used = xq;
    s.key_snapped = (kq != key);
    s.x_snapped = (xq != x);

    // Bracket: lo <= kq <= hi.
    auto hi = families_.lower_bound(kq);
    if (hi == families_.end()) {
        s.value = families_.rbegin()->second.eval(xq);
        return s;
    }
    if (hi->first == kq || hi == families_.begin()) {
        s.value = hi->second.eval(xq);
        return s;
    }
    auto lo = std::prev(hi);

    const double y0 = lo->second.eval(xq);
    const double y1 = hi->second.eval(xq);
    const double t = clamp(safe_div(kq - lo->first, hi->first - lo->first, 0.0), 0.0, 1.0);
    s.value = lerp(y0, y1, t);
    return s;
}

} // namespace panelheat::curves
