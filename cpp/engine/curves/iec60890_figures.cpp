/*
===============================================================================
Fragment 2.4 - Curves: Built-in IEC 60890 Figure Data
File: cpp/engine/curves/iec60890_figures.cpp
===============================================================================
*/

#include "engine/curves/iec60890_figures.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace panelheat::curves::figures {

namespace {

// Inlet opening areas (cm2) shared by every Fig. 5 / Fig. 6 family.
constexpr std::array<double, 11> kInletCm2{50.0, 100.0, 150.0, 200.0, 300.0, 400.0,
                                           500.0, 600.0, 700.0, 800.0, 1000.0};

using Row = std::array<double, 11>;

struct FamilyRow final {
    double key;
    Row values;
};

FamilyPoints build_families(const FamilyRow* rows, std::size_t n) {
    FamilyPoints out;
    for (std::size_t r = 0; r < n; ++r) {
        CurvePoints pts;
        pts.reserve(kInletCm2.size());
        for (std::size_t i = 0; i < kInletCm2.size(); ++i) {
            pts.push_back(CurvePoint{kInletCm2[i], rows[r].values[i]});
        }
        out.emplace(rows[r].key, std::move(pts));
    }
    return out;
}

// Fig. 5: k by Ae (m2)
const FamilyRow kFig5Rows[] = {
    { 1.0, {0.323, 0.284, 0.259, 0.241, 0.216, 0.198, 0.184, 0.173, 0.164, 0.156, 0.144}},
    { 1.5, {0.240, 0.211, 0.192, 0.179, 0.160, 0.147, 0.137, 0.128, 0.122, 0.116, 0.107}},
    { 2.0, {0.194, 0.171, 0.156, 0.145, 0.130, 0.119, 0.110, 0.104, 0.098, 0.094, 0.086}},
    { 2.5, {0.165, 0.145, 0.132, 0.123, 0.110, 0.101, 0.094, 0.088, 0.084, 0.080, 0.073}},
    { 3.0, {0.144, 0.127, 0.116, 0.108, 0.096, 0.088, 0.082, 0.077, 0.073, 0.070, 0.064}},
    { 4.0, {0.117, 0.103, 0.094, 0.087, 0.078, 0.071, 0.066, 0.062, 0.059, 0.056, 0.052}},
    { 5.0, {0.099, 0.087, 0.079, 0.074, 0.066, 0.061, 0.056, 0.053, 0.050, 0.048, 0.044}},
    { 6.0, {0.087, 0.076, 0.069, 0.065, 0.058, 0.053, 0.049, 0.046, 0.044, 0.042, 0.039}},
    { 7.0, {0.077, 0.068, 0.062, 0.058, 0.052, 0.047, 0.044, 0.041, 0.039, 0.037, 0.034}},
    { 8.0, {0.070, 0.062, 0.056, 0.052, 0.047, 0.043, 0.040, 0.038, 0.036, 0.034, 0.031}},
    {10.0, {0.060, 0.052, 0.048, 0.044, 0.040, 0.036, 0.034, 0.032, 0.030, 0.029, 0.026}},
    {12.0, {0.052, 0.046, 0.042, 0.039, 0.035, 0.032, 0.030, 0.028, 0.026, 0.025, 0.023}},
    {14.0, {0.046, 0.041, 0.037, 0.035, 0.031, 0.028, 0.026, 0.025, 0.024, 0.022, 0.021}},
};

// Fig. 6: c by f
const FamilyRow kFig6Rows[] = {
    { 1.5, {1.334, 1.362, 1.387, 1.407, 1.439, 1.462, 1.478, 1.490, 1.499, 1.505, 1.512}},
    { 2.0, {1.394, 1.423, 1.447, 1.467, 1.499, 1.522, 1.539, 1.551, 1.559, 1.565, 1.573}},
    { 3.0, {1.479, 1.508, 1.532, 1.553, 1.585, 1.608, 1.624, 1.636, 1.644, 1.650, 1.658}},
    { 4.0, {1.540, 1.568, 1.593, 1.613, 1.645, 1.668, 1.684, 1.696, 1.705, 1.711, 1.718}},
    { 5.0, {1.587, 1.615, 1.639, 1.660, 1.692, 1.715, 1.731, 1.743, 1.752, 1.758, 1.765}},
    { 6.0, {1.625, 1.653, 1.678, 1.698, 1.730, 1.753, 1.770, 1.781, 1.790, 1.796, 1.803}},
    { 7.0, {1.657, 1.686, 1.710, 1.731, 1.763, 1.786, 1.802, 1.814, 1.822, 1.828, 1.836}},
    { 8.0, {1.685, 1.714, 1.738, 1.759, 1.791, 1.814, 1.830, 1.842, 1.850, 1.856, 1.864}},
    { 9.0, {1.710, 1.739, 1.763, 1.783, 1.815, 1.838, 1.855, 1.866, 1.875, 1.881, 1.888}},
    {10.0, {1.732, 1.761, 1.785, 1.805, 1.837, 1.860, 1.877, 1.889, 1.897, 1.903, 1.911}},
};

} // namespace

CurvePoints fig3_k_sealed_large_points() {
    return {
        {1.25, 0.420}, {1.5, 0.370}, {2.0, 0.305}, {2.5, 0.262}, {3.0, 0.232},
        {4.0, 0.190}, {5.0, 0.163}, {6.0, 0.143}, {7.0, 0.128}, {8.0, 0.116},
        {10.0, 0.099}, {12.0, 0.087}, {14.0, 0.078},
    };
}

CurvePoints fig4_c_sealed_large_curve1_points() {
    return {
        {0.6, 1.225}, {1.0, 1.260}, {1.5, 1.290}, {2.0, 1.315}, {3.0, 1.350},
        {4.0, 1.375}, {5.0, 1.395}, {6.0, 1.410}, {7.0, 1.423}, {8.0, 1.435},
        {9.0, 1.445}, {10.0, 1.455}, {11.0, 1.463}, {12.0, 1.470},
    };
}

FamilyPoints fig5_k_ventilated_points() {
    return build_families(kFig5Rows, sizeof(kFig5Rows) / sizeof(kFig5Rows[0]));
}

FamilyPoints fig6_c_ventilated_points() {
    return build_families(kFig6Rows, sizeof(kFig6Rows) / sizeof(kFig6Rows[0]));
}

} // namespace panelheat::curves::figures
