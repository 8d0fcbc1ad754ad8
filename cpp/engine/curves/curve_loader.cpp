/*
===============================================================================
Fragment 2.3 - Curves: Digitized Curve Loader
File: cpp/engine/curves/curve_loader.cpp
===============================================================================
*/

#include "engine/curves/curve_loader.hpp"

#include "engine/core/csv_text.hpp"
#include "engine/curves/iec60890_figures.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <istream>
#include <sstream>
#include <system_error>

namespace panelheat::curves {

namespace fs = std::filesystem;

CurvePoints parse_curve_csv(std::istream& in, const std::string& source) {
    CurvePoints pts;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        const std::string t = csv::trim(line);
        if (t.empty() || t.front() == '#') continue;

        const auto fields = csv::split_row(t);
        double x = 0.0;
        double y = 0.0;
        const bool ok = fields.size() >= 2
                        && csv::try_parse_double(fields[0], x)
                        && csv::try_parse_double(fields[1], y);
        if (!ok) {
            std::ostringstream oss;
            oss << "Curve row is not numeric: " << source << ":" << line_no;
            fail(ErrorCode::ParseError, oss.str(), PANELHEAT_SITE);
        }
        pts.push_back(CurvePoint{x, y});
    }

    PANELHEAT_REQUIRE(!pts.empty(), ErrorCode::MissingCurveData, "No data in " + source);

    std::sort(pts.begin(), pts.end(),
              [](const CurvePoint& a, const CurvePoint& b) { return a.x < b.x; });
    return pts;
}

CurvePoints load_curve_file(const std::string& path) {
    std::ifstream in(path);
    PANELHEAT_REQUIRE(in.good(), ErrorCode::IOError, "Cannot open curve file: " + path);
    return parse_curve_csv(in, path);
}

FamilyPoints load_curve_folder(const std::string& dir) {
    std::error_code ec;
    PANELHEAT_REQUIRE(fs::is_directory(dir, ec), ErrorCode::IOError,
                      "Curve folder not found: " + dir);

    FamilyPoints out;
    fs::directory_iterator it(dir, ec);
    PANELHEAT_REQUIRE(!ec, ErrorCode::IOError, "Cannot list curve folder: " + dir);

    for (const auto& entry : it) {
        if (!entry.is_regular_file()) continue;
        const fs::path p = entry.path();
        if (p.extension() != ".csv") continue;

        double key = 0.0;
        PANELHEAT_REQUIRE(csv::try_parse_double(p.stem().string(), key), ErrorCode::ParseError,
                          "Invalid curve filename: " + p.filename().string());
        PANELHEAT_REQUIRE(out.find(key) == out.end(), ErrorCode::ParseError,
                          "Duplicate curve key: " + p.filename().string());

        out.emplace(key, load_curve_file(p.string()));
    }

    PANELHEAT_REQUIRE(!out.empty(), ErrorCode::MissingCurveData, "No CSV files found in " + dir);
    return out;
}

FigureData load_figure_data(const std::string& root, LogSink& log) {
    FigureData data;
    data.source = root;

    std::error_code ec;
    PANELHEAT_REQUIRE(fs::is_directory(root, ec), ErrorCode::IOError,
                      "Curve root not found: " + root);

    const fs::path fig5 = fs::path(root) / "fig5";
    const fs::path fig6 = fs::path(root) / "fig6";

    if (fs::is_directory(fig5, ec)) {
        data.fig5_k_ventilated = load_curve_folder(fig5.string());
        log.info("curves: Fig. 5 loaded from " + fig5.string() + " ("
                 + std::to_string(data.fig5_k_ventilated->size()) + " families)");
    } else {
        log.info("curves: no Fig. 5 folder under " + root);
    }

    if (fs::is_directory(fig6, ec)) {
        data.fig6_c_ventilated = load_curve_folder(fig6.string());
        log.info("curves: Fig. 6 loaded from " + fig6.string() + " ("
                 + std::to_string(data.fig6_c_ventilated->size()) + " families)");
    } else {
        log.info("curves: no Fig. 6 folder under " + root);
    }

    return data;
}

FigureData builtin_figure_data() {
    FigureData data;
    data.fig5_k_ventilated = figures::fig5_k_ventilated_points();
    data.fig6_c_ventilated = figures::fig6_c_ventilated_points();
    data.source = "builtin";
    return data;
}

} // namespace panelheat::curves
