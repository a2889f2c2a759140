// SPDX-License-Identifier: MIT
#include "src/flythrough/flythrough.hpp"
#include "src/grid/functionalize.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <map>
#include <vector>

int main() {
    using namespace gridfn;

    // 25 hourly samples over one day, 12 longitudes
    std::vector<double> hours;
    for (int i = 0; i <= 24; ++i) hours.push_back(static_cast<double>(i));
    std::vector<double> lons;
    for (int j = 0; j < 12; ++j) lons.push_back(-180.0 + 360.0 * j / 11.0);

    std::vector<double> temperature;
    for (size_t i = 0; i < hours.size(); ++i) {
        for (size_t j = 0; j < lons.size(); ++j) {
            temperature.push_back(100.0 + static_cast<double>(i) + 0.5 * static_cast<double>(j));
        }
    }

    FunctionRegistry registry;
    FunctionalizeOptions options;
    options.coordinate_system = "GDZ-sph";
    auto ok = functionalize(registry,
        {{"time", "hr", NdArray::vector(hours)}, {"lon", "deg", NdArray::vector(lons)}},
        {{"T", "S", NdArray{{hours.size(), lons.size()}, temperature}}},
        options);
    if (!ok) {
        std::cerr << "functionalize failed: " << ok.error() << "\n";
        return 1;
    }

    auto meta = registry.get_metadata("T");
    if (meta) {
        (*meta)->set_citation("Synthetic diurnal temperature");
    }

    std::cout << "=== Registered functions ===\n";
    for (const auto& row : registry.summary()) {
        std::cout << row.symbol << " [" << row.unit << "] : " << row.lhs << " = " << row.rhs;
        for (const auto& [arg, unit] : row.arg_units) {
            std::cout << "  " << arg << "[" << unit << "]";
        }
        std::cout << "\n";
    }

    std::cout << "\n=== Coordinate ranges ===\n";
    auto ranges = registry.coordinate_range();
    if (!ranges) {
        std::cerr << "coordinate_range failed: " << GridError(ranges.error()) << "\n";
        return 1;
    }
    for (const auto& [axis, range] : *ranges) {
        std::cout << axis << ": [" << range.min << ", " << range.max << "] " << range.unit << "\n";
    }

    auto t = registry.get("T").value();
    std::cout << "\n=== Evaluation ===\n" << std::fixed << std::setprecision(4);
    std::cout << "T(0, -180)   = " << t.eval(std::map<std::string, double>{{"time", 0.0}, {"lon", -180.0}}).value() << "\n";
    std::cout << "T(6.5, 12.3) = " << t.eval(std::map<std::string, double>{{"time", 6.5}, {"lon", 12.3}}).value() << "\n";

    auto out_of_range = t.eval(std::map<std::string, double>{{"time", 30.0}, {"lon", 0.0}});
    if (!out_of_range) {
        std::cout << "T(30, 0)     -> " << out_of_range.error() << "\n";
    }

    auto noon = t.restrict("time", 12.0);
    if (noon) {
        std::cout << noon->symbol() << " at lon 45 = "
                  << noon->eval(std::map<std::string, double>{{"lon", 45.0}}).value() << "\n";
    }

    // Sample along a synthetic orbit; time in the trajectory is seconds,
    // so bind a seconds-based copy of the temperature field
    std::vector<double> seconds;
    for (double h : hours) seconds.push_back(h * 3600.0);
    auto ok_s = functionalize(registry,
        {{"time", "s", NdArray::vector(seconds)}, {"lon", "deg", NdArray::vector(lons)}},
        {{"T_s", "S", NdArray{{hours.size(), lons.size()}, temperature}}});
    if (!ok_s) {
        std::cerr << "functionalize failed: " << ok_s.error() << "\n";
        return 1;
    }

    SampleTrajectoryConfig config;
    config.cadence = 600.0;
    auto traj = sample_trajectory(config);
    if (!traj) {
        std::cerr << "sample_trajectory failed: " << traj.error() << "\n";
        return 1;
    }

    auto flown = fly_through(registry, {"T_s"}, *traj);
    if (!flown) {
        std::cerr << "fly_through failed: " << flown.error() << "\n";
        return 1;
    }

    std::cout << "\n=== Flythrough (" << flown->size() << " of " << traj->size() << " points) ===\n";
    for (size_t k = 0; k < std::min<size_t>(flown->size(), 5); ++k) {
        std::cout << "t=" << flown->time[k] << " lon=" << flown->c1[k]
                  << " T=" << flown->variables.at("T_s")[k] << "\n";
    }

    return 0;
}
