// SPDX-License-Identifier: MIT
#pragma once

#include "src/flythrough/coordinate_system.hpp"
#include "src/flythrough/trajectory.hpp"
#include "src/grid/function_registry.hpp"
#include "src/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <map>
#include <string>
#include <vector>

namespace gridfn {

/// Trajectory column supplying an axis value
enum class TrajectoryComponent {
    TIME,
    C1,
    C2,
    C3
};

/// Axis name -> trajectory column
using AxisBindings = std::map<std::string, TrajectoryComponent>;

/// Conventional axis names of a coordinate system
///
/// "time" is always bound. Spherical grids bind "lon", "lat" and either
/// "height" (GDZ) or "radius"; cartesian grids bind "x", "y", "z".
[[nodiscard]] AxisBindings default_bindings(const CoordinateSystem& system);

/// Registered functions sampled along a trajectory
///
/// Only points inside the domain of every requested function survive;
/// net_idx holds each surviving point's index in the input trajectory.
struct FlythroughResult {
    std::vector<double> time;
    std::vector<double> c1;
    std::vector<double> c2;
    std::vector<double> c3;
    std::vector<size_t> net_idx;
    std::map<std::string, std::vector<double>> variables;
    std::map<std::string, std::string> units;  ///< Variables plus "time", "c1", "c2", "c3"
    CoordinateSystem coordinate_system{};

    [[nodiscard]] size_t size() const noexcept { return time.size(); }
};

/// Evaluate the named functions at every trajectory point
///
/// A point is outside a function's domain when the function's bounds
/// policy rejects it (always the case for NaN coordinates). Fails with
/// NotFoundError for an unknown name and ValidationError for an empty
/// name list, a ragged trajectory, or an argument without a binding.
[[nodiscard]] std::expected<FlythroughResult, GridError> fly_through(
    const FunctionRegistry& registry,
    const std::vector<std::string>& names,
    const Trajectory& trajectory,
    const AxisBindings& bindings);

/// fly_through() with default_bindings(trajectory.coordinate_system)
[[nodiscard]] std::expected<FlythroughResult, GridError> fly_through(
    const FunctionRegistry& registry,
    const std::vector<std::string>& names,
    const Trajectory& trajectory);

}  // namespace gridfn
