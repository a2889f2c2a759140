// SPDX-License-Identifier: MIT
#include "src/flythrough/flythrough.hpp"
#include "src/support/parallel.hpp"
#include "src/support/trace.h"

#include <array>
#include <cmath>
#include <limits>
#include <utility>

namespace gridfn {

namespace {

const std::vector<double>& column(const Trajectory& traj, TrajectoryComponent c) {
    switch (c) {
        case TrajectoryComponent::TIME: return traj.time;
        case TrajectoryComponent::C1:   return traj.c1;
        case TrajectoryComponent::C2:   return traj.c2;
        case TrajectoryComponent::C3:   return traj.c3;
    }
    return traj.time;
}

/// Function resolved against the bindings
struct Sampler {
    std::string name;
    AnyGriddedFunction fn;
    std::vector<const std::vector<double>*> columns;  ///< Argument order
};

}  // namespace

AxisBindings default_bindings(const CoordinateSystem& system) {
    AxisBindings bindings{{"time", TrajectoryComponent::TIME}};
    if (system.grid == CoordinateGrid::CARTESIAN) {
        bindings["x"] = TrajectoryComponent::C1;
        bindings["y"] = TrajectoryComponent::C2;
        bindings["z"] = TrajectoryComponent::C3;
        return bindings;
    }
    bindings["lon"] = TrajectoryComponent::C1;
    bindings["lat"] = TrajectoryComponent::C2;
    if (system.frame == CoordinateFrame::GDZ) {
        bindings["height"] = TrajectoryComponent::C3;
    } else {
        bindings["radius"] = TrajectoryComponent::C3;
    }
    return bindings;
}

std::expected<FlythroughResult, GridError> fly_through(
    const FunctionRegistry& registry,
    const std::vector<std::string>& names,
    const Trajectory& trajectory,
    const AxisBindings& bindings)
{
    if (names.empty()) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidConfiguration));
    }
    if (!trajectory.consistent()) {
        GRIDFN_TRACE_VALIDATION_ERROR(GRIDFN_MODULE_FLYTHROUGH,
            static_cast<int>(ValidationErrorCode::RaggedTrajectory), trajectory.size(), 0.0);
        return std::unexpected(ValidationError(
            ValidationErrorCode::RaggedTrajectory, {}, 0.0, trajectory.size()));
    }

    std::vector<Sampler> samplers;
    samplers.reserve(names.size());
    for (const auto& name : names) {
        auto fn = registry.get(name);
        if (!fn.has_value()) {
            return std::unexpected(fn.error());
        }
        Sampler s{name, std::move(fn.value()), {}};
        const auto args = s.fn.arg_names();
        for (size_t d = 0; d < args.size(); ++d) {
            auto it = bindings.find(args[d]);
            if (it == bindings.end()) {
                GRIDFN_TRACE_VALIDATION_ERROR(GRIDFN_MODULE_FLYTHROUGH,
                    static_cast<int>(ValidationErrorCode::UnboundAxis), d, 0.0);
                return std::unexpected(ValidationError(
                    ValidationErrorCode::UnboundAxis, args[d], 0.0, d));
            }
            s.columns.push_back(&column(trajectory, it->second));
        }
        samplers.push_back(std::move(s));
    }

    const size_t n = trajectory.size();
    GRIDFN_TRACE_ALGO_START(GRIDFN_MODULE_FLYTHROUGH, n, samplers.size());

    // 1 while the point is inside every domain seen so far
    std::vector<unsigned char> keep(n, 1);
    std::vector<std::vector<double>> values(samplers.size());

    for (size_t f = 0; f < samplers.size(); ++f) {
        const auto& s = samplers[f];
        auto& out = values[f];
        out.assign(n, std::numeric_limits<double>::quiet_NaN());
        const size_t dims = s.columns.size();

        GRIDFN_PRAGMA_PARALLEL_FOR_STATIC
        for (size_t i = 0; i < n; ++i) {
            std::array<double, kMaxDimensions> query{};
            for (size_t d = 0; d < dims; ++d) {
                query[d] = (*s.columns[d])[i];
            }
            auto v = s.fn.eval(std::span<const double>(query.data(), dims));
            if (v.has_value()) {
                out[i] = v.value();
            } else {
                keep[i] = 0;
            }
        }

        [[maybe_unused]] size_t kept = 0;
        for (auto k : keep) kept += k;
        GRIDFN_TRACE_FLYTHROUGH_PROGRESS(n, kept);
    }

    FlythroughResult result;
    result.coordinate_system = trajectory.coordinate_system;
    for (size_t i = 0; i < n; ++i) {
        if (!keep[i]) continue;
        result.net_idx.push_back(i);
        result.time.push_back(trajectory.time[i]);
        result.c1.push_back(trajectory.c1[i]);
        result.c2.push_back(trajectory.c2[i]);
        result.c3.push_back(trajectory.c3[i]);
    }
    for (size_t f = 0; f < samplers.size(); ++f) {
        std::vector<double> kept_values;
        kept_values.reserve(result.net_idx.size());
        for (size_t idx : result.net_idx) {
            kept_values.push_back(values[f][idx]);
        }
        result.variables[samplers[f].name] = std::move(kept_values);
        result.units[samplers[f].name] = samplers[f].fn.unit();
    }

    const auto component_units = coordinate_units(trajectory.coordinate_system);
    result.units["time"] = "s";
    result.units["c1"] = component_units[0];
    result.units["c2"] = component_units[1];
    result.units["c3"] = component_units[2];

    GRIDFN_TRACE_ALGO_COMPLETE(GRIDFN_MODULE_FLYTHROUGH, result.size());
    return result;
}

std::expected<FlythroughResult, GridError> fly_through(
    const FunctionRegistry& registry,
    const std::vector<std::string>& names,
    const Trajectory& trajectory)
{
    return fly_through(registry, names, trajectory,
                       default_bindings(trajectory.coordinate_system));
}

}  // namespace gridfn
