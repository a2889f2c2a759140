// SPDX-License-Identifier: MIT
#include "src/flythrough/trajectory.hpp"
#include "src/support/trace.h"

#include <cmath>
#include <numbers>

namespace gridfn {

namespace {

constexpr double kOrbitSeconds = 90.0 * 60.0;

/// k-th of n evenly spaced values in [a, b] (n >= 2)
double linspace_at(double a, double b, size_t k, size_t n) {
    return a + (b - a) * static_cast<double>(k) / static_cast<double>(n - 1);
}

double wrap_longitude(double lon) {
    if (lon > 360.0) {
        lon -= 360.0 * std::ceil((lon - 360.0) / 360.0);
    } else if (lon < 0.0) {
        lon += 360.0 * std::ceil(-lon / 360.0);
    }
    return lon;
}

}  // namespace

std::expected<Trajectory, ValidationError>
sample_trajectory(const SampleTrajectoryConfig& config) {
    if (!(config.cadence > 0.0) || !std::isfinite(config.cadence)) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidConfiguration, "cadence", config.cadence));
    }
    constexpr auto kMaxSamples = static_cast<double>(kMaxTrajectorySamples);

    const double span = config.stop_time - config.start_time;
    const double samples = span / config.cadence;
    if (!std::isfinite(span) || samples < 2.0 || !(samples < kMaxSamples)) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidConfiguration, "stop_time", config.stop_time));
    }

    // Samples per 90-minute orbit
    const double orbit_samples = kOrbitSeconds / config.cadence;
    if (orbit_samples < 2.0 || !(orbit_samples < kMaxSamples)) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidConfiguration, "cadence", config.cadence));
    }
    const auto per_orbit = static_cast<size_t>(orbit_samples);

    const auto n = static_cast<size_t>(samples);
    const double n_orbits = span / (static_cast<double>(per_orbit) * config.cadence);
    const double h_scale = (config.max_height - config.min_height) / 2.0;
    const double h_offset = (config.max_height + config.min_height) / 2.0;
    const double lat_scale = (config.max_lat - config.min_lat) / 2.0;
    const double lat_offset = (config.max_lat + config.min_lat) / 2.0;
    const double lon_end = config.lon_per_orbit * n_orbits;

    GRIDFN_TRACE_ALGO_START(GRIDFN_MODULE_FLYTHROUGH, n, per_orbit);

    Trajectory traj;
    traj.coordinate_system = CoordinateSystem{CoordinateFrame::GDZ, CoordinateGrid::SPHERICAL};
    traj.time.resize(n);
    traj.c1.resize(n);
    traj.c2.resize(n);
    traj.c3.resize(n);

    for (size_t i = 0; i < n; ++i) {
        const double phase = linspace_at(0.0, 2.0 * std::numbers::pi, i % per_orbit, per_orbit);
        traj.time[i] = linspace_at(config.start_time, config.stop_time, i, n);
        traj.c1[i] = wrap_longitude(linspace_at(0.0, lon_end, i, n)) - 180.0;
        traj.c2[i] = std::cos(phase) * lat_scale + lat_offset;
        traj.c3[i] = std::sin(phase) * h_scale + h_offset
                   - linspace_at(0.0, config.decay, i, n) * config.min_height;
    }

    GRIDFN_TRACE_ALGO_COMPLETE(GRIDFN_MODULE_FLYTHROUGH, n);
    return traj;
}

}  // namespace gridfn
