// SPDX-License-Identifier: MIT
#pragma once

#include "src/flythrough/coordinate_system.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <vector>

namespace gridfn {

/// Time-ordered positions in one coordinate system
///
/// All four component vectors must have the same length.
struct Trajectory {
    std::vector<double> time;  ///< UTC seconds
    std::vector<double> c1;
    std::vector<double> c2;
    std::vector<double> c3;
    CoordinateSystem coordinate_system{};

    [[nodiscard]] size_t size() const noexcept { return time.size(); }
    [[nodiscard]] bool consistent() const noexcept {
        return c1.size() == time.size() && c2.size() == time.size() && c3.size() == time.size();
    }
};

/// Parameters of the synthetic test orbit
/// Upper bound on the samples of one synthetic trajectory
inline constexpr size_t kMaxTrajectorySamples = 100'000'000;

struct SampleTrajectoryConfig {
    double start_time = 0.0;       ///< UTC seconds
    double stop_time = 86400.0;    ///< UTC seconds
    double max_lat = 65.0;         ///< deg
    double min_lat = -65.0;        ///< deg
    double lon_per_orbit = 363.0;  ///< deg advanced per ~90 min orbit
    double max_height = 450.0;     ///< km, starting maximum
    double min_height = 400.0;     ///< km, starting minimum
    double decay = 0.01;           ///< Total height loss as a fraction of min_height
    double cadence = 2.0;          ///< Seconds between samples
};

/// Deterministic synthetic low-earth orbit in GDZ-sph (lon, lat, alt)
///
/// One sample every `cadence` seconds. Latitude follows cos and altitude
/// follows sin of the orbital phase; altitude also decays linearly by
/// decay * min_height over the whole track. Longitude advances
/// lon_per_orbit degrees per orbit, is wrapped into [0, 360] and shifted
/// to [-180, 180].
///
/// Fails with InvalidConfiguration when the cadence is not positive, the
/// time span yields fewer than 2 samples, an orbit has fewer than 2
/// samples, or either count reaches kMaxTrajectorySamples.
[[nodiscard]] std::expected<Trajectory, ValidationError>
sample_trajectory(const SampleTrajectoryConfig& config = {});

}  // namespace gridfn
