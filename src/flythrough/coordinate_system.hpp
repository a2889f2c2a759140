// SPDX-License-Identifier: MIT
#pragma once

#include "src/support/error_types.hpp"
#include <array>
#include <expected>
#include <string>
#include <string_view>

namespace gridfn {

/// Geophysical reference frame of a trajectory
enum class CoordinateFrame {
    GDZ,  ///< Geodetic (lon, lat, altitude)
    GEO,  ///< Geographic
    GSM,  ///< Geocentric solar magnetospheric
    GSE,  ///< Geocentric solar ecliptic
    SM,   ///< Solar magnetic
    GEI,  ///< Geocentric equatorial inertial
    MAG,  ///< Geomagnetic
    SPH,  ///< Spherical GEO
    RLL   ///< Radius, latitude, longitude
};

/// Component layout within a frame
enum class CoordinateGrid {
    SPHERICAL,  ///< (lon, lat, altitude or radius)
    CARTESIAN   ///< (x, y, z)
};

/// Frame + grid pair written as "GDZ-sph" or "SM-car"
struct CoordinateSystem {
    CoordinateFrame frame = CoordinateFrame::GDZ;
    CoordinateGrid grid = CoordinateGrid::SPHERICAL;

    bool operator==(const CoordinateSystem&) const = default;
};

/// Parse "FRAME-grid" (frame name case-insensitive, grid "sph" or "car")
[[nodiscard]] std::expected<CoordinateSystem, ValidationError>
parse_coordinate_system(std::string_view label);

/// Canonical label, e.g. "GDZ-sph"
[[nodiscard]] std::string to_string(const CoordinateSystem& system);
[[nodiscard]] std::string_view to_string(CoordinateFrame frame) noexcept;
[[nodiscard]] std::string_view to_string(CoordinateGrid grid) noexcept;

/// Units of (c1, c2, c3)
///
/// Cartesian components are in earth radii. Spherical components are
/// degrees for lon/lat and km (GDZ altitude) or R_E (radius) for c3.
[[nodiscard]] std::array<std::string, 3> coordinate_units(const CoordinateSystem& system);

}  // namespace gridfn
