// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace gridfn {

/// Named, unit-tagged 1D coordinate axis
///
/// Values are finite and strictly increasing with at least 2 points.
/// Produced by CoordinateRegistry and shared immutably between every
/// function bound to it.
struct CoordinateAxis {
    std::string name;            ///< e.g. "time", "lon"
    std::string unit;            ///< e.g. "hr", "deg"
    std::vector<double> values;  ///< Grid points

    [[nodiscard]] size_t size() const noexcept { return values.size(); }
    [[nodiscard]] double min() const noexcept { return values.front(); }
    [[nodiscard]] double max() const noexcept { return values.back(); }
};

/// Inclusive coordinate range of an axis with its unit
struct AxisRange {
    double min = 0.0;
    double max = 0.0;
    std::string unit;

    bool operator==(const AxisRange&) const = default;
};

}  // namespace gridfn
