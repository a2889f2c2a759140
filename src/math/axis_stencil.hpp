// SPDX-License-Identifier: MIT
/**
 * @file axis_stencil.hpp
 * @brief 1D interpolation weights along a single axis
 *
 * Every supported method is linear in the sampled values, so evaluating
 * along one axis reduces to a short list of (node index, weight) pairs.
 * Tensor-product evaluation contracts one stencil per axis; restriction
 * contracts a single axis and keeps the rest.
 *
 * Entries with zero weight are never emitted. At a grid node every method
 * yields the single entry (node, 1.0), which is what makes evaluation at
 * the nodes exact even when neighbouring samples hold NaN fill values.
 */

#pragma once

#include "src/math/interpolation_config.hpp"
#include "src/math/natural_spline_operator.hpp"
#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>

namespace gridfn {

struct StencilEntry {
    size_t index;
    double weight;
};

using AxisStencil = std::vector<StencilEntry>;

/// Locate interval i with grid[i] <= x < grid[i+1]
///
/// Points left of the grid map to the first interval, points at or right
/// of the last node map to the last interval.
///
/// @pre grid.size() >= 2, strictly increasing
[[nodiscard]] inline size_t find_interval(std::span<const double> grid, double x) noexcept {
    const auto it = std::upper_bound(grid.begin(), grid.end(), x);
    const size_t upper = static_cast<size_t>(std::distance(grid.begin(), it));
    if (upper == 0) return 0;
    return std::min(upper - 1, grid.size() - 2);
}

namespace detail {

inline void push_nonzero(AxisStencil& stencil, size_t index, double weight) {
    if (weight != 0.0) {
        stencil.push_back({index, weight});
    }
}

}  // namespace detail

/// Linear weights; t outside [0, 1] extends the edge interval
inline void linear_stencil(std::span<const double> grid, double x, AxisStencil& out) {
    out.clear();
    const size_t i = find_interval(grid, x);
    const double t = (x - grid[i]) / (grid[i + 1] - grid[i]);
    detail::push_nonzero(out, i, 1.0 - t);
    detail::push_nonzero(out, i + 1, t);
}

/// Nearest node; ties go to the lower node, points outside snap to the ends
inline void nearest_stencil(std::span<const double> grid, double x, AxisStencil& out) {
    out.clear();
    const size_t i = find_interval(grid, x);
    const size_t pick = (x - grid[i] <= grid[i + 1] - x) ? i : i + 1;
    out.push_back({pick, 1.0});
}

/// Natural cubic spline weights for every node that contributes
inline void cubic_stencil(std::span<const double> grid,
                          const NaturalSplineOperator& op,
                          double x,
                          AxisStencil& out) {
    out.clear();
    const size_t n = grid.size();
    const size_t i = find_interval(grid, x);
    const double h = grid[i + 1] - grid[i];
    const double A = (grid[i + 1] - x) / h;
    const double B = (x - grid[i]) / h;
    const double scale = h * h / 6.0;
    const double cA = (A * A * A - A) * scale;
    const double cB = (B * B * B - B) * scale;

    if (cA == 0.0 && cB == 0.0) {
        detail::push_nonzero(out, i, A);
        detail::push_nonzero(out, i + 1, B);
        return;
    }

    out.reserve(n);
    for (size_t j = 0; j < n; ++j) {
        double w = cA * op.coefficient(i, j) + cB * op.coefficient(i + 1, j);
        if (j == i) w += A;
        if (j == i + 1) w += B;
        detail::push_nonzero(out, j, w);
    }
}

}  // namespace gridfn
