// SPDX-License-Identifier: MIT
/**
 * @file grid_interpolant_nd.hpp
 * @brief N-dimensional tensor-product interpolation on rectilinear grids
 *
 * Key features:
 * - Compile-time dimension via template parameter (N ≥ 0, N = 0 is a scalar)
 * - Linear, nearest and natural cubic spline methods share one
 *   tensor-product contraction over per-axis stencils
 * - Exact reproduction of stored samples at grid nodes
 * - Restriction: fixing one axis yields an (N-1)-D interpolant over the
 *   remaining axes that agrees with the parent everywhere
 *
 * Usage:
 *   auto interp = GridInterpolantND<2>::create({time, lon}, values).value();
 *   auto T = interp.eval({12.0, 45.0});            // expected<double, BoundsViolation>
 *   auto at_noon = interp.restrict(0, 12.0);       // GridInterpolantND<1> over lon
 *
 * Immutable after construction; concurrent eval() calls are safe.
 */

#pragma once

#include "src/math/axis_stencil.hpp"
#include "src/math/interpolation_config.hpp"
#include "src/math/natural_spline_operator.hpp"
#include "src/math/safe_math.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace gridfn {

/// Query coordinate outside its axis under OutOfBoundsPolicy::REJECT
struct BoundsViolation {
    size_t dim;
    double value;
    double min;
    double max;
};

template <size_t N>
class GridInterpolantND {
public:
    using GridArray = std::array<std::vector<double>, N>;
    using QueryPoint = std::array<double, N>;
    using Shape = std::array<size_t, N>;

    /// Dimensionality left after restricting one axis
    static constexpr size_t kReduced = N > 0 ? N - 1 : 0;

    /// Factory method with validation
    ///
    /// @param grids N strictly increasing, finite grids (each size ≥ 2)
    /// @param values Flattened N-D samples in row-major order (NaN allowed)
    /// @param config Interpolation method and out-of-bounds policy
    /// @return Interpolant or error message
    [[nodiscard]] static std::expected<GridInterpolantND, std::string> create(
        GridArray grids,
        std::vector<double> values,
        const InterpolationConfig& config = {})
    {
        Shape shape{};
        for (size_t dim = 0; dim < N; ++dim) {
            const auto& g = grids[dim];
            if (g.size() < 2) {
                return std::unexpected("Grid dimension " + std::to_string(dim) +
                                       " must have at least 2 points, got " +
                                       std::to_string(g.size()));
            }
            for (size_t i = 0; i < g.size(); ++i) {
                if (!std::isfinite(g[i])) {
                    return std::unexpected("Grid dimension " + std::to_string(dim) +
                                           " has a non-finite value at index " +
                                           std::to_string(i));
                }
                if (i > 0 && !(g[i] > g[i - 1])) {
                    return std::unexpected("Grid dimension " + std::to_string(dim) +
                                           " must be strictly increasing at index " +
                                           std::to_string(i));
                }
            }
            shape[dim] = g.size();
        }

        auto expected_size = safe_product(std::span<const size_t>(shape.data(), N));
        if (!expected_size.has_value()) {
            return std::unexpected("Grid shape overflows size_t");
        }
        if (values.size() != expected_size.value()) {
            return std::unexpected("Values size " + std::to_string(values.size()) +
                                   " does not match grid product " +
                                   std::to_string(expected_size.value()));
        }

        SplineArray splines{};
        if (config.method == InterpolationMethod::CUBIC_SPLINE) {
            for (size_t dim = 0; dim < N; ++dim) {
                auto op = NaturalSplineOperator::create(grids[dim]);
                if (!op.has_value()) {
                    return std::unexpected("Grid dimension " + std::to_string(dim) +
                                           ": " + op.error());
                }
                splines[dim] = std::make_shared<const NaturalSplineOperator>(
                    std::move(op.value()));
            }
        }

        return GridInterpolantND(std::move(grids), std::move(values), config,
                                 std::move(splines));
    }

    /// Evaluate at an N-dimensional query point
    [[nodiscard]] std::expected<double, BoundsViolation> eval(const QueryPoint& query) const {
        if constexpr (N == 0) {
            return values_[0];
        } else {
            std::array<AxisStencil, N> stencils;
            for (size_t dim = 0; dim < N; ++dim) {
                auto ok = make_stencil(dim, query[dim], stencils[dim]);
                if (!ok.has_value()) {
                    return std::unexpected(ok.error());
                }
            }
            return eval_tensor_product<0>(stencils, 0);
        }
    }

    /// Fix axis `dim` at coordinate x, leaving an (N-1)-D interpolant
    ///
    /// The result agrees with eval() on the parent for every query that
    /// shares the fixed coordinate, because each method is a tensor product
    /// of 1D linear operators.
    [[nodiscard]] std::expected<GridInterpolantND<kReduced>, BoundsViolation>
    restrict(size_t dim, double x) const requires (N >= 1)
    {
        AxisStencil stencil;
        auto ok = make_stencil(dim, x, stencil);
        if (!ok.has_value()) {
            return std::unexpected(ok.error());
        }

        const size_t inner = strides_[dim];
        const size_t extent = shape_[dim];
        const size_t outer = values_.size() / (inner * extent);

        std::vector<double> reduced(outer * inner, 0.0);
        for (size_t o = 0; o < outer; ++o) {
            const size_t base = o * extent * inner;
            for (size_t k = 0; k < inner; ++k) {
                double sum = 0.0;
                for (const auto& e : stencil) {
                    sum = std::fma(values_[base + e.index * inner + k], e.weight, sum);
                }
                reduced[o * inner + k] = sum;
            }
        }

        typename GridInterpolantND<kReduced>::GridArray grids;
        typename GridInterpolantND<kReduced>::SplineArray splines;
        for (size_t d = 0, r = 0; d < N; ++d) {
            if (d == dim) continue;
            grids[r] = grids_[d];
            splines[r] = splines_[d];
            ++r;
        }

        return GridInterpolantND<kReduced>(std::move(grids), std::move(reduced),
                                        config_, std::move(splines));
    }

    /// Stored sample at a multi-index (no interpolation)
    [[nodiscard]] double at(const std::array<size_t, N>& index) const noexcept {
        size_t flat = 0;
        for (size_t d = 0; d < N; ++d) {
            flat += index[d] * strides_[d];
        }
        return values_[flat];
    }

    /// Get grid for specific dimension
    [[nodiscard]] const std::vector<double>& grid(size_t dim) const noexcept {
        return grids_[dim];
    }

    /// Get shape (grid sizes for each dimension)
    [[nodiscard]] const Shape& shape() const noexcept { return shape_; }

    /// Flattened samples (row-major)
    [[nodiscard]] const std::vector<double>& values() const noexcept { return values_; }

    [[nodiscard]] const InterpolationConfig& config() const noexcept { return config_; }

private:
    template <size_t M> friend class GridInterpolantND;

    using SplineArray = std::array<std::shared_ptr<const NaturalSplineOperator>, N>;

    GridArray grids_;            ///< Grid coordinates for each dimension
    std::vector<double> values_; ///< Flattened N-D data (row-major)
    InterpolationConfig config_;
    SplineArray splines_;        ///< Per-axis spline operators (cubic only)
    Shape shape_{};
    std::array<size_t, N> strides_{};

    /// Private constructor - use factory method
    GridInterpolantND(GridArray grids,
                      std::vector<double> values,
                      const InterpolationConfig& config,
                      SplineArray splines)
        : grids_(std::move(grids))
        , values_(std::move(values))
        , config_(config)
        , splines_(std::move(splines))
    {
        size_t stride = 1;
        for (size_t d = N; d > 0; --d) {
            shape_[d - 1] = grids_[d - 1].size();
            strides_[d - 1] = stride;
            stride *= shape_[d - 1];
        }
    }

    /// Apply the bounds policy and build the 1D stencil for one axis
    [[nodiscard]] std::expected<void, BoundsViolation>
    make_stencil(size_t dim, double x, AxisStencil& out) const {
        const auto& g = grids_[dim];
        const double lo = g.front();
        const double hi = g.back();

        if (std::isnan(x)) {
            return std::unexpected(BoundsViolation{dim, x, lo, hi});
        }

        switch (config_.bounds) {
            case OutOfBoundsPolicy::REJECT:
                if (x < lo || x > hi) {
                    return std::unexpected(BoundsViolation{dim, x, lo, hi});
                }
                break;
            case OutOfBoundsPolicy::CLAMP:
                x = std::clamp(x, lo, hi);
                break;
            case OutOfBoundsPolicy::EXTRAPOLATE:
                if (std::isinf(x)) {
                    return std::unexpected(BoundsViolation{dim, x, lo, hi});
                }
                break;
        }

        switch (config_.method) {
            case InterpolationMethod::LINEAR:
                linear_stencil(g, x, out);
                break;
            case InterpolationMethod::NEAREST:
                nearest_stencil(g, x, out);
                break;
            case InterpolationMethod::CUBIC_SPLINE:
                cubic_stencil(g, *splines_[dim], x, out);
                break;
        }
        return {};
    }

    /// Recursive tensor-product contraction
    ///
    /// Each recursion level handles one dimension; the innermost level
    /// accumulates samples with FMA.
    template <size_t Dim>
    [[nodiscard]] double eval_tensor_product(
        const std::array<AxisStencil, N>& stencils,
        size_t offset) const
    {
        double sum = 0.0;
        for (const auto& e : stencils[Dim]) {
            const size_t idx = offset + e.index * strides_[Dim];
            if constexpr (Dim == N - 1) {
                sum = std::fma(values_[idx], e.weight, sum);
            } else {
                sum = std::fma(eval_tensor_product<Dim + 1>(stencils, idx), e.weight, sum);
            }
        }
        return sum;
    }
};

}  // namespace gridfn
