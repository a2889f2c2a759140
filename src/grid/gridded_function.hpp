// SPDX-License-Identifier: MIT
#pragma once

#include "src/grid/coordinate_axis.hpp"
#include "src/grid/function_metadata.hpp"
#include "src/math/grid_interpolant_nd.hpp"
#include "src/math/safe_math.hpp"
#include "src/support/error_types.hpp"
#include "src/support/trace.h"
#include <algorithm>
#include <array>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gridfn {

/// Coordinate fixed by a restriction, kept for labelling slices
struct FixedCoordinate {
    std::string axis;
    std::string unit;
    double value;
};

/// Named N-dimensional interpolant over unit-tagged axes
///
/// Argument order is the axis order and never changes. The interpolant is
/// immutable and shared between copies, so evaluation is safe from many
/// threads. The metadata record is shared and mutable (see FunctionMetadata).
///
/// @tparam N Number of arguments (N = 0 is a fully restricted scalar)
template <size_t N>
class GriddedFunction {
public:
    static constexpr size_t kDimensions = N;
    static constexpr size_t kReduced = N > 0 ? N - 1 : 0;

    using Axes = std::array<std::shared_ptr<const CoordinateAxis>, N>;
    using QueryPoint = std::array<double, N>;
    using Interpolant = GridInterpolantND<N>;

    /// Build a function from axes and row-major samples
    ///
    /// Metadata defaults: unit from the dataset, arg_units from the axes,
    /// citation/equation/description absent, no hidden arguments.
    [[nodiscard]] static std::expected<GriddedFunction, ValidationError> create(
        std::string name,
        std::string unit,
        Axes axes,
        std::vector<double> values,
        const InterpolationConfig& config = {})
    {
        if (name.empty()) {
            return std::unexpected(ValidationError(ValidationErrorCode::EmptyName));
        }

        typename Interpolant::GridArray grids;
        std::vector<ArgUnit> arg_units;
        arg_units.reserve(N);
        for (size_t d = 0; d < N; ++d) {
            if (!axes[d]) {
                return std::unexpected(ValidationError(
                    ValidationErrorCode::InvalidConfiguration, name, 0.0, d));
            }
            for (size_t e = 0; e < d; ++e) {
                if (axes[e]->name == axes[d]->name) {
                    return std::unexpected(ValidationError(
                        ValidationErrorCode::DuplicateAxisName, axes[d]->name, 0.0, d));
                }
            }
            grids[d] = axes[d]->values;
            arg_units.emplace_back(axes[d]->name, axes[d]->unit);
        }

        std::array<size_t, N> shape{};
        for (size_t d = 0; d < N; ++d) {
            shape[d] = grids[d].size();
        }
        const auto total = safe_product(std::span<const size_t>(shape.data(), N));
        if (!total.has_value()) {
            return std::unexpected(ValidationError(ValidationErrorCode::ShapeOverflow, name));
        }
        if (values.size() != total.value()) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::InconsistentArray, name,
                static_cast<double>(values.size())));
        }

        auto interp = Interpolant::create(std::move(grids), std::move(values), config);
        if (!interp.has_value()) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::InvalidConfiguration, name));
        }

        auto meta = std::make_shared<FunctionMetadata>(unit, std::move(arg_units));
        return GriddedFunction(std::move(name), std::move(unit), std::move(axes),
                               std::make_shared<const Interpolant>(std::move(interp.value())),
                               std::move(meta), {});
    }

    /// Evaluate at a point given in argument order
    [[nodiscard]] std::expected<double, OutOfRangeError> eval(const QueryPoint& query) const {
        auto result = interp_->eval(query);
        if (!result.has_value()) {
            return std::unexpected(to_out_of_range(result.error()));
        }
        return result.value();
    }

    [[nodiscard]] std::expected<double, OutOfRangeError> operator()(const QueryPoint& query) const {
        return eval(query);
    }

    /// Fix argument `dim` at x, returning an (N-1)-D function
    ///
    /// The slice keeps a copy of the metadata. Under CLAMP, fixed() records
    /// x clamped to the axis range.
    [[nodiscard]] std::expected<GriddedFunction<kReduced>, OutOfRangeError>
    restrict_at(size_t dim, double x) const requires (N >= 1)
    {
        auto reduced = interp_->restrict(dim, x);
        if (!reduced.has_value()) {
            return std::unexpected(to_out_of_range(reduced.error()));
        }

        typename GriddedFunction<kReduced>::Axes axes;
        std::vector<ArgUnit> arg_units;
        for (size_t d = 0, r = 0; d < N; ++d) {
            if (d == dim) continue;
            axes[r++] = axes_[d];
            arg_units.emplace_back(axes_[d]->name, axes_[d]->unit);
        }

        auto meta = std::make_shared<FunctionMetadata>(unit_, std::move(arg_units));
        if (meta_->citation()) meta->set_citation(*meta_->citation());
        if (meta_->equation()) meta->set_equation(*meta_->equation());
        if (meta_->description()) meta->set_description(*meta_->description());
        if (meta_->coordinate_system()) meta->set_coordinate_system(*meta_->coordinate_system());
        std::vector<std::string> hidden;
        for (const auto& h : meta_->hidden_args()) {
            if (h != axes_[dim]->name) hidden.push_back(h);
        }
        meta->set_hidden_args(std::move(hidden));
        for (const auto& [key, value] : meta_->extra()) {
            meta->set_extra(key, value);
        }

        // Record the coordinate the slice was actually taken at
        double used = x;
        if (interp_->config().bounds == OutOfBoundsPolicy::CLAMP) {
            used = std::clamp(x, axes_[dim]->min(), axes_[dim]->max());
        }
        auto fixed = fixed_;
        fixed.push_back({axes_[dim]->name, axes_[dim]->unit, used});

        return GriddedFunction<kReduced>(
            name_, unit_, std::move(axes),
            std::make_shared<const typename GriddedFunction<kReduced>::Interpolant>(
                std::move(reduced.value())),
            std::move(meta), std::move(fixed));
    }

    /// Position of a named argument
    [[nodiscard]] std::optional<size_t> axis_index(std::string_view axis) const noexcept {
        for (size_t d = 0; d < N; ++d) {
            if (axes_[d]->name == axis) return d;
        }
        return std::nullopt;
    }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& unit() const noexcept { return unit_; }
    [[nodiscard]] const Axes& axes() const noexcept { return axes_; }
    [[nodiscard]] const Interpolant& interpolant() const noexcept { return *interp_; }
    [[nodiscard]] const std::shared_ptr<FunctionMetadata>& metadata() const noexcept { return meta_; }
    [[nodiscard]] const std::vector<FixedCoordinate>& fixed() const noexcept { return fixed_; }

private:
    template <size_t M> friend class GriddedFunction;

    GriddedFunction(std::string name,
                    std::string unit,
                    Axes axes,
                    std::shared_ptr<const Interpolant> interp,
                    std::shared_ptr<FunctionMetadata> meta,
                    std::vector<FixedCoordinate> fixed)
        : name_(std::move(name))
        , unit_(std::move(unit))
        , axes_(std::move(axes))
        , interp_(std::move(interp))
        , meta_(std::move(meta))
        , fixed_(std::move(fixed)) {}

    [[nodiscard]] OutOfRangeError to_out_of_range(const BoundsViolation& v) const {
        GRIDFN_TRACE_OUT_OF_RANGE(v.dim, v.value, v.min, v.max);
        std::string axis;
        if constexpr (N > 0) {
            axis = axes_[v.dim]->name;
        }
        return OutOfRangeError{std::move(axis), v.value, v.min, v.max};
    }

    std::string name_;
    std::string unit_;
    Axes axes_;
    std::shared_ptr<const Interpolant> interp_;
    std::shared_ptr<FunctionMetadata> meta_;
    std::vector<FixedCoordinate> fixed_;
};

}  // namespace gridfn
