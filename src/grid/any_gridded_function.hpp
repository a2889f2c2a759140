// SPDX-License-Identifier: MIT
#pragma once

#include "src/grid/gridded_function.hpp"
#include "src/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gridfn {

/// Highest dimensionality a registered function may have
inline constexpr size_t kMaxDimensions = 5;

/// Gridded function of any supported dimensionality
///
/// Tagged union over GriddedFunction<0> ... GriddedFunction<kMaxDimensions>
/// so functions built from different axis sets can live in one registry.
/// Coordinates are passed positionally (argument order) or by axis name.
/// Copies share the interpolant and the metadata record.
class AnyGriddedFunction {
public:
    using Variant = std::variant<
        GriddedFunction<0>,
        GriddedFunction<1>,
        GriddedFunction<2>,
        GriddedFunction<3>,
        GriddedFunction<4>,
        GriddedFunction<5>>;

    template <size_t N>
        requires (N <= kMaxDimensions)
    AnyGriddedFunction(GriddedFunction<N> fn)
        : fn_(std::move(fn)) {}

    [[nodiscard]] size_t dimensions() const noexcept { return fn_.index(); }
    [[nodiscard]] const std::string& name() const noexcept;
    [[nodiscard]] const std::string& unit() const noexcept;
    [[nodiscard]] const std::shared_ptr<FunctionMetadata>& metadata() const noexcept;
    [[nodiscard]] const InterpolationConfig& config() const noexcept;
    [[nodiscard]] const std::vector<FixedCoordinate>& fixed() const noexcept;

    /// Axes in argument order
    [[nodiscard]] std::vector<std::shared_ptr<const CoordinateAxis>> axes() const;

    /// Argument names in order
    [[nodiscard]] std::vector<std::string> arg_names() const;

    /// "name(arg0, arg1, ...)"
    [[nodiscard]] std::string symbol() const;

    /// Evaluate with coordinates in argument order
    ///
    /// Fails with ValidationError when the count differs from dimensions(),
    /// OutOfRangeError when a coordinate is rejected by the bounds policy.
    [[nodiscard]] std::expected<double, GridError> eval(std::span<const double> coords) const;

    /// Evaluate with every argument given by name
    [[nodiscard]] std::expected<double, GridError>
    eval(const std::map<std::string, double>& named) const;

    /// Fix one named axis, returning a function of the remaining arguments
    ///
    /// Composes left to right:
    ///   f.restrict("time", 0.0).value().restrict("lon", -180.0)
    [[nodiscard]] std::expected<AnyGriddedFunction, GridError>
    restrict(std::string_view axis, double value) const;

    /// Fix a subset of axes (applied in argument order)
    ///
    /// Fixing every axis yields a 0-D function whose scalar() holds the value.
    [[nodiscard]] std::expected<AnyGriddedFunction, GridError>
    partial(const std::map<std::string, double>& fixed) const;

    /// Value of a 0-D function
    [[nodiscard]] std::optional<double> scalar() const;

    /// Evaluate many points stored row-major (n_points × dimensions())
    ///
    /// Points rejected by the bounds policy produce NaN. Runs in parallel
    /// when built with OpenMP.
    [[nodiscard]] std::expected<std::vector<double>, ValidationError>
    eval_batch(std::span<const double> points) const;

    /// Typed access to the underlying function
    template <size_t N>
    [[nodiscard]] const GriddedFunction<N>* get_if() const noexcept {
        return std::get_if<GriddedFunction<N>>(&fn_);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return fn_; }

private:
    Variant fn_;
};

}  // namespace gridfn
