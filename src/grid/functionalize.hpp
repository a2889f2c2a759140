// SPDX-License-Identifier: MIT
#pragma once

#include "src/grid/coordinate_registry.hpp"
#include "src/grid/dataset_binder.hpp"
#include "src/grid/function_registry.hpp"
#include "src/math/interpolation_config.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace gridfn {

/// Options for functionalize()
struct FunctionalizeOptions {
    InterpolationConfig interpolation{};

    /// Frame label stored on every built function's metadata (e.g. "GDZ-sph")
    std::optional<std::string> coordinate_system = std::nullopt;
};

/// Validate coordinates, bind datasets, build and register the functions
///
/// All-or-nothing: when any axis, dataset or function fails, the registry
/// is left exactly as it was. Existing functions with the same names as
/// the new datasets are replaced.
///
/// Example:
/// @code
///   FunctionRegistry registry;
///   auto ok = functionalize(registry,
///       {{"time", "hr", NdArray::vector(hours)}, {"lon", "deg", NdArray::vector(lons)}},
///       {{"T", "S", NdArray{{25, 12}, samples}}});
///   auto t = registry.get("T").value().eval({0.0, -180.0});
/// @endcode
[[nodiscard]] std::expected<void, GridError> functionalize(
    FunctionRegistry& registry,
    std::vector<CoordinateSpec> coordinates,
    std::vector<DatasetSpec> datasets,
    const FunctionalizeOptions& options = {});

/// Same pipeline into a fresh registry
[[nodiscard]] std::expected<FunctionRegistry, GridError> functionalize(
    std::vector<CoordinateSpec> coordinates,
    std::vector<DatasetSpec> datasets,
    const FunctionalizeOptions& options = {});

}  // namespace gridfn
