// SPDX-License-Identifier: MIT
#include "src/grid/functionalize.hpp"
#include "src/grid/gridded_function_builder.hpp"
#include "src/support/trace.h"

#include <utility>
#include <variant>

namespace gridfn {

std::expected<void, GridError> functionalize(
    FunctionRegistry& registry,
    std::vector<CoordinateSpec> coordinates,
    std::vector<DatasetSpec> datasets,
    const FunctionalizeOptions& options)
{
    GRIDFN_TRACE_ALGO_START(GRIDFN_MODULE_FUNCTIONALIZE, coordinates.size(), datasets.size());

    auto coords = CoordinateRegistry::create(std::move(coordinates));
    if (!coords.has_value()) {
        return std::unexpected(coords.error());
    }

    auto bound = DatasetBinder(coords.value()).bind(std::move(datasets));
    if (!bound.has_value()) {
        return std::unexpected(std::visit(
            [](const auto& e) -> GridError { return e; }, bound.error()));
    }

    auto built = GriddedFunctionBuilder(options.interpolation).build_all(bound.value());
    if (!built.has_value()) {
        return std::unexpected(built.error());
    }

    if (options.coordinate_system.has_value()) {
        for (const auto& fn : built.value()) {
            fn.metadata()->set_coordinate_system(*options.coordinate_system);
        }
    }

    [[maybe_unused]] const size_t n = built->size();
    auto inserted = registry.register_batch(std::move(built.value()));
    if (!inserted.has_value()) {
        return std::unexpected(inserted.error());
    }

    GRIDFN_TRACE_ALGO_COMPLETE(GRIDFN_MODULE_FUNCTIONALIZE, n);
    return {};
}

std::expected<FunctionRegistry, GridError> functionalize(
    std::vector<CoordinateSpec> coordinates,
    std::vector<DatasetSpec> datasets,
    const FunctionalizeOptions& options)
{
    FunctionRegistry registry;
    auto result = functionalize(registry, std::move(coordinates), std::move(datasets), options);
    if (!result.has_value()) {
        return std::unexpected(result.error());
    }
    return registry;
}

}  // namespace gridfn
