// SPDX-License-Identifier: MIT
#pragma once

#include "src/grid/any_gridded_function.hpp"
#include "src/grid/dataset_binder.hpp"
#include "src/math/interpolation_config.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <vector>

namespace gridfn {

/// Turns bound datasets into gridded functions ("functionalize" step)
///
/// Deterministic and side-effect free: the same bound dataset and config
/// always produce an equivalent function, and nothing is registered.
class GriddedFunctionBuilder {
public:
    explicit GriddedFunctionBuilder(InterpolationConfig config = {})
        : config_(config) {}

    /// Build one function; dimensionality is the number of bound axes
    [[nodiscard]] std::expected<AnyGriddedFunction, ValidationError>
    build(const BoundDataset& dataset) const;

    /// Build one function per dataset, failing on the first error
    [[nodiscard]] std::expected<std::vector<AnyGriddedFunction>, ValidationError>
    build_all(const std::vector<BoundDataset>& datasets) const;

    [[nodiscard]] const InterpolationConfig& config() const noexcept { return config_; }

private:
    InterpolationConfig config_;
};

}  // namespace gridfn
