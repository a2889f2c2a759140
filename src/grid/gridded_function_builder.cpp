// SPDX-License-Identifier: MIT
#include "src/grid/gridded_function_builder.hpp"
#include "src/support/trace.h"

#include <utility>

namespace gridfn {

namespace {

template <size_t N>
std::expected<AnyGriddedFunction, ValidationError>
build_nd(const BoundDataset& dataset, const InterpolationConfig& config) {
    typename GriddedFunction<N>::Axes axes;
    for (size_t d = 0; d < N; ++d) {
        axes[d] = dataset.axes[d];
    }

    auto fn = GriddedFunction<N>::create(dataset.name, dataset.unit,
                                         std::move(axes), dataset.values, config);
    if (!fn.has_value()) {
        return std::unexpected(fn.error());
    }
    return AnyGriddedFunction(std::move(fn.value()));
}

}  // namespace

std::expected<AnyGriddedFunction, ValidationError>
GriddedFunctionBuilder::build(const BoundDataset& dataset) const {
    const size_t dims = dataset.axes.size();
    GRIDFN_TRACE_ALGO_START(GRIDFN_MODULE_BUILDER, dims, static_cast<int>(config_.method));

    if (dims == 0) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidConfiguration,
                                               dataset.name));
    }

    std::expected<AnyGriddedFunction, ValidationError> result =
        std::unexpected(ValidationError(ValidationErrorCode::TooManyDimensions,
                                        dataset.name, static_cast<double>(dims)));
    switch (dims) {
        case 1: result = build_nd<1>(dataset, config_); break;
        case 2: result = build_nd<2>(dataset, config_); break;
        case 3: result = build_nd<3>(dataset, config_); break;
        case 4: result = build_nd<4>(dataset, config_); break;
        case 5: result = build_nd<5>(dataset, config_); break;
        default:
            GRIDFN_TRACE_VALIDATION_ERROR(GRIDFN_MODULE_BUILDER,
                static_cast<int>(ValidationErrorCode::TooManyDimensions), dims, 0.0);
            return result;
    }

    if (result.has_value()) {
        GRIDFN_TRACE_ALGO_COMPLETE(GRIDFN_MODULE_BUILDER, dims);
    }
    return result;
}

std::expected<std::vector<AnyGriddedFunction>, ValidationError>
GriddedFunctionBuilder::build_all(const std::vector<BoundDataset>& datasets) const {
    std::vector<AnyGriddedFunction> functions;
    functions.reserve(datasets.size());
    for (const auto& dataset : datasets) {
        auto fn = build(dataset);
        if (!fn.has_value()) {
            return std::unexpected(fn.error());
        }
        functions.push_back(std::move(fn.value()));
    }
    return functions;
}

}  // namespace gridfn
