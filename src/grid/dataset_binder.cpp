// SPDX-License-Identifier: MIT
#include "src/grid/dataset_binder.hpp"
#include "src/support/trace.h"

#include <unordered_set>

namespace gridfn {

namespace {

std::vector<size_t> axis_lengths(const std::vector<std::shared_ptr<const CoordinateAxis>>& axes) {
    std::vector<size_t> lengths;
    lengths.reserve(axes.size());
    for (const auto& axis : axes) {
        lengths.push_back(axis->size());
    }
    return lengths;
}

}  // namespace

std::expected<BoundDataset, BindError>
DatasetBinder::bind_one(DatasetSpec dataset) const {
    if (dataset.name.empty()) {
        GRIDFN_TRACE_VALIDATION_ERROR(GRIDFN_MODULE_BINDER,
                                      static_cast<int>(ValidationErrorCode::EmptyName), 0, 0.0);
        return std::unexpected(ValidationError(ValidationErrorCode::EmptyName));
    }

    const auto expected_shape = axis_lengths(axes_);
    if (dataset.data.shape != expected_shape) {
        const auto expected_size = safe_product(expected_shape);
        const auto actual_size = dataset.data.element_count();
        GRIDFN_TRACE_SHAPE_MISMATCH(expected_shape.size(), dataset.data.rank(),
                                    expected_size.value_or(0), actual_size.value_or(0));
        return std::unexpected(ShapeMismatchError{
            dataset.name, expected_shape, dataset.data.shape});
    }

    if (!dataset.data.consistent()) {
        GRIDFN_TRACE_VALIDATION_ERROR(GRIDFN_MODULE_BINDER,
                                      static_cast<int>(ValidationErrorCode::InconsistentArray),
                                      0, static_cast<double>(dataset.data.data.size()));
        return std::unexpected(ValidationError(
            ValidationErrorCode::InconsistentArray, dataset.name,
            static_cast<double>(dataset.data.data.size())));
    }

    return BoundDataset{std::move(dataset.name), std::move(dataset.unit),
                        axes_, std::move(dataset.data.data)};
}

std::expected<std::vector<BoundDataset>, BindError>
DatasetBinder::bind(std::vector<DatasetSpec> datasets) const {
    GRIDFN_TRACE_ALGO_START(GRIDFN_MODULE_BINDER, datasets.size(), axes_.size());

    std::unordered_set<std::string> seen;
    std::vector<BoundDataset> bound;
    bound.reserve(datasets.size());

    for (size_t i = 0; i < datasets.size(); ++i) {
        if (!datasets[i].name.empty() && !seen.insert(datasets[i].name).second) {
            GRIDFN_TRACE_VALIDATION_ERROR(GRIDFN_MODULE_BINDER,
                static_cast<int>(ValidationErrorCode::DuplicateDatasetName), i, 0.0);
            return std::unexpected(ValidationError(
                ValidationErrorCode::DuplicateDatasetName, datasets[i].name, 0.0, i));
        }

        auto result = bind_one(std::move(datasets[i]));
        if (!result.has_value()) {
            return std::unexpected(std::move(result.error()));
        }
        bound.push_back(std::move(result.value()));
    }

    GRIDFN_TRACE_ALGO_COMPLETE(GRIDFN_MODULE_BINDER, bound.size());
    return bound;
}

}  // namespace gridfn
