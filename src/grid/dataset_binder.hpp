// SPDX-License-Identifier: MIT
#pragma once

#include "src/grid/coordinate_axis.hpp"
#include "src/grid/coordinate_registry.hpp"
#include "src/math/nd_array.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace gridfn {

/// Raw dataset input: name, unit and N-D samples in axis order
struct DatasetSpec {
    std::string name;
    std::string unit;
    NdArray data;  ///< NaN entries are kept as fill values
};

/// Dataset whose shape has been checked against its axes
struct BoundDataset {
    std::string name;
    std::string unit;
    std::vector<std::shared_ptr<const CoordinateAxis>> axes;  ///< Argument order
    std::vector<double> values;                                ///< Row-major samples
};

/// Binding failures: malformed input or a shape that disagrees with the axes
using BindError = std::variant<ValidationError, ShapeMismatchError>;

/// Associates datasets with an ordered axis tuple
///
/// Pure validation: every dataset must have exactly the shape
/// (len(axis_0), ..., len(axis_{n-1})). Nothing is reshaped or truncated.
class DatasetBinder {
public:
    explicit DatasetBinder(const CoordinateRegistry& coordinates)
        : axes_(coordinates.axes()) {}

    /// Bind every dataset, failing on the first invalid one
    [[nodiscard]] std::expected<std::vector<BoundDataset>, BindError>
    bind(std::vector<DatasetSpec> datasets) const;

    /// Bind a single dataset
    [[nodiscard]] std::expected<BoundDataset, BindError>
    bind_one(DatasetSpec dataset) const;

private:
    std::vector<std::shared_ptr<const CoordinateAxis>> axes_;
};

}  // namespace gridfn
