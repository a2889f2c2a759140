// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/safe_math.hpp"
#include <cstddef>
#include <expected>
#include <vector>

namespace gridfn {

/// Dense N-dimensional array of doubles in row-major (C) order
///
/// The last dimension varies fastest:
///   flat = (...((i0*n1 + i1)*n2 + i2)*n3 + ...)
struct NdArray {
    std::vector<size_t> shape;  ///< Extent per dimension (empty = scalar)
    std::vector<double> data;   ///< Flattened values

    /// 1-D array from values
    [[nodiscard]] static NdArray vector(std::vector<double> values) {
        NdArray a;
        a.shape = {values.size()};
        a.data = std::move(values);
        return a;
    }

    /// Number of dimensions
    [[nodiscard]] size_t rank() const noexcept { return shape.size(); }

    /// Product of the shape, or OverflowError
    [[nodiscard]] std::expected<size_t, OverflowError> element_count() const noexcept {
        return safe_product(shape);
    }

    /// True when the shape product equals the storage length
    [[nodiscard]] bool consistent() const noexcept {
        auto n = element_count();
        return n.has_value() && n.value() == data.size();
    }
};

/// Row-major strides for a shape
[[nodiscard]] inline std::vector<size_t> row_major_strides(const std::vector<size_t>& shape) {
    std::vector<size_t> strides(shape.size(), 1);
    for (size_t d = shape.size(); d > 1; --d) {
        strides[d - 2] = strides[d - 1] * shape[d - 1];
    }
    return strides;
}

}  // namespace gridfn
