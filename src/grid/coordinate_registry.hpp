// SPDX-License-Identifier: MIT
#pragma once

#include "src/grid/coordinate_axis.hpp"
#include "src/math/nd_array.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gridfn {

/// Raw coordinate input: name, unit and (supposedly 1D) values
struct CoordinateSpec {
    std::string name;
    std::string unit;
    NdArray data;
};

/// Validated, ordered set of coordinate axes for one binding call
///
/// Axis order is the order of the input specs; it fixes the expected
/// dataset shape and the argument order of every function built from it.
class CoordinateRegistry {
public:
    /// Validate coordinate specs
    ///
    /// Fails when a name is empty or repeated, data is not 1D or is
    /// inconsistent, an axis has fewer than 2 points, a value is not
    /// finite, or values are not strictly increasing.
    [[nodiscard]] static std::expected<CoordinateRegistry, ValidationError>
    create(std::vector<CoordinateSpec> specs);

    /// Axes in declaration order
    [[nodiscard]] const std::vector<std::shared_ptr<const CoordinateAxis>>& axes() const noexcept {
        return axes_;
    }

    /// Axis by name, or nullptr
    [[nodiscard]] std::shared_ptr<const CoordinateAxis> find(std::string_view name) const noexcept;

    /// Ordered axis lengths (the shape every dataset must have)
    [[nodiscard]] std::vector<size_t> shape() const;

    [[nodiscard]] size_t size() const noexcept { return axes_.size(); }

private:
    explicit CoordinateRegistry(std::vector<std::shared_ptr<const CoordinateAxis>> axes)
        : axes_(std::move(axes)) {}

    std::vector<std::shared_ptr<const CoordinateAxis>> axes_;
};

}  // namespace gridfn
