// SPDX-License-Identifier: MIT
#pragma once

#include "src/support/error_types.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <span>

namespace gridfn {

/// Safely multiply two size_t values, detecting overflow via __int128
///
/// @param a First operand
/// @param b Second operand
/// @return Product if no overflow, OverflowError otherwise
[[nodiscard]] inline std::expected<size_t, OverflowError>
safe_multiply(size_t a, size_t b) noexcept {
    using uint128_t = unsigned __int128;

    uint128_t product = static_cast<uint128_t>(a) * static_cast<uint128_t>(b);

    if (product > std::numeric_limits<size_t>::max()) {
        return std::unexpected(OverflowError{a, b});
    }

    return static_cast<size_t>(product);
}

/// Safely compute the element count of a shape
///
/// An empty shape is a scalar and has one element.
///
/// @param shape Extent of each dimension
/// @return Product if no overflow, OverflowError otherwise
[[nodiscard]] inline std::expected<size_t, OverflowError>
safe_product(std::span<const size_t> shape) noexcept {
    size_t total = 1;
    for (size_t extent : shape) {
        auto result = safe_multiply(total, extent);
        if (!result.has_value()) {
            return std::unexpected(result.error());
        }
        total = result.value();
    }
    return total;
}

}  // namespace gridfn
