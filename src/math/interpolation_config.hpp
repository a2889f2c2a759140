// SPDX-License-Identifier: MIT
#pragma once

#include <optional>
#include <string_view>

namespace gridfn {

/// Interpolation method applied along every axis of a gridded function
enum class InterpolationMethod {
    LINEAR,        ///< Multilinear (tensor-product of 1D linear)
    NEAREST,       ///< Nearest grid node per axis, ties to the lower node
    CUBIC_SPLINE   ///< Tensor-product natural cubic spline: f''(x₀) = f''(xₙ) = 0
};

/// What happens to a query coordinate outside [min, max] of its axis
enum class OutOfBoundsPolicy {
    REJECT,       ///< Fail with an out-of-range error
    CLAMP,        ///< Clamp the coordinate to the nearest axis end
    EXTRAPOLATE   ///< Extend the edge interval's polynomial
};

/// Configuration for building gridded interpolants
struct InterpolationConfig {
    InterpolationMethod method = InterpolationMethod::LINEAR;
    OutOfBoundsPolicy bounds = OutOfBoundsPolicy::REJECT;
};

[[nodiscard]] constexpr std::string_view to_string(InterpolationMethod m) noexcept {
    switch (m) {
        case InterpolationMethod::LINEAR: return "linear";
        case InterpolationMethod::NEAREST: return "nearest";
        case InterpolationMethod::CUBIC_SPLINE: return "cubic_spline";
    }
    return "linear";
}

[[nodiscard]] constexpr std::string_view to_string(OutOfBoundsPolicy p) noexcept {
    switch (p) {
        case OutOfBoundsPolicy::REJECT: return "reject";
        case OutOfBoundsPolicy::CLAMP: return "clamp";
        case OutOfBoundsPolicy::EXTRAPOLATE: return "extrapolate";
    }
    return "reject";
}

[[nodiscard]] constexpr std::optional<InterpolationMethod>
parse_interpolation_method(std::string_view s) noexcept {
    if (s == "linear") return InterpolationMethod::LINEAR;
    if (s == "nearest") return InterpolationMethod::NEAREST;
    if (s == "cubic_spline") return InterpolationMethod::CUBIC_SPLINE;
    return std::nullopt;
}

[[nodiscard]] constexpr std::optional<OutOfBoundsPolicy>
parse_out_of_bounds_policy(std::string_view s) noexcept {
    if (s == "reject") return OutOfBoundsPolicy::REJECT;
    if (s == "clamp") return OutOfBoundsPolicy::CLAMP;
    if (s == "extrapolate") return OutOfBoundsPolicy::EXTRAPOLATE;
    return std::nullopt;
}

}  // namespace gridfn
