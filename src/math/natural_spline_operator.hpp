// SPDX-License-Identifier: MIT
/**
 * @file natural_spline_operator.hpp
 * @brief Linear operator mapping samples to natural cubic spline second derivatives
 *
 * A natural cubic spline through (x[i], y[i]) is linear in y: its second
 * derivatives satisfy M = K·y for an n×n matrix K that depends only on the
 * grid. Precomputing K once per axis lets every slice of an N-D array share
 * the same spline, and lets the spline be written as explicit node weights:
 *
 *   S(x) = A·y[i] + B·y[i+1] + ((A³-A)·M[i] + (B³-B)·M[i+1])·h²/6
 *   A = (x[i+1]-x)/h,  B = (x-x[i])/h,  h = x[i+1]-x[i]
 *
 * At a node A or B is exactly 1 and both cubic terms vanish exactly, so the
 * spline reproduces the stored samples bit for bit.
 *
 * The interior system is tridiagonal:
 *   h[i-1]·M[i-1] + 2(h[i-1]+h[i])·M[i] + h[i]·M[i+1]
 *       = 6·((y[i+1]-y[i])/h[i] - (y[i]-y[i-1])/h[i-1])
 * with M[0] = M[n-1] = 0. It is factorized once with Eigen's SparseLU and
 * solved for all n unit right-hand sides.
 */

#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace gridfn {

class NaturalSplineOperator {
public:
    /// Build the operator for a strictly increasing grid (size ≥ 2)
    ///
    /// @param grid Axis nodes
    /// @return Operator or error message
    [[nodiscard]] static std::expected<NaturalSplineOperator, std::string>
    create(std::span<const double> grid);

    /// Coefficient of y[j] in M[i]
    [[nodiscard]] double coefficient(size_t i, size_t j) const noexcept {
        return K_(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
    }

    /// Number of grid nodes
    [[nodiscard]] size_t size() const noexcept {
        return static_cast<size_t>(K_.rows());
    }

    /// Second derivatives of the spline through samples y
    [[nodiscard]] std::vector<double> second_derivatives(std::span<const double> y) const;

private:
    explicit NaturalSplineOperator(Eigen::MatrixXd K)
        : K_(std::move(K)) {}

    Eigen::MatrixXd K_;  ///< n×n, first and last rows zero
};

}  // namespace gridfn
