// SPDX-License-Identifier: MIT
#include "src/math/natural_spline_operator.hpp"
#include "src/support/trace.h"

#include <Eigen/Sparse>
#include <Eigen/SparseLU>

namespace gridfn {

std::expected<NaturalSplineOperator, std::string>
NaturalSplineOperator::create(std::span<const double> grid) {
    const size_t n = grid.size();
    if (n < 2) {
        return std::unexpected("Need at least 2 points for a natural spline");
    }

    std::vector<double> h(n - 1);
    for (size_t i = 0; i + 1 < n; ++i) {
        h[i] = grid[i + 1] - grid[i];
        if (!(h[i] > 0.0)) {
            return std::unexpected("Grid must be strictly increasing (index " +
                                   std::to_string(i + 1) + ")");
        }
    }

    const auto N = static_cast<Eigen::Index>(n);
    Eigen::MatrixXd K = Eigen::MatrixXd::Zero(N, N);

    // Two nodes: natural boundary forces M = 0, the spline is linear
    if (n == 2) {
        return NaturalSplineOperator(std::move(K));
    }

    GRIDFN_TRACE_ALGO_START(GRIDFN_MODULE_SPLINE, n, 0);

    const auto m = static_cast<Eigen::Index>(n - 2);

    std::vector<Eigen::Triplet<double>> triplets;
    triplets.reserve(static_cast<size_t>(3 * m));
    Eigen::MatrixXd rhs = Eigen::MatrixXd::Zero(m, N);

    for (Eigen::Index r = 0; r < m; ++r) {
        const auto i = static_cast<size_t>(r + 1);  // interior node
        const double h_left = h[i - 1];
        const double h_right = h[i];

        triplets.emplace_back(r, r, 2.0 * (h_left + h_right));
        if (r > 0) {
            triplets.emplace_back(r, r - 1, h_left);
        }
        if (r + 1 < m) {
            triplets.emplace_back(r, r + 1, h_right);
        }

        rhs(r, r) = 6.0 / h_left;                        // y[i-1]
        rhs(r, r + 1) = -6.0 / h_left - 6.0 / h_right;   // y[i]
        rhs(r, r + 2) = 6.0 / h_right;                   // y[i+1]
    }

    Eigen::SparseMatrix<double> A(m, m);
    A.setFromTriplets(triplets.begin(), triplets.end());
    A.makeCompressed();

    Eigen::SparseLU<Eigen::SparseMatrix<double>> solver;
    solver.analyzePattern(A);
    solver.factorize(A);
    if (solver.info() != Eigen::Success) {
        return std::unexpected("SparseLU factorization failed: " + solver.lastErrorMessage());
    }

    Eigen::MatrixXd interior = solver.solve(rhs);
    if (solver.info() != Eigen::Success) {
        return std::unexpected("SparseLU solve failed");
    }

    K.middleRows(1, m) = interior;

    GRIDFN_TRACE_ALGO_COMPLETE(GRIDFN_MODULE_SPLINE, n);
    return NaturalSplineOperator(std::move(K));
}

std::vector<double> NaturalSplineOperator::second_derivatives(std::span<const double> y) const {
    Eigen::Map<const Eigen::VectorXd> y_vec(y.data(), static_cast<Eigen::Index>(y.size()));
    Eigen::VectorXd M = K_ * y_vec;
    return std::vector<double>(M.data(), M.data() + M.size());
}

}  // namespace gridfn
