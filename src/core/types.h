#pragma once

/// @file types.h
/// @brief Fundamental type aliases for the box-QP coordinate descent solver.
///
/// The solver works in double precision throughout. Q is stored row-major
/// so that the i-th row handed to the coordinate kernel is a contiguous
/// dense view rather than a strided copy.

#include <vector>

#include <Eigen/Core>

namespace qpscd {

/// Scalar type of every problem and iterate entry.
using ScalarCPU = double;

/// Integer index type used throughout the library.
using Index = int;

// ── Eigen typedefs ─────────────────────────────────────────────────

using VectorXd = Eigen::VectorXd;
using MatrixXd = Eigen::MatrixXd;

/// Storage layout for Q: row i is data() + i * cols(), contiguous.
using RowMajorMatrixXd =
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Read-only dense view of one row of Q (no copy).
using RowView = Eigen::Map<const VectorXd>;

/// Visitation order of coordinate indices; a bijection on [0, n).
using Permutation = std::vector<Index>;

}  // namespace qpscd
