#pragma once

/// @file objective.h
/// @brief Objective value and stationarity diagnostics for a BoxQP.
///
///   f(x)        = (1/2) x'Qx + p'x
///   grad f(x)   = Qx + p            (Q symmetric)
///
/// The solver reports ||Qx + p||_2 as its residual. For a constrained
/// problem this is not an optimality measure (it is nonzero at any
/// solution on the boundary); projected_gradient_norm() is the one that
/// goes to zero at a KKT point.

#include "core/types.h"
#include "problem/box_qp.h"

namespace qpscd {

/// Evaluate (1/2) x'Qx + p'x.
/// @throws InvalidDimensions if x.size() != bqp.size().
ScalarCPU objective_value(const BoxQP& bqp, const VectorXd& x);

/// Euclidean norm of the unprojected gradient, ||Qx + p||_2.
/// @throws InvalidDimensions if x.size() != bqp.size().
ScalarCPU gradient_residual(const BoxQP& bqp, const VectorXd& x);

/// ||x - P_box(x - (Qx + p))||_2, zero exactly at a KKT point of the
/// box-constrained problem.
/// @throws InvalidDimensions if x.size() != bqp.size().
ScalarCPU projected_gradient_norm(const BoxQP& bqp, const VectorXd& x);

/// Project a vector onto the box {w : lb <= w <= ub}.
///
/// Element-wise clamping: w_i = clamp(v_i, lb_i, ub_i).
///
/// @throws InvalidDimensions on length mismatch.
VectorXd project_box(const VectorXd& v, const VectorXd& lb, const VectorXd& ub);

}  // namespace qpscd
