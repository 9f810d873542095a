#pragma once

/// @file coordinate_update.h
/// @brief Single projected coordinate-descent step on a box QP.
///
/// For coordinate i:
///   1. old   = x_i                          (read once)
///   2. d     = sum_j x_j * Q(i, j)           (live iterate, may be racing)
///   3. g     = d + p_i
///   4. step  = max(Q_ii, 1e-6)
///   5. x_i  <- min(max(old - g / step, lb_i), ub_i)
///
/// The dot product reads x while other workers write to it (Hogwild). The
/// result is always inside [lb_i, ub_i] whatever values were observed,
/// provided the inputs are finite. Non-finite inputs propagate unchanged.
///
/// Reference:
///   Niu, Recht, Re, Wright, "Hogwild!: A Lock-Free Approach to
///   Parallelizing Stochastic Gradient Descent", NIPS 2011.

#include "core/types.h"
#include "numa/node_buffer.h"
#include "problem/box_qp.h"

namespace qpscd {

/// Lower bound on the per-coordinate step denominator.
constexpr ScalarCPU kMinStep = 1e-6;

/// Apply one projected coordinate update to x_i.
///
/// @param q_i  Row i of Q (length x.size).
/// @param i    Coordinate index.
/// @param p_i  Linear term p_i.
/// @param lb_i Lower bound on x_i.
/// @param ub_i Upper bound on x_i.
/// @param q_ii Step diagonal for coordinate i.
/// @param x    Iterate, shared with concurrently running updates.
/// @return The value written to x_i.
ScalarCPU scd_update(const RowView& q_i, Index i, ScalarCPU p_i,
                     ScalarCPU lb_i, ScalarCPU ub_i, ScalarCPU q_ii,
                     const IterateView& x);

/// Same step, pulling row, bounds and diagonal from the problem.
inline ScalarCPU scd_update(const BoxQP& bqp, Index i, const IterateView& x) {
    return scd_update(bqp.row(i), i, bqp.p(i), bqp.lb(i), bqp.ub(i),
                      bqp.diag(i), x);
}

}  // namespace qpscd
