#pragma once

/// @file box_qp.h
/// @brief Immutable descriptor of a box-constrained quadratic program.
///
///   min_x  (1/2) x'Qx + p'x
///   s.t.   lb <= x <= ub
///
/// The diagonal is supplied separately from Q rather than re-derived, so a
/// caller can hand in a regularized diagonal. It is expected to equal
/// Q(i, i) for the unregularized problem.

#include "core/types.h"

namespace qpscd {

class BoxQP {
public:
    /// Take ownership of the problem data.
    ///
    /// @param Q      n x n matrix (row-major storage).
    /// @param p      Linear term, length n.
    /// @param lbound Lower bounds, length n.
    /// @param ubound Upper bounds, length n.
    /// @param diag   Step diagonal, length n (normally Q.diagonal()).
    /// @throws InvalidDimensions if Q is not square or any vector length != n.
    BoxQP(RowMajorMatrixXd Q, VectorXd p, VectorXd lbound, VectorXd ubound,
          VectorXd diag);

    /// Convenience constructor taking diag = Q.diagonal().
    BoxQP(RowMajorMatrixXd Q, VectorXd p, VectorXd lbound, VectorXd ubound);

    /// Problem dimension n.
    Index size() const { return n_; }

    /// Dense view of row i of Q. Valid for the lifetime of this object.
    RowView row(Index i) const {
        return RowView(Q_.data() + static_cast<Eigen::Index>(i) * n_, n_);
    }

    ScalarCPU p(Index i) const { return p_(i); }
    ScalarCPU lb(Index i) const { return lbound_(i); }
    ScalarCPU ub(Index i) const { return ubound_(i); }
    ScalarCPU diag(Index i) const { return diag_(i); }

    const RowMajorMatrixXd& Q() const { return Q_; }
    const VectorXd& p() const { return p_; }
    const VectorXd& lbound() const { return lbound_; }
    const VectorXd& ubound() const { return ubound_; }
    const VectorXd& diag() const { return diag_; }

private:
    RowMajorMatrixXd Q_;
    VectorXd p_;
    VectorXd lbound_;
    VectorXd ubound_;
    VectorXd diag_;
    Index n_ = 0;
};

}  // namespace qpscd
