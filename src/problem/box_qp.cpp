#include "problem/box_qp.h"

#include <utility>

#include "core/errors.h"

namespace qpscd {

BoxQP::BoxQP(RowMajorMatrixXd Q, VectorXd p, VectorXd lbound,
             VectorXd ubound, VectorXd diag)
    : Q_(std::move(Q)),
      p_(std::move(p)),
      lbound_(std::move(lbound)),
      ubound_(std::move(ubound)),
      diag_(std::move(diag)),
      n_(static_cast<Index>(Q_.rows())) {
    if (Q_.cols() != Q_.rows()) {
        throw InvalidDimensions("BoxQP", "Q columns", n_,
                                static_cast<Index>(Q_.cols()));
    }
    if (p_.size() != n_) {
        throw InvalidDimensions("BoxQP", "p", n_, static_cast<Index>(p_.size()));
    }
    if (lbound_.size() != n_) {
        throw InvalidDimensions("BoxQP", "lbound", n_,
                                static_cast<Index>(lbound_.size()));
    }
    if (ubound_.size() != n_) {
        throw InvalidDimensions("BoxQP", "ubound", n_,
                                static_cast<Index>(ubound_.size()));
    }
    if (diag_.size() != n_) {
        throw InvalidDimensions("BoxQP", "diag", n_,
                                static_cast<Index>(diag_.size()));
    }
}

BoxQP::BoxQP(RowMajorMatrixXd Q, VectorXd p, VectorXd lbound,
             VectorXd ubound)
    : BoxQP(Q, std::move(p), std::move(lbound), std::move(ubound),
            VectorXd(Q.diagonal())) {}

}  // namespace qpscd
