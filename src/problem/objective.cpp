#include "problem/objective.h"

#include <algorithm>

#include "core/errors.h"

namespace qpscd {

namespace {

void check_size(const char* where, const BoxQP& bqp, const VectorXd& x) {
    if (x.size() != bqp.size()) {
        throw InvalidDimensions(where, "x", bqp.size(),
                                static_cast<Index>(x.size()));
    }
}

}  // namespace

ScalarCPU objective_value(const BoxQP& bqp, const VectorXd& x) {
    check_size("objective_value", bqp, x);
    return 0.5 * x.dot(bqp.Q() * x) + bqp.p().dot(x);
}

ScalarCPU gradient_residual(const BoxQP& bqp, const VectorXd& x) {
    check_size("gradient_residual", bqp, x);
    VectorXd grad = bqp.Q() * x + bqp.p();
    return grad.norm();
}

ScalarCPU projected_gradient_norm(const BoxQP& bqp, const VectorXd& x) {
    check_size("projected_gradient_norm", bqp, x);
    VectorXd grad = bqp.Q() * x + bqp.p();
    VectorXd stepped = project_box(x - grad, bqp.lbound(), bqp.ubound());
    return (x - stepped).norm();
}

// ── Box projection ──────────────────────────────────────────────────

VectorXd project_box(const VectorXd& v, const VectorXd& lb,
                     const VectorXd& ub) {
    const Index n = static_cast<Index>(v.size());
    if (lb.size() != n) {
        throw InvalidDimensions("project_box", "lb", n,
                                static_cast<Index>(lb.size()));
    }
    if (ub.size() != n) {
        throw InvalidDimensions("project_box", "ub", n,
                                static_cast<Index>(ub.size()));
    }

    VectorXd w(n);
    for (Index i = 0; i < n; ++i) {
        // max then min, so an inverted box (lb > ub) resolves to ub
        // the same way the coordinate kernel does.
        w(i) = std::min(std::max(v(i), lb(i)), ub(i));
    }
    return w;
}

}  // namespace qpscd
