#include "solver/coordinate_update.h"

#include <algorithm>

namespace qpscd {

ScalarCPU scd_update(const RowView& q_i, Index i, ScalarCPU p_i,
                     ScalarCPU lb_i, ScalarCPU ub_i, ScalarCPU q_ii,
                     const IterateView& x) {
    // Keep x_i^k: another worker may overwrite x_i while we sum below.
    const double xk_i = x.load(i);

    const Index n = static_cast<Index>(q_i.size());
    const double* row = q_i.data();
    double d_i = 0.0;
    for (Index j = 0; j < n; ++j) {
        d_i += x.load(j) * row[j];
    }
    const double gradf_i = d_i + p_i;

    const double step = std::max(q_ii, kMinStep);
    const double cand = std::max(xk_i - gradf_i / step, lb_i);
    const double xkp1_i = std::min(cand, ub_i);

    x.store(i, xkp1_i);
    return xkp1_i;
}

}  // namespace qpscd
