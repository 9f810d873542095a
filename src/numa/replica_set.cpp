#include "numa/replica_set.h"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "core/errors.h"

namespace qpscd {

ReplicaSet::ReplicaSet(Index n, Index num_replicas,
                       const NumaTopology& topology)
    : n_(n) {
    const Index n_domains = std::max<Index>(1, topology.num_domains());
    const Index R = num_replicas > 0 ? num_replicas : n_domains;

    replicas_.reserve(R);
    domains_.reserve(R);
    for (Index r = 0; r < R; ++r) {
        const Index d = r % n_domains;
        replicas_.emplace_back(n, topology.node_of_domain(d));
        domains_.push_back(d);
    }
    spdlog::debug("ReplicaSet: {} replica(s) of length {} over {} domain(s)",
                  R, n, n_domains);
}

void ReplicaSet::seed(const VectorXd& init) {
    if (init.size() != n_) {
        throw InvalidDimensions("ReplicaSet::seed", "init", n_,
                                static_cast<Index>(init.size()));
    }
    for (auto& rep : replicas_) {
        for (Index i = 0; i < n_; ++i) {
            rep.store(i, init(i));
        }
    }
}

void ReplicaSet::reconcile() {
    const Index R = num_replicas();
    if (R <= 1) return;

    const double denom = static_cast<double>(R);
    for (Index i = 0; i < n_; ++i) {
        const double base = replicas_[0].load(i);
        double delta = 0.0;
        for (Index r = 1; r < R; ++r) {
            // Equal entries contribute nothing; inf - inf would be NaN.
            const double xr = replicas_[r].load(i);
            if (xr != base) delta += xr - base;
        }
        const double mean = base + delta / denom;
        for (Index r = 0; r < R; ++r) {
            replicas_[r].store(i, mean);
        }
    }
}

VectorXd ReplicaSet::merge_final() {
    reconcile();
    return replicas_.front().to_vector();
}

}  // namespace qpscd
