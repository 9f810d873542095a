#pragma once

/// @file replica_set.h
/// @brief Per-NUMA-domain copies of the iterate with periodic averaging.
///
/// Replica r lives on domain r % num_domains. Between reconciliations
/// the replicas drift apart as each domain's workers update their own
/// copy. reconcile() is the only cross-domain access and must not run
/// concurrently with a sweep; the solve loop calls it only after every
/// worker of the previous epoch has finished.
///
/// Averaging is computed as
///   m_i = x_0[i] + (sum_r (x_r[i] - x_0[i])) / R
/// in a fixed replica order, skipping entries equal to x_0[i], and the same
/// m_i is written to every replica, so replicas are bit-identical
/// afterwards. When the replicas already agree nothing is summed and
/// m_i == x_0[i] (also for +-inf), which makes reconcile() bit-exactly
/// idempotent.

#include <vector>

#include "core/types.h"
#include "numa/node_buffer.h"
#include "numa/topology.h"

namespace qpscd {

class ReplicaSet {
public:
    /// @param n            Iterate length.
    /// @param num_replicas Number of replicas; <= 0 means one per domain.
    /// @param topology     Domain layout used for placement.
    ReplicaSet(Index n, Index num_replicas, const NumaTopology& topology);

    Index num_replicas() const { return static_cast<Index>(replicas_.size()); }
    Index size() const { return n_; }

    /// Domain index (into the topology) hosting replica r.
    Index domain_of(Index r) const { return domains_[r]; }

    /// Copy init into every replica.
    /// @throws InvalidDimensions if init.size() != size().
    void seed(const VectorXd& init);

    /// Average all replicas element-wise and broadcast the mean back.
    void reconcile();

    /// Same averaging as reconcile(), returned as a single vector.
    VectorXd merge_final();

    /// Mutable handle for the workers of replica r.
    IterateView view(Index r) { return replicas_[r].view(); }

    /// Copy of replica r's current contents.
    VectorXd snapshot(Index r) const { return replicas_[r].to_vector(); }

private:
    Index n_;
    std::vector<NodeBuffer> replicas_;
    std::vector<Index> domains_;
};

}  // namespace qpscd
