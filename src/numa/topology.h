#pragma once

/// @file topology.h
/// @brief NUMA domain discovery via libnuma.

#include <vector>

#include "core/types.h"

namespace qpscd {

/// NUMA layout of the machine as seen by this process.
struct NumaTopology {
    bool numa_available = false;        ///< libnuma usable (else single domain).
    std::vector<int> nodes;             ///< Node ids that own at least one CPU.
    std::vector<int> cpus_per_node;     ///< CPU count, parallel to nodes.

    /// Number of NUMA domains (always >= 1).
    Index num_domains() const { return static_cast<Index>(nodes.size()); }

    /// Node id backing domain d (-1 when NUMA is unavailable).
    int node_of_domain(Index d) const {
        return numa_available ? nodes[d] : -1;
    }

    /// CPUs attached to domain d (always >= 1).
    int cpus_of_domain(Index d) const { return cpus_per_node[d]; }
};

/// Discover NUMA domains.
///
/// Checks numa_available, walks node ids 0..numa_max_node() that are set in
/// numa_nodes_ptr, and counts CPUs with numa_node_to_cpus, skipping
/// memory-only nodes. Falls back to one domain holding
/// std::thread::hardware_concurrency() CPUs when NUMA is unavailable.
/// Never throws.
NumaTopology discover_topology();

/// A single-domain topology with the given CPU count, no node pinning.
/// Used to force R = 1 regardless of the machine.
NumaTopology single_domain_topology(int cpus);

}  // namespace qpscd
