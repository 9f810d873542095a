#include "numa/topology.h"

#include <algorithm>
#include <thread>

#include <numa.h>
#include <spdlog/spdlog.h>

namespace qpscd {

NumaTopology single_domain_topology(int cpus) {
    NumaTopology topo;
    topo.numa_available = false;
    topo.nodes = {0};
    topo.cpus_per_node = {std::max(cpus, 1)};
    return topo;
}

NumaTopology discover_topology() {
    if (numa_available() < 0) {
        int hw = static_cast<int>(std::thread::hardware_concurrency());
        spdlog::debug("discover_topology: NUMA not available, using 1 domain "
                      "with {} CPUs", std::max(hw, 1));
        return single_domain_topology(hw);
    }

    NumaTopology topo;
    topo.numa_available = true;

    const int max_node = numa_max_node();
    struct bitmask* cpus = numa_allocate_cpumask();
    for (int node = 0; node <= max_node; ++node) {
        if (numa_bitmask_isbitset(numa_nodes_ptr, node) == 0) continue;
        numa_bitmask_clearall(cpus);
        if (numa_node_to_cpus(node, cpus) != 0) {
            spdlog::warn("discover_topology: numa_node_to_cpus failed for "
                         "node {}; skipping", node);
            continue;
        }
        int count = static_cast<int>(numa_bitmask_weight(cpus));
        if (count == 0) continue;  // memory-only node (e.g. CXL)
        topo.nodes.push_back(node);
        topo.cpus_per_node.push_back(count);
    }
    numa_free_cpumask(cpus);

    if (topo.nodes.empty()) {
        int hw = static_cast<int>(std::thread::hardware_concurrency());
        spdlog::warn("discover_topology: no NUMA node with CPUs found, "
                     "falling back to 1 domain");
        return single_domain_topology(hw);
    }

    spdlog::debug("discover_topology: {} NUMA domain(s)", topo.nodes.size());
    return topo;
}

}  // namespace qpscd
