#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <utility>

#include "core/errors.h"
#include "numa/node_buffer.h"
#include "numa/replica_set.h"
#include "numa/topology.h"

using namespace qpscd;

namespace {

/// Two-domain layout without real NUMA placement.
NumaTopology fake_two_domains() {
    NumaTopology topo;
    topo.numa_available = false;
    topo.nodes = {0, 1};
    topo.cpus_per_node = {2, 2};
    return topo;
}

}  // namespace

// ── Topology ────────────────────────────────────────────────────────

TEST(Topology, DiscoverReportsAtLeastOneDomain) {
    NumaTopology topo = discover_topology();
    ASSERT_GE(topo.num_domains(), 1);
    for (Index d = 0; d < topo.num_domains(); ++d) {
        EXPECT_GE(topo.cpus_of_domain(d), 1);
    }
}

TEST(Topology, SingleDomainFallback) {
    NumaTopology topo = single_domain_topology(0);
    EXPECT_EQ(topo.num_domains(), 1);
    EXPECT_EQ(topo.cpus_of_domain(0), 1);
    EXPECT_EQ(topo.node_of_domain(0), -1);
}

// ── NodeBuffer ──────────────────────────────────────────────────────

TEST(NodeBuffer, ZeroInitializedAndWritable) {
    NodeBuffer buf(5, -1);
    EXPECT_EQ(buf.size(), 5);
    for (Index i = 0; i < 5; ++i) EXPECT_EQ(buf.load(i), 0.0);
    buf.store(3, 2.5);
    EXPECT_EQ(buf.to_vector()(3), 2.5);
}

TEST(NodeBuffer, MoveTransfersOwnership) {
    NodeBuffer a(3, -1);
    a.store(0, 7.0);
    NodeBuffer b(std::move(a));
    EXPECT_EQ(b.size(), 3);
    EXPECT_EQ(b.load(0), 7.0);
    EXPECT_EQ(a.size(), 0);  // NOLINT(bugprone-use-after-move)
}

TEST(NodeBuffer, AllocatesOnNodeZeroWhenAvailable) {
    // Node 0 exists on every NUMA machine; without NUMA this is heap memory.
    NodeBuffer buf(1000, 0);
    buf.store(999, 1.0);
    EXPECT_EQ(buf.load(999), 1.0);
}

TEST(NodeBuffer, ViewSharesStorage) {
    NodeBuffer buf(2, -1);
    IterateView v = buf.view();
    v.store(1, 4.0);
    EXPECT_EQ(buf.load(1), 4.0);
    EXPECT_EQ(v.size, 2);
}

// ── Seeding ─────────────────────────────────────────────────────────

TEST(ReplicaSet, OneReplicaPerDomainByDefault) {
    ReplicaSet reps(4, 0, fake_two_domains());
    EXPECT_EQ(reps.num_replicas(), 2);
    EXPECT_EQ(reps.domain_of(0), 0);
    EXPECT_EQ(reps.domain_of(1), 1);
}

TEST(ReplicaSet, ExplicitCountWrapsOverDomains) {
    ReplicaSet reps(4, 3, fake_two_domains());
    EXPECT_EQ(reps.num_replicas(), 3);
    EXPECT_EQ(reps.domain_of(2), 0);
}

TEST(ReplicaSet, SeedBroadcastsIdentically) {
    ReplicaSet reps(3, 3, single_domain_topology(1));
    VectorXd init(3);
    init << 1.0, -2.0, 0.5;
    reps.seed(init);
    for (Index r = 0; r < 3; ++r) {
        VectorXd s = reps.snapshot(r);
        for (Index i = 0; i < 3; ++i) EXPECT_EQ(s(i), init(i));
    }
}

TEST(ReplicaSet, SeedWrongLengthThrows) {
    ReplicaSet reps(3, 2, single_domain_topology(1));
    EXPECT_THROW(reps.seed(VectorXd::Zero(4)), InvalidDimensions);
}

// ── Reconciliation ──────────────────────────────────────────────────

TEST(ReplicaSet, ReconcileAveragesAndBroadcasts) {
    ReplicaSet reps(2, 3, single_domain_topology(1));
    reps.seed(VectorXd::Zero(2));
    reps.view(0).store(0, 1.0);
    reps.view(1).store(0, 2.0);
    reps.view(2).store(0, 3.0);
    reps.view(0).store(1, -4.0);
    reps.view(1).store(1, 0.0);
    reps.view(2).store(1, 1.0);

    reps.reconcile();

    for (Index r = 0; r < 3; ++r) {
        VectorXd s = reps.snapshot(r);
        EXPECT_DOUBLE_EQ(s(0), 2.0);
        EXPECT_DOUBLE_EQ(s(1), -1.0);
    }
}

TEST(ReplicaSet, ReplicasBitIdenticalAfterReconcile) {
    // Values whose mean is not exactly representable.
    ReplicaSet reps(4, 3, single_domain_topology(1));
    reps.seed(VectorXd::Zero(4));
    for (Index r = 0; r < 3; ++r) {
        for (Index i = 0; i < 4; ++i) {
            reps.view(r).store(i, 0.1 * (r + 1) + 1.0 / (i + 3));
        }
    }
    reps.reconcile();

    VectorXd ref = reps.snapshot(0);
    for (Index r = 1; r < 3; ++r) {
        VectorXd s = reps.snapshot(r);
        for (Index i = 0; i < 4; ++i) {
            EXPECT_EQ(s(i), ref(i)) << "replica " << r << " index " << i;
        }
    }
}

TEST(ReplicaSet, ReconcileIsIdempotent) {
    ReplicaSet reps(5, 3, single_domain_topology(1));
    reps.seed(VectorXd::Zero(5));
    for (Index r = 0; r < 3; ++r) {
        for (Index i = 0; i < 5; ++i) {
            reps.view(r).store(i, 1.0 / (3.0 + r + 7.0 * i));
        }
    }

    reps.reconcile();
    VectorXd once = reps.snapshot(0);
    reps.reconcile();

    for (Index r = 0; r < 3; ++r) {
        VectorXd twice = reps.snapshot(r);
        for (Index i = 0; i < 5; ++i) {
            EXPECT_EQ(twice(i), once(i)) << "replica " << r << " index " << i;
        }
    }
}

TEST(ReplicaSet, IdenticalInfinitiesSurviveReconcile) {
    const double inf = std::numeric_limits<double>::infinity();
    ReplicaSet reps(2, 2, single_domain_topology(1));
    VectorXd init(2);
    init << inf, 1.0;
    reps.seed(init);

    reps.reconcile();
    for (Index r = 0; r < 2; ++r) {
        VectorXd s = reps.snapshot(r);
        EXPECT_EQ(s(0), inf) << "replica " << r;
        EXPECT_EQ(s(1), 1.0) << "replica " << r;
    }

    VectorXd merged = reps.merge_final();
    EXPECT_EQ(merged(0), inf);
    EXPECT_EQ(merged(1), 1.0);

    // Opposite infinities have no mean.
    reps.view(1).store(0, -inf);
    reps.reconcile();
    EXPECT_TRUE(std::isnan(reps.snapshot(0)(0)));
}

TEST(ReplicaSet, SingleReplicaReconcileIsNoOp) {
    ReplicaSet reps(3, 1, single_domain_topology(1));
    VectorXd init(3);
    init << 0.3, 0.7, -1.1;
    reps.seed(init);
    reps.reconcile();
    VectorXd s = reps.snapshot(0);
    for (Index i = 0; i < 3; ++i) EXPECT_EQ(s(i), init(i));
}

TEST(ReplicaSet, MergeFinalReturnsMean) {
    ReplicaSet reps(1, 2, single_domain_topology(1));
    reps.seed(VectorXd::Zero(1));
    reps.view(0).store(0, 1.0);
    reps.view(1).store(0, 4.0);

    VectorXd merged = reps.merge_final();
    ASSERT_EQ(merged.size(), 1);
    EXPECT_DOUBLE_EQ(merged(0), 2.5);
    EXPECT_DOUBLE_EQ(reps.snapshot(1)(0), 2.5);
}
