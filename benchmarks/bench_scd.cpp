#include <benchmark/benchmark.h>

#include <cmath>
#include <vector>

#include <spdlog/spdlog.h>

#include "numa/node_buffer.h"
#include "numa/replica_set.h"
#include "numa/topology.h"
#include "parallel/thread_pool.h"
#include "problem/box_qp.h"
#include "solver/epoch_driver.h"
#include "solver/permutation.h"
#include "solver/scd_solver.h"

using namespace qpscd;

// ── Helper: build a synthetic diagonally dominant box QP ───────────

static BoxQP make_test_problem(Index n) {
    // Off-diagonals in [-0.5, 0.5] / n keep the rows dominant for any n.
    RowMajorMatrixXd Q(n, n);
    VectorXd p(n);
    for (Index i = 0; i < n; ++i) {
        for (Index j = 0; j < n; ++j) {
            Q(i, j) = 0.5 * std::sin(0.37 * (i + 1) * (j + 1)) / n;
        }
        Q(i, i) = 2.0;
        p(i) = std::cos(0.11 * i);
    }
    Q = (0.5 * (Q + Q.transpose())).eval();
    return BoxQP(Q, p, VectorXd::Constant(n, -0.25), VectorXd::Constant(n, 0.25));
}

// ── Single epoch on one replica ───────────────────────────────────

static void BM_ScdEpoch(benchmark::State& state) {
    spdlog::set_level(spdlog::level::warn);
    const Index n = static_cast<Index>(state.range(0));
    const auto threads = static_cast<std::size_t>(state.range(1));

    BoxQP bqp = make_test_problem(n);
    NodeBuffer x(n, -1);
    ThreadPool pool(threads);
    PermutationGenerator gen(42);
    Permutation perm = gen.generate(n);

    for (auto _ : state) {
        run_epoch(bqp, perm, x.view(), pool);
        benchmark::ClobberMemory();
    }
    // One epoch touches every entry of Q once.
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n) * n);
}

// n = 1K/4K coordinates x 1/2/4/8 workers
BENCHMARK(BM_ScdEpoch)
    ->Args({1000, 1})
    ->Args({1000, 2})
    ->Args({1000, 4})
    ->Args({1000, 8})
    ->Args({4000, 1})
    ->Args({4000, 4})
    ->Args({4000, 8})
    ->Unit(benchmark::kMillisecond)
    ->UseRealTime();

// ── Full solve: replicas x threads ────────────────────────────────

static void BM_ScdSolve(benchmark::State& state) {
    spdlog::set_level(spdlog::level::warn);
    const Index n = static_cast<Index>(state.range(0));

    BoxQP bqp = make_test_problem(n);
    ScdConfig cfg;
    cfg.num_epochs = 20;
    cfg.sync_interval = 5;
    cfg.num_replicas = static_cast<Index>(state.range(1));
    cfg.threads_per_replica = static_cast<int>(state.range(2));
    cfg.seed = 42;

    ScdSolver solver(bqp, cfg);
    VectorXd x0 = VectorXd::Zero(n);

    for (auto _ : state) {
        auto result = solver.solve(x0);
        benchmark::DoNotOptimize(result.x.data());
        benchmark::ClobberMemory();
        state.counters["residual"] =
            benchmark::Counter(result.residual, benchmark::Counter::kDefaults);
    }
}

// 2K coordinates, replicas x threads/replica
BENCHMARK(BM_ScdSolve)
    ->Args({2000, 1, 1})
    ->Args({2000, 1, 4})
    ->Args({2000, 2, 2})
    ->Args({2000, 2, 4})
    ->Args({2000, 4, 2})
    ->Unit(benchmark::kMillisecond)
    ->UseRealTime();

// ── Reconciliation cost ───────────────────────────────────────────

static void BM_Reconcile(benchmark::State& state) {
    const Index n = static_cast<Index>(state.range(0));
    const Index R = static_cast<Index>(state.range(1));

    ReplicaSet reps(n, R, discover_topology());
    reps.seed(VectorXd::Zero(n));
    for (Index r = 0; r < R; ++r) {
        for (Index i = 0; i < n; ++i) reps.view(r).store(i, 0.001 * (r + i));
    }

    for (auto _ : state) {
        reps.reconcile();
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n) * R);
}

BENCHMARK(BM_Reconcile)
    ->Args({100000, 2})
    ->Args({100000, 4})
    ->Args({1000000, 2})
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
