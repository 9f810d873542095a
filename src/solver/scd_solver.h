#pragma once

/// @file scd_solver.h
/// @brief Parallel stochastic coordinate descent for box-constrained QPs.
///
/// Solves
///   min_x  (1/2) x'Qx + p'x   s.t.  lb <= x <= ub
///
/// with Hogwild-style projected coordinate descent on one iterate replica
/// per NUMA domain:
///
///   seed all replicas from x0
///   for e in 0 .. num_epochs-1:
///       if e % sync_interval == 0: reconcile (average) all replicas
///       sweep every replica in parallel, lock-free within a replica
///   merge replicas (average) -> x*
///   residual = ||Q x* + p||_2
///
/// Results are not reproducible under parallelism: workers race on the
/// shared iterate by design. With one replica, one thread and a fixed
/// permutation the solve is fully deterministic.
///
/// No numerical-health checks are performed. A degenerate Q (huge
/// magnitudes, negative curvature) can drive the iterate to Inf/NaN, which
/// then shows up in the output vector and the residual.
///
/// References:
///   Niu, Recht, Re, Wright, "Hogwild!", NIPS 2011.
///   Liu, Wright, "Asynchronous Stochastic Coordinate Descent:
///   Parallelism and Convergence Properties", SIAM J. Optim. 2015.

#include <cstdint>
#include <memory>
#include <vector>

#include "core/types.h"
#include "numa/replica_set.h"
#include "numa/topology.h"
#include "parallel/thread_pool.h"
#include "problem/box_qp.h"
#include "solver/permutation.h"

namespace qpscd {

/// Configuration for the SCD solve loop.
struct ScdConfig {
    int num_epochs = 100;          ///< Full sweeps over all coordinates.
    int sync_interval = 10;        ///< Reconcile before epochs 0, S, 2S, ...
    Index num_replicas = 0;        ///< Iterate replicas (0 = one per NUMA domain).
    int threads_per_replica = 0;   ///< Workers per replica (0 = CPUs of its domain).

    /// Default kPerSolve: one order for every epoch and replica.
    PermutationPolicy permutation_policy = PermutationPolicy::kPerSolve;
    uint64_t seed = 0;             ///< Permutation RNG seed (0 = random_device).

    bool record_history = false;   ///< Evaluate diagnostics at each reconcile.
    bool verbose = false;          ///< Log per-reconcile diagnostics at info.

    /// @throws std::runtime_error if num_epochs < 0 or sync_interval < 1.
    void validate() const;
};

/// Diagnostics recorded right after a reconciliation.
struct ScdIterInfo {
    int epoch = 0;                 ///< Epoch about to run.
    ScalarCPU objective = 0.0;     ///< (1/2) x'Qx + p'x on the reconciled iterate.
    ScalarCPU residual = 0.0;      ///< ||Qx + p||_2 on the reconciled iterate.
};

/// Result of an SCD solve.
struct ScdResult {
    VectorXd x;                            ///< Merged final iterate.
    ScalarCPU residual = 0.0;              ///< ||Q x + p||_2 (unprojected).
    ScalarCPU objective = 0.0;             ///< (1/2) x'Qx + p'x.
    ScalarCPU projected_gradient_norm = 0.0;  ///< KKT stationarity measure.
    int epochs = 0;                        ///< Epochs run.
    int reconciliations = 0;               ///< reconcile() calls inside the loop.
    Index num_replicas = 0;
    int threads_per_replica = 0;           ///< Workers of replica 0's pool.
    uint64_t seed = 0;                     ///< Permutation seed used (0 if caller-supplied).
    double elapsed_ms = 0.0;               ///< Wall-clock time of the solve loop.
    std::vector<ScdIterInfo> history;      ///< Filled when record_history.
};

/// Solve loop owning the replicas and the per-domain worker pools.
///
/// Pools are created at construction and reused by every solve() call.
/// A solver must not be used from more than one thread at a time.
class ScdSolver {
public:
    /// A solve() that throws, at input checking or later, returns the
    /// solver to kCreated; the next solve() reseeds every replica.
    enum class State {
        kCreated,  ///< Pools and replicas allocated, nothing seeded.
        kSeeded,   ///< Replicas hold x0.
        kRunning,  ///< Epoch loop in progress.
        kMerged,   ///< Final iterate produced.
    };

    /// @param bqp      Problem; borrowed, must outlive the solver.
    /// @param config   Loop configuration (validated here).
    /// @param topology NUMA layout used for replica and worker placement.
    ScdSolver(const BoxQP& bqp, const ScdConfig& config,
              const NumaTopology& topology);

    /// Same, with the topology discovered from the machine.
    ScdSolver(const BoxQP& bqp, const ScdConfig& config);

    ~ScdSolver();

    ScdSolver(const ScdSolver&) = delete;
    ScdSolver& operator=(const ScdSolver&) = delete;

    /// Run the full loop from x0 with permutations drawn per the config.
    /// @throws InvalidDimensions if x0.size() != n.
    ScdResult solve(const VectorXd& x0);

    /// Run the full loop with a caller-supplied permutation for every epoch
    /// and replica (permutation_policy is ignored).
    /// @throws InvalidDimensions if x0 or perm has the wrong length.
    /// @throws std::runtime_error if perm is not a bijection on [0, n).
    ScdResult solve(const VectorXd& x0, const Permutation& perm);

    State state() const { return state_; }
    Index num_replicas() const { return replicas_.num_replicas(); }
    const ScdConfig& config() const { return config_; }

    /// Current contents of replica r (for inspection between solves).
    VectorXd replica(Index r) const { return replicas_.snapshot(r); }

private:
    ScdResult run(const VectorXd& x0, const Permutation* fixed_perm);
    ScdResult run_loop(const VectorXd& x0, const Permutation* fixed_perm);
    void run_sweep(const Permutation& perm);
    void check_inputs(const VectorXd& x0, const Permutation* fixed_perm) const;

    const BoxQP& bqp_;
    ScdConfig config_;
    ReplicaSet replicas_;
    std::vector<std::unique_ptr<ThreadPool>> pools_;
    State state_ = State::kCreated;
};

/// One-shot solve with the machine's NUMA topology.
ScdResult scd_solve(const BoxQP& bqp, const VectorXd& x0,
                    const ScdConfig& config = ScdConfig());

/// One-shot solve with a fixed permutation.
ScdResult scd_solve(const BoxQP& bqp, const VectorXd& x0,
                    const ScdConfig& config, const Permutation& perm);

/// Human-readable name of a solver state.
const char* to_string(ScdSolver::State state);

}  // namespace qpscd
