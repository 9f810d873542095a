#include "solver/scd_solver.h"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "core/errors.h"
#include "problem/objective.h"
#include "solver/epoch_driver.h"
#include "utils/timer.h"

namespace qpscd {

namespace {

const ScdConfig& validated(const ScdConfig& config) {
    config.validate();
    return config;
}

const char* to_string(PermutationPolicy policy) {
    return policy == PermutationPolicy::kPerEpoch ? "per_epoch" : "per_solve";
}

}  // namespace

// ── ScdConfig ───────────────────────────────────────────────────────

void ScdConfig::validate() const {
    if (num_epochs < 0) {
        throw std::runtime_error("ScdConfig: num_epochs must be >= 0, got " +
                                 std::to_string(num_epochs));
    }
    if (sync_interval < 1) {
        throw std::runtime_error(
            "ScdConfig: sync_interval must be >= 1, got " +
            std::to_string(sync_interval));
    }
}

// ── ScdSolver ───────────────────────────────────────────────────────

ScdSolver::ScdSolver(const BoxQP& bqp, const ScdConfig& config,
                     const NumaTopology& topology)
    : bqp_(bqp),
      config_(validated(config)),
      replicas_(bqp.size(), config.num_replicas, topology) {
    const Index R = replicas_.num_replicas();

    // Replicas sharing a domain split its CPUs.
    std::vector<int> replicas_on_domain(
        std::max<Index>(1, topology.num_domains()), 0);
    for (Index r = 0; r < R; ++r) {
        ++replicas_on_domain[replicas_.domain_of(r)];
    }

    pools_.reserve(R);
    for (Index r = 0; r < R; ++r) {
        const Index d = replicas_.domain_of(r);
        int threads = config_.threads_per_replica;
        if (threads <= 0) {
            threads = std::max(1, topology.cpus_of_domain(d) /
                                      replicas_on_domain[d]);
        }
        pools_.push_back(std::make_unique<ThreadPool>(
            static_cast<std::size_t>(threads), topology.node_of_domain(d)));
    }
}

ScdSolver::ScdSolver(const BoxQP& bqp, const ScdConfig& config)
    : ScdSolver(bqp, config, discover_topology()) {}

ScdSolver::~ScdSolver() = default;

ScdResult ScdSolver::solve(const VectorXd& x0) { return run(x0, nullptr); }

ScdResult ScdSolver::solve(const VectorXd& x0, const Permutation& perm) {
    return run(x0, &perm);
}

void ScdSolver::check_inputs(const VectorXd& x0,
                             const Permutation* fixed_perm) const {
    const Index n = bqp_.size();
    if (x0.size() != n) {
        throw InvalidDimensions("ScdSolver::solve", "x0", n,
                                static_cast<Index>(x0.size()));
    }
    if (fixed_perm == nullptr) return;
    if (static_cast<Index>(fixed_perm->size()) != n) {
        throw InvalidDimensions("ScdSolver::solve", "permutation", n,
                                static_cast<Index>(fixed_perm->size()));
    }
    if (!is_valid_permutation(*fixed_perm, n)) {
        throw std::runtime_error(
            "ScdSolver::solve: permutation is not a bijection on [0, " +
            std::to_string(n) + ")");
    }
}

void ScdSolver::run_sweep(const Permutation& perm) {
    // Launch every replica before waiting on any: domains sweep concurrently.
    std::vector<std::future<void>> futures;
    for (Index r = 0; r < replicas_.num_replicas(); ++r) {
        auto chunk = launch_epoch(bqp_, perm, replicas_.view(r), *pools_[r]);
        for (auto& f : chunk) futures.push_back(std::move(f));
    }
    wait_all(futures);
}

ScdResult ScdSolver::run(const VectorXd& x0, const Permutation* fixed_perm) {
    try {
        return run_loop(x0, fixed_perm);
    } catch (...) {
        // Replicas may hold a partial sweep; the next solve reseeds them.
        state_ = State::kCreated;
        throw;
    }
}

ScdResult ScdSolver::run_loop(const VectorXd& x0,
                              const Permutation* fixed_perm) {
    check_inputs(x0, fixed_perm);

    const Index n = bqp_.size();
    const Index R = replicas_.num_replicas();

    replicas_.seed(x0);
    state_ = State::kSeeded;

    ScdResult result;
    result.num_replicas = R;
    result.threads_per_replica = static_cast<int>(pools_.front()->thread_count());

    PermutationGenerator generator(config_.seed);
    Permutation drawn;
    if (fixed_perm == nullptr) {
        drawn = generator.generate(n);
        result.seed = generator.seed();
    }
    const bool per_epoch = fixed_perm == nullptr &&
        config_.permutation_policy == PermutationPolicy::kPerEpoch;

    spdlog::info("SCD solver: n={}, epochs={}, sync={}, replicas={}, "
                 "threads/replica={}, permutation={}",
                 n, config_.num_epochs, config_.sync_interval, R,
                 result.threads_per_replica,
                 fixed_perm ? "fixed" : to_string(config_.permutation_policy));

    CpuTimer timer("SCD solve", spdlog::level::debug);
    state_ = State::kRunning;

    for (int epoch = 0; epoch < config_.num_epochs; ++epoch) {
        if (epoch % config_.sync_interval == 0) {
            replicas_.reconcile();
            ++result.reconciliations;

            if (config_.record_history || config_.verbose) {
                VectorXd xr = replicas_.snapshot(0);
                ScdIterInfo info;
                info.epoch = epoch;
                info.objective = objective_value(bqp_, xr);
                info.residual = gradient_residual(bqp_, xr);
                spdlog::log(config_.verbose ? spdlog::level::info
                                            : spdlog::level::debug,
                            "  epoch {:4d}: objective={:.6e}, residual={:.6e}",
                            epoch, info.objective, info.residual);
                if (config_.record_history) result.history.push_back(info);
            }
        }

        if (per_epoch && epoch > 0) {
            drawn = generator.generate(n);
        }
        run_sweep(fixed_perm ? *fixed_perm : drawn);
        ++result.epochs;
    }

    result.x = replicas_.merge_final();
    state_ = State::kMerged;
    result.elapsed_ms = timer.stop();

    result.residual = gradient_residual(bqp_, result.x);
    result.objective = objective_value(bqp_, result.x);
    result.projected_gradient_norm = projected_gradient_norm(bqp_, result.x);

    spdlog::info("SCD solver: done in {:.3f} ms, objective={:.6e}, "
                 "residual={:.6e}, projected gradient={:.6e}",
                 result.elapsed_ms, result.objective, result.residual,
                 result.projected_gradient_norm);
    return result;
}

// ── Free functions ──────────────────────────────────────────────────

ScdResult scd_solve(const BoxQP& bqp, const VectorXd& x0,
                    const ScdConfig& config) {
    ScdSolver solver(bqp, config);
    return solver.solve(x0);
}

ScdResult scd_solve(const BoxQP& bqp, const VectorXd& x0,
                    const ScdConfig& config, const Permutation& perm) {
    ScdSolver solver(bqp, config);
    return solver.solve(x0, perm);
}

const char* to_string(ScdSolver::State state) {
    switch (state) {
        case ScdSolver::State::kCreated: return "created";
        case ScdSolver::State::kSeeded:  return "seeded";
        case ScdSolver::State::kRunning: return "running";
        case ScdSolver::State::kMerged:  return "merged";
    }
    return "unknown";
}

}  // namespace qpscd
