#pragma once

/// @file solve_config.h
/// @brief Configuration for the qpscd CLI.

#include <string>

#include "solver/scd_solver.h"

namespace qpscd {

/// Everything a qpscd run needs besides the two positional paths.
struct SolveConfig {
    ScdConfig scd;                  ///< Solve loop settings.
    std::string result_json;        ///< Optional JSON summary path.
    std::string log_level = "info"; ///< spdlog level name.
};

/// Load a SolveConfig from a JSON file.
///
/// @code
/// {
///   "num_epochs": 100,
///   "sync_interval": 10,
///   "num_replicas": 0,
///   "threads_per_replica": 0,
///   "permutation_policy": "per_solve",
///   "seed": 42,
///   "record_history": false,
///   "verbose": false,
///   "result_json": "out/result.json",
///   "log_level": "info"
/// }
/// @endcode
///
/// Missing keys keep their defaults.
/// @throws std::runtime_error if the file cannot be read, is not valid
///         JSON, has a value of the wrong type, or names an unknown policy.
SolveConfig load_solve_config(const std::string& json_path);

/// Parse "per_solve" / "per_epoch".
/// @throws std::runtime_error for any other string.
PermutationPolicy parse_permutation_policy(const std::string& name);

}  // namespace qpscd
