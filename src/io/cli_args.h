#pragma once

/// @file cli_args.h
/// @brief Command-line parsing for the qpscd executable.
///
/// @code
/// qpscd <input data folder> <output file> [--config <json>] [--epochs N]
///       [--sync N] [--replicas N] [--threads N] [--per-epoch-perm]
///       [--seed N] [--result-json <path>] [--help]
/// @endcode

#include <string>
#include <vector>

#include "io/solve_config.h"

namespace qpscd {

/// Parsed command line. Options override the --config file.
struct CliArgs {
    std::string input_dir;
    std::string output_path;
    std::string config_path;
    std::vector<std::string> overrides;  // flag/value pairs, applied in order
    bool help = false;
};

/// Parse argv. With --help the positionals are not required.
/// @throws UsageError on a missing positional, a flag without its value,
///         or an unknown option.
CliArgs parse_args(int argc, const char* const argv[]);

/// Apply the command-line overrides on top of cfg.
/// @throws UsageError if a numeric flag value does not parse.
void apply_overrides(const CliArgs& args, SolveConfig& cfg);

/// Load --config (if given), apply the overrides and validate.
/// @throws UsageError for malformed flag values.
/// @throws std::runtime_error for config-file or validation errors.
SolveConfig resolve_config(const CliArgs& args);

/// Usage text, one line per entry.
std::vector<std::string> usage_lines();

}  // namespace qpscd
