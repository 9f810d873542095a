#pragma once

/// @file result_writer.h
/// @brief JSON summary of an SCD solve.

#include <string>

#include "solver/scd_solver.h"

namespace qpscd {

/// Write residual, objective, loop settings, timing and (if recorded) the
/// per-reconcile history to JSON. The solution vector itself goes to the
/// CSV output; it is included here only when include_x is set.
/// @throws std::runtime_error if the file cannot be opened.
void write_result_json(const ScdResult& result, const ScdConfig& config,
                       const std::string& path, bool include_x = false);

}  // namespace qpscd
