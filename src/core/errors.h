#pragma once

/// @file errors.h
/// @brief Exception types surfaced to callers of the solver and CLI.
///
/// Everything else in the library reports failures as std::runtime_error
/// with the failing function name as a message prefix.

#include <stdexcept>
#include <string>

#include "core/types.h"

namespace qpscd {

/// Inputs with inconsistent lengths (vector length != n, Q not n x n).
/// Raised before any solve work begins.
class InvalidDimensions : public std::runtime_error {
public:
    InvalidDimensions(const std::string& where, const std::string& component,
                      Index expected, Index actual)
        : std::runtime_error(where + ": " + component + " has size " +
                             std::to_string(actual) + ", expected " +
                             std::to_string(expected)),
          component_(component),
          expected_(expected),
          actual_(actual) {}

    const std::string& component() const { return component_; }
    Index expected() const { return expected_; }
    Index actual() const { return actual_; }

private:
    std::string component_;
    Index expected_;
    Index actual_;
};

/// Missing or malformed command-line arguments.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace qpscd
