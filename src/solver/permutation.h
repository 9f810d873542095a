#pragma once

/// @file permutation.h
/// @brief Random coordinate visitation orders.

#include <cstdint>
#include <random>

#include "core/types.h"

namespace qpscd {

/// When the solver draws a new visitation order.
enum class PermutationPolicy {
    kPerSolve,  ///< One permutation reused for every epoch and replica.
    kPerEpoch,  ///< Fresh permutation before each epoch (all replicas share it).
};

/// Uniform random permutations of [0, n).
class PermutationGenerator {
public:
    /// @param seed RNG seed; 0 draws a seed from std::random_device.
    explicit PermutationGenerator(uint64_t seed = 0);

    /// Fisher-Yates shuffle of 0, 1, ..., n-1 (std::shuffle).
    /// n == 0 yields an empty permutation.
    /// @throws std::runtime_error if n < 0.
    Permutation generate(Index n);

    /// Seed actually in use (resolved from random_device when 0 was given).
    uint64_t seed() const { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 rng_;
};

/// Identity order 0, 1, ..., n-1.
Permutation identity_permutation(Index n);

/// True if perm contains every index of [0, n) exactly once.
bool is_valid_permutation(const Permutation& perm, Index n);

}  // namespace qpscd
