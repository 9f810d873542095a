#include "solver/permutation.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

namespace qpscd {

namespace {

uint64_t resolve_seed(uint64_t seed) {
    if (seed != 0) return seed;
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

}  // namespace

PermutationGenerator::PermutationGenerator(uint64_t seed)
    : seed_(resolve_seed(seed)), rng_(seed_) {}

Permutation PermutationGenerator::generate(Index n) {
    Permutation perm = identity_permutation(n);
    std::shuffle(perm.begin(), perm.end(), rng_);
    return perm;
}

Permutation identity_permutation(Index n) {
    if (n < 0) {
        throw std::runtime_error("identity_permutation: negative size " +
                                 std::to_string(n));
    }
    Permutation perm(static_cast<size_t>(n));
    std::iota(perm.begin(), perm.end(), 0);
    return perm;
}

bool is_valid_permutation(const Permutation& perm, Index n) {
    if (n < 0 || static_cast<Index>(perm.size()) != n) return false;
    std::vector<bool> seen(static_cast<size_t>(n), false);
    for (Index idx : perm) {
        if (idx < 0 || idx >= n || seen[idx]) return false;
        seen[idx] = true;
    }
    return true;
}

}  // namespace qpscd
