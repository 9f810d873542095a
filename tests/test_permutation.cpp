#include <gtest/gtest.h>

#include <map>
#include <stdexcept>

#include "solver/permutation.h"

using namespace qpscd;

// ── Validity ────────────────────────────────────────────────────────

TEST(Permutation, GeneratedIsBijectionForManySizes) {
    PermutationGenerator gen(123);
    for (Index n = 1; n <= 64; ++n) {
        Permutation perm = gen.generate(n);
        EXPECT_TRUE(is_valid_permutation(perm, n)) << "n = " << n;
    }
    Permutation big = gen.generate(10000);
    EXPECT_TRUE(is_valid_permutation(big, 10000));
}

TEST(Permutation, EmptyForZero) {
    PermutationGenerator gen(1);
    EXPECT_TRUE(gen.generate(0).empty());
    EXPECT_TRUE(is_valid_permutation(Permutation(), 0));
}

TEST(Permutation, NegativeSizeThrows) {
    PermutationGenerator gen(1);
    EXPECT_THROW(gen.generate(-1), std::runtime_error);
}

TEST(Permutation, IdentityIsOrdered) {
    Permutation id = identity_permutation(5);
    ASSERT_EQ(id.size(), 5u);
    for (Index i = 0; i < 5; ++i) EXPECT_EQ(id[i], i);
}

TEST(Permutation, ValidityRejectsBadInput) {
    EXPECT_FALSE(is_valid_permutation({0, 1, 1}, 3));   // repeat
    EXPECT_FALSE(is_valid_permutation({0, 1}, 3));      // omission
    EXPECT_FALSE(is_valid_permutation({0, 1, 3}, 3));   // out of range
    EXPECT_FALSE(is_valid_permutation({0, -1, 2}, 3));  // negative
    EXPECT_TRUE(is_valid_permutation({2, 0, 1}, 3));
}

// ── Seeding ─────────────────────────────────────────────────────────

TEST(Permutation, SameSeedSameSequence) {
    PermutationGenerator a(42);
    PermutationGenerator b(42);
    EXPECT_EQ(a.generate(100), b.generate(100));
    EXPECT_EQ(a.generate(100), b.generate(100));
    EXPECT_EQ(a.seed(), 42u);
}

TEST(Permutation, SuccessiveDrawsDiffer) {
    PermutationGenerator gen(42);
    Permutation first = gen.generate(100);
    Permutation second = gen.generate(100);
    EXPECT_NE(first, second);
}

TEST(Permutation, ZeroSeedResolvesFromRandomDevice) {
    PermutationGenerator gen(0);
    EXPECT_NE(gen.seed(), 0u);
    EXPECT_TRUE(is_valid_permutation(gen.generate(20), 20));
}

// ── Distribution ────────────────────────────────────────────────────

TEST(Permutation, AllOrdersOfThreeAppearEvenly) {
    // 6 orders, 6000 draws: expected 1000 each, sd ~ 29.
    PermutationGenerator gen(2024);
    std::map<Permutation, int> counts;
    for (int k = 0; k < 6000; ++k) {
        ++counts[gen.generate(3)];
    }
    EXPECT_EQ(counts.size(), 6u);
    for (const auto& kv : counts) {
        EXPECT_GT(kv.second, 850);
        EXPECT_LT(kv.second, 1150);
    }
}
