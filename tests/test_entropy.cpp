/**
 * @file test_entropy.cpp
 * @brief libsodium digests, base64 framing and the deterministic stream
 */

#include <gtest/gtest.h>
#include "tsg_entropy.hpp"

#include <string>

using namespace tsg;

// ─── digests ────────────────────────────────────────────────────────────────

TEST(EntropyTest, Blake2bIsStableAndSized) {
    const std::string a = blake2b_hex("tsguard");
    EXPECT_EQ(a.size(), 64u);
    EXPECT_EQ(a, blake2b_hex("tsguard"));
    EXPECT_NE(a, blake2b_hex("tsguarD"));
    EXPECT_EQ(blake2b_hex("x", 16).size(), 32u);
}

TEST(EntropyTest, Blake2bRejectsBadLength) {
    EXPECT_THROW(blake2b_hex("x", 4), std::invalid_argument);
    EXPECT_THROW(blake2b_hex("x", 65), std::invalid_argument);
}

TEST(EntropyTest, DeriveSeedDependsOnMaterial) {
    EXPECT_EQ(derive_seed("a"), derive_seed("a"));
    EXPECT_NE(derive_seed("a"), derive_seed("b"));
}

// ─── base64 ─────────────────────────────────────────────────────────────────

TEST(EntropyTest, Base64KnownVector) {
    EXPECT_EQ(base64_encode("hello"), "aGVsbG8=");
    std::string out;
    ASSERT_TRUE(base64_decode("aGVsbG8=", out));
    EXPECT_EQ(out, "hello");
}

TEST(EntropyTest, Base64RejectsGarbage) {
    std::string out;
    EXPECT_FALSE(base64_decode("@@not base64@@", out));
}

// ─── DeterministicStream ────────────────────────────────────────────────────

TEST(DeterministicStreamTest, SameSeedSameSequence) {
    DeterministicStream a("seed-1");
    DeterministicStream b("seed-1");
    for (int i = 0; i < 600; ++i) {
        ASSERT_EQ(a.next_u32(), b.next_u32()) << "draw " << i;
    }
}

TEST(DeterministicStreamTest, DifferentSeedsDiverge) {
    DeterministicStream a("seed-1");
    DeterministicStream b("seed-2");
    int equal = 0;
    for (int i = 0; i < 64; ++i) {
        if (a.next_u32() == b.next_u32()) ++equal;
    }
    EXPECT_LT(equal, 4);
}

TEST(DeterministicStreamTest, WordsAreBigEndianBytes) {
    DeterministicStream a("chunks");
    DeterministicStream b("chunks");
    for (int i = 0; i < 300; ++i) {
        uint32_t expected = 0;
        for (int k = 0; k < 4; ++k) expected = (expected << 8) | a.next_byte();
        ASSERT_EQ(b.next_u32(), expected) << "word " << i;
    }
}

TEST(DeterministicStreamTest, RangesStayInBounds) {
    DeterministicStream s("bounds");
    for (int i = 0; i < 2000; ++i) {
        EXPECT_LT(s.uniform(7), 7u);
        uint64_t r = s.range(10, 20);
        EXPECT_GE(r, 10u);
        EXPECT_LE(r, 20u);
        double u = s.unit();
        EXPECT_GE(u, 0.0);
        EXPECT_LT(u, 1.0);
    }
    EXPECT_EQ(s.uniform(0), 0u);
}
