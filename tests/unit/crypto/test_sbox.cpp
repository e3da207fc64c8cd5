/**
 * @file test_sbox.cpp
 * @brief S-box permutation generation tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <array>
#include <string>

#include "atomcrypte/atomcrypte.h"
#include "atomcrypte/crypto/sbox.h"

using namespace atomcrypte;

class SBoxTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(atomcrypte_init(), ATOMCRYPTE_SUCCESS);
        master_ = SecureBytes(ByteVec(32, 0xA7));
        nonce_ = ByteVec(16, 0x3C);
    }

    SecureBytes master_;
    ByteVec nonce_;
};

TEST_F(SBoxTest, ForwardIsAPermutationAndInverseUndoesIt) {
    for (SboxSource source : {SboxSource::PasswordDerived, SboxSource::NonceDerived,
                              SboxSource::Combined}) {
        const SBoxPair pair = SBoxGenerator::for_source(source, master_, nonce_);
        std::array<int, 256> seen{};
        for (int v : pair.forward) {
            seen[v]++;
        }
        for (int i = 0; i < 256; ++i) {
            EXPECT_EQ(seen[i], 1) << "value " << i;
            EXPECT_EQ(pair.inverse[pair.forward[i]], i);
            EXPECT_EQ(pair.forward[pair.inverse[i]], i);
        }
        EXPECT_TRUE(pair.is_consistent());
    }
}

TEST_F(SBoxTest, DeterministicForIdenticalSeeds) {
    const SBoxPair a = SBoxGenerator::for_source(SboxSource::Combined, master_, nonce_);
    const SBoxPair b = SBoxGenerator::for_source(SboxSource::Combined, master_, nonce_);
    EXPECT_EQ(a.forward, b.forward);
    EXPECT_EQ(a.inverse, b.inverse);
}

TEST_F(SBoxTest, NotTheIdentity) {
    const SBoxPair pair = SBoxGenerator::for_source(SboxSource::Combined, master_, nonce_);
    int fixed_points = 0;
    for (int i = 0; i < 256; ++i) {
        if (pair.forward[i] == i) fixed_points++;
    }
    EXPECT_LT(fixed_points, 16);
}

TEST_F(SBoxTest, SourceSelectsUnrelatedPermutations) {
    const SBoxPair password = SBoxGenerator::for_source(SboxSource::PasswordDerived, master_, nonce_);
    const SBoxPair nonce = SBoxGenerator::for_source(SboxSource::NonceDerived, master_, nonce_);
    const SBoxPair combined = SBoxGenerator::for_source(SboxSource::Combined, master_, nonce_);
    EXPECT_NE(password.forward, nonce.forward);
    EXPECT_NE(password.forward, combined.forward);
    EXPECT_NE(nonce.forward, combined.forward);

    // Same seed bytes under a different source selector still differ
    const SBoxPair as_password = SBoxGenerator::generate(master_, SboxSource::PasswordDerived);
    const SBoxPair as_nonce = SBoxGenerator::generate(master_, SboxSource::NonceDerived);
    EXPECT_NE(as_password.forward, as_nonce.forward);
}

TEST_F(SBoxTest, SeedMaterialPerSource) {
    EXPECT_TRUE(SBoxGenerator::seed_material(SboxSource::PasswordDerived, master_, nonce_).equals(master_));
    EXPECT_TRUE(SBoxGenerator::seed_material(SboxSource::NonceDerived, master_, nonce_)
                    .equals(SecureBytes(nonce_)));

    const SecureBytes combined = SBoxGenerator::seed_material(SboxSource::Combined, master_, nonce_);
    ASSERT_EQ(combined.size(), nonce_.size() + master_.size());
    EXPECT_EQ(combined[0], 0x3C);
    EXPECT_EQ(combined[nonce_.size()], 0xA7);
}

TEST_F(SBoxTest, NonceSourceIgnoresPassword) {
    const SecureBytes other_master(ByteVec(32, 0x01));
    EXPECT_EQ(SBoxGenerator::for_source(SboxSource::NonceDerived, master_, nonce_).forward,
              SBoxGenerator::for_source(SboxSource::NonceDerived, other_master, nonce_).forward);
    EXPECT_NE(SBoxGenerator::for_source(SboxSource::Combined, master_, nonce_).forward,
              SBoxGenerator::for_source(SboxSource::Combined, other_master, nonce_).forward);
}

TEST_F(SBoxTest, EmptySeedRejected) {
    EXPECT_THROW(SBoxGenerator::generate(nullptr, 0, SboxSource::Combined), CryptoError);
}
