/**
 * @file test_recovery.cpp
 * @brief Recovery key derivation and master key sealing tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <string>

#include "atomcrypte/atomcrypte.h"
#include "atomcrypte/crypto/key_derivation.h"
#include "atomcrypte/crypto/recovery.h"

using namespace atomcrypte;

namespace {

constexpr uint32_t TEST_COST = 8;

} // namespace

class RecoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(atomcrypte_init(), ATOMCRYPTE_SUCCESS);
        password_ = SecureBytes(std::string("correct horse"));
        nonce_ = ByteVec(16, 0x21);
    }

    SecureBytes password_;
    ByteVec nonce_;
};

TEST_F(RecoveryTest, DeterministicAndSized) {
    const SecureBytes a = RecoveryKeyDeriver::derive_recovery(password_, nonce_, KeyLength::Bits256, TEST_COST);
    const SecureBytes b = RecoveryKeyDeriver::derive_recovery(password_, nonce_, KeyLength::Bits256, TEST_COST);
    EXPECT_TRUE(a.equals(b));
    EXPECT_EQ(a.size(), 32u);
    EXPECT_EQ(RecoveryKeyDeriver::derive_recovery(password_, nonce_, KeyLength::Bits512, TEST_COST).size(), 64u);
}

TEST_F(RecoveryTest, IndependentOfMasterKeyAndSalt) {
    const SecureBytes recovery = RecoveryKeyDeriver::derive_recovery(password_, nonce_, KeyLength::Bits256, TEST_COST);
    const SecureBytes master = KeyDerivation::derive(password_, nonce_, nonce_, 256, TEST_COST);
    const SecureBytes salted = KeyDerivation::derive(password_, ByteVec(32, 0x77), nonce_, 256, TEST_COST);
    EXPECT_FALSE(recovery.equals(master));
    EXPECT_FALSE(recovery.equals(salted));
}

TEST_F(RecoveryTest, NonceChangesRecoveryKey) {
    ByteVec other = nonce_;
    other[5] ^= 0x10;
    EXPECT_FALSE(RecoveryKeyDeriver::derive_recovery(password_, nonce_, KeyLength::Bits256, TEST_COST)
                     .equals(RecoveryKeyDeriver::derive_recovery(password_, other, KeyLength::Bits256, TEST_COST)));
}

TEST_F(RecoveryTest, SealAndOpen) {
    for (KeyLength length : {KeyLength::Bits256, KeyLength::Bits512}) {
        const SecureBytes master(random_bytes(key_bytes(length)));
        const SecureBytes recovery = RecoveryKeyDeriver::derive_recovery(password_, nonce_, length, TEST_COST);

        const ByteVec block = RecoveryKeyDeriver::seal_master_key(master, recovery, nonce_);
        EXPECT_EQ(block.size(), RecoveryKeyDeriver::block_size(length));
        EXPECT_TRUE(RecoveryKeyDeriver::open_master_key(block, recovery, nonce_).equals(master));
    }
}

TEST_F(RecoveryTest, TamperedBlockOrWrongKeyFails) {
    const SecureBytes master(random_bytes(32));
    const SecureBytes recovery = RecoveryKeyDeriver::derive_recovery(password_, nonce_, KeyLength::Bits256, TEST_COST);
    const ByteVec block = RecoveryKeyDeriver::seal_master_key(master, recovery, nonce_);

    ByteVec tampered = block;
    tampered[5] ^= 0x01;
    try {
        RecoveryKeyDeriver::open_master_key(tampered, recovery, nonce_);
        FAIL() << "tampered block opened";
    } catch (const CryptoError& e) {
        EXPECT_EQ(e.code(), ATOMCRYPTE_ERROR_MAC_MISMATCH);
    }

    SecureBytes wrong = recovery;
    wrong[0] ^= 0x01;
    EXPECT_THROW(RecoveryKeyDeriver::open_master_key(block, wrong, nonce_), CryptoError);

    ByteVec other_nonce = nonce_;
    other_nonce[0] ^= 0x01;
    EXPECT_THROW(RecoveryKeyDeriver::open_master_key(block, recovery, other_nonce), CryptoError);
}

TEST_F(RecoveryTest, MalformedBlocks) {
    const SecureBytes recovery(random_bytes(32));
    for (const ByteVec& block : {ByteVec{}, ByteVec{32, 1, 2, 3}, ByteVec(1 + 48 + 32, 48)}) {
        try {
            RecoveryKeyDeriver::open_master_key(block, recovery, nonce_);
            FAIL() << "malformed block accepted";
        } catch (const CryptoError& e) {
            EXPECT_EQ(e.code(), ATOMCRYPTE_ERROR_MALFORMED_INPUT);
        }
    }
}

TEST_F(RecoveryTest, EmptyPasswordIsWeakInput) {
    try {
        RecoveryKeyDeriver::derive_recovery(SecureBytes(), nonce_, KeyLength::Bits256, TEST_COST);
        FAIL() << "empty password accepted";
    } catch (const CryptoError& e) {
        EXPECT_EQ(e.code(), ATOMCRYPTE_ERROR_WEAK_INPUT);
    }
}
