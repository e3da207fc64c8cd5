/**
 * @file test_builder.cpp
 * @brief Builder facade tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <functional>
#include <string>

#include "atomcrypte/atomcrypte.h"

using namespace atomcrypte;

namespace {

atomcrypte_error_t error_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const CryptoError& e) {
        return e.code();
    }
    return ATOMCRYPTE_SUCCESS;
}

} // namespace

class BuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(atomcrypte_init(), ATOMCRYPTE_SUCCESS);
        nonce_ = nonce::random(24);
        config_ = Config::from_profile(Profile::Standard).with_kdf_cost(10);
    }

    Builder base() {
        Builder b;
        b.password("builder password").nonce(nonce_).config(config_).cache(&cache_);
        return b;
    }

    KeyCache cache_;
    ByteVec nonce_;
    Config config_;
};

TEST_F(BuilderTest, DetachedRoundTrip) {
    const ByteVec blob = base().data(std::string("builder message")).encrypt();
    EXPECT_EQ(blob.size(), 15u + 64u);

    const ByteVec plaintext = base().data(blob).decrypt();
    EXPECT_EQ(std::string(plaintext.begin(), plaintext.end()), "builder message");
}

TEST_F(BuilderTest, MatchesEngineOutput) {
    const ByteVec payload = random_bytes(4096);
    const ByteVec from_builder = base().data(payload).encrypt();
    const ByteVec from_engine =
        Engine().encrypt(config_, KeyMaterial::from_password("builder password", nonce_), payload)
            .serialize();
    EXPECT_EQ(from_builder, from_engine);
}

TEST_F(BuilderTest, WrapAllNeedsNoNonceToDecrypt) {
    const ByteVec blob = base().data(std::string("wrapped")).wrap_all(true).encrypt();

    Builder decryptor;
    decryptor.password("builder password").config(config_).wrap_all(true).data(blob);
    const ByteVec plaintext = decryptor.decrypt();
    EXPECT_EQ(std::string(plaintext.begin(), plaintext.end()), "wrapped");
}

TEST_F(BuilderTest, SaltIsHonoured) {
    const ByteVec salt = nonce::salt(16);
    const ByteVec blob = base().salt(salt).data(std::string("salted")).encrypt();
    EXPECT_EQ(base().salt(salt).data(blob).decrypt(), ByteVec({'s', 'a', 'l', 't', 'e', 'd'}));
    EXPECT_EQ(error_of([&] { base().data(blob).decrypt(); }), ATOMCRYPTE_ERROR_MAC_MISMATCH);
}

TEST_F(BuilderTest, RecoveryThroughDecryptOptions) {
    const ByteVec salt = nonce::salt(16);
    EncryptedOutput output = base()
                                 .salt(salt)
                                 .config(config_.with_recovery_key(true))
                                 .data(std::string("recover me"))
                                 .encrypt_output();
    const SecureBytes recovery_key = output.take_recovery_key();
    const ByteVec block = output.recovery_block;
    ASSERT_FALSE(block.empty());

    const ByteVec plaintext = base()
                                  .config(config_.with_recovery_key(true))
                                  .decrypt_options(DecryptOptions::recovery(recovery_key, block))
                                  .data(output.serialize())
                                  .decrypt();
    EXPECT_EQ(std::string(plaintext.begin(), plaintext.end()), "recover me");
}

TEST_F(BuilderTest, MissingFieldsAreInvalidParam) {
    EXPECT_EQ(error_of([&] { Builder().password("pw").nonce(nonce_).data(std::string("x")).encrypt(); }),
              ATOMCRYPTE_ERROR_INVALID_PARAM);
    EXPECT_EQ(error_of([&] { Builder().config(config_).nonce(nonce_).data(std::string("x")).encrypt(); }),
              ATOMCRYPTE_ERROR_INVALID_PARAM);
    EXPECT_EQ(error_of([&] { Builder().config(config_).password("pw").data(std::string("x")).encrypt(); }),
              ATOMCRYPTE_ERROR_INVALID_PARAM);
    EXPECT_EQ(error_of([&] { Builder().config(config_).password("pw").nonce(nonce_).encrypt(); }),
              ATOMCRYPTE_ERROR_INVALID_PARAM);
    EXPECT_EQ(error_of([&] { Builder().config(config_).password("pw").data(ByteVec(80)).decrypt(); }),
              ATOMCRYPTE_ERROR_INVALID_PARAM);
}

TEST_F(BuilderTest, EngineValidationStillApplies) {
    EXPECT_EQ(error_of([&] { base().password("").data(std::string("x")).encrypt(); }),
              ATOMCRYPTE_ERROR_WEAK_INPUT);
    EXPECT_EQ(error_of([&] { base().nonce(ByteVec(7, 0)).data(std::string("x")).encrypt(); }),
              ATOMCRYPTE_ERROR_INVALID_LENGTH);
    EXPECT_EQ(error_of([&] { base().data(static_cast<const uint8_t*>(nullptr), 3).encrypt(); }),
              ATOMCRYPTE_ERROR_INVALID_PARAM);
}
