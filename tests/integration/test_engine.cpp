/**
 * @file test_engine.cpp
 * @brief End-to-end Engine encrypt/decrypt tests
 *
 * Covers round-trip, determinism, tamper detection, the recovery path,
 * empty input, wrapped/detached shapes and backend equivalence.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "atomcrypte/atomcrypte.h"

using namespace atomcrypte;

namespace {

constexpr uint32_t TEST_COST = 10;

ByteVec bytes_of(const std::string& s) {
    return ByteVec(s.begin(), s.end());
}

atomcrypte_error_t decrypt_error(const Engine& engine, const Config& config,
                                 const KeyMaterial& material, const ByteVec& blob,
                                 const DecryptOptions& options = DecryptOptions()) {
    try {
        engine.decrypt(config, material, blob, options);
    } catch (const CryptoError& e) {
        return e.code();
    }
    return ATOMCRYPTE_SUCCESS;
}

} // namespace

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(atomcrypte_init(), ATOMCRYPTE_SUCCESS);
        nonce_ = nonce::random(16);
        material_ = KeyMaterial::from_password("correct horse", nonce_);
        config_ = Config::from_profile(Profile::Standard).with_kdf_cost(TEST_COST);
    }

    Config profile(Profile p) const {
        return Config::from_profile(p).with_kdf_cost(TEST_COST);
    }

    KeyCache cache_;
    ByteVec nonce_;
    KeyMaterial material_;
    Config config_;
};

// ============================================================================
// Scenario
// ============================================================================

TEST_F(EngineTest, HelloAtomcrypteScenario) {
    const Engine engine;
    const ByteVec plaintext = bytes_of("hello atomcrypte");

    const EncryptedOutput output = engine.encrypt(config_, material_, plaintext);
    EXPECT_EQ(output.ciphertext.size(), 16u);
    EXPECT_NE(output.ciphertext, plaintext);

    const ByteVec blob = output.serialize();
    EXPECT_EQ(blob.size(), 16u + 64u);
    EXPECT_EQ(engine.decrypt(config_, material_, blob), plaintext);

    // Single-bit-flipped nonce: wrong key, never the original plaintext
    ByteVec flipped = nonce_;
    flipped[0] ^= 0x01;
    const KeyMaterial wrong = KeyMaterial::from_password("correct horse", flipped);
    try {
        const ByteVec recovered = engine.decrypt(config_, wrong, blob);
        EXPECT_NE(recovered, plaintext);
    } catch (const CryptoError& e) {
        EXPECT_EQ(e.code(), ATOMCRYPTE_ERROR_MAC_MISMATCH);
    }
}

// ============================================================================
// Round-trip and determinism
// ============================================================================

TEST_F(EngineTest, RoundTripAllProfilesAndSources) {
    const Engine engine(&cache_);
    const ByteVec plaintext = random_bytes(10000);
    for (Profile p : {Profile::Standard, Profile::Secure, Profile::Max}) {
        for (SboxSource source : {SboxSource::PasswordDerived, SboxSource::NonceDerived,
                                  SboxSource::Combined}) {
            const Config config = profile(p).with_sbox(source);
            const ByteVec blob = engine.encrypt(config, material_, plaintext).serialize();
            EXPECT_EQ(engine.decrypt(config, material_, blob), plaintext)
                << to_string(p) << " / " << to_string(source);
        }
    }
}

TEST_F(EngineTest, RoundTripCustomConfigurations) {
    const Engine engine(&cache_);
    const ByteVec plaintext = random_bytes(777);
    for (uint32_t rounds : {1u, 3u, 20u}) {
        for (KeyLength length : {KeyLength::Bits256, KeyLength::Bits512}) {
            const Config config = config_.with_rounds(rounds).with_key_length(length);
            const ByteVec blob = engine.encrypt(config, material_, plaintext).serialize();
            EXPECT_EQ(engine.decrypt(config, material_, blob), plaintext);
        }
    }
}

TEST_F(EngineTest, RoundTripLargeInputAcrossThreadStrategies) {
    const Engine engine(&cache_);
    const ByteVec plaintext = random_bytes(3 * 1024 * 1024 + 123);
    const ByteVec reference =
        engine.encrypt(config_.with_threads(ThreadStrategy::custom(1)), material_, plaintext).serialize();

    for (ThreadStrategy strategy : {ThreadStrategy::automatic(), ThreadStrategy::full(),
                                    ThreadStrategy::low(), ThreadStrategy::custom(5)}) {
        const Config config = config_.with_threads(strategy);
        const ByteVec blob = engine.encrypt(config, material_, plaintext).serialize();
        EXPECT_EQ(blob, reference) << strategy.to_string();
        EXPECT_EQ(engine.decrypt(config_.with_threads(ThreadStrategy::custom(3)), material_, blob),
                  plaintext);
    }
}

TEST_F(EngineTest, DeterministicWithoutRecoveryOrDummyData) {
    const Engine engine;
    const ByteVec plaintext = bytes_of("same input, same output");
    const ByteVec a = engine.encrypt(config_, material_, plaintext).serialize();
    const ByteVec b = engine.encrypt(config_, material_, plaintext).serialize();
    EXPECT_EQ(a, b);

    const Config wrapped = config_.with_output_shape(OutputShape::Wrapped);
    EXPECT_EQ(engine.encrypt(wrapped, material_, plaintext).serialize(),
              engine.encrypt(wrapped, material_, plaintext).serialize());
}

TEST_F(EngineTest, CacheDoesNotChangeOutput) {
    const ByteVec plaintext = bytes_of("cached or not");
    const ByteVec uncached = Engine().encrypt(config_, material_, plaintext).serialize();
    const Engine cached(&cache_);
    EXPECT_EQ(cached.encrypt(config_, material_, plaintext).serialize(), uncached);
    EXPECT_EQ(cached.encrypt(config_, material_, plaintext).serialize(), uncached);
    EXPECT_GE(cache_.stats().hits, 1u);
}

TEST_F(EngineTest, BackendEquivalence) {
    Engine scalar_engine(&cache_);
    Engine vector_engine(&cache_);
    CpuSnapshot cpu;
    cpu.core_count = 4;
    cpu.has_avx2 = false;
    scalar_engine.set_cpu_snapshot(cpu);
    cpu.has_avx2 = true;
    vector_engine.set_cpu_snapshot(cpu);

    const Config config = config_.with_threads(ThreadStrategy::full());
    EXPECT_FALSE(scalar_engine.plan_for(config, 1 << 20).use_vectorized);
    EXPECT_TRUE(vector_engine.plan_for(config, 1 << 20).use_vectorized);

    // When AVX2 is missing the vector plan falls back to scalar; output matches either way
    const ByteVec plaintext = random_bytes(500000);
    const ByteVec scalar_blob = scalar_engine.encrypt(config, material_, plaintext).serialize();
    const ByteVec vector_blob = vector_engine.encrypt(config, material_, plaintext).serialize();
    EXPECT_EQ(scalar_blob, vector_blob);
    EXPECT_EQ(scalar_engine.decrypt(config, material_, vector_blob), plaintext);
    EXPECT_EQ(vector_engine.decrypt(config, material_, scalar_blob), plaintext);
}

// ============================================================================
// Tamper detection
// ============================================================================

TEST_F(EngineTest, EveryCiphertextBitFlipIsDetected) {
    const Engine engine(&cache_);
    const ByteVec plaintext = bytes_of("tamper");
    const ByteVec blob = engine.encrypt(config_, material_, plaintext).serialize();
    ASSERT_EQ(blob.size(), plaintext.size() + 64u);

    for (size_t byte = 0; byte < plaintext.size(); ++byte) {
        for (int bit = 0; bit < 8; ++bit) {
            ByteVec tampered = blob;
            tampered[byte] ^= static_cast<uint8_t>(1u << bit);
            EXPECT_EQ(decrypt_error(engine, config_, material_, tampered),
                      ATOMCRYPTE_ERROR_MAC_MISMATCH)
                << "byte " << byte << " bit " << bit;
        }
    }
}

TEST_F(EngineTest, TagBitFlipsAreDetected) {
    const Engine engine(&cache_);
    const ByteVec blob = engine.encrypt(config_, material_, bytes_of("tag check")).serialize();
    const size_t tag_offset = blob.size() - 64;
    for (size_t i = 0; i < 64; i += 7) {
        ByteVec tampered = blob;
        tampered[tag_offset + i] ^= 0x40;
        EXPECT_EQ(decrypt_error(engine, config_, material_, tampered),
                  ATOMCRYPTE_ERROR_MAC_MISMATCH)
            << "tag byte " << i;
    }
}

TEST_F(EngineTest, WrongPasswordOrSaltFails) {
    const Engine engine(&cache_);
    const KeyMaterial salted = KeyMaterial::from_password("correct horse", nonce_, nonce::salt(24));
    const ByteVec blob = engine.encrypt(config_, salted, bytes_of("secret")).serialize();

    EXPECT_EQ(engine.decrypt(config_, salted, blob), bytes_of("secret"));
    EXPECT_EQ(decrypt_error(engine, config_, KeyMaterial::from_password("wrong horse", nonce_), blob),
              ATOMCRYPTE_ERROR_MAC_MISMATCH);
    EXPECT_EQ(decrypt_error(engine, config_, material_, blob), ATOMCRYPTE_ERROR_MAC_MISMATCH);
}

TEST_F(EngineTest, ConfigMismatchFailsAuthentication) {
    const Engine engine(&cache_);
    const ByteVec blob = engine.encrypt(config_, material_, bytes_of("bound context")).serialize();
    EXPECT_NE(decrypt_error(engine, config_.with_sbox(SboxSource::NonceDerived), material_, blob),
              ATOMCRYPTE_SUCCESS);
    EXPECT_NE(decrypt_error(engine, profile(Profile::Secure), material_, blob), ATOMCRYPTE_SUCCESS);
}

// ============================================================================
// Empty input
// ============================================================================

TEST_F(EngineTest, EmptyInputRoundTrip) {
    const Engine engine(&cache_);
    const EncryptedOutput output = engine.encrypt(config_, material_, ByteVec());
    EXPECT_GE(output.ciphertext.size(), 1u);
    EXPECT_LE(output.ciphertext.size(), 8192u);

    const ByteVec blob = output.serialize();
    EXPECT_EQ(blob.size(), output.ciphertext.size() + 64u);
    EXPECT_TRUE(engine.decrypt(config_, material_, blob).empty());

    ByteVec tampered = blob;
    tampered[0] ^= 0x01;
    EXPECT_EQ(decrypt_error(engine, config_, material_, tampered), ATOMCRYPTE_ERROR_MAC_MISMATCH);
}

TEST_F(EngineTest, EmptyInputWrapped) {
    const Engine engine(&cache_);
    const Config wrapped = config_.with_output_shape(OutputShape::Wrapped);
    const ByteVec blob = engine.encrypt(wrapped, material_, nullptr, 0).serialize();
    EXPECT_TRUE(engine.decrypt(wrapped, material_, blob).empty());
}

// ============================================================================
// Output shapes and dummy data
// ============================================================================

TEST_F(EngineTest, WrappedCarriesSaltAndNonce) {
    const Engine engine(&cache_);
    const Config wrapped = profile(Profile::Secure).with_output_shape(OutputShape::Wrapped);
    const ByteVec salt = nonce::salt(32);
    const KeyMaterial salted = KeyMaterial::from_password("correct horse", nonce_, salt);
    const ByteVec plaintext = bytes_of("self-describing");

    const ByteVec blob = engine.encrypt(wrapped, salted, plaintext).serialize();

    // Only the password is needed on the way back
    const KeyMaterial password_only(SecureBytes(std::string("correct horse")), ByteVec());
    EXPECT_EQ(engine.decrypt(wrapped, password_only, blob), plaintext);

    const EncryptedOutput parsed = EncryptedOutput::parse(blob, wrapped);
    ASSERT_TRUE(parsed.header.has_value());
    EXPECT_EQ(parsed.header->salt, salt);
    EXPECT_EQ(parsed.header->nonce, nonce_);
}

TEST_F(EngineTest, WrappedHeaderMismatchIsUnsupportedConfig) {
    const Engine engine(&cache_);
    const Config wrapped = config_.with_output_shape(OutputShape::Wrapped);
    const ByteVec blob = engine.encrypt(wrapped, material_, bytes_of("x")).serialize();
    EXPECT_EQ(decrypt_error(engine, wrapped.with_rounds(5), material_, blob),
              ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG);
    EXPECT_EQ(decrypt_error(engine, wrapped.with_key_length(KeyLength::Bits512), material_, blob),
              ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG);
}

TEST_F(EngineTest, DummyDataRoundTripsInBothShapes) {
    const Engine engine(&cache_);
    const ByteVec plaintext = bytes_of("padded");
    for (OutputShape shape : {OutputShape::Detached, OutputShape::Wrapped}) {
        const Config config = config_.with_dummy_data(true).with_output_shape(shape);
        const EncryptedOutput output = engine.encrypt(config, material_, plaintext);
        EXPECT_FALSE(output.padding.empty());
        const ByteVec blob = output.serialize();
        EXPECT_GT(blob.size(), plaintext.size() + 64u);
        EXPECT_EQ(engine.decrypt(config, material_, blob), plaintext);
    }
}

TEST_F(EngineTest, PaddingIsOutsideTheMac) {
    const Engine engine(&cache_);
    const Config config = config_.with_dummy_data(true);
    EncryptedOutput output = engine.encrypt(config, material_, bytes_of("padded"));
    output.padding.assign(output.padding.size(), 0x00);
    EXPECT_EQ(engine.decrypt(config, material_, output.serialize()), bytes_of("padded"));
}

// ============================================================================
// Recovery path
// ============================================================================

TEST_F(EngineTest, RecoveryKeyOpensWithoutTheSalt) {
    const Engine engine;
    const Config config = config_.with_recovery_key(true);
    const KeyMaterial salted = KeyMaterial::from_password("correct horse", nonce_, nonce::salt(32));
    const ByteVec plaintext = bytes_of("recoverable");

    EncryptedOutput output = engine.encrypt(config, salted, plaintext);
    ASSERT_FALSE(output.recovery_block.empty());
    const SecureBytes recovery_key = output.take_recovery_key();
    ASSERT_EQ(recovery_key.size(), 32u);
    const ByteVec block = output.recovery_block;
    const ByteVec blob = output.serialize();

    // Standard mode never falls back
    EXPECT_EQ(decrypt_error(engine, config, material_, blob,
                            DecryptOptions()),
              ATOMCRYPTE_ERROR_MAC_MISMATCH);

    // Recovery mode, key re-derived from password + nonce
    EXPECT_EQ(engine.decrypt(config, material_, blob, DecryptOptions::recovery(SecureBytes(), block)),
              plaintext);

    // Recovery mode with the handed-out key and no password at all
    const KeyMaterial nonce_only(SecureBytes(), nonce_);
    EXPECT_EQ(engine.decrypt(config, nonce_only, blob, DecryptOptions::recovery(recovery_key, block)),
              plaintext);

    // Standard path still works with the original salt
    EXPECT_EQ(engine.decrypt(config, salted, blob), plaintext);
}

TEST_F(EngineTest, RecoveryBlockTravelsInWrappedOutput) {
    const Engine engine;
    const Config config = config_.with_recovery_key(true).with_output_shape(OutputShape::Wrapped);
    const ByteVec plaintext = bytes_of("wrapped recovery");

    EncryptedOutput output = engine.encrypt(config, material_, plaintext);
    const SecureBytes recovery_key = output.take_recovery_key();
    const ByteVec blob = output.serialize();

    const KeyMaterial nonce_only{SecureBytes(), ByteVec()};
    EXPECT_EQ(engine.decrypt(config, nonce_only, blob, DecryptOptions::recovery(recovery_key)),
              plaintext);
}

TEST_F(EngineTest, RecoveryFailures) {
    const Engine engine;
    const Config config = config_.with_recovery_key(true);
    EncryptedOutput output = engine.encrypt(config, material_, bytes_of("x"));
    const ByteVec block = output.recovery_block;
    const ByteVec blob = output.serialize();  // detached: block not included

    const KeyMaterial wrong = KeyMaterial::from_password("wrong horse", nonce_);
    EXPECT_EQ(decrypt_error(engine, config, wrong, blob, DecryptOptions::recovery()),
              ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG);
    EXPECT_EQ(decrypt_error(engine, config, wrong, blob, DecryptOptions::recovery(SecureBytes(), block)),
              ATOMCRYPTE_ERROR_MAC_MISMATCH);
}

TEST_F(EngineTest, RecoveryDisabledProducesNothing) {
    const EncryptedOutput output = Engine().encrypt(config_, material_, bytes_of("x"));
    EXPECT_TRUE(output.recovery_block.empty());
    EXPECT_TRUE(output.recovery_key.empty());
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(EngineTest, InputValidation) {
    const Engine engine;
    const ByteVec plaintext = bytes_of("x");

    try {
        engine.encrypt(config_, KeyMaterial::from_password("", nonce_), plaintext);
        FAIL() << "empty password accepted";
    } catch (const CryptoError& e) {
        EXPECT_EQ(e.code(), ATOMCRYPTE_ERROR_WEAK_INPUT);
    }

    try {
        engine.encrypt(config_, KeyMaterial::from_password("pw", ByteVec(4, 1)), plaintext);
        FAIL() << "short nonce accepted";
    } catch (const CryptoError& e) {
        EXPECT_EQ(e.code(), ATOMCRYPTE_ERROR_INVALID_LENGTH);
    }

    try {
        engine.encrypt(config_.with_rounds(0), material_, plaintext);
        FAIL() << "zero rounds accepted";
    } catch (const CryptoError& e) {
        EXPECT_EQ(e.code(), ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG);
    }

    try {
        engine.encrypt(config_.with_threads(ThreadStrategy::custom(0)), material_, plaintext);
        FAIL() << "zero threads accepted";
    } catch (const CryptoError& e) {
        EXPECT_EQ(e.code(), ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG);
    }
    try {
        engine.encrypt(config_.with_key_length(static_cast<KeyLength>(384)), material_, plaintext);
        FAIL() << "384-bit key accepted";
    } catch (const CryptoError& e) {
        EXPECT_EQ(e.code(), ATOMCRYPTE_ERROR_INVALID_LENGTH);
    }
}

TEST_F(EngineTest, BenchmarkFlagDoesNotChangeOutput) {
    const Engine engine(&cache_);
    const ByteVec plaintext = bytes_of("timed");
    const log::Level saved = log::level();
    log::set_level(log::Level::Off);
    const ByteVec timed = engine.encrypt(config_.with_benchmark(true), material_, plaintext).serialize();
    log::set_level(saved);
    EXPECT_EQ(timed, engine.encrypt(config_, material_, plaintext).serialize());
}
