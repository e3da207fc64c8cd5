/**
 * @file test_key_cache.cpp
 * @brief KeyCache hit/miss, eviction and concurrent consistency tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "atomcrypte/atomcrypte.h"
#include "atomcrypte/crypto/key_derivation.h"
#include "atomcrypte/crypto/primitives.h"

using namespace atomcrypte;

namespace {

constexpr uint32_t TEST_COST = 8;

KeyCache::Fingerprint fp_of(uint8_t tag) {
    KeyCache::Fingerprint fp{};
    fp.fill(tag);
    return fp;
}

} // namespace

class KeyCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(atomcrypte_init(), ATOMCRYPTE_SUCCESS);
    }

    static KeyMaterial material(const std::string& password, uint8_t nonce_byte) {
        return KeyMaterial::from_password(password, ByteVec(16, nonce_byte));
    }
};

TEST_F(KeyCacheTest, HitReturnsSameKeyAsDirectDerivation) {
    KeyCache cache;
    const KeyMaterial km = material("correct horse", 0x01);

    const SecureBytes first = cache.get_or_derive(km, KeyLength::Bits256, TEST_COST);
    const SecureBytes second = cache.get_or_derive(km, KeyLength::Bits256, TEST_COST);
    const SecureBytes direct = KeyDerivation::derive(km, KeyLength::Bits256, TEST_COST);

    EXPECT_TRUE(first.equals(direct));
    EXPECT_TRUE(second.equals(direct));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.stats().misses, 1u);
    EXPECT_EQ(cache.stats().hits, 1u);
}

TEST_F(KeyCacheTest, FingerprintSeparatesInputs) {
    const KeyCache cache;
    const KeyMaterial a = material("pw", 0x01);
    const KeyMaterial b = material("pw", 0x02);
    const KeyMaterial c = KeyMaterial::from_password("pw", ByteVec(16, 0x01), ByteVec(16, 0x07));

    const auto fa = cache.fingerprint(a, KeyLength::Bits256, TEST_COST);
    EXPECT_EQ(fa, cache.fingerprint(a, KeyLength::Bits256, TEST_COST));
    EXPECT_NE(fa, cache.fingerprint(b, KeyLength::Bits256, TEST_COST));
    EXPECT_NE(fa, cache.fingerprint(c, KeyLength::Bits256, TEST_COST));
    EXPECT_NE(fa, cache.fingerprint(a, KeyLength::Bits512, TEST_COST));
    EXPECT_NE(fa, cache.fingerprint(a, KeyLength::Bits256, TEST_COST + 1));
}

TEST_F(KeyCacheTest, FingerprintIsKeyedPerCache) {
    KeyCache first;
    const KeyCache second;
    const KeyMaterial km = material("correct horse", 0x01);

    const auto fp = first.fingerprint(km, KeyLength::Bits256, TEST_COST);
    EXPECT_NE(fp, second.fingerprint(km, KeyLength::Bits256, TEST_COST));

    // Unkeyed BLAKE2b of the same fields must not reproduce the index
    primitives::Blake2b plain;
    plain.update(std::string("atomcrypte.key-cache"))
         .update_u64(km.password.size()).update(km.password)
         .update_u64(km.effective_salt().size()).update(km.effective_salt())
         .update_u64(km.nonce.size()).update(km.nonce)
         .update_u16(static_cast<uint16_t>(KeyLength::Bits256))
         .update_u32(TEST_COST);
    const Blake2b512Digest digest = plain.finish();
    EXPECT_FALSE(std::equal(fp.begin(), fp.end(), digest.begin()));

    // clear() replaces the key, so old index values no longer match
    first.get_or_derive(km, KeyLength::Bits256, TEST_COST);
    EXPECT_TRUE(first.contains(first.fingerprint(km, KeyLength::Bits256, TEST_COST)));
    first.clear();
    EXPECT_NE(fp, first.fingerprint(km, KeyLength::Bits256, TEST_COST));
}

TEST_F(KeyCacheTest, ReturnedKeysSurviveEvictionAndClear) {
    KeyCache cache(2);
    const SecureBytes a = cache.get_or_compute(fp_of(1), [] { return SecureBytes(std::string("aaaa")); });
    cache.get_or_compute(fp_of(2), [] { return SecureBytes(std::string("bbbb")); });
    cache.get_or_compute(fp_of(3), [] { return SecureBytes(std::string("cccc")); });

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(cache.contains(fp_of(1)));
    EXPECT_TRUE(cache.contains(fp_of(3)));
    EXPECT_EQ(cache.stats().evictions, 1u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_TRUE(a.equals(SecureBytes(std::string("aaaa"))));
}

TEST_F(KeyCacheTest, DerivationErrorsPropagateAndCacheNothing) {
    KeyCache cache;
    EXPECT_THROW(cache.get_or_derive(material("", 0x01), KeyLength::Bits256, TEST_COST), CryptoError);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(KeyCacheTest, ConcurrentMissesRetainOneValue) {
    KeyCache cache;
    const auto fp = fp_of(9);
    std::atomic<int> computations(0);
    constexpr int kThreads = 8;

    std::vector<SecureBytes> results(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            results[t] = cache.get_or_compute(fp, [&] {
                // Each racer produces a distinct value; only one may be committed
                const int n = computations.fetch_add(1);
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                return SecureBytes(std::string("value-") + std::to_string(n));
            });
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_GE(computations.load(), 1);
    EXPECT_EQ(cache.size(), 1u);
    for (int t = 1; t < kThreads; ++t) {
        EXPECT_TRUE(results[t].equals(results[0])) << "thread " << t;
    }
}

TEST_F(KeyCacheTest, ConcurrentDeriveIsByteEqual) {
    KeyCache cache;
    const KeyMaterial km = material("shared password", 0x33);
    constexpr int kThreads = 6;

    std::vector<SecureBytes> results(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            results[t] = cache.get_or_derive(km, KeyLength::Bits512, TEST_COST);
        });
    }
    for (auto& th : threads) th.join();

    const SecureBytes expected = KeyDerivation::derive(km, KeyLength::Bits512, TEST_COST);
    for (int t = 0; t < kThreads; ++t) {
        EXPECT_TRUE(results[t].equals(expected)) << "thread " << t;
    }
    EXPECT_EQ(cache.size(), 1u);
}
